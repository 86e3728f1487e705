/**
 * @file output_formatter.hpp
 * @brief Output formatting for CLI (table and JSON)
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <variant>
#include <sstream>
#include <iomanip>

namespace lanscope::cli {

/**
 * @brief JSON value types for output
 */
using JsonValue = std::variant<
    std::nullptr_t,
    bool,
    int64_t,
    double,
    std::string,
    std::vector<struct JsonObject>,
    std::map<std::string, struct JsonObject>
>;

struct JsonObject {
    JsonValue value;

    JsonObject() : value(nullptr) {}
    JsonObject(std::nullptr_t) : value(nullptr) {}
    JsonObject(bool b) : value(b) {}
    JsonObject(int i) : value(static_cast<int64_t>(i)) {}
    JsonObject(int64_t i) : value(i) {}
    JsonObject(uint32_t i) : value(static_cast<int64_t>(i)) {}
    JsonObject(double d) : value(d) {}
    JsonObject(const char* s) : value(std::string(s)) {}
    JsonObject(const std::string& s) : value(s) {}
    JsonObject(std::vector<JsonObject> arr) : value(std::move(arr)) {}
    JsonObject(std::map<std::string, JsonObject> obj) : value(std::move(obj)) {}
};

/**
 * @brief Table row for formatted output
 */
struct TableRow {
    std::vector<std::string> cells;
};

/**
 * @brief Output formatter supporting table and JSON formats
 */
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode = false);

    void set_json_mode(bool enabled);
    bool is_json_mode() const { return json_mode_; }

    // Simple value output
    void print_ok(const std::string& message);
    void print_error(const std::string& message);

    // Key-value output
    void print_key_values(const std::vector<std::pair<std::string, std::string>>& pairs);

    // Table output; in JSON mode an array of objects keyed by header
    void print_table(const std::vector<std::string>& headers,
                     const std::vector<TableRow>& rows);

    void print_json(const JsonObject& obj);

    // Section headers (ignored in JSON mode)
    void print_section(const std::string& title);

    // Raw output (for streaming data like scan progress)
    void print_raw(const std::string& text);
    void print_line(const std::string& text);

    void flush();

    std::string json_stringify(const JsonObject& obj) const;

private:
    bool json_mode_;

    std::string escape_json_string(const std::string& s) const;
    std::vector<size_t> calculate_column_widths(
        const std::vector<std::string>& headers,
        const std::vector<TableRow>& rows) const;
};

/**
 * @brief RAII helper capturing std::cout for its lifetime
 */
class OutputBuffer {
public:
    OutputBuffer();
    ~OutputBuffer();

    OutputBuffer(const OutputBuffer&) = delete;
    OutputBuffer& operator=(const OutputBuffer&) = delete;

    std::string str() const;

private:
    std::stringstream buffer_;
    std::streambuf* old_cout_;
};

} // namespace lanscope::cli
