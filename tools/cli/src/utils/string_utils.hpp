/**
 * @file string_utils.hpp
 * @brief String utility functions for CLI
 */

#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <vector>
#include <sstream>

namespace lanscope::cli::utils {

/**
 * @brief Convert string to uppercase (for command normalization)
 * @param str Input string
 * @return Uppercase version of the string
 */
inline std::string to_upper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return result;
}

/**
 * @brief Convert string to lowercase
 * @param str Input string
 * @return Lowercase version of the string
 */
inline std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

/**
 * @brief Trim whitespace from both ends of a string
 */
inline std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

/**
 * @brief Tokenize command line (respects quoted strings)
 * @param input Command line input
 * @return Vector of tokens
 */
inline std::vector<std::string> tokenize(const std::string& input) {
    std::vector<std::string> tokens;
    std::string current;
    bool in_quotes = false;
    char quote_char = '\0';

    for (char c : input) {
        if (!in_quotes && (c == '"' || c == '\'')) {
            in_quotes = true;
            quote_char = c;
        } else if (in_quotes && c == quote_char) {
            in_quotes = false;
            quote_char = '\0';
        } else if (!in_quotes && std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        tokens.push_back(current);
    }

    return tokens;
}

inline bool starts_with(const std::string& str, const std::string& prefix) {
    if (prefix.size() > str.size()) return false;
    return str.compare(0, prefix.size(), prefix) == 0;
}

/**
 * @brief Join strings with delimiter
 */
inline std::string join(const std::vector<std::string>& parts, const std::string& delimiter = " ") {
    if (parts.empty()) return "";
    std::string result = parts[0];
    for (size_t i = 1; i < parts.size(); ++i) {
        result += delimiter + parts[i];
    }
    return result;
}

/**
 * @brief Join port numbers as "80,443"; "-" when there are none
 */
inline std::string join_ports(const std::vector<uint32_t>& ports) {
    if (ports.empty()) return "-";
    std::string result;
    for (size_t i = 0; i < ports.size(); ++i) {
        if (i > 0) result += ",";
        result += std::to_string(ports[i]);
    }
    return result;
}

/**
 * @brief Format epoch milliseconds as local "YYYY-MM-DD HH:MM:SS"
 */
inline std::string format_timestamp(int64_t epoch_ms) {
    std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
    std::tm tm_buf{};
    localtime_r(&seconds, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return buf;
}

/**
 * @brief Format a millisecond duration as "850ms" or "15.2s"
 */
inline std::string format_duration(int64_t ms) {
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    }
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(1);
    oss << static_cast<double>(ms) / 1000.0 << "s";
    return oss.str();
}

} // namespace lanscope::cli::utils
