/**
 * @file dns_message.hpp
 * @brief Minimal DNS wire codec for multicast DNS service discovery.
 *
 * Covers what DNS-SD browsing needs: questions, and PTR / SRV / TXT /
 * A / AAAA answers with name compression. Other record types are
 * decoded as opaque and skipped by consumers.
 *
 * Names are carried as label vectors. Presentation strings escape
 * '.' and '\' inside a label with a backslash, so an instance name
 * such as "Kitchen.Light" survives a round trip.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#pragma once

#include "lanscope/net/export.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lanscope {
namespace net {
namespace dns {

using Labels = std::vector<std::string>;

enum class RecordType : uint16_t {
    A = 1,
    PTR = 12,
    TXT = 16,
    AAAA = 28,
    SRV = 33,
    ANY = 255
};

constexpr uint16_t kClassIn = 1;
constexpr uint16_t kUnicastResponseBit = 0x8000;  ///< QU bit in question class
constexpr uint16_t kCacheFlushBit = 0x8000;       ///< Cache-flush bit in record class
constexpr uint16_t kResponseFlag = 0x8000;
constexpr uint16_t kAuthoritativeFlag = 0x0400;

constexpr const char* kMdnsGroup = "224.0.0.251";
constexpr uint16_t kMdnsPort = 5353;

struct LANSCOPE_NET_API Question {
    Labels name;
    RecordType type = RecordType::PTR;
    bool unicastResponse = false;
};

/**
 * @struct ResourceRecord
 * @brief One decoded answer. Only the fields for its type are set.
 */
struct LANSCOPE_NET_API ResourceRecord {
    Labels name;
    uint16_t type = 0;
    uint16_t rrclass = kClassIn;
    uint32_t ttl = 0;

    Labels target;                              ///< PTR target, SRV target host
    uint16_t priority = 0;                      ///< SRV
    uint16_t weight = 0;                        ///< SRV
    uint16_t port = 0;                          ///< SRV
    std::string address;                        ///< A / AAAA, presentation form
    std::map<std::string, std::string> txt;     ///< TXT, keys lowercased

    bool is(RecordType t) const { return type == static_cast<uint16_t>(t); }
};

struct LANSCOPE_NET_API Message {
    uint16_t id = 0;
    uint16_t flags = 0;
    std::vector<Question> questions;
    std::vector<ResourceRecord> records;  ///< answer, authority and additional sections

    bool isResponse() const { return (flags & kResponseFlag) != 0; }
};

/**
 * @brief Split a presentation name into labels, honouring backslash escapes.
 *
 * A trailing dot is ignored.
 */
LANSCOPE_NET_API Labels splitName(const std::string& name);

/**
 * @brief Join labels into a presentation name without a trailing dot.
 */
LANSCOPE_NET_API std::string joinName(const Labels& labels);

/**
 * @brief Case-insensitive label-wise name comparison.
 */
LANSCOPE_NET_API bool sameName(const Labels& a, const Labels& b);

/**
 * @brief True if name ends with the labels of suffix (case-insensitive).
 */
LANSCOPE_NET_API bool endsWith(const Labels& name, const Labels& suffix);

/**
 * @brief Encode a query message (no answers).
 * @return Wire bytes, or empty if a label exceeds 63 bytes.
 */
LANSCOPE_NET_API std::vector<uint8_t> encodeQuery(const std::vector<Question>& questions,
                                                  uint16_t id = 0);

/**
 * @brief Encode a full message without name compression.
 *
 * Used to answer queries and to build fixtures; supports the record
 * types listed in RecordType except ANY.
 */
LANSCOPE_NET_API std::vector<uint8_t> encodeMessage(const Message& message);

/**
 * @brief Decode a DNS message.
 * @return std::nullopt when the packet is truncated or malformed.
 */
LANSCOPE_NET_API std::optional<Message> decodeMessage(const uint8_t* data, size_t length);

}  // namespace dns
}  // namespace net
}  // namespace lanscope
