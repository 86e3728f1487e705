/**
 * @file dns_message.cpp
 * @brief DNS wire codec implementation.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#include "lanscope/net/dns_message.hpp"
#include "lanscope/net/platform.hpp"

#include <algorithm>
#include <cctype>

namespace lanscope {
namespace net {
namespace dns {

namespace {

constexpr size_t kHeaderSize = 12;
constexpr int kMaxPointerHops = 16;
constexpr size_t kMaxLabels = 128;

uint16_t rd16(const uint8_t* p) {
    return static_cast<uint16_t>((uint16_t(p[0]) << 8) | p[1]);
}

uint32_t rd32(const uint8_t* p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) |
           (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

void put16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

void put32(std::vector<uint8_t>& out, uint32_t v) {
    put16(out, static_cast<uint16_t>(v >> 16));
    put16(out, static_cast<uint16_t>(v & 0xFFFF));
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool putName(std::vector<uint8_t>& out, const Labels& labels) {
    for (const auto& label : labels) {
        if (label.empty() || label.size() > 63) {
            return false;
        }
        out.push_back(static_cast<uint8_t>(label.size()));
        out.insert(out.end(), label.begin(), label.end());
    }
    out.push_back(0);
    return true;
}

// Reads a possibly compressed name starting at offset. On success offset
// points just past the name as it appears in place.
bool readName(const uint8_t* data, size_t len, size_t& offset, Labels& out) {
    size_t pos = offset;
    bool jumped = false;
    int hops = 0;

    while (true) {
        if (pos >= len) {
            return false;
        }
        uint8_t lab = data[pos];
        if (lab == 0) {
            if (!jumped) {
                offset = pos + 1;
            }
            return true;
        }
        if ((lab & 0xC0) == 0xC0) {
            if (pos + 1 >= len) {
                return false;
            }
            size_t target = (size_t(lab & 0x3F) << 8) | data[pos + 1];
            if (!jumped) {
                offset = pos + 2;
            }
            jumped = true;
            if (++hops > kMaxPointerHops || target >= len) {
                return false;
            }
            pos = target;
            continue;
        }
        if ((lab & 0xC0) != 0 || pos + 1 + lab > len) {
            return false;
        }
        out.emplace_back(reinterpret_cast<const char*>(data + pos + 1), lab);
        if (out.size() > kMaxLabels) {
            return false;
        }
        pos += 1 + lab;
    }
}

void parseTxt(const uint8_t* data, size_t length, std::map<std::string, std::string>& txt) {
    size_t pos = 0;
    while (pos < length) {
        size_t n = data[pos++];
        if (pos + n > length) {
            break;
        }
        std::string entry(reinterpret_cast<const char*>(data + pos), n);
        pos += n;
        if (entry.empty()) {
            continue;
        }
        auto eq = entry.find('=');
        if (eq == 0) {
            continue;
        }
        if (eq == std::string::npos) {
            txt.emplace(lower(entry), "");
        } else {
            // First occurrence wins (RFC 6763 section 6.4)
            txt.emplace(lower(entry.substr(0, eq)), entry.substr(eq + 1));
        }
    }
}

bool readRecord(const uint8_t* data, size_t len, size_t& offset, ResourceRecord& rr) {
    if (!readName(data, len, offset, rr.name) || offset + 10 > len) {
        return false;
    }
    rr.type = rd16(data + offset);
    rr.rrclass = rd16(data + offset + 2);
    rr.ttl = rd32(data + offset + 4);
    uint16_t rdlen = rd16(data + offset + 8);
    size_t rdoff = offset + 10;
    if (rdoff + rdlen > len) {
        return false;
    }
    offset = rdoff + rdlen;

    switch (static_cast<RecordType>(rr.type)) {
        case RecordType::PTR: {
            size_t t = rdoff;
            return readName(data, len, t, rr.target);
        }
        case RecordType::SRV: {
            if (rdlen < 7) {
                return false;
            }
            rr.priority = rd16(data + rdoff);
            rr.weight = rd16(data + rdoff + 2);
            rr.port = rd16(data + rdoff + 4);
            size_t t = rdoff + 6;
            return readName(data, len, t, rr.target);
        }
        case RecordType::TXT:
            parseTxt(data + rdoff, rdlen, rr.txt);
            return true;
        case RecordType::A: {
            if (rdlen != 4) {
                return false;
            }
            char buf[INET_ADDRSTRLEN];
            inet_ntop(AF_INET, data + rdoff, buf, sizeof(buf));
            rr.address = buf;
            return true;
        }
        case RecordType::AAAA: {
            if (rdlen != 16) {
                return false;
            }
            char buf[INET6_ADDRSTRLEN];
            inet_ntop(AF_INET6, data + rdoff, buf, sizeof(buf));
            rr.address = buf;
            return true;
        }
        case RecordType::ANY:
            return true;
    }
    // Unknown type: kept with its header fields only
    return true;
}

bool putRdata(std::vector<uint8_t>& out, const ResourceRecord& rr) {
    switch (static_cast<RecordType>(rr.type)) {
        case RecordType::PTR:
            return putName(out, rr.target);
        case RecordType::SRV:
            put16(out, rr.priority);
            put16(out, rr.weight);
            put16(out, rr.port);
            return putName(out, rr.target);
        case RecordType::TXT:
            if (rr.txt.empty()) {
                out.push_back(0);
                return true;
            }
            for (const auto& [key, value] : rr.txt) {
                std::string entry = value.empty() ? key : key + "=" + value;
                if (entry.size() > 255) {
                    return false;
                }
                out.push_back(static_cast<uint8_t>(entry.size()));
                out.insert(out.end(), entry.begin(), entry.end());
            }
            return true;
        case RecordType::A: {
            uint8_t buf[4];
            if (inet_pton(AF_INET, rr.address.c_str(), buf) != 1) {
                return false;
            }
            out.insert(out.end(), buf, buf + 4);
            return true;
        }
        case RecordType::AAAA: {
            uint8_t buf[16];
            if (inet_pton(AF_INET6, rr.address.c_str(), buf) != 1) {
                return false;
            }
            out.insert(out.end(), buf, buf + 16);
            return true;
        }
        case RecordType::ANY:
            return false;
    }
    return false;
}

void putHeader(std::vector<uint8_t>& out, uint16_t id, uint16_t flags,
               size_t questions, size_t answers) {
    put16(out, id);
    put16(out, flags);
    put16(out, static_cast<uint16_t>(questions));
    put16(out, static_cast<uint16_t>(answers));
    put16(out, 0);
    put16(out, 0);
}

bool putQuestion(std::vector<uint8_t>& out, const Question& q) {
    if (!putName(out, q.name)) {
        return false;
    }
    put16(out, static_cast<uint16_t>(q.type));
    put16(out, static_cast<uint16_t>(kClassIn | (q.unicastResponse ? kUnicastResponseBit : 0)));
    return true;
}

}  // namespace

Labels splitName(const std::string& name) {
    Labels labels;
    std::string current;
    for (size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        if (c == '\\' && i + 1 < name.size()) {
            current.push_back(name[++i]);
        } else if (c == '.') {
            if (!current.empty()) {
                labels.push_back(current);
            }
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        labels.push_back(current);
    }
    return labels;
}

std::string joinName(const Labels& labels) {
    std::string out;
    for (size_t i = 0; i < labels.size(); ++i) {
        if (i > 0) {
            out.push_back('.');
        }
        for (char c : labels[i]) {
            if (c == '.' || c == '\\') {
                out.push_back('\\');
            }
            out.push_back(c);
        }
    }
    return out;
}

bool sameName(const Labels& a, const Labels& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (lower(a[i]) != lower(b[i])) {
            return false;
        }
    }
    return true;
}

bool endsWith(const Labels& name, const Labels& suffix) {
    if (suffix.size() > name.size()) {
        return false;
    }
    size_t skip = name.size() - suffix.size();
    for (size_t i = 0; i < suffix.size(); ++i) {
        if (lower(name[skip + i]) != lower(suffix[i])) {
            return false;
        }
    }
    return true;
}

std::vector<uint8_t> encodeQuery(const std::vector<Question>& questions, uint16_t id) {
    std::vector<uint8_t> out;
    out.reserve(kHeaderSize + questions.size() * 32);
    putHeader(out, id, 0, questions.size(), 0);
    for (const auto& q : questions) {
        if (!putQuestion(out, q)) {
            return {};
        }
    }
    return out;
}

std::vector<uint8_t> encodeMessage(const Message& message) {
    std::vector<uint8_t> out;
    putHeader(out, message.id, message.flags, message.questions.size(), message.records.size());
    for (const auto& q : message.questions) {
        if (!putQuestion(out, q)) {
            return {};
        }
    }
    for (const auto& rr : message.records) {
        if (!putName(out, rr.name)) {
            return {};
        }
        put16(out, rr.type);
        put16(out, rr.rrclass);
        put32(out, rr.ttl);
        size_t lengthAt = out.size();
        put16(out, 0);
        if (!putRdata(out, rr)) {
            return {};
        }
        size_t rdlen = out.size() - lengthAt - 2;
        out[lengthAt] = static_cast<uint8_t>(rdlen >> 8);
        out[lengthAt + 1] = static_cast<uint8_t>(rdlen & 0xFF);
    }
    return out;
}

std::optional<Message> decodeMessage(const uint8_t* data, size_t length) {
    if (data == nullptr || length < kHeaderSize) {
        return std::nullopt;
    }

    Message msg;
    msg.id = rd16(data);
    msg.flags = rd16(data + 2);
    size_t qdcount = rd16(data + 4);
    size_t rrcount = size_t(rd16(data + 6)) + rd16(data + 8) + rd16(data + 10);

    size_t offset = kHeaderSize;
    for (size_t i = 0; i < qdcount; ++i) {
        Question q;
        if (!readName(data, length, offset, q.name) || offset + 4 > length) {
            return std::nullopt;
        }
        q.type = static_cast<RecordType>(rd16(data + offset));
        q.unicastResponse = (rd16(data + offset + 2) & kUnicastResponseBit) != 0;
        offset += 4;
        msg.questions.push_back(std::move(q));
    }

    for (size_t i = 0; i < rrcount; ++i) {
        ResourceRecord rr;
        if (!readRecord(data, length, offset, rr)) {
            return std::nullopt;
        }
        msg.records.push_back(std::move(rr));
    }

    return msg;
}

}  // namespace dns
}  // namespace net
}  // namespace lanscope
