#pragma once

#include "bsonkit/bson.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace bsonkit::easy {

namespace detail {
inline int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}
} // namespace detail

// Lowercase hex, two digits per byte.
inline std::string to_hex(const Bytes& b) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(b.size() * 2);
    for (std::uint8_t c : b) {
        out.push_back(digits[c >> 4]);
        out.push_back(digits[c & 0x0F]);
    }
    return out;
}

inline std::string to_hex(const ObjectId& id) {
    return to_hex(id.bytes);
}

inline Bytes from_hex(std::string_view s) {
    if (s.size() % 2 != 0) {
        throw BsonError(ErrorKind::Shape, "hex string has odd length");
    }
    Bytes out;
    out.reserve(s.size() / 2);
    for (std::size_t i = 0; i < s.size(); i += 2) {
        int hi = detail::hex_digit(s[i]);
        int lo = detail::hex_digit(s[i + 1]);
        if (hi < 0 || lo < 0) {
            throw BsonError(ErrorKind::Shape, "invalid hex digit in \"" + std::string(s) + "\"");
        }
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}

// Parses the 24-digit form printed by to_hex.
inline ObjectId object_id_from_hex(std::string_view s) {
    ObjectId id{from_hex(s)};
    if (id.bytes.size() != kObjectIdSize) {
        throw BsonError(ErrorKind::Constraint, "ObjectId must be 12 bytes, got " + std::to_string(id.bytes.size()));
    }
    return id;
}

inline void set(Map& root, std::string key, Value v) {
    root[std::move(key)] = std::move(v);
}

inline void push(Document& doc, std::string key, Value v) {
    doc.push_back(Element{std::move(key), std::move(v)});
}

} // namespace bsonkit::easy
