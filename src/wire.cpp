#include "bsonkit/wire.hpp"

#include <cstring>
#include <limits>

namespace bsonkit::wire {

// ------------------------------
// Writers
// ------------------------------

void put_u8(Bytes& out, std::uint8_t v) {
    out.push_back(v);
}

void put_i32(Bytes& out, std::int32_t v) {
    std::uint32_t u = static_cast<std::uint32_t>(v);
    out.push_back(static_cast<std::uint8_t>(u & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((u >> 8) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((u >> 16) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((u >> 24) & 0xFFu));
}

void put_i64(Bytes& out, std::int64_t v) {
    std::uint64_t u = static_cast<std::uint64_t>(v);
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<std::uint8_t>((u >> (8 * i)) & 0xFFu));
    }
}

void put_double(Bytes& out, double v) {
    static_assert(sizeof(double) == sizeof(std::uint64_t), "IEEE-754 binary64 expected");
    std::uint64_t u = 0;
    std::memcpy(&u, &v, sizeof(u));
    out.push_back(static_cast<std::uint8_t>(u));
    out.push_back(static_cast<std::uint8_t>(u >> 8));
    out.push_back(static_cast<std::uint8_t>(u >> 16));
    out.push_back(static_cast<std::uint8_t>(u >> 24));
    out.push_back(static_cast<std::uint8_t>(u >> 32));
    out.push_back(static_cast<std::uint8_t>(u >> 40));
    out.push_back(static_cast<std::uint8_t>(u >> 48));
    out.push_back(static_cast<std::uint8_t>(u >> 56));
}

void put_bytes(Bytes& out, const std::uint8_t* data, std::size_t n) {
    if (n == 0) return;
    out.insert(out.end(), data, data + n);
}

void put_cstring(Bytes& out, std::string_view s) {
    if (s.find('\0') != std::string_view::npos) {
        throw BsonError(ErrorKind::Constraint, "name contains a NUL byte");
    }
    out.insert(out.end(), s.begin(), s.end());
    out.push_back(0x00);
}

void put_string(Bytes& out, std::string_view s) {
    if (s.size() >= static_cast<std::size_t>((std::numeric_limits<std::int32_t>::max)())) {
        throw BsonError(ErrorKind::Shape, "string too long");
    }
    put_i32(out, static_cast<std::int32_t>(s.size() + 1));
    out.insert(out.end(), s.begin(), s.end());
    out.push_back(0x00);
}

std::size_t begin_document(Bytes& out) {
    std::size_t start = out.size();
    put_i32(out, 0); // patched by end_document
    return start;
}

void end_document(Bytes& out, std::size_t start) {
    out.push_back(0x00);
    std::size_t len = out.size() - start;
    if (len > static_cast<std::size_t>((std::numeric_limits<std::int32_t>::max)())) {
        throw BsonError(ErrorKind::Shape, "document too large");
    }
    patch_i32(out, start, static_cast<std::int32_t>(len));
}

void patch_i32(Bytes& out, std::size_t at, std::int32_t v) {
    std::uint32_t u = static_cast<std::uint32_t>(v);
    out[at] = static_cast<std::uint8_t>(u & 0xFFu);
    out[at + 1] = static_cast<std::uint8_t>((u >> 8) & 0xFFu);
    out[at + 2] = static_cast<std::uint8_t>((u >> 16) & 0xFFu);
    out[at + 3] = static_cast<std::uint8_t>((u >> 24) & 0xFFu);
}

// ------------------------------
// Unchecked loads
// ------------------------------

std::int32_t load_i32(const std::uint8_t* p) {
    std::uint32_t u = (static_cast<std::uint32_t>(p[0])      ) |
                      (static_cast<std::uint32_t>(p[1]) <<  8) |
                      (static_cast<std::uint32_t>(p[2]) << 16) |
                      (static_cast<std::uint32_t>(p[3]) << 24);
    return static_cast<std::int32_t>(u);
}

std::int64_t load_i64(const std::uint8_t* p) {
    std::uint64_t u = 0;
    for (int i = 7; i >= 0; --i) {
        u = (u << 8) | static_cast<std::uint64_t>(p[i]);
    }
    return static_cast<std::int64_t>(u);
}

double load_double(const std::uint8_t* p) {
    std::uint64_t u = 0;
    u |= static_cast<std::uint64_t>(p[7]) << 56;
    u |= static_cast<std::uint64_t>(p[6]) << 48;
    u |= static_cast<std::uint64_t>(p[5]) << 40;
    u |= static_cast<std::uint64_t>(p[4]) << 32;
    u |= static_cast<std::uint64_t>(p[3]) << 24;
    u |= static_cast<std::uint64_t>(p[2]) << 16;
    u |= static_cast<std::uint64_t>(p[1]) << 8;
    u |= static_cast<std::uint64_t>(p[0]);
    double d = 0.0;
    std::memcpy(&d, &u, sizeof(d));
    return d;
}

// ------------------------------
// Cursor
// ------------------------------

void Cursor::need(std::size_t n, const char* what) const {
    if (n > remaining()) {
        throw BsonError(ErrorKind::Shape, std::string("unexpected end of document while reading ") + what);
    }
}

std::uint8_t Cursor::read_u8() {
    need(1, "byte");
    return data_[pos_++];
}

std::int32_t Cursor::read_i32() {
    need(4, "int32");
    std::int32_t v = load_i32(data_ + pos_);
    pos_ += 4;
    return v;
}

std::int64_t Cursor::read_i64() {
    need(8, "int64");
    std::int64_t v = load_i64(data_ + pos_);
    pos_ += 8;
    return v;
}

double Cursor::read_double() {
    need(8, "double");
    double v = load_double(data_ + pos_);
    pos_ += 8;
    return v;
}

std::string Cursor::read_cstring() {
    const void* nul = remaining() ? std::memchr(data_ + pos_, 0, remaining()) : nullptr;
    if (!nul) {
        throw BsonError(ErrorKind::Shape, "missing NUL terminator");
    }
    std::size_t len = static_cast<std::size_t>(static_cast<const std::uint8_t*>(nul) - (data_ + pos_));
    std::string s(reinterpret_cast<const char*>(data_ + pos_), len);
    pos_ += len + 1;
    return s;
}

std::string Cursor::read_string() {
    std::int32_t len = read_i32();
    if (len < 1) {
        throw BsonError(ErrorKind::Shape, "invalid string length " + std::to_string(len));
    }
    need(static_cast<std::size_t>(len), "string");
    const std::uint8_t* p = data_ + pos_;
    if (p[len - 1] != 0x00) {
        throw BsonError(ErrorKind::Shape, "string missing NUL terminator");
    }
    std::string s(reinterpret_cast<const char*>(p), static_cast<std::size_t>(len - 1));
    pos_ += static_cast<std::size_t>(len);
    return s;
}

const std::uint8_t* Cursor::take(std::size_t n) {
    need(n, "bytes");
    const std::uint8_t* p = data_ + pos_;
    pos_ += n;
    return p;
}

Bytes Cursor::read_bytes(std::size_t n) {
    const std::uint8_t* p = take(n);
    return Bytes(p, p + n);
}

} // namespace bsonkit::wire
