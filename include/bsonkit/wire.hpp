#pragma once

#include "bsonkit/bson.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

// Little-endian byte primitives shared by the encoder and the decoder.
// Writers append to a Bytes buffer; readers go through a bounds-checked
// Cursor that throws BsonError(ErrorKind::Shape) on truncation.

namespace bsonkit::wire {

// ------------------------------
// Writers
// ------------------------------

void put_u8(Bytes& out, std::uint8_t v);
void put_i32(Bytes& out, std::int32_t v);
void put_i64(Bytes& out, std::int64_t v);
void put_double(Bytes& out, double v);
void put_bytes(Bytes& out, const std::uint8_t* data, std::size_t n);

// NUL-terminated name. Throws ErrorKind::Constraint if `s` contains a NUL.
void put_cstring(Bytes& out, std::string_view s);

// int32 length (payload + 1), payload, NUL.
void put_string(Bytes& out, std::string_view s);

// Writes a zero length placeholder and returns its offset.
std::size_t begin_document(Bytes& out);

// Writes the terminating NUL and patches the length at `start`.
void end_document(Bytes& out, std::size_t start);

// Overwrites 4 bytes at `at` with `v`.
void patch_i32(Bytes& out, std::size_t at, std::int32_t v);

// ------------------------------
// Unchecked loads
// ------------------------------

std::int32_t load_i32(const std::uint8_t* p);
std::int64_t load_i64(const std::uint8_t* p);
double load_double(const std::uint8_t* p);

// ------------------------------
// Reader
// ------------------------------

class Cursor {
public:
    Cursor(const std::uint8_t* data, std::size_t size) noexcept
        : data_(data), size_(size) {}

    std::size_t offset() const noexcept { return pos_; }
    std::size_t size() const noexcept { return size_; }
    std::size_t remaining() const noexcept { return size_ - pos_; }
    const std::uint8_t* here() const noexcept { return data_ + pos_; }

    std::uint8_t read_u8();
    std::int32_t read_i32();
    std::int64_t read_i64();
    double read_double();

    // Reads up to and consuming the next NUL.
    std::string read_cstring();

    // Length-prefixed string; the prefix counts the trailing NUL.
    std::string read_string();

    // Pointer to the next `n` bytes, then skips them.
    const std::uint8_t* take(std::size_t n);

    Bytes read_bytes(std::size_t n);

private:
    void need(std::size_t n, const char* what) const;

    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_{0};
};

} // namespace bsonkit::wire
