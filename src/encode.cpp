#include "bsonkit/encode.hpp"

#include <cstdlib>
#include <limits>
#include <memory>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace bsonkit {

namespace detail {

std::string demangle(const char* mangled) {
#if defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> res(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
    if (status == 0 && res) return res.get();
#endif
    return mangled;
}

} // namespace detail

// ------------------------------
// Exhaustive dispatch over Value
// ------------------------------

namespace {

struct ValueWriter {
    Encoder& enc;
    const std::string& path;
    std::string_view name;

    void operator()(double v) const { enc.append(path, name, v); }
    void operator()(const std::string& v) const { enc.append(path, name, v); }
    void operator()(const Map& v) const { enc.append(path, name, v); }
    void operator()(const Document& v) const { enc.append(path, name, v); }
    void operator()(const RawDocument& v) const { enc.append(path, name, v); }
    void operator()(const Array& v) const { enc.append(path, name, v); }
    void operator()(const Binary& v) const { enc.append(path, name, v); }
    void operator()(Undefined v) const { enc.append(path, name, v); }
    void operator()(const ObjectId& v) const { enc.append(path, name, v); }
    void operator()(bool v) const { enc.append(path, name, v); }
    void operator()(UtcDateTime v) const { enc.append(path, name, v); }
    void operator()(Null v) const { enc.append(path, name, v); }
    void operator()(const Regex& v) const { enc.append(path, name, v); }
    void operator()(const DbPointer& v) const { enc.append(path, name, v); }
    void operator()(const JsCode& v) const { enc.append(path, name, v); }
    void operator()(const Symbol& v) const { enc.append(path, name, v); }
    void operator()(const JsCodeWithScope& v) const { enc.append(path, name, v); }
    void operator()(std::int32_t v) const { enc.append(path, name, v); }
    void operator()(Timestamp v) const { enc.append(path, name, v); }
    void operator()(std::int64_t v) const { enc.append(path, name, v); }
    void operator()(MinKey v) const { enc.append(path, name, v); }
    void operator()(MaxKey v) const { enc.append(path, name, v); }
};

constexpr std::size_t kMaxInt32 = static_cast<std::size_t>((std::numeric_limits<std::int32_t>::max)());

} // namespace

// ------------------------------
// Element writers
// ------------------------------

void Encoder::cstring(const std::string& path, std::string_view s) {
    if (s.find('\0') != std::string_view::npos) {
        throw BsonError(ErrorKind::Constraint, path, "name contains a NUL byte");
    }
    wire::put_cstring(out_, s);
}

void Encoder::header(const std::string& path, Type t, std::string_view name) {
    wire::put_u8(out_, static_cast<std::uint8_t>(t));
    cstring(path, name);
}

void Encoder::append(const std::string& path, std::string_view name, const Value& v) {
    std::visit(ValueWriter{*this, path, name}, v.v);
}

void Encoder::append(const std::string& path, std::string_view name, double v) {
    header(path, Type::Double, name);
    wire::put_double(out_, v);
}

void Encoder::append(const std::string& path, std::string_view name, const std::string& v) {
    append_text(path, name, v);
}

void Encoder::append_text(const std::string& path, std::string_view name, std::string_view v) {
    header(path, Type::String, name);
    if (v.size() >= kMaxInt32) {
        throw BsonError(ErrorKind::Shape, path, "string too long");
    }
    wire::put_string(out_, v);
}

void Encoder::append(const std::string& path, std::string_view name, const Map& v) {
    header(path, Type::Document, name);
    write_map(path, v);
}

void Encoder::append(const std::string& path, std::string_view name, const Document& v) {
    header(path, Type::Document, name);
    write_document(path, v);
}

void Encoder::append(const std::string& path, std::string_view name, const RawDocument& v) {
    const Bytes& b = v.bytes;
    if (b.size() < 5 || b.size() > kMaxInt32 ||
        static_cast<std::size_t>(wire::load_i32(b.data())) != b.size() || b.back() != 0x00) {
        throw BsonError(ErrorKind::Shape, path, "raw document length prefix does not match its size");
    }
    header(path, Type::Document, name);
    wire::put_bytes(out_, b.data(), b.size());
}

void Encoder::append(const std::string& path, std::string_view name, const Array& v) {
    // Written as a document keyed "0", "1", ...
    header(path, Type::Array, name);
    std::size_t start = wire::begin_document(out_);
    for (std::size_t i = 0; i < v.size(); ++i) {
        std::string idx = std::to_string(i);
        append(catpath(path, idx), idx, v[i]);
    }
    wire::end_document(out_, start);
}

void Encoder::append(const std::string& path, std::string_view name, const Binary& v) {
    append_binary(path, name, v.data.data(), v.data.size());
}

void Encoder::append_binary(const std::string& path, std::string_view name, const std::uint8_t* data, std::size_t n) {
    header(path, Type::Binary, name);
    if (n > kMaxInt32) {
        throw BsonError(ErrorKind::Shape, path, "binary payload too long");
    }
    wire::put_i32(out_, static_cast<std::int32_t>(n));
    wire::put_u8(out_, 0x00); // generic subtype
    wire::put_bytes(out_, data, n);
}

void Encoder::append(const std::string& path, std::string_view name, Undefined) {
    header(path, Type::Undefined, name);
}

void Encoder::append(const std::string& path, std::string_view name, const ObjectId& v) {
    if (v.bytes.size() != kObjectIdSize) {
        throw BsonError(ErrorKind::Constraint, path,
                        "ObjectId must be 12 bytes, got " + std::to_string(v.bytes.size()));
    }
    header(path, Type::ObjectId, name);
    wire::put_bytes(out_, v.bytes.data(), v.bytes.size());
}

void Encoder::append(const std::string& path, std::string_view name, bool v) {
    header(path, Type::Boolean, name);
    wire::put_u8(out_, v ? 0x01 : 0x00);
}

void Encoder::append(const std::string& path, std::string_view name, UtcDateTime v) {
    header(path, Type::UtcDateTime, name);
    wire::put_i64(out_, v.ms);
}

void Encoder::append(const std::string& path, std::string_view name, Null) {
    header(path, Type::Null, name);
}

void Encoder::append(const std::string& path, std::string_view name, const Regex& v) {
    header(path, Type::Regex, name);
    cstring(path, v.pattern);
    cstring(path, v.options);
}

void Encoder::append(const std::string& path, std::string_view name, const DbPointer& v) {
    if (v.id.bytes.size() != kObjectIdSize) {
        throw BsonError(ErrorKind::Constraint, path,
                        "DbPointer id must be 12 bytes, got " + std::to_string(v.id.bytes.size()));
    }
    header(path, Type::DbPointer, name);
    wire::put_string(out_, v.name);
    wire::put_bytes(out_, v.id.bytes.data(), v.id.bytes.size());
}

void Encoder::append(const std::string& path, std::string_view name, const JsCode& v) {
    header(path, Type::JsCode, name);
    wire::put_string(out_, v.code);
}

void Encoder::append(const std::string& path, std::string_view name, const Symbol& v) {
    header(path, Type::Symbol, name);
    wire::put_string(out_, v.name);
}

void Encoder::append(const std::string& path, std::string_view name, const JsCodeWithScope& v) {
    // code_w_s ::= int32 string document, the int32 covering all three.
    header(path, Type::JsCodeWithScope, name);
    std::size_t start = out_.size();
    wire::put_i32(out_, 0);
    wire::put_string(out_, v.code);
    write_map(path, v.scope);
    std::size_t len = out_.size() - start;
    if (len > kMaxInt32) {
        throw BsonError(ErrorKind::Shape, path, "code with scope too large");
    }
    wire::patch_i32(out_, start, static_cast<std::int32_t>(len));
}

void Encoder::append(const std::string& path, std::string_view name, std::int32_t v) {
    header(path, Type::Int32, name);
    wire::put_i32(out_, v);
}

void Encoder::append(const std::string& path, std::string_view name, Timestamp v) {
    header(path, Type::Timestamp, name);
    wire::put_i64(out_, v.value);
}

void Encoder::append(const std::string& path, std::string_view name, std::int64_t v) {
    header(path, Type::Int64, name);
    wire::put_i64(out_, v);
}

void Encoder::append(const std::string& path, std::string_view name, MinKey) {
    header(path, Type::MinKey, name);
}

void Encoder::append(const std::string& path, std::string_view name, MaxKey) {
    header(path, Type::MaxKey, name);
}

// ------------------------------
// Documents
// ------------------------------

void Encoder::write_map(const std::string& path, const Map& m) {
    std::size_t start = wire::begin_document(out_);
    for (const auto& kv : m) {
        append(catpath(path, kv.first), kv.first, kv.second);
    }
    wire::end_document(out_, start);
}

void Encoder::write_document(const std::string& path, const Document& d) {
    std::size_t start = wire::begin_document(out_);
    for (const auto& el : d) {
        append(catpath(path, el.name), el.name, el.value);
    }
    wire::end_document(out_, start);
}

Bytes DocumentBuilder::finish() {
    if (finished_) throw std::logic_error("DocumentBuilder: finish called twice");
    finished_ = true;
    wire::end_document(buf_, start_);
    return std::move(buf_);
}

Bytes encode(const Map& doc) {
    Bytes out;
    Encoder enc(out);
    enc.write_map(std::string{}, doc);
    return out;
}

Bytes encode(const Document& doc) {
    Bytes out;
    Encoder enc(out);
    enc.write_document(std::string{}, doc);
    return out;
}

// ------------------------------
// Struct projection
// ------------------------------

FieldTag FieldTag::parse(std::string_view tag) {
    FieldTag t;
    if (tag.empty()) return t;
    if (tag == "-") {
        t.ignore = true;
        return t;
    }
    std::size_t comma = tag.find(',');
    t.name = std::string(tag.substr(0, comma));
    while (comma != std::string_view::npos) {
        std::size_t next = tag.find(',', comma + 1);
        std::string_view opt = tag.substr(comma + 1, next == std::string_view::npos ? std::string_view::npos : next - comma - 1);
        if (opt == "omitempty") t.omit_empty = true;
        comma = next;
    }
    return t;
}

} // namespace bsonkit
