#pragma once

#include <atomic>
#include <array>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <map>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace bsonkit {

// ------------------------------
// Error model
// ------------------------------

enum class ErrorKind {
    Io,         // underlying byte source failed
    Shape,      // bad length, truncation, unknown tag, missing NUL
    Type,       // no coercion rule for a host or destination type
    Constraint, // fixed-size field of the wrong size, NUL inside a name
};

std::string to_string(ErrorKind k);

class BsonError : public std::runtime_error {
public:
    BsonError(ErrorKind k, const std::string& msg);
    BsonError(ErrorKind k, const std::string& path, const std::string& msg);

    ErrorKind kind() const noexcept;
    // Dotted field path where the error occurred; empty at document level.
    const std::string& path() const noexcept;
    const std::string& message() const noexcept;

    // Copy of this error located at `path`.
    BsonError at(const std::string& path) const;

private:
    ErrorKind kind_;
    std::string path_;
    std::string msg_;
};

// ------------------------------
// Wire tags
// ------------------------------

enum class Type : std::uint8_t {
    Double = 0x01,
    String = 0x02,
    Document = 0x03,
    Array = 0x04,
    Binary = 0x05,
    Undefined = 0x06,
    ObjectId = 0x07,
    Boolean = 0x08,
    UtcDateTime = 0x09,
    Null = 0x0A,
    Regex = 0x0B,
    DbPointer = 0x0C,
    JsCode = 0x0D,
    Symbol = 0x0E,
    JsCodeWithScope = 0x0F,
    Int32 = 0x10,
    Timestamp = 0x11,
    Int64 = 0x12,
    MinKey = 0xFF,
    MaxKey = 0x7F,
};

std::string to_string(Type t);

// ------------------------------
// Value model
// ------------------------------

using Bytes = std::vector<std::uint8_t>;

struct Value;
struct Element;

// Document shapes: Map does not keep insertion order, Document does.
using Map = std::map<std::string, Value>;
using Document = std::vector<Element>;
using Array = std::vector<Value>;

constexpr std::size_t kObjectIdSize = 12;

// Serialized document (length prefix through terminator), never interpreted.
struct RawDocument {
    Bytes bytes{};
};

// Always written with subtype 0x00; the subtype is ignored when reading.
struct Binary {
    Bytes data{};
};

struct Undefined {};

// Must hold exactly kObjectIdSize bytes to be encodable.
struct ObjectId {
    Bytes bytes{};
};

struct UtcDateTime {
    std::int64_t ms{0}; // milliseconds since the Unix epoch
};

struct Null {};

struct Regex {
    std::string pattern{};
    std::string options{};
};

struct DbPointer {
    std::string name{};
    ObjectId id{};
};

struct JsCode {
    std::string code{};
};

struct Symbol {
    std::string name{};
};

struct JsCodeWithScope {
    std::string code{};
    Map scope{};
};

struct Timestamp {
    std::int64_t value{0};
};

struct MinKey {};
struct MaxKey {};

struct Value {
    std::variant<
        double,
        std::string,
        Map,
        Document,
        RawDocument,
        Array,
        Binary,
        Undefined,
        ObjectId,
        bool,
        UtcDateTime,
        Null,
        Regex,
        DbPointer,
        JsCode,
        Symbol,
        JsCodeWithScope,
        std::int32_t,
        Timestamp,
        std::int64_t,
        MinKey,
        MaxKey
    > v;

    Value();
    Value(double d);
    Value(std::string s);
    Value(const char* s);
    Value(Map m);
    Value(Document d);
    Value(RawDocument r);
    Value(Array a);
    Value(Binary b);
    Value(Undefined u);
    Value(ObjectId o);
    Value(bool b);
    Value(UtcDateTime t);
    Value(Null n);
    Value(Regex r);
    Value(DbPointer p);
    Value(JsCode c);
    Value(Symbol s);
    Value(JsCodeWithScope c);
    Value(std::int32_t i);
    Value(Timestamp t);
    Value(std::int64_t i);
    Value(MinKey k);
    Value(MaxKey k);

    // Wire tag this value is written with. Map, Document and RawDocument
    // all report Type::Document.
    Type type() const noexcept;

    template <typename T>
    bool is() const noexcept { return std::holds_alternative<T>(v); }

    template <typename T>
    const T& as() const { return std::get<T>(v); }

    template <typename T>
    T& as() { return std::get<T>(v); }
};

struct Element {
    std::string name{};
    Value value{};
};

bool operator==(const Value& a, const Value& b);
bool operator!=(const Value& a, const Value& b);
bool operator==(const Element& a, const Element& b);
bool operator==(const RawDocument& a, const RawDocument& b);
bool operator==(const Binary& a, const Binary& b);
bool operator==(const Undefined&, const Undefined&);
bool operator==(const ObjectId& a, const ObjectId& b);
bool operator==(const UtcDateTime& a, const UtcDateTime& b);
bool operator==(const Null&, const Null&);
bool operator==(const Regex& a, const Regex& b);
bool operator==(const DbPointer& a, const DbPointer& b);
bool operator==(const JsCode& a, const JsCode& b);
bool operator==(const Symbol& a, const Symbol& b);
bool operator==(const JsCodeWithScope& a, const JsCodeWithScope& b);
bool operator==(const Timestamp& a, const Timestamp& b);
bool operator==(const MinKey&, const MinKey&);
bool operator==(const MaxKey&, const MaxKey&);

// Debug rendering, e.g. "Map[a: Int32(7) b: String(x)]".
std::string to_string(const Value& v);
std::string to_string(const Map& m);
std::string to_string(const Document& d);

// ------------------------------
// Options
// ------------------------------

constexpr std::size_t kDefaultMaxDocumentSize = 16u * 1024u * 1024u; // 16 MiB
constexpr std::size_t kDefaultMaxDepth = 200;

struct ReadOptions {
    // false: embedded documents are returned as RawDocument, undecoded.
    bool nest{true};
    // Declared lengths above this are rejected before any body byte is read.
    std::size_t max_document_size{kDefaultMaxDocumentSize};
    // Embedded documents and arrays nested deeper than this are rejected.
    std::size_t max_depth{kDefaultMaxDepth};
};

// ------------------------------
// Decoding API
// ------------------------------

/// Decode one document from the start of a buffer. Bytes after the
/// document are ignored.
Map decode_map(const std::uint8_t* data, std::size_t size, const ReadOptions& opts = ReadOptions{});
Map decode_map(const Bytes& bson, const ReadOptions& opts = ReadOptions{});
Map decode_map(const RawDocument& raw, const ReadOptions& opts = ReadOptions{});

Document decode_document(const std::uint8_t* data, std::size_t size, const ReadOptions& opts = ReadOptions{});
Document decode_document(const Bytes& bson, const ReadOptions& opts = ReadOptions{});
Document decode_document(const RawDocument& raw, const ReadOptions& opts = ReadOptions{});

/// Read exactly one document off a stream without interpreting it. The
/// stream is left positioned right after the document.
RawDocument read_one(std::istream& is, const ReadOptions& opts = ReadOptions{});

/// Read one document off a stream and decode it.
Map read_map(std::istream& is, const ReadOptions& opts = ReadOptions{});
Document read_document(std::istream& is, const ReadOptions& opts = ReadOptions{});

// ------------------------------
// Identifier generator
// ------------------------------

// 12-byte ids: unix seconds (BE), 3 bytes of md5(host name), pid (BE, 16
// bits), counter (BE, 24 bits). Ids from one generator increase strictly
// until the counter wraps within a single second.
class ObjectIdGenerator {
public:
    ObjectIdGenerator();
    ObjectIdGenerator(const std::string& host_name, std::uint32_t pid);

    ObjectIdGenerator(const ObjectIdGenerator&) = delete;
    ObjectIdGenerator& operator=(const ObjectIdGenerator&) = delete;

    ObjectId next();

    const std::array<std::uint8_t, 3>& machine() const noexcept { return machine_; }
    std::uint16_t pid() const noexcept { return pid_; }

private:
    std::array<std::uint8_t, 3> machine_{};
    std::uint16_t pid_{0};
    std::atomic<std::uint32_t> counter_{0};
};

// ------------------------------
// Utilities
// ------------------------------

// Joins a field name onto a dotted path.
std::string catpath(const std::string& path, const std::string& name);

std::vector<std::string> split_path(const std::string& dotted);

std::uint32_t crc32(const RawDocument& raw);

} // namespace bsonkit
