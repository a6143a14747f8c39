#include "bsonkit/bson.hpp"
#include "bsonkit/wire.hpp"

#include <algorithm>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>
#include <utility>

#include <zlib.h>

namespace bsonkit {

// ------------------------------
// Errors
// ------------------------------

static std::string format_error(const std::string& path, const std::string& msg) {
    if (path.empty()) return msg;
    return path + ", " + msg;
}

BsonError::BsonError(ErrorKind k, const std::string& msg)
    : std::runtime_error(msg), kind_(k), msg_(msg) {}

BsonError::BsonError(ErrorKind k, const std::string& path, const std::string& msg)
    : std::runtime_error(format_error(path, msg)), kind_(k), path_(path), msg_(msg) {}

ErrorKind BsonError::kind() const noexcept { return kind_; }

const std::string& BsonError::path() const noexcept { return path_; }

const std::string& BsonError::message() const noexcept { return msg_; }

BsonError BsonError::at(const std::string& path) const {
    return BsonError(kind_, path, msg_);
}

std::string to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::Io: return "io";
        case ErrorKind::Shape: return "shape";
        case ErrorKind::Type: return "type";
        case ErrorKind::Constraint: return "constraint";
    }
    return "unknown";
}

std::string to_string(Type t) {
    switch (t) {
        case Type::Double: return "Double";
        case Type::String: return "String";
        case Type::Document: return "Document";
        case Type::Array: return "Array";
        case Type::Binary: return "Binary";
        case Type::Undefined: return "Undefined";
        case Type::ObjectId: return "ObjectId";
        case Type::Boolean: return "Bool";
        case Type::UtcDateTime: return "UTCDateTime";
        case Type::Null: return "Null";
        case Type::Regex: return "Regex";
        case Type::DbPointer: return "DBPointer";
        case Type::JsCode: return "JsCode";
        case Type::Symbol: return "Symbol";
        case Type::JsCodeWithScope: return "JsCodeWithScope";
        case Type::Int32: return "Int32";
        case Type::Timestamp: return "Timestamp";
        case Type::Int64: return "Int64";
        case Type::MinKey: return "MinKey";
        case Type::MaxKey: return "MaxKey";
    }
    return "unknown";
}

// ------------------------------
// Value
// ------------------------------

Value::Value() : v(Null{}) {}
Value::Value(double d) : v(d) {}
Value::Value(std::string s) : v(std::move(s)) {}
Value::Value(const char* s) : v(std::string(s)) {}
Value::Value(Map m) : v(std::move(m)) {}
Value::Value(Document d) : v(std::move(d)) {}
Value::Value(RawDocument r) : v(std::move(r)) {}
Value::Value(Array a) : v(std::move(a)) {}
Value::Value(Binary b) : v(std::move(b)) {}
Value::Value(Undefined u) : v(u) {}
Value::Value(ObjectId o) : v(std::move(o)) {}
Value::Value(bool b) : v(b) {}
Value::Value(UtcDateTime t) : v(t) {}
Value::Value(Null n) : v(n) {}
Value::Value(Regex r) : v(std::move(r)) {}
Value::Value(DbPointer p) : v(std::move(p)) {}
Value::Value(JsCode c) : v(std::move(c)) {}
Value::Value(Symbol s) : v(std::move(s)) {}
Value::Value(JsCodeWithScope c) : v(std::move(c)) {}
Value::Value(std::int32_t i) : v(i) {}
Value::Value(Timestamp t) : v(t) {}
Value::Value(std::int64_t i) : v(i) {}
Value::Value(MinKey k) : v(k) {}
Value::Value(MaxKey k) : v(k) {}

namespace {

struct TypeOf {
    Type operator()(double) const { return Type::Double; }
    Type operator()(const std::string&) const { return Type::String; }
    Type operator()(const Map&) const { return Type::Document; }
    Type operator()(const Document&) const { return Type::Document; }
    Type operator()(const RawDocument&) const { return Type::Document; }
    Type operator()(const Array&) const { return Type::Array; }
    Type operator()(const Binary&) const { return Type::Binary; }
    Type operator()(Undefined) const { return Type::Undefined; }
    Type operator()(const ObjectId&) const { return Type::ObjectId; }
    Type operator()(bool) const { return Type::Boolean; }
    Type operator()(UtcDateTime) const { return Type::UtcDateTime; }
    Type operator()(Null) const { return Type::Null; }
    Type operator()(const Regex&) const { return Type::Regex; }
    Type operator()(const DbPointer&) const { return Type::DbPointer; }
    Type operator()(const JsCode&) const { return Type::JsCode; }
    Type operator()(const Symbol&) const { return Type::Symbol; }
    Type operator()(const JsCodeWithScope&) const { return Type::JsCodeWithScope; }
    Type operator()(std::int32_t) const { return Type::Int32; }
    Type operator()(Timestamp) const { return Type::Timestamp; }
    Type operator()(std::int64_t) const { return Type::Int64; }
    Type operator()(MinKey) const { return Type::MinKey; }
    Type operator()(MaxKey) const { return Type::MaxKey; }
};

} // namespace

Type Value::type() const noexcept {
    return std::visit(TypeOf{}, v);
}

bool operator==(const Value& a, const Value& b) { return a.v == b.v; }
bool operator!=(const Value& a, const Value& b) { return !(a == b); }
bool operator==(const Element& a, const Element& b) { return a.name == b.name && a.value == b.value; }
bool operator==(const RawDocument& a, const RawDocument& b) { return a.bytes == b.bytes; }
bool operator==(const Binary& a, const Binary& b) { return a.data == b.data; }
bool operator==(const Undefined&, const Undefined&) { return true; }
bool operator==(const ObjectId& a, const ObjectId& b) { return a.bytes == b.bytes; }
bool operator==(const UtcDateTime& a, const UtcDateTime& b) { return a.ms == b.ms; }
bool operator==(const Null&, const Null&) { return true; }
bool operator==(const Regex& a, const Regex& b) { return a.pattern == b.pattern && a.options == b.options; }
bool operator==(const DbPointer& a, const DbPointer& b) { return a.name == b.name && a.id == b.id; }
bool operator==(const JsCode& a, const JsCode& b) { return a.code == b.code; }
bool operator==(const Symbol& a, const Symbol& b) { return a.name == b.name; }
bool operator==(const JsCodeWithScope& a, const JsCodeWithScope& b) { return a.code == b.code && a.scope == b.scope; }
bool operator==(const Timestamp& a, const Timestamp& b) { return a.value == b.value; }
bool operator==(const MinKey&, const MinKey&) { return true; }
bool operator==(const MaxKey&, const MaxKey&) { return true; }

// ------------------------------
// Debug rendering
// ------------------------------

namespace {

std::string hex_bytes(const Bytes& b) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto c : b) oss << std::setw(2) << static_cast<int>(c);
    return oss.str();
}

struct Printer {
    std::ostream& os;

    void operator()(double d) const { os << "Float(" << d << ")"; }
    void operator()(const std::string& s) const { os << "String(" << s << ")"; }
    void operator()(const Map& m) const {
        os << "Map[";
        bool first = true;
        for (const auto& kv : m) {
            if (!first) os << ' ';
            first = false;
            os << kv.first << ": ";
            std::visit(*this, kv.second.v);
        }
        os << ']';
    }
    void operator()(const Document& d) const {
        os << "Slice[";
        for (std::size_t i = 0; i < d.size(); ++i) {
            if (i) os << ' ';
            os << d[i].name << ": ";
            std::visit(*this, d[i].value.v);
        }
        os << ']';
    }
    void operator()(const RawDocument& r) const { os << "BSON(" << hex_bytes(r.bytes) << ")"; }
    void operator()(const Array& a) const {
        os << "Array([";
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (i) os << ' ';
            std::visit(*this, a[i].v);
        }
        os << "])";
    }
    void operator()(const Binary& b) const { os << "Binary(" << hex_bytes(b.data) << ")"; }
    void operator()(Undefined) const { os << "Undefined()"; }
    void operator()(const ObjectId& o) const { os << "ObjectId(" << hex_bytes(o.bytes) << ")"; }
    void operator()(bool b) const { os << "Bool(" << (b ? "true" : "false") << ")"; }
    void operator()(UtcDateTime t) const { os << "UTCDateTime(" << t.ms << ")"; }
    void operator()(Null) const { os << "Null()"; }
    void operator()(const Regex& r) const {
        os << "Regexp(Pattern(" << r.pattern << ") Options(" << r.options << "))";
    }
    void operator()(const DbPointer& p) const {
        os << "DBPointer(Name(" << p.name << ") ObjectId(" << hex_bytes(p.id.bytes) << "))";
    }
    void operator()(const JsCode& c) const { os << "Javascript(" << c.code << ")"; }
    void operator()(const Symbol& s) const { os << "Symbol(" << s.name << ")"; }
    void operator()(const JsCodeWithScope& c) const {
        os << "JavascriptScope(Javascript(" << c.code << ") Scope(";
        (*this)(c.scope);
        os << "))";
    }
    void operator()(std::int32_t i) const { os << "Int32(" << i << ")"; }
    void operator()(Timestamp t) const { os << "Timestamp(" << t.value << ")"; }
    void operator()(std::int64_t i) const { os << "Int64(" << i << ")"; }
    void operator()(MinKey) const { os << "MinKey()"; }
    void operator()(MaxKey) const { os << "MaxKey()"; }
};

} // namespace

std::string to_string(const Value& v) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    std::visit(Printer{oss}, v.v);
    return oss.str();
}

std::string to_string(const Map& m) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    Printer{oss}(m);
    return oss.str();
}

std::string to_string(const Document& d) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    Printer{oss}(d);
    return oss.str();
}

// ------------------------------
// Small helpers
// ------------------------------

std::string catpath(const std::string& path, const std::string& name) {
    if (path.empty()) return name;
    return path + "." + name;
}

std::vector<std::string> split_path(const std::string& s) {
    std::vector<std::string> parts;
    if (s.empty()) return parts;
    std::size_t start = 0;
    while (true) {
        auto dot = s.find('.', start);
        if (dot == std::string::npos) dot = s.size();
        parts.push_back(s.substr(start, dot - start));
        if (dot == s.size()) break;
        start = dot + 1;
    }
    return parts;
}

std::uint32_t crc32(const RawDocument& raw) {
    uLong crc = ::crc32(0L, Z_NULL, 0);
    crc = ::crc32(crc, reinterpret_cast<const Bytef*>(raw.bytes.data()), static_cast<uInt>(raw.bytes.size()));
    return static_cast<std::uint32_t>(crc);
}

// ------------------------------
// Decoder
// ------------------------------

namespace {

using wire::Cursor;

// Reads a length prefix at the cursor and checks it against the ceiling and
// the bytes actually available. Returns the declared length.
std::size_t checked_length(Cursor& cur, const ReadOptions& opts) {
    std::int32_t len = cur.read_i32();
    if (len < 5) {
        throw BsonError(ErrorKind::Shape, "invalid document length " + std::to_string(len));
    }
    if (static_cast<std::size_t>(len) > opts.max_document_size) {
        throw BsonError(ErrorKind::Shape, "document length " + std::to_string(len) +
                                              " exceeds maximum size " + std::to_string(opts.max_document_size));
    }
    if (static_cast<std::size_t>(len) - 4 > cur.remaining()) {
        throw BsonError(ErrorKind::Shape, "truncated document: declared " + std::to_string(len) +
                                              " bytes, " + std::to_string(cur.remaining() + 4) + " available");
    }
    return static_cast<std::size_t>(len);
}

RawDocument read_raw(Cursor& cur, const ReadOptions& opts) {
    const std::uint8_t* start = cur.here();
    std::size_t len = checked_length(cur, opts);
    cur.take(len - 4);
    RawDocument raw;
    raw.bytes.assign(start, start + len);
    return raw;
}

void insert(Map& m, std::string name, Value v) {
    m[std::move(name)] = std::move(v);
}

void insert(Document& d, std::string name, Value v) {
    d.push_back(Element{std::move(name), std::move(v)});
}

// Array keys are "0", "1", ...; order them by numeric value so arrays with
// ten or more elements come back in index order. Keys that are not decimal
// indexes sort after the numeric ones, by string.
bool index_less(const Element& a, const Element& b) {
    auto numeric = [](const std::string& s, std::uint64_t& out) {
        if (s.empty() || s.size() > 18) return false;
        std::uint64_t n = 0;
        for (char c : s) {
            if (c < '0' || c > '9') return false;
            n = n * 10 + static_cast<std::uint64_t>(c - '0');
        }
        out = n;
        return true;
    };
    std::uint64_t na = 0;
    std::uint64_t nb = 0;
    bool ia = numeric(a.name, na);
    bool ib = numeric(b.name, nb);
    if (ia && ib) return na < nb;
    if (ia != ib) return ia;
    return a.name < b.name;
}

class Decoder {
public:
    explicit Decoder(const ReadOptions& opts) : opts_(opts) {}

    template <typename Doc>
    Doc document(Cursor& cur, const std::string& path, bool nest) {
        Doc out;
        elements<Doc>(cur, path, nest, [&](std::string name, Value v) {
            insert(out, std::move(name), std::move(v));
        });
        return out;
    }

private:
    template <typename Doc, typename Sink>
    void elements(Cursor& outer, const std::string& path, bool nest, Sink&& sink) {
        if (depth_ >= opts_.max_depth) {
            throw BsonError(ErrorKind::Shape, path,
                            "document nesting exceeds maximum depth " + std::to_string(opts_.max_depth));
        }
        DepthGuard guard{depth_};

        std::size_t len = 0;
        try {
            len = checked_length(outer, opts_);
        } catch (const BsonError& e) {
            if (e.path().empty() && !path.empty()) throw e.at(path);
            throw;
        }
        Cursor cur(outer.take(len - 4), len - 4);

        while (true) {
            std::uint8_t tag = 0;
            std::string name;
            try {
                tag = cur.read_u8();
                if (tag == 0x00) break;
                name = cur.read_cstring();
            } catch (const BsonError& e) {
                if (e.path().empty() && !path.empty()) throw e.at(path);
                throw;
            }
            std::string field_path = catpath(path, name);
            Value v;
            try {
                v = value<Doc>(cur, tag, field_path, nest);
            } catch (const BsonError& e) {
                if (e.path().empty()) throw e.at(field_path);
                throw;
            }
            sink(std::move(name), std::move(v));
        }

        if (cur.remaining() != 0) {
            throw BsonError(ErrorKind::Shape, path,
                            "document terminator found " + std::to_string(cur.remaining()) +
                                " bytes before its declared end");
        }
    }

    template <typename Doc>
    Array array(Cursor& cur, const std::string& path) {
        // Array bodies are always decoded in full, whatever the nest flag.
        Document body;
        elements<Doc>(cur, path, true, [&](std::string name, Value v) {
            body.push_back(Element{std::move(name), std::move(v)});
        });
        std::stable_sort(body.begin(), body.end(), index_less);
        Array out;
        out.reserve(body.size());
        for (auto& el : body) out.push_back(std::move(el.value));
        return out;
    }

    template <typename Doc>
    Value value(Cursor& cur, std::uint8_t tag, const std::string& path, bool nest) {
        switch (static_cast<Type>(tag)) {
            case Type::Double:
                return Value(cur.read_double());
            case Type::String:
                return Value(cur.read_string());
            case Type::Document:
                if (!nest) return Value(read_raw(cur, opts_));
                return Value(document<Doc>(cur, path, true));
            case Type::Array:
                return Value(array<Doc>(cur, path));
            case Type::Binary: {
                std::int32_t n = cur.read_i32();
                if (n < 0) throw BsonError(ErrorKind::Shape, "invalid binary length " + std::to_string(n));
                cur.read_u8(); // subtype, ignored
                Binary b;
                b.data = cur.read_bytes(static_cast<std::size_t>(n));
                return Value(std::move(b));
            }
            case Type::Undefined:
                return Value(Undefined{});
            case Type::ObjectId:
                return Value(ObjectId{cur.read_bytes(kObjectIdSize)});
            case Type::Boolean:
                return Value(cur.read_u8() == 0x01);
            case Type::UtcDateTime:
                return Value(UtcDateTime{cur.read_i64()});
            case Type::Null:
                return Value(Null{});
            case Type::Regex: {
                Regex r;
                r.pattern = cur.read_cstring();
                r.options = cur.read_cstring();
                return Value(std::move(r));
            }
            case Type::DbPointer: {
                DbPointer p;
                p.name = cur.read_string();
                p.id.bytes = cur.read_bytes(kObjectIdSize);
                return Value(std::move(p));
            }
            case Type::JsCode:
                return Value(JsCode{cur.read_string()});
            case Type::Symbol:
                return Value(Symbol{cur.read_string()});
            case Type::JsCodeWithScope: {
                std::size_t start = cur.offset();
                std::int32_t total = cur.read_i32();
                JsCodeWithScope c;
                c.code = cur.read_string();
                c.scope = document<Map>(cur, path, true);
                if (total < 0 || static_cast<std::size_t>(total) != cur.offset() - start) {
                    throw BsonError(ErrorKind::Shape, path, "code with scope length " + std::to_string(total) +
                                                                " does not match its contents");
                }
                return Value(std::move(c));
            }
            case Type::Int32:
                return Value(cur.read_i32());
            case Type::Timestamp:
                return Value(Timestamp{cur.read_i64()});
            case Type::Int64:
                return Value(cur.read_i64());
            case Type::MinKey:
                return Value(MinKey{});
            case Type::MaxKey:
                return Value(MaxKey{});
        }
        std::ostringstream oss;
        oss << "unsupported element type 0x" << std::uppercase << std::hex << std::setw(2)
            << std::setfill('0') << static_cast<int>(tag);
        throw BsonError(ErrorKind::Shape, path, oss.str());
    }

    struct DepthGuard {
        std::size_t& depth;
        explicit DepthGuard(std::size_t& d) : depth(d) { ++depth; }
        ~DepthGuard() { --depth; }
        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;
    };

    const ReadOptions& opts_;
    std::size_t depth_{0};
};

// The stream is read as raw bytes first so that the declared length is
// checked before anything is allocated for the body.
RawDocument read_raw_stream(std::istream& is, const ReadOptions& opts) {
    unsigned char b[4];
    is.read(reinterpret_cast<char*>(b), 4);
    if (is.bad()) throw BsonError(ErrorKind::Io, "stream read failed");
    if (is.gcount() != 4) {
        throw BsonError(ErrorKind::Shape, "unexpected end of stream while reading document length");
    }
    std::int32_t len = wire::load_i32(b);
    if (len < 5) {
        throw BsonError(ErrorKind::Shape, "invalid document length " + std::to_string(len));
    }
    if (static_cast<std::size_t>(len) > opts.max_document_size) {
        throw BsonError(ErrorKind::Shape, "document length " + std::to_string(len) +
                                              " exceeds maximum size " + std::to_string(opts.max_document_size));
    }
    RawDocument raw;
    raw.bytes.resize(static_cast<std::size_t>(len));
    std::copy(b, b + 4, raw.bytes.begin());
    std::streamsize want = static_cast<std::streamsize>(len) - 4;
    is.read(reinterpret_cast<char*>(raw.bytes.data() + 4), want);
    if (is.bad()) throw BsonError(ErrorKind::Io, "stream read failed");
    if (is.gcount() != want) {
        throw BsonError(ErrorKind::Shape, "truncated document: declared " + std::to_string(len) + " bytes, got " +
                                              std::to_string(is.gcount() + 4));
    }
    return raw;
}

} // namespace

Map decode_map(const std::uint8_t* data, std::size_t size, const ReadOptions& opts) {
    Cursor cur(data, size);
    return Decoder(opts).document<Map>(cur, std::string{}, opts.nest);
}

Map decode_map(const Bytes& bson, const ReadOptions& opts) {
    return decode_map(bson.data(), bson.size(), opts);
}

Map decode_map(const RawDocument& raw, const ReadOptions& opts) {
    return decode_map(raw.bytes.data(), raw.bytes.size(), opts);
}

Document decode_document(const std::uint8_t* data, std::size_t size, const ReadOptions& opts) {
    Cursor cur(data, size);
    return Decoder(opts).document<Document>(cur, std::string{}, opts.nest);
}

Document decode_document(const Bytes& bson, const ReadOptions& opts) {
    return decode_document(bson.data(), bson.size(), opts);
}

Document decode_document(const RawDocument& raw, const ReadOptions& opts) {
    return decode_document(raw.bytes.data(), raw.bytes.size(), opts);
}

RawDocument read_one(std::istream& is, const ReadOptions& opts) {
    return read_raw_stream(is, opts);
}

Map read_map(std::istream& is, const ReadOptions& opts) {
    RawDocument raw = read_raw_stream(is, opts);
    return decode_map(raw, opts);
}

Document read_document(std::istream& is, const ReadOptions& opts) {
    RawDocument raw = read_raw_stream(is, opts);
    return decode_document(raw, opts);
}

} // namespace bsonkit
