#include "bsonkit/bson.hpp"
#include "bsonkit/bson_easy.hpp"
#include "bsonkit/encode.hpp"
#include "bsonkit/wire.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <set>
#include <sstream>
#include <streambuf>
#include <string>
#include <thread>
#include <vector>

#define CHECK(cond) do { \
    if (!(cond)) { \
        std::ostringstream _oss; \
        _oss << "CHECK failed: " #cond " at " << __FILE__ << ":" << __LINE__; \
        throw std::runtime_error(_oss.str()); \
    } \
} while (0)

using namespace bsonkit;

// Runs `fn` and returns the BsonError it throws; fails the test otherwise.
template <typename Fn>
static BsonError expect_error(Fn&& fn) {
    try {
        fn();
    } catch (const BsonError& e) {
        return e;
    }
    throw std::runtime_error("expected a BsonError");
}

static std::string as_stream_bytes(const Bytes& b) {
    return std::string(reinterpret_cast<const char*>(b.data()), b.size());
}

// `levels` embedded documents, each holding the next under the name "d".
static Bytes nested_bytes(std::size_t levels) {
    Bytes out;
    for (std::size_t i = 0; i < levels; ++i) {
        wire::put_i32(out, static_cast<std::int32_t>(5 + 8 * (levels - i)));
        wire::put_u8(out, 0x03);
        wire::put_cstring(out, "d");
    }
    wire::put_i32(out, 5);
    wire::put_u8(out, 0x00);
    for (std::size_t i = 0; i < levels; ++i) wire::put_u8(out, 0x00);
    return out;
}

struct FailingBuf : std::streambuf {
    int_type underflow() override { throw std::runtime_error("device gone"); }
};

int main() {
    // Identifier layout with an explicit host identity.
    {
        ObjectIdGenerator gen("example-host", 0x12345);
        CHECK(gen.pid() == 0x2345);
        ObjectId id = gen.next();
        CHECK(id.bytes.size() == kObjectIdSize);
        CHECK(id.bytes[4] == 0x03 && id.bytes[5] == 0x90 && id.bytes[6] == 0xC6);
        CHECK(id.bytes[7] == 0x23 && id.bytes[8] == 0x45);
        CHECK(id.bytes[9] == 0 && id.bytes[10] == 0 && id.bytes[11] == 1);
        ObjectId id2 = gen.next();
        CHECK(id2.bytes[11] == 2);
        CHECK(easy::to_hex(id).size() == 24);
        CHECK(easy::object_id_from_hex(easy::to_hex(id)) == id);
    }

    // Back-to-back identifiers increase strictly.
    {
        ObjectIdGenerator gen;
        ObjectId prev = gen.next();
        for (int i = 0; i < 2000; ++i) {
            ObjectId next = gen.next();
            CHECK(next.bytes.size() == kObjectIdSize);
            CHECK(std::lexicographical_compare(prev.bytes.begin(), prev.bytes.end(),
                                               next.bytes.begin(), next.bytes.end()));
            prev = next;
        }
    }

    // Concurrent callers never see the same identifier.
    {
        ObjectIdGenerator gen("host", 1);
        std::mutex mu;
        std::set<Bytes> seen;
        std::vector<std::thread> workers;
        for (int t = 0; t < 4; ++t) {
            workers.emplace_back([&] {
                std::vector<Bytes> mine;
                for (int i = 0; i < 1000; ++i) mine.push_back(gen.next().bytes);
                std::lock_guard<std::mutex> lock(mu);
                seen.insert(mine.begin(), mine.end());
            });
        }
        for (auto& w : workers) w.join();
        CHECK(seen.size() == 4000);
    }

    // Reading consecutive documents off one stream.
    {
        Bytes first = encode(Document{{"n", Value(std::int32_t{1})}});
        Bytes second = encode(Document{{"s", Value("two")}, {"b", Value(false)}});
        std::istringstream is(as_stream_bytes(first) + as_stream_bytes(second));
        CHECK(read_one(is).bytes == first);
        CHECK(read_one(is).bytes == second);
        BsonError e = expect_error([&] { (void)read_one(is); });
        CHECK(e.kind() == ErrorKind::Shape);
    }

    {
        Bytes first = encode(Document{{"n", Value(std::int32_t{1})}});
        Bytes second = encode(Document{{"s", Value("two")}});
        std::istringstream is(as_stream_bytes(first) + as_stream_bytes(second));
        Map m = read_map(is);
        CHECK(m.at("n") == Value(std::int32_t{1}));
        Document d = read_document(is);
        CHECK(d[0].name == "s");
    }

    // A declared size above the ceiling is rejected before the body is read.
    {
        Bytes huge{0xFF, 0xFF, 0xFF, 0x7F, 0x0A};
        std::istringstream is(as_stream_bytes(huge));
        ReadOptions small{.max_document_size = 1024};
        BsonError e = expect_error([&] { (void)read_one(is, small); });
        CHECK(e.kind() == ErrorKind::Shape);
        CHECK(is.tellg() == std::streampos(4));

        BsonError e2 = expect_error([&] { (void)decode_map(huge, small); });
        CHECK(e2.kind() == ErrorKind::Shape);

        Bytes ok = encode(Document{{"pad", Value(std::string(2000, 'x'))}});
        BsonError e3 = expect_error([&] { (void)decode_document(ok, small); });
        CHECK(e3.kind() == ErrorKind::Shape);
        CHECK(decode_document(ok).size() == 1);
    }

    // Truncation, in a buffer and on a stream.
    {
        Bytes b = encode(Document{{"hello", Value("world")}});
        Bytes cut(b.begin(), b.end() - 3);
        CHECK(expect_error([&] { (void)decode_document(cut); }).kind() == ErrorKind::Shape);

        std::istringstream is(as_stream_bytes(cut));
        CHECK(expect_error([&] { (void)read_one(is); }).kind() == ErrorKind::Shape);

        Bytes tiny{0x03, 0x00};
        CHECK(expect_error([&] { (void)decode_map(tiny); }).kind() == ErrorKind::Shape);
    }

    // Stream failures are I/O errors.
    {
        FailingBuf buf;
        std::istream is(&buf);
        CHECK(expect_error([&] { (void)read_one(is); }).kind() == ErrorKind::Io);
    }

    // Unknown tags are shape errors located at the field.
    {
        Bytes b = encode(Document{{"odd", Value(std::int32_t{0})}});
        b[4] = 0x13;
        BsonError e = expect_error([&] { (void)decode_document(b); });
        CHECK(e.kind() == ErrorKind::Shape);
        CHECK(e.path() == "odd");
        CHECK(e.message().find("0x13") != std::string::npos);
    }

    // Nesting depth is bounded well inside the size ceiling.
    {
        Bytes deep = nested_bytes(200000);
        CHECK(deep.size() < kDefaultMaxDocumentSize);
        BsonError e = expect_error([&] { (void)decode_map(deep); });
        CHECK(e.kind() == ErrorKind::Shape);
        CHECK(e.message().find("maximum depth") != std::string::npos);
        CHECK(expect_error([&] { (void)decode_document(deep); }).kind() == ErrorKind::Shape);

        ReadOptions flat{.nest = false};
        CHECK(decode_map(deep, flat).at("d").is<RawDocument>());

        Bytes five = nested_bytes(5);
        CHECK(decode_document(five).size() == 1);
        ReadOptions shallow{.max_depth = 3};
        BsonError e3 = expect_error([&] { (void)decode_document(five, shallow); });
        CHECK(e3.kind() == ErrorKind::Shape);
        CHECK(e3.path() == "d.d.d");

        Document arr{{"a", Value(Array{Value(Array{Value(1)})})}};
        ReadOptions two{.max_depth = 2};
        CHECK(expect_error([&] { (void)decode_map(encode(arr), two); }).path() == "a.0");
    }

    // Nested failures report the innermost path.
    {
        Document inner{{"x", Value("abc")}};
        Bytes b = encode(Document{{"outer", Value(inner)}});
        // outer len(4) tag(1) "outer\0"(6) inner len(4) tag(1) "x\0"(2) -> string length
        std::size_t at = 4 + 1 + 6 + 4 + 1 + 2;
        b[at] = 0x40;
        BsonError e = expect_error([&] { (void)decode_map(b); });
        CHECK(e.kind() == ErrorKind::Shape);
        CHECK(e.path() == "outer.x");
        CHECK(std::string(e.what()).rfind("outer.x, ", 0) == 0);
    }

    // Terminator found before the declared end.
    {
        Bytes b = encode(Document{{"a", Value(true)}});
        b.insert(b.end() - 1, 0x00);
        b[0] = static_cast<std::uint8_t>(b.size());
        CHECK(expect_error([&] { (void)decode_document(b); }).kind() == ErrorKind::Shape);
    }

    // Code-with-scope total must match its contents.
    {
        Bytes b = encode(Document{{"c", Value(JsCodeWithScope{"x", Map{}})}});
        // len(4) tag(1) "c\0"(2) -> total
        b[7] = static_cast<std::uint8_t>(b[7] + 1);
        BsonError e = expect_error([&] { (void)decode_document(b); });
        CHECK(e.kind() == ErrorKind::Shape && e.path() == "c");
    }

    // Encode-side constraints.
    {
        Map m;
        m[std::string("a\0b", 3)] = Value(true);
        CHECK(expect_error([&] { (void)encode(m); }).kind() == ErrorKind::Constraint);

        Document d{{"id", Value(ObjectId{Bytes(11, 0)})}};
        BsonError e = expect_error([&] { (void)encode(d); });
        CHECK(e.kind() == ErrorKind::Constraint && e.path() == "id");

        Document p{{"ref", Value(DbPointer{"c", ObjectId{Bytes(13, 0)}})}};
        CHECK(expect_error([&] { (void)encode(p); }).kind() == ErrorKind::Constraint);

        RawDocument bad{Bytes{0x09, 0x00, 0x00, 0x00, 0x00}};
        Document r{{"raw", Value(bad)}};
        CHECK(expect_error([&] { (void)encode(r); }).kind() == ErrorKind::Shape);
    }

    // Checksums and hex helpers.
    {
        RawDocument raw{encode(Document{{"hello", Value("world")}})};
        CHECK(crc32(raw) == 0xAD927E4Au);
        CHECK(easy::to_hex(Bytes{0x00, 0xAB, 0x10}) == "00ab10");
        CHECK(easy::from_hex("00AB10") == (Bytes{0x00, 0xAB, 0x10}));
        CHECK(expect_error([] { (void)easy::from_hex("abc"); }).kind() == ErrorKind::Shape);
        CHECK(expect_error([] { (void)easy::object_id_from_hex("abcd"); }).kind() == ErrorKind::Constraint);
    }

    // Path helpers.
    {
        CHECK(catpath("", "a") == "a");
        CHECK(catpath("a.b", "c") == "a.b.c");
        std::vector<std::string> parts = split_path("a.b.c");
        CHECK(parts.size() == 3 && parts[2] == "c");
        CHECK(split_path("").empty());
        CHECK(to_string(ErrorKind::Constraint) == "constraint");
        CHECK(to_string(Type::JsCodeWithScope) == "JsCodeWithScope");
    }

    std::cout << "All tests passed.\n";
    return 0;
}
