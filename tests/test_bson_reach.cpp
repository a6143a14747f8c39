#include "bsonkit/bson.hpp"
#include "bsonkit/encode.hpp"
#include "bsonkit/reach.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#define CHECK(cond) do { \
    if (!(cond)) { \
        std::ostringstream _oss; \
        _oss << "CHECK failed: " #cond " at " << __FILE__ << ":" << __LINE__; \
        throw std::runtime_error(_oss.str()); \
    } \
} while (0)

using namespace bsonkit;

template <typename Root, typename T>
static bool reach_throws_type(const Root& root, T& dst, const Path& path) {
    try {
        (void)reach(root, dst, path);
    } catch (const BsonError& e) {
        return e.kind() == ErrorKind::Type && e.path() == join_path(path);
    }
    return false;
}

static Map sample() {
    Map b;
    b["b"] = Value(std::int32_t{7});
    b["big"] = Value(std::int64_t{1} << 40);
    b["name"] = Value("seven");

    Map root;
    root["a"] = Value(b);
    root["pi"] = Value(3.5);
    root["flag"] = Value(true);
    root["code"] = Value(JsCode{"f()"});
    root["sym"] = Value(Symbol{"s"});
    root["bin"] = Value(Binary{Bytes{1, 2, 3}});
    root["when"] = Value(UtcDateTime{1500});
    root["ts"] = Value(Timestamp{99});
    root["nil"] = Value(Null{});
    root["undef"] = Value(Undefined{});
    root["list"] = Value(Array{Value(std::int32_t{1})});
    root["re"] = Value(Regex{"a.c", "i"});
    Map scope;
    scope["x"] = Value(std::int32_t{2});
    root["cws"] = Value(JsCodeWithScope{"x * 2", scope});
    ObjectId id;
    id.bytes.assign(kObjectIdSize, 0xAB);
    root["ptr"] = Value(DbPointer{"db.c", id});
    root["oid"] = Value(id);
    return root;
}

int main() {
    const Map root = sample();

    // The basic matrix.
    {
        std::int32_t i32 = 0;
        CHECK(reach(root, i32, Path{"a", "b"}));
        CHECK(i32 == 7);

        std::int64_t i64 = 0;
        CHECK(reach(root, i64, Path{"a", "b"}));
        CHECK(i64 == 7);

        std::int32_t untouched = -1;
        CHECK(!reach(root, untouched, Path{"a", "c"}));
        CHECK(untouched == -1);

        bool flag = false;
        CHECK(reach_throws_type(root, flag, Path{"a", "b"}));
        CHECK(!flag);
    }

    // Int64 does not narrow.
    {
        std::int32_t i32 = 0;
        CHECK(reach_throws_type(root, i32, Path{"a", "big"}));
        std::int64_t i64 = 0;
        CHECK(reach(root, i64, "a.big"));
        CHECK(i64 == (std::int64_t{1} << 40));
    }

    // Scalars by destination type.
    {
        double d = 0;
        CHECK(reach(root, d, "pi") && d == 3.5);
        bool b = false;
        CHECK(reach(root, b, "flag") && b);

        std::string s;
        CHECK(reach(root, s, "a.name") && s == "seven");
        CHECK(reach(root, s, "code") && s == "f()");
        CHECK(reach(root, s, "sym") && s == "s");

        Bytes bytes;
        CHECK(reach(root, bytes, "bin") && bytes == (Bytes{1, 2, 3}));
        CHECK(reach(root, bytes, "oid") && bytes.size() == kObjectIdSize);

        std::int64_t raw = 0;
        CHECK(reach(root, raw, "when") && raw == 1500);
        CHECK(reach(root, raw, "ts") && raw == 99);

        std::chrono::system_clock::time_point tp{};
        CHECK(reach(root, tp, "when"));
        CHECK(std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() == 1500);
        std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds> tp_us{};
        CHECK(reach(root, tp_us, "when") && tp_us.time_since_epoch().count() == 1500000);
        std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds> tp_s{};
        CHECK(reach(root, tp_s, "when") && tp_s.time_since_epoch().count() == 1);

        float f = 0;
        CHECK(reach_throws_type(root, f, Path{"pi"}));
        std::string wrong;
        CHECK(reach_throws_type(root, wrong, Path{"flag"}));
    }

    // Null-like leaves assign nothing but count as found.
    {
        std::int32_t i = 5;
        CHECK(reach(root, i, "nil"));
        CHECK(i == 5);
        std::string s = "keep";
        CHECK(reach(root, s, "undef"));
        CHECK(s == "keep");
    }

    // Containers only match their own shape.
    {
        Map m;
        CHECK(reach(root, m, "a"));
        CHECK(m.at("b") == Value(std::int32_t{7}));
        Document d;
        CHECK(reach_throws_type(root, d, Path{"a"}));

        Array arr;
        CHECK(reach(root, arr, "list") && arr.size() == 1);

        Regex re;
        CHECK(reach(root, re, "re") && re.pattern == "a.c");
    }

    // Scalars and arrays cannot be descended into.
    {
        Value v;
        CHECK(!reach(root, v, "pi.x"));
        CHECK(!reach(root, v, "list.0"));
        CHECK(!reach(root, v, "missing.deeper"));
    }

    // Fixed-shape payloads expose named fields.
    {
        std::string s;
        CHECK(reach(root, s, "re.Pattern") && s == "a.c");
        CHECK(reach(root, s, "re.Options") && s == "i");
        CHECK(reach(root, s, "ptr.Name") && s == "db.c");
        ObjectId id;
        CHECK(reach(root, id, "ptr.ObjectId") && id.bytes.size() == kObjectIdSize);
        CHECK(reach(root, s, "cws.Code") && s == "x * 2");
        std::int32_t x = 0;
        CHECK(reach(root, x, "cws.Scope.x") && x == 2);
        CHECK(!reach(root, s, "re.Nope"));
    }

    // Any leaf fits a Value destination; the empty path yields the root.
    {
        Value v;
        CHECK(reach(root, v, "a.b") && v == Value(std::int32_t{7}));
        auto whole = lookup(root, Path{});
        CHECK(whole.has_value() && whole->is<Map>());
        CHECK(!lookup(root, "a.zzz").has_value());
    }

    // Empty holders are allocated on demand, and only when assigned to.
    {
        std::optional<std::int64_t> opt;
        CHECK(reach(root, opt, "a.b"));
        CHECK(opt.has_value() && *opt == 7);

        std::unique_ptr<Map> um;
        CHECK(reach(root, um, "a"));
        CHECK(um && um->count("name") == 1);

        std::shared_ptr<std::string> sp;
        CHECK(reach(root, sp, "a.name"));
        CHECK(sp && *sp == "seven");

        std::optional<std::int32_t> still_empty;
        CHECK(reach(root, still_empty, "nil"));
        CHECK(!still_empty.has_value());

        std::optional<bool> failed;
        CHECK(reach_throws_type(root, failed, Path{"a", "b"}));
        CHECK(!failed.has_value());
    }

    // Order-preserving documents, and raw documents on the path.
    {
        Document inner{{"k", Value("v")}, {"k", Value("second")}};
        Document doc{{"outer", Value(inner)}};
        std::string s;
        CHECK(reach(doc, s, "outer.k") && s == "v");

        Bytes bytes = encode(doc);
        Document shallow = decode_document(bytes, ReadOptions{.nest = false});
        CHECK(shallow[0].value.is<RawDocument>());
        CHECK(reach(shallow, s, "outer.k") && s == "v");

        Value as_value(shallow);
        CHECK(reach(as_value, s, Path{"outer", "k"}) && s == "v");
    }

    std::cout << "All tests passed.\n";
    return 0;
}
