#include "bsonkit/bson.hpp"
#include "bsonkit/encode.hpp"

#include <cstdint>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#define CHECK(cond) do { \
    if (!(cond)) { \
        std::ostringstream _oss; \
        _oss << "CHECK failed: " #cond " at " << __FILE__ << ":" << __LINE__; \
        throw std::runtime_error(_oss.str()); \
    } \
} while (0)

using namespace bsonkit;

struct Address {
    std::string street;
    std::int32_t number{0};

    void bson_fields(FieldWalker& w) const {
        w.field("Street", street, "street");
        w.field("Number", number, "number,omitempty");
    }
};

struct Person {
    std::string name;
    std::int64_t id{0};
    bool admin{false};
    std::vector<std::string> tags;
    std::optional<Address> home;
    Address work;
    std::string password; // never listed
    std::string note;

    void bson_fields(FieldWalker& w) const {
        w.field("Name", name);
        w.field("Id", id, "_id");
        w.field("Admin", admin, ",omitempty");
        w.field("Tags", tags, "tags,omitempty");
        w.field("Home", home, "home,omitempty");
        w.field("Work", work, "work");
        w.field("Note", note, "-");
    }
};

struct Nothing {
    std::int32_t hidden{3};

    void bson_fields(FieldWalker&) const {}
};

// Only `inner` is projected, so the float member is never looked at.
struct Partial {
    float ratio{0.5f};
    Address inner;

    void bson_fields(FieldWalker& w) const {
        w.field("Inner", inner);
    }
};

struct Gauge {
    float level{0.25f};

    void bson_fields(FieldWalker& w) const {
        w.field("Level", level, "level");
    }
};

struct Panel {
    Gauge gauge;

    void bson_fields(FieldWalker& w) const {
        w.field("Gauge", gauge, "gauge");
    }
};

struct HoldsBad {
    std::vector<Address> addrs;
    float weight{1.0f};

    void bson_fields(FieldWalker& w) const {
        w.field("Addrs", addrs);
        w.field("Weight", weight, "weight");
    }
};

int main() {
    // Directive grammar.
    {
        FieldTag t = FieldTag::parse("-");
        CHECK(t.ignore);
        t = FieldTag::parse("alias");
        CHECK(!t.ignore && t.name == "alias" && !t.omit_empty);
        t = FieldTag::parse("alias,omitempty");
        CHECK(t.name == "alias" && t.omit_empty);
        t = FieldTag::parse(",omitempty");
        CHECK(t.name.empty() && t.omit_empty);
        t = FieldTag::parse("");
        CHECK(!t.ignore && t.name.empty() && !t.omit_empty);
    }

    // Renames, omission and nesting, in declaration order.
    {
        Person p;
        p.name = "Ada";
        p.id = 42;
        p.work.street = "Main";
        p.password = "secret";
        p.note = "skip me";

        Document d = decode_document(encode_record(p));
        CHECK(d.size() == 3);
        CHECK(d[0].name == "Name" && d[0].value == Value("Ada"));
        CHECK(d[1].name == "_id" && d[1].value == Value(std::int64_t{42}));
        CHECK(d[2].name == "work");
        const Document& work = d[2].value.as<Document>();
        CHECK(work.size() == 1);
        CHECK(work[0].name == "street" && work[0].value == Value("Main"));
    }

    // Non-empty values under omitempty are kept.
    {
        Person p;
        p.name = "Grace";
        p.admin = true;
        p.tags = {"x", "y"};
        p.home = Address{"Elm", 12};

        Map m = decode_map(encode_record(p));
        CHECK(m.at("Admin") == Value(true));
        CHECK(m.at("tags") == Value(Array{Value("x"), Value("y")}));
        const Map& home = m.at("home").as<Map>();
        CHECK(home.at("street") == Value("Elm"));
        CHECK(home.at("number") == Value(std::int32_t{12}));
        CHECK(m.count("password") == 0);
        CHECK(m.count("Note") == 0);
        CHECK(m.count("note") == 0);
    }

    // A record that lists nothing is an empty document.
    {
        Bytes b = encode_record(Nothing{});
        CHECK(b.size() == 5);
        CHECK(decode_map(b).empty());
    }

    // Records are accepted wherever a host value is.
    {
        DocumentBuilder b;
        b.append("addr", Address{"Oak", 1});
        Map m = decode_map(b.finish());
        CHECK(m.at("addr").as<Map>().at("number") == Value(std::int32_t{1}));
    }

    // Errors inside records carry the full path.
    {
        HoldsBad h;
        h.addrs.push_back(Address{"A", 1});
        bool threw = false;
        try {
            (void)encode_record(h);
        } catch (const BsonError& e) {
            threw = e.kind() == ErrorKind::Type && e.path() == "weight";
        }
        CHECK(threw);
    }

    {
        bool threw = false;
        try {
            (void)encode_record(Panel{});
        } catch (const BsonError& e) {
            threw = e.kind() == ErrorKind::Type && e.path() == "gauge.level";
        }
        CHECK(threw);
    }

    {
        Document d = decode_document(encode_record(Partial{}));
        CHECK(d.size() == 1 && d[0].name == "Inner");
    }

    std::cout << "All tests passed.\n";
    return 0;
}
