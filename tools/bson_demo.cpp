#include "bsonkit/bson_easy.hpp"
#include "bsonkit/encode.hpp"
#include "bsonkit/reach.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

struct Sensor {
    std::string name;
    std::int32_t channel{0};
    std::vector<double> readings;
    std::optional<std::string> note;

    void bson_fields(bsonkit::FieldWalker& w) const {
        w.field("Name", name, "name");
        w.field("Channel", channel, "channel");
        w.field("Readings", readings, "readings,omitempty");
        w.field("Note", note, "note,omitempty");
    }
};

int main() {
    try {
        using namespace bsonkit;

        ObjectIdGenerator ids;

        // Ad-hoc document from host values
        DocumentBuilder b;
        b.append("_id", ids.next())
         .append("created", std::chrono::system_clock::now())
         .append("title", "demo")
         .append("count", 3)
         .append("sensor", Sensor{"thermo", 2, {20.5, 21.0, 21.25}, std::nullopt});
        Bytes first = b.finish();

        // Canonical document, order preserved
        Document second;
        easy::push(second, "kind", Value("canonical"));
        easy::push(second, "pattern", Value(Regex{"^t.*o$", "i"}));
        easy::push(second, "tags", Value(Array{Value("a"), Value("b")}));

        std::string file = "demo_out.bson";
        {
            std::ofstream os(file, std::ios::binary);
            Bytes b2 = encode(second);
            os.write(reinterpret_cast<const char*>(first.data()), static_cast<std::streamsize>(first.size()));
            os.write(reinterpret_cast<const char*>(b2.data()), static_cast<std::streamsize>(b2.size()));
            if (!os) throw BsonError(ErrorKind::Io, "write failed: " + file);
        }
        std::cout << "Wrote: " << file << "\n";

        // Read both documents back
        std::ifstream is(file, std::ios::binary);
        Map one = read_map(is);
        Document two = read_document(is);

        std::string title;
        std::int64_t channel = 0;
        double first_reading = 0;
        if (!reach(one, title, "title") || !reach(one, channel, "sensor.channel")) {
            throw BsonError(ErrorKind::Shape, "demo document is missing title or sensor.channel");
        }
        if (auto readings = lookup(one, "sensor.readings"); readings && readings->is<Array>()) {
            first_reading = readings->as<Array>().front().as<double>();
        }
        std::cout << "Read title=" << title << " channel=" << channel << " reading0=" << first_reading << "\n";
        std::cout << "Read _id=" << easy::to_hex(one.at("_id").as<ObjectId>()) << "\n";

        std::string pattern;
        if (!reach(two, pattern, "pattern.Pattern")) {
            throw BsonError(ErrorKind::Shape, "demo document is missing pattern");
        }
        std::cout << "Read pattern=" << pattern << " fields=" << two.size() << "\n";
        std::cout << to_string(two) << "\n";

        std::cout << "OK\n";
        return 0;

    } catch (const bsonkit::BsonError& e) {
        std::cerr << "BSON error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
