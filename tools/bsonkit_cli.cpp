#include "bsonkit/bson.hpp"
#include "bsonkit/bson_easy.hpp"
#include "bsonkit/encode.hpp"
#include "bsonkit/reach.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

// FTXUI TUI
#include <ftxui/component/component.hpp>
#include <ftxui/component/component_base.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/terminal.hpp>

#if !defined(_WIN32)
#include <unistd.h>
#endif

namespace {

struct Ansi {
    bool enabled{true};

    std::string reset() const { return enabled ? "\x1b[0m" : ""; }
    std::string dim() const { return enabled ? "\x1b[2m" : ""; }
    std::string bold() const { return enabled ? "\x1b[1m" : ""; }
    std::string red() const { return enabled ? "\x1b[31m" : ""; }
    std::string yellow() const { return enabled ? "\x1b[33m" : ""; }
    std::string magenta() const { return enabled ? "\x1b[35m" : ""; }
    std::string cyan() const { return enabled ? "\x1b[36m" : ""; }
    std::string gray() const { return enabled ? "\x1b[90m" : ""; }
};

static bool is_tty() {
#if defined(_WIN32)
    return false;
#else
    return ::isatty(fileno(stdout));
#endif
}

static std::string hex8(std::uint32_t v) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setw(8) << std::setfill('0') << v;
    return oss.str();
}

static void usage() {
    std::cerr <<
        "bsonkit - BSON document inspector\n"
        "\n"
        "Usage:\n"
        "  bsonkit info <FILE> [--max-size BYTES] [--no-color]\n"
        "  bsonkit tree <FILE> [--doc N] [--no-nest] [--max-depth N] [--max-size BYTES] [--no-color]\n"
        "  bsonkit get  <FILE> <PATH> [--doc N] [--max-size BYTES]\n"
        "  bsonkit show <FILE> [<PATH>] [--doc N] [--max-size BYTES]\n"
        "  bsonkit oid  [--count N]\n";
}

struct Args {
    std::string cmd;
    std::string file;
    std::string path;
    std::size_t doc{0};
    bool no_nest{false};
    bool no_color{false};
    std::size_t max_size{bsonkit::kDefaultMaxDocumentSize};
    std::size_t max_depth{static_cast<std::size_t>(-1)};
    std::size_t count{1};
};

static bool parse_args(int argc, char** argv, Args& a) {
    if (argc < 2) return false;
    a.cmd = argv[1];

    int i = 2;
    if (a.cmd != "oid") {
        if (i >= argc) return false;
        a.file = argv[i++];
    }
    // positional path for get/show
    if ((a.cmd == "get" || a.cmd == "show") && i < argc && std::string(argv[i]).rfind("--", 0) != 0) {
        a.path = argv[i++];
    }

    while (i < argc) {
        std::string opt = argv[i++];
        if (opt == "--no-nest") a.no_nest = true;
        else if (opt == "--no-color") a.no_color = true;
        else if (opt == "--doc" && i < argc) a.doc = static_cast<std::size_t>(std::stoull(argv[i++]));
        else if (opt == "--max-size" && i < argc) a.max_size = static_cast<std::size_t>(std::stoull(argv[i++]));
        else if (opt == "--max-depth" && i < argc) a.max_depth = static_cast<std::size_t>(std::stoull(argv[i++]));
        else if (opt == "--count" && i < argc) a.count = static_cast<std::size_t>(std::stoull(argv[i++]));
        else {
            std::cerr << "Unknown option: " << opt << "\n";
            return false;
        }
    }

    if (a.cmd != "info" && a.cmd != "tree" && a.cmd != "get" && a.cmd != "show" && a.cmd != "oid") {
        std::cerr << "Unknown command: " << a.cmd << "\n";
        return false;
    }
    if (a.cmd == "get" && a.path.empty()) {
        std::cerr << "get needs a PATH\n";
        return false;
    }
    return true;
}

// ----------------- File access -----------------

struct RawEntry {
    std::uint64_t offset{0};
    bsonkit::RawDocument raw;
};

static std::vector<RawEntry> read_all(const std::string& file, const bsonkit::ReadOptions& opts) {
    std::ifstream is(file, std::ios::binary);
    if (!is) throw bsonkit::BsonError(bsonkit::ErrorKind::Io, "cannot open " + file);

    std::vector<RawEntry> out;
    std::uint64_t offset = 0;
    while (is.peek() != std::char_traits<char>::eof()) {
        RawEntry e;
        e.offset = offset;
        try {
            e.raw = bsonkit::read_one(is, opts);
        } catch (const bsonkit::BsonError& err) {
            throw bsonkit::BsonError(err.kind(), "document " + std::to_string(out.size()) + " at offset " +
                                                     std::to_string(offset) + ": " + err.what());
        }
        offset += e.raw.bytes.size();
        out.push_back(std::move(e));
    }
    if (is.bad()) throw bsonkit::BsonError(bsonkit::ErrorKind::Io, "read failed: " + file);
    return out;
}

static bsonkit::RawDocument load_raw(const Args& a) {
    bsonkit::ReadOptions opts{.max_document_size = a.max_size};
    auto docs = read_all(a.file, opts);
    if (a.doc >= docs.size()) {
        throw bsonkit::BsonError(bsonkit::ErrorKind::Shape, "document " + std::to_string(a.doc) +
                                                                " not found (file holds " +
                                                                std::to_string(docs.size()) + ")");
    }
    return std::move(docs[a.doc].raw);
}

static bsonkit::Document load_doc(const Args& a) {
    bsonkit::ReadOptions opts{.nest = !a.no_nest, .max_document_size = a.max_size};
    return bsonkit::decode_document(load_raw(a), opts);
}

// ----------------- Value summaries -----------------

static std::string clip(std::string s, std::size_t n) {
    if (s.size() > n) {
        s.resize(n);
        s += "...";
    }
    return s;
}

static std::string summary(const bsonkit::Value& v) {
    using namespace bsonkit;
    if (v.is<Map>()) return std::to_string(v.as<Map>().size()) + " fields";
    if (v.is<Document>()) return std::to_string(v.as<Document>().size()) + " fields";
    if (v.is<Array>()) return std::to_string(v.as<Array>().size()) + " items";
    if (v.is<RawDocument>()) return "raw, " + std::to_string(v.as<RawDocument>().bytes.size()) + " bytes";
    if (v.is<std::string>()) return "\"" + clip(v.as<std::string>(), 60) + "\"";
    if (v.is<Binary>()) return std::to_string(v.as<Binary>().data.size()) + " bytes";
    if (v.is<ObjectId>()) return easy::to_hex(v.as<ObjectId>());
    return clip(to_string(v), 60);
}

static bool has_children(const bsonkit::Value& v) {
    return v.is<bsonkit::Map>() || v.is<bsonkit::Document>() || v.is<bsonkit::Array>();
}

// Ordered (name, child) view over a container value.
static std::vector<std::pair<std::string, const bsonkit::Value*>> children_of(const bsonkit::Value& v) {
    using namespace bsonkit;
    std::vector<std::pair<std::string, const Value*>> out;
    if (v.is<Document>()) {
        for (const auto& el : v.as<Document>()) out.emplace_back(el.name, &el.value);
    } else if (v.is<Map>()) {
        for (const auto& kv : v.as<Map>()) out.emplace_back(kv.first, &kv.second);
    } else if (v.is<Array>()) {
        const auto& arr = v.as<Array>();
        for (std::size_t i = 0; i < arr.size(); ++i) out.emplace_back(std::to_string(i), &arr[i]);
    }
    return out;
}

// ----------------- Tree printer -----------------

static void print_tree(const bsonkit::Value& node, const Ansi& ansi, std::size_t indent, std::size_t depth,
                       std::size_t max_depth) {
    if (depth > max_depth) return;
    for (const auto& [name, child] : children_of(node)) {
        std::string pad(indent, ' ');
        if (has_children(*child)) {
            std::cout << pad << ansi.magenta() << name << "/" << ansi.reset()
                      << " " << ansi.gray() << summary(*child) << ansi.reset() << "\n";
            print_tree(*child, ansi, indent + 2, depth + 1, max_depth);
        } else {
            std::cout << pad
                      << ansi.cyan() << name << ansi.reset()
                      << " " << ansi.yellow() << bsonkit::to_string(child->type()) << ansi.reset()
                      << " " << ansi.gray() << summary(*child) << ansi.reset() << "\n";
        }
    }
}

// ----------------- Element browser (FTXUI) -----------------

// One element of the document being browsed, with its encoded form.
struct ElementRow {
    std::string name;
    bsonkit::Value value;
    std::size_t offset{0}; // from the start of the enclosing document
    bsonkit::Bytes bytes;  // tag, name and payload
};

struct Frame {
    std::string path; // empty for the top-level document
    bsonkit::RawDocument raw;
    std::vector<ElementRow> rows;
    int selected{0};
    int scroll{0};
};

// Decodes one level only; embedded documents stay raw until opened.
static Frame open_frame(const std::string& path, bsonkit::RawDocument raw, const bsonkit::ReadOptions& opts) {
    Frame f;
    f.path = path;
    f.raw = std::move(raw);
    bsonkit::Document top = bsonkit::decode_document(f.raw, opts);
    std::size_t offset = 4;
    for (auto& el : top) {
        ElementRow r;
        bsonkit::Bytes one = bsonkit::encode(bsonkit::Document{el});
        r.bytes.assign(one.begin() + 4, one.end() - 1);
        r.offset = offset;
        offset += r.bytes.size();
        r.name = std::move(el.name);
        r.value = std::move(el.value);
        f.rows.push_back(std::move(r));
    }
    return f;
}

// Document bytes behind a value the browser can step into.
static std::optional<bsonkit::RawDocument> child_document(const bsonkit::Value& v) {
    using namespace bsonkit;
    if (v.is<RawDocument>()) return v.as<RawDocument>();
    if (v.is<Document>()) return RawDocument{encode(v.as<Document>())};
    if (v.is<Map>()) return RawDocument{encode(v.as<Map>())};
    if (v.is<JsCodeWithScope>()) return RawDocument{encode(v.as<JsCodeWithScope>().scope)};
    if (v.is<Array>()) {
        const auto& arr = v.as<Array>();
        Document d;
        for (std::size_t i = 0; i < arr.size(); ++i) d.push_back(Element{std::to_string(i), arr[i]});
        return RawDocument{encode(d)};
    }
    return std::nullopt;
}

static std::vector<std::string> hex_dump(const bsonkit::Bytes& b, std::size_t base, std::size_t limit) {
    std::vector<std::string> out;
    std::size_t n = std::min(b.size(), limit);
    for (std::size_t row = 0; row < n; row += 16) {
        std::ostringstream oss;
        oss << std::hex << std::setfill('0') << std::setw(6) << (base + row) << "  ";
        std::string ascii;
        for (std::size_t i = row; i < row + 16; ++i) {
            if (i < n) {
                oss << std::setw(2) << static_cast<int>(b[i]) << ' ';
                ascii.push_back(b[i] >= 0x20 && b[i] < 0x7F ? static_cast<char>(b[i]) : '.');
            } else {
                oss << "   ";
            }
        }
        oss << ' ' << ascii;
        out.push_back(oss.str());
    }
    if (b.size() > limit) out.push_back("... " + std::to_string(b.size() - limit) + " more bytes");
    return out;
}

static std::vector<std::pair<std::string, std::string>> element_details(const ElementRow& r) {
    std::vector<std::pair<std::string, std::string>> kv;
    std::ostringstream tag;
    tag << "0x" << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(r.bytes.empty() ? 0 : r.bytes[0]);
    kv.emplace_back("type", bsonkit::to_string(r.value.type()));
    kv.emplace_back("tag", tag.str());
    kv.emplace_back("offset", std::to_string(r.offset));
    kv.emplace_back("size", std::to_string(r.bytes.size()));
    kv.emplace_back("value", summary(r.value));
    if (auto child = child_document(r.value)) {
        kv.emplace_back("document", std::to_string(child->bytes.size()) + " bytes" +
                                        (r.value.is<bsonkit::RawDocument>() ? ", not decoded" : ""));
        kv.emplace_back("crc32", hex8(bsonkit::crc32(*child)));
    }
    return kv;
}

static int run_show(const Args& a, const bsonkit::RawDocument& raw) {
    using namespace ftxui;
    constexpr std::size_t kDumpLimit = 512;

    bsonkit::ReadOptions opts{.nest = false, .max_document_size = a.max_size};

    std::vector<Frame> stack;
    stack.push_back(open_frame(std::string{}, raw, opts));
    for (const auto& part : bsonkit::split_path(a.path)) {
        Frame& top = stack.back();
        auto it = std::find_if(top.rows.begin(), top.rows.end(),
                               [&](const ElementRow& r) { return r.name == part; });
        std::optional<bsonkit::RawDocument> child;
        if (it != top.rows.end()) child = child_document(it->value);
        if (!child) {
            std::cerr << "not a document path: " << a.path << "\n";
            return 2;
        }
        top.selected = static_cast<int>(it - top.rows.begin());
        std::string next_path = bsonkit::catpath(top.path, part);
        stack.push_back(open_frame(next_path, std::move(*child), opts));
    }

    std::string status;

    auto current = [&]() -> const ElementRow* {
        const Frame& f = stack.back();
        if (f.rows.empty()) return nullptr;
        return &f.rows[static_cast<std::size_t>(f.selected)];
    };

    auto move_to = [&](int idx) {
        Frame& f = stack.back();
        if (f.rows.empty()) return;
        f.selected = std::clamp(idx, 0, static_cast<int>(f.rows.size()) - 1);
    };

    auto descend = [&]() {
        const ElementRow* r = current();
        if (!r) return;
        auto child = child_document(r->value);
        if (!child) {
            status = r->name + " is " + bsonkit::to_string(r->value.type()) + ", not a document";
            return;
        }
        std::string next_path = bsonkit::catpath(stack.back().path, r->name);
        try {
            Frame next = open_frame(next_path, std::move(*child), opts);
            stack.push_back(std::move(next));
            status.clear();
        } catch (const bsonkit::BsonError& e) {
            status = "cannot open " + next_path + ": " + e.what();
        }
    };

    auto left_pane = Renderer([&] {
        Frame& f = stack.back();
        int visible = std::max(3, std::max(10, Terminal::Size().dimy) - 7);
        int total = static_cast<int>(f.rows.size());
        if (f.selected < f.scroll) f.scroll = f.selected;
        if (f.selected >= f.scroll + visible) f.scroll = f.selected - visible + 1;
        f.scroll = std::clamp(f.scroll, 0, std::max(0, total - visible));

        std::vector<Element> lines;
        if (total == 0) lines.push_back(text("(empty document)") | color(Color::GrayDark));
        for (int i = f.scroll; i < std::min(total, f.scroll + visible); ++i) {
            const ElementRow& r = f.rows[static_cast<std::size_t>(i)];
            bool opens = child_document(r.value).has_value();
            Element line = hbox({
                text(opens ? "+ " : "  ") | color(Color::GrayDark),
                text(r.name) | color(opens ? Color::Magenta : Color::Cyan) | flex,
                text(bsonkit::to_string(r.value.type())) | color(Color::Yellow),
                text(" " + std::to_string(r.bytes.size())) | color(Color::GrayDark),
            });
            if (i == f.selected) line = line | inverted;
            lines.push_back(line);
        }

        std::string where = "doc " + std::to_string(a.doc);
        if (!f.path.empty()) where += " / " + f.path;
        auto header = vbox({
            hbox({text(where) | bold | color(Color::Green), filler(),
                  text(std::to_string(f.raw.bytes.size()) + " bytes") | color(Color::GrayDark)}),
            text("Enter open  Backspace up  q quit") | color(Color::GrayDark),
        });
        Element footer = text(status) | color(Color::Red);
        return vbox({header, separator(), vbox(std::move(lines)) | flex, footer}) | border;
    });

    auto right_pane = Renderer([&] {
        const ElementRow* r = current();
        if (!r) return text("") | border | flex;

        std::vector<Element> meta;
        for (const auto& [k, v] : element_details(*r)) {
            meta.push_back(hbox({text(k) | bold | color(Color::Yellow) | size(WIDTH, EQUAL, 10),
                                 text(v) | color(Color::GrayLight) | flex}));
        }
        std::vector<Element> dump;
        for (const auto& line : hex_dump(r->bytes, r->offset, kDumpLimit)) {
            dump.push_back(text(line) | color(Color::White));
        }
        return vbox({
                   text(bsonkit::catpath(stack.back().path, r->name)) | bold | color(Color::Green),
                   separator(),
                   vbox(std::move(meta)),
                   separator(),
                   vbox(std::move(dump)) | vscroll_indicator | frame | flex,
               }) |
               border | flex;
    });

    auto layout = Renderer([&] {
        return hbox({left_pane->Render() | size(WIDTH, EQUAL, 48), right_pane->Render() | flex}) |
               size(HEIGHT, EQUAL, std::max(10, Terminal::Size().dimy));
    });

    auto screen = ScreenInteractive::TerminalOutput();
    screen.TrackMouse(true);

    auto app = CatchEvent(layout, [&](Event e) {
        int sel = stack.back().selected;
        if (e == Event::Character('q') || e == Event::Escape) {
            screen.Exit();
        } else if (e == Event::ArrowUp) {
            move_to(sel - 1);
        } else if (e == Event::ArrowDown) {
            move_to(sel + 1);
        } else if (e == Event::PageUp) {
            move_to(sel - 20);
        } else if (e == Event::PageDown) {
            move_to(sel + 20);
        } else if (e == Event::Home) {
            move_to(0);
        } else if (e == Event::End) {
            move_to(static_cast<int>(stack.back().rows.size()) - 1);
        } else if (e == Event::Return || e == Event::ArrowRight) {
            descend();
        } else if (e == Event::Backspace || e == Event::ArrowLeft) {
            if (stack.size() > 1) stack.pop_back();
            status.clear();
        } else if (e.is_mouse() && e.mouse().button == Mouse::WheelUp) {
            move_to(sel - 3);
        } else if (e.is_mouse() && e.mouse().button == Mouse::WheelDown) {
            move_to(sel + 3);
        } else {
            return false;
        }
        return true;
    });

    screen.Loop(app);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    Args a;
    if (!parse_args(argc, argv, a)) {
        usage();
        return 2;
    }

    Ansi ansi;
    ansi.enabled = !a.no_color && is_tty();

    try {
        if (a.cmd == "info") {
            bsonkit::ReadOptions opts{.nest = false, .max_document_size = a.max_size};
            auto docs = read_all(a.file, opts);

            std::cout << ansi.bold() << "File" << ansi.reset() << ": " << a.file << "\n";
            std::cout << ansi.bold() << "Documents" << ansi.reset() << ": " << docs.size() << "\n";
            for (std::size_t i = 0; i < docs.size(); ++i) {
                const auto& e = docs[i];
                bsonkit::Document top = bsonkit::decode_document(e.raw, opts);
                std::cout << ansi.cyan() << "#" << i << ansi.reset()
                          << " " << ansi.dim() << "off=" << e.offset
                          << " size=" << e.raw.bytes.size()
                          << " fields=" << top.size()
                          << " crc32=" << hex8(bsonkit::crc32(e.raw)) << ansi.reset() << "\n";
            }
            return 0;
        }

        if (a.cmd == "tree") {
            bsonkit::Document doc = load_doc(a);
            std::cout << ansi.bold() << "Document " << a.doc << ansi.reset() << ": " << a.file << "\n";
            print_tree(bsonkit::Value(std::move(doc)), ansi, 0, 0, a.max_depth);
            return 0;
        }

        if (a.cmd == "get") {
            bsonkit::Document doc = load_doc(a);
            auto v = bsonkit::lookup(doc, a.path);
            if (!v) {
                std::cerr << ansi.red() << "not found" << ansi.reset() << ": " << a.path << "\n";
                return 1;
            }
            std::cout << ansi.yellow() << bsonkit::to_string(v->type()) << ansi.reset()
                      << " " << bsonkit::to_string(*v) << "\n";
            return 0;
        }

        if (a.cmd == "show") {
            return run_show(a, load_raw(a));
        }

        if (a.cmd == "oid") {
            bsonkit::ObjectIdGenerator gen;
            for (std::size_t i = 0; i < a.count; ++i) {
                std::cout << bsonkit::easy::to_hex(gen.next()) << "\n";
            }
            return 0;
        }
    } catch (const bsonkit::BsonError& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << " (" << bsonkit::to_string(e.kind()) << "): "
                  << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << ": " << e.what() << "\n";
        return 1;
    }

    usage();
    return 2;
}
