#include "bsonkit/reach.hpp"

#include <utility>

namespace bsonkit {

namespace {

const Value* find_in(const Map& m, const std::string& name) {
    auto it = m.find(name);
    if (it == m.end()) return nullptr;
    return &it->second;
}

const Value* find_in(const Document& d, const std::string& name) {
    for (const auto& el : d) {
        if (el.name == name) return &el.value;
    }
    return nullptr;
}

// One step down from `cur`. Values that only exist as fields of a
// fixed-shape payload are built into `scratch`, which may alias `cur`;
// everything needed from `cur` is copied out before `scratch` is written.
const Value* step(const Value& cur, const std::string& name, Value& scratch) {
    if (cur.is<Map>()) return find_in(cur.as<Map>(), name);
    if (cur.is<Document>()) return find_in(cur.as<Document>(), name);

    if (cur.is<RawDocument>()) {
        Value decoded(decode_document(cur.as<RawDocument>()));
        scratch = std::move(decoded);
        return find_in(scratch.as<Document>(), name);
    }

    Value next;
    if (cur.is<Regex>()) {
        const auto& r = cur.as<Regex>();
        if (name == "Pattern") {
            next = Value(r.pattern);
        } else if (name == "Options") {
            next = Value(r.options);
        } else {
            return nullptr;
        }
    } else if (cur.is<DbPointer>()) {
        const auto& p = cur.as<DbPointer>();
        if (name == "Name") {
            next = Value(p.name);
        } else if (name == "ObjectId") {
            next = Value(p.id);
        } else {
            return nullptr;
        }
    } else if (cur.is<JsCodeWithScope>()) {
        const auto& c = cur.as<JsCodeWithScope>();
        if (name == "Code") {
            next = Value(JsCode{c.code});
        } else if (name == "Scope") {
            next = Value(c.scope);
        } else {
            return nullptr;
        }
    } else {
        // Scalars and arrays have no fields.
        return nullptr;
    }
    scratch = std::move(next);
    return &scratch;
}

std::optional<Value> walk(const Value* cur, const Path& path, std::size_t from, Value& scratch) {
    for (std::size_t i = from; i < path.size(); ++i) {
        if (!cur) return std::nullopt;
        cur = step(*cur, path[i], scratch);
    }
    if (!cur) return std::nullopt;
    return *cur;
}

} // namespace

std::string join_path(const Path& path) {
    std::string out;
    for (const auto& p : path) out = catpath(out, p);
    return out;
}

std::optional<Value> lookup(const Value& root, const Path& path) {
    Value scratch;
    return walk(&root, path, 0, scratch);
}

std::optional<Value> lookup(const Map& root, const Path& path) {
    if (path.empty()) return Value(root);
    Value scratch;
    return walk(find_in(root, path[0]), path, 1, scratch);
}

std::optional<Value> lookup(const Document& root, const Path& path) {
    if (path.empty()) return Value(root);
    Value scratch;
    return walk(find_in(root, path[0]), path, 1, scratch);
}

std::optional<Value> lookup(const Value& root, std::string_view dotted) {
    return lookup(root, split_path(std::string(dotted)));
}

std::optional<Value> lookup(const Map& root, std::string_view dotted) {
    return lookup(root, split_path(std::string(dotted)));
}

std::optional<Value> lookup(const Document& root, std::string_view dotted) {
    return lookup(root, split_path(std::string(dotted)));
}

} // namespace bsonkit
