#pragma once

#include "bsonkit/bson.hpp"
#include "bsonkit/encode.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

// Path-based lookup into decoded documents, with a coercing assignment of
// the leaf into a caller-supplied destination.
//
// Besides Map and Document, a few fixed-shape values can be walked into:
//   Regex            Pattern, Options
//   DbPointer        Name, ObjectId
//   JsCodeWithScope  Code, Scope
// A RawDocument on the path is decoded on the fly. Every other value,
// Array included, is a leaf.

namespace bsonkit {

using Path = std::vector<std::string>;

std::optional<Value> lookup(const Value& root, const Path& path);
std::optional<Value> lookup(const Map& root, const Path& path);
std::optional<Value> lookup(const Document& root, const Path& path);

std::optional<Value> lookup(const Value& root, std::string_view dotted);
std::optional<Value> lookup(const Map& root, std::string_view dotted);
std::optional<Value> lookup(const Document& root, std::string_view dotted);

std::string join_path(const Path& path);

namespace detail {

template <typename T, typename V>
struct is_variant_member;

template <typename T, typename... Ts>
struct is_variant_member<T, std::variant<Ts...>> : std::disjunction<std::is_same<T, Ts>...> {};

template <typename T>
constexpr bool is_value_alternative_v = is_variant_member<T, decltype(Value::v)>::value;

inline bool assigns_nothing(const Value& leaf) {
    return leaf.is<Null>() || leaf.is<Undefined>() || leaf.is<MinKey>() || leaf.is<MaxKey>();
}

// Coercion table for a plain destination. Returns false when the leaf's
// wire type has no rule for T.
template <typename T>
bool assign_leaf(const Value& leaf, T& dst) {
    if constexpr (std::is_same_v<T, double>) {
        if (!leaf.is<double>()) return false;
        dst = leaf.as<double>();
        return true;
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (leaf.is<std::string>()) {
            dst = leaf.as<std::string>();
        } else if (leaf.is<JsCode>()) {
            dst = leaf.as<JsCode>().code;
        } else if (leaf.is<Symbol>()) {
            dst = leaf.as<Symbol>().name;
        } else {
            return false;
        }
        return true;
    } else if constexpr (std::is_same_v<T, Bytes>) {
        if (leaf.is<Binary>()) {
            dst = leaf.as<Binary>().data;
        } else if (leaf.is<ObjectId>()) {
            dst = leaf.as<ObjectId>().bytes;
        } else {
            return false;
        }
        return true;
    } else if constexpr (std::is_same_v<T, bool>) {
        if (!leaf.is<bool>()) return false;
        dst = leaf.as<bool>();
        return true;
    } else if constexpr (std::is_same_v<T, std::int32_t>) {
        if (!leaf.is<std::int32_t>()) return false;
        dst = leaf.as<std::int32_t>();
        return true;
    } else if constexpr (std::is_same_v<T, std::int64_t>) {
        if (leaf.is<std::int64_t>()) {
            dst = leaf.as<std::int64_t>();
        } else if (leaf.is<std::int32_t>()) {
            dst = leaf.as<std::int32_t>();
        } else if (leaf.is<UtcDateTime>()) {
            dst = leaf.as<UtcDateTime>().ms;
        } else if (leaf.is<Timestamp>()) {
            dst = leaf.as<Timestamp>().value;
        } else {
            return false;
        }
        return true;
    } else if constexpr (is_system_time<T>::value) {
        std::int64_t ms = 0;
        if (leaf.is<UtcDateTime>()) {
            ms = leaf.as<UtcDateTime>().ms;
        } else if (leaf.is<Timestamp>()) {
            ms = leaf.as<Timestamp>().value;
        } else {
            return false;
        }
        // Stored value is milliseconds; convert to the destination's own tick, not a fixed x1000.
        dst = T(std::chrono::duration_cast<typename T::duration>(std::chrono::milliseconds(ms)));
        return true;
    } else if constexpr (is_value_alternative_v<T>) {
        // Containers and the remaining payload types: exact type only.
        if (!leaf.is<T>()) return false;
        dst = leaf.as<T>();
        return true;
    } else {
        (void)leaf;
        (void)dst;
        return false;
    }
}

} // namespace detail

/// Assign a found leaf into `dst`. Null, Undefined, MinKey and MaxKey leave
/// `dst` untouched. Empty optional/unique_ptr/shared_ptr destinations are
/// allocated only when something is assigned. Throws ErrorKind::Type naming
/// both types when no rule applies.
template <typename T>
void assign(const Value& leaf, T& dst, const std::string& path) {
    if (detail::assigns_nothing(leaf)) return;
    if constexpr (std::is_same_v<T, Value>) {
        dst = leaf;
    } else if constexpr (detail::is_optional<T>::value) {
        if (dst) {
            assign(leaf, *dst, path);
        } else {
            typename T::value_type tmp{};
            assign(leaf, tmp, path);
            dst = std::move(tmp);
        }
    } else if constexpr (detail::is_unique_ptr<T>::value) {
        if (dst) {
            assign(leaf, *dst, path);
        } else {
            auto p = std::make_unique<typename T::element_type>();
            assign(leaf, *p, path);
            dst = std::move(p);
        }
    } else if constexpr (detail::is_shared_ptr<T>::value) {
        if (dst) {
            assign(leaf, *dst, path);
        } else {
            auto p = std::make_shared<typename T::element_type>();
            assign(leaf, *p, path);
            dst = std::move(p);
        }
    } else {
        if (!detail::assign_leaf(leaf, dst)) {
            throw BsonError(ErrorKind::Type, path,
                            "cannot coerce " + to_string(leaf.type()) + " to " + detail::type_name<T>());
        }
    }
}

/// Walk `path` from `root` and assign the leaf into `dst`. Returns false
/// when the path does not exist; `dst` is then untouched.
template <typename Root, typename T>
bool reach(const Root& root, T& dst, const Path& path) {
    std::optional<Value> leaf = lookup(root, path);
    if (!leaf) return false;
    assign(*leaf, dst, join_path(path));
    return true;
}

template <typename Root, typename T>
bool reach(const Root& root, T& dst, std::string_view dotted) {
    return reach(root, dst, split_path(std::string(dotted)));
}

} // namespace bsonkit
