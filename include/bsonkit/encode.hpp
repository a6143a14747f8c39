#pragma once

#include "bsonkit/bson.hpp"
#include "bsonkit/wire.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

namespace bsonkit {

class Encoder;
class FieldWalker;

// ------------------------------
// Type traits
// ------------------------------

namespace detail {

std::string demangle(const char* mangled);

template <typename T>
std::string type_name() {
    return demangle(typeid(T).name());
}

template <typename T, typename = void>
struct has_bson_fields : std::false_type {};

template <typename T>
struct has_bson_fields<T, std::void_t<decltype(std::declval<const T&>().bson_fields(std::declval<FieldWalker&>()))>>
    : std::true_type {};

template <typename T, typename = void>
struct has_empty : std::false_type {};

template <typename T>
struct has_empty<T, std::void_t<decltype(std::declval<const T&>().empty())>> : std::true_type {};

template <typename T>
struct is_vector : std::false_type {};

template <typename T, typename A>
struct is_vector<std::vector<T, A>> : std::true_type {};

template <typename T>
struct is_optional : std::false_type {};

template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template <typename T>
struct is_unique_ptr : std::false_type {};

template <typename T, typename D>
struct is_unique_ptr<std::unique_ptr<T, D>> : std::true_type {};

template <typename T>
struct is_shared_ptr : std::false_type {};

template <typename T>
struct is_shared_ptr<std::shared_ptr<T>> : std::true_type {};

// Raw object pointers and owning smart pointers; text pointers are matched
// earlier as strings.
template <typename T>
constexpr bool is_pointer_like_v = (std::is_pointer_v<T> && std::is_object_v<std::remove_pointer_t<T>>) ||
                                   is_unique_ptr<T>::value || is_shared_ptr<T>::value;

template <typename T>
struct is_system_time : std::false_type {};

template <typename D>
struct is_system_time<std::chrono::time_point<std::chrono::system_clock, D>> : std::true_type {};

template <typename T>
constexpr bool is_char_v =
    std::is_same_v<T, char> || std::is_same_v<T, wchar_t> || std::is_same_v<T, char16_t> || std::is_same_v<T, char32_t>
#if defined(__cpp_char8_t)
    || std::is_same_v<T, char8_t>
#endif
    ;

template <typename T>
constexpr bool is_text_v =
    std::is_same_v<T, std::string_view> || std::is_same_v<T, const char*> || std::is_same_v<T, char*> ||
    (std::is_array_v<T> && std::is_same_v<std::remove_cv_t<std::remove_extent_t<T>>, char>);

// Zero/empty test used by the omitempty directive: false, zero, null,
// empty text, empty sequence or mapping.
template <typename T>
bool is_empty_value(const T& v) {
    if constexpr (std::is_same_v<T, bool>) {
        return !v;
    } else if constexpr (std::is_arithmetic_v<T>) {
        return v == T{};
    } else if constexpr (std::is_same_v<T, std::nullptr_t>) {
        return true;
    } else if constexpr (std::is_pointer_v<T>) {
        return v == nullptr;
    } else if constexpr (is_optional<T>::value) {
        return !v.has_value();
    } else if constexpr (is_unique_ptr<T>::value || is_shared_ptr<T>::value) {
        return v == nullptr;
    } else if constexpr (std::is_same_v<T, Value>) {
        return v.template is<Null>();
    } else if constexpr (has_empty<T>::value) {
        return v.empty();
    } else {
        return false;
    }
}

} // namespace detail

// ------------------------------
// Host-native coercion
// ------------------------------

// Maps a host type onto a canonical wire type. Specialize for your own
// types; the primary template covers the built-in table and rejects the
// rest with ErrorKind::Type.
template <typename T, typename Enable = void>
struct Coerce {
    static void append(Encoder& enc, const std::string& path, std::string_view name, const T& v);
};

// ------------------------------
// Encoder
// ------------------------------

class Encoder {
public:
    explicit Encoder(Bytes& out) : out_(out) {}

    Bytes& out() noexcept { return out_; }

    // Canonical values, one overload per wire variant.
    void append(const std::string& path, std::string_view name, const Value& v);
    void append(const std::string& path, std::string_view name, double v);
    void append(const std::string& path, std::string_view name, const std::string& v);
    void append(const std::string& path, std::string_view name, const Map& v);
    void append(const std::string& path, std::string_view name, const Document& v);
    void append(const std::string& path, std::string_view name, const RawDocument& v);
    void append(const std::string& path, std::string_view name, const Array& v);
    void append(const std::string& path, std::string_view name, const Binary& v);
    void append(const std::string& path, std::string_view name, Undefined v);
    void append(const std::string& path, std::string_view name, const ObjectId& v);
    void append(const std::string& path, std::string_view name, bool v);
    void append(const std::string& path, std::string_view name, UtcDateTime v);
    void append(const std::string& path, std::string_view name, Null v);
    void append(const std::string& path, std::string_view name, const Regex& v);
    void append(const std::string& path, std::string_view name, const DbPointer& v);
    void append(const std::string& path, std::string_view name, const JsCode& v);
    void append(const std::string& path, std::string_view name, const Symbol& v);
    void append(const std::string& path, std::string_view name, const JsCodeWithScope& v);
    void append(const std::string& path, std::string_view name, std::int32_t v);
    void append(const std::string& path, std::string_view name, Timestamp v);
    void append(const std::string& path, std::string_view name, std::int64_t v);
    void append(const std::string& path, std::string_view name, MinKey v);
    void append(const std::string& path, std::string_view name, MaxKey v);

    // Anything else goes through Coerce<T>.
    template <typename T>
    void append(const std::string& path, std::string_view name, const T& v) {
        Coerce<T>::append(*this, path, name, v);
    }

    void append_text(const std::string& path, std::string_view name, std::string_view v);
    void append_binary(const std::string& path, std::string_view name, const std::uint8_t* data, std::size_t n);

    template <typename T, typename A>
    void append_sequence(const std::string& path, std::string_view name, const std::vector<T, A>& seq);

    template <typename T>
    void append_record(const std::string& path, std::string_view name, const T& rec) {
        header(path, Type::Document, name);
        write_record(path, rec);
    }

    // Whole documents, length prefix through terminator. `path` is the
    // dotted location of the document itself, empty at top level.
    void write_map(const std::string& path, const Map& m);
    void write_document(const std::string& path, const Document& d);

    template <typename T>
    void write_record(const std::string& path, const T& rec);

private:
    void header(const std::string& path, Type t, std::string_view name);
    void cstring(const std::string& path, std::string_view s);

    Bytes& out_;
};

// ------------------------------
// Struct projection
// ------------------------------

// Per-field directive, written like "name,omitempty".
//   "-"              skip the field
//   "name"           use "name" on the wire
//   "name,omitempty" rename, and skip when empty
//   ",omitempty"     keep the name, skip when empty
struct FieldTag {
    bool ignore{false};
    std::string name{};
    bool omit_empty{false};

    static FieldTag parse(std::string_view tag);
};

// Handed to a record's `bson_fields(FieldWalker&) const`, which lists the
// members to project. Unlisted members are never encoded.
class FieldWalker {
public:
    FieldWalker(Encoder& enc, std::string path) : enc_(enc), path_(std::move(path)) {}

    template <typename T>
    void field(std::string_view name, const T& value, const FieldTag& tag) {
        if (tag.ignore) return;
        if (tag.omit_empty && detail::is_empty_value(value)) return;
        std::string wire_name = tag.name.empty() ? std::string(name) : tag.name;
        enc_.append(catpath(path_, wire_name), wire_name, value);
    }

    template <typename T>
    void field(std::string_view name, const T& value, std::string_view tag = {}) {
        field(name, value, FieldTag::parse(tag));
    }

private:
    Encoder& enc_;
    std::string path_;
};

// ------------------------------
// Builders and entry points
// ------------------------------

// Builds one document from host-native values in call order.
class DocumentBuilder {
public:
    DocumentBuilder() : enc_(buf_), start_(wire::begin_document(buf_)) {}

    DocumentBuilder(const DocumentBuilder&) = delete;
    DocumentBuilder& operator=(const DocumentBuilder&) = delete;

    template <typename T>
    DocumentBuilder& append(std::string_view name, const T& value) {
        if (finished_) throw std::logic_error("DocumentBuilder: append after finish");
        // A failed field leaves the document as it was before the call.
        std::size_t mark = buf_.size();
        try {
            enc_.append(std::string(name), name, value);
        } catch (...) {
            buf_.resize(mark);
            throw;
        }
        return *this;
    }

    Bytes finish();

private:
    Bytes buf_{};
    Encoder enc_;
    std::size_t start_;
    bool finished_{false};
};

Bytes encode(const Map& doc);
Bytes encode(const Document& doc);

template <typename T>
Bytes encode_record(const T& rec) {
    static_assert(detail::has_bson_fields<T>::value,
                  "encode_record requires `void bson_fields(bsonkit::FieldWalker&) const`");
    Bytes out;
    Encoder enc(out);
    enc.write_record(std::string{}, rec);
    return out;
}

// ------------------------------
// Template definitions
// ------------------------------

template <typename T, typename A>
void Encoder::append_sequence(const std::string& path, std::string_view name, const std::vector<T, A>& seq) {
    header(path, Type::Array, name);
    std::size_t start = wire::begin_document(out_);
    for (std::size_t i = 0; i < seq.size(); ++i) {
        std::string idx = std::to_string(i);
        const T& el = seq[i];
        append(catpath(path, idx), idx, el);
    }
    wire::end_document(out_, start);
}

template <typename T>
void Encoder::write_record(const std::string& path, const T& rec) {
    std::size_t start = wire::begin_document(out_);
    FieldWalker walker(*this, path);
    rec.bson_fields(walker);
    wire::end_document(out_, start);
}

template <typename T, typename Enable>
void Coerce<T, Enable>::append(Encoder& enc, const std::string& path, std::string_view name, const T& v) {
    if constexpr (std::is_same_v<T, std::nullptr_t>) {
        enc.append(path, name, Null{});
    } else if constexpr (std::is_same_v<T, bool>) {
        enc.append(path, name, static_cast<bool>(v));
    } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T> && !detail::is_char_v<T> && sizeof(T) <= 4) {
        enc.append(path, name, static_cast<std::int32_t>(v));
    } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T> && !detail::is_char_v<T> && sizeof(T) == 8) {
        enc.append(path, name, static_cast<std::int64_t>(v));
    } else if constexpr (std::is_same_v<T, double>) {
        enc.append(path, name, static_cast<double>(v));
    } else if constexpr (std::is_same_v<T, std::string>) {
        enc.append_text(path, name, v);
    } else if constexpr (detail::is_text_v<T>) {
        if constexpr (std::is_pointer_v<T>) {
            if (v == nullptr) {
                enc.append(path, name, Null{});
                return;
            }
        }
        enc.append_text(path, name, std::string_view(v));
    } else if constexpr (std::is_same_v<T, Bytes>) {
        enc.append_binary(path, name, v.data(), v.size());
    } else if constexpr (detail::is_system_time<T>::value) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(v.time_since_epoch()).count();
        enc.append(path, name, UtcDateTime{static_cast<std::int64_t>(ms)});
    } else if constexpr (detail::is_optional<T>::value) {
        if (v.has_value()) {
            enc.append(path, name, *v);
        } else {
            enc.append(path, name, Null{});
        }
    } else if constexpr (detail::is_pointer_like_v<T>) {
        if (v == nullptr) {
            enc.append(path, name, Null{});
        } else {
            enc.append(path, name, *v);
        }
    } else if constexpr (detail::is_vector<T>::value) {
        enc.append_sequence(path, name, v);
    } else if constexpr (detail::has_bson_fields<T>::value) {
        enc.append_record(path, name, v);
    } else {
        (void)enc;
        (void)name;
        (void)v;
        throw BsonError(ErrorKind::Type, path, "cannot encode " + detail::type_name<T>());
    }
}

} // namespace bsonkit
