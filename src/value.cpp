#include "hmarshal/error.hpp"
#include "hmarshal/value.hpp"

#include <cctype>
#include <cmath>
#include <cstddef>
#include <limits>
#include <sstream>
#include <utility>

namespace hmarshal {

MarshalError::MarshalError(ErrorKind k, const std::string& msg)
    : std::runtime_error(msg), kind_(k) {}

ErrorKind MarshalError::kind() const noexcept { return kind_; }

std::string to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::UnsupportedType: return "unsupported type";
        case ErrorKind::UnknownTypeTag: return "unknown type tag";
        case ErrorKind::PathNotFound: return "path not found";
        case ErrorKind::PathConflict: return "path conflict";
        case ErrorKind::InvalidPath: return "invalid path";
        case ErrorKind::CorruptMetadata: return "corrupt metadata";
        case ErrorKind::Io: return "i/o error";
        case ErrorKind::InvalidData: return "invalid data";
    }
    return "unknown";
}

// ------------------------------
// Element kind helpers
// ------------------------------

std::string to_string(ElementKind k) {
    switch (k) {
        case ElementKind::Bool: return "bool";
        case ElementKind::UInt8: return "uint8";
        case ElementKind::UInt16: return "uint16";
        case ElementKind::UInt32: return "uint32";
        case ElementKind::UInt64: return "uint64";
        case ElementKind::Int8: return "int8";
        case ElementKind::Int16: return "int16";
        case ElementKind::Int32: return "int32";
        case ElementKind::Int64: return "int64";
        case ElementKind::Float16: return "float16";
        case ElementKind::Float32: return "float32";
        case ElementKind::Float64: return "float64";
        case ElementKind::Complex64: return "complex64";
        case ElementKind::Complex128: return "complex128";
    }
    return "unknown";
}

std::optional<ElementKind> element_kind_from_string(const std::string& s) {
    std::string t;
    t.reserve(s.size());
    for (char c : s) t.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (t == "bool") return ElementKind::Bool;
    if (t == "uint8") return ElementKind::UInt8;
    if (t == "uint16") return ElementKind::UInt16;
    if (t == "uint32") return ElementKind::UInt32;
    if (t == "uint64") return ElementKind::UInt64;
    if (t == "int8") return ElementKind::Int8;
    if (t == "int16") return ElementKind::Int16;
    if (t == "int32") return ElementKind::Int32;
    if (t == "int64") return ElementKind::Int64;
    if (t == "float16") return ElementKind::Float16;
    if (t == "float32") return ElementKind::Float32;
    if (t == "float64") return ElementKind::Float64;
    if (t == "complex64") return ElementKind::Complex64;
    if (t == "complex128") return ElementKind::Complex128;
    return std::nullopt;
}

std::size_t element_size(ElementKind k) noexcept {
    switch (k) {
        case ElementKind::Bool: return 1;
        case ElementKind::UInt8: return 1;
        case ElementKind::UInt16: return 2;
        case ElementKind::UInt32: return 4;
        case ElementKind::UInt64: return 8;
        case ElementKind::Int8: return 1;
        case ElementKind::Int16: return 2;
        case ElementKind::Int32: return 4;
        case ElementKind::Int64: return 8;
        case ElementKind::Float16: return 2;
        case ElementKind::Float32: return 4;
        case ElementKind::Float64: return 8;
        case ElementKind::Complex64: return 8;
        case ElementKind::Complex128: return 16;
    }
    return 1;
}

bool is_complex(ElementKind k) noexcept {
    return k == ElementKind::Complex64 || k == ElementKind::Complex128;
}

ElementKind real_part_kind(ElementKind k) noexcept {
    if (k == ElementKind::Complex64) return ElementKind::Float32;
    if (k == ElementKind::Complex128) return ElementKind::Float64;
    return k;
}

std::string to_string(CollectionKind k) {
    switch (k) {
        case CollectionKind::List: return "list";
        case CollectionKind::Tuple: return "tuple";
        case CollectionKind::Set: return "set";
        case CollectionKind::FrozenSet: return "frozenset";
        case CollectionKind::Deque: return "deque";
    }
    return "unknown";
}

std::optional<CollectionKind> collection_kind_from_string(const std::string& s) {
    if (s == "list") return CollectionKind::List;
    if (s == "tuple") return CollectionKind::Tuple;
    if (s == "set") return CollectionKind::Set;
    if (s == "frozenset") return CollectionKind::FrozenSet;
    if (s == "deque") return CollectionKind::Deque;
    return std::nullopt;
}

bool is_unordered(CollectionKind k) noexcept {
    return k == CollectionKind::Set || k == CollectionKind::FrozenSet;
}

std::string to_string(ValueKind k) {
    switch (k) {
        case ValueKind::Null: return "null";
        case ValueKind::Bool: return "bool";
        case ValueKind::Int: return "int";
        case ValueKind::Float: return "float";
        case ValueKind::Complex: return "complex";
        case ValueKind::Text: return "text";
        case ValueKind::Bytes: return "bytes";
        case ValueKind::NumericScalar: return "numeric scalar";
        case ValueKind::NumericArray: return "numeric array";
        case ValueKind::TextArray: return "text array";
        case ValueKind::ByteArray: return "byte array";
        case ValueKind::ObjectArray: return "object array";
        case ValueKind::Collection: return "collection";
    }
    return "unknown";
}

// ------------------------------
// Shapes
// ------------------------------

std::size_t numel(const Shape& shape) {
    std::size_t n = 1;
    for (auto d : shape) {
        if (d == 0) return 0;
        if (n > (std::numeric_limits<std::size_t>::max)() / d) {
            throw MarshalError(ErrorKind::InvalidData, "shape size overflow");
        }
        n *= d;
    }
    return n;
}

std::string shape_to_string(const Shape& shape) {
    std::ostringstream oss;
    oss << '(';
    for (std::size_t i = 0; i < shape.size(); ++i) {
        if (i) oss << ", ";
        oss << shape[i];
    }
    if (shape.size() == 1) oss << ',';
    oss << ')';
    return oss.str();
}

// ------------------------------
// Value helpers
// ------------------------------

Value Value::make_null() {
    Value v;
    v.v = Null{};
    return v;
}

Value Value::make_bool(bool b) {
    Value v;
    v.v = b;
    return v;
}

Value Value::make_int(std::int64_t i) {
    Value v;
    v.v = i;
    return v;
}

Value Value::make_float(double d) {
    Value v;
    v.v = d;
    return v;
}

Value Value::make_complex(std::complex<double> c) {
    Value v;
    v.v = c;
    return v;
}

Value Value::make_text(std::u32string s) {
    Value v;
    v.v = std::move(s);
    return v;
}

Value Value::make_bytes(std::vector<std::uint8_t> b, bool is_mutable) {
    Value v;
    v.v = ByteString{std::move(b), is_mutable};
    return v;
}

Value Value::make_numeric(NumericArray a) {
    Value v;
    v.v = std::move(a);
    return v;
}

Value Value::make_text_array(TextArray a) {
    Value v;
    v.v = std::move(a);
    return v;
}

Value Value::make_byte_array(ByteArray a) {
    Value v;
    v.v = std::move(a);
    return v;
}

Value Value::make_object_array(ObjectArray a) {
    Value v;
    v.v = std::move(a);
    return v;
}

Value Value::make_collection(CollectionKind kind, std::vector<Value> elements) {
    Value v;
    v.v = Collection{kind, std::move(elements)};
    return v;
}

bool Value::is_null() const noexcept {
    return std::holds_alternative<Null>(v);
}

bool Value::is_container() const noexcept {
    return std::holds_alternative<ObjectArray>(v) || std::holds_alternative<Collection>(v);
}

// ------------------------------
// Equality
// ------------------------------

static bool same_double(double a, double b) {
    if (std::isnan(a) || std::isnan(b)) return std::isnan(a) && std::isnan(b);
    return a == b;
}

static bool equal_unordered(const std::vector<Value>& a, const std::vector<Value>& b) {
    if (a.size() != b.size()) return false;
    std::vector<bool> used(b.size(), false);
    for (const auto& x : a) {
        bool found = false;
        for (std::size_t j = 0; j < b.size(); ++j) {
            if (!used[j] && x == b[j]) {
                used[j] = true;
                found = true;
                break;
            }
        }
        if (!found) return false;
    }
    return true;
}

static bool equal_ordered(const std::vector<Value>& a, const std::vector<Value>& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i] != b[i]) return false;
    }
    return true;
}

bool operator==(const Value& a, const Value& b) {
    if (a.v.index() != b.v.index()) return false;

    if (std::holds_alternative<Null>(a.v)) return true;
    if (auto* x = std::get_if<bool>(&a.v)) return *x == std::get<bool>(b.v);
    if (auto* x = std::get_if<std::int64_t>(&a.v)) return *x == std::get<std::int64_t>(b.v);
    if (auto* x = std::get_if<double>(&a.v)) return same_double(*x, std::get<double>(b.v));
    if (auto* x = std::get_if<std::complex<double>>(&a.v)) {
        const auto& y = std::get<std::complex<double>>(b.v);
        return same_double(x->real(), y.real()) && same_double(x->imag(), y.imag());
    }
    if (auto* x = std::get_if<std::u32string>(&a.v)) return *x == std::get<std::u32string>(b.v);
    if (auto* x = std::get_if<ByteString>(&a.v)) {
        const auto& y = std::get<ByteString>(b.v);
        return x->is_mutable == y.is_mutable && x->bytes == y.bytes;
    }
    if (auto* x = std::get_if<NumericArray>(&a.v)) {
        const auto& y = std::get<NumericArray>(b.v);
        return x->kind == y.kind && x->shape == y.shape && x->data == y.data;
    }
    if (auto* x = std::get_if<TextArray>(&a.v)) {
        const auto& y = std::get<TextArray>(b.v);
        return x->shape == y.shape && x->width == y.width && x->data == y.data;
    }
    if (auto* x = std::get_if<ByteArray>(&a.v)) {
        const auto& y = std::get<ByteArray>(b.v);
        return x->shape == y.shape && x->width == y.width && x->data == y.data;
    }
    if (auto* x = std::get_if<ObjectArray>(&a.v)) {
        const auto& y = std::get<ObjectArray>(b.v);
        return x->shape == y.shape && equal_ordered(x->elements, y.elements);
    }
    const auto& x = std::get<Collection>(a.v);
    const auto& y = std::get<Collection>(b.v);
    if (x.kind != y.kind) return false;
    return is_unordered(x.kind) ? equal_unordered(x.elements, y.elements)
                                : equal_ordered(x.elements, y.elements);
}

bool operator!=(const Value& a, const Value& b) {
    return !(a == b);
}

std::u32string text_element(const TextArray& a, std::size_t i) {
    if ((i + 1) * a.width > a.data.size()) {
        throw MarshalError(ErrorKind::InvalidData, "text element index out of range");
    }
    auto first = a.data.begin() + static_cast<std::ptrdiff_t>(i * a.width);
    std::u32string s(first, first + static_cast<std::ptrdiff_t>(a.width));
    while (!s.empty() && s.back() == U'\0') s.pop_back();
    return s;
}

std::string bytes_element(const ByteArray& a, std::size_t i) {
    if ((i + 1) * a.width > a.data.size()) {
        throw MarshalError(ErrorKind::InvalidData, "bytes element index out of range");
    }
    auto first = a.data.begin() + static_cast<std::ptrdiff_t>(i * a.width);
    std::string s(first, first + static_cast<std::ptrdiff_t>(a.width));
    while (!s.empty() && s.back() == '\0') s.pop_back();
    return s;
}

// ------------------------------
// Validation
// ------------------------------

void validate(const NumericArray& a) {
    if (a.data.size() != numel(a.shape) * element_size(a.kind)) {
        throw MarshalError(ErrorKind::InvalidData,
                           "numeric data size does not match shape " + shape_to_string(a.shape)
                           + " and kind " + to_string(a.kind));
    }
}

void validate(const TextArray& a) {
    if (a.width == 0) {
        throw MarshalError(ErrorKind::InvalidData, "text array width must be at least 1");
    }
    if (a.data.size() != numel(a.shape) * a.width) {
        throw MarshalError(ErrorKind::InvalidData,
                           "text array data length does not match shape " + shape_to_string(a.shape));
    }
}

void validate(const ByteArray& a) {
    if (a.width == 0) {
        throw MarshalError(ErrorKind::InvalidData, "byte array width must be at least 1");
    }
    if (a.data.size() != numel(a.shape) * a.width) {
        throw MarshalError(ErrorKind::InvalidData,
                           "byte array data length does not match shape " + shape_to_string(a.shape));
    }
}

void validate(const ObjectArray& a) {
    if (a.elements.size() != numel(a.shape)) {
        throw MarshalError(ErrorKind::InvalidData,
                           "object array element count does not match shape " + shape_to_string(a.shape));
    }
}

} // namespace hmarshal
