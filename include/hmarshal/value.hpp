#pragma once

#include <complex>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace hmarshal {

// ------------------------------
// Element kinds
// ------------------------------

enum class ElementKind {
    Bool,
    UInt8,
    UInt16,
    UInt32,
    UInt64,
    Int8,
    Int16,
    Int32,
    Int64,
    Float16,
    Float32,
    Float64,
    Complex64,
    Complex128,
};

std::string to_string(ElementKind k);
std::optional<ElementKind> element_kind_from_string(const std::string& s);

std::size_t element_size(ElementKind k) noexcept;
bool is_complex(ElementKind k) noexcept;
// complex64 -> float32, complex128 -> float64; other kinds map to themselves.
ElementKind real_part_kind(ElementKind k) noexcept;

enum class CollectionKind {
    List,
    Tuple,
    Set,
    FrozenSet,
    Deque,
};

std::string to_string(CollectionKind k);
std::optional<CollectionKind> collection_kind_from_string(const std::string& s);
bool is_unordered(CollectionKind k) noexcept;

// ------------------------------
// Shapes
// ------------------------------

using Shape = std::vector<std::size_t>;

// Product of the dimensions: 1 for a 0-D shape, 0 if any dimension is 0.
std::size_t numel(const Shape& shape);
std::string shape_to_string(const Shape& shape);

// ------------------------------
// Value model
// ------------------------------

struct Value;

struct Null {};

struct ByteString {
    std::vector<std::uint8_t> bytes{};
    // bytearray rather than bytes.
    bool is_mutable{false};
};

struct NumericArray {
    ElementKind kind{ElementKind::Float64};
    // An empty shape is a numeric scalar.
    Shape shape{};
    // Little-endian element bytes in row-major (C) order. Complex elements
    // are stored as interleaved (real, imag) pairs.
    std::vector<std::uint8_t> data{};
};

struct TextArray {
    Shape shape{};
    // Codepoints per element; shorter strings are NUL padded.
    std::size_t width{1};
    // numel(shape) * width codepoints, row-major.
    std::vector<char32_t> data{};
};

struct ByteArray {
    Shape shape{};
    std::size_t width{1};
    // numel(shape) * width octets, row-major, NUL padded.
    std::vector<std::uint8_t> data{};
};

struct ObjectArray {
    Shape shape{};
    // numel(shape) elements, row-major.
    std::vector<Value> elements{};
};

struct Collection {
    CollectionKind kind{CollectionKind::List};
    std::vector<Value> elements{};
};

enum class ValueKind {
    Null,
    Bool,
    Int,
    Float,
    Complex,
    Text,
    Bytes,
    NumericScalar,
    NumericArray,
    TextArray,
    ByteArray,
    ObjectArray,
    Collection,
};

std::string to_string(ValueKind k);

struct Value {
    std::variant<
        Null,
        bool,
        std::int64_t,
        double,
        std::complex<double>,
        std::u32string,
        ByteString,
        NumericArray,
        TextArray,
        ByteArray,
        ObjectArray,
        Collection
    > v;

    // Convenience constructors
    static Value make_null();
    static Value make_bool(bool b);
    static Value make_int(std::int64_t i);
    static Value make_float(double d);
    static Value make_complex(std::complex<double> c);
    static Value make_text(std::u32string s);
    static Value make_bytes(std::vector<std::uint8_t> b, bool is_mutable = false);
    static Value make_numeric(NumericArray a);
    static Value make_text_array(TextArray a);
    static Value make_byte_array(ByteArray a);
    static Value make_object_array(ObjectArray a);
    static Value make_collection(CollectionKind kind, std::vector<Value> elements);

    bool is_null() const noexcept;
    bool is_container() const noexcept;
};

// Deep equality. Floating point elements compare equal when both are NaN;
// numeric array data is otherwise compared byte for byte. Set and frozenset
// collections compare as multisets.
bool operator==(const Value& a, const Value& b);
bool operator!=(const Value& a, const Value& b);

// Element i of a fixed-width array with trailing NULs stripped.
std::u32string text_element(const TextArray& a, std::size_t i);
std::string bytes_element(const ByteArray& a, std::size_t i);

// ------------------------------
// Validation
// ------------------------------

// Throws MarshalError(InvalidData) if the array payload disagrees with its
// shape, kind or width.
void validate(const NumericArray& a);
void validate(const TextArray& a);
void validate(const ByteArray& a);
void validate(const ObjectArray& a);

} // namespace hmarshal
