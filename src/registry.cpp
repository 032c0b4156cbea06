#include "registry.hpp"

namespace hmarshal::internal {

static const Marshaler kMarshalers[] = {
    {ValueKind::Null, "null", false, &encode_null, &decode_null},
    {ValueKind::Bool, "bool", false, &encode_bool, &decode_bool},
    {ValueKind::Int, "int", false, &encode_int, &decode_int},
    {ValueKind::Float, "float", false, &encode_float, &decode_float},
    {ValueKind::Complex, "complex", false, &encode_complex, &decode_complex},
    {ValueKind::Text, "str", false, &encode_text, &decode_text},
    {ValueKind::Bytes, "bytes", false, &encode_bytes, &decode_bytes},
    {ValueKind::NumericScalar, "scalar", false, &encode_numeric, &decode_numeric},
    {ValueKind::NumericArray, "ndarray", false, &encode_numeric, &decode_numeric},
    {ValueKind::TextArray, "str_array", false, &encode_text_array, &decode_text_array},
    {ValueKind::ByteArray, "bytes_array", false, &encode_byte_array, &decode_byte_array},
    {ValueKind::ObjectArray, "object_array", true, nullptr, nullptr},
    {ValueKind::Collection, "list", true, nullptr, nullptr},
};

// Secondary tags resolving to an existing row.
struct TagAlias {
    const char* tag;
    ValueKind kind;
};

static const TagAlias kAliases[] = {
    {"bytearray", ValueKind::Bytes},
    {"tuple", ValueKind::Collection},
    {"set", ValueKind::Collection},
    {"frozenset", ValueKind::Collection},
    {"deque", ValueKind::Collection},
};

ValueKind classify(const Value& v) {
    if (v.v.valueless_by_exception()) {
        throw MarshalError(ErrorKind::UnsupportedType, "value holds no variant");
    }
    switch (v.v.index()) {
        case 0: return ValueKind::Null;
        case 1: return ValueKind::Bool;
        case 2: return ValueKind::Int;
        case 3: return ValueKind::Float;
        case 4: return ValueKind::Complex;
        case 5: return ValueKind::Text;
        case 6: return ValueKind::Bytes;
        case 7:
            return std::get<NumericArray>(v.v).shape.empty() ? ValueKind::NumericScalar
                                                             : ValueKind::NumericArray;
        case 8: return ValueKind::TextArray;
        case 9: return ValueKind::ByteArray;
        case 10: return ValueKind::ObjectArray;
        case 11: return ValueKind::Collection;
    }
    throw MarshalError(ErrorKind::UnsupportedType, "unrecognised value variant");
}

std::string type_tag(const Value& v) {
    if (const auto* b = std::get_if<ByteString>(&v.v)) return b->is_mutable ? "bytearray" : "bytes";
    if (const auto* c = std::get_if<Collection>(&v.v)) return to_string(c->kind);
    return marshaler_for(classify(v)).tag;
}

const Marshaler& marshaler_for(ValueKind kind) {
    for (const auto& m : kMarshalers) {
        if (m.kind == kind) return m;
    }
    throw MarshalError(ErrorKind::UnsupportedType, "no marshaler for " + to_string(kind));
}

const Marshaler& marshaler_for_tag(const std::string& tag) {
    for (const auto& m : kMarshalers) {
        if (tag == m.tag) return m;
    }
    for (const auto& a : kAliases) {
        if (tag == a.tag) return marshaler_for(a.kind);
    }
    throw MarshalError(ErrorKind::UnknownTypeTag, "unknown type tag '" + tag + "'");
}

} // namespace hmarshal::internal
