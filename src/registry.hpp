#pragma once

#include "transform.hpp"

#include <string>

namespace hmarshal::internal {

using EncodeFn = EncodedLeaf (*)(const Value&, const Layout&);
using DecodeFn = Value (*)(const Dataset&, const AttributeMap&, const Layout&);

/// One row of the registry. Containers have no leaf transforms; the engine
/// writes them as groups.
struct Marshaler {
    ValueKind kind;
    const char* tag;
    bool container;
    EncodeFn encode;
    DecodeFn decode;
};

// Throws MarshalError(UnsupportedType) for a value that holds no variant.
ValueKind classify(const Value& v);

// The tag recorded for `v` under Fidelity. Differs from the marshaler's
// primary tag for bytearray and the non-list collection variants.
std::string type_tag(const Value& v);

const Marshaler& marshaler_for(ValueKind kind);

// Throws MarshalError(UnknownTypeTag) for a tag no marshaler owns.
const Marshaler& marshaler_for_tag(const std::string& tag);

} // namespace hmarshal::internal
