#pragma once

#include "hmarshal/hmarshal.hpp"

#include <map>
#include <string>

namespace hmarshal::internal {

// ------------------------------
// Attribute names
// ------------------------------

namespace attr {
inline constexpr const char* kType = "HMARSHAL.type";
inline constexpr const char* kElement = "HMARSHAL.element";
inline constexpr const char* kShape = "HMARSHAL.shape";
inline constexpr const char* kWidth = "HMARSHAL.width";
inline constexpr const char* kEmpty = "HMARSHAL.empty";
inline constexpr const char* kCount = "HMARSHAL.count";
// Structural dimensions of an object-array group, written in every regime.
inline constexpr const char* kGroupShape = "shape";
inline constexpr const char* kMatlabClass = "MATLAB_class";
inline constexpr const char* kMatlabEmpty = "MATLAB_empty";
inline constexpr const char* kMatlabIntDecode = "MATLAB_int_decode";
} // namespace attr

using AttributeMap = std::map<std::string, Attribute>;

struct Layout {
    Regime regime{Regime::Fidelity};
    bool matlab{true};

    bool tagged() const noexcept { return regime == Regime::Fidelity; }
    // The untagged regime used when tags are absent or unknown.
    Layout inference() const noexcept;
};

Layout layout_for(const Options& opts) noexcept;

struct EncodedLeaf {
    Dataset dataset{};
    AttributeMap attributes{};
};

struct GroupInfo {
    bool is_collection{false};
    CollectionKind collection{CollectionKind::List};
    Shape shape{};
};

// ------------------------------
// Shape rules
// ------------------------------

// () -> (1, 1), (n,) -> (1, n); two or more dimensions are unchanged.
Shape atleast_2d(const Shape& shape);
// Non-zero dimensions lead (at least one, 1 if none), one trailing 0.
Shape promote_empty(const Shape& shape);
Shape reversed(const Shape& shape);

// ------------------------------
// Forward transforms (leaf values)
// ------------------------------

// Throws what encoding `v` itself would throw (children are not visited):
// InvalidData for inconsistent arrays, UnsupportedType for kinds the
// layout cannot store.
void check_encodable(const Value& v, const Layout& layout);

EncodedLeaf encode_null(const Value& v, const Layout& layout);
EncodedLeaf encode_bool(const Value& v, const Layout& layout);
EncodedLeaf encode_int(const Value& v, const Layout& layout);
EncodedLeaf encode_float(const Value& v, const Layout& layout);
EncodedLeaf encode_complex(const Value& v, const Layout& layout);
EncodedLeaf encode_text(const Value& v, const Layout& layout);
EncodedLeaf encode_bytes(const Value& v, const Layout& layout);
EncodedLeaf encode_numeric(const Value& v, const Layout& layout);
EncodedLeaf encode_text_array(const Value& v, const Layout& layout);
EncodedLeaf encode_byte_array(const Value& v, const Layout& layout);

// ------------------------------
// Inverse transforms (tagged datasets)
// ------------------------------

Value decode_null(const Dataset& ds, const AttributeMap& attrs, const Layout& layout);
Value decode_bool(const Dataset& ds, const AttributeMap& attrs, const Layout& layout);
Value decode_int(const Dataset& ds, const AttributeMap& attrs, const Layout& layout);
Value decode_float(const Dataset& ds, const AttributeMap& attrs, const Layout& layout);
Value decode_complex(const Dataset& ds, const AttributeMap& attrs, const Layout& layout);
Value decode_text(const Dataset& ds, const AttributeMap& attrs, const Layout& layout);
Value decode_bytes(const Dataset& ds, const AttributeMap& attrs, const Layout& layout);
Value decode_numeric(const Dataset& ds, const AttributeMap& attrs, const Layout& layout);
Value decode_text_array(const Dataset& ds, const AttributeMap& attrs, const Layout& layout);
Value decode_byte_array(const Dataset& ds, const AttributeMap& attrs, const Layout& layout);

/// Reconstruct a value from raw dtype/shape alone (regime b or c rules,
/// chosen by layout.matlab).
Value infer_leaf(const Dataset& ds, const AttributeMap& attrs, const Layout& layout);

// ------------------------------
// Containers
// ------------------------------

const std::vector<Value>& container_elements(const Value& v);

AttributeMap encode_group(const Value& v, const Layout& layout);

// `tag` is a known container tag, or nullptr when the group is untagged.
GroupInfo decode_group(const std::string* tag, const AttributeMap& attrs,
                       std::size_t child_count, const Layout& layout);

Value fold_group(const GroupInfo& info, std::vector<Value> elements);

} // namespace hmarshal::internal
