#include "transform.hpp"

#include "hmarshal/hmarshal_easy.hpp"

#include <algorithm>
#include <utility>

namespace hmarshal::internal {

// ------------------------------
// Helpers
// ------------------------------

static MarshalError corrupt(const std::string& msg) {
    return MarshalError(ErrorKind::CorruptMetadata, msg);
}

static const std::string* attr_string(const AttributeMap& attrs, const char* name) {
    auto it = attrs.find(name);
    if (it == attrs.end()) return nullptr;
    const auto* s = std::get_if<std::string>(&it->second);
    if (!s) throw corrupt(std::string("attribute ") + name + " must be a string");
    return s;
}

static std::optional<std::int64_t> attr_int(const AttributeMap& attrs, const char* name) {
    auto it = attrs.find(name);
    if (it == attrs.end()) return std::nullopt;
    const auto* i = std::get_if<std::int64_t>(&it->second);
    if (!i) throw corrupt(std::string("attribute ") + name + " must be an integer");
    return *i;
}

static bool attr_flag(const AttributeMap& attrs, const char* name) {
    auto v = attr_int(attrs, name);
    return v && *v != 0;
}

static std::optional<Shape> attr_shape(const AttributeMap& attrs, const char* name) {
    auto it = attrs.find(name);
    if (it == attrs.end()) return std::nullopt;
    const auto* dims = std::get_if<std::vector<std::uint64_t>>(&it->second);
    if (!dims) throw corrupt(std::string("attribute ") + name + " must be a list of dimensions");
    Shape out;
    out.reserve(dims->size());
    for (auto d : *dims) out.push_back(static_cast<std::size_t>(d));
    return out;
}

static Attribute shape_attr(const Shape& shape) {
    return std::vector<std::uint64_t>(shape.begin(), shape.end());
}

static std::vector<char32_t> widen(const std::vector<std::uint8_t>& bytes) {
    return std::vector<char32_t>(bytes.begin(), bytes.end());
}

static std::vector<std::uint8_t> narrow(const std::vector<char32_t>& cps) {
    std::vector<std::uint8_t> out;
    out.reserve(cps.size());
    for (char32_t c : cps) {
        if (c > 0xFF) throw corrupt("character data does not fit in a byte string");
        out.push_back(static_cast<std::uint8_t>(c));
    }
    return out;
}

// Codepoints of a char-class dataset.
static std::vector<char32_t> chars_of(const Dataset& ds) {
    if (ds.dtype.is_bytes()) throw corrupt("expected character codes, found " + to_string(ds.dtype));
    switch (ds.dtype.element) {
        case ElementKind::UInt8:
            return widen(ds.data);
        case ElementKind::UInt16: {
            auto v = easy::unpack_le<std::uint16_t>(ds.data);
            return std::vector<char32_t>(v.begin(), v.end());
        }
        case ElementKind::UInt32: {
            auto v = easy::unpack_le<std::uint32_t>(ds.data);
            return std::vector<char32_t>(v.begin(), v.end());
        }
        default:
            throw corrupt("character data must be uint8, uint16 or uint32, found " + to_string(ds.dtype));
    }
}

// ------------------------------
// Layout
// ------------------------------

Layout Layout::inference() const noexcept {
    Layout out = *this;
    out.regime = matlab ? Regime::Matlab : Regime::Bare;
    return out;
}

Layout layout_for(const Options& opts) noexcept {
    Layout l;
    l.regime = opts.regime();
    l.matlab = opts.matlab_layout();
    return l;
}

// ------------------------------
// Shape rules
// ------------------------------

Shape atleast_2d(const Shape& shape) {
    if (shape.empty()) return Shape{1, 1};
    if (shape.size() == 1) return Shape{1, shape[0]};
    return shape;
}

Shape promote_empty(const Shape& shape) {
    Shape out;
    for (auto d : shape) {
        if (d != 0) out.push_back(d);
    }
    if (out.empty()) out.push_back(1);
    out.push_back(0);
    return out;
}

Shape reversed(const Shape& shape) {
    return Shape(shape.rbegin(), shape.rend());
}

// ------------------------------
// MATLAB encodings
// ------------------------------

// Complex data has the class of its parts.
static std::optional<std::string> matlab_class_for(ElementKind k) {
    switch (real_part_kind(k)) {
        case ElementKind::Bool: return std::string("logical");
        case ElementKind::UInt8: return std::string("uint8");
        case ElementKind::UInt16: return std::string("uint16");
        case ElementKind::UInt32: return std::string("uint32");
        case ElementKind::UInt64: return std::string("uint64");
        case ElementKind::Int8: return std::string("int8");
        case ElementKind::Int16: return std::string("int16");
        case ElementKind::Int32: return std::string("int32");
        case ElementKind::Int64: return std::string("int64");
        case ElementKind::Float32: return std::string("single");
        case ElementKind::Float64: return std::string("double");
        case ElementKind::Float16:
        case ElementKind::Complex64:
        case ElementKind::Complex128: break;
    }
    return std::nullopt;
}

static std::optional<ElementKind> kind_for_matlab_class(const std::string& cls) {
    if (cls == "logical") return ElementKind::Bool;
    if (cls == "double") return ElementKind::Float64;
    if (cls == "single") return ElementKind::Float32;
    if (cls == "char" || cls == "cell") return std::nullopt;
    // the integer classes share their element kind names
    auto k = element_kind_from_string(cls);
    if (k && *k != ElementKind::Bool && *k != ElementKind::Float16 && !is_complex(*k)) return k;
    return std::nullopt;
}

// Empty arrays: a uint64 dataset of the (reversed) dimensions.
static EncodedLeaf encode_matlab_empty(const std::string& matlab_class, const Shape& dims) {
    Shape disk = reversed(dims);
    EncodedLeaf out;
    out.dataset.dtype = Dtype::numeric(ElementKind::UInt64);
    out.dataset.shape = Shape{disk.size()};
    out.dataset.data = easy::pack_le(std::vector<std::uint64_t>(disk.begin(), disk.end()));
    out.attributes[attr::kMatlabClass] = matlab_class;
    out.attributes[attr::kMatlabEmpty] = std::int64_t{1};
    return out;
}

static Shape matlab_empty_dims(const Dataset& ds) {
    if (ds.dtype != Dtype::numeric(ElementKind::UInt64) || ds.shape.size() != 1) {
        throw corrupt("MATLAB_empty dataset must be a uint64 vector of dimensions");
    }
    auto dims = easy::unpack_le<std::uint64_t>(ds.data);
    Shape out(dims.rbegin(), dims.rend());
    if (numel(out) != 0) throw corrupt("MATLAB_empty dimensions " + shape_to_string(out) + " are not empty");
    return out;
}

// Character matrix: the last axis of the value is merged with the element
// width into one row.
static EncodedLeaf encode_chars(const Shape& shape, std::size_t width,
                                const std::vector<char32_t>& cps) {
    if (cps.empty()) return encode_matlab_empty("char", promote_empty(shape));

    Shape s1 = shape.empty() ? Shape{1} : shape;
    Shape rows(s1.begin(), s1.end() - 1);
    rows.push_back(1);
    rows = atleast_2d(rows);
    rows.back() = s1.back() * width;

    bool wide = std::any_of(cps.begin(), cps.end(), [](char32_t c) { return c >= 0x10000; });
    EncodedLeaf out;
    out.dataset.shape = reversed(rows);
    if (wide) {
        out.dataset.dtype = Dtype::numeric(ElementKind::UInt32);
        out.dataset.data = easy::pack_le(std::vector<std::uint32_t>(cps.begin(), cps.end()));
    } else {
        out.dataset.dtype = Dtype::numeric(ElementKind::UInt16);
        out.dataset.data = easy::pack_le(std::vector<std::uint16_t>(cps.begin(), cps.end()));
    }
    out.attributes[attr::kMatlabClass] = std::string("char");
    out.attributes[attr::kMatlabIntDecode] = std::int64_t{wide ? 4 : 2};
    return out;
}

static Value text_from_chars(const Dataset& ds, Shape logical) {
    auto cps = chars_of(ds);
    logical = atleast_2d(logical);
    if (cps.size() != numel(logical)) {
        throw corrupt("char data holds " + std::to_string(cps.size()) + " codes for shape " +
                      shape_to_string(logical));
    }
    TextArray a;
    if (logical.back() == 0) {
        a.shape = promote_empty(logical);
        return Value::make_text_array(std::move(a));
    }
    a.width = logical.back();
    a.shape = logical;
    a.shape.back() = 1;
    a.data = std::move(cps);
    return Value::make_text_array(std::move(a));
}

// ------------------------------
// Forward transforms
// ------------------------------

static MarshalError no_matlab_form(ElementKind k) {
    return MarshalError(ErrorKind::UnsupportedType, to_string(k) + " has no MATLAB representation");
}

static EncodedLeaf encode_numeric_array(const NumericArray& a, const Layout& layout) {
    validate(a);
    EncodedLeaf out;
    if (!layout.matlab) {
        out.dataset = Dataset{Dtype::numeric(a.kind), a.shape, a.data};
        return out;
    }
    auto cls = matlab_class_for(a.kind);
    if (!cls) {
        if (layout.regime == Regime::Matlab) throw no_matlab_form(a.kind);
        out.dataset = Dataset{Dtype::numeric(a.kind), reversed(atleast_2d(a.shape)), a.data};
        return out;
    }
    if (numel(a.shape) == 0) return encode_matlab_empty(*cls, promote_empty(a.shape));

    Dtype dtype = Dtype::numeric(a.kind == ElementKind::Bool ? ElementKind::UInt8 : a.kind);
    out.dataset = Dataset{dtype, reversed(atleast_2d(a.shape)), a.data};
    out.attributes[attr::kMatlabClass] = *cls;
    return out;
}

void check_encodable(const Value& v, const Layout& layout) {
    if (const auto* a = std::get_if<NumericArray>(&v.v)) {
        validate(*a);
        if (layout.regime == Regime::Matlab && !matlab_class_for(a->kind)) throw no_matlab_form(a->kind);
    } else if (const auto* t = std::get_if<TextArray>(&v.v)) {
        validate(*t);
    } else if (const auto* b = std::get_if<ByteArray>(&v.v)) {
        validate(*b);
    } else if (const auto* o = std::get_if<ObjectArray>(&v.v)) {
        validate(*o);
    }
}

static EncodedLeaf encode_byte_string(const std::vector<std::uint8_t>& raw, const Layout& layout) {
    EncodedLeaf out;
    if (raw.empty()) {
        // zero-width strings are not storable; keep one NUL
        out.dataset = Dataset{Dtype::bytes(1), Shape{}, std::vector<std::uint8_t>{0}};
        if (layout.tagged()) out.attributes[attr::kEmpty] = std::int64_t{1};
        return out;
    }
    out.dataset = Dataset{Dtype::bytes(raw.size()), Shape{}, raw};
    return out;
}

EncodedLeaf encode_null(const Value&, const Layout& layout) {
    if (layout.matlab) return encode_matlab_empty("double", Shape{1, 0});
    EncodedLeaf out;
    out.dataset = Dataset{Dtype::numeric(ElementKind::Float64), Shape{0}, {}};
    return out;
}

EncodedLeaf encode_bool(const Value& v, const Layout& layout) {
    return encode_numeric_array(easy::make_scalar<bool>(std::get<bool>(v.v)), layout);
}

EncodedLeaf encode_int(const Value& v, const Layout& layout) {
    return encode_numeric_array(easy::make_scalar<std::int64_t>(std::get<std::int64_t>(v.v)), layout);
}

EncodedLeaf encode_float(const Value& v, const Layout& layout) {
    return encode_numeric_array(easy::make_scalar<double>(std::get<double>(v.v)), layout);
}

EncodedLeaf encode_complex(const Value& v, const Layout& layout) {
    return encode_numeric_array(
        easy::make_scalar<std::complex<double>>(std::get<std::complex<double>>(v.v)), layout);
}

EncodedLeaf encode_text(const Value& v, const Layout& layout) {
    const auto& s = std::get<std::u32string>(v.v);
    if (layout.matlab) return encode_chars(Shape{}, s.size(), std::vector<char32_t>(s.begin(), s.end()));
    std::string utf8 = easy::to_utf8(s);
    return encode_byte_string(std::vector<std::uint8_t>(utf8.begin(), utf8.end()), layout);
}

EncodedLeaf encode_bytes(const Value& v, const Layout& layout) {
    const auto& b = std::get<ByteString>(v.v);
    if (layout.matlab) return encode_chars(Shape{}, b.bytes.size(), widen(b.bytes));
    return encode_byte_string(b.bytes, layout);
}

EncodedLeaf encode_numeric(const Value& v, const Layout& layout) {
    const auto& a = std::get<NumericArray>(v.v);
    EncodedLeaf out = encode_numeric_array(a, layout);
    if (layout.tagged()) {
        out.attributes[attr::kElement] = to_string(a.kind);
        out.attributes[attr::kShape] = shape_attr(a.shape);
    }
    return out;
}

EncodedLeaf encode_text_array(const Value& v, const Layout& layout) {
    const auto& a = std::get<TextArray>(v.v);
    validate(a);
    EncodedLeaf out;
    if (layout.matlab) {
        out = encode_chars(a.shape, a.width, a.data);
    } else {
        Shape merged = a.shape;
        if (merged.empty()) {
            merged.push_back(a.width);
        } else {
            merged.back() *= a.width;
        }
        out.dataset = Dataset{Dtype::numeric(ElementKind::UInt32), merged,
                              easy::pack_le(std::vector<std::uint32_t>(a.data.begin(), a.data.end()))};
    }
    if (layout.tagged()) {
        out.attributes[attr::kShape] = shape_attr(a.shape);
        out.attributes[attr::kWidth] = static_cast<std::int64_t>(a.width);
    }
    return out;
}

EncodedLeaf encode_byte_array(const Value& v, const Layout& layout) {
    const auto& a = std::get<ByteArray>(v.v);
    validate(a);
    EncodedLeaf out;
    if (layout.matlab) {
        out = encode_chars(a.shape, a.width, widen(a.data));
    } else {
        out.dataset = Dataset{Dtype::bytes(a.width), a.shape, a.data};
    }
    if (layout.tagged()) {
        out.attributes[attr::kShape] = shape_attr(a.shape);
        out.attributes[attr::kWidth] = static_cast<std::int64_t>(a.width);
    }
    return out;
}

// ------------------------------
// Inverse transforms
// ------------------------------

// Single-element numeric payload behind a scalar tag.
static const Dataset& scalar_payload(const Dataset& ds, const AttributeMap& attrs, const char* tag) {
    if (attr_flag(attrs, attr::kMatlabEmpty) || ds.dtype.is_bytes() || numel(ds.shape) != 1) {
        throw corrupt(std::string("'") + tag + "' dataset must hold one numeric element");
    }
    return ds;
}

Value decode_null(const Dataset&, const AttributeMap&, const Layout&) {
    return Value::make_null();
}

Value decode_bool(const Dataset& ds, const AttributeMap& attrs, const Layout&) {
    const Dataset& p = scalar_payload(ds, attrs, "bool");
    if (p.dtype.element != ElementKind::Bool && p.dtype.element != ElementKind::UInt8) {
        throw corrupt("'bool' dataset has dtype " + to_string(p.dtype));
    }
    return Value::make_bool(p.data[0] != 0);
}

Value decode_int(const Dataset& ds, const AttributeMap& attrs, const Layout&) {
    const Dataset& p = scalar_payload(ds, attrs, "int");
    if (p.dtype.element != ElementKind::Int64) throw corrupt("'int' dataset has dtype " + to_string(p.dtype));
    return Value::make_int(easy::unpack_le<std::int64_t>(p.data)[0]);
}

Value decode_float(const Dataset& ds, const AttributeMap& attrs, const Layout&) {
    const Dataset& p = scalar_payload(ds, attrs, "float");
    if (p.dtype.element != ElementKind::Float64) throw corrupt("'float' dataset has dtype " + to_string(p.dtype));
    return Value::make_float(easy::unpack_le<double>(p.data)[0]);
}

Value decode_complex(const Dataset& ds, const AttributeMap& attrs, const Layout&) {
    const Dataset& p = scalar_payload(ds, attrs, "complex");
    if (p.dtype.element != ElementKind::Complex128) {
        throw corrupt("'complex' dataset has dtype " + to_string(p.dtype));
    }
    return Value::make_complex(easy::unpack_le<std::complex<double>>(p.data)[0]);
}

Value decode_text(const Dataset& ds, const AttributeMap& attrs, const Layout&) {
    if (attr_flag(attrs, attr::kEmpty) || attr_flag(attrs, attr::kMatlabEmpty)) {
        return Value::make_text(std::u32string());
    }
    if (ds.dtype.is_bytes()) {
        return Value::make_text(easy::from_utf8(std::string(ds.data.begin(), ds.data.end())));
    }
    auto cps = chars_of(ds);
    return Value::make_text(std::u32string(cps.begin(), cps.end()));
}

Value decode_bytes(const Dataset& ds, const AttributeMap& attrs, const Layout&) {
    const std::string* tag = attr_string(attrs, attr::kType);
    bool is_mutable = tag && *tag == "bytearray";
    if (attr_flag(attrs, attr::kEmpty) || attr_flag(attrs, attr::kMatlabEmpty)) {
        return Value::make_bytes({}, is_mutable);
    }
    if (ds.dtype.is_bytes()) return Value::make_bytes(ds.data, is_mutable);
    return Value::make_bytes(narrow(chars_of(ds)), is_mutable);
}

Value decode_numeric(const Dataset& ds, const AttributeMap& attrs, const Layout&) {
    const std::string* kind_name = attr_string(attrs, attr::kElement);
    if (!kind_name) throw corrupt("numeric dataset has no element kind");
    auto kind = element_kind_from_string(*kind_name);
    if (!kind) throw corrupt("unknown element kind '" + *kind_name + "'");
    auto shape = attr_shape(attrs, attr::kShape);
    if (!shape) throw corrupt("numeric dataset has no shape");
    if (ds.dtype.is_bytes()) throw corrupt("numeric dataset has dtype " + to_string(ds.dtype));

    NumericArray a;
    a.kind = *kind;
    a.shape = *shape;
    if (!attr_flag(attrs, attr::kMatlabEmpty)) a.data = ds.data;
    if (a.data.size() != numel(a.shape) * element_size(a.kind)) {
        throw corrupt("numeric payload does not match " + to_string(a.kind) + " " + shape_to_string(a.shape));
    }
    return Value::make_numeric(std::move(a));
}

static std::size_t width_attr(const AttributeMap& attrs) {
    auto w = attr_int(attrs, attr::kWidth);
    if (!w || *w < 1) throw corrupt("string array has no valid width");
    return static_cast<std::size_t>(*w);
}

Value decode_text_array(const Dataset& ds, const AttributeMap& attrs, const Layout&) {
    auto shape = attr_shape(attrs, attr::kShape);
    if (!shape) throw corrupt("string array has no shape");
    TextArray a;
    a.shape = *shape;
    a.width = width_attr(attrs);
    if (!attr_flag(attrs, attr::kMatlabEmpty)) a.data = chars_of(ds);
    if (a.data.size() != numel(a.shape) * a.width) {
        throw corrupt("string array payload does not match " + shape_to_string(a.shape));
    }
    return Value::make_text_array(std::move(a));
}

Value decode_byte_array(const Dataset& ds, const AttributeMap& attrs, const Layout&) {
    auto shape = attr_shape(attrs, attr::kShape);
    if (!shape) throw corrupt("bytes array has no shape");
    ByteArray a;
    a.shape = *shape;
    a.width = width_attr(attrs);
    if (!attr_flag(attrs, attr::kMatlabEmpty)) {
        a.data = ds.dtype.is_bytes() ? ds.data : narrow(chars_of(ds));
    }
    if (a.data.size() != numel(a.shape) * a.width) {
        throw corrupt("bytes array payload does not match " + shape_to_string(a.shape));
    }
    return Value::make_byte_array(std::move(a));
}

// ------------------------------
// Inference
// ------------------------------

Value infer_leaf(const Dataset& ds, const AttributeMap& attrs, const Layout& layout) {
    if (!layout.matlab) {
        if (ds.dtype.is_bytes()) {
            ByteArray a;
            a.shape = ds.shape;
            a.width = ds.dtype.width;
            a.data = ds.data;
            return Value::make_byte_array(std::move(a));
        }
        return Value::make_numeric(NumericArray{ds.dtype.element, ds.shape, ds.data});
    }

    const std::string* cls = attr_string(attrs, attr::kMatlabClass);
    if (attr_flag(attrs, attr::kMatlabEmpty)) {
        Shape dims = matlab_empty_dims(ds);
        if (cls && *cls == "char") {
            TextArray a;
            a.shape = dims;
            return Value::make_text_array(std::move(a));
        }
        ElementKind kind = ElementKind::Float64;
        if (cls) {
            if (auto k = kind_for_matlab_class(*cls)) kind = *k;
        }
        return Value::make_numeric(NumericArray{kind, dims, {}});
    }

    Shape logical = reversed(ds.shape);
    if (cls && *cls == "char") return text_from_chars(ds, logical);
    if (ds.dtype.is_bytes()) {
        ByteArray a;
        a.shape = logical;
        a.width = ds.dtype.width;
        a.data = ds.data;
        return Value::make_byte_array(std::move(a));
    }
    if (cls && *cls == "logical") {
        NumericArray a{ElementKind::Bool, logical, {}};
        a.data.reserve(ds.data.size());
        for (auto b : ds.data) a.data.push_back(b != 0 ? 1 : 0);
        return Value::make_numeric(std::move(a));
    }
    return Value::make_numeric(NumericArray{ds.dtype.element, logical, ds.data});
}

// ------------------------------
// Containers
// ------------------------------

const std::vector<Value>& container_elements(const Value& v) {
    if (const auto* a = std::get_if<ObjectArray>(&v.v)) return a->elements;
    if (const auto* c = std::get_if<Collection>(&v.v)) return c->elements;
    throw MarshalError(ErrorKind::UnsupportedType, "value is not a container");
}

AttributeMap encode_group(const Value& v, const Layout& layout) {
    const auto& elements = container_elements(v);
    const auto* object_array = std::get_if<ObjectArray>(&v.v);
    Shape shape;
    if (object_array) {
        validate(*object_array);
        shape = object_array->shape;
    } else {
        shape = Shape{elements.size()};
    }

    AttributeMap attrs;
    attrs[attr::kGroupShape] = shape_attr(layout.matlab ? reversed(atleast_2d(shape)) : shape);
    if (layout.matlab) attrs[attr::kMatlabClass] = std::string("cell");
    if (layout.tagged()) {
        attrs[attr::kCount] = static_cast<std::int64_t>(elements.size());
        if (object_array) attrs[attr::kShape] = shape_attr(shape);
    }
    return attrs;
}

GroupInfo decode_group(const std::string* tag, const AttributeMap& attrs,
                       std::size_t child_count, const Layout& layout) {
    GroupInfo info;
    if (tag) {
        if (auto n = attr_int(attrs, attr::kCount)) {
            if (*n < 0 || static_cast<std::size_t>(*n) != child_count) {
                throw corrupt("group records " + std::to_string(*n) + " elements but has " +
                              std::to_string(child_count) + " children");
            }
        }
        if (auto kind = collection_kind_from_string(*tag)) {
            info.is_collection = true;
            info.collection = *kind;
            info.shape = Shape{child_count};
            return info;
        }
        if (auto shape = attr_shape(attrs, attr::kShape)) {
            info.shape = *shape;
            if (numel(info.shape) != child_count) {
                throw corrupt("object array shape " + shape_to_string(info.shape) + " does not match " +
                              std::to_string(child_count) + " children");
            }
            return info;
        }
    }

    if (auto shape = attr_shape(attrs, attr::kGroupShape)) {
        info.shape = layout.matlab ? reversed(*shape) : *shape;
    } else {
        info.shape = Shape{child_count};
    }
    if (numel(info.shape) != child_count) {
        throw corrupt("group shape " + shape_to_string(info.shape) + " does not match " +
                      std::to_string(child_count) + " children");
    }
    return info;
}

Value fold_group(const GroupInfo& info, std::vector<Value> elements) {
    if (info.is_collection) return Value::make_collection(info.collection, std::move(elements));
    ObjectArray a;
    a.shape = info.shape;
    a.elements = std::move(elements);
    return Value::make_object_array(std::move(a));
}

} // namespace hmarshal::internal
