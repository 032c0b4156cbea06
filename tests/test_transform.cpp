#include "transform.hpp"

#include "hmarshal/hmarshal_easy.hpp"

#include "test_support.hpp"

#include <iostream>

using namespace hmarshal;
using namespace hmarshal::internal;

static const Layout kFidelityMatlab{Regime::Fidelity, true};
static const Layout kFidelityPlain{Regime::Fidelity, false};
static const Layout kMatlab{Regime::Matlab, true};
static const Layout kBare{Regime::Bare, false};

static std::string str_attr(const AttributeMap& attrs, const char* name) {
    return std::get<std::string>(attrs.at(name));
}

static std::int64_t int_attr(const AttributeMap& attrs, const char* name) {
    return std::get<std::int64_t>(attrs.at(name));
}

static std::vector<std::uint64_t> dims_attr(const AttributeMap& attrs, const char* name) {
    return std::get<std::vector<std::uint64_t>>(attrs.at(name));
}

static std::vector<std::uint64_t> dims(std::initializer_list<std::uint64_t> d) {
    return std::vector<std::uint64_t>(d);
}

static void test_shape_rules() {
    CHECK(atleast_2d(Shape{}) == (Shape{1, 1}));
    CHECK(atleast_2d(Shape{4}) == (Shape{1, 4}));
    CHECK(atleast_2d(Shape{2, 3, 4}) == (Shape{2, 3, 4}));

    CHECK(promote_empty(Shape{}) == (Shape{1, 0}));
    CHECK(promote_empty(Shape{0}) == (Shape{1, 0}));
    CHECK(promote_empty(Shape{0, 3}) == (Shape{3, 0}));
    CHECK(promote_empty(Shape{2, 0, 4}) == (Shape{2, 4, 0}));
    CHECK(promote_empty(Shape{0, 0}) == (Shape{1, 0}));
    for (const Shape& s : {Shape{0}, Shape{0, 3}, Shape{2, 0, 4}, Shape{5, 0, 0, 7}}) {
        Shape once = promote_empty(s);
        CHECK(once.back() == 0);
        for (std::size_t i = 0; i + 1 < once.size(); ++i) CHECK(once[i] >= 1);
        CHECK(promote_empty(once) == once);
    }

    CHECK(reversed(Shape{1, 2, 3}) == (Shape{3, 2, 1}));
    CHECK(reversed(Shape{}).empty());
}

static void test_layouts() {
    Layout l = layout_for(hmarshal_test::fidelity());
    CHECK(l.regime == Regime::Fidelity && l.matlab && l.tagged());
    CHECK(l.inference().regime == Regime::Matlab);
    CHECK(!l.inference().tagged());

    l = layout_for(hmarshal_test::fidelity(false));
    CHECK(l.regime == Regime::Fidelity && !l.matlab);
    CHECK(l.inference().regime == Regime::Bare);

    CHECK(layout_for(hmarshal_test::matlab()).regime == Regime::Matlab);
    CHECK(layout_for(hmarshal_test::bare()).regime == Regime::Bare);
    CHECK(!layout_for(hmarshal_test::bare()).matlab);
    CHECK(to_string(Regime::Bare) == "bare");
}

// ------------------------------
// MATLAB layout
// ------------------------------

static void test_matlab_numeric() {
    EncodedLeaf leaf = encode_int(Value::make_int(42), kMatlab);
    CHECK(leaf.dataset.dtype == Dtype::numeric(ElementKind::Int64));
    CHECK(leaf.dataset.shape == (Shape{1, 1}));
    CHECK(str_attr(leaf.attributes, attr::kMatlabClass) == "int64");
    CHECK(leaf.attributes.count(attr::kType) == 0);

    Value a = Value::make_numeric(easy::make_numeric<float>({2, 3}, {1, 2, 3, 4, 5, 6}));
    leaf = encode_numeric(a, kMatlab);
    CHECK(leaf.dataset.shape == (Shape{3, 2}));
    CHECK(str_attr(leaf.attributes, attr::kMatlabClass) == "single");
    CHECK(leaf.dataset.data == std::get<NumericArray>(a.v).data);
    CHECK(infer_leaf(leaf.dataset, leaf.attributes, kMatlab) == a);

    // 1-D arrays come back as row vectors
    Value row = Value::make_numeric(easy::make_numeric<std::int8_t>({3}, {1, -2, 3}));
    leaf = encode_numeric(row, kMatlab);
    CHECK(leaf.dataset.shape == (Shape{3, 1}));
    Value back = infer_leaf(leaf.dataset, leaf.attributes, kMatlab);
    CHECK(std::get<NumericArray>(back.v).shape == (Shape{1, 3}));
    CHECK(std::get<NumericArray>(back.v).kind == ElementKind::Int8);

    leaf = encode_bool(Value::make_bool(true), kMatlab);
    CHECK(leaf.dataset.dtype == Dtype::numeric(ElementKind::UInt8));
    CHECK(str_attr(leaf.attributes, attr::kMatlabClass) == "logical");
    back = infer_leaf(leaf.dataset, leaf.attributes, kMatlab);
    CHECK(back == Value::make_numeric(easy::make_numeric<bool>({1, 1}, {true})));

    leaf = encode_complex(Value::make_complex({1.0, -1.0}), kMatlab);
    CHECK(leaf.dataset.dtype == Dtype::numeric(ElementKind::Complex128));
    CHECK(str_attr(leaf.attributes, attr::kMatlabClass) == "double");
}

static void test_matlab_empties() {
    EncodedLeaf leaf = encode_null(Value::make_null(), kMatlab);
    CHECK(leaf.dataset.dtype == Dtype::numeric(ElementKind::UInt64));
    CHECK(easy::unpack_le<std::uint64_t>(leaf.dataset.data) == dims({0, 1}));
    CHECK(int_attr(leaf.attributes, attr::kMatlabEmpty) == 1);
    CHECK(str_attr(leaf.attributes, attr::kMatlabClass) == "double");
    Value back = infer_leaf(leaf.dataset, leaf.attributes, kMatlab);
    CHECK(back == Value::make_numeric(NumericArray{ElementKind::Float64, {1, 0}, {}}));

    leaf = encode_numeric(Value::make_numeric(NumericArray{ElementKind::Int16, {0, 3}, {}}), kMatlab);
    CHECK(easy::unpack_le<std::uint64_t>(leaf.dataset.data) == dims({0, 3}));
    back = infer_leaf(leaf.dataset, leaf.attributes, kMatlab);
    CHECK(back == Value::make_numeric(NumericArray{ElementKind::Int16, {3, 0}, {}}));

    // complex empties read back real
    leaf = encode_numeric(Value::make_numeric(NumericArray{ElementKind::Complex64, {2, 0}, {}}), kMatlab);
    back = infer_leaf(leaf.dataset, leaf.attributes, kMatlab);
    CHECK(std::get<NumericArray>(back.v).kind == ElementKind::Float32);
    CHECK(std::get<NumericArray>(back.v).shape == (Shape{2, 0}));

    leaf = encode_text(Value::make_text(U""), kMatlab);
    CHECK(str_attr(leaf.attributes, attr::kMatlabClass) == "char");
    back = infer_leaf(leaf.dataset, leaf.attributes, kMatlab);
    const auto& t = std::get<TextArray>(back.v);
    CHECK(t.shape == (Shape{1, 0}));
    CHECK(t.data.empty());

    leaf = encode_bytes(Value::make_bytes({}), kMatlab);
    back = infer_leaf(leaf.dataset, leaf.attributes, kMatlab);
    CHECK(std::get<TextArray>(back.v).shape == (Shape{1, 0}));

    // MATLAB_empty must describe an empty array
    Dataset bogus{Dtype::numeric(ElementKind::UInt64), {2}, easy::pack_le(std::vector<std::uint64_t>{2, 3})};
    AttributeMap flags{{attr::kMatlabEmpty, std::int64_t{1}}};
    CHECK_THROWS_KIND(infer_leaf(bogus, flags, kMatlab), ErrorKind::CorruptMetadata);
}

static void test_matlab_float16() {
    Value half = Value::make_numeric(NumericArray{ElementKind::Float16, {2}, {0, 60, 0, 188}});
    CHECK_THROWS_KIND(encode_numeric(half, kMatlab), ErrorKind::UnsupportedType);

    EncodedLeaf leaf = encode_numeric(half, kFidelityMatlab);
    CHECK(leaf.dataset.dtype == Dtype::numeric(ElementKind::Float16));
    CHECK(leaf.dataset.shape == (Shape{2, 1}));
    CHECK(leaf.attributes.count(attr::kMatlabClass) == 0);
    CHECK(str_attr(leaf.attributes, attr::kElement) == "float16");
    CHECK(decode_numeric(leaf.dataset, leaf.attributes, kFidelityMatlab) == half);

    // rejected up front, the same way encoding rejects it
    CHECK_THROWS_KIND(check_encodable(half, kMatlab), ErrorKind::UnsupportedType);
    check_encodable(half, kFidelityMatlab);
    check_encodable(Value::make_numeric(easy::make_scalar<std::complex<float>>({1.f, 2.f})), kMatlab);
    CHECK_THROWS_KIND(check_encodable(Value::make_numeric(NumericArray{ElementKind::Int32, {2}, {1, 2}}), kMatlab),
                      ErrorKind::InvalidData);
}

static void test_matlab_chars() {
    EncodedLeaf leaf = encode_text(Value::make_text(U"abc"), kMatlab);
    CHECK(leaf.dataset.dtype == Dtype::numeric(ElementKind::UInt16));
    CHECK(leaf.dataset.shape == (Shape{3, 1}));
    CHECK(int_attr(leaf.attributes, attr::kMatlabIntDecode) == 2);
    Value back = infer_leaf(leaf.dataset, leaf.attributes, kMatlab);
    const auto& t = std::get<TextArray>(back.v);
    CHECK(t.shape == (Shape{1, 1}));
    CHECK(t.width == 3);
    CHECK(text_element(t, 0) == U"abc");

    leaf = encode_text(Value::make_text(U"a\U0001F600"), kMatlab);
    CHECK(leaf.dataset.dtype == Dtype::numeric(ElementKind::UInt32));
    CHECK(int_attr(leaf.attributes, attr::kMatlabIntDecode) == 4);

    // bytes widen to one code per byte and read back as text
    leaf = encode_bytes(easy::make_bytes("\x01\xff"), kMatlab);
    CHECK(leaf.dataset.dtype == Dtype::numeric(ElementKind::UInt16));
    CHECK(easy::unpack_le<std::uint16_t>(leaf.dataset.data) == (std::vector<std::uint16_t>{1, 255}));
    back = infer_leaf(leaf.dataset, leaf.attributes, kMatlab);
    CHECK(text_element(std::get<TextArray>(back.v), 0) == U"\x01\xff");

    // the last axis is merged into the row
    Value arr = Value::make_text_array(easy::make_text_array({2, 2}, {"ab", "c", "de", "f"}));
    leaf = encode_text_array(arr, kMatlab);
    CHECK(leaf.dataset.shape == (Shape{4, 2}));
    back = infer_leaf(leaf.dataset, leaf.attributes, kMatlab);
    const auto& rows = std::get<TextArray>(back.v);
    CHECK(rows.shape == (Shape{2, 1}));
    CHECK(rows.width == 4);
    CHECK(text_element(rows, 0) == U"abc");
    CHECK(text_element(rows, 1) == U"def");

    Value one_d = Value::make_text_array(easy::make_text_array({2}, {"xyz", "w"}));
    leaf = encode_text_array(one_d, kMatlab);
    CHECK(leaf.dataset.shape == (Shape{6, 1}));

    // tags restore the original array from the same layout
    leaf = encode_text_array(arr, kFidelityMatlab);
    CHECK(dims_attr(leaf.attributes, attr::kShape) == dims({2, 2}));
    CHECK(int_attr(leaf.attributes, attr::kWidth) == 2);
    CHECK(decode_text_array(leaf.dataset, leaf.attributes, kFidelityMatlab) == arr);

    Value barr = Value::make_byte_array(easy::make_byte_array({3}, {"a", "bc", ""}));
    leaf = encode_byte_array(barr, kFidelityMatlab);
    CHECK(decode_byte_array(leaf.dataset, leaf.attributes, kFidelityMatlab) == barr);
}

// ------------------------------
// Bare layout
// ------------------------------

static void test_bare_leaves() {
    EncodedLeaf leaf = encode_null(Value::make_null(), kBare);
    CHECK(leaf.dataset.dtype == Dtype::numeric(ElementKind::Float64));
    CHECK(leaf.dataset.shape == (Shape{0}));
    CHECK(leaf.attributes.empty());

    leaf = encode_float(Value::make_float(2.5), kBare);
    CHECK(leaf.dataset.shape.empty());
    CHECK(infer_leaf(leaf.dataset, leaf.attributes, kBare) ==
          Value::make_numeric(easy::make_scalar<double>(2.5)));

    leaf = encode_text(Value::make_text(U"hé"), kBare);
    CHECK(leaf.dataset.dtype == Dtype::bytes(3));
    CHECK(leaf.dataset.shape.empty());
    Value back = infer_leaf(leaf.dataset, leaf.attributes, kBare);
    CHECK(bytes_element(std::get<ByteArray>(back.v), 0) == "h\xc3\xa9");

    leaf = encode_text(Value::make_text(U""), kBare);
    CHECK(leaf.dataset.dtype == Dtype::bytes(1));
    CHECK(leaf.dataset.data == (std::vector<std::uint8_t>{0}));
    CHECK(leaf.attributes.count(attr::kEmpty) == 0);
    back = infer_leaf(leaf.dataset, leaf.attributes, kBare);
    CHECK(bytes_element(std::get<ByteArray>(back.v), 0).empty());

    leaf = encode_bytes(Value::make_bytes({}), kFidelityPlain);
    CHECK(int_attr(leaf.attributes, attr::kEmpty) == 1);
    CHECK(decode_bytes(leaf.dataset, leaf.attributes, kFidelityPlain) == Value::make_bytes({}));

    Value arr = Value::make_text_array(easy::make_text_array({2, 3}, {"a", "bb", "", "c", "dd", "e"}));
    leaf = encode_text_array(arr, kBare);
    CHECK(leaf.dataset.dtype == Dtype::numeric(ElementKind::UInt32));
    CHECK(leaf.dataset.shape == (Shape{2, 6}));

    TextArray scalar;
    scalar.width = 4;
    scalar.data = {U'a', U'b', 0, 0};
    leaf = encode_text_array(Value::make_text_array(scalar), kBare);
    CHECK(leaf.dataset.shape == (Shape{4}));

    Value barr = Value::make_byte_array(easy::make_byte_array({2, 2}, {"a", "bcd", "", "x"}));
    leaf = encode_byte_array(barr, kBare);
    CHECK(leaf.dataset.dtype == Dtype::bytes(3));
    CHECK(leaf.dataset.shape == (Shape{2, 2}));
    CHECK(infer_leaf(leaf.dataset, leaf.attributes, kBare) == barr);
}

// ------------------------------
// Tagged decoding
// ------------------------------

static void test_tagged_decoders() {
    EncodedLeaf leaf = encode_int(Value::make_int(-9), kFidelityPlain);
    CHECK(decode_int(leaf.dataset, leaf.attributes, kFidelityPlain) == Value::make_int(-9));
    CHECK_THROWS_KIND(decode_float(leaf.dataset, leaf.attributes, kFidelityPlain), ErrorKind::CorruptMetadata);

    leaf = encode_text(Value::make_text(U"ok"), kFidelityPlain);
    CHECK(decode_text(leaf.dataset, leaf.attributes, kFidelityPlain) == Value::make_text(U"ok"));
    CHECK_THROWS_KIND(decode_bool(leaf.dataset, leaf.attributes, kFidelityPlain), ErrorKind::CorruptMetadata);

    leaf = encode_numeric(Value::make_numeric(easy::make_numeric<std::uint32_t>({2}, {1, 2})), kFidelityPlain);
    AttributeMap attrs = leaf.attributes;
    attrs.erase(attr::kElement);
    CHECK_THROWS_KIND(decode_numeric(leaf.dataset, attrs, kFidelityPlain), ErrorKind::CorruptMetadata);
    attrs = leaf.attributes;
    attrs[attr::kElement] = std::string("float128");
    CHECK_THROWS_KIND(decode_numeric(leaf.dataset, attrs, kFidelityPlain), ErrorKind::CorruptMetadata);
    attrs = leaf.attributes;
    attrs[attr::kShape] = dims({3});
    CHECK_THROWS_KIND(decode_numeric(leaf.dataset, attrs, kFidelityPlain), ErrorKind::CorruptMetadata);
    attrs = leaf.attributes;
    attrs[attr::kShape] = std::string("2");
    CHECK_THROWS_KIND(decode_numeric(leaf.dataset, attrs, kFidelityPlain), ErrorKind::CorruptMetadata);

    // wide codes cannot be bytes
    Dataset wide{Dtype::numeric(ElementKind::UInt16), {1, 1}, easy::pack_le(std::vector<std::uint16_t>{0x100})};
    CHECK_THROWS_KIND(decode_bytes(wide, {}, kFidelityMatlab), ErrorKind::CorruptMetadata);

    leaf = encode_bytes(easy::make_bytes("zz", true), kFidelityMatlab);
    leaf.attributes[attr::kType] = std::string("bytearray");
    CHECK(decode_bytes(leaf.dataset, leaf.attributes, kFidelityMatlab) == easy::make_bytes("zz", true));
}

// ------------------------------
// Groups
// ------------------------------

static void test_groups() {
    Value list = Value::make_collection(CollectionKind::Tuple,
                                        {Value::make_int(1), Value::make_int(2), Value::make_int(3)});
    AttributeMap attrs = encode_group(list, kMatlab);
    CHECK(dims_attr(attrs, attr::kGroupShape) == dims({3, 1}));
    CHECK(str_attr(attrs, attr::kMatlabClass) == "cell");
    CHECK(attrs.count(attr::kCount) == 0);

    attrs = encode_group(list, kFidelityPlain);
    CHECK(dims_attr(attrs, attr::kGroupShape) == dims({3}));
    CHECK(int_attr(attrs, attr::kCount) == 3);
    CHECK(attrs.count(attr::kMatlabClass) == 0);

    const std::string tuple = "tuple";
    GroupInfo info = decode_group(&tuple, attrs, 3, kFidelityPlain);
    CHECK(info.is_collection);
    CHECK(info.collection == CollectionKind::Tuple);
    CHECK_THROWS_KIND(decode_group(&tuple, attrs, 2, kFidelityPlain), ErrorKind::CorruptMetadata);

    ObjectArray o;
    o.shape = {2, 3};
    for (int i = 0; i < 6; ++i) o.elements.push_back(Value::make_int(i));
    Value grid = Value::make_object_array(o);
    attrs = encode_group(grid, kFidelityMatlab);
    CHECK(dims_attr(attrs, attr::kShape) == dims({2, 3}));
    CHECK(dims_attr(attrs, attr::kGroupShape) == dims({3, 2}));
    const std::string object_array = "object_array";
    info = decode_group(&object_array, attrs, 6, kFidelityMatlab);
    CHECK(!info.is_collection);
    CHECK(info.shape == (Shape{2, 3}));

    // untagged groups rely on the structural shape
    attrs = encode_group(grid, kMatlab);
    CHECK(decode_group(nullptr, attrs, 6, kMatlab).shape == (Shape{2, 3}));
    attrs = encode_group(list, kMatlab);
    CHECK(decode_group(nullptr, attrs, 3, kMatlab).shape == (Shape{1, 3}));
    attrs = encode_group(grid, kBare);
    CHECK(decode_group(nullptr, attrs, 6, kBare).shape == (Shape{2, 3}));
    CHECK_THROWS_KIND(decode_group(nullptr, attrs, 5, kBare), ErrorKind::CorruptMetadata);
    CHECK(decode_group(nullptr, AttributeMap{}, 4, kBare).shape == (Shape{4}));

    info = decode_group(nullptr, encode_group(grid, kBare), 6, kBare);
    CHECK(fold_group(info, o.elements) == grid);
    CHECK_THROWS_KIND(container_elements(Value::make_int(1)), ErrorKind::UnsupportedType);
}

int main() {
    test_shape_rules();
    test_layouts();
    test_matlab_numeric();
    test_matlab_empties();
    test_matlab_float16();
    test_matlab_chars();
    test_bare_leaves();
    test_tagged_decoders();
    test_groups();
    std::cout << "All tests passed.\n";
    return 0;
}
