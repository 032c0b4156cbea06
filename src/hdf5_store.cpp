#include "hmarshal/error.hpp"
#include "hmarshal/path.hpp"
#include "hmarshal/store.hpp"
#include "logging.hpp"

#include <H5Cpp.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <utility>

namespace hmarshal {

// ------------------------------
// Type mapping
// ------------------------------

// Booleans are an 8-bit enum {FALSE = 0, TRUE = 1}, as h5py writes them.
static H5::EnumType bool_type() {
    H5::EnumType t(H5::IntType(H5::PredType::NATIVE_INT8));
    std::int8_t no = 0;
    std::int8_t yes = 1;
    t.insert("FALSE", &no);
    t.insert("TRUE", &yes);
    return t;
}

static H5::FloatType half_type() {
    H5::FloatType t(H5::PredType::IEEE_F32LE);
    t.setFields(15, 10, 5, 0, 10);
    t.setSize(2);
    t.setEbias(15);
    return t;
}

static H5::CompType complex_type(std::size_t part, const H5::DataType& member,
                                 const std::string& re = "r", const std::string& im = "i") {
    H5::CompType t(2 * part);
    t.insertMember(re, 0, member);
    t.insertMember(im, part, member);
    return t;
}

static H5::StrType bytes_type(std::size_t width) {
    H5::StrType t(H5::PredType::C_S1, width);
    t.setStrpad(H5T_STR_NULLPAD);
    return t;
}

// ASCII attribute text is fixed-length, as MATLAB expects for MATLAB_class;
// anything else is variable-length UTF-8.
static H5::StrType text_attr_type(const std::string& s) {
    const bool ascii = std::all_of(s.begin(), s.end(), [](char c) {
        return static_cast<unsigned char>(c) < 0x80 && c != '\0';
    });
    if (ascii && !s.empty()) {
        H5::StrType t(H5::PredType::C_S1, s.size());
        t.setStrpad(H5T_STR_NULLPAD);
        return t;
    }
    H5::StrType t(H5::PredType::C_S1, H5T_VARIABLE);
    t.setCset(H5T_CSET_UTF8);
    t.setStrpad(H5T_STR_NULLTERM);
    return t;
}

// MATLAB reads MATLAB_empty as uint8.
static const H5::PredType& int_attr_type(const std::string& name) {
    return name == "MATLAB_empty" ? H5::PredType::STD_U8LE : H5::PredType::STD_I64LE;
}

static bool is_mat_file(const std::filesystem::path& file) {
    std::string ext = file.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".mat";
}

static constexpr hsize_t kMatUserblock = 512;

// MATLAB recognises a v7.3 file by the 128-byte text header at the start
// of the userblock: 116 bytes of text, 8 bytes of subsystem offset, the
// version 0x0200 and the endian indicator "IM".
static void write_mat_header(const std::string& file) {
    char when[64] = {0};
    std::time_t now = std::time(nullptr);
    if (const std::tm* tm = std::localtime(&now)) {
        std::strftime(when, sizeof(when), "%a %b %d %H:%M:%S %Y", tm);
    }
    std::string header = std::string("MATLAB 7.3 MAT-file, Platform: GLNXA64-hmarshal, Created on: ") + when +
                         " HDF5 schema 1.00 .";
    header.resize(116, ' ');
    header += std::string(8, '\0');
    header += std::string("\x00\x02IM", 4);

    std::fstream f(file, std::ios::in | std::ios::out | std::ios::binary);
    if (!f) throw MarshalError(ErrorKind::Io, "failed to reopen " + file + " for the MAT-file header");
    f.seekp(0, std::ios::beg);
    f.write(header.data(), static_cast<std::streamsize>(header.size()));
    if (!f) throw MarshalError(ErrorKind::Io, "failed to write the MAT-file header of " + file);
}

// Little-endian file and memory type for a dtype; payload buffers are
// little-endian regardless of the host.
static H5::DataType h5_type(const Dtype& d) {
    if (d.is_bytes()) return bytes_type(d.width);
    switch (d.element) {
        case ElementKind::Bool: return bool_type();
        case ElementKind::UInt8: return H5::PredType::STD_U8LE;
        case ElementKind::UInt16: return H5::PredType::STD_U16LE;
        case ElementKind::UInt32: return H5::PredType::STD_U32LE;
        case ElementKind::UInt64: return H5::PredType::STD_U64LE;
        case ElementKind::Int8: return H5::PredType::STD_I8LE;
        case ElementKind::Int16: return H5::PredType::STD_I16LE;
        case ElementKind::Int32: return H5::PredType::STD_I32LE;
        case ElementKind::Int64: return H5::PredType::STD_I64LE;
        case ElementKind::Float16: return half_type();
        case ElementKind::Float32: return H5::PredType::IEEE_F32LE;
        case ElementKind::Float64: return H5::PredType::IEEE_F64LE;
        case ElementKind::Complex64: return complex_type(4, H5::PredType::IEEE_F32LE);
        case ElementKind::Complex128: return complex_type(8, H5::PredType::IEEE_F64LE);
    }
    throw MarshalError(ErrorKind::UnsupportedType, "no HDF5 type for " + to_string(d));
}

static MarshalError unsupported_type(const std::string& path) {
    return MarshalError(ErrorKind::UnsupportedType, "unsupported HDF5 datatype at '" + path + "'");
}

// Dtype of a stored dataset plus the memory type to read it with.
static std::pair<Dtype, H5::DataType> stored_type(const H5::DataSet& ds, const std::string& path) {
    switch (ds.getTypeClass()) {
        case H5T_ENUM: {
            H5::EnumType et = ds.getEnumType();
            if (et.getSize() != 1 || et.getNmembers() != 2) throw unsupported_type(path);
            return {Dtype::numeric(ElementKind::Bool), bool_type()};
        }
        case H5T_INTEGER: {
            H5::IntType it = ds.getIntType();
            const bool is_signed = it.getSign() != H5T_SGN_NONE;
            switch (it.getSize()) {
                case 1: return is_signed ? std::make_pair(Dtype::numeric(ElementKind::Int8), H5::DataType(H5::PredType::STD_I8LE))
                                         : std::make_pair(Dtype::numeric(ElementKind::UInt8), H5::DataType(H5::PredType::STD_U8LE));
                case 2: return is_signed ? std::make_pair(Dtype::numeric(ElementKind::Int16), H5::DataType(H5::PredType::STD_I16LE))
                                         : std::make_pair(Dtype::numeric(ElementKind::UInt16), H5::DataType(H5::PredType::STD_U16LE));
                case 4: return is_signed ? std::make_pair(Dtype::numeric(ElementKind::Int32), H5::DataType(H5::PredType::STD_I32LE))
                                         : std::make_pair(Dtype::numeric(ElementKind::UInt32), H5::DataType(H5::PredType::STD_U32LE));
                case 8: return is_signed ? std::make_pair(Dtype::numeric(ElementKind::Int64), H5::DataType(H5::PredType::STD_I64LE))
                                         : std::make_pair(Dtype::numeric(ElementKind::UInt64), H5::DataType(H5::PredType::STD_U64LE));
                default: throw unsupported_type(path);
            }
        }
        case H5T_FLOAT: {
            switch (ds.getFloatType().getSize()) {
                case 2: return {Dtype::numeric(ElementKind::Float16), half_type()};
                case 4: return {Dtype::numeric(ElementKind::Float32), H5::PredType::IEEE_F32LE};
                case 8: return {Dtype::numeric(ElementKind::Float64), H5::PredType::IEEE_F64LE};
                default: throw unsupported_type(path);
            }
        }
        case H5T_COMPOUND: {
            H5::CompType ct = ds.getCompType();
            if (ct.getNmembers() != 2 || ct.getMemberClass(0) != H5T_FLOAT || ct.getMemberClass(1) != H5T_FLOAT) {
                throw unsupported_type(path);
            }
            // members are matched by name on conversion
            const std::string re = ct.getMemberName(0);
            const std::string im = ct.getMemberName(1);
            switch (ct.getSize()) {
                case 8: return {Dtype::numeric(ElementKind::Complex64), complex_type(4, H5::PredType::IEEE_F32LE, re, im)};
                case 16: return {Dtype::numeric(ElementKind::Complex128), complex_type(8, H5::PredType::IEEE_F64LE, re, im)};
                default: throw unsupported_type(path);
            }
        }
        case H5T_STRING: {
            H5::StrType st = ds.getStrType();
            if (st.isVariableStr()) throw unsupported_type(path);
            return {Dtype::bytes(st.getSize()), bytes_type(st.getSize())};
        }
        default:
            throw unsupported_type(path);
    }
}

static H5::DataSpace dataspace_for(const Shape& shape) {
    if (shape.empty()) return H5::DataSpace(H5S_SCALAR);
    std::vector<hsize_t> dims(shape.begin(), shape.end());
    return H5::DataSpace(static_cast<int>(dims.size()), dims.data());
}

static Shape shape_of(const H5::DataSpace& space) {
    if (space.getSimpleExtentType() == H5S_NULL) return Shape{0};
    int rank = space.getSimpleExtentNdims();
    std::vector<hsize_t> dims(static_cast<std::size_t>(rank));
    if (rank > 0) space.getSimpleExtentDims(dims.data());
    return Shape(dims.begin(), dims.end());
}

// ------------------------------
// Hdf5Store
// ------------------------------

namespace {

class Hdf5Store : public Store {
public:
    Hdf5Store(const std::filesystem::path& file, OpenMode mode) : name_(file.string()), mode_(mode) {
        H5::Exception::dontPrint();
        std::error_code ec;
        bool present = std::filesystem::exists(file, ec);
        if (mode == OpenMode::Read && !present) {
            throw MarshalError(ErrorKind::PathNotFound, "no such file: " + name_);
        }
        unsigned flags = mode == OpenMode::Read ? H5F_ACC_RDONLY : (present ? H5F_ACC_RDWR : H5F_ACC_TRUNC);
        try {
            if (!present && is_mat_file(file)) {
                H5::FileCreatPropList fcpl;
                fcpl.setUserblock(kMatUserblock);
                file_ = H5::H5File(name_, flags, fcpl);
                mat_header_ = true;
            } else {
                file_ = H5::H5File(name_, flags);
            }
        } catch (const H5::Exception& e) {
            throw MarshalError(ErrorKind::Io, "failed to open " + name_ + ": " + e.getDetailMsg());
        }
        internal::get_logger()->debug("opened HDF5 file {}", name_);
    }

    ~Hdf5Store() override {
        if (closed_) return;
        try {
            close();
        } catch (const std::exception& e) {
            internal::get_logger()->error("failed to close {}: {}", name_, e.what());
        }
    }

    NodeType node_type(const std::string& path) const override {
        return guarded("inspect", path, [&] { return lookup(normalize_path(path)); });
    }

    void create_group(const std::string& path) override {
        require_writable();
        guarded("create group", path, [&] { make_groups(split_path(normalize_path(path))); });
    }

    void create_dataset(const std::string& path, const Dataset& ds) override {
        require_writable();
        const std::string p = normalize_path(path);
        auto parts = split_path(p);
        if (parts.empty()) throw MarshalError(ErrorKind::InvalidPath, "cannot create a dataset at '/'");
        if (ds.data.size() != numel(ds.shape) * ds.dtype.item_size()) {
            throw MarshalError(ErrorKind::InvalidData, "dataset payload size does not match dtype and shape at '" + p + "'");
        }
        guarded("create dataset", p, [&] {
            parts.pop_back();
            make_groups(parts);
            if (lookup(p) != NodeType::Missing) {
                throw MarshalError(ErrorKind::PathConflict, "node already exists at '" + p + "'");
            }
            H5::DataType type = h5_type(ds.dtype);
            H5::DataSet out = file_.createDataSet(p, type, dataspace_for(ds.shape));
            if (!ds.data.empty()) out.write(ds.data.data(), type);
        });
    }

    Dataset read_dataset(const std::string& path) const override {
        const std::string p = normalize_path(path);
        return guarded("read dataset", p, [&] {
            NodeType t = lookup(p);
            if (t == NodeType::Missing) throw MarshalError(ErrorKind::PathNotFound, "no dataset at '" + p + "'");
            if (t != NodeType::Dataset) {
                throw MarshalError(ErrorKind::PathConflict, "'" + p + "' is a group, not a dataset");
            }
            H5::DataSet in = file_.openDataSet(p);
            auto [dtype, memtype] = stored_type(in, p);
            Dataset ds;
            ds.dtype = dtype;
            ds.shape = shape_of(in.getSpace());
            ds.data.resize(numel(ds.shape) * ds.dtype.item_size());
            if (!ds.data.empty()) in.read(ds.data.data(), memtype);
            return ds;
        });
    }

    void set_attribute(const std::string& path, const std::string& name,
                       const Attribute& value) override {
        require_writable();
        const std::string p = normalize_path(path);
        guarded("set attribute on", p, [&] {
            with_object(p, [&](const H5::H5Object& obj) {
                if (obj.attrExists(name)) obj.removeAttr(name);
                if (const auto* s = std::get_if<std::string>(&value)) {
                    H5::StrType st = text_attr_type(*s);
                    obj.createAttribute(name, st, H5::DataSpace(H5S_SCALAR)).write(st, *s);
                } else if (const auto* i = std::get_if<std::int64_t>(&value)) {
                    obj.createAttribute(name, int_attr_type(name), H5::DataSpace(H5S_SCALAR))
                        .write(H5::PredType::NATIVE_INT64, i);
                } else {
                    const auto& dims = std::get<std::vector<std::uint64_t>>(value);
                    if (dims.empty()) {
                        obj.createAttribute(name, H5::PredType::STD_U64LE, H5::DataSpace(H5S_NULL));
                    } else {
                        hsize_t n = dims.size();
                        obj.createAttribute(name, H5::PredType::STD_U64LE, H5::DataSpace(1, &n))
                            .write(H5::PredType::NATIVE_UINT64, dims.data());
                    }
                }
                return 0;
            });
        });
    }

    std::optional<Attribute> get_attribute(const std::string& path,
                                           const std::string& name) const override {
        const std::string p = normalize_path(path);
        return guarded("read attribute of", p, [&] {
            return with_object(p, [&](const H5::H5Object& obj) -> std::optional<Attribute> {
                if (!obj.attrExists(name)) return std::nullopt;
                return convert_attribute(obj.openAttribute(name), p);
            });
        });
    }

    std::vector<std::string> list_attributes(const std::string& path) const override {
        const std::string p = normalize_path(path);
        return guarded("list attributes of", p, [&] {
            return with_object(p, [&](const H5::H5Object& obj) {
                std::vector<std::string> names;
                const int n = obj.getNumAttrs();
                for (int i = 0; i < n; ++i) {
                    H5::Attribute a = obj.openAttribute(static_cast<unsigned>(i));
                    if (convert_attribute(a, p)) names.push_back(a.getName());
                }
                std::sort(names.begin(), names.end());
                return names;
            });
        });
    }

    std::vector<std::string> list_children(const std::string& path) const override {
        const std::string p = normalize_path(path);
        return guarded("list", p, [&] {
            NodeType t = lookup(p);
            if (t == NodeType::Missing) throw MarshalError(ErrorKind::PathNotFound, "no group at '" + p + "'");
            if (t != NodeType::Group) {
                throw MarshalError(ErrorKind::PathConflict, "'" + p + "' is a dataset, not a group");
            }
            H5::Group g = file_.openGroup(p);
            std::vector<std::string> names;
            const hsize_t n = g.getNumObjs();
            for (hsize_t i = 0; i < n; ++i) names.push_back(g.getObjnameByIdx(i));
            std::sort(names.begin(), names.end());
            return names;
        });
    }

    void remove(const std::string& path) override {
        require_writable();
        const std::string p = normalize_path(path);
        if (p == "/") throw MarshalError(ErrorKind::InvalidPath, "cannot remove the root group");
        guarded("remove", p, [&] {
            if (lookup(p) == NodeType::Missing) throw MarshalError(ErrorKind::PathNotFound, "no node at '" + p + "'");
            file_.unlink(p);
        });
    }

    void flush() override {
        if (closed_ || mode_ == OpenMode::Read) return;
        guarded("flush", name_, [&] { file_.flush(H5F_SCOPE_GLOBAL); });
    }

    void close() override {
        if (closed_) return;
        flush();
        guarded("close", name_, [&] { file_.close(); });
        closed_ = true;
        if (mat_header_) {
            write_mat_header(name_);
            mat_header_ = false;
        }
    }

private:
    std::string name_;
    OpenMode mode_;
    H5::H5File file_;
    bool closed_{false};
    // set for a newly created .mat file until its header is written
    bool mat_header_{false};

    template <typename F>
    auto guarded(const char* what, const std::string& path, F&& f) const -> decltype(f()) {
        if (closed_) throw MarshalError(ErrorKind::Io, "store is closed: " + name_);
        try {
            return f();
        } catch (const H5::Exception& e) {
            throw MarshalError(ErrorKind::Io, std::string("HDF5 failed to ") + what + " '" + path +
                                                  "' in " + name_ + ": " + e.getDetailMsg());
        }
    }

    void require_writable() const {
        if (mode_ == OpenMode::Read) {
            throw MarshalError(ErrorKind::Io, "store is opened read-only: " + name_);
        }
    }

    // Walks prefix by prefix; a dataset in the middle of the path makes
    // the node missing.
    NodeType lookup(const std::string& p) const {
        auto parts = split_path(p);
        if (parts.empty()) return NodeType::Group;
        for (std::size_t i = 1; i <= parts.size(); ++i) {
            const std::string prefix = "/" + join_path(parts, i);
            if (!file_.nameExists(prefix)) return NodeType::Missing;
            H5O_type_t t = file_.childObjType(prefix);
            if (i == parts.size()) {
                if (t == H5O_TYPE_GROUP) return NodeType::Group;
                if (t == H5O_TYPE_DATASET) return NodeType::Dataset;
                return NodeType::Missing;
            }
            if (t != H5O_TYPE_GROUP) return NodeType::Missing;
        }
        return NodeType::Missing;
    }

    void make_groups(const std::vector<std::string>& parts) const {
        for (std::size_t i = 1; i <= parts.size(); ++i) {
            const std::string prefix = "/" + join_path(parts, i);
            NodeType t = lookup(prefix);
            if (t == NodeType::Missing) {
                file_.createGroup(prefix);
            } else if (t != NodeType::Group) {
                throw MarshalError(ErrorKind::PathConflict, "'" + prefix + "' is a dataset, not a group");
            }
        }
    }

    template <typename F>
    auto with_object(const std::string& p, F&& f) const -> decltype(f(std::declval<const H5::H5Object&>())) {
        switch (lookup(p)) {
            case NodeType::Group: {
                H5::Group g = file_.openGroup(p);
                return f(g);
            }
            case NodeType::Dataset: {
                H5::DataSet d = file_.openDataSet(p);
                return f(d);
            }
            case NodeType::Missing:
                break;
        }
        throw MarshalError(ErrorKind::PathNotFound, "no node at '" + p + "'");
    }

    // Strings, signed scalars and unsigned vectors; other attribute types
    // written by foreign tools are not visible through the store.
    static std::optional<Attribute> convert_attribute(const H5::Attribute& a, const std::string& p) {
        H5::DataSpace space = a.getSpace();
        const H5S_class_t extent = space.getSimpleExtentType();
        switch (a.getTypeClass()) {
            case H5T_STRING: {
                if (extent != H5S_SCALAR) break;
                std::string s;
                a.read(a.getStrType(), s);
                while (!s.empty() && s.back() == '\0') s.pop_back();
                return Attribute(std::move(s));
            }
            case H5T_INTEGER: {
                if (extent == H5S_SCALAR) {
                    std::int64_t v = 0;
                    a.read(H5::PredType::NATIVE_INT64, &v);
                    return Attribute(v);
                }
                if (extent == H5S_NULL) return Attribute(std::vector<std::uint64_t>{});
                if (space.getSimpleExtentNdims() != 1) break;
                std::vector<std::uint64_t> dims(static_cast<std::size_t>(space.getSimpleExtentNpoints()));
                if (!dims.empty()) a.read(H5::PredType::NATIVE_UINT64, dims.data());
                return Attribute(std::move(dims));
            }
            default:
                break;
        }
        internal::get_logger()->debug("skipping attribute {} of unsupported type on {}", a.getName(), p);
        return std::nullopt;
    }
};

} // namespace

std::unique_ptr<Store> open_store(const std::filesystem::path& file, OpenMode mode) {
    return std::make_unique<Hdf5Store>(file, mode);
}

} // namespace hmarshal
