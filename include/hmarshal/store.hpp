#pragma once

#include "hmarshal/value.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace hmarshal {

// ------------------------------
// On-disk data model
// ------------------------------

struct Dtype {
    enum class Class {
        Numeric,
        Bytes,
    };

    Class cls{Class::Numeric};
    ElementKind element{ElementKind::Float64};
    // Octets per element when cls == Bytes.
    std::size_t width{0};

    static Dtype numeric(ElementKind k);
    static Dtype bytes(std::size_t width);

    bool is_bytes() const noexcept { return cls == Class::Bytes; }
    std::size_t item_size() const noexcept;
};

bool operator==(const Dtype& a, const Dtype& b);
bool operator!=(const Dtype& a, const Dtype& b);

// "float64", "complex128", ... for numeric dtypes, "S<width>" for bytes.
std::string to_string(const Dtype& d);
std::optional<Dtype> dtype_from_string(const std::string& s);

struct Dataset {
    Dtype dtype{};
    Shape shape{};
    // numel(shape) * dtype.item_size() bytes, little-endian, row-major.
    std::vector<std::uint8_t> data{};
};

using Attribute = std::variant<std::string, std::int64_t, std::vector<std::uint64_t>>;

enum class NodeType {
    Missing,
    Group,
    Dataset,
};

// ------------------------------
// Store
// ------------------------------

/// A hierarchical container of groups and typed datasets addressed by
/// absolute POSIX paths. Intermediate groups are created on write. All
/// failures are reported as MarshalError.
class Store {
public:
    virtual ~Store() = default;

    virtual NodeType node_type(const std::string& path) const = 0;
    bool exists(const std::string& path) const;

    // No-op if a group already exists at `path`.
    virtual void create_group(const std::string& path) = 0;
    virtual void create_dataset(const std::string& path, const Dataset& ds) = 0;
    virtual Dataset read_dataset(const std::string& path) const = 0;

    virtual void set_attribute(const std::string& path, const std::string& name,
                               const Attribute& value) = 0;
    virtual std::optional<Attribute> get_attribute(const std::string& path,
                                                   const std::string& name) const = 0;
    virtual std::vector<std::string> list_attributes(const std::string& path) const = 0;

    // Child names (not paths) in ascending name order.
    virtual std::vector<std::string> list_children(const std::string& path) const = 0;
    virtual void remove(const std::string& path) = 0;

    virtual void flush() {}
    virtual void close() { flush(); }
};

class MemoryStore : public Store {
public:
    MemoryStore();
    ~MemoryStore() override;

    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    NodeType node_type(const std::string& path) const override;
    void create_group(const std::string& path) override;
    void create_dataset(const std::string& path, const Dataset& ds) override;
    Dataset read_dataset(const std::string& path) const override;
    void set_attribute(const std::string& path, const std::string& name,
                       const Attribute& value) override;
    std::optional<Attribute> get_attribute(const std::string& path,
                                           const std::string& name) const override;
    std::vector<std::string> list_attributes(const std::string& path) const override;
    std::vector<std::string> list_children(const std::string& path) const override;
    void remove(const std::string& path) override;

private:
    struct Node {
        NodeType type{NodeType::Group};
        Dataset dataset{};
        std::map<std::string, Attribute> attributes{};
        std::map<std::string, std::unique_ptr<Node>> children{};
    };

    const Node* find(const std::string& path) const;
    Node& require(const std::string& path);
    Node& make_parents(const std::vector<std::string>& parts);

    Node root_;
};

// ------------------------------
// File backends
// ------------------------------

enum class OpenMode {
    Read,
    ReadWrite,
};

/// Open an HDF5 file. Read requires the file to exist (PathNotFound
/// otherwise); ReadWrite opens it or creates it. A new ".mat" file gets the
/// 512-byte MAT-file userblock so MATLAB recognises it.
std::unique_ptr<Store> open_store(const std::filesystem::path& file, OpenMode mode);

} // namespace hmarshal
