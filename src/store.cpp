#include "hmarshal/store.hpp"

#include "hmarshal/error.hpp"
#include "hmarshal/path.hpp"

#include <cctype>

namespace hmarshal {

// ------------------------------
// Dtype
// ------------------------------

Dtype Dtype::numeric(ElementKind k) {
    Dtype d;
    d.cls = Class::Numeric;
    d.element = k;
    d.width = 0;
    return d;
}

Dtype Dtype::bytes(std::size_t width) {
    Dtype d;
    d.cls = Class::Bytes;
    d.element = ElementKind::UInt8;
    d.width = width;
    return d;
}

std::size_t Dtype::item_size() const noexcept {
    return is_bytes() ? width : element_size(element);
}

bool operator==(const Dtype& a, const Dtype& b) {
    if (a.cls != b.cls) return false;
    return a.is_bytes() ? a.width == b.width : a.element == b.element;
}

bool operator!=(const Dtype& a, const Dtype& b) {
    return !(a == b);
}

std::string to_string(const Dtype& d) {
    if (d.is_bytes()) return "S" + std::to_string(d.width);
    return to_string(d.element);
}

std::optional<Dtype> dtype_from_string(const std::string& s) {
    if (s.size() > 1 && s[0] == 'S') {
        std::size_t width = 0;
        for (std::size_t i = 1; i < s.size(); ++i) {
            if (!std::isdigit(static_cast<unsigned char>(s[i]))) return std::nullopt;
            width = width * 10 + static_cast<std::size_t>(s[i] - '0');
        }
        if (width == 0) return std::nullopt;
        return Dtype::bytes(width);
    }
    if (auto k = element_kind_from_string(s)) return Dtype::numeric(*k);
    return std::nullopt;
}

bool Store::exists(const std::string& path) const {
    return node_type(path) != NodeType::Missing;
}

// ------------------------------
// MemoryStore
// ------------------------------

MemoryStore::MemoryStore() {
    root_.type = NodeType::Group;
}

MemoryStore::~MemoryStore() = default;

const MemoryStore::Node* MemoryStore::find(const std::string& path) const {
    auto parts = split_path(normalize_path(path));
    const Node* cur = &root_;
    for (const auto& p : parts) {
        if (cur->type != NodeType::Group) return nullptr;
        auto it = cur->children.find(p);
        if (it == cur->children.end()) return nullptr;
        cur = it->second.get();
    }
    return cur;
}

MemoryStore::Node& MemoryStore::require(const std::string& path) {
    const Node* n = find(path);
    if (!n) throw MarshalError(ErrorKind::PathNotFound, "no node at '" + path + "'");
    return *const_cast<Node*>(n);
}

MemoryStore::Node& MemoryStore::make_parents(const std::vector<std::string>& parts) {
    Node* cur = &root_;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        auto it = cur->children.find(parts[i]);
        if (it == cur->children.end()) {
            auto node = std::make_unique<Node>();
            node->type = NodeType::Group;
            it = cur->children.emplace(parts[i], std::move(node)).first;
        } else if (it->second->type != NodeType::Group) {
            throw MarshalError(ErrorKind::PathConflict,
                               "'/" + join_path(parts, i + 1) + "' is a dataset, not a group");
        }
        cur = it->second.get();
    }
    return *cur;
}

NodeType MemoryStore::node_type(const std::string& path) const {
    const Node* n = find(path);
    return n ? n->type : NodeType::Missing;
}

void MemoryStore::create_group(const std::string& path) {
    make_parents(split_path(normalize_path(path)));
}

void MemoryStore::create_dataset(const std::string& path, const Dataset& ds) {
    const std::string p = normalize_path(path);
    if (p == "/") {
        throw MarshalError(ErrorKind::InvalidPath, "cannot create a dataset at '/'");
    }
    if (ds.data.size() != numel(ds.shape) * ds.dtype.item_size()) {
        throw MarshalError(ErrorKind::InvalidData, "dataset payload size does not match dtype and shape at '" + path + "'");
    }
    const std::string leaf = leaf_name(p);
    Node& parent = make_parents(split_path(parent_path(p)));
    if (parent.children.count(leaf)) {
        throw MarshalError(ErrorKind::PathConflict, "node already exists at '" + path + "'");
    }
    auto node = std::make_unique<Node>();
    node->type = NodeType::Dataset;
    node->dataset = ds;
    parent.children.emplace(leaf, std::move(node));
}

Dataset MemoryStore::read_dataset(const std::string& path) const {
    const Node* n = find(path);
    if (!n) throw MarshalError(ErrorKind::PathNotFound, "no dataset at '" + path + "'");
    if (n->type != NodeType::Dataset) {
        throw MarshalError(ErrorKind::PathConflict, "'" + path + "' is a group, not a dataset");
    }
    return n->dataset;
}

void MemoryStore::set_attribute(const std::string& path, const std::string& name,
                                const Attribute& value) {
    require(path).attributes[name] = value;
}

std::optional<Attribute> MemoryStore::get_attribute(const std::string& path,
                                                    const std::string& name) const {
    const Node* n = find(path);
    if (!n) throw MarshalError(ErrorKind::PathNotFound, "no node at '" + path + "'");
    auto it = n->attributes.find(name);
    if (it == n->attributes.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> MemoryStore::list_attributes(const std::string& path) const {
    const Node* n = find(path);
    if (!n) throw MarshalError(ErrorKind::PathNotFound, "no node at '" + path + "'");
    std::vector<std::string> out;
    out.reserve(n->attributes.size());
    for (const auto& kv : n->attributes) out.push_back(kv.first);
    return out;
}

std::vector<std::string> MemoryStore::list_children(const std::string& path) const {
    const Node* n = find(path);
    if (!n) throw MarshalError(ErrorKind::PathNotFound, "no group at '" + path + "'");
    if (n->type != NodeType::Group) {
        throw MarshalError(ErrorKind::PathConflict, "'" + path + "' is a dataset, not a group");
    }
    std::vector<std::string> out;
    out.reserve(n->children.size());
    for (const auto& kv : n->children) out.push_back(kv.first);
    return out;
}

void MemoryStore::remove(const std::string& path) {
    const std::string p = normalize_path(path);
    if (p == "/") {
        throw MarshalError(ErrorKind::InvalidPath, "cannot remove the root group");
    }
    Node& parent = require(parent_path(p));
    if (parent.type != NodeType::Group || parent.children.erase(leaf_name(p)) == 0) {
        throw MarshalError(ErrorKind::PathNotFound, "no node at '" + path + "'");
    }
}

} // namespace hmarshal
