#include "hmarshal/hmarshal.hpp"

#include "hmarshal/path.hpp"
#include "logging.hpp"
#include "registry.hpp"
#include "transform.hpp"

#include <algorithm>
#include <optional>
#include <utility>

namespace hmarshal {

using internal::AttributeMap;
using internal::GroupInfo;
using internal::Layout;
using internal::Marshaler;
using internal::get_logger;

std::string to_string(Regime r) {
    switch (r) {
        case Regime::Fidelity: return "fidelity";
        case Regime::Matlab: return "matlab";
        case Regime::Bare: return "bare";
    }
    return "unknown";
}

Regime Options::regime() const noexcept {
    if (store_type_information) return Regime::Fidelity;
    return matlab_compatible ? Regime::Matlab : Regime::Bare;
}

// ------------------------------
// Attribute plumbing
// ------------------------------

static void write_attributes(Store& store, const std::string& path, const AttributeMap& attrs) {
    auto logger = get_logger();
    for (const auto& kv : attrs) {
        logger->trace("set attribute {} on {}", kv.first, path);
        store.set_attribute(path, kv.first, kv.second);
    }
}

static AttributeMap read_attributes(const Store& store, const std::string& path) {
    AttributeMap attrs;
    for (const auto& name : store.list_attributes(path)) {
        if (auto a = store.get_attribute(path, name)) attrs.emplace(name, std::move(*a));
    }
    return attrs;
}

static const std::string* type_tag_of(const AttributeMap& attrs) {
    auto it = attrs.find(internal::attr::kType);
    if (it == attrs.end()) return nullptr;
    const auto* s = std::get_if<std::string>(&it->second);
    if (!s) throw MarshalError(ErrorKind::CorruptMetadata, "type tag must be a string");
    return s;
}

// Resolves a stored tag. Unknown tags are logged and yield nullptr so the
// caller falls back to inference.
static const Marshaler* resolve_tag(const std::string& tag, const std::string& path) {
    try {
        return &internal::marshaler_for_tag(tag);
    } catch (const MarshalError& e) {
        if (e.kind() != ErrorKind::UnknownTypeTag) throw;
        get_logger()->warn("{} at {}; inferring from shape and dtype", e.what(), path);
        return nullptr;
    }
}

// ------------------------------
// Write
// ------------------------------

// Walks the whole value so a value the layout rejects fails before
// anything stored at the target path is replaced.
static void check_value(const Value& value, const Layout& layout) {
    std::vector<const Value*> stack{&value};
    while (!stack.empty()) {
        const Value* v = stack.back();
        stack.pop_back();
        const Marshaler& m = internal::marshaler_for(internal::classify(*v));
        internal::check_encodable(*v, layout);
        if (m.container) {
            for (const auto& e : internal::container_elements(*v)) stack.push_back(&e);
        }
    }
}

void write(const Value& value, const std::string& name, Store& store, const Options& opts) {
    const std::string root = normalize_path(name);
    if (root == "/") throw MarshalError(ErrorKind::InvalidPath, "cannot write a value at '/'");

    const Layout layout = internal::layout_for(opts);
    auto logger = get_logger();
    check_value(value, layout);

    if (store.exists(root)) {
        if (!opts.overwrite) {
            throw MarshalError(ErrorKind::PathConflict, "a node already exists at '" + root + "'");
        }
        logger->debug("replacing existing node at {}", root);
        store.remove(root);
    }

    struct Task {
        const Value* value;
        std::string path;
    };
    std::vector<Task> stack;
    stack.push_back(Task{&value, root});

    while (!stack.empty()) {
        Task task = std::move(stack.back());
        stack.pop_back();

        const ValueKind kind = internal::classify(*task.value);
        const Marshaler& m = internal::marshaler_for(kind);
        logger->debug("write {} {} ({})", task.path, to_string(kind), to_string(layout.regime));

        AttributeMap attrs;
        if (m.container) {
            attrs = internal::encode_group(*task.value, layout);
            store.create_group(task.path);
        } else {
            internal::EncodedLeaf leaf = m.encode(*task.value, layout);
            store.create_dataset(task.path, leaf.dataset);
            attrs = std::move(leaf.attributes);
        }
        if (layout.tagged()) attrs[internal::attr::kType] = internal::type_tag(*task.value);
        write_attributes(store, task.path, attrs);

        if (m.container) {
            const auto& elements = internal::container_elements(*task.value);
            // reversed so element 0 is written first
            for (std::size_t i = elements.size(); i-- > 0;) {
                stack.push_back(Task{&elements[i], child_path(task.path, i)});
            }
        }
    }
}

// ------------------------------
// Read
// ------------------------------

static Value read_leaf(const Store& store, const std::string& path, const AttributeMap& attrs,
                       const Layout& layout) {
    Dataset ds = store.read_dataset(path);
    if (layout.tagged()) {
        if (const std::string* tag = type_tag_of(attrs)) {
            if (const Marshaler* m = resolve_tag(*tag, path)) {
                if (m->container) {
                    throw MarshalError(ErrorKind::CorruptMetadata,
                                       "container tag '" + *tag + "' on dataset " + path);
                }
                return m->decode(ds, attrs, layout);
            }
        }
    }
    return internal::infer_leaf(ds, attrs, layout.inference());
}

// Child paths of a group in element order.
static std::vector<std::string> ordered_children(const Store& store, const std::string& path) {
    std::vector<std::pair<std::size_t, std::string>> indexed;
    for (const auto& child : store.list_children(path)) {
        auto index = child_index(child);
        if (!index) {
            throw MarshalError(ErrorKind::CorruptMetadata,
                               "unexpected child '" + child + "' in group " + path);
        }
        indexed.emplace_back(*index, child);
    }
    std::sort(indexed.begin(), indexed.end());
    std::vector<std::string> out;
    out.reserve(indexed.size());
    for (std::size_t i = 0; i < indexed.size(); ++i) {
        if (indexed[i].first != i) {
            throw MarshalError(ErrorKind::CorruptMetadata,
                               "group " + path + " is missing element " + std::to_string(i));
        }
        out.push_back(child_path(path, i));
    }
    return out;
}

static GroupInfo read_group_info(const AttributeMap& attrs, std::size_t child_count,
                                 const std::string& path, const Layout& layout) {
    if (layout.tagged()) {
        if (const std::string* tag = type_tag_of(attrs)) {
            if (const Marshaler* m = resolve_tag(*tag, path)) {
                if (!m->container) {
                    throw MarshalError(ErrorKind::CorruptMetadata,
                                       "value tag '" + *tag + "' on group " + path);
                }
                return internal::decode_group(tag, attrs, child_count, layout);
            }
        }
    }
    return internal::decode_group(nullptr, attrs, child_count, layout.inference());
}

Value read(const std::string& name, const Store& store, const Options& opts) {
    const std::string root = normalize_path(name);
    const Layout layout = internal::layout_for(opts);
    auto logger = get_logger();

    struct Frame {
        GroupInfo info;
        std::vector<std::string> children;
        std::vector<Value> elements;
    };
    std::vector<Frame> stack;
    std::optional<Value> result;

    auto deliver = [&](Value v) {
        if (stack.empty()) {
            result = std::move(v);
        } else {
            stack.back().elements.push_back(std::move(v));
        }
    };

    auto visit = [&](const std::string& path) {
        const NodeType type = store.node_type(path);
        if (type == NodeType::Missing) {
            throw MarshalError(ErrorKind::PathNotFound, "nothing stored at '" + path + "'");
        }
        AttributeMap attrs = read_attributes(store, path);
        if (type == NodeType::Dataset) {
            Value v = read_leaf(store, path, attrs, layout);
            logger->debug("read {} {} ({})", path, to_string(internal::classify(v)),
                          to_string(layout.regime));
            deliver(std::move(v));
            return;
        }
        Frame frame;
        frame.children = ordered_children(store, path);
        frame.info = read_group_info(attrs, frame.children.size(), path, layout);
        logger->debug("read {} group of {} ({})", path, frame.children.size(),
                      to_string(layout.regime));
        if (frame.children.empty()) {
            deliver(internal::fold_group(frame.info, {}));
        } else {
            stack.push_back(std::move(frame));
        }
    };

    visit(root);
    while (!stack.empty()) {
        Frame& top = stack.back();
        if (top.elements.size() < top.children.size()) {
            // copied: visiting may grow the stack
            std::string next = top.children[top.elements.size()];
            visit(next);
        } else {
            Frame done = std::move(stack.back());
            stack.pop_back();
            deliver(internal::fold_group(done.info, std::move(done.elements)));
        }
    }
    return std::move(*result);
}

// ------------------------------
// File helpers
// ------------------------------

namespace {

// Closes the store on every exit path. close() reports failures; the
// destructor only runs while another exception is already unwinding.
class ScopedStore {
public:
    explicit ScopedStore(std::unique_ptr<Store> store) : store_(std::move(store)) {}

    ~ScopedStore() {
        if (!store_) return;
        try {
            store_->close();
        } catch (const std::exception& e) {
            get_logger()->warn("failed to close store after error: {}", e.what());
        }
    }

    ScopedStore(const ScopedStore&) = delete;
    ScopedStore& operator=(const ScopedStore&) = delete;

    Store& get() { return *store_; }

    void close() {
        std::unique_ptr<Store> store = std::move(store_);
        store->close();
    }

private:
    std::unique_ptr<Store> store_;
};

} // namespace

void write(const Value& value, const std::string& name, const std::filesystem::path& file,
           const Options& opts) {
    ScopedStore store(open_store(file, OpenMode::ReadWrite));
    write(value, name, store.get(), opts);
    store.close();
}

Value read(const std::string& name, const std::filesystem::path& file, const Options& opts) {
    ScopedStore store(open_store(file, OpenMode::Read));
    Value v = read(name, store.get(), opts);
    store.close();
    return v;
}

} // namespace hmarshal
