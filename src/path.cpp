#include "hmarshal/path.hpp"

#include "hmarshal/error.hpp"

#include <cctype>
#include <limits>

namespace hmarshal {

std::string normalize_path(const std::string& path) {
    if (path.empty() || path[0] != '/') {
        throw MarshalError(ErrorKind::InvalidPath, "path must be absolute: '" + path + "'");
    }
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= path.size()) {
        auto slash = path.find('/', start);
        if (slash == std::string::npos) slash = path.size();
        std::string seg = path.substr(start, slash - start);
        start = slash + 1;
        if (seg.empty() || seg == ".") continue;
        if (seg == "..") {
            throw MarshalError(ErrorKind::InvalidPath, "'..' is not allowed in path: '" + path + "'");
        }
        parts.push_back(std::move(seg));
    }
    return "/" + join_path(parts, parts.size());
}

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start < path.size()) {
        auto slash = path.find('/', start);
        if (slash == std::string::npos) slash = path.size();
        if (slash > start) parts.push_back(path.substr(start, slash - start));
        start = slash + 1;
    }
    return parts;
}

std::string join_path(const std::vector<std::string>& parts, std::size_t upto) {
    std::string out;
    for (std::size_t i = 0; i < upto && i < parts.size(); ++i) {
        if (i) out.push_back('/');
        out += parts[i];
    }
    return out;
}

std::string parent_path(const std::string& path) {
    auto parts = split_path(path);
    if (parts.empty()) return "/";
    return "/" + join_path(parts, parts.size() - 1);
}

std::string leaf_name(const std::string& path) {
    auto parts = split_path(path);
    return parts.empty() ? std::string() : parts.back();
}

std::string append_path(const std::string& parent, const std::string& name) {
    if (parent.empty() || parent.back() == '/') return parent + name;
    return parent + "/" + name;
}

// ------------------------------
// Path namer
// ------------------------------

std::string child_path(const std::string& parent, std::size_t index) {
    return append_path(parent, std::to_string(index));
}

std::optional<std::size_t> child_index(const std::string& name) {
    if (name.empty() || name.size() > 20) return std::nullopt;
    // "0" is the only index with a leading zero.
    if (name.size() > 1 && name[0] == '0') return std::nullopt;
    std::size_t v = 0;
    for (char c : name) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        std::size_t d = static_cast<std::size_t>(c - '0');
        if (v > ((std::numeric_limits<std::size_t>::max)() - d) / 10) return std::nullopt;
        v = v * 10 + d;
    }
    return v;
}

} // namespace hmarshal
