#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace hmarshal {

// Collapse repeated '/', drop '.' segments and a trailing '/'. Throws
// MarshalError(InvalidPath) for relative paths and '..' segments.
std::string normalize_path(const std::string& path);

// Segments of a normalized path; "/" has none.
std::vector<std::string> split_path(const std::string& path);
std::string join_path(const std::vector<std::string>& parts, std::size_t upto);

std::string parent_path(const std::string& path);
std::string leaf_name(const std::string& path);
std::string append_path(const std::string& parent, const std::string& name);

// ------------------------------
// Path namer
// ------------------------------

/// Path of element `index` of the container at `parent`. Injective in
/// (parent, index); child_index() recovers the index from the last segment.
std::string child_path(const std::string& parent, std::size_t index);
std::optional<std::size_t> child_index(const std::string& name);

} // namespace hmarshal
