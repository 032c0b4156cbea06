#pragma once

#include "hmarshal/error.hpp"
#include "hmarshal/store.hpp"
#include "hmarshal/value.hpp"

#include <filesystem>
#include <string>

namespace hmarshal {

// ------------------------------
// Options
// ------------------------------

enum class Regime {
    // Type tags are stored; read-back reproduces the written value exactly.
    Fidelity,
    // No type tags, MATLAB array-shape and string conventions.
    Matlab,
    // No type tags, natural shapes; the reader infers from shape/dtype.
    Bare,
};

std::string to_string(Regime r);

struct Options {
    bool store_type_information{true};
    bool matlab_compatible{true};
    // Replace an existing node at the target path instead of failing with
    // PathConflict.
    bool overwrite{true};

    Regime regime() const noexcept;
    bool matlab_layout() const noexcept { return matlab_compatible; }
};

// ------------------------------
// API
// ------------------------------

/// Write `value` at the absolute POSIX path `name` inside an open store.
/// Intermediate groups are created as needed.
void write(const Value& value, const std::string& name, Store& store,
           const Options& opts = Options{});

/// Open (or create) `file`, write `value` at `name`, and close the file on
/// every exit path.
void write(const Value& value, const std::string& name,
           const std::filesystem::path& file, const Options& opts = Options{});

/// Read the value stored at `name` inside an open store.
Value read(const std::string& name, const Store& store,
           const Options& opts = Options{});

/// Open `file` read-only, read the value at `name`, and close the file.
Value read(const std::string& name, const std::filesystem::path& file,
           const Options& opts = Options{});

} // namespace hmarshal
