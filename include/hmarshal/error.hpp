#pragma once

#include <stdexcept>
#include <string>

namespace hmarshal {

// ------------------------------
// Error model
// ------------------------------

enum class ErrorKind {
    UnsupportedType,
    UnknownTypeTag,
    PathNotFound,
    PathConflict,
    InvalidPath,
    CorruptMetadata,
    Io,
    InvalidData,
};

std::string to_string(ErrorKind k);

class MarshalError : public std::runtime_error {
public:
    MarshalError(ErrorKind k, const std::string& msg);
    ErrorKind kind() const noexcept;

private:
    ErrorKind kind_;
};

} // namespace hmarshal
