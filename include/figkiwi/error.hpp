#pragma once

#include <stdexcept>
#include <string>

namespace figkiwi {

// ------------------------------
// Error model
// ------------------------------

enum class ErrorKind {
    Truncated,
    MalformedSyntax,
    SemanticError,
    UnknownType,
    UnknownField,
    NotFound,
    MissingRequiredField,
    InvalidEnumValue,
    TypeMismatch,
    InvalidStringContent,
    InvalidContainerFormat,
    UnsupportedCompression,
    Corrupt,
    ZlibError,
    ZstdError,
};

const char* to_string(ErrorKind k) noexcept;

class KiwiError : public std::runtime_error {
public:
    KiwiError(ErrorKind k, const std::string& msg);
    ErrorKind kind() const noexcept;

private:
    ErrorKind kind_;
};

/// Error raised while parsing or verifying schema text. Carries the 1-based
/// source location of the offending token (0 when the schema was not parsed
/// from text).
class SchemaError : public KiwiError {
public:
    SchemaError(ErrorKind k, const std::string& msg, int line, int column);
    int line() const noexcept;
    int column() const noexcept;

private:
    int line_;
    int column_;
};

} // namespace figkiwi
