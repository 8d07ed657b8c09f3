#include "figkiwi/error.hpp"

namespace figkiwi {

const char* to_string(ErrorKind k) noexcept {
    switch (k) {
        case ErrorKind::Truncated: return "Truncated";
        case ErrorKind::MalformedSyntax: return "MalformedSyntax";
        case ErrorKind::SemanticError: return "SemanticError";
        case ErrorKind::UnknownType: return "UnknownType";
        case ErrorKind::UnknownField: return "UnknownField";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::MissingRequiredField: return "MissingRequiredField";
        case ErrorKind::InvalidEnumValue: return "InvalidEnumValue";
        case ErrorKind::TypeMismatch: return "TypeMismatch";
        case ErrorKind::InvalidStringContent: return "InvalidStringContent";
        case ErrorKind::InvalidContainerFormat: return "InvalidContainerFormat";
        case ErrorKind::UnsupportedCompression: return "UnsupportedCompression";
        case ErrorKind::Corrupt: return "Corrupt";
        case ErrorKind::ZlibError: return "ZlibError";
        case ErrorKind::ZstdError: return "ZstdError";
    }
    return "Unknown";
}

KiwiError::KiwiError(ErrorKind k, const std::string& msg)
    : std::runtime_error(msg), kind_(k) {}

ErrorKind KiwiError::kind() const noexcept { return kind_; }

SchemaError::SchemaError(ErrorKind k, const std::string& msg, int line, int column)
    : KiwiError(k, msg + " at line " + std::to_string(line) + ", column " + std::to_string(column)),
      line_(line),
      column_(column) {}

int SchemaError::line() const noexcept { return line_; }

int SchemaError::column() const noexcept { return column_; }

} // namespace figkiwi
