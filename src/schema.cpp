#include "figkiwi/schema.hpp"

namespace figkiwi {

std::string to_string(DefinitionKind k) {
    switch (k) {
        case DefinitionKind::Enum: return "enum";
        case DefinitionKind::Struct: return "struct";
        case DefinitionKind::Message: return "message";
    }
    return "unknown";
}

std::optional<NativeType> native_type_from_string(const std::string& s) {
    for (std::size_t i = 0; i < kNativeTypeNames.size(); ++i) {
        if (s == kNativeTypeNames[i]) return static_cast<NativeType>(i);
    }
    return std::nullopt;
}

const char* to_string(NativeType t) noexcept {
    return kNativeTypeNames[static_cast<std::size_t>(t)];
}

bool is_native_type_name(const std::string& s) {
    return native_type_from_string(s).has_value();
}

bool is_reserved_name(const std::string& s) {
    for (const char* r : kReservedNames) {
        if (s == r) return true;
    }
    return false;
}

const Definition* Schema::find(const std::string& name) const {
    for (const auto& d : definitions) {
        if (d.name == name) return &d;
    }
    return nullptr;
}

bool operator==(const Field& a, const Field& b) {
    return a.name == b.name && a.type == b.type && a.is_array == b.is_array &&
           a.is_deprecated == b.is_deprecated && a.id == b.id;
}

bool operator!=(const Field& a, const Field& b) { return !(a == b); }

bool operator==(const Definition& a, const Definition& b) {
    return a.name == b.name && a.kind == b.kind && a.fields == b.fields;
}

bool operator!=(const Definition& a, const Definition& b) { return !(a == b); }

bool operator==(const Schema& a, const Schema& b) {
    return a.package == b.package && a.definitions == b.definitions;
}

bool operator!=(const Schema& a, const Schema& b) { return !(a == b); }

} // namespace figkiwi
