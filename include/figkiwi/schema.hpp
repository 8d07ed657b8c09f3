#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace figkiwi {

// ------------------------------
// Schema model
// ------------------------------

enum class DefinitionKind {
    Enum,
    Struct,
    Message,
};

std::string to_string(DefinitionKind k);

/// Native scalar types, in binary-schema table order.
enum class NativeType {
    Bool,
    Byte,
    Int,
    Uint,
    Float,
    String,
    Int64,
    Uint64,
};

inline constexpr std::array<const char*, 8> kNativeTypeNames = {
    "bool", "byte", "int", "uint", "float", "string", "int64", "uint64",
};

inline constexpr std::array<const char*, 2> kReservedNames = {
    "ByteBuffer", "package",
};

std::optional<NativeType> native_type_from_string(const std::string& s);
const char* to_string(NativeType t) noexcept;

bool is_native_type_name(const std::string& s);
bool is_reserved_name(const std::string& s);

struct Field {
    std::string name{};
    // Absent only for enum members.
    std::optional<std::string> type{};
    bool is_array{false};
    bool is_deprecated{false};
    // Enum member value, struct ordinal (1-based) or message wire id.
    std::int64_t id{0};

    // 1-based source position for text-parsed schemas, 0 otherwise.
    int line{0};
    int column{0};
};

struct Definition {
    std::string name{};
    DefinitionKind kind{DefinitionKind::Struct};
    std::vector<Field> fields{};

    int line{0};
    int column{0};
};

struct Schema {
    std::optional<std::string> package{};
    std::vector<Definition> definitions{};

    const Definition* find(const std::string& name) const;
};

// Structural equality ignores source positions.
bool operator==(const Field& a, const Field& b);
bool operator!=(const Field& a, const Field& b);
bool operator==(const Definition& a, const Definition& b);
bool operator!=(const Definition& a, const Definition& b);
bool operator==(const Schema& a, const Schema& b);
bool operator!=(const Schema& a, const Schema& b);

} // namespace figkiwi
