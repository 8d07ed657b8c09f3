#pragma once

#include "figkiwi/byte_stream.hpp"
#include "figkiwi/schema.hpp"
#include "figkiwi/value.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace figkiwi {

struct DecodeOptions {
    // Maximum nesting of struct/message values below the root record.
    std::size_t max_depth{512};
};

/// Immutable encode/decode tables built once from a schema.
///
/// All member functions are const and touch no shared mutable state, so one
/// instance can serve concurrent encode/decode calls from many threads.
class CompiledSchema {
public:
    /// Throws KiwiError(UnknownType) if a field type does not resolve.
    explicit CompiledSchema(Schema schema);

    static std::shared_ptr<const CompiledSchema> compile(Schema schema);

    const Schema& schema() const noexcept { return schema_; }

    /// Encode a record as the named struct or message.
    Bytes encode(const std::string& type_name, const Value& record) const;
    void encode(const std::string& type_name, const Value& record, ByteStream& out) const;

    /// Decode the named struct or message from the start of `bytes`.
    Value decode(const std::string& type_name, const Bytes& bytes,
                 const DecodeOptions& opts = DecodeOptions{}) const;
    /// Takes ownership of `bytes` instead of copying them.
    Value decode(const std::string& type_name, Bytes&& bytes,
                 const DecodeOptions& opts = DecodeOptions{}) const;
    Value decode(const std::string& type_name, ByteStream& in,
                 const DecodeOptions& opts = DecodeOptions{}) const;

    const Definition* find_definition(const std::string& name) const;

    // Enum lookup tables; null when `enum_name` is not an enum.
    const std::map<std::string, std::uint32_t>* enum_values(const std::string& enum_name) const;
    const std::map<std::uint32_t, std::string>* enum_names(const std::string& enum_name) const;

private:
    struct TypeRef {
        bool is_native{true};
        NativeType native{NativeType::Bool};
        std::size_t definition{0};
    };

    struct CompiledField {
        std::string name{};
        std::uint32_t id{0};
        bool is_array{false};
        bool is_deprecated{false};
        TypeRef type{};
    };

    struct CompiledDefinition {
        std::string name{};
        DefinitionKind kind{DefinitionKind::Struct};
        std::vector<CompiledField> fields{};
        std::unordered_map<std::uint32_t, std::size_t> field_by_id{};
        std::map<std::string, std::uint32_t> enum_values{};
        std::map<std::uint32_t, std::string> enum_names{};
    };

    Schema schema_;
    std::vector<CompiledDefinition> definitions_;
    std::unordered_map<std::string, std::size_t> by_name_;

    const CompiledDefinition& root_definition(const std::string& type_name) const;

    void encode_definition(ByteStream& bb, const CompiledDefinition& def, const Value& record) const;
    void encode_field(ByteStream& bb, const CompiledDefinition& owner, const CompiledField& field,
                      const Value& value) const;
    void encode_value(ByteStream& bb, const CompiledDefinition& owner, const CompiledField& field,
                      const Value& value) const;

    Value decode_definition(ByteStream& bb, const CompiledDefinition& def, const DecodeOptions& opts,
                            std::size_t depth) const;
    Value decode_field(ByteStream& bb, const CompiledField& field, const DecodeOptions& opts,
                       std::size_t depth) const;
    Value decode_value(ByteStream& bb, const CompiledField& field, const DecodeOptions& opts,
                       std::size_t depth) const;
};

/// Compile a schema into shareable encode/decode tables.
std::shared_ptr<const CompiledSchema> compile(Schema schema);

} // namespace figkiwi
