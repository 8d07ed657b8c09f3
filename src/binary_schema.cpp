#include "figkiwi/binary_schema.hpp"

#include "figkiwi/error.hpp"

#include <iterator>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace figkiwi {

static constexpr DefinitionKind kKinds[] = {
    DefinitionKind::Enum,
    DefinitionKind::Struct,
    DefinitionKind::Message,
};
static constexpr std::uint8_t kFlagArray = 1u;

Schema decode_binary_schema(ByteStream& bb) {
    Schema schema;

    // Type codes stay raw until every definition is known.
    std::vector<std::vector<std::int32_t>> type_codes;

    std::uint32_t definition_count = bb.read_var_uint();
    for (std::uint32_t i = 0; i < definition_count; ++i) {
        Definition def;
        def.name = bb.read_string();

        std::size_t kind_at = bb.position();
        std::uint8_t kind_index = bb.read_byte();
        if (kind_index >= std::size(kKinds)) {
            std::ostringstream oss;
            oss << "invalid kind " << static_cast<int>(kind_index) << " for definition '" << def.name
                << "' at offset " << kind_at;
            throw KiwiError(ErrorKind::Corrupt, oss.str());
        }
        def.kind = kKinds[kind_index];

        std::uint32_t field_count = bb.read_var_uint();
        std::vector<std::int32_t> codes;
        for (std::uint32_t j = 0; j < field_count; ++j) {
            Field f;
            f.name = bb.read_string();
            std::int32_t code = bb.read_var_int();
            f.is_array = (bb.read_byte() & kFlagArray) != 0;
            f.id = bb.read_var_uint();
            codes.push_back(code);
            def.fields.push_back(std::move(f));
        }

        type_codes.push_back(std::move(codes));
        schema.definitions.push_back(std::move(def));
    }

    // Bind type names afterwards.
    const auto count = static_cast<std::int64_t>(schema.definitions.size());
    for (std::size_t i = 0; i < schema.definitions.size(); ++i) {
        auto& def = schema.definitions[i];
        if (def.kind == DefinitionKind::Enum) continue;

        for (std::size_t j = 0; j < def.fields.size(); ++j) {
            auto& f = def.fields[j];
            std::int32_t code = type_codes[i][j];
            if (code < 0) {
                std::int32_t native = ~code;
                if (native >= static_cast<std::int32_t>(kNativeTypeNames.size())) {
                    throw KiwiError(ErrorKind::UnknownType,
                                    "invalid type code " + std::to_string(code) + " for field '" + def.name + "." + f.name + "'");
                }
                f.type = kNativeTypeNames[static_cast<std::size_t>(native)];
            } else {
                if (code >= count) {
                    throw KiwiError(ErrorKind::UnknownType,
                                    "invalid type code " + std::to_string(code) + " for field '" + def.name + "." + f.name + "'");
                }
                f.type = schema.definitions[static_cast<std::size_t>(code)].name;
            }
        }
    }

    return schema;
}

Schema decode_binary_schema(const Bytes& bytes) {
    ByteStream bb(bytes);
    return decode_binary_schema(bb);
}

Schema decode_binary_schema(Bytes&& bytes) {
    ByteStream bb(std::move(bytes));
    return decode_binary_schema(bb);
}

Bytes encode_binary_schema(const Schema& schema) {
    ByteStream bb;
    const auto& definitions = schema.definitions;

    std::unordered_map<std::string, std::int32_t> definition_index;
    for (std::size_t i = 0; i < definitions.size(); ++i) {
        definition_index.emplace(definitions[i].name, static_cast<std::int32_t>(i));
    }

    bb.write_var_uint(static_cast<std::uint32_t>(definitions.size()));

    for (const auto& def : definitions) {
        bb.write_string(def.name);
        bb.write_byte(static_cast<std::uint8_t>(def.kind));
        bb.write_var_uint(static_cast<std::uint32_t>(def.fields.size()));

        for (const auto& f : def.fields) {
            bb.write_string(f.name);

            std::int32_t code = 0;
            if (def.kind != DefinitionKind::Enum) {
                const std::string type = f.type.value_or("");
                if (auto native = native_type_from_string(type)) {
                    code = ~static_cast<std::int32_t>(*native);
                } else {
                    auto it = definition_index.find(type);
                    if (it == definition_index.end()) {
                        throw KiwiError(ErrorKind::UnknownType,
                                        "type '" + type + "' of field '" + def.name + "." + f.name + "' is not defined");
                    }
                    code = it->second;
                }
            }
            bb.write_var_int(code);
            bb.write_byte(f.is_array ? kFlagArray : 0);
            bb.write_var_uint(static_cast<std::uint32_t>(f.id));
        }
    }

    return bb.to_bytes();
}

} // namespace figkiwi
