#include "figkiwi/compiled_schema.hpp"

#include "figkiwi/error.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace figkiwi {

// ------------------------------
// Diagnostics
// ------------------------------

static std::string field_path(const std::string& owner, const std::string& field) {
    return "'" + owner + "." + field + "'";
}

static KiwiError field_mismatch(const std::string& owner, const std::string& field, const Value& value,
                                const char* wanted) {
    return KiwiError(ErrorKind::TypeMismatch, "field " + field_path(owner, field) + " is " + value.type_name() +
                                                  ", expected " + wanted);
}

// ------------------------------
// Compilation
// ------------------------------

CompiledSchema::CompiledSchema(Schema schema) : schema_(std::move(schema)) {
    const auto& defs = schema_.definitions;
    definitions_.resize(defs.size());

    for (std::size_t i = 0; i < defs.size(); ++i) {
        by_name_.emplace(defs[i].name, i);
    }

    for (std::size_t i = 0; i < defs.size(); ++i) {
        const Definition& def = defs[i];
        CompiledDefinition& out = definitions_[i];
        out.name = def.name;
        out.kind = def.kind;

        if (def.kind == DefinitionKind::Enum) {
            for (const auto& member : def.fields) {
                const auto value = static_cast<std::uint32_t>(member.id);
                out.enum_values[member.name] = value;
                out.enum_names[value] = member.name;
            }
            continue;
        }

        out.fields.reserve(def.fields.size());
        for (const auto& f : def.fields) {
            CompiledField cf;
            cf.name = f.name;
            cf.id = static_cast<std::uint32_t>(f.id);
            cf.is_array = f.is_array;
            cf.is_deprecated = f.is_deprecated;

            const std::string type = f.type.value_or("");
            if (auto native = native_type_from_string(type)) {
                cf.type.is_native = true;
                cf.type.native = *native;
            } else {
                auto it = by_name_.find(type);
                if (it == by_name_.end()) {
                    throw KiwiError(ErrorKind::UnknownType,
                                    "type '" + type + "' of field " + field_path(def.name, f.name) + " is not defined");
                }
                cf.type.is_native = false;
                cf.type.definition = it->second;
            }

            // Later duplicates never win; the verifier rejects them anyway.
            out.field_by_id.emplace(cf.id, out.fields.size());
            out.fields.push_back(std::move(cf));
        }
    }
}

std::shared_ptr<const CompiledSchema> CompiledSchema::compile(Schema schema) {
    return std::make_shared<const CompiledSchema>(std::move(schema));
}

std::shared_ptr<const CompiledSchema> compile(Schema schema) {
    return CompiledSchema::compile(std::move(schema));
}

const Definition* CompiledSchema::find_definition(const std::string& name) const {
    auto it = by_name_.find(name);
    if (it == by_name_.end()) return nullptr;
    return &schema_.definitions[it->second];
}

const std::map<std::string, std::uint32_t>* CompiledSchema::enum_values(const std::string& enum_name) const {
    auto it = by_name_.find(enum_name);
    if (it == by_name_.end()) return nullptr;
    const auto& def = definitions_[it->second];
    return def.kind == DefinitionKind::Enum ? &def.enum_values : nullptr;
}

const std::map<std::uint32_t, std::string>* CompiledSchema::enum_names(const std::string& enum_name) const {
    auto it = by_name_.find(enum_name);
    if (it == by_name_.end()) return nullptr;
    const auto& def = definitions_[it->second];
    return def.kind == DefinitionKind::Enum ? &def.enum_names : nullptr;
}

const CompiledSchema::CompiledDefinition& CompiledSchema::root_definition(const std::string& type_name) const {
    auto it = by_name_.find(type_name);
    if (it == by_name_.end()) {
        throw KiwiError(ErrorKind::NotFound, "unknown type '" + type_name + "'");
    }
    const auto& def = definitions_[it->second];
    if (def.kind == DefinitionKind::Enum) {
        throw KiwiError(ErrorKind::TypeMismatch, "enum '" + type_name + "' cannot be used as a root type");
    }
    return def;
}

// ------------------------------
// Encoding
// ------------------------------

Bytes CompiledSchema::encode(const std::string& type_name, const Value& record) const {
    ByteStream bb;
    encode(type_name, record, bb);
    return bb.to_bytes();
}

void CompiledSchema::encode(const std::string& type_name, const Value& record, ByteStream& out) const {
    const auto& def = root_definition(type_name);
    if (!record.is_record()) {
        throw KiwiError(ErrorKind::TypeMismatch,
                        std::string("root value for '") + type_name + "' is " + record.type_name() + ", expected record");
    }
    encode_definition(out, def, record);
}

void CompiledSchema::encode_definition(ByteStream& bb, const CompiledDefinition& def, const Value& record) const {
    const auto& fields = record.as_record();

    if (def.kind == DefinitionKind::Message) {
        for (const auto& f : def.fields) {
            auto it = fields.find(f.name);
            if (it == fields.end() || it->second.is_null()) continue;
            bb.write_var_uint(f.id);
            encode_field(bb, def, f, it->second);
        }
        bb.write_var_uint(0);
        return;
    }

    for (const auto& f : def.fields) {
        auto it = fields.find(f.name);
        if (it == fields.end() || it->second.is_null()) {
            throw KiwiError(ErrorKind::MissingRequiredField, "missing required field " + field_path(def.name, f.name));
        }
        encode_field(bb, def, f, it->second);
    }
}

void CompiledSchema::encode_field(ByteStream& bb, const CompiledDefinition& owner, const CompiledField& field,
                                  const Value& value) const {
    if (!field.is_array) {
        encode_value(bb, owner, field, value);
        return;
    }

    if (field.type.is_native && field.type.native == NativeType::Byte) {
        if (!value.is_bytes()) throw field_mismatch(owner.name, field.name, value, "bytes");
        bb.write_byte_array(value.as_bytes());
        return;
    }

    if (!value.is_array()) throw field_mismatch(owner.name, field.name, value, "array");
    const auto& items = value.as_array();
    bb.write_var_uint(static_cast<std::uint32_t>(items.size()));
    for (const auto& item : items) {
        encode_value(bb, owner, field, item);
    }
}

void CompiledSchema::encode_value(ByteStream& bb, const CompiledDefinition& owner, const CompiledField& field,
                                  const Value& value) const {
    if (!field.type.is_native) {
        const auto& def = definitions_[field.type.definition];
        if (def.kind == DefinitionKind::Enum) {
            if (!value.is_string()) throw field_mismatch(owner.name, field.name, value, "enum name");
            auto it = def.enum_values.find(value.as_string());
            if (it == def.enum_values.end()) {
                throw KiwiError(ErrorKind::InvalidEnumValue, "invalid value '" + value.as_string() + "' for enum '" +
                                                                 def.name + "' in field " + field_path(owner.name, field.name));
            }
            bb.write_var_uint(it->second);
            return;
        }
        if (!value.is_record()) throw field_mismatch(owner.name, field.name, value, "record");
        encode_definition(bb, def, value);
        return;
    }

    switch (field.type.native) {
        case NativeType::Bool:
            if (!value.is_bool()) throw field_mismatch(owner.name, field.name, value, "bool");
            bb.write_bool(value.as_bool());
            return;
        case NativeType::Byte: {
            if (!value.is_integer()) throw field_mismatch(owner.name, field.name, value, "byte");
            bool in_range = std::holds_alternative<std::int64_t>(value.v)
                                ? (value.as_int() >= 0 && value.as_int() <= 0xFF)
                                : value.as_uint() <= 0xFFu;
            if (!in_range) {
                throw KiwiError(ErrorKind::TypeMismatch,
                                "value of field " + field_path(owner.name, field.name) + " is out of range for byte");
            }
            bb.write_byte(static_cast<std::uint8_t>(value.as_uint()));
            return;
        }
        case NativeType::Int:
            if (!value.is_integer()) throw field_mismatch(owner.name, field.name, value, "int");
            bb.write_var_int(static_cast<std::int32_t>(value.as_int()));
            return;
        case NativeType::Uint:
            if (!value.is_integer()) throw field_mismatch(owner.name, field.name, value, "uint");
            bb.write_var_uint(static_cast<std::uint32_t>(value.as_uint()));
            return;
        case NativeType::Int64:
            if (!value.is_integer()) throw field_mismatch(owner.name, field.name, value, "int64");
            bb.write_var_int64(value.as_int());
            return;
        case NativeType::Uint64:
            if (!value.is_integer()) throw field_mismatch(owner.name, field.name, value, "uint64");
            bb.write_var_uint64(value.as_uint());
            return;
        case NativeType::Float:
            if (!value.is_float() && !value.is_integer()) throw field_mismatch(owner.name, field.name, value, "float");
            bb.write_var_float(static_cast<float>(value.as_float()));
            return;
        case NativeType::String:
            if (!value.is_string()) throw field_mismatch(owner.name, field.name, value, "string");
            bb.write_string(value.as_string());
            return;
    }
}

// ------------------------------
// Decoding
// ------------------------------

Value CompiledSchema::decode(const std::string& type_name, const Bytes& bytes, const DecodeOptions& opts) const {
    ByteStream bb(bytes);
    return decode(type_name, bb, opts);
}

Value CompiledSchema::decode(const std::string& type_name, Bytes&& bytes, const DecodeOptions& opts) const {
    ByteStream bb(std::move(bytes));
    return decode(type_name, bb, opts);
}

Value CompiledSchema::decode(const std::string& type_name, ByteStream& in, const DecodeOptions& opts) const {
    const auto& def = root_definition(type_name);
    return decode_definition(in, def, opts, 0);
}

Value CompiledSchema::decode_definition(ByteStream& bb, const CompiledDefinition& def, const DecodeOptions& opts,
                                        std::size_t depth) const {
    if (depth > opts.max_depth) {
        std::ostringstream oss;
        oss << "nesting deeper than " << opts.max_depth << " while decoding '" << def.name << "' at offset "
            << bb.position();
        throw KiwiError(ErrorKind::Corrupt, oss.str());
    }

    Value::Record result;

    if (def.kind == DefinitionKind::Message) {
        while (true) {
            std::size_t id_at = bb.position();
            std::uint32_t id = bb.read_var_uint();
            if (id == 0) break;

            auto it = def.field_by_id.find(id);
            if (it == def.field_by_id.end()) {
                std::ostringstream oss;
                oss << "unknown field id " << id << " in message '" << def.name << "' at offset " << id_at;
                throw KiwiError(ErrorKind::UnknownField, oss.str());
            }

            const auto& f = def.fields[it->second];
            Value value = decode_field(bb, f, opts, depth);
            if (!f.is_deprecated) result[f.name] = std::move(value);
        }
        return Value::make_record(std::move(result));
    }

    for (const auto& f : def.fields) {
        result[f.name] = decode_field(bb, f, opts, depth);
    }
    return Value::make_record(std::move(result));
}

Value CompiledSchema::decode_field(ByteStream& bb, const CompiledField& field, const DecodeOptions& opts,
                                   std::size_t depth) const {
    if (!field.is_array) return decode_value(bb, field, opts, depth);

    if (field.type.is_native && field.type.native == NativeType::Byte) {
        return Value::make_bytes(bb.read_byte_array());
    }

    std::uint32_t count = bb.read_var_uint();
    Value::Array items;
    items.reserve(std::min<std::size_t>(count, bb.remaining()));
    for (std::uint32_t i = 0; i < count; ++i) {
        items.push_back(decode_value(bb, field, opts, depth));
    }
    return Value::make_array(std::move(items));
}

Value CompiledSchema::decode_value(ByteStream& bb, const CompiledField& field, const DecodeOptions& opts,
                                   std::size_t depth) const {
    if (!field.type.is_native) {
        const auto& def = definitions_[field.type.definition];
        if (def.kind == DefinitionKind::Enum) {
            std::size_t at = bb.position();
            std::uint32_t raw = bb.read_var_uint();
            auto it = def.enum_names.find(raw);
            if (it == def.enum_names.end()) {
                std::ostringstream oss;
                oss << "invalid value " << raw << " for enum '" << def.name << "' at offset " << at;
                throw KiwiError(ErrorKind::InvalidEnumValue, oss.str());
            }
            return Value::make_string(it->second);
        }
        return decode_definition(bb, def, opts, depth + 1);
    }

    switch (field.type.native) {
        case NativeType::Bool: return Value::make_bool(bb.read_bool());
        case NativeType::Byte: return Value::make_uint(bb.read_byte());
        case NativeType::Int: return Value::make_int(bb.read_var_int());
        case NativeType::Uint: return Value::make_uint(bb.read_var_uint());
        case NativeType::Int64: return Value::make_int(bb.read_var_int64());
        case NativeType::Uint64: return Value::make_uint(bb.read_var_uint64());
        case NativeType::Float: return Value::make_float(static_cast<double>(bb.read_var_float()));
        case NativeType::String: return Value::make_string(bb.read_string());
    }
    throw KiwiError(ErrorKind::Corrupt, "unhandled native type for field '" + field.name + "'");
}

} // namespace figkiwi
