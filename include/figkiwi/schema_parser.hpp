#pragma once

#include "figkiwi/schema.hpp"

#include <string>

namespace figkiwi {

struct VerifyOptions {
    // Reject message/struct field ids larger than the definition's field count.
    bool enforce_id_upper_bound{true};
};

/// Parse and verify schema text. Throws SchemaError with kind MalformedSyntax
/// (tokenizer/grammar) or SemanticError (verification), both located.
Schema parse_schema(const std::string& text);

/// Check the schema invariants: unique, non-native, non-reserved definition
/// names; unique field names; resolvable field types; unique positive field
/// ids; no struct containing itself through non-array fields.
void verify_schema(const Schema& schema, const VerifyOptions& opts = VerifyOptions{});

/// Render a schema back to text that parse_schema accepts.
std::string pretty_print(const Schema& schema);

} // namespace figkiwi
