#include "figkiwi/schema_parser.hpp"

#include "figkiwi/error.hpp"

#include <cctype>
#include <cstdint>
#include <limits>
#include <sstream>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace figkiwi {

static std::string quote(const std::string& s) {
    return "\"" + s + "\"";
}

// ------------------------------
// Tokenizer (internal)
// ------------------------------

namespace internal {

enum class TokenKind {
    Identifier,
    Integer,
    Punct,
    End,
};

struct Token {
    TokenKind kind{TokenKind::End};
    std::string text{};
    int line{0};
    int column{0};
};

class Tokenizer {
public:
    explicit Tokenizer(std::string_view s) : s_(s) {}

    std::vector<Token> tokenize() {
        std::vector<Token> out;
        while (true) {
            skip_ws_and_comments();
            if (pos_ >= s_.size()) break;
            out.push_back(next_token());
        }
        Token end;
        end.kind = TokenKind::End;
        end.line = line_;
        end.column = column_;
        out.push_back(std::move(end));
        return out;
    }

private:
    std::string_view s_;
    std::size_t pos_{0};
    int line_{1};
    int column_{1};

    char peek(std::size_t ahead = 0) const {
        return pos_ + ahead < s_.size() ? s_[pos_ + ahead] : '\0';
    }

    void advance() {
        if (s_[pos_] == '\n') {
            ++line_;
            column_ = 1;
        } else {
            ++column_;
        }
        ++pos_;
    }

    static bool is_ident_start(char c) {
        return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
    }

    static bool is_ident_char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    }

    static bool is_digit(char c) {
        return c >= '0' && c <= '9';
    }

    void skip_ws_and_comments() {
        while (pos_ < s_.size()) {
            char c = s_[pos_];
            if (c == ' ' || c == '\n' || c == '\r' || c == '\t') {
                advance();
                continue;
            }
            if (c == '/' && peek(1) == '/') {
                while (pos_ < s_.size() && s_[pos_] != '\n') advance();
                continue;
            }
            break;
        }
    }

    [[noreturn]] void syntax_error(std::size_t len) const {
        std::string part(s_.substr(pos_, len));
        throw SchemaError(ErrorKind::MalformedSyntax, "Syntax error " + quote(part), line_, column_);
    }

    Token take(TokenKind kind, std::size_t len) {
        Token t;
        t.kind = kind;
        t.text = std::string(s_.substr(pos_, len));
        t.line = line_;
        t.column = column_;
        for (std::size_t i = 0; i < len; ++i) advance();
        return t;
    }

    Token next_token() {
        char c = peek();

        if (is_ident_start(c)) {
            std::size_t n = 1;
            while (is_ident_char(peek(n))) ++n;
            return take(TokenKind::Identifier, n);
        }

        if (is_digit(c) || (c == '-' && is_digit(peek(1)))) {
            std::size_t n = 1;
            while (is_digit(peek(n))) ++n;
            // "12abc" is neither an integer nor an identifier.
            if (is_ident_char(peek(n))) {
                std::size_t bad = n;
                while (is_ident_char(peek(bad))) ++bad;
                syntax_error(bad);
            }
            return take(TokenKind::Integer, n);
        }

        if (c == '{' || c == '}' || c == ';' || c == '=') {
            return take(TokenKind::Punct, 1);
        }

        if (c == '[') {
            if (peek(1) == ']') return take(TokenKind::Punct, 2);
            static constexpr std::string_view kDeprecated = "[deprecated]";
            if (s_.substr(pos_, kDeprecated.size()) == kDeprecated) {
                return take(TokenKind::Punct, kDeprecated.size());
            }
        }

        syntax_error(1);
    }
};

class Parser {
public:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    Schema parse() {
        Schema schema;

        if (eat_word("package")) {
            const Token& name = current();
            expect_identifier();
            schema.package = name.text;
            expect_punct(";");
        }

        while (current().kind != TokenKind::End) {
            schema.definitions.push_back(parse_definition());
        }
        return schema;
    }

private:
    std::vector<Token> tokens_;
    std::size_t index_{0};

    const Token& current() const { return tokens_[index_]; }

    bool eat_word(const char* word) {
        const Token& t = current();
        if (t.kind == TokenKind::Identifier && t.text == word) {
            ++index_;
            return true;
        }
        return false;
    }

    bool eat_punct(const char* p) {
        const Token& t = current();
        if (t.kind == TokenKind::Punct && t.text == p) {
            ++index_;
            return true;
        }
        return false;
    }

    [[noreturn]] void expected(const std::string& what) const {
        const Token& t = current();
        throw SchemaError(ErrorKind::MalformedSyntax,
                          "Expected " + what + " but found " + quote(t.text), t.line, t.column);
    }

    void expect_identifier() {
        if (current().kind != TokenKind::Identifier) expected("identifier");
        ++index_;
    }

    void expect_punct(const char* p) {
        if (!eat_punct(p)) expected(quote(p));
    }

    std::int64_t expect_integer() {
        const Token& t = current();
        if (t.kind != TokenKind::Integer) expected("integer");

        std::string_view digits(t.text);
        bool negative = false;
        if (!digits.empty() && digits[0] == '-') {
            negative = true;
            digits.remove_prefix(1);
        }
        // Canonical form only: no leading zeros, no "-0".
        bool canonical = !digits.empty() && !(digits.size() > 1 && digits[0] == '0') &&
                         !(negative && digits == "0");
        std::int64_t v = 0;
        if (canonical && digits.size() <= 10) {
            for (char c : digits) v = v * 10 + (c - '0');
            if (negative) v = -v;
        }
        const std::int64_t lo = std::numeric_limits<std::int32_t>::min();
        const std::int64_t hi = std::numeric_limits<std::uint32_t>::max();
        if (!canonical || digits.size() > 10 || v < lo || v > hi) {
            throw SchemaError(ErrorKind::MalformedSyntax, "Invalid integer " + quote(t.text), t.line, t.column);
        }
        ++index_;
        return v;
    }

    Definition parse_definition() {
        Definition def;
        if (eat_word("enum")) {
            def.kind = DefinitionKind::Enum;
        } else if (eat_word("struct")) {
            def.kind = DefinitionKind::Struct;
        } else if (eat_word("message")) {
            def.kind = DefinitionKind::Message;
        } else {
            const Token& t = current();
            throw SchemaError(ErrorKind::MalformedSyntax, "Unexpected token " + quote(t.text), t.line, t.column);
        }

        const Token& name = current();
        expect_identifier();
        def.name = name.text;
        def.line = name.line;
        def.column = name.column;
        expect_punct("{");

        while (!eat_punct("}")) {
            def.fields.push_back(parse_field(def));
        }
        return def;
    }

    Field parse_field(const Definition& def) {
        Field field;

        // Enums don't have types.
        if (def.kind != DefinitionKind::Enum) {
            const Token& type = current();
            expect_identifier();
            field.type = type.text;
            field.is_array = eat_punct("[]");
        }

        const Token& name = current();
        expect_identifier();
        field.name = name.text;
        field.line = name.line;
        field.column = name.column;

        switch (def.kind) {
            case DefinitionKind::Enum:
                if (eat_punct("=")) {
                    field.id = expect_integer();
                } else {
                    field.id = def.fields.empty() ? 0 : def.fields.back().id + 1;
                }
                break;
            case DefinitionKind::Struct:
                field.id = static_cast<std::int64_t>(def.fields.size()) + 1;
                break;
            case DefinitionKind::Message:
                expect_punct("=");
                field.id = expect_integer();
                break;
        }

        const Token& deprecated = current();
        if (eat_punct("[deprecated]")) {
            if (def.kind != DefinitionKind::Message) {
                throw SchemaError(ErrorKind::SemanticError, "Cannot deprecate this field",
                                  deprecated.line, deprecated.column);
            }
            field.is_deprecated = true;
        }

        expect_punct(";");
        return field;
    }
};

} // namespace internal

// ------------------------------
// Verification
// ------------------------------

static void check_fields(const Definition& def,
                         const std::unordered_map<std::string, std::size_t>& index,
                         const VerifyOptions& opts) {
    std::unordered_set<std::string> names;
    for (const auto& f : def.fields) {
        if (!names.insert(f.name).second) {
            throw SchemaError(ErrorKind::SemanticError,
                              "The field " + quote(f.name) + " is defined twice in " + quote(def.name),
                              f.line, f.column);
        }
        if (f.is_deprecated && def.kind != DefinitionKind::Message) {
            throw SchemaError(ErrorKind::SemanticError,
                              "Cannot deprecate field " + quote(f.name) + " of " + quote(def.name), f.line, f.column);
        }
    }

    if (def.kind == DefinitionKind::Enum || def.fields.empty()) return;

    for (const auto& f : def.fields) {
        if (!f.type) {
            throw SchemaError(ErrorKind::SemanticError,
                              "The field " + quote(f.name) + " has no type", f.line, f.column);
        }
        if (!is_native_type_name(*f.type) && index.find(*f.type) == index.end()) {
            throw SchemaError(ErrorKind::SemanticError,
                              "The type " + quote(*f.type) + " is not defined for field " + quote(f.name),
                              f.line, f.column);
        }
    }

    const auto count = static_cast<std::int64_t>(def.fields.size());
    std::unordered_set<std::int64_t> ids;
    for (const auto& f : def.fields) {
        if (!ids.insert(f.id).second) {
            throw SchemaError(ErrorKind::SemanticError,
                              "The id for field " + quote(f.name) + " is used twice", f.line, f.column);
        }
        if (f.id <= 0) {
            throw SchemaError(ErrorKind::SemanticError,
                              "The id for field " + quote(f.name) + " must be positive", f.line, f.column);
        }
        if (opts.enforce_id_upper_bound && f.id > count) {
            throw SchemaError(ErrorKind::SemanticError,
                              "The id for field " + quote(f.name) + " cannot be larger than " + std::to_string(count),
                              f.line, f.column);
        }
    }
}

// Iterative 3-color DFS over struct definitions following non-array fields.
static void check_struct_nesting(const Schema& schema,
                                 const std::unordered_map<std::string, std::size_t>& index) {
    enum : std::uint8_t { kUnvisited = 0, kVisiting = 1, kDone = 2 };

    const auto& defs = schema.definitions;
    std::vector<std::uint8_t> color(defs.size(), kUnvisited);

    struct Frame {
        std::size_t def;
        std::size_t next_field;
    };
    std::vector<Frame> stack;

    auto struct_index = [&](const Field& f) -> std::size_t {
        if (f.is_array || !f.type) return defs.size();
        auto it = index.find(*f.type);
        if (it == index.end() || defs[it->second].kind != DefinitionKind::Struct) return defs.size();
        return it->second;
    };

    for (std::size_t root = 0; root < defs.size(); ++root) {
        if (defs[root].kind != DefinitionKind::Struct || color[root] != kUnvisited) continue;

        color[root] = kVisiting;
        stack.push_back(Frame{root, 0});

        while (!stack.empty()) {
            Frame& top = stack.back();
            const auto& fields = defs[top.def].fields;
            if (top.next_field == fields.size()) {
                color[top.def] = kDone;
                stack.pop_back();
                continue;
            }
            std::size_t target = struct_index(fields[top.next_field++]);
            if (target == defs.size()) continue;

            if (color[target] == kVisiting) {
                const auto& d = defs[target];
                throw SchemaError(ErrorKind::SemanticError,
                                  "Recursive nesting of " + quote(d.name) + " is not allowed", d.line, d.column);
            }
            if (color[target] == kUnvisited) {
                color[target] = kVisiting;
                stack.push_back(Frame{target, 0});
            }
        }
    }
}

void verify_schema(const Schema& schema, const VerifyOptions& opts) {
    std::unordered_map<std::string, std::size_t> index;

    for (std::size_t i = 0; i < schema.definitions.size(); ++i) {
        const auto& d = schema.definitions[i];
        if (is_native_type_name(d.name) || index.find(d.name) != index.end()) {
            throw SchemaError(ErrorKind::SemanticError,
                              "The type " + quote(d.name) + " is defined twice", d.line, d.column);
        }
        if (is_reserved_name(d.name)) {
            throw SchemaError(ErrorKind::SemanticError,
                              "The type name " + quote(d.name) + " is reserved", d.line, d.column);
        }
        index.emplace(d.name, i);
    }

    for (const auto& d : schema.definitions) {
        check_fields(d, index, opts);
    }

    check_struct_nesting(schema, index);
}

Schema parse_schema(const std::string& text) {
    internal::Tokenizer tokenizer(text);
    internal::Parser parser(tokenizer.tokenize());
    Schema schema = parser.parse();
    verify_schema(schema, VerifyOptions{});
    return schema;
}

// ------------------------------
// Printer
// ------------------------------

std::string pretty_print(const Schema& schema) {
    std::ostringstream text;

    if (schema.package) {
        text << "package " << *schema.package << ";\n";
    }

    for (std::size_t i = 0; i < schema.definitions.size(); ++i) {
        const auto& d = schema.definitions[i];
        if (i > 0 || schema.package) text << '\n';
        text << to_string(d.kind) << ' ' << d.name << " {\n";

        for (const auto& f : d.fields) {
            text << "  ";
            if (d.kind != DefinitionKind::Enum) {
                text << f.type.value_or("");
                if (f.is_array) text << "[]";
                text << ' ';
            }
            text << f.name;
            if (d.kind != DefinitionKind::Struct) {
                text << " = " << f.id;
            }
            if (f.is_deprecated) {
                text << " [deprecated]";
            }
            text << ";\n";
        }

        text << "}\n";
    }

    return text.str();
}

} // namespace figkiwi
