#pragma once

#include "figkiwi/byte_stream.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace figkiwi {

// ------------------------------
// Dynamic record model
// ------------------------------

struct Value {
    using Null = std::monostate;
    using Array = std::vector<Value>;
    // Keyed by field name and iterated in name order, not declaration or wire
    // order. Encoding always follows the schema's field order.
    using Record = std::map<std::string, Value>;

    std::variant<
        Null,
        bool,
        std::int64_t,
        std::uint64_t,
        double,
        std::string,
        Bytes,
        Array,
        Record
    > v;

    // Convenience constructors
    static Value make_null();
    static Value make_bool(bool b);
    static Value make_int(std::int64_t i);
    static Value make_uint(std::uint64_t u);
    static Value make_float(double d);
    static Value make_string(std::string s);
    static Value make_bytes(Bytes b);
    static Value make_array(Array a);
    static Value make_record();
    static Value make_record(Record r);

    bool is_null() const noexcept;
    bool is_bool() const noexcept;
    bool is_integer() const noexcept;
    bool is_float() const noexcept;
    bool is_string() const noexcept;
    bool is_bytes() const noexcept;
    bool is_array() const noexcept;
    bool is_record() const noexcept;

    // Accessors throw KiwiError(TypeMismatch) on the wrong alternative.
    bool as_bool() const;
    std::int64_t as_int() const;
    std::uint64_t as_uint() const;
    double as_float() const;
    const std::string& as_string() const;
    const Bytes& as_bytes() const;
    const Array& as_array() const;
    Array& as_array();
    const Record& as_record() const;
    Record& as_record();

    /// Record field lookup; null when absent or when this is not a record.
    const Value* find(const std::string& key) const;

    /// Name of the held alternative, for diagnostics.
    const char* type_name() const noexcept;
};

bool operator==(const Value& a, const Value& b);
bool operator!=(const Value& a, const Value& b);

} // namespace figkiwi
