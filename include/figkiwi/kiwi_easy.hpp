#pragma once

#include "figkiwi/value.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace figkiwi::easy {

// Short builders for hand-written records.
inline Value b(bool v) { return Value::make_bool(v); }
inline Value i(std::int64_t v) { return Value::make_int(v); }
inline Value u(std::uint64_t v) { return Value::make_uint(v); }
inline Value f(double v) { return Value::make_float(v); }
inline Value s(std::string v) { return Value::make_string(std::move(v)); }
inline Value bytes(Bytes v) { return Value::make_bytes(std::move(v)); }

inline Value array(std::initializer_list<Value> items) {
    return Value::make_array(Value::Array(items));
}

inline Value array(Value::Array items) {
    return Value::make_array(std::move(items));
}

inline Value record(std::initializer_list<std::pair<const std::string, Value>> fields) {
    return Value::make_record(Value::Record(fields));
}

inline void set(Value::Record& root, std::string key, Value v) {
    root[std::move(key)] = std::move(v);
}

// Enum-valued fields are plain member names.
inline Value enum_value(std::string name) {
    return Value::make_string(std::move(name));
}

} // namespace figkiwi::easy
