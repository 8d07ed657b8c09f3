#include "figkiwi/value.hpp"

#include "figkiwi/error.hpp"

#include <utility>

namespace figkiwi {

Value Value::make_null() {
    return Value{};
}

Value Value::make_bool(bool b) {
    Value v;
    v.v = b;
    return v;
}

Value Value::make_int(std::int64_t i) {
    Value v;
    v.v = i;
    return v;
}

Value Value::make_uint(std::uint64_t u) {
    Value v;
    v.v = u;
    return v;
}

Value Value::make_float(double d) {
    Value v;
    v.v = d;
    return v;
}

Value Value::make_string(std::string s) {
    Value v;
    v.v = std::move(s);
    return v;
}

Value Value::make_bytes(Bytes b) {
    Value v;
    v.v = std::move(b);
    return v;
}

Value Value::make_array(Array a) {
    Value v;
    v.v = std::move(a);
    return v;
}

Value Value::make_record() {
    Value v;
    v.v = Record{};
    return v;
}

Value Value::make_record(Record r) {
    Value v;
    v.v = std::move(r);
    return v;
}

bool Value::is_null() const noexcept { return std::holds_alternative<Null>(v); }
bool Value::is_bool() const noexcept { return std::holds_alternative<bool>(v); }
bool Value::is_integer() const noexcept {
    return std::holds_alternative<std::int64_t>(v) || std::holds_alternative<std::uint64_t>(v);
}
bool Value::is_float() const noexcept { return std::holds_alternative<double>(v); }
bool Value::is_string() const noexcept { return std::holds_alternative<std::string>(v); }
bool Value::is_bytes() const noexcept { return std::holds_alternative<Bytes>(v); }
bool Value::is_array() const noexcept { return std::holds_alternative<Array>(v); }
bool Value::is_record() const noexcept { return std::holds_alternative<Record>(v); }

static KiwiError mismatch(const Value& value, const char* wanted) {
    return KiwiError(ErrorKind::TypeMismatch,
                     std::string("value is ") + value.type_name() + ", expected " + wanted);
}

bool Value::as_bool() const {
    if (!is_bool()) throw mismatch(*this, "bool");
    return std::get<bool>(v);
}

std::int64_t Value::as_int() const {
    if (std::holds_alternative<std::int64_t>(v)) return std::get<std::int64_t>(v);
    if (std::holds_alternative<std::uint64_t>(v)) return static_cast<std::int64_t>(std::get<std::uint64_t>(v));
    throw mismatch(*this, "integer");
}

std::uint64_t Value::as_uint() const {
    if (std::holds_alternative<std::uint64_t>(v)) return std::get<std::uint64_t>(v);
    if (std::holds_alternative<std::int64_t>(v)) return static_cast<std::uint64_t>(std::get<std::int64_t>(v));
    throw mismatch(*this, "integer");
}

double Value::as_float() const {
    if (std::holds_alternative<double>(v)) return std::get<double>(v);
    if (std::holds_alternative<std::int64_t>(v)) return static_cast<double>(std::get<std::int64_t>(v));
    if (std::holds_alternative<std::uint64_t>(v)) return static_cast<double>(std::get<std::uint64_t>(v));
    throw mismatch(*this, "float");
}

const std::string& Value::as_string() const {
    if (!is_string()) throw mismatch(*this, "string");
    return std::get<std::string>(v);
}

const Bytes& Value::as_bytes() const {
    if (!is_bytes()) throw mismatch(*this, "bytes");
    return std::get<Bytes>(v);
}

const Value::Array& Value::as_array() const {
    if (!is_array()) throw mismatch(*this, "array");
    return std::get<Array>(v);
}

Value::Array& Value::as_array() {
    if (!is_array()) throw mismatch(*this, "array");
    return std::get<Array>(v);
}

const Value::Record& Value::as_record() const {
    if (!is_record()) throw mismatch(*this, "record");
    return std::get<Record>(v);
}

Value::Record& Value::as_record() {
    if (!is_record()) throw mismatch(*this, "record");
    return std::get<Record>(v);
}

const Value* Value::find(const std::string& key) const {
    if (!is_record()) return nullptr;
    const auto& r = std::get<Record>(v);
    auto it = r.find(key);
    return it == r.end() ? nullptr : &it->second;
}

const char* Value::type_name() const noexcept {
    switch (v.index()) {
        case 0: return "null";
        case 1: return "bool";
        case 2: return "int";
        case 3: return "uint";
        case 4: return "float";
        case 5: return "string";
        case 6: return "bytes";
        case 7: return "array";
        case 8: return "record";
        default: return "unknown";
    }
}

bool operator==(const Value& a, const Value& b) { return a.v == b.v; }

bool operator!=(const Value& a, const Value& b) { return !(a == b); }

} // namespace figkiwi
