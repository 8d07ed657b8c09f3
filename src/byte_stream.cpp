#include "figkiwi/byte_stream.hpp"

#include "figkiwi/error.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <sstream>
#include <utility>

namespace figkiwi {

static constexpr std::size_t kInitialCapacity = 256;
static constexpr std::uint32_t kCanonicalNaN = 0x7FC00000u;

ByteStream::ByteStream() : data_(kInitialCapacity) {}

ByteStream::ByteStream(Bytes data) : data_(std::move(data)) {
    length_ = data_.size();
}

void ByteStream::require(std::size_t count, const char* what) const {
    if (count > length_ - index_) {
        std::ostringstream oss;
        oss << "truncated " << what << ": need " << count << " byte(s) at offset " << index_
            << ", only " << (length_ - index_) << " available";
        throw KiwiError(ErrorKind::Truncated, oss.str());
    }
}

std::uint8_t* ByteStream::grow_by(std::size_t amount) {
    if (length_ + amount > data_.size()) {
        std::size_t cap = data_.empty() ? kInitialCapacity : data_.size();
        while (cap < length_ + amount) cap <<= 1;
        data_.resize(cap);
    }
    std::uint8_t* out = data_.data() + length_;
    length_ += amount;
    return out;
}

Bytes ByteStream::to_bytes() const {
    return Bytes(data_.begin(), data_.begin() + static_cast<std::ptrdiff_t>(length_));
}

// ------------------------------
// Reading
// ------------------------------

std::uint8_t ByteStream::read_byte() {
    require(1, "byte");
    return data_[index_++];
}

bool ByteStream::read_bool() {
    return read_byte() != 0;
}

Bytes ByteStream::read_byte_array() {
    std::size_t at = index_;
    std::uint32_t len = read_var_uint();
    if (len > remaining()) {
        std::ostringstream oss;
        oss << "byte array of length " << len << " at offset " << at << " overruns the buffer";
        throw KiwiError(ErrorKind::Truncated, oss.str());
    }
    auto first = data_.begin() + static_cast<std::ptrdiff_t>(index_);
    Bytes out(first, first + static_cast<std::ptrdiff_t>(len));
    index_ += len;
    return out;
}

std::uint32_t ByteStream::read_var_uint() {
    std::uint64_t value = 0;
    unsigned shift = 0;
    std::uint8_t b = 0;
    do {
        b = read_byte();
        value |= static_cast<std::uint64_t>(b & 127u) << shift;
        shift += 7;
    } while ((b & 128u) != 0 && shift < 35);
    return static_cast<std::uint32_t>(value & 0xFFFFFFFFu);
}

std::int32_t ByteStream::read_var_int() {
    std::uint32_t u = read_var_uint();
    return (u & 1u) != 0 ? ~static_cast<std::int32_t>(u >> 1) : static_cast<std::int32_t>(u >> 1);
}

std::uint64_t ByteStream::read_var_uint64() {
    std::uint64_t value = 0;
    unsigned shift = 0;
    std::uint8_t b = 0;
    do {
        b = read_byte();
        value |= static_cast<std::uint64_t>(b & 127u) << shift;
        shift += 7;
    } while ((b & 128u) != 0 && shift < 70);
    return value;
}

std::int64_t ByteStream::read_var_int64() {
    std::uint64_t u = read_var_uint64();
    return (u & 1u) != 0 ? ~static_cast<std::int64_t>(u >> 1) : static_cast<std::int64_t>(u >> 1);
}

float ByteStream::read_var_float() {
    require(1, "float");
    if (data_[index_] == 0) {
        ++index_;
        return 0.0f;
    }
    require(4, "float");
    const std::uint8_t* p = data_.data() + index_;
    std::uint32_t rotated = (static_cast<std::uint32_t>(p[0])      ) |
                            (static_cast<std::uint32_t>(p[1]) <<  8) |
                            (static_cast<std::uint32_t>(p[2]) << 16) |
                            (static_cast<std::uint32_t>(p[3]) << 24);
    index_ += 4;

    // Move the exponent back into place.
    std::uint32_t bits = (rotated << 23) | (rotated >> 9);
    float out = 0.0f;
    std::memcpy(&out, &bits, sizeof(out));
    return out;
}

std::string ByteStream::read_string() {
    auto first = data_.begin() + static_cast<std::ptrdiff_t>(index_);
    auto last = data_.begin() + static_cast<std::ptrdiff_t>(length_);
    auto nul = std::find(first, last, std::uint8_t{0});
    if (nul == last) {
        std::ostringstream oss;
        oss << "unterminated string at offset " << index_;
        throw KiwiError(ErrorKind::Truncated, oss.str());
    }
    std::string out(first, nul);
    index_ = static_cast<std::size_t>(nul - data_.begin()) + 1;
    return out;
}

// ------------------------------
// Writing
// ------------------------------

void ByteStream::write_byte(std::uint8_t v) {
    *grow_by(1) = v;
}

void ByteStream::write_bool(bool v) {
    write_byte(v ? 1 : 0);
}

void ByteStream::write_byte_array(const Bytes& v) {
    write_var_uint(static_cast<std::uint32_t>(v.size()));
    if (v.empty()) return;
    std::memcpy(grow_by(v.size()), v.data(), v.size());
}

void ByteStream::write_var_uint(std::uint32_t v) {
    do {
        std::uint8_t b = static_cast<std::uint8_t>(v & 127u);
        v >>= 7;
        write_byte(v != 0 ? static_cast<std::uint8_t>(b | 128u) : b);
    } while (v != 0);
}

void ByteStream::write_var_int(std::int32_t v) {
    write_var_uint((static_cast<std::uint32_t>(v) << 1) ^ static_cast<std::uint32_t>(v >> 31));
}

void ByteStream::write_var_uint64(std::uint64_t v) {
    do {
        std::uint8_t b = static_cast<std::uint8_t>(v & 127u);
        v >>= 7;
        write_byte(v != 0 ? static_cast<std::uint8_t>(b | 128u) : b);
    } while (v != 0);
}

void ByteStream::write_var_int64(std::int64_t v) {
    write_var_uint64((static_cast<std::uint64_t>(v) << 1) ^ static_cast<std::uint64_t>(v >> 63));
}

void ByteStream::write_var_float(float v) {
    std::uint32_t bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    if (std::isnan(v)) bits = kCanonicalNaN;

    // Move the exponent to the first 8 bits.
    std::uint32_t rotated = (bits >> 23) | (bits << 9);

    // Zero and subnormals share the single-byte form.
    if ((rotated & 255u) == 0) {
        write_byte(0);
        return;
    }

    std::uint8_t* p = grow_by(4);
    p[0] = static_cast<std::uint8_t>(rotated & 0xFFu);
    p[1] = static_cast<std::uint8_t>((rotated >> 8) & 0xFFu);
    p[2] = static_cast<std::uint8_t>((rotated >> 16) & 0xFFu);
    p[3] = static_cast<std::uint8_t>((rotated >> 24) & 0xFFu);
}

void ByteStream::write_string(const std::string& v) {
    if (v.find('\0') != std::string::npos) {
        throw KiwiError(ErrorKind::InvalidStringContent, "cannot encode a string containing the null character");
    }
    std::uint8_t* p = grow_by(v.size() + 1);
    if (!v.empty()) std::memcpy(p, v.data(), v.size());
    p[v.size()] = 0;
}

} // namespace figkiwi
