#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace figkiwi {

using Bytes = std::vector<std::uint8_t>;

/// Cursor-based reader/writer over an owned, growable byte buffer.
///
/// Writes append at the logical end and grow the backing storage by doubling.
/// Reads advance a separate cursor and throw KiwiError(Truncated) when they
/// would pass the logical end. Multi-byte values are little-endian.
class ByteStream {
public:
    ByteStream();
    explicit ByteStream(Bytes data);

    // Reading
    std::uint8_t read_byte();
    bool read_bool();
    Bytes read_byte_array();
    std::uint32_t read_var_uint();
    std::int32_t read_var_int();
    std::uint64_t read_var_uint64();
    std::int64_t read_var_int64();
    float read_var_float();
    std::string read_string();

    // Writing
    void write_byte(std::uint8_t v);
    void write_bool(bool v);
    void write_byte_array(const Bytes& v);
    void write_var_uint(std::uint32_t v);
    void write_var_int(std::int32_t v);
    void write_var_uint64(std::uint64_t v);
    void write_var_int64(std::int64_t v);
    void write_var_float(float v);
    void write_string(const std::string& v);

    std::size_t position() const noexcept { return index_; }
    std::size_t size() const noexcept { return length_; }
    std::size_t remaining() const noexcept { return length_ - index_; }

    /// Copy of the logical contents (not the spare capacity).
    Bytes to_bytes() const;

private:
    Bytes data_;
    std::size_t length_{0};
    std::size_t index_{0};

    std::uint8_t* grow_by(std::size_t amount);
    void require(std::size_t count, const char* what) const;
};

} // namespace figkiwi
