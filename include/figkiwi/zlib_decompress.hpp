#pragma once

#include "figkiwi/byte_stream.hpp"
#include "figkiwi/fig_file.hpp"

namespace figkiwi {

/// Inflate a zlib-wrapped stream (RFC 1950).
Bytes zlib_inflate(const Bytes& in);

/// Inflate headerless deflate data (RFC 1951), as Figma uses for the schema chunk.
Bytes raw_inflate(const Bytes& in);

/// Decompressors for Compression::Zlib and Compression::Deflate. Zstd lives in
/// zstd_decompress.hpp.
Decompressors zlib_decompressors();

} // namespace figkiwi
