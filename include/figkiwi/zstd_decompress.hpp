#pragma once

#include "figkiwi/byte_stream.hpp"
#include "figkiwi/fig_file.hpp"

namespace figkiwi {

/// Decompress one or more concatenated zstd frames. Frames that record their
/// content size are decoded in one call; others are streamed.
Bytes zstd_decompress(const Bytes& in);

/// Decompressor for Compression::Zstd only. Merge with zlib_decompressors()
/// to cover every chunk kind Figma writes.
Decompressors zstd_decompressors();

} // namespace figkiwi
