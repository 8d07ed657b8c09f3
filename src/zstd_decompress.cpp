#include "figkiwi/zstd_decompress.hpp"

#include "figkiwi/error.hpp"

#include <zstd.h>

#include <memory>
#include <string>

namespace figkiwi {

// Frames claiming more than this are streamed instead of trusting the header.
static constexpr unsigned long long kMaxOneShotSize = 1ull << 30;

namespace {

struct DCtxDeleter {
    void operator()(ZSTD_DCtx* ctx) const { ZSTD_freeDCtx(ctx); }
};

} // namespace

static KiwiError zstd_error(const std::string& what, std::size_t code) {
    return KiwiError(ErrorKind::ZstdError, "zstd " + what + ": " + ZSTD_getErrorName(code));
}

static Bytes stream_decompress(const Bytes& in) {
    std::unique_ptr<ZSTD_DCtx, DCtxDeleter> ctx(ZSTD_createDCtx());
    if (!ctx) throw KiwiError(ErrorKind::ZstdError, "zstd: failed to create decompression context");

    Bytes out;
    Bytes chunk(ZSTD_DStreamOutSize());
    ZSTD_inBuffer input{in.data(), in.size(), 0};
    std::size_t last = 0;

    while (true) {
        ZSTD_outBuffer output{chunk.data(), chunk.size(), 0};
        last = ZSTD_decompressStream(ctx.get(), &output, &input);
        if (ZSTD_isError(last)) throw zstd_error("decompression failed", last);
        out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(output.pos));

        // A full output buffer may leave data pending inside the context.
        if (input.pos == input.size && output.pos < output.size) break;
    }

    if (last != 0) {
        throw KiwiError(ErrorKind::ZstdError, "zstd stream is truncated after " + std::to_string(in.size()) + " bytes");
    }
    return out;
}

Bytes zstd_decompress(const Bytes& in) {
    unsigned long long size = ZSTD_getFrameContentSize(in.data(), in.size());
    if (size == ZSTD_CONTENTSIZE_ERROR) {
        throw KiwiError(ErrorKind::ZstdError, "zstd: input is not a zstd frame");
    }

    if (size != ZSTD_CONTENTSIZE_UNKNOWN && size <= kMaxOneShotSize &&
        ZSTD_findFrameCompressedSize(in.data(), in.size()) == in.size()) {
        Bytes out(static_cast<std::size_t>(size));
        std::size_t rc = ZSTD_decompress(out.data(), out.size(), in.data(), in.size());
        if (ZSTD_isError(rc)) throw zstd_error("decompression failed", rc);
        if (rc != out.size()) {
            throw KiwiError(ErrorKind::ZstdError, "zstd frame declared " + std::to_string(out.size()) +
                                                      " bytes but produced " + std::to_string(rc));
        }
        return out;
    }

    return stream_decompress(in);
}

Decompressors zstd_decompressors() {
    Decompressors d;
    d[Compression::Zstd] = zstd_decompress;
    return d;
}

} // namespace figkiwi
