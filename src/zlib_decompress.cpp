#include "figkiwi/zlib_decompress.hpp"

#include "figkiwi/error.hpp"

#include <zlib.h>

#include <cstring>
#include <limits>
#include <sstream>
#include <string>

namespace figkiwi {

static constexpr int kZlibWindowBits = 15;
static constexpr int kRawWindowBits = -15;
static constexpr std::size_t kMinOutput = 4096;

namespace {

// Owns an inflate stream; inflateEnd runs on every exit path.
class InflateStream {
public:
    InflateStream(int window_bits, const char* what) {
        std::memset(&zs_, 0, sizeof(zs_));
        if (::inflateInit2(&zs_, window_bits) != Z_OK) {
            throw KiwiError(ErrorKind::ZlibError, std::string(what) + " inflateInit2 failed");
        }
    }
    ~InflateStream() { ::inflateEnd(&zs_); }

    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;

    z_stream* get() noexcept { return &zs_; }

private:
    z_stream zs_;
};

} // namespace

// Streaming inflate. The output buffer starts at a multiple of the input and
// doubles whenever zlib fills it.
static Bytes inflate_bytes(const Bytes& in, int window_bits, const char* what) {
    if (in.size() > static_cast<std::size_t>((std::numeric_limits<uInt>::max)())) {
        throw KiwiError(ErrorKind::ZlibError, std::string(what) + " input too large");
    }

    InflateStream stream(window_bits, what);
    z_stream& zs = *stream.get();

    Bytes out(in.size() * 4 < kMinOutput ? kMinOutput : in.size() * 4);
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());

    std::size_t produced = 0;
    while (true) {
        if (produced == out.size()) out.resize(out.size() * 2);
        std::size_t room = out.size() - produced;
        if (room > static_cast<std::size_t>((std::numeric_limits<uInt>::max)())) {
            room = static_cast<std::size_t>((std::numeric_limits<uInt>::max)());
        }
        zs.next_out = reinterpret_cast<Bytef*>(out.data() + produced);
        zs.avail_out = static_cast<uInt>(room);

        int rc = ::inflate(&zs, Z_NO_FLUSH);
        produced += room - zs.avail_out;

        if (rc == Z_STREAM_END) break;
        if (rc == Z_BUF_ERROR && zs.avail_in == 0) {
            throw KiwiError(ErrorKind::ZlibError, std::string(what) + " stream is truncated");
        }
        if (rc != Z_OK && rc != Z_BUF_ERROR) {
            std::ostringstream oss;
            oss << what << " inflate failed (" << rc << ")";
            if (zs.msg) oss << ": " << zs.msg;
            throw KiwiError(ErrorKind::ZlibError, oss.str());
        }
    }

    out.resize(produced);
    return out;
}

Bytes zlib_inflate(const Bytes& in) {
    return inflate_bytes(in, kZlibWindowBits, "zlib");
}

Bytes raw_inflate(const Bytes& in) {
    return inflate_bytes(in, kRawWindowBits, "deflate");
}

Decompressors zlib_decompressors() {
    Decompressors d;
    d[Compression::Zlib] = zlib_inflate;
    d[Compression::Deflate] = raw_inflate;
    return d;
}

} // namespace figkiwi
