#include "figkiwi/binary_schema.hpp"
#include "figkiwi/fig_file.hpp"
#include "figkiwi/kiwi_easy.hpp"
#include "figkiwi/schema_parser.hpp"
#include "figkiwi/zlib_decompress.hpp"

#include "test_util.hpp"

#include <zlib.h>

#include <cstring>
#include <iostream>
#include <string>

using figkiwi::Bytes;
using figkiwi::Compression;
using figkiwi::ErrorKind;
using figkiwi::Value;

namespace easy = figkiwi::easy;

static Bytes zlib_compress(const Bytes& in, int level) {
    uLongf bound = ::compressBound(static_cast<uLong>(in.size()));
    Bytes out(bound);
    uLongf out_len = bound;
    int rc = ::compress2(reinterpret_cast<Bytef*>(out.data()), &out_len,
                         reinterpret_cast<const Bytef*>(in.data()),
                         static_cast<uLong>(in.size()),
                         level);
    CHECK(rc == Z_OK);
    out.resize(static_cast<std::size_t>(out_len));
    return out;
}

// Headerless deflate, as Figma writes the schema chunk.
static Bytes raw_deflate(const Bytes& in) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    CHECK(::deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY) == Z_OK);

    Bytes out(::deflateBound(&zs, static_cast<uLong>(in.size())));
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());
    zs.next_out = reinterpret_cast<Bytef*>(out.data());
    zs.avail_out = static_cast<uInt>(out.size());
    int rc = ::deflate(&zs, Z_FINISH);
    ::deflateEnd(&zs);
    CHECK(rc == Z_STREAM_END);
    out.resize(static_cast<std::size_t>(zs.total_out));
    return out;
}

static Bytes patterned(std::size_t n) {
    Bytes out(n);
    for (std::size_t i = 0; i < n; ++i) out[i] = static_cast<std::uint8_t>((i * 7) % 13);
    return out;
}

int main() {
    // Inflate both wrappings, including outputs far larger than the input
    {
        Bytes small = bytes_of({'k', 'i', 'w', 'i'});
        CHECK(figkiwi::zlib_inflate(zlib_compress(small, 6)) == small);
        CHECK(figkiwi::raw_inflate(raw_deflate(small)) == small);

        Bytes big = patterned(1u << 20);
        Bytes z = zlib_compress(big, 9);
        CHECK(z.size() * 4 < big.size());
        CHECK(figkiwi::zlib_inflate(z) == big);
        CHECK(figkiwi::raw_inflate(raw_deflate(big)) == big);

        Bytes nothing;
        CHECK(figkiwi::zlib_inflate(zlib_compress(nothing, 6)).empty());
    }

    // Bad streams
    {
        CHECK_THROWS_KIND(figkiwi::zlib_inflate(bytes_of({1, 2, 3, 4, 5})), ErrorKind::ZlibError);
        CHECK_THROWS_KIND(figkiwi::zlib_inflate(Bytes{}), ErrorKind::ZlibError);

        Bytes z = zlib_compress(patterned(4096), 6);
        z.resize(z.size() / 2);
        CHECK_THROWS_KIND(figkiwi::zlib_inflate(z), ErrorKind::ZlibError);

        // Fail after the output buffer has already grown several times, and
        // keep reusing the adapter afterwards.
        Bytes big = patterned(1u << 20);
        Bytes cut = zlib_compress(big, 9);
        cut.resize(cut.size() / 2);
        for (int round = 0; round < 200; ++round) {
            CHECK_THROWS_KIND(figkiwi::zlib_inflate(cut), ErrorKind::ZlibError);
            CHECK_THROWS_KIND(figkiwi::raw_inflate(bytes_of({0xFF, 0xFF, 0xFF})), ErrorKind::ZlibError);
        }
        CHECK(figkiwi::zlib_inflate(zlib_compress(big, 9)) == big);

        // A zlib header is not valid raw deflate.
        CHECK_THROWS_KIND(figkiwi::raw_inflate(zlib_compress(patterned(64), 6)), ErrorKind::ZlibError);
    }

    // Decompressor map
    {
        figkiwi::Decompressors d = figkiwi::zlib_decompressors();
        CHECK(d.count(Compression::Zlib) == 1);
        CHECK(d.count(Compression::Deflate) == 1);
        CHECK(d.count(Compression::Zstd) == 0);
    }

    // A .fig container the way Figma writes it: raw deflate schema, compressed data
    {
        figkiwi::Schema schema = figkiwi::parse_schema(
            "struct GUID { uint sessionID; uint localID; }\n"
            "message NodeChange { GUID guid = 1; string name = 2; float opacity = 3; }\n"
            "message Message { uint type = 1; NodeChange[] nodeChanges = 2; }\n");

        Value::Array nodes;
        for (std::uint64_t i = 0; i < 500; ++i) {
            nodes.push_back(easy::record({
                {"guid", easy::record({{"sessionID", easy::u(1)}, {"localID", easy::u(i)}})},
                {"name", easy::s("Rectangle " + std::to_string(i))},
                {"opacity", easy::f(0.5)},
            }));
        }
        Value message = easy::record({{"type", easy::u(1)}, {"nodeChanges", easy::array(nodes)}});

        Bytes schema_chunk = raw_deflate(figkiwi::encode_binary_schema(schema));
        Bytes data_chunk = zlib_compress(figkiwi::compile(schema)->encode("Message", message), 6);
        Bytes file = make_container("fig-kiwie", {schema_chunk, data_chunk});

        figkiwi::ContainerStructure st = figkiwi::parse_container_structure(file);
        CHECK(st.schema_chunk().compression == Compression::Deflate);
        CHECK(st.data_chunk().compression == Compression::Zlib);

        figkiwi::ParsedContainer parsed = figkiwi::parse_container(file, figkiwi::zlib_decompressors());
        CHECK(parsed.header.prelude == "fig-kiwie");
        CHECK(parsed.message == message);
        CHECK(parsed.node_changes().size() == 500);
        CHECK(parsed.node_changes()[499].find("name")->as_string() == "Rectangle 499");

        // Corrupt the compressed data chunk.
        Bytes damaged = make_container("fig-kiwie", {schema_chunk, bytes_of({0x78, 0x9C, 0xFF, 0xFF, 0xFF})});
        CHECK_THROWS_KIND(figkiwi::parse_container(damaged, figkiwi::zlib_decompressors()), ErrorKind::ZlibError);
    }

    std::cout << "All tests passed.\n";
    return 0;
}
