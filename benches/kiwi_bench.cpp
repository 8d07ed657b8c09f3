#include "figkiwi/binary_schema.hpp"
#include "figkiwi/fig_file.hpp"
#include "figkiwi/kiwi_easy.hpp"
#include "figkiwi/schema_parser.hpp"
#include "figkiwi/zlib_decompress.hpp"

#include <zlib.h>

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using figkiwi::Bytes;
using figkiwi::Value;

namespace easy = figkiwi::easy;

static const char* kBenchSchema = R"(
enum NodeType { DOCUMENT = 0; CANVAS = 1; FRAME = 2; RECTANGLE = 3; TEXT = 4; }
struct GUID { uint sessionID; uint localID; }
struct Color { float r; float g; float b; float a; }
struct Vector { float x; float y; }
message Paint { Color color = 1; float opacity = 2; bool visible = 3; }
message NodeChange {
  GUID guid = 1;
  GUID parent = 2;
  NodeType type = 3;
  string name = 4;
  Vector size = 5;
  Paint[] fillPaints = 6;
  int64 revision = 7;
  byte[] hash = 8;
}
message Message { uint type = 1; uint sessionID = 2; NodeChange[] nodeChanges = 3; }
)";

static double ms_since(const std::chrono::high_resolution_clock::time_point& t0) {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(high_resolution_clock::now() - t0).count();
}

static Bytes zlib_compress(const Bytes& in, int level) {
    uLongf bound = ::compressBound(static_cast<uLong>(in.size()));
    Bytes out(bound);
    uLongf out_len = bound;
    int rc = ::compress2(reinterpret_cast<Bytef*>(out.data()), &out_len,
                         reinterpret_cast<const Bytef*>(in.data()),
                         static_cast<uLong>(in.size()),
                         level);
    if (rc != Z_OK) throw std::runtime_error("zlib compress2 failed");
    out.resize(static_cast<std::size_t>(out_len));
    return out;
}

static Bytes raw_deflate(const Bytes& in) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    if (::deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }
    Bytes out(::deflateBound(&zs, static_cast<uLong>(in.size())));
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());
    zs.next_out = reinterpret_cast<Bytef*>(out.data());
    zs.avail_out = static_cast<uInt>(out.size());
    int rc = ::deflate(&zs, Z_FINISH);
    ::deflateEnd(&zs);
    if (rc != Z_STREAM_END) throw std::runtime_error("raw deflate failed");
    out.resize(static_cast<std::size_t>(zs.total_out));
    return out;
}

static Bytes container(const Bytes& schema_chunk, const Bytes& data_chunk) {
    Bytes out{'f', 'i', 'g', '-', 'k', 'i', 'w', 'i'};
    for (const Bytes* c : {&schema_chunk, &data_chunk}) {
        auto n = static_cast<std::uint32_t>(c->size());
        for (int shift = 0; shift < 32; shift += 8) out.push_back(static_cast<std::uint8_t>((n >> shift) & 0xFFu));
        out.insert(out.end(), c->begin(), c->end());
    }
    return out;
}

static Value make_document(std::size_t nodes) {
    static const char* kTypes[] = {"FRAME", "RECTANGLE", "TEXT"};
    std::mt19937 rng(123);
    std::uniform_real_distribution<float> dist(0.0f, 1.0f);

    Value::Array changes;
    changes.reserve(nodes);
    for (std::size_t i = 0; i < nodes; ++i) {
        Value::Array fills;
        for (int k = 0; k < 2; ++k) {
            fills.push_back(easy::record({
                {"color", easy::record({{"r", easy::f(dist(rng))}, {"g", easy::f(dist(rng))},
                                        {"b", easy::f(dist(rng))}, {"a", easy::f(1.0)}})},
                {"opacity", easy::f(dist(rng))},
                {"visible", easy::b(k == 0)},
            }));
        }
        Bytes hash(20);
        for (auto& h : hash) h = static_cast<std::uint8_t>(rng() & 0xFFu);

        changes.push_back(easy::record({
            {"guid", easy::record({{"sessionID", easy::u(1)}, {"localID", easy::u(i + 2)}})},
            {"parent", easy::record({{"sessionID", easy::u(1)}, {"localID", easy::u(i / 16 + 1)}})},
            {"type", easy::enum_value(kTypes[i % 3])},
            {"name", easy::s("Layer " + std::to_string(i))},
            {"size", easy::record({{"x", easy::f(100.0f * dist(rng))}, {"y", easy::f(100.0f * dist(rng))}})},
            {"fillPaints", easy::array(std::move(fills))},
            {"revision", easy::i(static_cast<std::int64_t>(i) * 1000003)},
            {"hash", easy::bytes(std::move(hash))},
        }));
    }

    return easy::record({
        {"type", easy::u(1)},
        {"sessionID", easy::u(1)},
        {"nodeChanges", easy::array(std::move(changes))},
    });
}

static void bench_one(std::size_t nodes) {
    figkiwi::Schema schema = figkiwi::parse_schema(kBenchSchema);
    auto compiled = figkiwi::compile(schema);
    Value doc = make_document(nodes);

    std::cout << "=== nodes=" << nodes << " ===\n";

    auto t0 = std::chrono::high_resolution_clock::now();
    Bytes encoded = compiled->encode("Message", doc);
    double e_ms = ms_since(t0);
    double mb = static_cast<double>(encoded.size()) / (1024.0 * 1024.0);
    std::cout << "encode: " << e_ms << " ms, message=" << mb << " MiB, throughput=" << (mb / (e_ms / 1000.0)) << " MiB/s\n";

    t0 = std::chrono::high_resolution_clock::now();
    Value decoded = compiled->decode("Message", encoded);
    double d_ms = ms_since(t0);
    std::cout << "decode: " << d_ms << " ms, throughput=" << (mb / (d_ms / 1000.0)) << " MiB/s\n";
    if (decoded != doc) throw std::runtime_error("decoded document differs");

    Bytes file = container(raw_deflate(figkiwi::encode_binary_schema(schema)), zlib_compress(encoded, 6));
    double file_mb = static_cast<double>(file.size()) / (1024.0 * 1024.0);

    t0 = std::chrono::high_resolution_clock::now();
    figkiwi::ParsedContainer parsed = figkiwi::parse_container(file, figkiwi::zlib_decompressors());
    double p_ms = ms_since(t0);
    std::cout << "parse container: " << p_ms << " ms, file=" << file_mb << " MiB, nodes=" << parsed.node_changes().size()
              << "\n";
}

int main(int argc, char** argv) {
    std::size_t nodes = (argc >= 2) ? static_cast<std::size_t>(std::strtoull(argv[1], nullptr, 10)) : 50000;
    try {
        bench_one(nodes / 10);
        bench_one(nodes);
    } catch (const std::exception& e) {
        std::cerr << "bench error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
