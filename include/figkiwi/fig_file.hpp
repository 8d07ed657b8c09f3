#pragma once

#include "figkiwi/byte_stream.hpp"
#include "figkiwi/compiled_schema.hpp"
#include "figkiwi/schema.hpp"
#include "figkiwi/value.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace figkiwi {

// ------------------------------
// Container model
// ------------------------------

inline constexpr const char* kFigKiwiPrelude = "fig-kiwi";
inline constexpr const char* kFigKiwiePrelude = "fig-kiwie";
inline constexpr const char* kFigJamPrelude = "fig-jam.";

enum class Compression {
    Zstd,
    Zlib,
    Deflate,
    Unknown,
};

const char* to_string(Compression c) noexcept;

struct ContainerHeader {
    std::string prelude{};
    // The container carries no explicit version field; always 0.
    std::uint32_t version{0};

    bool is_fig_kiwi() const noexcept;
    bool is_fig_jam() const noexcept;
};

struct Chunk {
    Bytes data{};
    Compression compression{Compression::Unknown};
};

struct ContainerStructure {
    ContainerHeader header{};
    std::vector<Chunk> chunks{};

    const Chunk& schema_chunk() const;
    const Chunk& data_chunk() const;
    /// Null when the container has no third chunk.
    const Chunk* preview_chunk() const noexcept;
};

struct ContainerOptions {
    std::size_t max_chunks{3};
    std::string root_type{"Message"};
    DecodeOptions decode{};
};

/// Turns compressed chunk bytes into raw bytes. Exceptions propagate unchanged.
using Decompressor = std::function<Bytes(const Bytes&)>;
using Decompressors = std::map<Compression, Decompressor>;

struct ParsedContainer {
    ContainerHeader header{};
    Schema schema{};
    std::shared_ptr<const CompiledSchema> compiled{};
    Value message{};
    std::optional<Bytes> preview{};

    /// Root "nodeChanges" / "blobs" arrays; empty when absent.
    Value::Array node_changes() const;
    Value::Array blobs() const;
};

// ------------------------------
// API
// ------------------------------

/// Sniff the compression of a chunk from its first bytes. Never decompresses.
Compression detect_compression(const Bytes& data, bool is_schema_chunk);

/// Frame the container into header and chunks without decompressing or decoding.
ContainerStructure parse_container_structure(
    const Bytes& data,
    const ContainerOptions& opts = ContainerOptions{}
);

/// Frame, decompress chunks 0 and 1 with the supplied callbacks, decode the
/// binary schema and then the root message.
ParsedContainer parse_container(
    const Bytes& data,
    const Decompressors& decompressors,
    const ContainerOptions& opts = ContainerOptions{}
);

} // namespace figkiwi
