#include "figkiwi/fig_file.hpp"

#include "figkiwi/binary_schema.hpp"
#include "figkiwi/error.hpp"

#include <sstream>
#include <utility>

namespace figkiwi {

static constexpr std::size_t kPreludeLen = 8;
static constexpr std::uint8_t kZstdMagic[4] = {0x28, 0xB5, 0x2F, 0xFD};
static constexpr std::uint8_t kZlibMagic = 0x78;

const char* to_string(Compression c) noexcept {
    switch (c) {
        case Compression::Zstd: return "zstd";
        case Compression::Zlib: return "zlib";
        case Compression::Deflate: return "deflate";
        case Compression::Unknown: return "unknown";
    }
    return "unknown";
}

bool ContainerHeader::is_fig_kiwi() const noexcept {
    return prelude == kFigKiwiPrelude || prelude == kFigKiwiePrelude;
}

bool ContainerHeader::is_fig_jam() const noexcept {
    return prelude == kFigJamPrelude;
}

const Chunk& ContainerStructure::schema_chunk() const {
    if (chunks.empty()) throw KiwiError(ErrorKind::InvalidContainerFormat, "container has no schema chunk");
    return chunks[0];
}

const Chunk& ContainerStructure::data_chunk() const {
    if (chunks.size() < 2) throw KiwiError(ErrorKind::InvalidContainerFormat, "container has no data chunk");
    return chunks[1];
}

const Chunk* ContainerStructure::preview_chunk() const noexcept {
    return chunks.size() > 2 ? &chunks[2] : nullptr;
}

static Value::Array root_array(const Value& message, const char* key) {
    const Value* v = message.find(key);
    if (!v || !v->is_array()) return {};
    return v->as_array();
}

Value::Array ParsedContainer::node_changes() const {
    return root_array(message, "nodeChanges");
}

Value::Array ParsedContainer::blobs() const {
    return root_array(message, "blobs");
}

// ------------------------------
// Framing
// ------------------------------

static std::uint32_t load_u32_le(const std::uint8_t* p) {
    return (static_cast<std::uint32_t>(p[0])      ) |
           (static_cast<std::uint32_t>(p[1]) <<  8) |
           (static_cast<std::uint32_t>(p[2]) << 16) |
           (static_cast<std::uint32_t>(p[3]) << 24);
}

Compression detect_compression(const Bytes& data, bool is_schema_chunk) {
    if (data.size() < 4) return Compression::Unknown;

    if (data[0] == kZstdMagic[0] && data[1] == kZstdMagic[1] &&
        data[2] == kZstdMagic[2] && data[3] == kZstdMagic[3]) {
        return Compression::Zstd;
    }
    if (data[0] == kZlibMagic && (data[1] == 0x01 || data[1] == 0x9C || data[1] == 0xDA)) {
        return Compression::Zlib;
    }
    // Figma writes the schema chunk as headerless deflate.
    if (is_schema_chunk) return Compression::Deflate;
    return Compression::Unknown;
}

ContainerStructure parse_container_structure(const Bytes& data, const ContainerOptions& opts) {
    if (data.size() < kPreludeLen) {
        std::ostringstream oss;
        oss << "container too small for prelude: " << data.size() << " bytes";
        throw KiwiError(ErrorKind::InvalidContainerFormat, oss.str());
    }

    ContainerStructure out;
    std::string prelude(data.begin(), data.begin() + kPreludeLen);
    std::size_t offset = kPreludeLen;

    if (prelude == kFigKiwiPrelude && offset < data.size() && data[offset] == 'e') {
        prelude = kFigKiwiePrelude;
        ++offset;
    }
    if (prelude != kFigKiwiPrelude && prelude != kFigKiwiePrelude && prelude != kFigJamPrelude) {
        // keep the diagnostic printable
        std::string shown;
        for (char c : prelude) shown.push_back((c >= 0x20 && c < 0x7F) ? c : '?');
        throw KiwiError(ErrorKind::InvalidContainerFormat, "bad prelude: '" + shown + "'");
    }
    out.header.prelude = prelude;

    // Pad to a 4-byte boundary.
    while (offset % 4 != 0 && offset < data.size()) ++offset;

    while (out.chunks.size() < opts.max_chunks && data.size() - offset >= 4) {
        std::uint32_t size = load_u32_le(data.data() + offset);
        offset += 4;
        if (size == 0 || size > data.size() - offset) break;

        Chunk chunk;
        chunk.data.assign(data.begin() + static_cast<std::ptrdiff_t>(offset),
                          data.begin() + static_cast<std::ptrdiff_t>(offset + size));
        chunk.compression = detect_compression(chunk.data, out.chunks.empty());
        out.chunks.push_back(std::move(chunk));
        offset += size;
    }

    if (out.chunks.size() < 2) {
        std::ostringstream oss;
        oss << "expected at least 2 chunks (schema + data), found " << out.chunks.size();
        throw KiwiError(ErrorKind::InvalidContainerFormat, oss.str());
    }

    return out;
}

// ------------------------------
// Decoding
// ------------------------------

// Uncompressed chunk data is moved out rather than copied.
static Bytes decompress_chunk(Chunk& chunk, const char* label, const Decompressors& decompressors) {
    if (chunk.compression == Compression::Unknown) return std::move(chunk.data);

    auto it = decompressors.find(chunk.compression);
    if (it == decompressors.end() || !it->second) {
        throw KiwiError(ErrorKind::UnsupportedCompression,
                        std::string(label) + " chunk is " + to_string(chunk.compression) +
                            " compressed but no decompressor was provided");
    }
    return it->second(chunk.data);
}

ParsedContainer parse_container(const Bytes& data, const Decompressors& decompressors, const ContainerOptions& opts) {
    ContainerStructure structure = parse_container_structure(data, opts);
    if (structure.header.is_fig_jam()) {
        throw KiwiError(ErrorKind::InvalidContainerFormat, "fig-jam containers are not decoded");
    }

    // parse_container_structure guarantees chunks 0 and 1.
    Bytes schema_bytes = decompress_chunk(structure.chunks[0], "schema", decompressors);
    Bytes message_bytes = decompress_chunk(structure.chunks[1], "data", decompressors);

    ParsedContainer out;
    out.header = structure.header;
    out.schema = decode_binary_schema(std::move(schema_bytes));
    out.compiled = compile(out.schema);
    out.message = out.compiled->decode(opts.root_type, std::move(message_bytes), opts.decode);
    if (const Chunk* preview = structure.preview_chunk()) {
        out.preview = preview->data;
    }
    return out;
}

} // namespace figkiwi
