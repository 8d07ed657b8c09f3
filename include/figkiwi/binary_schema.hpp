#pragma once

#include "figkiwi/byte_stream.hpp"
#include "figkiwi/schema.hpp"

namespace figkiwi {

/// Encode a schema in the self-hosted binary form. The package name and
/// deprecation flags are not part of that form.
Bytes encode_binary_schema(const Schema& schema);

/// Decode a binary schema. Field type codes are resolved after all
/// definitions are read, so self and forward references are allowed. No
/// semantic verification is performed.
Schema decode_binary_schema(const Bytes& bytes);
Schema decode_binary_schema(Bytes&& bytes);
Schema decode_binary_schema(ByteStream& bb);

} // namespace figkiwi
