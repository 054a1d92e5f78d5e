#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace flowstate::codec {

// gzip framing (RFC 1952) via zlib.
std::string GzipCompress(std::string_view data);

bool LooksLikeGzip(std::string_view data);

// nullopt when data is not a complete gzip stream. Throws
// SerializationError once the inflated output would exceed max_output_bytes.
std::optional<std::string> GzipDecompress(std::string_view data, std::size_t max_output_bytes);

} // namespace flowstate::codec
