#include "internal/codec/compression.hpp"

#include <zlib.h>

#include "internal/util/errors.hpp"

namespace flowstate::codec {

namespace {

// windowBits 15 plus 16 selects the gzip wrapper.
constexpr int kGzipWindowBits = 15 + 16;
constexpr int kMemLevel       = 8;

} // namespace

std::string GzipCompress(std::string_view data) {
  z_stream stream{};
  if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, kGzipWindowBits, kMemLevel, Z_DEFAULT_STRATEGY) != Z_OK) {
    throw util::SerializationError("deflateInit2 failed");
  }

  std::string out(deflateBound(&stream, static_cast<uLong>(data.size())), '\0');
  stream.next_in   = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  stream.avail_in  = static_cast<uInt>(data.size());
  stream.next_out  = reinterpret_cast<Bytef*>(out.data());
  stream.avail_out = static_cast<uInt>(out.size());

  const int ret = deflate(&stream, Z_FINISH);
  deflateEnd(&stream);
  if (ret != Z_STREAM_END) {
    throw util::SerializationError("gzip compression failed: " + std::to_string(ret));
  }
  out.resize(stream.total_out);
  return out;
}

bool LooksLikeGzip(std::string_view data) {
  return data.size() >= 18 && static_cast<unsigned char>(data[0]) == 0x1f && static_cast<unsigned char>(data[1]) == 0x8b;
}

std::optional<std::string> GzipDecompress(std::string_view data, std::size_t max_output_bytes) {
  if (!LooksLikeGzip(data)) {
    return std::nullopt;
  }

  z_stream stream{};
  if (inflateInit2(&stream, kGzipWindowBits) != Z_OK) {
    return std::nullopt;
  }

  stream.next_in  = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  stream.avail_in = static_cast<uInt>(data.size());

  std::string out;
  char        chunk[16384];
  int         ret = Z_OK;
  while (ret == Z_OK) {
    stream.next_out  = reinterpret_cast<Bytef*>(chunk);
    stream.avail_out = sizeof(chunk);
    ret              = inflate(&stream, Z_NO_FLUSH);
    if (ret != Z_OK && ret != Z_STREAM_END) {
      break;
    }
    const std::size_t produced = sizeof(chunk) - stream.avail_out;
    if (out.size() + produced > max_output_bytes) {
      inflateEnd(&stream);
      throw util::SerializationError("gzip payload inflates beyond " + std::to_string(max_output_bytes) + " bytes");
    }
    out.append(chunk, produced);
    if (ret == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
      // input exhausted before the gzip trailer
      ret = Z_DATA_ERROR;
    }
  }
  inflateEnd(&stream);

  if (ret != Z_STREAM_END) {
    return std::nullopt;
  }
  return out;
}

} // namespace flowstate::codec
