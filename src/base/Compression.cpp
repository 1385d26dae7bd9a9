#include "Compression.hpp"

#include <zlib.h>

namespace ts {
namespace {
const int CHUNK_SIZE = 16 * 1024;
// 16 selects the gzip wrapper on deflate, 32 auto-detects on inflate
const int GZIP_WINDOW_BITS = 15 + 16;
const int AUTO_WINDOW_BITS = 15 + 32;
}  // namespace

string gzipCompress(const string& input) {
  z_stream stream;
  memset(&stream, 0, sizeof(stream));
  if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                   GZIP_WINDOW_BITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
    throw runtime_error("deflateInit2 failed");
  }

  stream.next_in = (Bytef*)input.data();
  stream.avail_in = uInt(input.size());

  string output;
  char buffer[CHUNK_SIZE];
  int rc;
  do {
    stream.next_out = reinterpret_cast<Bytef*>(buffer);
    stream.avail_out = CHUNK_SIZE;
    rc = deflate(&stream, Z_FINISH);
    if (rc == Z_STREAM_ERROR) {
      deflateEnd(&stream);
      throw runtime_error("deflate failed");
    }
    output.append(buffer, CHUNK_SIZE - stream.avail_out);
  } while (rc != Z_STREAM_END);

  deflateEnd(&stream);
  return output;
}

string gzipDecompress(const string& input) {
  z_stream stream;
  memset(&stream, 0, sizeof(stream));
  if (inflateInit2(&stream, AUTO_WINDOW_BITS) != Z_OK) {
    throw runtime_error("inflateInit2 failed");
  }

  stream.next_in = (Bytef*)input.data();
  stream.avail_in = uInt(input.size());

  string output;
  char buffer[CHUNK_SIZE];
  int rc = Z_OK;
  while (rc != Z_STREAM_END) {
    stream.next_out = reinterpret_cast<Bytef*>(buffer);
    stream.avail_out = CHUNK_SIZE;
    rc = inflate(&stream, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      string msg = stream.msg ? stream.msg : "inflate failed";
      inflateEnd(&stream);
      throw runtime_error("Corrupt compressed data: " + msg);
    }
    output.append(buffer, CHUNK_SIZE - stream.avail_out);
    if (rc == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
      inflateEnd(&stream);
      throw runtime_error("Truncated compressed data");
    }
  }

  inflateEnd(&stream);
  return output;
}
}  // namespace ts
