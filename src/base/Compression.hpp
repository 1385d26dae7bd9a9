#ifndef __TS_COMPRESSION_H__
#define __TS_COMPRESSION_H__

#include "Headers.hpp"

namespace ts {
/**
 * @brief Compresses a buffer into the gzip container format.
 * @throws std::runtime_error if zlib reports a failure.
 */
string gzipCompress(const string& input);

/**
 * @brief Inflates a gzip (or zlib) stream.
 * @throws std::runtime_error on corrupt or truncated input.
 */
string gzipDecompress(const string& input);
}  // namespace ts

#endif  // __TS_COMPRESSION_H__
