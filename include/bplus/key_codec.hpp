#ifndef BPLUS_KEY_CODEC_HPP
#define BPLUS_KEY_CODEC_HPP

#include <bplus/defs.hpp>
#include <bplus/key.hpp>
#include <bplus/schema.hpp>

#include <string>

namespace bplus {

/// \defgroup key_codec Key Encoding
///
/// Composite keys are encoded as the concatenation of their columns, in schema order.
/// Every column occupies exactly its declared width:
///     - int32 / int64 columns are stored as big endian two's complement integers
///       (4 and 8 bytes),
///     - float32 / float64 columns are stored as big endian IEEE 754 values (4 and 8 bytes),
///     - fixed string columns store the raw bytes of the string, followed by zero bytes
///       up to the column width.
///
/// There are no delimiters and no length fields, the encoded size of every key
/// is `schema::key_size()`.
/// @{

/// Encodes `k` into `buffer` and returns the number of bytes written,
/// which is always `s.key_size()`.
///
/// \throws bad_argument If the buffer is too small or if the key does not match the schema.
size_t encode_key(const schema& s, const key& k, byte* buffer, size_t buffer_size);

/// Decodes a key from `buffer`, consuming exactly `s.key_size()` bytes.
///
/// \throws corruption_error If the buffer is shorter than an encoded key or
///         if a fixed string column is not properly zero padded.
key decode_key(const schema& s, const byte* buffer, size_t buffer_size);

/// Returns a human readable representation of the key, e.g. `[42 abc]`.
/// Only meant for diagnostics.
std::string format_key(const schema& s, const key& k);

/// @}

} // namespace bplus

#endif // BPLUS_KEY_CODEC_HPP
