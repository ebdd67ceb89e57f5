#pragma once

#include <cstddef>
#include <cstdint>

// Each backend matches streamvbyte::scalar bit for bit. Decoders use the same
// contract as scalar::svbDec32 (control holds exactly (n + 3) / 4 bytes,
// nullptr on a short data stream) and never read past data_end.

namespace streamvbyte::ssse3
{

/// Table-driven pshufb decode: byte count and shuffle mask are both looked up
const unsigned char *
svbDec32(const unsigned char * control, const unsigned char * data, const unsigned char * data_end, size_t n, uint32_t * out);

} // namespace streamvbyte::ssse3

namespace streamvbyte::sse41
{

/// Vectorised width classification; data must have room for 4 * n bytes
unsigned char * svbEnc32(const uint32_t * in, size_t n, unsigned char * control, unsigned char * data);

/// pshufb decode with computed byte counts and pmovzx fast paths for uniform quads
const unsigned char *
svbDec32(const unsigned char * control, const unsigned char * data, const unsigned char * data_end, size_t n, uint32_t * out);

} // namespace streamvbyte::sse41

namespace streamvbyte::neon
{

/// clz-based width classification; data must have room for 4 * n bytes
unsigned char * svbEnc32(const uint32_t * in, size_t n, unsigned char * control, unsigned char * data);

/// tbl-based decode
const unsigned char *
svbDec32(const unsigned char * control, const unsigned char * data, const unsigned char * data_end, size_t n, uint32_t * out);

} // namespace streamvbyte::neon
