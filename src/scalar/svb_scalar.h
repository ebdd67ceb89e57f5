#pragma once

#include <cstddef>
#include <cstdint>

namespace streamvbyte::scalar
{

/// Encode n 32-bit integers into separate control and data streams.
/// control receives (n + 3) / 4 bytes; data must have room for 4 * n bytes.
/// Returns a pointer past the last data byte written.
unsigned char * svbEnc32(const uint32_t * in, size_t n, unsigned char * control, unsigned char * data);

/// Decode n 32-bit integers. control must hold exactly (n + 3) / 4 bytes.
/// Returns a pointer past the last data byte consumed, or nullptr when
/// [data, data_end) is shorter than the control stream requires.
const unsigned char *
svbDec32(const unsigned char * control, const unsigned char * data, const unsigned char * data_end, size_t n, uint32_t * out);

} // namespace streamvbyte::scalar
