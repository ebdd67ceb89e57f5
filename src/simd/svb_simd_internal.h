#pragma once

#include "scalar/svb_scalar.h"
#include "scalar/svb_scalar_internal.h"
#include "scalar/svb_tables.h"

namespace streamvbyte::simd::detail
{

// Import constants and utilities from scalar namespace
using scalar::detail::kLengthClassTable;
using scalar::detail::loadU32Fast;
using scalar::detail::MAX_QUAD_BYTES;
using scalar::detail::QUAD_SIZE;

/// True while a full 16-byte vector load at ip stays inside the data stream
STREAMVBYTE_ALWAYS_INLINE bool canLoadQuad(const unsigned char * ip, const unsigned char * data_end, unsigned quads = 1)
{
    return data_end - ip >= static_cast<ptrdiff_t>(quads * MAX_QUAD_BYTES);
}

/// Finish encoding after the first quads_done quads with the scalar encoder
STREAMVBYTE_ALWAYS_INLINE unsigned char *
encodeTail(const uint32_t * in, size_t n, unsigned char * control, unsigned char * op, size_t quads_done)
{
    const size_t done = quads_done * QUAD_SIZE;
    return scalar::svbEnc32(in + done, n - done, control + quads_done, op);
}

/// Finish decoding after the first quads_done quads with the bounds-checked scalar decoder
STREAMVBYTE_ALWAYS_INLINE const unsigned char * decodeTail(
    const unsigned char * control, const unsigned char * ip, const unsigned char * data_end, size_t n, uint32_t * out, size_t quads_done)
{
    const size_t done = quads_done * QUAD_SIZE;
    return scalar::svbDec32(control + quads_done, ip, data_end, n - done, out + done);
}

} // namespace streamvbyte::simd::detail
