#include "svb_simd.h"
#include "svb_simd_internal.h"

#include <arm_neon.h>

namespace streamvbyte::neon
{

unsigned char * svbEnc32(const uint32_t * in, size_t n, unsigned char * control, unsigned char * data)
{
    using namespace streamvbyte::simd::detail;

    static const int32_t shifts[QUAD_SIZE] = {0, 2, 4, 6};
    const int32x4_t lane_shift = vld1q_s32(shifts);
    const uint32x4_t max_code = vdupq_n_u32(3);

    unsigned char * op = data;
    const size_t quads = n / QUAD_SIZE;

    // Quad q starts at most at 16 * q, so the 16-byte store stays inside the
    // 4 * n byte data buffer for every complete quad
    for (size_t q = 0; q < quads; ++q)
    {
        const uint32x4_t v = vld1q_u32(in + q * QUAD_SIZE);

        // code = 3 - leading zero bytes; saturation maps 0 (4 zero bytes) to code 0
        const uint32x4_t codes = vqsubq_u32(max_code, vshrq_n_u32(vclzq_u32(v), 3));
        const unsigned c = vaddvq_u32(vshlq_u32(codes, lane_shift));

        const uint8x16_t mask = vld1q_u8(kLengthClassTable.encode_neon[c].bytes);
        vst1q_u8(op, vqtbl1q_u8(vreinterpretq_u8_u32(v), mask));

        control[q] = static_cast<unsigned char>(c);
        op += kLengthClassTable.quad_length[c];
    }

    return encodeTail(in, n, control, op, quads);
}

} // namespace streamvbyte::neon
