#include "svb_simd.h"
#include "svb_simd_internal.h"

#include <arm_neon.h>

namespace streamvbyte::neon
{

const unsigned char *
svbDec32(const unsigned char * control, const unsigned char * data, const unsigned char * data_end, size_t n, uint32_t * out)
{
    using namespace streamvbyte::simd::detail;

    const unsigned char * ip = data;
    const size_t quads = n / QUAD_SIZE;
    size_t q = 0;

    // tbl returns zero for out-of-range indices, which the NEON masks use as zero-fill
    for (; q < quads && canLoadQuad(ip, data_end); ++q)
    {
        const unsigned c = control[q];
        const uint8x16_t mask = vld1q_u8(kLengthClassTable.decode_neon[c].bytes);
        const uint8x16_t bytes = vld1q_u8(ip);

        vst1q_u8(reinterpret_cast<uint8_t *>(out + q * QUAD_SIZE), vqtbl1q_u8(bytes, mask));
        ip += kLengthClassTable.quad_length[c];
    }

    return decodeTail(control, ip, data_end, n, out, q);
}

} // namespace streamvbyte::neon
