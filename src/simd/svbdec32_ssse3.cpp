#include "svb_simd.h"
#include "svb_simd_internal.h"

#include <tmmintrin.h> // SSSE3

namespace streamvbyte::ssse3
{

const unsigned char *
svbDec32(const unsigned char * control, const unsigned char * data, const unsigned char * data_end, size_t n, uint32_t * out)
{
    using namespace streamvbyte::simd::detail;

    const unsigned char * ip = data;
    const size_t quads = n / QUAD_SIZE;
    size_t q = 0;

    // One quad per iteration:
    // 1. Look up the shuffle mask and byte count for the control byte
    // 2. Load 16 data bytes (only quad_length of them belong to this quad)
    // 3. pshufb scatters them into 4 lanes, zero-filling the high bytes
    for (; q < quads && canLoadQuad(ip, data_end); ++q)
    {
        const unsigned c = control[q];
        const __m128i mask = _mm_load_si128(reinterpret_cast<const __m128i *>(kLengthClassTable.decode_x86[c].bytes));
        const __m128i bytes = _mm_loadu_si128(reinterpret_cast<const __m128i *>(ip));

        _mm_storeu_si128(reinterpret_cast<__m128i *>(out + q * QUAD_SIZE), _mm_shuffle_epi8(bytes, mask));
        ip += kLengthClassTable.quad_length[c];
    }

    return decodeTail(control, ip, data_end, n, out, q);
}

} // namespace streamvbyte::ssse3
