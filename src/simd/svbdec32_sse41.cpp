#include "svb_simd.h"
#include "svb_simd_internal.h"

#include <smmintrin.h> // SSE4.1

namespace streamvbyte::sse41
{

namespace
{

constexpr unsigned ALL_ONE_BYTE = 0x00u;
constexpr unsigned ALL_TWO_BYTES = 0x55u;

/// 4 + sum of the four length codes, computed instead of looked up
STREAMVBYTE_ALWAYS_INLINE unsigned quadLength(unsigned c)
{
    return 4u + (c & 3u) + ((c >> 2) & 3u) + ((c >> 4) & 3u) + (c >> 6);
}

/// Decode one quad. Quads of small values are the common case in posting lists
/// and delta-coded ids, so uniform 1-byte and 2-byte quads are widened with
/// pmovzx and skip the shuffle table.
STREAMVBYTE_ALWAYS_INLINE __m128i decodeQuad(const unsigned char * ip, unsigned c)
{
    using namespace streamvbyte::simd::detail;

    if (c == ALL_ONE_BYTE)
        return _mm_cvtepu8_epi32(_mm_cvtsi32_si128(static_cast<int>(loadU32Fast(ip))));

    if (c == ALL_TWO_BYTES)
        return _mm_cvtepu16_epi32(_mm_loadl_epi64(reinterpret_cast<const __m128i *>(ip)));

    const __m128i mask = _mm_load_si128(reinterpret_cast<const __m128i *>(kLengthClassTable.decode_x86[c].bytes));
    return _mm_shuffle_epi8(_mm_loadu_si128(reinterpret_cast<const __m128i *>(ip)), mask);
}

} // namespace

const unsigned char *
svbDec32(const unsigned char * control, const unsigned char * data, const unsigned char * data_end, size_t n, uint32_t * out)
{
    using namespace streamvbyte::simd::detail;

    const unsigned char * ip = data;
    const size_t quads = n / QUAD_SIZE;
    size_t q = 0;

    // Two quads per iteration. The first quad consumes at most 16 bytes, so 32
    // bytes of remaining input cover both 16-byte loads.
    for (; q + 2 <= quads && canLoadQuad(ip, data_end, 2); q += 2)
    {
        const unsigned c0 = control[q];
        const unsigned c1 = control[q + 1];

        const __m128i v0 = decodeQuad(ip, c0);
        ip += quadLength(c0);
        const __m128i v1 = decodeQuad(ip, c1);
        ip += quadLength(c1);

        _mm_storeu_si128(reinterpret_cast<__m128i *>(out + q * QUAD_SIZE), v0);
        _mm_storeu_si128(reinterpret_cast<__m128i *>(out + (q + 1) * QUAD_SIZE), v1);
    }

    for (; q < quads && canLoadQuad(ip, data_end); ++q)
    {
        const unsigned c = control[q];
        _mm_storeu_si128(reinterpret_cast<__m128i *>(out + q * QUAD_SIZE), decodeQuad(ip, c));
        ip += quadLength(c);
    }

    return decodeTail(control, ip, data_end, n, out, q);
}

} // namespace streamvbyte::sse41
