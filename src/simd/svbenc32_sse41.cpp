#include "svb_simd.h"
#include "svb_simd_internal.h"

#include <smmintrin.h> // SSE4.1

namespace streamvbyte::sse41
{

unsigned char * svbEnc32(const uint32_t * in, size_t n, unsigned char * control, unsigned char * data)
{
    using namespace streamvbyte::simd::detail;

    // Width thresholds: v >= t  <=>  max_epu32(v, t) == v
    const __m128i two_bytes = _mm_set1_epi32(0x100);
    const __m128i three_bytes = _mm_set1_epi32(0x10000);
    const __m128i four_bytes = _mm_set1_epi32(0x1000000);
    // Multipliers moving lane i's code to bits [2i+1:2i]
    const __m128i lane_shift = _mm_setr_epi32(1, 1 << 2, 1 << 4, 1 << 6);

    unsigned char * op = data;
    const size_t quads = n / QUAD_SIZE;

    // Each store writes 16 bytes. Quad q starts at most at 16 * q, so the store
    // ends inside the 4 * n byte data buffer for every complete quad.
    for (size_t q = 0; q < quads; ++q)
    {
        const __m128i v = _mm_loadu_si128(reinterpret_cast<const __m128i *>(in + q * QUAD_SIZE));

        // Comparisons yield -1 per reached threshold; negating the sum gives the code
        const __m128i ge2 = _mm_cmpeq_epi32(_mm_max_epu32(v, two_bytes), v);
        const __m128i ge3 = _mm_cmpeq_epi32(_mm_max_epu32(v, three_bytes), v);
        const __m128i ge4 = _mm_cmpeq_epi32(_mm_max_epu32(v, four_bytes), v);
        const __m128i codes = _mm_sub_epi32(_mm_setzero_si128(), _mm_add_epi32(_mm_add_epi32(ge2, ge3), ge4));

        // Codes occupy disjoint bits after the multiply, so a horizontal add packs them
        __m128i packed = _mm_mullo_epi32(codes, lane_shift);
        packed = _mm_add_epi32(packed, _mm_shuffle_epi32(packed, _MM_SHUFFLE(1, 0, 3, 2)));
        packed = _mm_add_epi32(packed, _mm_shuffle_epi32(packed, _MM_SHUFFLE(2, 3, 0, 1)));
        const unsigned c = static_cast<unsigned>(_mm_cvtsi128_si32(packed));

        const __m128i mask = _mm_load_si128(reinterpret_cast<const __m128i *>(kLengthClassTable.encode_x86[c].bytes));
        _mm_storeu_si128(reinterpret_cast<__m128i *>(op), _mm_shuffle_epi8(v, mask));

        control[q] = static_cast<unsigned char>(c);
        op += kLengthClassTable.quad_length[c];
    }

    return encodeTail(in, n, control, op, quads);
}

} // namespace streamvbyte::sse41
