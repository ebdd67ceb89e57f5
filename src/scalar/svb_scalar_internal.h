#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace streamvbyte::scalar::detail
{

#if defined(__GNUC__) || defined(__clang__)
#    define STREAMVBYTE_ALWAYS_INLINE __attribute__((always_inline)) inline
#    define STREAMVBYTE_LIKELY(x) __builtin_expect(!!(x), 1)
#    define STREAMVBYTE_UNLIKELY(x) __builtin_expect(!!(x), 0)
using U32Alias = uint32_t __attribute__((__may_alias__));
#else
#    define STREAMVBYTE_ALWAYS_INLINE inline
#    define STREAMVBYTE_LIKELY(x) (x)
#    define STREAMVBYTE_UNLIKELY(x) (x)
using U32Alias = uint32_t;
#endif

// Endianness detection
// The data stream stores every value little-endian.
// On big-endian platforms, we need to byte-swap when loading/storing.
#if defined(__BYTE_ORDER__) && defined(__ORDER_BIG_ENDIAN__)
#    if __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
#        define STREAMVBYTE_BIG_ENDIAN 1
#    else
#        define STREAMVBYTE_BIG_ENDIAN 0
#    endif
#elif defined(__BIG_ENDIAN__) || defined(__ARMEB__) || defined(__THUMBEB__) || defined(__AARCH64EB__) || defined(_MIPSEB) \
    || defined(__MIPSEB) || defined(__MIPSEB__)
#    define STREAMVBYTE_BIG_ENDIAN 1
#else
#    define STREAMVBYTE_BIG_ENDIAN 0
#endif

STREAMVBYTE_ALWAYS_INLINE constexpr uint32_t byteSwap32(uint32_t v)
{
#if defined(__GNUC__) || defined(__clang__)
    return __builtin_bswap32(v);
#else
    return ((v >> 24) & 0x000000FFu) | ((v >> 8) & 0x0000FF00u) | ((v << 8) & 0x00FF0000u) | ((v << 24) & 0xFF000000u);
#endif
}

// Convert from little-endian to native (no-op on little-endian platforms)
STREAMVBYTE_ALWAYS_INLINE constexpr uint32_t leToNative32(uint32_t v)
{
#if STREAMVBYTE_BIG_ENDIAN
    return byteSwap32(v);
#else
    return v;
#endif
}

STREAMVBYTE_ALWAYS_INLINE constexpr uint32_t nativeToLe32(uint32_t v)
{
    return leToNative32(v);
}

constexpr unsigned QUAD_SIZE = 4; // Values described by one control byte
constexpr unsigned MAX_QUAD_BYTES = 16; // Data bytes of a quad of 4-byte values

/// Bit scan reverse for 32-bit integer (returns highest set bit position + 1, or 0 if x is 0)
/// Returns value in range [0, 32]
///
/// The bsr instruction leaves the destination unchanged when the source is 0,
/// so initializing b=-1 gives b+1=0 for x=0 without branching.
inline unsigned bsr32(uint32_t x)
{
#if (defined(__GNUC__) || defined(__clang__)) && (defined(__i386__) || defined(__x86_64__))
    int b = -1;
    asm("bsrl %1,%0" : "+r"(b) : "rm"(x));
    return static_cast<unsigned>(b + 1);
#elif defined(__GNUC__) || defined(__clang__)
    return x ? (32u - static_cast<unsigned>(__builtin_clz(x))) : 0u;
#else
    unsigned b = 0u;
    while (x)
    {
        ++b;
        x >>= 1u;
    }
    return b;
#endif
}

/// Minimal number of little-endian bytes holding x, in [1, 4]. Zero takes one byte.
inline unsigned byteWidth32(uint32_t x)
{
    return (bsr32(x | 1u) + 7u) >> 3;
}

/// Load unaligned 32-bit little-endian value and convert to native
inline uint32_t loadU32(const unsigned char * in)
{
    uint32_t v;
    memcpy(&v, in, sizeof(v));
    return leToNative32(v);
}

/// Store native 32-bit value as unaligned little-endian
inline void storeU32(unsigned char * out, uint32_t v)
{
    v = nativeToLe32(v);
    memcpy(out, &v, sizeof(v));
}

/// Fast unaligned loads/stores with little-endian conversion
/// On x86 (always little-endian), uses direct pointer access.
inline uint32_t loadU32Fast(const unsigned char * in)
{
#if defined(__i386__) || defined(__x86_64__)
    return *reinterpret_cast<const U32Alias *>(in);
#else
    return loadU32(in);
#endif
}

inline void storeU32Fast(unsigned char * out, uint32_t v)
{
#if defined(__i386__) || defined(__x86_64__)
    *reinterpret_cast<U32Alias *>(out) = v;
#else
    storeU32(out, v);
#endif
}

/// Load a w-byte little-endian value (1 <= w <= 4) without touching bytes past in + w
inline uint32_t loadPartial(const unsigned char * in, unsigned w)
{
    uint32_t v = 0;
    for (unsigned i = 0; i < w; ++i)
        v |= static_cast<uint32_t>(in[i]) << (8u * i);
    return v;
}

/// Mask keeping the low w bytes (1 <= w <= 4)
constexpr uint32_t widthMask(unsigned w)
{
    return 0xFFFFFFFFu >> (32u - 8u * w);
}

} // namespace streamvbyte::scalar::detail
