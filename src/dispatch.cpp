#include "streamvbyte.h"

#include "scalar/svb_scalar.h"
#include "scalar/svb_tables.h"
#include "simd/svb_simd.h"

#include <cstdint>
#include <limits>
#include <string>

namespace streamvbyte
{

namespace
{

using EncodeFn = unsigned char * (*)(const uint32_t *, size_t, unsigned char *, unsigned char *);
using DecodeFn = const unsigned char * (*)(const unsigned char *, const unsigned char *, const unsigned char *, size_t, uint32_t *);

struct Codec
{
    EncodeFn encode;
    DecodeFn decode;
};

// ssse3 only accelerates decoding and encodes with the scalar encoder.
// A hint for a backend this build does not contain falls back to scalar,
// which produces identical output.
Codec codecFor(Backend backend)
{
    switch (backend)
    {
#ifdef STREAMVBYTE_ENABLE_SSSE3
        case Backend::X86Ssse3:
            return {scalar::svbEnc32, ssse3::svbDec32};
#endif
#ifdef STREAMVBYTE_ENABLE_SSE41
        case Backend::X86Sse41:
            return {sse41::svbEnc32, sse41::svbDec32};
#endif
#ifdef STREAMVBYTE_ENABLE_NEON
        case Backend::Aarch64Neon:
            return {neon::svbEnc32, neon::svbDec32};
#endif
        default:
            return {scalar::svbEnc32, scalar::svbDec32};
    }
}

// Counts whose data stream could not fit in memory are rejected before
// any stream length is derived from them
constexpr size_t MAX_VALUE_COUNT = std::numeric_limits<size_t>::max() / 4;

void checkControlLen(size_t control_len, size_t n)
{
    if (n > MAX_VALUE_COUNT)
        throw DecodeError("value count " + std::to_string(n) + " exceeds the largest encodable stream");
    if (control_len != controlStreamLen(n))
        throw DecodeError(
            "control stream has " + std::to_string(control_len) + " bytes but " + std::to_string(n) + " values need "
            + std::to_string(controlStreamLen(n)));
}

} // namespace

Backend defaultBackend()
{
#if defined(STREAMVBYTE_ENABLE_SSE41)
    return Backend::X86Sse41;
#elif defined(STREAMVBYTE_ENABLE_SSSE3)
    return Backend::X86Ssse3;
#elif defined(STREAMVBYTE_ENABLE_NEON)
    return Backend::Aarch64Neon;
#else
    return Backend::Scalar;
#endif
}

bool isBackendAvailable(Backend backend)
{
    switch (backend)
    {
        case Backend::Scalar:
            return true;
        case Backend::X86Ssse3:
#ifdef STREAMVBYTE_ENABLE_SSSE3
            return true;
#else
            return false;
#endif
        case Backend::X86Sse41:
#ifdef STREAMVBYTE_ENABLE_SSE41
            return true;
#else
            return false;
#endif
        case Backend::Aarch64Neon:
#ifdef STREAMVBYTE_ENABLE_NEON
            return true;
#else
            return false;
#endif
    }
    return false;
}

std::vector<Backend> availableBackends()
{
    std::vector<Backend> backends;
    for (Backend backend : {Backend::Scalar, Backend::X86Ssse3, Backend::X86Sse41, Backend::Aarch64Neon})
    {
        if (isBackendAvailable(backend))
            backends.push_back(backend);
    }
    return backends;
}

const char * backendName(Backend backend)
{
    switch (backend)
    {
        case Backend::Scalar:
            return "scalar";
        case Backend::X86Ssse3:
            return "x86_ssse3";
        case Backend::X86Sse41:
            return "x86_sse41";
        case Backend::Aarch64Neon:
            return "aarch64_neon";
    }
    return "unknown";
}

size_t encodedDataLen(const unsigned char * control, size_t control_len, size_t n)
{
    using namespace streamvbyte::scalar::detail;

    checkControlLen(control_len, n);

    const size_t quads = n / QUAD_SIZE;
    size_t len = 0;
    for (size_t q = 0; q < quads; ++q)
        len += kLengthClassTable.quad_length[control[q]];

    // Only the real lanes of a partial final quad carry data
    for (size_t i = 0; i < n - quads * QUAD_SIZE; ++i)
        len += laneCode(control[quads], static_cast<unsigned>(i)) + 1u;

    return len;
}

size_t encode(const uint32_t * in, size_t n, unsigned char * control, unsigned char * data, Backend backend)
{
    if (n == 0)
        return 0;

    unsigned char * end = codecFor(backend).encode(in, n, control, data);
    return static_cast<size_t>(end - data);
}

EncodedStreams encode(const std::vector<uint32_t> & values, Backend backend)
{
    EncodedStreams streams;
    streams.control.resize(controlStreamLen(values.size()));
    streams.data.resize(maxEncodedDataLen(values.size()));

    const size_t data_len = encode(values.data(), values.size(), streams.control.data(), streams.data.data(), backend);
    streams.data.resize(data_len);
    return streams;
}

size_t decode(
    const unsigned char * control,
    size_t control_len,
    const unsigned char * data,
    size_t data_len,
    size_t n,
    uint32_t * out,
    Backend backend)
{
    checkControlLen(control_len, n);
    if (n == 0)
        return 0;

    const unsigned char * end = codecFor(backend).decode(control, data, data + data_len, n, out);
    if (!end)
        throw DecodeError(
            "data stream of " + std::to_string(data_len) + " bytes is too short for " + std::to_string(n) + " values (needs "
            + std::to_string(encodedDataLen(control, control_len, n)) + ")");

    return static_cast<size_t>(end - data);
}

std::vector<uint32_t> decode(const std::vector<uint8_t> & control, const std::vector<uint8_t> & data, size_t n, Backend backend)
{
    std::vector<uint32_t> values(n);
    decode(control.data(), control.size(), data.data(), data.size(), n, values.data(), backend);
    return values;
}

size_t encodeToBuffer(const uint32_t * in, size_t n, unsigned char * out, Backend backend)
{
    const size_t control_len = controlStreamLen(n);
    return control_len + encode(in, n, out, out + control_len, backend);
}

size_t decodeFromBuffer(const unsigned char * in, size_t in_len, size_t n, uint32_t * out, Backend backend)
{
    const size_t control_len = controlStreamLen(n);
    if (in_len < control_len)
        throw DecodeError(
            "buffer of " + std::to_string(in_len) + " bytes cannot hold the " + std::to_string(control_len) + " control bytes of "
            + std::to_string(n) + " values");

    return control_len + decode(in, control_len, in + control_len, in_len - control_len, n, out, backend);
}

} // namespace streamvbyte
