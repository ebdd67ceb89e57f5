#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace streamvbyte
{

/// Decode implementations. Exactly one is the build's default; the others are
/// usable as hints when compiled into the same artifact.
enum class Backend
{
    Scalar,
    X86Ssse3,
    X86Sse41,
    Aarch64Neon,
};

/// Thrown when caller-supplied lengths do not match the encoded streams
class DecodeError : public std::runtime_error
{
public:
    explicit DecodeError(const std::string & what) : std::runtime_error(what) { }
};

struct EncodedStreams
{
    std::vector<uint8_t> control;
    std::vector<uint8_t> data;
};

/// Number of control bytes for n values
constexpr size_t controlStreamLen(size_t n)
{
    return n / 4 + (n % 4 != 0);
}

/// Upper bound on the data stream for n values
constexpr size_t maxEncodedDataLen(size_t n)
{
    return 4 * n;
}

/// Upper bound on encodeToBuffer output (control stream followed by data stream)
constexpr size_t maxEncodedLen(size_t n)
{
    return controlStreamLen(n) + maxEncodedDataLen(n);
}

/// Backend selected by the STREAMVBYTE_SIMD build option
Backend defaultBackend();

bool isBackendAvailable(Backend backend);

/// Compiled backends, scalar first
std::vector<Backend> availableBackends();

/// Build option spelling: "scalar", "x86_ssse3", "x86_sse41" or "aarch64_neon"
const char * backendName(Backend backend);

/// Exact data stream length described by control for n values
size_t encodedDataLen(const unsigned char * control, size_t control_len, size_t n);

/// Encode n values into separate streams.
/// control needs controlStreamLen(n) bytes, data needs maxEncodedDataLen(n) bytes.
/// Returns the number of data bytes written.
size_t encode(const uint32_t * in, size_t n, unsigned char * control, unsigned char * data, Backend backend = defaultBackend());

EncodedStreams encode(const std::vector<uint32_t> & values, Backend backend = defaultBackend());

/// Decode n values into out. Returns the number of data bytes consumed;
/// data bytes after that are ignored. Throws DecodeError if control_len is not
/// controlStreamLen(n) or the data stream is too short; out is then unspecified.
size_t decode(
    const unsigned char * control,
    size_t control_len,
    const unsigned char * data,
    size_t data_len,
    size_t n,
    uint32_t * out,
    Backend backend = defaultBackend());

std::vector<uint32_t>
decode(const std::vector<uint8_t> & control, const std::vector<uint8_t> & data, size_t n, Backend backend = defaultBackend());

/// Encode n values as the control stream immediately followed by the data stream.
/// out needs maxEncodedLen(n) bytes. Returns the total number of bytes written.
size_t encodeToBuffer(const uint32_t * in, size_t n, unsigned char * out, Backend backend = defaultBackend());

/// Decode n values written by encodeToBuffer. Returns the total number of bytes consumed.
size_t decodeFromBuffer(const unsigned char * in, size_t in_len, size_t n, uint32_t * out, Backend backend = defaultBackend());

} // namespace streamvbyte
