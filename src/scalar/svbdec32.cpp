#include "svb_scalar.h"
#include "svb_scalar_internal.h"
#include "svb_tables.h"

namespace streamvbyte::scalar
{

namespace
{

// Read one w-byte value. A full 4-byte load is used whenever 4 bytes remain in
// the data stream; near the end the bytes are gathered one at a time.
STREAMVBYTE_ALWAYS_INLINE uint32_t getValue(const unsigned char * ip, const unsigned char * end, unsigned w)
{
    using namespace streamvbyte::scalar::detail;

    if (STREAMVBYTE_LIKELY(end - ip >= 4))
        return loadU32Fast(ip) & widthMask(w);
    return loadPartial(ip, w);
}

} // namespace

const unsigned char *
svbDec32(const unsigned char * control, const unsigned char * data, const unsigned char * data_end, size_t n, uint32_t * out)
{
    using namespace streamvbyte::scalar::detail;

    const unsigned char * ip = data;
    const size_t quads = n / QUAD_SIZE;

    for (size_t q = 0; q < quads; ++q)
    {
        const unsigned c = control[q];
        const unsigned quad_length = kLengthClassTable.quad_length[c];
        if (STREAMVBYTE_UNLIKELY(data_end - ip < static_cast<ptrdiff_t>(quad_length)))
            return nullptr;

        const uint8_t * len = kLengthClassTable.lane_length[c];
        const uint8_t * off = kLengthClassTable.lane_offset[c];
        uint32_t * op = out + q * QUAD_SIZE;
        op[0] = getValue(ip + off[0], data_end, len[0]);
        op[1] = getValue(ip + off[1], data_end, len[1]);
        op[2] = getValue(ip + off[2], data_end, len[2]);
        op[3] = getValue(ip + off[3], data_end, len[3]);
        ip += quad_length;
    }

    // Partial final quad: lanes past n are never read, whatever their codes
    const size_t rest = n - quads * QUAD_SIZE;
    if (rest)
    {
        const unsigned c = control[quads];
        for (size_t i = 0; i < rest; ++i)
        {
            const unsigned w = laneCode(c, static_cast<unsigned>(i)) + 1u;
            if (STREAMVBYTE_UNLIKELY(data_end - ip < static_cast<ptrdiff_t>(w)))
                return nullptr;
            out[quads * QUAD_SIZE + i] = getValue(ip, data_end, w);
            ip += w;
        }
    }

    return ip;
}

} // namespace streamvbyte::scalar
