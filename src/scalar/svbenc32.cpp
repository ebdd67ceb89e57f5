#include "svb_scalar.h"
#include "svb_scalar_internal.h"

namespace streamvbyte::scalar
{

namespace
{

// Append one value to the data stream and return its length code (width - 1).
//
// Every value is stored with a full 4-byte write and the cursor then advances
// by the value's width, so the bytes past the width are overwritten by the
// next value. Value i starts at most at offset 4 * i, which keeps the write
// inside the 4 * n byte data buffer.
STREAMVBYTE_ALWAYS_INLINE unsigned putValue(unsigned char *& op, uint32_t v)
{
    using namespace streamvbyte::scalar::detail;

    const unsigned w = byteWidth32(v);
    storeU32Fast(op, v);
    op += w;
    return w - 1u;
}

} // namespace

unsigned char * svbEnc32(const uint32_t * in, size_t n, unsigned char * control, unsigned char * data)
{
    using namespace streamvbyte::scalar::detail;

    unsigned char * op = data;
    const size_t quads = n / QUAD_SIZE;

    for (size_t q = 0; q < quads; ++q)
    {
        const uint32_t * ip = in + q * QUAD_SIZE;
        unsigned code = putValue(op, ip[0]);
        code |= putValue(op, ip[1]) << 2;
        code |= putValue(op, ip[2]) << 4;
        code |= putValue(op, ip[3]) << 6;
        control[q] = static_cast<unsigned char>(code);
    }

    // Partial final quad: unused lanes keep code 0 and emit no data
    const size_t rest = n - quads * QUAD_SIZE;
    if (rest)
    {
        unsigned code = 0;
        for (size_t i = 0; i < rest; ++i)
            code |= putValue(op, in[quads * QUAD_SIZE + i]) << (2u * i);
        control[quads] = static_cast<unsigned char>(code);
    }

    return op;
}

} // namespace streamvbyte::scalar
