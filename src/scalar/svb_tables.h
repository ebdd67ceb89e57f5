#pragma once

#include "svb_scalar_internal.h"

#include <cstdint>

namespace streamvbyte::scalar::detail
{

// Control byte layout: lane i keeps its length code (byte width - 1) in bits [2i+1:2i].
//
//   bit  7 6   5 4   3 2   1 0
//        lane3 lane2 lane1 lane0
//
// The table below holds everything a decoder or encoder needs per control byte.
// Shuffle masks place data byte mask[k] into lane byte k (decode), or lane byte
// mask[k] into data byte k (encode). Slots that receive no byte carry the
// instruction set's zero-fill sentinel.

/// pshufb writes zero when bit 7 of the index byte is set
constexpr uint8_t X86_ZERO_FILL = 0x80u;

/// tbl writes zero for any index >= 16
constexpr uint8_t NEON_ZERO_FILL = 0xFFu;

struct alignas(16) ShuffleMask
{
    uint8_t bytes[MAX_QUAD_BYTES];
};

struct LengthClassTable
{
    uint8_t quad_length[256]; ///< Data bytes consumed by all 4 lanes
    uint8_t lane_length[256][QUAD_SIZE]; ///< Byte width per lane (1-4)
    uint8_t lane_offset[256][QUAD_SIZE]; ///< Start of each lane within the quad's data bytes
    ShuffleMask decode_x86[256];
    ShuffleMask decode_neon[256];
    ShuffleMask encode_x86[256];
    ShuffleMask encode_neon[256];
};

constexpr unsigned laneCode(unsigned control, unsigned lane)
{
    return (control >> (2u * lane)) & 3u;
}

constexpr LengthClassTable buildLengthClassTable()
{
    LengthClassTable t{};

    for (unsigned c = 0; c < 256u; ++c)
    {
        unsigned offset = 0;
        for (unsigned lane = 0; lane < QUAD_SIZE; ++lane)
        {
            const unsigned w = laneCode(c, lane) + 1u;
            t.lane_length[c][lane] = static_cast<uint8_t>(w);
            t.lane_offset[c][lane] = static_cast<uint8_t>(offset);

            for (unsigned k = 0; k < 4u; ++k)
            {
                const unsigned lane_byte = lane * 4u + k;
                if (k < w)
                {
                    t.decode_x86[c].bytes[lane_byte] = static_cast<uint8_t>(offset + k);
                    t.decode_neon[c].bytes[lane_byte] = static_cast<uint8_t>(offset + k);
                    t.encode_x86[c].bytes[offset + k] = static_cast<uint8_t>(lane_byte);
                    t.encode_neon[c].bytes[offset + k] = static_cast<uint8_t>(lane_byte);
                }
                else
                {
                    t.decode_x86[c].bytes[lane_byte] = X86_ZERO_FILL;
                    t.decode_neon[c].bytes[lane_byte] = NEON_ZERO_FILL;
                }
            }
            offset += w;
        }

        t.quad_length[c] = static_cast<uint8_t>(offset);
        for (unsigned k = offset; k < MAX_QUAD_BYTES; ++k)
        {
            t.encode_x86[c].bytes[k] = X86_ZERO_FILL;
            t.encode_neon[c].bytes[k] = NEON_ZERO_FILL;
        }
    }

    return t;
}

/// Cross-check every entry: lane widths sum to the quad length, offsets are
/// running sums, and both decode masks address exactly the bytes of their lane.
constexpr bool isConsistent(const LengthClassTable & t)
{
    for (unsigned c = 0; c < 256u; ++c)
    {
        unsigned sum = 0;
        for (unsigned lane = 0; lane < QUAD_SIZE; ++lane)
        {
            const unsigned w = t.lane_length[c][lane];
            if (w != laneCode(c, lane) + 1u || t.lane_offset[c][lane] != sum)
                return false;

            for (unsigned k = 0; k < 4u; ++k)
            {
                const uint8_t x86 = t.decode_x86[c].bytes[lane * 4u + k];
                const uint8_t neon = t.decode_neon[c].bytes[lane * 4u + k];
                if (k < w && (x86 != sum + k || neon != sum + k))
                    return false;
                if (k >= w && ((x86 & 0x80u) == 0u || neon < MAX_QUAD_BYTES))
                    return false;
            }
            sum += w;
        }
        if (sum != t.quad_length[c] || sum < 4u || sum > MAX_QUAD_BYTES)
            return false;
    }
    return true;
}

inline constexpr LengthClassTable kLengthClassTable = buildLengthClassTable();

static_assert(isConsistent(kLengthClassTable), "length class table is corrupt");
static_assert(kLengthClassTable.quad_length[0x00] == 4u, "all 1-byte lanes");
static_assert(kLengthClassTable.quad_length[0xFF] == 16u, "all 4-byte lanes");
// codes 0,1,2,0 -> widths 1,2,3,1
static_assert(kLengthClassTable.quad_length[0x24] == 7u, "mixed lanes");
static_assert(kLengthClassTable.decode_x86[0x24].bytes[8] == 3u && kLengthClassTable.decode_x86[0x24].bytes[12] == 6u, "lane offsets");

} // namespace streamvbyte::scalar::detail
