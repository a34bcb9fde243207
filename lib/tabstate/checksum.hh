#pragma once

#include <cstddef>
#include <cstdint>

namespace tabstate {

// crc32 computes the standard (zlib) CRC32 of [begin, end).
uint32_t crc32(
        const uint8_t* begin,
        const uint8_t* end);

// verify returns whether the CRC32 of [begin, end) equals stored. If actual is
// not null, the computed value is written to it.
bool verify(
        const uint8_t* begin,
        const uint8_t* end,
        uint32_t stored,
        uint32_t* actual = nullptr);

}
