#include "tabstate/checksum.hh"

#include <algorithm>
#include <limits>
#define ZLIB_CONST
#include <zlib.h>

namespace tabstate {

uint32_t crc32(
        const uint8_t* begin,
        const uint8_t* end) {
    uLong crc = ::crc32(0L, Z_NULL, 0);

    // zlib takes a uInt length; feed large ranges in pieces.
    while (begin < end) {
        size_t n = std::min<size_t>(
            static_cast<size_t>(end - begin),
            std::numeric_limits<uInt>::max());
        crc = ::crc32(crc, reinterpret_cast<const Bytef*>(begin), static_cast<uInt>(n));
        begin += n;
    }

    return static_cast<uint32_t>(crc);
}

bool verify(
        const uint8_t* begin,
        const uint8_t* end,
        uint32_t stored,
        uint32_t* actual) {
    uint32_t computed = crc32(begin, end);
    if (actual)
        *actual = computed;

    return computed == stored;
}

}
