#pragma once

#include <cstddef>
#include <cstdint>
#include <iostream>

namespace tabstate {

// Extents represents a memory address range holding the bytes of one tab
// state file, and provides helpers for bounds checking.
struct Extents {
    // start is the first valid memory address in the range.
    const uint8_t* start;

    // end is the last valid memory address in the range + 1. That is, the range
    // is exclusive.
    const uint8_t* end;

    // valid returns whether a read would stay in the bounds of the extent.
    bool valid(const uint8_t* at, size_t count) const {
        return at >= start && at <= end && count <= static_cast<size_t>(end - at);
    }

    // remaining returns the number of bytes between at and the end of the range.
    size_t remaining(const uint8_t* at) const {
        if (at < start || at >= end)
            return 0;

        return static_cast<size_t>(end - at);
    }

    size_t size() const {
        return static_cast<size_t>(end - start);
    }
};

template <typename CharT>
std::basic_ostream<CharT>& operator<<(std::basic_ostream<CharT>& s, const Extents& e) {
    auto state = s.flags();
    s << "[0x" << std::hex << reinterpret_cast<uintptr_t>(e.start)
      << ", 0x" << reinterpret_cast<uintptr_t>(e.end) << "]";
    s.flags(state);
    return s;
}

}
