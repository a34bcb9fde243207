#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "util/error.hh"
#include "tabstate/extents.hh"

namespace tabstate {

enum {
    // VARINT_MAX_BYTES is the longest encoding of a 64 bit unsigned varint.
    VARINT_MAX_BYTES = 10,
};

// Parser is a cursor over the bytes of a tab state file. Every read is
// bounds checked against `file`; a read that would run past the end fails
// with Error::TRUNCATEDSTREAM and leaves the cursor where it was.
struct Parser {
    const uint8_t* address;
    Extents file;

    static Parser over(
            const uint8_t* data,
            size_t size) {
        Parser p;
        p.file.start = data;
        p.file.end = data + size;
        p.address = data;
        return p;
    }

    // eof returns whether no bytes remain. This is the only termination
    // signal of the multi-block record sequence.
    bool eof() const {
        return address >= file.end;
    }

    size_t remaining() const {
        return file.remaining(address);
    }

    // position returns the offset of the cursor from the start of the file.
    size_t position() const {
        return static_cast<size_t>(address - file.start);
    }

    Error u8(uint8_t* x);

    // bytes copies n raw bytes into out.
    Error bytes(
            uint8_t* out,
            size_t n);

    // varint decodes an unsigned base-128 integer, least significant group
    // first, continuing while the high bit of a byte is set.
    Error varint(uint64_t* x);

    // checksum reads a 4 byte big-endian CRC32 field.
    Error checksum(uint32_t* x);

    // wstring reads count UTF-16LE code units. count is checked against the
    // remaining bytes before anything is allocated.
    Error wstring(
            std::u16string* s,
            uint64_t count);
};

}
