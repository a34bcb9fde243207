#pragma once

#include <cstdint>
#include <string>

#include "util/error.hh"
#include "tabstate/parser.hh"

namespace tabstate {

// SingleDataBlock holds the entire content of a tab whose size was known when
// it was written. No replay applies; data is the text.
struct SingleDataBlock {
    uint64_t offset;
    uint64_t deleted;
    uint64_t added;
    std::u16string data;
    uint8_t reserved;
    uint32_t checksum;

    // checksum_at is the address of the checksum field. Everything from the
    // file state byte up to here is covered by the checksum.
    const uint8_t* checksum_at;

    static Error parse(
            SingleDataBlock* b,
            Parser* p);
};

// MultiDataExtraHeader precedes the edit records of a multi-block tab.
struct MultiDataExtraHeader {
    uint8_t reserved[4];
    uint32_t checksum;

    // checksum_at is the address of the checksum field. Everything from the
    // file state byte up to here is covered by the checksum.
    const uint8_t* checksum_at;

    static Error parse(
            MultiDataExtraHeader* h,
            Parser* p);
};

// MultiDataBlock is one recorded edit: `added` code units inserted at offset,
// or `deleted` code units removed from offset.
struct MultiDataBlock {
    uint64_t offset;
    uint64_t deleted;
    uint64_t added;
    std::u16string data;
    uint32_t checksum;

    // begin and checksum_at delimit the bytes covered by the checksum.
    const uint8_t* begin;
    const uint8_t* checksum_at;

    static Error parse(
            MultiDataBlock* b,
            Parser* p);
};

}
