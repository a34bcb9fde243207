#include "tabstate/parser.hh"

#include <cstring>

namespace tabstate {

Error Parser::u8(uint8_t* x) {
    if (!file.valid(address, 1))
        return error_new(Error::TRUNCATEDSTREAM)
            << "end of stream at offset " << position();

    *x = *address;
    ++address;

    return Error();
}

Error Parser::bytes(
        uint8_t* out,
        size_t n) {
    if (!file.valid(address, n))
        return error_new(Error::TRUNCATEDSTREAM)
            << "need " << n << " bytes at offset " << position()
            << ", " << remaining() << " remaining";

    std::memcpy(out, address, n);
    address += n;

    return Error();
}

Error Parser::varint(uint64_t* x) {
    const uint8_t* at = address;
    uint64_t value = 0;

    for (unsigned i = 0; ; ++i) {
        if (i >= VARINT_MAX_BYTES)
            return error_new(Error::INVALIDFORMAT)
                << "varint at offset " << position() << " is longer than "
                << VARINT_MAX_BYTES << " bytes";
        if (!file.valid(at, 1))
            return error_new(Error::TRUNCATEDSTREAM)
                << "end of stream inside varint at offset " << position();

        uint8_t b = *at;
        ++at;

        uint64_t payload = b & 0x7F;
        unsigned shift = i * 7;
        // The tenth byte may only carry the single remaining bit.
        if (shift == 63 && payload > 1)
            return error_new(Error::INVALIDFORMAT)
                << "varint at offset " << position() << " overflows 64 bits";
        value |= payload << shift;

        if ((b & 0x80) == 0)
            break;
    }

    *x = value;
    address = at;

    return Error();
}

Error Parser::checksum(uint32_t* x) {
    uint8_t b[4] = { 0 };
    CHECK(bytes(b, sizeof(b)),
        Error::BADREAD) << "failed to read checksum";

    *x = (static_cast<uint32_t>(b[0]) << 24)
        | (static_cast<uint32_t>(b[1]) << 16)
        | (static_cast<uint32_t>(b[2]) << 8)
        | static_cast<uint32_t>(b[3]);

    return Error();
}

Error Parser::wstring(
        std::u16string* s,
        uint64_t count) {
    if (count > remaining() / 2)
        return error_new(Error::TRUNCATEDSTREAM)
            << "string of " << count << " code units at offset " << position()
            << " exceeds the " << remaining() << " remaining bytes";

    s->clear();
    s->reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; ++i) {
        char16_t c = static_cast<char16_t>(
            static_cast<uint16_t>(address[0]) | (static_cast<uint16_t>(address[1]) << 8));
        s->push_back(c);
        address += 2;
    }

    return Error();
}

}
