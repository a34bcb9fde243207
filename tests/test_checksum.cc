#include <catch2/catch.hpp>

#include <cstring>
#include <vector>

#include "tabstate/checksum.hh"

using namespace tabstate;

CATCH_TEST_CASE("crc32 matches the standard check value", "[checksum]") {
    const char* check = "123456789";
    const uint8_t* begin = reinterpret_cast<const uint8_t*>(check);

    CATCH_CHECK(crc32(begin, begin + std::strlen(check)) == 0xCBF43926u);
    CATCH_CHECK(crc32(begin, begin) == 0);
}

CATCH_TEST_CASE("verify reports the computed value", "[checksum]") {
    std::vector<uint8_t> data = { 0x01, 0x00, 0x05, 'h', 0x00 };
    uint32_t expected = crc32(data.data(), data.data() + data.size());

    uint32_t actual = 0;
    CATCH_CHECK(verify(data.data(), data.data() + data.size(), expected, &actual));
    CATCH_CHECK(actual == expected);

    data[3] = 'j';
    CATCH_CHECK_FALSE(verify(data.data(), data.data() + data.size(), expected, &actual));
    CATCH_CHECK(actual != expected);
    CATCH_CHECK(actual == crc32(data.data(), data.data() + data.size()));

    CATCH_CHECK_FALSE(verify(data.data(), data.data() + data.size(), expected));
}
