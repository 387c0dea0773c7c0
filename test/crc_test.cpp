#include <cyphal/util/crc.hpp>
#include <doctest/doctest.h>

using namespace cyphal;

TEST_CASE("CRC - check values") {
    SUBCASE("standard check string") {
        const char *text = "123456789";
        CHECK(crc::compute(DataSpan(reinterpret_cast<const u8 *>(text), 9)) == 0x29B1);
    }

    SUBCASE("bytes 0..7") {
        u8 data[8] = {0, 1, 2, 3, 4, 5, 6, 7};
        CHECK(crc::compute(DataSpan(data, 8)) == 0x178D);
    }

    SUBCASE("empty input is the initial value") { CHECK(crc::compute(DataSpan()) == 0xFFFF); }
}

TEST_CASE("CRC - is usable at compile time") {
    constexpr u8 data[3] = {0x31, 0x32, 0x33};
    constexpr u16 value = crc::update(crc::init(), data, 3);
    static_assert(value == crc::compute(DataSpan(data, 3)));
    CHECK(value != crc::INITIAL);
}

TEST_CASE("CRC - incremental update matches one-shot") {
    u8 data[20];
    for (u8 i = 0; i < 20; ++i)
        data[i] = static_cast<u8>(i * 13 + 7);

    TransferCrc acc;
    acc.add(DataSpan(data, 7)).add(DataSpan(data + 7, 7)).add(DataSpan(data + 14, 6));
    CHECK(acc.value() == crc::compute(DataSpan(data, 20)));

    TransferCrc bytewise;
    for (u8 b : data)
        bytewise.add(b);
    CHECK(bytewise.value() == acc.value());
}

TEST_CASE("CRC - residue") {
    u8 data[11] = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 0};
    u16 crc = crc::compute(DataSpan(data, 9));

    SUBCASE("payload followed by its big-endian CRC leaves zero") {
        data[9] = static_cast<u8>(crc >> 8);
        data[10] = static_cast<u8>(crc & 0xFF);
        TransferCrc acc;
        acc.add(DataSpan(data, 11));
        CHECK(acc.residue_ok());
    }

    SUBCASE("little-endian CRC does not") {
        data[9] = static_cast<u8>(crc & 0xFF);
        data[10] = static_cast<u8>(crc >> 8);
        TransferCrc acc;
        acc.add(DataSpan(data, 11));
        CHECK_FALSE(acc.residue_ok());
    }

    SUBCASE("reset starts over") {
        TransferCrc acc;
        acc.add(0x55);
        acc.reset();
        CHECK(acc.value() == crc::INITIAL);
    }
}
