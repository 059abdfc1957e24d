#include "Utility/crc32.hpp"

#include <catch2/catch_all.hpp>
#include <string>
#include <vector>

TEST_CASE("Crc32 known values", "[crc32]") {
    SECTION("Standard check string") {
        std::string check = "123456789";
        std::vector<uint8_t> data(check.begin(), check.end());
        REQUIRE(Crc32::compute(data) == 0xCBF43926u);
    }

    SECTION("Empty payload") {
        std::vector<uint8_t> empty;
        REQUIRE(Crc32::compute(empty) == 0x00000000u);
    }

    SECTION("Three byte payload") {
        std::vector<uint8_t> data = {0x01, 0x02, 0x03};
        REQUIRE(Crc32::compute(data) == 0x55BC801Du);
    }

    SECTION("Single character") {
        std::vector<uint8_t> data = {'a'};
        REQUIRE(Crc32::compute(data) == 0xE8B7BE43u);
    }
}

TEST_CASE("Crc32 determinism", "[crc32]") {
    std::vector<uint8_t> data(4096);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<uint8_t>(i * 7);
    }

    SECTION("Repeated calls agree") {
        REQUIRE(Crc32::compute(data) == Crc32::compute(data));
    }

    SECTION("One flipped byte changes the checksum") {
        auto altered = data;
        altered[2048] ^= 0x01;
        REQUIRE(Crc32::compute(altered) != Crc32::compute(data));
    }

    SECTION("Incremental updates match a single pass") {
        Crc32 digest;
        digest.update(data.data(), 1000);
        digest.update(data.data() + 1000, data.size() - 1000);
        REQUIRE(digest.finalize() == Crc32::compute(data));

        digest.reset();
        digest.update(data);
        REQUIRE(digest.finalize() == Crc32::compute(data));
    }
}
