#include "imagePatcher.hpp"
#include "Utility/log.hpp"
#include "scratchDir.hpp"

#include <catch2/catch_all.hpp>
#include <algorithm>

using test_files::ScratchDir;
using test_files::patternBytes;
using test_files::readAll;

namespace {

std::vector<uint8_t> makeImage(uint32_t backupOffset, size_t tailSize) {
    SplHeader header = SplHeader::create(SplHeader::DEFAULT_VERSION, backupOffset);
    header.fileSize = static_cast<uint32_t>(tailSize);
    header.crc32 = 0x12345678;
    header.reservedA[100] = 0x77;
    auto bytes = header.serialize();

    std::vector<uint8_t> image(bytes.begin(), bytes.end());
    auto tail = patternBytes(tailSize, 3);
    image.insert(image.end(), tail.begin(), tail.end());
    return image;
}

}

TEST_CASE("ImagePatcher overrides the backup address", "[imagePatcher]") {
    Log::setQuiet(true);
    ScratchDir dir;
    auto original = makeImage(0x100000, 4096);
    std::string path = dir.write("sdcard.img", original);

    ImagePatcher patcher;
    auto result = patcher.patchImageHeader(path, 0x300000);
    REQUIRE(result.has_value());
    REQUIRE(result->backupOffset == 0x300000);
    REQUIRE(result->crc32 == 0x5A5A5A5A);

    auto patched = readAll(path);
    REQUIRE(patched.size() == original.size());

    auto header = SplHeader::deserialize(patched);
    REQUIRE(header.has_value());
    REQUIRE(header->backupOffset == 0x300000);
    REQUIRE(header->crc32 == 0x5A5A5A5A);
    REQUIRE(header->version == SplHeader::DEFAULT_VERSION);
    REQUIRE(header->fileSize == 4096);
    REQUIRE(header->reservedA[100] == 0x77);

    REQUIRE(std::equal(patched.begin() + 1024, patched.end(), original.begin() + 1024));
}

TEST_CASE("ImagePatcher keeps the backup address when given zero", "[imagePatcher]") {
    Log::setQuiet(true);
    ScratchDir dir;
    auto original = makeImage(0x100000, 512);
    std::string path = dir.write("sdcard.img", original);

    ImagePatcher patcher;
    auto result = patcher.patchImageHeader(path, 0);
    REQUIRE(result.has_value());

    auto patched = readAll(path);
    auto header = SplHeader::deserialize(patched);
    REQUIRE(header.has_value());
    REQUIRE(header->backupOffset == 0x100000);
    REQUIRE(header->crc32 == 0x5A5A5A5A);

    // Only the four CRC bytes differ
    for (size_t i = 0; i < patched.size(); ++i) {
        if (i >= SplHeader::CRC32_POS && i < SplHeader::CRC32_POS + 4) continue;
        REQUIRE(patched[i] == original[i]);
    }
}

TEST_CASE("ImagePatcher is idempotent", "[imagePatcher]") {
    Log::setQuiet(true);
    ScratchDir dir;
    std::string path = dir.write("sdcard.img", makeImage(0x100000, 2048));

    ImagePatcher patcher;
    REQUIRE(patcher.patchImageHeader(path, 0x300000).has_value());
    auto once = readAll(path);

    REQUIRE(patcher.patchImageHeader(path, 0x300000).has_value());
    auto twice = readAll(path);

    REQUIRE(once == twice);
}

TEST_CASE("ImagePatcher accepts any 1024 byte prefix", "[imagePatcher]") {
    Log::setQuiet(true);
    ScratchDir dir;
    std::string path = dir.write("raw.img", patternBytes(1024, 9));

    ImagePatcher patcher;
    auto result = patcher.patchImageHeader(path, 0x200000);
    REQUIRE(result.has_value());
    REQUIRE(readAll(path).size() == 1024);
    REQUIRE(result->backupOffset == 0x200000);
}

TEST_CASE("ImagePatcher error cases", "[imagePatcher]") {
    Log::setQuiet(true);
    ScratchDir dir;
    ImagePatcher patcher;

    SECTION("Truncated file is rejected and left alone") {
        auto shortImage = patternBytes(1023);
        std::string path = dir.write("short.img", shortImage);
        auto result = patcher.patchImageHeader(path, 0x300000);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == HeaderErrorCode::TruncatedFile);
        REQUIRE(result.error().actual == 1023);
        REQUIRE(readAll(path) == shortImage);
    }

    SECTION("Missing file") {
        auto result = patcher.patchImageHeader(dir.path("missing.img"), 0x300000);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == HeaderErrorCode::FileNotFound);
    }
}
