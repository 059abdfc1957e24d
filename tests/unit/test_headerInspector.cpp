#include "headerInspector.hpp"
#include "imagePatcher.hpp"
#include "splWriter.hpp"
#include "Utility/crc32.hpp"
#include "Utility/log.hpp"
#include "scratchDir.hpp"

#include <catch2/catch_all.hpp>
#include <filesystem>
#include <vector>

using test_files::ScratchDir;
using test_files::patternBytes;
using test_files::readAll;

TEST_CASE("HeaderInspector reports CRC status", "[inspector]") {
    Log::setQuiet(true);
    ScratchDir dir;
    std::string input = dir.write("spl.bin", patternBytes(300));

    SplWriter writer;
    auto built = writer.buildSplOutput(input);
    REQUIRE(built.has_value());

    HeaderInspector inspector;

    SECTION("Fresh output is valid") {
        auto report = inspector.inspect(built->outputPath);
        REQUIRE(report.has_value());
        REQUIRE(report->crcStatus == CrcStatus::Valid);
        REQUIRE(report->payloadBytes == 300);
        REQUIRE(report->header == built->header);
    }

    SECTION("Patched output shows the sentinel") {
        ImagePatcher patcher;
        REQUIRE(patcher.patchImageHeader(built->outputPath, 0).has_value());
        auto report = inspector.inspect(built->outputPath);
        REQUIRE(report.has_value());
        REQUIRE(report->crcStatus == CrcStatus::Sentinel);
        REQUIRE(report->toJson()["crc_status"] == "sentinel");
    }

    SECTION("Corrupted payload is a mismatch") {
        auto bytes = readAll(built->outputPath);
        bytes[1024 + 10] ^= 0xFF;
        std::string corrupted = dir.write("corrupted.out", bytes);
        auto report = inspector.inspect(corrupted);
        REQUIRE(report.has_value());
        REQUIRE(report->crcStatus == CrcStatus::Mismatch);
    }

    SECTION("Short payload is a mismatch") {
        auto bytes = readAll(built->outputPath);
        bytes.resize(1024 + 100);
        std::string cut = dir.write("cut.out", bytes);
        auto report = inspector.inspect(cut);
        REQUIRE(report.has_value());
        REQUIRE(report->payloadBytes == 100);
        REQUIRE(report->crcStatus == CrcStatus::Mismatch);
    }

    SECTION("Text rendering names every field") {
        auto report = inspector.inspect(built->outputPath);
        REQUIRE(report.has_value());
        std::string text = report->toString();
        REQUIRE(text.find("spl_offset") != std::string::npos);
        REQUIRE(text.find("0x240") != std::string::npos);
        REQUIRE(text.find("0x200000") != std::string::npos);
        REQUIRE(text.find("valid") != std::string::npos);
    }
}

TEST_CASE("HeaderInspector handles multi-gigabyte images", "[inspector]") {
    ScratchDir dir;
    std::vector<uint8_t> zeros(3, 0);
    SplHeader header = SplHeader::create(SplHeader::DEFAULT_VERSION, 0x100000);
    header.fileSize = 3;
    header.crc32 = Crc32::compute(zeros);
    auto bytes = header.serialize();

    std::string path = dir.write("sdcard.img", std::vector<uint8_t>(bytes.begin(), bytes.end()));
    const uint64_t imageSize = 2ull * 1024 * 1024 * 1024;
    std::filesystem::resize_file(path, imageSize);

    HeaderInspector inspector;
    auto report = inspector.inspect(path);
    REQUIRE(report.has_value());
    REQUIRE(report->header == header);
    REQUIRE(report->payloadBytes == imageSize - 1024);
    REQUIRE(report->crcStatus == CrcStatus::Valid);
}

TEST_CASE("HeaderInspector error cases", "[inspector]") {
    ScratchDir dir;
    HeaderInspector inspector;

    SECTION("Truncated file") {
        auto report = inspector.inspect(dir.write("tiny.img", patternBytes(10)));
        REQUIRE_FALSE(report.has_value());
        REQUIRE(report.error().code == HeaderErrorCode::TruncatedFile);
    }

    SECTION("Missing file") {
        auto report = inspector.inspect(dir.path("missing.img"));
        REQUIRE_FALSE(report.has_value());
        REQUIRE(report.error().code == HeaderErrorCode::FileNotFound);
    }
}
