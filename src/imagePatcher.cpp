#include "imagePatcher.hpp"
#include "Utility/log.hpp"
#include "Utility/utils.hpp"

#include <array>
#include <filesystem>
#include <fstream>

using namespace std;

expected<SplHeader, HeaderError> ImagePatcher::patchImageHeader(const string& path, uint32_t backupOffset) {

    error_code ec;
    if (filesystem::is_directory(path, ec)) {
        return unexpected(HeaderError::ioError(path + " is a directory"));
    }

    fstream fileStream(path, ios::in | ios::out | ios::binary);
    if (!fileStream.is_open()) {
        return unexpected(classifyOpenFailure(path));
    }

    array<uint8_t, SplHeader::SIZE> buffer{};
    fileStream.read(reinterpret_cast<char*>(buffer.data()), buffer.size());
    size_t bytesRead = static_cast<size_t>(fileStream.gcount());
    if (bytesRead < SplHeader::SIZE) {
        return unexpected(HeaderError::truncatedFile(path, bytesRead, SplHeader::SIZE));
    }

    auto header = SplHeader::deserialize(buffer.data(), bytesRead);
    if (!header) {
        return unexpected(header.error());
    }

    Log::detail("stored bofs: " + toHex(header->backupOffset) + ", crc32: " + toHex(header->crc32));

    if (backupOffset != 0) {
        header->backupOffset = backupOffset;
    }
    header->crc32 = SplHeader::CRC_SENTINEL;

    fileStream.clear();
    fileStream.seekp(0);
    if (!header->writeBinary(fileStream)) {
        return unexpected(HeaderError::ioError("Failed to write header to " + path));
    }

    fileStream.flush();
    if (!fileStream.good()) {
        return unexpected(HeaderError::ioError("Failed to flush " + path));
    }

    Log::info("IMG " + path + " fixed hdr successfully.");
    return *header;
}
