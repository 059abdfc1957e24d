#include "splWriter.hpp"
#include "Utility/crc32.hpp"
#include "Utility/log.hpp"
#include "Utility/utils.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <limits>

using namespace std;

SplWriter::~SplWriter() {
    removeTempFile();
}

expected<SplBuildResult, HeaderError> SplWriter::buildSplOutput(
    const string& inputPath, uint32_t version, uint32_t backupOffset, size_t maxPayloadSize) {

    SplHeader header = SplHeader::create(version, backupOffset);

    Log::info("spl_hdr.sofs: " + toHex(header.splOffset) +
              ", spl_hdr.bofs: " + toHex(header.backupOffset) +
              ", spl_hdr.vers: " + toHex(header.version) +
              " name:" + inputPath);

    // file_size is a u32, so nothing larger can be described by the header
    uint64_t limit = min<uint64_t>(maxPayloadSize, numeric_limits<uint32_t>::max());

    auto inputSize = fileSizeOf(inputPath);
    if (!inputSize) {
        return unexpected(inputSize.error());
    }
    if (*inputSize > limit) {
        return unexpected(HeaderError::payloadTooLarge(*inputSize, limit));
    }

    auto payload = readFileBytes(inputPath);
    if (!payload) {
        return unexpected(payload.error());
    }

    // The file may have grown since it was measured
    if (payload->size() > limit) {
        return unexpected(HeaderError::payloadTooLarge(payload->size(), limit));
    }

    header.fileSize = static_cast<uint32_t>(payload->size());
    header.crc32 = Crc32::compute(*payload);
    Log::detail("payload: " + to_string(header.fileSize) + " bytes, crc32 " + toHex(header.crc32));

    SplBuildResult result;
    result.header = header;
    result.outputPath = outputPathFor(inputPath);

    auto headerBytes = header.serialize();
    result.output.reserve(headerBytes.size() + payload->size());
    result.output.insert(result.output.end(), headerBytes.begin(), headerBytes.end());
    result.output.insert(result.output.end(), payload->begin(), payload->end());

    tempFilePath = result.outputPath + ".tmp";
    auto written = writeTempFile(result.output);
    if (!written) {
        removeTempFile();
        return unexpected(written.error());
    }

    if (!renameTempFile(result.outputPath)) {
        removeTempFile();
        return unexpected(HeaderError::ioError("Failed to move " + tempFilePath + " to " + result.outputPath));
    }

    Log::detail("wrote " + to_string(result.output.size()) + " bytes to " + result.outputPath);
    return result;
}

expected<void, HeaderError> SplWriter::writeTempFile(const vector<uint8_t>& output) {

    ofstream file(tempFilePath, ios::binary | ios::trunc);
    if (!file.is_open()) {
        return unexpected(HeaderError::permissionDenied(tempFilePath));
    }
    Log::detail("temp file: " + tempFilePath);

    file.write(reinterpret_cast<const char*>(output.data()), static_cast<streamsize>(output.size()));
    file.close();
    if (file.fail()) {
        return unexpected(HeaderError::ioError("Failed to write " + tempFilePath));
    }

    return {};
}

void SplWriter::removeTempFile() {
    if (tempFilePath.empty()) {
        return;
    }
    error_code ec;
    filesystem::remove(tempFilePath, ec);
    tempFilePath.clear();
}

bool SplWriter::renameTempFile(const string& newFilename) {
    error_code ec;
    filesystem::rename(tempFilePath, newFilename, ec);
    if (ec) {
        return false;
    }
    tempFilePath.clear();
    return true;
}
