#include "headerInspector.hpp"
#include "Utility/crc32.hpp"
#include "Utility/utils.hpp"

#include <algorithm>
#include <fstream>
#include <vector>
#include <iomanip>
#include <sstream>

using namespace std;

string crcStatusName(CrcStatus status) {
    switch (status) {
        case CrcStatus::Valid: return "valid";
        case CrcStatus::Sentinel: return "sentinel";
        case CrcStatus::Mismatch: return "mismatch";
        default: return "unknown";
    }
}

expected<InspectReport, HeaderError> HeaderInspector::inspect(const string& path) {

    auto totalSize = fileSizeOf(path);
    if (!totalSize) {
        return unexpected(totalSize.error());
    }
    if (*totalSize < SplHeader::SIZE) {
        return unexpected(HeaderError::truncatedFile(path, *totalSize, SplHeader::SIZE));
    }

    ifstream fileStream(path, ios::binary);
    if (!fileStream.is_open()) {
        return unexpected(classifyOpenFailure(path));
    }

    auto header = SplHeader::readBinary(fileStream);
    if (!header) {
        return unexpected(HeaderError::truncatedFile(path, header.error().actual, SplHeader::SIZE));
    }

    InspectReport report;
    report.path = path;
    report.header = *header;
    report.payloadBytes = *totalSize - SplHeader::SIZE;

    // Only the bytes the header claims are checksummed, streamed in chunks
    uint64_t covered = min<uint64_t>(header->fileSize, report.payloadBytes);
    vector<uint8_t> chunk(CHUNK_SIZE);
    Crc32 digest;
    uint64_t remaining = covered;
    while (remaining > 0) {
        size_t want = static_cast<size_t>(min<uint64_t>(remaining, chunk.size()));
        fileStream.read(reinterpret_cast<char*>(chunk.data()), static_cast<streamsize>(want));
        size_t got = static_cast<size_t>(fileStream.gcount());
        if (got == 0) {
            break;
        }
        digest.update(chunk.data(), got);
        remaining -= got;
    }
    if (fileStream.bad()) {
        return unexpected(HeaderError::ioError("Failed to read " + path));
    }
    covered -= remaining;
    report.computedCrc = digest.finalize();

    if (header->hasSentinelCrc()) {
        report.crcStatus = CrcStatus::Sentinel;
    } else if (covered == header->fileSize && report.computedCrc == header->crc32) {
        report.crcStatus = CrcStatus::Valid;
    } else {
        report.crcStatus = CrcStatus::Mismatch;
    }

    return report;
}

nlohmann::json InspectReport::toJson() const {
    return {
        {"file", path},
        {"header", header.toJson()},
        {"payload_bytes", payloadBytes},
        {"computed_crc32", toHex(computedCrc)},
        {"crc_status", crcStatusName(crcStatus)}
    };
}

string InspectReport::toString() const {
    ostringstream oss;
    oss << "Header of " << path << "\n";
    oss << left;
    oss << "  " << setw(16) << "spl_offset" << toHex(header.splOffset) << "\n";
    oss << "  " << setw(16) << "backup_offset" << toHex(header.backupOffset) << "\n";
    oss << "  " << setw(16) << "version" << toHex(header.version) << "\n";
    oss << "  " << setw(16) << "file_size" << header.fileSize << "\n";
    oss << "  " << setw(16) << "image_offset" << toHex(header.imageOffset) << "\n";
    oss << "  " << setw(16) << "crc32" << toHex(header.crc32)
        << " (" << crcStatusName(crcStatus) << ", computed " << toHex(computedCrc) << ")\n";
    oss << "  " << setw(16) << "payload_bytes" << payloadBytes;
    return oss.str();
}
