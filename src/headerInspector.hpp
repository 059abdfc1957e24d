#ifndef HEADER_INSPECTOR_HPP
#define HEADER_INSPECTOR_HPP

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>

#include <nlohmann/json.hpp>

#include "Header/splHeader.hpp"
#include "Utility/headerError.hpp"

enum class CrcStatus : uint8_t {
    Valid = 1,
    Sentinel = 2,
    Mismatch = 3
};

std::string crcStatusName(CrcStatus status);

struct InspectReport {
    std::string path;
    SplHeader header;
    uint64_t payloadBytes = 0;     // bytes present after the header
    uint32_t computedCrc = 0;      // CRC32 over min(fileSize, payloadBytes) bytes
    CrcStatus crcStatus = CrcStatus::Mismatch;

    nlohmann::json toJson() const;
    std::string toString() const;
};

/**
 * @brief Read-only view of a header-prefixed image.
 */
class HeaderInspector {
private:
    inline static constexpr size_t CHUNK_SIZE = 64 * 1024;

public:
    std::expected<InspectReport, HeaderError> inspect(const std::string& path);
};

#endif
