#ifndef TOOL_CONFIG_HPP
#define TOOL_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>

#include <nlohmann/json.hpp>

#include "Header/splHeader.hpp"
#include "Utility/headerError.hpp"

/**
 * @brief Defaults for a run, optionally loaded from a JSON file.
 *
 * Recognised keys: "backup_addr", "version" (number or "0x.." string),
 * "max_payload_size" (number), "quiet", "verbose" (bool). Other keys are
 * ignored.
 */
struct ToolConfig {
    uint32_t backupAddr = SplHeader::DEFAULT_BACKUP_OFFSET;
    uint32_t version = SplHeader::DEFAULT_VERSION;
    size_t maxPayloadSize = SplHeader::MAX_PAYLOAD_SIZE;
    bool quiet = false;
    bool verbose = false;

    static std::expected<ToolConfig, HeaderError> fromJson(const nlohmann::json& config);
    static std::expected<ToolConfig, HeaderError> loadFromFile(const std::string& path);
};

#endif
