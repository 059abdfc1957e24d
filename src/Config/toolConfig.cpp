#include "toolConfig.hpp"
#include "Utility/utils.hpp"

#include <fstream>
#include <limits>

using namespace std;

namespace {

expected<uint32_t, HeaderError> readU32Field(const nlohmann::json& config, const string& key, uint32_t fallback) {
    if (!config.contains(key)) {
        return fallback;
    }

    const auto& value = config.at(key);
    if (value.is_number_unsigned()) {
        uint64_t number = value.get<uint64_t>();
        if (number > numeric_limits<uint32_t>::max()) {
            return unexpected(HeaderError{HeaderErrorCode::InvalidConfig, "'" + key + "' is out of range for u32"});
        }
        return static_cast<uint32_t>(number);
    }
    if (value.is_string()) {
        auto parsed = parseU32(value.get<string>());
        if (!parsed) {
            return unexpected(HeaderError{HeaderErrorCode::InvalidConfig, "'" + key + "': " + parsed.error().message});
        }
        return *parsed;
    }

    return unexpected(HeaderError{HeaderErrorCode::InvalidConfig, "'" + key + "' must be an unsigned number or a hex string"});
}

expected<bool, HeaderError> readBoolField(const nlohmann::json& config, const string& key, bool fallback) {
    if (!config.contains(key)) {
        return fallback;
    }
    if (!config.at(key).is_boolean()) {
        return unexpected(HeaderError{HeaderErrorCode::InvalidConfig, "'" + key + "' must be a boolean"});
    }
    return config.at(key).get<bool>();
}

}

expected<ToolConfig, HeaderError> ToolConfig::fromJson(const nlohmann::json& config) {

    if (!config.is_object()) {
        return unexpected(HeaderError{HeaderErrorCode::InvalidConfig, "Configuration must be a JSON object"});
    }

    ToolConfig result;

    auto backupAddr = readU32Field(config, "backup_addr", result.backupAddr);
    if (!backupAddr) return unexpected(backupAddr.error());
    result.backupAddr = *backupAddr;

    auto version = readU32Field(config, "version", result.version);
    if (!version) return unexpected(version.error());
    result.version = *version;

    if (config.contains("max_payload_size")) {
        const auto& value = config.at("max_payload_size");
        if (!value.is_number_unsigned()) {
            return unexpected(HeaderError{HeaderErrorCode::InvalidConfig, "'max_payload_size' must be an unsigned number"});
        }
        uint64_t limit = value.get<uint64_t>();
        if (limit > numeric_limits<uint32_t>::max()) {
            return unexpected(HeaderError{HeaderErrorCode::InvalidConfig, "'max_payload_size' does not fit the u32 file_size field"});
        }
        result.maxPayloadSize = static_cast<size_t>(limit);
    }

    auto quiet = readBoolField(config, "quiet", result.quiet);
    if (!quiet) return unexpected(quiet.error());
    result.quiet = *quiet;

    auto verbose = readBoolField(config, "verbose", result.verbose);
    if (!verbose) return unexpected(verbose.error());
    result.verbose = *verbose;

    return result;
}

expected<ToolConfig, HeaderError> ToolConfig::loadFromFile(const string& path) {

    ifstream file(path);
    if (!file.is_open()) {
        return unexpected(classifyOpenFailure(path));
    }

    nlohmann::json config;
    try {
        file >> config;
    } catch (const nlohmann::json::parse_error& e) {
        return unexpected(HeaderError{HeaderErrorCode::InvalidConfig, "Failed to parse " + path + ": " + string(e.what())});
    }

    return fromJson(config);
}
