#ifndef CLI_HPP
#define CLI_HPP

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>

#include "Config/toolConfig.hpp"
#include "Utility/headerError.hpp"

enum class RunMode : uint8_t {
    None = 0,
    CreateHeader = 1,
    FixHeader = 2,
    ShowHeader = 3
};

/**
 * @brief Pick the single mode to run. Create wins over fix, fix over show.
 */
RunMode selectMode(bool createHeader, bool fixHeader, bool showHeader);

// Values a run works with once the config file and the flags are merged
struct RunSettings {
    uint32_t backupAddr = 0;
    uint32_t version = 0;
    size_t maxPayloadSize = 0;
    bool quiet = false;
    bool verbose = false;
};

/**
 * @brief Merge numeric flags over the config defaults.
 *
 * @param config Defaults, from a config file or built in
 * @param backupText --backup-addr text, when given on the command line
 * @param versionText --version text, when given on the command line
 * @return Merged settings, or InvalidArgument for an unparsable flag
 */
std::expected<RunSettings, HeaderError> resolveSettings(
    const ToolConfig& config,
    const std::optional<std::string>& backupText,
    const std::optional<std::string>& versionText);

/**
 * @brief Run one mode against file.
 *
 * @return Process exit code: 0 on success or when no mode is selected, 1 on failure
 */
int runMode(RunMode mode, const std::string& file, const RunSettings& settings, bool jsonOutput);

/**
 * @brief Full command line entry point used by main().
 *
 * @return Process exit code
 */
int runCli(int argc, const char* const* argv);

#endif
