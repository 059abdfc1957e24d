#include "cli.hpp"
#include "Header/splHeader.hpp"
#include "Utility/log.hpp"
#include "Utility/utils.hpp"
#include "headerInspector.hpp"
#include "imagePatcher.hpp"
#include "splWriter.hpp"

#include <iostream>
#include <string>

#include <CLI/CLI.hpp>

using namespace std;

/* -------------------------- MODE HANDLERS -------------------------- */

namespace {

int runCreate(const string& file, const RunSettings& settings) {
    SplWriter writer;
    auto result = writer.buildSplOutput(file, settings.version, settings.backupAddr, settings.maxPayloadSize);
    if (!result) {
        Log::error(result.error().toString());
        return 1;
    }
    Log::info("SPL header written to " + result->outputPath +
              " (file_size " + to_string(result->header.fileSize) +
              ", crc32 " + toHex(result->header.crc32) + ")");
    return 0;
}

int runFix(const string& file, const RunSettings& settings) {
    ImagePatcher patcher;
    auto result = patcher.patchImageHeader(file, settings.backupAddr);
    if (!result) {
        Log::error(result.error().toString());
        return 1;
    }
    return 0;
}

int runShow(const string& file, bool jsonOutput) {
    HeaderInspector inspector;
    auto report = inspector.inspect(file);
    if (!report) {
        Log::error(report.error().toString());
        return 1;
    }

    // Requested output, not a diagnostic: printed even in quiet mode
    if (jsonOutput) {
        cout << report->toJson().dump(2) << endl;
    } else {
        cout << report->toString() << endl;
    }
    return 0;
}

}

/* -------------------------- SETTINGS -------------------------- */

RunMode selectMode(bool createHeader, bool fixHeader, bool showHeader) {
    if (createHeader) return RunMode::CreateHeader;
    if (fixHeader) return RunMode::FixHeader;
    if (showHeader) return RunMode::ShowHeader;
    return RunMode::None;
}

expected<RunSettings, HeaderError> resolveSettings(
    const ToolConfig& config, const optional<string>& backupText, const optional<string>& versionText) {

    RunSettings settings;
    settings.backupAddr = config.backupAddr;
    settings.version = config.version;
    settings.maxPayloadSize = config.maxPayloadSize;
    settings.quiet = config.quiet;
    settings.verbose = config.verbose;

    // Explicit flags win over the config file
    if (backupText) {
        auto parsed = parseU32(*backupText);
        if (!parsed) {
            return unexpected(HeaderError{HeaderErrorCode::InvalidArgument, "--backup-addr: " + parsed.error().message});
        }
        settings.backupAddr = *parsed;
    }

    if (versionText) {
        auto parsed = parseU32(*versionText);
        if (!parsed) {
            return unexpected(HeaderError{HeaderErrorCode::InvalidArgument, "--version: " + parsed.error().message});
        }
        settings.version = *parsed;
    }

    return settings;
}

int runMode(RunMode mode, const string& file, const RunSettings& settings, bool jsonOutput) {
    try {
        switch (mode) {
            case RunMode::CreateHeader: return runCreate(file, settings);
            case RunMode::FixHeader: return runFix(file, settings);
            case RunMode::ShowHeader: return runShow(file, jsonOutput);
            case RunMode::None: return 0;
        }
    } catch (const exception& e) {
        Log::error("Unexpected failure: " + string(e.what()));
        return 1;
    }
    return 0;
}

/* -------------------------- COMMAND LINE -------------------------- */

int runCli(int argc, const char* const* argv) {

    CLI::App app{"splhdr - SPL boot header tool\nCreates the boot header for an SPL binary, or breaks the header CRC of a disk image so the boot ROM falls back to the backup SPL."};

    bool createHeader = false;
    bool fixHeader = false;
    bool showHeader = false;
    bool jsonOutput = false;
    bool quiet = false;
    bool verbose = false;

    string backupAddrText = toHex(SplHeader::DEFAULT_BACKUP_OFFSET);
    string versionText = toHex(SplHeader::DEFAULT_VERSION);
    string file;
    string configFile;

    app.add_flag("-c,--create-header,--creat-splhdr", createHeader, "Create the SPL header, writes <file>.normal.out");
    app.add_flag("-i,--fix-header,--fix-imghdr", fixHeader, "Fix the image header in place for eMMC boot");
    app.add_flag("-s,--show-header", showHeader, "Display the header at the start of <file>");
    CLI::Option* backupOpt = app.add_option("-a,--backup-addr,--spl-bak-addr", backupAddrText, "Backup SPL address (hex or decimal)")
        ->capture_default_str();
    CLI::Option* versionOpt = app.add_option("-v,--version", versionText, "Header version (hex or decimal)")
        ->capture_default_str();
    app.add_option("-f,--file", file, "Input file name")->required();
    app.add_option("--config", configFile, "JSON file with default settings")->check(CLI::ExistingFile);
    app.add_flag("--json", jsonOutput, "Print --show-header output as JSON");
    app.add_flag("-q,--quiet", quiet, "Suppress success messages");
    app.add_flag("--verbose", verbose, "Print each processing step");

    if (argc <= 1) {
        cout << app.help() << endl;
        return 1;
    }

    CLI11_PARSE(app, argc, argv);

    Log::initFromEnvironment();

    ToolConfig config;
    if (!configFile.empty()) {
        auto loaded = ToolConfig::loadFromFile(configFile);
        if (!loaded) {
            Log::error(loaded.error().toString());
            return 1;
        }
        config = *loaded;
    }

    auto settings = resolveSettings(
        config,
        backupOpt->count() > 0 ? optional<string>(backupAddrText) : nullopt,
        versionOpt->count() > 0 ? optional<string>(versionText) : nullopt);
    if (!settings) {
        Log::error(settings.error().toString());
        return 1;
    }

    Log::setQuiet(quiet || settings->quiet);
    if (verbose || settings->verbose) {
        Log::setVerbose(true);
    }

    return runMode(selectMode(createHeader, fixHeader, showHeader), file, *settings, jsonOutput);
}
