#ifndef SPL_WRITER_HPP
#define SPL_WRITER_HPP

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

#include "Header/splHeader.hpp"
#include "Utility/headerError.hpp"

/**
 * @brief Outcome of a successful buildSplOutput call.
 */
struct SplBuildResult {
    SplHeader header;
    std::vector<uint8_t> output;   // serialized header followed by the payload
    std::string outputPath;
};

/**
 * @brief Writer for SPL images with a freshly generated boot header.
 *
 * Reads an SPL binary, prepends a header carrying its size and CRC32, and
 * writes the result next to the input as "<input>.normal.out". The input file
 * is never modified.
 *
 * @note The output is first written to "<output>.tmp" and renamed into place,
 *       so a failed run never leaves a partial output behind
 */
class SplWriter {
private:
    std::string tempFilePath;

    /**
     * @brief Remove the temporary file, if one was created.
     */
    void removeTempFile();

    /**
     * @brief Rename the temporary file to the final filename.
     *
     * @param newFilename Target filename, replaced if it already exists
     * @return true if successful, false otherwise
     */
    bool renameTempFile(const std::string& newFilename);

    std::expected<void, HeaderError> writeTempFile(const std::vector<uint8_t>& output);

public:
    ~SplWriter();

    static std::string outputPathFor(const std::string& inputPath) { return inputPath + ".normal.out"; }

    /**
     * @brief Build the header for an SPL binary and write header plus payload.
     *
     * @param inputPath Path of the raw SPL binary
     * @param version Value for the header's version field
     * @param backupOffset Address of the backup SPL
     * @param maxPayloadSize Largest accepted payload in bytes
     * @return The header and output bytes, or FileNotFound, PermissionDenied,
     *         PayloadTooLarge or IoError
     */
    std::expected<SplBuildResult, HeaderError> buildSplOutput(
        const std::string& inputPath,
        uint32_t version = SplHeader::DEFAULT_VERSION,
        uint32_t backupOffset = SplHeader::DEFAULT_BACKUP_OFFSET,
        size_t maxPayloadSize = SplHeader::MAX_PAYLOAD_SIZE);
};

#endif
