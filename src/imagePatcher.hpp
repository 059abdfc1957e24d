#ifndef IMAGE_PATCHER_HPP
#define IMAGE_PATCHER_HPP

#include <cstdint>
#include <expected>
#include <string>

#include "Header/splHeader.hpp"
#include "Utility/headerError.hpp"

/**
 * @brief Rewrites the header at the start of a disk image in place.
 *
 * When booting from eMMC the boot ROM reads the header at byte 0 instead of
 * at the start of the SPL partition. The patcher stores the backup SPL
 * address there and replaces the CRC with CRC_SENTINEL, so the ROM's check
 * fails and it loads the real SPL from the backup address.
 *
 * The first 1024 bytes are trusted to be a header; nothing is validated.
 */
class ImagePatcher {
public:
    /**
     * @brief Patch the header of the image at path.
     *
     * @param path Image file, opened for reading and writing
     * @param backupOffset New backup SPL address, 0 keeps the stored one
     * @return The header as written, or FileNotFound, PermissionDenied,
     *         TruncatedFile or IoError
     *
     * @note Only bytes [0, 1024) are rewritten
     */
    std::expected<SplHeader, HeaderError> patchImageHeader(const std::string& path, uint32_t backupOffset);
};

#endif
