#ifndef SPL_HEADER_HPP
#define SPL_HEADER_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <istream>
#include <ostream>
#include <vector>

#include <nlohmann/json.hpp>

#include "Utility/headerError.hpp"

/**
 * @brief The 1024 byte header the boot ROM expects in front of an SPL image.
 *
 * On-disk layout, every integer little-endian:
 *
 *   offset  size  field
 *   0       4     splOffset     (0x240)
 *   4       4     backupOffset
 *   8       636   reservedA     (zero)
 *   644     4     version
 *   648     4     fileSize
 *   652     4     imageOffset   (0x400)
 *   656     4     crc32
 *   660     364   reservedC     (zero)
 *
 * The layout is produced by serialize() byte by byte, never by copying the
 * struct, so it does not depend on the compiler's struct packing.
 */
struct SplHeader {

    inline static constexpr size_t SIZE = 1024;

    // Offset of the header inside the boot area: 64 + 256 + 256
    inline static constexpr uint32_t SPL_OFFSET = 0x240;
    // Offset from the header to the SPL image
    inline static constexpr uint32_t IMAGE_OFFSET = 0x400;
    inline static constexpr uint32_t DEFAULT_VERSION = 0x01010101;
    inline static constexpr uint32_t DEFAULT_BACKUP_OFFSET = 0x200000;
    // Written in place of a real checksum so the boot ROM check fails
    inline static constexpr uint32_t CRC_SENTINEL = 0x5A5A5A5A;

    // Boot ROM SRAM window (181072 bytes) minus the header, plus one
    inline static constexpr size_t SRAM_LIMIT = 181072;
    inline static constexpr size_t MAX_PAYLOAD_SIZE = SRAM_LIMIT - SIZE + 1;

    inline static constexpr size_t SPL_OFFSET_POS = 0;
    inline static constexpr size_t BACKUP_OFFSET_POS = 4;
    inline static constexpr size_t RESERVED_A_POS = 8;
    inline static constexpr size_t VERSION_POS = 644;
    inline static constexpr size_t FILE_SIZE_POS = 648;
    inline static constexpr size_t IMAGE_OFFSET_POS = 652;
    inline static constexpr size_t CRC32_POS = 656;
    inline static constexpr size_t RESERVED_C_POS = 660;

    uint32_t splOffset = 0;
    uint32_t backupOffset = 0;
    std::array<uint8_t, 636> reservedA{};
    uint32_t version = 0;
    uint32_t fileSize = 0;
    uint32_t imageOffset = 0;
    uint32_t crc32 = 0;
    std::array<uint8_t, 364> reservedC{};

    /**
     * @brief Build a fresh header.
     *
     * splOffset and imageOffset get their fixed values, reserved bytes are
     * zero, fileSize and crc32 stay zero until a payload is attached.
     */
    static SplHeader create(uint32_t version, uint32_t backupOffset);

    std::array<uint8_t, SIZE> serialize() const;

    /**
     * @brief Decode a header from raw bytes.
     *
     * Only the first SIZE bytes are read. No field is validated: any bit
     * pattern decodes.
     *
     * @return The header, or MalformedHeader when fewer than SIZE bytes are given
     */
    static std::expected<SplHeader, HeaderError> deserialize(const uint8_t* data, size_t size);
    static std::expected<SplHeader, HeaderError> deserialize(const std::vector<uint8_t>& bytes) {
        return deserialize(bytes.data(), bytes.size());
    }

    bool writeBinary(std::ostream& out) const;
    static std::expected<SplHeader, HeaderError> readBinary(std::istream& in);

    bool hasSentinelCrc() const { return crc32 == CRC_SENTINEL; }

    nlohmann::json toJson() const;

    bool operator==(const SplHeader& other) const = default;
};

#endif
