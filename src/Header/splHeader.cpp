#include "splHeader.hpp"
#include "Utility/utils.hpp"

#include <algorithm>
#include <istream>
#include <ostream>

using namespace std;

SplHeader SplHeader::create(uint32_t version, uint32_t backupOffset) {
    SplHeader header;
    header.splOffset = SPL_OFFSET;
    header.backupOffset = backupOffset;
    header.version = version;
    header.imageOffset = IMAGE_OFFSET;
    return header;
}

array<uint8_t, SplHeader::SIZE> SplHeader::serialize() const {

    array<uint8_t, SIZE> out{};

    putU32LE(&out[SPL_OFFSET_POS], splOffset);
    putU32LE(&out[BACKUP_OFFSET_POS], backupOffset);
    copy(reservedA.begin(), reservedA.end(), out.begin() + RESERVED_A_POS);
    putU32LE(&out[VERSION_POS], version);
    putU32LE(&out[FILE_SIZE_POS], fileSize);
    putU32LE(&out[IMAGE_OFFSET_POS], imageOffset);
    putU32LE(&out[CRC32_POS], crc32);
    copy(reservedC.begin(), reservedC.end(), out.begin() + RESERVED_C_POS);

    return out;
}

expected<SplHeader, HeaderError> SplHeader::deserialize(const uint8_t* data, size_t size) {

    if (data == nullptr || size < SIZE) {
        return unexpected(HeaderError::malformedHeader(data == nullptr ? 0 : size, SIZE));
    }

    SplHeader header;
    header.splOffset = getU32LE(data + SPL_OFFSET_POS);
    header.backupOffset = getU32LE(data + BACKUP_OFFSET_POS);
    copy_n(data + RESERVED_A_POS, header.reservedA.size(), header.reservedA.begin());
    header.version = getU32LE(data + VERSION_POS);
    header.fileSize = getU32LE(data + FILE_SIZE_POS);
    header.imageOffset = getU32LE(data + IMAGE_OFFSET_POS);
    header.crc32 = getU32LE(data + CRC32_POS);
    copy_n(data + RESERVED_C_POS, header.reservedC.size(), header.reservedC.begin());

    return header;
}

bool SplHeader::writeBinary(ostream& out) const {
    auto bytes = serialize();
    out.write(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    return out.good();
}

expected<SplHeader, HeaderError> SplHeader::readBinary(istream& in) {
    array<uint8_t, SIZE> buffer{};
    in.read(reinterpret_cast<char*>(buffer.data()), buffer.size());
    return deserialize(buffer.data(), static_cast<size_t>(in.gcount()));
}

nlohmann::json SplHeader::toJson() const {
    bool reservedClear =
        all_of(reservedA.begin(), reservedA.end(), [](uint8_t b) { return b == 0; }) &&
        all_of(reservedC.begin(), reservedC.end(), [](uint8_t b) { return b == 0; });

    return {
        {"spl_offset", toHex(splOffset)},
        {"backup_offset", toHex(backupOffset)},
        {"version", toHex(version)},
        {"file_size", fileSize},
        {"image_offset", toHex(imageOffset)},
        {"crc32", toHex(crc32)},
        {"reserved_zero", reservedClear}
    };
}
