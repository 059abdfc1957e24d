#include "crc32.hpp"

using namespace std;

const array<uint32_t, 256>& Crc32::table() {
    static const array<uint32_t, 256> crcTable = [] {
        array<uint32_t, 256> t{};
        for (uint32_t i = 0; i < 256; i++) {
            uint32_t c = i;
            for (int j = 0; j < 8; j++) {
                c = (c & 1) ? (POLYNOMIAL ^ (c >> 1)) : (c >> 1);
            }
            t[i] = c;
        }
        return t;
    }();
    return crcTable;
}

void Crc32::update(const uint8_t* data, size_t size) {
    const auto& t = table();
    uint32_t crc = state;
    for (size_t i = 0; i < size; ++i) {
        crc = t[(crc ^ data[i]) & 0xFF] ^ (crc >> 8);
    }
    state = crc;
}

uint32_t Crc32::compute(const uint8_t* data, size_t size) {
    Crc32 digest;
    digest.update(data, size);
    return digest.finalize();
}
