#ifndef CRC32_HPP
#define CRC32_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

/**
 * @brief CRC-32/ISO-HDLC digest (reflected polynomial 0xEDB88320).
 *
 * Initial value 0xFFFFFFFF, final XOR 0xFFFFFFFF. The check value over the
 * ASCII string "123456789" is 0xCBF43926.
 */
class Crc32 {
private:
    inline static constexpr uint32_t POLYNOMIAL = 0xEDB88320;
    inline static constexpr uint32_t INITIAL = 0xFFFFFFFF;

    uint32_t state = INITIAL;

    static const std::array<uint32_t, 256>& table();

public:
    void update(const uint8_t* data, size_t size);
    void update(const std::vector<uint8_t>& data) { update(data.data(), data.size()); }

    uint32_t finalize() const { return state ^ 0xFFFFFFFF; }
    void reset() { state = INITIAL; }

    static uint32_t compute(const uint8_t* data, size_t size);
    static uint32_t compute(const std::vector<uint8_t>& data) { return compute(data.data(), data.size()); }
};

#endif
