#include "Common/EndianUtils.h"

namespace EndianUtils {

uint32_t load_big_32(const uint8_t* data)
{
    return (static_cast<uint32_t>(data[0]) << 24) | (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8)  |  static_cast<uint32_t>(data[3]);
}

uint32_t load_little_32(const uint8_t* data)
{
    return (static_cast<uint32_t>(data[3]) << 24) | (static_cast<uint32_t>(data[2]) << 16) |
           (static_cast<uint32_t>(data[1]) << 8)  |  static_cast<uint32_t>(data[0]);
}

uint16_t load_little_16(const uint8_t* data)
{
    return static_cast<uint16_t>((data[1] << 8) | data[0]);
}

void store_big_32(uint8_t* data, uint32_t value)
{
    data[0] = static_cast<uint8_t>(value >> 24);
    data[1] = static_cast<uint8_t>(value >> 16);
    data[2] = static_cast<uint8_t>(value >> 8);
    data[3] = static_cast<uint8_t>(value);
}

void store_big_16(uint8_t* data, uint16_t value)
{
    data[0] = static_cast<uint8_t>(value >> 8);
    data[1] = static_cast<uint8_t>(value);
}

void store_little_32(uint8_t* data, uint32_t value)
{
    data[0] = static_cast<uint8_t>(value);
    data[1] = static_cast<uint8_t>(value >> 8);
    data[2] = static_cast<uint8_t>(value >> 16);
    data[3] = static_cast<uint8_t>(value >> 24);
}

void store_big_64(uint8_t* data, uint64_t value)
{
    store_big_32(data, static_cast<uint32_t>(value >> 32));
    store_big_32(data + 4, static_cast<uint32_t>(value));
}

}; // namespace EndianUtils
