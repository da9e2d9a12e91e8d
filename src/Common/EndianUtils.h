#ifndef _ENDIAN_UTILS_H_
#define _ENDIAN_UTILS_H_

#include <cstdint>

namespace EndianUtils {

    // On-disk structures are decoded byte by byte, so host order never matters
    uint32_t load_big_32(const uint8_t* data);
    uint32_t load_little_32(const uint8_t* data);
    uint16_t load_little_16(const uint8_t* data);

    void store_big_32(uint8_t* data, uint32_t value);
    void store_big_16(uint8_t* data, uint16_t value);
    void store_little_32(uint8_t* data, uint32_t value);
    void store_big_64(uint8_t* data, uint64_t value);
    
};

#endif // _ENDIAN_UTILS_H_
