#ifndef _GOD_H_
#define _GOD_H_

#include <cstdint>

/* GoD file structure:
- master hashtable block
- sub hashtable block
- 204 data blocks
- sub hashtable block
- 204 data blocks
- sub hashtable block
- 204 data blocks 
...and so forth
Maximum of 203 sub hashtables per Data file. 
The master hashtable of every Data file but the last gets one extra entry,
the hash of the following Data file's master hashtable block. */
namespace GoD {

    static constexpr uint32_t BLOCK_SIZE = 0x1000;
    static constexpr uint32_t DATA_BLOCKS_PER_SHT = 204;
    static constexpr uint32_t SHT_PER_MHT = 203;
    static constexpr uint32_t DATA_BLOCKS_PER_PART = DATA_BLOCKS_PER_SHT * SHT_PER_MHT;
    static constexpr uint32_t BLOCKS_PER_PART = 0xA290; // data + hash blocks of a full part
    static_assert(BLOCKS_PER_PART == DATA_BLOCKS_PER_PART + SHT_PER_MHT + 1, "GoD part geometry mismatch");

    static constexpr uint32_t HASH_SIZE = 20;
    static constexpr uint32_t HASHES_PER_BLOCK = BLOCK_SIZE / HASH_SIZE;

    enum class ContentType : uint32_t {
        GAMES_ON_DEMAND = 0x7000,
        ORIGINAL_XBOX   = 0x5000,
    };

    // LIVE content header, all offsets absolute
    namespace ConHeader {
        static constexpr uint32_t SIZE                  = 0xB000;
        static constexpr uint32_t MAGIC                 = 0x0000; // "LIVE"
        static constexpr uint32_t LICENSE_ENTRIES       = 0x022C;
        static constexpr uint32_t HEADER_HASH           = 0x032C;
        static constexpr uint32_t HEADER_SIZE           = 0x0340;
        static constexpr uint32_t CONTENT_TYPE          = 0x0344;
        static constexpr uint32_t METADATA_VERSION      = 0x0348;
        static constexpr uint32_t MEDIA_ID              = 0x0354;
        static constexpr uint32_t VERSION               = 0x0358;
        static constexpr uint32_t BASE_VERSION          = 0x035C;
        static constexpr uint32_t TITLE_ID              = 0x0360;
        static constexpr uint32_t PLATFORM              = 0x0364;
        static constexpr uint32_t EXECUTABLE_TYPE       = 0x0365;
        static constexpr uint32_t DISC_NUMBER           = 0x0366;
        static constexpr uint32_t DISC_COUNT            = 0x0367;
        static constexpr uint32_t DESCRIPTOR_SIZE       = 0x0379;
        static constexpr uint32_t MHT_HASH              = 0x037D;
        static constexpr uint32_t BLOCK_COUNT           = 0x0392; // little endian
        static constexpr uint32_t SECONDARY_COUNT       = 0x0396;
        static constexpr uint32_t DATA_PART_COUNT       = 0x03A0; // little endian
        static constexpr uint32_t DATA_PARTS_SIZE       = 0x03A4; // in 0x100 byte units
        static constexpr uint32_t DESCRIPTOR_TYPE       = 0x03A9;
        static constexpr uint32_t DISPLAY_NAME          = 0x0411;
        static constexpr uint32_t TITLE_NAME            = 0x1691;
        static constexpr uint32_t ICON_SIZE             = 0x1712;
        static constexpr uint32_t TITLE_ICON_SIZE       = 0x1716;
        static constexpr uint32_t ICON                  = 0x171A;
        static constexpr uint32_t TITLE_ICON            = 0x571A;

        static constexpr uint32_t HASHED_START          = CONTENT_TYPE;
        static constexpr uint32_t HEADER_SIZE_VALUE     = 0xAD0E;
        static constexpr uint32_t METADATA_VERSION_VALUE = 2;
        static constexpr uint8_t  DESCRIPTOR_SIZE_VALUE = 0x24;
        static constexpr uint8_t  DESCRIPTOR_TYPE_SVOD  = 1;
        static constexpr uint32_t PARTS_SIZE_UNIT       = 0x100;
        static constexpr uint32_t MAX_TITLE_CHARS       = 40;
        static constexpr uint32_t MAX_ICON_SIZE         = 0x4000;
    };

};

#endif // _GOD_H_
