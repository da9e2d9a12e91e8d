#ifndef _XISO_H_
#define _XISO_H_

#include <cstdint>
#include <string>

/* XDVDFS, the read-only filesystem on Xbox and Xbox 360 game discs.
The volume descriptor sits 0x10000 bytes past the start of the game partition,
which itself starts at one of a few well known offsets depending on how the
disc image was dumped. Directory tables are binary trees of variable length
entries, left/right child offsets are stored in dwords from the table start. */
namespace Xiso {

    constexpr uint64_t SECTOR_SIZE  = 2048;
    constexpr uint16_t PAD_SHORT    = 0xFFFF;

    constexpr char     MAGIC_DATA[]      = "MICROSOFT*XBOX*MEDIA";
    constexpr uint64_t MAGIC_DATA_LEN    = 20;
    constexpr uint64_t MAGIC_OFFSET      = 0x10000;
    constexpr uint64_t MAGIC_UNUSED_LEN  = 0x7c8;

    // Game partition offsets in redump style images, 0 is a plain XISO
    constexpr uint64_t LSEEK_OFFSET_GLOBAL = 0x0FD90000;
    constexpr uint64_t LSEEK_OFFSET_XGD3   = 0x02080000;
    constexpr uint64_t LSEEK_OFFSET_XGD1   = 0x18300000;

    constexpr uint8_t ATTRIBUTE_DIRECTORY = 0x10;
    constexpr uint8_t ATTRIBUTE_FILE      = 0x20;

    struct DirectoryEntry {
        struct Header {
            uint16_t left_offset{0};
            uint16_t right_offset{0};
            uint32_t start_sector{0};
            uint32_t file_size{0};
            uint8_t attributes{0};
            uint8_t name_length{0};
        } header;
        static constexpr uint64_t HEADER_SIZE = 14;

        std::string filename;

        bool is_directory() const { return (header.attributes & ATTRIBUTE_DIRECTORY) != 0; }

        // Decodes the little endian on-disk header, data must hold HEADER_SIZE bytes
        static Header parse_header(const uint8_t* data);
    };

    struct VolumeDescriptor {
        uint64_t root_offset{0};       // absolute offset of the game partition in the image
        uint32_t root_dir_sector{0};   // relative to root_offset
        uint32_t root_dir_size{0};
        uint64_t file_time{0};

        static constexpr uint64_t SIZE = MAGIC_DATA_LEN + 4 + 4 + 8 + MAGIC_UNUSED_LEN + MAGIC_DATA_LEN;
    };
    static_assert(VolumeDescriptor::SIZE == SECTOR_SIZE, "Xiso::VolumeDescriptor size mismatch");

};

#endif // _XISO_H_
