#ifndef _GOD_GEOMETRY_H_
#define _GOD_GEOMETRY_H_

#include <cstdint>

#include "Formats/GoD.h"

namespace GoD {

    // Block and part counts for a payload, every part but the last is full
    struct Geometry 
    {
        uint64_t payload_size{0};
        uint64_t block_count{0};
        uint64_t part_count{0};

        static Geometry from_payload_size(const uint64_t payload_size);

        uint64_t data_blocks_in_part(const uint64_t part_index) const;
        uint64_t sub_tables_in_part(const uint64_t part_index) const;

        // MHT + SHTs + data blocks
        uint64_t part_file_size(const uint64_t part_index) const;

        // Payload window of a part, relative to the image's root offset
        uint64_t part_payload_offset(const uint64_t part_index) const;
        uint64_t part_payload_size(const uint64_t part_index) const;
    };

    uint64_t num_blocks(const uint64_t num_bytes);

}; // namespace GoD

#endif // _GOD_GEOMETRY_H_
