#include <algorithm>

#include "GDT.h"
#include "GoDWriter/Geometry.h"

namespace GoD {

uint64_t num_blocks(const uint64_t num_bytes) 
{
    return (num_bytes / BLOCK_SIZE) + ((num_bytes % BLOCK_SIZE) ? 1 : 0);
}

Geometry Geometry::from_payload_size(const uint64_t payload_size) 
{
    if (payload_size == 0) 
    {
        throw GDTException(ErrCode::IMAGE_INVALID, HERE(), "Image has no payload to convert");
    }

    Geometry geometry;
    geometry.payload_size = payload_size;
    geometry.block_count = num_blocks(payload_size);
    geometry.part_count = (geometry.block_count / DATA_BLOCKS_PER_PART) + ((geometry.block_count % DATA_BLOCKS_PER_PART) ? 1 : 0);
    return geometry;
}

uint64_t Geometry::data_blocks_in_part(const uint64_t part_index) const 
{
    if (part_index >= part_count) 
    {
        return 0;
    }
    return std::min(static_cast<uint64_t>(DATA_BLOCKS_PER_PART), block_count - (part_index * DATA_BLOCKS_PER_PART));
}

uint64_t Geometry::sub_tables_in_part(const uint64_t part_index) const 
{
    uint64_t data_blocks = data_blocks_in_part(part_index);
    return (data_blocks / DATA_BLOCKS_PER_SHT) + ((data_blocks % DATA_BLOCKS_PER_SHT) ? 1 : 0);
}

uint64_t Geometry::part_file_size(const uint64_t part_index) const 
{
    if (part_index >= part_count) 
    {
        return 0;
    }
    return (1 + sub_tables_in_part(part_index) + data_blocks_in_part(part_index)) * BLOCK_SIZE;
}

uint64_t Geometry::part_payload_offset(const uint64_t part_index) const 
{
    return part_index * DATA_BLOCKS_PER_PART * static_cast<uint64_t>(BLOCK_SIZE);
}

uint64_t Geometry::part_payload_size(const uint64_t part_index) const 
{
    uint64_t offset = part_payload_offset(part_index);
    if (offset >= payload_size) 
    {
        return 0;
    }
    return std::min(payload_size - offset, static_cast<uint64_t>(DATA_BLOCKS_PER_PART) * BLOCK_SIZE);
}

}; // namespace GoD
