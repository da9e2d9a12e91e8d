#include <algorithm>
#include <cstring>
#include <unordered_set>

#include "GDT.h"
#include "Common/EndianUtils.h"
#include "Common/StringUtils.h"
#include "ImageReader/ImageReader.h"

ImageReader::ImageReader(std::shared_ptr<ImageSource> source) 
    : source_(source) 
{
    if (!source_) 
    {
        throw GDTException(ErrCode::MISC, HERE(), "No image source");
    }

    read_volume_descriptor();
}

void ImageReader::read_volume_descriptor() 
{
    GDTLog(Debug) << "Getting image offset..." << GDTLog::Endl;

    const std::vector<uint64_t> seek_offsets = 
    {
        0,
        Xiso::LSEEK_OFFSET_GLOBAL,
        Xiso::LSEEK_OFFSET_XGD3,
        Xiso::LSEEK_OFFSET_XGD1
    };

    std::vector<uint8_t> buffer(Xiso::VolumeDescriptor::SIZE);

    for (uint64_t offset : seek_offsets) 
    {
        if (offset + Xiso::MAGIC_OFFSET + Xiso::VolumeDescriptor::SIZE > source_->size()) 
        {
            continue;
        }

        source_->read_bytes(offset + Xiso::MAGIC_OFFSET, buffer.size(), reinterpret_cast<char*>(buffer.data()));

        if (std::memcmp(buffer.data(), Xiso::MAGIC_DATA, Xiso::MAGIC_DATA_LEN) != 0) 
        {
            continue;
        }

        volume_descriptor_.root_offset     = offset;
        volume_descriptor_.root_dir_sector = EndianUtils::load_little_32(buffer.data() + Xiso::MAGIC_DATA_LEN);
        volume_descriptor_.root_dir_size   = EndianUtils::load_little_32(buffer.data() + Xiso::MAGIC_DATA_LEN + 4);
        volume_descriptor_.file_time       = (static_cast<uint64_t>(EndianUtils::load_little_32(buffer.data() + Xiso::MAGIC_DATA_LEN + 12)) << 32) |
                                              EndianUtils::load_little_32(buffer.data() + Xiso::MAGIC_DATA_LEN + 8);

        GDTLog(Debug) << "Found XISO magic data, image offset: " << offset << ", sector: " << (offset / Xiso::SECTOR_SIZE) << GDTLog::Endl;
        return;
    }

    throw GDTException(ErrCode::IMAGE_INVALID, HERE(), "Invalid volume descriptor, failed to find XISO magic data in " + source_->name());
}

uint64_t ImageReader::payload_size() 
{
    return source_->size() - root_offset();
}

void ImageReader::read_bytes(const uint64_t offset, const uint64_t size, char* out_buffer) 
{
    source_->read_bytes(root_offset() + offset, size, out_buffer);
}

std::vector<uint8_t> ImageReader::read_directory_table(const uint32_t sector, const uint32_t size) 
{
    uint64_t table_offset = static_cast<uint64_t>(sector) * Xiso::SECTOR_SIZE;

    if (size > MAX_DIRECTORY_TABLE_SIZE || table_offset + size > payload_size()) 
    {
        throw GDTException(ErrCode::IMAGE_INVALID, HERE(), "Directory table at sector " + std::to_string(sector) + " is out of range");
    }

    std::vector<uint8_t> table(size);
    read_bytes(table_offset, size, reinterpret_cast<char*>(table.data()));
    return table;
}

void ImageReader::for_each_entry(const std::vector<uint8_t>& table, const std::function<bool(const Xiso::DirectoryEntry&)>& callback) 
{
    std::vector<uint64_t> unprocessed_offsets{ 0 };
    std::unordered_set<uint64_t> visited_offsets;

    while (!unprocessed_offsets.empty()) 
    {
        uint64_t position = unprocessed_offsets.back() * sizeof(uint32_t);
        unprocessed_offsets.pop_back();

        if (!visited_offsets.insert(position).second || position + Xiso::DirectoryEntry::HEADER_SIZE > table.size()) 
        {
            continue;
        }

        Xiso::DirectoryEntry entry;
        entry.header = Xiso::DirectoryEntry::parse_header(table.data() + position);

        if (entry.header.left_offset == Xiso::PAD_SHORT) 
        {
            continue;
        }

        if (entry.header.name_length == 0 || position + Xiso::DirectoryEntry::HEADER_SIZE + entry.header.name_length > table.size()) 
        {
            GDTLog(Debug) << "Skipping malformed directory entry at offset " << position << GDTLog::Endl;
            continue;
        }

        entry.filename.assign(reinterpret_cast<const char*>(table.data() + position + Xiso::DirectoryEntry::HEADER_SIZE), entry.header.name_length);

        if (entry.header.left_offset != 0) 
        {
            unprocessed_offsets.push_back(entry.header.left_offset);
        }

        if (entry.header.right_offset != 0) 
        {
            unprocessed_offsets.push_back(entry.header.right_offset);
        }

        if (!callback(entry)) 
        {
            return;
        }
    }
}

std::optional<Xiso::DirectoryEntry> ImageReader::find_root_entry(const std::string& filename) 
{
    std::vector<uint8_t> root_table = read_directory_table(volume_descriptor_.root_dir_sector, volume_descriptor_.root_dir_size);
    std::optional<Xiso::DirectoryEntry> found;

    for_each_entry(root_table, [&](const Xiso::DirectoryEntry& entry) 
    {
        if (StringUtils::case_insensitive_equals(entry.filename, filename)) 
        {
            found = entry;
            return false;
        }
        return true;
    });

    return found;
}

uint64_t ImageReader::max_used_prefix_size() 
{
    struct Table {
        uint32_t sector;
        uint32_t size;
        uint32_t depth;
    };

    uint64_t max_end = Xiso::MAGIC_OFFSET + Xiso::SECTOR_SIZE;
    std::vector<Table> unprocessed_tables{ { volume_descriptor_.root_dir_sector, volume_descriptor_.root_dir_size, 0 } };
    std::unordered_set<uint32_t> visited_sectors;

    GDTLog(Debug) << "Scanning directory tables for used data" << GDTLog::Endl;

    while (!unprocessed_tables.empty()) 
    {
        Table current_table = unprocessed_tables.back();
        unprocessed_tables.pop_back();

        if (current_table.size == 0 || !visited_sectors.insert(current_table.sector).second) 
        {
            continue;
        }

        if (current_table.depth > MAX_DIRECTORY_DEPTH) 
        {
            GDTLog(Debug) << "Directory depth limit reached at sector " << current_table.sector << GDTLog::Endl;
            continue;
        }

        std::vector<uint8_t> table;

        try 
        {
            table = read_directory_table(current_table.sector, current_table.size);
        } 
        catch (const GDTException& e) 
        {
            GDTLog(Debug) << "Skipping unreadable directory table: " << e.what() << GDTLog::Endl;
            continue;
        }

        max_end = std::max(max_end, static_cast<uint64_t>(current_table.sector) * Xiso::SECTOR_SIZE + sector_align(current_table.size));

        for_each_entry(table, [&](const Xiso::DirectoryEntry& entry) 
        {
            if (entry.is_directory()) 
            {
                unprocessed_tables.push_back({ entry.header.start_sector, entry.header.file_size, current_table.depth + 1 });
            } 
            else if (entry.header.file_size > 0) 
            {
                uint64_t file_end = static_cast<uint64_t>(entry.header.start_sector) * Xiso::SECTOR_SIZE + sector_align(entry.header.file_size);
                if (file_end <= sector_align(payload_size())) 
                {
                    max_end = std::max(max_end, file_end);
                }
            }
            return true;
        });
    }

    return std::min(sector_align(max_end), payload_size());
}

uint64_t ImageReader::sector_align(const uint64_t num_bytes) 
{
    return ((num_bytes + Xiso::SECTOR_SIZE - 1) / Xiso::SECTOR_SIZE) * Xiso::SECTOR_SIZE;
}
