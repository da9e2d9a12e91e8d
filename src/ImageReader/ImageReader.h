#ifndef _IMAGE_READER_H_
#define _IMAGE_READER_H_

#include <cstdint>
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>

#include "Formats/Xiso.h"
#include "ImageSource/ImageSource.h"

/*  Parses the XDVDFS volume of a disc image. Only what a GoD conversion needs is
    implemented: the volume descriptor, lookups in the root directory and the
    extent of data actually referenced by the filesystem. */
class ImageReader 
{
public:
    static constexpr uint32_t MAX_DIRECTORY_DEPTH = 32;
    static constexpr uint64_t MAX_DIRECTORY_TABLE_SIZE = 0x1000000;

    ImageReader(std::shared_ptr<ImageSource> source);
    ~ImageReader() = default;

    const Xiso::VolumeDescriptor& volume_descriptor() const { return volume_descriptor_; };
    uint64_t root_offset() const { return volume_descriptor_.root_offset; };

    std::shared_ptr<ImageSource> source() { return source_; };
    std::string name() { return source_->name(); };

    // Physical size minus the partition offset
    uint64_t payload_size();

    // Highest byte referenced by any table or file, relative to root_offset, sector aligned.
    // Never throws, unreadable entries are skipped.
    uint64_t max_used_prefix_size();

    std::optional<Xiso::DirectoryEntry> find_root_entry(const std::string& filename);

    // Offset relative to root_offset
    void read_bytes(const uint64_t offset, const uint64_t size, char* out_buffer);

private:
    std::shared_ptr<ImageSource> source_;
    Xiso::VolumeDescriptor volume_descriptor_;

    void read_volume_descriptor();

    std::vector<uint8_t> read_directory_table(const uint32_t sector, const uint32_t size);
    void for_each_entry(const std::vector<uint8_t>& table, const std::function<bool(const Xiso::DirectoryEntry&)>& callback);
    uint64_t sector_align(const uint64_t num_bytes);
};

#endif // _IMAGE_READER_H_
