#ifndef _GOD_WRITER_H_
#define _GOD_WRITER_H_

#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

#include "Formats/GoD.h"
#include "ImageReader/ImageReader.h"
#include "ImageSource/ImageSource.h"
#include "TitleHelper/TitleHelper.h"
#include "WorkerPool/WorkerPool.h"
#include "GoDWriter/Geometry.h"
#include "GoDWriter/FileLayout.h"
#include "GoDWriter/HashList.h"

/*  Writes a GoD package for the first geometry.payload_size bytes of the image's 
    XDVDFS volume. The output directories must already exist, see FileLayout::prepare(). */
class GoDWriter 
{
public:
    GoDWriter(ImageReader& image_reader, const TitleInfo& title_info, const FileLayout& file_layout, const GoD::Geometry& geometry);
    ~GoDWriter() = default;

    // Converted to UTF-16 here, throws STR_ENCODING before anything is written
    void set_game_title(const std::optional<std::string>& game_title);
    void set_game_icon(const std::vector<uint8_t>& game_icon) { game_icon_ = game_icon; };

    // Parts in parallel on worker_pool, then hash tables and header on the calling thread
    void write(WorkerPool& worker_pool);

    void write_parts(WorkerPool& worker_pool);
    HashList::Digest stitch_hash_tables();
    void write_con_header(const HashList::Digest& mht_hash);

    // One Data file, reads from its own source handle
    static void write_part(ImageSource& source, const uint64_t root_offset, const GoD::Geometry& geometry, 
                           const uint64_t part_index, const std::filesystem::path& part_path);

    static HashList read_part_mht(const std::filesystem::path& part_path);
    static void write_part_mht(const std::filesystem::path& part_path, const HashList& mht);

private:
    ImageReader& image_reader_;
    const TitleInfo& title_info_;
    const FileLayout& file_layout_;
    GoD::Geometry geometry_;

    std::vector<char16_t> game_title_;
    std::vector<uint8_t> game_icon_;

    static uint64_t expected_mht_entries(const uint64_t part_file_size);
};

#endif // _GOD_WRITER_H_
