#ifndef _GOD_FILE_LAYOUT_H_
#define _GOD_FILE_LAYOUT_H_

#include <cstdint>
#include <string>
#include <filesystem>

#include "Formats/GoD.h"
#include "Formats/Xex.h"

/*  Output naming for one package:
    <base>/<TITLE ID>/<CONTENT TYPE>/<content id>          LIVE header
    <base>/<TITLE ID>/<CONTENT TYPE>/<content id>.data/    Data0000, Data0001, ... */
class FileLayout 
{
public:
    FileLayout(const std::filesystem::path& base_path, const Xex::ExecutionInfo& exe_info, const GoD::ContentType content_type);
    ~FileLayout() = default;

    const std::filesystem::path& base_path() const { return base_path_; };
    const std::string& content_id() const { return content_id_; };

    std::filesystem::path title_dir_path() const;
    std::filesystem::path content_dir_path() const;
    std::filesystem::path data_dir_path() const;
    std::filesystem::path part_file_path(const uint64_t part_index) const;
    std::filesystem::path con_header_file_path() const;

    // Deletes the content type directory with any previous package in it, then recreates it empty
    void prepare() const;

    // First 10 bytes of SHA1(title id, media id, disc number, disc count) in upper case hex
    static std::string create_content_id(const Xex::ExecutionInfo& exe_info);

private:
    std::filesystem::path base_path_;
    uint32_t title_id_;
    GoD::ContentType content_type_;
    std::string content_id_;
};

#endif // _GOD_FILE_LAYOUT_H_
