#include <sstream>
#include <iomanip>
#include <system_error>

#include <openssl/sha.h>

#include "GDT.h"
#include "Common/EndianUtils.h"
#include "Common/StringUtils.h"
#include "GoDWriter/FileLayout.h"

FileLayout::FileLayout(const std::filesystem::path& base_path, const Xex::ExecutionInfo& exe_info, const GoD::ContentType content_type)
    :   base_path_(base_path), 
        title_id_(exe_info.title_id), 
        content_type_(content_type),
        content_id_(create_content_id(exe_info)) {}

std::filesystem::path FileLayout::title_dir_path() const 
{
    return base_path_ / StringUtils::uint32_to_hex_string(title_id_);
}

std::filesystem::path FileLayout::content_dir_path() const 
{
    return title_dir_path() / StringUtils::uint32_to_hex_string(static_cast<uint32_t>(content_type_));
}

std::filesystem::path FileLayout::data_dir_path() const 
{
    return content_dir_path() / (content_id_ + ".data");
}

std::filesystem::path FileLayout::part_file_path(const uint64_t part_index) const 
{
    std::ostringstream out_name;
    out_name << "Data" << std::setw(4) << std::setfill('0') << part_index;
    return data_dir_path() / out_name.str();
}

std::filesystem::path FileLayout::con_header_file_path() const 
{
    return content_dir_path() / content_id_;
}

void FileLayout::prepare() const 
{
    std::error_code ec;

    if (std::filesystem::exists(content_dir_path(), ec)) 
    {
        std::filesystem::remove_all(content_dir_path(), ec);
        if (ec) 
        {
            throw GDTException(ErrCode::FS_REMOVE, HERE(), content_dir_path().string() + ": " + ec.message());
        }
    }

    std::filesystem::create_directories(data_dir_path(), ec);
    if (ec) 
    {
        throw GDTException(ErrCode::FS_MKDIR, HERE(), data_dir_path().string() + ": " + ec.message());
    }

    GDTLog(Debug) << "Prepared output directory: " << content_dir_path().string() << GDTLog::Endl;
}

std::string FileLayout::create_content_id(const Xex::ExecutionInfo& exe_info) 
{
    uint8_t data[10];
    EndianUtils::store_little_32(data, exe_info.title_id);
    EndianUtils::store_little_32(data + 4, EndianUtils::load_big_32(exe_info.media_id));
    data[8] = exe_info.disc_number;
    data[9] = exe_info.disc_count;

    unsigned char hash[SHA_DIGEST_LENGTH];
    SHA1(data, sizeof(data), hash);

    return StringUtils::bytes_to_hex_string(hash, SHA_DIGEST_LENGTH / 2);
}
