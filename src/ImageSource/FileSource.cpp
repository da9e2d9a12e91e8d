#include <algorithm>

#include "GDT.h"
#include "ImageSource/FileSource.h"

FileSource::FileSource(const std::filesystem::path& in_path) 
    : in_path_(in_path) 
{
    in_file_.open(in_path_, std::ios::binary);
    if (!in_file_.is_open()) 
    {
        throw GDTException(ErrCode::FILE_OPEN, HERE(), in_path_.string());
    }

    in_file_.seekg(0, std::ios::end);
    if (in_file_.fail()) 
    {
        throw GDTException(ErrCode::FILE_SEEK, HERE(), in_path_.string());
    }

    file_size_ = static_cast<uint64_t>(in_file_.tellg());
    in_file_.seekg(0, std::ios::beg);
}

FileSource::~FileSource() 
{
    if (in_file_.is_open()) 
    {
        in_file_.close();
    }
}

uint64_t FileSource::read_some(const uint64_t offset, const uint64_t size, char* out_buffer) 
{
    if (offset >= file_size_) 
    {
        return 0;
    }

    uint64_t read_size = std::min(size, file_size_ - offset);

    in_file_.clear();
    in_file_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (in_file_.fail()) 
    {
        throw GDTException(ErrCode::FILE_SEEK, HERE(), "Failed to seek to offset " + std::to_string(offset) + " in " + in_path_.string());
    }

    in_file_.read(out_buffer, static_cast<std::streamsize>(read_size));
    if (in_file_.bad() || static_cast<uint64_t>(in_file_.gcount()) != read_size) 
    {
        throw GDTException(ErrCode::FILE_READ, HERE(), "Failed to read " + std::to_string(read_size) + " bytes from " + in_path_.string());
    }

    return read_size;
}

std::unique_ptr<ImageSource> FileSource::clone() 
{
    return std::make_unique<FileSource>(in_path_);
}
