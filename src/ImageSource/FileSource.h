#ifndef _FILE_SOURCE_H_
#define _FILE_SOURCE_H_

#include <cstdint>
#include <fstream>
#include <filesystem>

#include "ImageSource/ImageSource.h"

class FileSource : public ImageSource 
{
public:
    FileSource(const std::filesystem::path& in_path);
    ~FileSource() override;

    uint64_t read_some(const uint64_t offset, const uint64_t size, char* out_buffer) override;

    uint64_t size() override { return file_size_; };
    std::string name() override { return in_path_.filename().string(); };
    std::unique_ptr<ImageSource> clone() override;

    const std::filesystem::path& path() const { return in_path_; };

private:
    std::filesystem::path in_path_;
    std::ifstream in_file_;
    uint64_t file_size_{0};
};

#endif // _FILE_SOURCE_H_
