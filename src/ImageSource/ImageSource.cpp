#include "GDT.h"
#include "ImageSource/FileSource.h"
#include "ImageSource/ImageSource.h"

void ImageSource::read_bytes(const uint64_t offset, const uint64_t size, char* out_buffer) 
{
    uint64_t bytes_read = read_some(offset, size, out_buffer);
    if (bytes_read != size) 
    {
        throw GDTException(ErrCode::FILE_READ, HERE(), "Read " + std::to_string(bytes_read) + " of " + std::to_string(size) + 
                                                       " bytes at offset " + std::to_string(offset) + " from " + name());
    }
}

std::shared_ptr<ImageSource> ImageSource::open_file(const std::filesystem::path& path) 
{
    return std::make_shared<FileSource>(path);
}
