#ifndef _IMAGE_SOURCE_H_
#define _IMAGE_SOURCE_H_

#include <cstdint>
#include <string>
#include <memory>
#include <filesystem>

/*  Random access, read only view of a disc image. Readers never assume the image 
    is a file, anything that can read at an offset and report its length works.
    clone() opens an independent handle so parallel part writers never share 
    a read position. */
class ImageSource 
{
public:
    virtual ~ImageSource() = default;

    // Reads up to size bytes, returns fewer only at the end of the image
    virtual uint64_t read_some(const uint64_t offset, const uint64_t size, char* out_buffer) = 0;

    virtual uint64_t size() = 0;
    virtual std::string name() = 0;
    virtual std::unique_ptr<ImageSource> clone() = 0;

    // Throws FILE_READ unless exactly size bytes were read
    void read_bytes(const uint64_t offset, const uint64_t size, char* out_buffer);

    static std::shared_ptr<ImageSource> open_file(const std::filesystem::path& path);
};

#endif // _IMAGE_SOURCE_H_
