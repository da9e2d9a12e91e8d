#include <algorithm>
#include <cstring>

#include "ImageSource/MemorySource.h"

MemorySource::MemorySource(std::vector<char> data, const std::string& name)
    : data_(std::make_shared<const std::vector<char>>(std::move(data))), name_(name) {}

MemorySource::MemorySource(std::shared_ptr<const std::vector<char>> data, const std::string& name)
    : data_(data), name_(name) {}

uint64_t MemorySource::read_some(const uint64_t offset, const uint64_t size, char* out_buffer) 
{
    if (offset >= data_->size()) 
    {
        return 0;
    }

    uint64_t read_size = std::min(size, static_cast<uint64_t>(data_->size()) - offset);
    std::memcpy(out_buffer, data_->data() + offset, static_cast<size_t>(read_size));
    return read_size;
}

std::unique_ptr<ImageSource> MemorySource::clone() 
{
    return std::make_unique<MemorySource>(data_, name_);
}
