#ifndef _MEMORY_SOURCE_H_
#define _MEMORY_SOURCE_H_

#include <cstdint>
#include <string>
#include <vector>
#include <memory>

#include "ImageSource/ImageSource.h"

// Image held in memory, clones share the same immutable buffer
class MemorySource : public ImageSource 
{
public:
    MemorySource(std::vector<char> data, const std::string& name = "memory");
    MemorySource(std::shared_ptr<const std::vector<char>> data, const std::string& name);

    uint64_t read_some(const uint64_t offset, const uint64_t size, char* out_buffer) override;

    uint64_t size() override { return data_->size(); };
    std::string name() override { return name_; };
    std::unique_ptr<ImageSource> clone() override;

private:
    std::shared_ptr<const std::vector<char>> data_;
    std::string name_;
};

#endif // _MEMORY_SOURCE_H_
