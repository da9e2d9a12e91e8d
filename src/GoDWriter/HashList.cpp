#include <algorithm>
#include <cstring>
#include <istream>
#include <ostream>

#include "GDT.h"
#include "GoDWriter/HashList.h"

HashList HashList::from_block(const uint8_t* block) 
{
    static const Digest ZERO_DIGEST{};

    HashList hash_list;

    for (uint32_t i = 0; i < GoD::HASHES_PER_BLOCK; ++i) 
    {
        Digest digest;
        std::memcpy(digest.data(), block + (i * GoD::HASH_SIZE), GoD::HASH_SIZE);

        if (digest == ZERO_DIGEST) 
        {
            break;
        }

        hash_list.entries_.push_back(digest);
    }

    return hash_list;
}

HashList HashList::read(std::istream& in_stream) 
{
    std::vector<uint8_t> block(GoD::BLOCK_SIZE, 0);

    in_stream.seekg(0, std::ios::beg);
    if (in_stream.fail()) 
    {
        throw GDTException(ErrCode::FILE_SEEK, HERE());
    }

    in_stream.read(reinterpret_cast<char*>(block.data()), block.size());
    if (in_stream.gcount() != static_cast<std::streamsize>(GoD::BLOCK_SIZE)) 
    {
        throw GDTException(ErrCode::HASH_INVALID, HERE(), "Hash table block is truncated");
    }

    return from_block(block.data());
}

void HashList::add_hash(const Digest& digest) 
{
    if (full()) 
    {
        throw GDTException(ErrCode::HASH_INVALID, HERE(), "Hash table is full");
    }
    entries_.push_back(digest);
}

void HashList::add_block_hash(const uint8_t* block, const uint64_t size) 
{
    add_hash(sha1(block, size));
}

std::vector<uint8_t> HashList::to_block() const 
{
    std::vector<uint8_t> block(GoD::BLOCK_SIZE, 0);

    for (size_t i = 0; i < entries_.size(); ++i) 
    {
        std::memcpy(block.data() + (i * GoD::HASH_SIZE), entries_[i].data(), GoD::HASH_SIZE);
    }

    return block;
}

void HashList::write(std::ostream& out_stream) const 
{
    std::vector<uint8_t> block = to_block();

    out_stream.seekp(0, std::ios::beg);
    if (out_stream.fail()) 
    {
        throw GDTException(ErrCode::FILE_SEEK, HERE());
    }

    out_stream.write(reinterpret_cast<const char*>(block.data()), block.size());
    if (out_stream.fail()) 
    {
        throw GDTException(ErrCode::FILE_WRITE, HERE());
    }
}

HashList::Digest HashList::digest() const 
{
    std::vector<uint8_t> block = to_block();
    return sha1(block.data(), block.size());
}

HashList::Digest HashList::sha1(const uint8_t* data, const uint64_t size) 
{
    Digest result;
    SHA1(data, size, result.data());
    return result;
}
