#ifndef _GOD_HASH_LIST_H_
#define _GOD_HASH_LIST_H_

#include <cstdint>
#include <array>
#include <vector>
#include <iosfwd>

#include <openssl/sha.h>

#include "Formats/GoD.h"

/*  Up to 204 SHA1 digests serialized back to back into one zero padded block.
    Used for both sub hashtables and master hashtables. */
class HashList 
{
public:
    using Digest = std::array<uint8_t, SHA_DIGEST_LENGTH>;
    static_assert(SHA_DIGEST_LENGTH == GoD::HASH_SIZE, "GoD hash size mismatch");

    HashList() = default;
    ~HashList() = default;

    // Parses entries until the first all zero digest
    static HashList from_block(const uint8_t* block);

    // Reads the block at the stream's start, throws HASH_INVALID if the stream is shorter than a block
    static HashList read(std::istream& in_stream);

    void add_hash(const Digest& digest);
    void add_block_hash(const uint8_t* block, const uint64_t size);

    // Writes the serialized block at the stream's start
    void write(std::ostream& out_stream) const;

    std::vector<uint8_t> to_block() const;

    // SHA1 of the serialized block
    Digest digest() const;

    size_t size() const { return entries_.size(); };
    bool full() const { return entries_.size() >= GoD::HASHES_PER_BLOCK; };
    const std::vector<Digest>& entries() const { return entries_; };

    static Digest sha1(const uint8_t* data, const uint64_t size);

private:
    std::vector<Digest> entries_;
};

#endif // _GOD_HASH_LIST_H_
