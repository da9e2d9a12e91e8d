#include <algorithm>
#include <cstring>
#include <sstream>

#include <gtest/gtest.h>

#include "GDT.h"
#include "GoDWriter/HashList.h"

namespace {

HashList::Digest digest_of(const std::string& text) {
    return HashList::sha1(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

TEST(HashListTest, EmptyListSerializesToZeroBlock) {
    HashList hash_list;
    std::vector<uint8_t> block = hash_list.to_block();

    ASSERT_EQ(block.size(), GoD::BLOCK_SIZE);
    EXPECT_TRUE(std::all_of(block.begin(), block.end(), [](uint8_t b) { return b == 0; }));
    EXPECT_EQ(hash_list.digest(), HashList::sha1(block.data(), block.size()));
}

TEST(HashListTest, EntriesAreStoredBackToBack) {
    HashList hash_list;
    hash_list.add_hash(digest_of("one"));
    hash_list.add_hash(digest_of("two"));

    std::vector<uint8_t> block = hash_list.to_block();

    EXPECT_EQ(std::memcmp(block.data(), digest_of("one").data(), GoD::HASH_SIZE), 0);
    EXPECT_EQ(std::memcmp(block.data() + GoD::HASH_SIZE, digest_of("two").data(), GoD::HASH_SIZE), 0);
    EXPECT_EQ(block[2 * GoD::HASH_SIZE], 0);

    HashList parsed = HashList::from_block(block.data());
    ASSERT_EQ(parsed.size(), 2u);
    EXPECT_EQ(parsed.entries()[1], digest_of("two"));
    EXPECT_EQ(parsed.digest(), hash_list.digest());
}

TEST(HashListTest, BlockHashIsSha1OfTheBlock) {
    std::vector<uint8_t> block(GoD::BLOCK_SIZE, 0x5A);

    HashList hash_list;
    hash_list.add_block_hash(block.data(), block.size());

    EXPECT_EQ(hash_list.entries()[0], HashList::sha1(block.data(), block.size()));
}

TEST(HashListTest, CapacityIsOneBlockOfDigests) {
    HashList hash_list;
    for (uint32_t i = 0; i < GoD::HASHES_PER_BLOCK; ++i) {
        hash_list.add_hash(digest_of(std::to_string(i)));
    }

    EXPECT_EQ(hash_list.size(), 204u);
    EXPECT_TRUE(hash_list.full());

    try {
        hash_list.add_hash(digest_of("overflow"));
        FAIL() << "Expected GDTException";
    } catch (const GDTException& e) {
        EXPECT_EQ(e.code(), ErrCode::HASH_INVALID);
        EXPECT_EQ(e.kind(), ErrKind::FORMAT);
    }
}

TEST(HashListTest, TruncatedBlockIsAFormatError) {
    std::stringstream stream(std::string(100, '\x01'));

    try {
        HashList::read(stream);
        FAIL() << "Expected GDTException";
    } catch (const GDTException& e) {
        EXPECT_EQ(e.code(), ErrCode::HASH_INVALID);
    }
}

TEST(HashListTest, WriteReplacesOnlyTheFirstBlock) {
    std::string contents(2 * GoD::BLOCK_SIZE, '\x7F');
    std::stringstream stream(contents, std::ios::in | std::ios::out | std::ios::binary);

    HashList hash_list;
    hash_list.add_hash(digest_of("first"));
    hash_list.write(stream);

    std::string written = stream.str();
    ASSERT_EQ(written.size(), contents.size());
    EXPECT_EQ(written.substr(GoD::BLOCK_SIZE), contents.substr(GoD::BLOCK_SIZE));

    HashList reread = HashList::read(stream);
    ASSERT_EQ(reread.size(), 1u);
    EXPECT_EQ(reread.entries()[0], digest_of("first"));
}

}; // namespace
