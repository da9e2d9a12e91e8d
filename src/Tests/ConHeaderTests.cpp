#include <cstring>

#include <gtest/gtest.h>

#include "GDT.h"
#include "Common/EndianUtils.h"
#include "GoDWriter/ConHeaderBuilder.h"
#include "Tests/TestImage.h"

namespace {

using namespace GoD::ConHeader;

HashList::Digest sample_digest() {
    HashList::Digest digest;
    for (size_t i = 0; i < digest.size(); ++i) {
        digest[i] = static_cast<uint8_t>(0xA0 + i);
    }
    return digest;
}

std::vector<uint8_t> build_sample_header() {
    ConHeaderBuilder builder;
    builder.with_execution_info(Tests::make_execution_info(0x4D5307E6))
           .with_block_counts(0x1234, 0)
           .with_data_parts_info(2, 0x12345600)
           .with_content_type(GoD::ContentType::GAMES_ON_DEMAND)
           .with_mht_hash(sample_digest());
    return builder.finalize();
}

TEST(ConHeaderTest, FixedFields) {
    std::vector<uint8_t> header = build_sample_header();

    ASSERT_EQ(header.size(), SIZE);
    EXPECT_EQ(std::memcmp(header.data(), "LIVE", 4), 0);
    EXPECT_EQ(EndianUtils::load_big_32(header.data() + LICENSE_ENTRIES), 0xFFFFFFFFu);
    EXPECT_EQ(EndianUtils::load_big_32(header.data() + LICENSE_ENTRIES + 4), 0xFFFFFFFFu);
    EXPECT_EQ(EndianUtils::load_big_32(header.data() + HEADER_SIZE), 0xAD0Eu);
    EXPECT_EQ(EndianUtils::load_big_32(header.data() + METADATA_VERSION), 2u);
    EXPECT_EQ(header[DESCRIPTOR_SIZE], 0x24);
    EXPECT_EQ(header[DESCRIPTOR_TYPE], 1);
}

TEST(ConHeaderTest, ExecutionInfoFields) {
    std::vector<uint8_t> header = build_sample_header();

    EXPECT_EQ(EndianUtils::load_big_32(header.data() + CONTENT_TYPE), 0x7000u);
    EXPECT_EQ(EndianUtils::load_big_32(header.data() + MEDIA_ID), 0x12345678u);
    EXPECT_EQ(EndianUtils::load_big_32(header.data() + VERSION), 0x00010002u);
    EXPECT_EQ(EndianUtils::load_big_32(header.data() + BASE_VERSION), 0x00010000u);
    EXPECT_EQ(EndianUtils::load_big_32(header.data() + TITLE_ID), 0x4D5307E6u);
    EXPECT_EQ(header[DISC_NUMBER], 1);
    EXPECT_EQ(header[DISC_COUNT], 1);
}

TEST(ConHeaderTest, PartFields) {
    std::vector<uint8_t> header = build_sample_header();

    EXPECT_EQ(EndianUtils::load_little_32(header.data() + BLOCK_COUNT), 0x1234u);
    EXPECT_EQ(header[SECONDARY_COUNT], 0);
    EXPECT_EQ(header[SECONDARY_COUNT + 1], 0);
    EXPECT_EQ(EndianUtils::load_little_32(header.data() + DATA_PART_COUNT), 2u);
    EXPECT_EQ(EndianUtils::load_big_32(header.data() + DATA_PARTS_SIZE), 0x123456u);
    EXPECT_EQ(std::memcmp(header.data() + MHT_HASH, sample_digest().data(), SHA_DIGEST_LENGTH), 0);
}

TEST(ConHeaderTest, DigestCoversEverythingAfterIt) {
    std::vector<uint8_t> header = build_sample_header();

    HashList::Digest expected = HashList::sha1(header.data() + HASHED_START, header.size() - HASHED_START);
    EXPECT_EQ(std::memcmp(header.data() + HEADER_HASH, expected.data(), SHA_DIGEST_LENGTH), 0);
}

TEST(ConHeaderTest, TitleIsUtf16BigEndianInBothSlots) {
    ConHeaderBuilder builder;
    builder.with_game_title("Halo \xC3\xA9");
    std::vector<uint8_t> header = builder.finalize();

    for (uint32_t offset : { DISPLAY_NAME, TITLE_NAME }) {
        EXPECT_EQ(header[offset], 0x00);
        EXPECT_EQ(header[offset + 1], 'H');
        EXPECT_EQ(header[offset + 8], 0x00);
        EXPECT_EQ(header[offset + 9], ' ');
        EXPECT_EQ(header[offset + 10], 0x00);
        EXPECT_EQ(header[offset + 11], 0xE9);
        EXPECT_EQ(header[offset + 12], 0x00);
        EXPECT_EQ(header[offset + 13], 0x00);
    }
}

TEST(ConHeaderTest, TitleIsTruncatedToFortyCharacters) {
    ConHeaderBuilder builder;
    builder.with_game_title(std::string(60, 'x'));
    std::vector<uint8_t> header = builder.finalize();

    EXPECT_EQ(header[DISPLAY_NAME + 2 * 39 + 1], 'x');
    EXPECT_EQ(header[DISPLAY_NAME + 2 * 40 + 1], 0x00);
}

TEST(ConHeaderTest, TruncationKeepsSurrogatePairsWhole) {
    const std::string grinning_face = "\xF0\x9F\x98\x80";

    ConHeaderBuilder split_builder;
    split_builder.with_game_title(std::string(39, 'x') + grinning_face + "yy");
    std::vector<uint8_t> split_header = split_builder.finalize();

    for (uint32_t offset : { DISPLAY_NAME, TITLE_NAME }) {
        EXPECT_EQ(split_header[offset + 2 * 38 + 1], 'x');
        EXPECT_EQ(split_header[offset + 2 * 39], 0x00);
        EXPECT_EQ(split_header[offset + 2 * 39 + 1], 0x00);
    }

    ConHeaderBuilder fitting_builder;
    fitting_builder.with_game_title(std::string(38, 'x') + grinning_face + "yy");
    std::vector<uint8_t> fitting_header = fitting_builder.finalize();

    EXPECT_EQ(fitting_header[DISPLAY_NAME + 2 * 38], 0xD8);
    EXPECT_EQ(fitting_header[DISPLAY_NAME + 2 * 38 + 1], 0x3D);
    EXPECT_EQ(fitting_header[DISPLAY_NAME + 2 * 39], 0xDE);
    EXPECT_EQ(fitting_header[DISPLAY_NAME + 2 * 39 + 1], 0x00);
}

TEST(ConHeaderTest, InvalidUtf8TitleIsRejected) {
    ConHeaderBuilder builder;
    try {
        builder.with_game_title(std::string("Bad\xFF title"));
        FAIL() << "Expected STR_ENCODING";
    } catch (const GDTException& e) {
        EXPECT_EQ(e.code(), ErrCode::STR_ENCODING);
        EXPECT_EQ(e.kind(), ErrKind::METADATA);
    }
}

TEST(ConHeaderTest, IconIsStoredTwiceWithItsSize) {
    std::vector<uint8_t> icon(300);
    for (size_t i = 0; i < icon.size(); ++i) {
        icon[i] = static_cast<uint8_t>(i);
    }

    ConHeaderBuilder builder;
    builder.with_game_icon(icon);
    std::vector<uint8_t> header = builder.finalize();

    EXPECT_EQ(EndianUtils::load_big_32(header.data() + ICON_SIZE), 300u);
    EXPECT_EQ(EndianUtils::load_big_32(header.data() + TITLE_ICON_SIZE), 300u);
    EXPECT_EQ(std::memcmp(header.data() + ICON, icon.data(), icon.size()), 0);
    EXPECT_EQ(std::memcmp(header.data() + TITLE_ICON, icon.data(), icon.size()), 0);
}

TEST(ConHeaderTest, OversizedIconIsRejected) {
    ConHeaderBuilder builder;
    EXPECT_THROW(builder.with_game_icon(std::vector<uint8_t>(MAX_ICON_SIZE + 1, 1)), GDTException);
}

}; // namespace
