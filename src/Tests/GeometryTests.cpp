#include <gtest/gtest.h>

#include "GDT.h"
#include "GoDWriter/Geometry.h"

namespace {

constexpr uint64_t B = GoD::BLOCK_SIZE;
constexpr uint64_t P = GoD::DATA_BLOCKS_PER_PART;

TEST(GeometryTest, SingleByteIsOneBlockInOnePart) {
    GoD::Geometry geometry = GoD::Geometry::from_payload_size(1);

    EXPECT_EQ(geometry.block_count, 1u);
    EXPECT_EQ(geometry.part_count, 1u);
    EXPECT_EQ(geometry.sub_tables_in_part(0), 1u);
    EXPECT_EQ(geometry.part_file_size(0), 3 * B);
}

TEST(GeometryTest, BlockCountRoundsUp) {
    EXPECT_EQ(GoD::Geometry::from_payload_size(B).block_count, 1u);
    EXPECT_EQ(GoD::Geometry::from_payload_size(B + 1).block_count, 2u);
    EXPECT_EQ(GoD::Geometry::from_payload_size(10 * B - 1).block_count, 10u);
}

TEST(GeometryTest, OneByteOverAFullPartStartsASecondPart) {
    GoD::Geometry geometry = GoD::Geometry::from_payload_size(B * P + 1);

    EXPECT_EQ(geometry.block_count, P + 1);
    EXPECT_EQ(geometry.part_count, 2u);
    EXPECT_EQ(geometry.data_blocks_in_part(0), P);
    EXPECT_EQ(geometry.data_blocks_in_part(1), 1u);
    EXPECT_EQ(geometry.part_payload_size(0), B * P);
    EXPECT_EQ(geometry.part_payload_offset(1), B * P);
    EXPECT_EQ(geometry.part_payload_size(1), 1u);
}

TEST(GeometryTest, FullPartMatchesFormatBlockCount) {
    GoD::Geometry geometry = GoD::Geometry::from_payload_size(B * P);

    EXPECT_EQ(geometry.part_count, 1u);
    EXPECT_EQ(geometry.sub_tables_in_part(0), GoD::SHT_PER_MHT);
    EXPECT_EQ(geometry.part_file_size(0), static_cast<uint64_t>(GoD::BLOCKS_PER_PART) * B);
}

TEST(GeometryTest, SubTableCountFollowsDataBlocks) {
    EXPECT_EQ(GoD::Geometry::from_payload_size(204 * B).sub_tables_in_part(0), 1u);
    EXPECT_EQ(GoD::Geometry::from_payload_size(205 * B).sub_tables_in_part(0), 2u);
    EXPECT_EQ(GoD::Geometry::from_payload_size(205 * B).part_file_size(0), (1 + 2 + 205) * B);
}

TEST(GeometryTest, PartsOutsideThePayloadAreEmpty) {
    GoD::Geometry geometry = GoD::Geometry::from_payload_size(3 * B);

    EXPECT_EQ(geometry.data_blocks_in_part(1), 0u);
    EXPECT_EQ(geometry.part_file_size(1), 0u);
    EXPECT_EQ(geometry.part_payload_size(1), 0u);
}

TEST(GeometryTest, ZeroPayloadIsRejected) {
    try {
        GoD::Geometry::from_payload_size(0);
        FAIL() << "Expected GDTException";
    } catch (const GDTException& e) {
        EXPECT_EQ(e.code(), ErrCode::IMAGE_INVALID);
        EXPECT_EQ(e.kind(), ErrKind::IMAGE);
    }
}

}; // namespace
