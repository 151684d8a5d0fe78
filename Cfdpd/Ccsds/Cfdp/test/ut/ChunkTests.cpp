// ======================================================================
// \title  ChunkTests.cpp
// \author campuzan
// \brief  Unit tests for the received segment list and gap computation
// ======================================================================

#include <Cfdpd/Ccsds/Cfdp/Chunk.hpp>
#include <gtest/gtest.h>

#include <vector>

using namespace Cfdpd;
using namespace Cfdpd::Ccsds::Cfdp;

class ChunkTest : public ::testing::Test {
  protected:
    //! Collect the gaps of a list
    std::vector<Chunk> gaps(const ChunkList& list, ChunkIdx maxGaps, FileSize total, FileSize start = 0) {
        std::vector<Chunk> found;
        const U32 count = list.computeGaps(maxGaps, total, start, [&found](const Chunk& gap) { found.push_back(gap); });
        EXPECT_EQ(found.size(), count);
        return found;
    }

    void expectChunk(const Chunk& chunk, FileSize offset, FileSize size) {
        EXPECT_EQ(offset, chunk.offset);
        EXPECT_EQ(size, chunk.size);
    }
};

// ======================================================================
// Add Tests
// ======================================================================

TEST_F(ChunkTest, ZeroSizeIgnored) {
    ChunkList list(4);
    list.add(100, 0);
    EXPECT_EQ(0, list.getCount());
    EXPECT_EQ(nullptr, list.getFirstChunk());
}

TEST_F(ChunkTest, AdjacentSegmentsMerge) {
    ChunkList list(4);
    list.add(0, 10);
    list.add(10, 10);

    ASSERT_EQ(1, list.getCount());
    expectChunk(*list.getFirstChunk(), 0, 20);
}

TEST_F(ChunkTest, OverlappingSegmentsMerge) {
    ChunkList list(4);
    list.add(0, 10);
    list.add(5, 10);
    list.add(2, 3);

    ASSERT_EQ(1, list.getCount());
    expectChunk(*list.getFirstChunk(), 0, 15);
    EXPECT_EQ(15U, list.getCoveredSize());
}

TEST_F(ChunkTest, OutOfOrderSegmentsFillHole) {
    ChunkList list(4);
    list.add(20, 10);
    list.add(0, 10);
    ASSERT_EQ(2, list.getCount());
    expectChunk(*list.getFirstChunk(), 0, 10);

    // Bridges both neighbors
    list.add(10, 10);
    ASSERT_EQ(1, list.getCount());
    expectChunk(*list.getFirstChunk(), 0, 30);
}

TEST_F(ChunkTest, SegmentSpanningSeveralChunks) {
    ChunkList list(8);
    list.add(10, 5);
    list.add(20, 5);
    list.add(30, 5);
    ASSERT_EQ(3, list.getCount());

    list.add(0, 40);
    ASSERT_EQ(1, list.getCount());
    expectChunk(*list.getFirstChunk(), 0, 40);
}

// A full list drops its smallest segment for a larger newcomer only
TEST_F(ChunkTest, FullListEvictsSmallest) {
    ChunkList list(2);
    list.add(0, 1);
    list.add(10, 5);
    list.add(20, 10);

    ASSERT_EQ(2, list.getCount());
    expectChunk(*list.getFirstChunk(), 10, 5);
    EXPECT_EQ(15U, list.getCoveredSize());

    list.add(40, 2);
    EXPECT_EQ(2, list.getCount());
    EXPECT_EQ(15U, list.getCoveredSize());
}

TEST_F(ChunkTest, Reset) {
    ChunkList list(4);
    list.add(0, 10);
    list.add(20, 10);
    list.reset();

    EXPECT_EQ(0, list.getCount());
    EXPECT_EQ(0U, list.getCoveredSize());
    EXPECT_EQ(4, list.getMaxChunks());
}

// ======================================================================
// Remove Tests
// ======================================================================

TEST_F(ChunkTest, RemoveFromFirst) {
    ChunkList list(4);
    list.add(0, 100);
    list.add(200, 50);

    list.removeFromFirst(30);
    ASSERT_EQ(2, list.getCount());
    expectChunk(*list.getFirstChunk(), 30, 70);

    // More than the chunk holds removes just that chunk
    list.removeFromFirst(500);
    ASSERT_EQ(1, list.getCount());
    expectChunk(*list.getFirstChunk(), 200, 50);

    list.removeFromFirst(50);
    EXPECT_EQ(nullptr, list.getFirstChunk());
}

// ======================================================================
// Gap Tests
// ======================================================================

TEST_F(ChunkTest, EmptyListIsOneGap) {
    ChunkList list(4);
    const std::vector<Chunk> found = gaps(list, 10, 1000, 100);
    ASSERT_EQ(1U, found.size());
    expectChunk(found[0], 100, 900);
}

TEST_F(ChunkTest, GapsBetweenAndAroundChunks) {
    ChunkList list(4);
    list.add(10, 10);
    list.add(30, 10);

    const std::vector<Chunk> found = gaps(list, 10, 50);
    ASSERT_EQ(3U, found.size());
    expectChunk(found[0], 0, 10);
    expectChunk(found[1], 20, 10);
    expectChunk(found[2], 40, 10);
}

TEST_F(ChunkTest, CompleteFileHasNoGaps) {
    ChunkList list(4);
    list.add(0, 50);
    EXPECT_TRUE(gaps(list, 10, 50).empty());
}

TEST_F(ChunkTest, GapCountIsLimited) {
    ChunkList list(8);
    list.add(10, 10);
    list.add(30, 10);
    list.add(50, 10);

    const std::vector<Chunk> found = gaps(list, 2, 100);
    ASSERT_EQ(2U, found.size());
    expectChunk(found[0], 0, 10);
    expectChunk(found[1], 20, 10);

    EXPECT_EQ(0U, list.computeGaps(0, 100, 0, GapComputeCallback()));
}

TEST_F(ChunkTest, GapsStartAtOffset) {
    ChunkList list(4);
    list.add(0, 10);
    list.add(30, 10);

    const std::vector<Chunk> found = gaps(list, 10, 40, 25);
    ASSERT_EQ(1U, found.size());
    expectChunk(found[0], 25, 5);
}

// Data beyond the expected total does not produce a gap
TEST_F(ChunkTest, ChunkPastTotal) {
    ChunkList list(4);
    list.add(0, 10);
    list.add(60, 10);

    const std::vector<Chunk> found = gaps(list, 10, 50);
    ASSERT_EQ(1U, found.size());
    expectChunk(found[0], 10, 40);
}

TEST_F(ChunkTest, GapsWithoutCallback) {
    ChunkList list(4);
    list.add(10, 10);
    EXPECT_EQ(2U, list.computeGaps(10, 50, 0, GapComputeCallback()));
}
