/**
 * @file test_data_block.cpp
 * @brief DataBlock reads, slicing and the shared channel lifecycle.
 */
#include "nj_archive.hpp"
#include "archive_test_doubles.h"
#include "shared_test_helpers.h"
#include <gtest/gtest.h>
#include <array>
#include <limits>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace nestjar::archive;
using namespace nestjar::tests::helper;
using ::testing::_;

class DataBlockTest : public ::testing::Test
{
  protected:
    void SetUp() override { write_pattern_file(file, 100); }

    TempDir dir{"nestjar_block"};
    fs::path file = dir / "small.jar";
};

TEST_F(DataBlockTest, HundredByteFileWithSlice)
{
    auto stats = std::make_shared<HandleStats>();
    DataBlock block(file, {}, counting_opener(stats));
    EXPECT_EQ(block.size(), 100);
    EXPECT_EQ(block.offset(), 0);
    block.open();

    std::array<std::byte, 10> storage{};
    ByteBuffer dst(storage);
    ASSERT_EQ(block.read(dst, 0), 10);
    for (size_t i = 0; i < 10; ++i)
        EXPECT_EQ(storage[i], pattern_byte(i));

    DataBlock slice = block.slice(50, 50);
    EXPECT_EQ(slice.size(), 50);
    EXPECT_EQ(slice.offset(), 50);
    slice.open();
    dst.clear();
    ASSERT_EQ(slice.read(dst, 0), 10);
    for (size_t i = 0; i < 10; ++i)
        EXPECT_EQ(storage[i], pattern_byte(50 + i));

    EXPECT_EQ(block.channel()->reference_count(), 2);
    slice.close();
    block.close();
    EXPECT_EQ(block.channel()->reference_count(), 0);
    EXPECT_FALSE(block.channel()->is_open());
    EXPECT_EQ(stats->opens.load(), 1);
    EXPECT_EQ(stats->closes.load(), 1);
}

TEST_F(DataBlockTest, DirectoryIsRejectedBeforeAnyHandleOpens)
{
    auto tracker = std::make_shared<::testing::StrictMock<MockChannelTracker>>();
    ScopedTracker installed(tracker);
    EXPECT_CALL(*tracker, opened_channel(_, _)).Times(0);
    EXPECT_THROW(DataBlock(dir.path()), std::invalid_argument);
}

TEST_F(DataBlockTest, SliceReadsMatchParentAtShiftedPosition)
{
    DataBlock block(file);
    block.open();
    DataBlock slice = block.slice(17, 60);

    for (int64_t p = 0; p + 5 <= 60; p += 7)
    {
        std::array<std::byte, 5> a{};
        std::array<std::byte, 5> b{};
        ByteBuffer from_parent(a);
        ByteBuffer from_slice(b);
        const int64_t n_parent = block.read(from_parent, 17 + p);
        const int64_t n_slice = slice.read(from_slice, p);
        EXPECT_EQ(n_parent, n_slice);
        EXPECT_EQ(a, b);
    }
    block.close();
}

TEST_F(DataBlockTest, ReadNeverCrossesBlockEnd)
{
    DataBlock block(file);
    block.open();
    DataBlock slice = block.slice(10, 20);

    std::array<std::byte, 64> storage{};
    ByteBuffer dst(storage);
    EXPECT_EQ(slice.read(dst, 15), 5);
    EXPECT_EQ(dst.position(), 5u);
    // The caller's limit is restored after the call.
    EXPECT_EQ(dst.limit(), 64u);
    EXPECT_EQ(storage[4], pattern_byte(29));
    EXPECT_EQ(storage[5], std::byte{0});

    EXPECT_EQ(slice.read(dst, 20), -1);
    EXPECT_EQ(slice.read(dst, 500), -1);
    EXPECT_EQ(dst.position(), 5u);
    block.close();
}

TEST_F(DataBlockTest, NegativePositionIsRejected)
{
    DataBlock block(file);
    block.open();
    std::array<std::byte, 4> storage{};
    ByteBuffer dst(storage);
    EXPECT_THROW(block.read(dst, -1), std::invalid_argument);
    block.close();
}

TEST_F(DataBlockTest, ReadOnClosedBlockThrows)
{
    DataBlock block(file);
    std::array<std::byte, 4> storage{};
    ByteBuffer dst(storage);
    EXPECT_THROW(block.read(dst, 0), ChannelClosedError);
}

TEST_F(DataBlockTest, SliceBoundsAreChecked)
{
    DataBlock block(file);
    EXPECT_THROW(block.slice(-1), std::invalid_argument);
    EXPECT_THROW(block.slice(-1, 10), std::invalid_argument);
    EXPECT_THROW(block.slice(10, -1), std::invalid_argument);
    EXPECT_THROW(block.slice(90, 11), std::invalid_argument);
    EXPECT_THROW(block.slice(101), std::invalid_argument);
    EXPECT_THROW(block.slice(101, 0), std::invalid_argument);
    EXPECT_THROW(block.slice(1, std::numeric_limits<int64_t>::max()), std::invalid_argument);
    EXPECT_THROW(block.slice(std::numeric_limits<int64_t>::max(), 1), std::invalid_argument);
    EXPECT_THROW(block.slice(std::numeric_limits<int64_t>::min()), std::invalid_argument);
    EXPECT_THROW(block.slice(0, std::numeric_limits<int64_t>::min()), std::invalid_argument);
    EXPECT_NO_THROW(block.slice(100));
    EXPECT_EQ(block.slice(100).size(), 0);
    EXPECT_EQ(block.slice(40).size(), 60);
}

TEST_F(DataBlockTest, WholeBlockSliceIsEqual)
{
    DataBlock block(file);
    EXPECT_EQ(block.slice(0), block);
    EXPECT_EQ(block.slice(0, 100), block);
    EXPECT_FALSE(block.slice(1) == block);
    EXPECT_EQ(block.slice(10, 30), block.slice(10, 30));
}

TEST_F(DataBlockTest, NestedSlicesAccumulateOffsets)
{
    DataBlock block(file);
    const DataBlock inner = block.slice(20, 60).slice(5, 10);
    EXPECT_EQ(inner.offset(), 25);
    EXPECT_EQ(inner.size(), 10);
    EXPECT_EQ(inner.channel(), block.channel());
}

TEST_F(DataBlockTest, SlicingDoesNotOpen)
{
    DataBlock block(file);
    DataBlock slice = block.slice(10, 10);
    EXPECT_EQ(block.channel()->reference_count(), 0);
    EXPECT_FALSE(slice.channel()->is_open());
}

TEST_F(DataBlockTest, SiblingSlicesStayReadable)
{
    DataBlock block(file);
    block.open();
    DataBlock first = block.slice(0, 30);
    DataBlock second = block.slice(70, 30);
    first.open();
    second.open();
    first.close();

    std::array<std::byte, 4> storage{};
    ByteBuffer dst(storage);
    ASSERT_EQ(second.read(dst, 2), 4);
    EXPECT_EQ(storage[0], pattern_byte(72));

    second.close();
    dst.clear();
    EXPECT_EQ(block.read(dst, 0), 4);
    block.close();
    EXPECT_FALSE(block.channel()->is_open());
}

TEST_F(DataBlockTest, ConstructorRejectsNegativeRange)
{
    auto channel = std::make_shared<ManagedChannel>(file);
    EXPECT_THROW(DataBlock(channel, -1, 10), std::invalid_argument);
    EXPECT_THROW(DataBlock(channel, 0, -10), std::invalid_argument);
    EXPECT_THROW(DataBlock(std::shared_ptr<ManagedChannel>{}, 0, 10), std::invalid_argument);
}

TEST_F(DataBlockTest, ReadFullyStitchesAcrossCacheRefill)
{
    write_pattern_file(file, 12000);
    auto stats = std::make_shared<HandleStats>();
    DataBlock block(file, {}, counting_opener(stats));
    block.open();

    std::array<std::byte, 10> head{};
    ByteBuffer head_dst(head);
    block.read_fully(head_dst, 0);
    EXPECT_EQ(stats->reads.load(), 1);

    std::vector<std::byte> storage(100);
    ByteBuffer dst(storage);
    block.read_fully(dst, 10200);
    EXPECT_EQ(stats->reads.load(), 2);
    for (size_t i = 0; i < storage.size(); ++i)
        EXPECT_EQ(storage[i], pattern_byte(10200 + i)) << i;

    // Fully inside the refilled region.
    dst.clear();
    block.read_fully(dst, 10300);
    EXPECT_EQ(stats->reads.load(), 2);
    block.close();
}

TEST_F(DataBlockTest, ReadFullyPastEndThrows)
{
    DataBlock block(file);
    block.open();
    DataBlock tail = block.slice(90);
    std::array<std::byte, 20> storage{};
    ByteBuffer dst(storage);
    EXPECT_THROW(tail.read_fully(dst, 0), EndOfDataError);
    EXPECT_EQ(dst.position(), 10u);
    EXPECT_EQ(storage[9], pattern_byte(99));
    block.close();
}
