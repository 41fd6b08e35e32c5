/**
 * @file test_data_block_input_stream.cpp
 * @brief Sequential reads, skipping and closing of DataBlockInputStream.
 */
#include "nj_archive.hpp"
#include "shared_test_helpers.h"
#include <gtest/gtest.h>
#include <array>
#include <memory>
#include <utility>

using namespace nestjar::archive;
using namespace nestjar::tests::helper;

class DataBlockInputStreamTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        write_pattern_file(file, 300);
        block = std::make_unique<DataBlock>(file);
    }

    TempDir dir{"nestjar_stream"};
    fs::path file = dir / "entries.bin";
    std::unique_ptr<DataBlock> block;
};

TEST_F(DataBlockInputStreamTest, ReadsBytesUntilEnd)
{
    DataBlock entry = block->slice(296, 4);
    entry.open();
    auto stream = entry.as_input_stream();
    EXPECT_EQ(stream.available(), 4);
    for (size_t i = 0; i < 4; ++i)
        EXPECT_EQ(stream.read(), std::to_integer<int>(pattern_byte(296 + i)));
    EXPECT_EQ(stream.read(), -1);
    EXPECT_EQ(stream.available(), 0);
}

TEST_F(DataBlockInputStreamTest, ByteValuesAreUnsigned)
{
    // pattern_byte(250) == 250: must come back positive.
    DataBlock entry = block->slice(250, 1);
    entry.open();
    auto stream = entry.as_input_stream();
    EXPECT_EQ(stream.read(), 250);
}

TEST_F(DataBlockInputStreamTest, BulkReadStopsAtEnd)
{
    DataBlock entry = block->slice(100, 30);
    entry.open();
    auto stream = entry.as_input_stream();

    std::array<std::byte, 20> storage{};
    EXPECT_EQ(stream.read(storage), 20);
    EXPECT_EQ(storage[0], pattern_byte(100));
    EXPECT_EQ(stream.read(storage), 10);
    EXPECT_EQ(storage[9], pattern_byte(129));
    EXPECT_EQ(stream.read(storage), -1);
    EXPECT_EQ(stream.read(std::span<std::byte>{}), 0);
}

TEST_F(DataBlockInputStreamTest, SkipIsClampedBothWays)
{
    DataBlock entry = block->slice(0, 50);
    entry.open();
    auto stream = entry.as_input_stream();

    EXPECT_EQ(stream.skip(10), 10);
    EXPECT_EQ(stream.available(), 40);
    EXPECT_EQ(stream.skip(-4), -4);
    EXPECT_EQ(stream.read(), std::to_integer<int>(pattern_byte(6)));
    EXPECT_EQ(stream.skip(-100), -7);
    EXPECT_EQ(stream.skip(1000), 50);
    EXPECT_EQ(stream.read(), -1);
    EXPECT_EQ(stream.skip(0), 0);
}

TEST_F(DataBlockInputStreamTest, CloseReleasesBlockReferenceOnce)
{
    block->open();
    auto stream = block->as_input_stream();
    EXPECT_EQ(block->channel()->reference_count(), 1);

    stream.close();
    EXPECT_TRUE(stream.is_closed());
    EXPECT_EQ(block->channel()->reference_count(), 0);
    EXPECT_NO_THROW(stream.close());
    EXPECT_EQ(stream.available(), 0);
    EXPECT_THROW(stream.read(), ChannelClosedError);
    EXPECT_THROW(stream.skip(1), ChannelClosedError);
}

TEST_F(DataBlockInputStreamTest, DestructionClosesStream)
{
    block->open();
    block->open();
    {
        auto stream = block->as_input_stream();
        EXPECT_EQ(stream.read(), 0);
    }
    EXPECT_EQ(block->channel()->reference_count(), 1);
    block->close();
}

TEST_F(DataBlockInputStreamTest, MovedFromStreamDoesNotCloseAgain)
{
    block->open();
    auto first = block->as_input_stream();
    first.skip(5);
    DataBlockInputStream second(std::move(first));
    EXPECT_EQ(second.read(), std::to_integer<int>(pattern_byte(5)));
    EXPECT_EQ(block->channel()->reference_count(), 1);
    second.close();
    EXPECT_EQ(block->channel()->reference_count(), 0);
}
