#include "nj_base.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <array>
#include <algorithm>
#include <regex>

using namespace nestjar::format_tools;
using ::testing::HasSubstr;

TEST(FormatToolsTest, FilenameOnly_HandlesBothSeparators)
{
    static_assert(filename_only("a/b/c.cpp") == "c.cpp");
    EXPECT_EQ(filename_only("C:\\src\\x.hpp"), "x.hpp");
    EXPECT_EQ(filename_only("plain.txt"), "plain.txt");
    EXPECT_EQ(filename_only("dir/"), "");
}

TEST(FormatToolsTest, FormattedTime_HasMicrosecondPrecision)
{
    const std::string s = formatted_time(std::chrono::system_clock::now());
    EXPECT_TRUE(std::regex_match(s, std::regex(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{6})")))
        << s;
}

TEST(FormatToolsTest, HexDump_FormatsRowsWithOffsetAndAscii)
{
    std::array<std::byte, 18> bytes{};
    for (size_t i = 0; i < bytes.size(); ++i)
        bytes[i] = static_cast<std::byte>('A' + i);
    bytes[1] = std::byte{0x00};

    const std::string dump = hex_dump(bytes, 0x20);
    EXPECT_THAT(dump, HasSubstr("00000020  41 00 43 44"));
    EXPECT_THAT(dump, HasSubstr("|A.CDEFGHIJKLMNOP|\n"));
    EXPECT_THAT(dump, HasSubstr("00000030  51 52 "));
    EXPECT_THAT(dump, HasSubstr("|QR|\n"));
    EXPECT_EQ(std::count(dump.begin(), dump.end(), '\n'), 2);
}

TEST(FormatToolsTest, HexDump_EmptyInputIsEmpty)
{
    EXPECT_TRUE(hex_dump({}).empty());
}

TEST(FormatToolsTest, MakeBuffer_FormatsIntoMemoryBuffer)
{
    auto mb = make_buffer("{}-{}", 1, "two");
    EXPECT_EQ(std::string(mb.data(), mb.size()), "1-two");
}
