#include <gtest/gtest.h>
#include <sstream>

#include "machine.hpp"

TEST(LittleU32, WriteThenRead) {
    std::ostringstream out;
    std::uint32_t original = 0xDEADBEEF;
    ASSERT_TRUE(writeLittleu32(out, original));

    std::string bytes = out.str();
    ASSERT_EQ(bytes.size(), 4u);

    // least significant byte first
    EXPECT_EQ(static_cast<std::uint8_t>(bytes[0]), 0xEF);
    EXPECT_EQ(static_cast<std::uint8_t>(bytes[1]), 0xBE);
    EXPECT_EQ(static_cast<std::uint8_t>(bytes[2]), 0xAD);
    EXPECT_EQ(static_cast<std::uint8_t>(bytes[3]), 0xDE);

    std::istringstream in(bytes, std::ios_base::binary);
    uint32_t reconstructed = 0;
    ASSERT_TRUE(readLittleu32(in, reconstructed));
    EXPECT_EQ(reconstructed, original);
}

TEST(LittleU32, ReadFailsOnShortStream) {
  // Only 3 bytes available -> read should fail and leave `out` unchanged
  std::string short_bytes = std::string("\x01\x02\x03", 3);
  std::istringstream in(short_bytes, std::ios_base::binary);
  std::uint32_t out_val = 0xFFFFFFFF;
  EXPECT_FALSE(readLittleu32(in, out_val));
  EXPECT_EQ(out_val, 0xFFFFFFFFu);
}

TEST(LittleU32, MultipleReads) {
  std::ostringstream out;
  writeLittleu32(out, 0x00000001);
  writeLittleu32(out, 0x7F800001);
  writeLittleu32(out, 0xFFFFFFFF);

  std::istringstream in(out.str(), std::ios_base::binary);
  std::uint32_t v1, v2, v3;
  ASSERT_TRUE(readLittleu32(in, v1));
  ASSERT_TRUE(readLittleu32(in, v2));
  ASSERT_TRUE(readLittleu32(in, v3));
  EXPECT_EQ(v1, 0x00000001u);
  EXPECT_EQ(v2, 0x7F800001u);
  EXPECT_EQ(v3, 0xFFFFFFFFu);

  // EOF now: additional read should fail
  std::uint32_t v4 = 0;
  EXPECT_FALSE(readLittleu32(in, v4));
}

TEST(Padded, ZeroFillsToWidth) {
  std::ostringstream out;
  ASSERT_TRUE(writePadded(out, "abc", 3, 6));
  EXPECT_EQ(out.str(), std::string("abc\0\0\0", 6));
}

TEST(Padded, TruncatesToWidth) {
  std::ostringstream out;
  ASSERT_TRUE(writePadded(out, "abcdef", 6, 4));
  EXPECT_EQ(out.str(), "abcd");
}

/* writes through a membuf land in the wrapped memory and cannot overrun it */
TEST(Membuf, WritesInPlace) {
  std::array<char, 4> mem = {0};
  membuf buf(mem.data(), mem.size());
  std::ostream out(&buf);

  EXPECT_TRUE(writeLittleu32(out, 0x04030201));
  EXPECT_EQ(1, mem[0]);
  EXPECT_EQ(4, mem[3]);

  EXPECT_FALSE(writeLittleu32(out, 1));
}
