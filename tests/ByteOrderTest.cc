#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "ByteOrder.hh"

using namespace std;

TEST(ByteOrderTest, ReadU16) {
  string data("\x01\x02", 2);
  EXPECT_EQ(0x0102, read_u16(data, 0, Endianness::BIG));
  EXPECT_EQ(0x0201, read_u16(data, 0, Endianness::LITTLE));
}

TEST(ByteOrderTest, ReadU24) {
  string data("\x01\x02\x03", 3);
  EXPECT_EQ(0x010203u, read_u24(data, 0, Endianness::BIG));
  EXPECT_EQ(0x030201u, read_u24(data, 0, Endianness::LITTLE));
}

TEST(ByteOrderTest, WriteU16AtOffset) {
  string data(4, '\0');
  write_u16(data, 1, 0xABCD, Endianness::BIG);
  EXPECT_EQ(string("\x00\xAB\xCD\x00", 4), data);
  write_u16(data, 1, 0xABCD, Endianness::LITTLE);
  EXPECT_EQ(string("\x00\xCD\xAB\x00", 4), data);
}

TEST(ByteOrderTest, WriteU24MasksHighByte) {
  string data(5, '\xEE');
  write_u24(data, 1, 0x7F123456, Endianness::BIG);
  EXPECT_EQ(string("\xEE\x12\x34\x56\xEE", 5), data);
  write_u24(data, 1, 0x7F123456, Endianness::LITTLE);
  EXPECT_EQ(string("\xEE\x56\x34\x12\xEE", 5), data);
  EXPECT_EQ(0x123456u, read_u24(data, 1, Endianness::LITTLE));
}

TEST(ByteOrderTest, EndiannessNames) {
  EXPECT_STREQ("big", phosg::name_for_enum(Endianness::BIG));
  EXPECT_STREQ("little", phosg::name_for_enum(Endianness::LITTLE));
  EXPECT_EQ(Endianness::BIG, phosg::enum_for_name<Endianness>("big"));
  EXPECT_EQ(Endianness::LITTLE, phosg::enum_for_name<Endianness>("le"));
  EXPECT_THROW(phosg::enum_for_name<Endianness>("middle"), invalid_argument);
}
