#include <array>
#include <cstdint>
#include <gtest/gtest.h>
#include "kducer/common/address_span.hpp"
#include "kducer/common/byte_helpers.hpp"

using kducer::AddressSpan;
using kducer::GetHighByte;
using kducer::GetLowByte;
using kducer::MakeU16;
using kducer::ReadU16;
using kducer::RegistersToBytes;
using kducer::WriteU16;

TEST(ByteHelpers, SplitsRegisterIntoWireBytes) {
  EXPECT_EQ(GetHighByte(0x1CCC), 0x1C);
  EXPECT_EQ(GetLowByte(0x1CCC), 0xCC);
  EXPECT_EQ(GetHighByte(0x00FF), 0x00);
  EXPECT_EQ(GetLowByte(0xFF00), 0x00);
}

TEST(ByteHelpers, MakeU16HighByteFirst) {
  EXPECT_EQ(MakeU16(0x12, 0x34), 0x1234);
  EXPECT_EQ(MakeU16(0xFF, 0x00), 0xFF00);
  EXPECT_EQ(MakeU16(0x00, 0x01), 0x0001);
}

TEST(ByteHelpers, ReadAndWriteAtOffset) {
  std::array<uint8_t, 6> buffer{};
  WriteU16(buffer, 2, 7372);
  EXPECT_EQ(buffer[0], 0x00);
  EXPECT_EQ(buffer[1], 0x00);
  EXPECT_EQ(buffer[2], 0x1C);
  EXPECT_EQ(buffer[3], 0xCC);
  EXPECT_EQ(ReadU16(buffer, 2), 7372);
  EXPECT_EQ(ReadU16(buffer, 4), 0);
}

TEST(ByteHelpers, RegistersToBytes) {
  EXPECT_EQ(RegistersToBytes(0), 0U);
  EXPECT_EQ(RegistersToBytes(67), 134U);
  EXPECT_EQ(RegistersToBytes(125), 250U);
}

TEST(AddressSpan, ByteCountAndContains) {
  constexpr AddressSpan kSpan{295, 67};
  EXPECT_EQ(kSpan.ByteCount(), 134U);
  EXPECT_TRUE(kSpan.Contains(295));
  EXPECT_TRUE(kSpan.Contains(361));
  EXPECT_FALSE(kSpan.Contains(294));
  EXPECT_FALSE(kSpan.Contains(362));
}

TEST(AddressSpan, EmptySpanContainsNothing) {
  constexpr AddressSpan kSpan{100, 0};
  EXPECT_EQ(kSpan.ByteCount(), 0U);
  EXPECT_FALSE(kSpan.Contains(100));
}

TEST(AddressSpan, Equality) {
  EXPECT_EQ((AddressSpan{7000, 46}), (AddressSpan{7000, 46}));
  EXPECT_NE((AddressSpan{7000, 46}), (AddressSpan{7000, 39}));
}
