#include <array>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <string_view>
#include <vector>
#include <gtest/gtest.h>
#include "kducer/common/address_span.hpp"
#include "kducer/common/byte_helpers.hpp"
#include "kducer/session/register_map.hpp"
#include "kducer/session/tightening_event.hpp"

using kducer::AddressSpan;
using kducer::GetRegisterMap;
using kducer::ParseFirmwareVersion;
using kducer::ReadU16;
using kducer::ReplaceResultTimestamp;

TEST(RegisterMap, LegacyTier) {
  for (uint16_t version : {0, 1, 37}) {
    const auto &map = GetRegisterMap(version);
    EXPECT_EQ(map.max_program_number, 64) << "version " << version;
    EXPECT_EQ(map.max_sequence_number, 8) << "version " << version;
    EXPECT_EQ(map.ProgramBytes(), 180U);
    EXPECT_EQ(map.SequenceBytes(), 64U);
    EXPECT_EQ(map.SettingsBytes(), 78U);
  }
}

TEST(RegisterMap, CurrentTier) {
  for (uint16_t version : {38, 40, 41, 999}) {
    const auto &map = GetRegisterMap(version);
    EXPECT_EQ(map.max_program_number, 200) << "version " << version;
    EXPECT_EQ(map.max_sequence_number, 24) << "version " << version;
    EXPECT_EQ(map.ProgramBytes(), 230U);
    EXPECT_EQ(map.SequenceBytes(), 112U);
    EXPECT_EQ(map.SettingsBytes(), 92U);
  }
}

TEST(RegisterMap, ProgramAndSequenceBlocks) {
  const auto &map = GetRegisterMap(38);
  EXPECT_EQ(map.ProgramBlock(1), (AddressSpan{10000, 115}));
  EXPECT_EQ(map.ProgramBlock(2), (AddressSpan{10115, 115}));
  EXPECT_EQ(map.SequenceBlock(1), (AddressSpan{35000, 56}));
  EXPECT_EQ(map.SequenceBlock(3), (AddressSpan{35112, 56}));

  // Last blocks stay inside the 16-bit address space
  const AddressSpan last_program = map.ProgramBlock(map.max_program_number);
  EXPECT_LE(static_cast<uint32_t>(last_program.start_address) + last_program.reg_count, 0x10000U);
  const AddressSpan last_sequence = map.SequenceBlock(map.max_sequence_number);
  EXPECT_LE(static_cast<uint32_t>(last_sequence.start_address) + last_sequence.reg_count, 0x10000U);
}

TEST(RegisterMap, BlocksFitOneRequest) {
  for (uint16_t version : {0, 38}) {
    const auto &map = GetRegisterMap(version);
    EXPECT_LE(map.program_register_count, 123);
    EXPECT_LE(map.sequence_register_count, 123);
    EXPECT_LE(map.settings_block.reg_count, 123);
  }
}

TEST(ParseFirmwareVersion, TrailingNumberAfterLastDot) {
  EXPECT_EQ(ParseFirmwareVersion("KDU-1A v.00.38"), 38);
  EXPECT_EQ(ParseFirmwareVersion("KDU-1A v.00.41"), 41);
  EXPECT_EQ(ParseFirmwareVersion("v.1.37"), 37);
}

TEST(ParseFirmwareVersion, IgnoresPadding) {
  EXPECT_EQ(ParseFirmwareVersion(std::string_view("KDU v.00.40\0\0\0", 14)), 40);
  EXPECT_EQ(ParseFirmwareVersion("KDU v.00.40   "), 40);
}

TEST(ParseFirmwareVersion, UnparsableIsZero) {
  EXPECT_EQ(ParseFirmwareVersion(""), 0);
  EXPECT_EQ(ParseFirmwareVersion("KDU"), 0);
  EXPECT_EQ(ParseFirmwareVersion("KDU v."), 0);
  EXPECT_EQ(ParseFirmwareVersion("KDU v.3x"), 0);
  EXPECT_EQ(ParseFirmwareVersion("v.99999"), 0);
}

TEST(TighteningEvent, ReplaceResultTimestampWritesLocalTime) {
  std::vector<uint8_t> result(kducer::kdu::kResultBytes, 0xAA);
  std::tm when{};
  when.tm_year = 2024 - 1900;
  when.tm_mon = 4;
  when.tm_mday = 17;
  when.tm_hour = 13;
  when.tm_min = 5;
  when.tm_sec = 59;
  when.tm_isdst = -1;
  const auto time_point = std::chrono::system_clock::from_time_t(std::mktime(&when));

  ReplaceResultTimestamp(result, time_point);

  const size_t offset = kducer::kdu::kResultTimestampOffset;
  EXPECT_EQ(ReadU16(result, offset), 24);
  EXPECT_EQ(ReadU16(result, offset + 2), 5);
  EXPECT_EQ(ReadU16(result, offset + 4), 17);
  EXPECT_EQ(ReadU16(result, offset + 6), 13);
  EXPECT_EQ(ReadU16(result, offset + 8), 5);
  EXPECT_EQ(ReadU16(result, offset + 10), 59);
  // Bytes around the timestamp are untouched
  EXPECT_EQ(result[offset - 1], 0xAA);
  EXPECT_EQ(result[offset + 12], 0xAA);
}

TEST(TighteningEvent, ShortBlockIsLeftAlone) {
  std::vector<uint8_t> result(10, 0xAA);
  ReplaceResultTimestamp(result, std::chrono::system_clock::now());
  EXPECT_EQ(result, std::vector<uint8_t>(10, 0xAA));
}

TEST(TighteningEvent, HasGraph) {
  kducer::TighteningEvent event;
  EXPECT_FALSE(event.HasGraph());
  event.torque_graph.assign(142, 0);
  EXPECT_FALSE(event.HasGraph());
  event.angle_graph.assign(142, 0);
  EXPECT_TRUE(event.HasGraph());
}
