#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include "../common/address_span.hpp"

namespace kducer {

// Addresses shared by every firmware generation
namespace kdu {

// Input registers (telemetry)
static constexpr uint16_t kNewResultFlagRegister = 294;
static constexpr AddressSpan kResultBlock{295, 67};
static constexpr AddressSpan kTorqueGraphBlock{152, 71};
static constexpr AddressSpan kAngleGraphBlock{223, 71};
static constexpr AddressSpan kFirmwareVersionBlock{362, 10};

// Holding registers
static constexpr uint16_t kActiveProgramRegister = 7372;
static constexpr uint16_t kActiveSequenceRegister = 7373;
static constexpr AddressSpan kBarcodeBlock{7300, 8};
static constexpr uint16_t kReprogramControlRegister = 7390;

// Coils
static constexpr uint16_t kRemoteLeverCoil = 32;
static constexpr uint16_t kStopMotorCoil = 34;
static constexpr uint16_t kHighResGraphCoil = 36;

static constexpr size_t kResultBytes = 134;
static constexpr size_t kGraphBytes = 142;
static constexpr size_t kBarcodeMaxLength = 16;
// Offset of the six big-endian u16 timestamp fields inside the result block
static constexpr size_t kResultTimestampOffset = 102;

}  // namespace kdu

/**
 * @brief Firmware-dependent limits and data block addresses
 *
 * The KDU changed the size of its program, sequence and settings blocks with
 * firmware 38. Everything that depends on the generation lives in this table;
 * command handlers only ask it for spans.
 */
struct RegisterMap {
  uint16_t min_firmware_version;
  uint16_t max_program_number;
  uint16_t max_sequence_number;
  uint16_t program_base_address;
  uint16_t program_register_count;
  uint16_t sequence_base_address;
  uint16_t sequence_register_count;
  AddressSpan settings_block;

  [[nodiscard]] constexpr size_t ProgramBytes() const noexcept { return static_cast<size_t>(program_register_count) * 2; }
  [[nodiscard]] constexpr size_t SequenceBytes() const noexcept {
    return static_cast<size_t>(sequence_register_count) * 2;
  }
  [[nodiscard]] constexpr size_t SettingsBytes() const noexcept { return settings_block.ByteCount(); }

  /**
   * @brief Register block of program @p program_number (1-based, caller validates the range)
   */
  [[nodiscard]] AddressSpan ProgramBlock(uint16_t program_number) const;

  /**
   * @brief Register block of sequence @p sequence_number (1-based, caller validates the range)
   */
  [[nodiscard]] AddressSpan SequenceBlock(uint16_t sequence_number) const;
};

// Largest numbers any firmware accepts; checked before a command is queued
static constexpr uint16_t kMaxProgramNumber = 200;
static constexpr uint16_t kMaxSequenceNumber = 24;
static constexpr uint16_t kCurrentFirmwareTier = 38;

/**
 * @brief Select the table row for a firmware version (0 when unknown selects the legacy row)
 */
[[nodiscard]] const RegisterMap &GetRegisterMap(uint16_t firmware_version) noexcept;

/**
 * @brief Numeric version from the firmware string, e.g. "KDU-1A v.00.38" yields 38
 * @return 0 if the string carries no trailing number after a '.'
 */
[[nodiscard]] uint16_t ParseFirmwareVersion(std::string_view firmware) noexcept;

}  // namespace kducer
