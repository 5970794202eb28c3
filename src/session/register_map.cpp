#include <array>
#include <cctype>
#include <cstdint>
#include <string_view>
#include "common/address_span.hpp"
#include "session/register_map.hpp"

namespace kducer {

namespace {

// Ordered by ascending min_firmware_version
constexpr std::array<RegisterMap, 2> kRegisterMaps{{
    // Up to firmware 37: 64 programs, 8 sequences
    {0, 64, 8, 10000, 90, 35000, 32, AddressSpan{7000, 39}},
    // Firmware 38 and later: 200 programs, 24 sequences
    {kCurrentFirmwareTier, kMaxProgramNumber, kMaxSequenceNumber, 10000, 115, 35000, 56, AddressSpan{7000, 46}},
}};

}  // namespace

AddressSpan RegisterMap::ProgramBlock(uint16_t program_number) const {
  return {static_cast<uint16_t>(program_base_address + (program_number - 1) * program_register_count),
          program_register_count};
}

AddressSpan RegisterMap::SequenceBlock(uint16_t sequence_number) const {
  return {static_cast<uint16_t>(sequence_base_address + (sequence_number - 1) * sequence_register_count),
          sequence_register_count};
}

const RegisterMap &GetRegisterMap(uint16_t firmware_version) noexcept {
  const RegisterMap *selected = &kRegisterMaps.front();
  for (const auto &map : kRegisterMaps) {
    if (firmware_version >= map.min_firmware_version) {
      selected = &map;
    }
  }
  return *selected;
}

uint16_t ParseFirmwareVersion(std::string_view firmware) noexcept {
  // Device pads the string with NULs or spaces
  while (!firmware.empty() && (firmware.back() == '\0' || firmware.back() == ' ')) {
    firmware.remove_suffix(1);
  }
  const auto dot = firmware.rfind('.');
  if (dot == std::string_view::npos || dot + 1 == firmware.size()) {
    return 0;
  }

  unsigned value = 0;
  for (char c : firmware.substr(dot + 1)) {
    if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
      return 0;
    }
    value = value * 10 + static_cast<unsigned>(c - '0');
    if (value > 0xFFFF) {
      return 0;
    }
  }
  return static_cast<uint16_t>(value);
}

}  // namespace kducer
