#pragma once

#include <cstddef>
#include <cstdint>

namespace kducer {

/**
 * @brief Contiguous block of 16-bit registers on the device
 */
struct AddressSpan {
  uint16_t start_address{0};
  uint16_t reg_count{0};

  [[nodiscard]] constexpr size_t ByteCount() const noexcept { return static_cast<size_t>(reg_count) * 2; }

  [[nodiscard]] constexpr bool Contains(uint16_t address) const noexcept {
    return address >= start_address && address - start_address < reg_count;
  }

  friend constexpr bool operator==(const AddressSpan &, const AddressSpan &) = default;
};

}  // namespace kducer
