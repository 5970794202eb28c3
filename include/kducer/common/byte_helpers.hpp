#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace kducer {

static constexpr uint8_t kMaxByte = 0xFF;
static constexpr uint8_t kBitsPerByte = 8;
static constexpr size_t kBytesPerRegister = 2;
static constexpr uint16_t kCoilOnValue = 0xFF00;
static constexpr uint8_t kExceptionFunctionCodeMask = 0x80;

static inline constexpr uint8_t GetLowByte(uint16_t value) {
  return value & kMaxByte;
}

static inline constexpr uint8_t GetHighByte(uint16_t value) {
  return (value >> kBitsPerByte) & kMaxByte;
}

/**
 * @brief Assemble a 16-bit value from wire bytes (network order: high byte first)
 */
static inline constexpr uint16_t MakeU16(uint8_t high_byte, uint8_t low_byte) {
  return static_cast<uint16_t>(static_cast<uint16_t>(high_byte) << kBitsPerByte | static_cast<uint16_t>(low_byte));
}

/**
 * @brief Read a big-endian u16 at @p offset; caller guarantees offset + 1 is in range
 */
static inline uint16_t ReadU16(std::span<const uint8_t> bytes, size_t offset) {
  return MakeU16(bytes[offset], bytes[offset + 1]);
}

/**
 * @brief Write a big-endian u16 at @p offset; caller guarantees offset + 1 is in range
 */
static inline void WriteU16(std::span<uint8_t> bytes, size_t offset, uint16_t value) {
  bytes[offset] = GetHighByte(value);
  bytes[offset + 1] = GetLowByte(value);
}

static inline constexpr size_t RegistersToBytes(size_t register_count) {
  return register_count * kBytesPerRegister;
}

}  // namespace kducer
