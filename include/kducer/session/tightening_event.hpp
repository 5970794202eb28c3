#pragma once

#include <chrono>
#include <cstdint>
#include <span>
#include <vector>

namespace kducer {

/**
 * @brief One completed tightening as read from the device
 *
 * The bytes are handed over untouched (apart from the optional timestamp
 * override); a result codec turns them into named fields.
 */
struct TighteningEvent {
  std::vector<uint8_t> result;        // result block, 134 bytes
  std::vector<uint8_t> torque_graph;  // 142 bytes in high-resolution graph mode, empty otherwise
  std::vector<uint8_t> angle_graph;   // 142 bytes in high-resolution graph mode, empty otherwise
  uint16_t firmware_version{0};       // selects the codec layout

  [[nodiscard]] bool HasGraph() const noexcept { return !torque_graph.empty() && !angle_graph.empty(); }
};

/**
 * @brief Overwrite the timestamp fields of a result block with @p when in local time
 *
 * Writes year % 2000, month, day, hour, minute and second as big-endian u16 values.
 * Blocks too short to hold the timestamp are left unchanged.
 */
void ReplaceResultTimestamp(std::span<uint8_t> result, std::chrono::system_clock::time_point when);

}  // namespace kducer
