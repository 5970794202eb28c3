#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <span>
#include "common/byte_helpers.hpp"
#include "session/register_map.hpp"
#include "session/tightening_event.hpp"

namespace kducer {

void ReplaceResultTimestamp(std::span<uint8_t> result, std::chrono::system_clock::time_point when) {
  static constexpr size_t kTimestampFields = 6;
  if (result.size() < kdu::kResultTimestampOffset + kTimestampFields * kBytesPerRegister) {
    return;
  }

  const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
  std::tm local{};
  localtime_r(&seconds, &local);

  const uint16_t fields[kTimestampFields] = {
      static_cast<uint16_t>((local.tm_year + 1900) % 2000),
      static_cast<uint16_t>(local.tm_mon + 1),
      static_cast<uint16_t>(local.tm_mday),
      static_cast<uint16_t>(local.tm_hour),
      static_cast<uint16_t>(local.tm_min),
      static_cast<uint16_t>(local.tm_sec),
  };
  for (size_t i = 0; i < kTimestampFields; ++i) {
    WriteU16(result, kdu::kResultTimestampOffset + i * kBytesPerRegister, fields[i]);
  }
}

}  // namespace kducer
