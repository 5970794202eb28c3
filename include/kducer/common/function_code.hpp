#pragma once

#include <cstdint>

namespace kducer {

// Subset of Modbus function codes understood by the KDU controller
enum class FunctionCode : uint8_t {
  kInvalid = 0,
  kReadHR = 3,
  kReadIR = 4,
  kWriteSingleCoil = 5,
  kWriteSingleReg = 6,
  kWriteMultRegs = 16
};

[[nodiscard]] static inline constexpr bool IsReadFunction(FunctionCode function_code) {
  return function_code == FunctionCode::kReadHR || function_code == FunctionCode::kReadIR;
}

}  // namespace kducer
