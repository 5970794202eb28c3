#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>
#include "../common/exception_code.hpp"
#include "../common/function_code.hpp"

namespace kducer {

class TcpResponse {
 public:
  TcpResponse(uint16_t transaction_id, uint8_t unit_id, FunctionCode function_code)
      : transaction_id_(transaction_id),
        unit_id_(unit_id),
        function_code_(function_code) {}

  [[nodiscard]] uint16_t GetTransactionId() const noexcept { return transaction_id_; }
  [[nodiscard]] uint8_t GetUnitId() const noexcept { return unit_id_; }
  [[nodiscard]] FunctionCode GetFunctionCode() const noexcept { return function_code_; }

  // Set only for exception responses
  [[nodiscard]] std::optional<ExceptionCode> GetExceptionCode() const noexcept { return exception_code_; }
  [[nodiscard]] bool IsException() const noexcept { return exception_code_.has_value(); }

  [[nodiscard]] const std::vector<uint8_t> &GetData() const noexcept { return data_; }

  void SetExceptionCode(ExceptionCode exception_code) noexcept { exception_code_ = exception_code; }

  void SetData(std::span<const uint8_t> data) { data_.assign(data.begin(), data.end()); }
  void EmplaceBack(uint8_t data) { data_.emplace_back(data); }

 private:
  uint16_t transaction_id_{};
  uint8_t unit_id_{};
  FunctionCode function_code_{};
  std::optional<ExceptionCode> exception_code_{};
  std::vector<uint8_t> data_{};
};

}  // namespace kducer
