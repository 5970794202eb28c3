#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>
#include "../common/address_span.hpp"
#include "../common/function_code.hpp"

namespace kducer {

class TcpRequest {
 public:
  struct Header {
    uint16_t transaction_id;
    uint8_t unit_id;
    FunctionCode function_code;
  };

  explicit TcpRequest(Header header)
      : header_(header) {}

  [[nodiscard]] uint16_t GetTransactionId() const noexcept { return header_.transaction_id; }
  [[nodiscard]] uint8_t GetUnitId() const noexcept { return header_.unit_id; }
  [[nodiscard]] FunctionCode GetFunctionCode() const noexcept { return header_.function_code; }
  [[nodiscard]] const std::vector<uint8_t> &GetData() const { return data_; }

  /**
   * @brief Start address and register count of a read request
   */
  [[nodiscard]] std::optional<AddressSpan> GetAddressSpan() const;

  bool SetAddressSpan(AddressSpan address_span);
  bool SetWriteSingleRegisterData(uint16_t register_address, uint16_t register_value);
  bool SetWriteSingleCoilData(uint16_t coil_address, bool coil_value);

  /**
   * @brief Payload of a write-multiple request; @p values are raw register bytes (two per register)
   */
  bool SetWriteMultipleRegistersData(uint16_t start_address, std::span<const uint8_t> values);

  void SetRawData(std::span<const uint8_t> data) { data_.assign(data.begin(), data.end()); }

 private:
  Header header_;
  std::vector<uint8_t> data_{};
};

}  // namespace kducer
