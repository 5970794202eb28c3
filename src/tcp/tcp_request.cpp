#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
#include "common/address_span.hpp"
#include "common/byte_helpers.hpp"
#include "common/function_code.hpp"
#include "tcp/tcp_frame.hpp"
#include "tcp/tcp_request.hpp"

namespace kducer {

static constexpr size_t kStartAddressIndex{0};
static constexpr size_t kRegCountIndex{2};
static constexpr size_t kAddressSpanDataSize{4};
static constexpr size_t kWriteMultipleHeaderSize{5};  // address(2) + count(2) + byte_count(1)

std::optional<AddressSpan> TcpRequest::GetAddressSpan() const {
  if (data_.size() < kAddressSpanDataSize || !IsReadFunction(header_.function_code)) {
    return {};
  }

  AddressSpan address_span;
  address_span.start_address = ReadU16(data_, kStartAddressIndex);
  address_span.reg_count = ReadU16(data_, kRegCountIndex);
  return address_span;
}

bool TcpRequest::SetAddressSpan(AddressSpan address_span) {
  if (!IsReadFunction(header_.function_code)) {
    return false;
  }

  data_.assign(kAddressSpanDataSize, 0);
  WriteU16(data_, kStartAddressIndex, address_span.start_address);
  WriteU16(data_, kRegCountIndex, address_span.reg_count);
  return true;
}

bool TcpRequest::SetWriteSingleRegisterData(uint16_t register_address, uint16_t register_value) {
  if (header_.function_code != FunctionCode::kWriteSingleReg) {
    return false;
  }

  data_.assign(4, 0);
  WriteU16(data_, 0, register_address);
  WriteU16(data_, 2, register_value);
  return true;
}

bool TcpRequest::SetWriteSingleCoilData(uint16_t coil_address, bool coil_value) {
  if (header_.function_code != FunctionCode::kWriteSingleCoil) {
    return false;
  }

  data_.assign(4, 0);
  WriteU16(data_, 0, coil_address);
  WriteU16(data_, 2, coil_value ? kCoilOnValue : 0x0000);
  return true;
}

bool TcpRequest::SetWriteMultipleRegistersData(uint16_t start_address, std::span<const uint8_t> values) {
  if (header_.function_code != FunctionCode::kWriteMultRegs) {
    return false;
  }
  if (values.empty() || values.size() % kBytesPerRegister != 0 ||
      values.size() / kBytesPerRegister > TcpFrame::kMaxWriteRegisters) {
    return false;
  }

  const auto count = static_cast<uint16_t>(values.size() / kBytesPerRegister);
  data_.assign(kWriteMultipleHeaderSize, 0);
  WriteU16(data_, 0, start_address);
  WriteU16(data_, 2, count);
  data_[4] = static_cast<uint8_t>(values.size());
  data_.insert(data_.end(), values.begin(), values.end());
  return true;
}

}  // namespace kducer
