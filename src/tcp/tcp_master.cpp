#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include "common/address_span.hpp"
#include "common/errors.hpp"
#include "common/function_code.hpp"
#include "tcp/tcp_frame.hpp"
#include "tcp/tcp_master.hpp"
#include "tcp/tcp_request.hpp"
#include "tcp/tcp_response.hpp"

namespace kducer {

std::vector<uint8_t> TcpMaster::ReadHoldingRegisters(uint8_t unit_id, uint16_t start_address, uint16_t count) {
  return ReadRegisters(FunctionCode::kReadHR, unit_id, start_address, count);
}

std::vector<uint8_t> TcpMaster::ReadInputRegisters(uint8_t unit_id, uint16_t start_address, uint16_t count) {
  return ReadRegisters(FunctionCode::kReadIR, unit_id, start_address, count);
}

std::vector<uint8_t> TcpMaster::ReadRegisters(FunctionCode function_code, uint8_t unit_id, uint16_t start_address,
                                              uint16_t count) {
  if (count == 0 || count > TcpFrame::kMaxReadRegisters) {
    throw InvalidArgument("Register count must be 1.." + std::to_string(TcpFrame::kMaxReadRegisters) + ", got " +
                          std::to_string(count));
  }

  TcpRequest request({GetNextTransactionId(), unit_id, function_code});
  if (!request.SetAddressSpan(AddressSpan{start_address, count})) {
    throw InvalidArgument("Function code cannot carry an address span");
  }

  auto response = SendRequest(request);
  // First byte is the byte count, already checked against count * 2
  const auto &data = response.GetData();
  return {data.begin() + 1, data.end()};
}

void TcpMaster::WriteSingleCoil(uint8_t unit_id, uint16_t address, bool value) {
  TcpRequest request({GetNextTransactionId(), unit_id, FunctionCode::kWriteSingleCoil});
  if (!request.SetWriteSingleCoilData(address, value)) {
    throw InvalidArgument("Cannot build write-coil request");
  }
  static_cast<void>(SendRequest(request));
}

void TcpMaster::WriteSingleRegister(uint8_t unit_id, uint16_t address, uint16_t value) {
  TcpRequest request({GetNextTransactionId(), unit_id, FunctionCode::kWriteSingleReg});
  if (!request.SetWriteSingleRegisterData(address, value)) {
    throw InvalidArgument("Cannot build write-register request");
  }
  static_cast<void>(SendRequest(request));
}

void TcpMaster::WriteMultipleRegisters(uint8_t unit_id, uint16_t start_address, std::span<const uint8_t> values) {
  TcpRequest request({GetNextTransactionId(), unit_id, FunctionCode::kWriteMultRegs});
  if (!request.SetWriteMultipleRegistersData(start_address, values)) {
    throw InvalidArgument("Write-multiple payload must be a non-empty even number of bytes, at most " +
                          std::to_string(TcpFrame::kMaxWriteRegisters) + " registers; got " +
                          std::to_string(values.size()) + " bytes");
  }
  static_cast<void>(SendRequest(request));
}

TcpResponse TcpMaster::SendRequest(const TcpRequest &request) {
  transport_.SendAll(TcpFrame::EncodeRequest(request));

  const auto header = transport_.ReceiveAll(TcpFrame::kMbapHeaderSize);
  size_t remaining = 0;
  try {
    remaining = TcpFrame::ValidateResponseHeader(request, header);
  } catch (const ProtocolError &) {
    const uint16_t declared = TcpFrame::ExtractLength(header);
    if (declared > 1 && declared <= TcpFrame::kMaxDeclaredLength) {
      static_cast<void>(transport_.ReceiveAll(declared - 1));
    }
    throw;
  }

  const auto body = transport_.ReceiveAll(remaining);
  return TcpFrame::DecodeResponseBody(request, body);
}

}  // namespace kducer
