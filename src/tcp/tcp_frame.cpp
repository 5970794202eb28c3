#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include "common/byte_helpers.hpp"
#include "common/errors.hpp"
#include "common/exception_code.hpp"
#include "common/function_code.hpp"
#include "tcp/tcp_frame.hpp"
#include "tcp/tcp_request.hpp"
#include "tcp/tcp_response.hpp"

namespace kducer {

namespace {

std::string Hex(unsigned value) {
  static constexpr char kDigits[] = "0123456789ABCDEF";
  std::string text = "0x";
  text += kDigits[(value >> 4) & 0x0F];
  text += kDigits[value & 0x0F];
  return text;
}

}  // namespace

uint16_t TcpFrame::ExtractTransactionId(std::span<const uint8_t> frame) {
  if (frame.size() < 2) {
    return 0;
  }
  return ReadU16(frame, 0);
}

uint16_t TcpFrame::ExtractProtocolId(std::span<const uint8_t> frame) {
  if (frame.size() < 4) {
    return 0;
  }
  return ReadU16(frame, 2);
}

uint16_t TcpFrame::ExtractLength(std::span<const uint8_t> frame) {
  if (frame.size() < 6) {
    return 0;
  }
  // Length is at offset 4-5
  return ReadU16(frame, 4);
}

uint8_t TcpFrame::ExtractUnitId(std::span<const uint8_t> frame) {
  if (frame.size() < kMbapHeaderSize) {
    return 0;
  }
  return frame[6];
}

size_t TcpFrame::WriteHeader(std::vector<uint8_t> &frame, uint16_t transaction_id, uint8_t unit_id) {
  frame.push_back(GetHighByte(transaction_id));
  frame.push_back(GetLowByte(transaction_id));
  frame.push_back(GetHighByte(kProtocolId));
  frame.push_back(GetLowByte(kProtocolId));
  size_t length_offset = frame.size();
  frame.resize(frame.size() + 2);  // Reserve space for length
  frame.push_back(unit_id);
  return length_offset;
}

void TcpFrame::PatchLength(std::vector<uint8_t> &frame, size_t length_offset) {
  // Length covers the Unit ID and everything after it
  auto length = static_cast<uint16_t>(frame.size() - length_offset - 2);
  WriteU16(frame, length_offset, length);
}

std::vector<uint8_t> TcpFrame::EncodeRequest(const TcpRequest &request) {
  std::vector<uint8_t> frame;
  size_t length_offset = WriteHeader(frame, request.GetTransactionId(), request.GetUnitId());

  frame.push_back(static_cast<uint8_t>(request.GetFunctionCode()));
  const auto &data = request.GetData();
  frame.insert(frame.end(), data.begin(), data.end());

  PatchLength(frame, length_offset);
  return frame;
}

std::vector<uint8_t> TcpFrame::EncodeResponse(const TcpResponse &response) {
  std::vector<uint8_t> frame;
  size_t length_offset = WriteHeader(frame, response.GetTransactionId(), response.GetUnitId());

  auto function_code_byte = static_cast<uint8_t>(response.GetFunctionCode());
  if (response.IsException()) {
    frame.push_back(static_cast<uint8_t>(function_code_byte | kExceptionFunctionCodeMask));
    frame.push_back(static_cast<uint8_t>(*response.GetExceptionCode()));
  } else {
    frame.push_back(function_code_byte);
    const auto &data = response.GetData();
    frame.insert(frame.end(), data.begin(), data.end());
  }

  PatchLength(frame, length_offset);
  return frame;
}

std::optional<TcpRequest> TcpFrame::DecodeRequest(std::span<const uint8_t> frame) {
  // Minimum frame: MBAP header (7) + function_code (1)
  if (frame.size() < kMbapHeaderSize + 1 || ExtractProtocolId(frame) != kProtocolId) {
    return {};
  }

  uint16_t length = ExtractLength(frame);
  if (length < 2 || frame.size() < static_cast<size_t>(6 + length)) {
    return {};
  }

  auto function_code = static_cast<FunctionCode>(frame[kMbapHeaderSize]);
  TcpRequest request({ExtractTransactionId(frame), ExtractUnitId(frame), function_code});
  // PDU data = length - Unit ID(1) - function code(1)
  request.SetRawData(frame.subspan(kMbapHeaderSize + 1, length - 2));
  return request;
}

uint16_t TcpFrame::ExpectedResponseLength(const TcpRequest &request) {
  if (IsReadFunction(request.GetFunctionCode())) {
    auto span = request.GetAddressSpan();
    const size_t registers = span.has_value() ? span->reg_count : 0;
    return static_cast<uint16_t>(3 + RegistersToBytes(registers));
  }
  return kWriteEchoLength;
}

size_t TcpFrame::ValidateResponseHeader(const TcpRequest &request, std::span<const uint8_t> header) {
  if (header.size() != kMbapHeaderSize) {
    throw ProtocolError("MBAP header must be 7 bytes, got " + std::to_string(header.size()));
  }
  if (ExtractTransactionId(header) != request.GetTransactionId()) {
    throw ProtocolError("Transaction id mismatch: sent " + std::to_string(request.GetTransactionId()) +
                        ", received " + std::to_string(ExtractTransactionId(header)));
  }
  if (ExtractProtocolId(header) != kProtocolId) {
    throw ProtocolError("Protocol id must be 0, received " + std::to_string(ExtractProtocolId(header)));
  }
  if (ExtractUnitId(header) != request.GetUnitId()) {
    throw ProtocolError("Unit id mismatch: sent " + std::to_string(request.GetUnitId()) + ", received " +
                        std::to_string(ExtractUnitId(header)));
  }

  const uint16_t length = ExtractLength(header);
  const uint16_t expected = ExpectedResponseLength(request);
  if (length != expected && length != kExceptionLength) {
    throw ProtocolError("Declared length " + std::to_string(length) + " is neither " + std::to_string(expected) +
                        " nor the exception length");
  }
  // Unit ID is part of the header already
  return static_cast<size_t>(length) - 1;
}

TcpResponse TcpFrame::DecodeResponseBody(const TcpRequest &request, std::span<const uint8_t> body) {
  if (body.empty()) {
    throw ProtocolError("Empty response PDU");
  }

  const auto request_code = static_cast<uint8_t>(request.GetFunctionCode());
  const uint8_t function_code_byte = body[0];
  TcpResponse response(request.GetTransactionId(), request.GetUnitId(), request.GetFunctionCode());

  if (function_code_byte == (request_code | kExceptionFunctionCodeMask)) {
    if (body.size() != 2) {
      throw ProtocolError("Exception response must carry exactly one exception code");
    }
    const auto code = static_cast<ExceptionCode>(body[1]);
    if (code == ExceptionCode::kServerDeviceBusy) {
      throw DeviceBusy("Device busy: request with function code " + std::to_string(request_code) +
                       " was not processed");
    }
    throw DeviceException(code, "Modbus exception " + Hex(body[1]) + " for function code " +
                                    std::to_string(request_code));
  }

  if (function_code_byte != request_code) {
    throw ProtocolError("Function code mismatch: sent " + std::to_string(request_code) + ", received " +
                        std::to_string(function_code_byte));
  }
  if (body.size() + 1 != ExpectedResponseLength(request)) {
    throw ProtocolError("Response PDU has " + std::to_string(body.size()) + " bytes, expected " +
                        std::to_string(ExpectedResponseLength(request) - 1));
  }

  const auto payload = body.subspan(1);
  if (IsReadFunction(request.GetFunctionCode())) {
    if (payload[0] != payload.size() - 1) {
      throw ProtocolError("Byte count " + std::to_string(payload[0]) + " does not match " +
                          std::to_string(payload.size() - 1) + " register bytes");
    }
  } else {
    // Writes echo the first four request bytes (address + value or count)
    const auto &sent = request.GetData();
    if (sent.size() < 4 || !std::equal(payload.begin(), payload.begin() + 4, sent.begin())) {
      throw ProtocolError("Write response does not echo the request");
    }
  }

  response.SetData(payload);
  return response;
}

TcpResponse TcpFrame::ParseResponse(const TcpRequest &request, std::span<const uint8_t> frame) {
  if (frame.size() < kMbapHeaderSize) {
    throw ProtocolError("Frame shorter than the MBAP header");
  }
  const size_t remaining = ValidateResponseHeader(request, frame.first(kMbapHeaderSize));
  if (frame.size() != kMbapHeaderSize + remaining) {
    throw ProtocolError("Frame has " + std::to_string(frame.size()) + " bytes, header declares " +
                        std::to_string(kMbapHeaderSize + remaining));
  }
  return DecodeResponseBody(request, frame.subspan(kMbapHeaderSize));
}

bool TcpFrame::IsFrameComplete(std::span<const uint8_t> frame) {
  if (frame.size() < kMbapHeaderSize) {
    return false;
  }
  // Total frame size = 6 + length
  return frame.size() >= static_cast<size_t>(6 + ExtractLength(frame));
}

}  // namespace kducer
