#include <cstdint>
#include <span>
#include <vector>
#include <gtest/gtest.h>
#include "kducer/common/address_span.hpp"
#include "kducer/common/errors.hpp"
#include "kducer/common/exception_code.hpp"
#include "kducer/common/function_code.hpp"
#include "kducer/tcp/tcp_frame.hpp"
#include "kducer/tcp/tcp_request.hpp"
#include "kducer/tcp/tcp_response.hpp"

using kducer::AddressSpan;
using kducer::DeviceBusy;
using kducer::DeviceException;
using kducer::ExceptionCode;
using kducer::FunctionCode;
using kducer::ProtocolError;
using kducer::TcpFrame;
using kducer::TcpRequest;
using kducer::TcpResponse;

TEST(TCPFrame, EncodeReadRequest) {
  TcpRequest request{{1, 0, FunctionCode::kReadHR}};
  ASSERT_TRUE(request.SetAddressSpan(AddressSpan{7372, 1}));

  const auto frame = TcpFrame::EncodeRequest(request);
  const std::vector<uint8_t> expected{0x00, 0x01, 0x00, 0x00, 0x00, 0x06, 0x00, 0x03, 0x1C, 0xCC, 0x00, 0x01};
  EXPECT_EQ(frame, expected);
}

TEST(TCPFrame, EncodeWriteCoilRequest) {
  TcpRequest request{{0x1234, 0, FunctionCode::kWriteSingleCoil}};
  ASSERT_TRUE(request.SetWriteSingleCoilData(34, true));

  const auto frame = TcpFrame::EncodeRequest(request);
  const std::vector<uint8_t> expected{0x12, 0x34, 0x00, 0x00, 0x00, 0x06, 0x00, 0x05, 0x00, 0x22, 0xFF, 0x00};
  EXPECT_EQ(frame, expected);
}

TEST(TCPFrame, EncodeWriteMultipleRequest) {
  TcpRequest request{{2, 0, FunctionCode::kWriteMultRegs}};
  const std::vector<uint8_t> values{0x41, 0x42, 0x43, 0x00};
  ASSERT_TRUE(request.SetWriteMultipleRegistersData(7300, values));

  const auto frame = TcpFrame::EncodeRequest(request);
  const std::vector<uint8_t> expected{0x00, 0x02, 0x00, 0x00, 0x00, 0x0B, 0x00, 0x10, 0x1C,
                                      0x84, 0x00, 0x02, 0x04, 0x41, 0x42, 0x43, 0x00};
  EXPECT_EQ(frame, expected);
}

TEST(TCPFrame, RejectsUnbuildableWriteMultiple) {
  TcpRequest request{{2, 0, FunctionCode::kWriteMultRegs}};
  EXPECT_FALSE(request.SetWriteMultipleRegistersData(0, std::vector<uint8_t>{}));
  EXPECT_FALSE(request.SetWriteMultipleRegistersData(0, std::vector<uint8_t>{1, 2, 3}));
  EXPECT_FALSE(request.SetWriteMultipleRegistersData(0, std::vector<uint8_t>(248, 0)));
  EXPECT_TRUE(request.SetWriteMultipleRegistersData(0, std::vector<uint8_t>(246, 0)));
}

TEST(TCPFrame, DecodeRequestRecoversFields) {
  TcpRequest request{{1234, 5, FunctionCode::kReadIR}};
  request.SetAddressSpan(AddressSpan{295, 67});

  const auto decoded = TcpFrame::DecodeRequest(TcpFrame::EncodeRequest(request));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->GetTransactionId(), 1234);
  EXPECT_EQ(decoded->GetUnitId(), 5);
  EXPECT_EQ(decoded->GetFunctionCode(), FunctionCode::kReadIR);
  ASSERT_TRUE(decoded->GetAddressSpan().has_value());
  EXPECT_EQ(*decoded->GetAddressSpan(), (AddressSpan{295, 67}));
}

TEST(TCPFrame, DecodeRequestRejectsShortOrForeignFrames) {
  EXPECT_FALSE(TcpFrame::DecodeRequest(std::vector<uint8_t>{0x00, 0x01, 0x00}).has_value());
  // Protocol id 1
  EXPECT_FALSE(
      TcpFrame::DecodeRequest(std::vector<uint8_t>{0x00, 0x01, 0x00, 0x01, 0x00, 0x02, 0x00, 0x03}).has_value());
  // Length claims more than present
  EXPECT_FALSE(
      TcpFrame::DecodeRequest(std::vector<uint8_t>{0x00, 0x01, 0x00, 0x00, 0x00, 0x06, 0x00, 0x03}).has_value());
}

TEST(TCPFrame, ExpectedResponseLength) {
  TcpRequest read{{1, 0, FunctionCode::kReadHR}};
  read.SetAddressSpan(AddressSpan{10000, 115});
  EXPECT_EQ(TcpFrame::ExpectedResponseLength(read), 3 + 230);

  TcpRequest write{{1, 0, FunctionCode::kWriteSingleReg}};
  write.SetWriteSingleRegisterData(7390, 1);
  EXPECT_EQ(TcpFrame::ExpectedResponseLength(write), 6);
}

TEST(TCPFrame, ParseReadResponse) {
  TcpRequest request{{7, 0, FunctionCode::kReadHR}};
  request.SetAddressSpan(AddressSpan{7372, 1});

  TcpResponse reply{7, 0, FunctionCode::kReadHR};
  reply.SetData(std::vector<uint8_t>{0x02, 0x00, 0x05});

  const auto response = TcpFrame::ParseResponse(request, TcpFrame::EncodeResponse(reply));
  EXPECT_FALSE(response.IsException());
  EXPECT_EQ(response.GetData(), (std::vector<uint8_t>{0x02, 0x00, 0x05}));
}

TEST(TCPFrame, ParseWriteEcho) {
  TcpRequest request{{8, 0, FunctionCode::kWriteSingleReg}};
  request.SetWriteSingleRegisterData(7372, 12);

  TcpResponse echo{8, 0, FunctionCode::kWriteSingleReg};
  echo.SetData(request.GetData());
  EXPECT_NO_THROW(static_cast<void>(TcpFrame::ParseResponse(request, TcpFrame::EncodeResponse(echo))));

  TcpResponse wrong_value{8, 0, FunctionCode::kWriteSingleReg};
  wrong_value.SetData(std::vector<uint8_t>{0x1C, 0xCC, 0x00, 0x0D});
  EXPECT_THROW(static_cast<void>(TcpFrame::ParseResponse(request, TcpFrame::EncodeResponse(wrong_value))),
               ProtocolError);
}

TEST(TCPFrame, TransactionIdMismatch) {
  TcpRequest request{{1, 0, FunctionCode::kReadHR}};
  request.SetAddressSpan(AddressSpan{7372, 1});

  TcpResponse reply{2, 0, FunctionCode::kReadHR};
  reply.SetData(std::vector<uint8_t>{0x02, 0x00, 0x05});
  EXPECT_THROW(static_cast<void>(TcpFrame::ParseResponse(request, TcpFrame::EncodeResponse(reply))), ProtocolError);
}

TEST(TCPFrame, UnitIdMismatch) {
  TcpRequest request{{1, 0, FunctionCode::kReadHR}};
  request.SetAddressSpan(AddressSpan{7372, 1});

  TcpResponse reply{1, 9, FunctionCode::kReadHR};
  reply.SetData(std::vector<uint8_t>{0x02, 0x00, 0x05});
  EXPECT_THROW(static_cast<void>(TcpFrame::ParseResponse(request, TcpFrame::EncodeResponse(reply))), ProtocolError);
}

TEST(TCPFrame, NonZeroProtocolId) {
  TcpRequest request{{1, 0, FunctionCode::kReadHR}};
  request.SetAddressSpan(AddressSpan{7372, 1});

  const std::vector<uint8_t> frame{0x00, 0x01, 0x00, 0x01, 0x00, 0x05, 0x00, 0x03, 0x02, 0x00, 0x05};
  EXPECT_THROW(static_cast<void>(TcpFrame::ParseResponse(request, frame)), ProtocolError);
}

TEST(TCPFrame, UnexpectedDeclaredLength) {
  TcpRequest request{{1, 0, FunctionCode::kReadHR}};
  request.SetAddressSpan(AddressSpan{7372, 2});

  // One register returned where two were asked for
  TcpResponse reply{1, 0, FunctionCode::kReadHR};
  reply.SetData(std::vector<uint8_t>{0x02, 0x00, 0x05});
  EXPECT_THROW(static_cast<void>(TcpFrame::ParseResponse(request, TcpFrame::EncodeResponse(reply))), ProtocolError);
}

TEST(TCPFrame, FunctionCodeMismatch) {
  TcpRequest request{{1, 0, FunctionCode::kReadHR}};
  request.SetAddressSpan(AddressSpan{7372, 1});

  TcpResponse reply{1, 0, FunctionCode::kReadIR};
  reply.SetData(std::vector<uint8_t>{0x02, 0x00, 0x05});
  EXPECT_THROW(static_cast<void>(TcpFrame::ParseResponse(request, TcpFrame::EncodeResponse(reply))), ProtocolError);
}

TEST(TCPFrame, WrongByteCount) {
  TcpRequest request{{1, 0, FunctionCode::kReadHR}};
  request.SetAddressSpan(AddressSpan{7372, 1});

  TcpResponse reply{1, 0, FunctionCode::kReadHR};
  reply.SetData(std::vector<uint8_t>{0x04, 0x00, 0x05});
  EXPECT_THROW(static_cast<void>(TcpFrame::ParseResponse(request, TcpFrame::EncodeResponse(reply))), ProtocolError);
}

TEST(TCPFrame, BusyExceptionResponse) {
  TcpRequest request{{3, 0, FunctionCode::kWriteSingleReg}};
  request.SetWriteSingleRegisterData(7372, 4);

  TcpResponse reply{3, 0, FunctionCode::kWriteSingleReg};
  reply.SetExceptionCode(ExceptionCode::kServerDeviceBusy);
  const auto frame = TcpFrame::EncodeResponse(reply);
  ASSERT_EQ(frame.size(), 9U);
  EXPECT_EQ(frame[7], 0x86);
  EXPECT_EQ(frame[8], 0x06);

  EXPECT_THROW(static_cast<void>(TcpFrame::ParseResponse(request, frame)), DeviceBusy);
}

TEST(TCPFrame, OtherExceptionCarriesCode) {
  TcpRequest request{{3, 0, FunctionCode::kReadIR}};
  request.SetAddressSpan(AddressSpan{295, 67});

  TcpResponse reply{3, 0, FunctionCode::kReadIR};
  reply.SetExceptionCode(ExceptionCode::kIllegalDataAddress);
  try {
    static_cast<void>(TcpFrame::ParseResponse(request, TcpFrame::EncodeResponse(reply)));
    FAIL() << "expected DeviceException";
  } catch (const DeviceBusy &) {
    FAIL() << "code 2 is not busy";
  } catch (const DeviceException &e) {
    EXPECT_EQ(e.GetCode(), ExceptionCode::kIllegalDataAddress);
  }
}

TEST(TCPFrame, IsFrameComplete) {
  const std::vector<uint8_t> frame{0x00, 0x01, 0x00, 0x00, 0x00, 0x06, 0x00, 0x03, 0x1C, 0xCC, 0x00, 0x01};
  EXPECT_TRUE(TcpFrame::IsFrameComplete(frame));
  EXPECT_FALSE(TcpFrame::IsFrameComplete(std::span<const uint8_t>(frame).first(11)));
  EXPECT_FALSE(TcpFrame::IsFrameComplete(std::span<const uint8_t>(frame).first(6)));
}
