#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
#include "../common/function_code.hpp"
#include "tcp_request.hpp"
#include "tcp_response.hpp"

namespace kducer {

/**
 * @brief TCP frame encoder/decoder
 *
 * Handles conversion between byte frames and Modbus TCP request/response objects.
 * Every frame starts with the 7-byte MBAP header:
 * - Transaction ID (2 bytes)
 * - Protocol ID (2 bytes, always 0x0000)
 * - Length (2 bytes) - number of bytes following (Unit ID + PDU)
 * - Unit ID (1 byte)
 * followed by the PDU (function code + data). All integers are big-endian.
 *
 * The client side validates strictly and throws; the decode helpers used by device
 * simulators return an empty optional on malformed input.
 */
class TcpFrame {
 public:
  static constexpr size_t kMbapHeaderSize = 7;       // Transaction ID(2) + Protocol ID(2) + Length(2) + Unit ID(1)
  static constexpr uint16_t kExceptionLength = 3;    // Unit ID(1) + function code(1) + exception code(1)
  static constexpr uint16_t kWriteEchoLength = 6;    // Unit ID(1) + function code(1) + address(2) + value/count(2)
  static constexpr uint16_t kMaxDeclaredLength = 254;  // Unit ID(1) + largest PDU(253)
  static constexpr uint16_t kMaxReadRegisters = 125;
  static constexpr uint16_t kMaxWriteRegisters = 123;

  /**
   * @brief Encode a request into a TCP frame with MBAP header
   */
  [[nodiscard]] static std::vector<uint8_t> EncodeRequest(const TcpRequest &request);

  /**
   * @brief Encode a response into a TCP frame with MBAP header
   */
  [[nodiscard]] static std::vector<uint8_t> EncodeResponse(const TcpResponse &response);

  /**
   * @brief Decode a complete request frame
   * @return Parsed request if frame is valid, empty optional otherwise
   */
  [[nodiscard]] static std::optional<TcpRequest> DecodeRequest(std::span<const uint8_t> frame);

  /**
   * @brief Value of the MBAP length field a successful response to @p request carries
   *
   * Reads answer with byte count + 2 bytes per register (3 + 2n), writes echo
   * address and value or count (6).
   */
  [[nodiscard]] static uint16_t ExpectedResponseLength(const TcpRequest &request);

  /**
   * @brief Check a received MBAP header against the request it answers
   * @param request The request that was sent
   * @param header Exactly kMbapHeaderSize received bytes
   * @return Number of bytes still to read (function code + payload)
   * @throws ProtocolError if an echoed field or the declared length is wrong
   */
  [[nodiscard]] static size_t ValidateResponseHeader(const TcpRequest &request, std::span<const uint8_t> header);

  /**
   * @brief Decode the PDU that follows a validated header
   * @param request The request that was sent
   * @param body Function code and payload
   * @throws DeviceBusy for exception code 6, DeviceException for any other exception response
   * @throws ProtocolError if the function code, size, byte count or echo is wrong
   */
  [[nodiscard]] static TcpResponse DecodeResponseBody(const TcpRequest &request, std::span<const uint8_t> body);

  /**
   * @brief ValidateResponseHeader() followed by DecodeResponseBody() on a complete frame
   */
  [[nodiscard]] static TcpResponse ParseResponse(const TcpRequest &request, std::span<const uint8_t> frame);

  /**
   * @brief Raw length field of a header (0 if too short)
   */
  [[nodiscard]] static uint16_t ExtractLength(std::span<const uint8_t> frame);

  /**
   * @brief Check if a frame holds at least one complete ADU
   */
  [[nodiscard]] static bool IsFrameComplete(std::span<const uint8_t> frame);

 private:
  static constexpr uint16_t kProtocolId = 0x0000;

  [[nodiscard]] static uint16_t ExtractTransactionId(std::span<const uint8_t> frame);
  [[nodiscard]] static uint16_t ExtractProtocolId(std::span<const uint8_t> frame);
  [[nodiscard]] static uint8_t ExtractUnitId(std::span<const uint8_t> frame);

  /**
   * @brief Write MBAP header with a placeholder length, return the offset of the length field
   */
  static size_t WriteHeader(std::vector<uint8_t> &frame, uint16_t transaction_id, uint8_t unit_id);
  static void PatchLength(std::vector<uint8_t> &frame, size_t length_offset);
};

}  // namespace kducer
