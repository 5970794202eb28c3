#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "../transport/transport.hpp"
#include "tcp_frame.hpp"
#include "tcp_request.hpp"
#include "tcp_response.hpp"

namespace kducer {

/**
 * @brief Modbus TCP client for the function codes the KDU implements
 *
 * Every call is exactly one synchronous request/response round trip over the
 * transport, so there is never more than one outstanding exchange. Nothing is
 * retried here: TransportError, ProtocolError, DeviceBusy and DeviceException all
 * propagate to the caller.
 */
class TcpMaster {
 public:
  /**
   * @brief Construct a Modbus TCP client
   * @param transport Connected transport; must outlive the client
   */
  explicit TcpMaster(Transport &transport)
      : transport_(transport) {}

  /**
   * @brief Read holding registers (FC 3)
   * @param unit_id Target unit ID
   * @param start_address Starting register address
   * @param count Number of registers to read (1..125)
   * @return Raw register bytes, two per register, high byte first
   */
  [[nodiscard]] std::vector<uint8_t> ReadHoldingRegisters(uint8_t unit_id, uint16_t start_address, uint16_t count);

  /**
   * @brief Read input registers (FC 4)
   * @param unit_id Target unit ID
   * @param start_address Starting register address
   * @param count Number of registers to read (1..125)
   * @return Raw register bytes, two per register, high byte first
   */
  [[nodiscard]] std::vector<uint8_t> ReadInputRegisters(uint8_t unit_id, uint16_t start_address, uint16_t count);

  /**
   * @brief Write a single coil (FC 5)
   */
  void WriteSingleCoil(uint8_t unit_id, uint16_t address, bool value);

  /**
   * @brief Write a single holding register (FC 6)
   */
  void WriteSingleRegister(uint8_t unit_id, uint16_t address, uint16_t value);

  /**
   * @brief Write multiple holding registers (FC 16)
   * @param unit_id Target unit ID
   * @param start_address Starting register address
   * @param values Raw register bytes; even count, at most 123 registers
   */
  void WriteMultipleRegisters(uint8_t unit_id, uint16_t start_address, std::span<const uint8_t> values);

  /**
   * @brief Send a request and receive its validated response
   *
   * On a header that fails validation the declared body is still drained when its
   * length is plausible, so the next exchange starts on a frame boundary.
   */
  [[nodiscard]] TcpResponse SendRequest(const TcpRequest &request);

  /**
   * @brief Get the next transaction ID (auto-increments)
   */
  [[nodiscard]] uint16_t GetNextTransactionId() noexcept { return next_transaction_id_++; }

 private:
  [[nodiscard]] std::vector<uint8_t> ReadRegisters(FunctionCode function_code, uint8_t unit_id,
                                                   uint16_t start_address, uint16_t count);

  Transport &transport_;
  uint16_t next_transaction_id_{1};
};

}  // namespace kducer
