#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stop_token>
#include <vector>

namespace kducer {

/**
 * @brief Abstract byte stream to one device
 *
 * Implementations provide the connection handling and the partial Read()/Write()
 * primitives; SendAll()/ReceiveAll() loop over them and turn zero progress into
 * TransportError. The Modbus layer only talks to this interface, so tests can swap
 * the socket for an in-memory device.
 */
class Transport {
 public:
  virtual ~Transport() = default;

  /**
   * @brief Establish the connection; no-op if already connected
   * @param timeout Give up with ConnectTimeout after this long
   * @param stop Abandons the attempt with Cancelled when requested
   * @throws TransportError if the connection is refused or reset
   */
  virtual void Connect(std::chrono::milliseconds timeout, std::stop_token stop) = 0;

  /**
   * @brief Non-blocking query of the link state
   */
  [[nodiscard]] virtual bool IsConnected() const = 0;

  /**
   * @brief Release the underlying handle; aborts any exchange in progress
   */
  virtual void Close() = 0;

  /**
   * @brief Read up to buffer.size() bytes
   * @return Number of bytes read, 0 if the peer closed the stream, -1 on error or timeout
   */
  [[nodiscard]] virtual int Read(std::span<uint8_t> buffer) = 0;

  /**
   * @brief Write up to data.size() bytes
   * @return Number of bytes written, 0 or -1 on error or timeout
   */
  [[nodiscard]] virtual int Write(std::span<const uint8_t> data) = 0;

  /**
   * @brief Write every byte of @p data
   * @throws TransportError on error, timeout or zero progress
   */
  void SendAll(std::span<const uint8_t> data);

  /**
   * @brief Read exactly @p count bytes
   * @throws TransportError on error, timeout or peer close
   */
  [[nodiscard]] std::vector<uint8_t> ReceiveAll(size_t count);
};

}  // namespace kducer
