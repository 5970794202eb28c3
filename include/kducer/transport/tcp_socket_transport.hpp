#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stop_token>
#include <string>
#include "transport.hpp"

namespace kducer {

/**
 * @brief Transport over a client TCP socket (POSIX)
 *
 * Owns the socket descriptor and closes it in the destructor. Connect() runs a
 * non-blocking connect polled in short slices so a stop request is observed quickly;
 * once connected, every send and receive is bounded by the exchange timeout.
 */
class TcpSocketTransport : public Transport {
 public:
  /**
   * @param host IPv4 address or host name of the controller
   * @param port TCP port (the KDU listens on 502)
   * @param exchange_timeout Per-call send/receive timeout, distinct from the connect timeout
   */
  TcpSocketTransport(std::string host, uint16_t port, std::chrono::milliseconds exchange_timeout);

  ~TcpSocketTransport() override;

  TcpSocketTransport(const TcpSocketTransport &) = delete;
  TcpSocketTransport &operator=(const TcpSocketTransport &) = delete;

  void Connect(std::chrono::milliseconds timeout, std::stop_token stop) override;
  [[nodiscard]] bool IsConnected() const override;
  void Close() override;

  [[nodiscard]] int Read(std::span<uint8_t> buffer) override;
  [[nodiscard]] int Write(std::span<const uint8_t> data) override;

  [[nodiscard]] const std::string &GetHost() const noexcept { return host_; }
  [[nodiscard]] uint16_t GetPort() const noexcept { return port_; }

 private:
  static constexpr std::chrono::milliseconds kConnectPollSlice{5};

  void ConfigureConnectedSocket();

  std::string host_;
  uint16_t port_;
  std::chrono::milliseconds exchange_timeout_;
  int fd_{-1};
};

}  // namespace kducer
