#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stop_token>
#include <vector>
#include "../common/errors.hpp"
#include "transport.hpp"

namespace kducer {

/**
 * @brief Scripted in-memory transport
 *
 * Read() serves the bytes given to SetReadData()/AppendReadData() and reports a peer
 * close once they are exhausted. Everything written is captured for inspection.
 */
class MemoryTransport : public Transport {
 public:
  MemoryTransport() = default;

  void Connect(std::chrono::milliseconds /*timeout*/, std::stop_token stop) override {
    if (stop.stop_requested()) {
      throw Cancelled("Connect cancelled");
    }
    if (refuse_connect_) {
      throw TransportError("Connection refused");
    }
    connected_ = true;
  }

  [[nodiscard]] bool IsConnected() const override { return connected_; }

  void Close() override { connected_ = false; }

  [[nodiscard]] int Read(std::span<uint8_t> buffer) override {
    if (!connected_) {
      return -1;
    }
    if (read_pos_ >= read_buffer_.size()) {
      return 0;
    }

    size_t bytes_to_read = std::min(buffer.size(), read_buffer_.size() - read_pos_);
    std::copy_n(read_buffer_.begin() + static_cast<std::ptrdiff_t>(read_pos_), bytes_to_read, buffer.begin());
    read_pos_ += bytes_to_read;
    return static_cast<int>(bytes_to_read);
  }

  [[nodiscard]] int Write(std::span<const uint8_t> data) override {
    if (!connected_) {
      return -1;
    }
    write_buffer_.insert(write_buffer_.end(), data.begin(), data.end());
    return static_cast<int>(data.size());
  }

  /**
   * @brief Replace the data that will be served by Read()
   */
  void SetReadData(std::span<const uint8_t> data) {
    read_buffer_.assign(data.begin(), data.end());
    read_pos_ = 0;
  }

  /**
   * @brief Queue more data behind whatever has not been read yet
   */
  void AppendReadData(std::span<const uint8_t> data) { read_buffer_.insert(read_buffer_.end(), data.begin(), data.end()); }

  [[nodiscard]] size_t AvailableBytes() const noexcept { return read_buffer_.size() - read_pos_; }

  [[nodiscard]] std::span<const uint8_t> GetWrittenData() const { return {write_buffer_.data(), write_buffer_.size()}; }

  void ClearWriteBuffer() { write_buffer_.clear(); }

  void ResetReadPosition() { read_pos_ = 0; }

  /**
   * @brief Make subsequent Connect() calls fail with TransportError
   */
  void SetRefuseConnect(bool refuse) noexcept { refuse_connect_ = refuse; }

 private:
  bool connected_{false};
  bool refuse_connect_{false};
  std::vector<uint8_t> read_buffer_;
  size_t read_pos_{0};
  std::vector<uint8_t> write_buffer_;
};

}  // namespace kducer
