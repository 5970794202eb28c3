#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include "common/errors.hpp"
#include "transport/transport.hpp"

namespace kducer {

void Transport::SendAll(std::span<const uint8_t> data) {
  size_t sent = 0;
  while (sent < data.size()) {
    int written = Write(data.subspan(sent));
    if (written <= 0) {
      throw TransportError("Send failed after " + std::to_string(sent) + " of " + std::to_string(data.size()) +
                           " bytes");
    }
    sent += static_cast<size_t>(written);
  }
}

std::vector<uint8_t> Transport::ReceiveAll(size_t count) {
  std::vector<uint8_t> buffer(count);
  size_t received = 0;
  while (received < count) {
    int bytes_read = Read(std::span<uint8_t>(buffer).subspan(received));
    if (bytes_read == 0) {
      throw TransportError("Connection closed by peer after " + std::to_string(received) + " of " +
                           std::to_string(count) + " bytes");
    }
    if (bytes_read < 0) {
      throw TransportError("Receive failed or timed out after " + std::to_string(received) + " of " +
                           std::to_string(count) + " bytes");
    }
    received += static_cast<size_t>(bytes_read);
  }
  return buffer;
}

}  // namespace kducer
