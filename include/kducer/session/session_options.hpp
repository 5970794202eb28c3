#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace kducer {

/**
 * @brief Configuration of one device session
 *
 * Defaults match a KDU controller on its standard Modbus TCP port. Timing fields
 * are exposed so tests and slow networks can shorten or stretch them.
 */
struct SessionOptions {
  std::string host{};
  uint16_t port{502};
  uint8_t unit_id{0};

  std::chrono::milliseconds connect_timeout{5000};
  std::chrono::milliseconds exchange_timeout{250};  // per send/receive call
  std::chrono::milliseconds poll_interval{100};     // loop tick and caller polling cadence

  std::chrono::milliseconds short_wait{50};               // after coil writes
  std::chrono::milliseconds program_change_settle{300};   // device loads the new program
  std::chrono::milliseconds permanent_memory_settle{2000};  // device commits to flash

  // Delay between reconnect attempts. Doubles after each failure up to
  // max_reconnect_backoff; equal values keep a fixed interval and never give up.
  std::chrono::milliseconds reconnect_interval{100};
  std::chrono::milliseconds max_reconnect_backoff{100};

  // Raise stop-motor after a result until the result queue has been drained
  bool lock_until_result_fetched{false};
  // Raise stop-motor after a result and leave it raised until EnableTool()
  bool lock_indefinitely{false};
  // Overwrite the device timestamp of each result with the local wall clock
  bool replace_result_timestamp{true};
  bool log_failed_connections_as_warning{true};
};

}  // namespace kducer
