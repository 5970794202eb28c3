#pragma once

#include <cstdint>
#include <span>
#include <stop_token>
#include <string>
#include "../common/address_span.hpp"
#include "../tcp/tcp_master.hpp"
#include "command.hpp"
#include "register_map.hpp"
#include "session_options.hpp"
#include "tightening_event.hpp"

namespace kducer {

/**
 * @brief State the session loop keeps about the connected device
 *
 * Owned by the loop thread only; survives reconnects.
 */
struct DeviceState {
  std::string firmware_string{};
  uint16_t firmware_version{0};  // 0 until the first successful connection
  bool high_res_graph{false};
  bool replace_result_timestamp{true};
  bool result_pending{false};  // flag was read (and so cleared) but the result block is not queued yet
};

/**
 * @brief Translates commands into register exchanges with one KDU
 *
 * Runs on the session loop thread with exclusive use of the client. Every delay
 * honours the command's stop token, and tier-dependent limits are checked against
 * the register map before anything is sent.
 */
class CommandRunner {
 public:
  CommandRunner(TcpMaster &master, const SessionOptions &options, DeviceState &state)
      : master_(master),
        options_(options),
        state_(state) {}

  /**
   * @brief Exchanges performed once per connection before the session goes active
   *
   * Reads and caches the firmware version, restores high-resolution graph mode and
   * discards a stale new-result flag.
   */
  void Handshake();

  /**
   * @brief Execute one command
   * @return Output matching the command kind
   * @throws InvalidArgument if the command does not fit the connected firmware
   * @throws Cancelled if the command's token fired during a delay
   */
  [[nodiscard]] CommandOutput Execute(const Command &command);

  /**
   * @brief Low byte of the new-result register; reading it clears the device flag
   */
  [[nodiscard]] uint8_t ReadNewResultFlag();

  /**
   * @brief Read the result block, plus the graph blocks in high-resolution mode
   */
  [[nodiscard]] TighteningEvent ReadTighteningEvent();

  /**
   * @brief Write the stop-motor coil and wait the short delay
   */
  void SetStopMotor(bool on, const std::stop_token &stop);

 private:
  [[nodiscard]] const RegisterMap &Map() const noexcept { return GetRegisterMap(state_.firmware_version); }

  [[nodiscard]] uint16_t ReadActiveNumber(uint16_t address);
  void SelectActiveNumber(uint16_t address, uint16_t number, const std::stop_token &stop);
  [[nodiscard]] TighteningEvent RunTool(const std::stop_token &stop);

  [[nodiscard]] Blob ReadBlock(AddressSpan span);
  void WriteBlock(AddressSpan span, std::span<const uint8_t> data);
  void CommitToPermanentMemory(const std::stop_token &stop);

  void CheckProgramNumber(uint16_t program_number) const;
  void CheckSequenceNumber(uint16_t sequence_number) const;
  void CheckBlobSize(std::span<const uint8_t> data, size_t expected, const char *what) const;

  [[nodiscard]] CommandOutput SendPrograms(const BlobMap &programs, bool permanent, const std::stop_token &stop);
  [[nodiscard]] CommandOutput SendSequences(const BlobMap &sequences, bool permanent, const std::stop_token &stop);

  TcpMaster &master_;
  const SessionOptions &options_;
  DeviceState &state_;
};

}  // namespace kducer
