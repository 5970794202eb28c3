#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string_view>
#include <thread>
#include <utility>
#include <variant>

#include "../common/errors.hpp"
#include "../common/sync_queue.hpp"
#include "../tcp/tcp_master.hpp"
#include "../transport/transport.hpp"
#include "command.hpp"
#include "command_runner.hpp"
#include "session_options.hpp"
#include "tightening_event.hpp"

namespace kducer {

enum class SessionPhase : uint8_t { kDisconnected, kConnecting, kActive, kStopped };

[[nodiscard]] const char *ToString(SessionPhase phase) noexcept;

/**
 * @brief Creates a fresh, unconnected transport for each connection attempt
 */
using TransportFactory = std::function<std::unique_ptr<Transport>()>;

/**
 * @brief Long-lived connection to one KDU tightening controller
 *
 * A background thread owns the socket. Each tick it either runs one queued command
 * or polls the device for a new tightening result, then sleeps out the rest of the
 * poll interval. Link failures are answered by reconnecting forever; the command
 * that was in flight is retried first and queued commands keep their order.
 *
 * Foreground calls may come from any number of threads. Each one queues a Command
 * and polls its completion flag at the poll interval, so no call returns sooner than
 * one interval after it was made. Device exceptions (DeviceBusy, DeviceException) and
 * ProtocolError are delivered to the caller whose command hit them; validation errors
 * are InvalidArgument; a call interrupted by its own token or by shutdown throws
 * Cancelled.
 */
class DeviceSession {
 public:
  /**
   * @brief Start the session thread; the first connection attempt follows one poll interval later
   * @param options Connection parameters, timings and lock policies
   * @param transport_factory Optional factory; defaults to a TCP socket to options.host:options.port
   */
  explicit DeviceSession(SessionOptions options, TransportFactory transport_factory = {});

  /**
   * @brief Stop the session thread; pending calls observe Cancelled
   */
  ~DeviceSession();

  DeviceSession(const DeviceSession &) = delete;
  DeviceSession &operator=(const DeviceSession &) = delete;

  /**
   * @brief Request shutdown and wait for the session thread to finish
   */
  void Stop();

  [[nodiscard]] SessionPhase GetPhase() const noexcept { return phase_.load(); }
  [[nodiscard]] bool IsConnected() const noexcept { return GetPhase() == SessionPhase::kActive; }

  /**
   * @brief Block until the session is active
   * @throws Cancelled if @p stop fires or the session stops first
   */
  void WaitUntilConnected(std::stop_token stop = {});

  // Program and sequence selection
  void SelectProgram(uint16_t program_number);
  [[nodiscard]] uint16_t GetProgramNumber();
  void SelectSequence(uint16_t sequence_number);
  [[nodiscard]] uint16_t GetSequenceNumber();

  /**
   * @brief Raise the stop-motor coil so the lever has no effect
   */
  void DisableTool();

  /**
   * @brief Lower the stop-motor coil; needed after DisableTool() or a lock-indefinitely result
   */
  void EnableTool();

  /**
   * @brief Hold the remote lever until the device reports a tightening result
   *
   * The result is returned directly and is not added to the result queue. When
   * @p stop fires the lever is released before Cancelled is thrown.
   */
  [[nodiscard]] TighteningEvent RunToolUntilResult(std::stop_token stop = {});

  /**
   * @brief Read torque and angle graphs along with every result (firmware 41+)
   */
  void SetHighResGraphMode(bool enabled);

  /**
   * @brief Take the oldest result, waiting for one if the queue is empty
   * @param stop Cancels the wait
   * @param fail_fast_on_disconnect Throw TransportError instead of waiting while the link is down
   */
  [[nodiscard]] TighteningEvent GetResult(std::stop_token stop = {}, bool fail_fast_on_disconnect = false);

  [[nodiscard]] std::optional<TighteningEvent> TryGetResult() { return results_.TryPop(); }
  [[nodiscard]] bool HasNewResult() const { return !results_.Empty(); }
  [[nodiscard]] size_t ResultQueueSize() const { return results_.Size(); }
  void ClearResultQueue() { results_.Clear(); }

  /**
   * @brief Number of commands waiting for the session thread (excluding one in flight)
   */
  [[nodiscard]] size_t QueuedCommandCount() const { return commands_.Size(); }

  // Program data blobs, sized by the connected firmware
  void SendProgramData(uint16_t program_number, std::span<const uint8_t> data, bool permanent = false);
  void SendMultipleProgramsData(const BlobMap &programs, bool permanent = false);
  [[nodiscard]] Blob GetProgramData(uint16_t program_number);
  [[nodiscard]] Blob GetActiveProgramData();
  [[nodiscard]] BlobMap GetAllProgramsData();

  // Sequence data blobs, sized by the connected firmware
  void SendSequenceData(uint16_t sequence_number, std::span<const uint8_t> data, bool permanent = false);
  void SendMultipleSequencesData(const BlobMap &sequences, bool permanent = false);
  [[nodiscard]] Blob GetSequenceData(uint16_t sequence_number);
  [[nodiscard]] Blob GetActiveSequenceData();
  [[nodiscard]] BlobMap GetAllSequencesData();

  void SendSettingsData(std::span<const uint8_t> data, bool permanent = false);
  [[nodiscard]] Blob GetSettingsData();

  /**
   * @brief Send a barcode of at most 16 ASCII characters; commas are sent as dots
   */
  void SendBarcode(std::string_view barcode);

  /**
   * @brief Firmware version cached at connection time (waits for the first connection)
   */
  [[nodiscard]] uint16_t GetFirmwareVersion();

  void SetLockUntilResultFetched(bool enabled) noexcept { lock_until_result_fetched_.store(enabled); }
  void SetLockIndefinitely(bool enabled) noexcept { lock_indefinitely_.store(enabled); }
  void SetReplaceResultTimestamp(bool enabled) noexcept { replace_result_timestamp_.store(enabled); }
  void SetPollInterval(std::chrono::milliseconds interval) noexcept { poll_interval_.store(interval); }
  [[nodiscard]] std::chrono::milliseconds GetPollInterval() const noexcept { return poll_interval_.load(); }

 private:
  static constexpr size_t kResultQueueWarningThreshold = 10;

  // Foreground side
  [[nodiscard]] CommandOutput Submit(CommandKind kind, CommandInput input = {}, std::stop_token caller = {});
  template <typename T>
  [[nodiscard]] T SubmitFor(CommandKind kind, CommandInput input = {}, std::stop_token caller = {}) {
    return std::get<T>(Submit(kind, std::move(input), std::move(caller)));
  }

  // Session thread side
  void Run();
  void Connect();
  void ServeConnection();
  [[nodiscard]] bool RunNextCommand();
  void PollStep();
  void DropConnection() noexcept;
  void LogConnectionFailure(const Error &error, bool while_connecting) const;

  SessionOptions options_;
  TransportFactory transport_factory_;

  std::atomic<SessionPhase> phase_{SessionPhase::kDisconnected};
  std::atomic<std::chrono::milliseconds> poll_interval_;
  std::atomic<bool> lock_until_result_fetched_;
  std::atomic<bool> lock_indefinitely_;
  std::atomic<bool> replace_result_timestamp_;

  SyncQueue<std::shared_ptr<Command>> commands_;
  SyncQueue<TighteningEvent> results_;

  // Owned by the session thread
  std::unique_ptr<Transport> transport_;
  std::unique_ptr<TcpMaster> master_;
  std::unique_ptr<CommandRunner> runner_;
  DeviceState device_state_;
  std::shared_ptr<Command> in_flight_;
  size_t result_warning_threshold_{kResultQueueWarningThreshold};

  std::stop_source stop_source_;
  std::jthread loop_thread_;  // last member: started after everything above exists
};

}  // namespace kducer
