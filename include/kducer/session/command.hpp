#pragma once

#include <atomic>
#include <cstdint>
#include <exception>
#include <map>
#include <stop_token>
#include <utility>
#include <variant>
#include <vector>
#include "tightening_event.hpp"

namespace kducer {

using Blob = std::vector<uint8_t>;
// Keyed by program or sequence number
using BlobMap = std::map<uint16_t, Blob>;

enum class CommandKind : uint8_t {
  kGetProgramNumber,
  kSelectProgram,
  kGetSequenceNumber,
  kSelectSequence,
  kStopMotorOn,
  kStopMotorOff,
  kRunTool,
  kSetHighResGraphMode,
  kSendBarcode,
  kSendProgramData,
  kSendMultipleProgramsData,
  kGetProgramData,
  kGetActiveProgramData,
  kGetAllProgramsData,
  kSendSequenceData,
  kSendMultipleSequencesData,
  kGetSequenceData,
  kGetActiveSequenceData,
  kGetAllSequencesData,
  kSendSettingsData,
  kGetSettingsData,
  kGetFirmwareVersion
};

[[nodiscard]] const char *ToString(CommandKind kind) noexcept;

struct CommandInput {
  uint16_t number{0};  // program or sequence number
  bool flag{false};    // permanent-memory write, graph mode on/off
  Blob data{};
  BlobMap batch{};
};

using CommandOutput = std::variant<std::monostate, uint16_t, Blob, BlobMap, TighteningEvent>;

/**
 * @brief One foreground request handed to the session loop
 *
 * The creating thread keeps a shared reference and polls IsCompleted(); the loop
 * sets the output or the error exactly once and then raises the completion flag.
 */
class Command {
 public:
  Command(CommandKind kind, CommandInput input, std::stop_token stop)
      : kind_(kind),
        input_(std::move(input)),
        stop_(std::move(stop)) {}

  Command(const Command &) = delete;
  Command &operator=(const Command &) = delete;

  [[nodiscard]] CommandKind GetKind() const noexcept { return kind_; }
  [[nodiscard]] const CommandInput &GetInput() const noexcept { return input_; }
  [[nodiscard]] const std::stop_token &GetStopToken() const noexcept { return stop_; }

  [[nodiscard]] bool IsCompleted() const noexcept { return completed_.load(std::memory_order_acquire); }

  /**
   * @brief Store the output and complete; later calls are ignored
   */
  void Complete(CommandOutput output);

  /**
   * @brief Store the error and complete; later calls are ignored
   */
  void Fail(std::exception_ptr error);

  /**
   * @brief Move the output out of a completed command, rethrowing its error if it failed
   */
  [[nodiscard]] CommandOutput TakeOutput();

 private:
  const CommandKind kind_;
  const CommandInput input_;
  const std::stop_token stop_;

  std::atomic<bool> finished_{false};  // claimed by the first Complete()/Fail()
  std::atomic<bool> completed_{false};
  CommandOutput output_{};
  std::exception_ptr error_{};
};

}  // namespace kducer
