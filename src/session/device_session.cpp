#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include "common/errors.hpp"
#include "common/log.hpp"
#include "session/cancellation.hpp"
#include "session/command.hpp"
#include "session/device_session.hpp"
#include "session/register_map.hpp"
#include "transport/tcp_socket_transport.hpp"

namespace kducer {

namespace {

void CheckNumber(uint16_t number, uint16_t max_number, const char *what) {
  if (number == 0 || number > max_number) {
    throw InvalidArgument(std::string(what) + " number " + std::to_string(number) + " is outside 1.." +
                          std::to_string(max_number));
  }
}

void CheckBlob(std::span<const uint8_t> data, const char *what) {
  if (data.empty() || data.size() % 2 != 0) {
    throw InvalidArgument(std::string(what) + " data must be a non-empty even number of bytes, got " +
                          std::to_string(data.size()));
  }
}

CommandInput NumberInput(uint16_t number) {
  CommandInput input;
  input.number = number;
  return input;
}

CommandInput BlobInput(uint16_t number, std::span<const uint8_t> data, bool permanent) {
  CommandInput input;
  input.number = number;
  input.flag = permanent;
  input.data.assign(data.begin(), data.end());
  return input;
}

CommandInput BatchInput(const BlobMap &batch, bool permanent) {
  CommandInput input;
  input.flag = permanent;
  input.batch = batch;
  return input;
}

}  // namespace

const char *ToString(SessionPhase phase) noexcept {
  switch (phase) {
    case SessionPhase::kDisconnected:
      return "disconnected";
    case SessionPhase::kConnecting:
      return "connecting";
    case SessionPhase::kActive:
      return "active";
    case SessionPhase::kStopped:
      return "stopped";
  }
  return "unknown";
}

DeviceSession::DeviceSession(SessionOptions options, TransportFactory transport_factory)
    : options_(std::move(options)),
      transport_factory_(std::move(transport_factory)),
      poll_interval_(options_.poll_interval),
      lock_until_result_fetched_(options_.lock_until_result_fetched),
      lock_indefinitely_(options_.lock_indefinitely),
      replace_result_timestamp_(options_.replace_result_timestamp) {
  if (!transport_factory_) {
    transport_factory_ = [host = options_.host, port = options_.port, timeout = options_.exchange_timeout]() {
      return std::make_unique<TcpSocketTransport>(host, port, timeout);
    };
  }
  loop_thread_ = std::jthread([this] { Run(); });
}

DeviceSession::~DeviceSession() {
  Stop();
}

void DeviceSession::Stop() {
  stop_source_.request_stop();
  if (loop_thread_.joinable() && loop_thread_.get_id() != std::this_thread::get_id()) {
    loop_thread_.join();
  }
}

void DeviceSession::WaitUntilConnected(std::stop_token stop) {
  CancellationScope scope(stop_source_.get_token(), stop);
  while (!IsConnected()) {
    SleepFor(GetPollInterval(), scope.GetToken());
  }
}

// ---------------------------------------------------------------------------
// Foreground operations

CommandOutput DeviceSession::Submit(CommandKind kind, CommandInput input, std::stop_token caller) {
  CancellationScope scope(stop_source_.get_token(), caller);
  ThrowIfCancelled(scope.GetToken());

  auto command = std::make_shared<Command>(kind, std::move(input), scope.GetToken());
  commands_.Push(command);
  do {
    SleepFor(GetPollInterval(), scope.GetToken());
  } while (!command->IsCompleted());
  return command->TakeOutput();
}

void DeviceSession::SelectProgram(uint16_t program_number) {
  CheckNumber(program_number, kMaxProgramNumber, "Program");
  static_cast<void>(Submit(CommandKind::kSelectProgram, NumberInput(program_number)));
}

uint16_t DeviceSession::GetProgramNumber() {
  return SubmitFor<uint16_t>(CommandKind::kGetProgramNumber);
}

void DeviceSession::SelectSequence(uint16_t sequence_number) {
  CheckNumber(sequence_number, kMaxSequenceNumber, "Sequence");
  static_cast<void>(Submit(CommandKind::kSelectSequence, NumberInput(sequence_number)));
}

uint16_t DeviceSession::GetSequenceNumber() {
  return SubmitFor<uint16_t>(CommandKind::kGetSequenceNumber);
}

void DeviceSession::DisableTool() {
  static_cast<void>(Submit(CommandKind::kStopMotorOn));
}

void DeviceSession::EnableTool() {
  static_cast<void>(Submit(CommandKind::kStopMotorOff));
}

TighteningEvent DeviceSession::RunToolUntilResult(std::stop_token stop) {
  return SubmitFor<TighteningEvent>(CommandKind::kRunTool, {}, std::move(stop));
}

void DeviceSession::SetHighResGraphMode(bool enabled) {
  CommandInput input;
  input.flag = enabled;
  static_cast<void>(Submit(CommandKind::kSetHighResGraphMode, std::move(input)));
}

TighteningEvent DeviceSession::GetResult(std::stop_token stop, bool fail_fast_on_disconnect) {
  CancellationScope scope(stop_source_.get_token(), stop);
  while (true) {
    if (auto event = results_.TryPop()) {
      return std::move(*event);
    }
    if (fail_fast_on_disconnect && !IsConnected()) {
      throw TransportError(std::string("Device is not connected (session ") + ToString(GetPhase()) + ")");
    }
    SleepFor(GetPollInterval(), scope.GetToken());
  }
}

void DeviceSession::SendProgramData(uint16_t program_number, std::span<const uint8_t> data, bool permanent) {
  CheckNumber(program_number, kMaxProgramNumber, "Program");
  CheckBlob(data, "Program");
  static_cast<void>(Submit(CommandKind::kSendProgramData, BlobInput(program_number, data, permanent)));
}

void DeviceSession::SendMultipleProgramsData(const BlobMap &programs, bool permanent) {
  if (programs.empty()) {
    throw InvalidArgument("No programs to send");
  }
  for (const auto &[number, data] : programs) {
    CheckNumber(number, kMaxProgramNumber, "Program");
    CheckBlob(data, "Program");
  }
  static_cast<void>(Submit(CommandKind::kSendMultipleProgramsData, BatchInput(programs, permanent)));
}

Blob DeviceSession::GetProgramData(uint16_t program_number) {
  CheckNumber(program_number, kMaxProgramNumber, "Program");
  return SubmitFor<Blob>(CommandKind::kGetProgramData, NumberInput(program_number));
}

Blob DeviceSession::GetActiveProgramData() {
  return SubmitFor<Blob>(CommandKind::kGetActiveProgramData);
}

BlobMap DeviceSession::GetAllProgramsData() {
  return SubmitFor<BlobMap>(CommandKind::kGetAllProgramsData);
}

void DeviceSession::SendSequenceData(uint16_t sequence_number, std::span<const uint8_t> data, bool permanent) {
  CheckNumber(sequence_number, kMaxSequenceNumber, "Sequence");
  CheckBlob(data, "Sequence");
  static_cast<void>(Submit(CommandKind::kSendSequenceData, BlobInput(sequence_number, data, permanent)));
}

void DeviceSession::SendMultipleSequencesData(const BlobMap &sequences, bool permanent) {
  if (sequences.empty()) {
    throw InvalidArgument("No sequences to send");
  }
  for (const auto &[number, data] : sequences) {
    CheckNumber(number, kMaxSequenceNumber, "Sequence");
    CheckBlob(data, "Sequence");
  }
  static_cast<void>(Submit(CommandKind::kSendMultipleSequencesData, BatchInput(sequences, permanent)));
}

Blob DeviceSession::GetSequenceData(uint16_t sequence_number) {
  CheckNumber(sequence_number, kMaxSequenceNumber, "Sequence");
  return SubmitFor<Blob>(CommandKind::kGetSequenceData, NumberInput(sequence_number));
}

Blob DeviceSession::GetActiveSequenceData() {
  return SubmitFor<Blob>(CommandKind::kGetActiveSequenceData);
}

BlobMap DeviceSession::GetAllSequencesData() {
  return SubmitFor<BlobMap>(CommandKind::kGetAllSequencesData);
}

void DeviceSession::SendSettingsData(std::span<const uint8_t> data, bool permanent) {
  CheckBlob(data, "Settings");
  static_cast<void>(Submit(CommandKind::kSendSettingsData, BlobInput(0, data, permanent)));
}

Blob DeviceSession::GetSettingsData() {
  return SubmitFor<Blob>(CommandKind::kGetSettingsData);
}

void DeviceSession::SendBarcode(std::string_view barcode) {
  if (barcode.size() > kdu::kBarcodeMaxLength) {
    throw InvalidArgument("Barcode is " + std::to_string(barcode.size()) + " characters, at most " +
                          std::to_string(kdu::kBarcodeMaxLength) + " are allowed");
  }

  // Zero padded to the full register block
  Blob data(kdu::kBarcodeBlock.ByteCount(), 0);
  for (size_t i = 0; i < barcode.size(); ++i) {
    const auto c = static_cast<unsigned char>(barcode[i]);
    if (c > 0x7F) {
      throw InvalidArgument("Barcode must be ASCII, found byte " + std::to_string(c) + " at position " +
                            std::to_string(i));
    }
    data[i] = c == ',' ? static_cast<uint8_t>('.') : c;
  }
  static_cast<void>(Submit(CommandKind::kSendBarcode, BlobInput(0, data, false)));
}

uint16_t DeviceSession::GetFirmwareVersion() {
  return SubmitFor<uint16_t>(CommandKind::kGetFirmwareVersion);
}

// ---------------------------------------------------------------------------
// Session thread

void DeviceSession::Run() {
  const auto stop = stop_source_.get_token();
  auto backoff = options_.reconnect_interval;
  const auto backoff_cap = std::max(options_.max_reconnect_backoff, options_.reconnect_interval);

  try {
    SleepFor(GetPollInterval(), stop);
    while (true) {
      bool connecting = true;
      try {
        phase_.store(SessionPhase::kConnecting);
        Connect();
        connecting = false;
        phase_.store(SessionPhase::kActive);
        backoff = options_.reconnect_interval;
        ServeConnection();
      } catch (const TransportError &e) {
        LogConnectionFailure(e, connecting);
      } catch (const ProtocolError &e) {
        LogConnectionFailure(e, connecting);
      } catch (const DeviceException &e) {
        LogConnectionFailure(e, connecting);
      }

      DropConnection();
      phase_.store(SessionPhase::kDisconnected);
      SleepFor(backoff, stop);
      backoff = std::min(backoff * 2, backoff_cap);
    }
  } catch (const Cancelled &) {
    Log(LogLevel::kDebug, "Session shutting down");
  } catch (const std::exception &e) {
    Log(LogLevel::kError, std::string("Unexpected exception, session stops: ") + e.what());
    stop_source_.request_stop();
  }

  DropConnection();
  in_flight_.reset();
  commands_.Clear();
  phase_.store(SessionPhase::kStopped);
}

void DeviceSession::Connect() {
  DropConnection();
  transport_ = transport_factory_();
  if (!transport_) {
    throw TransportError("Transport factory returned no transport");
  }
  transport_->Connect(options_.connect_timeout, stop_source_.get_token());
  master_ = std::make_unique<TcpMaster>(*transport_);
  runner_ = std::make_unique<CommandRunner>(*master_, options_, device_state_);
  runner_->Handshake();
  result_warning_threshold_ = kResultQueueWarningThreshold;

  Log(LogLevel::kInfo, "Connected to " + options_.host + ":" + std::to_string(options_.port) + ", firmware '" +
                           device_state_.firmware_string + "' (version " +
                           std::to_string(device_state_.firmware_version) + ")");
}

void DeviceSession::ServeConnection() {
  const auto stop = stop_source_.get_token();
  while (true) {
    const auto deadline = std::chrono::steady_clock::now() + GetPollInterval();
    device_state_.replace_result_timestamp = replace_result_timestamp_.load();

    if (!RunNextCommand()) {
      PollStep();
    }

    const size_t queued_results = results_.Size();
    if (queued_results >= result_warning_threshold_) {
      Log(LogLevel::kWarning, std::to_string(queued_results) +
                                  " tightening results are waiting in the result queue. Did you forget to consume "
                                  "them?");
      result_warning_threshold_ *= 10;
    }

    SleepUntil(deadline, stop);
  }
}

bool DeviceSession::RunNextCommand() {
  const auto session_stop = stop_source_.get_token();

  // Commands whose caller gave up are completed without touching the link
  while (true) {
    if (!in_flight_) {
      auto next = commands_.TryPop();
      if (!next) {
        return false;
      }
      in_flight_ = std::move(*next);
    }
    if (!in_flight_->GetStopToken().stop_requested()) {
      break;
    }
    ThrowIfCancelled(session_stop);
    in_flight_->Fail(std::make_exception_ptr(Cancelled("Command cancelled before execution")));
    in_flight_.reset();
  }

  try {
    in_flight_->Complete(runner_->Execute(*in_flight_));
  } catch (const TransportError &) {
    // Stays in flight and runs first after reconnecting
    throw;
  } catch (const Cancelled &) {
    ThrowIfCancelled(session_stop);
    in_flight_->Fail(std::current_exception());
  } catch (const InvalidArgument &) {
    in_flight_->Fail(std::current_exception());
  } catch (const Error &e) {
    Log(LogLevel::kWarning, std::string("Command '") + ToString(in_flight_->GetKind()) +
                                "' failed and will not be retried: " + e.what());
    in_flight_->Fail(std::current_exception());
  }
  in_flight_.reset();
  return true;
}

void DeviceSession::PollStep() {
  const auto stop = stop_source_.get_token();
  const bool lock_until_fetched = lock_until_result_fetched_.load();
  const bool lock_indefinitely = lock_indefinitely_.load();

  try {
    // A flagged result whose block read failed is read again before the flag
    if (device_state_.result_pending || runner_->ReadNewResultFlag() == 1) {
      device_state_.result_pending = true;
      results_.Push(runner_->ReadTighteningEvent());
      device_state_.result_pending = false;
      if (lock_until_fetched || lock_indefinitely) {
        runner_->SetStopMotor(true, stop);
      }
    } else if (!lock_indefinitely && lock_until_fetched && results_.Empty()) {
      runner_->SetStopMotor(false, stop);
    }
  } catch (const DeviceException &e) {
    Log(LogLevel::kWarning, std::string("Device replied with an exception while polling for results: ") + e.what());
  } catch (const ProtocolError &e) {
    Log(LogLevel::kWarning, std::string("Malformed reply while polling for results: ") + e.what());
  }
}

void DeviceSession::DropConnection() noexcept {
  runner_.reset();
  master_.reset();
  if (transport_) {
    transport_->Close();
    transport_.reset();
  }
}

void DeviceSession::LogConnectionFailure(const Error &error, bool while_connecting) const {
  if (while_connecting) {
    const LogLevel level = options_.log_failed_connections_as_warning ? LogLevel::kWarning : LogLevel::kInfo;
    Log(level, "Connection to " + options_.host + ":" + std::to_string(options_.port) +
                   " failed: " + error.what() + ". Will keep retrying.");
  } else {
    Log(LogLevel::kWarning, std::string("Transmission error: ") + error.what() +
                                ". Reconnecting; queued commands are kept.");
  }
}

}  // namespace kducer
