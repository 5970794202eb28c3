#include <exception>
#include <string>
#include <utility>
#include "common/errors.hpp"
#include "session/command.hpp"

namespace kducer {

const char *ToString(CommandKind kind) noexcept {
  switch (kind) {
    case CommandKind::kGetProgramNumber:
      return "get program number";
    case CommandKind::kSelectProgram:
      return "select program";
    case CommandKind::kGetSequenceNumber:
      return "get sequence number";
    case CommandKind::kSelectSequence:
      return "select sequence";
    case CommandKind::kStopMotorOn:
      return "stop motor on";
    case CommandKind::kStopMotorOff:
      return "stop motor off";
    case CommandKind::kRunTool:
      return "run tool";
    case CommandKind::kSetHighResGraphMode:
      return "set high-res graph mode";
    case CommandKind::kSendBarcode:
      return "send barcode";
    case CommandKind::kSendProgramData:
      return "send program data";
    case CommandKind::kSendMultipleProgramsData:
      return "send multiple programs data";
    case CommandKind::kGetProgramData:
      return "get program data";
    case CommandKind::kGetActiveProgramData:
      return "get active program data";
    case CommandKind::kGetAllProgramsData:
      return "get all programs data";
    case CommandKind::kSendSequenceData:
      return "send sequence data";
    case CommandKind::kSendMultipleSequencesData:
      return "send multiple sequences data";
    case CommandKind::kGetSequenceData:
      return "get sequence data";
    case CommandKind::kGetActiveSequenceData:
      return "get active sequence data";
    case CommandKind::kGetAllSequencesData:
      return "get all sequences data";
    case CommandKind::kSendSettingsData:
      return "send settings data";
    case CommandKind::kGetSettingsData:
      return "get settings data";
    case CommandKind::kGetFirmwareVersion:
      return "get firmware version";
  }
  return "unknown command";
}

void Command::Complete(CommandOutput output) {
  if (finished_.exchange(true)) {
    return;
  }
  output_ = std::move(output);
  completed_.store(true, std::memory_order_release);
}

void Command::Fail(std::exception_ptr error) {
  if (finished_.exchange(true)) {
    return;
  }
  error_ = std::move(error);
  completed_.store(true, std::memory_order_release);
}

CommandOutput Command::TakeOutput() {
  if (!IsCompleted()) {
    throw InvalidArgument(std::string("Command '") + ToString(kind_) + "' has not completed");
  }
  if (error_) {
    std::rethrow_exception(error_);
  }
  return std::move(output_);
}

}  // namespace kducer
