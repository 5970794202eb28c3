#include <chrono>
#include <cstdint>
#include <span>
#include <stop_token>
#include <string>
#include <vector>
#include "common/address_span.hpp"
#include "common/errors.hpp"
#include "common/log.hpp"
#include "session/cancellation.hpp"
#include "session/command.hpp"
#include "session/command_runner.hpp"
#include "session/register_map.hpp"
#include "session/tightening_event.hpp"

namespace kducer {

void CommandRunner::Handshake() {
  const auto raw = master_.ReadInputRegisters(options_.unit_id, kdu::kFirmwareVersionBlock.start_address,
                                              kdu::kFirmwareVersionBlock.reg_count);
  std::string firmware(raw.begin(), raw.end());
  while (!firmware.empty() && (firmware.back() == '\0' || firmware.back() == ' ')) {
    firmware.pop_back();
  }
  state_.firmware_string = firmware;
  state_.firmware_version = ParseFirmwareVersion(firmware);
  if (state_.firmware_version == 0) {
    Log(LogLevel::kWarning, "Cannot parse firmware version '" + firmware + "', assuming the legacy register layout");
  }

  if (state_.high_res_graph) {
    master_.WriteSingleCoil(options_.unit_id, kdu::kHighResGraphCoil, true);
  }
  static_cast<void>(ReadNewResultFlag());
}

CommandOutput CommandRunner::Execute(const Command &command) {
  const auto &input = command.GetInput();
  const auto &stop = command.GetStopToken();

  switch (command.GetKind()) {
    case CommandKind::kGetProgramNumber:
      return ReadActiveNumber(kdu::kActiveProgramRegister);

    case CommandKind::kSelectProgram:
      CheckProgramNumber(input.number);
      SelectActiveNumber(kdu::kActiveProgramRegister, input.number, stop);
      return {};

    case CommandKind::kGetSequenceNumber:
      return ReadActiveNumber(kdu::kActiveSequenceRegister);

    case CommandKind::kSelectSequence:
      CheckSequenceNumber(input.number);
      SelectActiveNumber(kdu::kActiveSequenceRegister, input.number, stop);
      return {};

    case CommandKind::kStopMotorOn:
      SetStopMotor(true, stop);
      return {};

    case CommandKind::kStopMotorOff:
      SetStopMotor(false, stop);
      return {};

    case CommandKind::kRunTool:
      return RunTool(stop);

    case CommandKind::kSetHighResGraphMode:
      master_.WriteSingleCoil(options_.unit_id, kdu::kHighResGraphCoil, input.flag);
      state_.high_res_graph = input.flag;
      return {};

    case CommandKind::kSendBarcode:
      CheckBlobSize(input.data, kdu::kBarcodeBlock.ByteCount(), "barcode");
      WriteBlock(kdu::kBarcodeBlock, input.data);
      return {};

    case CommandKind::kSendProgramData:
      return SendPrograms(BlobMap{{input.number, input.data}}, input.flag, stop);

    case CommandKind::kSendMultipleProgramsData:
      return SendPrograms(input.batch, input.flag, stop);

    case CommandKind::kGetProgramData:
      CheckProgramNumber(input.number);
      return ReadBlock(Map().ProgramBlock(input.number));

    case CommandKind::kGetActiveProgramData: {
      const uint16_t active = ReadActiveNumber(kdu::kActiveProgramRegister);
      CheckProgramNumber(active);
      return ReadBlock(Map().ProgramBlock(active));
    }

    case CommandKind::kGetAllProgramsData: {
      BlobMap programs;
      for (uint16_t number = 1; number <= Map().max_program_number; ++number) {
        ThrowIfCancelled(stop);
        programs.emplace(number, ReadBlock(Map().ProgramBlock(number)));
      }
      return programs;
    }

    case CommandKind::kSendSequenceData:
      return SendSequences(BlobMap{{input.number, input.data}}, input.flag, stop);

    case CommandKind::kSendMultipleSequencesData:
      return SendSequences(input.batch, input.flag, stop);

    case CommandKind::kGetSequenceData:
      CheckSequenceNumber(input.number);
      return ReadBlock(Map().SequenceBlock(input.number));

    case CommandKind::kGetActiveSequenceData: {
      const uint16_t active = ReadActiveNumber(kdu::kActiveSequenceRegister);
      CheckSequenceNumber(active);
      return ReadBlock(Map().SequenceBlock(active));
    }

    case CommandKind::kGetAllSequencesData: {
      BlobMap sequences;
      for (uint16_t number = 1; number <= Map().max_sequence_number; ++number) {
        ThrowIfCancelled(stop);
        sequences.emplace(number, ReadBlock(Map().SequenceBlock(number)));
      }
      return sequences;
    }

    case CommandKind::kSendSettingsData:
      CheckBlobSize(input.data, Map().SettingsBytes(), "settings");
      WriteBlock(Map().settings_block, input.data);
      if (input.flag) {
        CommitToPermanentMemory(stop);
      }
      return {};

    case CommandKind::kGetSettingsData:
      return ReadBlock(Map().settings_block);

    case CommandKind::kGetFirmwareVersion:
      return state_.firmware_version;
  }
  throw InvalidArgument("Unknown command kind " + std::to_string(static_cast<int>(command.GetKind())));
}

uint8_t CommandRunner::ReadNewResultFlag() {
  const auto raw = master_.ReadInputRegisters(options_.unit_id, kdu::kNewResultFlagRegister, 1);
  return raw[1];
}

TighteningEvent CommandRunner::ReadTighteningEvent() {
  TighteningEvent event;
  event.firmware_version = state_.firmware_version;
  event.result =
      master_.ReadInputRegisters(options_.unit_id, kdu::kResultBlock.start_address, kdu::kResultBlock.reg_count);
  if (state_.replace_result_timestamp) {
    ReplaceResultTimestamp(event.result, std::chrono::system_clock::now());
  }
  if (state_.high_res_graph) {
    event.torque_graph = master_.ReadInputRegisters(options_.unit_id, kdu::kTorqueGraphBlock.start_address,
                                                    kdu::kTorqueGraphBlock.reg_count);
    event.angle_graph = master_.ReadInputRegisters(options_.unit_id, kdu::kAngleGraphBlock.start_address,
                                                   kdu::kAngleGraphBlock.reg_count);
  }
  return event;
}

void CommandRunner::SetStopMotor(bool on, const std::stop_token &stop) {
  master_.WriteSingleCoil(options_.unit_id, kdu::kStopMotorCoil, on);
  SleepFor(options_.short_wait, stop);
}

uint16_t CommandRunner::ReadActiveNumber(uint16_t address) {
  // Only the low byte carries the number
  return master_.ReadHoldingRegisters(options_.unit_id, address, 1)[1];
}

void CommandRunner::SelectActiveNumber(uint16_t address, uint16_t number, const std::stop_token &stop) {
  if (ReadActiveNumber(address) == number) {
    return;
  }
  master_.WriteSingleRegister(options_.unit_id, address, number);
  SleepFor(options_.program_change_settle, stop);
}

TighteningEvent CommandRunner::RunTool(const std::stop_token &stop) {
  static_cast<void>(ReadNewResultFlag());
  try {
    while (ReadNewResultFlag() == 0) {
      ThrowIfCancelled(stop);
      master_.WriteSingleCoil(options_.unit_id, kdu::kRemoteLeverCoil, true);
      SleepFor(options_.short_wait, stop);
    }
  } catch (const TransportError &) {
    throw;
  } catch (const Error &) {
    // The lever must not stay held once the command has failed
    try {
      master_.WriteSingleCoil(options_.unit_id, kdu::kRemoteLeverCoil, false);
    } catch (const Error &e) {
      Log(LogLevel::kWarning, std::string("Could not release the remote lever: ") + e.what());
    }
    throw;
  }
  state_.result_pending = true;
  master_.WriteSingleCoil(options_.unit_id, kdu::kRemoteLeverCoil, false);
  auto event = ReadTighteningEvent();
  state_.result_pending = false;
  return event;
}

Blob CommandRunner::ReadBlock(AddressSpan span) {
  return master_.ReadHoldingRegisters(options_.unit_id, span.start_address, span.reg_count);
}

void CommandRunner::WriteBlock(AddressSpan span, std::span<const uint8_t> data) {
  master_.WriteMultipleRegisters(options_.unit_id, span.start_address, data);
}

void CommandRunner::CommitToPermanentMemory(const std::stop_token &stop) {
  master_.WriteSingleRegister(options_.unit_id, kdu::kReprogramControlRegister, 1);
  try {
    SleepFor(options_.permanent_memory_settle, stop);
  } catch (const Cancelled &) {
    master_.WriteSingleRegister(options_.unit_id, kdu::kReprogramControlRegister, 0);
    throw;
  }
  master_.WriteSingleRegister(options_.unit_id, kdu::kReprogramControlRegister, 0);
}

void CommandRunner::CheckProgramNumber(uint16_t program_number) const {
  if (program_number == 0 || program_number > Map().max_program_number) {
    throw InvalidArgument("Program number " + std::to_string(program_number) + " is outside 1.." +
                          std::to_string(Map().max_program_number) + " for firmware version " +
                          std::to_string(state_.firmware_version));
  }
}

void CommandRunner::CheckSequenceNumber(uint16_t sequence_number) const {
  if (sequence_number == 0 || sequence_number > Map().max_sequence_number) {
    throw InvalidArgument("Sequence number " + std::to_string(sequence_number) + " is outside 1.." +
                          std::to_string(Map().max_sequence_number) + " for firmware version " +
                          std::to_string(state_.firmware_version));
  }
}

void CommandRunner::CheckBlobSize(std::span<const uint8_t> data, size_t expected, const char *what) const {
  if (data.size() != expected) {
    throw InvalidArgument(std::string(what) + " data must be " + std::to_string(expected) +
                          " bytes for firmware version " + std::to_string(state_.firmware_version) + ", got " +
                          std::to_string(data.size()));
  }
}

CommandOutput CommandRunner::SendPrograms(const BlobMap &programs, bool permanent, const std::stop_token &stop) {
  // Validate the whole batch before the first write
  for (const auto &[number, data] : programs) {
    CheckProgramNumber(number);
    CheckBlobSize(data, Map().ProgramBytes(), "program");
  }
  for (const auto &[number, data] : programs) {
    ThrowIfCancelled(stop);
    WriteBlock(Map().ProgramBlock(number), data);
  }
  if (permanent) {
    CommitToPermanentMemory(stop);
  }
  return {};
}

CommandOutput CommandRunner::SendSequences(const BlobMap &sequences, bool permanent, const std::stop_token &stop) {
  for (const auto &[number, data] : sequences) {
    CheckSequenceNumber(number);
    CheckBlobSize(data, Map().SequenceBytes(), "sequence");
  }
  for (const auto &[number, data] : sequences) {
    ThrowIfCancelled(stop);
    WriteBlock(Map().SequenceBlock(number), data);
  }
  if (permanent) {
    CommitToPermanentMemory(stop);
  }
  return {};
}

}  // namespace kducer
