#include <atomic>
#include <iostream>
#include <mutex>
#include <string_view>
#include <utility>
#include "common/log.hpp"

namespace kducer {

namespace {

std::mutex &SinkMutex() {
  static std::mutex mutex;
  return mutex;
}

LogSink &CurrentSink() {
  static LogSink sink;
  return sink;
}

std::atomic<LogLevel> &CurrentLevel() {
  static std::atomic<LogLevel> level{LogLevel::kInfo};
  return level;
}

void WriteToStderr(LogLevel level, std::string_view message) {
  std::cerr << "[kducer] " << ToString(level) << ": " << message << '\n';
}

}  // namespace

void SetLogSink(LogSink sink) {
  std::lock_guard<std::mutex> lock(SinkMutex());
  CurrentSink() = std::move(sink);
}

void SetLogLevel(LogLevel level) noexcept {
  CurrentLevel().store(level);
}

LogLevel GetLogLevel() noexcept {
  return CurrentLevel().load();
}

void Log(LogLevel level, std::string_view message) {
  if (level < GetLogLevel()) {
    return;
  }
  std::lock_guard<std::mutex> lock(SinkMutex());
  if (CurrentSink()) {
    CurrentSink()(level, message);
  } else {
    WriteToStderr(level, message);
  }
}

std::string_view ToString(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarning:
      return "warning";
    case LogLevel::kError:
      return "error";
  }
  return "unknown";
}

}  // namespace kducer
