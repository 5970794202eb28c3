#pragma once

#include <cstdint>
#include <functional>
#include <string_view>

namespace kducer {

enum class LogLevel : uint8_t { kDebug, kInfo, kWarning, kError };

/**
 * @brief Receives every message at or above the current log level
 *
 * Sinks may be called from the session thread and from caller threads; they must be thread-safe.
 */
using LogSink = std::function<void(LogLevel level, std::string_view message)>;

/**
 * @brief Replace the process-wide sink
 * @param sink New sink; an empty function restores the default std::cerr sink
 */
void SetLogSink(LogSink sink);

void SetLogLevel(LogLevel level) noexcept;
[[nodiscard]] LogLevel GetLogLevel() noexcept;

/**
 * @brief Emit a message through the current sink if @p level passes the threshold
 */
void Log(LogLevel level, std::string_view message);

[[nodiscard]] std::string_view ToString(LogLevel level) noexcept;

}  // namespace kducer
