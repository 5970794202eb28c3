#pragma once

#include <chrono>
#include <stop_token>

namespace kducer {

/**
 * @brief Throw Cancelled if @p stop has been requested
 */
void ThrowIfCancelled(const std::stop_token &stop);

/**
 * @brief Sleep that wakes up as soon as @p stop is requested
 * @throws Cancelled if the sleep was interrupted or the token was already stopped
 */
void SleepFor(std::chrono::steady_clock::duration duration, const std::stop_token &stop);

/**
 * @brief SleepFor() with an absolute deadline; returns at once if it already passed
 */
void SleepUntil(std::chrono::steady_clock::time_point deadline, const std::stop_token &stop);

/**
 * @brief One token that fires when either of two tokens fires
 *
 * The session layers its shutdown token under every caller token this way, so
 * shutdown always wins and a caller's cancel never reaches anyone else. The
 * returned token stays valid after the scope ends but can no longer fire.
 */
class CancellationScope {
 public:
  CancellationScope(const std::stop_token &parent, const std::stop_token &caller);

  CancellationScope(const CancellationScope &) = delete;
  CancellationScope &operator=(const CancellationScope &) = delete;

  [[nodiscard]] std::stop_token GetToken() const noexcept { return source_.get_token(); }
  [[nodiscard]] bool IsCancelled() const noexcept { return source_.stop_requested(); }

 private:
  struct RequestStop {
    std::stop_source *source;
    void operator()() const noexcept { source->request_stop(); }
  };

  std::stop_source source_;
  std::stop_callback<RequestStop> parent_callback_;
  std::stop_callback<RequestStop> caller_callback_;
};

}  // namespace kducer
