#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>
#include "common/errors.hpp"
#include "session/cancellation.hpp"

namespace kducer {

void ThrowIfCancelled(const std::stop_token &stop) {
  if (stop.stop_requested()) {
    throw Cancelled("Operation cancelled");
  }
}

void SleepFor(std::chrono::steady_clock::duration duration, const std::stop_token &stop) {
  SleepUntil(std::chrono::steady_clock::now() + duration, stop);
}

void SleepUntil(std::chrono::steady_clock::time_point deadline, const std::stop_token &stop) {
  ThrowIfCancelled(stop);
  std::mutex mutex;
  std::condition_variable_any wakeup;
  std::unique_lock<std::mutex> lock(mutex);
  // Nothing notifies besides the stop token, so the predicate only reports stop
  static_cast<void>(wakeup.wait_until(lock, stop, deadline, [] { return false; }));
  ThrowIfCancelled(stop);
}

CancellationScope::CancellationScope(const std::stop_token &parent, const std::stop_token &caller)
    : source_(),
      parent_callback_(parent, RequestStop{&source_}),
      caller_callback_(caller, RequestStop{&source_}) {}

}  // namespace kducer
