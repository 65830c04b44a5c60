#pragma once
#include <atomic>

namespace chronolog {

// Set from a signal handler, polled between sections.
class CancellationToken {
public:
  void cancel() noexcept { flag_.store(true); }
  [[nodiscard]] bool cancelled() const noexcept { return flag_.load(); }

  // Throws Cancelled once cancel() has been called.
  void throw_if_cancelled() const;

private:
  std::atomic<bool> flag_{false};
};

// Routes SIGINT, SIGTERM and SIGHUP to `token` while alive; a second signal gets
// the default action. The destructor restores the default handlers. Only one
// guard per process.
class SignalCancellation {
public:
  explicit SignalCancellation(CancellationToken& token);
  ~SignalCancellation();
  SignalCancellation(const SignalCancellation&) = delete;
  SignalCancellation& operator=(const SignalCancellation&) = delete;
};

} // namespace chronolog
