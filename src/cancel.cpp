#include "chronolog/cancel.hpp"

#include "chronolog/error.hpp"

#include <atomic>
#include <csignal>

namespace chronolog {

namespace {

constexpr int kSignals[] = {SIGINT, SIGTERM, SIGHUP};

std::atomic<CancellationToken *> g_token{nullptr};

extern "C" void on_signal(int sig) {
  std::signal(sig, SIG_DFL);
  if (CancellationToken *token = g_token.load(); token != nullptr)
    token->cancel();
}

} // namespace

void CancellationToken::throw_if_cancelled() const {
  if (cancelled())
    throw Cancelled();
}

SignalCancellation::SignalCancellation(CancellationToken &token) {
  g_token.store(&token);
  for (const int sig : kSignals)
    std::signal(sig, on_signal);
}

SignalCancellation::~SignalCancellation() {
  for (const int sig : kSignals)
    std::signal(sig, SIG_DFL);
  g_token.store(nullptr);
}

} // namespace chronolog
