/**
 * @file interrupt.hpp
 * @brief SIGINT / SIGTERM to a cancellation flag.
 *
 * The flag is checked by the address poll between probes and by
 * CurlTransport while a request is in flight. Handlers are installed with
 * sigaction(2) and the previous dispositions are restored when the guard
 * goes out of scope.
 * Header-only, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef RECON_INTERRUPT_HPP_
#define RECON_INTERRUPT_HPP_

#include "recon/platform.hpp"
#include "recon/vocabulary.hpp"

#include <atomic>
#include <csignal>
#include <cstdint>

namespace recon {

class InterruptGuard;

namespace detail {

/** Exactly one InterruptGuard may be installed per process. */
inline InterruptGuard*& GetInterruptInstance() {
  static InterruptGuard* ptr = nullptr;
  return ptr;
}

}  // namespace detail

/**
 * @brief Scoped signal handler that sets a cancellation flag.
 *
 * Usage:
 * @code
 *   recon::InterruptGuard interrupt;
 *   if (!interrupt.Install()) { ... }
 *   options.cancel = &interrupt.Flag();
 * @endcode
 *
 * Non-copyable, non-movable.
 */
class InterruptGuard final {
 public:
  InterruptGuard() noexcept {
    if (detail::GetInterruptInstance() != nullptr) return;
    detail::GetInterruptInstance() = this;
    valid_ = true;
  }

  ~InterruptGuard() {
    if (installed_) {
      (void)::sigaction(SIGINT, &old_int_, nullptr);
      (void)::sigaction(SIGTERM, &old_term_, nullptr);
    }
    if (detail::GetInterruptInstance() == this) {
      detail::GetInterruptInstance() = nullptr;
    }
  }

  InterruptGuard(const InterruptGuard&) = delete;
  InterruptGuard& operator=(const InterruptGuard&) = delete;
  InterruptGuard(InterruptGuard&&) = delete;
  InterruptGuard& operator=(InterruptGuard&&) = delete;

  bool IsValid() const noexcept { return valid_; }

  Status Install() noexcept {
    if (!valid_) {
      return Status::error(MakeError(ErrorKind::kSettings,
                                     "interrupt handler already installed"));
    }
    struct sigaction sa;
    sa.sa_handler = &InterruptGuard::SignalHandler;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    if (::sigaction(SIGINT, &sa, &old_int_) != 0) {
      return Status::error(
          MakeError(ErrorKind::kSettings, "sigaction(SIGINT) failed"));
    }
    if (::sigaction(SIGTERM, &sa, &old_term_) != 0) {
      (void)::sigaction(SIGINT, &old_int_, nullptr);
      return Status::error(
          MakeError(ErrorKind::kSettings, "sigaction(SIGTERM) failed"));
    }
    installed_ = true;
    return Ok();
  }

  /** Cancel without a signal. */
  void Request(int signo = 0) noexcept {
    signo_.store(signo, std::memory_order_relaxed);
    flag_.store(true, std::memory_order_release);
  }

  const std::atomic<bool>& Flag() const noexcept { return flag_; }
  bool IsRequested() const noexcept {
    return flag_.load(std::memory_order_acquire);
  }
  int Signal() const noexcept { return signo_.load(std::memory_order_relaxed); }

 private:
  /** Async-signal-safe: atomic stores only. */
  static void SignalHandler(int signo) {
    InterruptGuard* self = detail::GetInterruptInstance();
    if (self != nullptr) self->Request(signo);
  }

  std::atomic<bool> flag_{false};
  std::atomic<int> signo_{0};
  struct sigaction old_int_ {};
  struct sigaction old_term_ {};
  bool valid_ = false;
  bool installed_ = false;
};

}  // namespace recon

#endif  // RECON_INTERRUPT_HPP_
