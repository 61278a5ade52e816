/**
 * @file address_waiter.hpp
 * @brief Blocking wait until every network device of an instance has IPv4.
 *
 * TimedPoll is a deadline + interval poll loop with an injectable clock and
 * an optional cancellation flag (set from a signal handler, see
 * interrupt.hpp). AddressWaiter runs it against ControlPlane::FetchState().
 *
 * Readiness is all-or-nothing: at least one non-loopback device, and every
 * such device holding at least one IPv4 address. Partial results are never
 * reported as success.
 */

#ifndef RECON_ADDRESS_WAITER_HPP_
#define RECON_ADDRESS_WAITER_HPP_

#include "recon/control_plane.hpp"
#include "recon/log.hpp"
#include "recon/vocabulary.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace recon {

// ============================================================================
// PollClock
// ============================================================================

/** Time source and sleeper used by TimedPoll. */
class PollClock {
 public:
  using TimePoint = std::chrono::steady_clock::time_point;

  virtual ~PollClock() = default;
  virtual TimePoint Now() = 0;
  virtual void Sleep(std::chrono::milliseconds duration) = 0;
};

class SteadyPollClock final : public PollClock {
 public:
  TimePoint Now() override { return std::chrono::steady_clock::now(); }
  void Sleep(std::chrono::milliseconds duration) override {
    std::this_thread::sleep_for(duration);
  }

  static SteadyPollClock& Instance() {
    static SteadyPollClock clock;
    return clock;
  }
};

// ============================================================================
// TimedPoll
// ============================================================================

class TimedPoll final {
 public:
  /**
   * @param timeout   Total time budget, measured from Run().
   * @param interval  Sleep before each probe.
   * @param clock     Time source.
   * @param cancel    Optional flag; when it turns true the poll stops with
   *                  ErrorKind::kCancelled.
   */
  TimedPoll(std::chrono::milliseconds timeout,
            std::chrono::milliseconds interval, PollClock& clock,
            const std::atomic<bool>* cancel = nullptr) noexcept
      : timeout_(timeout), interval_(interval), clock_(clock),
        cancel_(cancel) {}

  /**
   * @brief Probe until it yields a value, fails, or the deadline passes.
   *
   * @p probe returns Result<std::optional<T>>: an empty optional means
   * "not ready yet", an error aborts the poll.
   *
   * @param what  Used in the timeout message: "timeout waiting for <what>".
   */
  template <typename T, typename Probe>
  Result<T> Run(const char* what, Probe&& probe) {
    const PollClock::TimePoint deadline = clock_.Now() + timeout_;
    while (clock_.Now() < deadline) {
      if (Cancelled()) break;
      clock_.Sleep(interval_);
      if (Cancelled()) break;

      Result<std::optional<T>> r = probe();
      if (!r.has_value()) return Result<T>::error(r.get_error());
      if (r.value().has_value()) {
        return Result<T>::success(std::move(*r.value()));
      }
    }
    if (Cancelled()) {
      return Result<T>::error(MakeError(ErrorKind::kCancelled,
                                        std::string("cancelled waiting for ") +
                                            what));
    }
    return Result<T>::error(
        MakeError(ErrorKind::kTimeout, std::string("timeout waiting for ") + what));
  }

 private:
  bool Cancelled() const noexcept {
    return cancel_ != nullptr && cancel_->load(std::memory_order_acquire);
  }

  std::chrono::milliseconds timeout_;
  std::chrono::milliseconds interval_;
  PollClock& clock_;
  const std::atomic<bool>* cancel_;
};

// ============================================================================
// AddressWaiter
// ============================================================================

class AddressWaiter final {
 public:
  static constexpr std::chrono::milliseconds kDefaultInterval{1000};

  explicit AddressWaiter(ControlPlane& control,
                         PollClock& clock = SteadyPollClock::Instance(),
                         const std::atomic<bool>* cancel = nullptr,
                         std::chrono::milliseconds interval = kDefaultInterval)
      : control_(control), clock_(clock), cancel_(cancel),
        interval_(interval) {}

  /**
   * @brief Block until all devices of @p name report IPv4 addresses.
   * @return Device -> IPv4 list, or kTimeout / kCancelled / the fetch error.
   */
  Result<AddressMap> Await(const std::string& name, uint32_t timeout_s) {
    RECON_LOG_INFO("waiter", "waiting up to %us for IPv4 addresses on %s",
                   timeout_s, name.c_str());
    TimedPoll poll(std::chrono::seconds(timeout_s), interval_, clock_, cancel_);
    Result<AddressMap> r = poll.Run<AddressMap>(
        "addresses", [this, &name]() -> Result<std::optional<AddressMap>> {
          Result<NetworkState> net = control_.FetchState(name);
          if (!net.has_value()) {
            return Result<std::optional<AddressMap>>::error(net.get_error());
          }
          AddressMap addrs = Ipv4Addresses(net.value());
          if (!HasAllIpv4(addrs)) {
            RECON_LOG_DEBUG("waiter", "%s: %zu device(s), not all addressed",
                            name.c_str(), addrs.size());
            return Result<std::optional<AddressMap>>::success(std::nullopt);
          }
          return Result<std::optional<AddressMap>>::success(std::move(addrs));
        });
    if (!r.has_value()) {
      RECON_LOG_WARN("waiter", "%s: %s", name.c_str(),
                     r.get_error().message.c_str());
    }
    return r;
  }

  /** IPv4 ("inet") addresses per device, loopback excluded. */
  static AddressMap Ipv4Addresses(const NetworkState& net) {
    AddressMap out;
    for (const auto& dev : net) {
      if (dev.first == "lo") continue;
      std::vector<std::string>& list = out[dev.first];
      for (const InterfaceAddress& a : dev.second) {
        if (a.family == "inet") list.push_back(a.address);
      }
    }
    return out;
  }

  static bool HasAllIpv4(const AddressMap& addrs) {
    if (addrs.empty()) return false;
    return std::all_of(addrs.begin(), addrs.end(), [](const auto& kv) {
      return !kv.second.empty();
    });
  }

 private:
  ControlPlane& control_;
  PollClock& clock_;
  const std::atomic<bool>* cancel_;
  std::chrono::milliseconds interval_;
};

}  // namespace recon

#endif  // RECON_ADDRESS_WAITER_HPP_
