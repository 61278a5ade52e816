/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file reconciler.hpp
 * @brief Entry point: converge one instance toward a DesiredSpec.
 *
 * Pipeline (single pass, single thread):
 *
 *   authenticate? -> Fetch -> diff.before -> TransitionPlanner::Plan
 *     -> ActionExecutor (in order, stop at first failure)
 *     -> AddressWaiter (started / restarted, when requested, not in dry-run)
 *
 * Errors are carried as Status values and turned into a failure result in
 * exactly one place, Reconcile(). Nothing is rolled back: a failure result
 * carries the actions that did complete and the diff built so far.
 *
 * Usage:
 * @code
 *   recon::LxdClient client(std::move(transport), opts);
 *   recon::Reconciler rec(client);
 *   recon::ReconcileResult res = rec.Reconcile(spec);
 *   std::puts(res.ToJson().dump().c_str());
 * @endcode
 */

#ifndef RECON_RECONCILER_HPP_
#define RECON_RECONCILER_HPP_

#include "recon/action_executor.hpp"
#include "recon/address_waiter.hpp"
#include "recon/config_differ.hpp"
#include "recon/control_plane.hpp"
#include "recon/instance.hpp"
#include "recon/log.hpp"
#include "recon/transition_planner.hpp"
#include "recon/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace recon {

// ============================================================================
// ReconcileResult
// ============================================================================

struct ReconcileResult {
  bool ok = false;
  bool changed = false;
  std::string old_state;              ///< Empty when the fetch never happened.
  std::vector<std::string> actions;
  Json diff = Json::object();
  std::optional<AddressMap> addresses;
  std::string message;                ///< Failure message, empty on success.
  ErrorKind error_kind = ErrorKind::kTransport;
  Json logs;                          ///< Client debug logs, null if none.

  /**
   * @brief Structured report.
   *
   * Success: {changed, old_state, actions, diff, [addresses], [logs]}.
   * Failure: {failed: true, msg, changed, actions, diff, [logs]}.
   */
  Json ToJson() const {
    Json j = Json::object();
    if (!ok) {
      j["failed"] = true;
      j["msg"] = message;
    } else {
      j["old_state"] = old_state;
      if (addresses) j["addresses"] = *addresses;
    }
    j["changed"] = changed;
    j["actions"] = actions;
    j["diff"] = diff;
    if (!logs.is_null()) j["logs"] = logs;
    return j;
  }
};

// ============================================================================
// Reconciler
// ============================================================================

class Reconciler final {
 public:
  struct Options {
    bool dry_run = false;
    std::optional<std::string> trust_password;
    const std::atomic<bool>* cancel = nullptr;    ///< Interrupts address wait.
    PollClock* clock = nullptr;                   ///< nullptr = steady clock.
    std::chrono::milliseconds poll_interval{1000};
  };

  explicit Reconciler(ControlPlane& control) : control_(control) {}
  Reconciler(ControlPlane& control, Options options)
      : control_(control), options_(std::move(options)) {}

  ReconcileResult Reconcile(const DesiredSpec& spec) {
    ReconciliationRun run(spec, options_.dry_run);
    Status st = Run(run);

    ReconcileResult res;
    res.ok = st.has_value();
    res.changed = run.changed();
    if (run.observed_valid) res.old_state = InstanceStatusName(run.observed.status);
    res.actions = run.actions;
    res.diff = run.diff;
    res.addresses = run.addresses;
    Json logs = control_.DebugLogs();
    if (logs.is_array() && !logs.empty()) res.logs = std::move(logs);

    if (!st) {
      res.message = st.get_error().message;
      res.error_kind = st.get_error().kind;
      RECON_LOG_ERROR("reconciler", "%s: %s failure after %zu action(s): %s",
                      spec.name.c_str(), ErrorKindName(res.error_kind),
                      run.actions.size(), res.message.c_str());
    } else {
      RECON_LOG_INFO("reconciler", "%s: %s -> %s, %s", spec.name.c_str(),
                     res.old_state.c_str(), DesiredStateName(spec.state),
                     res.changed ? "changed" : "unchanged");
    }
    return res;
  }

 private:
  Status Run(ReconciliationRun& run) {
    const DesiredSpec& spec = run.spec;

    if (options_.trust_password) {
      Status auth = control_.Authenticate(*options_.trust_password);
      if (!auth) return auth;
    }

    Result<ObservedInstance> observed = control_.Fetch(spec.name);
    if (!observed) return Status::error(observed.get_error());
    run.observed = std::move(observed).value();
    run.observed_valid = true;

    run.diff["before"]["state"] = InstanceStatusName(run.observed.status);
    run.diff["after"]["state"] = DesiredStateName(spec.state);
    run.diff["before"]["instance"] =
        ConfigDiffer::MutableSnapshot(run.observed.metadata);

    for (const std::string& key : ConfigDiffer::IgnoredVolatileKeys(spec)) {
      RECON_LOG_WARN("reconciler", "%s: ignoring control-plane key %s",
                     spec.name.c_str(), key.c_str());
    }

    const bool needs_apply =
        run.observed.exists() &&
        ConfigDiffer::NeedsApply(spec, run.observed.metadata);
    TransitionPlan plan = TransitionPlanner::Plan(
        run.observed.status, spec.state, needs_apply,
        spec.wait_for_ipv4_addresses);
    RECON_LOG_DEBUG("reconciler", "%s: %s -> %s, %zu action(s), apply=%d",
                    spec.name.c_str(), InstanceStatusName(run.observed.status),
                    DesiredStateName(spec.state), plan.actions.size(),
                    needs_apply ? 1 : 0);

    ActionExecutor exec(control_, run);
    for (Action action : plan.actions) {
      Status st = exec.Execute(action);
      if (!st) return st;
    }

    if (plan.await_addresses) {
      if (run.dry_run) {
        RECON_LOG_DEBUG("reconciler", "%s: dry-run, address wait skipped",
                        spec.name.c_str());
        return Ok();
      }
      PollClock& clock = (options_.clock != nullptr)
                             ? *options_.clock
                             : static_cast<PollClock&>(SteadyPollClock::Instance());
      AddressWaiter waiter(control_, clock, options_.cancel,
                           options_.poll_interval);
      Result<AddressMap> addrs = waiter.Await(spec.name, spec.timeout_s);
      if (!addrs) return Status::error(addrs.get_error());
      run.addresses = std::move(addrs).value();
    }
    return Ok();
  }

  ControlPlane& control_;
  Options options_;
};

}  // namespace recon

#endif  // RECON_RECONCILER_HPP_
