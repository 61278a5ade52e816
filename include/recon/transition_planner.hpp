/**
 * @file transition_planner.hpp
 * @brief Ordered lifecycle plan for every (observed, desired) state pair.
 *
 * Observed: Absent / Stopped / Started / Frozen.
 * Desired:  started / stopped / restarted / absent / frozen.
 *
 * Transition table ("apply?" = apply-config only when the config differs):
 *
 *   started   Absent  -> create, start
 *             Frozen  -> unfreeze, apply?
 *             Stopped -> start, apply?
 *             Started -> apply?
 *   stopped   Absent  -> create
 *             Stopped -> start, apply, stop      (only when config differs)
 *             Frozen  -> unfreeze, apply?, stop
 *             Started -> apply?, stop
 *   restarted Absent  -> create, start
 *             other   -> [unfreeze], apply?, restart
 *   absent    Absent  -> (nothing)
 *             other   -> [unfreeze], [stop], delete
 *   frozen    Absent  -> create, start, freeze
 *             Stopped -> start, apply?, freeze
 *             other   -> apply?, freeze
 *
 * Config is applied before the terminal action of a transition. When the
 * instance has to be started before it can be reconfigured the order is
 * start, apply, terminal action.
 */

#ifndef RECON_TRANSITION_PLANNER_HPP_
#define RECON_TRANSITION_PLANNER_HPP_

#include "recon/instance.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace recon {

// ============================================================================
// Action
// ============================================================================

enum class Action : uint8_t {
  kCreate = 0,
  kStart,
  kStop,
  kRestart,
  kDelete,
  kFreeze,
  kUnfreeze,
  kApplyConfig,
};

/** Name recorded in the action log. */
inline const char* ActionName(Action a) noexcept {
  switch (a) {
    case Action::kCreate:      return "create";
    case Action::kStart:       return "start";
    case Action::kStop:        return "stop";
    case Action::kRestart:     return "restart";
    case Action::kDelete:      return "delete";
    case Action::kFreeze:      return "freeze";
    case Action::kUnfreeze:    return "unfreeze";
    case Action::kApplyConfig: return "apply_container_configs";
  }
  return "";
}

// ============================================================================
// TransitionPlan
// ============================================================================

struct TransitionPlan {
  std::vector<Action> actions;
  bool await_addresses = false;  ///< Run the AddressWaiter after actions.
};

// ============================================================================
// TransitionPlanner
// ============================================================================

class TransitionPlanner final {
 public:
  /**
   * @brief Select the ordered action list for one reconciliation run.
   *
   * @param observed        Status from the single fetch of this run.
   * @param desired         Requested target state.
   * @param needs_apply     ConfigDiffer::NeedsApply() for the snapshot
   *                        (ignored when observed is Absent).
   * @param wait_requested  Caller asked to wait for IPv4 addresses.
   */
  static TransitionPlan Plan(InstanceStatus observed, DesiredState desired,
                             bool needs_apply, bool wait_requested) {
    TransitionPlan plan;
    switch (desired) {
      case DesiredState::kStarted:
        PlanStarted(observed, needs_apply, plan.actions);
        plan.await_addresses = wait_requested;
        break;
      case DesiredState::kStopped:
        PlanStopped(observed, needs_apply, plan.actions);
        break;
      case DesiredState::kRestarted:
        PlanRestarted(observed, needs_apply, plan.actions);
        plan.await_addresses = wait_requested;
        break;
      case DesiredState::kAbsent:
        PlanAbsent(observed, plan.actions);
        break;
      case DesiredState::kFrozen:
        PlanFrozen(observed, needs_apply, plan.actions);
        break;
    }
    return plan;
  }

 private:
  using Actions = std::vector<Action>;

  static void ApplyIf(bool needs_apply, Actions& out) {
    if (needs_apply) out.push_back(Action::kApplyConfig);
  }

  static void PlanStarted(InstanceStatus observed, bool needs_apply,
                          Actions& out) {
    switch (observed) {
      case InstanceStatus::kAbsent:
        out.push_back(Action::kCreate);
        out.push_back(Action::kStart);
        return;
      case InstanceStatus::kFrozen:
        out.push_back(Action::kUnfreeze);
        break;
      case InstanceStatus::kStopped:
        out.push_back(Action::kStart);
        break;
      case InstanceStatus::kStarted:
        break;
    }
    ApplyIf(needs_apply, out);
  }

  static void PlanStopped(InstanceStatus observed, bool needs_apply,
                          Actions& out) {
    switch (observed) {
      case InstanceStatus::kAbsent:
        out.push_back(Action::kCreate);
        return;
      case InstanceStatus::kStopped:
        // Most attributes cannot be pushed to a stopped instance, so it is
        // started briefly, reconfigured, then stopped again.
        if (needs_apply) {
          out.push_back(Action::kStart);
          out.push_back(Action::kApplyConfig);
          out.push_back(Action::kStop);
        }
        return;
      case InstanceStatus::kFrozen:
        out.push_back(Action::kUnfreeze);
        break;
      case InstanceStatus::kStarted:
        break;
    }
    ApplyIf(needs_apply, out);
    out.push_back(Action::kStop);
  }

  static void PlanRestarted(InstanceStatus observed, bool needs_apply,
                            Actions& out) {
    if (observed == InstanceStatus::kAbsent) {
      out.push_back(Action::kCreate);
      out.push_back(Action::kStart);
      return;
    }
    if (observed == InstanceStatus::kFrozen) out.push_back(Action::kUnfreeze);
    ApplyIf(needs_apply, out);
    out.push_back(Action::kRestart);
  }

  static void PlanAbsent(InstanceStatus observed, Actions& out) {
    if (observed == InstanceStatus::kAbsent) return;
    if (observed == InstanceStatus::kFrozen) out.push_back(Action::kUnfreeze);
    if (observed != InstanceStatus::kStopped) out.push_back(Action::kStop);
    out.push_back(Action::kDelete);
  }

  static void PlanFrozen(InstanceStatus observed, bool needs_apply,
                         Actions& out) {
    switch (observed) {
      case InstanceStatus::kAbsent:
        out.push_back(Action::kCreate);
        out.push_back(Action::kStart);
        out.push_back(Action::kFreeze);
        return;
      case InstanceStatus::kStopped:
        out.push_back(Action::kStart);
        break;
      case InstanceStatus::kStarted:
      case InstanceStatus::kFrozen:
        // Freeze is re-issued on an already frozen instance.
        break;
    }
    ApplyIf(needs_apply, out);
    out.push_back(Action::kFreeze);
  }
};

}  // namespace recon

#endif  // RECON_TRANSITION_PLANNER_HPP_
