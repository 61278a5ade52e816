/**
 * @file action_executor.hpp
 * @brief Per-run context and thin wrappers around each lifecycle primitive.
 *
 * Every primitive issues at most one control-plane call and then appends
 * its name to the run's action log. In dry-run mode no call is issued but
 * the action is still recorded, so the log predicts what a real run would
 * do. A failed call records nothing and is returned to the caller, which
 * stops the plan there.
 */

#ifndef RECON_ACTION_EXECUTOR_HPP_
#define RECON_ACTION_EXECUTOR_HPP_

#include "recon/config_differ.hpp"
#include "recon/control_plane.hpp"
#include "recon/instance.hpp"
#include "recon/log.hpp"
#include "recon/transition_planner.hpp"
#include "recon/vocabulary.hpp"

#include <optional>
#include <string>
#include <vector>

namespace recon {

// ============================================================================
// ReconciliationRun
// ============================================================================

/**
 * @brief Mutable state of one reconciliation pass.
 *
 * Owned by the Reconciler for the duration of Reconcile(). The desired
 * spec is borrowed and never modified.
 */
struct ReconciliationRun {
  ReconciliationRun(const DesiredSpec& desired, bool dry)
      : spec(desired), dry_run(dry) {
    diff["before"] = Json::object();
    diff["after"] = Json::object();
  }

  const DesiredSpec& spec;
  const bool dry_run;
  ObservedInstance observed;
  bool observed_valid = false;
  std::vector<std::string> actions;
  Json diff = Json::object();
  std::optional<AddressMap> addresses;

  bool changed() const noexcept { return !actions.empty(); }
};

// ============================================================================
// ActionExecutor
// ============================================================================

class ActionExecutor final {
 public:
  ActionExecutor(ControlPlane& control, ReconciliationRun& run) noexcept
      : control_(control), run_(run) {}

  Status Execute(Action action) {
    switch (action) {
      case Action::kCreate:      return Create();
      case Action::kStart:       return Start();
      case Action::kStop:        return Stop();
      case Action::kRestart:     return Restart();
      case Action::kDelete:      return Delete();
      case Action::kFreeze:      return Freeze();
      case Action::kUnfreeze:    return Unfreeze();
      case Action::kApplyConfig: return ApplyConfig();
    }
    return Ok();
  }

  /** Create with the full spec, creation-only attributes included. */
  Status Create() {
    if (!run_.dry_run) {
      Status st = control_.Create(CreationBody(run_.spec), run_.spec.target);
      if (!st) return st;
    }
    Record(Action::kCreate);
    return Ok();
  }

  Status Start() { return ChangeState(StateAction::kStart, Action::kStart, false); }

  Status Stop() {
    return ChangeState(StateAction::kStop, Action::kStop, run_.spec.force_stop);
  }

  Status Restart() {
    return ChangeState(StateAction::kRestart, Action::kRestart,
                       run_.spec.force_stop);
  }

  Status Delete() {
    if (!run_.dry_run) {
      Status st = control_.Delete(run_.spec.name);
      if (!st) return st;
    }
    Record(Action::kDelete);
    return Ok();
  }

  Status Freeze() {
    return ChangeState(StateAction::kFreeze, Action::kFreeze, false);
  }

  Status Unfreeze() {
    return ChangeState(StateAction::kUnfreeze, Action::kUnfreeze, false);
  }

  /**
   * @brief Push the merged attribute set.
   *
   * The body lands in diff.after.instance before the request is sent, so a
   * failed update still shows what was attempted.
   */
  Status ApplyConfig() {
    Json body = ConfigDiffer::BuildApplyBody(run_.spec, run_.observed.metadata);
    run_.diff["after"]["instance"] = body;
    if (!run_.dry_run) {
      Status st = control_.Update(run_.spec.name, body);
      if (!st) return st;
    }
    Record(Action::kApplyConfig);
    return Ok();
  }

 private:
  Status ChangeState(StateAction verb, Action action, bool force) {
    if (!run_.dry_run) {
      Status st = control_.SetState(run_.spec.name, verb, run_.spec.timeout_s,
                                    force);
      if (!st) return st;
    }
    Record(action);
    return Ok();
  }

  void Record(Action action) {
    run_.actions.emplace_back(ActionName(action));
    RECON_LOG_INFO("executor", "%s: %s%s", run_.spec.name.c_str(),
                   ActionName(action), run_.dry_run ? " (dry-run)" : "");
  }

  ControlPlane& control_;
  ReconciliationRun& run_;
};

}  // namespace recon

#endif  // RECON_ACTION_EXECUTOR_HPP_
