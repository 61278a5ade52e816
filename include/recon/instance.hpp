/**
 * @file instance.hpp
 * @brief Instance data model: desired specification, observed state, enums.
 *
 * Attribute values that travel to and from the control plane (config,
 * devices, source) are kept as nlohmann::json so they round-trip without
 * loss. Everything else is strongly typed.
 */

#ifndef RECON_INSTANCE_HPP_
#define RECON_INSTANCE_HPP_

#include "recon/platform.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <cstring>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace recon {

using Json = nlohmann::json;

// ============================================================================
// InstanceStatus - observed runtime status
// ============================================================================

enum class InstanceStatus : uint8_t {
  kAbsent = 0,
  kStarted,
  kStopped,
  kFrozen,
};

inline const char* InstanceStatusName(InstanceStatus s) noexcept {
  switch (s) {
    case InstanceStatus::kAbsent:  return "absent";
    case InstanceStatus::kStarted: return "started";
    case InstanceStatus::kStopped: return "stopped";
    case InstanceStatus::kFrozen:  return "frozen";
  }
  return "absent";
}

/**
 * @brief Map the control plane's status string ("Running", "Stopped",
 *        "Frozen") onto InstanceStatus.
 * @return Empty optional for any other status.
 */
inline std::optional<InstanceStatus> StatusFromApi(const std::string& status) {
  if (status == "Running") return InstanceStatus::kStarted;
  if (status == "Stopped") return InstanceStatus::kStopped;
  if (status == "Frozen") return InstanceStatus::kFrozen;
  return std::nullopt;
}

// ============================================================================
// DesiredState - caller-declared target
// ============================================================================

enum class DesiredState : uint8_t {
  kStarted = 0,
  kStopped,
  kRestarted,
  kAbsent,
  kFrozen,
};

inline const char* DesiredStateName(DesiredState s) noexcept {
  switch (s) {
    case DesiredState::kStarted:   return "started";
    case DesiredState::kStopped:   return "stopped";
    case DesiredState::kRestarted: return "restarted";
    case DesiredState::kAbsent:    return "absent";
    case DesiredState::kFrozen:    return "frozen";
  }
  return "started";
}

inline std::optional<DesiredState> ParseDesiredState(const std::string& name) {
  if (name == "started") return DesiredState::kStarted;
  if (name == "stopped") return DesiredState::kStopped;
  if (name == "restarted") return DesiredState::kRestarted;
  if (name == "absent") return DesiredState::kAbsent;
  if (name == "frozen") return DesiredState::kFrozen;
  return std::nullopt;
}

// ============================================================================
// InstanceType
// ============================================================================

enum class InstanceType : uint8_t {
  kContainer = 0,
  kVirtualMachine,
};

inline const char* InstanceTypeName(InstanceType t) noexcept {
  return (t == InstanceType::kVirtualMachine) ? "virtual-machine"
                                              : "container";
}

inline std::optional<InstanceType> ParseInstanceType(const std::string& name) {
  if (name == "container") return InstanceType::kContainer;
  if (name == "virtual-machine") return InstanceType::kVirtualMachine;
  return std::nullopt;
}

// ============================================================================
// StateAction - verbs accepted by the state endpoint
// ============================================================================

enum class StateAction : uint8_t {
  kStart = 0,
  kStop,
  kRestart,
  kFreeze,
  kUnfreeze,
};

inline const char* StateActionName(StateAction a) noexcept {
  switch (a) {
    case StateAction::kStart:    return "start";
    case StateAction::kStop:     return "stop";
    case StateAction::kRestart:  return "restart";
    case StateAction::kFreeze:   return "freeze";
    case StateAction::kUnfreeze: return "unfreeze";
  }
  return "start";
}

// ============================================================================
// MutableAttr - attributes reconciled on an existing instance
// ============================================================================

/**
 * source and type are creation-only and deliberately absent here: they are
 * sent on create and never compared or re-applied afterwards.
 */
enum class MutableAttr : uint8_t {
  kArchitecture = 0,
  kConfig,
  kDevices,
  kEphemeral,
  kProfiles,
};

static constexpr std::array<MutableAttr, 5> kMutableAttrs = {
    MutableAttr::kArchitecture, MutableAttr::kConfig, MutableAttr::kDevices,
    MutableAttr::kEphemeral, MutableAttr::kProfiles};

inline const char* MutableAttrName(MutableAttr a) noexcept {
  switch (a) {
    case MutableAttr::kArchitecture: return "architecture";
    case MutableAttr::kConfig:       return "config";
    case MutableAttr::kDevices:      return "devices";
    case MutableAttr::kEphemeral:    return "ephemeral";
    case MutableAttr::kProfiles:     return "profiles";
  }
  return "";
}

// ============================================================================
// DesiredSpec
// ============================================================================

/**
 * @brief Immutable per-invocation target for one instance.
 *
 * Optional attributes left empty are neither compared nor pushed. An
 * attribute holding an empty collection is still compared.
 */
struct DesiredSpec {
  std::string name;
  std::optional<std::string> architecture;
  std::optional<Json> config;    ///< Object: key -> scalar.
  std::optional<Json> devices;   ///< Object: device name -> object.
  std::optional<bool> ephemeral;
  std::optional<std::vector<std::string>> profiles;
  std::optional<Json> source;    ///< Creation-only image/pull descriptor.
  InstanceType type = InstanceType::kContainer;  ///< Creation-only.
  std::string target;            ///< Cluster placement node, empty = any.
  DesiredState state = DesiredState::kStarted;
  uint32_t timeout_s = 30;
  bool wait_for_ipv4_addresses = false;
  bool force_stop = false;
};

/** Desired value of a mutable attribute, empty when the caller left it unset. */
inline std::optional<Json> DesiredAttr(const DesiredSpec& spec,
                                       MutableAttr attr) {
  switch (attr) {
    case MutableAttr::kArchitecture:
      if (spec.architecture) return Json(*spec.architecture);
      return std::nullopt;
    case MutableAttr::kConfig:
      return spec.config;
    case MutableAttr::kDevices:
      return spec.devices;
    case MutableAttr::kEphemeral:
      if (spec.ephemeral) return Json(*spec.ephemeral);
      return std::nullopt;
    case MutableAttr::kProfiles:
      if (spec.profiles) return Json(*spec.profiles);
      return std::nullopt;
  }
  return std::nullopt;
}

/** Body for the create request: every set attribute plus name and type. */
inline Json CreationBody(const DesiredSpec& spec) {
  Json body = Json::object();
  for (MutableAttr attr : kMutableAttrs) {
    std::optional<Json> v = DesiredAttr(spec, attr);
    if (v) body[MutableAttrName(attr)] = *v;
  }
  if (spec.source) body["source"] = *spec.source;
  body["type"] = InstanceTypeName(spec.type);
  body["name"] = spec.name;
  return body;
}

// ============================================================================
// Observed state
// ============================================================================

/**
 * @brief Single snapshot of the instance fetched at the start of a run.
 *
 * metadata is the control plane's instance object (null when absent).
 */
struct ObservedInstance {
  InstanceStatus status = InstanceStatus::kAbsent;
  Json metadata;

  bool exists() const noexcept { return status != InstanceStatus::kAbsent; }
};

struct InterfaceAddress {
  std::string family;   ///< "inet" or "inet6".
  std::string address;
};

/** Device name -> addresses, as reported by the state endpoint. */
using NetworkState = std::map<std::string, std::vector<InterfaceAddress>>;

/** Device name -> IPv4 addresses. */
using AddressMap = std::map<std::string, std::vector<std::string>>;

}  // namespace recon

#endif  // RECON_INSTANCE_HPP_
