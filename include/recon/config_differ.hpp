/**
 * @file config_differ.hpp
 * @brief Decides whether an existing instance's attributes must be updated.
 *
 * Pure functions over an already-fetched metadata snapshot:
 *   - scalar / list / map attributes (architecture, devices, ephemeral,
 *     profiles) compare by plain inequality;
 *   - the config map is a per-key superset merge: desired keys must be
 *     present with equal values, observed-only keys are left alone;
 *   - keys in the "volatile." namespace belong to the control plane. They
 *     are dropped from the observed side and ignored on the desired side.
 */

#ifndef RECON_CONFIG_DIFFER_HPP_
#define RECON_CONFIG_DIFFER_HPP_

#include "recon/instance.hpp"

#include <cstring>
#include <string>
#include <vector>

namespace recon {

static constexpr const char* kVolatilePrefix = "volatile.";

class ConfigDiffer final {
 public:
  static bool IsVolatileKey(const std::string& key) noexcept {
    return key.compare(0, std::strlen(kVolatilePrefix), kVolatilePrefix) == 0;
  }

  /** Copy of a config object without its volatile keys. */
  static Json StripVolatile(const Json& config) {
    Json out = Json::object();
    if (!config.is_object()) return out;
    for (auto it = config.begin(); it != config.end(); ++it) {
      if (!IsVolatileKey(it.key())) out[it.key()] = it.value();
    }
    return out;
  }

  /**
   * @brief Whether @p attr must be pushed to the instance.
   *
   * Unset desired attributes never need a change. A desired attribute the
   * observed snapshot lacks always does.
   */
  static bool NeedsChange(MutableAttr attr, const DesiredSpec& spec,
                          const Json& observed) {
    std::optional<Json> desired = DesiredAttr(spec, attr);
    if (!desired) return false;

    const char* name = MutableAttrName(attr);
    if (attr == MutableAttr::kConfig) {
      Json current = Json::object();
      if (observed.is_object()) {
        auto it = observed.find(name);
        if (it != observed.end()) current = StripVolatile(*it);
      }
      if (!desired->is_object()) return false;
      for (auto it = desired->begin(); it != desired->end(); ++it) {
        if (IsVolatileKey(it.key())) continue;
        auto cur = current.find(it.key());
        if (cur == current.end() || *cur != it.value()) return true;
      }
      return false;
    }

    if (!observed.is_object()) return true;
    auto it = observed.find(name);
    if (it == observed.end()) return true;
    return *it != *desired;
  }

  static bool NeedsApply(const DesiredSpec& spec, const Json& observed) {
    for (MutableAttr attr : kMutableAttrs) {
      if (NeedsChange(attr, spec, observed)) return true;
    }
    return false;
  }

  /**
   * @brief Full mutable-attribute body for an update request.
   *
   * Starts from the observed values (volatile keys included, so the control
   * plane sees them unchanged) and overlays every attribute that needs a
   * change; config is merged key by key.
   */
  static Json BuildApplyBody(const DesiredSpec& spec, const Json& observed) {
    Json body = Json::object();
    for (MutableAttr attr : kMutableAttrs) {
      const char* name = MutableAttrName(attr);
      if (observed.is_object()) {
        auto it = observed.find(name);
        if (it != observed.end()) body[name] = *it;
      }
      if (!NeedsChange(attr, spec, observed)) continue;

      if (attr == MutableAttr::kConfig) {
        if (!body.contains(name) || !body[name].is_object()) {
          body[name] = Json::object();
        }
        for (auto it = spec.config->begin(); it != spec.config->end(); ++it) {
          if (!IsVolatileKey(it.key())) body[name][it.key()] = it.value();
        }
      } else {
        body[name] = *DesiredAttr(spec, attr);
      }
    }
    return body;
  }

  /** Mutable attributes of the observed snapshot, volatile config removed. */
  static Json MutableSnapshot(const Json& observed) {
    Json snap = Json::object();
    if (!observed.is_object()) return snap;
    for (MutableAttr attr : kMutableAttrs) {
      const char* name = MutableAttrName(attr);
      auto it = observed.find(name);
      if (it == observed.end()) continue;
      snap[name] = (attr == MutableAttr::kConfig) ? StripVolatile(*it) : *it;
    }
    return snap;
  }

  /** Desired config keys that will be ignored for being volatile. */
  static std::vector<std::string> IgnoredVolatileKeys(const DesiredSpec& spec) {
    std::vector<std::string> keys;
    if (!spec.config || !spec.config->is_object()) return keys;
    for (auto it = spec.config->begin(); it != spec.config->end(); ++it) {
      if (IsVolatileKey(it.key())) keys.push_back(it.key());
    }
    return keys;
  }
};

}  // namespace recon

#endif  // RECON_CONFIG_DIFFER_HPP_
