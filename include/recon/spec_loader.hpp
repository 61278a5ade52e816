/**
 * @file spec_loader.hpp
 * @brief Build and validate a DesiredSpec from a JSON document.
 *
 * Accepted document (only "name" is required):
 * @code
 *   {
 *     "name": "web1",
 *     "state": "started",              // started|stopped|restarted|absent|frozen
 *     "type": "container",             // container|virtual-machine
 *     "architecture": "x86_64",
 *     "config": {"limits.cpu": "2"},   // scalar values, sent as strings
 *     "devices": {"root": {"type": "disk", "path": "/", "pool": "default"}},
 *     "ephemeral": false,
 *     "profiles": ["default"],
 *     "source": {"type": "image", "alias": "ubuntu/22.04"},
 *     "target": "node2",
 *     "timeout": 30,
 *     "wait_for_ipv4_addresses": false,
 *     "force_stop": false
 *   }
 * @endcode
 *
 * Config values are normalized to strings (the control plane stores
 * config as strings; comparing 2 against "2" would never converge).
 * Unknown keys are rejected. A null value means "not set".
 */

#ifndef RECON_SPEC_LOADER_HPP_
#define RECON_SPEC_LOADER_HPP_

#include "recon/instance.hpp"
#include "recon/vocabulary.hpp"

#include <cstdio>
#include <limits>
#include <string>
#include <utility>

namespace recon {

namespace detail {

inline Error SpecError(const std::string& msg) {
  return MakeError(ErrorKind::kInvalidSpec, msg);
}

inline Status ExpectType(const Json& v, bool ok, const char* key,
                         const char* what) {
  if (ok) return Ok();
  return Status::error(SpecError(std::string("'") + key + "' must be " + what +
                                 ", got " + v.type_name()));
}

}  // namespace detail

inline Result<DesiredSpec> LoadDesiredSpec(const Json& doc) {
  using R = Result<DesiredSpec>;
  if (!doc.is_object()) {
    return R::error(detail::SpecError("specification must be a JSON object"));
  }

  DesiredSpec spec;
  for (auto it = doc.begin(); it != doc.end(); ++it) {
    const std::string& key = it.key();
    const Json& v = it.value();
    if (v.is_null()) continue;

    Status st = Ok();
    if (key == "name") {
      st = detail::ExpectType(v, v.is_string(), "name", "a string");
      if (st) spec.name = v.get<std::string>();
    } else if (key == "architecture") {
      st = detail::ExpectType(v, v.is_string(), "architecture", "a string");
      if (st) spec.architecture = v.get<std::string>();
    } else if (key == "config") {
      st = detail::ExpectType(v, v.is_object(), "config", "an object");
      if (st) {
        Json cfg = Json::object();
        for (auto c = v.begin(); c != v.end() && st; ++c) {
          if (c->is_string()) {
            cfg[c.key()] = c->get<std::string>();
          } else if (c->is_boolean()) {
            cfg[c.key()] = c->get<bool>() ? "true" : "false";
          } else if (c->is_number()) {
            cfg[c.key()] = c->dump();
          } else {
            st = Status::error(detail::SpecError(
                "config value for '" + c.key() + "' must be a scalar"));
          }
        }
        if (st) spec.config = std::move(cfg);
      }
    } else if (key == "devices") {
      st = detail::ExpectType(v, v.is_object(), "devices", "an object");
      for (auto d = v.begin(); st && d != v.end(); ++d) {
        if (!d->is_object()) {
          st = Status::error(detail::SpecError(
              "device '" + d.key() + "' must be an object"));
        }
      }
      if (st) spec.devices = v;
    } else if (key == "ephemeral") {
      st = detail::ExpectType(v, v.is_boolean(), "ephemeral", "a boolean");
      if (st) spec.ephemeral = v.get<bool>();
    } else if (key == "profiles") {
      st = detail::ExpectType(v, v.is_array(), "profiles", "an array");
      std::vector<std::string> profiles;
      for (size_t i = 0; st && i < v.size(); ++i) {
        if (!v[i].is_string()) {
          st = Status::error(detail::SpecError("profiles must hold strings"));
        } else {
          profiles.push_back(v[i].get<std::string>());
        }
      }
      if (st) spec.profiles = std::move(profiles);
    } else if (key == "source") {
      st = detail::ExpectType(v, v.is_object(), "source", "an object");
      if (st) spec.source = v;
    } else if (key == "type") {
      st = detail::ExpectType(v, v.is_string(), "type", "a string");
      if (st) {
        std::optional<InstanceType> t = ParseInstanceType(v.get<std::string>());
        if (!t) {
          st = Status::error(detail::SpecError(
              "type must be container or virtual-machine, got '" +
              v.get<std::string>() + "'"));
        } else {
          spec.type = *t;
        }
      }
    } else if (key == "state") {
      st = detail::ExpectType(v, v.is_string(), "state", "a string");
      if (st) {
        std::optional<DesiredState> s = ParseDesiredState(v.get<std::string>());
        if (!s) {
          st = Status::error(detail::SpecError(
              "state must be one of started, stopped, restarted, absent, "
              "frozen, got '" + v.get<std::string>() + "'"));
        } else {
          spec.state = *s;
        }
      }
    } else if (key == "target") {
      st = detail::ExpectType(v, v.is_string(), "target", "a string");
      if (st) spec.target = v.get<std::string>();
    } else if (key == "timeout") {
      st = detail::ExpectType(v, v.is_number_integer(), "timeout", "an integer");
      if (st) {
        const int64_t t = v.get<int64_t>();
        if (t < 0 || t > std::numeric_limits<uint32_t>::max()) {
          st = Status::error(detail::SpecError("timeout out of range"));
        } else {
          spec.timeout_s = static_cast<uint32_t>(t);
        }
      }
    } else if (key == "wait_for_ipv4_addresses") {
      st = detail::ExpectType(v, v.is_boolean(), "wait_for_ipv4_addresses",
                              "a boolean");
      if (st) spec.wait_for_ipv4_addresses = v.get<bool>();
    } else if (key == "force_stop") {
      st = detail::ExpectType(v, v.is_boolean(), "force_stop", "a boolean");
      if (st) spec.force_stop = v.get<bool>();
    } else {
      st = Status::error(detail::SpecError("unsupported parameter '" + key + "'"));
    }
    if (!st) return R::error(st.get_error());
  }

  if (spec.name.empty()) {
    return R::error(detail::SpecError("'name' is required"));
  }
  return R::success(std::move(spec));
}

inline Result<DesiredSpec> LoadDesiredSpecFile(const std::string& path) {
  FILE* f = std::fopen(path.c_str(), "rb");
  if (f == nullptr) {
    return Result<DesiredSpec>::error(
        detail::SpecError("cannot open specification " + path));
  }
  std::string data;
  char buf[4096];
  size_t n = 0;
  while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) data.append(buf, n);
  std::fclose(f);

  Json doc = Json::parse(data, nullptr, false);
  if (doc.is_discarded()) {
    return Result<DesiredSpec>::error(
        detail::SpecError("specification " + path + " is not valid JSON"));
  }
  return LoadDesiredSpec(doc);
}

}  // namespace recon

#endif  // RECON_SPEC_LOADER_HPP_
