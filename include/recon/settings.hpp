/**
 * @file settings.hpp
 * @brief Client settings with template-based multi-format backend dispatch.
 *
 * Design patterns (kept from the config layer):
 *   - Tag dispatch: IniBackend / JsonBackend / YamlBackend type tags
 *   - Template specialization: SettingsParser<Backend> per-format parsers
 *   - Variadic templates: Settings<Backends...> compile-time composition
 *
 * Supported backends:
 *   - JsonBackend : nlohmann/json (always built, the core depends on it)
 *   - IniBackend  : inih           (RECON_SETTINGS_INI_ENABLED)
 *   - YamlBackend : fkYAML         (RECON_SETTINGS_YAML_ENABLED)
 *
 * All formats are flattened to "section + key = value"; section and key
 * lookups are case-insensitive.
 *
 * Recognized keys:
 * @code
 *   [client]
 *   url = unix:/var/lib/lxd/unix.socket
 *   snap_url = unix:/var/snap/lxd/common/lxd/unix.socket
 *   client_cert = ~/.config/lxc/client.crt
 *   client_key = ~/.config/lxc/client.key
 *   server_cert =
 *   trust_password =
 *   instances_endpoint = /instances
 *   connect_timeout_ms = 10000
 *   request_timeout_ms = 0          ; 0 = no limit on a single request
 *   debug = false
 *   [log]
 *   level = info
 * @endcode
 */

#ifndef RECON_SETTINGS_HPP_
#define RECON_SETTINGS_HPP_

#include "recon/log.hpp"
#include "recon/platform.hpp"
#include "recon/vocabulary.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <cstdlib>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

#if defined(RECON_PLATFORM_POSIX)
#include <sys/stat.h>
#endif

#ifdef RECON_SETTINGS_INI_ENABLED
#include <ini.h>
#endif

#ifdef RECON_SETTINGS_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace recon {

// ============================================================================
// SettingsFormat
// ============================================================================

enum class SettingsFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline char Lower(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
}

inline std::string ToLower(const std::string& s) {
  std::string out(s);
  for (char& c : out) c = Lower(c);
  return out;
}

inline bool ExtEquals(const std::string& ext, const char* want) {
  return ToLower(ext) == want;
}

}  // namespace detail

// ============================================================================
// Backend Tag Types
// ============================================================================

struct IniBackend {
  static constexpr SettingsFormat kFormat = SettingsFormat::kIni;
  static bool MatchesExtension(const std::string& ext) {
    return detail::ExtEquals(ext, "ini") || detail::ExtEquals(ext, "cfg") ||
           detail::ExtEquals(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr SettingsFormat kFormat = SettingsFormat::kJson;
  static bool MatchesExtension(const std::string& ext) {
    return detail::ExtEquals(ext, "json");
  }
};

struct YamlBackend {
  static constexpr SettingsFormat kFormat = SettingsFormat::kYaml;
  static bool MatchesExtension(const std::string& ext) {
    return detail::ExtEquals(ext, "yaml") || detail::ExtEquals(ext, "yml");
  }
};

// ============================================================================
// SettingsStore - flat section/key/value storage
// ============================================================================

class SettingsStore {
 public:
  std::string GetString(const std::string& section, const std::string& key,
                        const std::string& default_val = std::string()) const {
    const std::string* v = FindEntry(section, key);
    return (v != nullptr) ? *v : default_val;
  }

  int32_t GetInt(const std::string& section, const std::string& key,
                 int32_t default_val = 0) const {
    std::optional<int32_t> v = FindInt(section, key);
    return v ? *v : default_val;
  }

  bool GetBool(const std::string& section, const std::string& key,
               bool default_val = false) const {
    const std::string* v = FindEntry(section, key);
    return (v != nullptr) ? ParseBool(*v) : default_val;
  }

  std::optional<std::string> FindString(const std::string& section,
                                        const std::string& key) const {
    const std::string* v = FindEntry(section, key);
    if (v == nullptr) return std::nullopt;
    return *v;
  }

  std::optional<int32_t> FindInt(const std::string& section,
                                 const std::string& key) const {
    const std::string* v = FindEntry(section, key);
    if (v == nullptr) return std::nullopt;
    char* end = nullptr;
    long val = std::strtol(v->c_str(), &end, 10);
    if (end == v->c_str()) return std::nullopt;
    return static_cast<int32_t>(val);
  }

  bool HasKey(const std::string& section, const std::string& key) const {
    return FindEntry(section, key) != nullptr;
  }

  size_t EntryCount() const noexcept { return entries_.size(); }

  /** Insert or overwrite one entry. */
  void Set(const std::string& section, const std::string& key,
           const std::string& value) {
    entries_[std::make_pair(detail::ToLower(section), detail::ToLower(key))] =
        value;
  }

 protected:
  static Result<std::string> ReadFile(const std::string& path) {
    FILE* f = std::fopen(path.c_str(), "rb");
    if (f == nullptr) {
      return Result<std::string>::error(
          MakeError(ErrorKind::kSettings, "cannot open settings file " + path));
    }
    std::string data;
    char buf[4096];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) data.append(buf, n);
    const bool failed = (std::ferror(f) != 0);
    std::fclose(f);
    if (failed) {
      return Result<std::string>::error(
          MakeError(ErrorKind::kSettings, "error reading settings file " + path));
    }
    return Result<std::string>::success(std::move(data));
  }

  static bool ParseBool(const std::string& s) {
    const std::string l = detail::ToLower(s);
    return l == "true" || l == "1" || l == "yes" || l == "on";
  }

  static std::string GetExtension(const std::string& path) {
    std::string::size_type dot = path.rfind('.');
    std::string::size_type slash = path.rfind('/');
    if (dot == std::string::npos ||
        (slash != std::string::npos && dot < slash)) {
      return std::string();
    }
    return path.substr(dot + 1);
  }

 private:
  const std::string* FindEntry(const std::string& section,
                               const std::string& key) const {
    auto it = entries_.find(
        std::make_pair(detail::ToLower(section), detail::ToLower(key)));
    return (it != entries_.end()) ? &it->second : nullptr;
  }

  std::map<std::pair<std::string, std::string>, std::string> entries_;

  template <typename> friend struct SettingsParser;
};

// ============================================================================
// SettingsParser<Backend>
// ============================================================================

/** Default: format not compiled in. */
template <typename Backend>
struct SettingsParser {
  static Status ParseBuffer(SettingsStore&, const std::string&) {
    return Status::error(
        MakeError(ErrorKind::kSettings, "settings format not supported"));
  }
};

// --- JSON Backend ---

template <>
struct SettingsParser<JsonBackend> {
  static Status ParseBuffer(SettingsStore& store, const std::string& data) {
    nlohmann::json j = nlohmann::json::parse(data, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      return Status::error(
          MakeError(ErrorKind::kSettings, "settings: invalid JSON document"));
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          store.Set(it.key(), kit.key(), ToStr(*kit));
        }
      } else {
        store.Set("", it.key(), ToStr(*it));
      }
    }
    return Ok();
  }

 private:
  static std::string ToStr(const nlohmann::json& n) {
    if (n.is_string()) return n.get<std::string>();
    if (n.is_boolean()) return n.get<bool>() ? "true" : "false";
    if (n.is_null()) return std::string();
    return n.dump();
  }
};

// --- INI Backend ---

#ifdef RECON_SETTINGS_INI_ENABLED
template <>
struct SettingsParser<IniBackend> {
  static Status ParseBuffer(SettingsStore& store, const std::string& data) {
    int result = ini_parse_string(data.c_str(), Handler, &store);
    if (result != 0) {
      return Status::error(MakeError(
          ErrorKind::kSettings,
          "settings: INI parse error at line " + std::to_string(result)));
    }
    return Ok();
  }

 private:
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* s = static_cast<SettingsStore*>(user);
    s->Set(section ? section : "", name ? name : "", value ? value : "");
    return 1;
  }
};
#endif

// --- YAML Backend ---

#ifdef RECON_SETTINGS_YAML_ENABLED
template <>
struct SettingsParser<YamlBackend> {
  static Status ParseBuffer(SettingsStore& store, const std::string& data) {
    auto root = fkyaml::node::deserialize(data);
    if (root.is_null() || !root.is_mapping()) {
      return Status::error(
          MakeError(ErrorKind::kSettings, "settings: invalid YAML document"));
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      auto sec = it.key().get_value<std::string>();
      auto& node = *it;
      if (node.is_mapping()) {
        for (auto kit = node.begin(); kit != node.end(); ++kit) {
          store.Set(sec, kit.key().get_value<std::string>(), ToStr(*kit));
        }
      } else {
        store.Set("", sec, ToStr(node));
      }
    }
    return Ok();
  }

 private:
  static std::string ToStr(const fkyaml::node& n) {
    if (n.is_string()) return n.get_value<std::string>();
    if (n.is_boolean()) return n.get_value<bool>() ? "true" : "false";
    if (n.is_integer()) return std::to_string(n.get_value<int64_t>());
    if (n.is_float_number()) return std::to_string(n.get_value<double>());
    return std::string();
  }
};
#endif

// ============================================================================
// Settings<Backends...>
// ============================================================================

template <typename... Backends>
class Settings final : public SettingsStore {
  static_assert(sizeof...(Backends) > 0, "Settings requires at least one backend");

 public:
  Settings() = default;

  Status LoadFile(const std::string& path,
                  SettingsFormat format = SettingsFormat::kAuto) {
    Result<std::string> data = ReadFile(path);
    if (!data) return Status::error(data.get_error());
    if (format == SettingsFormat::kAuto) format = DetectFormat(path);
    RECON_LOG_DEBUG("settings", "loading %s", path.c_str());
    return Dispatch<Backends...>(data.value(), format);
  }

  Status LoadBuffer(const std::string& data, SettingsFormat format) {
    return Dispatch<Backends...>(data, format);
  }

 private:
  template <typename First, typename... Rest>
  Status Dispatch(const std::string& data, SettingsFormat format) {
    if (First::kFormat == format) {
      return SettingsParser<First>::ParseBuffer(*this, data);
    }
    if constexpr (sizeof...(Rest) > 0) return Dispatch<Rest...>(data, format);
    return Status::error(
        MakeError(ErrorKind::kSettings, "settings format not supported"));
  }

  SettingsFormat DetectFormat(const std::string& path) const {
    const std::string ext = GetExtension(path);
    if (ext.empty()) return Head::kFormat;
    return DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  SettingsFormat DetectExt(const std::string& ext) const {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return DetectExt<Rest...>(ext);
    return Head::kFormat;
  }

  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;
};

using MultiSettings = Settings<JsonBackend
#ifdef RECON_SETTINGS_INI_ENABLED
                               , IniBackend
#endif
#ifdef RECON_SETTINGS_YAML_ENABLED
                               , YamlBackend
#endif
                               >;

// ============================================================================
// ClientSettings
// ============================================================================

static constexpr const char* kDefaultUrl = "unix:/var/lib/lxd/unix.socket";
static constexpr const char* kDefaultSnapUrl =
    "unix:/var/snap/lxd/common/lxd/unix.socket";

/** Endpoint, credentials and client behaviour for one process run. */
struct ClientSettings {
  std::string url = kDefaultUrl;
  std::string client_cert;
  std::string client_key;
  std::string server_cert;
  std::optional<std::string> trust_password;
  std::string instances_endpoint = "/instances";
  int32_t connect_timeout_ms = 10000;
  int32_t request_timeout_ms = 0;
  bool debug = false;
  log::Level log_level = log::Level::kInfo;
};

using PathExistsFn = bool (*)(const char* path);

inline bool PathExists(const char* path) {
#if defined(RECON_PLATFORM_POSIX)
  struct stat st;
  return ::stat(path, &st) == 0;
#else
  FILE* f = std::fopen(path, "rb");
  if (f == nullptr) return false;
  std::fclose(f);
  return true;
#endif
}

/**
 * @brief Resolve ClientSettings from a loaded store.
 *
 * When url is left at its default and the snap socket exists, the snap
 * socket is used. Certificate paths default to $HOME/.config/lxc/.
 *
 * @param home    Home directory for default certificate paths (may be null).
 * @param exists  Filesystem probe, replaceable in tests.
 */
inline Result<ClientSettings> ResolveClientSettings(
    const SettingsStore& store, const char* home,
    PathExistsFn exists = PathExists) {
  ClientSettings cs;
  const std::string url = store.GetString("client", "url", kDefaultUrl);
  const std::string snap_url =
      store.GetString("client", "snap_url", kDefaultSnapUrl);
  cs.url = url;
  if (url == kDefaultUrl && snap_url.compare(0, 5, "unix:") == 0 &&
      exists(snap_url.c_str() + 5)) {
    cs.url = snap_url;
  }

  const std::string lxc_dir =
      (home != nullptr) ? std::string(home) + "/.config/lxc" : std::string();
  cs.client_cert = store.GetString(
      "client", "client_cert", lxc_dir.empty() ? "" : lxc_dir + "/client.crt");
  cs.client_key = store.GetString(
      "client", "client_key", lxc_dir.empty() ? "" : lxc_dir + "/client.key");
  cs.server_cert = store.GetString("client", "server_cert");
  cs.trust_password = store.FindString("client", "trust_password");
  if (cs.trust_password && cs.trust_password->empty()) {
    cs.trust_password.reset();
  }
  cs.instances_endpoint =
      store.GetString("client", "instances_endpoint", "/instances");
  if (cs.instances_endpoint.empty() || cs.instances_endpoint[0] != '/') {
    return Result<ClientSettings>::error(MakeError(
        ErrorKind::kSettings,
        "instances_endpoint must start with '/': " + cs.instances_endpoint));
  }
  cs.connect_timeout_ms =
      store.GetInt("client", "connect_timeout_ms", cs.connect_timeout_ms);
  cs.request_timeout_ms =
      store.GetInt("client", "request_timeout_ms", cs.request_timeout_ms);
  if (cs.connect_timeout_ms < 0 || cs.request_timeout_ms < 0) {
    return Result<ClientSettings>::error(
        MakeError(ErrorKind::kSettings, "timeouts must not be negative"));
  }
  cs.debug = store.GetBool("client", "debug", false);

  std::optional<std::string> level = store.FindString("log", "level");
  if (level && !log::ParseLevel(level->c_str(), cs.log_level)) {
    return Result<ClientSettings>::error(
        MakeError(ErrorKind::kSettings, "unknown log level: " + *level));
  }
  return Result<ClientSettings>::success(std::move(cs));
}

}  // namespace recon

#endif  // RECON_SETTINGS_HPP_
