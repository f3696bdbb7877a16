/**
 * @file config.hpp
 * @brief Settings file reader: INI, JSON or YAML flattened to section/key/value.
 *
 *   Config<IniBackend, JsonBackend>::LoadFile("corral.json")
 *        |
 *        +-- extension --> backend tag --> ConfigParser<Tag>::Parse*
 *        |
 *   ConfigStore  [orchestrator] identity = deploy@ci
 *                [store]        lock_dir = /var/lib/corral/locks
 *        |
 *   ApplyEnvironment("CORRAL_")  CORRAL_STORE_LOCK_DIR=/tmp/locks wins
 *
 * Backends are compiled in on request (CMake options):
 *   - IniBackend  : inih            (CORRAL_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json   (CORRAL_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML          (CORRAL_CONFIG_YAML_ENABLED)
 *
 * JSON and YAML documents are read as a mapping of sections. Scalars at the
 * top level go to the "" section, sequences of scalars become a
 * comma-separated value, and deeper mappings keep their path in the key
 * ("ssh.port"). Section and key lookups ignore case.
 */

#ifndef CORRAL_CONFIG_HPP_
#define CORRAL_CONFIG_HPP_

#include "corral/platform.hpp"
#include "corral/vocabulary.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <unistd.h>

#ifdef CORRAL_CONFIG_INI_ENABLED
#include "ini.h"
#endif

#ifdef CORRAL_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef CORRAL_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

extern char** environ;  // NOLINT

namespace corral {

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
};

inline const char* ConfigErrorName(ConfigError e) noexcept {
  switch (e) {
    case ConfigError::kFileNotFound:       return "file not found";
    case ConfigError::kParseError:         return "parse error";
    case ConfigError::kFormatNotSupported: return "format not supported";
    case ConfigError::kBufferFull:         return "too many entries";
    default:                               return "unknown";
  }
}

using ConfigResult = expected<void, ConfigError>;

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline char Lower(char c) noexcept {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

inline bool CaseEqual(const std::string& a, const char* b) noexcept {
  size_t i = 0U;
  for (; i < a.size() && b[i] != '\0'; ++i) {
    if (Lower(a[i]) != Lower(b[i])) return false;
  }
  return i == a.size() && b[i] == '\0';
}

/// Extension after the last '.' of the final path component, or "".
inline std::string Extension(const std::string& path) {
  const size_t slash = path.find_last_of('/');
  const size_t dot = path.find_last_of('.');
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
    return std::string();
  }
  return path.substr(dot + 1U);
}

}  // namespace detail

// ============================================================================
// Backend tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const std::string& ext) noexcept {
    return detail::CaseEqual(ext, "ini") || detail::CaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const std::string& ext) noexcept {
    return detail::CaseEqual(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const std::string& ext) noexcept {
    return detail::CaseEqual(ext, "yaml") || detail::CaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

#ifndef CORRAL_CONFIG_MAX_ENTRIES
#define CORRAL_CONFIG_MAX_ENTRIES 512U
#endif

class ConfigStore {
 public:
  struct Entry {
    std::string section;
    std::string key;
    std::string value;
  };

  std::string GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = Lookup(section, key);
    return (e != nullptr) ? e->value : std::string(default_val);
  }

  int64_t GetInt(const char* section, const char* key,
                 int64_t default_val = 0) const {
    return FindInt(section, key).value_or(default_val);
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    return FindBool(section, key).value_or(default_val);
  }

  double GetDouble(const char* section, const char* key,
                   double default_val = 0.0) const {
    const Entry* e = Lookup(section, key);
    if (e == nullptr || e->value.empty()) return default_val;
    char* end = nullptr;
    const double val = std::strtod(e->value.c_str(), &end);
    return (*end != '\0') ? default_val : val;
  }

  /// @return Empty if absent or not entirely an integer.
  optional<int64_t> FindInt(const char* section, const char* key) const {
    const Entry* e = Lookup(section, key);
    if (e == nullptr || e->value.empty()) return optional<int64_t>();
    char* end = nullptr;
    const long long val = std::strtoll(e->value.c_str(), &end, 10);
    if (*end != '\0') return optional<int64_t>();
    return optional<int64_t>(static_cast<int64_t>(val));
  }

  /// true/yes/on/1 and false/no/off/0; anything else is treated as absent.
  optional<bool> FindBool(const char* section, const char* key) const {
    const Entry* e = Lookup(section, key);
    if (e == nullptr) return optional<bool>();
    for (const char* t : {"true", "yes", "on", "1"}) {
      if (detail::CaseEqual(e->value, t)) return optional<bool>(true);
    }
    for (const char* f : {"false", "no", "off", "0"}) {
      if (detail::CaseEqual(e->value, f)) return optional<bool>(false);
    }
    return optional<bool>();
  }

  bool HasSection(const char* section) const {
    CORRAL_ASSERT(section != nullptr);
    for (const auto& e : entries_) {
      if (detail::CaseEqual(e.section, section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return Lookup(section, key) != nullptr;
  }

  /// @brief All key/value pairs of @p section, in load order.
  std::vector<std::pair<std::string, std::string>> SectionEntries(
      const char* section) const {
    std::vector<std::pair<std::string, std::string>> out;
    for (const auto& e : entries_) {
      if (detail::CaseEqual(e.section, section)) {
        out.emplace_back(e.key, e.value);
      }
    }
    return out;
  }

  uint32_t EntryCount() const noexcept {
    return static_cast<uint32_t>(entries_.size());
  }

  /// @brief Insert or overwrite one value. false when the store is full.
  bool Set(const std::string& section, const std::string& key,
           const std::string& value) {
    for (auto& e : entries_) {
      if (detail::CaseEqual(e.section, section.c_str()) &&
          detail::CaseEqual(e.key, key.c_str())) {
        e.value = value;
        return true;
      }
    }
    if (entries_.size() >= CORRAL_CONFIG_MAX_ENTRIES) return false;
    entries_.push_back(Entry{section, key, value});
    return true;
  }

  /**
   * @brief Overlay variables named <prefix><SECTION>_<KEY>.
   *
   * The section is the text up to the first '_' after the prefix, the key
   * is the rest; both are lower-cased. CORRAL_ORCHESTRATOR_REQUEST_WORKERS=4
   * sets [orchestrator] request_workers.
   *
   * @param envp NULL-terminated "NAME=value" array (defaults to environ).
   * @return Number of values applied.
   */
  uint32_t ApplyEnvironment(const char* prefix,
                            const char* const* envp = environ) {
    const std::string pre(prefix);
    uint32_t applied = 0U;
    for (const char* const* p = envp; p != nullptr && *p != nullptr; ++p) {
      const std::string var(*p);
      const size_t eq = var.find('=');
      if (eq == std::string::npos || var.compare(0U, pre.size(), pre) != 0) {
        continue;
      }
      const std::string name = var.substr(pre.size(), eq - pre.size());
      const size_t split = name.find('_');
      if (split == std::string::npos || split == 0U ||
          split + 1U >= name.size()) {
        continue;
      }
      std::string section = name.substr(0U, split);
      std::string key = name.substr(split + 1U);
      for (auto& c : section) c = detail::Lower(c);
      for (auto& c : key) c = detail::Lower(c);
      if (Set(section, key, var.substr(eq + 1U))) {
        ++applied;
      }
    }
    return applied;
  }

 protected:
  static expected<std::string, ConfigError> ReadFile(const std::string& path) {
    using R = expected<std::string, ConfigError>;
    FILE* f = std::fopen(path.c_str(), "rb");
    if (f == nullptr) return R::error(ConfigError::kFileNotFound);
    std::string data;
    char chunk[4096];
    size_t n = 0U;
    while ((n = std::fread(chunk, 1U, sizeof(chunk), f)) > 0U) {
      data.append(chunk, n);
    }
    const bool failed = std::ferror(f) != 0;
    (void)std::fclose(f);
    if (failed) return R::error(ConfigError::kParseError);
    return R::success(std::move(data));
  }

  const Entry* Lookup(const char* section, const char* key) const {
    CORRAL_ASSERT(section != nullptr && key != nullptr);
    for (const auto& e : entries_) {
      if (detail::CaseEqual(e.section, section) &&
          detail::CaseEqual(e.key, key)) {
        return &e;
      }
    }
    return nullptr;
  }

  std::vector<Entry> entries_;

  template <typename> friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/// Backends that were not compiled in.
template <typename Backend>
struct ConfigParser {
  static ConfigResult ParseFile(ConfigStore&, const std::string&) {
    return ConfigResult::error(ConfigError::kFormatNotSupported);
  }
  static ConfigResult ParseBuffer(ConfigStore&, const std::string&) {
    return ConfigResult::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef CORRAL_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static ConfigResult ParseFile(ConfigStore& store, const std::string& path) {
    Sink sink{&store, false};
    const int rc = ini_parse(path.c_str(), &Sink::OnValue, &sink);
    if (rc == -1) return ConfigResult::error(ConfigError::kFileNotFound);
    return Finish(sink, rc);
  }

  static ConfigResult ParseBuffer(ConfigStore& store, const std::string& text) {
    Sink sink{&store, false};
    return Finish(sink, ini_parse_string(text.c_str(), &Sink::OnValue, &sink));
  }

 private:
  struct Sink {
    ConfigStore* store;
    bool overflow;

    /// inih callback: nonzero to continue.
    static int OnValue(void* user, const char* section, const char* name,
                       const char* value) {
      auto* self = static_cast<Sink*>(user);
      if (!self->store->Set(section ? section : "", name ? name : "",
                            value ? value : "")) {
        self->overflow = true;
        return 0;
      }
      return 1;
    }
  };

  /// rc > 0 is the first bad line; an overflow aborts with the current line.
  static ConfigResult Finish(const Sink& sink, int rc) {
    if (sink.overflow) return ConfigResult::error(ConfigError::kBufferFull);
    if (rc != 0) return ConfigResult::error(ConfigError::kParseError);
    return ConfigResult::success();
  }
};
#endif

#ifdef CORRAL_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static ConfigResult ParseFile(ConfigStore& store, const std::string& path) {
    auto text = ConfigStore::ReadFile(path);
    if (!text.has_value()) return ConfigResult::error(text.get_error());
    return ParseBuffer(store, text.value());
  }

  static ConfigResult ParseBuffer(ConfigStore& store, const std::string& text) {
    const auto doc = nlohmann::json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
      return ConfigResult::error(ConfigError::kParseError);
    }
    for (auto it = doc.begin(); it != doc.end(); ++it) {
      const bool ok = it->is_object() ? Flatten(store, it.key(), "", *it)
                                      : store.Set("", it.key(), Scalar(*it));
      if (!ok) return ConfigResult::error(ConfigError::kBufferFull);
    }
    return ConfigResult::success();
  }

 private:
  static bool Flatten(ConfigStore& store, const std::string& section,
                      const std::string& path, const nlohmann::json& obj) {
    for (auto it = obj.begin(); it != obj.end(); ++it) {
      const std::string key = path.empty() ? it.key() : path + "." + it.key();
      const bool ok = it->is_object() ? Flatten(store, section, key, *it)
                                      : store.Set(section, key, Scalar(*it));
      if (!ok) return false;
    }
    return true;
  }

  static std::string Scalar(const nlohmann::json& n) {
    if (n.is_string()) return n.get<std::string>();
    if (n.is_null()) return std::string();
    if (n.is_array()) {
      std::string out;
      for (const auto& el : n) {
        if (!out.empty()) out.push_back(',');
        out += Scalar(el);
      }
      return out;
    }
    return n.dump();
  }
};
#endif

#ifdef CORRAL_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static ConfigResult ParseFile(ConfigStore& store, const std::string& path) {
    auto text = ConfigStore::ReadFile(path);
    if (!text.has_value()) return ConfigResult::error(text.get_error());
    return ParseBuffer(store, text.value());
  }

  static ConfigResult ParseBuffer(ConfigStore& store, const std::string& text) {
    fkyaml::node doc;
    try {
      doc = fkyaml::node::deserialize(text);
    } catch (const fkyaml::exception&) {
      return ConfigResult::error(ConfigError::kParseError);
    }
    if (!doc.is_mapping()) return ConfigResult::error(ConfigError::kParseError);
    for (auto it = doc.begin(); it != doc.end(); ++it) {
      const std::string name = it.key().get_value<std::string>();
      const bool ok = it->is_mapping() ? Flatten(store, name, "", *it)
                                       : store.Set("", name, Scalar(*it));
      if (!ok) return ConfigResult::error(ConfigError::kBufferFull);
    }
    return ConfigResult::success();
  }

 private:
  static bool Flatten(ConfigStore& store, const std::string& section,
                      const std::string& path, const fkyaml::node& map) {
    for (auto it = map.begin(); it != map.end(); ++it) {
      const std::string name = it.key().get_value<std::string>();
      const std::string key = path.empty() ? name : path + "." + name;
      const bool ok = it->is_mapping() ? Flatten(store, section, key, *it)
                                       : store.Set(section, key, Scalar(*it));
      if (!ok) return false;
    }
    return true;
  }

  static std::string Scalar(const fkyaml::node& n) {
    if (n.is_string()) return n.get_value<std::string>();
    if (n.is_boolean()) return n.get_value<bool>() ? "true" : "false";
    if (n.is_integer()) return std::to_string(n.get_value<int64_t>());
    if (n.is_float_number()) return std::to_string(n.get_value<double>());
    if (n.is_sequence()) {
      std::string out;
      for (const auto& el : n) {
        if (!out.empty()) out.push_back(',');
        out += Scalar(el);
      }
      return out;
    }
    return std::string();
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config needs at least one backend");

  using Primary = typename std::tuple_element<0, std::tuple<Backends...>>::type;

 public:
  /// kAuto picks the backend by file extension, else the first backend.
  ConfigResult LoadFile(const std::string& path,
                        ConfigFormat format = ConfigFormat::kAuto) {
    if (format == ConfigFormat::kAuto) {
      format = FormatFor<Backends...>(detail::Extension(path));
    }
    return Route<Backends...>(format, [this, &path](auto tag) {
      return ConfigParser<decltype(tag)>::ParseFile(*this, path);
    });
  }

  ConfigResult LoadBuffer(const std::string& text, ConfigFormat format) {
    if (format == ConfigFormat::kAuto) format = Primary::kFormat;
    return Route<Backends...>(format, [this, &text](auto tag) {
      return ConfigParser<decltype(tag)>::ParseBuffer(*this, text);
    });
  }

 private:
  template <typename First, typename... Rest, typename Fn>
  static ConfigResult Route(ConfigFormat format, Fn&& fn) {
    if (First::kFormat == format) return fn(First{});
    if constexpr (sizeof...(Rest) > 0) {
      return Route<Rest...>(format, std::forward<Fn>(fn));
    } else {
      return ConfigResult::error(ConfigError::kFormatNotSupported);
    }
  }

  template <typename First, typename... Rest>
  static ConfigFormat FormatFor(const std::string& ext) {
    if (!ext.empty() && First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) {
      return FormatFor<Rest...>(ext);
    } else {
      return Primary::kFormat;
    }
  }
};

#ifdef CORRAL_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef CORRAL_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef CORRAL_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

}  // namespace corral

#endif  // CORRAL_CONFIG_HPP_
