/**
 * @file config.hpp
 * @brief Worker configuration store with template-based format backends.
 *
 * A worker file is a set of sections ([worker] [pool] [dispatcher]
 * [limits] [log]) whose values are scalars. Every backend flattens its
 * document into ConfigStore as "section.key = text"; typing happens on
 * read (counts, durations, byte sizes), so a value means the same thing
 * whether it came from INI, JSON, YAML or the environment.
 *
 *   - Tag dispatch: IniBackend / JsonBackend / YamlBackend
 *   - ConfigParser<Backend>: one specialization per compiled-in format
 *   - Config<Backends...>: picks the parser from the file extension
 *
 * Keys outside any section (INI lines before the first header, top-level
 * scalars in JSON/YAML) belong to [worker]. Nested objects and arrays
 * inside a section are rejected.
 *
 * Backends (CMake opt-in):
 *   - IniBackend  : inih           (HIVE_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json  (HIVE_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML         (HIVE_CONFIG_YAML_ENABLED)
 *
 * @code
 *   hive::MultiConfig cfg;
 *   if (!cfg.LoadFile("worker.yaml")) { ... }
 *   auto hard = cfg.GetDurationMs("limits", "time_limit", 0);
 * @endcode
 */

#ifndef HIVE_CONFIG_HPP_
#define HIVE_CONFIG_HPP_

#include "hive/log.hpp"
#include "hive/platform.hpp"
#include "hive/vocabulary.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <map>
#include <string>
#include <tuple>
#include <utility>

#ifdef HIVE_CONFIG_INI_ENABLED
#include "ini.h"
#endif

#ifdef HIVE_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef HIVE_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

#ifndef HIVE_CONFIG_MAX_FILE_SIZE
#define HIVE_CONFIG_MAX_FILE_SIZE (64U * 1024U)
#endif

namespace hive {

enum class ConfigFormat : uint8_t { kAuto = 0, kIni, kJson, kYaml };

/// Section for keys that appear outside any section.
static constexpr const char* kDefaultConfigSection = "worker";

namespace detail {

inline bool StrCaseEqual(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    if (std::tolower(static_cast<unsigned char>(*a)) !=
        std::tolower(static_cast<unsigned char>(*b))) {
      return false;
    }
    ++a;
    ++b;
  }
  return *a == *b;
}

inline const char* SkipSpace(const char* p) noexcept {
  while (*p != '\0' && std::isspace(static_cast<unsigned char>(*p))) ++p;
  return p;
}

/// Leading number of @p str; @p unit is left at the first non-space after it.
inline bool SplitNumber(const char* str, double* num, const char** unit) noexcept {
  if (str == nullptr) return false;
  const char* p = SkipSpace(str);
  char* end = nullptr;
  *num = std::strtod(p, &end);
  if (end == p || *num < 0.0 || !std::isfinite(*num)) return false;
  *unit = SkipSpace(end);
  return true;
}

}  // namespace detail

// ============================================================================
// Durations and byte sizes
// ============================================================================

/**
 * @brief Parse a duration into milliseconds.
 *
 * Accepts "250ms", "30s", "1.5s", "5m", "1h", "2d"; a bare number is
 * seconds ("30" == 30s). Whitespace between number and unit is allowed.
 * @return false on malformed input or a negative value.
 */
inline bool ParseDurationMs(const char* str, uint64_t* out) noexcept {
  double num = 0.0;
  const char* unit = nullptr;
  if (out == nullptr || !detail::SplitNumber(str, &num, &unit)) return false;

  struct Unit {
    const char* name;
    double ms;
  };
  static constexpr Unit kUnits[] = {
      {"", 1000.0},        {"s", 1000.0},       {"ms", 1.0},
      {"m", 60000.0},      {"min", 60000.0},    {"h", 3600000.0},
      {"d", 86400000.0},
  };
  for (const auto& u : kUnits) {
    if (!detail::StrCaseEqual(unit, u.name)) continue;
    const double ms = num * u.ms;
    if (ms >= 9.0e18) return false;
    *out = static_cast<uint64_t>(std::llround(ms));
    return true;
  }
  return false;
}

/**
 * @brief Parse a byte size: "512", "64KB", "200MB", "2GB", "1GiB".
 *
 * Decimal and binary suffixes are both powers of 1024, the way child
 * memory limits are usually written.
 */
inline bool ParseByteSize(const char* str, uint64_t* out) noexcept {
  double num = 0.0;
  const char* unit = nullptr;
  if (out == nullptr || !detail::SplitNumber(str, &num, &unit)) return false;

  struct Suffix {
    const char* name;
    uint64_t mult;
  };
  static constexpr Suffix kSuffixes[] = {
      {"", 1ULL},          {"b", 1ULL},
      {"k", 1ULL << 10},   {"kb", 1ULL << 10}, {"kib", 1ULL << 10},
      {"m", 1ULL << 20},   {"mb", 1ULL << 20}, {"mib", 1ULL << 20},
      {"g", 1ULL << 30},   {"gb", 1ULL << 30}, {"gib", 1ULL << 30},
  };
  for (const auto& s : kSuffixes) {
    if (!detail::StrCaseEqual(unit, s.name)) continue;
    const double bytes = num * static_cast<double>(s.mult);
    if (bytes >= 18446744073709551616.0) return false;
    *out = static_cast<uint64_t>(bytes);
    return true;
  }
  return false;
}

// ============================================================================
// Backend tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "ini") ||
           detail::StrCaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "yaml") ||
           detail::StrCaseEqual(ext, "yml");
  }
};

/// @brief One (section, key) pair of a known option schema.
struct ConfigKey {
  const char* section;
  const char* key;
};

// ============================================================================
// ConfigStore
// ============================================================================

/**
 * @brief Case-insensitive "section.key = text" map. Later writes win, so
 *        loading a file and then ApplyEnvironment() layers the two.
 */
class ConfigStore {
 public:
  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const std::string* v = Find(section, key);
    return (v != nullptr) ? v->c_str() : default_val;
  }

  /// @brief Non-negative integer; absent key yields @p default_val.
  expected<uint64_t, ConfigError> GetUint64(const char* section,
                                            const char* key,
                                            uint64_t default_val) const {
    using R = expected<uint64_t, ConfigError>;
    const std::string* v = Find(section, key);
    if (v == nullptr || v->empty()) return R::success(default_val);
    const char* text = detail::SkipSpace(v->c_str());
    char* end = nullptr;
    errno = 0;
    const unsigned long long n = std::strtoull(text, &end, 10);
    if (end == text || *detail::SkipSpace(end) != '\0' || text[0] == '-' ||
        errno == ERANGE) {
      return R::error(ConfigError::kInvalidValue);
    }
    return R::success(static_cast<uint64_t>(n));
  }

  /// @brief Duration in ms; absent key yields @p default_ms, bad text an error.
  expected<uint64_t, ConfigError> GetDurationMs(const char* section,
                                                const char* key,
                                                uint64_t default_ms) const {
    using R = expected<uint64_t, ConfigError>;
    const std::string* v = Find(section, key);
    if (v == nullptr || v->empty()) return R::success(default_ms);
    uint64_t ms = 0;
    if (!ParseDurationMs(v->c_str(), &ms)) {
      return R::error(ConfigError::kInvalidValue);
    }
    return R::success(ms);
  }

  /// @brief Byte size; absent key yields @p default_bytes, bad text an error.
  expected<uint64_t, ConfigError> GetBytes(const char* section,
                                           const char* key,
                                           uint64_t default_bytes) const {
    using R = expected<uint64_t, ConfigError>;
    const std::string* v = Find(section, key);
    if (v == nullptr || v->empty()) return R::success(default_bytes);
    uint64_t bytes = 0;
    if (!ParseByteSize(v->c_str(), &bytes)) {
      return R::error(ConfigError::kInvalidValue);
    }
    return R::success(bytes);
  }

  bool HasKey(const char* section, const char* key) const {
    return Find(section, key) != nullptr;
  }

  size_t EntryCount() const noexcept { return values_.size(); }

  /// @brief Insert or overwrite. False for an empty section or key.
  bool Set(const char* section, const char* key, const char* value) {
    HIVE_ASSERT(section != nullptr && key != nullptr);
    if (section[0] == '\0' || key[0] == '\0') return false;
    values_[MakeKey(section, key)] = (value != nullptr) ? value : "";
    return true;
  }

  /**
   * @brief Overlay values from the environment.
   *
   * For every (section, key) in @p keys, <PREFIX>_<SECTION>_<KEY>
   * (upper-cased) replaces the stored value when set. Prefix "HIVE" and
   * {"pool", "concurrency"} read HIVE_POOL_CONCURRENCY.
   *
   * @return Number of values taken from the environment.
   */
  expected<uint32_t, ConfigError> ApplyEnvironment(const char* prefix,
                                                   const ConfigKey* keys,
                                                   uint32_t key_count) {
    uint32_t applied = 0;
    for (uint32_t i = 0; i < key_count; ++i) {
      std::string name = std::string(prefix) + "_" + keys[i].section + "_" +
                         keys[i].key;
      for (char& c : name) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
      }
      const char* val = std::getenv(name.c_str());
      if (val == nullptr) continue;
      HIVE_LOG_DEBUG("Config", "[%s] %s from %s", keys[i].section, keys[i].key,
                     name.c_str());
      (void)Set(keys[i].section, keys[i].key, val);
      ++applied;
    }
    return expected<uint32_t, ConfigError>::success(applied);
  }

  /// @brief Set() for parsers: sectionless keys land in [worker].
  bool StoreScalar(const char* section, const char* key, const char* value) {
    return Set((section == nullptr || section[0] == '\0') ? kDefaultConfigSection
                                                          : section,
               key, value);
  }

  /// @brief Visit every entry as (section, key, value), in key order.
  template <typename Fn>
  void ForEach(Fn&& fn) const {
    for (const auto& kv : values_) {
      const size_t dot = kv.first.find('.');
      fn(kv.first.substr(0, dot), kv.first.substr(dot + 1U), kv.second);
    }
  }

 protected:
  static expected<std::string, ConfigError> ReadFile(const char* path) {
    using R = expected<std::string, ConfigError>;
    FILE* f = std::fopen(path, "rb");
    if (f == nullptr) return R::error(ConfigError::kFileNotFound);
    std::string data;
    char chunk[4096];
    size_t n = 0;
    while ((n = std::fread(chunk, 1, sizeof(chunk), f)) > 0U) {
      data.append(chunk, n);
      if (data.size() > HIVE_CONFIG_MAX_FILE_SIZE) {
        std::fclose(f);
        return R::error(ConfigError::kBufferFull);
      }
    }
    std::fclose(f);
    return R::success(std::move(data));
  }

  static const char* GetExtension(const char* path) noexcept {
    const char* dot = nullptr;
    for (const char* p = path; *p != '\0'; ++p) {
      if (*p == '.') dot = p;
      if (*p == '/') dot = nullptr;
    }
    return (dot != nullptr) ? dot + 1 : nullptr;
  }

 private:
  static std::string MakeKey(const char* section, const char* key) {
    std::string k = std::string(section) + "." + key;
    for (char& c : k) {
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return k;
  }

  const std::string* Find(const char* section, const char* key) const {
    HIVE_ASSERT(section != nullptr && key != nullptr);
    auto it = values_.find(MakeKey(section, key));
    return (it != values_.end()) ? &it->second : nullptr;
  }

  std::map<std::string, std::string> values_;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Default: format not compiled in. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const char*,
                                                 uint32_t) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef HIVE_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data, uint32_t size) {
    const std::string text(data, size);
    const int line = ini_parse_string(text.c_str(), Handler, &store);
    if (line != 0) {
      HIVE_LOG_ERROR("Config", "INI syntax error at line %d", line);
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    return static_cast<ConfigStore*>(user)->StoreScalar(section, name, value)
               ? 1
               : 0;
  }
};
#endif

/**
 * Shared walk for tree formats: the root must be a mapping whose values are
 * either scalars ([worker] keys) or mappings of scalars (one section each).
 * Traits supplies IsMapping / Scalar(node, std::string*) / Items(node, fn).
 */
template <typename Traits, typename Node>
expected<void, ConfigError> FlattenSections(ConfigStore& store, const Node& root) {
  using R = expected<void, ConfigError>;
  if (!Traits::IsMapping(root)) {
    HIVE_LOG_ERROR("Config", "top level must be a mapping of sections");
    return R::error(ConfigError::kParseError);
  }
  bool ok = true;
  Traits::Items(root, [&](const std::string& name, const Node& node) {
    std::string text;
    if (Traits::Scalar(node, &text)) {
      ok = ok && store.StoreScalar("", name.c_str(), text.c_str());
      return;
    }
    if (!Traits::IsMapping(node)) {
      HIVE_LOG_ERROR("Config", "%s: expected a section or a scalar", name.c_str());
      ok = false;
      return;
    }
    Traits::Items(node, [&](const std::string& key, const Node& value) {
      std::string v;
      if (!Traits::Scalar(value, &v)) {
        HIVE_LOG_ERROR("Config", "[%s] %s: expected a scalar", name.c_str(),
                       key.c_str());
        ok = false;
        return;
      }
      ok = ok && store.StoreScalar(name.c_str(), key.c_str(), v.c_str());
    });
  });
  return ok ? R::success() : R::error(ConfigError::kInvalidValue);
}

#ifdef HIVE_CONFIG_JSON_ENABLED
struct JsonTraits {
  static bool IsMapping(const nlohmann::json& n) { return n.is_object(); }

  template <typename Fn>
  static void Items(const nlohmann::json& n, Fn&& fn) {
    for (auto it = n.begin(); it != n.end(); ++it) fn(it.key(), it.value());
  }

  static bool Scalar(const nlohmann::json& n, std::string* out) {
    if (n.is_string()) {
      *out = n.get<std::string>();
    } else if (n.is_boolean()) {
      *out = n.get<bool>() ? "true" : "false";
    } else if (n.is_number_unsigned()) {
      *out = std::to_string(n.get<uint64_t>());
    } else if (n.is_number_integer()) {
      *out = std::to_string(n.get<int64_t>());
    } else if (n.is_number_float()) {
      *out = n.dump();
    } else if (n.is_null()) {
      out->clear();
    } else {
      return false;
    }
    return true;
  }
};

template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data, uint32_t size) {
    auto root = nlohmann::json::parse(data, data + size, nullptr, false);
    if (root.is_discarded()) {
      HIVE_LOG_ERROR("Config", "malformed JSON");
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return FlattenSections<JsonTraits>(store, root);
  }
};
#endif

#ifdef HIVE_CONFIG_YAML_ENABLED
struct YamlTraits {
  static bool IsMapping(const fkyaml::node& n) { return n.is_mapping(); }

  template <typename Fn>
  static void Items(const fkyaml::node& n, Fn&& fn) {
    for (auto it = n.begin(); it != n.end(); ++it) {
      fn(it.key().get_value<std::string>(), *it);
    }
  }

  static bool Scalar(const fkyaml::node& n, std::string* out) {
    if (n.is_string()) {
      *out = n.get_value<std::string>();
    } else if (n.is_boolean()) {
      *out = n.get_value<bool>() ? "true" : "false";
    } else if (n.is_integer()) {
      *out = std::to_string(n.get_value<int64_t>());
    } else if (n.is_float_number()) {
      *out = std::to_string(n.get_value<double>());
    } else if (n.is_null()) {
      out->clear();
    } else {
      return false;
    }
    return true;
  }
};

template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data, uint32_t size) {
    fkyaml::node root;
    try {
      root = fkyaml::node::deserialize(std::string(data, size));
    } catch (const fkyaml::exception& e) {
      HIVE_LOG_ERROR("Config", "malformed YAML: %s", e.what());
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return FlattenSections<YamlTraits>(store, root);
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  /// @brief Load @p path; kAuto picks the backend from the extension.
  expected<void, ConfigError> LoadFile(const char* path,
                                       ConfigFormat format = ConfigFormat::kAuto) {
    HIVE_ASSERT(path != nullptr);
    auto data = ReadFile(path);
    if (!data) {
      HIVE_LOG_ERROR("Config", "%s: %s", path, ConfigErrorName(data.get_error()));
      return expected<void, ConfigError>::error(data.get_error());
    }
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    const std::string& text = data.value();
    auto r = LoadBuffer(text.data(), static_cast<uint32_t>(text.size()), format);
    if (r) HIVE_LOG_INFO("Config", "loaded %s", path);
    return r;
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size,
                                         ConfigFormat format) {
    HIVE_ASSERT(data != nullptr);
    return Dispatch<Backends...>(data, size, format);
  }

 private:
  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;

  template <typename First, typename... Rest>
  expected<void, ConfigError> Dispatch(const char* data, uint32_t size,
                                       ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseBuffer(*this, data, size);
    }
    if constexpr (sizeof...(Rest) > 0) return Dispatch<Rest...>(data, size, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const char* path) const noexcept {
    const char* ext = GetExtension(path);
    return (ext == nullptr) ? Head::kFormat : DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const char* ext) const noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return DetectExt<Rest...>(ext);
    return Head::kFormat;
  }
};

// ============================================================================
// Aliases
// ============================================================================

#ifdef HIVE_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef HIVE_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef HIVE_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

/// Every format compiled in; JSON is always present and is the fallback.
using MultiConfig = Config<JsonBackend
#ifdef HIVE_CONFIG_INI_ENABLED
                           , IniBackend
#endif
#ifdef HIVE_CONFIG_YAML_ENABLED
                           , YamlBackend
#endif
                           >;

}  // namespace hive

#endif  // HIVE_CONFIG_HPP_
