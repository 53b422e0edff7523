#pragma once

#include <algorithm>
#include <cstdint>
#include <format>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

#include <toml++/toml.h>

#include "core/Log.h"

namespace TomlUtil {

inline int& warningCounter() {
  static int counter = 0;
  return counter;
}

inline void resetWarningCount() {
  warningCounter() = 0;
}

inline int warningCount() {
  return warningCounter();
}

template <typename... Args>
inline void warnf(const char* path, std::format_string<Args...> fmt, Args&&... args) {
  ++warningCounter();
  Log::warnf((path != nullptr) ? path : "<toml>", fmt, std::forward<Args>(args)...);
}

inline void reportParseError(const char* path, const toml::parse_error& err) {
  const auto& src = err.source();
  Log::errorf((path != nullptr) ? path : "<toml>", "{}:{}: {}", src.begin.line, src.begin.column,
              err.description());
}

inline bool allowedKey(std::string_view key, std::initializer_list<std::string_view> allowed) {
  return std::ranges::any_of(allowed, [key](std::string_view a) { return key == a; });
}

inline void warnUnknownKeys(const toml::table& tbl,
                            const char* path,
                            std::string_view scope,
                            std::initializer_list<std::string_view> allowed) {
  for (const auto& [key, node] : tbl) {
    (void)node;
    std::string_view k = key.str();
    if (allowedKey(k, allowed)) {
      continue;
    }
    warnf(path, "unknown key '{}' in {}", k, scope);
  }
}

// Reads a float field; warns when present with the wrong type, leaves `out` untouched.
inline void readFloat(const toml::table& tbl,
                      const char* path,
                      std::string_view scope,
                      std::string_view key,
                      float& out) {
  const toml::node* node = tbl.get(key);
  if (node == nullptr) {
    return;
  }
  if (auto v = node->value<double>()) {
    out = static_cast<float>(*v);
    return;
  }
  warnf(path, "{}.{} must be a number", scope, key);
}

inline void readInt(const toml::table& tbl,
                    const char* path,
                    std::string_view scope,
                    std::string_view key,
                    int& out) {
  const toml::node* node = tbl.get(key);
  if (node == nullptr) {
    return;
  }
  if (auto v = node->value<int64_t>()) {
    out = static_cast<int>(*v);
    return;
  }
  warnf(path, "{}.{} must be an integer", scope, key);
}

inline void readMask(const toml::table& tbl,
                     const char* path,
                     std::string_view scope,
                     std::string_view key,
                     std::uint32_t& out) {
  const toml::node* node = tbl.get(key);
  if (node == nullptr) {
    return;
  }
  auto v = node->value<int64_t>();
  if (!v || *v < 0 || *v > 0xFFFFFFFFLL) {
    warnf(path, "{}.{} must be an integer in [0, 0xFFFFFFFF]", scope, key);
    return;
  }
  out = static_cast<std::uint32_t>(*v);
}

inline void readBool(const toml::table& tbl,
                     const char* path,
                     std::string_view scope,
                     std::string_view key,
                     bool& out) {
  const toml::node* node = tbl.get(key);
  if (node == nullptr) {
    return;
  }
  if (auto v = node->value<bool>()) {
    out = *v;
    return;
  }
  warnf(path, "{}.{} must be a boolean", scope, key);
}

inline void readString(const toml::table& tbl,
                       const char* path,
                       std::string_view scope,
                       std::string_view key,
                       std::string& out) {
  const toml::node* node = tbl.get(key);
  if (node == nullptr) {
    return;
  }
  if (auto v = node->value<std::string>()) {
    out = *v;
    return;
  }
  warnf(path, "{}.{} must be a string", scope, key);
}

}  // namespace TomlUtil
