#pragma once

#include <cstdio>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace Log {

inline int& warningCounter() {
  static int counter = 0;
  return counter;
}

inline int& errorCounter() {
  static int counter = 0;
  return counter;
}

inline void resetCounts() {
  warningCounter() = 0;
  errorCounter() = 0;
}

inline int warningCount() {
  return warningCounter();
}

inline int errorCount() {
  return errorCounter();
}

// One line per message: "<scope>: <level>: <message>".
inline void writeLine(std::string_view scope, std::string_view level, std::string_view message) {
  std::fprintf(stderr, "%.*s: %.*s: %.*s\n", static_cast<int>(scope.size()), scope.data(),
               static_cast<int>(level.size()), level.data(), static_cast<int>(message.size()),
               message.data());
}

inline std::string_view scopeOrDefault(const char* scope) {
  return (scope != nullptr) ? std::string_view{scope} : std::string_view{"platcore"};
}

template <typename... Args>
inline void infof(const char* scope, std::format_string<Args...> fmt, Args&&... args) {
  const std::string message = std::format(fmt, std::forward<Args>(args)...);
  writeLine(scopeOrDefault(scope), "info", message);
}

template <typename... Args>
inline void warnf(const char* scope, std::format_string<Args...> fmt, Args&&... args) {
  ++warningCounter();
  const std::string message = std::format(fmt, std::forward<Args>(args)...);
  writeLine(scopeOrDefault(scope), "warning", message);
}

template <typename... Args>
inline void errorf(const char* scope, std::format_string<Args...> fmt, Args&&... args) {
  ++errorCounter();
  const std::string message = std::format(fmt, std::forward<Args>(args)...);
  writeLine(scopeOrDefault(scope), "error", message);
}

}  // namespace Log
