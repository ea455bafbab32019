#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace clawlink {

constexpr const char *kLoggerName = "clawlink";

/// Shared logger for every clawlink component. A host application may
/// register its own spdlog logger named "clawlink" before first use.
inline std::shared_ptr<spdlog::logger> logger() {
  static std::shared_ptr<spdlog::logger> instance = [] {
    if (auto existing = spdlog::get(kLoggerName))
      return existing;
    auto created = spdlog::stderr_color_mt(kLoggerName);
    created->set_level(spdlog::level::info);
    return created;
  }();
  return instance;
}

inline void set_log_level(spdlog::level::level_enum level) {
  logger()->set_level(level);
}

/// Clip untrusted frame text before it reaches a log line.
inline std::string clip(std::string_view text, size_t limit = 200) {
  if (text.size() <= limit)
    return std::string(text);
  return std::string(text.substr(0, limit)) + "...";
}

} // namespace clawlink
