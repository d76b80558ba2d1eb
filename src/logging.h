#pragma once
#include <spdlog/spdlog.h>
#include <sstream>
#include <string>

struct LogHelper {
  spdlog::level::level_enum level;
  const char* tag;
  std::ostringstream ss;
  LogHelper(spdlog::level::level_enum lvl, const char* t) : level(lvl), tag(t) {}
  ~LogHelper() { spdlog::log(level, "{} {}", tag, ss.str()); }
  template <typename T> LogHelper& operator<<(const T& v) {
    ss << v;
    return *this;
  }
  LogHelper& operator<<(std::ostream& (*pf)(std::ostream&)) {
    pf(ss);
    return *this;
  }
};
#define LOG_T(tag) LogHelper(spdlog::level::trace, tag)
#define LOG_D(tag) LogHelper(spdlog::level::debug, tag)
#define LOG_I(tag) LogHelper(spdlog::level::info, tag)
#define LOG_W(tag) LogHelper(spdlog::level::warn, tag)
#define LOG_E(tag) LogHelper(spdlog::level::err, tag)

// Applies the level (trace|debug|info|warn|error|off, unknown names fall back
// to info) and stamps every line with the local node id.
inline void initLogging(const std::string& levelName, const std::string& nodeId) {
  auto lvl = spdlog::level::from_str(levelName);
  if (lvl == spdlog::level::off && levelName != "off")
    lvl = spdlog::level::info;
  spdlog::set_level(lvl);
  spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] [" + nodeId + "] %v");
}
