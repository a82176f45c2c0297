#pragma once
#include <array>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

// Synchronous leveled logger. The level comes from FMSIM_LOG_LEVEL
// (debug|info|warn|error); messages use "{}" placeholders. Instances are
// owned by the caller, there is no process-wide logger.
namespace fmsim::log {

enum class level { debug = 0, info = 1, warn = 2, error = 3 };

inline const char* level_name(level lv) {
  switch (lv) {
    case level::debug: return "debug";
    case level::info:  return "info";
    case level::warn:  return "warn";
    case level::error: return "error";
  }
  return "info";
}

// Case-insensitive; anything unknown is info.
inline level parse_level(std::string_view s) {
  std::string v;
  v.reserve(s.size());
  for (char c : s) v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (v == "debug") return level::debug;
  if (v == "warn" || v == "warning") return level::warn;
  if (v == "error" || v == "err") return level::error;
  return level::info;
}

namespace detail {

template <typename T>
inline std::string to_string_any(const T& v) {
  using D = std::decay_t<T>;
  if constexpr (std::is_same_v<D, std::string>) {
    return v;
  } else if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*>) {
    return v ? std::string(v) : std::string();
  } else if constexpr (std::is_convertible_v<T, std::string_view>) {
    return std::string(std::string_view(v));
  } else if constexpr (std::is_same_v<D, bool>) {
    return v ? "true" : "false";
  } else if constexpr (std::is_floating_point_v<D>) {
    std::ostringstream oss;
    oss.setf(std::ios::fixed, std::ios::floatfield);
    oss.precision(3);
    oss << v;
    return oss.str();
  } else if constexpr (std::is_arithmetic_v<D>) {
    return std::to_string(v);
  } else {
    std::ostringstream oss;
    oss << v;
    return oss.str();
  }
}

// Replaces each "{}" in order; extra arguments are appended space-separated.
template <typename... Args>
inline std::string tiny_format(std::string_view fmt, Args&&... args) {
  if constexpr (sizeof...(Args) == 0) {
    return std::string(fmt);
  } else {
    constexpr std::size_t N = sizeof...(Args);
    const std::array<std::string, N> values{to_string_any(std::forward<Args>(args))...};
    std::string out;
    out.reserve(fmt.size() + N * 8);
    std::size_t pos = 0;
    std::size_t idx = 0;
    while (idx < N) {
      const std::size_t p = fmt.find("{}", pos);
      if (p == std::string_view::npos) break;
      out.append(fmt.substr(pos, p - pos));
      out += values[idx++];
      pos = p + 2;
    }
    out.append(fmt.substr(pos));
    for (; idx < N; ++idx) {
      out.push_back(' ');
      out += values[idx];
    }
    return out;
  }
}

} // namespace detail

class Logger {
public:
  using Callback = std::function<void(level, const std::string&)>;

  // Reads FMSIM_LOG_LEVEL once; writes to std::cerr.
  Logger() : out_(&std::cerr) {
    if (const char* lvl = std::getenv("FMSIM_LOG_LEVEL")) level_ = parse_level(lvl);
  }
  Logger(std::ostream& out, level lv) : out_(&out), level_(lv) {}

  void set_level(level lv) noexcept { level_ = lv; }
  level current_level() const noexcept { return level_; }
  void set_stream(std::ostream* out) noexcept { out_ = out; }
  void set_callback(Callback cb) { cb_ = std::move(cb); }

  bool enabled(level lv) const noexcept { return static_cast<int>(lv) >= static_cast<int>(level_); }

  // One line: "[I HH:MM:SS] message".
  void write(level lv, std::string_view msg) {
    if (!enabled(lv)) return;
    const std::string m(msg);
    if (out_) {
      const std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
      std::tm tm{};
#if defined(_WIN32)
      localtime_s(&tm, &tt);
#else
      localtime_r(&tt, &tm);
#endif
      char buf[16];
      std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
      *out_ << '[' << tag(lv) << ' ' << buf << "] " << m << '\n';
    }
    if (cb_) cb_(lv, m);
  }

  template <typename... Args>
  void debug(std::string_view fmt, Args&&... args) { emit(level::debug, fmt, std::forward<Args>(args)...); }
  template <typename... Args>
  void info(std::string_view fmt, Args&&... args) { emit(level::info, fmt, std::forward<Args>(args)...); }
  template <typename... Args>
  void warn(std::string_view fmt, Args&&... args) { emit(level::warn, fmt, std::forward<Args>(args)...); }
  template <typename... Args>
  void error(std::string_view fmt, Args&&... args) { emit(level::error, fmt, std::forward<Args>(args)...); }

private:
  static char tag(level lv) {
    switch (lv) {
      case level::debug: return 'D';
      case level::info:  return 'I';
      case level::warn:  return 'W';
      case level::error: return 'E';
    }
    return 'I';
  }

  // Formats only when the level is enabled.
  template <typename... Args>
  void emit(level lv, std::string_view fmt, Args&&... args) {
    if (enabled(lv)) write(lv, detail::tiny_format(fmt, std::forward<Args>(args)...));
  }

  std::ostream* out_{nullptr};
  level level_{level::info};
  Callback cb_{};
};

} // namespace fmsim::log
