#pragma once

#include <fmt/format.h>
#include <memory>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>

class Log {
public:
  // Console sink always; rotating file sink under /var/log/seatview when
  // writable, otherwise under fallbackDir (skipped if empty).
  static void init(const std::string &fallbackDir = "");

  static void setLevel(spdlog::level::level_enum level) {
    if (s_Logger) {
      s_Logger->set_level(level);
    }
  }

  // Accepts "trace", "debug", "info", "warn", "error" (any case). Unknown
  // names fall back to warn.
  static void setLevel(const std::string &name);

  // Categorized logging. Runtime format strings, and a no-op when init() has
  // not run (library code and unit tests log through these).
  template <typename... Args>
  static void d(const std::string &cat, const std::string &f, Args &&...args) {
    write(spdlog::level::debug, cat, f, args...);
  }
  template <typename... Args>
  static void i(const std::string &cat, const std::string &f, Args &&...args) {
    write(spdlog::level::info, cat, f, args...);
  }
  template <typename... Args>
  static void w(const std::string &cat, const std::string &f, Args &&...args) {
    write(spdlog::level::warn, cat, f, args...);
  }
  template <typename... Args>
  static void e(const std::string &cat, const std::string &f, Args &&...args) {
    write(spdlog::level::err, cat, f, args...);
  }

#define LOG_D(cat, f, ...) ::Log::d(cat, f, ##__VA_ARGS__)
#define LOG_I(cat, f, ...) ::Log::i(cat, f, ##__VA_ARGS__)
#define LOG_W(cat, f, ...) ::Log::w(cat, f, ##__VA_ARGS__)
#define LOG_E(cat, f, ...) ::Log::e(cat, f, ##__VA_ARGS__)

private:
  template <typename... Args>
  static void write(spdlog::level::level_enum lvl, const std::string &cat,
                    const std::string &f, Args &...args) {
    if (s_Logger && s_Logger->should_log(lvl)) {
      s_Logger->log(lvl, "[{}] {}", cat,
                    fmt::vformat(f, fmt::make_format_args(args...)));
    }
  }

  static std::shared_ptr<spdlog::logger> s_Logger;
};
