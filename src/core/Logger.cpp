#include "Logger.h"

#include <spdlog/sinks/rotating_file_sink.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <unistd.h>
#include <vector>

std::shared_ptr<spdlog::logger> Log::s_Logger;

void Log::init(const std::string &fallbackDir) {
  spdlog::set_pattern("%^[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v%$");

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

  std::filesystem::path primaryPath = "/var/log/seatview";
  std::filesystem::path logFile;

  std::error_code ec;
  if (std::filesystem::exists(primaryPath, ec) &&
      access(primaryPath.string().c_str(), W_OK) == 0) {
    logFile = primaryPath / "seatview.log";
  } else if (!fallbackDir.empty()) {
    std::filesystem::create_directories(fallbackDir, ec);
    logFile = std::filesystem::path(fallbackDir) / "seatview.log";
  }

  if (!logFile.empty()) {
    try {
      // 5MB per file, 3 rotated files max
      auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          logFile.string(), 5 * 1024 * 1024, 3);
      sinks.push_back(fileSink);
    } catch (const spdlog::spdlog_ex &ex) {
      std::fprintf(stderr, "Log file sink disabled (%s): %s\n",
                   logFile.string().c_str(), ex.what());
    }
  }

  s_Logger =
      std::make_shared<spdlog::logger>("SEATVIEW", sinks.begin(), sinks.end());
  s_Logger->set_level(spdlog::level::warn);
  spdlog::flush_on(spdlog::level::warn);

  LOG_D("Log", "Logger initialized with {} sinks", sinks.size());
}

void Log::setLevel(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lower == "trace") {
    setLevel(spdlog::level::trace);
  } else if (lower == "debug") {
    setLevel(spdlog::level::debug);
  } else if (lower == "info") {
    setLevel(spdlog::level::info);
  } else if (lower == "warn") {
    setLevel(spdlog::level::warn);
  } else if (lower == "error") {
    setLevel(spdlog::level::err);
  } else {
    std::fprintf(stderr, "Log: unknown level '%s', using warn\n", name.c_str());
    setLevel(spdlog::level::warn);
  }
}
