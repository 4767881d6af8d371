#pragma once

#include "Constants.h"

#include <cstddef>
#include <filesystem>
#include <string>

struct AppConfig {
  // Render backend
  std::string renderEndpoint;  // POST target; empty = rendering disabled
  std::string renderToken;     // bearer token, SEATVIEW_RENDER_TOKEN overrides
  int renderTimeoutMs = SeatView::DEFAULT_RENDER_TIMEOUT_MS;
  int renderRetries = SeatView::DEFAULT_RENDER_RETRIES;     // extra attempts
  int renderBackoffMs = SeatView::DEFAULT_RENDER_BACKOFF_MS; // doubles per retry

  // Render cache
  std::size_t cacheMaxBytes = SeatView::DEFAULT_CACHE_MAX_BYTES;
  std::size_t cacheMaxEntries = SeatView::DEFAULT_CACHE_MAX_ENTRIES;
  int cacheTtlS = SeatView::DEFAULT_CACHE_TTL_S;
  int renderWorkers = SeatView::DEFAULT_RENDER_WORKERS;

  // Mapping
  double fovMinDeg = SeatView::DEFAULT_FOV_MIN_DEG;
  double fovMaxDeg = SeatView::DEFAULT_FOV_MAX_DEG;

  // Fingerprint grid
  double positionPrecisionM = SeatView::DEFAULT_POSITION_PRECISION_M;
  double fovPrecisionDeg = SeatView::DEFAULT_FOV_PRECISION_DEG;

  // Venues ("" = <config dir>/venues)
  std::string venuesDir;

  std::string logLevel = "warn";
};

class ConfigManager {
public:
  // Resolves the config directory and file path. With an explicit file the
  // directory is its parent; otherwise $XDG_CONFIG_HOME/seatview or
  // ~/.config/seatview. Returns false if no path could be determined.
  bool init(const std::filesystem::path &explicitFile = {});

  // Load config from disk. Returns false if the file is missing or invalid;
  // config keeps its defaults for anything not read.
  bool load(AppConfig &config) const;

  // Save config to disk. Creates directories if needed. Returns false on
  // failure.
  bool save(const AppConfig &config) const;

  const std::filesystem::path &configPath() const { return configPath_; }
  const std::filesystem::path &configDir() const { return configDir_; }

  // venuesDir from config, or <configDir>/venues when unset.
  std::filesystem::path venuesDir(const AppConfig &config) const;

private:
  std::filesystem::path configDir_;
  std::filesystem::path configPath_;
};
