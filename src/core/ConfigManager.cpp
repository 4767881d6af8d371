#include "ConfigManager.h"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <cstdlib>
#include <fstream>

static void sanitize(AppConfig &config) {
  if (config.renderTimeoutMs <= 0) {
    std::fprintf(stderr, "ConfigManager: render timeout_ms must be > 0\n");
    config.renderTimeoutMs = SeatView::DEFAULT_RENDER_TIMEOUT_MS;
  }
  if (config.renderRetries < 0)
    config.renderRetries = 0;
  if (config.renderBackoffMs < 0)
    config.renderBackoffMs = 0;
  if (config.renderWorkers <= 0)
    config.renderWorkers = SeatView::DEFAULT_RENDER_WORKERS;
  if (config.cacheTtlS < 0)
    config.cacheTtlS = 0;
  if (config.fovMinDeg <= 0.0 || config.fovMaxDeg >= 180.0 ||
      config.fovMinDeg > config.fovMaxDeg) {
    std::fprintf(stderr, "ConfigManager: invalid fov range [%.1f, %.1f], "
                         "using defaults\n",
                 config.fovMinDeg, config.fovMaxDeg);
    config.fovMinDeg = SeatView::DEFAULT_FOV_MIN_DEG;
    config.fovMaxDeg = SeatView::DEFAULT_FOV_MAX_DEG;
  }
  if (config.positionPrecisionM <= 0.0)
    config.positionPrecisionM = SeatView::DEFAULT_POSITION_PRECISION_M;
  if (config.fovPrecisionDeg <= 0.0)
    config.fovPrecisionDeg = SeatView::DEFAULT_FOV_PRECISION_DEG;
}

bool ConfigManager::init(const std::filesystem::path &explicitFile) {
  if (!explicitFile.empty()) {
    configPath_ = explicitFile;
    configDir_ = explicitFile.has_parent_path() ? explicitFile.parent_path()
                                                : std::filesystem::path(".");
    return true;
  }

  const char *xdg = std::getenv("XDG_CONFIG_HOME");
  const char *home = std::getenv("HOME");
  if (xdg && *xdg) {
    configDir_ = std::filesystem::path(xdg) / "seatview";
  } else if (home && *home) {
    configDir_ = std::filesystem::path(home) / ".config" / "seatview";
  } else {
    std::fprintf(stderr, "ConfigManager: neither XDG_CONFIG_HOME nor HOME set\n");
    return false;
  }

  configPath_ = configDir_ / "config.json";
  return true;
}

bool ConfigManager::load(AppConfig &config) const {
  if (configPath_.empty())
    return false;

  std::ifstream ifs(configPath_);
  if (!ifs)
    return false;

  auto json = nlohmann::json::parse(ifs, nullptr, false);
  if (json.is_discarded() || !json.is_object()) {
    std::fprintf(stderr, "ConfigManager: invalid JSON in %s\n",
                 configPath_.c_str());
    return false;
  }

  try {
    if (json.contains("render")) {
      auto &r = json["render"];
      config.renderEndpoint = r.value("endpoint", config.renderEndpoint);
      config.renderToken = r.value("token", config.renderToken);
      config.renderTimeoutMs = r.value("timeout_ms", config.renderTimeoutMs);
      config.renderRetries = r.value("retries", config.renderRetries);
      config.renderBackoffMs = r.value("backoff_ms", config.renderBackoffMs);
      config.renderWorkers = r.value("workers", config.renderWorkers);
    }

    if (json.contains("cache")) {
      auto &c = json["cache"];
      config.cacheMaxBytes = c.value("max_bytes", config.cacheMaxBytes);
      config.cacheMaxEntries = c.value("max_entries", config.cacheMaxEntries);
      config.cacheTtlS = c.value("ttl_s", config.cacheTtlS);
    }

    if (json.contains("mapping")) {
      auto &m = json["mapping"];
      config.fovMinDeg = m.value("fov_min_deg", config.fovMinDeg);
      config.fovMaxDeg = m.value("fov_max_deg", config.fovMaxDeg);
    }

    if (json.contains("fingerprint")) {
      auto &f = json["fingerprint"];
      config.positionPrecisionM =
          f.value("position_precision_m", config.positionPrecisionM);
      config.fovPrecisionDeg = f.value("fov_precision_deg", config.fovPrecisionDeg);
    }

    if (json.contains("venues")) {
      config.venuesDir = json["venues"].value("dir", config.venuesDir);
    }

    config.logLevel = json.value("log_level", config.logLevel);
  } catch (const nlohmann::json::exception &ex) {
    std::fprintf(stderr, "ConfigManager: bad value in %s: %s\n",
                 configPath_.c_str(), ex.what());
    return false;
  }

  if (const char *token = std::getenv("SEATVIEW_RENDER_TOKEN")) {
    config.renderToken = token;
  }

  sanitize(config);
  return true;
}

bool ConfigManager::save(const AppConfig &config) const {
  if (configPath_.empty())
    return false;

  std::error_code ec;
  std::filesystem::create_directories(configDir_, ec);
  if (ec) {
    std::fprintf(stderr, "ConfigManager: failed to create dir %s: %s\n",
                 configDir_.c_str(), ec.message().c_str());
    return false;
  }

  nlohmann::json json;
  json["render"] = {
      {"endpoint", config.renderEndpoint},
      {"timeout_ms", config.renderTimeoutMs},
      {"retries", config.renderRetries},
      {"backoff_ms", config.renderBackoffMs},
      {"workers", config.renderWorkers},
  };
  // Token is not persisted; it comes from SEATVIEW_RENDER_TOKEN or by hand.
  json["cache"] = {
      {"max_bytes", config.cacheMaxBytes},
      {"max_entries", config.cacheMaxEntries},
      {"ttl_s", config.cacheTtlS},
  };
  json["mapping"] = {
      {"fov_min_deg", config.fovMinDeg},
      {"fov_max_deg", config.fovMaxDeg},
  };
  json["fingerprint"] = {
      {"position_precision_m", config.positionPrecisionM},
      {"fov_precision_deg", config.fovPrecisionDeg},
  };
  json["venues"] = {{"dir", config.venuesDir}};
  json["log_level"] = config.logLevel;

  // Write to a temp file then rename over the old config
  std::filesystem::path tmp = configPath_;
  tmp += ".tmp";
  {
    std::ofstream ofs(tmp);
    if (!ofs) {
      std::fprintf(stderr, "ConfigManager: cannot write %s\n", tmp.c_str());
      return false;
    }
    ofs << json.dump(2) << "\n";
    if (!ofs) {
      std::fprintf(stderr, "ConfigManager: short write to %s\n", tmp.c_str());
      return false;
    }
  }

  std::filesystem::rename(tmp, configPath_, ec);
  if (ec) {
    std::fprintf(stderr, "ConfigManager: rename to %s failed: %s\n",
                 configPath_.c_str(), ec.message().c_str());
    return false;
  }
  return true;
}

std::filesystem::path ConfigManager::venuesDir(const AppConfig &config) const {
  if (!config.venuesDir.empty())
    return config.venuesDir;
  return configDir_ / "venues";
}
