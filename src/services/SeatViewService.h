#pragma once

#include "../core/ConfigManager.h"
#include "../core/Fingerprint.h"
#include "../core/RenderTypes.h"
#include "../core/VenueRegistry.h"
#include "CoordinateMapper.h"
#include "RenderCache.h"

#include <chrono>
#include <memory>
#include <stop_token>
#include <string>

class RenderClient;
class WorkerService;

struct SeatViewOptions {
  MapperConfig mapper;
  RenderCacheConfig cache;
  FingerprintPrecision precision;
  int retries = SeatView::DEFAULT_RENDER_RETRIES;
  std::chrono::milliseconds backoff{SeatView::DEFAULT_RENDER_BACKOFF_MS};

  static SeatViewOptions fromConfig(const AppConfig &config);
};

struct SeatViewResult {
  SeatMapping mapping;
  std::string fingerprint;
  RenderResult render;
  int attempts = 0;
};

// Click in, image out: venue lookup, mapping, fingerprinting, and the cached
// render, retrying timeouts and transient backend failures with exponential
// backoff.
class SeatViewService {
public:
  SeatViewService(VenueRegistry &venues, RenderClient &client,
                  WorkerService &workers, SeatViewOptions options = {});

  // Mapping only; no render. Throws InvalidVenueConfig for unknown venues.
  SeatMapping locate(const std::string &venueId, const ClickPoint &click) const;

  std::string fingerprintFor(const Venue &venue, const SeatMapping &mapping,
                             RenderPreset preset) const;

  SeatViewResult view(const std::string &venueId, const ClickPoint &click,
                      RenderPreset preset = RenderPreset::FULL,
                      std::stop_token stop = {});

  const CoordinateMapper &mapper() const { return mapper_; }
  RenderCache &cache() { return cache_; }

private:
  VenueRegistry &venues_;
  RenderClient &client_;
  SeatViewOptions options_;
  CoordinateMapper mapper_;
  RenderCache cache_;
};
