#include "SeatViewService.h"
#include "../core/Logger.h"
#include "../network/RenderClient.h"

#include <condition_variable>
#include <mutex>

SeatViewOptions SeatViewOptions::fromConfig(const AppConfig &config) {
  SeatViewOptions o;
  o.mapper.fovMinDeg = config.fovMinDeg;
  o.mapper.fovMaxDeg = config.fovMaxDeg;
  o.cache.maxBytes = config.cacheMaxBytes;
  o.cache.maxEntries = config.cacheMaxEntries;
  o.cache.ttl = std::chrono::seconds(config.cacheTtlS);
  o.cache.renderTimeout = std::chrono::milliseconds(config.renderTimeoutMs);
  o.precision.positionM = config.positionPrecisionM;
  o.precision.fovDeg = config.fovPrecisionDeg;
  o.retries = config.renderRetries;
  o.backoff = std::chrono::milliseconds(config.renderBackoffMs);
  return o;
}

SeatViewService::SeatViewService(VenueRegistry &venues, RenderClient &client,
                                 WorkerService &workers,
                                 SeatViewOptions options)
    : venues_(venues), client_(client), options_(options),
      mapper_(options.mapper), cache_(options.cache, workers) {}

SeatMapping SeatViewService::locate(const std::string &venueId,
                                    const ClickPoint &click) const {
  auto venue = venues_.get(venueId);
  return mapper_.map(click, *venue);
}

std::string SeatViewService::fingerprintFor(const Venue &venue,
                                            const SeatMapping &mapping,
                                            RenderPreset preset) const {
  return Fingerprint::make(venue.id, venue.templateId, mapping.sectionId,
                           preset, mapping.pose, options_.precision);
}

// Returns false if stop fired before the delay elapsed.
static bool sleepFor(std::chrono::milliseconds delay, const std::stop_token &stop) {
  std::mutex m;
  std::condition_variable_any cv;
  std::unique_lock<std::mutex> lock(m);
  return !cv.wait_for(lock, stop, delay, [] { return false; }) &&
         !stop.stop_requested();
}

SeatViewResult SeatViewService::view(const std::string &venueId,
                                     const ClickPoint &click,
                                     RenderPreset preset,
                                     std::stop_token stop) {
  // Hold the venue for the whole request; a concurrent reload swaps the
  // registry entry, not this object.
  std::shared_ptr<const Venue> venue = venues_.get(venueId);

  SeatViewResult out;
  out.mapping = mapper_.map(click, *venue);
  out.fingerprint = fingerprintFor(*venue, out.mapping, preset);

  const CameraPose pose = out.mapping.pose;
  const std::chrono::milliseconds timeout = options_.cache.renderTimeout;
  RenderClient &client = client_;
  auto renderFn = [venue, pose, preset, timeout, &client] {
    return client.render(pose, venue->templateId, venue->id,
                         RenderOptions::forPreset(preset), timeout);
  };

  std::chrono::milliseconds delay = options_.backoff;
  for (int attempt = 0; attempt <= options_.retries; ++attempt) {
    out.attempts = attempt + 1;
    out.render = cache_.getOrRender(out.fingerprint, renderFn, stop);
    if (out.render.ok() || !isRetryable(out.render.error))
      break;
    if (attempt == options_.retries)
      break;

    LOG_I("SeatView", "Render {} for {} section {} failed ({}), retry {} in {} ms",
          out.fingerprint, venueId, out.mapping.sectionId,
          renderErrorToString(out.render.error), attempt + 1, delay.count());
    if (!sleepFor(delay, stop)) {
      out.render = RenderResult::failure(RenderError::CANCELLED, "request cancelled");
      break;
    }
    delay *= 2;
  }

  if (!out.render.ok()) {
    LOG_W("SeatView", "View unavailable for {} section {} after {} attempt(s): {}",
          venueId, out.mapping.sectionId, out.attempts, out.render.message);
  }
  return out;
}
