#include "RenderCache.h"
#include "../core/Logger.h"
#include "../core/WorkerService.h"

#include <exception>

RenderCache::RenderCache(RenderCacheConfig config, WorkerService &workers,
                         NowFn now)
    : config_(config), workers_(workers), now_(std::move(now)) {
  if (!now_)
    now_ = [] { return Clock::now(); };
}

RenderCache::~RenderCache() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_.wait(lock, [this] { return outstanding_ == 0; });
}

RenderResult RenderCache::getOrRender(const std::string &fingerprint,
                                      RenderFn renderFn,
                                      std::stop_token stop) {
  std::unique_lock<std::mutex> lock(mutex_);

  auto it = entries_.find(fingerprint);
  if (it != entries_.end()) {
    const auto now = now_();
    if (isExpired(it->second.entry, now)) {
      LOG_D("RenderCache", "Entry {} expired", fingerprint);
      ++stats_.expirations;
      removeNode(it);
    } else {
      it->second.entry.lastAccess = now;
      lru_.splice(lru_.begin(), lru_, it->second.lru);
      ++stats_.hits;
      RenderResult hit;
      hit.image = it->second.entry.image;
      return hit;
    }
  }

  std::shared_ptr<Flight> flight;
  auto fit = inflight_.find(fingerprint);
  if (fit != inflight_.end() && fit->second->deadline <= Clock::now()) {
    // Nobody was waiting when this one ran out of time
    auto stale = fit->second;
    expire(fingerprint, stale);
    fit = inflight_.end();
  }

  if (fit != inflight_.end()) {
    flight = fit->second;
    ++stats_.coalesced;
    LOG_D("RenderCache", "Joining render in flight for {}", fingerprint);
  } else {
    flight = std::make_shared<Flight>();
    flight->deadline = Clock::now() + config_.renderTimeout;
    inflight_.emplace(fingerprint, flight);
    ++stats_.misses;
    ++outstanding_;

    bool queued = workers_.submitTask(
        [this, fingerprint, flight, fn = std::move(renderFn)] {
          runRender(fingerprint, flight, fn);
        });
    if (!queued) {
      --outstanding_;
      complete(fingerprint, flight,
               RenderResult::failure(RenderError::TRANSIENT,
                                     "render workers are shut down"));
    }
  }

  return await(lock, fingerprint, flight, stop);
}

RenderResult RenderCache::await(std::unique_lock<std::mutex> &lock,
                                const std::string &fingerprint,
                                const std::shared_ptr<Flight> &flight,
                                const std::stop_token &stop) {
  ++flight->waiters;
  const bool finished = flight->cv.wait_until(lock, stop, flight->deadline,
                                              [&] { return flight->done; });
  --flight->waiters;

  if (finished)
    return flight->result;

  if (stop.stop_requested()) {
    LOG_D("RenderCache", "Caller left {} ({} still waiting)", fingerprint,
          flight->waiters);
    return RenderResult::failure(RenderError::CANCELLED, "request cancelled");
  }

  expire(fingerprint, flight);
  return flight->result;
}

void RenderCache::runRender(const std::string &fingerprint,
                            const std::shared_ptr<Flight> &flight,
                            const RenderFn &fn) {
  RenderResult result;
  try {
    result = fn();
  } catch (const std::exception &ex) {
    result = RenderResult::failure(RenderError::FATAL, ex.what());
  } catch (...) {
    result = RenderResult::failure(RenderError::FATAL, "unknown render exception");
  }
  if (result.error == RenderError::NONE && (!result.image || result.image->empty()))
    result = RenderResult::failure(RenderError::TRANSIENT, "render returned no image");

  // Notify under the lock: once it is released the destructor may run.
  std::lock_guard<std::mutex> lock(mutex_);
  complete(fingerprint, flight, std::move(result));
  --outstanding_;
  idle_.notify_all();
}

void RenderCache::complete(const std::string &fingerprint,
                           const std::shared_ptr<Flight> &flight,
                           RenderResult result) {
  if (flight->done) {
    LOG_D("RenderCache", "Dropping late {} result for {}",
          result.ok() ? "successful" : renderErrorToString(result.error),
          fingerprint);
    return;
  }

  auto fit = inflight_.find(fingerprint);
  if (fit != inflight_.end() && fit->second == flight)
    inflight_.erase(fit);

  if (result.ok()) {
    insert(fingerprint, result.image);
  } else {
    ++stats_.failures;
    LOG_W("RenderCache", "Render for {} failed ({}): {}", fingerprint,
          renderErrorToString(result.error), result.message);
  }

  flight->result = std::move(result);
  flight->done = true;
  flight->cv.notify_all();
}

void RenderCache::expire(const std::string &fingerprint,
                         const std::shared_ptr<Flight> &flight) {
  if (flight->done)
    return;

  auto fit = inflight_.find(fingerprint);
  if (fit != inflight_.end() && fit->second == flight)
    inflight_.erase(fit);

  ++stats_.timeouts;
  LOG_W("RenderCache", "Render for {} timed out after {} ms", fingerprint,
        config_.renderTimeout.count());

  flight->result = RenderResult::failure(RenderError::TIMEOUT, "render timed out");
  flight->done = true;
  flight->cv.notify_all();
}

void RenderCache::insert(const std::string &fingerprint, const ImageData &image) {
  const std::size_t size = image->size();
  if (config_.maxBytes != 0 && size > config_.maxBytes) {
    LOG_W("RenderCache", "Image for {} ({} bytes) exceeds cache size, not kept",
          fingerprint, size);
    return;
  }

  auto existing = entries_.find(fingerprint);
  if (existing != entries_.end())
    removeNode(existing);

  const auto now = now_();
  lru_.push_front(fingerprint);
  Node node{CacheEntry{fingerprint, image, now, now, size}, lru_.begin()};
  entries_.emplace(fingerprint, std::move(node));
  bytes_ += size;

  evictIfNeeded();
}

void RenderCache::evictIfNeeded() {
  while (!lru_.empty() &&
         ((config_.maxBytes != 0 && bytes_ > config_.maxBytes) ||
          (config_.maxEntries != 0 && entries_.size() > config_.maxEntries))) {
    auto victim = entries_.find(lru_.back());
    LOG_D("RenderCache", "Evicting {} ({} bytes)", lru_.back(),
          victim->second.entry.sizeBytes);
    removeNode(victim);
    ++stats_.evictions;
  }
}

void RenderCache::removeNode(std::unordered_map<std::string, Node>::iterator it) {
  bytes_ -= it->second.entry.sizeBytes;
  lru_.erase(it->second.lru);
  entries_.erase(it);
}

bool RenderCache::isExpired(const CacheEntry &entry, Clock::time_point now) const {
  return config_.ttl.count() > 0 && now - entry.created >= config_.ttl;
}

std::optional<ImageData> RenderCache::peek(const std::string &fingerprint) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(fingerprint);
  if (it == entries_.end() || isExpired(it->second.entry, now_()))
    return std::nullopt;
  return it->second.entry.image;
}

bool RenderCache::contains(const std::string &fingerprint) const {
  return peek(fingerprint).has_value();
}

bool RenderCache::inFlight(const std::string &fingerprint) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return inflight_.count(fingerprint) != 0;
}

void RenderCache::erase(const std::string &fingerprint) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(fingerprint);
  if (it != entries_.end())
    removeNode(it);
}

void RenderCache::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
  lru_.clear();
  bytes_ = 0;
}

RenderCacheStats RenderCache::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  RenderCacheStats s = stats_;
  s.entries = entries_.size();
  s.bytes = bytes_;
  return s;
}

std::size_t RenderCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::size_t RenderCache::bytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return bytes_;
}
