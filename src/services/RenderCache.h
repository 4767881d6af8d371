#pragma once

#include "../core/Constants.h"
#include "../core/RenderTypes.h"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>

class WorkerService;

struct RenderCacheConfig {
  std::size_t maxBytes = SeatView::DEFAULT_CACHE_MAX_BYTES;     // 0 = unbounded
  std::size_t maxEntries = SeatView::DEFAULT_CACHE_MAX_ENTRIES; // 0 = unbounded
  std::chrono::milliseconds ttl{SeatView::DEFAULT_CACHE_TTL_S * 1000LL}; // 0 = never
  std::chrono::milliseconds renderTimeout{SeatView::DEFAULT_RENDER_TIMEOUT_MS};
};

struct RenderCacheStats {
  std::uint64_t hits = 0;
  std::uint64_t misses = 0;    // renders started
  std::uint64_t coalesced = 0; // requests that joined a render in flight
  std::uint64_t evictions = 0;
  std::uint64_t expirations = 0;
  std::uint64_t timeouts = 0;
  std::uint64_t failures = 0;
  std::size_t entries = 0;
  std::size_t bytes = 0;
};

// Fingerprint -> rendered image, with one render per fingerprint in flight.
//
// The cache lookup, the in-flight lookup and the in-flight registration
// happen under one mutex. The render itself runs on the worker pool; callers
// wait on the flight until it completes, its deadline passes, or their own
// stop token fires. A flight that times out is removed, its late result is
// dropped, and the next request for that fingerprint renders again.
class RenderCache {
public:
  using Clock = std::chrono::steady_clock;
  using RenderFn = std::function<RenderResult()>;
  using NowFn = std::function<Clock::time_point()>;

  // now drives entry ages (TTL); render deadlines always use Clock.
  RenderCache(RenderCacheConfig config, WorkerService &workers,
              NowFn now = nullptr);
  ~RenderCache(); // waits for renders still running on the pool

  RenderCache(const RenderCache &) = delete;
  RenderCache &operator=(const RenderCache &) = delete;

  RenderResult getOrRender(const std::string &fingerprint, RenderFn renderFn,
                           std::stop_token stop = {});

  // Cached image without rendering; does not refresh recency.
  std::optional<ImageData> peek(const std::string &fingerprint) const;
  bool contains(const std::string &fingerprint) const;
  bool inFlight(const std::string &fingerprint) const;

  void erase(const std::string &fingerprint);
  void clear();

  RenderCacheStats stats() const;
  std::size_t size() const;
  std::size_t bytes() const;
  const RenderCacheConfig &config() const { return config_; }

private:
  struct CacheEntry {
    std::string fingerprint;
    ImageData image;
    Clock::time_point created;
    Clock::time_point lastAccess;
    std::size_t sizeBytes = 0;
  };

  struct Node {
    CacheEntry entry;
    std::list<std::string>::iterator lru; // position in lru_, front = newest
  };

  struct Flight {
    Clock::time_point deadline;
    bool done = false;
    RenderResult result;
    std::size_t waiters = 0;
    std::condition_variable_any cv;
  };

  void runRender(const std::string &fingerprint,
                 const std::shared_ptr<Flight> &flight, const RenderFn &fn);
  RenderResult await(std::unique_lock<std::mutex> &lock,
                     const std::string &fingerprint,
                     const std::shared_ptr<Flight> &flight,
                     const std::stop_token &stop);

  // The helpers below expect mutex_ to be held.
  void complete(const std::string &fingerprint,
                const std::shared_ptr<Flight> &flight, RenderResult result);
  void expire(const std::string &fingerprint,
              const std::shared_ptr<Flight> &flight);
  void insert(const std::string &fingerprint, const ImageData &image);
  void evictIfNeeded();
  void removeNode(std::unordered_map<std::string, Node>::iterator it);
  bool isExpired(const CacheEntry &entry, Clock::time_point now) const;

  RenderCacheConfig config_;
  WorkerService &workers_;
  NowFn now_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Node> entries_;
  std::list<std::string> lru_;
  std::unordered_map<std::string, std::shared_ptr<Flight>> inflight_;
  std::size_t bytes_ = 0;
  std::size_t outstanding_ = 0; // render tasks queued or running
  std::condition_variable idle_;
  RenderCacheStats stats_;
};
