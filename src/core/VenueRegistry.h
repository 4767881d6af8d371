#pragma once

#include "VenueData.h"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Process-wide set of loaded venues. Venues are never edited in place: a
// reload swaps the shared pointer, so mappings already holding the old
// venue finish against it.
class VenueRegistry {
public:
  explicit VenueRegistry(std::filesystem::path venuesDir = {});

  // Registered venue, loading it from venuesDir on first use. Throws
  // InvalidVenueConfig when the file is missing or malformed.
  std::shared_ptr<const Venue> get(const std::string &venueId);

  // Nullptr when the venue is not registered; never touches the disk.
  std::shared_ptr<const Venue> find(const std::string &venueId) const;

  void replace(std::shared_ptr<const Venue> venue);

  // Re-read from disk. On failure the previous venue stays registered and
  // the error propagates.
  std::shared_ptr<const Venue> reload(const std::string &venueId);

  // Load every *.json and */config.json under venuesDir. Bad files are
  // logged and skipped. Returns the number of venues registered.
  std::size_t loadAll();

  std::vector<std::string> ids() const;

private:
  std::shared_ptr<const Venue> loadFromDisk(const std::string &venueId) const;

  std::filesystem::path venuesDir_;
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<const Venue>> venues_;
};
