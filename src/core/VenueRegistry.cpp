#include "VenueRegistry.h"
#include "Errors.h"
#include "Logger.h"
#include "VenueLoader.h"

VenueRegistry::VenueRegistry(std::filesystem::path venuesDir)
    : venuesDir_(std::move(venuesDir)) {}

std::shared_ptr<const Venue> VenueRegistry::get(const std::string &venueId) {
  if (auto venue = find(venueId))
    return venue;

  // Load outside the lock; two racing first uses both parse, the first one
  // registered wins.
  auto loaded = loadFromDisk(venueId);

  std::lock_guard<std::mutex> lock(mutex_);
  return venues_.emplace(venueId, loaded).first->second;
}

std::shared_ptr<const Venue>
VenueRegistry::find(const std::string &venueId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = venues_.find(venueId);
  return it == venues_.end() ? nullptr : it->second;
}

void VenueRegistry::replace(std::shared_ptr<const Venue> venue) {
  if (!venue)
    return;
  std::lock_guard<std::mutex> lock(mutex_);
  venues_[venue->id] = std::move(venue);
}

std::shared_ptr<const Venue>
VenueRegistry::reload(const std::string &venueId) {
  auto loaded = loadFromDisk(venueId);
  replace(loaded);
  LOG_I("VenueRegistry", "Reloaded venue '{}'", venueId);
  return loaded;
}

std::size_t VenueRegistry::loadAll() {
  if (venuesDir_.empty())
    return 0;

  std::error_code ec;
  std::filesystem::directory_iterator it(venuesDir_, ec);
  if (ec) {
    LOG_E("VenueRegistry", "Cannot read venue dir {}: {}", venuesDir_.string(),
          ec.message());
    return 0;
  }

  std::size_t count = 0;
  for (const auto &entry : it) {
    std::filesystem::path file;
    if (entry.is_regular_file() && entry.path().extension() == ".json") {
      file = entry.path();
    } else if (entry.is_directory() &&
               std::filesystem::exists(entry.path() / "config.json", ec)) {
      file = entry.path() / "config.json";
    } else {
      continue;
    }

    try {
      replace(VenueLoader::fromFile(file));
      ++count;
    } catch (const InvalidVenueConfig &ex) {
      LOG_E("VenueRegistry", "Skipping {}: {}", file.string(), ex.what());
    }
  }
  return count;
}

std::vector<std::string> VenueRegistry::ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> out;
  out.reserve(venues_.size());
  for (const auto &[id, venue] : venues_)
    out.push_back(id);
  return out;
}

std::shared_ptr<const Venue>
VenueRegistry::loadFromDisk(const std::string &venueId) const {
  if (venuesDir_.empty())
    throw InvalidVenueConfig(venueId, "venue not registered and no venue dir");

  auto venue = VenueLoader::fromFile(VenueLoader::pathFor(venuesDir_, venueId));
  if (venue->id != venueId)
    throw InvalidVenueConfig(venueId, "file declares id '" + venue->id + "'");
  return venue;
}
