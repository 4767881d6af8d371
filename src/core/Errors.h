#pragma once

#include <stdexcept>
#include <string>

// Venue data rejected at load time. Never thrown from the mapping path.
class InvalidVenueConfig : public std::runtime_error {
public:
  InvalidVenueConfig(const std::string &venueId, const std::string &reason)
      : std::runtime_error("invalid venue '" + venueId + "': " + reason),
        venueId_(venueId), reason_(reason) {}

  const std::string &venueId() const { return venueId_; }
  const std::string &reason() const { return reason_; }

private:
  std::string venueId_;
  std::string reason_;
};

// The mapper was handed a venue with nothing to resolve against.
class SectionResolutionError : public std::logic_error {
public:
  explicit SectionResolutionError(const std::string &venueId)
      : std::logic_error("venue '" + venueId + "' has no sections"),
        venueId_(venueId) {}

  const std::string &venueId() const { return venueId_; }

private:
  std::string venueId_;
};
