#include "VenueLoader.h"
#include "Errors.h"
#include "Logger.h"

#include <nlohmann/json.hpp>

#include <charconv>
#include <cmath>
#include <fstream>
#include <set>
#include <stdexcept>

namespace {

using nlohmann::json;

bool inUnitSquare(const Vec2 &p) {
  return std::isfinite(p.x) && std::isfinite(p.y) && p.x >= 0.0 &&
         p.x <= 1.0 && p.y >= 0.0 && p.y <= 1.0;
}

Vec2 parsePoint(const json &j) {
  if (j.is_array() && j.size() == 2)
    return {j.at(0).get<double>(), j.at(1).get<double>()};
  if (j.is_object())
    return {j.at("x").get<double>(), j.at("y").get<double>()};
  throw std::invalid_argument("point must be [x, y] or {x, y}, got " + j.dump());
}

int parseTierKey(const std::string &venueId, const std::string &key) {
  int value = 0;
  auto [ptr, ec] = std::from_chars(key.data(), key.data() + key.size(), value);
  if (ec != std::errc() || ptr != key.data() + key.size())
    throw InvalidVenueConfig(venueId, "tier key '" + key + "' is not an integer");
  return value;
}

Section parseSection(const json &js) {
  Section s;
  const json &id = js.at("id");
  // Numeric ids are common in hand-written configs
  s.id = id.is_string() ? id.get<std::string>() : id.dump();
  s.tier = js.at("tier").get<int>();
  for (const auto &pt : js.at("polygon"))
    s.polygon.push_back(parsePoint(pt));
  s.angle = js.value("angle", 0.0);

  if (js.contains("depth_axis")) {
    const json &axis = js.at("depth_axis");
    s.depthAxis = SectionDepthAxis{parsePoint(axis.at("front")),
                                   parsePoint(axis.at("back"))};
  }
  if (js.contains("row_count") && !js.at("row_count").is_null())
    s.rowCount = js.at("row_count").get<int>();
  return s;
}

} // namespace

std::shared_ptr<const Venue> VenueLoader::fromJson(const nlohmann::json &doc) {
  const json &root = doc.contains("venue") ? doc.at("venue") : doc;
  if (!root.is_object())
    throw InvalidVenueConfig("<unknown>", "venue must be a JSON object");
  const std::string venueId =
      root.contains("id") && root.at("id").is_string()
          ? root.at("id").get<std::string>()
          : "<unknown>";

  auto venue = std::make_shared<Venue>();
  try {
    venue->id = root.at("id").get<std::string>();
    venue->name = root.value("name", venue->id);

    const std::string type = root.at("type").get<std::string>();
    auto parsedType = venueTypeFromString(type);
    if (!parsedType)
      throw InvalidVenueConfig(venueId, "unknown venue type '" + type + "'");
    venue->type = *parsedType;

    venue->templateId = root.at("template").get<std::string>();

    if (root.contains("seatmap")) {
      const json &sm = root.at("seatmap");
      venue->seatmap.file = sm.value("file", "");
      venue->seatmap.width = sm.at("width").get<int>();
      venue->seatmap.height = sm.at("height").get<int>();
    }

    if (root.contains("field_center")) {
      const json &fc = root.at("field_center");
      venue->fieldCenter = {fc.value("x", 0.0), fc.value("y", 0.0),
                            fc.value("z", 0.0)};
    }
    if (root.contains("seatmap_center"))
      venue->seatmapCenter = parsePoint(root.at("seatmap_center"));

    for (const auto &[key, jt] : root.at("tiers").items()) {
      Tier tier;
      tier.id = parseTierKey(venueId, key);
      tier.elevation = jt.at("elevation").get<double>();
      const json &range = jt.at("distance_range");
      if (!range.is_array() || range.size() != 2)
        throw InvalidVenueConfig(venueId, "tier " + key +
                                              " distance_range must be [min, max]");
      tier.distance = {range.at(0).get<double>(), range.at(1).get<double>()};
      if (!venue->tiers.emplace(tier.id, tier).second)
        throw InvalidVenueConfig(venueId, "duplicate tier " + key);
    }

    for (const auto &js : root.at("sections"))
      venue->sections.push_back(parseSection(js));
  } catch (const json::exception &ex) {
    throw InvalidVenueConfig(venueId, ex.what());
  } catch (const std::invalid_argument &ex) {
    throw InvalidVenueConfig(venueId, ex.what());
  }

  validate(*venue);
  LOG_I("VenueLoader", "Loaded venue '{}' ({}): {} tiers, {} sections",
        venue->id, venueTypeToString(venue->type), venue->tiers.size(),
        venue->sections.size());
  return venue;
}

std::shared_ptr<const Venue> VenueLoader::fromString(const std::string &text) {
  auto doc = nlohmann::json::parse(text, nullptr, false);
  if (doc.is_discarded())
    throw InvalidVenueConfig("<string>", "malformed JSON");
  return fromJson(doc);
}

std::shared_ptr<const Venue>
VenueLoader::fromFile(const std::filesystem::path &path) {
  std::ifstream ifs(path);
  if (!ifs)
    throw InvalidVenueConfig(path.string(), "cannot open file");

  auto doc = nlohmann::json::parse(ifs, nullptr, false);
  if (doc.is_discarded())
    throw InvalidVenueConfig(path.string(), "malformed JSON");
  return fromJson(doc);
}

// Ids double as file names under the venue dir.
static bool isSafeVenueId(const std::string &id) {
  return !id.empty() && id.find_first_of("/\\") == std::string::npos &&
         id.find("..") == std::string::npos;
}

std::filesystem::path VenueLoader::pathFor(const std::filesystem::path &dir,
                                           const std::string &venueId) {
  if (!isSafeVenueId(venueId))
    throw InvalidVenueConfig(venueId, "venue id is not a plain name");

  std::filesystem::path flat = dir / (venueId + ".json");
  std::filesystem::path nested = dir / venueId / "config.json";

  std::error_code ec;
  if (!std::filesystem::exists(flat, ec) &&
      std::filesystem::exists(nested, ec))
    return nested;
  return flat;
}

void VenueLoader::validate(const Venue &venue) {
  const std::string &id = venue.id;
  if (id.empty())
    throw InvalidVenueConfig(id, "missing venue id");
  if (!isSafeVenueId(id))
    throw InvalidVenueConfig(id, "venue id is not a plain name");
  if (venue.templateId.empty())
    throw InvalidVenueConfig(id, "missing template");
  if (venueTypeFromString(venueTypeToString(venue.type)) != venue.type)
    throw InvalidVenueConfig(id, "unknown venue type");
  if (!std::isfinite(venue.fieldCenter.x) ||
      !std::isfinite(venue.fieldCenter.y) || !std::isfinite(venue.fieldCenter.z))
    throw InvalidVenueConfig(id, "field_center is not finite");
  if (!inUnitSquare(venue.seatmapCenter))
    throw InvalidVenueConfig(id, "seatmap_center outside [0,1]");
  if (!venue.seatmap.file.empty() || venue.seatmap.width != 0 ||
      venue.seatmap.height != 0) {
    if (venue.seatmap.width <= 0 || venue.seatmap.height <= 0)
      throw InvalidVenueConfig(id, "seatmap dimensions must be positive");
  }

  for (const auto &[tierId, tier] : venue.tiers) {
    const std::string label = "tier " + std::to_string(tierId);
    if (tier.id != tierId)
      throw InvalidVenueConfig(id, label + " is filed under the wrong key");
    if (!std::isfinite(tier.elevation))
      throw InvalidVenueConfig(id, label + " elevation is not finite");
    if (!(tier.distance.min > 0.0) || !(tier.distance.max > 0.0))
      throw InvalidVenueConfig(id, label + " distances must be positive");
    if (tier.distance.min > tier.distance.max)
      throw InvalidVenueConfig(id, label + " distance min exceeds max");
  }

  if (venue.sections.empty())
    throw InvalidVenueConfig(id, "no sections");

  std::set<std::string> seen;
  for (const auto &s : venue.sections) {
    const std::string label = "section '" + s.id + "'";
    if (s.id.empty())
      throw InvalidVenueConfig(id, "section with empty id");
    if (!seen.insert(s.id).second)
      throw InvalidVenueConfig(id, "duplicate " + label);
    if (!venue.findTier(s.tier))
      throw InvalidVenueConfig(id, label + " references unknown tier " +
                                       std::to_string(s.tier));
    if (s.polygon.size() < 3)
      throw InvalidVenueConfig(id, label + " polygon needs at least 3 vertices");
    for (const auto &v : s.polygon) {
      if (!inUnitSquare(v))
        throw InvalidVenueConfig(id, label + " vertex outside [0,1]");
    }
    if (Geometry::polygonArea(s.polygon) <= Geometry::EPSILON)
      throw InvalidVenueConfig(id, label + " polygon has no area");
    if (!Geometry::isSimplePolygon(s.polygon))
      throw InvalidVenueConfig(id, label + " polygon self-intersects");
    if (!std::isfinite(s.angle))
      throw InvalidVenueConfig(id, label + " angle is not finite");
    if (s.depthAxis) {
      if (!inUnitSquare(s.depthAxis->front) || !inUnitSquare(s.depthAxis->back))
        throw InvalidVenueConfig(id, label + " depth axis outside [0,1]");
      if (Geometry::distance(s.depthAxis->front, s.depthAxis->back) <=
          Geometry::EPSILON)
        throw InvalidVenueConfig(id, label + " depth axis has zero length");
    }
    if (s.rowCount && *s.rowCount <= 0)
      throw InvalidVenueConfig(id, label + " row_count must be positive");
  }
}
