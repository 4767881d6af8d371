#include "core/ConfigManager.h"
#include "core/Constants.h"
#include "core/Errors.h"
#include "core/Geometry.h"
#include "core/Logger.h"
#include "core/VenueLoader.h"
#include "core/VenueRegistry.h"
#include "core/WorkerService.h"
#include "network/RenderClient.h"
#include "services/CoordinateMapper.h"
#include "services/SeatViewService.h"

#include <curl/curl.h>

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <string>
#include <vector>

static void printUsage() {
  std::printf(
      "Usage: seatview [options] <command> [args]\n"
      "\n"
      "Commands:\n"
      "  map <venue_id> [x y]...       Map seatmap clicks to camera poses.\n"
      "                                Without clicks, maps every section\n"
      "                                centroid plus one out-of-bounds click.\n"
      "  render <venue_id> <x> <y>     Render the view from one click.\n"
      "  validate <venue.json>...      Load and validate venue files.\n"
      "\n"
      "Options:\n"
      "  --config <file>       Config file (default ~/.config/seatview/config.json)\n"
      "  --venues <dir>        Venue directory (overrides config)\n"
      "  --log-level <level>   trace, debug, info, warn, error\n"
      "  --normalized          Click coordinates are in [0,1], not pixels\n"
      "  --preview             Render the preview preset (960x540)\n"
      "  --out <file>          Output image for render (default view.png)\n"
      "  -h, --help            Show this help\n");
}

static void printMapping(const char *label, const ClickPoint &click,
                         const SeatMapping &m) {
  const CameraPose &p = m.pose;
  std::printf("\n%s (%.4f, %.4f):\n", label, click.x, click.y);
  std::printf("  Section:    %s (tier %d, %s)\n", m.sectionId.c_str(), m.tier,
              sectionResolutionToString(m.resolution));
  std::printf("  Depth:      %.3f  lateral %.3f\n", m.depth, m.lateral);
  std::printf("  Distance:   %.2f m  angle %.2f deg\n", m.distanceM, m.angleDeg);
  std::printf("  Position:   (%.2f, %.2f, %.2f)\n", p.position.x, p.position.y,
              p.position.z);
  std::printf("  Target:     (%.2f, %.2f, %.2f)\n", p.target.x, p.target.y,
              p.target.z);
  std::printf("  Rotation:   (%.3f, %.3f, %.3f)\n", p.rotation.x, p.rotation.y,
              p.rotation.z);
  std::printf("  FOV:        %.1f deg\n", p.fovDeg);
}

static bool parseClicks(const std::vector<std::string> &args, std::size_t first,
                        const Venue &venue, bool normalized,
                        std::vector<ClickPoint> &out) {
  if ((args.size() - first) % 2 != 0) {
    std::fprintf(stderr, "Clicks must be given as x y pairs\n");
    return false;
  }
  for (std::size_t i = first; i + 1 < args.size(); i += 2) {
    char *endX = nullptr;
    char *endY = nullptr;
    const double x = std::strtod(args[i].c_str(), &endX);
    const double y = std::strtod(args[i + 1].c_str(), &endY);
    if (*endX != '\0' || *endY != '\0') {
      std::fprintf(stderr, "Bad coordinate pair '%s %s'\n", args[i].c_str(),
                   args[i + 1].c_str());
      return false;
    }
    if (normalized) {
      out.push_back({x, y});
      continue;
    }
    auto click = ClickPoint::fromPixels(x, y, venue.seatmap);
    if (!click) {
      std::fprintf(stderr,
                   "Venue '%s' has no seatmap size; use --normalized\n",
                   venue.id.c_str());
      return false;
    }
    out.push_back(*click);
  }
  return true;
}

static int runMap(VenueRegistry &registry, const AppConfig &cfg,
                  const std::vector<std::string> &args, bool normalized) {
  if (args.size() < 2) {
    printUsage();
    return EXIT_FAILURE;
  }

  auto venue = registry.get(args[1]);
  std::printf("Venue: %s (%s, %s)\n", venue->name.c_str(), venue->id.c_str(),
              venueTypeToString(venue->type));
  std::printf("Sections defined: %zu\n", venue->sections.size());

  CoordinateMapper mapper(SeatViewOptions::fromConfig(cfg).mapper);
  FingerprintPrecision precision{cfg.positionPrecisionM, cfg.fovPrecisionDeg};

  std::vector<ClickPoint> clicks;
  std::vector<std::string> labels;
  if (args.size() > 2) {
    if (!parseClicks(args, 2, *venue, normalized, clicks))
      return EXIT_FAILURE;
    labels.assign(clicks.size(), "Click");
  } else {
    for (const auto &s : venue->sections) {
      Vec2 c = Geometry::polygonCentroid(s.polygon);
      clicks.push_back({c.x, c.y});
      labels.push_back("Centroid of " + s.id);
    }
    clicks.push_back({0.0, 0.0});
    labels.push_back("Out-of-bounds corner");
  }

  for (std::size_t i = 0; i < clicks.size(); ++i) {
    SeatMapping m = mapper.map(clicks[i], *venue);
    printMapping(labels[i].c_str(), clicks[i], m);
    std::printf("  Cache key:  %s\n",
                Fingerprint::make(venue->id, venue->templateId, m.sectionId,
                                  RenderPreset::FULL, m.pose, precision)
                    .c_str());
  }

  MappingStats stats = mapper.stats();
  std::printf("\nResolved: %llu in polygon, %llu overlapping, %llu out of bounds\n",
              static_cast<unsigned long long>(stats.inPolygon),
              static_cast<unsigned long long>(stats.overlaps),
              static_cast<unsigned long long>(stats.outOfBounds));
  return EXIT_SUCCESS;
}

static int runRender(VenueRegistry &registry, const AppConfig &cfg,
                     const std::vector<std::string> &args, bool normalized,
                     bool preview, const std::string &outPath) {
  if (args.size() != 4) {
    printUsage();
    return EXIT_FAILURE;
  }
  if (cfg.renderEndpoint.empty()) {
    std::fprintf(stderr, "No render endpoint configured (render.endpoint)\n");
    return EXIT_FAILURE;
  }

  auto venue = registry.get(args[1]);
  std::vector<ClickPoint> clicks;
  if (!parseClicks(args, 2, *venue, normalized, clicks))
    return EXIT_FAILURE;

  HttpRenderClient client(cfg.renderEndpoint, cfg.renderToken);
  WorkerService workers(static_cast<std::size_t>(cfg.renderWorkers));
  SeatViewService service(registry, client, workers,
                          SeatViewOptions::fromConfig(cfg));

  SeatViewResult result = service.view(
      venue->id, clicks.front(), preview ? RenderPreset::PREVIEW : RenderPreset::FULL);
  printMapping("Click", clicks.front(), result.mapping);

  if (!result.render.ok()) {
    std::fprintf(stderr, "View unavailable (%s): %s\n",
                 renderErrorToString(result.render.error),
                 result.render.message.c_str());
    return EXIT_FAILURE;
  }

  std::ofstream ofs(outPath, std::ios::binary);
  ofs.write(result.render.image->data(),
            static_cast<std::streamsize>(result.render.image->size()));
  if (!ofs) {
    std::fprintf(stderr, "Failed to write %s\n", outPath.c_str());
    return EXIT_FAILURE;
  }
  std::printf("\nWrote %zu bytes to %s (key %s, %d attempt(s))\n",
              result.render.image->size(), outPath.c_str(),
              result.fingerprint.c_str(), result.attempts);
  return EXIT_SUCCESS;
}

static int runValidate(const std::vector<std::string> &args) {
  if (args.size() < 2) {
    printUsage();
    return EXIT_FAILURE;
  }
  int failures = 0;
  for (std::size_t i = 1; i < args.size(); ++i) {
    try {
      auto venue = VenueLoader::fromFile(args[i]);
      std::printf("OK    %s: %s, %zu tiers, %zu sections\n", args[i].c_str(),
                  venue->id.c_str(), venue->tiers.size(), venue->sections.size());
    } catch (const InvalidVenueConfig &ex) {
      std::printf("FAIL  %s: %s\n", args[i].c_str(), ex.what());
      ++failures;
    }
  }
  return failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}

int main(int argc, char *argv[]) {
  std::string configFile;
  std::string venuesOverride;
  std::string logLevel;
  std::string outPath = "view.png";
  bool normalized = false;
  bool preview = false;
  std::vector<std::string> args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      configFile = argv[++i];
    } else if (arg == "--venues" && i + 1 < argc) {
      venuesOverride = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      logLevel = argv[++i];
    } else if (arg == "--out" && i + 1 < argc) {
      outPath = argv[++i];
    } else if (arg == "--normalized") {
      normalized = true;
    } else if (arg == "--preview") {
      preview = true;
    } else if (arg == "-h" || arg == "--help") {
      printUsage();
      return EXIT_SUCCESS;
    } else {
      args.push_back(arg);
    }
  }

  if (args.empty()) {
    printUsage();
    return EXIT_FAILURE;
  }

  ConfigManager cfgMgr;
  AppConfig cfg;
  if (!cfgMgr.init(configFile)) {
    std::fprintf(stderr, "Warning: could not resolve config path\n");
  } else if (!cfgMgr.load(cfg) && !configFile.empty()) {
    std::fprintf(stderr, "Could not load config %s\n", configFile.c_str());
    return EXIT_FAILURE;
  }

  Log::init(cfgMgr.configDir().empty() ? "" : (cfgMgr.configDir() / "logs").string());
  Log::setLevel(logLevel.empty() ? cfg.logLevel : logLevel);
  LOG_I("Main", "Starting SeatView v{}", SEATVIEW_VERSION);

  curl_global_init(CURL_GLOBAL_ALL);

  int rc = EXIT_FAILURE;
  try {
    VenueRegistry registry(venuesOverride.empty()
                               ? cfgMgr.venuesDir(cfg)
                               : std::filesystem::path(venuesOverride));
    const std::string &command = args.front();
    if (command == "map") {
      rc = runMap(registry, cfg, args, normalized);
    } else if (command == "render") {
      rc = runRender(registry, cfg, args, normalized, preview, outPath);
    } else if (command == "validate") {
      rc = runValidate(args);
    } else {
      std::fprintf(stderr, "Unknown command '%s'\n", command.c_str());
      printUsage();
    }
  } catch (const InvalidVenueConfig &ex) {
    LOG_E("Main", "{}", ex.what());
    std::fprintf(stderr, "Error: %s\n", ex.what());
  } catch (const SectionResolutionError &ex) {
    LOG_E("Main", "{}", ex.what());
    std::fprintf(stderr, "Error: %s\n", ex.what());
  } catch (const std::exception &ex) {
    LOG_E("Main", "Unexpected error: {}", ex.what());
    std::fprintf(stderr, "Error: %s\n", ex.what());
  }

  curl_global_cleanup();
  return rc;
}
