#pragma once

#include <cstddef>

// Project-wide constants for SeatView

#ifndef SEATVIEW_VERSION
#define SEATVIEW_VERSION "0.0.0"
#endif

namespace SeatView {

// Render cache grid: positions and targets snap to 0.5 m.
static constexpr double DEFAULT_POSITION_PRECISION_M = 0.5;
static constexpr double DEFAULT_FOV_PRECISION_DEG = 0.5;

// Field of view clamp for mapped cameras
static constexpr double DEFAULT_FOV_MIN_DEG = 45.0;
static constexpr double DEFAULT_FOV_MAX_DEG = 75.0;

// Render cache bounds (0 disables a bound)
static constexpr std::size_t DEFAULT_CACHE_MAX_BYTES = 512u * 1024u * 1024u;
static constexpr std::size_t DEFAULT_CACHE_MAX_ENTRIES = 0;
static constexpr int DEFAULT_CACHE_TTL_S = 24 * 60 * 60;
static constexpr int DEFAULT_RENDER_WORKERS = 4;

// GPU cold starts on the backend can take tens of seconds
static constexpr int DEFAULT_RENDER_TIMEOUT_MS = 60000;
static constexpr int DEFAULT_RENDER_RETRIES = 2;
static constexpr int DEFAULT_RENDER_BACKOFF_MS = 1000;

// Render presets
static constexpr int PREVIEW_WIDTH = 960;
static constexpr int PREVIEW_HEIGHT = 540;
static constexpr int PREVIEW_SAMPLES = 16;
static constexpr int FULL_WIDTH = 1920;
static constexpr int FULL_HEIGHT = 1080;
static constexpr int FULL_SAMPLES = 64;

} // namespace SeatView
