#pragma once

#include "Constants.h"

#include <memory>
#include <string>

enum class RenderPreset {
  PREVIEW,
  FULL,
};

inline const char *renderPresetToString(RenderPreset p) {
  switch (p) {
  case RenderPreset::PREVIEW: return "preview";
  case RenderPreset::FULL:    return "full";
  }
  return "full";
}

struct RenderOptions {
  int width = SeatView::FULL_WIDTH;
  int height = SeatView::FULL_HEIGHT;
  int samples = SeatView::FULL_SAMPLES;

  static RenderOptions forPreset(RenderPreset p) {
    if (p == RenderPreset::PREVIEW) {
      return {SeatView::PREVIEW_WIDTH, SeatView::PREVIEW_HEIGHT,
              SeatView::PREVIEW_SAMPLES};
    }
    return {};
  }
};

enum class RenderError {
  NONE,
  TIMEOUT,   // render deadline passed; retryable
  TRANSIENT, // network, 5xx, GPU cold start; retryable
  FATAL,     // invalid template, rejected request; not retryable
  CANCELLED, // this caller stopped waiting
};

inline const char *renderErrorToString(RenderError e) {
  switch (e) {
  case RenderError::NONE:      return "none";
  case RenderError::TIMEOUT:   return "timeout";
  case RenderError::TRANSIENT: return "transient";
  case RenderError::FATAL:     return "fatal";
  case RenderError::CANCELLED: return "cancelled";
  }
  return "fatal";
}

inline bool isRetryable(RenderError e) {
  return e == RenderError::TIMEOUT || e == RenderError::TRANSIENT;
}

using ImageData = std::shared_ptr<const std::string>;

// Outcome of one render. Copies share the same image buffer, so every waiter
// on a coalesced render holds the identical bytes.
struct RenderResult {
  ImageData image;
  RenderError error = RenderError::NONE;
  std::string message;

  bool ok() const { return error == RenderError::NONE && image != nullptr; }

  static RenderResult success(std::string bytes) {
    RenderResult r;
    r.image = std::make_shared<const std::string>(std::move(bytes));
    return r;
  }

  static RenderResult failure(RenderError error, std::string message) {
    RenderResult r;
    r.error = error;
    r.message = std::move(message);
    return r;
  }
};
