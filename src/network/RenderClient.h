#pragma once

#include "../core/CameraPose.h"
#include "../core/RenderTypes.h"

#include <chrono>
#include <string>

// Seam to the GPU render backend.
class RenderClient {
public:
  virtual ~RenderClient() = default;

  // Blocks for at most timeout. Never throws for backend failures; they come
  // back as RenderResult errors classified for retry.
  virtual RenderResult render(const CameraPose &pose,
                              const std::string &templateId,
                              const std::string &venueId,
                              const RenderOptions &options,
                              std::chrono::milliseconds timeout) = 0;
};

// POSTs the camera as JSON to the backend's web endpoint and expects the
// encoded image as the response body.
class HttpRenderClient : public RenderClient {
public:
  explicit HttpRenderClient(std::string endpoint, std::string token = {});

  RenderResult render(const CameraPose &pose, const std::string &templateId,
                      const std::string &venueId, const RenderOptions &options,
                      std::chrono::milliseconds timeout) override;

  const std::string &endpoint() const { return endpoint_; }

  static std::string buildRequestBody(const CameraPose &pose,
                                      const std::string &templateId,
                                      const std::string &venueId,
                                      const RenderOptions &options);

  // NONE for 2xx.
  static RenderError classifyHttpStatus(long status);
  static RenderError classifyCurlCode(int code);

private:
  std::string endpoint_;
  std::string token_;
};
