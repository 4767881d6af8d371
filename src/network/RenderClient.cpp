#include "RenderClient.h"
#include "../core/Constants.h"
#include "../core/Logger.h"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <memory>

static size_t writeCallback(char *ptr, size_t size, size_t nmemb,
                            void *userdata) {
  auto *response = static_cast<std::string *>(userdata);
  response->append(ptr, size * nmemb);
  return size * nmemb;
}

static std::string snippet(const std::string &body) {
  constexpr std::size_t maxLen = 200;
  if (body.size() <= maxLen)
    return body;
  return body.substr(0, maxLen) + "...";
}

HttpRenderClient::HttpRenderClient(std::string endpoint, std::string token)
    : endpoint_(std::move(endpoint)), token_(std::move(token)) {}

std::string HttpRenderClient::buildRequestBody(const CameraPose &pose,
                                               const std::string &templateId,
                                               const std::string &venueId,
                                               const RenderOptions &options) {
  nlohmann::json body = {
      {"venue_id", venueId},
      {"template_name", templateId},
      {"camera_x", pose.position.x},
      {"camera_y", pose.position.y},
      {"camera_z", pose.position.z},
      {"rotation_x", pose.rotation.x},
      {"rotation_y", pose.rotation.y},
      {"rotation_z", pose.rotation.z},
      {"fov", pose.fovDeg},
      {"width", options.width},
      {"height", options.height},
      {"samples", options.samples},
  };
  return body.dump();
}

RenderError HttpRenderClient::classifyHttpStatus(long status) {
  if (status >= 200 && status < 300)
    return RenderError::NONE;
  if (status == 504)
    return RenderError::TIMEOUT;
  // Request timeout, too early, rate limited, and server-side trouble
  // (including a GPU container still starting) are worth another try.
  if (status == 408 || status == 425 || status == 429 || status >= 500)
    return RenderError::TRANSIENT;
  return RenderError::FATAL;
}

RenderError HttpRenderClient::classifyCurlCode(int code) {
  switch (static_cast<CURLcode>(code)) {
  case CURLE_OK:
    return RenderError::NONE;
  case CURLE_OPERATION_TIMEDOUT:
    return RenderError::TIMEOUT;
  case CURLE_UNSUPPORTED_PROTOCOL:
  case CURLE_URL_MALFORMAT:
  case CURLE_NOT_BUILT_IN:
    return RenderError::FATAL;
  default:
    return RenderError::TRANSIENT;
  }
}

RenderResult HttpRenderClient::render(const CameraPose &pose,
                                      const std::string &templateId,
                                      const std::string &venueId,
                                      const RenderOptions &options,
                                      std::chrono::milliseconds timeout) {
  if (endpoint_.empty()) {
    return RenderResult::failure(RenderError::FATAL,
                                 "no render endpoint configured");
  }

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(),
                                                           &curl_easy_cleanup);
  if (!curl) {
    LOG_E("RenderClient", "curl_easy_init failed");
    return RenderResult::failure(RenderError::TRANSIENT, "curl_easy_init failed");
  }

  const std::string body = buildRequestBody(pose, templateId, venueId, options);

  struct curl_slist *headers = nullptr;
  headers = curl_slist_append(headers, "Content-Type: application/json");
  headers = curl_slist_append(headers, "Accept: image/png, application/json");
  if (!token_.empty()) {
    const std::string auth = "Authorization: Bearer " + token_;
    headers = curl_slist_append(headers, auth.c_str());
  }
  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headerGuard(
      headers, &curl_slist_free_all);

  std::string response;
  CURL *h = curl.get();
  curl_easy_setopt(h, CURLOPT_URL, endpoint_.c_str());
  curl_easy_setopt(h, CURLOPT_POST, 1L);
  curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(h, CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(h, CURLOPT_USERAGENT, "SeatView/" SEATVIEW_VERSION);

  LOG_D("RenderClient", "POST {} venue={} template={} {}x{}@{}", endpoint_,
        venueId, templateId, options.width, options.height, options.samples);

  CURLcode res = curl_easy_perform(h);
  if (res != CURLE_OK) {
    RenderError kind = classifyCurlCode(res);
    LOG_W("RenderClient", "Render request to {} failed: {}", endpoint_,
          curl_easy_strerror(res));
    return RenderResult::failure(kind, curl_easy_strerror(res));
  }

  long status = 0;
  curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
  RenderError kind = classifyHttpStatus(status);
  if (kind != RenderError::NONE) {
    std::string message = "HTTP " + std::to_string(status);
    auto json = nlohmann::json::parse(response, nullptr, false);
    if (!json.is_discarded() && json.is_object() && json.contains("error") &&
        json["error"].is_string()) {
      message += ": " + json["error"].get<std::string>();
    } else if (!response.empty()) {
      message += ": " + snippet(response);
    }
    LOG_W("RenderClient", "Backend rejected render for venue {}: {}", venueId,
          message);
    return RenderResult::failure(kind, message);
  }

  if (response.empty()) {
    return RenderResult::failure(RenderError::TRANSIENT,
                                 "backend returned an empty image");
  }

  LOG_I("RenderClient", "Rendered {} bytes for venue {}", response.size(),
        venueId);
  return RenderResult::success(std::move(response));
}
