// End-to-end click -> image flow against a scripted render backend.

#include "TestVenues.h"
#include "core/Errors.h"
#include "core/WorkerService.h"
#include "network/RenderClient.h"
#include "services/SeatViewService.h"

#include <gtest/gtest.h>

#include <deque>
#include <mutex>
#include <stop_token>
#include <thread>

using namespace std::chrono_literals;

namespace {

// Plays back queued outcomes, then succeeds.
class FakeRenderClient : public RenderClient {
public:
  RenderResult render(const CameraPose &pose, const std::string &templateId,
                      const std::string &venueId, const RenderOptions &options,
                      std::chrono::milliseconds) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++calls_;
    lastPose_ = pose;
    lastTemplate_ = templateId;
    lastVenue_ = venueId;
    lastOptions_ = options;
    if (!script_.empty()) {
      RenderError e = script_.front();
      script_.pop_front();
      if (e != RenderError::NONE)
        return RenderResult::failure(e, renderErrorToString(e));
    }
    return RenderResult::success("png:" + venueId + ":" + std::to_string(options.width));
  }

  void queue(std::initializer_list<RenderError> errors) {
    std::lock_guard<std::mutex> lock(mutex_);
    script_.insert(script_.end(), errors);
  }

  int calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }
  RenderOptions lastOptions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastOptions_;
  }
  std::string lastTemplate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastTemplate_;
  }

private:
  mutable std::mutex mutex_;
  std::deque<RenderError> script_;
  int calls_ = 0;
  CameraPose lastPose_;
  std::string lastTemplate_;
  std::string lastVenue_;
  RenderOptions lastOptions_;
};

class SeatViewServiceTest : public ::testing::Test {
protected:
  SeatViewServiceTest() : workers_(2) {
    registry_.replace(TestVenues::scenarioPtr());
    options_.backoff = 1ms;
    options_.retries = 2;
    options_.cache.renderTimeout = 5s;
  }

  VenueRegistry registry_;
  FakeRenderClient client_;
  WorkerService workers_;
  SeatViewOptions options_;
};

} // namespace

TEST_F(SeatViewServiceTest, RepeatViewIsServedFromCache) {
  SeatViewService service(registry_, client_, workers_, options_);

  SeatViewResult first = service.view("yankee_stadium", {0.5, 0.875});
  SeatViewResult second = service.view("yankee_stadium", {0.5, 0.875});

  ASSERT_TRUE(first.render.ok());
  ASSERT_TRUE(second.render.ok());
  EXPECT_EQ(client_.calls(), 1);
  EXPECT_EQ(first.fingerprint, second.fingerprint);
  EXPECT_EQ(first.render.image, second.render.image);
  EXPECT_EQ(first.mapping.sectionId, "101");
  EXPECT_EQ(first.attempts, 1);
  EXPECT_EQ(service.cache().stats().hits, 1u);
  EXPECT_EQ(client_.lastTemplate(), "yankee_stadium.blend");
}

TEST_F(SeatViewServiceTest, NearbyClicksShareRender) {
  SeatViewService service(registry_, client_, workers_, options_);

  SeatViewResult a = service.view("yankee_stadium", {0.5, 0.875});
  SeatViewResult b = service.view("yankee_stadium", {0.5004, 0.8752});
  EXPECT_EQ(a.fingerprint, b.fingerprint);
  EXPECT_EQ(client_.calls(), 1);
}

TEST_F(SeatViewServiceTest, PresetSelectsResolutionAndKey) {
  SeatViewService service(registry_, client_, workers_, options_);

  SeatViewResult preview =
      service.view("yankee_stadium", {0.5, 0.875}, RenderPreset::PREVIEW);
  EXPECT_EQ(client_.lastOptions().width, SeatView::PREVIEW_WIDTH);
  EXPECT_EQ(client_.lastOptions().samples, SeatView::PREVIEW_SAMPLES);

  SeatViewResult full = service.view("yankee_stadium", {0.5, 0.875}, RenderPreset::FULL);
  EXPECT_EQ(client_.lastOptions().width, SeatView::FULL_WIDTH);
  EXPECT_NE(preview.fingerprint, full.fingerprint);
  EXPECT_EQ(client_.calls(), 2);
}

TEST_F(SeatViewServiceTest, TransientFailureIsRetried) {
  client_.queue({RenderError::TRANSIENT});
  SeatViewService service(registry_, client_, workers_, options_);

  SeatViewResult r = service.view("yankee_stadium", {0.5, 0.875});
  ASSERT_TRUE(r.render.ok());
  EXPECT_EQ(r.attempts, 2);
  EXPECT_EQ(client_.calls(), 2);
}

TEST_F(SeatViewServiceTest, TimeoutIsRetried) {
  client_.queue({RenderError::TIMEOUT, RenderError::TRANSIENT});
  SeatViewService service(registry_, client_, workers_, options_);

  SeatViewResult r = service.view("yankee_stadium", {0.5, 0.875});
  ASSERT_TRUE(r.render.ok());
  EXPECT_EQ(r.attempts, 3);
}

TEST_F(SeatViewServiceTest, FatalFailureIsNotRetried) {
  client_.queue({RenderError::FATAL});
  SeatViewService service(registry_, client_, workers_, options_);

  SeatViewResult r = service.view("yankee_stadium", {0.5, 0.875});
  EXPECT_EQ(r.render.error, RenderError::FATAL);
  EXPECT_EQ(r.attempts, 1);
  EXPECT_EQ(client_.calls(), 1);
  EXPECT_FALSE(service.cache().contains(r.fingerprint));
}

TEST_F(SeatViewServiceTest, RetriesAreBounded) {
  client_.queue({RenderError::TRANSIENT, RenderError::TRANSIENT,
                 RenderError::TRANSIENT, RenderError::TRANSIENT});
  SeatViewService service(registry_, client_, workers_, options_);

  SeatViewResult r = service.view("yankee_stadium", {0.5, 0.875});
  EXPECT_EQ(r.render.error, RenderError::TRANSIENT);
  EXPECT_EQ(r.attempts, 3);
  EXPECT_EQ(client_.calls(), 3);

  // The mapping is still returned for a placeholder view
  EXPECT_EQ(r.mapping.sectionId, "101");
}

TEST_F(SeatViewServiceTest, StopDuringBackoffCancels) {
  client_.queue({RenderError::TRANSIENT});
  options_.backoff = 10s;
  SeatViewService service(registry_, client_, workers_, options_);

  std::stop_source source;
  std::thread stopper([&] {
    while (client_.calls() == 0)
      std::this_thread::sleep_for(1ms);
    std::this_thread::sleep_for(20ms);
    source.request_stop();
  });
  const auto started = std::chrono::steady_clock::now();
  SeatViewResult r = service.view("yankee_stadium", {0.5, 0.875}, RenderPreset::FULL,
                                  source.get_token());
  stopper.join();

  EXPECT_EQ(r.render.error, RenderError::CANCELLED);
  EXPECT_EQ(r.attempts, 1);
  EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST_F(SeatViewServiceTest, UnknownVenueThrows) {
  SeatViewService service(registry_, client_, workers_, options_);
  EXPECT_THROW(service.view("nowhere", {0.5, 0.5}), InvalidVenueConfig);
  EXPECT_THROW(service.locate("nowhere", {0.5, 0.5}), InvalidVenueConfig);
  EXPECT_EQ(client_.calls(), 0);
}

TEST_F(SeatViewServiceTest, LocateDoesNotRender) {
  SeatViewService service(registry_, client_, workers_, options_);

  SeatMapping m = service.locate("yankee_stadium", {0.5, 0.5});
  EXPECT_EQ(m.sectionId, "101");
  EXPECT_EQ(m.resolution, SectionResolution::NEAREST);
  EXPECT_EQ(client_.calls(), 0);
  EXPECT_EQ(service.mapper().stats().outOfBounds, 1u);
}

TEST_F(SeatViewServiceTest, ReloadedVenueChangesKey) {
  SeatViewService service(registry_, client_, workers_, options_);
  SeatViewResult before = service.view("yankee_stadium", {0.5, 0.875});

  Venue moved = TestVenues::scenario();
  moved.templateId = "yankee_stadium_v2.blend";
  registry_.replace(std::make_shared<const Venue>(moved));

  SeatViewResult after = service.view("yankee_stadium", {0.5, 0.875});
  EXPECT_NE(before.fingerprint, after.fingerprint);
  EXPECT_EQ(client_.lastTemplate(), "yankee_stadium_v2.blend");
  EXPECT_EQ(client_.calls(), 2);
}

TEST(SeatViewOptions, FromConfig) {
  AppConfig cfg;
  cfg.fovMinDeg = 40.0;
  cfg.fovMaxDeg = 80.0;
  cfg.cacheMaxBytes = 1024;
  cfg.cacheMaxEntries = 8;
  cfg.cacheTtlS = 60;
  cfg.renderTimeoutMs = 2500;
  cfg.renderRetries = 5;
  cfg.renderBackoffMs = 250;
  cfg.positionPrecisionM = 0.25;
  cfg.fovPrecisionDeg = 1.0;

  SeatViewOptions o = SeatViewOptions::fromConfig(cfg);
  EXPECT_DOUBLE_EQ(o.mapper.fovMinDeg, 40.0);
  EXPECT_DOUBLE_EQ(o.mapper.fovMaxDeg, 80.0);
  EXPECT_EQ(o.cache.maxBytes, 1024u);
  EXPECT_EQ(o.cache.maxEntries, 8u);
  EXPECT_EQ(o.cache.ttl, 60s);
  EXPECT_EQ(o.cache.renderTimeout, 2500ms);
  EXPECT_EQ(o.retries, 5);
  EXPECT_EQ(o.backoff, 250ms);
  EXPECT_DOUBLE_EQ(o.precision.positionM, 0.25);
  EXPECT_DOUBLE_EQ(o.precision.fovDeg, 1.0);
}
