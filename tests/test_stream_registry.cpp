#include <gtest/gtest.h>

#include <chrono>
#include <set>
#include <thread>
#include <vector>

#include "fakes.hpp"
#include "stream_registry.hpp"

using namespace std::chrono;

class StreamRegistryTest : public ::testing::Test {
protected:
  void SetUp() override {
    cache = std::make_unique<ResourceCache>();
    source = std::make_shared<FakeFrameSource>();
    encoder = std::make_shared<FakeEncoder>();
    rc.limits.max_streams = 3;
    rc.scheduler.call_timeout_ms = 0;
    registry = std::make_unique<StreamRegistry>(rc, *cache, source, encoder);
  }

  void TearDown() override { registry.reset(); }

  StreamConfig request(int fps = 20) const {
    StreamConfig c = preset_config(PerformanceMode::BALANCED);
    c.target_fps = fps;
    return c;
  }

  template <typename Fn>
  ErrorCode code_of(Fn fn) {
    try {
      fn();
    } catch (const StreamError& e) {
      return e.code();
    }
    ADD_FAILURE() << "expected StreamError";
    return ErrorCode::InvalidState;
  }

  RegistryConfig rc;
  std::unique_ptr<ResourceCache> cache;
  std::shared_ptr<FakeFrameSource> source;
  std::shared_ptr<FakeEncoder> encoder;
  std::unique_ptr<StreamRegistry> registry;
};

TEST_F(StreamRegistryTest, CreateAssignsUniqueIds) {
  auto a = registry->create(request());
  auto b = registry->create(request());
  EXPECT_NE(a, b);
  EXPECT_EQ(a.rfind("stream-", 0), 0u);
  EXPECT_EQ(a.size(), std::string("stream-").size() + 8);
  EXPECT_EQ(registry->active_count(), 2u);
}

TEST_F(StreamRegistryTest, GetRoundTripsConfig) {
  StreamConfig req = request(15);
  req.quality = 60;
  req.region = Region{10, 20, 320, 240};
  req.format = ImageFormat::PNG;

  auto id = registry->create(req);
  auto got = registry->get(id);
  ASSERT_TRUE(got.has_value());
  req.id = id;
  EXPECT_EQ(*got, req);

  auto info = registry->info(id);
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->state, StreamState::Idle);
  EXPECT_FALSE(info->degraded);
}

TEST_F(StreamRegistryTest, ListReturnsEveryLiveStream) {
  std::set<std::string> ids{registry->create(request()), registry->create(request())};
  std::set<std::string> listed;
  for (const auto& c : registry->list()) listed.insert(c.id);
  EXPECT_EQ(listed, ids);
}

TEST_F(StreamRegistryTest, InvalidRequestIsRejected) {
  EXPECT_EQ(code_of([&] { registry->create(request(0)); }), ErrorCode::InvalidConfig);
  EXPECT_EQ(code_of([&] { registry->create(request(1000)); }), ErrorCode::InvalidConfig);
  StreamConfig bad = request();
  bad.region = Region{0, 0, 5000, 10};
  EXPECT_EQ(code_of([&] { registry->create(bad); }), ErrorCode::InvalidConfig);
  EXPECT_EQ(registry->active_count(), 0u);
}

TEST_F(StreamRegistryTest, StreamLimitIsEnforced) {
  for (int i = 0; i < 3; ++i) registry->create(request());
  EXPECT_EQ(code_of([&] { registry->create(request()); }), ErrorCode::ResourceExhausted);

  // Stopping a stream frees its slot.
  registry->stop(registry->list().front().id);
  EXPECT_NO_THROW(registry->create(request()));
}

TEST_F(StreamRegistryTest, StartProducesFrames) {
  auto id = registry->create(request(50));
  auto ch = registry->subscribe(id);
  registry->start(id);

  auto n = ch->pop(milliseconds(2000));
  ASSERT_TRUE(n.has_value());
  EXPECT_EQ(n->stream_id, id);
  EXPECT_NE(cache->get(n->uri), nullptr);
  EXPECT_EQ(registry->info(id)->state, StreamState::Running);

  registry->stop(id);
  EXPECT_TRUE(ch->closed());
}

TEST_F(StreamRegistryTest, StopIsIdempotent) {
  auto id = registry->create(request());
  registry->start(id);
  registry->stop(id);
  EXPECT_NO_THROW(registry->stop(id));
  EXPECT_FALSE(registry->get(id).has_value());
  EXPECT_EQ(registry->active_count(), 0u);
}

TEST_F(StreamRegistryTest, StartAfterStopFails) {
  auto id = registry->create(request());
  registry->stop(id);
  EXPECT_EQ(code_of([&] { registry->start(id); }), ErrorCode::InvalidState);
}

TEST_F(StreamRegistryTest, DoubleStartFails) {
  auto id = registry->create(request());
  registry->start(id);
  EXPECT_EQ(code_of([&] { registry->start(id); }), ErrorCode::InvalidState);
}

TEST_F(StreamRegistryTest, UnknownIdsAreNotFound) {
  EXPECT_EQ(code_of([&] { registry->start("stream-missing"); }), ErrorCode::NotFound);
  EXPECT_EQ(code_of([&] { registry->stop("stream-missing"); }), ErrorCode::NotFound);
  EXPECT_EQ(code_of([&] { registry->subscribe("stream-missing"); }), ErrorCode::NotFound);
  EXPECT_FALSE(registry->get("stream-missing").has_value());
  EXPECT_FALSE(registry->metrics("stream-missing").has_value());
}

TEST_F(StreamRegistryTest, SetQualityValidatesRange) {
  auto id = registry->create(request());
  EXPECT_EQ(code_of([&] { registry->set_quality(id, 0); }), ErrorCode::InvalidConfig);
  EXPECT_EQ(code_of([&] { registry->set_quality(id, 101); }), ErrorCode::InvalidConfig);
  EXPECT_EQ(registry->set_quality(id, 50), 50);
}

TEST_F(StreamRegistryTest, SetQualityReportsClampedValue) {
  StreamConfig req = request();
  req.min_quality = 40;
  req.max_quality = 80;
  auto id = registry->create(req);
  EXPECT_EQ(registry->set_quality(id, 100), 80);
  EXPECT_EQ(registry->set_quality(id, 1), 40);
}

TEST_F(StreamRegistryTest, StopDoesNotWaitForBlockedBackend) {
  RegistryConfig blocking_rc;
  blocking_rc.scheduler.call_timeout_ms = 150;
  auto blocking = std::make_shared<BlockingFrameSource>();
  StreamRegistry reg(blocking_rc, *cache, blocking, encoder);

  StreamConfig req = request(5);  // 200 ms period
  auto id = reg.create(req);
  reg.start(id);
  while (!blocking->entered.load()) std::this_thread::sleep_for(milliseconds(5));
  std::this_thread::sleep_for(milliseconds(50));

  const auto t0 = steady_clock::now();
  reg.stop(id);
  EXPECT_LT(steady_clock::now() - t0, milliseconds(200));
  EXPECT_FALSE(reg.get(id).has_value());
  EXPECT_GE(reg.abandoned_calls(), 1u);

  // The registry joins the stuck call once the backend returns.
  blocking->release();
}

TEST_F(StreamRegistryTest, StoppedIdsAreBounded) {
  RegistryConfig small_rc = rc;
  small_rc.max_tombstones = 2;
  StreamRegistry reg(small_rc, *cache, source, encoder);

  std::vector<std::string> ids;
  for (int i = 0; i < 3; ++i) {
    ids.push_back(reg.create(request()));
    reg.stop(ids.back());
  }
  // Oldest tombstone forgotten; the two most recent still stop idempotently.
  EXPECT_EQ(code_of([&] { reg.stop(ids[0]); }), ErrorCode::NotFound);
  EXPECT_NO_THROW(reg.stop(ids[1]));
  EXPECT_NO_THROW(reg.stop(ids[2]));
  EXPECT_EQ(code_of([&] { reg.start(ids[2]); }), ErrorCode::InvalidState);
}

TEST_F(StreamRegistryTest, CallbackSubscription) {
  auto id = registry->create(request(50));
  std::atomic<int> frames{0};
  registry->on_frame(id, [&frames](const FrameNotice&) { ++frames; });
  registry->start(id);
  const auto deadline = steady_clock::now() + seconds(2);
  while (frames.load() < 3 && steady_clock::now() < deadline) {
    std::this_thread::sleep_for(milliseconds(5));
  }
  registry->stop(id);
  EXPECT_GE(frames.load(), 3);
}

TEST_F(StreamRegistryTest, StopAllStopsEverything) {
  for (int i = 0; i < 3; ++i) registry->start(registry->create(request()));
  registry->stop_all();
  EXPECT_EQ(registry->active_count(), 0u);
  EXPECT_TRUE(registry->list().empty());
}
