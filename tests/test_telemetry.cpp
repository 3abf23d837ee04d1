// Tests for cached, coalesced and batched telemetry reads.
#include "test_support.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>

using namespace std::chrono_literals;
using avlink_test::ScriptedFactory;

namespace {

avlink::DeviceEndpoint Dsp() {
  return avlink_test::MakeEndpoint("dsp", avlink::ProtocolKind::kAtlas, "10.0.0.20",
                                   avlink::kAtlasControlPort);
}

avlink::RegistryConfig QuietRegistry() {
  avlink::RegistryConfig config;
  config.log_callback = avlink_test::QuietLog();
  config.client_options.log_callback = avlink_test::QuietLog();
  return config;
}

avlink::TelemetryConfig QuietTelemetry() {
  avlink::TelemetryConfig config;
  config.log_callback = avlink_test::QuietLog();
  return config;
}

// Meters report minus their index; "ZoneMeter_3" and anything while `failing`
// is set time out.
struct MeterDevice {
  std::atomic<bool> failing{false};

  avlink_test::ScriptedFactory::Handler handler() {
    return [this](const avlink::Command& command, avlink::Response* response) {
      if (command.kind != avlink::CommandKind::kGet) {
        return avlink::Status::Ok();
      }
      if (failing.load() || command.parameter == "ZoneMeter_3") {
        return avlink::Status(avlink::ErrorCode::kTimeout, "no reply");
      }
      const size_t underscore = command.parameter.rfind('_');
      const double index =
          underscore == std::string::npos ? 0.0 : std::stod(command.parameter.substr(underscore + 1));
      response->parameter = command.parameter;
      response->value = -index;
      return avlink::Status::Ok();
    };
  }
};

int CountKind(const avlink::test::ScriptedClient& client, avlink::CommandKind kind) {
  int count = 0;
  for (const auto& command : client.commands()) {
    if (command.kind == kind) {
      count++;
    }
  }
  return count;
}

class TelemetryTest : public ::testing::Test {
 protected:
  explicit TelemetryTest(bool pushes = true)
      : factory_(device_.handler(), pushes),
        directory_({Dsp()}),
        registry_(QuietRegistry(), factory_.factory()),
        telemetry_(QuietTelemetry(), registry_, cache_, directory_) {}

  MeterDevice device_;
  ScriptedFactory factory_;
  avlink::StaticDeviceDirectory directory_;
  avlink::CacheManager cache_;
  avlink::ConnectionRegistry registry_;
  avlink::TelemetryManager telemetry_;
};

class PollOnlyTelemetryTest : public TelemetryTest {
 protected:
  PollOnlyTelemetryTest() : TelemetryTest(false) {}
};

}  // namespace

TEST_F(TelemetryTest, ReadWithinTtlIsServedFromCache) {
  const avlink::TelemetryReading first = telemetry_.Read("dsp", "ZoneMeter_1");
  EXPECT_EQ(first.source, avlink::ReadSource::kFresh);
  EXPECT_DOUBLE_EQ(std::get<double>(first.value), -1.0);

  auto second = std::async(std::launch::async, [&]() { return telemetry_.Read("dsp", "ZoneMeter_1"); });
  auto third = std::async(std::launch::async, [&]() { return telemetry_.Read("dsp", "ZoneMeter_1"); });
  EXPECT_EQ(second.get().source, avlink::ReadSource::kCached);
  EXPECT_EQ(third.get().source, avlink::ReadSource::kCached);

  EXPECT_EQ(factory_.last()->exchanges(), 1);
  EXPECT_EQ(telemetry_.GetMetrics().cache_hits, 2u);
}

TEST(TelemetryCoalescingTest, ConcurrentMissesShareOneRoundTrip) {
  std::promise<void> release;
  std::shared_future<void> released = release.get_future().share();
  ScriptedFactory factory([released](const avlink::Command& command, avlink::Response* response) {
    released.wait();
    response->parameter = command.parameter;
    response->value = -30.0;
    return avlink::Status::Ok();
  });
  avlink::StaticDeviceDirectory directory({Dsp()});
  avlink::CacheManager cache;
  avlink::ConnectionRegistry registry(QuietRegistry(), factory.factory());
  avlink::TelemetryManager telemetry(QuietTelemetry(), registry, cache, directory);

  auto first = std::async(std::launch::async, [&]() { return telemetry.Read("dsp", "ZoneMeter_0"); });
  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while ((factory.last() == nullptr || factory.last()->exchanges() == 0) &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(1ms);
  }
  auto second = std::async(std::launch::async, [&]() { return telemetry.Read("dsp", "ZoneMeter_0"); });
  while (telemetry.GetMetrics().coalesced == 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(1ms);
  }
  release.set_value();

  const avlink::TelemetryReading a = first.get();
  const avlink::TelemetryReading b = second.get();
  EXPECT_EQ(a.source, avlink::ReadSource::kFresh);
  EXPECT_EQ(b.source, avlink::ReadSource::kFresh);
  EXPECT_DOUBLE_EQ(std::get<double>(b.value), -30.0);
  EXPECT_EQ(factory.last()->exchanges(), 1);
  EXPECT_EQ(telemetry.GetMetrics().coalesced, 1u);
}

TEST_F(TelemetryTest, LateMissReusesValueStoredByLeader) {
  ASSERT_EQ(telemetry_.Read("dsp", "ZoneMeter_2").source, avlink::ReadSource::kFresh);
  ASSERT_EQ(factory_.last()->exchanges(), 1);

  // A reader that missed the cache just before the first fetch stored it.
  EXPECT_EQ(avlink::test::LoadAfterCacheMiss(telemetry_, "dsp", "ZoneMeter_2"),
            avlink::ReadSource::kCached);
  EXPECT_EQ(factory_.last()->exchanges(), 1);
}

TEST_F(TelemetryTest, BatchKeepsPositionsWhenOneChannelTimesOut) {
  const auto values = telemetry_.ReadIndexed("dsp", "ZoneMeter_", 8);
  ASSERT_EQ(values.size(), 8u);
  for (size_t i = 0; i < values.size(); ++i) {
    if (i == 3) {
      EXPECT_FALSE(values[i].has_value());
      continue;
    }
    ASSERT_TRUE(values[i].has_value()) << "index " << i;
    EXPECT_DOUBLE_EQ(std::get<double>(*values[i]), -static_cast<double>(i));
  }
}

TEST_F(TelemetryTest, DeviceFailureServesLastGoodValue) {
  ASSERT_EQ(telemetry_.Read("dsp", "ZoneMeter_2").source, avlink::ReadSource::kFresh);
  cache_.ClearNamespace(avlink::kTelemetryNamespace);
  device_.failing = true;

  const avlink::TelemetryReading reading = telemetry_.Read("dsp", "ZoneMeter_2");
  EXPECT_EQ(reading.source, avlink::ReadSource::kStale);
  EXPECT_DOUBLE_EQ(std::get<double>(reading.value), -2.0);
  EXPECT_EQ(reading.error.code, avlink::ErrorCode::kTimeout);
  EXPECT_EQ(telemetry_.GetMetrics().stale_serves, 1u);
}

TEST_F(TelemetryTest, FailureWithoutHistoryIsUnavailable) {
  device_.failing = true;
  const avlink::TelemetryReading reading = telemetry_.Read("dsp", "ZoneMeter_2");
  EXPECT_EQ(reading.source, avlink::ReadSource::kUnavailable);
  EXPECT_FALSE(reading.has_value());
  EXPECT_EQ(reading.error.code, avlink::ErrorCode::kTimeout);
}

TEST_F(TelemetryTest, UnknownDeviceIsUnavailable) {
  const avlink::TelemetryReading reading = telemetry_.Read("nope", "ZoneMeter_0");
  EXPECT_EQ(reading.source, avlink::ReadSource::kUnavailable);
  EXPECT_EQ(reading.error.code, avlink::ErrorCode::kDeviceNotFound);
}

TEST_F(TelemetryTest, EnsureSubscribedIsIdempotent) {
  EXPECT_EQ(telemetry_.EnsureSubscribed("", "ZoneGain_0").code,
            avlink::ErrorCode::kValidationError);
  EXPECT_EQ(telemetry_.EnsureSubscribed("nope", "ZoneGain_0").code,
            avlink::ErrorCode::kDeviceNotFound);

  ASSERT_TRUE(telemetry_.EnsureSubscribed("dsp", "ZoneGain_0").ok());
  ASSERT_TRUE(telemetry_.EnsureSubscribed("dsp", "ZoneGain_0").ok());
  EXPECT_EQ(CountKind(*factory_.last(), avlink::CommandKind::kSubscribe), 1);

  const auto subscriptions = telemetry_.GetSubscriptions();
  ASSERT_EQ(subscriptions.size(), 1u);
  EXPECT_TRUE(subscriptions[0].active);
  EXPECT_TRUE(subscriptions[0].pushed);
}

TEST_F(TelemetryTest, PushedUpdateLandsInCache) {
  ASSERT_TRUE(telemetry_.EnsureSubscribed("dsp", "ZoneGain_0").ok());
  avlink::ParameterUpdate update;
  update.parameter = "ZoneGain_0";
  update.value = -7.0;
  factory_.last()->QueueUpdate(update);

  avlink::test::RunTelemetryRefresh(telemetry_, std::chrono::steady_clock::now());

  const avlink::TelemetryReading reading = telemetry_.Read("dsp", "ZoneGain_0");
  EXPECT_EQ(reading.source, avlink::ReadSource::kCached);
  EXPECT_DOUBLE_EQ(std::get<double>(reading.value), -7.0);
  EXPECT_EQ(telemetry_.GetMetrics().updates_applied, 1u);
}

TEST_F(TelemetryTest, RefreshResubscribesAfterReconnect) {
  ASSERT_TRUE(telemetry_.EnsureSubscribed("dsp", "ZoneGain_0").ok());
  {
    avlink::ConnectionHandle handle;
    ASSERT_TRUE(registry_.Acquire(Dsp(), &handle).ok());
    device_.failing = true;
    EXPECT_EQ(handle->SendCommand(avlink::Command::Get("ZoneGain_0"), nullptr).code,
              avlink::ErrorCode::kTimeout);
    device_.failing = false;
  }

  avlink::test::RunTelemetryRefresh(telemetry_, std::chrono::steady_clock::now());
  EXPECT_EQ(CountKind(*factory_.last(), avlink::CommandKind::kSubscribe), 2);
}

TEST_F(TelemetryTest, IdleSubscriptionIsDeactivated) {
  ASSERT_TRUE(telemetry_.EnsureSubscribed("dsp", "ZoneGain_0").ok());
  const auto later = std::chrono::steady_clock::now() + QuietTelemetry().retention + 1s;
  avlink::test::RunTelemetryRefresh(telemetry_, later);

  const auto subscriptions = telemetry_.GetSubscriptions();
  ASSERT_EQ(subscriptions.size(), 1u);
  EXPECT_FALSE(subscriptions[0].active);
  EXPECT_EQ(CountKind(*factory_.last(), avlink::CommandKind::kUnsubscribe), 1);

  // A later request reactivates it.
  ASSERT_TRUE(telemetry_.EnsureSubscribed("dsp", "ZoneGain_0").ok());
  EXPECT_TRUE(telemetry_.GetSubscriptions()[0].active);
}

TEST_F(PollOnlyTelemetryTest, DevicesWithoutPushArePolled) {
  ASSERT_TRUE(telemetry_.EnsureSubscribed("dsp", "ZoneMeter_5").ok());
  EXPECT_EQ(CountKind(*factory_.last(), avlink::CommandKind::kSubscribe), 0);
  ASSERT_FALSE(telemetry_.GetSubscriptions()[0].pushed);

  avlink::test::RunTelemetryRefresh(telemetry_, std::chrono::steady_clock::now());
  const avlink::TelemetryReading reading = telemetry_.Read("dsp", "ZoneMeter_5");
  EXPECT_EQ(reading.source, avlink::ReadSource::kCached);
  EXPECT_DOUBLE_EQ(std::get<double>(reading.value), -5.0);
}
