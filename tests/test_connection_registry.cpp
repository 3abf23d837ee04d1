// Tests for connection pooling, borrow counting and idle reclaim.
#include "test_support.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using avlink_test::ScriptedFactory;

namespace {

avlink::RegistryConfig QuietConfig() {
  avlink::RegistryConfig config;
  config.idle_timeout = 5000ms;
  config.log_callback = avlink_test::QuietLog();
  config.client_options.log_callback = avlink_test::QuietLog();
  return config;
}

avlink::DeviceEndpoint Dsp(const std::string& id = "dsp") {
  return avlink_test::MakeEndpoint(id, avlink::ProtocolKind::kAtlas, "10.0.0.20",
                                   avlink::kAtlasControlPort);
}

}  // namespace

TEST(ConnectionRegistryTest, BorrowsAreBalanced) {
  ScriptedFactory factory(avlink_test::EchoHandler);
  avlink::ConnectionRegistry registry(QuietConfig(), factory.factory());
  const std::string key = Dsp().Key();

  avlink::ConnectionHandle first;
  avlink::ConnectionHandle second;
  ASSERT_TRUE(registry.Acquire(Dsp(), &first).ok());
  ASSERT_TRUE(registry.Acquire(Dsp(), &second).ok());
  EXPECT_EQ(avlink::test::GetBorrowCount(registry, key), 2);
  EXPECT_EQ(first->state(), avlink::ConnectionState::kConnected);

  first.Release();
  first.Release();
  EXPECT_EQ(avlink::test::GetBorrowCount(registry, key), 1);
  second.Release();
  EXPECT_EQ(avlink::test::GetBorrowCount(registry, key), 0);
  registry.Release(second);
  EXPECT_EQ(avlink::test::GetBorrowCount(registry, key), 0);

  const avlink::RegistryMetrics metrics = registry.GetMetrics();
  EXPECT_EQ(metrics.acquires, 2u);
  EXPECT_EQ(metrics.releases, 2u);
}

TEST(ConnectionRegistryTest, HandleReleasesOnScopeExit) {
  ScriptedFactory factory(avlink_test::EchoHandler);
  avlink::ConnectionRegistry registry(QuietConfig(), factory.factory());
  {
    avlink::ConnectionHandle handle;
    ASSERT_TRUE(registry.Acquire(Dsp(), &handle).ok());
    avlink::ConnectionHandle moved = std::move(handle);
    EXPECT_FALSE(static_cast<bool>(handle));
    EXPECT_TRUE(static_cast<bool>(moved));
    EXPECT_EQ(avlink::test::GetBorrowCount(registry, Dsp().Key()), 1);
  }
  EXPECT_EQ(avlink::test::GetBorrowCount(registry, Dsp().Key()), 0);
}

TEST(ConnectionRegistryTest, OneClientPerAddressAndPort) {
  ScriptedFactory factory(avlink_test::EchoHandler);
  avlink::ConnectionRegistry registry(QuietConfig(), factory.factory());

  avlink::ConnectionHandle a;
  avlink::ConnectionHandle b;
  ASSERT_TRUE(registry.Acquire(Dsp("zone-a"), &a).ok());
  ASSERT_TRUE(registry.Acquire(Dsp("zone-b"), &b).ok());
  EXPECT_EQ(&a.client(), &b.client());
  EXPECT_EQ(factory.created(), 1u);
  EXPECT_EQ(registry.GetConnections().size(), 1u);
}

TEST(ConnectionRegistryTest, ConcurrentFirstAcquireConnectsOnce) {
  ScriptedFactory factory(avlink_test::EchoHandler);
  avlink::ConnectionRegistry registry(QuietConfig(), factory.factory());

  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&]() {
      avlink::ConnectionHandle handle;
      if (!registry.Acquire(Dsp(), &handle).ok()) {
        failures++;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(failures.load(), 0);
  ASSERT_NE(factory.last(), nullptr);
  EXPECT_EQ(factory.last()->connect_calls(), 1);
  EXPECT_EQ(avlink::test::GetBorrowCount(registry, Dsp().Key()), 0);
}

TEST(ConnectionRegistryTest, FailedConnectHoldsNoBorrow) {
  ScriptedFactory factory(avlink_test::EchoHandler);
  factory.SetConnectStatus(avlink::Status(avlink::ErrorCode::kConnectionError, "refused"));
  avlink::ConnectionRegistry registry(QuietConfig(), factory.factory());

  avlink::ConnectionHandle handle;
  const avlink::Status status = registry.Acquire(Dsp(), &handle);
  EXPECT_EQ(status.code, avlink::ErrorCode::kConnectionError);
  EXPECT_FALSE(static_cast<bool>(handle));
  EXPECT_EQ(avlink::test::GetBorrowCount(registry, Dsp().Key()), 0);
  EXPECT_EQ(registry.GetMetrics().connect_failures, 1u);
}

TEST(ConnectionRegistryTest, ReconnectsClosedSessionOnAcquire) {
  ScriptedFactory factory([](const avlink::Command& command, avlink::Response* response) {
    if (command.parameter == "Silent") {
      return avlink::Status(avlink::ErrorCode::kTimeout, "no reply");
    }
    return avlink_test::EchoHandler(command, response);
  });
  avlink::ConnectionRegistry registry(QuietConfig(), factory.factory());

  {
    avlink::ConnectionHandle handle;
    ASSERT_TRUE(registry.Acquire(Dsp(), &handle).ok());
    EXPECT_EQ(handle->SendCommand(avlink::Command::Get("Silent"), nullptr).code,
              avlink::ErrorCode::kTimeout);
    EXPECT_EQ(handle->state(), avlink::ConnectionState::kDisconnected);
  }
  avlink::ConnectionHandle handle;
  ASSERT_TRUE(registry.Acquire(Dsp(), &handle).ok());
  EXPECT_EQ(handle->state(), avlink::ConnectionState::kConnected);
  EXPECT_EQ(factory.last()->connect_calls(), 2);
  EXPECT_EQ(factory.created(), 1u);
}

TEST(ConnectionRegistryTest, IdleReclaimWaitsForThreshold) {
  ScriptedFactory factory(avlink_test::EchoHandler);
  avlink::ConnectionRegistry registry(QuietConfig(), factory.factory());
  const std::string key = Dsp().Key();
  {
    avlink::ConnectionHandle handle;
    ASSERT_TRUE(registry.Acquire(Dsp(), &handle).ok());
  }
  const auto base = std::chrono::steady_clock::now();
  avlink::test::SetLastActivity(registry, key, base);

  avlink::test::SweepIdle(registry, base + 5000ms);
  EXPECT_EQ(avlink::test::GetBorrowCount(registry, key), 0);

  avlink::test::SweepIdle(registry, base + 5001ms);
  EXPECT_EQ(avlink::test::GetBorrowCount(registry, key), -1);
  EXPECT_EQ(registry.GetMetrics().reclaimed, 1u);
}

TEST(ConnectionRegistryTest, BorrowedConnectionIsNeverReclaimed) {
  ScriptedFactory factory(avlink_test::EchoHandler);
  avlink::ConnectionRegistry registry(QuietConfig(), factory.factory());
  const std::string key = Dsp().Key();

  avlink::ConnectionHandle handle;
  ASSERT_TRUE(registry.Acquire(Dsp(), &handle).ok());
  const auto base = std::chrono::steady_clock::now();
  avlink::test::SetLastActivity(registry, key, base - 1h);
  avlink::test::SweepIdle(registry, base + 1h);

  EXPECT_EQ(avlink::test::GetBorrowCount(registry, key), 1);
  EXPECT_EQ(handle->state(), avlink::ConnectionState::kConnected);
}

TEST(ConnectionRegistryTest, RetiredEntryGoesOnceUnborrowed) {
  ScriptedFactory factory(avlink_test::EchoHandler);
  avlink::ConnectionRegistry registry(QuietConfig(), factory.factory());
  const std::string key = Dsp().Key();

  avlink::ConnectionHandle handle;
  ASSERT_TRUE(registry.Acquire(Dsp(), &handle).ok());
  registry.Retire(Dsp());
  avlink::test::SweepIdle(registry, std::chrono::steady_clock::now());
  EXPECT_EQ(avlink::test::GetBorrowCount(registry, key), 1);

  handle.Release();
  avlink::test::SweepIdle(registry, std::chrono::steady_clock::now());
  EXPECT_EQ(avlink::test::GetBorrowCount(registry, key), -1);
}

TEST(ConnectionRegistryTest, ForwardsPushedUpdates) {
  ScriptedFactory factory(avlink_test::EchoHandler, true);
  avlink::ConnectionRegistry registry(QuietConfig(), factory.factory());
  std::vector<std::string> seen;
  registry.SetUpdateCallback(
      [&](const avlink::DeviceEndpoint& endpoint, const avlink::ParameterUpdate& update) {
        seen.push_back(endpoint.id + ":" + update.parameter);
      });

  avlink::ConnectionHandle handle;
  ASSERT_TRUE(registry.Acquire(Dsp(), &handle).ok());
  avlink::ParameterUpdate update;
  update.parameter = "ZoneGain_0";
  update.value = -3.0;
  factory.last()->QueueUpdate(update);
  ASSERT_TRUE(handle->PollUpdates().ok());

  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0], "dsp:ZoneGain_0");
}

TEST(ConnectionRegistryTest, StopClosesConnections) {
  ScriptedFactory factory(avlink_test::EchoHandler);
  avlink::ConnectionRegistry registry(QuietConfig(), factory.factory());
  ASSERT_TRUE(registry.Start());
  {
    avlink::ConnectionHandle handle;
    ASSERT_TRUE(registry.Acquire(Dsp(), &handle).ok());
  }
  registry.Stop();
  EXPECT_TRUE(registry.GetConnections().empty());
}

TEST(ConnectionRegistryTest, StartRejectsInvalidConfig) {
  avlink::RegistryConfig config = QuietConfig();
  config.idle_timeout = 0ms;
  avlink::ConnectionRegistry registry(config);
  EXPECT_FALSE(registry.Start());
  EXPECT_NE(registry.GetLastError().find("idle_timeout"), std::string::npos);
}
