// Thread safety smoke tests for shared clients and the cache.
#include "test_support.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

TEST(ThreadSafetyTest, SharedClientSerializesCommands) {
  avlink_test::ScriptedFactory factory([](const avlink::Command& command, avlink::Response* response) {
    std::this_thread::sleep_for(std::chrono::microseconds(200));
    return avlink_test::EchoHandler(command, response);
  });
  avlink::RegistryConfig config;
  config.log_callback = avlink_test::QuietLog();
  config.client_options.log_callback = avlink_test::QuietLog();
  avlink::ConnectionRegistry registry(config, factory.factory());
  const avlink::DeviceEndpoint dsp = avlink_test::MakeEndpoint(
      "dsp", avlink::ProtocolKind::kAtlas, "10.0.0.20", avlink::kAtlasControlPort);

  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 6; ++t) {
    threads.emplace_back([&, t]() {
      for (int i = 0; i < 25; ++i) {
        avlink::ConnectionHandle handle;
        if (!registry.Acquire(dsp, &handle).ok()) {
          failures++;
          continue;
        }
        avlink::Response response;
        const std::string parameter = "ZoneGain_" + std::to_string(t);
        if (!handle->SendCommand(avlink::Command::Get(parameter), &response).ok() ||
            response.parameter != parameter) {
          failures++;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(factory.created(), 1u);
  EXPECT_EQ(factory.last()->exchanges(), 150);
  EXPECT_EQ(factory.last()->max_in_flight(), 1);
  EXPECT_EQ(avlink::test::GetBorrowCount(registry, dsp.Key()), 0);
}

TEST(ThreadSafetyTest, ConcurrentCacheAccessIsSafe) {
  avlink::CacheManager cache;

  std::thread writer([&]() {
    for (int i = 0; i < 1000; ++i) {
      cache.Set("meters", "m" + std::to_string(i % 10), static_cast<double>(i),
                std::chrono::milliseconds(1000));
    }
  });
  std::thread reader([&]() {
    for (int i = 0; i < 1000; ++i) {
      cache.Get("meters", "m" + std::to_string(i % 10));
    }
  });
  std::thread purger([&]() {
    for (int i = 0; i < 100; ++i) {
      cache.Purge();
      cache.GetStats();
    }
  });

  writer.join();
  reader.join();
  purger.join();

  EXPECT_EQ(cache.GetStats().entries, 10u);
}
