// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Porta, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using namespace porta::network;

namespace
{
class NullConnection : public IConnection
{
public:
  void close() noexcept override { open = false; }
  bool isOpen() const override { return open; }
  int nativeHandle() const override { return -1; }
  std::string peerAddress() const override { return "test:0"; }
  bool open{true};
};

class RecordingHandler : public IProtocolHandler
{
public:
  SocketState process(const SocketWrapperPtr &wrapper, SocketEvent event) override
  {
    ++processed;
    lastEvent = event;
    lastId = wrapper->id();
    if (throwOnProcess)
      throw std::runtime_error("handler exploded");
    return result;
  }
  std::vector<SocketWrapperPtr> getOpenConnections() override { return {}; }
  void release(const SocketWrapperPtr &) override { ++released; }

  SocketState result{SocketState::Open};
  bool throwOnProcess{false};
  int processed{0};
  int released{0};
  SocketEvent lastEvent{SocketEvent::OpenRead};
  std::uint64_t lastId{0};
};

SocketWrapperPtr makeWrapper(std::function<void()> onRelease = nullptr)
{
  return std::make_shared<SocketWrapper>(std::make_unique<NullConnection>(), std::move(onRelease));
}
} // namespace

TEST_CASE("ProcessorPool caches up to its capacity", "[pool]")
{
  ProcessorPool<int> pool(2);
  REQUIRE(pool.acquire() == nullptr);

  REQUIRE(pool.release(std::make_unique<int>(1)));
  REQUIRE(pool.release(std::make_unique<int>(2)));
  REQUIRE_FALSE(pool.release(std::make_unique<int>(3)));
  REQUIRE_FALSE(pool.release(nullptr));
  REQUIRE(pool.size() == 2);

  auto obj = pool.acquire();
  REQUIRE(obj != nullptr);
  REQUIRE(*obj == 2);

  auto stats = pool.getStats();
  REQUIRE(stats.available == 1);
  REQUIRE(stats.capacity == 2);
  REQUIRE(stats.hits == 1);
  REQUIRE(stats.misses == 1);
  REQUIRE(stats.released == 2);
  REQUIRE(stats.discarded == 1);
}

TEST_CASE("ProcessorPool with zero capacity never caches", "[pool]")
{
  ProcessorPool<int> pool(0);
  REQUIRE_FALSE(pool.release(std::make_unique<int>(1)));
  REQUIRE(pool.size() == 0);
  REQUIRE(pool.acquire() == nullptr);
}

TEST_CASE("ProcessorPool setCapacity trims and clear empties", "[pool]")
{
  ProcessorPool<int> pool(4);
  for (int i = 0; i < 4; ++i)
    REQUIRE(pool.release(std::make_unique<int>(i)));

  pool.setCapacity(1);
  REQUIRE(pool.size() == 1);
  REQUIRE(pool.capacity() == 1);
  REQUIRE(pool.getStats().discarded == 3);

  pool.clear();
  REQUIRE(pool.size() == 0);
}

TEST_CASE("ProcessorPool concurrent acquire and release", "[pool][threaded]")
{
  ProcessorPool<int> pool(8);
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t)
  {
    threads.emplace_back(
      [&pool]()
      {
        for (int i = 0; i < 1000; ++i)
        {
          auto obj = pool.acquire();
          if (!obj)
            obj = std::make_unique<int>(i);
          pool.release(std::move(obj));
        }
      });
  }
  for (auto &t : threads)
    t.join();
  REQUIRE(pool.size() <= 8);
  auto stats = pool.getStats();
  REQUIRE(stats.hits + stats.misses == 4000);
}

TEST_CASE("SocketProcessor runs the handler and scrubs itself", "[processor]")
{
  RecordingHandler handler;
  SocketProcessor processor(handler);
  REQUIRE_FALSE(processor.hasConnection());

  auto wrapper = makeWrapper();
  processor.reset(wrapper, SocketEvent::OpenWrite);
  REQUIRE(processor.hasConnection());
  REQUIRE(wrapper.use_count() == 2);

  processor.run();
  REQUIRE(handler.processed == 1);
  REQUIRE(handler.lastEvent == SocketEvent::OpenWrite);
  REQUIRE(handler.lastId == wrapper->id());
  REQUIRE_FALSE(processor.hasConnection());
  REQUIRE(processor.event() == SocketEvent::OpenRead);
  REQUIRE(wrapper.use_count() == 1);
  REQUIRE_FALSE(wrapper->isClosed());
}

TEST_CASE("SocketProcessor closes connections the handler is done with", "[processor]")
{
  RecordingHandler handler;
  SocketProcessor processor(handler);
  int slots = 0;
  auto wrapper = makeWrapper([&slots]() { ++slots; });

  SECTION("Closed state")
  {
    handler.result = SocketState::Closed;
    processor.reset(wrapper, SocketEvent::OpenRead);
    processor.run();
  }

  SECTION("Handler failure")
  {
    porta::test::LogCapture logs;
    handler.throwOnProcess = true;
    processor.reset(wrapper, SocketEvent::OpenRead);
    processor.run();
    REQUIRE(logs.count(porta::core::Logger::Level::Error, "handler exploded") == 1);
  }

  REQUIRE(handler.released == 1);
  REQUIRE(wrapper->isClosed());
  REQUIRE(slots == 1);
  REQUIRE_FALSE(processor.hasConnection());

  wrapper->close();
  REQUIRE(slots == 1);
}

TEST_CASE("SocketProcessor leaves long-lived states open", "[processor]")
{
  RecordingHandler handler;
  SocketProcessor processor(handler);
  for (auto state : {SocketState::Open, SocketState::Long, SocketState::Suspended,
                     SocketState::Upgrading, SocketState::Upgraded, SocketState::AsyncEnd,
                     SocketState::Sendfile})
  {
    handler.result = state;
    auto wrapper = makeWrapper();
    processor.reset(wrapper, SocketEvent::OpenRead);
    processor.run();
    REQUIRE_FALSE(wrapper->isClosed());
  }
  REQUIRE(handler.released == 0);
}

TEST_CASE("SocketProcessor skips connections closed before it ran", "[processor]")
{
  RecordingHandler handler;
  SocketProcessor processor(handler);
  auto wrapper = makeWrapper();
  wrapper->close();
  processor.reset(wrapper, SocketEvent::OpenRead);
  processor.run();
  REQUIRE(handler.processed == 0);
  REQUIRE_FALSE(processor.hasConnection());
}

TEST_CASE("SocketWrapper releases its slot exactly once", "[wrapper]")
{
  int slots = 0;
  {
    auto wrapper = makeWrapper([&slots]() { ++slots; });
    REQUIRE(wrapper->holdsAdmissionSlot());
    REQUIRE(wrapper->connection()->isOpen());
    wrapper->close();
    REQUIRE_FALSE(wrapper->holdsAdmissionSlot());
    wrapper->close();
  }
  REQUIRE(slots == 1);

  {
    auto wrapper = makeWrapper([&slots]() { ++slots; });
  }
  REQUIRE(slots == 2);

  auto first = makeWrapper();
  auto second = makeWrapper();
  REQUIRE(first->id() != second->id());
  REQUIRE_FALSE(first->holdsAdmissionSlot());
}
