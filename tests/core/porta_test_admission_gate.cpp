// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Porta, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <atomic>
#include <thread>
#include <vector>

using porta::core::AdmissionGate;
using Result = porta::core::AdmissionGate::AcquireResult;

namespace
{
// Parks \p n threads in tryAcquireOrAwait() and records their outcomes.
struct Waiters
{
  Waiters(AdmissionGate &gate, int n)
  {
    for (int i = 0; i < n; ++i)
    {
      threads.emplace_back(
        [this, &gate]()
        {
          auto r = gate.tryAcquireOrAwait();
          if (r == Result::Acquired)
            ++acquired;
          else if (r == Result::Bypassed)
            ++bypassed;
          else
            ++interrupted;
        });
    }
  }

  ~Waiters() { join(); }

  void join()
  {
    for (auto &t : threads)
    {
      if (t.joinable())
        t.join();
    }
  }

  int finished() const { return acquired + bypassed + interrupted; }

  std::vector<std::thread> threads;
  std::atomic<int> acquired{0};
  std::atomic<int> bypassed{0};
  std::atomic<int> interrupted{0};
};
} // namespace

TEST_CASE("AdmissionGate counts up to its limit", "[gate]")
{
  AdmissionGate gate(2);
  REQUIRE(gate.enabled());
  REQUIRE(gate.currentCount() == 0);

  REQUIRE(gate.tryAcquireOrAwait() == Result::Acquired);
  REQUIRE(gate.tryAcquireOrAwait() == Result::Acquired);
  REQUIRE(gate.currentCount() == 2);

  REQUIRE(gate.release() == 1);
  REQUIRE(gate.release() == 0);
  REQUIRE(gate.currentCount() == 0);
  REQUIRE(gate.anomalies() == 0);
}

TEST_CASE("AdmissionGate release without acquire is reported", "[gate]")
{
  porta::test::LogCapture logs;
  AdmissionGate gate(3);

  REQUIRE(gate.release() == -1);
  REQUIRE(gate.currentCount() == 0);
  REQUIRE(gate.anomalies() == 1);
  REQUIRE(logs.count(porta::core::Logger::Level::Warning, "AdmissionGate") == 1);
}

TEST_CASE("AdmissionGate disabled never blocks and never counts", "[gate]")
{
  AdmissionGate gate;
  REQUIRE_FALSE(gate.enabled());
  REQUIRE(gate.currentCount() == -1);

  for (int i = 0; i < 100; ++i)
  {
    REQUIRE(gate.tryAcquireOrAwait() == Result::Bypassed);
  }
  REQUIRE(gate.currentCount() == -1);
  REQUIRE(gate.release() == -1);
  REQUIRE(gate.anomalies() == 0);
}

TEST_CASE("AdmissionGate blocks at the limit until a release", "[gate][blocking]")
{
  AdmissionGate gate(1);
  REQUIRE(gate.tryAcquireOrAwait() == Result::Acquired);

  Waiters waiters(gate, 1);
  REQUIRE(porta::test::waitFor([&]() { return gate.waiters() == 1; }));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  REQUIRE(waiters.finished() == 0);

  REQUIRE(gate.release() == 0);
  waiters.join();
  REQUIRE(waiters.acquired == 1);
  REQUIRE(gate.currentCount() == 1);
}

TEST_CASE("AdmissionGate disabling releases every waiter", "[gate][blocking]")
{
  AdmissionGate gate(0);
  Waiters waiters(gate, 4);
  REQUIRE(porta::test::waitFor([&]() { return gate.waiters() == 4; }));

  gate.setLimit(AdmissionGate::kDisabled);
  waiters.join();
  REQUIRE(waiters.bypassed == 4);
  REQUIRE(gate.currentCount() == -1);
  REQUIRE(gate.tryAcquireOrAwait() == Result::Bypassed);
}

TEST_CASE("AdmissionGate raising the limit wakes exactly the new capacity", "[gate][blocking]")
{
  AdmissionGate gate(2);
  REQUIRE(gate.tryAcquireOrAwait() == Result::Acquired);
  REQUIRE(gate.tryAcquireOrAwait() == Result::Acquired);

  Waiters waiters(gate, 5);
  REQUIRE(porta::test::waitFor([&]() { return gate.waiters() == 5; }));

  gate.setLimit(5);
  REQUIRE(porta::test::waitFor([&]() { return waiters.acquired == 3; }));
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  REQUIRE(waiters.acquired == 3);
  REQUIRE(gate.waiters() == 2);
  REQUIRE(gate.currentCount() == 5);

  gate.setLimit(AdmissionGate::kDisabled);
  waiters.join();
  REQUIRE(waiters.bypassed == 2);
}

TEST_CASE("AdmissionGate re-enabled starts from zero", "[gate]")
{
  AdmissionGate gate(4);
  REQUIRE(gate.tryAcquireOrAwait() == Result::Acquired);
  gate.setLimit(AdmissionGate::kDisabled);
  gate.setLimit(4);
  REQUIRE(gate.currentCount() == 0);
  REQUIRE(gate.limit() == 4);
}

TEST_CASE("AdmissionGate interruptWaiters cancels a parked acquire", "[gate][blocking]")
{
  AdmissionGate gate(0);
  Waiters waiters(gate, 2);
  REQUIRE(porta::test::waitFor([&]() { return gate.waiters() == 2; }));

  gate.interruptWaiters();
  waiters.join();
  REQUIRE(waiters.interrupted == 2);
  REQUIRE(gate.currentCount() == 0);
}

TEST_CASE("AdmissionGate count stays within bounds under contention", "[gate][stress]")
{
  constexpr long limit = 3;
  AdmissionGate gate(limit);
  std::atomic<long> inside{0};
  std::atomic<long> maxInside{0};
  std::atomic<bool> violated{false};

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t)
  {
    threads.emplace_back(
      [&]()
      {
        for (int i = 0; i < 200; ++i)
        {
          if (gate.tryAcquireOrAwait() != Result::Acquired)
            violated = true;
          long now = ++inside;
          long seen = maxInside.load();
          while (now > seen && !maxInside.compare_exchange_weak(seen, now))
          {
          }
          long count = gate.currentCount();
          if (count < 0 || count > limit)
            violated = true;
          --inside;
          gate.release();
        }
      });
  }
  for (auto &t : threads)
    t.join();

  REQUIRE_FALSE(violated);
  REQUIRE(maxInside.load() <= limit);
  REQUIRE(gate.currentCount() == 0);
  REQUIRE(gate.anomalies() == 0);
}
