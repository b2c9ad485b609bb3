// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Porta, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <limits>

using porta::network::ErrorBackoff;

TEST_CASE("ErrorBackoff doubles up to the ceiling", "[backoff]")
{
  STATIC_REQUIRE(ErrorBackoff::next(0) == 50);
  REQUIRE(ErrorBackoff::next(50) == 100);
  REQUIRE(ErrorBackoff::next(100) == 200);
  REQUIRE(ErrorBackoff::next(800) == 1600);
  REQUIRE(ErrorBackoff::next(1600) == 1600);
  REQUIRE(ErrorBackoff::next(1000) == 1600);
  REQUIRE(ErrorBackoff::next(-3) == ErrorBackoff::kInitialDelayMs);
}

TEST_CASE("ErrorBackoff clamps delays beyond the ceiling", "[backoff]")
{
  STATIC_REQUIRE(ErrorBackoff::next(std::numeric_limits<int>::max()) == ErrorBackoff::kMaxDelayMs);
  STATIC_REQUIRE(ErrorBackoff::next(std::numeric_limits<int>::max() / 2 + 1) ==
                 ErrorBackoff::kMaxDelayMs);
  REQUIRE(ErrorBackoff::next(799) == 1598);
  REQUIRE(ErrorBackoff::next(5000) == ErrorBackoff::kMaxDelayMs);
}

TEST_CASE("ErrorBackoff sequence from a fresh failure", "[backoff]")
{
  std::vector<int> seen;
  int delay = 0;
  for (int i = 0; i < 8; ++i)
  {
    delay = ErrorBackoff::next(delay);
    seen.push_back(delay);
  }
  REQUIRE(seen == std::vector<int>{50, 100, 200, 400, 800, 1600, 1600, 1600});
}

TEST_CASE("ErrorBackoff handleWithDelay sleeps the current delay", "[backoff]")
{
  auto start = std::chrono::steady_clock::now();
  REQUIRE(ErrorBackoff::handleWithDelay(0) == 50);
  auto firstElapsed = std::chrono::steady_clock::now() - start;
  REQUIRE(firstElapsed < std::chrono::milliseconds(40));

  start = std::chrono::steady_clock::now();
  REQUIRE(ErrorBackoff::handleWithDelay(50) == 100);
  REQUIRE(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(50));
}
