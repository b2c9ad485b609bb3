// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Porta, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <algorithm>
#include <iterator>

using porta::core::Logger;

TEST_CASE("Logger writes every enabled level to a file", "[logger][levels]")
{
  porta::test::TempFileManager files;
  const std::string logFile = files.write("levels.log", "");

  Logger::init(Logger::Level::Trace, logFile);
  PORTA_LOG_TRACE("Trace message");
  PORTA_LOG_DEBUG("Debug message");
  PORTA_LOG_INFO("Info message " << 1);
  PORTA_LOG_WARN("Warn message");
  PORTA_LOG_ERROR("Error message");
  PORTA_LOG_FATAL("Fatal message");
  Logger::init(Logger::Level::Info);

  std::ifstream in(logFile);
  REQUIRE(in.is_open());
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  REQUIRE(std::count(content.begin(), content.end(), '\n') == 6);
  REQUIRE(content.find("[TRACE]") != std::string::npos);
  REQUIRE(content.find("[WARN]") != std::string::npos);
  REQUIRE(content.find("Info message 1") != std::string::npos);
  REQUIRE(content.find("porta_test_logger.cpp:") != std::string::npos);
}

TEST_CASE("Logger filters below the configured level", "[logger][levels]")
{
  porta::test::LogCapture logs(Logger::Level::Warning);

  PORTA_LOG_DEBUG("hidden");
  PORTA_LOG_INFO("hidden");
  PORTA_LOG_WARN("shown");
  Logger::error("shown too");

  auto entries = logs.entries();
  REQUIRE(entries.size() == 2);
  REQUIRE(entries[0].level == Logger::Level::Warning);
  REQUIRE(entries[0].message == "shown");
  REQUIRE(entries[1].level == Logger::Level::Error);
  REQUIRE_FALSE(Logger::isEnabled(Logger::Level::Info));
  REQUIRE(Logger::isEnabled(Logger::Level::Fatal));
}

TEST_CASE("Logger external handler receives formatted and raw text", "[logger][external]")
{
  std::vector<std::string> formatted;
  std::vector<std::string> raw;

  Logger::setLevel(Logger::Level::Debug);
  Logger::setExternalHandler(
    [&](Logger::Level, const std::string &f, const std::string &r)
    {
      formatted.push_back(f);
      raw.push_back(r);
    });

  PORTA_LOG_INFO("external " << 42);
  Logger::clearExternalHandler();
  PORTA_LOG_INFO("not captured");

  REQUIRE(raw.size() == 1);
  REQUIRE(raw[0] == "external 42");
  REQUIRE(formatted[0].find("[INFO]") != std::string::npos);
  REQUIRE(formatted[0].find("external 42") != std::string::npos);
}

TEST_CASE("Logger stream interface", "[logger][stream]")
{
  porta::test::LogCapture logs;
  {
    auto stream = Logger::stream(Logger::Level::Info);
    stream << "Stream log test: " << 123;
  }
  REQUIRE(logs.count(Logger::Level::Info, "Stream log test: 123") == 1);
}

TEST_CASE("Logger level names", "[logger]")
{
  REQUIRE(Logger::levelFromString("TRACE") == Logger::Level::Trace);
  REQUIRE(Logger::levelFromString("debug") == Logger::Level::Debug);
  REQUIRE(Logger::levelFromString("Warn") == Logger::Level::Warning);
  REQUIRE(Logger::levelFromString("warning") == Logger::Level::Warning);
  REQUIRE(Logger::levelFromString("fatal") == Logger::Level::Fatal);
  REQUIRE_THROWS_AS(Logger::levelFromString("verbose"), std::invalid_argument);
  REQUIRE(std::string(Logger::levelToString(Logger::Level::Error)) == "ERROR");
}

TEST_CASE("Logger thread safety", "[logger][threaded]")
{
  porta::test::LogCapture logs(Logger::Level::Info);
  const int threads = 8;
  const int messagesPerThread = 50;
  std::vector<std::thread> workers;

  for (int i = 0; i < threads; ++i)
  {
    workers.emplace_back(
      [i]()
      {
        for (int j = 0; j < messagesPerThread; ++j)
        {
          PORTA_LOG_INFO("Thread " << i << " message " << j);
        }
      });
  }
  for (auto &t : workers)
  {
    t.join();
  }
  REQUIRE(logs.entries().size() == static_cast<std::size_t>(threads * messagesPerThread));
}

TEST_CASE("Logger init refuses an unwritable file", "[logger]")
{
  REQUIRE_THROWS_AS(Logger::init(Logger::Level::Info, "/nonexistent/dir/porta.log"),
                    std::runtime_error);
  Logger::init(Logger::Level::Info);
}
