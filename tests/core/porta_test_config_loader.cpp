// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Porta, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

namespace toml = porta::parsers::toml;

TEST_CASE("ConfigLoader basic operations", "[config][ConfigLoader]")
{
  porta::test::TempFileManager files;
  const std::string cfgFile = files.write("basic.toml", "[section]\n"
                                                        "int_val = 42\n"
                                                        "bool_val = true\n"
                                                        "str_val = 'hello'\n"
                                                        "[other]\n"
                                                        "float_val = 3.14\n");

  porta::core::ConfigLoader loader(cfgFile);
  REQUIRE(loader.isLoaded());
  REQUIRE(loader.filename() == cfgFile);

  SECTION("get<T> returns correct values")
  {
    REQUIRE(loader.get<int64_t>("section.int_val").value() == 42);
    REQUIRE(loader.get<bool>("section.bool_val").value());
    REQUIRE(loader.get<std::string>("section.str_val").value() == "hello");
    REQUIRE_FALSE(loader.get<int64_t>("section.missing").has_value());
  }

  SECTION("getInt, getDouble, getBool, getString work as expected")
  {
    REQUIRE(loader.getInt("section.int_val").value() == 42);
    REQUIRE(loader.getDouble("other.float_val").value() == Approx(3.14));
    REQUIRE(loader.getDouble("section.int_val").value() == Approx(42.0));
    REQUIRE(loader.getBool("section.bool_val").value());
    REQUIRE(loader.getString("section.str_val").value() == "hello");
    REQUIRE_FALSE(loader.getString("section.int_val").has_value());
    REQUIRE_FALSE(loader.getInt("nothing.here").has_value());
  }

  SECTION("table() returns the parsed table")
  {
    const auto &tbl = loader.table();
    REQUIRE(tbl.contains("section"));
    REQUIRE(tbl.contains("other"));
    REQUIRE(tbl.at_path("section.int_val").is_value());
  }

  SECTION("reload picks up changes")
  {
    {
      std::ofstream out(cfgFile, std::ios::trunc);
      out << "[section]\nint_val = 7\n";
    }
    REQUIRE(loader.reload());
    REQUIRE(loader.getInt("section.int_val").value() == 7);
  }

  SECTION("failed reload keeps the previous table")
  {
    {
      std::ofstream out(cfgFile, std::ios::trunc);
      out << "[section\nint_val = \n";
    }
    porta::test::LogCapture logs;
    REQUIRE_FALSE(loader.reload());
    REQUIRE(loader.getInt("section.int_val").value() == 42);
    REQUIRE(logs.count(porta::core::Logger::Level::Warning, "reload") == 1);
  }
}

TEST_CASE("ConfigLoader missing file throws", "[config][ConfigLoader]")
{
  REQUIRE_THROWS_AS(porta::core::ConfigLoader("/nonexistent/porta_missing.toml"),
                    std::runtime_error);
}

TEST_CASE("ConfigLoader arrays", "[config][ConfigLoader]")
{
  auto loader = porta::core::ConfigLoader::fromString("[tls]\n"
                                                      "alpn = [\"h2\", \"http/1.1\"]\n"
                                                      "mixed = [\"a\", 1]\n"
                                                      "empty = []\n");

  REQUIRE(loader.getStringArray("tls.alpn").value() ==
          std::vector<std::string>{"h2", "http/1.1"});
  REQUIRE(loader.getStringArray("tls.empty").value().empty());
  REQUIRE_FALSE(loader.getStringArray("tls.missing").has_value());
  REQUIRE_THROWS_AS(loader.getStringArray("tls.mixed"), std::runtime_error);
  REQUIRE_FALSE(loader.reload());
}

TEST_CASE("ConfigLoader arrays of tables", "[config][ConfigLoader][toml]")
{
  auto loader = porta::core::ConfigLoader::fromString("[endpoint.tls]\n"
                                                      "enabled = true\n"
                                                      "\n"
                                                      "[[endpoint.tls.host]]\n"
                                                      "host_name = \"_default_\"\n"
                                                      "\n"
                                                      "[[endpoint.tls.host]]\n"
                                                      "host_name = \"*.example.com\"\n"
                                                      "protocols = [\"TLSv1.3\"]\n");

  auto hosts = loader.getTableArray("endpoint.tls.host");
  REQUIRE(hosts.size() == 2);
  REQUIRE(hosts[0]->at_path("host_name").as<std::string>().value() == "_default_");
  REQUIRE(hosts[1]->at_path("host_name").as<std::string>().value() == "*.example.com");
  REQUIRE(hosts[1]->at_path("protocols").is_array());
  REQUIRE(loader.getBool("endpoint.tls.enabled").value());
  REQUIRE(loader.getTableArray("endpoint.tls.missing").empty());
}

TEST_CASE("Minimal TOML parser", "[toml]")
{
  SECTION("comments, quoted and dotted keys")
  {
    auto tbl = toml::parse("# leading comment\n"
                           "title = \"porta\" # trailing\n"
                           "a.b.c = 1\n"
                           "\"quoted key\" = 'literal\\n'\n");
    REQUIRE(tbl.at_path("title").as<std::string>().value() == "porta");
    REQUIRE(tbl.at_path("a.b.c").as<int64_t>().value() == 1);
    REQUIRE(tbl.at("quoted key").as<std::string>().value() == "literal\\n");
  }

  SECTION("numbers, booleans and escapes")
  {
    auto tbl = toml::parse("big = 1_000_000\n"
                           "neg = -5\n"
                           "pi = 3.5\n"
                           "on = true\n"
                           "off = false\n"
                           "esc = \"tab\\there\\\"q\\\"\"\n");
    REQUIRE(tbl.at("big").as<int64_t>().value() == 1000000);
    REQUIRE(tbl.at("neg").as<int64_t>().value() == -5);
    REQUIRE(tbl.at("pi").as<double>().value() == Approx(3.5));
    REQUIRE(tbl.at("on").as<bool>().value());
    REQUIRE_FALSE(tbl.at("off").as<bool>().value());
    REQUIRE(tbl.at("esc").as<std::string>().value() == "tab\there\"q\"");
  }

  SECTION("multiline arrays")
  {
    auto tbl = toml::parse("list = [\n  1,\n  2, # two\n  3,\n]\n");
    const auto *arr = tbl.at("list").as_array();
    REQUIRE(arr != nullptr);
    REQUIRE(arr->size() == 3);
  }

  SECTION("errors carry the line number")
  {
    try
    {
      toml::parse("a = 1\na = 2\n");
      FAIL("duplicate key accepted");
    }
    catch (const toml::parse_error &e)
    {
      REQUIRE(e.line() == 2);
    }
    REQUIRE_THROWS_AS(toml::parse("[unterminated\n"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("s = \"open\n"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("x = @\n"), toml::parse_error);
  }
}
