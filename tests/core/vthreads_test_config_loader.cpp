// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vthreads, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using namespace vthreads::core;
using vthreads::test::TempFile;
namespace toml = vthreads::parsers::toml;

TEST_CASE("ConfigLoader basic operations", "[config][ConfigLoader]")
{
  TempFile cfg("config.toml", "[section]\n"
                              "int_val = 42\n"
                              "bool_val = true\n"
                              "str_val = 'hello'\n"
                              "[other]\n"
                              "float_val = 3.14\n");

  ConfigLoader loader(cfg.path());
  REQUIRE_FALSE(loader.isLoaded());
  REQUIRE(loader.filename() == cfg.path());

  SECTION("Reload and load returns table")
  {
    REQUIRE(loader.reload());
    const auto &tbl = loader.load();
    REQUIRE(loader.isLoaded());
    REQUIRE(tbl.contains("section"));
    REQUIRE(tbl.contains("other"));
    REQUIRE_FALSE(tbl.contains("sect"));
    REQUIRE(tbl.size() == 4);
  }

  SECTION("load reads the file on first use")
  {
    REQUIRE(loader.load().contains("section.int_val"));
  }

  SECTION("get<T> returns correct values")
  {
    loader.load();
    REQUIRE(loader.get<int64_t>("section.int_val").value() == 42);
    REQUIRE(loader.get<bool>("section.bool_val").value());
    REQUIRE(loader.get<std::string>("section.str_val").value() == "hello");
    REQUIRE_FALSE(loader.get<int64_t>("section.missing").has_value());
  }

  SECTION("getInt, getDouble, getBool, getString work as expected")
  {
    loader.load();
    REQUIRE(loader.getInt("section.int_val").value() == 42);
    REQUIRE(loader.getDouble("other.float_val").value() == Approx(3.14));
    REQUIRE(loader.getDouble("section.int_val").value() == Approx(42.0));
    REQUIRE(loader.getBool("section.bool_val").value());
    REQUIRE(loader.getString("section.str_val").value() == "hello");
  }

  SECTION("Type mismatches yield nothing")
  {
    loader.load();
    REQUIRE_FALSE(loader.getInt("section.str_val").has_value());
    REQUIRE_FALSE(loader.getString("section.int_val").has_value());
    REQUIRE_FALSE(loader.getBool("other.float_val").has_value());
  }
}

TEST_CASE("ConfigLoader missing file", "[config][ConfigLoader]")
{
  ConfigLoader loader("/nonexistent/vthreads/config.toml");

  REQUIRE_FALSE(loader.reload());
  REQUIRE_FALSE(loader.isLoaded());
  REQUIRE_THROWS_AS(loader.load(), std::runtime_error);
}

TEST_CASE("ConfigLoader string arrays", "[config][array]")
{
  auto loader = ConfigLoader::fromString("[lists]\n"
                                         "names = [\"a\", \"b\",\n"
                                         "         \"c\"] # trailing comment\n"
                                         "mixed = [\"a\", 1]\n"
                                         "scalar = \"x\"\n");

  REQUIRE(loader.getStringArray("lists.names").value() == std::vector<std::string>{"a", "b", "c"});
  REQUIRE_FALSE(loader.getStringArray("lists.scalar").has_value());
  REQUIRE_FALSE(loader.getStringArray("lists.missing").has_value());
  REQUIRE_THROWS_AS(loader.getStringArray("lists.mixed"), std::runtime_error);
}

TEST_CASE("TOML parser subset", "[config][toml]")
{
  SECTION("Dotted keys, comments and escapes")
  {
    auto tbl = toml::parse("# header comment\n"
                           "top = -7\n"
                           "[a.b]\n"
                           "c.d = \"tab\\there # not a comment\"\n"
                           "big = 1_000\n"
                           "ratio = 2.5e1\n");

    REQUIRE(tbl.find("top")->as<int64_t>().value() == -7);
    REQUIRE(tbl.find("a.b.c.d")->as<std::string>().value() == "tab\there # not a comment");
    REQUIRE(tbl.find("big") == nullptr);
    REQUIRE(tbl.find("a.b.big")->as<int64_t>().value() == 1000);
    REQUIRE(tbl.find("a.b.ratio")->is_floating_point());
    REQUIRE(tbl.find("a.b.ratio")->as<double>().value() == Approx(25.0));
    REQUIRE(tbl.contains("a"));
    REQUIRE(tbl.contains("a.b.c"));
  }

  SECTION("Malformed input reports the line")
  {
    try
    {
      toml::parse("ok = 1\n"
                  "broken\n");
      FAIL("parse should have thrown");
    }
    catch (const toml::parse_error &e)
    {
      REQUIRE(e.line() == 2);
    }

    REQUIRE_THROWS_AS(toml::parse("[unterminated\n"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("s = \"open\n"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("b = maybe\n"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("n = 12abc\n"), toml::parse_error);
  }
}

TEST_CASE("PoolConfig from configuration", "[config][pool]")
{
  SECTION("Defaults when the table is absent")
  {
    auto config = PoolConfig::fromConfig(ConfigLoader::fromString(""));
    REQUIRE(config.name == "Thread Pool");
    REQUIRE(config.minThreads == 2);
    REQUIRE(config.maxThreads == 10);
    REQUIRE_FALSE(config.daemon);
    REQUIRE_FALSE(config.resolveOnFatal);
    REQUIRE(config.errorPolicy.name() == "standard");
  }

  SECTION("Every key is read")
  {
    auto config = PoolConfig::fromConfig(ConfigLoader::fromString("[pool]\n"
                                                                  "name = \"io\"\n"
                                                                  "min_threads = 1\n"
                                                                  "max_threads = 3\n"
                                                                  "daemon = true\n"
                                                                  "resolve_on_fatal = true\n"
                                                                  "error_policy = \"capture_all\"\n"));
    REQUIRE(config.name == "io");
    REQUIRE(config.minThreads == 1);
    REQUIRE(config.maxThreads == 3);
    REQUIRE(config.daemon);
    REQUIRE(config.resolveOnFatal);
    REQUIRE(config.errorPolicy.name() == "capture_all");
  }

  SECTION("Invalid values are rejected")
  {
    REQUIRE_THROWS_AS(PoolConfig::fromConfig(ConfigLoader::fromString("[pool]\nmin_threads = -1\n")),
                      std::runtime_error);
    REQUIRE_THROWS_AS(
      PoolConfig::fromConfig(ConfigLoader::fromString("[pool]\nerror_policy = \"lenient\"\n")),
      std::runtime_error);
    REQUIRE_THROWS_AS(
      PoolConfig::fromConfig(ConfigLoader::fromString("[pool]\nmin_threads = 5\nmax_threads = 4\n")),
      std::invalid_argument);
  }
}

TEST_CASE("Logging configuration", "[config][log]")
{
  TempFile logFile("configured.log");

  configureLogging(ConfigLoader::fromString("[log]\n"
                                            "level = \"debug\"\n"
                                            "file = \"" +
                                            logFile.path() +
                                            "\"\n"
                                            "format = \"%L: %m\"\n"));
  REQUIRE(Logger::getLevel() == Logger::Level::Debug);
  REQUIRE(Logger::getLogFormat() == "%L: %m");

  VTHREADS_LOG_DEBUG("configured " << 1);
  Logger::shutdown();
  REQUIRE(logFile.read() == "DEBUG: configured 1\n");

  REQUIRE_THROWS_AS(configureLogging(ConfigLoader::fromString("[log]\nlevel = \"loud\"\n")),
                    std::runtime_error);

  Logger::setLogFormat("[%T] [%L] %m");
  Logger::init(Logger::Level::Warning);
}

TEST_CASE("Pool built from a configuration file", "[config][pool]")
{
  TempFile cfg("pool.toml", "[pool]\n"
                            "name = \"from-file\"\n"
                            "min_threads = 1\n"
                            "max_threads = 2\n"
                            "[log]\n"
                            "level = \"warning\"\n");

  auto pool = vthreads::makePoolFromFile(cfg.path());
  REQUIRE(pool->name() == "from-file");
  REQUIRE(pool->maxThreads() == 2);
  REQUIRE(pool->getLiveThreadCount() == 1);
  REQUIRE(pool->submit([]() { return 11; }).get() == 11);

  REQUIRE_THROWS_AS(vthreads::makePoolFromFile("/nonexistent/pool.toml"), std::runtime_error);
}
