// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RssFlow, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>
#include <filesystem>

using rssflow::core::ConfigLoader;
using rssflow::feed::ParserOptions;

TEST_CASE("ConfigLoader basic operations", "[config][ConfigLoader]")
{
  const std::string cfgFile = "test_config.toml";
  {
    std::ofstream out(cfgFile);
    out << "# feed reader\n";
    out << "[section]\n";
    out << "int_val = 42\n";
    out << "big_val = 1_000_000\n";
    out << "bool_val = true\n";
    out << "str_val = 'hello'\n";
    out << "esc_val = \"a\\tb\" # trailing comment\n";
    out << "str_array = ['a', 'b', 'c']\n";
    out << "mixed_array = ['x', 42]\n";
    out << "[other]\n";
    out << "float_val = 3.14\n";
  }

  ConfigLoader loader(cfgFile);

  SECTION("get<T> returns correct values")
  {
    REQUIRE(loader.get<int64_t>("section.int_val").value() == 42);
    REQUIRE(loader.get<int64_t>("section.big_val").value() == 1000000);
    REQUIRE(loader.get<bool>("section.bool_val").value());
    REQUIRE(loader.get<std::string>("section.str_val").value() == "hello");
    REQUIRE(loader.get<std::string>("section.esc_val").value() == "a\tb");
    REQUIRE(loader.get<double>("other.float_val").value() == Approx(3.14));
    REQUIRE(loader.get<double>("section.int_val").value() == Approx(42.0));
    REQUIRE_FALSE(loader.get<int64_t>("section.missing").has_value());
    REQUIRE_FALSE(loader.get<int64_t>("section.str_val").has_value());
  }

  SECTION("Typed helpers")
  {
    REQUIRE(loader.getInt("section.int_val").value() == 42);
    REQUIRE(loader.getBool("section.bool_val").value());
    REQUIRE(loader.getString("section.str_val").value() == "hello");
    REQUIRE_FALSE(loader.getString("missing.key").has_value());
  }

  SECTION("String arrays")
  {
    auto result = loader.getStringArray("section.str_array");
    REQUIRE(result.has_value());
    REQUIRE(*result == std::vector<std::string>{"a", "b", "c"});
    REQUIRE_FALSE(loader.getStringArray("section.missing_array").has_value());
    REQUIRE_THROWS_AS(loader.getStringArray("section.mixed_array"), std::runtime_error);
  }

  SECTION("table() returns the parsed table")
  {
    const auto &tbl = loader.table();
    REQUIRE(tbl.contains("section"));
    REQUIRE(tbl.at_path("section.int_val").is_value());
    REQUIRE(loader.filename() == cfgFile);
  }

  SECTION("Reload picks up changes and keeps the old table on error")
  {
    {
      std::ofstream out(cfgFile, std::ios::trunc);
      out << "[section]\nint_val = 7\n";
    }
    REQUIRE(loader.reload());
    REQUIRE(loader.getInt("section.int_val").value() == 7);
    {
      std::ofstream out(cfgFile, std::ios::trunc);
      out << "[section\nint_val = 8\n";
    }
    REQUIRE_FALSE(loader.reload());
    REQUIRE(loader.getInt("section.int_val").value() == 7);
  }

  std::filesystem::remove(cfgFile);
}

TEST_CASE("ConfigLoader errors", "[config][ConfigLoader][errors]")
{
  SECTION("Missing file throws")
  {
    REQUIRE_THROWS_AS(ConfigLoader("does_not_exist.toml"), std::runtime_error);
  }

  SECTION("Syntax errors carry the line number")
  {
    try
    {
      ConfigLoader::fromString("[parser]\nrecord_tag \"item\"\n");
      FAIL("parse should have failed");
    }
    catch (const std::runtime_error &e)
    {
      REQUIRE(std::string(e.what()).find("line 2") != std::string::npos);
    }
  }

  SECTION("In-memory loader cannot reload")
  {
    auto loader = ConfigLoader::fromString("a = 1\n");
    REQUIRE(loader.getInt("a").value() == 1);
    REQUIRE_FALSE(loader.reload());
  }
}

TEST_CASE("ParserOptions from configuration", "[config][ParserOptions]")
{
  SECTION("Defaults when the table is absent")
  {
    auto opts = ParserOptions::fromConfig(ConfigLoader::fromString(""));
    ParserOptions defaults;
    REQUIRE(opts.recordTag == defaults.recordTag);
    REQUIRE(opts.readChunkSize == defaults.readChunkSize);
    REQUIRE(opts.emptyReadBudget == defaults.emptyReadBudget);
    REQUIRE(opts.pollInterval == defaults.pollInterval);
    REQUIRE(opts.trimText);
    REQUIRE_FALSE(opts.lenientEntities);
  }

  SECTION("All keys")
  {
    auto loader = ConfigLoader::fromString("[parser]\n"
                                           "record_tag = \"ENTRY\"\n"
                                           "initial_buffer_size = 256\n"
                                           "read_chunk_size = 128\n"
                                           "max_buffer_size = 65536\n"
                                           "max_token_size = 4096\n"
                                           "empty_read_budget = 0\n"
                                           "poll_interval_ms = 25\n"
                                           "trim_text = false\n"
                                           "lenient_entities = true\n");
    auto opts = ParserOptions::fromConfig(loader);
    REQUIRE(opts.recordTag == "entry");
    REQUIRE(opts.initialBufferSize == 256);
    REQUIRE(opts.readChunkSize == 128);
    REQUIRE(opts.maxBufferSize == 65536);
    REQUIRE(opts.maxTokenSize == 4096);
    REQUIRE(opts.emptyReadBudget == 0);
    REQUIRE(opts.pollInterval == std::chrono::milliseconds(25));
    REQUIRE_FALSE(opts.trimText);
    REQUIRE(opts.lenientEntities);
  }

  SECTION("Custom section name")
  {
    auto loader = ConfigLoader::fromString("[atom]\nrecord_tag = \"entry\"\n");
    REQUIRE(ParserOptions::fromConfig(loader, "atom").recordTag == "entry");
  }

  SECTION("Invalid values are rejected")
  {
    REQUIRE_THROWS_AS(
      ParserOptions::fromConfig(ConfigLoader::fromString("[parser]\nread_chunk_size = 0\n")),
      std::runtime_error);
    REQUIRE_THROWS_AS(
      ParserOptions::fromConfig(ConfigLoader::fromString("[parser]\nrecord_tag = \"\"\n")),
      std::runtime_error);
    REQUIRE_THROWS_AS(ParserOptions::fromConfig(ConfigLoader::fromString(
                        "[parser]\ninitial_buffer_size = 1024\nmax_buffer_size = 512\n")),
                      std::runtime_error);
  }
}
