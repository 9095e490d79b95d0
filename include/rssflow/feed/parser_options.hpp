// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RssFlow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <rssflow/core/config_loader.hpp>
#include <rssflow/core/logger.hpp>
#include "tokenizer.hpp"

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace rssflow
{
namespace feed
{

/// \brief Tunables for a FeedParser.
struct ParserOptions
{
  std::string recordTag{"item"};              ///< Record-boundary element, matched case-insensitively
  std::size_t initialBufferSize{4096};        ///< Initial window storage
  std::size_t readChunkSize{4096};            ///< Free space requested before a read
  std::size_t maxBufferSize{8u << 20};        ///< Storage cap, 0 for unbounded
  std::size_t maxTokenSize{1u << 20};         ///< Longest single token accepted
  std::size_t emptyReadBudget{1000};          ///< Consecutive empty reads before EOF, 0 = never
  std::chrono::milliseconds pollInterval{100}; ///< Wait granularity of the blocking next()
  bool trimText{true};
  bool lenientEntities{false};

  /// \brief Read a `[parser]` style table. Missing keys keep their defaults.
  /// \throws std::runtime_error on out-of-range values
  static ParserOptions fromConfig(const core::ConfigLoader &loader,
                                  const std::string &section = "parser")
  {
    ParserOptions opts;
    auto key = [&section](const char *name) { return section + "." + name; };

    if (auto tag = loader.getString(key("record_tag")))
    {
      if (tag->empty())
      {
        throw std::runtime_error("config: " + key("record_tag") + " must not be empty");
      }
      opts.recordTag = Tokenizer::lowercase(*tag);
    }
    readSize(loader, key("initial_buffer_size"), opts.initialBufferSize, 1);
    readSize(loader, key("read_chunk_size"), opts.readChunkSize, 1);
    readSize(loader, key("max_buffer_size"), opts.maxBufferSize, 0);
    readSize(loader, key("max_token_size"), opts.maxTokenSize, 1);
    readSize(loader, key("empty_read_budget"), opts.emptyReadBudget, 0);
    std::size_t intervalMs = static_cast<std::size_t>(opts.pollInterval.count());
    readSize(loader, key("poll_interval_ms"), intervalMs, 1);
    opts.pollInterval = std::chrono::milliseconds(intervalMs);
    opts.trimText = loader.getBool(key("trim_text")).value_or(opts.trimText);
    opts.lenientEntities = loader.getBool(key("lenient_entities")).value_or(opts.lenientEntities);

    if (opts.maxBufferSize != 0 && opts.maxBufferSize < opts.initialBufferSize)
    {
      throw std::runtime_error("config: " + key("max_buffer_size") +
                               " is smaller than initial_buffer_size");
    }
    return opts;
  }

private:
  static void readSize(const core::ConfigLoader &loader, const std::string &key,
                       std::size_t &target, int64_t minimum)
  {
    if (auto v = loader.getInt(key))
    {
      if (*v < minimum)
      {
        throw std::runtime_error("config: " + key + " must be >= " + std::to_string(minimum));
      }
      target = static_cast<std::size_t>(*v);
    }
  }
};

/// \brief Apply the `[log]` table: level, file, format and time_format.
inline void configureLogging(const core::ConfigLoader &loader)
{
  auto level = core::Logger::levelFromString(loader.getString("log.level").value_or("info"));
  std::string file = loader.getString("log.file").value_or("");
  std::string timeFormat = loader.getString("log.time_format").value_or("%Y-%m-%d %H:%M:%S");
  core::Logger::init(level, file, timeFormat);
  if (auto format = loader.getString("log.format"))
  {
    core::Logger::setLogFormat(*format);
  }
  RSSFLOW_LOG_DEBUG("configureLogging: level=" << core::Logger::levelToString(level)
                                               << " file=" << (file.empty() ? "<stdout>" : file));
}

} // namespace feed
} // namespace rssflow
