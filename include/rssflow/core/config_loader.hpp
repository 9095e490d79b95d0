// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RssFlow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <rssflow/parsers/minimal_toml.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace rssflow
{
namespace core
{
/// \brief Loads a TOML configuration file and exposes typed lookups by
/// dotted key ("parser.record_tag").
class ConfigLoader
{
public:
  /// \brief Loads \p filename. Throws std::runtime_error if it cannot be read
  /// or parsed.
  explicit ConfigLoader(const std::string &filename) : _filename(filename)
  {
    _table = parsers::toml::parse_file(_filename);
  }

  /// \brief Builds a loader from in-memory TOML text.
  static ConfigLoader fromString(const std::string &toml)
  {
    return ConfigLoader(parsers::toml::parse(toml));
  }

  /// \brief Reloads the configuration from disk. On failure the previous
  /// table is kept and false is returned.
  bool reload()
  {
    if (_filename.empty())
    {
      return false;
    }
    try
    {
      _table = parsers::toml::parse_file(_filename);
      return true;
    }
    catch (const std::runtime_error &)
    {
      return false;
    }
  }

  const parsers::toml::table &table() const { return _table; }

  const std::string &filename() const { return _filename; }

  /// \brief Gets a typed value from the configuration.
  /// \tparam T int64_t, double, bool or std::string
  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    auto node = _table.at_path(dottedKey);
    if (node && node.is_value())
    {
      return node.as<T>();
    }
    return std::nullopt;
  }

  std::optional<int64_t> getInt(const std::string &key) const { return get<int64_t>(key); }

  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }

  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

  /// \brief Gets an array of strings.
  /// \throws std::runtime_error if the key is an array holding a non-string.
  std::optional<std::vector<std::string>> getStringArray(const std::string &key) const
  {
    auto node = _table.at_path(key);
    if (!node || !node.is_array())
    {
      return std::nullopt;
    }
    std::vector<std::string> result;
    for (const auto &elem : *node.as_array())
    {
      if (auto *strVal = std::get_if<std::string>(&elem))
      {
        result.push_back(*strVal);
      }
      else
      {
        throw std::runtime_error("ConfigLoader: Array element at '" + key + "' is not a string");
      }
    }
    return result;
  }

private:
  explicit ConfigLoader(parsers::toml::table table) : _table(std::move(table)) {}

  std::string _filename;
  parsers::toml::table _table;
};

} // namespace core
} // namespace rssflow
