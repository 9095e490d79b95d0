// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RssFlow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rssflow
{
namespace feed
{

using Attribute = std::pair<std::string, std::string>;
using Attributes = std::vector<Attribute>;

/// \brief One fully parsed field element inside a record.
///
/// `tag` and attribute names are lowercase. Text and literal (CDATA) content
/// are independently optional: `<a>x<![CDATA[y]]></a>` carries both.
struct RawNode
{
  std::string tag;
  std::optional<std::string> text;
  std::optional<std::string> literal;
  Attributes attributes;

  RawNode() = default;
  explicit RawNode(std::string t) : tag(std::move(t)) {}

  /// \brief Text if present, otherwise the literal block.
  std::optional<std::string> value() const { return text ? text : literal; }

  /// \brief Attribute value by lowercase name, or nullptr.
  const std::string *attribute(std::string_view name) const
  {
    for (const auto &attr : attributes)
    {
      if (attr.first == name)
      {
        return &attr.second;
      }
    }
    return nullptr;
  }
};

} // namespace feed
} // namespace rssflow
