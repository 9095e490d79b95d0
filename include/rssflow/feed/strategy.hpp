// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RssFlow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "raw_node.hpp"

#include <functional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace rssflow
{
namespace feed
{

/// \brief Field-dispatch strategy that defers to the record type itself.
///
/// Record must provide `static Record init()` and
/// `void populate(RawNode &&node)`.
template <typename Record> struct MemberStrategy
{
  Record init() const { return Record::init(); }

  void populate(Record &record, RawNode &&node) const { record.populate(std::move(node)); }
};

/// \brief Field-dispatch strategy built from two callables, for record types
/// that cannot or should not know about the parser.
template <typename Record> class CallbackStrategy
{
public:
  using InitFn = std::function<Record()>;
  using PopulateFn = std::function<void(Record &, RawNode &&)>;

  CallbackStrategy(InitFn init, PopulateFn populate)
    : _init(std::move(init)), _populate(std::move(populate))
  {
    if (!_init || !_populate)
    {
      throw std::invalid_argument("CallbackStrategy: both callbacks are required");
    }
  }

  Record init() const { return _init(); }

  void populate(Record &record, RawNode &&node) const { _populate(record, std::move(node)); }

private:
  InitFn _init;
  PopulateFn _populate;
};

namespace detail
{
template <typename S, typename R, typename = void> struct is_strategy_for : std::false_type
{
};

template <typename S, typename R>
struct is_strategy_for<
  S, R,
  std::void_t<decltype(std::declval<S &>().init()),
              decltype(std::declval<S &>().populate(std::declval<R &>(),
                                                          std::declval<RawNode &&>()))>>
  : std::is_convertible<decltype(std::declval<S &>().init()), R>
{
};
} // namespace detail

/// \brief True when \p Strategy can create and populate \p Record.
template <typename Strategy, typename Record>
inline constexpr bool is_strategy_for_v = detail::is_strategy_for<Strategy, Record>::value;

} // namespace feed
} // namespace rssflow
