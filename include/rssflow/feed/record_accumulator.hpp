// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RssFlow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "raw_node.hpp"
#include "strategy.hpp"
#include "tokenizer.hpp"
#include <rssflow/core/logger.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rssflow
{
namespace feed
{

/// \brief Assembles records from the event stream.
///
/// Only the element depth at which the record opened is boundary-significant:
/// an element named like the record tag inside a record is an ordinary field.
template <typename Record, typename Strategy> class RecordAccumulator
{
  static_assert(is_strategy_for_v<Strategy, Record>,
                "Strategy must provide Record init() and populate(Record&, RawNode&&)");

public:
  enum class State
  {
    Seeking,
    InRecord
  };

  RecordAccumulator(Strategy strategy, const std::string &recordTag)
    : _strategy(std::move(strategy)), _recordTag(Tokenizer::lowercase(recordTag))
  {
  }

  /// \brief Apply one event. Returns true when a record was completed; fetch
  /// it with takeRecord().
  bool feed(Event &&ev)
  {
    if (_state == State::Seeking)
    {
      if (ev.kind == Event::Kind::StartTag && ev.name == _recordTag)
      {
        _current.emplace(_strategy.init());
        _scopes.clear();
        _state = State::InRecord;
      }
      return false;
    }

    switch (ev.kind)
    {
    case Event::Kind::StartTag:
    {
      Scope scope{RawNode(std::move(ev.name)), false};
      scope.node.attributes = std::move(ev.attributes);
      _scopes.push_back(std::move(scope));
      return false;
    }
    case Event::Kind::Text:
      if (!_scopes.empty())
      {
        Scope &scope = _scopes.back();
        // Pieces split by a comment or a skipped run keep one separating space
        if (scope.node.text && (scope.spaceAfterText || ev.spaceBefore))
        {
          scope.node.text->push_back(' ');
        }
        append(scope.node.text, ev.text);
        scope.spaceAfterText = ev.spaceAfter;
      }
      return false;
    case Event::Kind::LiteralBlock:
      if (!_scopes.empty())
      {
        append(_scopes.back().node.literal, ev.text);
      }
      return false;
    case Event::Kind::EndTag:
      return closeScope(ev.name);
    default:
      return false;
    }
  }

  /// \brief Hand over the record completed by the last feed().
  std::optional<Record> takeRecord()
  {
    std::optional<Record> out = std::move(_completed);
    _completed.reset();
    return out;
  }

  /// \brief Drop any in-progress record. Returns true if one was dropped.
  bool abandon()
  {
    bool had = (_state == State::InRecord);
    _current.reset();
    _scopes.clear();
    _state = State::Seeking;
    return had;
  }

  State state() const { return _state; }

  bool inRecord() const { return _state == State::InRecord; }

  /// \brief Number of currently open field scopes.
  std::size_t depth() const { return _scopes.size(); }

  const std::string &recordTag() const { return _recordTag; }

private:
  struct Scope
  {
    RawNode node;
    bool spaceAfterText;
  };

  static void append(std::optional<std::string> &slot, const std::string &piece)
  {
    if (slot)
    {
      slot->append(piece);
    }
    else
    {
      slot = piece;
    }
  }

  bool closeScope(const std::string &name)
  {
    for (std::size_t i = _scopes.size(); i-- > 0;)
    {
      if (_scopes[i].node.tag != name)
      {
        continue;
      }
      if (i + 1 != _scopes.size())
      {
        RSSFLOW_LOG_DEBUG("RecordAccumulator: </" << name << "> closes "
                                                  << (_scopes.size() - i - 1)
                                                  << " unclosed field(s)");
        _scopes.resize(i + 1);
      }
      RawNode node = std::move(_scopes.back().node);
      _scopes.pop_back();
      _strategy.populate(*_current, std::move(node));
      return false;
    }

    if (name != _recordTag)
    {
      return false;
    }
    if (!_scopes.empty())
    {
      RSSFLOW_LOG_DEBUG("RecordAccumulator: record closed with " << _scopes.size()
                                                                 << " unclosed field(s)");
      _scopes.clear();
    }
    _completed = std::move(_current);
    _current.reset();
    _state = State::Seeking;
    return true;
  }

  Strategy _strategy;
  std::string _recordTag;
  State _state{State::Seeking};
  std::optional<Record> _current;
  std::vector<Scope> _scopes;
  std::optional<Record> _completed;
};

} // namespace feed
} // namespace rssflow
