// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RssFlow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "input_buffer.hpp"
#include "raw_node.hpp"
#include <rssflow/core/logger.hpp>
#include <rssflow/parsers/xml_lexer.hpp>

#include <string>
#include <string_view>

namespace rssflow
{
namespace feed
{

/// \brief Markup event handed from the tokenizer to the record accumulator.
///
/// Unlike lexer tokens, events own their strings: they survive buffer
/// compaction and refills.
struct Event
{
  enum class Kind
  {
    StartTag,
    EndTag,
    Text,
    LiteralBlock,
    Malformed,
    NeedMore,
    EndOfInput
  };

  Kind kind{Kind::NeedMore};
  std::string name;       ///< Lowercased element name for StartTag/EndTag
  std::string text;       ///< Decoded text, literal block body, or malformed reason
  Attributes attributes;  ///< Decoded attributes of a StartTag
  std::size_t offset{0};  ///< Absolute stream offset of the event
  bool spaceBefore{false}; ///< Text lost leading whitespace to trimming
  bool spaceAfter{false};  ///< Text lost trailing whitespace to trimming
};

struct TokenizerOptions
{
  parsers::xml::Options lexer;
  bool trimText{true};
  bool lenientEntities{false};
};

/// \brief Turns the unconsumed window of an InputBuffer into Events.
///
/// Comments, processing instructions, the XML declaration and DOCTYPE are
/// consumed silently. A self-closing element produces a StartTag followed by
/// a synthetic EndTag. Whitespace-only text is dropped when trimming is on.
class Tokenizer
{
public:
  explicit Tokenizer(TokenizerOptions options = TokenizerOptions{})
    : _options(options), _lexer(options.lexer)
  {
  }

  /// \brief Produce the next event from \p buffer.
  ///
  /// Returns NeedMore, without consuming anything, when the window ends
  /// inside a token and the buffer is not at end-of-input.
  Event next(InputBuffer &buffer)
  {
    if (_pendingEnd)
    {
      _pendingEnd = false;
      Event ev;
      ev.kind = Event::Kind::EndTag;
      ev.name = std::move(_pendingEndName);
      ev.offset = _pendingEndOffset;
      return ev;
    }

    while (true)
    {
      parsers::xml::Token tok;
      std::string_view window = buffer.window();
      parsers::xml::ScanResult r = _lexer.scan(window, buffer.atEnd(), tok);
      std::size_t offset = buffer.consumedTotal();

      switch (r.status)
      {
      case parsers::xml::ScanStatus::NeedMore:
      {
        Event ev;
        ev.kind = Event::Kind::NeedMore;
        ev.offset = offset;
        return ev;
      }
      case parsers::xml::ScanStatus::End:
      {
        Event ev;
        ev.kind = Event::Kind::EndOfInput;
        ev.offset = offset;
        return ev;
      }
      case parsers::xml::ScanStatus::Malformed:
      {
        Event ev = malformed(offset, r.reason, window.substr(0, r.consumed));
        buffer.consume(r.consumed);
        return ev;
      }
      case parsers::xml::ScanStatus::Token:
        break;
      }

      Event ev;
      ev.offset = offset;
      bool emit = true;
      switch (tok.kind)
      {
      case parsers::xml::TokenKind::StartElement:
      case parsers::xml::TokenKind::EmptyElement:
        ev.kind = Event::Kind::StartTag;
        ev.name = lowercase(tok.name);
        decodeAttributes(tok, offset, ev.attributes);
        if (tok.kind == parsers::xml::TokenKind::EmptyElement || tok.selfClosing)
        {
          _pendingEnd = true;
          _pendingEndName = ev.name;
          _pendingEndOffset = offset;
        }
        break;
      case parsers::xml::TokenKind::EndElement:
        ev.kind = Event::Kind::EndTag;
        ev.name = lowercase(tok.name);
        break;
      case parsers::xml::TokenKind::Text:
      {
        std::string_view raw = _options.trimText ? trim(tok.text) : tok.text;
        if (raw.empty())
        {
          emit = false;
          break;
        }
        parsers::xml::Error err;
        ev.kind = Event::Kind::Text;
        ev.spaceBefore = raw.data() != tok.text.data();
        ev.spaceAfter = raw.data() + raw.size() != tok.text.data() + tok.text.size();
        if (!parsers::xml::Lexer::decodeEntities(raw, ev.text, _options.lenientEntities, &err))
        {
          ev = malformed(offset + err.offset, err.message.c_str(), raw);
        }
        break;
      }
      case parsers::xml::TokenKind::CData:
        ev.kind = Event::Kind::LiteralBlock;
        ev.text.assign(tok.text.data(), tok.text.size());
        break;
      default:
        // Comments, PIs, declarations and DOCTYPE carry nothing for records
        emit = false;
        break;
      }

      buffer.consume(r.consumed);
      if (emit)
      {
        return ev;
      }
    }
  }

  /// \brief Number of malformed runs skipped so far.
  std::size_t malformedCount() const { return _malformed; }

  /// \brief ASCII lowercase, the folding applied to element and attribute
  /// names.
  static std::string lowercase(std::string_view s)
  {
    std::string out(s);
    for (auto &ch : out)
    {
      if (ch >= 'A' && ch <= 'Z')
      {
        ch = static_cast<char>(ch + ('a' - 'A'));
      }
    }
    return out;
  }

private:
  Event malformed(std::size_t offset, const char *reason, std::string_view excerpt)
  {
    ++_malformed;
    RSSFLOW_LOG_DEBUG("Tokenizer: skipping malformed markup at offset "
                      << offset << " (" << reason << "): '"
                      << excerpt.substr(0, 40) << (excerpt.size() > 40 ? "..." : "") << "'");
    Event ev;
    ev.kind = Event::Kind::Malformed;
    ev.text = reason;
    ev.offset = offset;
    return ev;
  }

  /// An attribute value that fails strict decoding is decoded leniently
  /// instead, so one stray '&' in a URL does not cost the element.
  void decodeAttributes(const parsers::xml::Token &tok, std::size_t offset, Attributes &out) const
  {
    out.reserve(tok.attributes.size());
    for (const auto &attr : tok.attributes)
    {
      std::string value;
      if (!parsers::xml::Lexer::decodeEntities(attr.value, value, _options.lenientEntities))
      {
        RSSFLOW_LOG_DEBUG("Tokenizer: attribute '" << attr.name << "' of <" << tok.name
                                                   << "> at offset " << offset
                                                   << " has bad entities, decoding leniently");
        if (!parsers::xml::Lexer::decodeEntities(attr.value, value, true))
        {
          value.assign(attr.value.data(), attr.value.size());
        }
      }
      out.emplace_back(lowercase(attr.name), std::move(value));
    }
  }

  static std::string_view trim(std::string_view s)
  {
    auto isSpace = [](char ch) { return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n'; };
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && isSpace(s[b]))
    {
      ++b;
    }
    while (e > b && isSpace(s[e - 1]))
    {
      --e;
    }
    return s.substr(b, e - b);
  }

  TokenizerOptions _options;
  parsers::xml::Lexer _lexer;
  bool _pendingEnd{false};
  std::string _pendingEndName;
  std::size_t _pendingEndOffset{0};
  std::size_t _malformed{0};
};

} // namespace feed
} // namespace rssflow
