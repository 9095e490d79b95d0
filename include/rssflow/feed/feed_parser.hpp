// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RssFlow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "input_buffer.hpp"
#include "parser_options.hpp"
#include "raw_node.hpp"
#include "record_accumulator.hpp"
#include "strategy.hpp"
#include "tokenizer.hpp"
#include <rssflow/core/logger.hpp>
#include <rssflow/io/byte_source.hpp>
#include <rssflow/io/fd_source.hpp>
#include <rssflow/io/memory_source.hpp>
#include <rssflow/io/socket_source.hpp>
#include <rssflow/io/tls_source.hpp>

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace rssflow
{
namespace feed
{

/// \brief Observable parse state.
enum class ParseState
{
  Seeking,   ///< Between records
  InRecord,  ///< Inside a record, waiting for its closing tag
  Exhausted, ///< Source ended; the sequence is over
  Failed     ///< Source failed; see lastError()
};

inline const char *toString(ParseState state)
{
  switch (state)
  {
  case ParseState::Seeking:
    return "seeking";
  case ParseState::InRecord:
    return "in-record";
  case ParseState::Exhausted:
    return "exhausted";
  case ParseState::Failed:
    return "failed";
  }
  return "unknown";
}

/// \brief Counters accumulated over one parse.
struct ParserStats
{
  std::size_t bytesRead{0};
  std::size_t recordsEmitted{0};
  std::size_t malformedSkipped{0};
  std::size_t partialRecordsDiscarded{0};
};

/// \brief Incremental record extractor over a byte source.
///
/// Bytes are pulled from the source only when the tokenizer cannot make
/// progress, so records are emitted as soon as their closing tag arrives and
/// memory stays bounded by the largest token plus the current record.
///
/// \code
/// struct Item
/// {
///   std::string title;
///   static Item init() { return {}; }
///   void populate(rssflow::feed::RawNode &&node)
///   {
///     if (node.tag == "title") title = node.value().value_or("");
///   }
/// };
///
/// auto parser = rssflow::feed::FeedParser<Item>::fromFile("feed.xml");
/// for (auto &item : parser)
/// {
///   std::cout << item.title << "\n";
/// }
/// \endcode
///
/// A parser has one owner at a time; it is movable but not copyable.
/// Iterators and the blocking next() share the same underlying sequence.
template <typename Record, typename Strategy = MemberStrategy<Record>> class FeedParser
{
public:
  using record_type = Record;
  using strategy_type = Strategy;

  struct PollResult
  {
    enum class Status
    {
      Ready,   ///< `record` holds the next record
      Pending, ///< The source has no bytes right now; poll again later
      End      ///< The sequence is over (see state())
    };

    Status status{Status::End};
    std::optional<Record> record;
  };

  /// \brief Non-restartable input iterator over the remaining records.
  class iterator
  {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Record;
    using difference_type = std::ptrdiff_t;
    using pointer = Record *;
    using reference = Record &;

    iterator() = default;

    explicit iterator(FeedParser *parser) : _parser(parser) { advance(); }

    reference operator*() { return *_current; }
    pointer operator->() { return &*_current; }

    iterator &operator++()
    {
      advance();
      return *this;
    }

    void operator++(int) { advance(); }

    bool operator==(const iterator &other) const { return _parser == other._parser; }
    bool operator!=(const iterator &other) const { return _parser != other._parser; }

  private:
    void advance()
    {
      _current = _parser->next();
      if (!_current)
      {
        _parser = nullptr;
      }
    }

    FeedParser *_parser{nullptr};
    std::optional<Record> _current;
  };

  FeedParser(std::unique_ptr<io::ByteSource> source, ParserOptions options = ParserOptions{},
             Strategy strategy = Strategy{})
    : _source(checked(std::move(source))), _options(std::move(options)),
      _buffer(*_source, _options.initialBufferSize, _options.readChunkSize,
              _options.maxBufferSize, _options.emptyReadBudget),
      _tokenizer(tokenizerOptions(_options)),
      _accumulator(std::move(strategy), _options.recordTag)
  {
    RSSFLOW_LOG_DEBUG("FeedParser: reading <" << _options.recordTag << "> records from "
                                              << _source->describe());
  }

  FeedParser(const FeedParser &) = delete;
  FeedParser &operator=(const FeedParser &) = delete;
  FeedParser(FeedParser &&) = default;
  FeedParser &operator=(FeedParser &&) = default;

  // ── Factories ─────────────────────────────────────────────────────────

  static FeedParser fromSource(std::unique_ptr<io::ByteSource> source,
                               ParserOptions options = ParserOptions{},
                               Strategy strategy = Strategy{})
  {
    return FeedParser(std::move(source), std::move(options), std::move(strategy));
  }

  /// \brief Parse an in-memory document.
  static FeedParser fromString(std::string document, ParserOptions options = ParserOptions{},
                               Strategy strategy = Strategy{})
  {
    return FeedParser(std::make_unique<io::MemorySource>(std::move(document)),
                      std::move(options), std::move(strategy));
  }

  /// \brief Parse from a stream that must outlive the parser.
  static FeedParser fromStream(std::istream &in, ParserOptions options = ParserOptions{},
                               Strategy strategy = Strategy{})
  {
    return FeedParser(std::make_unique<io::StreamSource>(in), std::move(options),
                      std::move(strategy));
  }

  /// \throws io::SourceError if the file cannot be opened
  static FeedParser fromFile(const std::string &path, ParserOptions options = ParserOptions{},
                             Strategy strategy = Strategy{})
  {
    return FeedParser(io::FdSource::openFile(path), std::move(options), std::move(strategy));
  }

  static FeedParser fromFd(int fd, bool owned = false, ParserOptions options = ParserOptions{},
                           Strategy strategy = Strategy{})
  {
    return FeedParser(std::make_unique<io::FdSource>(fd, owned), std::move(options),
                      std::move(strategy));
  }

  static FeedParser fromSocket(int fd, bool owned = false,
                               ParserOptions options = ParserOptions{},
                               Strategy strategy = Strategy{})
  {
    return FeedParser(std::make_unique<io::SocketSource>(fd, owned), std::move(options),
                      std::move(strategy));
  }

  /// \brief Connect to \p host:\p port over TCP and parse what the peer sends.
  /// \throws io::SourceError on resolve or connect failure
  static FeedParser connect(const std::string &host, std::uint16_t port,
                            ParserOptions options = ParserOptions{},
                            Strategy strategy = Strategy{},
                            std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
  {
    int fd = io::connectTcp(host, port, timeout);
    auto source = std::make_unique<io::SocketSource>(fd, true, host + ":" + std::to_string(port));
    RSSFLOW_LOG_INFO("FeedParser: connected to " << host << ":" << port);
    return FeedParser(std::move(source), std::move(options), std::move(strategy));
  }

  /// \brief Parse application data of an established TLS session.
  static FeedParser fromTls(SSL *ssl, bool owned = false, ParserOptions options = ParserOptions{},
                            Strategy strategy = Strategy{})
  {
    return FeedParser(std::make_unique<io::TlsSource>(ssl, owned), std::move(options),
                      std::move(strategy));
  }

  // ── Sequence ──────────────────────────────────────────────────────────

  /// \brief Advance without blocking on the source.
  ///
  /// Returns Pending when a read found no bytes; calling again resumes at
  /// the same position. After End every call returns End.
  PollResult poll()
  {
    using Status = typename PollResult::Status;
    if (_terminal)
    {
      return {Status::End, std::nullopt};
    }

    while (true)
    {
      Event ev = _tokenizer.next(_buffer);
      switch (ev.kind)
      {
      case Event::Kind::NeedMore:
        switch (_buffer.ensure(_buffer.remaining() + 1))
        {
        case FillStatus::Ready:
        case FillStatus::EndOfInput:
          continue;
        case FillStatus::Pending:
          return {Status::Pending, std::nullopt};
        case FillStatus::Overflow:
          discardWindow();
          continue;
        case FillStatus::Failed:
          fail();
          return {Status::End, std::nullopt};
        }
        continue;
      case Event::Kind::EndOfInput:
        finish();
        return {Status::End, std::nullopt};
      case Event::Kind::Malformed:
        ++_stats.malformedSkipped;
        continue;
      default:
        if (_accumulator.feed(std::move(ev)))
        {
          ++_stats.recordsEmitted;
          return {Status::Ready, _accumulator.takeRecord()};
        }
        continue;
      }
    }
  }

  /// \brief Blocking pull of the next record; std::nullopt at the end.
  std::optional<Record> next()
  {
    while (true)
    {
      PollResult r = poll();
      switch (r.status)
      {
      case PollResult::Status::Ready:
        return std::move(r.record);
      case PollResult::Status::End:
        return std::nullopt;
      case PollResult::Status::Pending:
        if (!_source->waitReadable(_options.pollInterval))
        {
          // The empty-read budget still bounds the retries
          RSSFLOW_LOG_TRACE("FeedParser: " << _source->describe() << " cannot wait, retrying");
        }
        break;
      }
    }
  }

  /// \brief Iterate the remaining records. A second begin() continues where
  /// the previous iteration stopped.
  iterator begin() { return iterator(this); }
  iterator end() { return iterator(); }

  ParseState state() const
  {
    if (_terminal)
    {
      return *_terminal;
    }
    return _accumulator.inRecord() ? ParseState::InRecord : ParseState::Seeking;
  }

  /// \brief The source failure that ended the sequence, if any.
  const std::optional<io::ReadResult> &lastError() const { return _lastError; }

  ParserStats stats() const
  {
    ParserStats s = _stats;
    s.bytesRead = _buffer.bytesRead();
    return s;
  }

  const ParserOptions &options() const { return _options; }

  io::ByteSource &source() { return *_source; }

private:
  static std::unique_ptr<io::ByteSource> checked(std::unique_ptr<io::ByteSource> source)
  {
    if (!source)
    {
      throw io::SourceError(io::SourceErrorCode::Open, "FeedParser: null byte source");
    }
    return source;
  }

  static TokenizerOptions tokenizerOptions(const ParserOptions &options)
  {
    TokenizerOptions t;
    t.lexer.maxTokenSpan = options.maxTokenSize;
    t.trimText = options.trimText;
    t.lenientEntities = options.lenientEntities;
    return t;
  }

  void discardWindow()
  {
    ++_stats.malformedSkipped;
    RSSFLOW_LOG_WARN("FeedParser: token exceeds " << _options.maxBufferSize
                                                  << " byte buffer at offset "
                                                  << _buffer.consumedTotal() << ", skipping "
                                                  << _buffer.remaining() << " bytes");
    _buffer.consume(_buffer.remaining());
  }

  void finish()
  {
    if (_accumulator.abandon())
    {
      ++_stats.partialRecordsDiscarded;
      RSSFLOW_LOG_WARN("FeedParser: " << _source->describe()
                                      << " ended inside a record; partial record discarded");
    }
    _terminal = ParseState::Exhausted;
    RSSFLOW_LOG_DEBUG("FeedParser: " << _source->describe() << " exhausted after "
                                     << _stats.recordsEmitted << " record(s)");
  }

  void fail()
  {
    if (_accumulator.abandon())
    {
      ++_stats.partialRecordsDiscarded;
    }
    _lastError = _buffer.lastFailure();
    _terminal = ParseState::Failed;
    RSSFLOW_LOG_ERROR("FeedParser: " << _source->describe() << " failed ("
                                     << io::toString(_lastError->code)
                                     << "): " << _lastError->message);
  }

  std::unique_ptr<io::ByteSource> _source;
  ParserOptions _options;
  InputBuffer _buffer;
  Tokenizer _tokenizer;
  RecordAccumulator<Record, Strategy> _accumulator;
  ParserStats _stats;
  std::optional<ParseState> _terminal;
  std::optional<io::ReadResult> _lastError;
};

} // namespace feed
} // namespace rssflow
