// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RssFlow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <rssflow/core/logger.hpp>
#include <rssflow/io/byte_source.hpp>

#include <algorithm>
#include <cstring>
#include <string_view>
#include <vector>

namespace rssflow
{
namespace feed
{

enum class FillStatus
{
  Ready,      ///< The window already was large enough or grew
  Pending,    ///< The source had nothing right now
  EndOfInput, ///< No more bytes will arrive (closed, or retry budget spent)
  Failed,     ///< The source failed; see lastFailure()
  Overflow    ///< The window reached the size limit without room to read
};

/// \brief Growable window of bytes read from a source but not yet consumed.
///
/// Storage doubles when it runs out of room and the unconsumed tail is moved
/// to the front before growing, so memory stays proportional to the largest
/// single token rather than to the document. Views returned by window() are
/// invalidated by ensure() and consume().
class InputBuffer
{
public:
  /// \param maxSize upper bound on storage, 0 for unbounded
  /// \param emptyReadBudget consecutive WouldBlock reads tolerated before
  ///        end-of-input is assumed, 0 for unbounded
  InputBuffer(io::ByteSource &source, std::size_t initialSize, std::size_t readChunk,
              std::size_t maxSize, std::size_t emptyReadBudget)
    : _source(&source), _readChunk(std::max<std::size_t>(readChunk, 1)), _maxSize(maxSize),
      _emptyReadBudget(emptyReadBudget)
  {
    _storage.resize(std::max<std::size_t>(initialSize, 1));
  }

  /// \brief Make sure at least \p minExtra unconsumed bytes are available,
  /// performing at most one source read.
  FillStatus ensure(std::size_t minExtra)
  {
    if (remaining() >= minExtra)
    {
      return FillStatus::Ready;
    }
    if (_failed)
    {
      return FillStatus::Failed;
    }
    if (_eof)
    {
      return FillStatus::EndOfInput;
    }
    if (!makeRoom())
    {
      return FillStatus::Overflow;
    }

    io::ReadResult r = _source->read(_storage.data() + _end, _storage.size() - _end);
    switch (r.status)
    {
    case io::ReadStatus::Data:
      _end += r.count;
      _bytesRead += r.count;
      _emptyReads = 0;
      return FillStatus::Ready;
    case io::ReadStatus::WouldBlock:
      ++_emptyReads;
      if (_emptyReadBudget != 0 && _emptyReads > _emptyReadBudget)
      {
        RSSFLOW_LOG_WARN("InputBuffer: no data from " << _source->describe() << " after "
                                                      << _emptyReads
                                                      << " attempts, treating as end of input");
        _eof = true;
        return FillStatus::EndOfInput;
      }
      return FillStatus::Pending;
    case io::ReadStatus::EndOfInput:
      _eof = true;
      return FillStatus::EndOfInput;
    case io::ReadStatus::Failed:
    default:
      _failed = true;
      _eof = true;
      _failure = std::move(r);
      return FillStatus::Failed;
    }
  }

  /// \brief Drop the first \p n bytes of the window.
  void consume(std::size_t n)
  {
    n = std::min(n, remaining());
    _begin += n;
    _consumedTotal += n;
    if (_begin == _end)
    {
      _begin = _end = 0;
    }
  }

  std::size_t remaining() const { return _end - _begin; }

  std::string_view window() const
  {
    return std::string_view(_storage.data() + _begin, remaining());
  }

  /// \brief True once the source reported end-of-input or failure.
  bool atEnd() const { return _eof; }

  bool failed() const { return _failed; }

  const io::ReadResult &lastFailure() const { return _failure; }

  /// \brief Absolute offset of window()[0] in the input stream.
  std::size_t consumedTotal() const { return _consumedTotal; }

  std::size_t bytesRead() const { return _bytesRead; }

  std::size_t capacity() const { return _storage.size(); }

  io::ByteSource &source() { return *_source; }

private:
  bool makeRoom()
  {
    if (_storage.size() - _end >= _readChunk)
    {
      return true;
    }
    if (_begin > 0)
    {
      std::memmove(_storage.data(), _storage.data() + _begin, remaining());
      _end -= _begin;
      _begin = 0;
      if (_storage.size() - _end >= _readChunk)
      {
        return true;
      }
    }
    std::size_t wanted = std::max(_storage.size() * 2, _end + _readChunk);
    if (_maxSize != 0)
    {
      wanted = std::min(wanted, _maxSize);
    }
    if (wanted > _storage.size())
    {
      _storage.resize(wanted);
    }
    return _storage.size() > _end;
  }

  io::ByteSource *_source;
  std::vector<char> _storage;
  std::size_t _begin{0};
  std::size_t _end{0};
  std::size_t _readChunk;
  std::size_t _maxSize;
  std::size_t _emptyReadBudget;
  std::size_t _emptyReads{0};
  std::size_t _consumedTotal{0};
  std::size_t _bytesRead{0};
  bool _eof{false};
  bool _failed{false};
  io::ReadResult _failure;
};

} // namespace feed
} // namespace rssflow
