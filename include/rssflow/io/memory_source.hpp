// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RssFlow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "byte_source.hpp"

#include <algorithm>
#include <cstring>
#include <istream>
#include <string>

namespace rssflow
{
namespace io
{

/// \brief In-memory source. Can hand out the data in fixed-size chunks,
/// report WouldBlock before each chunk and end in a failure instead of
/// end-of-input, which makes it the driver for chunking and recovery tests.
class MemorySource : public ByteSource
{
public:
  /// \param maxChunk bytes per read, 0 for "as much as fits"
  /// \param stallsPerChunk WouldBlock results returned before every chunk
  explicit MemorySource(std::string data, std::size_t maxChunk = 0,
                        std::size_t stallsPerChunk = 0)
    : _data(std::move(data)), _maxChunk(maxChunk), _stallsPerChunk(stallsPerChunk)
  {
  }

  /// \brief Report \p code instead of end-of-input once the data is drained.
  void failAtEnd(SourceErrorCode code, const std::string &message)
  {
    _failCode = code;
    _failMessage = message;
  }

  ReadResult read(char *dst, std::size_t capacity) override
  {
    if (_pos >= _data.size())
    {
      if (_failCode != SourceErrorCode::None)
      {
        return ReadResult::failure(_failCode, _failMessage);
      }
      return ReadResult::endOfInput();
    }
    if (_stalls < _stallsPerChunk)
    {
      ++_stalls;
      return ReadResult::wouldBlock();
    }
    _stalls = 0;

    std::size_t n = std::min(capacity, _data.size() - _pos);
    if (_maxChunk != 0)
    {
      n = std::min(n, _maxChunk);
    }
    std::memcpy(dst, _data.data() + _pos, n);
    _pos += n;
    ++_reads;
    return ReadResult::data(n);
  }

  std::string describe() const override { return "memory(" + std::to_string(_data.size()) + ")"; }

  std::size_t position() const { return _pos; }
  std::size_t reads() const { return _reads; }

private:
  std::string _data;
  std::size_t _pos{0};
  std::size_t _maxChunk;
  std::size_t _stallsPerChunk;
  std::size_t _stalls{0};
  std::size_t _reads{0};
  SourceErrorCode _failCode{SourceErrorCode::None};
  std::string _failMessage;
};

/// \brief Adapter for any std::istream. The stream is borrowed and must
/// outlive the source.
class StreamSource : public ByteSource
{
public:
  explicit StreamSource(std::istream &in) : _in(in) {}

  ReadResult read(char *dst, std::size_t capacity) override
  {
    if (_in.bad())
    {
      return ReadResult::failure(SourceErrorCode::Read, "stream is in a bad state");
    }
    if (_in.eof())
    {
      return ReadResult::endOfInput();
    }
    _in.read(dst, static_cast<std::streamsize>(capacity));
    std::streamsize n = _in.gcount();
    if (_in.bad())
    {
      return ReadResult::failure(SourceErrorCode::Read, "stream read failed");
    }
    if (n > 0)
    {
      return ReadResult::data(static_cast<std::size_t>(n));
    }
    return ReadResult::endOfInput();
  }

  std::string describe() const override { return "istream"; }

private:
  std::istream &_in;
};

} // namespace io
} // namespace rssflow
