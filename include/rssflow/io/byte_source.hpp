// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RssFlow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <cstddef>
#include <cstring>
#include <stdexcept>
#include <string>

namespace rssflow
{
namespace io
{

enum class SourceErrorCode
{
  None = 0,
  Open,
  Read,
  Resolve,
  Connect,
  Timeout,
  PeerReset,
  TLS,
  Closed,
  Unknown
};

inline const char *toString(SourceErrorCode code)
{
  switch (code)
  {
  case SourceErrorCode::None:
    return "none";
  case SourceErrorCode::Open:
    return "open";
  case SourceErrorCode::Read:
    return "read";
  case SourceErrorCode::Resolve:
    return "resolve";
  case SourceErrorCode::Connect:
    return "connect";
  case SourceErrorCode::Timeout:
    return "timeout";
  case SourceErrorCode::PeerReset:
    return "peer reset";
  case SourceErrorCode::TLS:
    return "tls";
  case SourceErrorCode::Closed:
    return "closed";
  default:
    return "unknown";
  }
}

/// \brief Setup failure raised by source constructors and factories
/// (file not found, connection refused, ...).
class SourceError : public std::runtime_error
{
public:
  SourceError(SourceErrorCode code, const std::string &message, int sysErrno = 0)
    : std::runtime_error(message), _code(code), _sysErrno(sysErrno)
  {
  }

  SourceErrorCode code() const { return _code; }
  int sysErrno() const { return _sysErrno; }

private:
  SourceErrorCode _code;
  int _sysErrno;
};

enum class ReadStatus
{
  Data,       ///< `count` bytes were written to the destination
  WouldBlock, ///< Nothing available right now; try again later
  EndOfInput, ///< The channel is closed; no more bytes will arrive
  Failed      ///< Terminal I/O failure; see code/message
};

/// \brief Outcome of one ByteSource::read() call.
struct ReadResult
{
  ReadStatus status{ReadStatus::Data};
  std::size_t count{0};
  SourceErrorCode code{SourceErrorCode::None};
  std::string message;
  int sysErrno{0};

  bool ok() const { return status != ReadStatus::Failed; }

  static ReadResult data(std::size_t n) { return {ReadStatus::Data, n, SourceErrorCode::None, "", 0}; }

  static ReadResult wouldBlock() { return {ReadStatus::WouldBlock, 0, SourceErrorCode::None, "", 0}; }

  static ReadResult endOfInput()
  {
    return {ReadStatus::EndOfInput, 0, SourceErrorCode::None, "", 0};
  }

  static ReadResult failure(SourceErrorCode c, const std::string &m, int se = 0)
  {
    return {ReadStatus::Failed, 0, c, m, se};
  }

  /// \brief Failure built from errno, with strerror text appended to \p context.
  static ReadResult fromErrno(SourceErrorCode c, const std::string &context, int se)
  {
    return failure(c, context + ": " + std::strerror(se), se);
  }
};

/// \brief Uniform "read more bytes, maybe none yet" contract over any
/// byte-producing channel.
///
/// A source is driven by exactly one reader; there is never more than one
/// outstanding read(). Each successful read advances the channel.
class ByteSource
{
public:
  virtual ~ByteSource() = default;

  /// \brief Read up to \p capacity bytes into \p dst.
  ///
  /// A Data result always carries count > 0. After EndOfInput or Failed the
  /// source must keep returning the same status.
  virtual ReadResult read(char *dst, std::size_t capacity) = 0;

  /// \brief Block until the channel may have data or \p timeout elapses.
  /// Returns false when waiting is impossible. Sources that never return
  /// WouldBlock keep the default.
  virtual bool waitReadable(std::chrono::milliseconds timeout)
  {
    (void)timeout;
    return true;
  }

  /// \brief Short description used in log messages.
  virtual std::string describe() const = 0;
};

} // namespace io
} // namespace rssflow
