// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RssFlow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "byte_source.hpp"

#include <cerrno>
#include <fcntl.h>
#include <memory>
#include <poll.h>
#include <string>
#include <unistd.h>

namespace rssflow
{
namespace io
{

/// \brief Source over a POSIX file descriptor (file, pipe, character device).
///
/// Works with blocking and non-blocking descriptors; EAGAIN is reported as
/// WouldBlock. An owned descriptor is closed on destruction.
class FdSource : public ByteSource
{
public:
  FdSource(int fd, bool owned, std::string label = "")
    : _fd(fd), _owned(owned), _label(label.empty() ? "fd:" + std::to_string(fd) : std::move(label))
  {
    if (_fd < 0)
    {
      throw SourceError(SourceErrorCode::Open, "FdSource: invalid file descriptor");
    }
  }

  FdSource(const FdSource &) = delete;
  FdSource &operator=(const FdSource &) = delete;

  ~FdSource() override
  {
    if (_owned && _fd >= 0)
    {
      ::close(_fd);
    }
  }

  /// \brief Open \p path read-only.
  /// \throws SourceError when the file cannot be opened
  static std::unique_ptr<FdSource> openFile(const std::string &path)
  {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0)
    {
      int e = errno;
      throw SourceError(SourceErrorCode::Open,
                        "cannot open '" + path + "': " + std::strerror(e), e);
    }
    return std::make_unique<FdSource>(fd, true, path);
  }

  ReadResult read(char *dst, std::size_t capacity) override
  {
    if (_terminal)
    {
      return *_terminal;
    }
    while (true)
    {
      ssize_t n = readOnce(dst, capacity);
      if (n > 0)
      {
        return ReadResult::data(static_cast<std::size_t>(n));
      }
      if (n == 0)
      {
        return finish(ReadResult::endOfInput());
      }
      int e = errno;
      if (e == EINTR)
      {
        continue;
      }
      if (e == EAGAIN || e == EWOULDBLOCK)
      {
        return ReadResult::wouldBlock();
      }
      return finish(classify(e));
    }
  }

  bool waitReadable(std::chrono::milliseconds timeout) override
  {
    if (_terminal)
    {
      return false;
    }
    pollfd pfd{};
    pfd.fd = _fd;
    pfd.events = POLLIN;
    int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    return rc >= 0 || errno == EINTR;
  }

  std::string describe() const override { return _label; }

  int fd() const { return _fd; }

protected:
  virtual ssize_t readOnce(char *dst, std::size_t capacity) { return ::read(_fd, dst, capacity); }

  virtual ReadResult classify(int sysErrno)
  {
    return ReadResult::fromErrno(SourceErrorCode::Read, "read " + _label, sysErrno);
  }

private:
  ReadResult finish(ReadResult r)
  {
    _terminal = std::make_unique<ReadResult>(r);
    return r;
  }

  int _fd;
  bool _owned;
  std::string _label;
  std::unique_ptr<ReadResult> _terminal;
};

} // namespace io
} // namespace rssflow
