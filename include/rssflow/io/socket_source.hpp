// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RssFlow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
#ifndef __linux__
#error "Linux-only (SOCK_NONBLOCK/SOCK_CLOEXEC)"
#endif

#include "fd_source.hpp"
#include <rssflow/core/logger.hpp>

#include <cstdint>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

namespace rssflow
{
namespace io
{

/// \brief Source over a connected stream socket.
class SocketSource : public FdSource
{
public:
  SocketSource(int fd, bool owned, std::string label = "")
    : FdSource(fd, owned, label.empty() ? "socket:" + std::to_string(fd) : std::move(label))
  {
  }

protected:
  ssize_t readOnce(char *dst, std::size_t capacity) override
  {
    return ::recv(fd(), dst, capacity, 0);
  }

  ReadResult classify(int sysErrno) override
  {
    if (sysErrno == ECONNRESET || sysErrno == EPIPE || sysErrno == ENOTCONN)
    {
      return ReadResult::fromErrno(SourceErrorCode::PeerReset, "recv " + describe(), sysErrno);
    }
    return ReadResult::fromErrno(SourceErrorCode::Read, "recv " + describe(), sysErrno);
  }
};

/// \brief Resolve \p host and open a TCP connection to it.
///
/// The returned descriptor is non-blocking and owned by the caller.
/// \throws SourceError on resolve failure, refusal or timeout
inline int connectTcp(const std::string &host, std::uint16_t port,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
{
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *res = nullptr;
  std::string service = std::to_string(port);
  int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
  if (rc != 0)
  {
    throw SourceError(SourceErrorCode::Resolve,
                      "getaddrinfo(" + host + "): " + ::gai_strerror(rc));
  }

  int lastErr = 0;
  SourceErrorCode lastCode = SourceErrorCode::Connect;
  for (addrinfo *ai = res; ai; ai = ai->ai_next)
  {
    int cfd = ::socket(ai->ai_family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (cfd < 0)
    {
      lastErr = errno;
      continue;
    }
    int one = 1;
    if (::setsockopt(cfd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) != 0)
    {
      RSSFLOW_LOG_DEBUG("connectTcp: TCP_NODELAY not applied: " << std::strerror(errno));
    }

    int err = 0;
    if (::connect(cfd, ai->ai_addr, ai->ai_addrlen) != 0)
    {
      err = errno;
      if (err == EINPROGRESS)
      {
        pollfd pfd{};
        pfd.fd = cfd;
        pfd.events = POLLOUT;
        int prc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (prc == 0)
        {
          err = ETIMEDOUT;
        }
        else if (prc < 0)
        {
          err = errno;
        }
        else
        {
          socklen_t len = sizeof(err);
          if (::getsockopt(cfd, SOL_SOCKET, SO_ERROR, &err, &len) != 0)
          {
            err = errno;
          }
        }
      }
    }
    if (err == 0)
    {
      ::freeaddrinfo(res);
      RSSFLOW_LOG_DEBUG("connectTcp: connected to " << host << ":" << port << " fd=" << cfd);
      return cfd;
    }
    ::close(cfd);
    lastErr = err;
    lastCode = (err == ETIMEDOUT) ? SourceErrorCode::Timeout : SourceErrorCode::Connect;
  }
  ::freeaddrinfo(res);
  throw SourceError(lastCode,
                    "connect(" + host + ":" + service + "): " + std::strerror(lastErr), lastErr);
}

} // namespace io
} // namespace rssflow
