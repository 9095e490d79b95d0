// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RssFlow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "byte_source.hpp"

#include <cerrno>
#include <climits>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <poll.h>
#include <string>

namespace rssflow
{
namespace io
{

/// \brief Source over an established OpenSSL session.
///
/// The handshake is the caller's business; the source only reads
/// application data. With \p owned the SSL object is freed on destruction
/// (the underlying socket stays with whoever created the BIO).
class TlsSource : public ByteSource
{
public:
  TlsSource(SSL *ssl, bool owned, std::string label = "tls") : _ssl(ssl), _owned(owned), _label(std::move(label))
  {
    if (!_ssl)
    {
      throw SourceError(SourceErrorCode::TLS, "TlsSource: null SSL session");
    }
  }

  TlsSource(const TlsSource &) = delete;
  TlsSource &operator=(const TlsSource &) = delete;

  ~TlsSource() override
  {
    if (_owned)
    {
      ::SSL_free(_ssl);
    }
  }

  ReadResult read(char *dst, std::size_t capacity) override
  {
    if (_done)
    {
      return _last;
    }
    int want = capacity > static_cast<std::size_t>(INT_MAX) ? INT_MAX : static_cast<int>(capacity);
    int n = ::SSL_read(_ssl, dst, want);
    if (n > 0)
    {
      return ReadResult::data(static_cast<std::size_t>(n));
    }
    int se = ::SSL_get_error(_ssl, n);
    switch (se)
    {
    case SSL_ERROR_WANT_READ:
    case SSL_ERROR_WANT_WRITE:
      return ReadResult::wouldBlock();
    case SSL_ERROR_ZERO_RETURN:
      return finish(ReadResult::endOfInput());
    case SSL_ERROR_SYSCALL:
    {
      int e = errno;
      if (e == ECONNRESET || e == EPIPE)
      {
        return finish(ReadResult::fromErrno(SourceErrorCode::PeerReset, "SSL_read", e));
      }
      return finish(ReadResult::failure(SourceErrorCode::TLS, "SSL_read: " + lastTlsError(), e));
    }
    default:
      return finish(ReadResult::failure(SourceErrorCode::TLS, "SSL_read: " + lastTlsError()));
    }
  }

  bool waitReadable(std::chrono::milliseconds timeout) override
  {
    if (_done)
    {
      return false;
    }
    if (::SSL_pending(_ssl) > 0)
    {
      return true;
    }
    int fd = ::SSL_get_rfd(_ssl);
    if (fd < 0)
    {
      return false;
    }
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    return rc >= 0 || errno == EINTR;
  }

  std::string describe() const override { return _label; }

private:
  static std::string lastTlsError()
  {
    unsigned long e = ::ERR_get_error();
    if (e == 0)
    {
      return "unexpected end of stream";
    }
    char msg[256];
    ::ERR_error_string_n(e, msg, sizeof(msg));
    ::ERR_clear_error();
    return msg;
  }

  ReadResult finish(ReadResult r)
  {
    _done = true;
    _last = r;
    return r;
  }

  SSL *_ssl;
  bool _owned;
  std::string _label;
  bool _done{false};
  ReadResult _last;
};

} // namespace io
} // namespace rssflow
