// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RssFlow, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <arpa/inet.h>
#include <atomic>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <thread>

using namespace rssflow::io;
using rssflow::test::TestParser;

namespace
{
/// Loopback listener on an ephemeral port.
class LoopbackServer
{
public:
  LoopbackServer()
  {
    _fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    REQUIRE(_fd >= 0);
    int one = 1;
    REQUIRE(::setsockopt(_fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) == 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    REQUIRE(::bind(_fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0);
    REQUIRE(::listen(_fd, 4) == 0);
    socklen_t len = sizeof(addr);
    REQUIRE(::getsockname(_fd, reinterpret_cast<sockaddr *>(&addr), &len) == 0);
    _port = ntohs(addr.sin_port);
  }

  ~LoopbackServer()
  {
    if (_fd >= 0)
    {
      ::close(_fd);
    }
  }

  std::uint16_t port() const { return _port; }

  /// Accept one client and send \p payload in \p chunk sized pieces.
  void serveOnce(const std::string &payload, std::size_t chunk)
  {
    int client = ::accept(_fd, nullptr, nullptr);
    if (client < 0)
    {
      return;
    }
    for (std::size_t off = 0; off < payload.size(); off += chunk)
    {
      std::size_t n = std::min(chunk, payload.size() - off);
      if (::send(client, payload.data() + off, n, MSG_NOSIGNAL) != static_cast<ssize_t>(n))
      {
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    ::close(client);
  }

  /// Close the listening socket so the port refuses connections.
  void shutdown()
  {
    ::close(_fd);
    _fd = -1;
  }

private:
  int _fd{-1};
  std::uint16_t _port{0};
};
} // namespace

TEST_CASE("FdSource - Files and pipes", "[io][fd]")
{
  rssflow::test::initializeTestLogging();

  SECTION("Reads a file to the end")
  {
    rssflow::test::TempFile file("hello feed");
    auto source = FdSource::openFile(file.path());
    char buf[64];
    auto r = source->read(buf, sizeof(buf));
    REQUIRE(r.status == ReadStatus::Data);
    REQUIRE(std::string(buf, r.count) == "hello feed");
    REQUIRE(source->read(buf, sizeof(buf)).status == ReadStatus::EndOfInput);
    REQUIRE(source->read(buf, sizeof(buf)).status == ReadStatus::EndOfInput);
    REQUIRE(source->describe() == file.path());
  }

  SECTION("Missing file")
  {
    REQUIRE_THROWS_AS(FdSource::openFile("/nonexistent/feed.xml"), SourceError);
  }

  SECTION("Invalid descriptor")
  {
    REQUIRE_THROWS_AS(FdSource(-1, false), SourceError);
  }

  SECTION("Non-blocking pipe reports WouldBlock")
  {
    int fds[2];
    REQUIRE(::pipe2(fds, O_NONBLOCK | O_CLOEXEC) == 0);
    FdSource source(fds[0], true);
    char buf[16];
    REQUIRE(source.read(buf, sizeof(buf)).status == ReadStatus::WouldBlock);
    REQUIRE(::write(fds[1], "abc", 3) == 3);
    REQUIRE(source.waitReadable(std::chrono::milliseconds(100)));
    auto r = source.read(buf, sizeof(buf));
    REQUIRE(r.status == ReadStatus::Data);
    REQUIRE(r.count == 3);
    ::close(fds[1]);
    REQUIRE(source.read(buf, sizeof(buf)).status == ReadStatus::EndOfInput);
  }

  SECTION("Parser over a pipe fed by another thread")
  {
    int fds[2];
    REQUIRE(::pipe2(fds, O_NONBLOCK | O_CLOEXEC) == 0);
    std::string doc = rssflow::test::makeFeed(20);
    std::thread writer(
      [&doc, fd = fds[1]]
      {
        for (std::size_t off = 0; off < doc.size(); off += 7)
        {
          std::size_t n = std::min<std::size_t>(7, doc.size() - off);
          std::size_t done = 0;
          while (done < n)
          {
            ssize_t w = ::write(fd, doc.data() + off + done, n - done);
            if (w > 0)
            {
              done += static_cast<std::size_t>(w);
            }
            else
            {
              std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
          }
        }
        ::close(fd);
      });

    rssflow::feed::ParserOptions opts;
    opts.emptyReadBudget = 0;
    opts.pollInterval = std::chrono::milliseconds(10);
    auto parser = TestParser::fromFd(fds[0], true, opts);
    auto items = rssflow::test::collect(parser);
    writer.join();
    REQUIRE(items.size() == 20);
    REQUIRE(items[19].title == std::optional<std::string>("Item 19"));
    REQUIRE(parser.state() == rssflow::feed::ParseState::Exhausted);
  }
}

TEST_CASE("SocketSource - TCP", "[io][socket]")
{
  rssflow::test::initializeTestLogging();

  SECTION("Socket pair")
  {
    int sv[2];
    REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv) == 0);
    const std::string doc = "<rss><item><title>S</title></item></rss>";
    REQUIRE(::send(sv[1], doc.data(), doc.size(), MSG_NOSIGNAL) ==
            static_cast<ssize_t>(doc.size()));
    ::close(sv[1]);
    auto parser = TestParser::fromSocket(sv[0], true);
    auto item = parser.next();
    REQUIRE(item);
    REQUIRE(item->title == std::optional<std::string>("S"));
    REQUIRE_FALSE(parser.next());
  }

  SECTION("Connect and stream a feed")
  {
    LoopbackServer server;
    std::string doc = rssflow::test::SAMPLE_RSS;
    std::thread t([&server, &doc] { server.serveOnce(doc, 13); });

    rssflow::feed::ParserOptions opts;
    opts.emptyReadBudget = 0;
    opts.pollInterval = std::chrono::milliseconds(10);
    auto parser = TestParser::connect("127.0.0.1", server.port(), opts);
    auto items = rssflow::test::collect(parser);
    t.join();
    REQUIRE(items.size() == 2);
    REQUIRE(items[1].description ==
            std::optional<std::string>("Description with <b>HTML</b> content"));
    REQUIRE(parser.stats().bytesRead == doc.size());
  }

  SECTION("Refused connection")
  {
    LoopbackServer server;
    std::uint16_t port = server.port();
    server.shutdown();
    try
    {
      auto fd = connectTcp("127.0.0.1", port, std::chrono::milliseconds(1000));
      ::close(fd);
      FAIL("connection to a closed port succeeded");
    }
    catch (const SourceError &e)
    {
      REQUIRE(e.code() == SourceErrorCode::Connect);
      REQUIRE(e.sysErrno() == ECONNREFUSED);
    }
  }

  SECTION("Unresolvable host")
  {
    REQUIRE_THROWS_AS(connectTcp("host.invalid", 80), SourceError);
  }
}

TEST_CASE("TlsSource - Session errors", "[io][tls]")
{
  rssflow::test::initializeTestLogging();

  SECTION("Null session is rejected")
  {
    REQUIRE_THROWS_AS(TlsSource(nullptr, false), SourceError);
  }

  SECTION("Non-TLS peer fails the read")
  {
    int sv[2];
    REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv) == 0);
    const std::string garbage = "HTTP/1.0 400 Bad Request\r\n\r\n";
    REQUIRE(::send(sv[1], garbage.data(), garbage.size(), MSG_NOSIGNAL) ==
            static_cast<ssize_t>(garbage.size()));

    SSL_CTX *ctx = ::SSL_CTX_new(::TLS_client_method());
    REQUIRE(ctx != nullptr);
    SSL *ssl = ::SSL_new(ctx);
    REQUIRE(ssl != nullptr);
    REQUIRE(::SSL_set_fd(ssl, sv[0]) == 1);
    ::SSL_set_connect_state(ssl);
    {
      TlsSource source(ssl, true, "tls-test");
      char buf[64];
      auto r = source.read(buf, sizeof(buf));
      REQUIRE(r.status == ReadStatus::Failed);
      REQUIRE((r.code == SourceErrorCode::TLS || r.code == SourceErrorCode::PeerReset));
      REQUIRE(source.read(buf, sizeof(buf)).status == ReadStatus::Failed);
      REQUIRE_FALSE(source.waitReadable(std::chrono::milliseconds(1)));
    }
    ::SSL_CTX_free(ctx);
    ::close(sv[0]);
    ::close(sv[1]);
  }
}
