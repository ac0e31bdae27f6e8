/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <peerscout/delegated/impl/beast_http_client.hpp>

#include <gtest/gtest.h>

#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>
#include <fmt/format.h>

#include <peerscout/delegated/delegated_peer_routing.hpp>
#include <peerscout/delegated/error.hpp>
#include <peerscout/multi/base58.hpp>
#include "testutil/prepare_loggers.hpp"

using namespace peerscout;
using namespace peerscout::delegated;
using peer::PeerId;
using peer::PeerInfo;
using routing::PeerStream;
using tcp = boost::asio::ip::tcp;

using namespace std::chrono_literals;

namespace {
  constexpr std::string_view kClosest1 =
      "12D3KooWLewYMMdGWAtuX852n4rgCWkK7EBn4CWbwwBzhsVoKxk3";
  constexpr std::string_view kClosest2 =
      "12D3KooWDtoQbpKhtnWddfj72QmpFvvLDTsBLTFkjvgQm6cde2AK";

  /// Chunk of "Transfer-Encoding: chunked" body
  std::string chunk(std::string_view data) {
    return fmt::format("{:x}\r\n{}\r\n", data.size(), data);
  }

  /**
   * Accepts one connection on 127.0.0.1, reads request header and writes
   * reply pieces one by one, then shuts the connection down
   */
  class OneShotHttpServer {
   public:
    OneShotHttpServer(boost::asio::io_context &io,
                      std::vector<std::string> reply)
        : acceptor_(io, {boost::asio::ip::make_address("127.0.0.1"), 0}),
          socket_(io),
          reply_(std::move(reply)) {
      acceptor_.async_accept(socket_, [this](boost::system::error_code ec) {
        if (not ec) {
          readRequest();
        }
      });
    }

    uint16_t port() const {
      return acceptor_.local_endpoint().port();
    }

    /// Request line and headers as received
    std::string request;

   private:
    void readRequest() {
      boost::asio::async_read_until(
          socket_,
          request_buffer_,
          "\r\n\r\n",
          [this](boost::system::error_code ec, size_t size) {
            if (ec) {
              return;
            }
            auto begin = boost::asio::buffers_begin(request_buffer_.data());
            request.assign(begin, begin + static_cast<ptrdiff_t>(size));
            write(0);
          });
    }

    void write(size_t i) {
      if (i == reply_.size()) {
        boost::system::error_code ec;
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        return;
      }
      boost::asio::async_write(
          socket_,
          boost::asio::buffer(reply_[i]),
          [this, i](boost::system::error_code ec, size_t) {
            if (not ec) {
              write(i + 1);
            }
          });
    }

    tcp::acceptor acceptor_;
    tcp::socket socket_;
    boost::asio::streambuf request_buffer_;
    std::vector<std::string> reply_;
  };

  /// Result of pulling asynchronous stream to its end
  struct Pulled {
    std::vector<PeerInfo> peers;
    std::optional<std::error_code> error;
    bool finished = false;
  };

  void pullAll(std::shared_ptr<PeerStream> stream,
               std::shared_ptr<Pulled> pulled) {
    stream->next([stream, pulled](PeerStream::NextResult res) {
      if (res.has_error()) {
        pulled->error = res.error();
        pulled->finished = true;
      } else if (not res.value()) {
        pulled->finished = true;
      } else {
        pulled->peers.push_back(std::move(*res.value()));
        pullAll(stream, pulled);
      }
    });
  }
}  // namespace

class BeastHttpClientTest : public ::testing::Test {
 public:
  void SetUp() override {
    testutil::prepareLoggers();
  }

  /// Serves @param reply and points the delegate to the server
  void serve(std::vector<std::string> reply) {
    server = std::make_unique<OneShotHttpServer>(*io, std::move(reply));
    config.port = server->port();
    makeDelegate();
  }

  void makeDelegate() {
    delegate = std::make_shared<DelegatedPeerRouting>(
        config, std::make_shared<BeastHttpClient>(io, config));
  }

  std::shared_ptr<Pulled> closestPeers() {
    auto pulled = std::make_shared<Pulled>();
    pullAll(delegate->getClosestPeers(key, {}), pulled);
    io->run_for(5s);
    return pulled;
  }

  std::shared_ptr<boost::asio::io_context> io =
      std::make_shared<boost::asio::io_context>();
  Config config{.timeout = 5s};
  std::unique_ptr<OneShotHttpServer> server;
  std::shared_ptr<DelegatedPeerRouting> delegate;

  const Bytes key = PeerId::fromBase58(kClosest1).value().toVector();
};

/**
 * @given delegate which streams chunked ndjson reply, chunk boundaries split
 * lines @and one chunk is larger than a single read
 * @when draining closest peers over real connection
 * @then POST request is sent to the query endpoint @and both final peers
 * are yielded in order with their addresses
 */
TEST_F(BeastHttpClientTest, ClosestPeersChunked) {
  auto noise = fmt::format(
      R"({{"Extra":"{}","ID":"","Responses":null,"Type":0}})"
      "\n",
      std::string(6000, 'x'));
  auto body = fmt::format(
      R"({{"extra":"","id":"{0}","responses":[{{"ID":"{0}","Addrs":)"
      R"(["/ip4/127.0.0.1/tcp/63930"]}}],"type":1}})"
      "\n"
      R"({{"extra":"","id":"{1}","responses":[{{"ID":"{1}","Addrs":)"
      R"(["/ip4/127.0.0.1/tcp/63506","/ip4/127.0.0.1/tcp/63507"]}}],"type":1}})"
      "\n"
      R"({{"Extra":"","ID":"{1}","Responses":[],"Type":2}})"
      "\n"
      R"({{"Extra":"","ID":"{0}","Responses":[],"Type":2}})"
      "\n",
      kClosest1,
      kClosest2);
  serve({"HTTP/1.1 200 OK\r\n"
         "Content-Type: application/json\r\n"
         "Transfer-Encoding: chunked\r\n\r\n",
         chunk(noise),
         chunk(body.substr(0, 50)),
         chunk(body.substr(50, 170)),
         chunk(body.substr(220)),
         "0\r\n\r\n"});

  auto pulled = closestPeers();

  EXPECT_TRUE(server->request.starts_with(
      fmt::format("POST /api/v0/dht/query?arg={} HTTP/1.1\r\n",
                  multi::detail::encodeBase58(key))));
  EXPECT_TRUE(pulled->finished);
  EXPECT_FALSE(pulled->error);
  ASSERT_EQ(pulled->peers.size(), 2);
  EXPECT_EQ(pulled->peers[0].id.toBase58(), kClosest2);
  ASSERT_EQ(pulled->peers[0].addresses.size(), 2);
  EXPECT_EQ(pulled->peers[0].addresses[1].getStringAddress(),
            "/ip4/127.0.0.1/tcp/63507");
  EXPECT_EQ(pulled->peers[1].id.toBase58(), kClosest1);
  EXPECT_EQ(pulled->peers[1].addresses.size(), 1);
}

/**
 * @given delegate which answers with HTTP 502
 * @when draining closest peers over real connection
 * @then stream fails with BAD_STATUS
 */
TEST_F(BeastHttpClientTest, BadStatus) {
  serve({"HTTP/1.1 502 Bad Gateway\r\n"
         "Content-Length: 11\r\n\r\n"
         "Bad Gateway"});

  auto pulled = closestPeers();

  EXPECT_TRUE(pulled->finished);
  EXPECT_TRUE(pulled->peers.empty());
  EXPECT_EQ(pulled->error, make_error_code(DelegatedError::BAD_STATUS));
}

/**
 * @given port nobody listens on
 * @when looking for a peer
 * @then lookup fails with CONNECTION_FAILED
 */
TEST_F(BeastHttpClientTest, ConnectionRefused) {
  {
    tcp::acceptor closed(*io, {boost::asio::ip::make_address("127.0.0.1"), 0});
    config.port = closed.local_endpoint().port();
  }
  makeDelegate();

  std::optional<routing::PeerRouting::FindPeerResult> found;
  auto cancel = delegate->findPeer(
      PeerId::fromBase58(kClosest2).value(),
      [&](auto res) { found.emplace(std::move(res)); });
  io->run_for(5s);

  ASSERT_TRUE(found);
  EXPECT_EQ(found->error(),
            make_error_code(DelegatedError::CONNECTION_FAILED));
}
