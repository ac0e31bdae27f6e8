/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <peerscout/delegated/delegated_peer_routing.hpp>

#include <gtest/gtest.h>

#include <peerscout/basic/scheduler/manual_scheduler_backend.hpp>
#include <peerscout/basic/scheduler/scheduler_impl.hpp>
#include <peerscout/delegated/error.hpp>
#include <peerscout/multi/base58.hpp>
#include <peerscout/routing/error.hpp>
#include <peerscout/routing/impl/composite_router.hpp>
#include "mock/peerscout/delegated/http_client_mock.hpp"
#include "mock/peerscout/routing/peer_stream_helpers.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace peerscout;
using namespace peerscout::delegated;
using peer::PeerId;
using peer::PeerInfo;
using routing::PeerRouting;
using routing::RoutingError;
using ::testing::Return;

namespace {
  constexpr std::string_view kPeerKey =
      "QmTp9VkYvnHyrqKQuFPiuZkiX9gPcqj6x5LJ1rmWuSySnL";
  constexpr std::string_view kClosest1 =
      "12D3KooWLewYMMdGWAtuX852n4rgCWkK7EBn4CWbwwBzhsVoKxk3";
  constexpr std::string_view kClosest2 =
      "12D3KooWDtoQbpKhtnWddfj72QmpFvvLDTsBLTFkjvgQm6cde2AK";
}  // namespace

class DelegatedPeerRoutingTest : public ::testing::Test {
 public:
  void SetUp() override {
    testutil::prepareLoggers();
    delegate = std::make_shared<DelegatedPeerRouting>(config, http_client);
  }

  /// Next request is answered with @param status and body @param chunks
  std::shared_ptr<FakeHttpExchange> expectPost(
      std::string target,
      outcome::result<unsigned> status,
      std::deque<std::string> chunks = {}) {
    auto exchange =
        std::make_shared<FakeHttpExchange>(status, std::move(chunks));
    EXPECT_CALL(*http_client, post(target)).WillOnce(Return(exchange));
    return exchange;
  }

  std::optional<PeerRouting::FindPeerResult> findPeer(const PeerId &peer_id) {
    std::optional<PeerRouting::FindPeerResult> found;
    cancel = delegate->findPeer(peer_id,
                                [&](auto res) { found.emplace(std::move(res)); });
    return found;
  }

  std::shared_ptr<routing::CompositeRouter> makeRouter() {
    auto backend = std::make_shared<basic::ManualSchedulerBackend>();
    auto scheduler = std::make_shared<basic::SchedulerImpl>(
        backend, basic::Scheduler::Config{});
    return std::make_shared<routing::CompositeRouter>(
        std::vector<std::shared_ptr<PeerRouting>>{delegate}, scheduler);
  }

  Config config;
  std::shared_ptr<HttpClientMock> http_client =
      std::make_shared<HttpClientMock>();
  std::shared_ptr<DelegatedPeerRouting> delegate;
  Cancel cancel;

  const PeerId peer_id = PeerId::fromBase58(kPeerKey).value();
  const std::string find_target =
      fmt::format("/api/v0/dht/findpeer?arg={}", kPeerKey);
};

/**
 * @given delegate which reports the peer among final peers
 * @when looking for the peer
 * @then peer with its addresses is returned
 */
TEST_F(DelegatedPeerRoutingTest, FindPeer) {
  auto exchange = expectPost(
      find_target,
      200,
      {R"({"Extra":"","ID":"some other id","Responses":null,"Type":0})"
       "\n",
       fmt::format(R"({{"Extra":"","ID":"","Responses":[{{"Addrs":)"
                   R"(["/ip4/127.0.0.1/tcp/4001"],"ID":"{}"}}],"Type":2}})"
                   "\n",
                   kPeerKey)});

  auto found = findPeer(peer_id);

  ASSERT_TRUE(found);
  EXPECT_OUTCOME_TRUE(peer_info, *found);
  ASSERT_TRUE(peer_info);
  EXPECT_EQ(peer_info->id, peer_id);
  ASSERT_EQ(peer_info->addresses.size(), 1);
  EXPECT_EQ(peer_info->addresses[0].getStringAddress(),
            "/ip4/127.0.0.1/tcp/4001");
  EXPECT_TRUE(exchange->closed);
}

/**
 * @given delegate which reports "not found" query error
 * @when looking for the peer through the router
 * @then lookup fails with NOT_FOUND
 */
TEST_F(DelegatedPeerRoutingTest, FindPeerNotFound) {
  expectPost(
      find_target,
      200,
      {"{\"Extra\":\"\",\"ID\":\"some other id\",\"Responses\":null,"
       "\"Type\":6}\n"
       "{\"Extra\":\"\",\"ID\":\"yet another id\",\"Responses\":null,"
       "\"Type\":0}\n"
       "{\"Extra\":\"routing:not found\",\"ID\":\"\",\"Responses\":null,"
       "\"Type\":3}\n"});

  std::optional<outcome::result<PeerInfo>> found;
  EXPECT_OUTCOME_TRUE_1(makeRouter()->findPeer(
      peer_id, {}, [&](auto res) { found.emplace(std::move(res)); }));

  ASSERT_TRUE(found);
  EXPECT_EQ(found->error(), make_error_code(RoutingError::NOT_FOUND));
}

/**
 * @given delegate which reports other query error
 * @when looking for the peer
 * @then QUERY_FAILED is returned
 */
TEST_F(DelegatedPeerRoutingTest, FindPeerQueryError) {
  expectPost(find_target,
             200,
             {R"({"Extra":"failed to dial","ID":"","Type":3})"});

  auto found = findPeer(peer_id);

  ASSERT_TRUE(found);
  EXPECT_EQ(found->error(), make_error_code(DelegatedError::QUERY_FAILED));
}

/**
 * @given delegate reply which ends without the peer
 * @when looking for the peer
 * @then empty answer is returned
 */
TEST_F(DelegatedPeerRoutingTest, FindPeerReplyEnds) {
  expectPost(find_target, 200, {R"({"Type":0,"ID":"x"})"});

  auto found = findPeer(peer_id);

  ASSERT_TRUE(found);
  ASSERT_TRUE(found->has_value());
  EXPECT_FALSE(found->value());
}

/**
 * @given delegate which answers with HTTP 502
 * @when looking for the peer through the router
 * @then lookup fails with BAD_STATUS
 */
TEST_F(DelegatedPeerRoutingTest, FindPeerBadStatus) {
  auto exchange = expectPost(find_target, 502);

  std::optional<outcome::result<PeerInfo>> found;
  EXPECT_OUTCOME_TRUE_1(makeRouter()->findPeer(
      peer_id, {}, [&](auto res) { found.emplace(std::move(res)); }));

  ASSERT_TRUE(found);
  EXPECT_EQ(found->error(), make_error_code(DelegatedError::BAD_STATUS));
  EXPECT_EQ(exchange->reads, 0);
}

/**
 * @given delegate which can not be reached
 * @when looking for the peer
 * @then transport error is returned
 */
TEST_F(DelegatedPeerRoutingTest, FindPeerConnectionFailed) {
  expectPost(find_target, DelegatedError::CONNECTION_FAILED);

  auto found = findPeer(peer_id);

  ASSERT_TRUE(found);
  EXPECT_EQ(found->error(),
            make_error_code(DelegatedError::CONNECTION_FAILED));
}

/**
 * @given request in flight
 * @when lookup handle is destroyed
 * @then request is aborted @and handler is never called
 */
TEST_F(DelegatedPeerRoutingTest, FindPeerCancel) {
  auto exchange = expectPost(find_target, 200);
  exchange->hold_start = true;

  auto found = findPeer(peer_id);
  EXPECT_FALSE(found);
  EXPECT_EQ(exchange->starts, 1);

  cancel.reset();
  EXPECT_TRUE(exchange->closed);
  EXPECT_FALSE(exchange->start_handler);
}

class DelegatedClosestPeersTest : public DelegatedPeerRoutingTest {
 public:
  const Bytes key = PeerId::fromBase58(kClosest1).value().toVector();
  const std::string query_target =
      "/api/v0/dht/query?arg=" + multi::detail::encodeBase58(key);
};

/**
 * @given delegate which streams responses of two peers and then reports
 * them as final in reverse order
 * @when draining closest peers
 * @then exactly two peers are yielded in the final order, each one with all
 * listed addresses
 */
TEST_F(DelegatedClosestPeersTest, ClosestPeers) {
  auto line1 = fmt::format(
      R"({{"extra":"","id":"{0}","responses":[{{"ID":"{0}","Addrs":)"
      R"(["/ip4/127.0.0.1/tcp/63930","/ip4/127.0.0.1/tcp/63930"]}}],"type":1}})"
      "\n",
      kClosest1);
  auto line2 = fmt::format(
      R"({{"extra":"","id":"{0}","responses":[{{"ID":"{0}","Addrs":)"
      R"(["/ip4/127.0.0.1/tcp/63506","/ip4/127.0.0.1/tcp/63506"]}}],"type":1}})"
      "\n",
      kClosest2);
  auto line3 = fmt::format(
      R"({{"Extra":"","ID":"{}","Responses":[],"Type":2}})"
      "\n",
      kClosest2);
  auto line4 = fmt::format(
      R"({{"Extra":"","ID":"{}","Responses":[],"Type":2}})"
      "\n",
      kClosest1);
  // line boundaries do not match chunk boundaries
  auto body = line1 + line2 + line3 + line4;
  auto exchange = expectPost(query_target,
                             200,
                             {body.substr(0, 30),
                              body.substr(30, 200),
                              body.substr(230)});

  auto stream = delegate->getClosestPeers(key, {});
  EXPECT_EQ(exchange->starts, 0);

  auto drained = routing::drain(*stream);

  EXPECT_TRUE(drained.finished);
  EXPECT_FALSE(drained.error);
  ASSERT_EQ(drained.peers.size(), 2);
  EXPECT_EQ(drained.peers[0].id.toBase58(), kClosest2);
  EXPECT_EQ(drained.peers[0].addresses.size(), 2);
  EXPECT_EQ(drained.peers[1].id.toBase58(), kClosest1);
  EXPECT_EQ(drained.peers[1].addresses.size(), 2);
}

/**
 * @given delegate which answers with HTTP 502
 * @when draining closest peers
 * @then stream fails instead of being empty
 */
TEST_F(DelegatedClosestPeersTest, BadStatus) {
  expectPost(query_target, 502, {"Bad Gateway"});

  auto drained = routing::drain(*delegate->getClosestPeers(key, {}));

  EXPECT_TRUE(drained.peers.empty());
  EXPECT_EQ(drained.error, make_error_code(DelegatedError::BAD_STATUS));
}

/**
 * @given delegate reply with malformed line after a peer
 * @when draining closest peers
 * @then the peer is yielded and then the stream fails
 */
TEST_F(DelegatedClosestPeersTest, MalformedLine) {
  expectPost(query_target,
             200,
             {fmt::format(R"({{"Type":2,"Responses":[{{"ID":"{}"}}]}})"
                          "\n{{\"Type\":\n",
                          kClosest1)});

  auto drained = routing::drain(*delegate->getClosestPeers(key, {}));

  ASSERT_EQ(drained.peers.size(), 1);
  EXPECT_EQ(drained.peers[0].id.toBase58(), kClosest1);
  EXPECT_TRUE(drained.peers[0].addresses.empty());
  EXPECT_EQ(drained.error, make_error_code(DelegatedError::MALFORMED_RESPONSE));
}

/**
 * @given delegate which reports query error
 * @when draining closest peers
 * @then stream fails with QUERY_FAILED
 */
TEST_F(DelegatedClosestPeersTest, QueryError) {
  expectPost(query_target, 200, {R"({"Type":3,"Extra":"no peers"})"});

  auto drained = routing::drain(*delegate->getClosestPeers(key, {}));

  EXPECT_TRUE(drained.peers.empty());
  EXPECT_EQ(drained.error, make_error_code(DelegatedError::QUERY_FAILED));
}

/**
 * @given closest peers stream waiting for the delegate
 * @when stream is cancelled
 * @then request is aborted
 */
TEST_F(DelegatedClosestPeersTest, Cancel) {
  auto exchange = expectPost(query_target, 200);
  exchange->hold_start = true;

  auto stream = delegate->getClosestPeers(key, {});
  stream->next([](auto) { FAIL() << "must not be called"; });
  EXPECT_EQ(exchange->starts, 1);

  stream->cancel();
  EXPECT_TRUE(exchange->closed);
}
