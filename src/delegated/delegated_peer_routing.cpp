/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <peerscout/delegated/delegated_peer_routing.hpp>

#include <unordered_map>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/assert.hpp>

#include <peerscout/delegated/error.hpp>
#include <peerscout/delegated/query_event_stream.hpp>
#include <peerscout/multi/base58.hpp>
#include <peerscout/routing/peer_channel.hpp>

namespace peerscout::delegated {

  namespace {
    using routing::PeerRouting;

    void readFindPeer(std::shared_ptr<QueryEventStream> events,
                      std::string sought,
                      PeerRouting::FindPeerHandler handler) {
      auto &stream = *events;
      stream.next([events{std::move(events)},
                   sought{std::move(sought)},
                   handler{std::move(handler)}](
                      outcome::result<std::optional<QueryEvent>> res) mutable {
        auto finish = [&](PeerRouting::FindPeerResult result) {
          events->close();
          handler(std::move(result));
        };

        if (res.has_error()) {
          return finish(res.error());
        }
        auto &event = res.value();
        if (not event) {
          // reply is over, peer is not among final peers
          return finish(std::nullopt);
        }

        switch (event->type) {
          case QueryEventType::FINAL_PEER:
            for (const auto &response : event->responses) {
              if (response.id != sought) {
                continue;
              }
              auto peer_info = toPeerInfo(response);
              if (peer_info.has_error()) {
                return finish(peer_info.error());
              }
              return finish(std::move(peer_info.value()));
            }
            break;
          case QueryEventType::QUERY_ERROR:
            if (boost::algorithm::icontains(event->extra, "not found")) {
              return finish(std::nullopt);
            }
            return finish(DelegatedError::QUERY_FAILED);
          default:
            break;
        }

        readFindPeer(std::move(events), std::move(sought), std::move(handler));
      });
    }

    /**
     * Closest peers query: peers which responded are remembered with their
     * addresses, final peers are yielded one per demand
     */
    class ClosestPeersQuery
        : public std::enable_shared_from_this<ClosestPeersQuery> {
     public:
      ClosestPeersQuery(std::shared_ptr<QueryEventStream> events,
                        const std::shared_ptr<routing::PeerChannel> &channel)
          : events_(std::move(events)), channel_(channel) {}

      void pump() {
        events_->next([self{shared_from_this()}](
                          outcome::result<std::optional<QueryEvent>> res) {
          self->onEvent(std::move(res));
        });
      }

      void close() {
        events_->close();
      }

     private:
      void onEvent(outcome::result<std::optional<QueryEvent>> res) {
        auto channel = channel_.lock();
        if (not channel) {
          events_->close();
          return;
        }
        if (res.has_error()) {
          fail(*channel, res.error());
          return;
        }
        auto &event = res.value();
        if (not event) {
          channel->close();
          return;
        }

        switch (event->type) {
          case QueryEventType::PEER_RESPONSE:
            for (const auto &response : event->responses) {
              auto peer_info = toPeerInfo(response);
              if (peer_info.has_error()) {
                fail(*channel, peer_info.error());
                return;
              }
              responded_[response.id] = std::move(peer_info.value().addresses);
            }
            break;
          case QueryEventType::FINAL_PEER: {
            auto peer_info = finalPeer(*event);
            if (peer_info.has_error()) {
              fail(*channel, peer_info.error());
              return;
            }
            // one record per demand
            channel->push(std::move(peer_info.value()));
            return;
          }
          case QueryEventType::QUERY_ERROR:
            fail(*channel, DelegatedError::QUERY_FAILED);
            return;
          default:
            break;
        }
        pump();
      }

      outcome::result<peer::PeerInfo> finalPeer(const QueryEvent &event) {
        auto id = event.id;
        if (id.empty() and not event.responses.empty()) {
          id = event.responses.front().id;
        }
        if (auto it = responded_.find(id); it != responded_.end()) {
          auto peer_id = peer::PeerId::fromBase58(id);
          if (peer_id.has_error()) {
            return DelegatedError::MALFORMED_RESPONSE;
          }
          return peer::PeerInfo{peer_id.value(), it->second};
        }
        for (const auto &response : event.responses) {
          if (response.id == id) {
            return toPeerInfo(response);
          }
        }
        return toPeerInfo(QueryEvent::Response{id, {}});
      }

      void fail(routing::PeerChannel &channel, std::error_code error) {
        events_->close();
        channel.close(error);
      }

      std::shared_ptr<QueryEventStream> events_;
      std::weak_ptr<routing::PeerChannel> channel_;
      std::unordered_map<std::string, std::vector<multi::Multiaddress>>
          responded_;
    };
  }  // namespace

  DelegatedPeerRouting::DelegatedPeerRouting(
      const Config &config, std::shared_ptr<HttpClient> http_client)
      : api_path_(config.apiPath), http_client_(std::move(http_client)) {
    BOOST_ASSERT(http_client_ != nullptr);
  }

  Cancel DelegatedPeerRouting::findPeer(const peer::PeerId &peer_id,
                                        FindPeerHandler handler) {
    auto sought = peer_id.toBase58();
    SL_DEBUG(log_, "findPeer {}", sought);
    auto events = std::make_shared<QueryEventStream>(
        http_client_->post(makeTarget("dht/findpeer", sought)), "FindPeer");
    std::weak_ptr<QueryEventStream> weak_events = events;
    readFindPeer(std::move(events), std::move(sought), std::move(handler));
    return cancelFn([weak_events{std::move(weak_events)}] {
      if (auto events = weak_events.lock()) {
        events->close();
      }
    });
  }

  std::shared_ptr<routing::PeerStream> DelegatedPeerRouting::getClosestPeers(
      Bytes key, const routing::QueryOptions &) {
    auto arg = multi::detail::encodeBase58(key);
    SL_DEBUG(log_, "getClosestPeers {}", arg);
    auto events = std::make_shared<QueryEventStream>(
        http_client_->post(makeTarget("dht/query", arg)), "ClosestPeers");
    auto channel = std::make_shared<routing::PeerChannel>();
    auto query = std::make_shared<ClosestPeersQuery>(std::move(events), channel);
    channel->onDemand([query] { query->pump(); });
    channel->onCancel([weak_query{std::weak_ptr{query}}] {
      if (auto query = weak_query.lock()) {
        query->close();
      }
    });
    return channel;
  }

  std::string DelegatedPeerRouting::makeTarget(std::string_view command,
                                               std::string_view arg) const {
    std::string target{api_path_};
    target += '/';
    target += command;
    target += "?arg=";
    target += arg;
    return target;
  }

}  // namespace peerscout::delegated
