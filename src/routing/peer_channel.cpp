/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <peerscout/routing/peer_channel.hpp>

#include <peerscout/routing/error.hpp>

namespace peerscout::routing {

  void PeerChannel::next(NextHandler handler) {
    if (cancelled_) {
      handler(RoutingError::CANCELLED);
      return;
    }
    if (pending_) {
      handler(RoutingError::IN_PROGRESS);
      return;
    }
    if (not buffer_.empty()) {
      auto peer_info = std::move(buffer_.front());
      buffer_.pop_front();
      handler(std::move(peer_info));
      return;
    }
    if (closed_) {
      handler(terminal());
      return;
    }
    pending_ = std::move(handler);
    if (on_demand_) {
      // producer may push synchronously
      auto on_demand = on_demand_;
      on_demand();
    }
  }

  void PeerChannel::cancel() {
    if (cancelled_) {
      return;
    }
    cancelled_ = true;
    pending_ = nullptr;
    buffer_.clear();
    on_demand_ = nullptr;
    if (auto on_cancel = std::move(on_cancel_)) {
      on_cancel_ = nullptr;
      on_cancel();
    }
  }

  void PeerChannel::onDemand(Callback cb) {
    on_demand_ = std::move(cb);
  }

  void PeerChannel::onCancel(Callback cb) {
    on_cancel_ = std::move(cb);
  }

  bool PeerChannel::push(peer::PeerInfo peer_info) {
    if (cancelled_ or closed_) {
      return false;
    }
    if (pending_) {
      auto handler = std::move(pending_);
      pending_ = nullptr;
      handler(std::move(peer_info));
      return true;
    }
    buffer_.emplace_back(std::move(peer_info));
    return true;
  }

  void PeerChannel::close(outcome::result<void> result) {
    if (cancelled_ or closed_) {
      return;
    }
    closed_ = std::move(result);
    on_demand_ = nullptr;
    if (pending_) {
      auto handler = std::move(pending_);
      pending_ = nullptr;
      handler(terminal());
    }
  }

  PeerStream::NextResult PeerChannel::terminal() const {
    if (closed_->has_error()) {
      return closed_->error();
    }
    return std::nullopt;
  }

}  // namespace peerscout::routing
