/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <deque>

#include <peerscout/routing/peer_stream.hpp>

namespace peerscout::routing {

  /**
   * Stream fed by a producer: records pushed before they are requested are
   * buffered, a pending request is answered by the next push.
   * Not thread safe, producer and consumer share one event loop
   */
  class PeerChannel : public PeerStream {
   public:
    using Callback = std::function<void()>;

    void next(NextHandler handler) override;

    void cancel() override;

    /// Called when consumer waits and the buffer is empty
    void onDemand(Callback cb);

    /// Called once on cancel()
    void onCancel(Callback cb);

    /// @return false if the channel is closed or cancelled
    bool push(peer::PeerInfo peer_info);

    /// Ends the stream after buffered records, with error if @param result
    /// is failure
    void close(outcome::result<void> result = outcome::success());

    bool isCancelled() const {
      return cancelled_;
    }

   private:
    NextResult terminal() const;

    std::deque<peer::PeerInfo> buffer_;
    std::optional<outcome::result<void>> closed_;
    bool cancelled_ = false;
    NextHandler pending_;
    Callback on_demand_;
    Callback on_cancel_;
  };

}  // namespace peerscout::routing
