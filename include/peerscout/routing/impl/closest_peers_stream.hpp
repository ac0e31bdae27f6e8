/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <memory>
#include <system_error>
#include <vector>

#include <peerscout/basic/scheduler.hpp>
#include <peerscout/log/sublogger.hpp>
#include <peerscout/routing/peer_routing.hpp>

namespace peerscout::routing {

  /**
   * Closest peers query of the composite router. Backends are asked lazily,
   * one by one, until one of them yields a record; that backend is then
   * streamed to its end
   */
  class ClosestPeersStream
      : public PeerStream,
        public std::enable_shared_from_this<ClosestPeersStream> {
   public:
    ClosestPeersStream(std::vector<std::shared_ptr<PeerRouting>> backends,
                       std::shared_ptr<basic::Scheduler> scheduler,
                       Bytes key,
                       QueryOptions options);

    ~ClosestPeersStream() override;

    void next(NextHandler handler) override;

    void cancel() override;

   private:
    /// Opens stream of the current backend
    void open();

    void pull();

    void onNext(size_t generation, NextResult result);

    /// Moves to the next backend or finishes the query
    void fallback();

    void onTimeout();

    void finish(NextResult result);

    void deliver(NextResult result);

    static std::atomic_size_t instance_number;

    // Primary
    const std::vector<std::shared_ptr<PeerRouting>> backends_;
    std::shared_ptr<basic::Scheduler> scheduler_;

    // Secondary
    const Bytes key_;
    const QueryOptions options_;

    // Auxiliary
    size_t index_ = 0;
    size_t generation_ = 0;
    std::shared_ptr<PeerStream> current_;
    bool produced_ = false;
    bool started_ = false;
    std::optional<std::error_code> last_error_;
    std::optional<NextResult> terminal_;
    NextHandler pending_;
    basic::Scheduler::Handle timeout_handle_;

    log::SubLogger log_;
  };

}  // namespace peerscout::routing
