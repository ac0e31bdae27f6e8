/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <optional>

#include <qtils/outcome.hpp>

#include <peerscout/peer/peer_info.hpp>

namespace peerscout::routing {

  /**
   * Lazy single-pass sequence of peer records.
   * Records are produced on demand, one per next() call
   */
  class PeerStream {
   public:
    /// Empty optional marks the end of the stream
    using NextResult = outcome::result<std::optional<peer::PeerInfo>>;
    using NextHandler = std::function<void(NextResult)>;

    virtual ~PeerStream() = default;

    /**
     * Requests the next record. Handler may be called before return.
     * Only one request may be pending, otherwise handler receives
     * RoutingError::IN_PROGRESS. After the end or an error, all subsequent
     * requests get the same outcome
     */
    virtual void next(NextHandler handler) = 0;

    /**
     * Stops producing. Pending handler is not called, subsequent requests get
     * RoutingError::CANCELLED
     */
    virtual void cancel() = 0;
  };

}  // namespace peerscout::routing
