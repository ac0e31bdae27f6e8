/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <peerscout/delegated/query_event_stream.hpp>

#include <boost/assert.hpp>

#include <peerscout/delegated/error.hpp>
#include <peerscout/routing/error.hpp>

namespace peerscout::delegated {

  // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
  std::atomic_size_t QueryEventStream::instance_number = 0;

  QueryEventStream::QueryEventStream(std::shared_ptr<HttpExchange> exchange,
                                     std::string_view name)
      : exchange_(std::move(exchange)),
        log_("DelegatedPeerRouting", "delegated", name, ++instance_number) {
    BOOST_ASSERT(exchange_ != nullptr);
  }

  void QueryEventStream::next(EventHandler handler) {
    if (closed_) {
      return;
    }
    if (pending_) {
      handler(routing::RoutingError::IN_PROGRESS);
      return;
    }
    if (error_) {
      handler(*error_);
      return;
    }
    pending_ = std::move(handler);

    if (not started_) {
      started_ = true;
      log_.debug("sending request");
      exchange_->start(
          [self{shared_from_this()}](outcome::result<unsigned> status) {
            self->onStatus(status);
          });
      return;
    }
    if (not status_ok_) {
      // header is still awaited
      return;
    }

    auto event = reader_.next();
    if (event.has_error() or event.value().has_value()) {
      deliver(std::move(event));
      return;
    }
    if (eof_) {
      deliver(reader_.finish());
      return;
    }
    exchange_->read(
        [self{shared_from_this()}](
            outcome::result<std::optional<std::string>> chunk) {
          self->onChunk(std::move(chunk));
        });
  }

  void QueryEventStream::close() {
    if (closed_) {
      return;
    }
    log_.debug("closed");
    closed_ = true;
    pending_ = nullptr;
    exchange_->close();
  }

  void QueryEventStream::onStatus(outcome::result<unsigned> status) {
    if (closed_) {
      return;
    }
    if (status.has_error()) {
      log_.debug("request failed: {}", status.error().message());
      deliver(status.error());
      return;
    }
    if (status.value() != 200) {
      log_.debug("HTTP status {}", status.value());
      deliver(DelegatedError::BAD_STATUS);
      return;
    }
    status_ok_ = true;
    auto handler = std::move(pending_);
    pending_ = nullptr;
    next(std::move(handler));
  }

  void QueryEventStream::onChunk(
      outcome::result<std::optional<std::string>> chunk) {
    if (closed_) {
      return;
    }
    if (chunk.has_error()) {
      log_.debug("read failed: {}", chunk.error().message());
      deliver(chunk.error());
      return;
    }
    if (chunk.value().has_value()) {
      reader_.feed(*chunk.value());
    } else {
      eof_ = true;
    }
    auto handler = std::move(pending_);
    pending_ = nullptr;
    next(std::move(handler));
  }

  void QueryEventStream::deliver(
      outcome::result<std::optional<QueryEvent>> result) {
    if (result.has_error()) {
      error_ = result.error();
    }
    auto handler = std::move(pending_);
    pending_ = nullptr;
    if (handler) {
      handler(std::move(result));
    }
  }

}  // namespace peerscout::delegated
