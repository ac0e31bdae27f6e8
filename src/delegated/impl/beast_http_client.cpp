/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <peerscout/delegated/impl/beast_http_client.hpp>

#include <array>

#include <boost/asio/ip/tcp.hpp>
#include <boost/assert.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <peerscout/delegated/error.hpp>
#include <peerscout/log/logger.hpp>

namespace peerscout::delegated {

  namespace beast = boost::beast;
  namespace http = boost::beast::http;
  using tcp = boost::asio::ip::tcp;

  namespace {
    constexpr size_t kReadBufferSize = 4096;

    class BeastHttpExchange
        : public HttpExchange,
          public std::enable_shared_from_this<BeastHttpExchange> {
     public:
      BeastHttpExchange(boost::asio::io_context &io_context,
                        const Config &config,
                        std::string target)
          : config_(config),
            resolver_(io_context),
            stream_(io_context),
            request_(http::verb::post, target, 11) {
        request_.set(http::field::host, config_.host);
        request_.set(http::field::user_agent, "peerscout");
        request_.prepare_payload();
        // reply is streamed, its size is not known in advance
        parser_.body_limit(boost::none);
      }

      void start(StatusHandler handler) override {
        resolver_.async_resolve(
            config_.host,
            std::to_string(config_.port),
            [self{shared_from_this()}, handler{std::move(handler)}](
                const beast::error_code &ec,
                const tcp::resolver::results_type &results) mutable {
              if (self->failed(ec, "resolve", handler)) {
                return;
              }
              self->connect(results, std::move(handler));
            });
      }

      void read(ChunkHandler handler) override {
        if (closed_) {
          return;
        }
        if (parser_.is_done()) {
          handler(std::nullopt);
          return;
        }
        auto &body = parser_.get().body();
        body.data = buffer_.data();
        body.size = buffer_.size();
        stream_.expires_after(config_.timeout);
        http::async_read_some(
            stream_,
            flat_buffer_,
            parser_,
            [self{shared_from_this()}, handler{std::move(handler)}](
                beast::error_code ec, size_t) mutable {
              if (ec == http::error::need_buffer) {
                ec = {};
              }
              if (self->failed(ec, "read", handler)) {
                return;
              }
              auto size =
                  self->buffer_.size() - self->parser_.get().body().size;
              if (size == 0) {
                // header bytes or chunk framing only
                self->read(std::move(handler));
                return;
              }
              handler(std::string(self->buffer_.data(), size));
            });
      }

      void close() override {
        if (closed_) {
          return;
        }
        closed_ = true;
        resolver_.cancel();
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
        stream_.close();
      }

     private:
      void connect(const tcp::resolver::results_type &results,
                   StatusHandler handler) {
        stream_.expires_after(config_.timeout);
        stream_.async_connect(
            results,
            [self{shared_from_this()}, handler{std::move(handler)}](
                const beast::error_code &ec,
                const tcp::endpoint &) mutable {
              if (self->failed(ec, "connect", handler)) {
                return;
              }
              self->write(std::move(handler));
            });
      }

      void write(StatusHandler handler) {
        stream_.expires_after(config_.timeout);
        http::async_write(
            stream_,
            request_,
            [self{shared_from_this()}, handler{std::move(handler)}](
                const beast::error_code &ec, size_t) mutable {
              if (self->failed(ec, "write", handler)) {
                return;
              }
              self->readHeader(std::move(handler));
            });
      }

      void readHeader(StatusHandler handler) {
        stream_.expires_after(config_.timeout);
        http::async_read_header(
            stream_,
            flat_buffer_,
            parser_,
            [self{shared_from_this()}, handler{std::move(handler)}](
                const beast::error_code &ec, size_t) mutable {
              if (self->failed(ec, "read header", handler)) {
                return;
              }
              handler(self->parser_.get().result_int());
            });
      }

      /// @return true if the exchange is over and the handler is consumed
      template <typename Handler>
      bool failed(const beast::error_code &ec,
                  std::string_view step,
                  Handler &handler) {
        if (closed_) {
          return true;
        }
        if (not ec) {
          return false;
        }
        log_->debug("{} {}:{} failed: {}",
                    step,
                    config_.host,
                    config_.port,
                    ec.message());
        closed_ = true;
        handler(DelegatedError::CONNECTION_FAILED);
        return true;
      }

      const Config config_;
      tcp::resolver resolver_;
      beast::tcp_stream stream_;
      beast::flat_buffer flat_buffer_;
      http::request<http::empty_body> request_;
      http::response_parser<http::buffer_body> parser_;
      std::array<char, kReadBufferSize> buffer_{};
      bool closed_ = false;

      log::Logger log_ = log::createLogger("BeastHttpClient", "delegated");
    };
  }  // namespace

  BeastHttpClient::BeastHttpClient(
      std::shared_ptr<boost::asio::io_context> io_context, const Config &config)
      : io_context_(std::move(io_context)), config_(config) {
    BOOST_ASSERT(io_context_ != nullptr);
  }

  std::shared_ptr<HttpExchange> BeastHttpClient::post(std::string target) {
    return std::make_shared<BeastHttpExchange>(
        *io_context_, config_, std::move(target));
  }

}  // namespace peerscout::delegated
