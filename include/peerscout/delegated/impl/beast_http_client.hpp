/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <boost/asio/io_context.hpp>

#include <peerscout/delegated/config.hpp>
#include <peerscout/delegated/http_client.hpp>

namespace peerscout::delegated {

  /**
   * Plain HTTP/1.1 client on Boost.Beast, one connection per request
   */
  class BeastHttpClient : public HttpClient {
   public:
    BeastHttpClient(std::shared_ptr<boost::asio::io_context> io_context,
                    const Config &config);

    std::shared_ptr<HttpExchange> post(std::string target) override;

   private:
    std::shared_ptr<boost::asio::io_context> io_context_;
    const Config config_;
  };

}  // namespace peerscout::delegated
