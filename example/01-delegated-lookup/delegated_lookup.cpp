/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <chrono>
#include <iostream>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>

#include <peerscout/basic/scheduler/asio_scheduler_backend.hpp>
#include <peerscout/basic/scheduler/scheduler_impl.hpp>
#include <peerscout/delegated/delegated_peer_routing.hpp>
#include <peerscout/delegated/impl/beast_http_client.hpp>
#include <peerscout/log/configurator.hpp>
#include <peerscout/log/logger.hpp>
#include <peerscout/multi/base58.hpp>
#include <peerscout/routing/impl/composite_router.hpp>

namespace {
  const std::string logger_config(R"(
# ----------------
sinks:
  - name: console
    type: console
    color: true
groups:
  - name: main
    sink: console
    level: info
    children:
      - name: peerscout
# ----------------
  )");

  struct Options {
    peerscout::delegated::Config delegate;
    std::string find;
    std::string closest;
    size_t timeout_ms = 10000;
    bool trace = false;
  };

  boost::optional<Options> parseCommandLine(int argc, char **argv) {
    namespace po = boost::program_options;
    try {
      Options o;

      po::options_description desc("delegated_lookup options");
      desc.add_options()("help,h", "print usage message")(
          "host", po::value(&o.delegate.host), "delegate node host")(
          "port,p", po::value(&o.delegate.port), "delegate node API port")(
          "find,f", po::value(&o.find), "base58 id of the peer to find")(
          "closest,c",
          po::value(&o.closest),
          "base58 key to find closest peers of")(
          "timeout,t", po::value(&o.timeout_ms), "lookup timeout, ms")(
          "trace", po::bool_switch(&o.trace), "verbose logging");

      po::variables_map vm;
      po::store(parse_command_line(argc, argv, desc), vm);
      po::notify(vm);

      if (vm.count("help") != 0 || argc == 1) {
        std::cerr << desc << "\n";
        return boost::none;
      }

      if (o.find.empty() == o.closest.empty()) {
        std::cerr << "Exactly one of --find and --closest is expected\n";
        return boost::none;
      }

      return o;

    } catch (const std::exception &e) {
      std::cerr << e.what() << "\n";
    }
    return boost::none;
  }

  void printPeer(const peerscout::peer::PeerInfo &peer_info) {
    std::cout << peer_info.id.toBase58() << "\n";
    for (const auto &ma : peer_info.addresses) {
      std::cout << "  " << ma.getStringAddress() << "\n";
    }
  }

  /// Prints records until the end of the stream
  void printAll(std::shared_ptr<peerscout::routing::PeerStream> stream,
                std::function<void(bool)> on_done) {
    auto &s = *stream;
    s.next([stream, on_done{std::move(on_done)}](
               peerscout::routing::PeerStream::NextResult res) mutable {
      if (res.has_error()) {
        std::cerr << "Query failed: " << res.error().message() << "\n";
        on_done(false);
        return;
      }
      if (not res.value()) {
        on_done(true);
        return;
      }
      printPeer(*res.value());
      printAll(std::move(stream), std::move(on_done));
    });
  }
}  // namespace

int main(int argc, char *argv[]) {
  auto options = parseCommandLine(argc, argv);
  if (!options) {
    return EXIT_FAILURE;
  }

  // prepare log system
  auto logging_system = std::make_shared<soralog::LoggingSystem>(
      std::make_shared<soralog::ConfiguratorFromYAML>(
          // Original peerscout logging config
          std::make_shared<peerscout::log::Configurator>(),
          // Additional logging config for application
          logger_config));
  auto r = logging_system->configure();
  if (not r.message.empty()) {
    (r.has_error ? std::cerr : std::cout) << r.message << std::endl;
  }
  if (r.has_error) {
    return EXIT_FAILURE;
  }

  peerscout::log::setLoggingSystem(logging_system);
  if (options->trace) {
    peerscout::log::setLevelOfGroup("main", soralog::Level::TRACE);
  }

  auto log = peerscout::log::createLogger("DelegatedLookup");

  auto io = std::make_shared<boost::asio::io_context>();
  auto scheduler = std::make_shared<peerscout::basic::SchedulerImpl>(
      std::make_shared<peerscout::basic::AsioSchedulerBackend>(io),
      peerscout::basic::Scheduler::Config{});

  auto delegate = std::make_shared<peerscout::delegated::DelegatedPeerRouting>(
      options->delegate,
      std::make_shared<peerscout::delegated::BeastHttpClient>(
          io, options->delegate));
  auto router = std::make_shared<peerscout::routing::CompositeRouter>(
      std::vector<std::shared_ptr<peerscout::routing::PeerRouting>>{delegate},
      scheduler);

  peerscout::routing::QueryOptions query_options{
      std::chrono::milliseconds(options->timeout_ms)};

  int exit_code = EXIT_FAILURE;
  std::shared_ptr<peerscout::routing::PeerStream> closest;

  if (not options->find.empty()) {
    auto peer_id = peerscout::peer::PeerId::fromBase58(options->find);
    if (peer_id.has_error()) {
      log->error("Invalid peer id: {}", peer_id.error().message());
      return EXIT_FAILURE;
    }
    auto started = router->findPeer(
        peer_id.value(),
        query_options,
        [&](outcome::result<peerscout::peer::PeerInfo> res) {
          if (res.has_error()) {
            log->error("Peer is not found: {}", res.error().message());
          } else {
            printPeer(res.value());
            exit_code = EXIT_SUCCESS;
          }
          io->stop();
        });
    if (started.has_error()) {
      log->error("Lookup is not started: {}", started.error().message());
      return EXIT_FAILURE;
    }
  } else {
    auto key = peerscout::multi::detail::decodeBase58(options->closest);
    if (key.has_error()) {
      log->error("Invalid key: {}", key.error().message());
      return EXIT_FAILURE;
    }
    closest = router->getClosestPeers(key.value(), query_options);
    printAll(closest, [&](bool ok) {
      exit_code = ok ? EXIT_SUCCESS : EXIT_FAILURE;
      io->stop();
    });
  }

  io->run();
  return exit_code;
}
