/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/di.hpp>

// implementations
#include <peerscout/basic/scheduler/asio_scheduler_backend.hpp>
#include <peerscout/basic/scheduler/scheduler_impl.hpp>
#include <peerscout/delegated/delegated_peer_routing.hpp>
#include <peerscout/delegated/impl/beast_http_client.hpp>
#include <peerscout/local/local_peer_routing.hpp>
#include <peerscout/peer/address_repository/inmem_address_repository.hpp>
#include <peerscout/routing/impl/composite_router.hpp>
#include <peerscout/routing/refresh_manager.hpp>

namespace peerscout::injector {

  /**
   * @brief Instruct injector to use this config type. Can be used many times
   * for different types.
   * @tparam C config type
   * @param c config instance
   * @return injector binding
   *
   * @code
   * auto injector = makeRoutingInjector(
   *   self_id,
   *   useConfig(routing::Config{.closestPeersCount = 10})
   * );
   * @endcode
   */
  template <typename C>
  inline auto useConfig(C &&c) {
    return boost::di::bind<std::decay_t<C>>().template to(
        std::forward<C>(c))[boost::di::override];
  }

  /**
   * @brief Bind router backends by type, in priority order. Can be used once.
   * @tparam BackendImpl one or many types of backends
   * @return injector binding
   *
   * @code
   * auto injector = makeRoutingInjector(
   *   self_id,
   *   useBackends<local::LocalPeerRouting, delegated::DelegatedPeerRouting>()
   * );
   * @endcode
   */
  template <typename... BackendImpl>
  inline auto useBackends() {
    return boost::di::bind<routing::PeerRouting *[]>()  // NOLINT
        .template to<BackendImpl...>()[boost::di::override];
  }

  /**
   * @brief Main function that creates Routing Injector.
   * @param self_id identifier of this node, refresh looks for peers close to
   * it
   * @param args injector bindings that override default bindings.
   * @return complete routing injector
   */
  template <typename InjectorConfig = BOOST_DI_CFG, typename... Ts>
  inline auto makeRoutingInjector(peer::PeerId self_id, Ts &&...args) {
    namespace di = boost::di;

    // clang-format off
    return di::make_injector<InjectorConfig>(
        di::bind<peer::PeerId>().template to(std::move(self_id)),

        di::bind<basic::Scheduler::Config>.template to(basic::Scheduler::Config{}),
        di::bind<basic::SchedulerBackend>().template to<basic::AsioSchedulerBackend>(),
        di::bind<basic::Scheduler>().template to<basic::SchedulerImpl>(),

        di::bind<peer::AddressRepository>().template to<peer::InmemAddressRepository>(),

        di::bind<routing::Config>.template to(routing::Config{}),
        di::bind<routing::PeerRouting>().template to<local::LocalPeerRouting>(),
        di::bind<routing::Router>().template to<routing::CompositeRouter>(),

        di::bind<delegated::Config>.template to(delegated::Config{}),
        di::bind<delegated::HttpClient>().template to<delegated::BeastHttpClient>(),

        // default backends
        di::bind<routing::PeerRouting *[]>().template to<local::LocalPeerRouting>(),  // NOLINT

        // user-defined overrides...
        std::forward<decltype(args)>(args)...
    );
    // clang-format on
  }

}  // namespace peerscout::injector
