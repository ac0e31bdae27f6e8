/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <peerscout/peer/address_repository.hpp>

#include <gmock/gmock.h>

namespace peerscout::peer {

  struct AddressRepositoryMock : public AddressRepository {
    ~AddressRepositoryMock() override = default;

    MOCK_METHOD(outcome::result<bool>,
                addAddresses,
                (const PeerId &,
                 std::span<const multi::Multiaddress>,
                 Milliseconds),
                (override));

    MOCK_METHOD(outcome::result<bool>,
                upsertAddresses,
                (const PeerId &,
                 std::span<const multi::Multiaddress>,
                 Milliseconds),
                (override));

    MOCK_METHOD(outcome::result<void>,
                updateAddresses,
                (const PeerId &, Milliseconds),
                (override));

    MOCK_METHOD(outcome::result<std::vector<multi::Multiaddress>>,
                getAddresses,
                (const PeerId &),
                (const, override));

    MOCK_METHOD(void, clear, (const PeerId &p), (override));

    MOCK_METHOD(std::unordered_set<PeerId>, getPeers, (), (const, override));

    MOCK_METHOD(void, collectGarbage, (), (override));
  };

}  // namespace peerscout::peer
