// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <restake/core/address.hpp>
#include <restake/core/int.hpp>
#include <restake/core/result.hpp>
#include <restake/vault/config.hpp>
#include <restake/vault/instant_withdrawer.hpp>
#include <restake/vault/util/collaborators.hpp>

#include <cstdint>

RESTAKE_NAMESPACE_BEGIN

class State;

RESTAKE_NAMESPACE_END

RESTAKE_VAULT_NAMESPACE_BEGIN

// Storage layout versions:
//
// v1: asset and delegate registries, value caps, buffer target and claim
//     reserve, claim cooldown, withdraw requests.
// v2: buffer queue counters and the instant withdraw config. Both are new
//     slots, a v1 store reads them as zero.

struct ProtocolConfig
{
    uint64_t cooldown_period;
    uint256_t max_total_value;
    InstantWithdrawConfig instant;
};

ProtocolConfig default_protocol_config(Address const &fee_destination);

uint64_t schema_version(State &, Collaborators const &);

// Writes `config` and stamps the current version. Only once.
Result<void> initialize(
    State &, Collaborators const &, Address const &caller,
    ProtocolConfig const &);

// Upgrades the store to the current version and returns it. A v1 store has
// no instant withdraw config; the default one is written with
// `fee_destination`, which must be non-zero.
Result<uint64_t> migrate(
    State &, Collaborators const &, Address const &caller,
    Address const &fee_destination);

// NotInitialized, or UnsupportedSchemaVersion for a store that still needs
// migrate (or was written by a newer version)
Result<void> require_current_schema(State &, Collaborators const &);

RESTAKE_VAULT_NAMESPACE_END
