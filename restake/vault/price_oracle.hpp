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
#include <restake/core/bytes.hpp>
#include <restake/core/int.hpp>
#include <restake/core/result.hpp>
#include <restake/ledger/storage_variable.hpp>
#include <restake/vault/config.hpp>
#include <restake/vault/util/collaborators.hpp>
#include <restake/vault/util/constants.hpp>

#include <bit>
#include <cstdint>

RESTAKE_NAMESPACE_BEGIN

class State;

RESTAKE_NAMESPACE_END

RESTAKE_VAULT_NAMESPACE_BEGIN

/// Prices collateral in units of the native currency. Every lookup goes
/// through the staleness and sign checks; the mint and redeem formulas are
/// pure.
class PriceOracle
{
    State &state_;
    Collaborators const &collab_;

    enum Namespace : uint8_t
    {
        NSFeed = 0x01,
    };

    // mapping (asset => address) feed
    StorageVariable<Address> feed_var(Address const &asset) const
    {
        struct
        {
            uint8_t ns;
            Address address;
            uint8_t slots[11];
        } key{.ns = NSFeed, .address = asset, .slots = {}};

        return {state_, ORACLE_CA, std::bit_cast<bytes32_t>(key)};
    }

    // price of one whole unit of `asset`, scaled by SCALE_FACTOR
    Result<uint256_t> price(Address const &asset) const;

public:
    PriceOracle(State &, Collaborators const &);

    bool has_feed(Address const &asset) const;

    Result<Address> feed_of(Address const &asset) const;

    Result<uint256_t>
    lookup_value(Address const &asset, uint256_t const &amount) const;

    Result<uint256_t> lookup_amount_from_value(
        Address const &asset, uint256_t const &value) const;

    Result<void> set_oracle_address(
        Address const &caller, Address const &asset, Address const &feed);

    static Result<uint256_t> calculate_mint_amount(
        uint256_t const &current_value, uint256_t const &new_value,
        uint256_t const &existing_supply);

    static Result<uint256_t> calculate_redeem_amount(
        uint256_t const &shares_burned, uint256_t const &total_supply,
        uint256_t const &current_value);
};

RESTAKE_VAULT_NAMESPACE_END
