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

#include <restake/core/assert.h>
#include <restake/core/likely.h>
#include <restake/ledger/asset.hpp>
#include <restake/ledger/state.hpp>
#include <restake/ledger/token_ledger.hpp>
#include <restake/sim/sim_operator_pool.hpp>
#include <restake/vault/util/constants.hpp>
#include <restake/vault/util/vault_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <algorithm>
#include <bit>

RESTAKE_NAMESPACE_BEGIN

namespace sim
{
    // tokens taken by a slash go here
    constexpr Address SLASH_SINK{
        0x000000000000000000000000000000000000dead_address};

    SimOperatorPool::SimOperatorPool(State &state, Address const &address)
        : state_{state}
        , address_{address}
    {
    }

    StorageVariable<u256_be> SimOperatorPool::native_staked() const
    {
        return {state_, address_, AddressNativeStaked};
    }

    StorageVariable<u64_be> SimOperatorPool::last_request_id() const
    {
        return {state_, address_, AddressLastRequestId};
    }

    StorageVariable<SimOperatorPool::PendingRequest>
    SimOperatorPool::request(uint64_t const id) const
    {
        struct
        {
            uint8_t ns;
            u64_be id;
            uint8_t slots[23];
        } key{.ns = NSRequest, .id = id, .slots = {}};

        return {state_, address_, std::bit_cast<bytes32_t>(key)};
    }

    uint256_t SimOperatorPool::balance_of(Address const &asset) const
    {
        if (is_native(asset)) {
            return 0;
        }
        return TokenLedger{state_, asset}.balance_of(address_);
    }

    uint256_t SimOperatorPool::native_staked_balance() const
    {
        return native_staked().load().native();
    }

    Result<uint256_t>
    SimOperatorPool::deposit(Address const &asset, uint256_t const &amount)
    {
        if (is_native(asset)) {
            auto var = native_staked();
            auto const staked = var.load().native() + amount;
            RESTAKE_ASSERT(staked <= state_.get_balance(address_));
            var.store(staked);
        }
        return amount;
    }

    Result<uint64_t> SimOperatorPool::initiate_withdraw(
        Address const &asset, uint256_t const &amount)
    {
        auto const held = is_native(asset) ? native_staked_balance()
                                           : balance_of(asset);
        if (RESTAKE_UNLIKELY(held < amount)) {
            return vault::VaultError::InsufficientCollateral;
        }
        auto const id = last_request_id().load().native() + 1;
        last_request_id().store(id);
        request(id).store(PendingRequest{.asset = asset, .amount = amount});
        return id;
    }

    Result<uint256_t> SimOperatorPool::complete_withdraw(uint64_t const id)
    {
        auto const pending = request(id).load_checked();
        if (RESTAKE_UNLIKELY(!pending.has_value())) {
            return vault::VaultError::DelegateWithdrawalNotFound;
        }
        request(id).clear();

        auto const &asset = pending->asset;
        // a slash since initiation shrinks what comes back
        auto amount = pending->amount.native();
        if (is_native(asset)) {
            amount = std::min(amount, native_staked_balance());
            native_staked().store(native_staked_balance() - amount);
        }
        else {
            amount = std::min(amount, balance_of(asset));
        }
        BOOST_OUTCOME_TRY(transfer_asset(
            state_, asset, address_, vault::ACCOUNTING_CA, amount));
        return amount;
    }

    void SimOperatorPool::reward(Address const &asset, uint256_t const &amount)
    {
        if (is_native(asset)) {
            state_.add_to_balance(address_, amount);
            native_staked().store(native_staked_balance() + amount);
            return;
        }
        auto const res = TokenLedger{state_, asset}.mint(address_, amount);
        RESTAKE_ASSERT(!res.has_error(), "reward overflows the token supply");
    }

    void SimOperatorPool::slash(Address const &asset, uint256_t const &amount)
    {
        if (is_native(asset)) {
            auto const taken = std::min(amount, native_staked_balance());
            native_staked().store(native_staked_balance() - taken);
            state_.subtract_from_balance(address_, taken);
            return;
        }
        auto const taken = std::min(amount, balance_of(asset));
        auto const res =
            TokenLedger{state_, asset}.transfer(address_, SLASH_SINK, taken);
        RESTAKE_ASSERT(!res.has_error());
    }
}

RESTAKE_NAMESPACE_END
