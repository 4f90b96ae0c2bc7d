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
#include <restake/sim/sim_collaborators.hpp>
#include <restake/vault/util/vault_error.hpp>

#include <intx/intx.hpp>

#include <memory>

RESTAKE_NAMESPACE_BEGIN

namespace sim
{
    SimPoolDirectory::SimPoolDirectory(State &state)
        : state_{state}
    {
    }

    SimOperatorPool &SimPoolDirectory::deploy(
        Address const &delegate, Address const &pool_address)
    {
        auto const [it, inserted] = pools_.try_emplace(
            delegate, std::make_unique<SimOperatorPool>(state_, pool_address));
        RESTAKE_ASSERT(inserted, "pool already deployed for delegate");
        return *it->second;
    }

    SimOperatorPool *SimPoolDirectory::find(Address const &delegate)
    {
        auto const it = pools_.find(delegate);
        if (it == pools_.end()) {
            return nullptr;
        }
        return it->second.get();
    }

    vault::OperatorPool *SimPoolDirectory::resolve(Address const &delegate)
    {
        return find(delegate);
    }

    void StaticPriceFeed::set_price(
        Address const &feed, uint256_t const &answer,
        uint64_t const updated_at, uint8_t const decimals)
    {
        feeds_[feed] = Entry{
            .round = {.answer = answer, .updated_at = updated_at},
            .decimals = decimals};
    }

    void StaticPriceFeed::set_negative_price(
        Address const &feed, uint256_t const &magnitude,
        uint64_t const updated_at)
    {
        // two's complement
        set_price(feed, uint256_t{0} - magnitude, updated_at);
    }

    Result<vault::PriceRound>
    StaticPriceFeed::latest_round(Address const &feed) const
    {
        auto const it = feeds_.find(feed);
        if (RESTAKE_UNLIKELY(it == feeds_.end())) {
            return vault::VaultError::OracleNotFound;
        }
        return it->second.round;
    }

    Result<uint8_t> StaticPriceFeed::decimals(Address const &feed) const
    {
        auto const it = feeds_.find(feed);
        if (RESTAKE_UNLIKELY(it == feeds_.end())) {
            return vault::VaultError::OracleNotFound;
        }
        return it->second.decimals;
    }

    void RoleTable::grant(Address const &account, vault::Role const role)
    {
        roles_[account] |= bit(role);
    }

    void RoleTable::revoke(Address const &account, vault::Role const role)
    {
        auto const it = roles_.find(account);
        if (it != roles_.end()) {
            it->second &= ~bit(role);
        }
    }

    void RoleTable::grant_all(Address const &account)
    {
        for (auto const role :
             {vault::Role::Admin,
              vault::Role::Pauser,
              vault::Role::OracleAdmin,
              vault::Role::WithdrawQueueAdmin,
              vault::Role::NativeStakeAdmin,
              vault::Role::DepositFlow}) {
            grant(account, role);
        }
    }

    bool RoleTable::has_role(
        Address const &account, vault::Role const role) const
    {
        auto const it = roles_.find(account);
        return it != roles_.end() && (it->second & bit(role)) != 0;
    }

    void StaticRiskFeed::set_paused(vault::PauseFlag const flag, bool const on)
    {
        auto const mask = uint32_t{1} << static_cast<uint8_t>(flag);
        if (on) {
            paused_ |= mask;
        }
        else {
            paused_ &= ~mask;
        }
    }

    void StaticRiskFeed::set_cooldown_override(uint64_t const seconds)
    {
        cooldown_override_ = seconds;
    }

    bool StaticRiskFeed::is_paused(vault::PauseFlag const flag) const
    {
        return (paused_ & (uint32_t{1} << static_cast<uint8_t>(flag))) != 0;
    }

    uint64_t StaticRiskFeed::cooldown_override() const
    {
        return cooldown_override_;
    }
}

RESTAKE_NAMESPACE_END
