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
#include <restake/sim/sim_operator_pool.hpp>
#include <restake/vault/util/collaborators.hpp>

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <memory>

RESTAKE_NAMESPACE_BEGIN

class State;

namespace sim
{
    template <typename K, typename V>
    using Map = ankerl::unordered_dense::segmented_map<K, V>;

    class SimPoolDirectory final : public vault::OperatorPoolDirectory
    {
        State &state_;
        Map<Address, std::unique_ptr<SimOperatorPool>> pools_;

    public:
        explicit SimPoolDirectory(State &);

        // Deploys a pool for `delegate` at `pool_address`
        SimOperatorPool &
        deploy(Address const &delegate, Address const &pool_address);

        SimOperatorPool *find(Address const &delegate);

        vault::OperatorPool *resolve(Address const &delegate) override;
    };

    class StaticPriceFeed final : public vault::PriceFeed
    {
        struct Entry
        {
            vault::PriceRound round;
            uint8_t decimals;
        };

        Map<Address, Entry> feeds_;

    public:
        void set_price(
            Address const &feed, uint256_t const &answer, uint64_t updated_at,
            uint8_t decimals = 18);

        // Reports a negative answer
        void set_negative_price(
            Address const &feed, uint256_t const &magnitude,
            uint64_t updated_at);

        Result<vault::PriceRound>
        latest_round(Address const &feed) const override;

        Result<uint8_t> decimals(Address const &feed) const override;
    };

    class RoleTable final : public vault::AccessControl
    {
        Map<Address, uint32_t> roles_;

        static constexpr uint32_t bit(vault::Role const role)
        {
            return uint32_t{1} << static_cast<uint8_t>(role);
        }

    public:
        void grant(Address const &account, vault::Role);
        void revoke(Address const &account, vault::Role);
        void grant_all(Address const &account);

        bool has_role(Address const &account, vault::Role) const override;
    };

    class StaticRiskFeed final : public vault::RiskParameterFeed
    {
        uint32_t paused_{0};
        uint64_t cooldown_override_{0};

    public:
        void set_paused(vault::PauseFlag, bool);
        void set_cooldown_override(uint64_t seconds);

        bool is_paused(vault::PauseFlag) const override;
        uint64_t cooldown_override() const override;
    };

    /// All collaborators of one simulated deployment
    struct Environment
    {
        explicit Environment(State &state)
            : pools{state}
        {
        }

        Environment(Environment const &) = delete;
        Environment &operator=(Environment const &) = delete;

        SimPoolDirectory pools;
        StaticPriceFeed price_feed;
        RoleTable access;
        StaticRiskFeed risk;
        vault::Collaborators collaborators{
            .pools = pools,
            .price_feed = price_feed,
            .access = access,
            .risk = risk};
    };
}

RESTAKE_NAMESPACE_END
