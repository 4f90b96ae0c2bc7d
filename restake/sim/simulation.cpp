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

#include <restake/core/fmt/address_fmt.hpp> // NOLINT
#include <restake/core/fmt/int_fmt.hpp> // NOLINT
#include <restake/core/restake_exception.hpp>
#include <restake/ledger/asset.hpp>
#include <restake/ledger/checked_math.hpp>
#include <restake/ledger/token_ledger.hpp>
#include <restake/sim/simulation.hpp>
#include <restake/vault/util/constants.hpp>
#include <restake/vault/util/vault_error.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <string>
#include <utility>

RESTAKE_NAMESPACE_BEGIN

namespace sim
{
    namespace
    {
        template <typename T>
        void
        require_success(Result<T> const &res, std::string const &what)
        {
            RESTAKE_THROW(
                !res.has_error(),
                what + " failed: " + res.error().message().c_str());
        }
    }

    Simulation::Simulation(Deployment deployment)
        : deployment_{std::move(deployment)}
        , state_{deployment_.start_time}
        , env_{state_}
        , vault_{state_, env_.collaborators}
    {
        setup();
    }

    void Simulation::setup()
    {
        auto const &d = deployment_;
        auto const &admin = d.admin;

        env_.access.grant_all(admin);
        for (auto const &grant : d.roles) {
            for (auto const role : grant.roles) {
                env_.access.grant(grant.account, role);
            }
        }
        env_.access.grant(
            vault::INSTANT_WITHDRAWER_CA, vault::Role::InstantWithdrawer);

        for (auto const &asset : d.assets) {
            env_.price_feed.set_price(asset.feed, asset.price, d.start_time);
        }
        for (auto const &delegate : d.delegates) {
            env_.pools.deploy(delegate.delegate, delegate.pool);
        }
        for (auto const &account : d.accounts) {
            state_.add_to_balance(account.address, account.native);
            for (auto const &[token, amount] : account.tokens) {
                require_success(
                    TokenLedger{state_, token}.mint(account.address, amount),
                    "funding account");
            }
        }

        require_success(vault_.initialize(admin, d.config), "initialize");
        for (auto const &asset : d.assets) {
            require_success(
                vault_.set_oracle_address(admin, asset.token, asset.feed),
                "set_oracle_address");
            require_success(
                vault_.add_collateral_asset(
                    admin, asset.token, asset.value_cap),
                "add_collateral_asset");
            if (asset.buffer_target != 0) {
                require_success(
                    vault_.set_buffer_target(
                        admin, asset.token, asset.buffer_target),
                    "set_buffer_target");
            }
        }
        if (d.native_buffer_target != 0) {
            require_success(
                vault_.set_buffer_target(
                    admin, NATIVE_ASSET, d.native_buffer_target),
                "set_buffer_target");
        }
        for (auto const &delegate : d.delegates) {
            require_success(
                vault_.add_operator_delegate(
                    admin, delegate.delegate, delegate.allocation_bps),
                "add_operator_delegate");
        }
        LOG_INFO(
            "deployment ready: {} assets, {} delegates, {} accounts",
            d.assets.size(),
            d.delegates.size(),
            d.accounts.size());
    }

    Result<uint256_t> Simulation::apply(Action const &a)
    {
        switch (a.type) {
        case ActionType::Deposit:
            return vault_.deposit(a.caller, a.asset, a.amount);
        case ActionType::DepositNative:
            return vault_.deposit_native(a.caller, a.amount);
        case ActionType::Withdraw: {
            BOOST_OUTCOME_TRY(
                auto const index, vault_.withdraw(a.caller, a.amount, a.asset));
            return uint256_t{index};
        }
        case ActionType::Claim:
            return vault_.claim(a.caller, a.index, a.target);
        case ActionType::InstantWithdraw:
            return vault_.instant_withdraw(
                a.caller, a.amount, a.asset, a.min_out);
        case ActionType::FillBuffer:
            return vault_.fill_buffer(a.caller, a.asset, a.amount);
        case ActionType::StakeNative: {
            BOOST_OUTCOME_TRY(
                vault_.stake_native_from_staging(a.caller, a.target));
            return vault::VALIDATOR_DEPOSIT;
        }
        case ActionType::QueueDelegateWithdrawal: {
            BOOST_OUTCOME_TRY(
                auto const id,
                vault_.queue_delegate_withdrawal(a.caller, a.asset, a.amount));
            return uint256_t{id};
        }
        case ActionType::CompleteDelegateWithdrawal:
            return vault_.complete_delegate_withdrawal(a.caller, a.index);
        case ActionType::AdvanceTime:
            state_.advance_time(a.index);
            return uint256_t{state_.timestamp()};
        case ActionType::SetPrice:
            env_.price_feed.set_price(a.target, a.amount, state_.timestamp());
            return a.amount;
        case ActionType::Reward:
        case ActionType::Slash: {
            auto *const pool = env_.pools.find(a.target);
            if (pool == nullptr) {
                return vault::VaultError::DelegateNotFound;
            }
            if (a.type == ActionType::Reward) {
                pool->reward(a.asset, a.amount);
            }
            else {
                pool->slash(a.asset, a.amount);
            }
            return a.amount;
        }
        case ActionType::Report: {
            BOOST_OUTCOME_TRY(auto const r, report());
            log_report(r);
            return r.share_price;
        }
        }
        RESTAKE_ABORT("unknown action");
    }

    size_t Simulation::replay()
    {
        size_t mismatches = 0;
        auto const &actions = deployment_.actions;
        for (size_t i = 0; i < actions.size(); ++i) {
            auto const &action = actions[i];
            auto const res = apply(action);
            if (res.has_error()) {
                LOG_INFO(
                    "#{} {} by {} failed: {}",
                    i,
                    action_name(action.type),
                    action.caller,
                    res.error().message().c_str());
            }
            else {
                LOG_INFO(
                    "#{} {} by {} -> {}",
                    i,
                    action_name(action.type),
                    action.caller,
                    res.value());
            }
            if (res.has_error() != action.expect_error) {
                LOG_ERROR(
                    "#{} {} {} unexpectedly",
                    i,
                    action_name(action.type),
                    res.has_error() ? "failed" : "succeeded");
                ++mismatches;
            }
        }
        return mismatches;
    }

    Result<Report> Simulation::report()
    {
        BOOST_OUTCOME_TRY(auto const totals, vault_.calculate_total_values());

        Report r{};
        r.total_value = totals.grand_total;
        r.total_shares = vault_.total_shares();
        if (r.total_shares != 0) {
            BOOST_OUTCOME_TRY(
                r.share_price,
                checked_mul_div(
                    r.total_value, vault::SCALE_FACTOR, r.total_shares));
        }
        r.delegate_totals = totals.per_delegate_total;

        std::vector<Address> assets;
        for (auto const &asset : deployment_.assets) {
            assets.push_back(asset.token);
        }
        assets.push_back(NATIVE_ASSET);
        for (auto const &asset : assets) {
            auto const held =
                asset_balance(state_, asset, vault::WITHDRAW_QUEUE_CA);
            r.buffers.push_back(BufferReport{
                .asset = asset,
                .target = vault_.buffer_target(asset),
                .held = held,
                .claim_reserve = vault_.claim_reserve(asset),
                .available = vault_.available_to_withdraw(asset),
                .queue_deficit = vault_.withdraw_deficit(asset),
                .buffer_deficit = vault_.buffer_deficit(asset)});
        }
        return r;
    }

    void Simulation::log_report(Report const &r)
    {
        LOG_INFO(
            "total value {}, shares {}, share price {}",
            r.total_value,
            r.total_shares,
            r.share_price);
        for (size_t i = 0; i < r.delegate_totals.size(); ++i) {
            LOG_INFO("  delegate #{} value {}", i, r.delegate_totals[i]);
        }
        for (auto const &b : r.buffers) {
            if (b.target == 0 && b.held == 0) {
                continue;
            }
            LOG_INFO(
                "  buffer {}: target {} held {} reserved {} available {} "
                "queue deficit {} refill deficit {}",
                b.asset,
                b.target,
                b.held,
                b.claim_reserve,
                b.available,
                b.queue_deficit,
                b.buffer_deficit);
        }
    }
}

RESTAKE_NAMESPACE_END
