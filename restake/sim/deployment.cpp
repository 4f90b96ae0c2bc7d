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

#include <restake/core/restake_exception.hpp>
#include <restake/ledger/asset.hpp>
#include <restake/sim/deployment.hpp>
#include <restake/vault/util/constants.hpp>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <fstream>
#include <string>
#include <unordered_map>

RESTAKE_NAMESPACE_BEGIN

namespace sim
{
    namespace
    {
        using json = nlohmann::json;

        std::unordered_map<std::string, vault::Role> const role_map = {
            {"admin", vault::Role::Admin},
            {"pauser", vault::Role::Pauser},
            {"oracle_admin", vault::Role::OracleAdmin},
            {"withdraw_queue_admin", vault::Role::WithdrawQueueAdmin},
            {"native_stake_admin", vault::Role::NativeStakeAdmin},
            {"deposit_flow", vault::Role::DepositFlow},
            {"instant_withdrawer", vault::Role::InstantWithdrawer}};

        std::unordered_map<std::string, ActionType> const action_map = {
            {"deposit", ActionType::Deposit},
            {"deposit_native", ActionType::DepositNative},
            {"withdraw", ActionType::Withdraw},
            {"claim", ActionType::Claim},
            {"instant_withdraw", ActionType::InstantWithdraw},
            {"fill_buffer", ActionType::FillBuffer},
            {"stake_native", ActionType::StakeNative},
            {"queue_delegate_withdrawal",
             ActionType::QueueDelegateWithdrawal},
            {"complete_delegate_withdrawal",
             ActionType::CompleteDelegateWithdrawal},
            {"advance_time", ActionType::AdvanceTime},
            {"set_price", ActionType::SetPrice},
            {"reward", ActionType::Reward},
            {"slash", ActionType::Slash},
            {"report", ActionType::Report}};

        uint256_t amount_or(
            json const &j, char const *const key, uint256_t const &fallback)
        {
            return j.contains(key) ? parse_amount(j.at(key)) : fallback;
        }

        Address address_or(
            json const &j, char const *const key, Address const &fallback)
        {
            return j.contains(key) ? parse_address(j.at(key)) : fallback;
        }

        Address asset_of(json const &j)
        {
            // "native" is accepted in place of the placeholder address
            if (j.contains("asset") && j.at("asset").is_string() &&
                j.at("asset").get<std::string>() == "native") {
                return NATIVE_ASSET;
            }
            return address_or(j, "asset", NATIVE_ASSET);
        }

        vault::InstantWithdrawConfig
        parse_instant_config(json const &j, vault::InstantWithdrawConfig cfg)
        {
            if (j.contains("drawdown_bps")) {
                cfg.drawdown_bps = j.at("drawdown_bps").get<uint64_t>();
            }
            if (j.contains("min_fee_bps")) {
                cfg.min_fee_bps = j.at("min_fee_bps").get<uint64_t>();
            }
            if (j.contains("max_fee_bps")) {
                cfg.max_fee_bps = j.at("max_fee_bps").get<uint64_t>();
            }
            cfg.fee_destination =
                address_or(j, "fee_destination", cfg.fee_destination);
            return cfg;
        }

        Action parse_action(json const &j)
        {
            Action action{};
            action.type = parse_action_type(j.at("type").get<std::string>());
            action.caller = address_or(j, "caller", Address{});
            action.asset = asset_of(j);
            action.expect_error = j.value("expect_error", false);

            switch (action.type) {
            case ActionType::Deposit:
            case ActionType::DepositNative:
            case ActionType::FillBuffer:
            case ActionType::QueueDelegateWithdrawal:
                action.amount = parse_amount(j.at("amount"));
                break;
            case ActionType::Withdraw:
                action.amount = parse_amount(j.at("shares"));
                break;
            case ActionType::InstantWithdraw:
                action.amount = parse_amount(j.at("shares"));
                action.min_out = amount_or(j, "min_out", 0);
                break;
            case ActionType::Claim:
                action.target = address_or(j, "user", action.caller);
                action.index = j.value("index", uint64_t{0});
                break;
            case ActionType::StakeNative:
                action.target = parse_address(j.at("delegate"));
                break;
            case ActionType::CompleteDelegateWithdrawal:
                action.index = j.at("id").get<uint64_t>();
                break;
            case ActionType::AdvanceTime:
                action.index = j.at("seconds").get<uint64_t>();
                break;
            case ActionType::SetPrice:
                action.target = parse_address(j.at("feed"));
                action.amount = parse_amount(j.at("price"));
                break;
            case ActionType::Reward:
            case ActionType::Slash:
                action.target = parse_address(j.at("delegate"));
                action.amount = parse_amount(j.at("amount"));
                break;
            case ActionType::Report:
                break;
            }
            return action;
        }
    }

    uint256_t parse_amount(json const &j)
    {
        if (j.is_number_unsigned()) {
            return j.get<uint64_t>();
        }
        RESTAKE_THROW(
            j.is_string(), "amount must be a string or unsigned integer");
        // throws std::invalid_argument on malformed input
        return intx::from_string<uint256_t>(j.get<std::string>());
    }

    Address parse_address(json const &j)
    {
        RESTAKE_THROW(j.is_string(), "address must be a hex string");
        auto const str = j.get<std::string>();
        auto const address = evmc::from_hex<Address>(str);
        RESTAKE_THROW(address.has_value(), "invalid address " + str);
        return address.value();
    }

    vault::Role parse_role(std::string const &name)
    {
        auto const it = role_map.find(name);
        RESTAKE_THROW(it != role_map.end(), "unknown role " + name);
        return it->second;
    }

    ActionType parse_action_type(std::string const &name)
    {
        auto const it = action_map.find(name);
        RESTAKE_THROW(it != action_map.end(), "unknown action " + name);
        return it->second;
    }

    char const *action_name(ActionType const type)
    {
        for (auto const &[name, t] : action_map) {
            if (t == type) {
                return name.c_str();
            }
        }
        return "unknown";
    }

    Deployment parse_deployment(json const &j)
    {
        Deployment d{};
        d.start_time = j.value("start_time", uint64_t{0});
        d.admin = parse_address(j.at("admin"));
        d.config = vault::default_protocol_config(d.admin);

        if (j.contains("config")) {
            auto const &c = j.at("config");
            d.config.cooldown_period =
                c.value("cooldown_period", d.config.cooldown_period);
            d.config.max_total_value =
                amount_or(c, "max_total_value", d.config.max_total_value);
            if (c.contains("instant")) {
                d.config.instant =
                    parse_instant_config(c.at("instant"), d.config.instant);
            }
        }
        d.native_buffer_target = amount_or(j, "native_buffer_target", 0);

        for (auto const &a : j.value("assets", json::array())) {
            d.assets.push_back(AssetSpec{
                .token = parse_address(a.at("token")),
                .feed = parse_address(a.at("feed")),
                .price = parse_amount(a.at("price")),
                .value_cap = amount_or(a, "value_cap", 0),
                .buffer_target = amount_or(a, "buffer_target", 0)});
        }
        for (auto const &del : j.value("delegates", json::array())) {
            auto const bps = del.at("allocation_bps").get<uint64_t>();
            RESTAKE_THROW(
                bps <= vault::BASIS_POINTS,
                "allocation_bps above " + std::to_string(vault::BASIS_POINTS));
            d.delegates.push_back(DelegateSpec{
                .delegate = parse_address(del.at("address")),
                .pool = parse_address(del.at("pool")),
                .allocation_bps = bps});
        }
        for (auto const &acc : j.value("accounts", json::array())) {
            AccountSpec spec{
                .address = parse_address(acc.at("address")),
                .native = amount_or(acc, "native", 0),
                .tokens = {}};
            auto const tokens = acc.value("tokens", json::object());
            for (auto const &item : tokens.items()) {
                spec.tokens.emplace_back(
                    parse_address(json(item.key())), parse_amount(item.value()));
            }
            d.accounts.push_back(std::move(spec));
        }
        for (auto const &g : j.value("roles", json::array())) {
            RoleGrant grant{
                .account = parse_address(g.at("account")), .roles = {}};
            for (auto const &r : g.at("roles")) {
                grant.roles.push_back(parse_role(r.get<std::string>()));
            }
            d.roles.push_back(std::move(grant));
        }
        for (auto const &a : j.value("actions", json::array())) {
            d.actions.push_back(parse_action(a));
        }
        return d;
    }

    Deployment load_deployment(std::filesystem::path const &path)
    {
        std::ifstream in{path};
        RESTAKE_THROW(in.is_open(), "cannot open " + path.string());
        return parse_deployment(json::parse(in));
    }
}

RESTAKE_NAMESPACE_END
