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
#include <restake/core/config.hpp>
#include <restake/core/int.hpp>
#include <restake/vault/schema.hpp>
#include <restake/vault/util/collaborators.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

RESTAKE_NAMESPACE_BEGIN

namespace sim
{
    struct AssetSpec
    {
        Address token;
        Address feed;
        // native value of one whole token, 18 decimals
        uint256_t price;
        uint256_t value_cap;
        uint256_t buffer_target;
    };

    struct DelegateSpec
    {
        Address delegate;
        Address pool;
        uint64_t allocation_bps;
    };

    struct AccountSpec
    {
        Address address;
        uint256_t native;
        std::vector<std::pair<Address, uint256_t>> tokens;
    };

    struct RoleGrant
    {
        Address account;
        std::vector<vault::Role> roles;
    };

    enum class ActionType : uint8_t
    {
        Deposit = 0,
        DepositNative,
        Withdraw,
        Claim,
        InstantWithdraw,
        FillBuffer,
        StakeNative,
        QueueDelegateWithdrawal,
        CompleteDelegateWithdrawal,
        AdvanceTime,
        SetPrice,
        Reward,
        Slash,
        Report,
    };

    // Fields an action does not use stay zero
    struct Action
    {
        ActionType type;
        Address caller;
        Address asset;
        // delegate, claim owner or price feed, depending on the action
        Address target;
        uint256_t amount;
        uint256_t min_out;
        uint64_t index;
        // whether a failure is the expected outcome
        bool expect_error;
    };

    struct Deployment
    {
        uint64_t start_time;
        Address admin;
        vault::ProtocolConfig config;
        uint256_t native_buffer_target;
        std::vector<AssetSpec> assets;
        std::vector<DelegateSpec> delegates;
        std::vector<AccountSpec> accounts;
        std::vector<RoleGrant> roles;
        std::vector<Action> actions;
    };

    // Amounts are decimal or 0x-prefixed strings, or plain JSON numbers
    uint256_t parse_amount(nlohmann::json const &);

    Address parse_address(nlohmann::json const &);

    vault::Role parse_role(std::string const &);

    ActionType parse_action_type(std::string const &);

    char const *action_name(ActionType);

    Deployment parse_deployment(nlohmann::json const &);

    Deployment load_deployment(std::filesystem::path const &);
}

RESTAKE_NAMESPACE_END
