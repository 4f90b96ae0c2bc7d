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

#include <cstdint>

RESTAKE_VAULT_NAMESPACE_BEGIN

/////////////////////////////////////////////////////
// External components consumed by the vault. None of
// them are implemented here; restake/sim provides
// in-memory stand-ins.
/////////////////////////////////////////////////////

// Staking-layer adapter for one operator delegate. Funds are moved to
// `address()` before `deposit` is called; `complete_withdraw` sends the
// funds back to the accounting core.
class OperatorPool
{
public:
    virtual ~OperatorPool() = default;

    virtual Address const &address() const = 0;

    // Includes amounts with a withdrawal initiated but not completed
    virtual uint256_t balance_of(Address const &asset) const = 0;

    virtual uint256_t native_staked_balance() const = 0;

    // Returns the pool shares credited for `amount`
    virtual Result<uint256_t>
    deposit(Address const &asset, uint256_t const &amount) = 0;

    virtual Result<uint64_t>
    initiate_withdraw(Address const &asset, uint256_t const &amount) = 0;

    // Returns the amount sent back
    virtual Result<uint256_t> complete_withdraw(uint64_t request_id) = 0;
};

class OperatorPoolDirectory
{
public:
    virtual ~OperatorPoolDirectory() = default;

    // nullptr when no pool is deployed for the delegate
    virtual OperatorPool *resolve(Address const &delegate) = 0;
};

struct PriceRound
{
    // signed 256-bit answer in two's complement
    uint256_t answer;
    uint64_t updated_at;
};

class PriceFeed
{
public:
    virtual ~PriceFeed() = default;

    virtual Result<PriceRound> latest_round(Address const &feed) const = 0;

    virtual Result<uint8_t> decimals(Address const &feed) const = 0;
};

enum class Role : uint8_t
{
    Admin = 0,
    Pauser,
    OracleAdmin,
    WithdrawQueueAdmin,
    NativeStakeAdmin,
    DepositFlow,
    InstantWithdrawer,
};

class AccessControl
{
public:
    virtual ~AccessControl() = default;

    virtual bool has_role(Address const &account, Role) const = 0;
};

enum class PauseFlag : uint8_t
{
    Deposit = 0,
    Withdraw,
    Claim,
    InstantWithdraw,
};

class RiskParameterFeed
{
public:
    virtual ~RiskParameterFeed() = default;

    virtual bool is_paused(PauseFlag) const = 0;

    // Seconds; only ever lengthens the local cooldown
    virtual uint64_t cooldown_override() const = 0;
};

struct Collaborators
{
    OperatorPoolDirectory &pools;
    PriceFeed const &price_feed;
    AccessControl const &access;
    RiskParameterFeed const &risk;
};

RESTAKE_VAULT_NAMESPACE_END
