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
#include <restake/core/fmt/address_fmt.hpp> // NOLINT
#include <restake/core/fmt/int_fmt.hpp> // NOLINT
#include <restake/core/likely.h>
#include <restake/ledger/abi_encode.hpp>
#include <restake/ledger/abi_signatures.hpp>
#include <restake/ledger/asset.hpp>
#include <restake/ledger/checked_math.hpp>
#include <restake/ledger/events.hpp>
#include <restake/ledger/state.hpp>
#include <restake/ledger/token_ledger.hpp>
#include <restake/vault/accounting_core.hpp>
#include <restake/vault/price_oracle.hpp>
#include <restake/vault/util/vault_error.hpp>
#include <restake/vault/withdrawal_queue.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>

RESTAKE_VAULT_NAMESPACE_BEGIN

AccountingCore::AccountingCore(State &state, Collaborators const &collab)
    : state_{state}
    , collab_{collab}
    , vars{state}
{
}

Result<void>
AccountingCore::require_role(Address const &caller, Role const role) const
{
    if (RESTAKE_UNLIKELY(!collab_.access.has_role(caller, role))) {
        return VaultError::NotAuthorized;
    }
    return outcome::success();
}

Result<OperatorPool *> AccountingCore::pool_of(Address const &delegate)
{
    auto *const pool = collab_.pools.resolve(delegate);
    if (RESTAKE_UNLIKELY(pool == nullptr)) {
        return VaultError::DelegateNotFound;
    }
    return pool;
}

/////////////
// Views //
/////////////

bool AccountingCore::is_paused() const
{
    return vars.paused.load();
}

Result<size_t> AccountingCore::asset_column(Address const &asset)
{
    if (is_native(asset)) {
        return static_cast<size_t>(vars.assets.size());
    }
    auto const index = vars.assets.index_of(asset);
    if (RESTAKE_UNLIKELY(!index.has_value())) {
        return VaultError::AssetNotFound;
    }
    return static_cast<size_t>(index.value());
}

Result<TotalValues> AccountingCore::calculate_total_values()
{
    PriceOracle const oracle{state_, collab_};
    auto const assets = vars.assets.addresses();
    auto const delegates = vars.delegates.addresses();

    TotalValues totals{};
    totals.per_delegate_per_asset.reserve(delegates.size());
    totals.per_delegate_total.reserve(delegates.size());

    for (auto const &delegate : delegates) {
        BOOST_OUTCOME_TRY(auto *const pool, pool_of(delegate));

        std::vector<uint256_t> row(assets.size() + 1, 0);
        uint256_t delegate_total = 0;
        for (size_t i = 0; i < assets.size(); ++i) {
            auto const balance = pool->balance_of(assets[i]);
            if (balance == 0) {
                continue;
            }
            BOOST_OUTCOME_TRY(
                auto const value, oracle.lookup_value(assets[i], balance));
            row[i] = value;
            BOOST_OUTCOME_TRY(delegate_total, checked_add(delegate_total, value));
        }
        row.back() = pool->native_staked_balance();
        BOOST_OUTCOME_TRY(
            delegate_total, checked_add(delegate_total, row.back()));

        BOOST_OUTCOME_TRY(
            totals.grand_total, checked_add(totals.grand_total, delegate_total));
        totals.per_delegate_per_asset.push_back(std::move(row));
        totals.per_delegate_total.push_back(delegate_total);
    }

    BOOST_OUTCOME_TRY(auto const undeployed, undeployed_value());
    BOOST_OUTCOME_TRY(
        totals.grand_total, checked_add(totals.grand_total, undeployed));
    return totals;
}

Result<uint256_t> AccountingCore::undeployed_value()
{
    PriceOracle const oracle{state_, collab_};

    BOOST_OUTCOME_TRY(
        uint256_t total,
        checked_add(
            asset_balance(state_, NATIVE_ASSET, STAGING_CA),
            asset_balance(state_, NATIVE_ASSET, WITHDRAW_QUEUE_CA)));

    for (auto const &asset : vars.assets.addresses()) {
        auto const held = asset_balance(state_, asset, WITHDRAW_QUEUE_CA);
        if (held == 0) {
            continue;
        }
        BOOST_OUTCOME_TRY(auto const value, oracle.lookup_value(asset, held));
        BOOST_OUTCOME_TRY(total, checked_add(total, value));
    }
    return total;
}

uint256_t AccountingCore::delegated_balance(Address const &asset)
{
    uint256_t total = 0;
    for (auto const &delegate : vars.delegates.addresses()) {
        auto *const pool = collab_.pools.resolve(delegate);
        if (pool == nullptr) {
            continue;
        }
        total += is_native(asset) ? pool->native_staked_balance()
                                  : pool->balance_of(asset);
    }
    if (is_native(asset)) {
        total += asset_balance(state_, NATIVE_ASSET, STAGING_CA);
    }
    return total;
}

Result<AccountingCore::PendingDelegateWithdrawal>
AccountingCore::pending_delegate_withdrawal(uint64_t const id)
{
    auto const pending = vars.delegate_withdrawal(id).load_checked();
    if (RESTAKE_UNLIKELY(!pending.has_value())) {
        return VaultError::DelegateWithdrawalNotFound;
    }
    return pending.value();
}

////////////////////////
// Delegate selection //
////////////////////////

Result<size_t> AccountingCore::choose_delegate_for_deposit(
    std::vector<uint256_t> const &per_delegate_total,
    uint256_t const &grand_total)
{
    if (RESTAKE_UNLIKELY(per_delegate_total.empty())) {
        return VaultError::NoEligibleDelegate;
    }
    if (grand_total == 0) {
        return size_t{0};
    }
    RESTAKE_ASSERT(per_delegate_total.size() == vars.delegates.size());

    for (size_t i = 0; i < per_delegate_total.size(); ++i) {
        uint256_t const allocation =
            vars.allocation_bps(vars.delegates.at(i)).load().native();
        BOOST_OUTCOME_TRY(
            auto const threshold,
            checked_mul_div(allocation, grand_total, BASIS_POINTS));
        if (per_delegate_total[i] < threshold) {
            return i;
        }
    }
    return size_t{0};
}

Result<size_t> AccountingCore::choose_delegate_for_withdraw(
    size_t const asset_column, uint256_t const &value,
    std::vector<std::vector<uint256_t>> const &per_delegate_per_asset,
    std::vector<uint256_t> const &per_delegate_total,
    uint256_t const &grand_total)
{
    RESTAKE_ASSERT(per_delegate_per_asset.size() == per_delegate_total.size());

    // prefer delegates above their allocation
    for (size_t i = 0; i < per_delegate_total.size(); ++i) {
        uint256_t const allocation =
            vars.allocation_bps(vars.delegates.at(i)).load().native();
        BOOST_OUTCOME_TRY(
            auto const threshold,
            checked_mul_div(allocation, grand_total, BASIS_POINTS));
        if (per_delegate_total[i] > threshold &&
            per_delegate_per_asset[i][asset_column] >= value) {
            return i;
        }
    }
    for (size_t i = 0; i < per_delegate_per_asset.size(); ++i) {
        if (per_delegate_per_asset[i][asset_column] >= value) {
            return i;
        }
    }
    return VaultError::NoEligibleDelegate;
}

//////////////
// Deposits //
//////////////

Result<uint256_t> AccountingCore::route_to_buffer(
    Address const &asset, uint256_t const &amount)
{
    WithdrawalQueue queue{state_, collab_};
    auto const fill = std::min(queue.buffer_deficit(asset), amount);
    if (fill == 0) {
        return uint256_t{0};
    }
    BOOST_OUTCOME_TRY(queue.receive_fill(ACCOUNTING_CA, asset, fill));
    return fill;
}

Result<void> AccountingCore::deposit_into_delegate(
    Address const &delegate, Address const &asset, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(auto *const pool, pool_of(delegate));
    BOOST_OUTCOME_TRY(
        transfer_asset(state_, asset, ACCOUNTING_CA, pool->address(), amount));
    BOOST_OUTCOME_TRY(pool->deposit(asset, amount));
    return outcome::success();
}

void AccountingCore::emit_deposit_event(
    Address const &depositor, Address const &asset, uint256_t const &amount,
    uint256_t const &shares, Address const &referral)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "Deposit(address,address,uint256,uint256,address)");

    auto const event = EventBuilder(ACCOUNTING_CA, signature)
                           .add_topic(abi_encode_address(depositor))
                           .add_topic(abi_encode_address(asset))
                           .add_data(abi_encode_uint(u256_be{amount}))
                           .add_data(abi_encode_uint(u256_be{shares}))
                           .add_data(abi_encode_address(referral))
                           .build();
    state_.store_log(event);
}

Result<uint256_t> AccountingCore::deposit(
    Address const &caller, Address const &asset, uint256_t const &amount,
    Address const &referral)
{
    if (RESTAKE_UNLIKELY(
            is_paused() || collab_.risk.is_paused(PauseFlag::Deposit))) {
        return VaultError::Paused;
    }
    if (RESTAKE_UNLIKELY(amount == 0)) {
        return VaultError::ZeroAmount;
    }
    // native goes through deposit_native
    if (RESTAKE_UNLIKELY(is_native(asset))) {
        return VaultError::InvalidInput;
    }
    auto const column = vars.assets.index_of(asset);
    if (RESTAKE_UNLIKELY(!column.has_value())) {
        return VaultError::AssetNotFound;
    }
    BOOST_OUTCOME_TRY(auto const lock, vars.guard.acquire());

    BOOST_OUTCOME_TRY(auto const totals, calculate_total_values());
    PriceOracle const oracle{state_, collab_};
    BOOST_OUTCOME_TRY(auto const value, oracle.lookup_value(asset, amount));

    uint256_t const max_total = vars.max_total_value.load().native();
    if (max_total != 0) {
        BOOST_OUTCOME_TRY(
            auto const after, checked_add(totals.grand_total, value));
        if (RESTAKE_UNLIKELY(after > max_total)) {
            return VaultError::MaxTvlReached;
        }
    }
    uint256_t const token_cap = vars.token_value_cap(asset).load().native();
    if (token_cap != 0) {
        // buffered holdings count against the cap as well
        BOOST_OUTCOME_TRY(
            uint256_t asset_total,
            oracle.lookup_value(
                asset, asset_balance(state_, asset, WITHDRAW_QUEUE_CA)));
        BOOST_OUTCOME_TRY(asset_total, checked_add(asset_total, value));
        for (auto const &row : totals.per_delegate_per_asset) {
            BOOST_OUTCOME_TRY(
                asset_total, checked_add(asset_total, row[column.value()]));
        }
        if (RESTAKE_UNLIKELY(asset_total > token_cap)) {
            return VaultError::MaxTokenTvlReached;
        }
    }

    BOOST_OUTCOME_TRY(
        auto const index,
        choose_delegate_for_deposit(
            totals.per_delegate_total, totals.grand_total));

    TokenLedger shares{state_, SHARE_TOKEN_CA};
    BOOST_OUTCOME_TRY(
        auto const minted,
        PriceOracle::calculate_mint_amount(
            totals.grand_total, value, shares.total_supply()));

    BOOST_OUTCOME_TRY(
        transfer_asset(state_, asset, caller, ACCOUNTING_CA, amount));
    BOOST_OUTCOME_TRY(auto const filled, route_to_buffer(asset, amount));
    if (amount > filled) {
        BOOST_OUTCOME_TRY(deposit_into_delegate(
            vars.delegates.at(index), asset, amount - filled));
    }
    BOOST_OUTCOME_TRY(shares.mint(caller, minted));

    emit_deposit_event(caller, asset, amount, minted, referral);
    return minted;
}

Result<uint256_t> AccountingCore::deposit_native(
    Address const &caller, uint256_t const &value, Address const &referral)
{
    if (RESTAKE_UNLIKELY(
            is_paused() || collab_.risk.is_paused(PauseFlag::Deposit))) {
        return VaultError::Paused;
    }
    if (RESTAKE_UNLIKELY(value == 0)) {
        return VaultError::ZeroAmount;
    }
    BOOST_OUTCOME_TRY(auto const lock, vars.guard.acquire());

    BOOST_OUTCOME_TRY(auto const totals, calculate_total_values());

    uint256_t const max_total = vars.max_total_value.load().native();
    if (max_total != 0) {
        BOOST_OUTCOME_TRY(
            auto const after, checked_add(totals.grand_total, value));
        if (RESTAKE_UNLIKELY(after > max_total)) {
            return VaultError::MaxTvlReached;
        }
    }

    TokenLedger shares{state_, SHARE_TOKEN_CA};
    BOOST_OUTCOME_TRY(
        auto const minted,
        PriceOracle::calculate_mint_amount(
            totals.grand_total, value, shares.total_supply()));

    BOOST_OUTCOME_TRY(
        transfer_asset(state_, NATIVE_ASSET, caller, ACCOUNTING_CA, value));
    BOOST_OUTCOME_TRY(auto const filled, route_to_buffer(NATIVE_ASSET, value));
    if (value > filled) {
        BOOST_OUTCOME_TRY(transfer_asset(
            state_, NATIVE_ASSET, ACCOUNTING_CA, STAGING_CA, value - filled));
    }
    BOOST_OUTCOME_TRY(shares.mint(caller, minted));

    emit_deposit_event(caller, NATIVE_ASSET, value, minted, referral);
    return minted;
}

///////////
// Admin //
///////////

Result<void> AccountingCore::add_collateral_asset(
    Address const &caller, Address const &asset, uint256_t const &value_cap)
{
    BOOST_OUTCOME_TRY(require_role(caller, Role::Admin));
    if (RESTAKE_UNLIKELY(asset == Address{})) {
        return VaultError::ZeroAddress;
    }
    if (RESTAKE_UNLIKELY(is_native(asset))) {
        return VaultError::InvalidInput;
    }
    if (RESTAKE_UNLIKELY(vars.assets.contains(asset))) {
        return VaultError::AlreadyRegistered;
    }
    PriceOracle const oracle{state_, collab_};
    if (RESTAKE_UNLIKELY(!oracle.has_feed(asset))) {
        return VaultError::OracleNotFound;
    }
    bool const added = vars.assets.add(asset);
    RESTAKE_ASSERT(added);
    vars.token_value_cap(asset).store(value_cap);
    LOG_INFO("collateral asset {} added, value cap {}", asset, value_cap);
    return outcome::success();
}

Result<void> AccountingCore::remove_collateral_asset(
    Address const &caller, Address const &asset)
{
    BOOST_OUTCOME_TRY(require_role(caller, Role::Admin));
    if (RESTAKE_UNLIKELY(!vars.assets.contains(asset))) {
        return VaultError::AssetNotFound;
    }
    for (auto const &delegate : vars.delegates.addresses()) {
        BOOST_OUTCOME_TRY(auto *const pool, pool_of(delegate));
        if (RESTAKE_UNLIKELY(pool->balance_of(asset) != 0)) {
            return VaultError::NonZeroBalance;
        }
    }
    WithdrawalQueue queue{state_, collab_};
    auto const buffer = queue.vars.buffer(asset);
    if (RESTAKE_UNLIKELY(
            queue.held(asset) != 0 ||
            buffer.claim_reserve().load().native() != 0 ||
            buffer.queue_deficit() != 0)) {
        return VaultError::NonZeroBalance;
    }
    bool const removed = vars.assets.remove(asset);
    RESTAKE_ASSERT(removed);
    vars.token_value_cap(asset).clear();
    LOG_INFO("collateral asset {} removed", asset);
    return outcome::success();
}

Result<void> AccountingCore::set_token_value_cap(
    Address const &caller, Address const &asset, uint256_t const &cap)
{
    BOOST_OUTCOME_TRY(require_role(caller, Role::Admin));
    if (RESTAKE_UNLIKELY(!vars.assets.contains(asset))) {
        return VaultError::AssetNotFound;
    }
    vars.token_value_cap(asset).store(cap);
    LOG_INFO("value cap of asset {} set to {}", asset, cap);
    return outcome::success();
}

Result<void> AccountingCore::set_max_total_value(
    Address const &caller, uint256_t const &cap)
{
    BOOST_OUTCOME_TRY(require_role(caller, Role::Admin));
    vars.max_total_value.store(cap);
    LOG_INFO("max total value set to {}", cap);
    return outcome::success();
}

Result<void> AccountingCore::add_operator_delegate(
    Address const &caller, Address const &delegate,
    uint64_t const allocation_bps)
{
    BOOST_OUTCOME_TRY(require_role(caller, Role::Admin));
    if (RESTAKE_UNLIKELY(delegate == Address{})) {
        return VaultError::ZeroAddress;
    }
    if (RESTAKE_UNLIKELY(allocation_bps > BASIS_POINTS)) {
        return VaultError::InvalidBasisPoints;
    }
    if (RESTAKE_UNLIKELY(vars.delegates.contains(delegate))) {
        return VaultError::AlreadyRegistered;
    }
    BOOST_OUTCOME_TRY(pool_of(delegate));
    bool const added = vars.delegates.add(delegate);
    RESTAKE_ASSERT(added);
    vars.allocation_bps(delegate).store(allocation_bps);
    LOG_INFO(
        "operator delegate {} added, allocation {} bps",
        delegate,
        allocation_bps);
    return outcome::success();
}

Result<void> AccountingCore::remove_operator_delegate(
    Address const &caller, Address const &delegate)
{
    BOOST_OUTCOME_TRY(require_role(caller, Role::Admin));
    if (RESTAKE_UNLIKELY(!vars.delegates.contains(delegate))) {
        return VaultError::DelegateNotFound;
    }
    BOOST_OUTCOME_TRY(auto *const pool, pool_of(delegate));
    if (RESTAKE_UNLIKELY(pool->native_staked_balance() != 0)) {
        return VaultError::NonZeroBalance;
    }
    for (auto const &asset : vars.assets.addresses()) {
        if (RESTAKE_UNLIKELY(pool->balance_of(asset) != 0)) {
            return VaultError::NonZeroBalance;
        }
    }
    bool const removed = vars.delegates.remove(delegate);
    RESTAKE_ASSERT(removed);
    vars.allocation_bps(delegate).clear();
    LOG_INFO("operator delegate {} removed", delegate);
    return outcome::success();
}

Result<void> AccountingCore::set_delegate_allocation(
    Address const &caller, Address const &delegate,
    uint64_t const allocation_bps)
{
    BOOST_OUTCOME_TRY(require_role(caller, Role::Admin));
    if (RESTAKE_UNLIKELY(allocation_bps > BASIS_POINTS)) {
        return VaultError::InvalidBasisPoints;
    }
    if (RESTAKE_UNLIKELY(!vars.delegates.contains(delegate))) {
        return VaultError::DelegateNotFound;
    }
    vars.allocation_bps(delegate).store(allocation_bps);
    LOG_INFO(
        "allocation of delegate {} set to {} bps", delegate, allocation_bps);
    return outcome::success();
}

Result<void> AccountingCore::pause(Address const &caller)
{
    BOOST_OUTCOME_TRY(require_role(caller, Role::Pauser));
    vars.paused.store(true);
    LOG_INFO("deposits paused by {}", caller);
    return outcome::success();
}

Result<void> AccountingCore::unpause(Address const &caller)
{
    BOOST_OUTCOME_TRY(require_role(caller, Role::Pauser));
    vars.paused.clear();
    LOG_INFO("deposits unpaused by {}", caller);
    return outcome::success();
}

//////////////////
// Native stake //
//////////////////

Result<void> AccountingCore::stake_native_from_staging(
    Address const &caller, Address const &delegate)
{
    BOOST_OUTCOME_TRY(require_role(caller, Role::NativeStakeAdmin));
    if (RESTAKE_UNLIKELY(!vars.delegates.contains(delegate))) {
        return VaultError::DelegateNotFound;
    }
    BOOST_OUTCOME_TRY(auto const lock, vars.guard.acquire());

    if (RESTAKE_UNLIKELY(
            asset_balance(state_, NATIVE_ASSET, STAGING_CA) <
            VALIDATOR_DEPOSIT)) {
        return VaultError::InsufficientStaging;
    }
    BOOST_OUTCOME_TRY(auto *const pool, pool_of(delegate));
    BOOST_OUTCOME_TRY(transfer_asset(
        state_, NATIVE_ASSET, STAGING_CA, pool->address(), VALIDATOR_DEPOSIT));
    BOOST_OUTCOME_TRY(pool->deposit(NATIVE_ASSET, VALIDATOR_DEPOSIT));
    LOG_INFO("staged validator deposit sent to delegate {}", delegate);
    return outcome::success();
}

/////////////////////////////////
// Delegate withdrawals (refill)
/////////////////////////////////

Result<uint64_t> AccountingCore::queue_delegate_withdrawal(
    Address const &caller, Address const &asset, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(require_role(caller, Role::WithdrawQueueAdmin));
    if (RESTAKE_UNLIKELY(amount == 0)) {
        return VaultError::ZeroAmount;
    }
    BOOST_OUTCOME_TRY(auto const column, asset_column(asset));
    BOOST_OUTCOME_TRY(auto const lock, vars.guard.acquire());

    BOOST_OUTCOME_TRY(auto const totals, calculate_total_values());
    PriceOracle const oracle{state_, collab_};
    BOOST_OUTCOME_TRY(auto const value, oracle.lookup_value(asset, amount));
    BOOST_OUTCOME_TRY(
        auto const index,
        choose_delegate_for_withdraw(
            column,
            value,
            totals.per_delegate_per_asset,
            totals.per_delegate_total,
            totals.grand_total));

    auto const delegate = vars.delegates.at(index);
    BOOST_OUTCOME_TRY(auto *const pool, pool_of(delegate));
    BOOST_OUTCOME_TRY(
        auto const adapter_id, pool->initiate_withdraw(asset, amount));

    auto const id = vars.last_delegate_withdrawal_id.load().native() + 1;
    vars.last_delegate_withdrawal_id.store(id);
    vars.delegate_withdrawal(id).store(PendingDelegateWithdrawal{
        .delegate = delegate,
        .asset = asset,
        .adapter_request_id = adapter_id,
        .amount = amount});

    LOG_INFO(
        "delegate withdrawal {} queued: {} of asset {} from delegate {}",
        id,
        amount,
        asset,
        delegate);
    return id;
}

Result<uint256_t> AccountingCore::complete_delegate_withdrawal(
    Address const &caller, uint64_t const id)
{
    BOOST_OUTCOME_TRY(require_role(caller, Role::WithdrawQueueAdmin));
    BOOST_OUTCOME_TRY(auto const pending, pending_delegate_withdrawal(id));
    BOOST_OUTCOME_TRY(auto const lock, vars.guard.acquire());

    vars.delegate_withdrawal(id).clear();

    BOOST_OUTCOME_TRY(auto *const pool, pool_of(pending.delegate));
    auto const before = asset_balance(state_, pending.asset, ACCOUNTING_CA);
    BOOST_OUTCOME_TRY(
        pool->complete_withdraw(pending.adapter_request_id.native()));
    // trust the ledger, not the adapter's report
    auto const after = asset_balance(state_, pending.asset, ACCOUNTING_CA);
    RESTAKE_ASSERT(after >= before);
    auto const received = after - before;

    BOOST_OUTCOME_TRY(
        auto const filled, route_to_buffer(pending.asset, received));
    if (received > filled) {
        BOOST_OUTCOME_TRY(deposit_into_delegate(
            pending.delegate, pending.asset, received - filled));
    }

    LOG_INFO(
        "delegate withdrawal {} completed: received {}, buffer filled {}",
        id,
        received,
        filled);
    return received;
}

RESTAKE_VAULT_NAMESPACE_END
