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
#include <restake/core/likely.h>
#include <restake/ledger/asset.hpp>
#include <restake/ledger/checked_math.hpp>
#include <restake/ledger/state.hpp>
#include <restake/vault/price_oracle.hpp>
#include <restake/vault/util/vault_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

RESTAKE_VAULT_NAMESPACE_BEGIN

PriceOracle::PriceOracle(State &state, Collaborators const &collab)
    : state_{state}
    , collab_{collab}
{
}

bool PriceOracle::has_feed(Address const &asset) const
{
    return is_native(asset) || feed_var(asset).load_checked().has_value();
}

Result<Address> PriceOracle::feed_of(Address const &asset) const
{
    auto const feed = feed_var(asset).load_checked();
    if (RESTAKE_UNLIKELY(!feed.has_value())) {
        return VaultError::OracleNotFound;
    }
    return feed.value();
}

Result<uint256_t> PriceOracle::price(Address const &asset) const
{
    BOOST_OUTCOME_TRY(auto const feed, feed_of(asset));
    BOOST_OUTCOME_TRY(auto const round, collab_.price_feed.latest_round(feed));

    if (RESTAKE_UNLIKELY(
            uint256_t{round.updated_at} + MAX_PRICE_AGE <
            uint256_t{state_.timestamp()})) {
        return VaultError::OracleStale;
    }
    // the answer is signed
    if (RESTAKE_UNLIKELY(
            round.answer == 0 || intx::slt(round.answer, uint256_t{0}))) {
        return VaultError::InvalidPrice;
    }
    return round.answer;
}

Result<uint256_t> PriceOracle::lookup_value(
    Address const &asset, uint256_t const &amount) const
{
    if (is_native(asset)) {
        return amount;
    }
    BOOST_OUTCOME_TRY(auto const p, price(asset));
    return checked_mul_div(amount, p, SCALE_FACTOR);
}

Result<uint256_t> PriceOracle::lookup_amount_from_value(
    Address const &asset, uint256_t const &value) const
{
    if (is_native(asset)) {
        return value;
    }
    BOOST_OUTCOME_TRY(auto const p, price(asset));
    return checked_mul_div(value, SCALE_FACTOR, p);
}

Result<void> PriceOracle::set_oracle_address(
    Address const &caller, Address const &asset, Address const &feed)
{
    if (RESTAKE_UNLIKELY(!collab_.access.has_role(caller, Role::OracleAdmin))) {
        return VaultError::NotAuthorized;
    }
    if (RESTAKE_UNLIKELY(asset == Address{} || feed == Address{})) {
        return VaultError::ZeroAddress;
    }
    if (RESTAKE_UNLIKELY(is_native(asset))) {
        return VaultError::InvalidInput;
    }
    BOOST_OUTCOME_TRY(auto const decimals, collab_.price_feed.decimals(feed));
    if (RESTAKE_UNLIKELY(decimals != REQUIRED_DECIMALS)) {
        return VaultError::InvalidTokenDecimals;
    }
    feed_var(asset).store(feed);
    LOG_INFO("oracle for asset {} set to feed {}", asset, feed);
    return outcome::success();
}

Result<uint256_t> PriceOracle::calculate_mint_amount(
    uint256_t const &current_value, uint256_t const &new_value,
    uint256_t const &existing_supply)
{
    uint256_t minted;
    if (current_value == 0 || existing_supply == 0) {
        minted = new_value;
    }
    else {
        // share of the post-deposit value contributed by this deposit
        BOOST_OUTCOME_TRY(
            auto const total, checked_add(current_value, new_value));
        BOOST_OUTCOME_TRY(
            auto const inflation,
            checked_mul_div(SCALE_FACTOR, new_value, total));
        BOOST_OUTCOME_TRY(
            auto const remaining, checked_sub(SCALE_FACTOR, inflation));
        BOOST_OUTCOME_TRY(
            auto const new_supply,
            checked_mul_div(existing_supply, SCALE_FACTOR, remaining));
        BOOST_OUTCOME_TRY(minted, checked_sub(new_supply, existing_supply));
    }
    if (RESTAKE_UNLIKELY(minted == 0)) {
        return VaultError::ZeroMintAmount;
    }
    return minted;
}

Result<uint256_t> PriceOracle::calculate_redeem_amount(
    uint256_t const &shares_burned, uint256_t const &total_supply,
    uint256_t const &current_value)
{
    BOOST_OUTCOME_TRY(
        auto const value,
        checked_mul_div(current_value, shares_burned, total_supply));
    if (RESTAKE_UNLIKELY(value == 0)) {
        return VaultError::ZeroRedeemAmount;
    }
    return value;
}

RESTAKE_VAULT_NAMESPACE_END
