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

#include <restake/core/address.hpp>
#include <restake/core/int.hpp>
#include <restake/ledger/asset.hpp>
#include <restake/vault/price_oracle.hpp>
#include <restake/vault/test_vault_fixture.hpp>
#include <restake/vault/util/constants.hpp>
#include <restake/vault/util/vault_error.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace restake;
using namespace restake::vault;
using namespace restake::test;

namespace
{
    constexpr auto OTHER_TOKEN{
        0x00000000000000000000000000000000000070c1_address};
    constexpr auto OTHER_FEED{
        0x000000000000000000000000000000000000fee1_address};
}

struct PriceOracleTest : public VaultTest
{
    PriceOracle oracle{state, env.collaborators};
};

TEST(PriceMath, bootstrap_mints_one_to_one)
{
    auto const minted =
        PriceOracle::calculate_mint_amount(0, 100 * ONE, 0);
    ASSERT_FALSE(minted.has_error());
    EXPECT_EQ(minted.value(), 100 * ONE);

    // either side empty counts as bootstrap
    EXPECT_EQ(
        PriceOracle::calculate_mint_amount(100 * ONE, 7 * ONE, 0).value(),
        7 * ONE);
    EXPECT_EQ(
        PriceOracle::calculate_mint_amount(0, 7 * ONE, 100 * ONE).value(),
        7 * ONE);

    auto const redeemed =
        PriceOracle::calculate_redeem_amount(100 * ONE, 100 * ONE, 100 * ONE);
    ASSERT_FALSE(redeemed.has_error());
    EXPECT_EQ(redeemed.value(), 100 * ONE);
}

TEST(PriceMath, second_deposit_at_par)
{
    // 100 value backing 100 shares, then 50 more value
    auto const minted =
        PriceOracle::calculate_mint_amount(100 * ONE, 50 * ONE, 100 * ONE);
    ASSERT_FALSE(minted.has_error());
    EXPECT_EQ(minted.value(), 49999999999999999925_u256);
    EXPECT_LE(50 * ONE - minted.value(), 100);
}

TEST(PriceMath, mint_is_homogeneous)
{
    auto const base =
        PriceOracle::calculate_mint_amount(100 * ONE, 50 * ONE, 100 * ONE)
            .value();
    auto const doubled =
        PriceOracle::calculate_mint_amount(200 * ONE, 100 * ONE, 200 * ONE)
            .value();
    EXPECT_EQ(doubled, 2 * base);

    // doubling the value against the same supply halves the mint
    auto const pricier =
        PriceOracle::calculate_mint_amount(200 * ONE, 100 * ONE, 100 * ONE)
            .value();
    EXPECT_LE(base - pricier, 100);
}

TEST(PriceMath, redeem_is_proportional)
{
    EXPECT_EQ(
        PriceOracle::calculate_redeem_amount(25 * ONE, 100 * ONE, 300 * ONE)
            .value(),
        75 * ONE);
}

TEST(PriceMath, zero_results_are_rejected)
{
    EXPECT_EQ(
        PriceOracle::calculate_mint_amount(
            1'000'000'000'000 * ONE * ONE, 1, 1)
            .assume_error(),
        VaultError::ZeroMintAmount);
    EXPECT_EQ(
        PriceOracle::calculate_redeem_amount(1, ONE, 1).assume_error(),
        VaultError::ZeroRedeemAmount);
}

TEST_F(PriceOracleTest, native_is_one_to_one)
{
    EXPECT_TRUE(oracle.has_feed(NATIVE_ASSET));
    EXPECT_EQ(oracle.lookup_value(NATIVE_ASSET, 3 * ONE).value(), 3 * ONE);
    EXPECT_EQ(
        oracle.lookup_amount_from_value(NATIVE_ASSET, 3 * ONE).value(),
        3 * ONE);
}

TEST_F(PriceOracleTest, lookup_uses_feed_price)
{
    env.price_feed.set_price(FEED, 2 * ONE, START_TIME);
    EXPECT_EQ(oracle.lookup_value(TOKEN, 3 * ONE).value(), 6 * ONE);
    EXPECT_EQ(oracle.lookup_amount_from_value(TOKEN, 6 * ONE).value(), 3 * ONE);
    EXPECT_EQ(oracle.feed_of(TOKEN).value(), FEED);
}

TEST_F(PriceOracleTest, stale_price)
{
    state.advance_time(MAX_PRICE_AGE);
    EXPECT_FALSE(oracle.lookup_value(TOKEN, ONE).has_error());

    state.advance_time(1);
    EXPECT_EQ(
        oracle.lookup_value(TOKEN, ONE).assume_error(),
        VaultError::OracleStale);
    EXPECT_EQ(
        oracle.lookup_amount_from_value(TOKEN, ONE).assume_error(),
        VaultError::OracleStale);
}

TEST_F(PriceOracleTest, non_positive_price)
{
    env.price_feed.set_price(FEED, 0, START_TIME);
    EXPECT_EQ(
        oracle.lookup_value(TOKEN, ONE).assume_error(),
        VaultError::InvalidPrice);

    env.price_feed.set_negative_price(FEED, ONE, START_TIME);
    EXPECT_EQ(
        oracle.lookup_value(TOKEN, ONE).assume_error(),
        VaultError::InvalidPrice);
}

TEST_F(PriceOracleTest, missing_feed)
{
    EXPECT_FALSE(oracle.has_feed(OTHER_TOKEN));
    EXPECT_EQ(
        oracle.lookup_value(OTHER_TOKEN, ONE).assume_error(),
        VaultError::OracleNotFound);
}

TEST_F(PriceOracleTest, set_oracle_address_checks)
{
    env.price_feed.set_price(OTHER_FEED, ONE, START_TIME, 8);

    EXPECT_EQ(
        oracle.set_oracle_address(ALICE, OTHER_TOKEN, OTHER_FEED)
            .assume_error(),
        VaultError::NotAuthorized);
    EXPECT_EQ(
        oracle.set_oracle_address(ADMIN, Address{}, OTHER_FEED).assume_error(),
        VaultError::ZeroAddress);
    EXPECT_EQ(
        oracle.set_oracle_address(ADMIN, NATIVE_ASSET, OTHER_FEED)
            .assume_error(),
        VaultError::InvalidInput);
    EXPECT_EQ(
        oracle.set_oracle_address(ADMIN, OTHER_TOKEN, OTHER_FEED)
            .assume_error(),
        VaultError::InvalidTokenDecimals);

    env.price_feed.set_price(OTHER_FEED, ONE, START_TIME);
    ASSERT_FALSE(
        oracle.set_oracle_address(ADMIN, OTHER_TOKEN, OTHER_FEED).has_error());
    EXPECT_EQ(oracle.feed_of(OTHER_TOKEN).value(), OTHER_FEED);
}
