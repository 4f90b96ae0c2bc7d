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
#include <restake/vault/config.hpp>

#include <intx/intx.hpp>

#include <cstdint>

RESTAKE_VAULT_NAMESPACE_BEGIN

using namespace intx::literals;

// Fixed-point unit for prices and the mint formula
inline constexpr uint256_t SCALE_FACTOR{1000000000000000000_u256};

inline constexpr uint64_t BASIS_POINTS{10'000};

// A price older than this is stale. One day plus a minute of slack for the
// feed's heartbeat.
inline constexpr uint64_t MAX_PRICE_AGE{86'400 + 60};

// Price feeds and collateral amounts are normalized to this many decimals
inline constexpr uint8_t REQUIRED_DECIMALS{18};

// Native stake leaves the staging area in units of one validator deposit
inline constexpr uint256_t VALIDATOR_DEPOSIT{32 * SCALE_FACTOR};

inline constexpr uint64_t DEFAULT_COOLDOWN_PERIOD{7 * 86'400};

inline constexpr uint64_t DEFAULT_DRAWDOWN_BPS{5'000};
inline constexpr uint64_t DEFAULT_MIN_FEE_BPS{10};
inline constexpr uint64_t DEFAULT_MAX_FEE_BPS{100};

inline constexpr uint64_t SCHEMA_V1{1};
inline constexpr uint64_t SCHEMA_V2{2};
inline constexpr uint64_t CURRENT_SCHEMA_VERSION{SCHEMA_V2};

// Component addresses. Each component owns the storage under its address.
inline constexpr Address ACCOUNTING_CA{0x2000};
inline constexpr Address ORACLE_CA{0x2001};
inline constexpr Address WITHDRAW_QUEUE_CA{0x2002};
inline constexpr Address INSTANT_WITHDRAWER_CA{0x2003};
inline constexpr Address STAGING_CA{0x2004};
inline constexpr Address SHARE_TOKEN_CA{0x2005};

static_assert(DEFAULT_MIN_FEE_BPS <= DEFAULT_MAX_FEE_BPS);
static_assert(DEFAULT_MAX_FEE_BPS <= BASIS_POINTS);
static_assert(DEFAULT_DRAWDOWN_BPS <= BASIS_POINTS);

RESTAKE_VAULT_NAMESPACE_END
