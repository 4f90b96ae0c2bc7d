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
#include <restake/core/result.hpp>

RESTAKE_NAMESPACE_BEGIN

class State;

// Placeholder asset id for the chain's native currency. Native amounts are
// held as host balances; every other asset id is a token address.
inline constexpr Address NATIVE_ASSET{
    0xeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeee_address};

constexpr bool is_native(Address const &asset) noexcept
{
    return asset == NATIVE_ASSET;
}

uint256_t
asset_balance(State &, Address const &asset, Address const &holder);

Result<void> transfer_asset(
    State &, Address const &asset, Address const &from, Address const &to,
    uint256_t const &amount);

RESTAKE_NAMESPACE_END
