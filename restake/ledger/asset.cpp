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

#include <restake/core/likely.h>
#include <restake/ledger/asset.hpp>
#include <restake/ledger/ledger_error.hpp>
#include <restake/ledger/state.hpp>
#include <restake/ledger/token_ledger.hpp>

#include <boost/outcome/success_failure.hpp>

RESTAKE_NAMESPACE_BEGIN

uint256_t
asset_balance(State &state, Address const &asset, Address const &holder)
{
    if (is_native(asset)) {
        return state.get_balance(holder);
    }
    return TokenLedger{state, asset}.balance_of(holder);
}

Result<void> transfer_asset(
    State &state, Address const &asset, Address const &from, Address const &to,
    uint256_t const &amount)
{
    if (!is_native(asset)) {
        return TokenLedger{state, asset}.transfer(from, to, amount);
    }
    if (RESTAKE_UNLIKELY(from == Address{} || to == Address{})) {
        return LedgerError::ZeroAddress;
    }
    if (RESTAKE_UNLIKELY(state.get_balance(from) < amount)) {
        return LedgerError::InsufficientBalance;
    }
    state.subtract_from_balance(from, amount);
    state.add_to_balance(to, amount);
    return outcome::success();
}

RESTAKE_NAMESPACE_END
