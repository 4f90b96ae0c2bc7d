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
#include <restake/ledger/abi_encode.hpp>
#include <restake/ledger/abi_signatures.hpp>
#include <restake/ledger/checked_math.hpp>
#include <restake/ledger/events.hpp>
#include <restake/ledger/state.hpp>
#include <restake/ledger/token_ledger.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <bit>

RESTAKE_NAMESPACE_BEGIN

TokenLedger::TokenLedger(State &state, Address const &token)
    : state_{state}
    , token_{token}
{
}

StorageVariable<u256_be> TokenLedger::total_supply_var() const
{
    return {state_, token_, AddressTotalSupply};
}

StorageVariable<u256_be> TokenLedger::balance_var(Address const &owner) const
{
    struct
    {
        uint8_t ns;
        Address address;
        uint8_t slots[11];
    } key{.ns = NSBalance, .address = owner, .slots = {}};

    return {state_, token_, std::bit_cast<bytes32_t>(key)};
}

void TokenLedger::emit_transfer_event(
    Address const &from, Address const &to, uint256_t const &amount)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("Transfer(address,address,uint256)");

    auto const event = EventBuilder(token_, signature)
                           .add_topic(abi_encode_address(from))
                           .add_topic(abi_encode_address(to))
                           .add_data(abi_encode_uint(u256_be{amount}))
                           .build();
    state_.store_log(event);
}

uint256_t TokenLedger::total_supply() const
{
    return total_supply_var().load().native();
}

uint256_t TokenLedger::balance_of(Address const &owner) const
{
    return balance_var(owner).load().native();
}

Result<void> TokenLedger::mint(Address const &to, uint256_t const &amount)
{
    if (RESTAKE_UNLIKELY(to == Address{})) {
        return LedgerError::ZeroAddress;
    }
    auto supply_var = total_supply_var();
    auto const supply = checked_add(supply_var.load().native(), amount);
    if (RESTAKE_UNLIKELY(supply.has_error())) {
        return LedgerError::SupplyOverflow;
    }
    // a balance never exceeds the supply, so it cannot overflow either
    auto balance_var_to = balance_var(to);
    balance_var_to.store(balance_var_to.load().native() + amount);
    supply_var.store(supply.value());

    emit_transfer_event(Address{}, to, amount);
    return outcome::success();
}

Result<void> TokenLedger::burn(Address const &from, uint256_t const &amount)
{
    if (RESTAKE_UNLIKELY(from == Address{})) {
        return LedgerError::ZeroAddress;
    }
    auto balance_var_from = balance_var(from);
    auto const balance = balance_var_from.load().native();
    if (RESTAKE_UNLIKELY(balance < amount)) {
        return LedgerError::InsufficientBalance;
    }
    balance_var_from.store(balance - amount);
    auto supply_var = total_supply_var();
    supply_var.store(supply_var.load().native() - amount);

    emit_transfer_event(from, Address{}, amount);
    return outcome::success();
}

Result<void> TokenLedger::transfer(
    Address const &from, Address const &to, uint256_t const &amount)
{
    if (RESTAKE_UNLIKELY(from == Address{} || to == Address{})) {
        return LedgerError::ZeroAddress;
    }
    auto balance_var_from = balance_var(from);
    auto const balance = balance_var_from.load().native();
    if (RESTAKE_UNLIKELY(balance < amount)) {
        return LedgerError::InsufficientBalance;
    }
    if (from != to) {
        balance_var_from.store(balance - amount);
        auto balance_var_to = balance_var(to);
        balance_var_to.store(balance_var_to.load().native() + amount);
    }

    emit_transfer_event(from, to, amount);
    return outcome::success();
}

RESTAKE_NAMESPACE_END
