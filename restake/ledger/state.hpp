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
#include <restake/core/bytes.hpp>
#include <restake/core/config.hpp>
#include <restake/core/int.hpp>
#include <restake/ledger/account_state.hpp>
#include <restake/ledger/log.hpp>
#include <restake/ledger/version_stack.hpp>

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <vector>

RESTAKE_NAMESPACE_BEGIN

/// In-process host ledger. Holds per-address native balances and storage,
/// the event log and the host clock. Every mutation is recorded against the
/// innermost open checkpoint (`push`) and is either folded into the
/// enclosing one (`pop_accept`) or discarded (`pop_reject`).
class State
{
    template <typename K, typename V>
    using Map = ankerl::unordered_dense::segmented_map<K, V>;

    Map<Address, VersionStack<AccountState>> current_{};

    VersionStack<std::vector<Log>> logs_{{}};

    unsigned version_{0};

    uint64_t timestamp_{0};

    AccountState const *recent_account_state(Address const &) const;

    AccountState &current_account_state(Address const &);

public:
    explicit State(uint64_t timestamp = 0);

    State(State &&) = delete;
    State(State const &) = delete;
    State &operator=(State &&) = delete;
    State &operator=(State const &) = delete;

    void push();

    void pop_accept();

    void pop_reject();

    unsigned version() const
    {
        return version_;
    }

    ////////////////////////////////////////

    uint256_t get_balance(Address const &) const;

    bytes32_t get_storage(Address const &, bytes32_t const &key) const;

    ////////////////////////////////////////

    void add_to_balance(Address const &, uint256_t const &delta);

    void subtract_from_balance(Address const &, uint256_t const &delta);

    void set_storage(
        Address const &, bytes32_t const &key, bytes32_t const &value);

    ////////////////////////////////////////

    std::vector<Log> const &logs() const;

    void store_log(Log const &);

    ////////////////////////////////////////

    // The clock is owned by the host and is not part of any checkpoint.
    uint64_t timestamp() const
    {
        return timestamp_;
    }

    void set_timestamp(uint64_t timestamp);

    void advance_time(uint64_t seconds);
};

RESTAKE_NAMESPACE_END
