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
#include <restake/core/likely.h>
#include <restake/ledger/state.hpp>

#include <limits>
#include <vector>

RESTAKE_NAMESPACE_BEGIN

State::State(uint64_t const timestamp)
    : timestamp_{timestamp}
{
}

AccountState const *State::recent_account_state(Address const &address) const
{
    auto const it = current_.find(address);
    if (it == current_.end()) {
        return nullptr;
    }
    return &it->second.recent();
}

AccountState &State::current_account_state(Address const &address)
{
    auto it = current_.find(address);
    if (RESTAKE_UNLIKELY(it == current_.end())) {
        it = current_.try_emplace(address, AccountState{}, version_).first;
    }
    return it->second.current(version_);
}

void State::push()
{
    ++version_;
}

void State::pop_accept()
{
    RESTAKE_ASSERT(version_);

    for (auto &it : current_) {
        it.second.pop_accept(version_);
    }

    logs_.pop_accept(version_);

    --version_;
}

void State::pop_reject()
{
    RESTAKE_ASSERT(version_);

    std::vector<Address> removals;

    for (auto &it : current_) {
        if (it.second.pop_reject(version_)) {
            removals.push_back(it.first);
        }
    }

    logs_.pop_reject(version_);

    while (removals.size()) {
        current_.erase(removals.back());
        removals.pop_back();
    }

    --version_;
}

uint256_t State::get_balance(Address const &address) const
{
    auto const *const account_state = recent_account_state(address);
    return account_state ? account_state->balance_ : uint256_t{0};
}

bytes32_t
State::get_storage(Address const &address, bytes32_t const &key) const
{
    auto const *const account_state = recent_account_state(address);
    return account_state ? account_state->get_storage(key) : bytes32_t{};
}

void State::add_to_balance(Address const &address, uint256_t const &delta)
{
    auto &account_state = current_account_state(address);

    RESTAKE_ASSERT(
        std::numeric_limits<uint256_t>::max() - delta >=
            account_state.balance_,
        "balance overflow");

    account_state.balance_ += delta;
}

void State::subtract_from_balance(
    Address const &address, uint256_t const &delta)
{
    auto &account_state = current_account_state(address);

    RESTAKE_ASSERT(delta <= account_state.balance_, "balance underflow");

    account_state.balance_ -= delta;
}

void State::set_storage(
    Address const &address, bytes32_t const &key, bytes32_t const &value)
{
    current_account_state(address).set_storage(key, value);
}

std::vector<Log> const &State::logs() const
{
    return logs_.recent();
}

void State::store_log(Log const &log)
{
    auto &logs = logs_.current(version_);
    logs.push_back(log);
}

void State::set_timestamp(uint64_t const timestamp)
{
    timestamp_ = timestamp;
}

void State::advance_time(uint64_t const seconds)
{
    RESTAKE_ASSERT(
        std::numeric_limits<uint64_t>::max() - seconds >= timestamp_,
        "clock overflow");
    timestamp_ += seconds;
}

RESTAKE_NAMESPACE_END
