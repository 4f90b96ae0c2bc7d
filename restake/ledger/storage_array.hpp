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

#include <restake/core/assert.h>
#include <restake/ledger/storage_variable.hpp>

#include <intx/intx.hpp>

#include <cstdint>
#include <utility>

RESTAKE_NAMESPACE_BEGIN

/// Dynamic array in storage: the length lives at `slot`, element `i` starts
/// at `slot + 1 + i * N`.
template <typename T>
    requires std::has_unique_object_representations_v<T>
class StorageArray
{
    State &state_;
    Address address_;
    StorageVariable<u64_be> length_;
    uint256_t start_index_;

    static constexpr size_t SLOT_PER_ELEM = StorageVariable<T>::N;

public:
    StorageArray(State &state, Address const &address, bytes32_t const &slot)
        : state_{state}
        , address_{address}
        , length_{state, address, slot}
        , start_index_{intx::be::load<uint256_t>(slot) + 1}
    {
    }

    uint64_t length() const
    {
        return length_.load().native();
    }

    bool empty() const
    {
        return length() == 0;
    }

    StorageVariable<T> get(uint64_t const index) const
    {
        uint256_t const offset = start_index_ + index * SLOT_PER_ELEM;
        return StorageVariable<T>{state_, address_, offset};
    }

    void push(T const &value)
    {
        auto const len = length();
        get(len).store(value);
        length_.store(len + 1);
    }

    T pop()
    {
        uint64_t len = length();
        RESTAKE_ASSERT(len > 0);
        len = len - 1;
        auto var = get(len);
        T const value = var.load();
        var.clear();
        length_.store(len);
        return value;
    }

    // O(1) removal; the last element takes the place of `index`.
    T swap_remove(uint64_t const index)
    {
        auto const len = length();
        RESTAKE_ASSERT(index < len);
        T const value = get(index).load();
        T const last = pop();
        if (index != len - 1) {
            get(index).store(last);
        }
        return value;
    }

    // O(n) removal that keeps the relative order of the remaining elements.
    T erase(uint64_t const index)
    {
        auto const len = length();
        RESTAKE_ASSERT(index < len);
        T const value = get(index).load();
        for (uint64_t i = index + 1; i < len; ++i) {
            get(i - 1).store(get(i).load());
        }
        (void)pop();
        return value;
    }
};

RESTAKE_NAMESPACE_END
