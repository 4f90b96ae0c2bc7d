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
#include <restake/ledger/big_endian.hpp>
#include <restake/ledger/state.hpp>
#include <restake/ledger/storage_array.hpp>
#include <restake/ledger/storage_variable.hpp>
#include <restake/vault/config.hpp>

#include <bit>
#include <cstdint>
#include <optional>
#include <vector>

RESTAKE_VAULT_NAMESPACE_BEGIN

/// Insertion-ordered set of addresses in storage. The list keeps iteration
/// deterministic and the index mapping (stored as index + 1, so zero means
/// absent) makes membership O(1).
class AddressRegistry
{
    State &state_;
    Address owner_;
    uint8_t index_ns_;
    StorageArray<Address> list_;

    // mapping (address => uint64) index + 1
    StorageVariable<u64_be> index_var(Address const &address) const
    {
        struct
        {
            uint8_t ns;
            Address address;
            uint8_t slots[11];
        } key{.ns = index_ns_, .address = address, .slots = {}};

        return {state_, owner_, std::bit_cast<bytes32_t>(key)};
    }

public:
    AddressRegistry(
        State &state, Address const &owner, bytes32_t const &list_slot,
        uint8_t const index_ns)
        : state_{state}
        , owner_{owner}
        , index_ns_{index_ns}
        , list_{state, owner, list_slot}
    {
    }

    uint64_t size() const
    {
        return list_.length();
    }

    Address at(uint64_t const index) const
    {
        return list_.get(index).load();
    }

    std::optional<uint64_t> index_of(Address const &address) const
    {
        auto const stored = index_var(address).load().native();
        if (stored == 0) {
            return std::nullopt;
        }
        return stored - 1;
    }

    bool contains(Address const &address) const
    {
        return index_of(address).has_value();
    }

    std::vector<Address> addresses() const
    {
        std::vector<Address> out;
        auto const n = size();
        out.reserve(n);
        for (uint64_t i = 0; i < n; ++i) {
            out.push_back(at(i));
        }
        return out;
    }

    // Returns false if already present
    bool add(Address const &address)
    {
        if (contains(address)) {
            return false;
        }
        list_.push(address);
        index_var(address).store(list_.length());
        return true;
    }

    // Returns false if absent. Later entries shift down by one, keeping
    // their relative order.
    bool remove(Address const &address)
    {
        auto const index = index_of(address);
        if (!index.has_value()) {
            return false;
        }
        (void)list_.erase(*index);
        index_var(address).clear();
        auto const n = size();
        for (uint64_t i = *index; i < n; ++i) {
            index_var(at(i)).store(i + 1);
        }
        return true;
    }
};

RESTAKE_VAULT_NAMESPACE_END
