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
#include <restake/core/likely.h>
#include <restake/core/result.hpp>
#include <restake/ledger/state.hpp>
#include <restake/ledger/storage_variable.hpp>
#include <restake/vault/config.hpp>
#include <restake/vault/util/vault_error.hpp>

#include <optional>
#include <utility>

RESTAKE_VAULT_NAMESPACE_BEGIN

/// Storage-backed mutex for one component. The flag is written to the host
/// ledger, so a nested call through any external component observes it.
class ReentrancyGuard
{
    StorageVariable<bool> flag_;

public:
    class Lock
    {
        std::optional<StorageVariable<bool>> flag_;

    public:
        explicit Lock(StorageVariable<bool> const &flag)
            : flag_{flag}
        {
            flag_->store(true);
        }

        Lock(Lock &&other) noexcept
            : flag_{std::exchange(other.flag_, std::nullopt)}
        {
        }

        Lock(Lock const &) = delete;
        Lock &operator=(Lock const &) = delete;
        Lock &operator=(Lock &&) = delete;

        ~Lock()
        {
            if (flag_.has_value()) {
                flag_->clear();
            }
        }
    };

    ReentrancyGuard(State &state, Address const &component, bytes32_t slot)
        : flag_{state, component, slot}
    {
    }

    bool locked() const
    {
        return flag_.load_checked().has_value();
    }

    Result<Lock> acquire()
    {
        if (RESTAKE_UNLIKELY(locked())) {
            return VaultError::Reentrancy;
        }
        return Lock{flag_};
    }
};

RESTAKE_VAULT_NAMESPACE_END
