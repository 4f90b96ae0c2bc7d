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

#include <restake/core/config.hpp>
#include <restake/ledger/state.hpp>

#include <functional>
#include <type_traits>
#include <utility>

RESTAKE_NAMESPACE_BEGIN

/// Runs `f` inside a checkpoint of `state`. Everything `f` wrote is kept if
/// it returns a value and discarded if it returns an error or throws.
template <typename F>
auto transact(State &state, F &&f) -> std::invoke_result_t<F>
{
    state.push();
    try {
        auto result = std::invoke(std::forward<F>(f));
        if (result.has_error()) {
            state.pop_reject();
        }
        else {
            state.pop_accept();
        }
        return result;
    }
    catch (...) {
        state.pop_reject();
        throw;
    }
}

RESTAKE_NAMESPACE_END
