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

#include <evmc/evmc.hpp>

#include <cstddef>
#include <functional>

RESTAKE_NAMESPACE_BEGIN

using Address = ::evmc::address;

using namespace evmc::literals;

static_assert(sizeof(Address) == 20);
static_assert(alignof(Address) == 1);

RESTAKE_NAMESPACE_END
