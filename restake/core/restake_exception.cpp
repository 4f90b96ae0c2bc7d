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

#include <restake/core/restake_exception.hpp>

#include <string>
#include <utility>

RESTAKE_NAMESPACE_BEGIN

RestakeException::RestakeException(
    std::string message, char const *const expr, char const *const function,
    char const *const file, long const line)
    : message_{std::move(message)}
    , expr_{expr}
    , function_{function}
    , file_{file}
    , line_{line}
{
}

char const *RestakeException::what() const noexcept
{
    return message_.c_str();
}

RESTAKE_NAMESPACE_END
