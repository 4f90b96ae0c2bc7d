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
#include <restake/core/likely.h>

#include <exception>
#include <string>

RESTAKE_NAMESPACE_BEGIN

/// Exception for `RESTAKE_THROW` failures. Raised only by the host side
/// (deployment loading, scenario replay), never by protocol entry points,
/// which report failures through `Result`.
class RestakeException : public std::exception
{
public:
    RestakeException(
        std::string message, char const *expr, char const *function,
        char const *file, long line);

    char const *what() const noexcept override;

    char const *expr() const noexcept
    {
        return expr_;
    }

    char const *function() const noexcept
    {
        return function_;
    }

    char const *file() const noexcept
    {
        return file_;
    }

    long line() const noexcept
    {
        return line_;
    }

private:
    std::string message_;
    char const *expr_;
    char const *function_;
    char const *file_;
    long line_;
};

RESTAKE_NAMESPACE_END

/// Given `bool expr` and a message convertible to `std::string`, throw
/// `restake::RestakeException` iff `expr` evaluates to `false`.
#define RESTAKE_THROW(expr, message)                                           \
    if (RESTAKE_LIKELY(expr)) { /* likeliest */                                \
    }                                                                          \
    else {                                                                     \
        throw ::restake::RestakeException{                                     \
            (message),                                                         \
            #expr,                                                             \
            __extension__ __PRETTY_FUNCTION__,                                 \
            __FILE__,                                                          \
            __LINE__};                                                         \
    }
