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

#include <restake/core/int.hpp>
#include <restake/ledger/checked_math.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace restake;
using namespace intx::literals;

TEST(CheckedMath, add)
{
    EXPECT_EQ(checked_add(1, 2).value(), 3);
    auto const res = checked_add(UINT256_MAX, 1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MathError::Overflow);
}

TEST(CheckedMath, sub)
{
    EXPECT_EQ(checked_sub(5, 2).value(), 3);
    auto const res = checked_sub(2, 5);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MathError::Underflow);
}

TEST(CheckedMath, mul_div_uses_wide_intermediate)
{
    // the product does not fit in 256 bits but the quotient does
    auto const res = checked_mul_div(UINT256_MAX, 10, 20);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), UINT256_MAX / 2);

    EXPECT_EQ(
        checked_mul_div(UINT256_MAX, 2, 1).assume_error(),
        MathError::Overflow);
    EXPECT_EQ(
        checked_mul_div(1, 2, 0).assume_error(), MathError::DivisionByZero);
}
