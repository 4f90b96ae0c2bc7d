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

#include <restake/core/result.hpp>
#include <restake/ledger/ledger_error.hpp>
#include <restake/vault/util/vault_error.hpp>

#include <gtest/gtest.h>

using namespace restake;
using namespace restake::vault;

TEST(VaultError, classes)
{
    EXPECT_EQ(error_class(VaultError::Success), ErrorClass::None);
    EXPECT_EQ(error_class(VaultError::ZeroAmount), ErrorClass::InputError);
    EXPECT_EQ(
        error_class(VaultError::InvalidTokenDecimals), ErrorClass::InputError);
    EXPECT_EQ(error_class(VaultError::Reentrancy), ErrorClass::StateError);
    EXPECT_EQ(
        error_class(VaultError::UnsupportedSchemaVersion),
        ErrorClass::StateError);
    EXPECT_EQ(error_class(VaultError::EarlyClaim), ErrorClass::EconomicGuard);
    EXPECT_EQ(error_class(VaultError::OracleStale), ErrorClass::EconomicGuard);
    EXPECT_EQ(
        error_class(VaultError::NotAuthorized),
        ErrorClass::AuthorizationError);
}

TEST(VaultError, status_code)
{
    Result<void> const res = VaultError::MinOutNotMet;
    ASSERT_TRUE(res.has_error());
    EXPECT_STREQ(res.error().message().c_str(), "minimum output not met");
    EXPECT_STREQ(res.error().domain().name().c_str(), "Vault Error");
    EXPECT_EQ(res.assume_error(), VaultError::MinOutNotMet);
    EXPECT_NE(res.assume_error(), VaultError::Paused);
    // distinct domains never compare equal
    EXPECT_NE(res.assume_error(), LedgerError::InsufficientBalance);
}
