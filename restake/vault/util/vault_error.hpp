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

#include <restake/vault/config.hpp>

#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

RESTAKE_VAULT_NAMESPACE_BEGIN

enum class VaultError
{
    Success = 0,

    // input
    InvalidInput,
    ZeroAmount,
    ZeroAddress,
    InvalidBasisPoints,
    InvalidTokenDecimals,

    // state
    AlreadyRegistered,
    AssetNotFound,
    DelegateNotFound,
    OracleNotFound,
    AlreadyInitialized,
    NotInitialized,
    UnsupportedSchemaVersion,
    UnsupportedWithdrawAsset,
    WithdrawRequestNotFound,
    DelegateWithdrawalNotFound,
    NonZeroBalance,
    Reentrancy,
    Paused,

    // economic guards
    MaxTvlReached,
    MaxTokenTvlReached,
    OracleStale,
    InvalidPrice,
    ZeroMintAmount,
    ZeroRedeemAmount,
    InsufficientCollateral,
    InsufficientStaging,
    NoEligibleDelegate,
    EarlyClaim,
    QueuedWithdrawalNotFilled,
    InsufficientBuffer,
    BelowDrawdownFloor,
    MinOutNotMet,

    // authorization
    NotAuthorized,
};

enum class ErrorClass
{
    None = 0,
    InputError,
    StateError,
    EconomicGuard,
    AuthorizationError,
};

// How a caller can react: correct the input, correct the state, wait for
// conditions to change, or give up.
ErrorClass error_class(VaultError) noexcept;

RESTAKE_VAULT_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<restake::vault::VaultError>
    : quick_status_code_from_enum_defaults<restake::vault::VaultError>
{
    static constexpr auto const domain_name = "Vault Error";
    static constexpr auto const domain_uuid =
        "c7b3a1d4-92e0-4f6b-8a15-3e9d0b6f4c28";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
