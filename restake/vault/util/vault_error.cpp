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

#include <restake/core/assert.h>
#include <restake/vault/util/vault_error.hpp>

#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

RESTAKE_VAULT_NAMESPACE_BEGIN

ErrorClass error_class(VaultError const e) noexcept
{
    switch (e) {
    case VaultError::Success:
        return ErrorClass::None;
    case VaultError::InvalidInput:
    case VaultError::ZeroAmount:
    case VaultError::ZeroAddress:
    case VaultError::InvalidBasisPoints:
    case VaultError::InvalidTokenDecimals:
        return ErrorClass::InputError;
    case VaultError::AlreadyRegistered:
    case VaultError::AssetNotFound:
    case VaultError::DelegateNotFound:
    case VaultError::OracleNotFound:
    case VaultError::AlreadyInitialized:
    case VaultError::NotInitialized:
    case VaultError::UnsupportedSchemaVersion:
    case VaultError::UnsupportedWithdrawAsset:
    case VaultError::WithdrawRequestNotFound:
    case VaultError::DelegateWithdrawalNotFound:
    case VaultError::NonZeroBalance:
    case VaultError::Reentrancy:
    case VaultError::Paused:
        return ErrorClass::StateError;
    case VaultError::MaxTvlReached:
    case VaultError::MaxTokenTvlReached:
    case VaultError::OracleStale:
    case VaultError::InvalidPrice:
    case VaultError::ZeroMintAmount:
    case VaultError::ZeroRedeemAmount:
    case VaultError::InsufficientCollateral:
    case VaultError::InsufficientStaging:
    case VaultError::NoEligibleDelegate:
    case VaultError::EarlyClaim:
    case VaultError::QueuedWithdrawalNotFilled:
    case VaultError::InsufficientBuffer:
    case VaultError::BelowDrawdownFloor:
    case VaultError::MinOutNotMet:
        return ErrorClass::EconomicGuard;
    case VaultError::NotAuthorized:
        return ErrorClass::AuthorizationError;
    }
    RESTAKE_ABORT("unknown vault error");
}

RESTAKE_VAULT_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<restake::vault::VaultError>::mapping> const &
quick_status_code_from_enum<restake::vault::VaultError>::value_mappings()
{
    using restake::vault::VaultError;

    static std::initializer_list<mapping> const v = {
        {VaultError::Success, "success", {errc::success}},
        {VaultError::InvalidInput, "invalid input", {}},
        {VaultError::ZeroAmount, "zero amount", {}},
        {VaultError::ZeroAddress, "zero address", {}},
        {VaultError::InvalidBasisPoints, "invalid basis points", {}},
        {VaultError::InvalidTokenDecimals, "invalid token decimals", {}},
        {VaultError::AlreadyRegistered, "already registered", {}},
        {VaultError::AssetNotFound, "asset not found", {}},
        {VaultError::DelegateNotFound, "delegate not found", {}},
        {VaultError::OracleNotFound, "oracle not found", {}},
        {VaultError::AlreadyInitialized, "already initialized", {}},
        {VaultError::NotInitialized, "not initialized", {}},
        {VaultError::UnsupportedSchemaVersion,
         "unsupported schema version",
         {}},
        {VaultError::UnsupportedWithdrawAsset,
         "unsupported withdraw asset",
         {}},
        {VaultError::WithdrawRequestNotFound,
         "withdraw request not found",
         {}},
        {VaultError::DelegateWithdrawalNotFound,
         "delegate withdrawal not found",
         {}},
        {VaultError::NonZeroBalance, "non-zero balance", {}},
        {VaultError::Reentrancy, "reentrant call", {}},
        {VaultError::Paused, "paused", {}},
        {VaultError::MaxTvlReached, "max total value reached", {}},
        {VaultError::MaxTokenTvlReached, "max token value reached", {}},
        {VaultError::OracleStale, "oracle price is stale", {}},
        {VaultError::InvalidPrice, "invalid price", {}},
        {VaultError::ZeroMintAmount, "zero mint amount", {}},
        {VaultError::ZeroRedeemAmount, "zero redeem amount", {}},
        {VaultError::InsufficientCollateral, "insufficient collateral", {}},
        {VaultError::InsufficientStaging, "insufficient staging balance", {}},
        {VaultError::NoEligibleDelegate, "no eligible delegate", {}},
        {VaultError::EarlyClaim, "claim before cooldown", {}},
        {VaultError::QueuedWithdrawalNotFilled,
         "queued withdrawal not filled",
         {}},
        {VaultError::InsufficientBuffer, "insufficient buffer", {}},
        {VaultError::BelowDrawdownFloor, "below drawdown floor", {}},
        {VaultError::MinOutNotMet, "minimum output not met", {}},
        {VaultError::NotAuthorized, "not authorized", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
