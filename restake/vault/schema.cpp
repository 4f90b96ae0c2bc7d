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

#include <restake/core/fmt/address_fmt.hpp> // NOLINT
#include <restake/core/fmt/int_fmt.hpp> // NOLINT
#include <restake/core/likely.h>
#include <restake/ledger/state.hpp>
#include <restake/vault/accounting_core.hpp>
#include <restake/vault/instant_withdrawer.hpp>
#include <restake/vault/schema.hpp>
#include <restake/vault/util/constants.hpp>
#include <restake/vault/util/vault_error.hpp>
#include <restake/vault/withdrawal_queue.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

RESTAKE_VAULT_ANONYMOUS_NAMESPACE_BEGIN

InstantWithdrawConfig default_instant_config(Address const &fee_destination)
{
    return InstantWithdrawConfig{
        .drawdown_bps = DEFAULT_DRAWDOWN_BPS,
        .min_fee_bps = DEFAULT_MIN_FEE_BPS,
        .max_fee_bps = DEFAULT_MAX_FEE_BPS,
        .fee_destination = fee_destination};
}

Result<void>
require_admin(Collaborators const &collab, Address const &caller)
{
    if (RESTAKE_UNLIKELY(!collab.access.has_role(caller, Role::Admin))) {
        return VaultError::NotAuthorized;
    }
    return outcome::success();
}

RESTAKE_VAULT_ANONYMOUS_NAMESPACE_END

RESTAKE_VAULT_NAMESPACE_BEGIN

ProtocolConfig default_protocol_config(Address const &fee_destination)
{
    return ProtocolConfig{
        .cooldown_period = DEFAULT_COOLDOWN_PERIOD,
        .max_total_value = 0,
        .instant = default_instant_config(fee_destination)};
}

uint64_t schema_version(State &state, Collaborators const &collab)
{
    AccountingCore const core{state, collab};
    return core.vars.schema_version.load().native();
}

Result<void> initialize(
    State &state, Collaborators const &collab, Address const &caller,
    ProtocolConfig const &config)
{
    BOOST_OUTCOME_TRY(require_admin(collab, caller));
    AccountingCore core{state, collab};
    if (RESTAKE_UNLIKELY(core.vars.schema_version.load().native() != 0)) {
        return VaultError::AlreadyInitialized;
    }
    BOOST_OUTCOME_TRY(InstantWithdrawer::validate(config.instant));

    WithdrawalQueue queue{state, collab};
    InstantWithdrawer instant{state, collab};
    queue.vars.cooldown_period.store(config.cooldown_period);
    core.vars.max_total_value.store(config.max_total_value);
    instant.vars.config.store(config.instant);
    core.vars.schema_version.store(CURRENT_SCHEMA_VERSION);

    LOG_INFO(
        "initialized at schema v{}: cooldown {}s, max total value {}",
        CURRENT_SCHEMA_VERSION,
        config.cooldown_period,
        config.max_total_value);
    return outcome::success();
}

Result<uint64_t> migrate(
    State &state, Collaborators const &collab, Address const &caller,
    Address const &fee_destination)
{
    BOOST_OUTCOME_TRY(require_admin(collab, caller));
    AccountingCore core{state, collab};
    auto const version = core.vars.schema_version.load().native();
    if (RESTAKE_UNLIKELY(version == 0)) {
        return VaultError::NotInitialized;
    }
    if (RESTAKE_UNLIKELY(version > CURRENT_SCHEMA_VERSION)) {
        return VaultError::UnsupportedSchemaVersion;
    }
    if (version == CURRENT_SCHEMA_VERSION) {
        return version;
    }

    // v1 -> v2: queue counters start at zero without a write
    InstantWithdrawer instant{state, collab};
    if (!instant.vars.config.load_checked().has_value()) {
        auto const config = default_instant_config(fee_destination);
        BOOST_OUTCOME_TRY(InstantWithdrawer::validate(config));
        instant.vars.config.store(config);
        LOG_INFO("instant withdraw fees go to {}", fee_destination);
    }
    core.vars.schema_version.store(SCHEMA_V2);

    LOG_INFO("migrated schema v{} -> v{}", version, SCHEMA_V2);
    return SCHEMA_V2;
}

Result<void>
require_current_schema(State &state, Collaborators const &collab)
{
    auto const version = schema_version(state, collab);
    if (RESTAKE_UNLIKELY(version == 0)) {
        return VaultError::NotInitialized;
    }
    if (RESTAKE_UNLIKELY(version != CURRENT_SCHEMA_VERSION)) {
        return VaultError::UnsupportedSchemaVersion;
    }
    return outcome::success();
}

RESTAKE_VAULT_NAMESPACE_END
