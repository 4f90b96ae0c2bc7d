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
#include <restake/core/int.hpp>
#include <restake/core/result.hpp>
#include <restake/ledger/state.hpp>
#include <restake/sim/deployment.hpp>
#include <restake/sim/sim_collaborators.hpp>
#include <restake/vault/vault.hpp>

#include <cstddef>
#include <vector>

RESTAKE_NAMESPACE_BEGIN

namespace sim
{
    struct BufferReport
    {
        Address asset;
        uint256_t target;
        uint256_t held;
        uint256_t claim_reserve;
        uint256_t available;
        uint256_t queue_deficit;
        uint256_t buffer_deficit;
    };

    struct Report
    {
        uint256_t total_value;
        uint256_t total_shares;
        // native value of one whole share, 18 decimals; zero without shares
        uint256_t share_price;
        std::vector<uint256_t> delegate_totals;
        std::vector<BufferReport> buffers;
    };

    /// A deployment brought up on a fresh host ledger. Setup failures throw
    /// RestakeException; actions report through Result like any host call.
    class Simulation
    {
        Deployment deployment_;
        State state_;
        Environment env_;
        vault::Vault vault_;

        void setup();

    public:
        explicit Simulation(Deployment);

        State &state()
        {
            return state_;
        }

        Environment &environment()
        {
            return env_;
        }

        vault::Vault &vault()
        {
            return vault_;
        }

        // Value is the action's main output: shares, request index, payout
        // or amount; zero for actions without one
        Result<uint256_t> apply(Action const &);

        // Runs the deployment's actions in order and returns how many
        // outcomes differed from their expectation
        size_t replay();

        Result<Report> report();

        void log_report(Report const &);
    };
}

RESTAKE_NAMESPACE_END
