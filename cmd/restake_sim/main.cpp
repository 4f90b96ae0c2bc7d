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

#include <restake/core/log_level_map.hpp>
#include <restake/core/restake_exception.hpp>
#include <restake/sim/deployment.hpp>
#include <restake/sim/simulation.hpp>

#include <CLI/CLI.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <cstdlib>
#include <exception>
#include <filesystem>

using namespace restake;
namespace fs = std::filesystem;

int main(int const argc, char const *argv[])
{
    CLI::App cli{"restake-sim"};
    cli.option_defaults()->always_capture_default();

    fs::path deployment_path;
    auto log_level = quill::LogLevel::Info;
    bool no_report = false;

    cli.add_option(
           "--deployment",
           deployment_path,
           "deployment file describing assets, delegates, accounts and the "
           "actions to replay")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));
    cli.add_flag(
        "--no-report", no_report, "skip the report after the last action");

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(time) %(file_name):%(line_number) LOG_%(log_level)\t%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    try {
        sim::Simulation simulation{sim::load_deployment(deployment_path)};
        LOG_INFO("replaying {}", deployment_path.string());

        auto const mismatches = simulation.replay();
        if (!no_report) {
            auto const report = simulation.report();
            if (report.has_error()) {
                LOG_ERROR(
                    "report failed: {}",
                    report.assume_error().message().c_str());
                return EXIT_FAILURE;
            }
            simulation.log_report(report.value());
        }
        if (mismatches != 0) {
            LOG_ERROR("{} actions did not behave as expected", mismatches);
            return EXIT_FAILURE;
        }
    }
    catch (RestakeException const &e) {
        LOG_ERROR("{} ({}:{})", e.what(), e.file(), e.line());
        return EXIT_FAILURE;
    }
    catch (std::exception const &e) {
        LOG_ERROR("{}", e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
