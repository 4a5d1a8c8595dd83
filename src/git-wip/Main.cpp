//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#include <algorithm>
#include <iostream>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include "CommandLine.hpp"
#include "Filter.hpp"
#include "LibGitFacts.hpp"
#include "Report.hpp"
#include "StatusCollector.hpp"
#include "WorktreeManager.hpp"

static int list(const CommandLine &command_line) {
    const auto &config = command_line.config;
    auto filters = FilterSet::atCurrentTime();
    command_line.applyFilters(filters);

    LibGitFacts facts;
    auto statuses = StatusCollector(facts, config.jobs).collect(config.searchRoot(), config.depth, filters);
    if(!config.show_primary) {
        statuses.erase(std::remove_if(statuses.begin(), statuses.end(),
                                      [](const WorktreeStatus &status) { return status.primary; }),
                       statuses.end());
    }

    if(statuses.empty()) {
        std::cout << (filters.empty() ? "No work in progress found.\n" : "No branches match the specified filters.\n");
        return 0;
    }

    auto colorize = config.color ? Colorize::COLORIZE : Colorize::NO_COLORIZE;
    Report(statuses, filters.now()).toStream(std::cout, colorize);
    if(!filters.empty()) {
        std::cout << "Filters applied: " << filters.describe() << "\n";
    }
    return 0;
}

static void printCleanup(const CleanupReport &report, bool dry_run) {
    for(const auto &action : report.removed) {
        std::cout << action.describe() << "\n";
    }
    for(const auto &skipped : report.skipped) {
        spdlog::debug("keeping {}/{}: {}", skipped.repository, skipped.branch, skipped.reason);
    }
    for(const auto &failed : report.failed) {
        std::cerr << "failed to remove " << failed.repository << "/" << failed.branch << ": " << failed.reason << "\n";
    }
    if(report.removed.empty()) {
        std::cout << "No worktrees found matching cleanup criteria.\n";
    } else if(dry_run) {
        std::cout << "Dry run: would clean up " << report.removed.size() << " worktree(s)\n";
    } else {
        std::cout << "Cleaned up " << report.removed.size() << " worktree(s)\n";
    }
}

int main(int argc, const char ** argv)
{
    CLI::App app{"Work in progress across bare repositories and their worktrees"};
    CommandLine command_line(app);

    CLI11_PARSE(app, argc, argv);

    command_line.finish();
    const auto &config = command_line.config;
    setupLogging(config.log_level);

    try {
        LibGitFacts facts;
        WorktreeManager manager(facts, config.searchRoot(), config.depth, config.jobs);
        const auto &repository = command_line.repository;
        const auto &branch = command_line.branch;

        switch(command_line.command()) {
            case Command::ADD:
                std::cout << manager.add(repository, branch, command_line.add_options).describe() << "\n";
                break;
            case Command::REMOVE:
                std::cout << manager.remove(repository, branch, command_line.remove_options).describe() << "\n";
                break;
            case Command::CLEANUP: {
                auto report = manager.cleanup(command_line.cleanup_options);
                printCleanup(report, command_line.cleanup_options.dry_run);
                return report.failed.empty() ? 0 : 1;
            }
            case Command::PATH:
                std::cout << manager.path(repository, branch).string() << "\n";
                break;
            case Command::LIST:
                return list(command_line);
        }
    }
    catch(const std::exception &e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
