//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#pragma once

#include <map>
#include <string>
#include <CLI/CLI.hpp>
#include "Config.hpp"
#include "Filter.hpp"
#include "WorktreeManager.hpp"

enum class Command {LIST, ADD, REMOVE, CLEANUP, PATH};

/// The options of every command, bound to a `CLI::App`.
///
/// Listing is the default, so its filters live on the top level and `list` is only an
/// explicit spelling of it.  Top level options are also accepted after a subcommand.
class CommandLine {
public:
    explicit CommandLine(CLI::App &app);
    CommandLine(const CommandLine &) = delete;
    CommandLine &operator=(const CommandLine &) = delete;

    /// Call once the app has parsed, folds the shorthand flags into the config.
    void finish();

    Command command() const;

    /// Adds the requested filters to `filters`, throws AgeParseException on a bad age.
    void applyFilters(FilterSet &filters) const;

    Config config;
    std::string repository;
    std::string branch;
    AddOptions add_options;
    RemoveOptions remove_options;
    CleanupOptions cleanup_options;

private:
    std::string m_root;
    bool m_no_color = false;
    bool m_verbose = false;
    bool m_quiet = false;
    std::map<std::string, bool> m_flags;
    std::string m_older_than;
    std::string m_newer_than;
    std::string m_base;

    CLI::App * m_add = nullptr;
    CLI::App * m_remove = nullptr;
    CLI::App * m_cleanup = nullptr;
    CLI::App * m_path = nullptr;
};
