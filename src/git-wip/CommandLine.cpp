//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#include <utility>
#include <vector>
#include "CommandLine.hpp"

static const std::vector<std::pair<std::string, std::string>> kFilterFlags = {
        {"dirty", "Show only worktrees with unstaged changes"},
        {"clean", "Show only clean worktrees"},
        {"staged", "Show only worktrees with staged changes"},
        {"missing", "Show only worktrees whose directory is gone"},
        {"ahead", "Show only branches ahead of their upstream"},
        {"behind", "Show only branches behind their upstream"},
        {"diverged", "Show only branches diverged from their upstream"},
        {"not-pushed", "Show only branches whose upstream does not exist"},
        {"not-tracking", "Show only branches without an upstream"},
        {"up-to-date", "Show only branches level with their upstream"},
        {"merged", "Show only branches merged into the primary branch"},
        {"not-merged", "Show only branches not merged into the primary branch"},
        {"active", "Show only branches with commits in the last 7 days"},
        {"needs-attention", "Show only dirty, staged, diverged or unpushed branches"},
        {"stale", "Show only clean branches without commits for 30 days"},
        {"prune-candidates", "Show only clean merged branches older than 7 days"},
};

CommandLine::CommandLine(CLI::App &app) : m_root(config.root.string()) {
    app.require_subcommand(0, 1);
    // Subcommands inherit this, so global options may follow them.
    app.fallthrough();

    app.add_option("-p,--path", m_root, "Directory to search for repositories")->envname("GWM_REPOS_PATH");
    app.add_option("--depth", config.depth, "How many directory levels to search")->capture_default_str();
    app.add_option("-j,--jobs", config.jobs, "Worker threads, 0 for one per CPU")->capture_default_str();
    app.add_option("--log-level", config.log_level, "trace, debug, info, warn or error")->envname("GIT_WIP_LOG_LEVEL");
    app.add_flag("--no-color", m_no_color, "Disable coloured output");
    app.add_flag("-v,--verbose", m_verbose, "Log debug details");
    app.add_flag("-q,--quiet", m_quiet, "Only log errors");

    for(const auto &flag : kFilterFlags) {
        m_flags[flag.first] = false;
        app.add_flag("--" + flag.first, m_flags[flag.first], flag.second)->group("Filters");
    }
    app.add_option("--older-than", m_older_than, "Last commit older than an age (30, 2w, 3m) or date")->group("Filters");
    app.add_option("--newer-than", m_newer_than, "Last commit newer than an age (30, 2w, 3m) or date")->group("Filters");
    app.add_flag("-a,--all", config.show_primary, "Include the primary branch worktrees");

    app.add_subcommand("list", "Show work in progress worktrees (default)");

    m_add = app.add_subcommand("add", "Create a worktree for a new branch");
    m_add->add_option("repository", repository, "Repository name")->required();
    m_add->add_option("branch", branch, "Branch to create")->required();
    m_add->add_option("-b,--base-branch", m_base, "Branch to start from, defaults to the primary branch");
    m_add->add_flag("--reuse", add_options.reuse, "Check out the branch if it already exists");
    m_add->add_flag("--dry-run", add_options.dry_run, "Only show what would be created");

    m_remove = app.add_subcommand("remove", "Remove a worktree");
    m_remove->add_option("repository", repository, "Repository name")->required();
    m_remove->add_option("branch", branch, "Branch of the worktree")->required();
    m_remove->add_flag("-f,--force", remove_options.force, "Remove even with uncommitted changes");
    m_remove->add_flag("--dry-run", remove_options.dry_run, "Only show what would be removed");

    m_cleanup = app.add_subcommand("cleanup", "Remove clean worktrees merged into the primary branch");
    m_cleanup->add_flag("--allow-unpushed", cleanup_options.allow_unpushed,
                        "Also remove branches with commits missing from their upstream");
    m_cleanup->add_flag("--dry-run", cleanup_options.dry_run, "Only show what would be removed");

    m_path = app.add_subcommand("path", "Print the directory of a worktree");
    m_path->add_option("repository", repository, "Repository name")->required();
    m_path->add_option("branch", branch, "Branch of the worktree")->required();
}

void CommandLine::finish() {
    config.root = m_root;
    config.color = !m_no_color;
    if(m_verbose) {
        config.log_level = "debug";
    } else if(m_quiet) {
        config.log_level = "error";
    }
    if(!m_base.empty()) {
        add_options.base = m_base;
    }
}

Command CommandLine::command() const {
    if(m_add->parsed()) {
        return Command::ADD;
    }
    if(m_remove->parsed()) {
        return Command::REMOVE;
    }
    if(m_cleanup->parsed()) {
        return Command::CLEANUP;
    }
    if(m_path->parsed()) {
        return Command::PATH;
    }
    return Command::LIST;
}

void CommandLine::applyFilters(FilterSet &filters) const {
    for(const auto &flag : m_flags) {
        if(flag.second) {
            filters.add(*filterFromName(flag.first));
        }
    }
    if(!m_older_than.empty()) {
        filters.olderThan(m_older_than);
    }
    if(!m_newer_than.empty()) {
        filters.newerThan(m_newer_than);
    }
}
