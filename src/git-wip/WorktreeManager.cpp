//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#include <algorithm>
#include <spdlog/spdlog.h>
#include "Discovery.hpp"
#include "LocalInspector.hpp"
#include "StatusCollector.hpp"
#include "WorktreeManager.hpp"

namespace fs = std::filesystem;

std::mutex WorktreeManager::s_mutex;

std::string WorktreeAction::describe() const {
    std::string verb = kind == ActionKind::ADD ? "create" : "remove";
    std::string message = (performed ? verb + "d" : "would " + verb) + " worktree " + repository + "/" + branch;
    if(!path.empty()) {
        message += " at " + path.string();
    }
    if(kind == ActionKind::ADD && !base.empty()) {
        message += " from " + base;
    }
    return message;
}

WorktreeManager::WorktreeManager(GitFacts &facts, std::filesystem::path root, int max_depth, size_t jobs)
    : m_facts(facts), m_root(std::move(root)), m_max_depth(max_depth), m_jobs(jobs) {
}

std::string WorktreeManager::worktreeName(const std::string &branch) {
    auto name = branch;
    std::replace(name.begin(), name.end(), '/', '-');
    return name;
}

RepositoryEntry WorktreeManager::findRepository(const std::string &repository, const std::string &branch) {
    for(auto &entry : Discovery(m_facts).discover(m_root, m_max_depth)) {
        if(entry.name == repository) {
            return entry;
        }
    }
    throw NotFoundException(repository, branch, "no repository named '" + repository + "' under " + m_root.string());
}

WorktreeEntry WorktreeManager::findWorktree(const RepositoryEntry &repository, const std::string &branch) {
    for(const auto &worktree : repository.worktrees) {
        if(worktree.branch == branch) {
            return worktree;
        }
    }
    throw NotFoundException(repository.name, branch, "no worktree for branch '" + branch + "'");
}

WorktreeAction WorktreeManager::add(const std::string &repository, const std::string &branch,
                                    const AddOptions &options) {
    std::lock_guard<std::mutex> lock(s_mutex);

    auto target = findRepository(repository, branch);
    for(const auto &worktree : target.worktrees) {
        if(worktree.branch == branch) {
            throw AlreadyExistsException(repository, branch, "worktree already exists at " + worktree.path.string());
        }
    }

    WorktreeAction action;
    action.kind = ActionKind::ADD;
    action.repository = repository;
    action.branch = branch;
    action.path = target.path / branch;

    std::error_code error;
    if(fs::exists(action.path, error)) {
        throw AlreadyExistsException(repository, branch, "target directory " + action.path.string() + " already exists");
    }

    CommitId base_tip;
    bool branch_exists = false;
    try {
        action.base = options.base ? *options.base : m_facts.primaryBranch(target.path);
        branch_exists = m_facts.branchExists(target.path, branch);
        if(!branch_exists) {
            auto tip = m_facts.resolveBase(target.path, action.base);
            if(!tip) {
                throw NotFoundException(repository, branch, "base branch '" + action.base +
                                                            "' not found locally or on origin");
            }
            base_tip = *tip;
        }
    }
    catch(const WorktreeException &) {
        throw;
    }
    catch(const std::exception &e) {
        throw WorktreeException(repository, branch, e.what());
    }

    if(branch_exists) {
        if(!options.reuse) {
            throw AlreadyExistsException(repository, branch, "branch already exists, reuse it to check it out");
        }
        action.base = branch;
    }

    if(options.dry_run) {
        spdlog::debug("dry run: {}", action.describe());
        return action;
    }

    WorktreeEntry worktree;
    worktree.name = worktreeName(branch);
    worktree.branch = branch;
    worktree.path = action.path;
    try {
        m_facts.createWorktree(target.path, worktree, base_tip, branch_exists);
    }
    catch(const std::exception &e) {
        throw WorktreeException(repository, branch, e.what());
    }
    action.performed = true;
    spdlog::info("{}", action.describe());
    return action;
}

WorktreeAction WorktreeManager::remove(const std::string &repository, const std::string &branch,
                                       const RemoveOptions &options) {
    std::lock_guard<std::mutex> lock(s_mutex);

    auto target = findRepository(repository, branch);
    auto worktree = findWorktree(target, branch);

    auto local = LocalInspector(m_facts).inspect(worktree.path);
    if(!options.force) {
        if(local == LocalStatus::DIRTY || local == LocalStatus::STAGED) {
            throw UnsafeRemovalException(repository, branch, "worktree has uncommitted changes");
        }
        if(local == LocalStatus::UNKNOWN) {
            throw UnsafeRemovalException(repository, branch, "worktree could not be inspected");
        }
    }

    WorktreeAction action;
    action.kind = ActionKind::REMOVE;
    action.repository = repository;
    action.branch = branch;
    action.path = worktree.path;

    if(options.dry_run) {
        spdlog::debug("dry run: {}", action.describe());
        return action;
    }

    try {
        m_facts.removeWorktree(target.path, worktree);
    }
    catch(const std::exception &e) {
        throw WorktreeException(repository, branch, e.what());
    }
    action.performed = true;
    spdlog::info("{}", action.describe());
    return action;
}

static std::optional<std::string> cleanupRefusal(const WorktreeStatus &status, bool allow_unpushed) {
    if(status.primary) {
        return "primary branch";
    }
    switch(status.local) {
        case LocalStatus::CLEAN:
            break;
        case LocalStatus::DIRTY:
        case LocalStatus::STAGED:
            return "has uncommitted changes";
        case LocalStatus::MISSING:
            return "worktree directory is missing";
        case LocalStatus::UNKNOWN:
            return "local status unknown";
    }
    switch(status.merge) {
        case MergeStatus::MERGED:
            break;
        case MergeStatus::NOT_MERGED:
            return "not merged into the primary branch";
        case MergeStatus::UNKNOWN:
            return "merge status unknown";
    }
    if(!allow_unpushed) {
        auto remote = status.remote.kind();
        if(remote == RemoteKind::NOT_PUSHED || remote == RemoteKind::AHEAD) {
            return "has unpushed commits";
        }
    }
    return std::nullopt;
}

CleanupReport WorktreeManager::cleanup(const CleanupOptions &options) {
    std::lock_guard<std::mutex> lock(s_mutex);

    auto repositories = Discovery(m_facts).discover(m_root, m_max_depth);
    auto statuses = StatusCollector(m_facts, m_jobs).collect(repositories);

    CleanupReport report;
    for(const auto &status : statuses) {
        if(auto reason = cleanupRefusal(status, options.allow_unpushed)) {
            report.skipped.push_back({status.repository, status.branch, *reason});
            continue;
        }

        WorktreeAction action;
        action.kind = ActionKind::REMOVE;
        action.repository = status.repository;
        action.branch = status.branch;
        action.path = status.path;
        if(!options.dry_run) {
            WorktreeEntry worktree;
            worktree.name = status.worktree;
            worktree.branch = status.branch;
            worktree.path = status.path;
            worktree.exists = true;
            try {
                m_facts.removeWorktree(status.repository_path, worktree);
            }
            catch(const std::exception &e) {
                spdlog::error("unable to remove {}: {}", status.displayName(), e.what());
                report.failed.push_back({status.repository, status.branch, e.what()});
                continue;
            }
            action.performed = true;
            spdlog::info("{}", action.describe());
        }
        report.removed.push_back(action);
    }
    return report;
}

std::filesystem::path WorktreeManager::path(const std::string &repository, const std::string &branch) {
    auto target = findRepository(repository, branch);
    return findWorktree(target, branch).path;
}
