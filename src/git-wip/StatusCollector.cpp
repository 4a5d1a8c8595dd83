//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#include <algorithm>
#include <thread>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>
#include "Discovery.hpp"
#include "LocalInspector.hpp"
#include "RemoteAnalyzer.hpp"
#include "StatusCollector.hpp"

StatusCollector::StatusCollector(GitFacts &facts, size_t jobs) : m_facts(facts), m_jobs(jobs) {
    if(m_jobs == 0) {
        m_jobs = std::max(1u, std::thread::hardware_concurrency());
    }
}

std::vector<WorktreeStatus> StatusCollector::collect(const std::vector<RepositoryEntry> &repositories) {
    std::vector<std::pair<const RepositoryEntry *, const WorktreeEntry *>> work;
    for(const auto &repository : repositories) {
        for(const auto &worktree : repository.worktrees) {
            work.emplace_back(&repository, &worktree);
        }
    }

    std::vector<WorktreeStatus> results(work.size());
    boost::asio::thread_pool pool(std::min(m_jobs, std::max<size_t>(work.size(), 1)));
    for(size_t i = 0; i < work.size(); i++) {
        boost::asio::post(pool, [this, &work, &results, i]() {
            results[i] = statusOf(*work[i].first, *work[i].second);
        });
    }
    pool.join();
    return results;
}

std::vector<WorktreeStatus> StatusCollector::collect(const std::filesystem::path &root, int max_depth,
                                                     const FilterSet &filters) {
    auto repositories = Discovery(m_facts).discover(root, max_depth);
    auto statuses = collect(repositories);

    std::vector<WorktreeStatus> matching;
    for(auto &status : statuses) {
        if(filters.matches(status)) {
            matching.push_back(std::move(status));
        }
    }
    return matching;
}

WorktreeStatus StatusCollector::statusOf(const RepositoryEntry &repository, const WorktreeEntry &worktree) {
    WorktreeStatus status;
    status.repository = repository.name;
    status.repository_path = repository.path;
    status.worktree = worktree.name;
    status.branch = worktree.branch;
    status.path = worktree.path;

    status.local = LocalInspector(m_facts).inspect(worktree.path);

    std::optional<CommitId> tip;
    try {
        tip = m_facts.resolveBranch(repository.path, worktree.branch);
    }
    catch(const std::exception &e) {
        spdlog::warn("unable to resolve {}: {}", status.displayName(), e.what());
    }
    if(!tip) {
        return status;
    }

    status.remote = RemoteAnalyzer(m_facts).analyze(repository.path, worktree.branch, *tip);

    try {
        status.last_activity = m_facts.commitTime(repository.path, *tip);
    }
    catch(const std::exception &e) {
        spdlog::warn("unable to read last commit of {}: {}", status.displayName(), e.what());
    }

    try {
        auto primary = m_facts.primaryBranch(repository.path);
        status.primary = primary == worktree.branch;
        auto primary_tip = m_facts.resolveBranch(repository.path, primary);
        if(primary_tip) {
            status.merge = m_facts.isAncestor(repository.path, *tip, *primary_tip) ? MergeStatus::MERGED
                                                                                   : MergeStatus::NOT_MERGED;
        }
    }
    catch(const std::exception &e) {
        spdlog::warn("unable to check whether {} is merged: {}", status.displayName(), e.what());
    }
    return status;
}
