//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#pragma once

#include <filesystem>
#include <vector>
#include "Filter.hpp"
#include "GitFacts.hpp"
#include "WorktreeStatus.hpp"

/// Computes WorktreeStatus records for discovered worktrees on a bounded worker pool.
///
/// Workers share nothing but the (stateless) GitFacts; each one fills its own slot of the
/// result, so the output keeps discovery order however the work was scheduled.
class StatusCollector {
public:
    /// `jobs` of 0 uses one worker per hardware thread.
    StatusCollector(GitFacts &facts, size_t jobs=0);

    std::vector<WorktreeStatus> collect(const std::vector<RepositoryEntry> &repositories);

    /// Discovers, computes and filters in one go.
    std::vector<WorktreeStatus> collect(const std::filesystem::path &root, int max_depth, const FilterSet &filters);

    /// Status of a single worktree.  Never throws, failures show up as unknown values.
    WorktreeStatus statusOf(const RepositoryEntry &repository, const WorktreeEntry &worktree);

    size_t jobs() const { return m_jobs; }

private:
    GitFacts &m_facts;
    size_t m_jobs;
};
