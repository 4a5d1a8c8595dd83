//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#pragma once

#include <map>
#include <vector>
#include "WorktreeStatus.hpp"

/// Counts over an already filtered list of worktrees.
struct Summary {
    size_t total = 0;
    size_t repositories = 0;
    std::map<LocalStatus, size_t> local;
    std::map<RemoteKind, size_t> remote;

    size_t count(LocalStatus status) const;
    size_t count(RemoteKind kind) const;

    static Summary of(const std::vector<WorktreeStatus> &statuses);
};
