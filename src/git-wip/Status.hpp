//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#pragma once

#include <git2/types.h>
#include <git2/status.h>

/// Index and working directory changes of one checked out worktree.
class Status {
public:
    Status(git_repository * repo);
    ~Status();
    Status(const Status &) = delete;
    Status &operator=(const Status &) = delete;

    /// Changes between HEAD and the index.
    bool hasStaged() const;

    /// Changes between the index and the working directory, untracked files and conflicts.
    bool hasUnstaged() const;

private:
    git_status_list *m_status = NULL;

    bool anyEntry(unsigned int group_status) const;
};
