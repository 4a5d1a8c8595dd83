//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#include <git2/status.h>
#include "Repo.hpp"
#include "Status.hpp"

Status::Status(git_repository *repo) {
    git_status_options options = GIT_STATUS_OPTIONS_INIT;
    options.flags |= GIT_STATUS_OPT_INCLUDE_UNTRACKED | GIT_STATUS_OPT_RENAMES_HEAD_TO_INDEX |
                     GIT_STATUS_OPT_EXCLUDE_SUBMODULES;
    checkGit(git_status_list_new(&m_status, repo, &options), "unable to read worktree status");
}

Status::~Status() {
    git_status_list_free(m_status);
}

bool Status::hasStaged() const {
    return anyEntry(GIT_STATUS_INDEX_NEW | GIT_STATUS_INDEX_MODIFIED | GIT_STATUS_INDEX_DELETED |
                    GIT_STATUS_INDEX_RENAMED | GIT_STATUS_INDEX_TYPECHANGE);
}

bool Status::hasUnstaged() const {
    return anyEntry(GIT_STATUS_WT_NEW | GIT_STATUS_WT_MODIFIED | GIT_STATUS_WT_DELETED |
                    GIT_STATUS_WT_RENAMED | GIT_STATUS_WT_TYPECHANGE | GIT_STATUS_CONFLICTED);
}

bool Status::anyEntry(unsigned int group_status) const {
    auto num_entries = git_status_list_entrycount(m_status);
    for(decltype(num_entries) i=0; i < num_entries; i++) {
        const git_status_entry *entry = git_status_byindex(m_status, i);
        if (entry->status & group_status) {
            return true;
        }
    }
    return false;
}
