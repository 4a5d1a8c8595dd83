//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#pragma once

#include "GitFacts.hpp"
#include "Repo.hpp"

/// GitFacts read straight from the repositories on disk with libgit2.
///
/// Every call opens its own repository handle, so one instance may be shared by the status
/// workers without locking.  Repository paths are the directories holding a bare `.git`.
class LibGitFacts : public GitFacts {
public:
    LibGitFacts() = default;

    std::vector<std::filesystem::path> findRepositories(const std::filesystem::path &root, int max_depth) override;
    std::vector<WorktreeEntry> listWorktrees(const std::filesystem::path &repo) override;
    std::optional<DiffState> localDiffState(const std::filesystem::path &worktree) override;
    std::optional<CommitId> resolveBranch(const std::filesystem::path &repo, const std::string &branch) override;
    std::optional<std::string> resolveUpstream(const std::filesystem::path &repo, const std::string &branch) override;
    std::optional<CommitId> resolveRef(const std::filesystem::path &repo, const std::string &ref_name) override;
    AheadBehind aheadBehind(const std::filesystem::path &repo, const CommitId &local,
                            const CommitId &upstream) override;
    bool isAncestor(const std::filesystem::path &repo, const CommitId &ancestor,
                    const CommitId &descendant) override;
    std::int64_t commitTime(const std::filesystem::path &repo, const CommitId &commit) override;
    std::string primaryBranch(const std::filesystem::path &repo) override;
    bool branchExists(const std::filesystem::path &repo, const std::string &branch) override;
    std::optional<CommitId> resolveBase(const std::filesystem::path &repo, const std::string &base) override;
    void createWorktree(const std::filesystem::path &repo, const WorktreeEntry &worktree, const CommitId &base,
                        bool reuse) override;
    void removeWorktree(const std::filesystem::path &repo, const WorktreeEntry &worktree) override;

    static bool isBareRepository(const std::filesystem::path &dir);

private:
    LibGit m_lib;

    static std::filesystem::path gitDir(const std::filesystem::path &repo);
    static std::optional<std::string> worktreeBranch(const Repo &bare, const std::string &name);
};
