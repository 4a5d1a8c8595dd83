//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/// Hex commit id.
using CommitId = std::string;

struct WorktreeEntry {
    std::string name;
    std::string branch;
    std::filesystem::path path;
    bool exists = false;
};

struct RepositoryEntry {
    std::string name;
    std::filesystem::path path;
    std::vector<WorktreeEntry> worktrees;
};

struct DiffState {
    bool staged = false;
    bool unstaged = false;
};

struct AheadBehind {
    size_t ahead = 0;
    size_t behind = 0;
};

/// Source of version control facts.  The status engine only ever asks questions through this
/// interface so it can run against real repositories (LibGitFacts) or synthetic data in tests.
///
/// Repositories are identified by the directory holding the bare `.git` directory.  Failures
/// are reported by throwing (GitException for the libgit2 implementation).
class GitFacts {
public:
    virtual ~GitFacts() = default;

    /// Directories under `root`, at most `max_depth` levels down, that hold a bare repository.
    virtual std::vector<std::filesystem::path> findRepositories(const std::filesystem::path &root,
                                                                int max_depth) = 0;

    virtual std::vector<WorktreeEntry> listWorktrees(const std::filesystem::path &repo) = 0;

    /// std::nullopt when the worktree directory does not exist.
    virtual std::optional<DiffState> localDiffState(const std::filesystem::path &worktree) = 0;

    virtual std::optional<CommitId> resolveBranch(const std::filesystem::path &repo, const std::string &branch) = 0;

    /// Name of the configured upstream reference, std::nullopt when the branch tracks nothing.
    virtual std::optional<std::string> resolveUpstream(const std::filesystem::path &repo,
                                                       const std::string &branch) = 0;

    virtual std::optional<CommitId> resolveRef(const std::filesystem::path &repo, const std::string &ref_name) = 0;

    virtual AheadBehind aheadBehind(const std::filesystem::path &repo, const CommitId &local,
                                    const CommitId &upstream) = 0;

    /// True when `ancestor` is reachable from `descendant` or both are the same commit.
    virtual bool isAncestor(const std::filesystem::path &repo, const CommitId &ancestor,
                            const CommitId &descendant) = 0;

    /// Committer time in seconds since the epoch.
    virtual std::int64_t commitTime(const std::filesystem::path &repo, const CommitId &commit) = 0;

    virtual std::string primaryBranch(const std::filesystem::path &repo) = 0;

    virtual bool branchExists(const std::filesystem::path &repo, const std::string &branch) = 0;

    /// Resolves `base` as a local branch, then as `origin/<base>`.
    virtual std::optional<CommitId> resolveBase(const std::filesystem::path &repo, const std::string &base) = 0;

    /// Creates `worktree.branch` at `base` (or reuses the existing branch when `reuse` is set) and checks it out
    /// at `worktree.path`.
    virtual void createWorktree(const std::filesystem::path &repo, const WorktreeEntry &worktree,
                                const CommitId &base, bool reuse) = 0;

    /// Removes the working directory, when present, and the worktree registration.
    virtual void removeWorktree(const std::filesystem::path &repo, const WorktreeEntry &worktree) = 0;
};
