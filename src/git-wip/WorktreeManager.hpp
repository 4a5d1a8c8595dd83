//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "GitFacts.hpp"

/// A mutation refused or failed for one worktree.  Never retried.
class WorktreeException : public std::runtime_error {
public:
    WorktreeException(const std::string &repository, const std::string &branch, const std::string &error)
        : std::runtime_error(repository + "/" + branch + ": " + error), m_repository(repository), m_branch(branch){}

    const std::string &repository() const { return m_repository; }
    const std::string &branch() const { return m_branch; }

private:
    std::string m_repository;
    std::string m_branch;
};

class AlreadyExistsException : public WorktreeException {
public:
    using WorktreeException::WorktreeException;
};

class UnsafeRemovalException : public WorktreeException {
public:
    using WorktreeException::WorktreeException;
};

class NotFoundException : public WorktreeException {
public:
    using WorktreeException::WorktreeException;
};

enum class ActionKind {ADD, REMOVE};

/// What a mutation did, or with dry run what it would have done.
struct WorktreeAction {
    ActionKind kind = ActionKind::ADD;
    std::string repository;
    std::string branch;
    std::filesystem::path path;
    std::string base;
    bool performed = false;

    std::string describe() const;
};

struct AddOptions {
    std::optional<std::string> base;
    bool reuse = false;
    bool dry_run = false;
};

struct RemoveOptions {
    bool force = false;
    bool dry_run = false;
};

struct CleanupOptions {
    bool allow_unpushed = false;
    bool dry_run = false;
};

struct CleanupEntry {
    std::string repository;
    std::string branch;
    std::string reason;
};

struct CleanupReport {
    std::vector<WorktreeAction> removed;
    std::vector<CleanupEntry> skipped;
    std::vector<CleanupEntry> failed;
};

/// Add, remove and cleanup of worktrees.
///
/// Every operation rediscovers the repositories under the root before acting and holds a
/// process wide lock while it runs, so two mutations never race inside the same bare repository.
class WorktreeManager {
public:
    WorktreeManager(GitFacts &facts, std::filesystem::path root, int max_depth=2, size_t jobs=0);

    /// Checks out `branch` at `<repository>/<branch>`, branching from `base` or the primary branch.
    WorktreeAction add(const std::string &repository, const std::string &branch, const AddOptions &options = {});

    /// Refuses dirty, staged or uninspectable worktrees unless forced.  Missing worktrees only
    /// lose their registration.
    WorktreeAction remove(const std::string &repository, const std::string &branch,
                          const RemoveOptions &options = {});

    /// Removes every clean worktree whose branch is merged into the primary branch.  Branches
    /// with commits missing from their upstream are kept unless `allow_unpushed` is set.
    CleanupReport cleanup(const CleanupOptions &options = {});

    std::filesystem::path path(const std::string &repository, const std::string &branch);

    static std::string worktreeName(const std::string &branch);

private:
    static std::mutex s_mutex;

    GitFacts &m_facts;
    std::filesystem::path m_root;
    int m_max_depth;
    size_t m_jobs;

    RepositoryEntry findRepository(const std::string &repository, const std::string &branch);
    WorktreeEntry findWorktree(const RepositoryEntry &repository, const std::string &branch);
};
