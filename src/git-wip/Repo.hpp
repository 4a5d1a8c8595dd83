//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <git2/types.h>
#include <git2/oid.h>

class GitException : public std::runtime_error {
public:
    explicit GitException(const std::string &error) : std::runtime_error(error){}
};

/// Throws a GitException built from `what` and libgit2's last error when `error` is negative.
void checkGit(int error, const std::string &what);

/// Keeps libgit2 initialized for the lifetime of the object.  libgit2 reference counts the
/// init/shutdown pairs so nesting these is fine.
class LibGit {
public:
    LibGit();
    ~LibGit();
    LibGit(const LibGit &) = delete;
    LibGit &operator=(const LibGit &) = delete;
};

/// Owning handle around a git_repository opened at an exact path (no parent directory search).
class Repo {
public:
    explicit Repo(const std::filesystem::path &path);
    ~Repo();
    Repo(const Repo &) = delete;
    Repo &operator=(const Repo &) = delete;

    git_repository *get() const { return m_repo; }

    bool isBare() const;
    std::filesystem::path commonDir() const;

    std::vector<std::string> worktreeNames() const;

    std::optional<git_oid> lookupRef(const std::string &ref_name) const;
    std::optional<std::string> configString(const std::string &key) const;

private:
    LibGit m_lib;
    git_repository * m_repo = NULL;
    std::filesystem::path m_path;
};

std::string oidToString(const git_oid &oid);
git_oid oidFromString(const std::string &hex);
