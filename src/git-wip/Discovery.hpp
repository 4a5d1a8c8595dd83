//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#pragma once

#include <filesystem>
#include <stdexcept>
#include <vector>
#include "GitFacts.hpp"

class DiscoveryException : public std::runtime_error {
public:
    explicit DiscoveryException(const std::string &error) : std::runtime_error(error){}
};

/// Finds the bare repositories below a root and their worktrees.
///
/// The result is ordered by repository name and then branch name.  Repositories without
/// worktrees are kept so new worktrees can be added to them.  A repository that cannot be read
/// is logged and left out, it never aborts the scan of its siblings.
class Discovery {
public:
    explicit Discovery(GitFacts &facts);

    std::vector<RepositoryEntry> discover(const std::filesystem::path &root, int max_depth=2);

private:
    GitFacts &m_facts;
};
