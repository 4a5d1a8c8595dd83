//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#pragma once

#include <filesystem>
#include "GitFacts.hpp"
#include "WorktreeStatus.hpp"

class LocalInspector {
public:
    explicit LocalInspector(GitFacts &facts);

    /// Missing when the directory is gone, Unknown when it could not be inspected.
    LocalStatus inspect(const std::filesystem::path &worktree);

    static LocalStatus classify(const DiffState &state);

private:
    GitFacts &m_facts;
};
