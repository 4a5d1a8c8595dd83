//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#pragma once

#include <filesystem>
#include <string>
#include "GitFacts.hpp"
#include "WorktreeStatus.hpp"

/// Compares a local branch with its upstream using the locally cached remote tracking refs.
class RemoteAnalyzer {
public:
    explicit RemoteAnalyzer(GitFacts &facts);

    RemoteStatus analyze(const std::filesystem::path &repo, const std::string &branch);

    /// Same as analyze() with the local tip already resolved.
    RemoteStatus analyze(const std::filesystem::path &repo, const std::string &branch, const CommitId &local_tip);

private:
    GitFacts &m_facts;
};
