//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#include <spdlog/spdlog.h>
#include "RemoteAnalyzer.hpp"

RemoteAnalyzer::RemoteAnalyzer(GitFacts &facts) : m_facts(facts) {
}

RemoteStatus RemoteAnalyzer::analyze(const std::filesystem::path &repo, const std::string &branch) {
    std::optional<CommitId> local_tip;
    try {
        local_tip = m_facts.resolveBranch(repo, branch);
    }
    catch(const std::exception &e) {
        spdlog::warn("unable to resolve branch {} in {}: {}", branch, repo.string(), e.what());
        return RemoteStatus::unknown();
    }
    if(!local_tip) {
        return RemoteStatus::unknown();
    }
    return analyze(repo, branch, *local_tip);
}

RemoteStatus RemoteAnalyzer::analyze(const std::filesystem::path &repo, const std::string &branch,
                                     const CommitId &local_tip) {
    try {
        auto upstream = m_facts.resolveUpstream(repo, branch);
        if(!upstream) {
            return RemoteStatus::notTracking();
        }
        auto upstream_tip = m_facts.resolveRef(repo, *upstream);
        if(!upstream_tip) {
            return RemoteStatus::notPushed();
        }
        auto counts = m_facts.aheadBehind(repo, local_tip, *upstream_tip);
        return RemoteStatus::fromCounts(counts.ahead, counts.behind);
    }
    catch(const std::exception &e) {
        spdlog::warn("unable to compare {} in {} with its upstream: {}", branch, repo.string(), e.what());
        return RemoteStatus::unknown();
    }
}
