//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#include <spdlog/spdlog.h>
#include "LocalInspector.hpp"

LocalInspector::LocalInspector(GitFacts &facts) : m_facts(facts) {
}

LocalStatus LocalInspector::inspect(const std::filesystem::path &worktree) {
    std::optional<DiffState> state;
    try {
        state = m_facts.localDiffState(worktree);
    }
    catch(const std::exception &e) {
        spdlog::warn("unable to inspect {}: {}", worktree.string(), e.what());
        return LocalStatus::UNKNOWN;
    }
    if(!state) {
        return LocalStatus::MISSING;
    }
    return classify(*state);
}

LocalStatus LocalInspector::classify(const DiffState &state) {
    if(state.staged) {
        return LocalStatus::STAGED;
    }
    if(state.unstaged) {
        return LocalStatus::DIRTY;
    }
    return LocalStatus::CLEAN;
}
