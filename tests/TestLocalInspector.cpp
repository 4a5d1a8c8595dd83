//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include <catch2/catch.hpp>
#include <sstream>
#include <LocalInspector.hpp>
#include "FakeWorkspace.hpp"

TEST_CASE("Staged changes win over unstaged ones") {
    REQUIRE(LocalInspector::classify(DiffState{false, false}) == LocalStatus::CLEAN);
    REQUIRE(LocalInspector::classify(DiffState{false, true}) == LocalStatus::DIRTY);
    REQUIRE(LocalInspector::classify(DiffState{true, false}) == LocalStatus::STAGED);
    REQUIRE(LocalInspector::classify(DiffState{true, true}) == LocalStatus::STAGED);
}

TEST_CASE_METHOD(FakeWorkspace, "Inspect worktrees through their diff state") {
    m_facts.addRepository("repo");
    m_facts.addWorktree("repo", "clean");
    m_facts.addWorktree("repo", "dirty");
    m_facts.addWorktree("repo", "staged");
    m_facts.setDiff("repo", "dirty", false, true);
    m_facts.setDiff("repo", "staged", true, true);

    auto inspector = LocalInspector(m_facts);
    REQUIRE(inspector.inspect(m_facts.repoPath("repo") / "clean") == LocalStatus::CLEAN);
    REQUIRE(inspector.inspect(m_facts.repoPath("repo") / "dirty") == LocalStatus::DIRTY);
    REQUIRE(inspector.inspect(m_facts.repoPath("repo") / "staged") == LocalStatus::STAGED);
}

TEST_CASE_METHOD(FakeWorkspace, "Missing directory is missing, not an error") {
    m_facts.addRepository("repo");
    m_facts.addWorktree("repo", "gone");
    m_facts.setMissing("repo", "gone");
    REQUIRE(LocalInspector(m_facts).inspect(m_facts.repoPath("repo") / "gone") == LocalStatus::MISSING);
}

TEST_CASE_METHOD(FakeWorkspace, "Unreadable worktree is unknown") {
    m_facts.addRepository("repo");
    m_facts.addWorktree("repo", "broken");
    m_facts.breakInspection("repo", "broken");
    REQUIRE(LocalInspector(m_facts).inspect(m_facts.repoPath("repo") / "broken") == LocalStatus::UNKNOWN);
}

TEST_CASE("Local status names") {
    std::stringstream stream;
    stream << LocalStatus::STAGED << " " << LocalStatus::MISSING;
    REQUIRE(stream.str() == "staged missing");
    REQUIRE(toString(LocalStatus::UNKNOWN) == "unknown");
    REQUIRE(toString(MergeStatus::NOT_MERGED) == "not merged");
}
