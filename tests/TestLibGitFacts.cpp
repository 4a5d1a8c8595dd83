//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include <algorithm>
#include <fstream>
#include <catch2/catch.hpp>
#include <Discovery.hpp>
#include <LibGitFacts.hpp>
#include <RemoteAnalyzer.hpp>
#include <StatusCollector.hpp>
#include <WorktreeManager.hpp>
#include "RepoBuilder.hpp"
#include "TempDirectory.hpp"

namespace fs = std::filesystem;

class BareRepo {
public:
    BareRepo() : m_dir(TempDirectory::ForCurrentTest()), m_builder(m_dir / "alpha") {}

protected:
    fs::path m_dir;
    RepoBuilder m_builder;
    LibGitFacts m_facts;

    fs::path repo() const { return m_builder.path(); }
};

TEST_CASE_METHOD(BareRepo, "Open the bare repository") {
    auto bare = Repo(repo() / ".git");
    REQUIRE(bare.isBare());
    REQUIRE(fs::equivalent(bare.commonDir(), repo() / ".git"));
    REQUIRE(bare.lookupRef("refs/heads/main"));
    REQUIRE_FALSE(bare.lookupRef("refs/heads/nothing"));
}

TEST_CASE("Opening something that is not a repository throws") {
    REQUIRE_THROWS_AS(Repo("/something/that/should/not/exist"), GitException);
}

TEST_CASE_METHOD(BareRepo, "Find repositories down to the search depth") {
    RepoBuilder nested(m_dir / "group" / "gamma");
    RepoBuilder hidden(m_dir / ".hidden" / "delta");
    fs::create_directories(m_dir / "plain" / "folder");
    fs::create_directories(m_dir / "broken" / ".git");

    auto shallow = m_facts.findRepositories(m_dir, 1);
    REQUIRE(shallow.size() == 1);
    REQUIRE(shallow[0].filename() == "alpha");

    auto deep = m_facts.findRepositories(m_dir, 2);
    std::sort(deep.begin(), deep.end());
    REQUIRE(deep.size() == 2);
    REQUIRE(deep[0].filename() == "alpha");
    REQUIRE(deep[1].filename() == "gamma");
}

TEST_CASE_METHOD(BareRepo, "Scanning something that is not a directory finds nothing") {
    auto file = m_dir / "notes.txt";
    std::ofstream(file) << "not a directory\n";

    REQUIRE(m_facts.findRepositories(file, 2).empty());
    REQUIRE(m_facts.findRepositories(m_dir / "nowhere", 2).empty());
}

TEST_CASE_METHOD(BareRepo, "Search root can itself be a repository") {
    auto found = m_facts.findRepositories(repo(), 2);
    REQUIRE(found.size() == 1);
    REQUIRE(fs::equivalent(found[0], repo()));
}

TEST_CASE_METHOD(BareRepo, "List worktrees with their branches") {
    m_builder.branch("feature");
    m_builder.addWorktree("feature");
    m_builder.addWorktree("main");

    auto worktrees = m_facts.listWorktrees(repo());
    std::sort(worktrees.begin(), worktrees.end(),
              [](const WorktreeEntry &a, const WorktreeEntry &b) { return a.branch < b.branch; });

    REQUIRE(worktrees.size() == 2);
    REQUIRE(worktrees[0].branch == "feature");
    REQUIRE(worktrees[0].name == "feature");
    REQUIRE(worktrees[0].exists);
    REQUIRE(fs::equivalent(worktrees[0].path, repo() / "feature"));
    REQUIRE(worktrees[1].branch == "main");
}

TEST_CASE_METHOD(BareRepo, "Deleted worktree directory is listed as missing") {
    m_builder.branch("feature");
    m_builder.addWorktree("feature");
    fs::remove_all(repo() / "feature");

    auto worktrees = m_facts.listWorktrees(repo());

    REQUIRE(worktrees.size() == 1);
    REQUIRE(worktrees[0].branch == "feature");
    REQUIRE_FALSE(worktrees[0].exists);
    REQUIRE_FALSE(m_facts.localDiffState(worktrees[0].path));
}

TEST_CASE_METHOD(BareRepo, "A broken worktree registration does not hide its siblings") {
    m_builder.branch("broken");
    m_builder.addWorktree("broken");
    m_builder.branch("healthy");
    m_builder.addWorktree("healthy");
    fs::remove(repo() / ".git" / "worktrees" / "broken" / "gitdir");

    auto worktrees = m_facts.listWorktrees(repo());

    REQUIRE(worktrees.size() == 1);
    REQUIRE(worktrees[0].branch == "healthy");
    REQUIRE(worktrees[0].exists);

    auto repositories = Discovery(m_facts).discover(m_dir, 2);
    REQUIRE(repositories.size() == 1);
    REQUIRE(repositories[0].worktrees.size() == 1);
}

TEST_CASE_METHOD(BareRepo, "Diff state of a worktree") {
    m_builder.branch("feature");
    m_builder.addWorktree("feature");
    auto worktree = repo() / "feature";

    auto clean = m_facts.localDiffState(worktree);
    REQUIRE(clean);
    REQUIRE_FALSE(clean->staged);
    REQUIRE_FALSE(clean->unstaged);

    m_builder.writeFile("feature", "notes.txt", "work in progress\n");
    auto dirty = m_facts.localDiffState(worktree);
    REQUIRE_FALSE(dirty->staged);
    REQUIRE(dirty->unstaged);

    m_builder.stageFile("feature", "notes.txt");
    auto staged = m_facts.localDiffState(worktree);
    REQUIRE(staged->staged);
    REQUIRE_FALSE(staged->unstaged);
}

TEST_CASE_METHOD(BareRepo, "Remote status against origin") {
    m_builder.branch("feature");
    auto analyzer = RemoteAnalyzer(m_facts);
    REQUIRE(analyzer.analyze(repo(), "feature") == RemoteStatus::notTracking());

    m_builder.setUpstream("feature");
    REQUIRE(m_facts.resolveUpstream(repo(), "feature") == std::optional<std::string>("refs/remotes/origin/feature"));
    REQUIRE(analyzer.analyze(repo(), "feature") == RemoteStatus::notPushed());

    auto pushed = m_builder.commit("feature", "pushed");
    m_builder.setUpstream("feature", pushed);
    m_builder.branch("someone-else", "feature");
    REQUIRE(analyzer.analyze(repo(), "feature") == RemoteStatus::upToDate());

    m_builder.commit("feature", "local one");
    m_builder.commit("feature", "local two");
    REQUIRE(analyzer.analyze(repo(), "feature") == RemoteStatus::fromCounts(2, 0));

    auto upstream_only = m_builder.commit("someone-else", "upstream only");
    m_builder.setUpstream("feature", upstream_only);
    auto status = analyzer.analyze(repo(), "feature");
    REQUIRE(status.kind() == RemoteKind::DIVERGED);
    REQUIRE(status.ahead() == 2);
    REQUIRE(status.behind() == 1);
}

TEST_CASE_METHOD(BareRepo, "Merge status and commit time") {
    m_builder.branch("done");
    m_builder.branch("wip");
    auto wip = m_builder.commit("wip", "unmerged work", 1650000000);
    auto primary = m_facts.resolveBranch(repo(), "main");
    auto done = m_facts.resolveBranch(repo(), "done");

    REQUIRE(primary);
    REQUIRE(done == primary);
    REQUIRE(m_facts.isAncestor(repo(), *done, *primary));
    REQUIRE_FALSE(m_facts.isAncestor(repo(), wip, *primary));
    REQUIRE(m_facts.isAncestor(repo(), *primary, wip));
    REQUIRE(m_facts.commitTime(repo(), wip) == 1650000000);
}

TEST_CASE_METHOD(BareRepo, "Primary branch follows HEAD") {
    REQUIRE(m_facts.primaryBranch(repo()) == "main");

    RepoBuilder trunk(m_dir / "trunk", "trunk");
    REQUIRE(m_facts.primaryBranch(trunk.path()) == "trunk");
}

TEST_CASE_METHOD(BareRepo, "Collect statuses from real worktrees") {
    m_builder.branch("feature");
    m_builder.commit("feature", "ahead of main");
    m_builder.addWorktree("feature");
    m_builder.addWorktree("main");
    m_builder.writeFile("feature", "notes.txt", "scratch\n");

    auto statuses = StatusCollector(m_facts, 2).collect(m_dir, 2, FilterSet(0));

    REQUIRE(statuses.size() == 2);
    REQUIRE(statuses[0].displayName() == "alpha/feature");
    REQUIRE(statuses[0].local == LocalStatus::DIRTY);
    REQUIRE(statuses[0].remote == RemoteStatus::notTracking());
    REQUIRE(statuses[0].merge == MergeStatus::NOT_MERGED);
    REQUIRE(statuses[0].last_activity);
    REQUIRE(statuses[1].displayName() == "alpha/main");
    REQUIRE(statuses[1].primary);
    REQUIRE(statuses[1].local == LocalStatus::CLEAN);
}

TEST_CASE_METHOD(BareRepo, "Add and remove a worktree on disk") {
    auto manager = WorktreeManager(m_facts, m_dir);

    auto added = manager.add("alpha", "feature/login");
    REQUIRE(added.performed);
    REQUIRE(fs::is_directory(repo() / "feature" / "login"));
    REQUIRE(fs::exists(repo() / ".git" / "worktrees" / "feature-login"));
    REQUIRE(m_facts.resolveBranch(repo(), "feature/login") == m_facts.resolveBranch(repo(), "main"));
    REQUIRE(fs::equivalent(manager.path("alpha", "feature/login"), repo() / "feature" / "login"));

    auto removed = manager.remove("alpha", "feature/login");
    REQUIRE(removed.performed);
    REQUIRE_FALSE(fs::exists(repo() / "feature" / "login"));
    REQUIRE(m_facts.listWorktrees(repo()).empty());
    REQUIRE(m_facts.branchExists(repo(), "feature/login"));
}

TEST_CASE_METHOD(BareRepo, "Cleanup removes a merged worktree on disk") {
    m_builder.branch("done");
    m_builder.addWorktree("done");
    m_builder.branch("wip");
    m_builder.commit("wip", "still going");
    m_builder.addWorktree("wip");

    auto report = WorktreeManager(m_facts, m_dir).cleanup();

    REQUIRE(report.removed.size() == 1);
    REQUIRE(report.removed[0].branch == "done");
    REQUIRE(report.failed.empty());
    REQUIRE_FALSE(fs::exists(repo() / "done"));
    REQUIRE(fs::exists(repo() / "wip"));
}
