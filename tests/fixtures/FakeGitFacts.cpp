//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#include <algorithm>
#include <stdexcept>
#include "FakeGitFacts.hpp"

static const std::string kHeads = "refs/heads/";

FakeGitFacts::FakeGitFacts(std::filesystem::path root) : m_root(std::move(root)) {
}

FakeGitFacts::FakeRepository &FakeGitFacts::repository(const std::filesystem::path &repo) {
    auto found = m_repositories.find(repo);
    if(found == m_repositories.end()) {
        throw std::runtime_error("no fake repository at " + repo.string());
    }
    if(found->second.broken) {
        throw std::runtime_error("corrupt repository " + repo.string());
    }
    return found->second;
}

void FakeGitFacts::addRepository(const std::string &repository, const std::string &primary) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto &entry = m_repositories[repoPath(repository)];
    entry.primary = primary;
    entry.refs[kHeads + primary] = primary + "-tip";
}

void FakeGitFacts::addWorktree(const std::string &repository, const std::string &branch, const std::string &tip) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto &entry = m_repositories.at(repoPath(repository));
    WorktreeEntry worktree;
    worktree.name = branch;
    worktree.branch = branch;
    worktree.path = repoPath(repository) / branch;
    worktree.exists = true;
    entry.worktrees.push_back(worktree);
    if(!tip.empty() || entry.refs.find(kHeads + branch) == entry.refs.end()) {
        entry.refs[kHeads + branch] = tip.empty() ? branch + "-tip" : tip;
    }
}

void FakeGitFacts::setDiff(const std::string &repository, const std::string &branch, bool staged, bool unstaged) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_diffs[repoPath(repository) / branch] = DiffState{staged, unstaged};
}

void FakeGitFacts::setMissing(const std::string &repository, const std::string &branch) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_missing.insert(repoPath(repository) / branch);
    for(auto &worktree : m_repositories.at(repoPath(repository)).worktrees) {
        if(worktree.branch == branch) {
            worktree.exists = false;
        }
    }
}

void FakeGitFacts::setUpstream(const std::string &repository, const std::string &branch,
                               const std::string &upstream_ref) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_repositories.at(repoPath(repository)).upstreams[branch] = upstream_ref;
}

void FakeGitFacts::setRef(const std::string &repository, const std::string &ref_name, const CommitId &tip) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_repositories.at(repoPath(repository)).refs[ref_name] = tip;
}

void FakeGitFacts::setAheadBehind(const CommitId &local, const CommitId &upstream, size_t ahead, size_t behind) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_counts[{local, upstream}] = AheadBehind{ahead, behind};
}

void FakeGitFacts::setAncestor(const CommitId &ancestor, const CommitId &descendant) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_ancestors.insert({ancestor, descendant});
}

void FakeGitFacts::setCommitTime(const CommitId &commit, std::int64_t time) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_times[commit] = time;
}

void FakeGitFacts::breakRepository(const std::string &repository) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_repositories.at(repoPath(repository)).broken = true;
}

void FakeGitFacts::breakInspection(const std::string &repository, const std::string &branch) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_uninspectable.insert(repoPath(repository) / branch);
}

std::vector<std::filesystem::path> FakeGitFacts::findRepositories(const std::filesystem::path &root, int max_depth) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::filesystem::path> found;
    for(const auto &entry : m_repositories) {
        found.push_back(entry.first);
    }
    // Hand them out of order so callers have to sort.
    std::reverse(found.begin(), found.end());
    return found;
}

std::vector<WorktreeEntry> FakeGitFacts::listWorktrees(const std::filesystem::path &repo) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto worktrees = repository(repo).worktrees;
    std::reverse(worktrees.begin(), worktrees.end());
    return worktrees;
}

std::optional<DiffState> FakeGitFacts::localDiffState(const std::filesystem::path &worktree) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if(m_uninspectable.count(worktree)) {
        throw std::runtime_error("unable to read index of " + worktree.string());
    }
    if(m_missing.count(worktree)) {
        return std::nullopt;
    }
    auto found = m_diffs.find(worktree);
    return found == m_diffs.end() ? DiffState{} : found->second;
}

std::optional<CommitId> FakeGitFacts::resolveBranch(const std::filesystem::path &repo, const std::string &branch) {
    return resolveRef(repo, kHeads + branch);
}

std::optional<std::string> FakeGitFacts::resolveUpstream(const std::filesystem::path &repo,
                                                         const std::string &branch) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto &upstreams = repository(repo).upstreams;
    auto found = upstreams.find(branch);
    if(found == upstreams.end()) {
        return std::nullopt;
    }
    return found->second;
}

std::optional<CommitId> FakeGitFacts::resolveRef(const std::filesystem::path &repo, const std::string &ref_name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto &refs = repository(repo).refs;
    auto found = refs.find(ref_name);
    if(found == refs.end()) {
        return std::nullopt;
    }
    return found->second;
}

AheadBehind FakeGitFacts::aheadBehind(const std::filesystem::path &repo, const CommitId &local,
                                      const CommitId &upstream) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto found = m_counts.find({local, upstream});
    return found == m_counts.end() ? AheadBehind{} : found->second;
}

bool FakeGitFacts::isAncestor(const std::filesystem::path &repo, const CommitId &ancestor,
                              const CommitId &descendant) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return ancestor == descendant || m_ancestors.count({ancestor, descendant}) > 0;
}

std::int64_t FakeGitFacts::commitTime(const std::filesystem::path &repo, const CommitId &commit) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto found = m_times.find(commit);
    if(found == m_times.end()) {
        throw std::runtime_error("no time recorded for " + commit);
    }
    return found->second;
}

std::string FakeGitFacts::primaryBranch(const std::filesystem::path &repo) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return repository(repo).primary;
}

bool FakeGitFacts::branchExists(const std::filesystem::path &repo, const std::string &branch) {
    return resolveBranch(repo, branch).has_value();
}

std::optional<CommitId> FakeGitFacts::resolveBase(const std::filesystem::path &repo, const std::string &base) {
    if(auto local = resolveBranch(repo, base)) {
        return local;
    }
    return resolveRef(repo, "refs/remotes/origin/" + base);
}

void FakeGitFacts::createWorktree(const std::filesystem::path &repo, const WorktreeEntry &worktree,
                                  const CommitId &base, bool reuse) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto &entry = repository(repo);
    if(!reuse) {
        entry.refs[kHeads + worktree.branch] = base;
    }
    auto added = worktree;
    added.exists = true;
    entry.worktrees.push_back(added);
    m_created++;
}

void FakeGitFacts::removeWorktree(const std::filesystem::path &repo, const WorktreeEntry &worktree) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto &worktrees = repository(repo).worktrees;
    auto found = std::find_if(worktrees.begin(), worktrees.end(),
                              [&worktree](const WorktreeEntry &entry) { return entry.branch == worktree.branch; });
    if(found == worktrees.end()) {
        throw std::runtime_error("no worktree " + worktree.name);
    }
    worktrees.erase(found);
    m_removed++;
}
