//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#include <fstream>
#include <git2/branch.h>
#include <git2/buffer.h>
#include <git2/commit.h>
#include <git2/errors.h>
#include <git2/graph.h>
#include <git2/refs.h>
#include <git2/repository.h>
#include <git2/worktree.h>
#include <spdlog/spdlog.h>
#include "LibGitFacts.hpp"
#include "Status.hpp"

namespace fs = std::filesystem;

static const std::string kHeadsPrefix = "refs/heads/";

std::filesystem::path LibGitFacts::gitDir(const std::filesystem::path &repo) {
    return repo / ".git";
}

bool LibGitFacts::isBareRepository(const std::filesystem::path &dir) {
    std::error_code error;
    if(!fs::is_directory(gitDir(dir), error)) {
        return false;
    }
    try {
        auto repo = Repo(gitDir(dir));
        return repo.isBare();
    }
    catch(const GitException &e) {
        spdlog::debug("ignoring {}: {}", dir.string(), e.what());
        return false;
    }
}

std::vector<std::filesystem::path> LibGitFacts::findRepositories(const std::filesystem::path &root, int max_depth) {
    std::vector<fs::path> found;
    if(isBareRepository(root)) {
        found.push_back(root);
        return found;
    }
    if(max_depth <= 0) {
        return found;
    }

    auto options = fs::directory_options::skip_permission_denied;
    std::error_code scan_error;
    auto it = fs::recursive_directory_iterator(root, options, scan_error);
    for(; !scan_error && it != fs::recursive_directory_iterator(); it.increment(scan_error)) {
        std::error_code error;
        if(!it->is_directory(error) || it->is_symlink(error)) {
            continue;
        }
        auto name = it->path().filename().string();
        if(!name.empty() && name[0] == '.') {
            it.disable_recursion_pending();
            continue;
        }
        if(isBareRepository(it->path())) {
            found.push_back(it->path());
            it.disable_recursion_pending();
            continue;
        }
        if(it.depth() + 1 >= max_depth) {
            it.disable_recursion_pending();
        }
    }
    if(scan_error) {
        spdlog::warn("stopped scanning {}: {}", root.string(), scan_error.message());
    }
    return found;
}

std::optional<std::string> LibGitFacts::worktreeBranch(const Repo &bare, const std::string &name) {
    git_reference * head = NULL;
    if(git_repository_head_for_worktree(&head, bare.get(), name.c_str()) == 0) {
        std::optional<std::string> branch;
        const char * branch_name = NULL;
        if(git_reference_is_branch(head) && git_branch_name(&branch_name, head) == 0) {
            branch = std::string(branch_name);
        }
        git_reference_free(head);
        return branch;
    }

    // The worktree directory may be gone or its branch unborn; the administrative HEAD in the
    // common directory still names the branch.
    auto head_file = bare.commonDir() / "worktrees" / name / "HEAD";
    auto stream = std::ifstream(head_file);
    std::string line;
    if(!stream || !std::getline(stream, line)) {
        throw GitException("unable to read HEAD of worktree " + name);
    }
    const std::string symbolic = "ref: " + kHeadsPrefix;
    if(line.rfind(symbolic, 0) != 0) {
        return std::nullopt;
    }
    while(!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
        line.pop_back();
    }
    return line.substr(symbolic.length());
}

std::vector<WorktreeEntry> LibGitFacts::listWorktrees(const std::filesystem::path &repo) {
    auto bare = Repo(gitDir(repo));
    if(!bare.isBare()) {
        throw GitException(repo.string() + " is not a bare repository");
    }

    std::vector<WorktreeEntry> worktrees;
    for(const auto &name : bare.worktreeNames()) {
        git_worktree * worktree = NULL;
        try {
            checkGit(git_worktree_lookup(&worktree, bare.get(), name.c_str()), "unable to open worktree " + name);
        }
        catch(const GitException &e) {
            spdlog::warn("skipping worktree {} of {}: {}", name, repo.string(), e.what());
            continue;
        }
        WorktreeEntry entry;
        entry.name = name;
        entry.path = fs::path(git_worktree_path(worktree)).lexically_normal();
        if(!entry.path.has_filename()) {
            entry.path = entry.path.parent_path();
        }
        git_worktree_free(worktree);

        std::error_code error;
        entry.exists = fs::is_directory(entry.path, error);

        std::optional<std::string> branch;
        try {
            branch = worktreeBranch(bare, name);
        }
        catch(const GitException &e) {
            spdlog::warn("skipping worktree {} of {}: {}", name, repo.string(), e.what());
            continue;
        }
        if(!branch) {
            spdlog::debug("skipping detached worktree {} of {}", name, repo.string());
            continue;
        }
        entry.branch = *branch;
        worktrees.push_back(entry);
    }
    return worktrees;
}

std::optional<DiffState> LibGitFacts::localDiffState(const std::filesystem::path &worktree) {
    std::error_code error;
    if(!fs::exists(worktree, error)) {
        return std::nullopt;
    }
    auto repo = Repo(worktree);
    auto status = Status(repo.get());
    DiffState state;
    state.staged = status.hasStaged();
    state.unstaged = status.hasUnstaged();
    return state;
}

std::optional<CommitId> LibGitFacts::resolveBranch(const std::filesystem::path &repo, const std::string &branch) {
    return resolveRef(repo, kHeadsPrefix + branch);
}

std::optional<std::string> LibGitFacts::resolveUpstream(const std::filesystem::path &repo, const std::string &branch) {
    auto bare = Repo(gitDir(repo));
    auto remote = bare.configString("branch." + branch + ".remote");
    auto merge = bare.configString("branch." + branch + ".merge");
    if(!remote || !merge) {
        return std::nullopt;
    }

    git_buf upstream_name = GIT_BUF_INIT;
    auto local_name = kHeadsPrefix + branch;
    if(git_branch_upstream_name(&upstream_name, bare.get(), local_name.c_str()) == 0) {
        std::string name(upstream_name.ptr);
        git_buf_dispose(&upstream_name);
        return name;
    }
    git_buf_dispose(&upstream_name);
    git_error_clear();

    // Configured but the remote has no refspec mapping it; name the tracking ref the default
    // refspec would produce so it resolves as not pushed.
    auto merged = *merge;
    if(merged.rfind(kHeadsPrefix, 0) == 0) {
        merged = merged.substr(kHeadsPrefix.length());
    }
    return "refs/remotes/" + *remote + "/" + merged;
}

std::optional<CommitId> LibGitFacts::resolveRef(const std::filesystem::path &repo, const std::string &ref_name) {
    auto bare = Repo(gitDir(repo));
    auto oid = bare.lookupRef(ref_name);
    if(!oid) {
        return std::nullopt;
    }
    return oidToString(*oid);
}

AheadBehind LibGitFacts::aheadBehind(const std::filesystem::path &repo, const CommitId &local,
                                     const CommitId &upstream) {
    auto bare = Repo(gitDir(repo));
    auto local_oid = oidFromString(local);
    auto upstream_oid = oidFromString(upstream);
    AheadBehind counts;
    checkGit(git_graph_ahead_behind(&counts.ahead, &counts.behind, bare.get(), &local_oid, &upstream_oid),
             "unable to compare " + local + " with " + upstream);
    return counts;
}

bool LibGitFacts::isAncestor(const std::filesystem::path &repo, const CommitId &ancestor,
                             const CommitId &descendant) {
    if(ancestor == descendant) {
        return true;
    }
    auto bare = Repo(gitDir(repo));
    auto ancestor_oid = oidFromString(ancestor);
    auto descendant_oid = oidFromString(descendant);
    auto result = git_graph_descendant_of(bare.get(), &descendant_oid, &ancestor_oid);
    checkGit(result, "unable to check ancestry of " + ancestor);
    return result == 1;
}

std::int64_t LibGitFacts::commitTime(const std::filesystem::path &repo, const CommitId &commit) {
    auto bare = Repo(gitDir(repo));
    auto oid = oidFromString(commit);
    git_commit * object = NULL;
    checkGit(git_commit_lookup(&object, bare.get(), &oid), "unable to find commit " + commit);
    auto time = static_cast<std::int64_t>(git_commit_time(object));
    git_commit_free(object);
    return time;
}

std::string LibGitFacts::primaryBranch(const std::filesystem::path &repo) {
    auto bare = Repo(gitDir(repo));

    git_reference * head = NULL;
    std::string target;
    if(git_reference_lookup(&head, bare.get(), "HEAD") == 0) {
        if(git_reference_type(head) == GIT_REFERENCE_SYMBOLIC) {
            target = git_reference_symbolic_target(head);
        }
        git_reference_free(head);
    }
    git_error_clear();

    if(target.rfind(kHeadsPrefix, 0) == 0) {
        auto name = target.substr(kHeadsPrefix.length());
        if(bare.lookupRef(target)) {
            return name;
        }
    }
    for(const auto &candidate : {"main", "master"}) {
        if(bare.lookupRef(kHeadsPrefix + candidate)) {
            return candidate;
        }
    }
    return "main";
}

bool LibGitFacts::branchExists(const std::filesystem::path &repo, const std::string &branch) {
    return resolveBranch(repo, branch).has_value();
}

std::optional<CommitId> LibGitFacts::resolveBase(const std::filesystem::path &repo, const std::string &base) {
    if(auto local = resolveBranch(repo, base)) {
        return local;
    }
    return resolveRef(repo, "refs/remotes/origin/" + base);
}

void LibGitFacts::createWorktree(const std::filesystem::path &repo, const WorktreeEntry &worktree,
                                 const CommitId &base, bool reuse) {
    auto bare = Repo(gitDir(repo));
    auto ref_name = kHeadsPrefix + worktree.branch;
    bool created_branch = false;

    git_reference * branch = NULL;
    if(reuse && bare.lookupRef(ref_name)) {
        checkGit(git_reference_lookup(&branch, bare.get(), ref_name.c_str()), "unable to open " + ref_name);
    } else {
        auto oid = oidFromString(base);
        git_commit * commit = NULL;
        checkGit(git_commit_lookup(&commit, bare.get(), &oid), "unable to find base commit " + base);
        auto error = git_branch_create(&branch, bare.get(), worktree.branch.c_str(), commit, 0);
        git_commit_free(commit);
        checkGit(error, "unable to create branch " + worktree.branch);
        created_branch = true;
    }

    // Branches like feature/x check out below an intermediate directory.
    std::error_code mkdir_error;
    fs::create_directories(worktree.path.parent_path(), mkdir_error);
    if(mkdir_error) {
        spdlog::debug("unable to create {}: {}", worktree.path.parent_path().string(), mkdir_error.message());
    }

    git_worktree_add_options options = GIT_WORKTREE_ADD_OPTIONS_INIT;
    options.ref = branch;
    git_worktree * added = NULL;
    auto error = git_worktree_add(&added, bare.get(), worktree.name.c_str(), worktree.path.string().c_str(),
                                  &options);
    git_worktree_free(added);

    std::string message;
    if(error < 0) {
        auto last = git_error_last();
        message = last && last->message ? last->message : "unknown error";
        if(created_branch && git_branch_delete(branch) < 0) {
            spdlog::warn("unable to roll back branch {} in {}", worktree.branch, repo.string());
        }
    }
    git_reference_free(branch);
    if(error < 0) {
        throw GitException("unable to add worktree " + worktree.path.string() + ": " + message);
    }
}

void LibGitFacts::removeWorktree(const std::filesystem::path &repo, const WorktreeEntry &worktree) {
    auto bare = Repo(gitDir(repo));

    git_worktree * registered = NULL;
    auto error = git_worktree_lookup(&registered, bare.get(), worktree.name.c_str());
    if(error == GIT_ENOTFOUND) {
        git_error_clear();
        std::error_code fs_error;
        if(fs::exists(worktree.path, fs_error)) {
            fs::remove_all(worktree.path);
        }
        return;
    }
    checkGit(error, "unable to open worktree " + worktree.name);

    git_worktree_prune_options options = GIT_WORKTREE_PRUNE_OPTIONS_INIT;
    options.flags = GIT_WORKTREE_PRUNE_VALID | GIT_WORKTREE_PRUNE_WORKING_TREE;
    error = git_worktree_prune(registered, &options);
    git_worktree_free(registered);
    checkGit(error, "unable to remove worktree " + worktree.path.string());
}
