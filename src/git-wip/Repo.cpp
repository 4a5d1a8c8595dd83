//          Copyright Nick G 2020
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include <git2/global.h>
#include <git2/errors.h>
#include <git2/repository.h>
#include <git2/worktree.h>
#include <git2/refs.h>
#include <git2/config.h>
#include <git2/strarray.h>
#include "Repo.hpp"

void checkGit(int error, const std::string &what) {
    if(error >= 0) {
        return;
    }
    auto last = git_error_last();
    std::string message = what;
    if(last && last->message) {
        message += ": ";
        message += last->message;
    }
    throw GitException(message);
}

LibGit::LibGit() {
    git_libgit2_init();
}

LibGit::~LibGit() {
    git_libgit2_shutdown();
}

Repo::Repo(const std::filesystem::path &path) : m_path(path) {
    auto error = git_repository_open_ext(&m_repo, path.string().c_str(), GIT_REPOSITORY_OPEN_NO_SEARCH, NULL);
    if(error != 0) {
        m_repo = NULL;
        checkGit(error < 0 ? error : -1, "not a git repository: " + path.string());
    }
}

Repo::~Repo() {
    git_repository_free(m_repo);
}

bool Repo::isBare() const {
    return git_repository_is_bare(m_repo) == 1;
}

std::filesystem::path Repo::commonDir() const {
    return git_repository_commondir(m_repo);
}

std::vector<std::string> Repo::worktreeNames() const {
    git_strarray names = {NULL, 0};
    checkGit(git_worktree_list(&names, m_repo), "unable to list worktrees of " + m_path.string());

    std::vector<std::string> result;
    for(size_t i = 0; i < names.count; i++) {
        result.emplace_back(names.strings[i]);
    }
    git_strarray_dispose(&names);
    return result;
}

std::optional<git_oid> Repo::lookupRef(const std::string &ref_name) const {
    git_oid oid;
    auto error = git_reference_name_to_id(&oid, m_repo, ref_name.c_str());
    if(error == GIT_ENOTFOUND || error == GIT_EINVALIDSPEC) {
        return std::nullopt;
    }
    checkGit(error, "unable to resolve " + ref_name);
    return oid;
}

std::optional<std::string> Repo::configString(const std::string &key) const {
    git_config * config = NULL;
    checkGit(git_repository_config_snapshot(&config, m_repo), "unable to read config of " + m_path.string());

    const char * value = NULL;
    auto error = git_config_get_string(&value, config, key.c_str());
    std::optional<std::string> result;
    if(error == 0 && value) {
        result = std::string(value);
    }
    git_config_free(config);
    if(error != 0 && error != GIT_ENOTFOUND) {
        checkGit(error, "unable to read " + key);
    }
    return result;
}

std::string oidToString(const git_oid &oid) {
    return git_oid_tostr_s(&oid);
}

git_oid oidFromString(const std::string &hex) {
    git_oid oid;
    checkGit(git_oid_fromstr(&oid, hex.c_str()), "invalid commit id " + hex);
    return oid;
}
