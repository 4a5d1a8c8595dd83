//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#include <algorithm>
#include <spdlog/spdlog.h>
#include "Discovery.hpp"

Discovery::Discovery(GitFacts &facts) : m_facts(facts) {
}

std::vector<RepositoryEntry> Discovery::discover(const std::filesystem::path &root, int max_depth) {
    std::error_code error;
    if(!std::filesystem::is_directory(root, error)) {
        throw DiscoveryException("search path does not exist: " + root.string());
    }

    std::vector<RepositoryEntry> repositories;
    for(const auto &path : m_facts.findRepositories(root, max_depth)) {
        RepositoryEntry repository;
        repository.name = path.filename().string();
        if(repository.name.empty()) {
            repository.name = path.parent_path().filename().string();
        }
        repository.path = path;
        try {
            repository.worktrees = m_facts.listWorktrees(path);
        }
        catch(const std::exception &e) {
            spdlog::warn("skipping repository {}: {}", path.string(), e.what());
            continue;
        }
        if(repository.worktrees.empty()) {
            spdlog::debug("repository {} has no worktrees", path.string());
        }

        std::sort(repository.worktrees.begin(), repository.worktrees.end(),
                  [](const WorktreeEntry &a, const WorktreeEntry &b) { return a.branch < b.branch; });
        repositories.push_back(std::move(repository));
    }

    std::stable_sort(repositories.begin(), repositories.end(),
                     [](const RepositoryEntry &a, const RepositoryEntry &b) {
                         if(a.name != b.name) {
                             return a.name < b.name;
                         }
                         return a.path < b.path;
                     });
    spdlog::debug("discovered {} repositories under {}", repositories.size(), root.string());
    return repositories;
}
