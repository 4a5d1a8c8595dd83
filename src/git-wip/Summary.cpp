//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#include <set>
#include "Summary.hpp"

size_t Summary::count(LocalStatus status) const {
    auto found = local.find(status);
    return found == local.end() ? 0 : found->second;
}

size_t Summary::count(RemoteKind kind) const {
    auto found = remote.find(kind);
    return found == remote.end() ? 0 : found->second;
}

Summary Summary::of(const std::vector<WorktreeStatus> &statuses) {
    Summary summary;
    std::set<std::filesystem::path> repositories;
    for(const auto &status : statuses) {
        summary.total++;
        summary.local[status.local]++;
        summary.remote[status.remote.kind()]++;
        repositories.insert(status.repository_path);
    }
    summary.repositories = repositories.size();
    return summary;
}
