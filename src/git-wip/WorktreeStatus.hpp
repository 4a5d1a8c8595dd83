//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

/// Missing overrides every other value; Staged wins over Dirty when both kinds of change exist.
enum class LocalStatus {CLEAN, DIRTY, STAGED, MISSING, UNKNOWN};

enum class RemoteKind {UP_TO_DATE, AHEAD, BEHIND, DIVERGED, NOT_PUSHED, NOT_TRACKING, UNKNOWN};

enum class MergeStatus {MERGED, NOT_MERGED, UNKNOWN};

class RemoteStatus {
public:
    static RemoteStatus upToDate() { return RemoteStatus(RemoteKind::UP_TO_DATE); }
    static RemoteStatus notPushed() { return RemoteStatus(RemoteKind::NOT_PUSHED); }
    static RemoteStatus notTracking() { return RemoteStatus(RemoteKind::NOT_TRACKING); }
    static RemoteStatus unknown() { return RemoteStatus(RemoteKind::UNKNOWN); }

    /// Classifies a pair of ancestry counts, zero/zero is always up to date.
    static RemoteStatus fromCounts(size_t ahead, size_t behind);

    RemoteKind kind() const { return m_kind; }
    size_t ahead() const { return m_ahead; }
    size_t behind() const { return m_behind; }

    std::string toString() const;

    bool operator==(const RemoteStatus &other) const;
    bool operator!=(const RemoteStatus &other) const { return !(*this == other); }

private:
    explicit RemoteStatus(RemoteKind kind, size_t ahead=0, size_t behind=0)
        : m_kind(kind), m_ahead(ahead), m_behind(behind) {}

    RemoteKind m_kind;
    size_t m_ahead;
    size_t m_behind;
};

/// Snapshot of one worktree, computed fresh on every run.
struct WorktreeStatus {
    std::string repository;
    std::filesystem::path repository_path;
    std::string worktree;
    std::string branch;
    std::filesystem::path path;
    LocalStatus local = LocalStatus::UNKNOWN;
    RemoteStatus remote = RemoteStatus::unknown();
    MergeStatus merge = MergeStatus::UNKNOWN;
    /// Committer time of the branch tip, std::nullopt when it could not be read.
    std::optional<std::int64_t> last_activity;
    bool primary = false;

    std::string displayName() const { return repository + "/" + branch; }
};

std::string toString(LocalStatus status);
std::string toString(MergeStatus status);

std::ostream &operator<<(std::ostream &stream, LocalStatus status);
std::ostream &operator<<(std::ostream &stream, const RemoteStatus &status);
