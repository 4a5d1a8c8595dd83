//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "WorktreeStatus.hpp"

class AgeParseException : public std::runtime_error {
public:
    explicit AgeParseException(const std::string &error) : std::runtime_error(error){}
};

enum class FilterKind {
    DIRTY, CLEAN, STAGED, MISSING,
    AHEAD, BEHIND, DIVERGED, NOT_PUSHED, NOT_TRACKING, UP_TO_DATE,
    MERGED, NOT_MERGED,
    ACTIVE, NEEDS_ATTENTION, STALE, PRUNE_CANDIDATES,
    OLDER_THAN, NEWER_THAN
};

constexpr std::int64_t kSecondsPerDay = 24 * 60 * 60;
constexpr std::int64_t kActiveWindowDays = 7;
constexpr std::int64_t kStaleThresholdDays = 30;
constexpr std::int64_t kPruneAgeDays = 7;

/// Parses "30", "30d", "1w", "2m", "3 weeks" and the like into days.  Months count 30 days.
std::int64_t parseAgeDays(const std::string &age);

/// Turns an age relative to `now` or an absolute YYYY-MM-DD date (UTC) into a cutoff instant.
std::int64_t parseCutoff(const std::string &age, std::int64_t now);

std::string filterName(FilterKind kind);

/// Looks up a flag name such as "not-pushed" or "needs-attention".  Age filters take an argument
/// and are not returned.
std::optional<FilterKind> filterFromName(const std::string &name);

/// A conjunction of predicates over WorktreeStatus.
///
/// The evaluation instant and every age cutoff are fixed when the filter is built, matching is
/// a pure function of the status record.  An empty set matches everything; contradictory
/// combinations such as dirty and clean simply match nothing.
class FilterSet {
public:
    explicit FilterSet(std::int64_t now);
    static FilterSet atCurrentTime();

    void add(FilterKind kind);
    void olderThan(const std::string &age);
    void newerThan(const std::string &age);

    bool empty() const { return m_filters.empty(); }
    std::int64_t now() const { return m_now; }

    bool matches(const WorktreeStatus &status) const;

    /// Comma separated names of the active filters, e.g. "dirty, older-than-2w".
    std::string describe() const;

private:
    struct Filter {
        FilterKind kind;
        std::int64_t cutoff;
        std::string label;
    };

    std::int64_t m_now;
    std::vector<Filter> m_filters;

    bool matches(const Filter &filter, const WorktreeStatus &status) const;
};
