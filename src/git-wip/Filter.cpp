//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>
#include "Filter.hpp"

static const std::map<std::string, FilterKind> &filterNames() {
    static const std::map<std::string, FilterKind> names = {
            {"dirty", FilterKind::DIRTY},
            {"clean", FilterKind::CLEAN},
            {"staged", FilterKind::STAGED},
            {"missing", FilterKind::MISSING},
            {"ahead", FilterKind::AHEAD},
            {"behind", FilterKind::BEHIND},
            {"diverged", FilterKind::DIVERGED},
            {"not-pushed", FilterKind::NOT_PUSHED},
            {"not-tracking", FilterKind::NOT_TRACKING},
            {"up-to-date", FilterKind::UP_TO_DATE},
            {"merged", FilterKind::MERGED},
            {"not-merged", FilterKind::NOT_MERGED},
            {"active", FilterKind::ACTIVE},
            {"needs-attention", FilterKind::NEEDS_ATTENTION},
            {"stale", FilterKind::STALE},
            {"prune-candidates", FilterKind::PRUNE_CANDIDATES},
    };
    return names;
}

static bool allDigits(const std::string &text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); });
}

// Days between 1970-01-01 and the given civil date, see
// http://howardhinnant.github.io/date_algorithms.html#days_from_civil
static std::int64_t daysFromCivil(std::int64_t year, unsigned month, unsigned day) {
    year -= month <= 2;
    const std::int64_t era = (year >= 0 ? year : year - 399) / 400;
    const auto year_of_era = static_cast<unsigned>(year - era * 400);
    const unsigned day_of_year = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
    const unsigned day_of_era = year_of_era * 365 + year_of_era / 4 - year_of_era / 100 + day_of_year;
    return era * 146097 + static_cast<std::int64_t>(day_of_era) - 719468;
}

static unsigned daysInMonth(std::int64_t year, unsigned month) {
    static const unsigned days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return month == 2 && leap ? 29 : days[month - 1];
}

static std::optional<std::int64_t> parseDate(const std::string &text) {
    if(text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    std::tm parsed = {};
    std::istringstream stream(text);
    stream >> std::get_time(&parsed, "%Y-%m-%d");
    if(stream.fail()) {
        return std::nullopt;
    }
    std::int64_t year = parsed.tm_year + 1900;
    auto month = static_cast<unsigned>(parsed.tm_mon + 1);
    auto day = static_cast<unsigned>(parsed.tm_mday);
    if(month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month)) {
        throw AgeParseException("invalid date '" + text + "'");
    }
    return daysFromCivil(year, month, day) * kSecondsPerDay;
}

std::int64_t parseAgeDays(const std::string &age) {
    std::string text;
    for(auto c : age) {
        if(!std::isspace(static_cast<unsigned char>(c))) {
            text += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    if(text.empty()) {
        throw AgeParseException("empty age");
    }

    static const std::vector<std::pair<std::string, std::int64_t>> units = {
            {"months", 30}, {"month", 30}, {"weeks", 7}, {"week", 7}, {"days", 1}, {"day", 1},
            {"m", 30}, {"w", 7}, {"d", 1},
    };

    std::string number = text;
    std::int64_t multiplier = 1;
    if(!allDigits(text)) {
        auto unit = std::find_if(units.begin(), units.end(), [&text](const auto &candidate) {
            return text.size() > candidate.first.size() &&
                   text.compare(text.size() - candidate.first.size(), candidate.first.size(), candidate.first) == 0;
        });
        if(unit == units.end()) {
            throw AgeParseException("invalid age suffix in '" + age + "'");
        }
        number = text.substr(0, text.size() - unit->first.size());
        multiplier = unit->second;
    }

    if(!allDigits(number) || number.size() > 9) {
        throw AgeParseException("invalid number in age '" + age + "'");
    }
    return std::stoll(number) * multiplier;
}

std::int64_t parseCutoff(const std::string &age, std::int64_t now) {
    if(auto date = parseDate(age)) {
        return *date;
    }
    return now - parseAgeDays(age) * kSecondsPerDay;
}

std::string filterName(FilterKind kind) {
    for(const auto &entry : filterNames()) {
        if(entry.second == kind) {
            return entry.first;
        }
    }
    return kind == FilterKind::OLDER_THAN ? "older-than" : "newer-than";
}

std::optional<FilterKind> filterFromName(const std::string &name) {
    auto found = filterNames().find(name);
    if(found == filterNames().end()) {
        return std::nullopt;
    }
    return found->second;
}

FilterSet::FilterSet(std::int64_t now) : m_now(now) {
}

FilterSet FilterSet::atCurrentTime() {
    auto now = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    return FilterSet(static_cast<std::int64_t>(now));
}

void FilterSet::add(FilterKind kind) {
    Filter filter = {kind, 0, filterName(kind)};
    switch(kind) {
        case FilterKind::ACTIVE:
            filter.cutoff = m_now - kActiveWindowDays * kSecondsPerDay;
            break;
        case FilterKind::STALE:
            filter.cutoff = m_now - kStaleThresholdDays * kSecondsPerDay;
            break;
        case FilterKind::PRUNE_CANDIDATES:
            filter.cutoff = m_now - kPruneAgeDays * kSecondsPerDay;
            break;
        case FilterKind::OLDER_THAN:
        case FilterKind::NEWER_THAN:
            throw AgeParseException(filter.label + " needs an age");
        default:
            break;
    }
    m_filters.push_back(filter);
}

void FilterSet::olderThan(const std::string &age) {
    m_filters.push_back({FilterKind::OLDER_THAN, parseCutoff(age, m_now), "older-than-" + age});
}

void FilterSet::newerThan(const std::string &age) {
    m_filters.push_back({FilterKind::NEWER_THAN, parseCutoff(age, m_now), "newer-than-" + age});
}

bool FilterSet::matches(const WorktreeStatus &status) const {
    return std::all_of(m_filters.begin(), m_filters.end(),
                       [this, &status](const Filter &filter) { return matches(filter, status); });
}

bool FilterSet::matches(const Filter &filter, const WorktreeStatus &status) const {
    auto remote = status.remote.kind();
    const auto &activity = status.last_activity;
    switch(filter.kind) {
        case FilterKind::DIRTY:
            return status.local == LocalStatus::DIRTY;
        case FilterKind::CLEAN:
            return status.local == LocalStatus::CLEAN;
        case FilterKind::STAGED:
            return status.local == LocalStatus::STAGED;
        case FilterKind::MISSING:
            return status.local == LocalStatus::MISSING;
        case FilterKind::AHEAD:
            return remote == RemoteKind::AHEAD;
        case FilterKind::BEHIND:
            return remote == RemoteKind::BEHIND;
        case FilterKind::DIVERGED:
            return remote == RemoteKind::DIVERGED;
        case FilterKind::NOT_PUSHED:
            return remote == RemoteKind::NOT_PUSHED;
        case FilterKind::NOT_TRACKING:
            return remote == RemoteKind::NOT_TRACKING;
        case FilterKind::UP_TO_DATE:
            return remote == RemoteKind::UP_TO_DATE;
        case FilterKind::MERGED:
            return status.merge == MergeStatus::MERGED;
        case FilterKind::NOT_MERGED:
            return status.merge == MergeStatus::NOT_MERGED;
        case FilterKind::ACTIVE:
            return activity && *activity >= filter.cutoff && status.local != LocalStatus::MISSING;
        case FilterKind::NEEDS_ATTENTION:
            return status.local == LocalStatus::DIRTY || status.local == LocalStatus::STAGED ||
                   remote == RemoteKind::DIVERGED || remote == RemoteKind::NOT_PUSHED;
        case FilterKind::STALE:
            return activity && *activity < filter.cutoff && status.local == LocalStatus::CLEAN;
        case FilterKind::PRUNE_CANDIDATES:
            return activity && *activity <= filter.cutoff && status.local == LocalStatus::CLEAN &&
                   status.merge == MergeStatus::MERGED;
        case FilterKind::OLDER_THAN:
            return activity && *activity <= filter.cutoff;
        case FilterKind::NEWER_THAN:
            return activity && *activity >= filter.cutoff;
    }
    return false;
}

std::string FilterSet::describe() const {
    std::string description;
    for(const auto &filter : m_filters) {
        if(!description.empty()) {
            description += ", ";
        }
        description += filter.label;
    }
    return description;
}
