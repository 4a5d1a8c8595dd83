//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#include <algorithm>
#include <array>
#include "Filter.hpp"
#include "Report.hpp"

static const std::string kRed = "\u001b[31m";
static const std::string kGreen = "\u001b[32m";
static const std::string kYellow = "\u001b[33m";
static const std::string kCyan = "\u001b[36m";
static const std::string kReset = "\u001b[0m";

Report::Report(const std::vector<WorktreeStatus> &statuses, std::int64_t now) : m_statuses(statuses), m_now(now) {
}

void Report::toStream(std::ostream &stream, Colorize colorize) {
    getTableMessage(stream, colorize);
    getSummaryMessage(stream, colorize);
}

std::string Report::formatAge(const std::optional<std::int64_t> &last_activity, std::int64_t now) {
    if(!last_activity) {
        return "-";
    }
    auto seconds = std::max<std::int64_t>(0, now - *last_activity);
    auto days = seconds / kSecondsPerDay;
    if(days == 0) {
        auto hours = seconds / 3600;
        return hours == 0 ? "now" : std::to_string(hours) + "h";
    }
    if(days < 14) {
        return std::to_string(days) + "d";
    }
    if(days < 60) {
        return std::to_string(days / 7) + "w";
    }
    return std::to_string(days / 30) + "mo";
}

std::string Report::localColor(LocalStatus status) {
    switch(status) {
        case LocalStatus::CLEAN:
            return kGreen;
        case LocalStatus::DIRTY:
        case LocalStatus::MISSING:
            return kRed;
        case LocalStatus::STAGED:
            return kYellow;
        case LocalStatus::UNKNOWN:
            break;
    }
    return "";
}

std::string Report::remoteColor(RemoteKind kind) {
    switch(kind) {
        case RemoteKind::UP_TO_DATE:
            return kGreen;
        case RemoteKind::AHEAD:
        case RemoteKind::BEHIND:
            return kYellow;
        case RemoteKind::DIVERGED:
        case RemoteKind::NOT_PUSHED:
            return kRed;
        case RemoteKind::NOT_TRACKING:
        case RemoteKind::UNKNOWN:
            break;
    }
    return "";
}

void Report::getTableMessage(std::ostream &stream, Colorize colorize) {
    if(m_statuses.empty()) {
        return;
    }

    using Row = std::array<std::string, 6>;
    std::vector<Row> rows = {{"REPOSITORY", "BRANCH", "LOCAL", "REMOTE", "MERGED", "AGE"}};
    for(const auto &status : m_statuses) {
        rows.push_back({status.repository, status.branch, toString(status.local), status.remote.toString(),
                        toString(status.merge), formatAge(status.last_activity, m_now)});
    }

    Row::size_type columns = rows.front().size();
    std::vector<size_t> widths(columns, 0);
    for(const auto &row : rows) {
        for(Row::size_type i = 0; i < columns; i++) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }

    for(size_t r = 0; r < rows.size(); r++) {
        std::array<std::string, 6> colors;
        if(colorize == Colorize::COLORIZE && r > 0) {
            const auto &status = m_statuses[r - 1];
            colors[0] = kCyan;
            colors[2] = localColor(status.local);
            colors[3] = remoteColor(status.remote.kind());
        }
        std::string line;
        for(Row::size_type i = 0; i < columns; i++) {
            const auto &cell = rows[r][i];
            auto end_color = colors[i].empty() ? "" : kReset;
            line += colors[i] + cell + end_color;
            if(i + 1 < columns) {
                line += std::string(widths[i] - cell.size() + 2, ' ');
            }
        }
        stream << line << "\n";
    }
}

void Report::getSummaryMessage(std::ostream &stream, Colorize colorize) {
    auto summary = Summary::of(m_statuses);
    std::string color;
    std::string color_end;
    if (colorize == Colorize::COLORIZE) {
        color = kYellow;
        color_end = kReset;
    }

    stream << "\n";
    stream << color << "Total WIP branches: " << summary.total << color_end << "\n";
    stream << color << "Repositories with WIP: " << summary.repositories << color_end << "\n";
    stream << "  Local: clean (" << summary.count(LocalStatus::CLEAN) << ") | dirty ("
           << summary.count(LocalStatus::DIRTY) << ") | staged (" << summary.count(LocalStatus::STAGED)
           << ") | missing (" << summary.count(LocalStatus::MISSING) << ")\n";
    stream << "  Remote: up to date (" << summary.count(RemoteKind::UP_TO_DATE) << ") | ahead ("
           << summary.count(RemoteKind::AHEAD) << ") | behind (" << summary.count(RemoteKind::BEHIND)
           << ") | diverged (" << summary.count(RemoteKind::DIVERGED) << ") | not pushed ("
           << summary.count(RemoteKind::NOT_PUSHED) << ") | not tracking ("
           << summary.count(RemoteKind::NOT_TRACKING) << ")\n";
}
