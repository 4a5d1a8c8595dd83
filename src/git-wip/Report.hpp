//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#pragma once

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "Summary.hpp"
#include "WorktreeStatus.hpp"

enum class Colorize {COLORIZE, NO_COLORIZE};

/// Plain text table of worktree statuses followed by a summary.
class Report {
public:
    Report(const std::vector<WorktreeStatus> &statuses, std::int64_t now);

    void toStream(std::ostream &stream, Colorize colorize=Colorize::NO_COLORIZE);

    void getTableMessage(std::ostream &stream, Colorize colorize=Colorize::NO_COLORIZE);

    void getSummaryMessage(std::ostream &stream, Colorize colorize=Colorize::NO_COLORIZE);

    static std::string formatAge(const std::optional<std::int64_t> &last_activity, std::int64_t now);

private:
    const std::vector<WorktreeStatus> &m_statuses;
    std::int64_t m_now;

    static std::string localColor(LocalStatus status);
    static std::string remoteColor(RemoteKind kind);
};
