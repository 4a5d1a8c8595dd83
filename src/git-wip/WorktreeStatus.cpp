//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#include "WorktreeStatus.hpp"

RemoteStatus RemoteStatus::fromCounts(size_t ahead, size_t behind) {
    if(ahead && behind) {
        return RemoteStatus(RemoteKind::DIVERGED, ahead, behind);
    }
    if(ahead) {
        return RemoteStatus(RemoteKind::AHEAD, ahead, 0);
    }
    if(behind) {
        return RemoteStatus(RemoteKind::BEHIND, 0, behind);
    }
    return upToDate();
}

std::string RemoteStatus::toString() const {
    switch(m_kind) {
        case RemoteKind::UP_TO_DATE:
            return "up to date";
        case RemoteKind::AHEAD:
            return "ahead " + std::to_string(m_ahead);
        case RemoteKind::BEHIND:
            return "behind " + std::to_string(m_behind);
        case RemoteKind::DIVERGED:
            return "diverged +" + std::to_string(m_ahead) + " -" + std::to_string(m_behind);
        case RemoteKind::NOT_PUSHED:
            return "not pushed";
        case RemoteKind::NOT_TRACKING:
            return "not tracking";
        case RemoteKind::UNKNOWN:
            break;
    }
    return "unknown";
}

bool RemoteStatus::operator==(const RemoteStatus &other) const {
    return m_kind == other.m_kind && m_ahead == other.m_ahead && m_behind == other.m_behind;
}

std::string toString(LocalStatus status) {
    switch(status) {
        case LocalStatus::CLEAN:
            return "clean";
        case LocalStatus::DIRTY:
            return "dirty";
        case LocalStatus::STAGED:
            return "staged";
        case LocalStatus::MISSING:
            return "missing";
        case LocalStatus::UNKNOWN:
            break;
    }
    return "unknown";
}

std::string toString(MergeStatus status) {
    switch(status) {
        case MergeStatus::MERGED:
            return "merged";
        case MergeStatus::NOT_MERGED:
            return "not merged";
        case MergeStatus::UNKNOWN:
            break;
    }
    return "unknown";
}

std::ostream &operator<<(std::ostream &stream, LocalStatus status) {
    return stream << toString(status);
}

std::ostream &operator<<(std::ostream &stream, const RemoteStatus &status) {
    return stream << status.toString();
}
