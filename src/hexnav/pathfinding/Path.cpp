#include "hexnav/pathfinding/Path.hpp"

namespace hexnav::pf {

const char* StatusName(PathStatus status) noexcept
{
    switch (status)
    {
    case PathStatus::Succeeded:        return "succeeded";
    case PathStatus::NotFound:         return "not-found";
    case PathStatus::UnreachableStart: return "unreachable-start";
    case PathStatus::UnreachableGoal:  return "unreachable-goal";
    case PathStatus::InvalidConfig:    return "invalid-config";
    case PathStatus::Cancelled:        return "cancelled";
    case PathStatus::Failed:           return "failed";
    }
    return "unknown";
}

} // namespace hexnav::pf
