#include "SafetyChecker.hpp"

#include <array>

namespace junction
{

    bool SafetyChecker::hasMovementConflict(const MovementGroup &a, const MovementGroup &b)
    {
        if (!isValidMovementGroup(a) || !isValidMovementGroup(b))
        {
            return true;
        }

        if (a == b)
        {
            return false;
        }

        // Every movement of an origin has its own lane, so they diverge without crossing
        if (a.origin == b.origin)
        {
            return false;
        }

        if (destinationFor(a.origin, a.direction) == destinationFor(b.origin, b.direction))
        {
            return true;
        }

        if (areOpposing(a.origin, b.origin))
        {
            // Opposing lefts pass each other; a left against opposing through traffic crosses it
            const bool a_left = a.direction == Direction::Left;
            const bool b_left = b.direction == Direction::Left;
            return a_left != b_left;
        }

        // Perpendicular: a right turn stays in its corner, anything else crosses
        if (a.direction == Direction::Right || b.direction == Direction::Right)
        {
            return false;
        }
        return true;
    }

    bool SafetyChecker::isSafe(const IntersectionState &state) const
    {
        const auto groups = allMovementGroups();
        for (std::size_t i = 0; i < groups.size(); ++i)
        {
            if (!isActive(state.lights[i]))
            {
                continue;
            }
            for (std::size_t j = i + 1; j < groups.size(); ++j)
            {
                if (isActive(state.lights[j]) && hasMovementConflict(groups[i], groups[j]))
                {
                    return false;
                }
            }
        }
        return true;
    }

    bool SafetyChecker::isValidTransition(const IntersectionState &prev, const IntersectionState &next) const
    {
        return checkPerLightTransitions(prev, next) &&
               isSafe(next) &&
               checkGreenOnsets(prev, next);
    }

    bool SafetyChecker::checkPerLightTransitions(const IntersectionState &prev, const IntersectionState &next) const
    {
        auto valid_for_light = [](LightState p, LightState n)
        {
            if (p == n)
                return true;
            if (p == LightState::Green && n == LightState::Yellow)
                return true;
            if (p == LightState::Yellow && n == LightState::Red)
                return true;
            if (p == LightState::Red && n == LightState::Green)
                return true;
            return false;
        };

        for (std::size_t i = 0; i < MOVEMENT_GROUP_COUNT; ++i)
        {
            if (!valid_for_light(prev.lights[i], next.lights[i]))
            {
                return false;
            }
        }
        return true;
    }

    bool SafetyChecker::checkGreenOnsets(const IntersectionState &prev, const IntersectionState &next) const
    {
        const auto groups = allMovementGroups();
        for (std::size_t i = 0; i < groups.size(); ++i)
        {
            const bool going_green = prev.lights[i] != LightState::Green && next.lights[i] == LightState::Green;
            if (!going_green)
            {
                continue;
            }

            // A conflicting group still clearing on yellow blocks the onset
            for (std::size_t j = 0; j < groups.size(); ++j)
            {
                if (j != i && isActive(prev.lights[j]) && hasMovementConflict(groups[i], groups[j]))
                {
                    return false;
                }
            }
        }
        return true;
    }

    bool SafetyChecker::isPhaseConflictFree(const std::vector<MovementGroup> &groups) const
    {
        for (std::size_t i = 0; i < groups.size(); ++i)
        {
            for (std::size_t j = i + 1; j < groups.size(); ++j)
            {
                if (hasMovementConflict(groups[i], groups[j]))
                {
                    return false;
                }
            }
        }
        return true;
    }

    std::vector<std::string> SafetyChecker::validatePhasePlan(const ControllerConfig &config) const
    {
        std::vector<std::string> errors;

        if (config.green_ticks == 0)
        {
            errors.push_back("green_ticks must be positive");
        }
        if (config.yellow_ticks == 0)
        {
            errors.push_back("yellow_ticks must be positive");
        }
        if (config.max_clearance_ticks < config.clearance_ticks)
        {
            errors.push_back("max_clearance_ticks must not be shorter than clearance_ticks");
        }
        if (config.phases.empty())
        {
            errors.push_back("phase plan must contain at least one phase");
            return errors;
        }

        std::array<bool, MOVEMENT_GROUP_COUNT> served{};
        for (const auto &phase : config.phases)
        {
            if (phase.groups.empty())
            {
                errors.push_back("phase '" + phase.name + "' has no movement groups");
                continue;
            }

            std::array<bool, MOVEMENT_GROUP_COUNT> seen{};
            bool groups_valid = true;
            for (const auto &group : phase.groups)
            {
                const std::size_t index = movementGroupIndex(group);
                if (index >= MOVEMENT_GROUP_COUNT)
                {
                    errors.push_back("phase '" + phase.name + "' references an invalid movement group");
                    groups_valid = false;
                    continue;
                }
                if (seen[index])
                {
                    errors.push_back("phase '" + phase.name + "' lists " + movementGroupName(group) + " twice");
                }
                seen[index] = true;
                served[index] = true;
            }

            if (groups_valid && !isPhaseConflictFree(phase.groups))
            {
                errors.push_back("phase '" + phase.name + "' grants conflicting movement groups");
            }
        }

        for (std::size_t i = 0; i < served.size(); ++i)
        {
            if (!served[i])
            {
                errors.push_back("movement group " + movementGroupName(movementGroupAt(i)) + " is never served");
            }
        }

        return errors;
    }

} // namespace junction
