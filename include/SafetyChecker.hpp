#pragma once

#include "Intersection.hpp"
#include "SimulationConfig.hpp"

#include <string>
#include <vector>

namespace junction
{

    class SafetyChecker
    {
    public:
        SafetyChecker() = default;

        // Whether two movement groups may never be active at the same time
        static bool hasMovementConflict(const MovementGroup &a, const MovementGroup &b);

        // No two conflicting groups active (green or yellow)
        bool isSafe(const IntersectionState &state) const;
        bool isValidTransition(const IntersectionState &prev, const IntersectionState &next) const;

        bool isPhaseConflictFree(const std::vector<MovementGroup> &groups) const;
        std::vector<std::string> validatePhasePlan(const ControllerConfig &config) const;

    private:
        bool checkPerLightTransitions(const IntersectionState &prev, const IntersectionState &next) const;
        bool checkGreenOnsets(const IntersectionState &prev, const IntersectionState &next) const;
    };

} // namespace junction
