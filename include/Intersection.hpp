#pragma once

#include "SimulationConfig.hpp"

#include <array>

namespace junction
{

    enum class LightState
    {
        Red,
        Yellow,
        Green
    };

    struct IntersectionState
    {
        // One signal per movement group, indexed by movementGroupIndex()
        std::array<LightState, MOVEMENT_GROUP_COUNT> lights{};

        LightState of(const MovementGroup &group) const
        {
            const std::size_t index = movementGroupIndex(group);
            return index < lights.size() ? lights[index] : LightState::Red;
        }

        void set(const MovementGroup &group, LightState state)
        {
            const std::size_t index = movementGroupIndex(group);
            if (index < lights.size())
            {
                lights[index] = state;
            }
        }
    };

    inline bool isActive(LightState state)
    {
        return state == LightState::Green || state == LightState::Yellow;
    }

    inline const char *lightStateToString(LightState state)
    {
        switch (state)
        {
        case LightState::Red:
            return "red";
        case LightState::Yellow:
            return "yellow";
        case LightState::Green:
            return "green";
        }
        return "red";
    }

} // namespace junction
