#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace junction
{
    enum class Origin : uint8_t
    {
        North = 0,
        South = 1,
        East = 2,
        West = 3
    };

    enum class Direction : uint8_t
    {
        Left = 0,
        Right = 1,
        Straight = 2
    };

    struct MovementGroup
    {
        Origin origin = Origin::North;
        Direction direction = Direction::Straight;
    };

    inline bool operator==(const MovementGroup &a, const MovementGroup &b)
    {
        return a.origin == b.origin && a.direction == b.direction;
    }

    inline bool operator!=(const MovementGroup &a, const MovementGroup &b)
    {
        return !(a == b);
    }

    constexpr std::size_t ORIGIN_COUNT = 4;
    constexpr std::size_t DIRECTION_COUNT = 3;
    constexpr std::size_t MOVEMENT_GROUP_COUNT = ORIGIN_COUNT * DIRECTION_COUNT;

    inline bool isValidMovementGroup(const MovementGroup &group)
    {
        return static_cast<std::size_t>(group.origin) < ORIGIN_COUNT &&
               static_cast<std::size_t>(group.direction) < DIRECTION_COUNT;
    }

    // Dense index in [0, MOVEMENT_GROUP_COUNT); invalid groups map to MOVEMENT_GROUP_COUNT
    inline std::size_t movementGroupIndex(const MovementGroup &group)
    {
        if (!isValidMovementGroup(group))
        {
            return MOVEMENT_GROUP_COUNT;
        }
        return static_cast<std::size_t>(group.origin) * DIRECTION_COUNT + static_cast<std::size_t>(group.direction);
    }

    inline MovementGroup movementGroupAt(std::size_t index)
    {
        return {static_cast<Origin>(index / DIRECTION_COUNT), static_cast<Direction>(index % DIRECTION_COUNT)};
    }

    inline std::array<MovementGroup, MOVEMENT_GROUP_COUNT> allMovementGroups()
    {
        std::array<MovementGroup, MOVEMENT_GROUP_COUNT> groups{};
        for (std::size_t i = 0; i < MOVEMENT_GROUP_COUNT; ++i)
        {
            groups[i] = movementGroupAt(i);
        }
        return groups;
    }

    // Maneuver encoding used by spawners: 0 = left, 1 = right, 2 = straight
    inline Direction directionFromIndex(std::size_t index)
    {
        switch (index)
        {
        case 0:
            return Direction::Left;
        case 1:
            return Direction::Right;
        case 2:
            return Direction::Straight;
        }
        throw std::invalid_argument("invalid direction index: " + std::to_string(index));
    }

    // Lane counted from the middle of the road: left-turn lane innermost
    inline std::size_t laneOffset(Direction direction)
    {
        switch (direction)
        {
        case Direction::Left:
            return 0;
        case Direction::Straight:
            return 1;
        case Direction::Right:
            return 2;
        }
        return 1;
    }

    inline bool areOpposing(Origin a, Origin b)
    {
        return (a == Origin::North && b == Origin::South) ||
               (a == Origin::South && b == Origin::North) ||
               (a == Origin::East && b == Origin::West) ||
               (a == Origin::West && b == Origin::East);
    }

    // Edge of the simulated area a movement leaves through
    inline Origin destinationFor(Origin from, Direction direction)
    {
        switch (from)
        {
        case Origin::North:
            if (direction == Direction::Straight)
                return Origin::South;
            if (direction == Direction::Left)
                return Origin::East;
            return Origin::West;
        case Origin::South:
            if (direction == Direction::Straight)
                return Origin::North;
            if (direction == Direction::Left)
                return Origin::West;
            return Origin::East;
        case Origin::East:
            if (direction == Direction::Straight)
                return Origin::West;
            if (direction == Direction::Left)
                return Origin::South;
            return Origin::North;
        case Origin::West:
            if (direction == Direction::Straight)
                return Origin::East;
            if (direction == Direction::Left)
                return Origin::North;
            return Origin::South;
        }
        return from;
    }

    std::string originToString(Origin origin);
    bool originFromString(const std::string &value, Origin &origin);
    std::string directionToString(Direction direction);
    bool directionFromString(const std::string &value, Direction &direction);
    std::string movementGroupName(const MovementGroup &group);

    struct SimulationConfig
    {
        double width = 1000.0;
        double height = 1000.0;
        std::size_t path_points = 24; // must be divisible by 3

        double car_length = 50.0; // footprint along the heading
        double car_width = 33.0;

        double max_speed = 5.0;
        double acceleration = 0.15;
        double deceleration = 0.3;

        double waypoint_threshold = 5.0;
        double coincident_epsilon = 3.0;
        double turn_smoothing = 0.5;
    };

    inline double laneWidth(const SimulationConfig &config)
    {
        return config.car_width * 2.0;
    }

    inline double followingGap(const SimulationConfig &config)
    {
        return config.car_length * 2.0;
    }

    struct PhaseConfig
    {
        std::string name;
        std::vector<MovementGroup> groups;
    };

    struct ControllerConfig
    {
        uint32_t green_ticks = 300;
        uint32_t yellow_ticks = 90;
        uint32_t clearance_ticks = 30;
        uint32_t max_clearance_ticks = 180;
        bool skip_idle_phases = true;
        std::vector<PhaseConfig> phases;
    };

    struct TrafficConfig
    {
        uint32_t spawn_interval_ticks = 60;
        std::size_t max_backlog_per_group = 10;
        uint32_t straight_percent = 60;
        uint32_t right_percent = 20;
    };

    struct JunctionConfig
    {
        SimulationConfig simulation;
        ControllerConfig controller;
        TrafficConfig traffic;
    };

    inline ControllerConfig makeDefaultControllerConfig()
    {
        ControllerConfig config;
        config.phases = {
            {"north-south through",
             {{Origin::North, Direction::Straight}, {Origin::North, Direction::Right},
              {Origin::South, Direction::Straight}, {Origin::South, Direction::Right}}},
            {"north-south left",
             {{Origin::North, Direction::Left}, {Origin::South, Direction::Left},
              {Origin::East, Direction::Right}, {Origin::West, Direction::Right}}},
            {"east-west through",
             {{Origin::East, Direction::Straight}, {Origin::East, Direction::Right},
              {Origin::West, Direction::Straight}, {Origin::West, Direction::Right}}},
            {"east-west left",
             {{Origin::East, Direction::Left}, {Origin::West, Direction::Left},
              {Origin::North, Direction::Right}, {Origin::South, Direction::Right}}}};
        return config;
    }

    inline JunctionConfig makeDefaultJunctionConfig()
    {
        JunctionConfig config;
        config.controller = makeDefaultControllerConfig();
        return config;
    }

    // Every violated invariant, empty when the configuration is usable
    std::vector<std::string> validateSimulationConfig(const SimulationConfig &config);
    std::vector<std::string> validateJunctionConfig(const JunctionConfig &config);

} // namespace junction
