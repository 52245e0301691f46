#include "SimulationConfig.hpp"
#include "SafetyChecker.hpp"

#include <utility>

namespace junction
{
    std::string originToString(Origin origin)
    {
        switch (origin)
        {
        case Origin::North:
            return "north";
        case Origin::South:
            return "south";
        case Origin::East:
            return "east";
        case Origin::West:
            return "west";
        }
        return "north";
    }

    bool originFromString(const std::string &value, Origin &origin)
    {
        if (value == "north")
        {
            origin = Origin::North;
            return true;
        }
        if (value == "south")
        {
            origin = Origin::South;
            return true;
        }
        if (value == "east")
        {
            origin = Origin::East;
            return true;
        }
        if (value == "west")
        {
            origin = Origin::West;
            return true;
        }
        return false;
    }

    std::string directionToString(Direction direction)
    {
        switch (direction)
        {
        case Direction::Left:
            return "left";
        case Direction::Right:
            return "right";
        case Direction::Straight:
            return "straight";
        }
        return "straight";
    }

    bool directionFromString(const std::string &value, Direction &direction)
    {
        if (value == "left")
        {
            direction = Direction::Left;
            return true;
        }
        if (value == "right")
        {
            direction = Direction::Right;
            return true;
        }
        if (value == "straight")
        {
            direction = Direction::Straight;
            return true;
        }
        return false;
    }

    std::string movementGroupName(const MovementGroup &group)
    {
        if (!isValidMovementGroup(group))
        {
            return "invalid";
        }
        return originToString(group.origin) + "-" + directionToString(group.direction);
    }

    std::vector<std::string> validateSimulationConfig(const SimulationConfig &config)
    {
        std::vector<std::string> errors;

        if (config.width <= 0.0 || config.height <= 0.0)
        {
            errors.push_back("width and height must be positive");
        }
        if (config.path_points < 3 || config.path_points % 3 != 0)
        {
            errors.push_back("path_points must be a positive multiple of 3");
        }
        if (config.car_length <= 0.0 || config.car_width <= 0.0)
        {
            errors.push_back("car_length and car_width must be positive");
        }
        if (config.max_speed <= 0.0)
        {
            errors.push_back("max_speed must be positive");
        }
        if (config.acceleration <= 0.0 || config.deceleration <= 0.0)
        {
            errors.push_back("acceleration and deceleration must be positive");
        }
        if (config.waypoint_threshold <= 0.0)
        {
            errors.push_back("waypoint_threshold must be positive");
        }
        else if (config.max_speed >= config.waypoint_threshold * 2.0)
        {
            // A single step could otherwise jump over a waypoint's capture radius
            errors.push_back("max_speed must be below twice waypoint_threshold");
        }

        // Approach thirds run from the spawn edge to three lanes short of the middle
        const double approach_x = config.width / 2.0 - laneWidth(config) * 3.0 + config.car_length / 2.0;
        const double approach_y = config.height / 2.0 - laneWidth(config) * 3.0 + config.car_length / 2.0;
        if (approach_x <= 0.0 || approach_y <= 0.0)
        {
            errors.push_back("width and height must leave room for three lanes on each approach");
        }
        if (config.coincident_epsilon < 0.0 || config.coincident_epsilon >= followingGap(config))
        {
            errors.push_back("coincident_epsilon must lie in [0, following gap)");
        }
        if (config.turn_smoothing <= 0.0 || config.turn_smoothing > 1.0)
        {
            errors.push_back("turn_smoothing must lie in (0, 1]");
        }

        return errors;
    }

    std::vector<std::string> validateJunctionConfig(const JunctionConfig &config)
    {
        std::vector<std::string> errors = validateSimulationConfig(config.simulation);

        SafetyChecker checker;
        for (auto &error : checker.validatePhasePlan(config.controller))
        {
            errors.push_back(std::move(error));
        }

        if (config.traffic.spawn_interval_ticks == 0)
        {
            errors.push_back("spawn_interval_ticks must be positive");
        }
        if (config.traffic.straight_percent > 100 ||
            config.traffic.right_percent > 100 - config.traffic.straight_percent)
        {
            errors.push_back("straight_percent + right_percent must not exceed 100");
        }

        return errors;
    }

} // namespace junction
