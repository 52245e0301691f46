#include "Vehicle.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace junction
{

    Vehicle::Vehicle(uint32_t id, Origin origin, Direction direction, const PathSynthesizer &paths)
        : config(paths.getConfig()),
          id(id),
          origin(origin),
          direction(direction),
          position(paths.spawnPosition(origin, direction)),
          heading(PathSynthesizer::spawnHeading(origin)),
          target_heading(heading),
          path(paths.synthesize(origin, direction)),
          intersection_index(paths.intersectionIndex(direction))
    {
    }

    void Vehicle::update(const std::vector<Vehicle> &peers, ITrafficLightController &lights)
    {
        if (finished)
        {
            return;
        }

        // Committed past the stop line: the reservation is no longer needed
        if (!through_intersection && pastIntersection())
        {
            through_intersection = true;
            lights.removeCar(getTicket());
        }

        // Already waiting at the stop line when the group turns yellow: go rather than stall
        if (!through_intersection && lights.isYellow(origin, direction) && path_index == intersection_index)
        {
            lights.removeCar(getTicket());
            through_intersection = true;
        }

        stopForTrafficLight(lights);
        stopForVehicleAhead(peers);
        updateSpeed();

        position.x += std::cos(toRadians(heading)) * speed;
        position.y += std::sin(toRadians(heading)) * speed;

        advanceAlongPath();

        heading = interpolateHeading(heading, target_heading, config.turn_smoothing);
    }

    void Vehicle::stopForTrafficLight(ITrafficLightController &lights)
    {
        if (through_intersection)
        {
            stopped_for_light = false;
            stopped_for_collision = false;
            red_stop_index.reset();
            return;
        }

        bool can_go = lights.isGreen(getTicket());
        if (!can_go && pastIntersection())
        {
            can_go = true;
        }

        if (can_go)
        {
            red_stop_index.reset();
        }
        else if (!stopped_for_light)
        {
            red_stop_index = path_index;
        }

        stopped_for_light = !can_go;
    }

    void Vehicle::stopForVehicleAhead(const std::vector<Vehicle> &peers)
    {
        if (through_intersection)
        {
            return;
        }

        const double closest = distanceToClosestAhead(peers);
        const double gap = followingGap(config);

        // Vehicles sitting on the same spot (fresh spawns) are ignored
        if (!isStopped() && closest < gap && closest > config.coincident_epsilon)
        {
            stopped_for_collision = true;
        }
        else if (stopped_for_collision && closest > gap)
        {
            stopped_for_collision = false;
        }
    }

    void Vehicle::updateSpeed()
    {
        if (!isStopped())
        {
            speed = std::min(speed + config.acceleration, config.max_speed);
        }
        else
        {
            speed = std::max(speed - config.deceleration, 0.0);
        }
    }

    void Vehicle::advanceAlongPath()
    {
        if (!reachedWaypoint(path[path_index]))
        {
            return;
        }

        path_index += 1;
        if (path_index >= path.size())
        {
            path_index = 0;
            finished = true;
        }

        if (path_index >= 1)
        {
            const Vec2 &target = path[path_index];
            target_heading = toDegrees(std::atan2(target.y - position.y, target.x - position.x));
        }
    }

    bool Vehicle::reachedWaypoint(const Vec2 &point) const
    {
        return distance(position, point) < config.waypoint_threshold;
    }

    bool Vehicle::isAhead(const Vec2 &other) const
    {
        switch (origin)
        {
        case Origin::North:
            return other.y >= position.y;
        case Origin::South:
            return other.y <= position.y;
        case Origin::East:
            return other.x <= position.x;
        case Origin::West:
            return other.x >= position.x;
        }
        return false;
    }

    double Vehicle::distanceToClosestAhead(const std::vector<Vehicle> &peers) const
    {
        double closest = std::numeric_limits<double>::infinity();
        for (const Vehicle &other : peers)
        {
            if (other.id == id || other.origin != origin || other.direction != direction)
            {
                continue;
            }
            if (!isAhead(other.position))
            {
                continue;
            }
            closest = std::min(closest, distance(position, other.position));
        }
        return closest;
    }

    Quad Vehicle::vertices() const
    {
        return rectangleVertices(position, heading, config.car_length, config.car_width);
    }

    bool Vehicle::overlaps(const Vehicle &other) const
    {
        return rectanglesOverlap(vertices(), other.vertices());
    }

    bool Vehicle::overlapsAny(const std::vector<Vehicle> &peers) const
    {
        return std::any_of(peers.begin(), peers.end(),
                           [this](const Vehicle &other)
                           { return other.id != id && overlaps(other); });
    }

    void Vehicle::setPathIndex(std::size_t index)
    {
        if (index >= path.size())
        {
            throw std::out_of_range("path index " + std::to_string(index) + " beyond path of " +
                                    std::to_string(path.size()) + " waypoints");
        }
        path_index = index;
    }

} // namespace junction
