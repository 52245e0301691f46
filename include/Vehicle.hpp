#pragma once

#include "Geometry.hpp"
#include "PathSynthesizer.hpp"
#include "SimulationConfig.hpp"
#include "TrafficLightControllers.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace junction
{

    class Vehicle
    {
    public:
        Vehicle(uint32_t id, Origin origin, Direction direction, const PathSynthesizer &paths);

        // One simulation tick. `peers` is read only; the vehicle mutates nothing but itself
        // and the reservation it holds in `lights`.
        void update(const std::vector<Vehicle> &peers, ITrafficLightController &lights);

        uint32_t getId() const { return id; }
        Origin getOrigin() const { return origin; }
        Direction getDirection() const { return direction; }
        MovementGroup getGroup() const { return {origin, direction}; }
        CarTicket getTicket() const { return {origin, direction, id}; }

        Vec2 getPosition() const { return position; }
        double getHeading() const { return heading; }
        double getTargetHeading() const { return target_heading; }
        double getSpeed() const { return speed; }

        bool isStopped() const { return stopped_for_light || stopped_for_collision; }
        bool isStoppedForLight() const { return stopped_for_light; }
        bool isStoppedForCollision() const { return stopped_for_collision; }
        bool isThroughIntersection() const { return through_intersection; }
        bool isFinished() const { return finished; }

        const Path &getPath() const { return path; }
        std::size_t getPathIndex() const { return path_index; }
        std::size_t getIntersectionIndex() const { return intersection_index; }
        std::optional<std::size_t> getRedStopIndex() const { return red_stop_index; }

        Quad vertices() const;
        bool overlaps(const Vehicle &other) const;
        // Render feedback only, never feeds back into the simulation
        bool overlapsAny(const std::vector<Vehicle> &peers) const;

        // Distance to the nearest same-group vehicle ahead, or infinity when there is none
        double distanceToClosestAhead(const std::vector<Vehicle> &peers) const;

        // Scenario placement
        void setPathIndex(std::size_t index);
        void setPosition(const Vec2 &value) { position = value; }
        void setHeading(double degrees) { heading = degrees; }
        void setTargetHeading(double degrees) { target_heading = degrees; }

    private:
        bool pastIntersection() const { return path_index > intersection_index; }
        bool isAhead(const Vec2 &other) const;
        bool reachedWaypoint(const Vec2 &point) const;

        void stopForTrafficLight(ITrafficLightController &lights);
        void stopForVehicleAhead(const std::vector<Vehicle> &peers);
        void updateSpeed();
        void advanceAlongPath();

        SimulationConfig config;

        uint32_t id;
        Origin origin;
        Direction direction;

        Vec2 position;
        double heading;
        double target_heading;
        double speed = 0.0;

        bool stopped_for_light = false;
        bool stopped_for_collision = false;

        Path path;
        std::size_t path_index = 1;
        std::size_t intersection_index;
        std::optional<std::size_t> red_stop_index;
        bool through_intersection = false;
        bool finished = false;
    };

} // namespace junction
