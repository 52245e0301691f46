#pragma once

#include "Geometry.hpp"
#include "SimulationConfig.hpp"

#include <cstddef>
#include <vector>

namespace junction
{
    using Path = std::vector<Vec2>;

    // Builds the waypoint route of every movement group. Turning routes are three equal
    // phases (approach straight, quarter arc, departure straight); straight routes are a
    // single run across the whole area.
    class PathSynthesizer
    {
    public:
        // Throws std::invalid_argument when the configuration cannot produce aligned phases
        explicit PathSynthesizer(const SimulationConfig &config);

        Path synthesize(Origin origin, Direction direction) const;

        Vec2 spawnPosition(Origin origin, Direction direction) const;
        static double spawnHeading(Origin origin);

        // Waypoint a vehicle holds at when it lacks right-of-way
        std::size_t intersectionIndex(Direction direction) const;
        std::size_t pathLength() const { return config.path_points; }

        const SimulationConfig &getConfig() const { return config; }

    private:
        Path approachThird(Origin origin, Direction direction) const;
        Path straightPath(Origin origin) const;
        Path leftTurnPath(Origin origin) const;
        Path rightTurnPath(Origin origin) const;
        Vec2 middle() const;

        SimulationConfig config;
    };

} // namespace junction
