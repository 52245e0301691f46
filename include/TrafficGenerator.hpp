#pragma once

#include "PathSynthesizer.hpp"
#include "SimulationConfig.hpp"
#include "Vehicle.hpp"

#include <array>
#include <cstdint>
#include <deque>
#include <vector>

namespace junction
{

    // Deterministic arrivals: every spawn interval each origin queues one vehicle, its maneuver
    // picked from its id. Queued vehicles enter the area once their spawn point is free.
    class TrafficGenerator
    {
    public:
        explicit TrafficGenerator(const TrafficConfig &config = TrafficConfig{});

        // Advances one tick; appends released vehicles to `vehicles` and returns how many
        std::size_t generateTraffic(std::vector<Vehicle> &vehicles, const PathSynthesizer &paths);

        // Queues a vehicle of the given group; false when its backlog is full
        bool enqueue(const MovementGroup &group);

        uint32_t allocateId() { return next_vehicle_id++; }

        Direction chooseDirection(uint32_t vehicle_id) const;
        bool isSpawnPointClear(const MovementGroup &group, const std::vector<Vehicle> &vehicles,
                               const PathSynthesizer &paths) const;

        std::size_t getBacklog(const MovementGroup &group) const;
        std::size_t getTotalBacklog() const;
        std::size_t getTotalGenerated() const { return total_generated; }
        std::size_t getTotalSpawned() const { return total_spawned; }
        std::size_t getTotalDropped() const { return total_dropped; }

        void reset();

    private:
        TrafficConfig config;
        uint32_t ticks_accumulated;
        uint32_t next_vehicle_id;
        std::size_t total_generated;
        std::size_t total_spawned;
        std::size_t total_dropped;

        // Pending vehicle ids per movement group
        std::array<std::deque<uint32_t>, MOVEMENT_GROUP_COUNT> backlog;
    };

} // namespace junction
