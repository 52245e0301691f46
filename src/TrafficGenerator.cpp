#include "TrafficGenerator.hpp"

#include <algorithm>

namespace junction
{

    TrafficGenerator::TrafficGenerator(const TrafficConfig &config)
        : config(config), ticks_accumulated(0), next_vehicle_id(1),
          total_generated(0), total_spawned(0), total_dropped(0)
    {
    }

    void TrafficGenerator::reset()
    {
        ticks_accumulated = 0;
        next_vehicle_id = 1;
        total_generated = 0;
        total_spawned = 0;
        total_dropped = 0;
        for (auto &queue : backlog)
        {
            queue.clear();
        }
    }

    Direction TrafficGenerator::chooseDirection(uint32_t vehicle_id) const
    {
        const uint32_t roll = (vehicle_id % 10) * 10;
        if (roll < config.straight_percent)
            return Direction::Straight;
        if (roll < config.straight_percent + config.right_percent)
            return Direction::Right;
        return Direction::Left;
    }

    bool TrafficGenerator::enqueue(const MovementGroup &group)
    {
        const std::size_t index = movementGroupIndex(group);
        if (index >= backlog.size())
        {
            return false;
        }

        total_generated += 1;
        if (backlog[index].size() >= config.max_backlog_per_group)
        {
            total_dropped += 1;
            return false;
        }
        backlog[index].push_back(allocateId());
        return true;
    }

    bool TrafficGenerator::isSpawnPointClear(const MovementGroup &group, const std::vector<Vehicle> &vehicles,
                                             const PathSynthesizer &paths) const
    {
        const Vec2 spawn = paths.spawnPosition(group.origin, group.direction);
        const double gap = followingGap(paths.getConfig());
        return std::none_of(vehicles.begin(), vehicles.end(),
                            [&](const Vehicle &vehicle)
                            {
                                return vehicle.getGroup() == group && distance(vehicle.getPosition(), spawn) <= gap;
                            });
    }

    std::size_t TrafficGenerator::generateTraffic(std::vector<Vehicle> &vehicles, const PathSynthesizer &paths)
    {
        ticks_accumulated += 1;
        if (config.spawn_interval_ticks > 0 && ticks_accumulated >= config.spawn_interval_ticks)
        {
            ticks_accumulated = 0;

            const Origin origins[] = {Origin::North, Origin::South, Origin::East, Origin::West};
            for (Origin origin : origins)
            {
                // The id the vehicle would receive decides its maneuver
                enqueue({origin, chooseDirection(next_vehicle_id)});
            }
        }

        std::size_t released = 0;
        for (std::size_t index = 0; index < backlog.size(); ++index)
        {
            auto &queue = backlog[index];
            if (queue.empty())
            {
                continue;
            }

            const MovementGroup group = movementGroupAt(index);
            if (!isSpawnPointClear(group, vehicles, paths))
            {
                continue;
            }

            vehicles.emplace_back(queue.front(), group.origin, group.direction, paths);
            queue.pop_front();
            released += 1;
        }

        total_spawned += released;
        return released;
    }

    std::size_t TrafficGenerator::getBacklog(const MovementGroup &group) const
    {
        const std::size_t index = movementGroupIndex(group);
        return index < backlog.size() ? backlog[index].size() : 0;
    }

    std::size_t TrafficGenerator::getTotalBacklog() const
    {
        std::size_t total = 0;
        for (const auto &queue : backlog)
        {
            total += queue.size();
        }
        return total;
    }

} // namespace junction
