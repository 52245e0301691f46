#include "PathSynthesizer.hpp"

#include <cmath>
#include <stdexcept>

namespace junction
{
    namespace
    {
        // Origin whose approach lane a turning vehicle leaves along
        Origin leftTurnExitOrigin(Origin origin)
        {
            switch (origin)
            {
            case Origin::North:
                return Origin::West;
            case Origin::South:
                return Origin::East;
            case Origin::East:
                return Origin::North;
            case Origin::West:
                return Origin::South;
            }
            return origin;
        }

        Origin rightTurnExitOrigin(Origin origin)
        {
            switch (origin)
            {
            case Origin::North:
                return Origin::East;
            case Origin::South:
                return Origin::West;
            case Origin::East:
                return Origin::South;
            case Origin::West:
                return Origin::North;
            }
            return origin;
        }
    }

    PathSynthesizer::PathSynthesizer(const SimulationConfig &config)
        : config(config)
    {
        const auto errors = validateSimulationConfig(config);
        if (!errors.empty())
        {
            throw std::invalid_argument("invalid simulation config: " + errors.front());
        }
    }

    Vec2 PathSynthesizer::middle() const
    {
        return {config.width / 2.0, config.height / 2.0};
    }

    Vec2 PathSynthesizer::spawnPosition(Origin origin, Direction direction) const
    {
        const Vec2 mid = middle();
        const double lane = laneWidth(config);
        const double offset = static_cast<double>(laneOffset(direction));
        const double half_car = config.car_length / 2.0;

        switch (origin)
        {
        case Origin::North:
            return {mid.x - lane / 2.0 - offset * lane, -half_car};
        case Origin::South:
            return {mid.x + lane / 2.0 + offset * lane, config.height + half_car};
        case Origin::East:
            return {config.width + half_car, mid.y - lane / 2.0 - offset * lane};
        case Origin::West:
            return {-half_car, mid.y + lane / 2.0 + offset * lane};
        }
        return mid;
    }

    double PathSynthesizer::spawnHeading(Origin origin)
    {
        switch (origin)
        {
        case Origin::North:
            return 90.0;
        case Origin::South:
            return 270.0;
        case Origin::East:
            return 180.0;
        case Origin::West:
            return 0.0;
        }
        return 0.0;
    }

    std::size_t PathSynthesizer::intersectionIndex(Direction direction) const
    {
        return config.path_points / 3 + (direction == Direction::Straight ? 1 : 0);
    }

    Path PathSynthesizer::synthesize(Origin origin, Direction direction) const
    {
        switch (direction)
        {
        case Direction::Left:
            return leftTurnPath(origin);
        case Direction::Right:
            return rightTurnPath(origin);
        case Direction::Straight:
            return straightPath(origin);
        }
        throw std::invalid_argument("invalid direction");
    }

    Path PathSynthesizer::approachThird(Origin origin, Direction direction) const
    {
        const std::size_t count = config.path_points / 3;
        const double lane = laneWidth(config);
        const double half_car = config.car_length / 2.0;
        const double vertical_gap = (config.height / 2.0 - lane * 3.0 + half_car) / static_cast<double>(count);
        const double horizontal_gap = (config.width / 2.0 - lane * 3.0 + half_car) / static_cast<double>(count);
        const Vec2 start = spawnPosition(origin, direction);

        Path points;
        points.reserve(count);
        for (std::size_t i = 0; i < count; ++i)
        {
            const double step = static_cast<double>(i);
            switch (origin)
            {
            case Origin::North:
                points.push_back({start.x, start.y + step * vertical_gap});
                break;
            case Origin::South:
                points.push_back({start.x, start.y - step * vertical_gap});
                break;
            case Origin::East:
                points.push_back({start.x - step * horizontal_gap, start.y});
                break;
            case Origin::West:
                points.push_back({start.x + step * horizontal_gap, start.y});
                break;
            }
        }
        return points;
    }

    Path PathSynthesizer::straightPath(Origin origin) const
    {
        const std::size_t count = config.path_points;
        const double half_car = config.car_length / 2.0;
        const double vertical_gap = (config.height + half_car) / static_cast<double>(count);
        const double horizontal_gap = (config.width + half_car) / static_cast<double>(count);
        const Vec2 start = spawnPosition(origin, Direction::Straight);

        Path points;
        points.reserve(count);
        for (std::size_t i = 0; i < count; ++i)
        {
            const double step = static_cast<double>(i);
            switch (origin)
            {
            case Origin::North:
                points.push_back({start.x, start.y + step * vertical_gap});
                break;
            case Origin::South:
                points.push_back({start.x, start.y - step * vertical_gap});
                break;
            case Origin::East:
                points.push_back({start.x - step * horizontal_gap, start.y});
                break;
            case Origin::West:
                points.push_back({start.x + step * horizontal_gap, start.y});
                break;
            }
        }
        return points;
    }

    Path PathSynthesizer::leftTurnPath(Origin origin) const
    {
        const Vec2 mid = middle();
        const double lane = laneWidth(config);
        const double radius = lane * 3.5;
        const std::size_t count = config.path_points / 3;

        Path path = approachThird(origin, Direction::Left);

        Vec2 center;
        switch (origin)
        {
        case Origin::North:
            center = {mid.x + lane * 3.0, mid.y - lane * 3.0};
            break;
        case Origin::South:
            center = {mid.x - lane * 3.0, mid.y + lane * 3.0};
            break;
        case Origin::East:
            center = {mid.x + lane * 3.0, mid.y + lane * 3.0};
            break;
        case Origin::West:
            center = {mid.x - lane * 3.0, mid.y - lane * 3.0};
            break;
        }

        const double base_angle = origin == Origin::North ? -PI / 2.0 : PI / 2.0;
        Path arc;
        arc.reserve(count);
        for (std::size_t i = 0; i < count; ++i)
        {
            const double angle = static_cast<double>(i) / static_cast<double>(count) * PI / 2.0 + base_angle;
            switch (origin)
            {
            case Origin::North:
            case Origin::South:
                arc.push_back({center.x - std::cos(angle) * radius, center.y - std::sin(angle) * radius});
                break;
            case Origin::East:
                arc.push_back({center.x - std::sin(angle) * radius, center.y + std::cos(angle) * radius});
                break;
            case Origin::West:
                arc.push_back({center.x + std::sin(angle) * radius, center.y - std::cos(angle) * radius});
                break;
            }
        }
        // Sampled from the exit side; driven from the entry side
        path.insert(path.end(), arc.rbegin(), arc.rend());

        // Departure reuses the innermost approach lane of the exit edge, shifted across the junction
        Path departure = approachThird(leftTurnExitOrigin(origin), Direction::Left);
        for (Vec2 &point : departure)
        {
            switch (origin)
            {
            case Origin::North:
                point.x += mid.x + lane * 4.0;
                break;
            case Origin::South:
                point.x -= mid.x + lane * 4.0;
                break;
            case Origin::East:
                point.y += mid.y + lane * 4.0;
                break;
            case Origin::West:
                point.y -= mid.y + lane * 4.0;
                break;
            }
        }
        path.insert(path.end(), departure.begin(), departure.end());
        return path;
    }

    Path PathSynthesizer::rightTurnPath(Origin origin) const
    {
        const Vec2 mid = middle();
        const double lane = laneWidth(config);
        const double radius = lane / 2.0;
        const std::size_t count = config.path_points / 3;

        Path path = approachThird(origin, Direction::Right);

        Vec2 center;
        switch (origin)
        {
        case Origin::North:
            center = {mid.x - lane * 3.0, mid.y - lane * 3.0};
            break;
        case Origin::South:
            center = {mid.x + lane * 3.0, mid.y + lane * 3.0};
            break;
        case Origin::East:
            center = {mid.x + lane * 3.0, mid.y - lane * 3.0};
            break;
        case Origin::West:
            center = {mid.x - lane * 3.0, mid.y + lane * 3.0};
            break;
        }

        for (std::size_t i = 0; i < count; ++i)
        {
            const double angle = static_cast<double>(i) / static_cast<double>(count) * PI / 2.0;
            switch (origin)
            {
            case Origin::North:
                path.push_back({center.x + std::cos(angle) * radius, center.y + std::sin(angle) * radius});
                break;
            case Origin::South:
                path.push_back({center.x - std::cos(angle) * radius, center.y - std::sin(angle) * radius});
                break;
            case Origin::East:
                path.push_back({center.x - std::sin(angle) * radius, center.y + std::cos(angle) * radius});
                break;
            case Origin::West:
                path.push_back({center.x + std::sin(angle) * radius, center.y - std::cos(angle) * radius});
                break;
            }
        }

        // Departure reuses the outermost approach lane of the exit edge
        Path departure = approachThird(rightTurnExitOrigin(origin), Direction::Right);
        for (Vec2 &point : departure)
        {
            switch (origin)
            {
            case Origin::North:
                point.x -= mid.x + lane * 4.0;
                break;
            case Origin::South:
                point.x += mid.x + lane * 4.0;
                break;
            case Origin::East:
                point.y -= mid.y + lane * 4.0;
                break;
            case Origin::West:
                point.y += mid.y + lane * 4.0;
                break;
            }
        }
        path.insert(path.end(), departure.begin(), departure.end());
        return path;
    }

} // namespace junction
