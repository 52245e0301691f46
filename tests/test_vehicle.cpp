#include <catch2/catch_all.hpp>
#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>
#include <vector>
#include "PathSynthesizer.hpp"
#include "TrafficLightControllers.hpp"
#include "Vehicle.hpp"

using namespace junction;

namespace
{
    // Lights driven directly by the test
    class ScriptedLights : public ITrafficLightController
    {
    public:
        bool green = true;
        bool yellow = false;
        std::vector<uint32_t> removed;

        void tick() override {}

        bool isGreen(Origin, Direction) const override { return green; }
        bool isGreen(const CarTicket &car) override
        {
            tracked.insert(car.id);
            return green;
        }
        bool isYellow(Origin, Direction) const override { return yellow; }

        void removeCar(const CarTicket &car) override
        {
            removed.push_back(car.id);
            tracked.erase(car.id);
        }

        bool isTracked(uint32_t car_id) const override { return tracked.count(car_id) > 0; }
        std::size_t waitingCount(const MovementGroup &) const override { return tracked.size(); }

        IntersectionState getCurrentState() const override { return IntersectionState{}; }
        void reset() override
        {
            tracked.clear();
            removed.clear();
        }

    private:
        std::set<uint32_t> tracked;
    };

    void step(Vehicle &vehicle, ITrafficLightController &lights)
    {
        const std::vector<Vehicle> peers{vehicle};
        vehicle.update(peers, lights);
    }
}

TEST_CASE("New vehicle starts at rest at its spawn point", "[vehicle]")
{
    PathSynthesizer paths(SimulationConfig{});
    Vehicle car(1, Origin::North, Direction::Straight, paths);

    REQUIRE(car.getSpeed() == 0.0);
    REQUIRE(car.getHeading() == Catch::Approx(90.0));
    REQUIRE(car.getPathIndex() == 1);
    REQUIRE(car.getIntersectionIndex() == 9);
    REQUIRE(car.getPosition().x == Catch::Approx(401.0));
    REQUIRE(car.getPosition().y == Catch::Approx(-25.0));
    REQUIRE_FALSE(car.isStopped());
    REQUIRE_FALSE(car.isFinished());
}

TEST_CASE("Speed ramps up and stays within bounds", "[vehicle]")
{
    const SimulationConfig config;
    PathSynthesizer paths(config);
    Vehicle car(1, Origin::West, Direction::Straight, paths);
    ScriptedLights lights;

    step(car, lights);
    REQUIRE(car.getSpeed() == Catch::Approx(config.acceleration));
    REQUIRE(car.getPosition().x == Catch::Approx(-25.0 + config.acceleration));

    for (int i = 0; i < 60; ++i)
    {
        step(car, lights);
        REQUIRE(car.getSpeed() >= 0.0);
        REQUIRE(car.getSpeed() <= config.max_speed);
    }
    REQUIRE(car.getSpeed() == Catch::Approx(config.max_speed));
}

TEST_CASE("Red light brings the vehicle to a halt", "[vehicle]")
{
    const SimulationConfig config;
    PathSynthesizer paths(config);
    Vehicle car(1, Origin::North, Direction::Straight, paths);
    ScriptedLights lights;

    for (int i = 0; i < 20; ++i)
    {
        step(car, lights);
    }
    const double cruising = car.getSpeed();
    REQUIRE(cruising == Catch::Approx(20 * config.acceleration));

    lights.green = false;
    step(car, lights);
    REQUIRE(car.isStoppedForLight());
    REQUIRE(car.getSpeed() == Catch::Approx(cruising - config.deceleration));
    REQUIRE(car.getRedStopIndex().has_value());
    REQUIRE(*car.getRedStopIndex() == car.getPathIndex());

    for (int i = 0; i < 20; ++i)
    {
        step(car, lights);
    }
    REQUIRE(car.getSpeed() == 0.0);
    REQUIRE(car.isStoppedForLight());
    REQUIRE_FALSE(car.isThroughIntersection());
}

TEST_CASE("Vehicle waiting on red resumes once green", "[vehicle]")
{
    PathSynthesizer paths(SimulationConfig{});
    Vehicle car(7, Origin::East, Direction::Left, paths);
    ScriptedLights lights;
    lights.green = false;

    step(car, lights);
    const Vec2 held = car.getPosition();
    step(car, lights);
    REQUIRE(car.isStoppedForLight());
    REQUIRE(car.getPosition().x == Catch::Approx(held.x));
    REQUIRE(lights.isTracked(7));

    lights.green = true;
    step(car, lights);
    REQUIRE_FALSE(car.isStopped());
    REQUIRE_FALSE(car.getRedStopIndex().has_value());
    REQUIRE(car.getSpeed() > 0.0);
}

TEST_CASE("Red before the stop line keeps the vehicle stopped", "[vehicle]")
{
    PathSynthesizer paths(SimulationConfig{});
    Vehicle car(1, Origin::South, Direction::Straight, paths);
    ScriptedLights lights;
    lights.green = false;

    car.setPathIndex(car.getIntersectionIndex());
    for (int i = 0; i < 5; ++i)
    {
        step(car, lights);
        REQUIRE(car.isStoppedForLight());
        REQUIRE(car.getSpeed() == 0.0);
    }
    REQUIRE(lights.removed.empty());
}

TEST_CASE("Crossing the stop line releases the reservation", "[vehicle]")
{
    PathSynthesizer paths(SimulationConfig{});
    Vehicle car(3, Origin::South, Direction::Straight, paths);
    ScriptedLights lights;
    lights.green = false;

    step(car, lights);
    REQUIRE(car.isStoppedForLight());
    REQUIRE(lights.isTracked(3));

    car.setPathIndex(car.getIntersectionIndex() + 1);
    step(car, lights);
    REQUIRE(car.isThroughIntersection());
    REQUIRE_FALSE(car.isStopped());
    REQUIRE_FALSE(lights.isTracked(3));
    REQUIRE(lights.removed == std::vector<uint32_t>{3});
    REQUIRE(car.getSpeed() > 0.0);
}

TEST_CASE("Vehicle through the junction never stops for the light", "[vehicle]")
{
    PathSynthesizer paths(SimulationConfig{});
    Vehicle car(4, Origin::West, Direction::Right, paths);
    ScriptedLights lights;

    car.setPathIndex(car.getIntersectionIndex() + 1);
    step(car, lights);
    REQUIRE(car.isThroughIntersection());

    lights.green = false;
    double previous = car.getSpeed();
    for (int i = 0; i < 10; ++i)
    {
        step(car, lights);
        REQUIRE_FALSE(car.isStoppedForLight());
        REQUIRE(car.getSpeed() >= previous);
        previous = car.getSpeed();
    }
    REQUIRE(lights.removed.size() == 1);
}

TEST_CASE("Yellow at the stop line lets the vehicle go", "[vehicle]")
{
    PathSynthesizer paths(SimulationConfig{});
    Vehicle car(5, Origin::North, Direction::Left, paths);
    ScriptedLights lights;
    lights.green = false;
    lights.yellow = true;

    car.setPathIndex(car.getIntersectionIndex());
    step(car, lights);
    REQUIRE(car.isThroughIntersection());
    REQUIRE_FALSE(car.isStopped());
    REQUIRE(lights.removed == std::vector<uint32_t>{5});
}

TEST_CASE("Yellow short of the stop line still stops the vehicle", "[vehicle]")
{
    PathSynthesizer paths(SimulationConfig{});
    Vehicle car(5, Origin::North, Direction::Left, paths);
    ScriptedLights lights;
    lights.green = false;
    lights.yellow = true;

    step(car, lights);
    REQUIRE(car.isStoppedForLight());
    REQUIRE_FALSE(car.isThroughIntersection());
    REQUIRE(lights.removed.empty());
}

TEST_CASE("Follower stops behind a close leader and moves once it pulls away", "[vehicle]")
{
    PathSynthesizer paths(SimulationConfig{});
    ScriptedLights lights;

    Vehicle follower(1, Origin::North, Direction::Straight, paths);
    Vehicle leader(2, Origin::North, Direction::Straight, paths);
    leader.setPosition({follower.getPosition().x, follower.getPosition().y + 60.0});

    follower.update({follower, leader}, lights);
    REQUIRE(follower.isStoppedForCollision());
    REQUIRE_FALSE(follower.isStoppedForLight());
    REQUIRE(follower.getSpeed() == 0.0);
    REQUIRE(follower.distanceToClosestAhead({follower, leader}) == Catch::Approx(60.0));

    // Still inside the following gap
    leader.setPosition({follower.getPosition().x, follower.getPosition().y + 90.0});
    follower.update({follower, leader}, lights);
    REQUIRE(follower.isStoppedForCollision());

    leader.setPosition({follower.getPosition().x, follower.getPosition().y + 150.0});
    follower.update({follower, leader}, lights);
    REQUIRE_FALSE(follower.isStoppedForCollision());
    REQUIRE(follower.getSpeed() > 0.0);
}

TEST_CASE("Vehicles behind or in other groups are ignored", "[vehicle]")
{
    PathSynthesizer paths(SimulationConfig{});
    ScriptedLights lights;

    Vehicle car(1, Origin::North, Direction::Straight, paths);
    Vehicle behind(2, Origin::North, Direction::Straight, paths);
    behind.setPosition({car.getPosition().x, car.getPosition().y - 60.0});
    Vehicle other_lane(3, Origin::North, Direction::Left, paths);
    other_lane.setPosition({car.getPosition().x, car.getPosition().y + 60.0});

    const std::vector<Vehicle> peers{car, behind, other_lane};
    REQUIRE(std::isinf(car.distanceToClosestAhead(peers)));

    car.update(peers, lights);
    REQUIRE_FALSE(car.isStopped());
}

TEST_CASE("Coincident vehicles do not block each other", "[vehicle]")
{
    PathSynthesizer paths(SimulationConfig{});
    ScriptedLights lights;

    Vehicle first(1, Origin::East, Direction::Straight, paths);
    Vehicle second(2, Origin::East, Direction::Straight, paths);

    first.update({first, second}, lights);
    REQUIRE_FALSE(first.isStoppedForCollision());
    REQUIRE(first.getSpeed() > 0.0);
}

TEST_CASE("Vehicle through the junction ignores the vehicle ahead", "[vehicle]")
{
    PathSynthesizer paths(SimulationConfig{});
    ScriptedLights lights;

    Vehicle car(1, Origin::North, Direction::Straight, paths);
    car.setPathIndex(car.getIntersectionIndex() + 1);
    Vehicle leader(2, Origin::North, Direction::Straight, paths);
    leader.setPosition({car.getPosition().x, car.getPosition().y + 60.0});

    car.update({car, leader}, lights);
    REQUIRE(car.isThroughIntersection());
    REQUIRE_FALSE(car.isStoppedForCollision());
}

TEST_CASE("Every maneuver reaches the end of its path", "[vehicle]")
{
    PathSynthesizer paths(SimulationConfig{});

    for (const auto &group : allMovementGroups())
    {
        INFO(movementGroupName(group));
        Vehicle car(1, group.origin, group.direction, paths);
        ScriptedLights lights;

        int ticks = 0;
        while (!car.isFinished() && ticks < 1000)
        {
            step(car, lights);
            REQUIRE(car.getHeading() >= -180.0);
            REQUIRE(car.getHeading() <= 180.0);
            ++ticks;
        }
        REQUIRE(car.isFinished());
        REQUIRE(car.getPathIndex() == 0);
        REQUIRE(lights.removed.size() == 1);

        const Vec2 last = car.getPosition();
        step(car, lights);
        REQUIRE(car.getPosition().x == last.x);
        REQUIRE(car.getPosition().y == last.y);
    }
}

TEST_CASE("Path cursor cannot be placed past the path", "[vehicle]")
{
    PathSynthesizer paths(SimulationConfig{});
    Vehicle car(1, Origin::North, Direction::Right, paths);

    REQUIRE_THROWS_AS(car.setPathIndex(car.getPath().size()), std::out_of_range);
    REQUIRE_NOTHROW(car.setPathIndex(car.getPath().size() - 1));
}

TEST_CASE("Footprints of overlapping vehicles are reported", "[vehicle]")
{
    PathSynthesizer paths(SimulationConfig{});
    Vehicle a(1, Origin::North, Direction::Straight, paths);
    Vehicle b(2, Origin::West, Direction::Straight, paths);

    a.setPosition({500.0, 500.0});
    b.setPosition({510.0, 510.0});
    REQUIRE(a.overlaps(b));
    REQUIRE(a.overlapsAny({a, b}));

    b.setPosition({800.0, 800.0});
    REQUIRE_FALSE(a.overlapsAny({a, b}));
}
