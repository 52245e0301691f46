#pragma once

#include "Intersection.hpp"
#include "SimulationConfig.hpp"

#include <cstddef>
#include <cstdint>

namespace junction
{
    // The scheduler's view of a car: its movement group plus enough identity to tell
    // same-group cars apart
    struct CarTicket
    {
        Origin origin = Origin::North;
        Direction direction = Direction::Straight;
        uint32_t id = 0;

        MovementGroup group() const { return {origin, direction}; }
    };

    class ITrafficLightController
    {
    public:
        virtual ~ITrafficLightController() = default;

        // Advances phase timing by one simulation tick
        virtual void tick() = 0;

        virtual bool isGreen(Origin origin, Direction direction) const = 0;
        // Registers the car as waiting for its group, then answers like the plain query
        virtual bool isGreen(const CarTicket &car) = 0;
        virtual bool isYellow(Origin origin, Direction direction) const = 0;

        // Releases the car's reservation; unknown cars are ignored
        virtual void removeCar(const CarTicket &car) = 0;

        virtual bool isTracked(uint32_t car_id) const = 0;
        virtual std::size_t waitingCount(const MovementGroup &group) const = 0;

        virtual IntersectionState getCurrentState() const = 0;
        virtual void reset() = 0;
    };

    // Fail-safe fallback: everything red, nothing tracked
    class NullControlController : public ITrafficLightController
    {
    public:
        NullControlController() = default;

        void tick() override {}

        bool isGreen(Origin, Direction) const override { return false; }
        bool isGreen(const CarTicket &) override { return false; }
        bool isYellow(Origin, Direction) const override { return false; }

        void removeCar(const CarTicket &) override {}

        bool isTracked(uint32_t) const override { return false; }
        std::size_t waitingCount(const MovementGroup &) const override { return 0; }

        IntersectionState getCurrentState() const override { return IntersectionState{}; }
        void reset() override {}
    };

} // namespace junction
