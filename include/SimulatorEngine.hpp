#pragma once

#include "PathSynthesizer.hpp"
#include "SafetyChecker.hpp"
#include "SimulationConfig.hpp"
#include "TrafficGenerator.hpp"
#include "TrafficLightControllers.hpp"
#include "Vehicle.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace junction
{
    struct SimulatorMetrics
    {
        uint64_t ticks = 0;
        size_t vehicles_generated = 0;
        size_t vehicles_spawned = 0;
        size_t vehicles_finished = 0;
        size_t vehicles_active = 0;
        size_t overlapping_vehicles = 0;
        std::array<size_t, MOVEMENT_GROUP_COUNT> waiting{};
        size_t backlog = 0;
        size_t safety_violations = 0;
    };

    class SimulatorEngine
    {
    public:
        enum class ControlMode
        {
            Phased,
            NullControl
        };

        enum class UICommand
        {
            Start,
            Stop,
            Reset,
            Step
        };

        // Throws std::invalid_argument when the configuration violates an invariant
        explicit SimulatorEngine(const JunctionConfig &config = makeDefaultJunctionConfig());

        void simulate(uint64_t ticks);
        void tick();

        // Places a vehicle at its group's spawn point right away and returns its id
        uint32_t spawnVehicle(Origin origin, Direction direction);

        const std::vector<Vehicle> &getVehicles() const;
        IntersectionState getCurrentLightState() const;
        SimulatorMetrics getMetrics() const;
        std::string getSnapshotJson() const;

        void reset();
        void start();
        void stop();
        bool isRunning() const;
        void handleCommand(UICommand command);

        void setControlMode(ControlMode mode);
        ControlMode getControlMode() const;
        void setController(std::unique_ptr<ITrafficLightController> custom_controller, ControlMode mode);
        ITrafficLightController &getController();

        const JunctionConfig &getConfig() const;
        const PathSynthesizer &getPaths() const;

    private:
        void updateVehicles();
        void collectFinished();
        void checkSafety(const IntersectionState &previous);

        JunctionConfig config;
        PathSynthesizer paths;
        SafetyChecker checker;
        std::unique_ptr<ITrafficLightController> controller;
        ControlMode control_mode;
        TrafficGenerator traffic;

        std::vector<Vehicle> vehicles;
        uint64_t tick_count = 0;
        bool running = false;
        size_t vehicles_finished = 0;
        size_t safety_violations = 0;
    };

} // namespace junction
