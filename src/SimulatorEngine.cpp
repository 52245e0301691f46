#include "SimulatorEngine.hpp"
#include "PhasedLightController.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace junction
{
    namespace
    {
        const JunctionConfig &requireValid(const JunctionConfig &config)
        {
            const auto errors = validateJunctionConfig(config);
            if (!errors.empty())
            {
                throw std::invalid_argument("invalid junction config: " + errors.front());
            }
            return config;
        }
    }

    SimulatorEngine::SimulatorEngine(const JunctionConfig &config)
        : config(requireValid(config)),
          paths(config.simulation),
          controller(std::make_unique<PhasedLightController>(config.controller)),
          control_mode(ControlMode::Phased),
          traffic(config.traffic)
    {
    }

    void SimulatorEngine::simulate(uint64_t ticks)
    {
        reset();
        start();
        for (uint64_t i = 0; i < ticks; ++i)
            tick();
        stop();
    }

    void SimulatorEngine::tick()
    {
        if (!running)
        {
            return;
        }

        const IntersectionState previous = controller->getCurrentState();
        controller->tick();

        traffic.generateTraffic(vehicles, paths);
        updateVehicles();
        collectFinished();
        checkSafety(previous);

        tick_count += 1;
    }

    void SimulatorEngine::updateVehicles()
    {
        // Every vehicle sees its peers as they were at the start of the tick
        const std::vector<Vehicle> peers = vehicles;
        for (Vehicle &vehicle : vehicles)
        {
            vehicle.update(peers, *controller);
        }
    }

    void SimulatorEngine::collectFinished()
    {
        const auto first_finished = std::remove_if(vehicles.begin(), vehicles.end(),
                                                   [](const Vehicle &vehicle)
                                                   { return vehicle.isFinished(); });
        vehicles_finished += static_cast<size_t>(std::distance(first_finished, vehicles.end()));
        vehicles.erase(first_finished, vehicles.end());
    }

    void SimulatorEngine::checkSafety(const IntersectionState &previous)
    {
        const IntersectionState current = controller->getCurrentState();
        if (checker.isSafe(current) && checker.isValidTransition(previous, current))
        {
            return;
        }

        safety_violations++;
        if (control_mode != ControlMode::NullControl)
        {
            setControlMode(ControlMode::NullControl);
        }
    }

    uint32_t SimulatorEngine::spawnVehicle(Origin origin, Direction direction)
    {
        const uint32_t id = traffic.allocateId();
        vehicles.emplace_back(id, origin, direction, paths);
        return id;
    }

    const std::vector<Vehicle> &SimulatorEngine::getVehicles() const
    {
        return vehicles;
    }

    IntersectionState SimulatorEngine::getCurrentLightState() const
    {
        return controller->getCurrentState();
    }

    SimulatorMetrics SimulatorEngine::getMetrics() const
    {
        SimulatorMetrics metrics;
        metrics.ticks = tick_count;
        metrics.vehicles_generated = traffic.getTotalGenerated();
        metrics.vehicles_spawned = traffic.getTotalSpawned();
        metrics.vehicles_finished = vehicles_finished;
        metrics.vehicles_active = vehicles.size();
        metrics.overlapping_vehicles = static_cast<size_t>(
            std::count_if(vehicles.begin(), vehicles.end(),
                          [this](const Vehicle &vehicle)
                          { return vehicle.overlapsAny(vehicles); }));
        for (size_t i = 0; i < MOVEMENT_GROUP_COUNT; ++i)
        {
            metrics.waiting[i] = controller->waitingCount(movementGroupAt(i));
        }
        metrics.backlog = traffic.getTotalBacklog();
        metrics.safety_violations = safety_violations;
        return metrics;
    }

    std::string SimulatorEngine::getSnapshotJson() const
    {
        using nlohmann::json;

        const SimulatorMetrics metrics = getMetrics();
        const IntersectionState lights = getCurrentLightState();

        json root;
        root["tick"] = tick_count;
        root["running"] = running;
        root["control_mode"] = control_mode == ControlMode::Phased ? "phased" : "null";

        json &metrics_json = root["metrics"];
        metrics_json["vehicles_generated"] = metrics.vehicles_generated;
        metrics_json["vehicles_spawned"] = metrics.vehicles_spawned;
        metrics_json["vehicles_finished"] = metrics.vehicles_finished;
        metrics_json["vehicles_active"] = metrics.vehicles_active;
        metrics_json["overlapping_vehicles"] = metrics.overlapping_vehicles;
        metrics_json["backlog"] = metrics.backlog;
        metrics_json["safety_violations"] = metrics.safety_violations;

        root["lights"] = json::object();
        root["waiting"] = json::object();
        for (size_t i = 0; i < MOVEMENT_GROUP_COUNT; ++i)
        {
            const std::string name = movementGroupName(movementGroupAt(i));
            root["lights"][name] = lightStateToString(lights.lights[i]);
            root["waiting"][name] = metrics.waiting[i];
        }

        root["vehicles"] = json::array();
        for (const Vehicle &vehicle : vehicles)
        {
            json vehicle_json;
            vehicle_json["id"] = vehicle.getId();
            vehicle_json["origin"] = originToString(vehicle.getOrigin());
            vehicle_json["direction"] = directionToString(vehicle.getDirection());
            vehicle_json["x"] = vehicle.getPosition().x;
            vehicle_json["y"] = vehicle.getPosition().y;
            vehicle_json["heading"] = vehicle.getHeading();
            vehicle_json["speed"] = vehicle.getSpeed();
            vehicle_json["path_index"] = vehicle.getPathIndex();
            vehicle_json["stopped_for_light"] = vehicle.isStoppedForLight();
            vehicle_json["stopped_for_collision"] = vehicle.isStoppedForCollision();
            vehicle_json["through_intersection"] = vehicle.isThroughIntersection();
            vehicle_json["overlapping"] = vehicle.overlapsAny(vehicles);

            vehicle_json["vertices"] = json::array();
            for (const Vec2 &corner : vehicle.vertices())
            {
                vehicle_json["vertices"].push_back(json::array({corner.x, corner.y}));
            }
            root["vehicles"].push_back(vehicle_json);
        }

        return root.dump();
    }

    void SimulatorEngine::reset()
    {
        tick_count = 0;
        running = false;
        vehicles.clear();
        vehicles_finished = 0;
        safety_violations = 0;
        traffic.reset();
        setControlMode(ControlMode::Phased);
    }

    void SimulatorEngine::start()
    {
        running = true;
    }

    void SimulatorEngine::stop()
    {
        running = false;
    }

    bool SimulatorEngine::isRunning() const
    {
        return running;
    }

    void SimulatorEngine::handleCommand(UICommand command)
    {
        switch (command)
        {
        case UICommand::Start:
            start();
            break;
        case UICommand::Stop:
            stop();
            break;
        case UICommand::Reset:
            reset();
            break;
        case UICommand::Step:
            if (!running)
            {
                start();
                tick();
                stop();
            }
            else
            {
                tick();
            }
            break;
        }
    }

    void SimulatorEngine::setControlMode(ControlMode mode)
    {
        control_mode = mode;

        if (control_mode == ControlMode::Phased)
        {
            controller = std::make_unique<PhasedLightController>(config.controller);
        }
        else
        {
            controller = std::make_unique<NullControlController>();
        }

        controller->reset();
    }

    SimulatorEngine::ControlMode SimulatorEngine::getControlMode() const
    {
        return control_mode;
    }

    void SimulatorEngine::setController(std::unique_ptr<ITrafficLightController> custom_controller, ControlMode mode)
    {
        if (!custom_controller)
        {
            throw std::invalid_argument("controller must not be null");
        }
        control_mode = mode;
        controller = std::move(custom_controller);
        controller->reset();
    }

    ITrafficLightController &SimulatorEngine::getController()
    {
        return *controller;
    }

    const JunctionConfig &SimulatorEngine::getConfig() const
    {
        return config;
    }

    const PathSynthesizer &SimulatorEngine::getPaths() const
    {
        return paths;
    }

} // namespace junction
