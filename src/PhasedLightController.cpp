#include "PhasedLightController.hpp"

#include <algorithm>
#include <stdexcept>

namespace junction
{

    PhasedLightController::PhasedLightController(const ControllerConfig &config)
        : config(config), stage(Stage::Green), phase_index(0), next_phase_index(0),
          stage_elapsed(0), tick_count(0)
    {
        const auto errors = checker.validatePhasePlan(config);
        if (!errors.empty())
        {
            throw std::invalid_argument("invalid phase plan: " + errors.front());
        }
        reset();
    }

    void PhasedLightController::reset()
    {
        stage = Stage::Green;
        phase_index = 0;
        next_phase_index = 0;
        stage_elapsed = 0;
        tick_count = 0;
        tracked_cars.clear();
        last_entry_tick.fill(std::nullopt);
        entered.fill(0);
        applyStage();
    }

    bool PhasedLightController::phaseContains(std::size_t phase, const MovementGroup &group) const
    {
        const auto &groups = config.phases[phase].groups;
        return std::find(groups.begin(), groups.end(), group) != groups.end();
    }

    bool PhasedLightController::phaseHasDemand(std::size_t phase) const
    {
        for (const auto &group : config.phases[phase].groups)
        {
            if (waitingCount(group) > 0)
            {
                return true;
            }
        }
        return false;
    }

    std::size_t PhasedLightController::chooseNextPhase() const
    {
        const std::size_t count = config.phases.size();
        const std::size_t in_order = (phase_index + 1) % count;
        if (!config.skip_idle_phases)
        {
            return in_order;
        }

        // First phase after the current one with waiting cars; wraps onto the current phase
        // so a lone demand keeps its green
        for (std::size_t step = 1; step <= count; ++step)
        {
            const std::size_t candidate = (phase_index + step) % count;
            if (phaseHasDemand(candidate))
            {
                return candidate;
            }
        }
        return in_order;
    }

    bool PhasedLightController::outgoingGroupsCleared() const
    {
        for (const auto &group : config.phases[phase_index].groups)
        {
            if (phaseContains(next_phase_index, group))
            {
                continue;
            }
            const auto &entry = last_entry_tick[movementGroupIndex(group)];
            if (entry.has_value() && tick_count - *entry < config.clearance_ticks)
            {
                return false;
            }
        }
        return true;
    }

    void PhasedLightController::tick()
    {
        ++tick_count;
        ++stage_elapsed;

        switch (stage)
        {
        case Stage::Green:
            if (stage_elapsed >= config.green_ticks)
            {
                next_phase_index = chooseNextPhase();
                stage_elapsed = 0;
                if (next_phase_index != phase_index)
                {
                    stage = Stage::Yellow;
                }
            }
            break;
        case Stage::Yellow:
            if (stage_elapsed >= config.yellow_ticks)
            {
                stage = Stage::Clearance;
                stage_elapsed = 0;
            }
            break;
        case Stage::Clearance:
            if (stage_elapsed >= config.clearance_ticks &&
                (outgoingGroupsCleared() || stage_elapsed >= config.max_clearance_ticks))
            {
                phase_index = next_phase_index;
                stage = Stage::Green;
                stage_elapsed = 0;
            }
            break;
        }

        applyStage();
    }

    void PhasedLightController::applyStage()
    {
        current_state = IntersectionState{};
        for (const auto &group : config.phases[phase_index].groups)
        {
            const bool continues = phaseContains(next_phase_index, group);
            switch (stage)
            {
            case Stage::Green:
                current_state.set(group, LightState::Green);
                break;
            case Stage::Yellow:
                current_state.set(group, continues ? LightState::Green : LightState::Yellow);
                break;
            case Stage::Clearance:
                current_state.set(group, continues ? LightState::Green : LightState::Red);
                break;
            }
        }
    }

    bool PhasedLightController::isGreen(Origin origin, Direction direction) const
    {
        return current_state.of({origin, direction}) == LightState::Green;
    }

    bool PhasedLightController::isGreen(const CarTicket &car)
    {
        if (isValidMovementGroup(car.group()))
        {
            tracked_cars[car.id] = car.group();
        }
        return isGreen(car.origin, car.direction);
    }

    bool PhasedLightController::isYellow(Origin origin, Direction direction) const
    {
        return current_state.of({origin, direction}) == LightState::Yellow;
    }

    void PhasedLightController::removeCar(const CarTicket &car)
    {
        auto it = tracked_cars.find(car.id);
        if (it == tracked_cars.end() || it->second != car.group())
        {
            return;
        }

        const std::size_t index = movementGroupIndex(car.group());
        last_entry_tick[index] = tick_count;
        entered[index] += 1;
        tracked_cars.erase(it);
    }

    bool PhasedLightController::isTracked(uint32_t car_id) const
    {
        return tracked_cars.find(car_id) != tracked_cars.end();
    }

    std::size_t PhasedLightController::waitingCount(const MovementGroup &group) const
    {
        return static_cast<std::size_t>(std::count_if(tracked_cars.begin(), tracked_cars.end(),
                                                      [&group](const auto &entry)
                                                      { return entry.second == group; }));
    }

    std::size_t PhasedLightController::enteredCount(const MovementGroup &group) const
    {
        const std::size_t index = movementGroupIndex(group);
        return index < entered.size() ? entered[index] : 0;
    }

    IntersectionState PhasedLightController::getCurrentState() const
    {
        return current_state;
    }

} // namespace junction
