#pragma once

#include "Intersection.hpp"
#include "SafetyChecker.hpp"
#include "SimulationConfig.hpp"
#include "TrafficLightControllers.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <unordered_map>

namespace junction
{

    // Fixed-time controller cycling through conflict-free phases. Every change of phase goes
    // through a yellow stage for the groups losing right-of-way, then an all-red clearance
    // stage that lasts until recently entered cars have had time to clear.
    class PhasedLightController : public ITrafficLightController
    {
    public:
        enum class Stage
        {
            Green,
            Yellow,
            Clearance
        };

        // Throws std::invalid_argument when the phase plan is empty or grants conflicting groups
        explicit PhasedLightController(const ControllerConfig &config = makeDefaultControllerConfig());

        void tick() override;

        bool isGreen(Origin origin, Direction direction) const override;
        bool isGreen(const CarTicket &car) override;
        bool isYellow(Origin origin, Direction direction) const override;
        void removeCar(const CarTicket &car) override;

        bool isTracked(uint32_t car_id) const override;
        std::size_t waitingCount(const MovementGroup &group) const override;

        IntersectionState getCurrentState() const override;
        void reset() override;

        Stage getStage() const { return stage; }
        std::size_t getPhaseIndex() const { return phase_index; }
        std::size_t getNextPhaseIndex() const { return next_phase_index; }
        uint32_t getStageElapsed() const { return stage_elapsed; }
        uint64_t getTickCount() const { return tick_count; }
        std::size_t enteredCount(const MovementGroup &group) const;
        const ControllerConfig &getConfig() const { return config; }

    private:
        bool phaseContains(std::size_t phase, const MovementGroup &group) const;
        bool phaseHasDemand(std::size_t phase) const;
        std::size_t chooseNextPhase() const;
        bool outgoingGroupsCleared() const;
        void applyStage();

        ControllerConfig config;
        SafetyChecker checker;

        Stage stage;
        std::size_t phase_index;
        std::size_t next_phase_index;
        uint32_t stage_elapsed;
        uint64_t tick_count;
        IntersectionState current_state;

        // car id -> the one group it waits in
        std::unordered_map<uint32_t, MovementGroup> tracked_cars;
        std::array<std::optional<uint64_t>, MOVEMENT_GROUP_COUNT> last_entry_tick;
        std::array<std::size_t, MOVEMENT_GROUP_COUNT> entered{};
    };

} // namespace junction
