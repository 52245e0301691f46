#include <catch2/catch_all.hpp>
#include "SafetyChecker.hpp"

using namespace junction;

namespace
{
    const MovementGroup NS{Origin::North, Direction::Straight};
    const MovementGroup NL{Origin::North, Direction::Left};
    const MovementGroup NR{Origin::North, Direction::Right};
    const MovementGroup SS{Origin::South, Direction::Straight};
    const MovementGroup SL{Origin::South, Direction::Left};
    const MovementGroup ES{Origin::East, Direction::Straight};
    const MovementGroup EL{Origin::East, Direction::Left};
    const MovementGroup ER{Origin::East, Direction::Right};
    const MovementGroup WS{Origin::West, Direction::Straight};
}

TEST_CASE("Crossing through movements conflict", "[safety]")
{
    REQUIRE(SafetyChecker::hasMovementConflict(NS, ES));
    REQUIRE(SafetyChecker::hasMovementConflict(ES, NS));
    REQUIRE(SafetyChecker::hasMovementConflict(SS, WS));
}

TEST_CASE("Opposing through movements run together", "[safety]")
{
    REQUIRE_FALSE(SafetyChecker::hasMovementConflict(NS, SS));
    REQUIRE_FALSE(SafetyChecker::hasMovementConflict(NL, SL));
}

TEST_CASE("Left turn conflicts with opposing through traffic", "[safety]")
{
    REQUIRE(SafetyChecker::hasMovementConflict(NL, SS));
    REQUIRE(SafetyChecker::hasMovementConflict(SS, NL));
}

TEST_CASE("Movements of one origin never conflict", "[safety]")
{
    REQUIRE_FALSE(SafetyChecker::hasMovementConflict(NS, NL));
    REQUIRE_FALSE(SafetyChecker::hasMovementConflict(NS, NR));
    REQUIRE_FALSE(SafetyChecker::hasMovementConflict(NS, NS));
}

TEST_CASE("Movements into the same exit conflict", "[safety]")
{
    // Both leave through the west edge
    REQUIRE(SafetyChecker::hasMovementConflict(NR, ES));
    // Both leave through the south edge
    REQUIRE(SafetyChecker::hasMovementConflict(EL, NS));
}

TEST_CASE("Right turns stay clear of perpendicular traffic", "[safety]")
{
    REQUIRE_FALSE(SafetyChecker::hasMovementConflict(ER, NL));
    REQUIRE_FALSE(SafetyChecker::hasMovementConflict(NR, EL));
}

TEST_CASE("Invalid movement groups conflict with everything", "[safety]")
{
    const MovementGroup bogus{static_cast<Origin>(7), Direction::Left};
    REQUIRE(SafetyChecker::hasMovementConflict(bogus, NS));
    REQUIRE(SafetyChecker::hasMovementConflict(NS, bogus));
}

TEST_CASE("SafetyChecker rejects conflicting active groups", "[safety]")
{
    SafetyChecker checker;
    IntersectionState state;
    state.set(NS, LightState::Green);
    state.set(ES, LightState::Yellow);
    REQUIRE_FALSE(checker.isSafe(state));

    state.set(ES, LightState::Red);
    state.set(SS, LightState::Green);
    REQUIRE(checker.isSafe(state));
}

TEST_CASE("All red is safe", "[safety]")
{
    SafetyChecker checker;
    REQUIRE(checker.isSafe(IntersectionState{}));
}

TEST_CASE("Transitions enforce G->Y->R and R->G", "[transition]")
{
    SafetyChecker checker;
    IntersectionState green;
    green.set(NS, LightState::Green);

    IntersectionState yellow;
    yellow.set(NS, LightState::Yellow);
    REQUIRE(checker.isValidTransition(green, yellow));

    IntersectionState red;
    REQUIRE(checker.isValidTransition(yellow, red));
    REQUIRE(checker.isValidTransition(red, green));
    REQUIRE(checker.isValidTransition(green, green));

    // Skipping yellow, or jumping back from yellow, is not allowed
    REQUIRE_FALSE(checker.isValidTransition(green, red));
    REQUIRE_FALSE(checker.isValidTransition(yellow, green));
}

TEST_CASE("Cannot go green while a conflicting group is still clearing", "[transition]")
{
    SafetyChecker checker;
    IntersectionState prev;
    prev.set(NS, LightState::Yellow);

    IntersectionState next;
    next.set(NS, LightState::Red);
    next.set(ES, LightState::Green);
    REQUIRE_FALSE(checker.isValidTransition(prev, next));

    IntersectionState cleared;
    IntersectionState onset;
    onset.set(ES, LightState::Green);
    REQUIRE(checker.isValidTransition(cleared, onset));
}

TEST_CASE("Default phase plan is valid", "[safety]")
{
    SafetyChecker checker;
    const ControllerConfig config = makeDefaultControllerConfig();
    REQUIRE(checker.validatePhasePlan(config).empty());
    for (const auto &phase : config.phases)
    {
        REQUIRE(checker.isPhaseConflictFree(phase.groups));
    }
}

TEST_CASE("Phase plan must serve every movement group", "[safety]")
{
    SafetyChecker checker;
    ControllerConfig config = makeDefaultControllerConfig();
    config.phases.pop_back();

    const auto errors = checker.validatePhasePlan(config);
    REQUIRE_FALSE(errors.empty());
}

TEST_CASE("Phase plan rejects duplicates, conflicts and bad timing", "[safety]")
{
    SafetyChecker checker;

    ControllerConfig duplicated = makeDefaultControllerConfig();
    duplicated.phases.front().groups.push_back(NS);
    REQUIRE(checker.validatePhasePlan(duplicated).size() == 1);

    ControllerConfig conflicting = makeDefaultControllerConfig();
    conflicting.phases.front().groups.push_back(WS);
    REQUIRE_FALSE(checker.validatePhasePlan(conflicting).empty());

    ControllerConfig short_cap = makeDefaultControllerConfig();
    short_cap.max_clearance_ticks = short_cap.clearance_ticks - 1;
    REQUIRE(checker.validatePhasePlan(short_cap).size() == 1);

    ControllerConfig empty_phase = makeDefaultControllerConfig();
    empty_phase.phases.push_back(PhaseConfig{"idle", {}});
    REQUIRE(checker.validatePhasePlan(empty_phase).size() == 1);
}
