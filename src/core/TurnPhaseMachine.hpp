#ifndef SKIRMISH_TURNPHASEMACHINE_HPP
#define SKIRMISH_TURNPHASEMACHINE_HPP

#include <vector>
#include "Types.hpp"
#include "Actions.hpp"

namespace skirmish::core
{
    class Battlefield;

    class PhaseListener
    {
    public:
        virtual ~PhaseListener() = default;
        // Called after the machine has switched to `phase` and done its own setup
        virtual auto OnPhaseEntered(Phase phase) -> void = 0;
        // `round` is the round that just finished. Listeners with no per-round
        // state leave it alone.
        virtual auto OnRoundEnded(int) -> void {}
    };

    // Round/phase/player bookkeeping. Never rejects anything: whoever calls into
    // a resolver in the wrong phase gets rejected by that resolver.
    class TurnPhaseMachine
    {
    public:
        explicit TurnPhaseMachine(Battlefield& battlefield);

        TurnPhaseMachine(TurnPhaseMachine const&) = delete;
        auto operator=(TurnPhaseMachine const&) -> TurnPhaseMachine& = delete;

        auto AddListener(PhaseListener* listener) -> void;

        auto Round() const noexcept -> int { return round_; }
        auto CurrentPhase() const noexcept -> Phase { return phase_; }
        auto ActivePlayer() const noexcept -> PlayerId { return active_; }

        // Player 1 hands over to player 2; after player 2 the phase advances
        auto AdvanceTurn() -> Outcome;
        auto AdvancePhase() -> Outcome;
        // Same as AdvancePhase, but safe to call from a listener while a transition
        // is running: the extra advance happens once the current one finishes.
        auto EndPhase() -> Outcome;

    private:
        auto EnterNext() -> bool;

        Battlefield& battlefield_;
        std::vector<PhaseListener*> listeners_;

        int round_{1};
        Phase phase_{Phase::Movement};
        PlayerId active_{PlayerOne};

        bool in_transition_{false};
        bool end_requested_{false};
    };
}

#endif //SKIRMISH_TURNPHASEMACHINE_HPP
