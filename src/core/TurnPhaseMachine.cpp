#include "TurnPhaseMachine.hpp"

#include "Battlefield.hpp"
#include "Exception.hpp"

namespace skirmish::core
{
    TurnPhaseMachine::TurnPhaseMachine(Battlefield& battlefield) :
        battlefield_(battlefield)
    {
    }

    auto TurnPhaseMachine::AddListener(PhaseListener* listener) -> void
    {
        SKM_ASSERT(listener != nullptr, "Null phase listener");
        listeners_.push_back(listener);
    }

    auto TurnPhaseMachine::AdvanceTurn() -> Outcome
    {
        if (active_ == PlayerOne)
        {
            active_ = PlayerTwo;
            return Outcome::Applied;
        }
        return AdvancePhase();
    }

    auto TurnPhaseMachine::AdvancePhase() -> Outcome
    {
        if (in_transition_)
        {
            SKM_THROW(error::Code::State, "AdvancePhase re-entered from a phase listener, use EndPhase");
        }

        in_transition_ = true;
        bool wrapped = false;
        try
        {
            do
            {
                end_requested_ = false;
                wrapped |= EnterNext();
            }
            while (end_requested_);
        }
        catch (...)
        {
            // a throwing listener must not leave the machine locked
            in_transition_ = false;
            end_requested_ = false;
            throw;
        }
        in_transition_ = false;

        return wrapped ? Outcome::RoundEnded : Outcome::PhaseEnded;
    }

    auto TurnPhaseMachine::EndPhase() -> Outcome
    {
        if (in_transition_)
        {
            end_requested_ = true;
            return Outcome::PhaseEnded;
        }
        return AdvancePhase();
    }

    auto TurnPhaseMachine::EnterNext() -> bool
    {
        bool wrapped = false;
        if (phase_ == Phase::AdvanceFire)
        {
            int const finished = round_++;
            phase_ = Phase::Movement;
            battlefield_.ResetForRound();
            for (PhaseListener* l : listeners_) l->OnRoundEnded(finished);
            wrapped = true;
        }
        else
        {
            phase_ = static_cast<Phase>(static_cast<uint8_t>(phase_) + 1);
        }

        active_ = PlayerOne;

        // charge distance is measured from where the model stood when Charge began
        if (phase_ == Phase::Charge) battlefield_.SnapshotStartPositions();

        for (PhaseListener* l : listeners_) l->OnPhaseEntered(phase_);
        return wrapped;
    }
}
