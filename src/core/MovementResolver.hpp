#ifndef SKIRMISH_MOVEMENTRESOLVER_HPP
#define SKIRMISH_MOVEMENTRESOLVER_HPP

#include "Types.hpp"
#include "Exception.hpp"

namespace skirmish::core
{
    class Battlefield;
    class TurnPhaseMachine;
    class Notifier;

    class MovementResolver
    {
    public:
        MovementResolver(Battlefield& battlefield, TurnPhaseMachine const& machine, Notifier const& notifier);

        // Returns unexpected(reason) for ordinary rule violations, state untouched
        auto Validate(CombatantId mover, Vec3 destination) const -> error::Verdict;
        auto ProposeMove(CombatantId mover, Vec3 destination) -> error::Verdict;

    private:
        Battlefield& battlefield_;
        TurnPhaseMachine const& machine_;
        Notifier const& notifier_;
    };
}

#endif //SKIRMISH_MOVEMENTRESOLVER_HPP
