#include "MovementResolver.hpp"

#include <format>

#include "Battlefield.hpp"
#include "TurnPhaseMachine.hpp"

namespace skirmish::core
{
    using error::RuleViolationCode;

    MovementResolver::MovementResolver(Battlefield& battlefield, TurnPhaseMachine const& machine,
                                       Notifier const& notifier) :
        battlefield_(battlefield),
        machine_(machine),
        notifier_(notifier)
    {
    }

    auto MovementResolver::Validate(CombatantId const mover, Vec3 const destination) const -> error::Verdict
    {
        if (machine_.CurrentPhase() != Phase::Movement)
        {
            return std::unexpected(error::Reject(RuleViolationCode::WrongPhase).with_combatant(mover));
        }

        Combatant const* c = battlefield_.Find(mover);
        if (!c)
        {
            return std::unexpected(error::Reject(RuleViolationCode::UnknownCombatant).with_combatant(mover));
        }
        if (c->Owner() != machine_.ActivePlayer())
        {
            return std::unexpected(error::Reject(RuleViolationCode::WrongActor)
                                   .with_combatant(mover).with_actor(machine_.ActivePlayer()));
        }

        // net displacement from where the phase started, not the path walked
        float const distance = PlanarDistance(c->StartPosition(), destination);
        if (distance > c->MarchAllowance())
        {
            return std::unexpected(error::Reject(RuleViolationCode::Move_OutOfRange)
                                   .with_combatant(mover)
                                   .with_distance(distance)
                                   .with_allowance(c->MarchAllowance()));
        }
        return {};
    }

    auto MovementResolver::ProposeMove(CombatantId const mover, Vec3 const destination) -> error::Verdict
    {
        if (auto v = Validate(mover, destination); !v) return v;

        Combatant& c = battlefield_.Get(mover);
        float const distance = PlanarDistance(c.StartPosition(), destination);
        c.MoveTo(destination);
        c.RecordNetDisplacement(distance);

        float const inches = distance / battlefield_.ConversionFactor();
        notifier_.Post(EventKind::Moved,
                       std::format("{} {} {:.1f}\"", c.Name(), c.HasMarched() ? "marched" : "moved", inches),
                       mover);
        return {};
    }
}
