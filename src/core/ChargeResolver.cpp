#include "ChargeResolver.hpp"

#include <format>

#include "Dice.hpp"

namespace skirmish::core
{
    using error::RuleViolationCode;

    ChargeResolver::ChargeResolver(Battlefield& battlefield, TurnPhaseMachine const& machine, Dice& dice,
                                   Notifier const& notifier) :
        battlefield_(battlefield),
        machine_(machine),
        dice_(dice),
        notifier_(notifier)
    {
    }

    auto ChargeResolver::CheckCharger(CombatantId const charger) const -> error::Verdict
    {
        if (machine_.CurrentPhase() != Phase::Charge)
        {
            return std::unexpected(error::Reject(RuleViolationCode::WrongPhase).with_combatant(charger));
        }
        if (state_ == ChargeState::AwaitingMovement)
        {
            return std::unexpected(error::Reject(RuleViolationCode::Busy).with_combatant(charger));
        }

        Combatant const* c = battlefield_.Find(charger);
        if (!c)
        {
            return std::unexpected(error::Reject(RuleViolationCode::UnknownCombatant).with_combatant(charger));
        }
        if (c->Owner() != machine_.ActivePlayer())
        {
            return std::unexpected(error::Reject(RuleViolationCode::WrongActor)
                                   .with_combatant(charger).with_actor(machine_.ActivePlayer()));
        }
        if (c->HasMarched())
        {
            return std::unexpected(error::Reject(RuleViolationCode::Charge_AlreadyMarched).with_combatant(charger));
        }
        if (c->HasCharged())
        {
            return std::unexpected(error::Reject(RuleViolationCode::Charge_AlreadyCharged).with_combatant(charger));
        }
        return {};
    }

    auto ChargeResolver::SelectCharger(CombatantId const charger) -> error::Verdict
    {
        if (auto v = CheckCharger(charger); !v) return v;

        state_ = ChargeState::PendingTarget;
        charger_ = charger;
        target_.reset();
        budget_.reset();
        return {};
    }

    auto ChargeResolver::SelectTarget(CombatantId const attacker, CombatantId const target)
        -> error::Result<ChargeReport>
    {
        if (auto v = CheckCharger(attacker); !v) return std::unexpected(v.error());

        Combatant const* t = battlefield_.Find(target);
        if (!t)
        {
            return std::unexpected(error::Reject(RuleViolationCode::UnknownCombatant)
                                   .with_combatant(attacker).with_target(target));
        }

        Combatant& a = battlefield_.Get(attacker);
        if (t->Owner() == a.Owner())
        {
            return std::unexpected(error::Reject(RuleViolationCode::Charge_FriendlyTarget)
                                   .with_combatant(attacker).with_target(target));
        }

        float const gap = battlefield_.Gap(attacker, target);
        if (gap > a.MaxChargeRange())
        {
            Cancel();
            return std::unexpected(error::Reject(RuleViolationCode::Charge_OutOfMaxRange)
                                   .with_combatant(attacker)
                                   .with_target(target)
                                   .with_distance(gap)
                                   .with_allowance(a.MaxChargeRange()));
        }

        ChargeReport report{};
        report.roll = dice_.RollD6();
        report.charge_distance = (a.GetStats().movement_range + static_cast<float>(report.roll))
                               * battlefield_.ConversionFactor();
        report.gap = gap;
        report.success = report.charge_distance >= gap;

        if (!report.success)
        {
            // consolation move straight at the target, it cannot reach contact
            report.surge = report.charge_distance / 2.0f;
            Vec3 const dir = PlanarDirection(a.Position(), t->Position());
            a.MoveTo(a.Position() + dir * report.surge);
            a.SetCharged();
            Cancel();
            notifier_.Post(EventKind::ChargeFailed,
                           std::format("{} rolled {} and failed the charge, surging {:.1f}\"",
                                       a.Name(), report.roll, report.surge / battlefield_.ConversionFactor()),
                           attacker);
            return report;
        }

        state_ = ChargeState::AwaitingMovement;
        charger_ = attacker;
        target_ = target;
        budget_ = report.charge_distance;
        notifier_.Post(EventKind::ChargeSucceeded,
                       std::format("{} rolled {}: charge {:.1f}\" into {}",
                                   a.Name(), report.roll,
                                   report.charge_distance / battlefield_.ConversionFactor(), t->Name()),
                       attacker);
        return report;
    }

    auto ChargeResolver::ProposeChargeMove(Vec3 const destination) -> error::Verdict
    {
        if (state_ != ChargeState::AwaitingMovement || machine_.CurrentPhase() != Phase::Charge)
        {
            return std::unexpected(error::Reject(RuleViolationCode::Charge_NotAwaitingMovement));
        }
        return CommitMove(destination);
    }

    auto ChargeResolver::ChargeIntoTarget() -> error::Verdict
    {
        if (state_ != ChargeState::AwaitingMovement || machine_.CurrentPhase() != Phase::Charge)
        {
            return std::unexpected(error::Reject(RuleViolationCode::Charge_NotAwaitingMovement));
        }

        Combatant const& a = battlefield_.Get(*charger_);
        Combatant const& t = battlefield_.Get(*target_);
        Geometry const& geo = battlefield_.GetGeometry();

        Vec3 const dir = PlanarDirection(a.Position(), t.Position());
        auto const travel = geo.ContactDistance(geo.VolumeOf(a), dir, geo.VolumeOf(t));
        if (!travel)
        {
            return std::unexpected(error::Reject(RuleViolationCode::Charge_NoContact)
                                   .with_combatant(*charger_).with_target(*target_));
        }
        return CommitMove(a.Position() + dir * *travel);
    }

    auto ChargeResolver::CommitMove(Vec3 const destination) -> error::Verdict
    {
        CombatantId const attacker = *charger_;
        CombatantId const target = *target_;
        Combatant& a = battlefield_.Get(attacker);

        float const distance = PlanarDistance(a.StartPosition(), destination);
        if (distance > *budget_)
        {
            return std::unexpected(error::Reject(RuleViolationCode::Charge_BeyondRolledDistance)
                                   .with_combatant(attacker)
                                   .with_target(target)
                                   .with_distance(distance)
                                   .with_allowance(*budget_));
        }
        if (!battlefield_.InContactAt(attacker, destination, target))
        {
            return std::unexpected(error::Reject(RuleViolationCode::Charge_NoContact)
                                   .with_combatant(attacker).with_target(target));
        }

        a.MoveTo(destination);
        a.SetCharged();
        Cancel();
        notifier_.Post(EventKind::ChargeCompleted,
                       std::format("{} charged into {}", a.Name(), battlefield_.Get(target).Name()), attacker);
        return {};
    }

    auto ChargeResolver::Cancel() -> void
    {
        state_ = ChargeState::Idle;
        charger_.reset();
        target_.reset();
        budget_.reset();
    }

    auto ChargeResolver::OnPhaseEntered(Phase) -> void
    {
        Cancel();
    }

    auto ChargeResolver::OnCombatantRemoved(CombatantId const id) -> void
    {
        if (charger_ == id || target_ == id) Cancel();
    }
}
