#include "ShootingResolver.hpp"

namespace skirmish::core
{
    using error::RuleViolationCode;

    ShootingResolver::ShootingResolver(Battlefield& battlefield, TurnPhaseMachine const& machine,
                                       CombatResolver& combat) :
        battlefield_(battlefield),
        machine_(machine),
        combat_(combat)
    {
    }

    auto ShootingResolver::IsShootingPhase() const -> bool
    {
        Phase const p = machine_.CurrentPhase();
        return p == Phase::FirstFire || p == Phase::AdvanceFire;
    }

    auto ShootingResolver::SelectShooter(CombatantId const shooter) -> error::Verdict
    {
        if (!IsShootingPhase())
        {
            return std::unexpected(error::Reject(RuleViolationCode::WrongPhase).with_combatant(shooter));
        }

        Combatant const* c = battlefield_.Find(shooter);
        if (!c)
        {
            return std::unexpected(error::Reject(RuleViolationCode::UnknownCombatant).with_combatant(shooter));
        }
        if (c->Owner() != machine_.ActivePlayer())
        {
            return std::unexpected(error::Reject(RuleViolationCode::WrongActor)
                                   .with_combatant(shooter).with_actor(machine_.ActivePlayer()));
        }

        // standing still fires first, anything short of a march fires in advance
        if (machine_.CurrentPhase() == Phase::FirstFire && (c->HasMoved() || c->HasMarched()))
        {
            return std::unexpected(error::Reject(RuleViolationCode::Shoot_MovedBeforeFirstFire).with_combatant(shooter));
        }
        if (machine_.CurrentPhase() == Phase::AdvanceFire && c->HasMarched())
        {
            return std::unexpected(error::Reject(RuleViolationCode::Shoot_MarchedBeforeAdvanceFire)
                                   .with_combatant(shooter));
        }

        shooter_ = shooter;
        weapon_.reset();
        return {};
    }

    auto ShootingResolver::SelectWeapon(uint8_t const weapon) -> error::Verdict
    {
        if (!IsShootingPhase()) return std::unexpected(error::Reject(RuleViolationCode::WrongPhase));
        if (!shooter_) return std::unexpected(error::Reject(RuleViolationCode::Shoot_NoShooter));

        Combatant const& c = battlefield_.Get(*shooter_);
        Weapon const* w = c.WeaponAt(weapon);
        if (!w)
        {
            return std::unexpected(error::Reject(RuleViolationCode::Weapon_BadIndex)
                                   .with_combatant(*shooter_).with_weapon(weapon));
        }
        if (!w->IsRanged())
        {
            return std::unexpected(error::Reject(RuleViolationCode::Shoot_NotRangedWeapon)
                                   .with_combatant(*shooter_).with_weapon(weapon));
        }
        if (IsWeaponUsed(WeaponRef{*shooter_, weapon}))
        {
            return std::unexpected(error::Reject(RuleViolationCode::Shoot_WeaponUsed)
                                   .with_combatant(*shooter_).with_weapon(weapon));
        }

        weapon_ = weapon;
        return {};
    }

    auto ShootingResolver::SelectAttackTarget(CombatantId const target) -> error::Result<AttackReport>
    {
        if (!IsShootingPhase()) return std::unexpected(error::Reject(RuleViolationCode::WrongPhase));
        if (!shooter_) return std::unexpected(error::Reject(RuleViolationCode::Shoot_NoShooter));
        if (!weapon_)
        {
            return std::unexpected(error::Reject(RuleViolationCode::Shoot_NoWeapon).with_combatant(*shooter_));
        }

        Combatant const& s = battlefield_.Get(*shooter_);
        Combatant const* t = battlefield_.Find(target);
        if (!t)
        {
            return std::unexpected(error::Reject(RuleViolationCode::UnknownCombatant)
                                   .with_combatant(*shooter_).with_target(target));
        }
        if (t->Owner() == s.Owner())
        {
            return std::unexpected(error::Reject(RuleViolationCode::Shoot_FriendlyTarget)
                                   .with_combatant(*shooter_).with_target(target));
        }

        Weapon const& w = *s.WeaponAt(*weapon_);
        float const distance = PlanarDistance(s.Position(), t->Position());
        if (distance > w.range)
        {
            return std::unexpected(error::Reject(RuleViolationCode::Shoot_OutOfRange)
                                   .with_combatant(*shooter_)
                                   .with_target(target)
                                   .with_weapon(*weapon_)
                                   .with_distance(distance)
                                   .with_allowance(w.range));
        }

        WeaponRef const ref{*shooter_, *weapon_};
        AttackReport const report = combat_.ResolveAttack(ref.owner, ref.index, target);
        used_.insert(ref);
        Cancel();
        return report;
    }

    auto ShootingResolver::Cancel() -> void
    {
        shooter_.reset();
        weapon_.reset();
    }

    auto ShootingResolver::OnPhaseEntered(Phase) -> void
    {
        Cancel();
    }

    auto ShootingResolver::OnRoundEnded(int) -> void
    {
        used_.clear();
    }

    auto ShootingResolver::OnCombatantRemoved(CombatantId const id) -> void
    {
        if (shooter_ == id) Cancel();
    }
}
