#ifndef SKIRMISH_SHOOTINGRESOLVER_HPP
#define SKIRMISH_SHOOTINGRESOLVER_HPP

#include <set>
#include "Types.hpp"
#include "Exception.hpp"
#include "CombatResolver.hpp"
#include "TurnPhaseMachine.hpp"
#include "Battlefield.hpp"

namespace skirmish::core
{
    // Shooter -> ranged weapon -> target, resolved on the spot. Owns the
    // per-round set of ranged weapons that have already fired.
    class ShootingResolver final : public PhaseListener, public RemovalListener
    {
    public:
        ShootingResolver(Battlefield& battlefield, TurnPhaseMachine const& machine, CombatResolver& combat);

        auto SelectShooter(CombatantId shooter) -> error::Verdict;
        auto SelectWeapon(uint8_t weapon) -> error::Verdict;
        auto SelectAttackTarget(CombatantId target) -> error::Result<AttackReport>;
        auto Cancel() -> void;

        auto Shooter() const noexcept -> std::optional<CombatantId> { return shooter_; }
        auto SelectedWeapon() const noexcept -> std::optional<uint8_t> { return weapon_; }
        auto IsWeaponUsed(WeaponRef ref) const -> bool { return used_.contains(ref); }

        auto OnPhaseEntered(Phase phase) -> void override;
        auto OnRoundEnded(int round) -> void override;
        auto OnCombatantRemoved(CombatantId id) -> void override;

    private:
        auto IsShootingPhase() const -> bool;

        Battlefield& battlefield_;
        TurnPhaseMachine const& machine_;
        CombatResolver& combat_;

        std::optional<CombatantId> shooter_{};
        std::optional<uint8_t> weapon_{};
        std::set<WeaponRef> used_;
    };
}

#endif //SKIRMISH_SHOOTINGRESOLVER_HPP
