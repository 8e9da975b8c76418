#ifndef SKIRMISH_FIGHTORCHESTRATOR_HPP
#define SKIRMISH_FIGHTORCHESTRATOR_HPP

#include <set>
#include <vector>
#include "Types.hpp"
#include "Exception.hpp"
#include "State.hpp"
#include "Engagements.hpp"
#include "CombatResolver.hpp"
#include "TurnPhaseMachine.hpp"
#include "Battlefield.hpp"

namespace skirmish::core::debug {struct Inspector;}
namespace skirmish::core
{
    struct MeleeResult
    {
        AttackReport report{};
        // Applied while the fighter still has attacks, otherwise whatever ending the
        // activation led to
        Outcome outcome{Outcome::Applied};
    };

    // Runs the Fight phase. Engagements are found on phase entry, then each is
    // fought out tier by tier from initiative 10 down to 1, players alternating
    // activations inside a tier. Every player input is one call; the orchestrator
    // parks in a named state between them.
    class FightOrchestrator final : public PhaseListener, public RemovalListener
    {
    public:
        FightOrchestrator(Battlefield& battlefield, TurnPhaseMachine& machine, CombatResolver& combat,
                          Notifier const& notifier, FightMode mode);

        // Any participant picks its engagement. The active player chooses while they
        // still own a model in some engagement, after that the choice passes over.
        auto SelectFight(CombatantId participant) -> error::Verdict;
        auto ResolveSelectedFight() -> error::Result<Outcome>;
        auto SelectFighter(CombatantId fighter) -> error::Verdict;
        // Stages a pile in move; nothing moves until it is confirmed
        auto ProposePileIn(Vec3 destination) -> error::Verdict;
        // Commits the staged move, or declines to move when nothing is staged
        auto ConfirmPileInMove() -> error::Result<Outcome>;
        auto SelectWeapon(uint8_t weapon) -> error::Verdict;
        auto SelectAttackTarget(CombatantId target) -> error::Result<MeleeResult>;
        // Gives up the rest of the fighter's attacks
        auto FinishActivation() -> error::Result<Outcome>;
        // Rolls back whatever is not committed yet
        auto Cancel() -> void;

        auto State() const noexcept -> FightState { return state_; }
        auto Mode() const noexcept -> FightMode { return mode_; }
        auto Engagements() const noexcept -> std::vector<Engagement> const& { return engagements_; }
        auto SelectedFight() const -> Engagement const*;
        auto Tier() const noexcept -> int { return tier_; }
        auto Turn() const noexcept -> std::optional<PlayerId> { return turn_; }
        auto Fighter() const noexcept -> std::optional<CombatantId> { return fighter_; }
        auto StagedPileIn() const noexcept -> std::optional<Vec3> { return staged_; }
        auto SelectedWeapon() const noexcept -> std::optional<uint8_t> { return weapon_; }
        auto HasUnresolvedFights() const noexcept -> bool { return !engagements_.empty(); }

        auto OnPhaseEntered(Phase phase) -> void override;
        auto OnCombatantRemoved(CombatantId id) -> void override;

        friend struct debug::Inspector;

    private:
        auto Discover() -> void;
        auto Reset() -> void;
        auto CheckFightPhase() const -> error::Verdict;

        auto TierOf(Combatant const& c) const -> int;
        auto IsEligible(CombatantId id) const -> bool;
        auto HasEligible(PlayerId player) const -> bool;
        auto Owns(Engagement const& e, PlayerId player) const -> bool;
        auto IsOneSided() const -> bool;
        // The active player, unless they have no model left in any engagement
        auto Chooser() const -> PlayerId;
        auto EnemyInContact(CombatantId fighter) const -> bool;

        // Finds the next tier with someone left to fight, or finishes the engagement
        auto EnterTier() -> Outcome;
        auto BeginAttacks() -> Outcome;
        auto EndActivation() -> Outcome;
        auto CompleteFight() -> Outcome;
        auto ClearActivation() -> void;

        Battlefield& battlefield_;
        TurnPhaseMachine& machine_;
        CombatResolver& combat_;
        Notifier const& notifier_;
        FightMode mode_;

        FightState state_{FightState::None};
        std::vector<Engagement> engagements_;
        std::optional<size_t> selected_{};

        int tier_{0};
        std::optional<PlayerId> turn_{};
        std::vector<CombatantId> fought_;

        // current activation
        std::optional<CombatantId> fighter_{};
        std::optional<Vec3> staged_{};
        std::optional<uint8_t> weapon_{};
        bool weapon_struck_{false};
        std::set<uint8_t> spent_weapons_;
    };
}

#endif //SKIRMISH_FIGHTORCHESTRATOR_HPP
