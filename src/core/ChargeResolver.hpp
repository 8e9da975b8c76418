#ifndef SKIRMISH_CHARGERESOLVER_HPP
#define SKIRMISH_CHARGERESOLVER_HPP

#include "Types.hpp"
#include "Exception.hpp"
#include "State.hpp"
#include "TurnPhaseMachine.hpp"
#include "Battlefield.hpp"

namespace skirmish::core
{
    class Dice;

    struct ChargeReport
    {
        int roll{};
        float charge_distance{};
        // closest separation between the two models when the charge was declared
        float gap{};
        bool success{false};
        float surge{};
    };

    // Idle -> PendingTarget -> AwaitingMovement -> Idle. A failed roll ends the
    // charge right away with a surge move, a successful one parks in
    // AwaitingMovement until a move that reaches the target comes in.
    class ChargeResolver final : public PhaseListener, public RemovalListener
    {
    public:
        ChargeResolver(Battlefield& battlefield, TurnPhaseMachine const& machine, Dice& dice,
                       Notifier const& notifier);

        auto SelectCharger(CombatantId charger) -> error::Verdict;
        auto SelectTarget(CombatantId attacker, CombatantId target) -> error::Result<ChargeReport>;
        // Ground click while awaiting movement
        auto ProposeChargeMove(Vec3 destination) -> error::Verdict;
        // Click on the target itself: close in along a straight line
        auto ChargeIntoTarget() -> error::Verdict;
        auto Cancel() -> void;

        auto State() const noexcept -> ChargeState { return state_; }
        auto Charger() const noexcept -> std::optional<CombatantId> { return charger_; }
        auto Target() const noexcept -> std::optional<CombatantId> { return target_; }
        auto Budget() const noexcept -> std::optional<float> { return budget_; }

        auto OnPhaseEntered(Phase phase) -> void override;
        auto OnCombatantRemoved(CombatantId id) -> void override;

    private:
        auto CheckCharger(CombatantId charger) const -> error::Verdict;
        auto CommitMove(Vec3 destination) -> error::Verdict;

        Battlefield& battlefield_;
        TurnPhaseMachine const& machine_;
        Dice& dice_;
        Notifier const& notifier_;

        ChargeState state_{ChargeState::Idle};
        std::optional<CombatantId> charger_{};
        std::optional<CombatantId> target_{};
        std::optional<float> budget_{};
    };
}

#endif //SKIRMISH_CHARGERESOLVER_HPP
