#ifndef SKIRMISH_MATCH_HPP
#define SKIRMISH_MATCH_HPP

#include <memory>
#include "Types.hpp"
#include "Actions.hpp"
#include "State.hpp"
#include "Exception.hpp"
#include "Events.hpp"
#include "Dice.hpp"
#include "Geometry.hpp"
#include "Battlefield.hpp"
#include "TurnPhaseMachine.hpp"
#include "MovementResolver.hpp"
#include "CombatResolver.hpp"
#include "ShootingResolver.hpp"
#include "ChargeResolver.hpp"
#include "FightOrchestrator.hpp"

namespace skirmish::core::debug {struct Inspector;}
namespace skirmish::core
{
    // One play session. Owns every service and wires them together; nothing
    // about a match lives anywhere else.
    class Match : private PhaseListener, private RemovalListener
    {
    public:
        explicit Match(MatchConfig const& config);
        // Tests inject scripted dice; geometry defaults to BoxGeometry
        Match(MatchConfig const& config, std::unique_ptr<Dice> dice, std::unique_ptr<Geometry> geometry = nullptr);

        Match(Match const&) = delete;
        auto operator=(Match const&) -> Match& = delete;
        Match(Match&&) = delete;
        auto operator=(Match&&) -> Match& = delete;

        // Setup only, before the first command
        auto Spawn(CombatantSpec spec) -> CombatantId;

        // Returns unexpected(reason) for rule violations; the match is unchanged
        // and the reason is also posted as a Rejected event.
        auto Submit(Command const& command) -> error::Result<Outcome>;
        // Turns a pointer result into whatever command fits the current state
        auto HandleSelection(Selection const& selection) -> error::Result<Outcome>;

        auto Snapshot() const -> MatchSnapshot;

        auto AddSink(MessageSink* sink) -> void { notifier_.Attach(sink); }
        auto RemoveSink(MessageSink* sink) -> void { notifier_.Detach(sink); }

        auto Config() const noexcept -> MatchConfig const& { return config_; }
        auto Round() const noexcept -> int { return machine_.Round(); }
        auto CurrentPhase() const noexcept -> Phase { return machine_.CurrentPhase(); }
        auto ActivePlayer() const noexcept -> PlayerId { return machine_.ActivePlayer(); }
        auto Selected() const noexcept -> std::optional<CombatantId> { return selected_; }

        auto Field() const noexcept -> Battlefield const& { return battlefield_; }
        auto Charge() const noexcept -> ChargeResolver const& { return charge_; }
        auto Shooting() const noexcept -> ShootingResolver const& { return shooting_; }
        auto Fight() const noexcept -> FightOrchestrator const& { return fight_; }

        friend struct debug::Inspector;

    private:
        auto Dispatch(Command const& command) -> error::Result<Outcome>;
        auto Refuse(error::Rejection r) const -> std::unexpected<error::Rejection>;
        auto EndTurn() -> error::Result<Outcome>;
        auto Deselect() -> void;

        auto OnPhaseEntered(Phase phase) -> void override;
        auto OnRoundEnded(int round) -> void override;
        auto OnCombatantRemoved(CombatantId id) -> void override;

        MatchConfig config_;
        Notifier notifier_;
        std::unique_ptr<Dice> dice_;
        std::unique_ptr<Geometry> geometry_;

        Battlefield battlefield_;
        TurnPhaseMachine machine_;
        MovementResolver movement_;
        CombatResolver combat_;
        ShootingResolver shooting_;
        ChargeResolver charge_;
        FightOrchestrator fight_;

        std::optional<CombatantId> selected_{};
    };
}

#endif //SKIRMISH_MATCH_HPP
