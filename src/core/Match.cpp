#include "Match.hpp"

#include <algorithm>
#include <format>
#include <type_traits>
#include <utility>

namespace skirmish::core
{
    using error::RuleViolationCode;

    namespace
    {
        auto Require(std::unique_ptr<Dice> dice) -> std::unique_ptr<Dice>
        {
            SKM_ASSERT(dice != nullptr, "Match created without dice");
            return dice;
        }
    }

    Match::Match(MatchConfig const& config) :
        Match(config, std::make_unique<RandomDice>(config.seed))
    {
    }

    Match::Match(MatchConfig const& config, std::unique_ptr<Dice> dice, std::unique_ptr<Geometry> geometry) :
        config_(config),
        dice_(Require(std::move(dice))),
        geometry_(geometry ? std::move(geometry) : std::make_unique<BoxGeometry>()),
        battlefield_(config_.conversion_factor, *geometry_, notifier_),
        machine_(battlefield_),
        movement_(battlefield_, machine_, notifier_),
        combat_(battlefield_, *dice_, notifier_),
        shooting_(battlefield_, machine_, combat_),
        charge_(battlefield_, machine_, *dice_, notifier_),
        fight_(battlefield_, machine_, combat_, notifier_, config_.fight_mode)
    {
        machine_.AddListener(&charge_);
        machine_.AddListener(&shooting_);
        machine_.AddListener(&fight_);
        machine_.AddListener(this);

        battlefield_.AddRemovalListener(&charge_);
        battlefield_.AddRemovalListener(&shooting_);
        battlefield_.AddRemovalListener(&fight_);
        battlefield_.AddRemovalListener(this);
    }

    auto Match::Spawn(CombatantSpec spec) -> CombatantId
    {
        SKM_ASSERT(spec.owner == PlayerOne || spec.owner == PlayerTwo, "Spawn for unknown player");
        return battlefield_.Spawn(std::move(spec));
    }

    auto Match::Refuse(error::Rejection r) const -> std::unexpected<error::Rejection>
    {
        if (!r.phase) r.with_phase(machine_.CurrentPhase());
        if (!r.actor) r.with_actor(machine_.ActivePlayer());
        notifier_.Post(EventKind::Rejected, error::describe(r), r.combatant);
        return std::unexpected(std::move(r));
    }

    auto Match::Submit(Command const& command) -> error::Result<Outcome>
    {
        auto result = Dispatch(command);
        if (!result) return Refuse(std::move(result.error()));
        return result;
    }

    auto Match::Dispatch(Command const& command) -> error::Result<Outcome>
    {
        // lifts a Verdict/Result<T> into Result<Outcome>
        auto const applied = [](auto const& r) -> error::Result<Outcome>
        {
            if (!r) return std::unexpected(r.error());
            return Outcome::Applied;
        };

        return std::visit(
            [&]<typename T0>(T0 const& cmd) -> error::Result<Outcome>
            {
                using T = std::decay_t<T0>;

                if constexpr (std::is_same_v<T, MoveCommand>)
                {
                    auto r = movement_.ProposeMove(cmd.mover, cmd.destination);
                    if (r) selected_ = cmd.mover;
                    return applied(r);
                }
                else if constexpr (std::is_same_v<T, SelectChargerCommand>)
                {
                    auto r = charge_.SelectCharger(cmd.charger);
                    if (r) selected_ = cmd.charger;
                    return applied(r);
                }
                else if constexpr (std::is_same_v<T, ChargeCommand>)
                {
                    return applied(charge_.SelectTarget(cmd.attacker, cmd.target));
                }
                else if constexpr (std::is_same_v<T, ChargeMoveCommand>)
                {
                    return applied(charge_.ProposeChargeMove(cmd.destination));
                }
                else if constexpr (std::is_same_v<T, DirectChargeCommand>)
                {
                    return applied(charge_.ChargeIntoTarget());
                }
                else if constexpr (std::is_same_v<T, SelectShooterCommand>)
                {
                    auto r = shooting_.SelectShooter(cmd.shooter);
                    if (r) selected_ = cmd.shooter;
                    return applied(r);
                }
                else if constexpr (std::is_same_v<T, SelectWeaponCommand>)
                {
                    if (machine_.CurrentPhase() == Phase::Fight) return applied(fight_.SelectWeapon(cmd.weapon));
                    return applied(shooting_.SelectWeapon(cmd.weapon));
                }
                else if constexpr (std::is_same_v<T, AttackTargetCommand>)
                {
                    if (machine_.CurrentPhase() == Phase::Fight)
                    {
                        auto r = fight_.SelectAttackTarget(cmd.target);
                        if (!r) return std::unexpected(r.error());
                        return r->outcome;
                    }
                    return applied(shooting_.SelectAttackTarget(cmd.target));
                }
                else if constexpr (std::is_same_v<T, SelectFightCommand>)
                {
                    return applied(fight_.SelectFight(cmd.participant));
                }
                else if constexpr (std::is_same_v<T, ResolveFightCommand>)
                {
                    return fight_.ResolveSelectedFight();
                }
                else if constexpr (std::is_same_v<T, SelectFighterCommand>)
                {
                    auto r = fight_.SelectFighter(cmd.fighter);
                    if (r) selected_ = cmd.fighter;
                    return applied(r);
                }
                else if constexpr (std::is_same_v<T, PileInCommand>)
                {
                    return applied(fight_.ProposePileIn(cmd.destination));
                }
                else if constexpr (std::is_same_v<T, ConfirmPileInCommand>)
                {
                    return fight_.ConfirmPileInMove();
                }
                else if constexpr (std::is_same_v<T, FinishActivationCommand>)
                {
                    return fight_.FinishActivation();
                }
                else if constexpr (std::is_same_v<T, EndTurnCommand>)
                {
                    return EndTurn();
                }
                else
                {
                    Deselect();
                    return Outcome::Applied;
                }
            },
            command
        );
    }

    auto Match::EndTurn() -> error::Result<Outcome>
    {
        if (machine_.CurrentPhase() == Phase::Fight && fight_.HasUnresolvedFights())
        {
            return std::unexpected(error::Reject(RuleViolationCode::FightsUnresolved));
        }

        Deselect();
        Outcome const outcome = machine_.AdvanceTurn();
        battlefield_.ClearOriginMarkers();
        return outcome;
    }

    auto Match::Deselect() -> void
    {
        charge_.Cancel();
        shooting_.Cancel();
        fight_.Cancel();
        selected_.reset();
    }

    auto Match::HandleSelection(Selection const& selection) -> error::Result<Outcome>
    {
        if (selection.surface == SurfaceTag::None)
        {
            return Refuse(error::Reject(RuleViolationCode::Select_Nothing));
        }

        std::optional<CombatantId> const picked =
            selection.surface == SurfaceTag::Model ? selection.combatant : std::nullopt;
        Combatant const* c = picked ? battlefield_.Find(*picked) : nullptr;
        if (picked && !c)
        {
            return Refuse(error::Reject(RuleViolationCode::UnknownCombatant).with_combatant(*picked));
        }
        bool const own = c && c->Owner() == machine_.ActivePlayer();

        switch (machine_.CurrentPhase())
        {
        case Phase::Movement:
            if (c)
            {
                if (!own)
                {
                    return Refuse(error::Reject(RuleViolationCode::WrongActor).with_combatant(*picked));
                }
                selected_ = picked;
                return Outcome::Applied;
            }
            if (!selected_) return Refuse(error::Reject(RuleViolationCode::Select_Nothing));
            return Submit(MoveCommand{*selected_, selection.point});

        case Phase::FirstFire:
        case Phase::AdvanceFire:
            if (!c) return Refuse(error::Reject(RuleViolationCode::Select_Nothing));
            if (own) return Submit(SelectShooterCommand{*picked});
            if (!shooting_.Shooter()) return Refuse(error::Reject(RuleViolationCode::Shoot_NoShooter));
            return Submit(AttackTargetCommand{*picked});

        case Phase::Charge:
            if (charge_.State() == ChargeState::AwaitingMovement)
            {
                if (picked && picked == charge_.Target()) return Submit(DirectChargeCommand{});
                return Submit(ChargeMoveCommand{selection.point});
            }
            if (!c) return Refuse(error::Reject(RuleViolationCode::Select_Nothing));
            if (own) return Submit(SelectChargerCommand{*picked});
            if (!charge_.Charger()) return Refuse(error::Reject(RuleViolationCode::Charge_NoCharger));
            return Submit(ChargeCommand{*charge_.Charger(), *picked});

        case Phase::Fight:
            switch (fight_.State())
            {
            case FightState::None:
                return Refuse(error::Reject(RuleViolationCode::Fight_NoEngagement));
            case FightState::SelectingFight:
                if (!c) return Refuse(error::Reject(RuleViolationCode::Select_Nothing));
                return Submit(SelectFightCommand{*picked});
            case FightState::ResolvingInitiativeRound:
                if (!c) return Refuse(error::Reject(RuleViolationCode::Select_Nothing));
                return Submit(SelectFighterCommand{*picked});
            case FightState::PileInMove:
                return Submit(PileInCommand{selection.point});
            case FightState::Attacks:
                if (!c) return Refuse(error::Reject(RuleViolationCode::Select_Nothing));
                return Submit(AttackTargetCommand{*picked});
            }
            break;
        }
        return Refuse(error::Reject(RuleViolationCode::Internal_Unreachable));
    }

    auto Match::Snapshot() const -> MatchSnapshot
    {
        MatchSnapshot snap{};
        snap.round = machine_.Round();
        snap.phase = machine_.CurrentPhase();
        snap.active_player = machine_.ActivePlayer();
        snap.selected = selected_;

        snap.charge_state = charge_.State();
        snap.charger = charge_.Charger();
        snap.charge_target = charge_.Target();
        snap.charge_budget = charge_.Budget();
        if (charge_.Budget() && charge_.Charger())
        {
            Combatant const& a = battlefield_.Get(*charge_.Charger());
            float const used = PlanarDistance(a.StartPosition(), a.Position());
            snap.charge_remaining = std::max(*charge_.Budget() - used, 0.0f);
        }

        snap.fight_state = fight_.State();
        snap.open_fights = fight_.Engagements().size();
        if (Engagement const* e = fight_.SelectedFight()) snap.selected_fight = e->participants;
        snap.initiative_tier = fight_.Tier();
        snap.fight_turn = fight_.Turn();
        snap.fighter = fight_.Fighter();

        for (CombatantId const id : battlefield_.Live())
        {
            Combatant const& c = battlefield_.Get(id);
            snap.combatants.push_back(CombatantView{
                .id = id,
                .owner = c.Owner(),
                .name = c.Name(),
                .position = c.Position(),
                .origin_marker = c.OriginMarker(),
                .wounds = c.Wounds(),
                .moved = c.HasMoved(),
                .marched = c.HasMarched(),
                .charged = c.HasCharged(),
                .fought = c.HasFought(),
                .remaining_movement = c.RemainingMovement(),
                .remaining_march = c.RemainingMarch(),
                .remaining_attacks = c.RemainingAttacks()
            });
        }
        return snap;
    }

    auto Match::OnPhaseEntered(Phase const phase) -> void
    {
        selected_.reset();
        notifier_.Post(EventKind::PhaseEntered, std::format("Round {}: {}", machine_.Round(), to_string(phase)));
    }

    auto Match::OnRoundEnded(int const round) -> void
    {
        notifier_.Post(EventKind::RoundEnded, std::format("Round {} over", round));
    }

    auto Match::OnCombatantRemoved(CombatantId const id) -> void
    {
        if (selected_ == id) selected_.reset();
    }
}
