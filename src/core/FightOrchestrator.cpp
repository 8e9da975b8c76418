#include "FightOrchestrator.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <ranges>

namespace skirmish::core
{
    using error::RuleViolationCode;

    FightOrchestrator::FightOrchestrator(Battlefield& battlefield, TurnPhaseMachine& machine, CombatResolver& combat,
                                         Notifier const& notifier, FightMode const mode) :
        battlefield_(battlefield),
        machine_(machine),
        combat_(combat),
        notifier_(notifier),
        mode_(mode)
    {
    }

    auto FightOrchestrator::SelectedFight() const -> Engagement const*
    {
        return selected_ ? &engagements_[*selected_] : nullptr;
    }

    auto FightOrchestrator::OnPhaseEntered(Phase const phase) -> void
    {
        if (phase == Phase::Fight)
        {
            Discover();
        }
        else
        {
            Reset();
        }
    }

    auto FightOrchestrator::OnCombatantRemoved(CombatantId const id) -> void
    {
        for (Engagement& e : engagements_) std::erase(e.participants, id);
        std::erase(fought_, id);
        if (fighter_ == id)
        {
            ClearActivation();
            state_ = FightState::ResolvingInitiativeRound;
        }
    }

    auto FightOrchestrator::Discover() -> void
    {
        Reset();

        // one-sided groups are listed too; they resolve as soon as they are picked
        engagements_ = DiscoverEngagements(battlefield_);

        if (engagements_.empty())
        {
            notifier_.Post(EventKind::Info, "No fights this round");
            machine_.EndPhase();
            return;
        }

        state_ = FightState::SelectingFight;
        notifier_.Post(EventKind::Info, std::format("{} fight(s) to resolve", engagements_.size()));
    }

    auto FightOrchestrator::Reset() -> void
    {
        state_ = FightState::None;
        engagements_.clear();
        selected_.reset();
        tier_ = 0;
        turn_.reset();
        fought_.clear();
        ClearActivation();
    }

    auto FightOrchestrator::ClearActivation() -> void
    {
        fighter_.reset();
        staged_.reset();
        weapon_.reset();
        weapon_struck_ = false;
        spent_weapons_.clear();
    }

    auto FightOrchestrator::CheckFightPhase() const -> error::Verdict
    {
        if (machine_.CurrentPhase() != Phase::Fight)
        {
            return std::unexpected(error::Reject(RuleViolationCode::WrongPhase));
        }
        return {};
    }

    auto FightOrchestrator::TierOf(Combatant const& c) const -> int
    {
        return std::clamp(c.EffectiveInitiative(), 1, constants::MaxInitiative);
    }

    auto FightOrchestrator::IsEligible(CombatantId const id) const -> bool
    {
        Engagement const* e = SelectedFight();
        Combatant const* c = battlefield_.Find(id);
        return e && c && e->Contains(id)
            && std::ranges::find(fought_, id) == fought_.end()
            && TierOf(*c) == tier_;
    }

    auto FightOrchestrator::HasEligible(PlayerId const player) const -> bool
    {
        Engagement const* e = SelectedFight();
        if (!e) return false;
        return std::ranges::any_of(e->participants, [&](CombatantId const id)
        {
            return battlefield_.Get(id).Owner() == player && IsEligible(id);
        });
    }

    auto FightOrchestrator::Owns(Engagement const& e, PlayerId const player) const -> bool
    {
        return std::ranges::any_of(e.participants, [&](CombatantId const id)
        {
            return battlefield_.Get(id).Owner() == player;
        });
    }

    auto FightOrchestrator::IsOneSided() const -> bool
    {
        Engagement const* e = SelectedFight();
        if (!e) return true;
        return !(Owns(*e, PlayerOne) && Owns(*e, PlayerTwo));
    }

    auto FightOrchestrator::Chooser() const -> PlayerId
    {
        PlayerId const active = machine_.ActivePlayer();
        bool const any = std::ranges::any_of(engagements_, [&](Engagement const& e) { return Owns(e, active); });
        return any ? active : OtherPlayer(active);
    }

    auto FightOrchestrator::EnemyInContact(CombatantId const fighter) const -> bool
    {
        Engagement const* e = SelectedFight();
        PlayerId const owner = battlefield_.Get(fighter).Owner();
        return std::ranges::any_of(e->participants, [&](CombatantId const id)
        {
            return battlefield_.Get(id).Owner() != owner && battlefield_.InContact(fighter, id);
        });
    }

    auto FightOrchestrator::SelectFight(CombatantId const participant) -> error::Verdict
    {
        if (auto v = CheckFightPhase(); !v) return v;
        if (state_ == FightState::None)
        {
            return std::unexpected(error::Reject(RuleViolationCode::Fight_NoEngagement).with_combatant(participant));
        }
        if (state_ != FightState::SelectingFight)
        {
            return std::unexpected(error::Reject(RuleViolationCode::Busy).with_combatant(participant));
        }

        auto const it = std::ranges::find_if(engagements_, [&](Engagement const& e)
        {
            return e.Contains(participant);
        });
        if (it == engagements_.end())
        {
            return std::unexpected(error::Reject(RuleViolationCode::Fight_NoEngagement).with_combatant(participant));
        }

        PlayerId const chooser = Chooser();
        if (!Owns(*it, chooser))
        {
            return std::unexpected(error::Reject(RuleViolationCode::Fight_NoOwnParticipant)
                                   .with_combatant(participant).with_actor(chooser));
        }

        selected_ = static_cast<size_t>(std::distance(engagements_.begin(), it));
        notifier_.Post(EventKind::FightSelected,
                       std::format("Fight of {} models selected", it->participants.size()), participant);
        return {};
    }

    auto FightOrchestrator::ResolveSelectedFight() -> error::Result<Outcome>
    {
        if (auto v = CheckFightPhase(); !v) return std::unexpected(v.error());
        if (state_ == FightState::None)
        {
            return std::unexpected(error::Reject(RuleViolationCode::Fight_NoEngagement));
        }
        if (state_ != FightState::SelectingFight)
        {
            return std::unexpected(error::Reject(RuleViolationCode::Busy));
        }
        if (!selected_)
        {
            return std::unexpected(error::Reject(RuleViolationCode::Fight_NoneSelected));
        }

        tier_ = constants::MaxInitiative;
        fought_.clear();
        return EnterTier();
    }

    auto FightOrchestrator::EnterTier() -> Outcome
    {
        while (tier_ >= 1)
        {
            if (IsOneSided()) break;

            bool const p1 = HasEligible(PlayerOne);
            bool const p2 = HasEligible(PlayerTwo);
            if (p1 || p2)
            {
                turn_ = p1 ? PlayerOne : PlayerTwo;
                state_ = FightState::ResolvingInitiativeRound;
                return Outcome::Applied;
            }
            --tier_;
        }
        return CompleteFight();
    }

    auto FightOrchestrator::SelectFighter(CombatantId const fighter) -> error::Verdict
    {
        if (auto v = CheckFightPhase(); !v) return v;
        if (state_ != FightState::ResolvingInitiativeRound)
        {
            return std::unexpected(error::Reject(RuleViolationCode::Fight_NotAwaitingFighter).with_combatant(fighter));
        }

        Combatant const* c = battlefield_.Find(fighter);
        if (!c)
        {
            return std::unexpected(error::Reject(RuleViolationCode::UnknownCombatant).with_combatant(fighter));
        }
        if (!SelectedFight()->Contains(fighter))
        {
            return std::unexpected(error::Reject(RuleViolationCode::Fight_NotParticipant).with_combatant(fighter));
        }
        if (c->Owner() != *turn_)
        {
            return std::unexpected(error::Reject(RuleViolationCode::Fight_FighterNotOwned)
                                   .with_combatant(fighter).with_actor(*turn_));
        }
        if (!IsEligible(fighter))
        {
            return std::unexpected(error::Reject(RuleViolationCode::Fight_FighterNotEligible).with_combatant(fighter));
        }

        ClearActivation();
        fighter_ = fighter;
        state_ = FightState::PileInMove;
        notifier_.Post(EventKind::FighterActivated,
                       std::format("{} fights at initiative {}", c->Name(), tier_), fighter);
        return {};
    }

    auto FightOrchestrator::ProposePileIn(Vec3 const destination) -> error::Verdict
    {
        if (auto v = CheckFightPhase(); !v) return v;
        if (state_ != FightState::PileInMove)
        {
            return std::unexpected(error::Reject(RuleViolationCode::Fight_NotAwaitingPileIn));
        }

        CombatantId const fighter = *fighter_;
        Combatant const& f = battlefield_.Get(fighter);
        float const distance = PlanarDistance(f.Position(), destination);
        float const allowance = constants::PileInDistance * battlefield_.ConversionFactor();
        if (distance > allowance)
        {
            return std::unexpected(error::Reject(RuleViolationCode::Fight_PileInOutOfRange)
                                   .with_combatant(fighter)
                                   .with_distance(distance)
                                   .with_allowance(allowance));
        }

        bool const touches = std::ranges::any_of(SelectedFight()->participants, [&](CombatantId const id)
        {
            return battlefield_.Get(id).Owner() != f.Owner() && battlefield_.InContactAt(fighter, destination, id);
        });
        if (!touches)
        {
            return std::unexpected(error::Reject(RuleViolationCode::Fight_PileInNoContact).with_combatant(fighter));
        }

        staged_ = destination;
        return {};
    }

    auto FightOrchestrator::ConfirmPileInMove() -> error::Result<Outcome>
    {
        if (auto v = CheckFightPhase(); !v) return std::unexpected(v.error());
        if (state_ != FightState::PileInMove)
        {
            return std::unexpected(error::Reject(RuleViolationCode::Fight_NotAwaitingPileIn));
        }

        if (staged_)
        {
            battlefield_.Get(*fighter_).MoveTo(*staged_);
            staged_.reset();
        }

        if (mode_ == FightMode::PileInOnly) return EndActivation();
        return BeginAttacks();
    }

    auto FightOrchestrator::BeginAttacks() -> Outcome
    {
        Combatant& f = battlefield_.Get(*fighter_);
        f.SetRemainingAttacks(f.AttackAllowance());
        state_ = FightState::Attacks;

        if (f.RemainingAttacks() <= 0 || !EnemyInContact(*fighter_)) return EndActivation();
        return Outcome::Applied;
    }

    auto FightOrchestrator::SelectWeapon(uint8_t const weapon) -> error::Verdict
    {
        if (auto v = CheckFightPhase(); !v) return v;
        if (state_ != FightState::Attacks)
        {
            return std::unexpected(error::Reject(RuleViolationCode::Fight_NotAwaitingAttacks).with_weapon(weapon));
        }

        Weapon const* w = battlefield_.Get(*fighter_).WeaponAt(weapon);
        if (!w)
        {
            return std::unexpected(error::Reject(RuleViolationCode::Weapon_BadIndex)
                                   .with_combatant(*fighter_).with_weapon(weapon));
        }
        if (!w->IsMelee())
        {
            return std::unexpected(error::Reject(RuleViolationCode::Fight_NotMeleeWeapon)
                                   .with_combatant(*fighter_).with_weapon(weapon));
        }
        if (spent_weapons_.contains(weapon))
        {
            return std::unexpected(error::Reject(RuleViolationCode::Fight_WeaponUsed)
                                   .with_combatant(*fighter_).with_weapon(weapon));
        }
        if (weapon_ == weapon) return {};

        // a weapon that has struck is put away for the rest of the activation
        if (weapon_ && weapon_struck_) spent_weapons_.insert(*weapon_);
        weapon_ = weapon;
        weapon_struck_ = false;
        return {};
    }

    auto FightOrchestrator::SelectAttackTarget(CombatantId const target) -> error::Result<MeleeResult>
    {
        if (auto v = CheckFightPhase(); !v) return std::unexpected(v.error());
        if (state_ != FightState::Attacks)
        {
            return std::unexpected(error::Reject(RuleViolationCode::Fight_NotAwaitingAttacks).with_target(target));
        }

        CombatantId const fighter = *fighter_;
        if (!weapon_)
        {
            return std::unexpected(error::Reject(RuleViolationCode::Fight_NoWeapon).with_combatant(fighter));
        }

        Combatant const* t = battlefield_.Find(target);
        if (!t)
        {
            return std::unexpected(error::Reject(RuleViolationCode::UnknownCombatant)
                                   .with_combatant(fighter).with_target(target));
        }
        if (!SelectedFight()->Contains(target) || t->Owner() == battlefield_.Get(fighter).Owner())
        {
            return std::unexpected(error::Reject(RuleViolationCode::Fight_TargetNotEnemy)
                                   .with_combatant(fighter).with_target(target));
        }
        if (!battlefield_.InContact(fighter, target))
        {
            return std::unexpected(error::Reject(RuleViolationCode::Fight_TargetNotInContact)
                                   .with_combatant(fighter).with_target(target));
        }

        MeleeResult result{};
        result.report = combat_.ResolveAttack(fighter, *weapon_, target);

        Combatant& f = battlefield_.Get(fighter);
        f.SpendAttack();
        weapon_struck_ = true;

        if (f.RemainingAttacks() <= 0 || !EnemyInContact(fighter)) result.outcome = EndActivation();
        return result;
    }

    auto FightOrchestrator::FinishActivation() -> error::Result<Outcome>
    {
        if (auto v = CheckFightPhase(); !v) return std::unexpected(v.error());
        if (state_ != FightState::Attacks)
        {
            return std::unexpected(error::Reject(RuleViolationCode::Fight_NotAwaitingAttacks));
        }
        return EndActivation();
    }

    auto FightOrchestrator::EndActivation() -> Outcome
    {
        CombatantId const fighter = *fighter_;
        if (Combatant* f = battlefield_.Find(fighter))
        {
            f->SetFought();
            f->SetRemainingAttacks(0);
        }
        fought_.push_back(fighter);
        ClearActivation();

        if (IsOneSided()) return CompleteFight();

        PlayerId const other = OtherPlayer(*turn_);
        if (HasEligible(other))
        {
            turn_ = other;
            state_ = FightState::ResolvingInitiativeRound;
            return Outcome::Applied;
        }
        if (HasEligible(*turn_))
        {
            state_ = FightState::ResolvingInitiativeRound;
            return Outcome::Applied;
        }

        --tier_;
        return EnterTier();
    }

    auto FightOrchestrator::CompleteFight() -> Outcome
    {
        notifier_.Post(EventKind::FightResolved, "Fight resolved");

        engagements_.erase(engagements_.begin() + static_cast<std::ptrdiff_t>(*selected_));
        selected_.reset();
        tier_ = 0;
        turn_.reset();
        fought_.clear();
        ClearActivation();

        if (engagements_.empty())
        {
            state_ = FightState::None;
            return machine_.EndPhase();
        }

        state_ = FightState::SelectingFight;
        return Outcome::Applied;
    }

    auto FightOrchestrator::Cancel() -> void
    {
        switch (state_)
        {
        case FightState::SelectingFight:
            selected_.reset();
            break;
        case FightState::PileInMove:
            staged_.reset();
            break;
        case FightState::Attacks:
            if (weapon_ && weapon_struck_) spent_weapons_.insert(*weapon_);
            weapon_.reset();
            weapon_struck_ = false;
            break;
        case FightState::None:
        case FightState::ResolvingInitiativeRound:
            break;
        }
    }
}
