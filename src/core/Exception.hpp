#ifndef SKIRMISH_EXCEPTION_HPP
#define SKIRMISH_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <stdexcept>
#include <format>
#include <utility>
#include "Types.hpp"
#include "Actions.hpp"

namespace skirmish::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Rules, // rules engine misuse (not a rejected player action)
        State, // state machine misuse (not a rejected player action)
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::Rules: throw RulesError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define SKM_THROW(code_enum, msg) ::skirmish::core::error::fail((code_enum), (msg))
#define SKM_ASSERT(cond, msg) do { if(!(cond)) ::skirmish::core::error::fail(::skirmish::core::error::Code::Assertion, (msg)); } while(0)

    // The five ways a proposed action can be refused
    enum class RejectionKind : uint8_t
    {
        PhaseMismatch,
        IneligibleCombatant,
        OutOfRange,
        InvalidTarget,
        NoSelection
    };

    // Fine-grained reasons; grouped by action type.
    enum class RuleViolationCode : std::uint16_t
    {
        // Generic/flow
        WrongPhase,
        WrongActor, // combatant not owned by the player whose turn it is
        UnknownCombatant, // id never spawned or already destroyed
        Busy, // another multi-step action is mid-flight
        FightsUnresolved,

        // Movement
        Move_OutOfRange,

        // Charge
        Charge_NoCharger,
        Charge_AlreadyMarched,
        Charge_AlreadyCharged,
        Charge_FriendlyTarget,
        Charge_OutOfMaxRange,
        Charge_NotAwaitingMovement,
        Charge_BeyondRolledDistance,
        Charge_NoContact,

        // Shooting
        Shoot_NoShooter,
        Shoot_MovedBeforeFirstFire,
        Shoot_MarchedBeforeAdvanceFire,
        Shoot_NoWeapon,
        Shoot_NotRangedWeapon,
        Shoot_WeaponUsed,
        Shoot_FriendlyTarget,
        Shoot_OutOfRange,

        // Weapons
        Weapon_BadIndex,

        // Fight
        Fight_NoEngagement,
        Fight_NotParticipant,
        Fight_NoOwnParticipant,
        Fight_NoneSelected,
        Fight_NotAwaitingFighter,
        Fight_FighterNotEligible,
        Fight_FighterNotOwned,
        Fight_NotAwaitingPileIn,
        Fight_PileInOutOfRange,
        Fight_PileInNoContact,
        Fight_NotAwaitingAttacks,
        Fight_NotMeleeWeapon,
        Fight_WeaponUsed,
        Fight_NoWeapon,
        Fight_TargetNotEnemy,
        Fight_TargetNotInContact,

        // Selection routing
        Select_Nothing,

        // Safety net
        Internal_Unreachable
    };

    inline auto Kind(RuleViolationCode const c) -> RejectionKind
    {
        using E = RuleViolationCode;
        using K = RejectionKind;
        switch (c)
        {
        case E::WrongPhase:
        case E::Busy:
        case E::FightsUnresolved:
        case E::Charge_NotAwaitingMovement:
        case E::Fight_NotAwaitingFighter:
        case E::Fight_NotAwaitingPileIn:
        case E::Fight_NotAwaitingAttacks:
            return K::PhaseMismatch;

        case E::Charge_AlreadyMarched:
        case E::Charge_AlreadyCharged:
        case E::Shoot_MovedBeforeFirstFire:
        case E::Shoot_MarchedBeforeAdvanceFire:
        case E::Shoot_WeaponUsed:
        case E::Fight_FighterNotEligible:
        case E::Fight_WeaponUsed:
            return K::IneligibleCombatant;

        case E::Move_OutOfRange:
        case E::Charge_OutOfMaxRange:
        case E::Charge_BeyondRolledDistance:
        case E::Shoot_OutOfRange:
        case E::Fight_PileInOutOfRange:
            return K::OutOfRange;

        case E::WrongActor:
        case E::UnknownCombatant:
        case E::Charge_FriendlyTarget:
        case E::Charge_NoContact:
        case E::Shoot_FriendlyTarget:
        case E::Shoot_NotRangedWeapon:
        case E::Weapon_BadIndex:
        case E::Fight_NotParticipant:
        case E::Fight_NoOwnParticipant:
        case E::Fight_FighterNotOwned:
        case E::Fight_PileInNoContact:
        case E::Fight_NotMeleeWeapon:
        case E::Fight_TargetNotEnemy:
        case E::Fight_TargetNotInContact:
            return K::InvalidTarget;

        case E::Charge_NoCharger:
        case E::Shoot_NoShooter:
        case E::Shoot_NoWeapon:
        case E::Fight_NoEngagement:
        case E::Fight_NoneSelected:
        case E::Fight_NoWeapon:
        case E::Select_Nothing:
        case E::Internal_Unreachable:
            return K::NoSelection;
        }
        return K::NoSelection;
    }

    // Compact, optional context carried with the rejection.
    struct Rejection
    {
        RuleViolationCode code{};
        std::optional<Phase> phase{};
        std::optional<PlayerId> actor{};
        std::optional<CombatantId> combatant{};
        std::optional<CombatantId> target{};
        std::optional<uint8_t> weapon{};

        // Distances in world units
        std::optional<float> distance{};
        std::optional<float> allowance{};

        [[nodiscard]]
        auto kind() const -> RejectionKind { return Kind(code); }

        auto with_phase(Phase p) -> Rejection&
        {
            phase = p;
            return *this;
        }

        auto with_actor(PlayerId p) -> Rejection&
        {
            actor = p;
            return *this;
        }

        auto with_combatant(CombatantId id) -> Rejection&
        {
            combatant = id;
            return *this;
        }

        auto with_target(CombatantId id) -> Rejection&
        {
            target = id;
            return *this;
        }

        auto with_weapon(uint8_t w) -> Rejection&
        {
            weapon = w;
            return *this;
        }

        auto with_distance(float d) -> Rejection&
        {
            distance = d;
            return *this;
        }

        auto with_allowance(float a) -> Rejection&
        {
            allowance = a;
            return *this;
        }
    };

    inline auto Reject(RuleViolationCode const code) -> Rejection
    {
        return Rejection{.code = code};
    }

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::WrongPhase: return "Action not legal in this phase";
        case E::WrongActor: return "Combatant belongs to the other player";
        case E::UnknownCombatant: return "No such combatant on the field";
        case E::Busy: return "Another action is still in progress";
        case E::FightsUnresolved: return "Resolve every fight before ending the phase";

        case E::Move_OutOfRange: return "Move: outside movement/march range";

        case E::Charge_NoCharger: return "Charge: no model selected to charge";
        case E::Charge_AlreadyMarched: return "Charge: models that marched cannot charge";
        case E::Charge_AlreadyCharged: return "Charge: already charged this round";
        case E::Charge_FriendlyTarget: return "Charge: can only charge enemy models";
        case E::Charge_OutOfMaxRange: return "Charge: target outside maximum charge range";
        case E::Charge_NotAwaitingMovement: return "Charge: no successful charge awaiting movement";
        case E::Charge_BeyondRolledDistance: return "Charge: move exceeds rolled charge distance";
        case E::Charge_NoContact: return "Charge: move does not reach the target";

        case E::Shoot_NoShooter: return "Shoot: no shooter selected";
        case E::Shoot_MovedBeforeFirstFire: return "Shoot: moved or marched, cannot fire in First Fire";
        case E::Shoot_MarchedBeforeAdvanceFire: return "Shoot: marched, cannot fire in Advance Fire";
        case E::Shoot_NoWeapon: return "Shoot: no weapon selected";
        case E::Shoot_NotRangedWeapon: return "Shoot: weapon is not a ranged weapon";
        case E::Shoot_WeaponUsed: return "Shoot: weapon already used this round";
        case E::Shoot_FriendlyTarget: return "Shoot: can only shoot enemy models";
        case E::Shoot_OutOfRange: return "Shoot: target out of range";

        case E::Weapon_BadIndex: return "Weapon: no such weapon";

        case E::Fight_NoEngagement: return "Fight: combatant is not in any fight";
        case E::Fight_NotParticipant: return "Fight: combatant not part of this fight";
        case E::Fight_NoOwnParticipant: return "Fight: select a fight with one of your own models";
        case E::Fight_NoneSelected: return "Fight: no fight selected";
        case E::Fight_NotAwaitingFighter: return "Fight: not waiting for a fighter";
        case E::Fight_FighterNotEligible: return "Fight: model cannot fight in this initiative round";
        case E::Fight_FighterNotOwned: return "Fight: pick one of your own fighters";
        case E::Fight_NotAwaitingPileIn: return "Fight: not waiting for a pile in move";
        case E::Fight_PileInOutOfRange: return "Fight: pile in move out of range";
        case E::Fight_PileInNoContact: return "Fight: pile in move must touch an enemy model";
        case E::Fight_NotAwaitingAttacks: return "Fight: not waiting for attacks";
        case E::Fight_NotMeleeWeapon: return "Fight: weapon is not a melee weapon";
        case E::Fight_WeaponUsed: return "Fight: weapon already used this activation";
        case E::Fight_NoWeapon: return "Fight: no melee weapon selected";
        case E::Fight_TargetNotEnemy: return "Fight: target is not an enemy in this fight";
        case E::Fight_TargetNotInContact: return "Fight: target not in base contact";

        case E::Select_Nothing: return "Selection: nothing to do with that";

        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    inline auto to_string(RejectionKind k) -> std::string_view
    {
        switch (k)
        {
        case RejectionKind::PhaseMismatch: return "PhaseMismatch";
        case RejectionKind::IneligibleCombatant: return "IneligibleCombatant";
        case RejectionKind::OutOfRange: return "OutOfRange";
        case RejectionKind::InvalidTarget: return "InvalidTarget";
        case RejectionKind::NoSelection: return "NoSelection";
        }
        return "?";
    }

    inline auto describe(Rejection const& v) -> std::string
    {
        // Build a compact, reproducible message for logs/tests.
        auto s = std::format("{} [{}]", to_string(v.code), to_string(v.kind()));
        if (v.phase) s += std::format(" | phase={}", skirmish::core::to_string(*v.phase));
        if (v.actor) s += std::format(" | actor=P{}", static_cast<int>(*v.actor));
        if (v.combatant) s += std::format(" | who=#{}", *v.combatant);
        if (v.target) s += std::format(" | target=#{}", *v.target);
        if (v.weapon) s += std::format(" | weapon={}", static_cast<int>(*v.weapon));
        if (v.distance) s += std::format(" | dist={:.2f}", *v.distance);
        if (v.allowance) s += std::format(" | allow={:.2f}", *v.allowance);
        return s;
    }

    template <typename T>
    using Result = std::expected<T, Rejection>;
    using Verdict = std::expected<void, Rejection>;
}

#endif //SKIRMISH_EXCEPTION_HPP
