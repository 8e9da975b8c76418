#ifndef SKIRMISH_ACTIONS_HPP
#define SKIRMISH_ACTIONS_HPP

#include <string_view>
#include "Types.hpp"

namespace skirmish::core
{
    enum class Phase : uint8_t
    {
        Movement,
        FirstFire,
        Charge,
        Fight,
        AdvanceFire
    };

    inline auto to_string(Phase const p) -> std::string_view
    {
        switch (p)
        {
        case Phase::Movement: return "Movement";
        case Phase::FirstFire: return "FirstFire";
        case Phase::Charge: return "Charge";
        case Phase::Fight: return "Fight";
        case Phase::AdvanceFire: return "AdvanceFire";
        }
        return "?";
    }

    // Movement phase
    struct MoveCommand          { CombatantId mover{}; Vec3 destination{}; };

    // Charge phase
    struct SelectChargerCommand { CombatantId charger{}; };
    struct ChargeCommand        { CombatantId attacker{}; CombatantId target{}; };
    struct ChargeMoveCommand    { Vec3 destination{}; };
    // Click on the charge target itself: close straight in to contact
    struct DirectChargeCommand  {};

    // Shooting phases (and melee weapon/target choice in Fight)
    struct SelectShooterCommand { CombatantId shooter{}; };
    struct SelectWeaponCommand  { uint8_t weapon{}; };
    struct AttackTargetCommand  { CombatantId target{}; };

    // Fight phase
    struct SelectFightCommand      { CombatantId participant{}; };
    struct ResolveFightCommand     {};
    struct SelectFighterCommand    { CombatantId fighter{}; };
    struct PileInCommand           { Vec3 destination{}; };
    struct ConfirmPileInCommand    {};
    struct FinishActivationCommand {};

    struct EndTurnCommand  {};
    struct DeselectCommand {};

    using Command = std::variant<
        MoveCommand,
        SelectChargerCommand, ChargeCommand, ChargeMoveCommand, DirectChargeCommand,
        SelectShooterCommand, SelectWeaponCommand, AttackTargetCommand,
        SelectFightCommand, ResolveFightCommand, SelectFighterCommand,
        PileInCommand, ConfirmPileInCommand, FinishActivationCommand,
        EndTurnCommand, DeselectCommand>;

    enum class Outcome : uint8_t
    {
        Applied,
        PhaseEnded,
        RoundEnded
    };

    // What a pointer/ray resolved to on the presentation side
    enum class SurfaceTag : uint8_t
    {
        None,
        Ground,
        Model
    };

    struct Selection
    {
        std::optional<CombatantId> combatant{};
        Vec3 point{};
        SurfaceTag surface{SurfaceTag::None};
    };
} // namespace skirmish::core

#endif //SKIRMISH_ACTIONS_HPP
