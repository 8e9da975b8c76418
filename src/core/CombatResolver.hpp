#ifndef SKIRMISH_COMBATRESOLVER_HPP
#define SKIRMISH_COMBATRESOLVER_HPP

#include <optional>
#include "Types.hpp"

namespace skirmish::core
{
    class Battlefield;
    class Dice;
    class Notifier;

    struct AttackReport
    {
        int shots{};
        int hits{};
        int wounds{};
        int unsaved{};
        int damage{};
        bool destroyed{false};
    };

    // Lowest roll that wounds, empty when the attack can never wound
    auto WoundTarget(int strength, int toughness) -> std::optional<int>;
    auto ResolveWoundRoll(int roll, int strength, int toughness) -> bool;
    // armour_piercing is <= 0, so it raises the required roll
    auto RequiredSave(int armour_save, int armour_piercing, int invulnerable_save) -> int;
    auto IsSaved(int roll, int required) -> bool;

    // Hit, wound, save, damage. Shared by shooting and melee; callers do range,
    // contact and once-per-use gating before calling in.
    class CombatResolver
    {
    public:
        CombatResolver(Battlefield& battlefield, Dice& dice, Notifier const& notifier);

        auto ResolveAttack(CombatantId attacker, uint8_t weapon, CombatantId defender) -> AttackReport;

    private:
        Battlefield& battlefield_;
        Dice& dice_;
        Notifier const& notifier_;
    };
}

#endif //SKIRMISH_COMBATRESOLVER_HPP
