#ifndef SKIRMISH_WEAPON_HPP
#define SKIRMISH_WEAPON_HPP

#include <string>
#include <utility>
#include "Types.hpp"

namespace skirmish::core
{
    struct Weapon
    {
        std::string name;
        // world units, 0 for melee
        float range{};
        int shots{1};
        // 0 on a melee weapon strikes at the bearer's strength
        int strength{};
        // <= 0, subtracted from the armour save so -1 turns a 3+ into a 4+
        int armour_piercing{};
        int damage{1};

        [[nodiscard]]
        auto IsMelee() const noexcept -> bool { return range <= 0.0f; }
        [[nodiscard]]
        auto IsRanged() const noexcept -> bool { return range > 0.0f; }
    };

    // Tabletop profile in inches, converted once when the weapon is attached
    inline auto MakeWeapon(std::string name, float range_inches, int shots, int strength,
                           int armour_piercing, int damage, float conversion_factor) -> Weapon
    {
        return Weapon{
            .name = std::move(name),
            .range = range_inches * conversion_factor,
            .shots = shots,
            .strength = strength,
            .armour_piercing = armour_piercing,
            .damage = damage
        };
    }
}

#endif //SKIRMISH_WEAPON_HPP
