#include "CombatResolver.hpp"

#include <algorithm>
#include <format>
#include <string>

#include "Battlefield.hpp"
#include "Dice.hpp"
#include "Exception.hpp"

namespace skirmish::core
{
    auto WoundTarget(int const strength, int const toughness) -> std::optional<int>
    {
        if (strength >= 2 * toughness) return 2;
        if (2 * strength <= toughness) return std::nullopt;
        if (strength > toughness) return 3;
        if (strength == toughness) return 4;
        return 5;
    }

    auto ResolveWoundRoll(int const roll, int const strength, int const toughness) -> bool
    {
        auto const target = WoundTarget(strength, toughness);
        return target && roll >= *target;
    }

    auto RequiredSave(int const armour_save, int const armour_piercing, int const invulnerable_save) -> int
    {
        return std::min(armour_save - armour_piercing, invulnerable_save);
    }

    auto IsSaved(int const roll, int const required) -> bool
    {
        return roll >= required;
    }

    CombatResolver::CombatResolver(Battlefield& battlefield, Dice& dice, Notifier const& notifier) :
        battlefield_(battlefield),
        dice_(dice),
        notifier_(notifier)
    {
    }

    auto CombatResolver::ResolveAttack(CombatantId const attacker, uint8_t const weapon,
                                       CombatantId const defender) -> AttackReport
    {
        Combatant const& a = battlefield_.Get(attacker);
        Combatant const& d = battlefield_.Get(defender);
        Weapon const* w = a.WeaponAt(weapon);
        SKM_ASSERT(w != nullptr, "Attack with a weapon the attacker does not carry");
        SKM_ASSERT(attacker != defender, "Combatant attacking itself");

        Stats const& as = a.GetStats();
        Stats const& ds = d.GetStats();
        int const skill = w->IsRanged() ? as.ballistic_skill : as.weapon_skill;
        int const strength = (w->IsMelee() && w->strength <= 0) ? as.strength : w->strength;
        int const required_save = RequiredSave(ds.armour_save, w->armour_piercing, ds.invulnerability_save);

        AttackReport r{};
        r.shots = w->shots;

        for (int i{}; i < w->shots; ++i)
        {
            if (dice_.RollD6() >= skill) ++r.hits;
        }
        for (int i{}; i < r.hits; ++i)
        {
            if (ResolveWoundRoll(dice_.RollD6(), strength, ds.toughness)) ++r.wounds;
        }
        for (int i{}; i < r.wounds; ++i)
        {
            if (!IsSaved(dice_.RollD6(), required_save)) ++r.unsaved;
        }
        r.damage = r.unsaved * w->damage;

        std::string const summary = std::format("{} -> {} with {}: {} hits, {} wounds, {} unsaved, {} damage",
                                                a.Name(), d.Name(), w->name, r.hits, r.wounds, r.unsaved, r.damage);
        notifier_.Post(EventKind::AttackResolved, summary, defender);

        // d dangles once the defender is removed
        if (r.damage > 0) r.destroyed = battlefield_.ApplyDamage(defender, r.damage);
        return r;
    }
}
