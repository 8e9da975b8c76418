#include "Combatant.hpp"

#include <algorithm>
#include <ranges>
#include <utility>

#include "Exception.hpp"

namespace skirmish::core
{
    Combatant::Combatant(CombatantId const id, CombatantSpec spec, float const conversion_factor) :
        id_(id),
        owner_(spec.owner),
        name_(std::move(spec.name)),
        stats_(spec.stats),
        position_(spec.position),
        start_position_(spec.position),
        footprint_(spec.footprint),
        weapons_(std::move(spec.weapons)),
        movement_allowance_(spec.stats.movement_range * conversion_factor),
        march_allowance_((spec.stats.movement_range + static_cast<float>(spec.stats.initiative)) * conversion_factor),
        max_charge_range_((spec.stats.movement_range + constants::ChargeRangeBonus) * conversion_factor),
        remaining_movement_(movement_allowance_),
        remaining_march_(march_allowance_)
    {
        SKM_ASSERT(owner_ == PlayerOne || owner_ == PlayerTwo, "Combatant owner must be player 1 or 2");
        SKM_ASSERT(stats_.wounds > 0, "Combatant spawned without wounds");
        SKM_ASSERT(weapons_.size() <= 0xFF, "Too many weapons on one combatant");
    }

    auto Combatant::EffectiveInitiative() const noexcept -> int
    {
        return stats_.initiative + (has_charged_ ? 1 : 0);
    }

    auto Combatant::AttackAllowance() const -> int
    {
        int const melee = static_cast<int>(MeleeWeapons().size());
        return stats_.attacks + (has_charged_ ? 1 : 0) + (melee >= 2 ? 1 : 0);
    }

    auto Combatant::WeaponAt(uint8_t const index) const -> Weapon const*
    {
        return index < weapons_.size() ? &weapons_[index] : nullptr;
    }

    auto Combatant::RangedWeapons() const -> std::vector<uint8_t>
    {
        std::vector<uint8_t> out;
        for (size_t i{}; i < weapons_.size(); ++i)
            if (weapons_[i].IsRanged()) out.push_back(static_cast<uint8_t>(i));
        return out;
    }

    auto Combatant::MeleeWeapons() const -> std::vector<uint8_t>
    {
        std::vector<uint8_t> out;
        for (size_t i{}; i < weapons_.size(); ++i)
            if (weapons_[i].IsMelee()) out.push_back(static_cast<uint8_t>(i));
        return out;
    }

    auto Combatant::MoveTo(Vec3 destination) -> void
    {
        // models slide over the table, height never changes
        destination.y = position_.y;
        if (!origin_marker_) origin_marker_ = start_position_;
        position_ = destination;
    }

    auto Combatant::RecordNetDisplacement(float const distance) -> void
    {
        has_moved_ = distance > 0.0f;
        has_marched_ = distance > movement_allowance_;
        remaining_movement_ = std::max(movement_allowance_ - distance, 0.0f);
        remaining_march_ = std::max(march_allowance_ - distance, 0.0f);
    }

    auto Combatant::SpendAttack() -> void
    {
        SKM_ASSERT(remaining_attacks_ > 0, "Attack spent with none remaining");
        --remaining_attacks_;
    }

    auto Combatant::SnapshotStart() -> void
    {
        start_position_ = position_;
        origin_marker_.reset();
    }

    auto Combatant::ResetForRound() -> void
    {
        has_moved_ = false;
        has_marched_ = false;
        has_charged_ = false;
        has_fought_ = false;
        remaining_movement_ = movement_allowance_;
        remaining_march_ = march_allowance_;
        remaining_attacks_ = 0;
        SnapshotStart();
    }

    auto Combatant::TakeDamage(int const damage) -> bool
    {
        SKM_ASSERT(damage >= 0, "Negative damage");
        stats_.wounds -= damage;
        return stats_.wounds <= 0;
    }
}
