#ifndef SKIRMISH_COMBATANT_HPP
#define SKIRMISH_COMBATANT_HPP

#include <span>
#include <string>
#include <vector>
#include "Types.hpp"
#include "Weapon.hpp"

namespace skirmish::core
{
    struct Stats
    {
        // inches
        float movement_range{6.0f};
        int initiative{3};
        int ballistic_skill{4};
        int weapon_skill{4};
        int strength{3};
        int toughness{3};
        int armour_save{4};
        int invulnerability_save{constants::NoInvulnerableSave};
        int wounds{1};
        int attacks{1};
        Faction faction{Faction::AdeptusMechanicus};
    };

    // Everything needed to put a model on the table
    struct CombatantSpec
    {
        std::string name;
        PlayerId owner{PlayerOne};
        Stats stats{};
        Vec3 position{};
        // half-size of the model's bounding box, world units
        Vec3 footprint{5.0f, 5.0f, 5.0f};
        std::vector<Weapon> weapons{};
    };

    class Combatant
    {
    public:
        Combatant() = delete;
        Combatant(CombatantId id, CombatantSpec spec, float conversion_factor);

        Combatant(Combatant const&) = delete;
        auto operator=(Combatant const&) -> Combatant& = delete;

        auto Id() const noexcept -> CombatantId { return id_; }
        auto Owner() const noexcept -> PlayerId { return owner_; }
        auto Name() const noexcept -> std::string const& { return name_; }
        auto GetStats() const noexcept -> Stats const& { return stats_; }
        auto Wounds() const noexcept -> int { return stats_.wounds; }
        auto IsDestroyed() const noexcept -> bool { return stats_.wounds <= 0; }

        auto Position() const noexcept -> Vec3 { return position_; }
        auto StartPosition() const noexcept -> Vec3 { return start_position_; }
        auto Footprint() const noexcept -> Vec3 { return footprint_; }
        auto OriginMarker() const noexcept -> std::optional<Vec3> const& { return origin_marker_; }

        auto HasMoved() const noexcept -> bool { return has_moved_; }
        auto HasMarched() const noexcept -> bool { return has_marched_; }
        auto HasCharged() const noexcept -> bool { return has_charged_; }
        auto HasFought() const noexcept -> bool { return has_fought_; }

        auto RemainingMovement() const noexcept -> float { return remaining_movement_; }
        auto RemainingMarch() const noexcept -> float { return remaining_march_; }
        auto RemainingAttacks() const noexcept -> int { return remaining_attacks_; }

        auto MovementAllowance() const noexcept -> float { return movement_allowance_; }
        auto MarchAllowance() const noexcept -> float { return march_allowance_; }
        auto MaxChargeRange() const noexcept -> float { return max_charge_range_; }

        // +1 for having charged this round
        auto EffectiveInitiative() const noexcept -> int;
        auto CanCharge() const noexcept -> bool { return !has_marched_ && !has_charged_; }
        // attacks, +1 if charged, +1 more with two or more melee weapons
        auto AttackAllowance() const -> int;

        auto Weapons() const noexcept -> std::span<Weapon const> { return weapons_; }
        auto WeaponAt(uint8_t index) const -> Weapon const*;
        auto RangedWeapons() const -> std::vector<uint8_t>;
        auto MeleeWeapons() const -> std::vector<uint8_t>;

        // Mutators used by the resolvers. None of them validate rules.
        auto MoveTo(Vec3 destination) -> void;
        auto RecordNetDisplacement(float distance) -> void;
        auto SetCharged() -> void { has_charged_ = true; }
        auto SetFought() -> void { has_fought_ = true; }
        auto SetRemainingAttacks(int n) -> void { remaining_attacks_ = n; }
        auto SpendAttack() -> void;
        auto SnapshotStart() -> void;
        auto ClearOriginMarker() -> void { origin_marker_.reset(); }
        auto ResetForRound() -> void;
        // Returns true when this blow was lethal
        auto TakeDamage(int damage) -> bool;

    private:
        CombatantId id_;
        PlayerId owner_;
        std::string name_;
        Stats stats_;

        Vec3 position_;
        Vec3 start_position_;
        Vec3 footprint_;
        std::optional<Vec3> origin_marker_{};

        std::vector<Weapon> weapons_;

        float movement_allowance_;
        float march_allowance_;
        float max_charge_range_;

        float remaining_movement_;
        float remaining_march_;
        int remaining_attacks_{0};

        bool has_moved_{false};
        bool has_marched_{false};
        bool has_charged_{false};
        bool has_fought_{false};
    };
}

#endif //SKIRMISH_COMBATANT_HPP
