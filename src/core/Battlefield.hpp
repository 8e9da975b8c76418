#ifndef SKIRMISH_BATTLEFIELD_HPP
#define SKIRMISH_BATTLEFIELD_HPP

#include <array>
#include <memory>
#include <vector>
#include "Types.hpp"
#include "Combatant.hpp"
#include "Geometry.hpp"
#include "Events.hpp"

namespace skirmish::core::debug {struct Inspector;}
namespace skirmish::core
{
    // Told about every combatant taken off the table, before the removing call returns
    class RemovalListener
    {
    public:
        virtual ~RemovalListener() = default;
        virtual auto OnCombatantRemoved(CombatantId id) -> void = 0;
    };

    // Owns every combatant. Ids index the arena directly and are never reused,
    // so a destroyed slot simply stays empty.
    class Battlefield
    {
    public:
        Battlefield(float conversion_factor, Geometry const& geometry, Notifier const& notifier);

        Battlefield(Battlefield const&) = delete;
        auto operator=(Battlefield const&) -> Battlefield& = delete;

        auto Spawn(CombatantSpec spec) -> CombatantId;

        // nullptr when the id was never spawned or is already destroyed
        auto Find(CombatantId id) -> Combatant*;
        auto Find(CombatantId id) const -> Combatant const*;
        // Throws when the combatant is gone
        auto Get(CombatantId id) -> Combatant&;
        auto Get(CombatantId id) const -> Combatant const&;

        auto Roster(PlayerId player) const -> std::vector<CombatantId> const&;
        // Every live id in ascending order
        auto Live() const -> std::vector<CombatantId>;
        // One past the highest id ever handed out
        auto Capacity() const noexcept -> size_t { return arena_.size(); }

        // Returns true when the combatant was destroyed and removed
        auto ApplyDamage(CombatantId id, int damage) -> bool;
        auto Remove(CombatantId id) -> void;
        auto AddRemovalListener(RemovalListener* listener) -> void;

        auto InContact(CombatantId a, CombatantId b) const -> bool;
        // Would `mover` standing at `at` touch `other`
        auto InContactAt(CombatantId mover, Vec3 at, CombatantId other) const -> bool;
        auto Gap(CombatantId a, CombatantId b) const -> float;

        auto ResetForRound() -> void;
        auto SnapshotStartPositions() -> void;
        auto ClearOriginMarkers() -> void;

        auto GetGeometry() const noexcept -> Geometry const& { return geometry_; }
        auto ConversionFactor() const noexcept -> float { return conversion_factor_; }

        friend struct debug::Inspector;

    private:
        float conversion_factor_;
        Geometry const& geometry_;
        Notifier const& notifier_;

        std::vector<std::unique_ptr<Combatant>> arena_;
        std::array<std::vector<CombatantId>, constants::PlayerCount> rosters_{};
        std::vector<RemovalListener*> listeners_;
    };
}

#endif //SKIRMISH_BATTLEFIELD_HPP
