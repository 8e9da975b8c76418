#include "Battlefield.hpp"

#include <algorithm>
#include <format>
#include <utility>

#include "Exception.hpp"

namespace skirmish::core
{
    Battlefield::Battlefield(float const conversion_factor, Geometry const& geometry, Notifier const& notifier) :
        conversion_factor_(conversion_factor),
        geometry_(geometry),
        notifier_(notifier)
    {
        SKM_ASSERT(conversion_factor_ > 0.0f, "Conversion factor must be positive");
    }

    auto Battlefield::Spawn(CombatantSpec spec) -> CombatantId
    {
        auto const id = static_cast<CombatantId>(arena_.size());
        PlayerId const owner = spec.owner;
        arena_.push_back(std::make_unique<Combatant>(id, std::move(spec), conversion_factor_));
        rosters_[owner - 1].push_back(id);
        return id;
    }

    auto Battlefield::Find(CombatantId const id) -> Combatant*
    {
        return id < arena_.size() ? arena_[id].get() : nullptr;
    }

    auto Battlefield::Find(CombatantId const id) const -> Combatant const*
    {
        return id < arena_.size() ? arena_[id].get() : nullptr;
    }

    auto Battlefield::Get(CombatantId const id) -> Combatant&
    {
        Combatant* c = Find(id);
        if (!c) SKM_THROW(error::Code::Rules, std::format("No live combatant #{}", id));
        return *c;
    }

    auto Battlefield::Get(CombatantId const id) const -> Combatant const&
    {
        Combatant const* c = Find(id);
        if (!c) SKM_THROW(error::Code::Rules, std::format("No live combatant #{}", id));
        return *c;
    }

    auto Battlefield::Roster(PlayerId const player) const -> std::vector<CombatantId> const&
    {
        SKM_ASSERT(player == PlayerOne || player == PlayerTwo, "Roster of unknown player");
        return rosters_[player - 1];
    }

    auto Battlefield::Live() const -> std::vector<CombatantId>
    {
        std::vector<CombatantId> out;
        for (size_t i{}; i < arena_.size(); ++i)
        {
            if (arena_[i]) out.push_back(static_cast<CombatantId>(i));
        }
        return out;
    }

    auto Battlefield::ApplyDamage(CombatantId const id, int const damage) -> bool
    {
        Combatant& c = Get(id);
        if (!c.TakeDamage(damage)) return false;

        notifier_.Post(EventKind::CombatantDestroyed, std::format("{} was destroyed", c.Name()), id);
        Remove(id);
        return true;
    }

    auto Battlefield::Remove(CombatantId const id) -> void
    {
        Combatant const& c = Get(id);
        std::erase(rosters_[c.Owner() - 1], id);
        arena_[id].reset();

        for (RemovalListener* l : listeners_) l->OnCombatantRemoved(id);
    }

    auto Battlefield::AddRemovalListener(RemovalListener* listener) -> void
    {
        SKM_ASSERT(listener != nullptr, "Null removal listener");
        listeners_.push_back(listener);
    }

    auto Battlefield::InContact(CombatantId const a, CombatantId const b) const -> bool
    {
        return geometry_.Intersects(geometry_.VolumeOf(Get(a)), geometry_.VolumeOf(Get(b)));
    }

    auto Battlefield::InContactAt(CombatantId const mover, Vec3 const at, CombatantId const other) const -> bool
    {
        Combatant const& m = Get(mover);
        // MoveTo keeps height, so probe at the mover's own
        Vec3 const probe{at.x, m.Position().y, at.z};
        return geometry_.Intersects(geometry_.VolumeOf(m, probe), geometry_.VolumeOf(Get(other)));
    }

    auto Battlefield::Gap(CombatantId const a, CombatantId const b) const -> float
    {
        return geometry_.Gap(geometry_.VolumeOf(Get(a)), geometry_.VolumeOf(Get(b)));
    }

    auto Battlefield::ResetForRound() -> void
    {
        for (auto& c : arena_)
            if (c) c->ResetForRound();
    }

    auto Battlefield::SnapshotStartPositions() -> void
    {
        for (auto& c : arena_)
            if (c) c->SnapshotStart();
    }

    auto Battlefield::ClearOriginMarkers() -> void
    {
        for (auto& c : arena_)
            if (c) c->ClearOriginMarker();
    }
}
