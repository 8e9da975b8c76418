#ifndef SKIRMISH_INVARIANTS_HPP
#define SKIRMISH_INVARIANTS_HPP

#include "../core/Match.hpp"
#include "Inspector.hpp"
#include <algorithm>
#include <cassert>
#include <ranges>
#include <unordered_set>
#include <vector>

namespace skirmish::core::debug
{
    // A second layer of checks over the whole match, run by tests after every step
    inline auto CheckInvariants(Match const& m) -> void
    {
#if SKM_ENABLE_TEST_HOOKS == false
        (void)m;
#else
        Inspector::SnapshotAll const s = Inspector::Gather(m);

        auto const alive = [&](CombatantId const id)
        {
            return id < s.arena.size() && s.arena[id] != nullptr;
        };

        // 1) Live combatants always have wounds left
        for (Combatant const* c : s.arena)
        {
            if (!c) continue;
            assert(c->Wounds() > 0 && "Combatant alive with no wounds");
        }

        // 2) Rosters hold exactly the live combatants, each under its owner
        {
            size_t listed = 0;
            for (size_t p{}; p < s.rosters.size(); ++p)
            {
                for (CombatantId const id : s.rosters[p])
                {
                    assert(alive(id) && "Destroyed combatant still on a roster");
                    assert(s.arena[id]->Owner() == static_cast<PlayerId>(p + 1) && "Combatant on the wrong roster");
                    ++listed;
                }
            }
            auto const live = static_cast<size_t>(std::ranges::count_if(s.arena, [](Combatant const* c) { return c != nullptr; }));
            assert(listed == live && "Roster count differs from live combatants");
        }

        // 3) Engagements only reference live combatants, sorted, never shared
        {
            std::unordered_set<CombatantId> seen;
            for (Engagement const& e : s.engagements)
            {
                assert(std::ranges::is_sorted(e.participants));
                for (CombatantId const id : e.participants)
                {
                    assert(alive(id) && "Destroyed combatant in an engagement");
                    bool const inserted = seen.insert(id).second;
                    assert(inserted && "Combatant in two engagements");
                }
            }
        }

        // 4) Marching implies moving, and allowances stay within bounds
        for (Combatant const* c : s.arena)
        {
            if (!c) continue;
            assert((!c->HasMarched() || c->HasMoved()) && "Marched without moving");
            assert(c->RemainingMovement() >= 0.0f && c->RemainingMovement() <= c->MovementAllowance());
            assert(c->RemainingMarch() >= 0.0f && c->RemainingMarch() <= c->MarchAllowance());
            assert(c->RemainingAttacks() >= 0);
        }

        // 5) Suspend states only exist in their own phase
        assert(s.charge_state == ChargeState::Idle || s.phase == Phase::Charge);
        assert(s.fight_state == FightState::None || s.phase == Phase::Fight);
        assert(s.fight_state == FightState::None || s.fight_state == FightState::SelectingFight
               || (s.tier >= 1 && s.tier <= constants::MaxInitiative));

        // 6) Selection never points at a destroyed combatant
        assert(!s.selected || alive(*s.selected));
#endif // SKM_ENABLE_TEST_HOOKS == true
    }
}

#endif //SKIRMISH_INVARIANTS_HPP
