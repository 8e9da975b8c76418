#ifndef SKIRMISH_INSPECTOR_HPP
#define SKIRMISH_INSPECTOR_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "../core/Types.hpp"
#include "../core/Match.hpp"

namespace skirmish::core::debug
{
    struct Inspector
    {
        struct SnapshotAll
        {
            // arena slots, null where a combatant was destroyed
            std::vector<Combatant const*> arena;
            std::array<std::vector<CombatantId>, constants::PlayerCount> rosters{};
            std::vector<Engagement> engagements;
            std::vector<CombatantId> fought_this_fight;

            Phase phase{};
            PlayerId active{};
            ChargeState charge_state{};
            FightState fight_state{};
            int tier{};
            std::optional<CombatantId> selected{};
        };

        static inline auto Gather(Match const& m) -> SnapshotAll
        {
            SnapshotAll ret{};
            ret.arena.reserve(m.battlefield_.arena_.size());
            for (auto const& c : m.battlefield_.arena_) ret.arena.push_back(c.get());

            ret.rosters = m.battlefield_.rosters_;
            ret.engagements = m.fight_.engagements_;
            ret.fought_this_fight = m.fight_.fought_;

            ret.phase = m.machine_.CurrentPhase();
            ret.active = m.machine_.ActivePlayer();
            ret.charge_state = m.charge_.State();
            ret.fight_state = m.fight_.state_;
            ret.tier = m.fight_.tier_;
            ret.selected = m.selected_;
            return ret;
        }

        // White-box access for tests that need to stage a position
        static inline auto Mutable(Match& m, CombatantId id) -> Combatant&
        {
            return m.battlefield_.Get(id);
        }
    };
}

#endif //SKIRMISH_INSPECTOR_HPP
