#ifndef SKIRMISH_STATE_HPP
#define SKIRMISH_STATE_HPP

#include <string>
#include <string_view>
#include <vector>
#include "Types.hpp"
#include "Actions.hpp"

namespace skirmish::core
{
    enum class ChargeState : uint8_t
    {
        Idle,
        PendingTarget,
        AwaitingMovement
    };

    enum class FightState : uint8_t
    {
        None,
        SelectingFight,
        ResolvingInitiativeRound,
        PileInMove,
        Attacks
    };

    inline auto to_string(ChargeState const s) -> std::string_view
    {
        switch (s)
        {
        case ChargeState::Idle: return "Idle";
        case ChargeState::PendingTarget: return "PendingTarget";
        case ChargeState::AwaitingMovement: return "AwaitingMovement";
        }
        return "?";
    }

    inline auto to_string(FightState const s) -> std::string_view
    {
        switch (s)
        {
        case FightState::None: return "None";
        case FightState::SelectingFight: return "SelectingFight";
        case FightState::ResolvingInitiativeRound: return "ResolvingInitiativeRound";
        case FightState::PileInMove: return "PileInMove";
        case FightState::Attacks: return "Attacks";
        }
        return "?";
    }

    // Read-only copy of one combatant for the presentation layer
    struct CombatantView
    {
        CombatantId id{};
        PlayerId owner{};
        std::string name;
        Vec3 position{};
        std::optional<Vec3> origin_marker{};
        int wounds{};

        bool moved{false};
        bool marched{false};
        bool charged{false};
        bool fought{false};

        float remaining_movement{};
        float remaining_march{};
        int remaining_attacks{};
    };

    // Immutable snapshot exposed to the presentation layer
    struct MatchSnapshot
    {
        int round{1};
        Phase phase{Phase::Movement};
        PlayerId active_player{PlayerOne};
        std::optional<CombatantId> selected{};

        ChargeState charge_state{ChargeState::Idle};
        std::optional<CombatantId> charger{};
        std::optional<CombatantId> charge_target{};
        // rolled distance, and what is left of it measured from the phase start
        std::optional<float> charge_budget{};
        std::optional<float> charge_remaining{};

        FightState fight_state{FightState::None};
        size_t open_fights{};
        std::vector<CombatantId> selected_fight;
        int initiative_tier{};
        std::optional<PlayerId> fight_turn{};
        std::optional<CombatantId> fighter{};

        std::vector<CombatantView> combatants;
    };
} // namespace skirmish::core

#endif //SKIRMISH_STATE_HPP
