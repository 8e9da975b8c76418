#ifndef SKIRMISH_EVENTS_HPP
#define SKIRMISH_EVENTS_HPP

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "Types.hpp"

namespace skirmish::core
{
    enum class EventKind : uint8_t
    {
        Info,
        Rejected,
        Moved,
        ChargeSucceeded,
        ChargeFailed,
        ChargeCompleted,
        AttackResolved,
        CombatantDestroyed,
        FightSelected,
        FighterActivated,
        FightResolved,
        PhaseEntered,
        RoundEnded
    };

    inline auto to_string(EventKind const k) -> std::string_view
    {
        switch (k)
        {
        case EventKind::Info: return "Info";
        case EventKind::Rejected: return "Rejected";
        case EventKind::Moved: return "Moved";
        case EventKind::ChargeSucceeded: return "ChargeSucceeded";
        case EventKind::ChargeFailed: return "ChargeFailed";
        case EventKind::ChargeCompleted: return "ChargeCompleted";
        case EventKind::AttackResolved: return "AttackResolved";
        case EventKind::CombatantDestroyed: return "CombatantDestroyed";
        case EventKind::FightSelected: return "FightSelected";
        case EventKind::FighterActivated: return "FighterActivated";
        case EventKind::FightResolved: return "FightResolved";
        case EventKind::PhaseEntered: return "PhaseEntered";
        case EventKind::RoundEnded: return "RoundEnded";
        }
        return "?";
    }

    // Player-facing message. Informational only, nothing waits on it.
    struct MatchEvent
    {
        EventKind kind{EventKind::Info};
        std::string message;
        std::optional<CombatantId> subject{};
    };

    class MessageSink
    {
    public:
        virtual ~MessageSink() = default;
        virtual auto OnEvent(MatchEvent const& e) -> void = 0;
    };

    // Fans events out to every attached sink. Sinks are not owned.
    class Notifier
    {
    public:
        auto Attach(MessageSink* sink) -> void
        {
            if (sink && std::ranges::find(sinks_, sink) == sinks_.end()) sinks_.push_back(sink);
        }

        auto Detach(MessageSink* sink) -> void
        {
            std::erase(sinks_, sink);
        }

        auto Post(MatchEvent const& e) const -> void
        {
            for (MessageSink* s : sinks_) s->OnEvent(e);
        }

        auto Post(EventKind const kind, std::string message,
                  std::optional<CombatantId> const subject = std::nullopt) const -> void
        {
            Post(MatchEvent{.kind = kind, .message = std::move(message), .subject = subject});
        }

    private:
        std::vector<MessageSink*> sinks_;
    };
}

#endif //SKIRMISH_EVENTS_HPP
