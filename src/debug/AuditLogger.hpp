#ifndef SKIRMISH_AUDITLOGGER_HPP
#define SKIRMISH_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/Match.hpp"
#include "../core/Events.hpp"
#include "../core/Actions.hpp"
#include "../core/Exception.hpp"
#include "../core/Types.hpp"

namespace skirmish::core::debug
{
    // Line-oriented transcript of a match. Attach it to the match to capture
    // events; the driver logs commands and their results itself.
    class AuditLogger final : public MessageSink
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger() override;

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        // Session header (seed, conversion factor, fight mode, roster sizes)
        auto start(Match const& match) -> void;

        // Before Submit: where we are and what is proposed
        auto command(Match const& match, Command const& c) -> void;
        auto selection(Match const& match, Selection const& s) -> void;

        // After Submit
        auto outcome(error::Result<Outcome> const& r) -> void;

        // Footer with survivors per player
        auto end(Match const& match) -> void;

        auto flush() -> void;

        auto OnEvent(MatchEvent const& e) -> void override;

    private:
        std::ofstream out_;
    };
}

#endif //SKIRMISH_AUDITLOGGER_HPP
