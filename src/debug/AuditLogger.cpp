#include "AuditLogger.hpp"

#include <format>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

using namespace skirmish::core;

namespace
{

auto s_vec(Vec3 const& v) -> std::string
{
    return std::format("({:.1f},{:.1f},{:.1f})", v.x, v.y, v.z);
}

auto s_mode(FightMode const m) -> std::string_view
{
    return m == FightMode::PileInOnly ? "PileInOnly" : "PileInAndAttacks";
}

auto s_command(Command const& c) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& cmd) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, MoveCommand>)
            {
                return std::format("Move(#{} -> {})", cmd.mover, s_vec(cmd.destination));
            }
            else if constexpr (std::is_same_v<T, SelectChargerCommand>)
            {
                return std::format("SelectCharger(#{})", cmd.charger);
            }
            else if constexpr (std::is_same_v<T, ChargeCommand>)
            {
                return std::format("Charge(#{} -> #{})", cmd.attacker, cmd.target);
            }
            else if constexpr (std::is_same_v<T, ChargeMoveCommand>)
            {
                return std::format("ChargeMove({})", s_vec(cmd.destination));
            }
            else if constexpr (std::is_same_v<T, DirectChargeCommand>)
            {
                return "DirectCharge";
            }
            else if constexpr (std::is_same_v<T, SelectShooterCommand>)
            {
                return std::format("SelectShooter(#{})", cmd.shooter);
            }
            else if constexpr (std::is_same_v<T, SelectWeaponCommand>)
            {
                return std::format("SelectWeapon({})", static_cast<int>(cmd.weapon));
            }
            else if constexpr (std::is_same_v<T, AttackTargetCommand>)
            {
                return std::format("Attack(#{})", cmd.target);
            }
            else if constexpr (std::is_same_v<T, SelectFightCommand>)
            {
                return std::format("SelectFight(#{})", cmd.participant);
            }
            else if constexpr (std::is_same_v<T, ResolveFightCommand>)
            {
                return "ResolveFight";
            }
            else if constexpr (std::is_same_v<T, SelectFighterCommand>)
            {
                return std::format("SelectFighter(#{})", cmd.fighter);
            }
            else if constexpr (std::is_same_v<T, PileInCommand>)
            {
                return std::format("PileIn({})", s_vec(cmd.destination));
            }
            else if constexpr (std::is_same_v<T, ConfirmPileInCommand>)
            {
                return "ConfirmPileIn";
            }
            else if constexpr (std::is_same_v<T, FinishActivationCommand>)
            {
                return "FinishActivation";
            }
            else if constexpr (std::is_same_v<T, EndTurnCommand>)
            {
                return "EndTurn";
            }
            else
            {
                return "Deselect";
            }
        },
        c
    );
}

auto s_where(Match const& m) -> std::string
{
    return std::format("R{} {} P{}", m.Round(), to_string(m.CurrentPhase()), static_cast<int>(m.ActivePlayer()));
}

} // anonymous namespace

namespace skirmish::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(Match const& match) -> void
{
    MatchConfig const& cfg = match.Config();
    out_ << std::format("Seed={}\n", cfg.seed);
    out_ << std::format("Factor={:.2f}\n", cfg.conversion_factor);
    out_ << std::format("FightMode={}\n", s_mode(cfg.fight_mode));
    out_ << std::format("Rosters=P1:{},P2:{}\n",
                        match.Field().Roster(PlayerOne).size(),
                        match.Field().Roster(PlayerTwo).size());
    out_.flush();
}

auto AuditLogger::command(Match const& match, Command const& c) -> void
{
    out_ << std::format("[{}] Command: {}\n", s_where(match), s_command(c));
}

auto AuditLogger::selection(Match const& match, Selection const& s) -> void
{
    std::string const what = s.surface == SurfaceTag::Model && s.combatant
                           ? std::format("#{}", *s.combatant)
                           : (s.surface == SurfaceTag::Ground ? std::string("ground") : std::string("nothing"));
    out_ << std::format("[{}] Select: {} at {}\n", s_where(match), what, s_vec(s.point));
}

auto AuditLogger::outcome(error::Result<Outcome> const& r) -> void
{
    if (!r)
    {
        out_ << std::format("Outcome: Rejected ({})\n", error::describe(r.error()));
        return;
    }
    char const* txt =
        (*r == Outcome::Applied    ? "Applied" :
        (*r == Outcome::PhaseEnded ? "PhaseEnded" : "RoundEnded"));
    out_ << std::format("Outcome: {}\n", txt);
}

auto AuditLogger::OnEvent(MatchEvent const& e) -> void
{
    if (e.subject)
    {
        out_ << std::format("Event {} #{}: {}\n", to_string(e.kind), *e.subject, e.message);
    }
    else
    {
        out_ << std::format("Event {}: {}\n", to_string(e.kind), e.message);
    }
}

auto AuditLogger::end(Match const& match) -> void
{
    std::string body;
    for (PlayerId p : {PlayerOne, PlayerTwo})
    {
        body += std::format("{}P{}:{}", (p == PlayerOne ? "" : ","), static_cast<int>(p),
                            match.Field().Roster(p).size());
    }
    out_ << std::format("Round={} Survivors=[{}]\n", match.Round(), body);
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace skirmish::core::debug
