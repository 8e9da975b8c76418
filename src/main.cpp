//
// main.cpp: scripted hot-seat skirmish, printed round by round
//

#include <charconv>
#include <cstdint>
#include <cstring>
#include <limits>
#include <optional>
#include <print>
#include <string>
#include <vector>

#include "core/Match.hpp"
#include "core/Exception.hpp"
#include "debug/AuditLogger.hpp"

namespace
{
    using namespace skirmish::core;

    struct DemoConfig
    {
        MatchConfig match{};
        std::string log_path{"skirmish_demo.log"};
        int rounds{3};
    };

    auto ParseArgs(int argc, char** argv) -> DemoConfig
    {
        DemoConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next = [&]() -> char const*
            {
                return (i + 1 < argc) ? argv[++i] : nullptr;
            };

            if (arg == "--seed")
            {
                if (char const* s = next())
                {
                    std::uint64_t v{};
                    auto res = std::from_chars(s, s + std::strlen(s), v);
                    if (res.ec == std::errc{}) { cfg.match.seed = v; }
                }
            }
            else if (arg == "--factor")
            {
                if (char const* s = next())
                {
                    float v{};
                    auto res = std::from_chars(s, s + std::strlen(s), v);
                    if (res.ec == std::errc{} && v > 0.0f) { cfg.match.conversion_factor = v; }
                }
            }
            else if (arg == "--rounds")
            {
                if (char const* s = next())
                {
                    int v{};
                    auto res = std::from_chars(s, s + std::strlen(s), v);
                    if (res.ec == std::errc{} && v > 0) { cfg.rounds = v; }
                }
            }
            else if (arg == "--mode")
            {
                if (char const* s = next())
                {
                    std::string const m = s;
                    if (m == "pilein") { cfg.match.fight_mode = FightMode::PileInOnly; }
                    else if (m == "attacks") { cfg.match.fight_mode = FightMode::PileInAndAttacks; }
                }
            }
            else if (arg == "--log")
            {
                if (char const* s = next()) { cfg.log_path = s; }
            }
        }
        return cfg;
    }

    class ConsoleSink final : public MessageSink
    {
    public:
        auto OnEvent(MatchEvent const& e) -> void override
        {
            std::print("  [{}] {}\n", to_string(e.kind), e.message);
        }
    };

    auto SpawnArmies(Match& match) -> void
    {
        float const k = match.Config().conversion_factor;

        for (int i = 0; i < 3; ++i)
        {
            match.Spawn(CombatantSpec{
                .name = "Skitarii Ranger " + std::to_string(i + 1),
                .owner = PlayerOne,
                .stats = Stats{.movement_range = 6.0f, .initiative = 3, .ballistic_skill = 3, .weapon_skill = 4,
                               .strength = 3, .toughness = 3, .armour_save = 4, .wounds = 1, .attacks = 1,
                               .faction = Faction::AdeptusMechanicus},
                .position = Vec3{static_cast<float>(i) * 3.0f * k, 0.0f, 0.0f},
                .footprint = Vec3{0.5f * k, 0.5f * k, 0.5f * k},
                .weapons = {MakeWeapon("Galvanic rifle", 30.0f, 1, 4, 0, 1, k),
                            MakeWeapon("Combat blade", 0.0f, 1, 0, 0, 1, k)}
            });
        }

        for (int i = 0; i < 3; ++i)
        {
            match.Spawn(CombatantSpec{
                .name = "Plague Marine " + std::to_string(i + 1),
                .owner = PlayerTwo,
                .stats = Stats{.movement_range = 5.0f, .initiative = 3, .ballistic_skill = 3, .weapon_skill = 3,
                               .strength = 4, .toughness = 5, .armour_save = 3, .wounds = 2, .attacks = 2,
                               .faction = Faction::DeathGuard},
                .position = Vec3{static_cast<float>(i) * 3.0f * k, 0.0f, 16.0f * k},
                .footprint = Vec3{0.5f * k, 0.5f * k, 0.5f * k},
                .weapons = {MakeWeapon("Boltgun", 24.0f, 2, 4, 0, 1, k),
                            MakeWeapon("Plague knife", 0.0f, 1, 0, 0, 1, k),
                            MakeWeapon("Bubotic axe", 0.0f, 1, 5, -1, 1, k)}
            });
        }
    }

    class Demo
    {
    public:
        Demo(Match& match, debug::AuditLogger& log) :
            match_(match), log_(log)
        {
        }

        auto Play(int rounds) -> void
        {
            while (match_.Round() <= rounds && Alive(PlayerOne) && Alive(PlayerTwo))
            {
                switch (match_.CurrentPhase())
                {
                case Phase::Movement: Advance(); break;
                case Phase::FirstFire:
                case Phase::AdvanceFire: Shoot(); break;
                case Phase::Charge: Charge(); break;
                case Phase::Fight: Fight(); break;
                }
                if (match_.CurrentPhase() != Phase::Fight) Step(EndTurnCommand{});
            }
        }

    private:
        auto Step(Command const& c) -> error::Result<Outcome>
        {
            log_.command(match_, c);
            auto r = match_.Submit(c);
            log_.outcome(r);
            return r;
        }

        auto Alive(PlayerId const p) const -> bool
        {
            return !match_.Field().Roster(p).empty();
        }

        auto Mine() const -> std::vector<CombatantId>
        {
            return match_.Field().Roster(match_.ActivePlayer());
        }

        auto NearestEnemy(CombatantId const from) const -> std::optional<CombatantId>
        {
            Battlefield const& field = match_.Field();
            Combatant const& c = field.Get(from);
            std::optional<CombatantId> best;
            float best_d = std::numeric_limits<float>::max();
            for (CombatantId const id : field.Roster(OtherPlayer(c.Owner())))
            {
                float const d = field.Gap(from, id);
                if (d < best_d)
                {
                    best_d = d;
                    best = id;
                }
            }
            return best;
        }

        // everyone walks half their move straight at the closest enemy
        auto Advance() -> void
        {
            for (CombatantId const id : Mine())
            {
                auto const enemy = NearestEnemy(id);
                if (!enemy) return;
                Combatant const& c = match_.Field().Get(id);
                Vec3 const dir = PlanarDirection(c.Position(), match_.Field().Get(*enemy).Position());
                (void)Step(MoveCommand{id, c.Position() + dir * (c.MovementAllowance() * 0.5f)});
            }
        }

        auto Shoot() -> void
        {
            for (CombatantId const id : Mine())
            {
                if (!match_.Field().Find(id)) continue;
                if (!Step(SelectShooterCommand{id})) continue;

                for (uint8_t const w : match_.Field().Get(id).RangedWeapons())
                {
                    auto const enemy = NearestEnemy(id);
                    if (!enemy) return;
                    if (Step(SelectWeaponCommand{w})) (void)Step(AttackTargetCommand{*enemy});
                }
                (void)Step(DeselectCommand{});
            }
        }

        auto Charge() -> void
        {
            for (CombatantId const id : Mine())
            {
                auto const enemy = NearestEnemy(id);
                if (!enemy) return;
                if (!Step(ChargeCommand{id, *enemy})) continue;
                if (match_.Charge().State() == ChargeState::AwaitingMovement)
                {
                    if (!Step(DirectChargeCommand{})) (void)Step(DeselectCommand{});
                }
            }
        }

        auto Fight() -> void
        {
            FightOrchestrator const& fight = match_.Fight();
            while (match_.CurrentPhase() == Phase::Fight)
            {
                switch (fight.State())
                {
                case FightState::None:
                    return;
                case FightState::SelectingFight:
                    PickFight();
                    (void)Step(ResolveFightCommand{});
                    break;
                case FightState::ResolvingInitiativeRound:
                    for (CombatantId const id : fight.SelectedFight()->participants)
                    {
                        if (Step(SelectFighterCommand{id})) break;
                    }
                    break;
                case FightState::PileInMove:
                    (void)Step(ConfirmPileInCommand{});
                    break;
                case FightState::Attacks:
                    Strike();
                    break;
                }
            }
        }

        // First engagement the current chooser is allowed to pick
        auto PickFight() -> void
        {
            for (Engagement const& e : match_.Fight().Engagements())
            {
                if (!e.participants.empty() && Step(SelectFightCommand{e.participants.front()})) return;
            }
        }

        auto Strike() -> void
        {
            FightOrchestrator const& fight = match_.Fight();
            CombatantId const fighter = *fight.Fighter();
            auto const melee = match_.Field().Get(fighter).MeleeWeapons();

            for (uint8_t const w : melee)
            {
                if (!Step(SelectWeaponCommand{w})) continue;
                auto const enemy = NearestEnemy(fighter);
                if (!enemy || !Step(AttackTargetCommand{*enemy})) break;
                if (fight.State() != FightState::Attacks || fight.Fighter() != fighter) return;
            }
            (void)Step(FinishActivationCommand{});
        }

        Match& match_;
        debug::AuditLogger& log_;
    };
}

int main(int argc, char** argv)
{
    using namespace skirmish::core;

    DemoConfig const cfg = ParseArgs(argc, argv);

    std::print("[skirmish] seed {} | factor {:.1f} | {} round(s)\n",
               cfg.match.seed, cfg.match.conversion_factor, cfg.rounds);

    try
    {
        Match match(cfg.match);
        ConsoleSink console;
        debug::AuditLogger log(cfg.log_path);
        match.AddSink(&console);
        match.AddSink(&log);

        SpawnArmies(match);
        log.start(match);

        Demo demo(match, log);
        demo.Play(cfg.rounds);

        log.end(match);
        std::print("[skirmish] finished in round {} | P1 {} model(s), P2 {} model(s)\n",
                   match.Round(),
                   match.Field().Roster(PlayerOne).size(),
                   match.Field().Roster(PlayerTwo).size());
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print(stderr, "[skirmish] {}\n", e);
        return 1;
    }
    catch (std::exception const& e)
    {
        std::print(stderr, "[skirmish] {}\n", e.what());
        return 1;
    }

    return 0;
}
