#include <gtest/gtest.h>

#include <filesystem>
#include <format>
#include <print>
#include <random>
#include <utility>
#include <vector>

#include "../core/Match.hpp"
#include "../debug/AuditLogger.hpp"
#include "../debug/Invariants.hpp"

using namespace skirmish::core;

namespace
{
    constexpr float K = 10.0f;

    auto Squad(Match& m, PlayerId const owner, float const z) -> void
    {
        for (int i = 0; i < 4; ++i)
        {
            CombatantSpec spec{
                .name = std::format("P{}-{}", owner, i),
                .owner = owner,
                .stats = Stats{.initiative = 2 + i, .wounds = 2, .attacks = 1 + i % 2},
                .position = {static_cast<float>(i) * 15.0f, 0.0f, z},
                .footprint = {5.0f, 5.0f, 5.0f},
                .weapons = {MakeWeapon("Carbine", 18.0f, 2, 4, 0, 1, K),
                            MakeWeapon("Knife", 0.0f, 1, 0, 0, 1, K),
                            MakeWeapon("Maul", 0.0f, 1, 5, -1, 2, K)}
            };
            m.Spawn(std::move(spec));
        }
    }

    // Throws random clicks and commands at the match. Most get refused,
    // which is the point: refusals must never leave a mark.
    class Monkey
    {
    public:
        explicit Monkey(uint64_t const seed) : rng_(seed) {}

        auto Next(Match const& m) -> std::variant<Command, Selection>
        {
            int const roll = Pick(0, 99);
            if (roll < 5) return Command{EndTurnCommand{}};
            if (roll < 10) return Command{ResolveFightCommand{}};
            if (roll < 15) return Command{ConfirmPileInCommand{}};
            if (roll < 18) return Command{FinishActivationCommand{}};
            if (roll < 20) return Command{DeselectCommand{}};
            if (roll < 30) return Command{SelectWeaponCommand{static_cast<uint8_t>(Pick(0, 3))}};

            std::vector<CombatantId> const live = m.Field().Live();
            if (roll < 75 && !live.empty())
            {
                CombatantId const id = live[static_cast<size_t>(Pick(0, static_cast<int>(live.size()) - 1))];
                return Selection{.combatant = id, .surface = SurfaceTag::Model};
            }

            Vec3 point{static_cast<float>(Pick(-20, 80)), 0.0f, static_cast<float>(Pick(-20, 200))};
            if (!live.empty() && Pick(0, 1) == 0)
            {
                // land near somebody so charges and pile-ins have a chance
                Vec3 const near = m.Field().Get(live[static_cast<size_t>(Pick(0, static_cast<int>(live.size()) - 1))]).Position();
                point = {near.x + static_cast<float>(Pick(-12, 12)), 0.0f, near.z + static_cast<float>(Pick(-12, 12))};
            }
            return Selection{.point = point, .surface = SurfaceTag::Ground};
        }

    private:
        auto Pick(int const lo, int const hi) -> int
        {
            return std::uniform_int_distribution<int>{lo, hi}(rng_);
        }

        std::mt19937_64 rng_;
    };

    auto Survivors(Match const& m, PlayerId const p) -> size_t { return m.Field().Roster(p).size(); }
}

TEST(SelfPlay, Transcripts_And_End)
{
    namespace fs = std::filesystem;
    fs::create_directories("_artifacts");

    for (uint64_t const seed : {111ull, 222ull, 333ull})
    {
        auto const path = fs::path(std::format("_artifacts/match_{}.log", seed));
        try
        {
            Match match(MatchConfig{.conversion_factor = K, .fight_mode = FightMode::PileInAndAttacks, .seed = seed});
            Squad(match, PlayerOne, 0.0f);
            Squad(match, PlayerTwo, 120.0f);

            debug::AuditLogger log(path.string());
            match.AddSink(&log);
            log.start(match);

            Monkey monkey(seed);
            for (int step = 0; step < 5000 && match.Round() <= 4; ++step)
            {
                if (Survivors(match, PlayerOne) == 0 || Survivors(match, PlayerTwo) == 0) break;

                auto const move = monkey.Next(match);
                if (auto const* c = std::get_if<Command>(&move))
                {
                    log.command(match, *c);
                    log.outcome(match.Submit(*c));
                }
                else
                {
                    auto const& s = std::get<Selection>(move);
                    log.selection(match, s);
                    log.outcome(match.HandleSelection(s));
                }
                debug::CheckInvariants(match);
            }

            log.end(match);
            match.RemoveSink(&log);
        }
        catch (OmegaException<error::Code> const& e)
        {
            ADD_FAILURE() << std::format("seed {}: {}", seed, e);
        }

        ASSERT_TRUE(fs::exists(path));
        ASSERT_GT(fs::file_size(path), 0u);
    }
}

TEST(SelfPlay, Refusals_Leave_No_Trace)
{
    Match match(MatchConfig{.conversion_factor = K, .seed = 7});
    Squad(match, PlayerOne, 0.0f);
    Squad(match, PlayerTwo, 120.0f);

    MatchSnapshot const before = match.Snapshot();
    Monkey monkey(7);
    for (int i = 0; i < 200; ++i)
    {
        auto const move = monkey.Next(match);
        // only clicks on enemies and empty ground while nothing is selected
        auto const* s = std::get_if<Selection>(&move);
        if (!s || s->surface != SurfaceTag::Model) continue;
        if (match.Field().Get(*s->combatant).Owner() != PlayerTwo) continue;

        auto const r = match.HandleSelection(*s);
        ASSERT_FALSE(r.has_value());
        EXPECT_EQ(r.error().code, error::RuleViolationCode::WrongActor);
    }

    MatchSnapshot const after = match.Snapshot();
    EXPECT_EQ(after.phase, before.phase);
    EXPECT_EQ(after.active_player, before.active_player);
    ASSERT_EQ(after.combatants.size(), before.combatants.size());
    for (size_t i = 0; i < after.combatants.size(); ++i)
    {
        EXPECT_EQ(after.combatants[i].position, before.combatants[i].position);
        EXPECT_EQ(after.combatants[i].wounds, before.combatants[i].wounds);
    }
}
