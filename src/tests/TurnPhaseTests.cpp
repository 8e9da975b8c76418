#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "TestSupport.hpp"
#include "../core/Battlefield.hpp"
#include "../core/TurnPhaseMachine.hpp"

using namespace skirmish::test;
using error::RuleViolationCode;

namespace
{
    // Records every callback; optionally asks to leave a phase as soon as it starts
    class Recorder final : public PhaseListener
    {
    public:
        explicit Recorder(TurnPhaseMachine& machine) : machine_(machine) {}

        auto OnPhaseEntered(Phase const phase) -> void override
        {
            entered.push_back(phase);
            if (skip && *skip == phase) machine_.EndPhase();
            if (reenter && *reenter == phase) machine_.AdvancePhase();
        }

        auto OnRoundEnded(int const round) -> void override { rounds.push_back(round); }

        std::vector<Phase> entered;
        std::vector<int> rounds;
        std::optional<Phase> skip;
        std::optional<Phase> reenter;

    private:
        TurnPhaseMachine& machine_;
    };

    struct MachineTest : ::testing::Test
    {
        BoxGeometry geometry;
        Notifier notifier;
        Battlefield field{K, geometry, notifier};
        TurnPhaseMachine machine{field};
        Recorder recorder{machine};

        void SetUp() override { machine.AddListener(&recorder); }
    };
}

TEST_F(MachineTest, Starts_In_Round_One_Movement)
{
    EXPECT_EQ(machine.Round(), 1);
    EXPECT_EQ(machine.CurrentPhase(), Phase::Movement);
    EXPECT_EQ(machine.ActivePlayer(), PlayerOne);
    EXPECT_TRUE(recorder.entered.empty());
}

TEST_F(MachineTest, Both_Players_Act_Before_The_Phase_Moves_On)
{
    EXPECT_EQ(machine.AdvanceTurn(), Outcome::Applied);
    EXPECT_EQ(machine.ActivePlayer(), PlayerTwo);
    EXPECT_EQ(machine.CurrentPhase(), Phase::Movement);

    EXPECT_EQ(machine.AdvanceTurn(), Outcome::PhaseEnded);
    EXPECT_EQ(machine.CurrentPhase(), Phase::FirstFire);
    EXPECT_EQ(machine.ActivePlayer(), PlayerOne);
}

TEST_F(MachineTest, Phases_Run_In_Order_And_Wrap)
{
    EXPECT_EQ(machine.AdvancePhase(), Outcome::PhaseEnded);
    EXPECT_EQ(machine.AdvancePhase(), Outcome::PhaseEnded);
    EXPECT_EQ(machine.AdvancePhase(), Outcome::PhaseEnded);
    EXPECT_EQ(machine.AdvancePhase(), Outcome::PhaseEnded);
    EXPECT_EQ(machine.AdvancePhase(), Outcome::RoundEnded);

    std::vector<Phase> const expected{Phase::FirstFire, Phase::Charge, Phase::Fight,
                                      Phase::AdvanceFire, Phase::Movement};
    EXPECT_EQ(recorder.entered, expected);
    EXPECT_EQ(recorder.rounds, std::vector<int>{1});
    EXPECT_EQ(machine.Round(), 2);
}

TEST_F(MachineTest, Active_Player_Resets_On_Every_Phase)
{
    machine.AdvanceTurn();
    ASSERT_EQ(machine.ActivePlayer(), PlayerTwo);
    machine.AdvancePhase();
    EXPECT_EQ(machine.ActivePlayer(), PlayerOne);
}

TEST_F(MachineTest, End_Phase_From_A_Listener_Is_Deferred)
{
    recorder.skip = Phase::Fight;
    machine.AdvancePhase();
    machine.AdvancePhase();

    EXPECT_EQ(machine.AdvancePhase(), Outcome::PhaseEnded);
    EXPECT_EQ(machine.CurrentPhase(), Phase::AdvanceFire);
    std::vector<Phase> const expected{Phase::FirstFire, Phase::Charge, Phase::Fight, Phase::AdvanceFire};
    EXPECT_EQ(recorder.entered, expected);
}

TEST_F(MachineTest, Skipping_Through_The_Wrap_Reports_Round_End)
{
    recorder.skip = Phase::AdvanceFire;
    machine.AdvancePhase();
    machine.AdvancePhase();
    machine.AdvancePhase();

    EXPECT_EQ(machine.AdvancePhase(), Outcome::RoundEnded);
    EXPECT_EQ(machine.CurrentPhase(), Phase::Movement);
    EXPECT_EQ(machine.Round(), 2);
}

TEST_F(MachineTest, Advance_Phase_Inside_A_Transition_Throws)
{
    recorder.reenter = Phase::FirstFire;
    EXPECT_THROW(machine.AdvancePhase(), error::StateError);
}

TEST_F(MachineTest, Throwing_Listener_Does_Not_Lock_The_Machine)
{
    recorder.reenter = Phase::FirstFire;
    EXPECT_THROW(machine.AdvancePhase(), error::StateError);
    ASSERT_EQ(machine.CurrentPhase(), Phase::FirstFire);

    recorder.reenter.reset();
    EXPECT_EQ(machine.AdvancePhase(), Outcome::PhaseEnded);
    EXPECT_EQ(machine.CurrentPhase(), Phase::Charge);
    EXPECT_EQ(machine.EndPhase(), Outcome::PhaseEnded);
    EXPECT_EQ(machine.CurrentPhase(), Phase::Fight);
}

TEST_F(MachineTest, Round_End_Is_Optional_For_Listeners)
{
    // only cares about phases
    struct PhaseCounter final : PhaseListener
    {
        auto OnPhaseEntered(Phase) -> void override { ++entered; }
        int entered{0};
    } counter;
    machine.AddListener(&counter);

    for (int i = 0; i < 5; ++i) machine.AdvancePhase();
    EXPECT_EQ(counter.entered, 5);
    EXPECT_EQ(recorder.rounds, std::vector<int>{1});
}

TEST_F(MachineTest, Charge_Entry_Records_Start_Positions)
{
    CombatantId const id = field.Spawn(Trooper(PlayerOne, {0.0f, 0.0f, 0.0f}));
    machine.AdvancePhase();
    field.Get(id).MoveTo({30.0f, 0.0f, 0.0f});
    EXPECT_EQ(field.Get(id).StartPosition(), (Vec3{0.0f, 0.0f, 0.0f}));

    machine.AdvancePhase();
    ASSERT_EQ(machine.CurrentPhase(), Phase::Charge);
    EXPECT_EQ(field.Get(id).StartPosition(), (Vec3{30.0f, 0.0f, 0.0f}));
}

TEST_F(MachineTest, Round_Reset_Restores_Every_Model)
{
    CombatantId const id = field.Spawn(Trooper(PlayerOne, {0.0f, 0.0f, 0.0f}));
    Combatant& c = field.Get(id);
    c.MoveTo({80.0f, 0.0f, 0.0f});
    c.RecordNetDisplacement(80.0f);
    c.SetCharged();
    c.SetFought();
    c.SetRemainingAttacks(2);
    ASSERT_TRUE(c.HasMarched());

    for (int i = 0; i < 5; ++i) machine.AdvancePhase();

    EXPECT_FALSE(c.HasMoved());
    EXPECT_FALSE(c.HasMarched());
    EXPECT_FALSE(c.HasCharged());
    EXPECT_FALSE(c.HasFought());
    EXPECT_EQ(c.RemainingAttacks(), 0);
    EXPECT_FLOAT_EQ(c.RemainingMovement(), c.MovementAllowance());
    EXPECT_FLOAT_EQ(c.RemainingMarch(), c.MarchAllowance());
    EXPECT_EQ(c.StartPosition(), (Vec3{80.0f, 0.0f, 0.0f}));

    // nothing left to reset a second time around
    for (int i = 0; i < 5; ++i) machine.AdvancePhase();
    EXPECT_FALSE(c.HasMoved());
    EXPECT_FLOAT_EQ(c.RemainingMovement(), c.MovementAllowance());
    EXPECT_EQ(machine.Round(), 3);
}

TEST(MatchFlow, End_Turn_Walks_The_Whole_Round)
{
    Table t = MakeTable();
    EventLog log;
    t->AddSink(&log);
    t->Spawn(Trooper(PlayerOne, {0.0f, 0.0f, 0.0f}));
    t->Spawn(Trooper(PlayerTwo, {0.0f, 0.0f, 300.0f}));

    std::vector<Outcome> outcomes;
    while (t->Round() == 1)
    {
        auto const r = t->Submit(EndTurnCommand{});
        ASSERT_TRUE(r.has_value());
        outcomes.push_back(*r);
        ASSERT_LT(outcomes.size(), 20u);
    }

    // Fight has nobody in contact and passes straight on
    std::vector<Outcome> const expected{
        Outcome::Applied, Outcome::PhaseEnded,
        Outcome::Applied, Outcome::PhaseEnded,
        Outcome::Applied, Outcome::PhaseEnded,
        Outcome::Applied, Outcome::RoundEnded};
    EXPECT_EQ(outcomes, expected);
    EXPECT_EQ(t->CurrentPhase(), Phase::Movement);
    EXPECT_EQ(log.Count(EventKind::RoundEnded), 1u);
    EXPECT_EQ(log.Count(EventKind::PhaseEntered), 5u);
    t->RemoveSink(&log);
}

TEST(MatchFlow, New_Round_Lets_Everyone_Shoot_And_Move_Again)
{
    Table t = MakeTable();
    CombatantId const a = t->Spawn(Trooper(PlayerOne, {0.0f, 0.0f, 0.0f}, "a"));
    CombatantId const b = t->Spawn(WithStats(Trooper(PlayerTwo, {0.0f, 0.0f, 200.0f}, "b"), Stats{.wounds = 5}));

    ASSERT_TRUE(t->Submit(MoveCommand{a, {0.0f, 0.0f, 20.0f}}).has_value());
    GoTo(*t, Phase::AdvanceFire);
    t.dice->Push({1});
    ASSERT_TRUE(t->Submit(SelectShooterCommand{a}).has_value());
    ASSERT_TRUE(t->Submit(SelectWeaponCommand{0}).has_value());
    ASSERT_TRUE(t->Submit(AttackTargetCommand{b}).has_value());
    ASSERT_TRUE(t->Shooting().IsWeaponUsed({a, 0}));

    GoTo(*t, Phase::Movement);
    EXPECT_EQ(t->Round(), 2);
    EXPECT_FALSE(t->Shooting().IsWeaponUsed({a, 0}));
    EXPECT_FALSE(t->Field().Get(a).HasMoved());
    EXPECT_FLOAT_EQ(t->Field().Get(a).RemainingMovement(), 60.0f);
    debug::CheckInvariants(*t);
}

TEST(MatchFlow, Destroyed_Models_Never_Linger)
{
    Table t = MakeTable();
    t->Spawn(Trooper(PlayerOne, {0.0f, 0.0f, 0.0f}, "a"));
    CombatantSpec heavy = Trooper(PlayerOne, {100.0f, 0.0f, 0.0f}, "heavy");
    heavy.weapons[0].damage = 3;
    CombatantId const h = t->Spawn(std::move(heavy));
    CombatantId const b = t->Spawn(WithStats(Trooper(PlayerTwo, {0.0f, 0.0f, 100.0f}, "b"), Stats{.wounds = 2}));
    GoTo(*t, Phase::FirstFire);

    // overkill: 3 damage into 2 wounds
    t.dice->Push({6, 6, 1});
    ASSERT_TRUE(t->Submit(SelectShooterCommand{h}).has_value());
    ASSERT_TRUE(t->Submit(SelectWeaponCommand{0}).has_value());
    ASSERT_TRUE(t->Submit(AttackTargetCommand{b}).has_value());

    EXPECT_EQ(t->Field().Find(b), nullptr);
    EXPECT_TRUE(t->Field().Roster(PlayerTwo).empty());
    for (CombatantId const id : t->Field().Live())
    {
        EXPECT_GT(t->Field().Get(id).Wounds(), 0);
    }
    EXPECT_EQ(Code(t->Submit(SelectShooterCommand{b})), RuleViolationCode::UnknownCombatant);
    debug::CheckInvariants(*t);
}
