#include <gtest/gtest.h>

#include "TestSupport.hpp"

using namespace skirmish::test;
using error::RuleViolationCode;

namespace
{
    struct ChargeTest : ::testing::Test
    {
        Table t = MakeTable();
        CombatantId charger{};
        EventLog log;

        void SetUp() override
        {
            // M 6: max charge range 120, a roll of 4 gives 100
            charger = t->Spawn(Trooper(PlayerOne, {0.0f, 0.0f, 0.0f}, "Charger"));
            t->AddSink(&log);
        }

        void TearDown() override
        {
            t->RemoveSink(&log);
        }

        // boxes are 10 wide, so the gap is the centre distance minus 10
        auto EnemyAt(float const z) -> CombatantId
        {
            return t->Spawn(Trooper(PlayerTwo, {0.0f, 0.0f, z}, "Target"));
        }

        auto Charger() const -> Combatant const& { return t->Field().Get(charger); }
    };
}

TEST_F(ChargeTest, Short_Roll_Fails_With_Half_Distance_Surge)
{
    CombatantId const target = EnemyAt(130.0f);
    GoTo(*t, Phase::Charge);
    t.dice->Push({4});

    ASSERT_TRUE(t->Submit(ChargeCommand{charger, target}).has_value());

    EXPECT_FLOAT_EQ(Charger().Position().z, 50.0f);
    EXPECT_FLOAT_EQ(Charger().Position().x, 0.0f);
    EXPECT_TRUE(Charger().HasCharged());
    EXPECT_EQ(t->Charge().State(), ChargeState::Idle);
    EXPECT_FALSE(t->Field().InContact(charger, target));
    EXPECT_EQ(log.Count(EventKind::ChargeFailed), 1u);
}

TEST_F(ChargeTest, Successful_Roll_Awaits_A_Move_Into_Contact)
{
    CombatantId const target = EnemyAt(100.0f);
    GoTo(*t, Phase::Charge);
    t.dice->Push({4});

    ASSERT_TRUE(t->Submit(ChargeCommand{charger, target}).has_value());
    EXPECT_EQ(t->Charge().State(), ChargeState::AwaitingMovement);
    ASSERT_TRUE(t->Charge().Budget().has_value());
    EXPECT_FLOAT_EQ(*t->Charge().Budget(), 100.0f);
    EXPECT_FALSE(Charger().HasCharged());

    // one unit short of contact: rejected, the charge stays open
    EXPECT_EQ(Code(t->Submit(ChargeMoveCommand{{0.0f, 0.0f, 89.0f}})), RuleViolationCode::Charge_NoContact);
    EXPECT_EQ(t->Charge().State(), ChargeState::AwaitingMovement);
    EXPECT_FLOAT_EQ(Charger().Position().z, 0.0f);

    ASSERT_TRUE(t->Submit(ChargeMoveCommand{{0.0f, 0.0f, 90.0f}}).has_value());
    EXPECT_TRUE(Charger().HasCharged());
    EXPECT_TRUE(t->Field().InContact(charger, target));
    EXPECT_EQ(t->Charge().State(), ChargeState::Idle);
    EXPECT_EQ(log.Count(EventKind::ChargeCompleted), 1u);
    debug::CheckInvariants(*t);
}

TEST_F(ChargeTest, Move_Longer_Than_Roll_Is_Rejected)
{
    CombatantId const target = EnemyAt(100.0f);
    GoTo(*t, Phase::Charge);
    t.dice->Push({4});
    ASSERT_TRUE(t->Submit(ChargeCommand{charger, target}).has_value());

    auto const r = t->Submit(ChargeMoveCommand{{0.0f, 0.0f, 105.0f}});
    EXPECT_EQ(Code(r), RuleViolationCode::Charge_BeyondRolledDistance);
    EXPECT_EQ(r.error().kind(), error::RejectionKind::OutOfRange);
    EXPECT_EQ(t->Charge().State(), ChargeState::AwaitingMovement);
}

TEST_F(ChargeTest, Clicking_The_Target_Closes_Straight_To_Contact)
{
    CombatantId const target = t->Spawn(Trooper(PlayerTwo, {60.0f, 0.0f, 80.0f}, "Target"));
    GoTo(*t, Phase::Charge);
    t.dice->Push({6});

    ASSERT_TRUE(t->Submit(ChargeCommand{charger, target}).has_value());
    ASSERT_EQ(t->Charge().State(), ChargeState::AwaitingMovement);
    ASSERT_TRUE(t->Submit(DirectChargeCommand{}).has_value());

    EXPECT_TRUE(Charger().HasCharged());
    EXPECT_TRUE(t->Field().InContact(charger, target));
    // travelled along the centre line, stopping at first touch
    Vec3 const p = Charger().Position();
    EXPECT_NEAR(p.z / p.x, 80.0f / 60.0f, 1e-3f);
    EXPECT_LT(PlanarDistance(p, {0.0f, 0.0f, 0.0f}), 100.0f);
}

TEST_F(ChargeTest, Target_Beyond_Maximum_Range_Rolls_Nothing)
{
    CombatantId const target = EnemyAt(140.0f);
    GoTo(*t, Phase::Charge);
    ASSERT_TRUE(t->Submit(SelectChargerCommand{charger}).has_value());

    auto const r = t->Submit(ChargeCommand{charger, target});
    EXPECT_EQ(Code(r), RuleViolationCode::Charge_OutOfMaxRange);
    EXPECT_EQ(r.error().kind(), error::RejectionKind::OutOfRange);
    EXPECT_FLOAT_EQ(*r.error().distance, 130.0f);
    EXPECT_FLOAT_EQ(*r.error().allowance, 120.0f);
    EXPECT_EQ(t.dice->Rolled(), 0u);
    EXPECT_EQ(t->Charge().State(), ChargeState::Idle);
    EXPECT_FALSE(Charger().HasCharged());
}

TEST_F(ChargeTest, Marched_Models_Cannot_Charge)
{
    CombatantId const target = EnemyAt(200.0f);
    ASSERT_TRUE(t->Submit(MoveCommand{charger, {0.0f, 0.0f, 85.0f}}).has_value());
    GoTo(*t, Phase::Charge);

    auto const r = t->Submit(SelectChargerCommand{charger});
    EXPECT_EQ(Code(r), RuleViolationCode::Charge_AlreadyMarched);
    EXPECT_EQ(r.error().kind(), error::RejectionKind::IneligibleCombatant);
    EXPECT_EQ(Code(t->Submit(ChargeCommand{charger, target})), RuleViolationCode::Charge_AlreadyMarched);
}

TEST_F(ChargeTest, One_Charge_Per_Round)
{
    CombatantId const target = EnemyAt(130.0f);
    GoTo(*t, Phase::Charge);
    t.dice->Push({1});
    ASSERT_TRUE(t->Submit(ChargeCommand{charger, target}).has_value());
    ASSERT_TRUE(Charger().HasCharged());

    EXPECT_EQ(Code(t->Submit(ChargeCommand{charger, target})), RuleViolationCode::Charge_AlreadyCharged);
}

TEST_F(ChargeTest, Cannot_Charge_Own_Models)
{
    CombatantId const friendly = t->Spawn(Trooper(PlayerOne, {0.0f, 0.0f, 50.0f}, "Friend"));
    GoTo(*t, Phase::Charge);
    auto const r = t->Submit(ChargeCommand{charger, friendly});
    EXPECT_EQ(Code(r), RuleViolationCode::Charge_FriendlyTarget);
    EXPECT_EQ(r.error().kind(), error::RejectionKind::InvalidTarget);
}

TEST_F(ChargeTest, Deselect_Before_Moving_Leaves_No_Trace)
{
    CombatantId const target = EnemyAt(100.0f);
    GoTo(*t, Phase::Charge);
    t.dice->Push({4});
    ASSERT_TRUE(t->Submit(ChargeCommand{charger, target}).has_value());

    ASSERT_TRUE(t->Submit(DeselectCommand{}).has_value());
    EXPECT_EQ(t->Charge().State(), ChargeState::Idle);
    EXPECT_FALSE(Charger().HasCharged());
    EXPECT_EQ(Charger().Position(), (Vec3{0.0f, 0.0f, 0.0f}));
    EXPECT_EQ(Code(t->Submit(ChargeMoveCommand{{0.0f, 0.0f, 90.0f}})), RuleViolationCode::Charge_NotAwaitingMovement);
}

TEST_F(ChargeTest, Charge_Distance_Counts_From_Charge_Phase_Start)
{
    CombatantId const target = EnemyAt(150.0f);
    ASSERT_TRUE(t->Submit(MoveCommand{charger, {0.0f, 0.0f, 50.0f}}).has_value());
    GoTo(*t, Phase::Charge);
    EXPECT_EQ(Charger().StartPosition(), (Vec3{0.0f, 0.0f, 50.0f}));

    t.dice->Push({4});
    ASSERT_TRUE(t->Submit(ChargeCommand{charger, target}).has_value());
    // 90 from the Charge start, 140 from where the round began
    EXPECT_TRUE(t->Submit(ChargeMoveCommand{{0.0f, 0.0f, 140.0f}}).has_value());
    EXPECT_TRUE(Charger().HasCharged());
}

TEST_F(ChargeTest, Pointer_Flow_Select_Target_Then_Click_Target)
{
    CombatantId const target = EnemyAt(100.0f);
    GoTo(*t, Phase::Charge);

    auto const early = t->HandleSelection(Selection{.combatant = target, .surface = SurfaceTag::Model});
    EXPECT_EQ(Code(early), RuleViolationCode::Charge_NoCharger);
    EXPECT_EQ(early.error().kind(), error::RejectionKind::NoSelection);

    ASSERT_TRUE(t->HandleSelection(Selection{.combatant = charger, .surface = SurfaceTag::Model}).has_value());
    EXPECT_EQ(t->Charge().State(), ChargeState::PendingTarget);

    t.dice->Push({5});
    ASSERT_TRUE(t->HandleSelection(Selection{.combatant = target, .surface = SurfaceTag::Model}).has_value());
    ASSERT_EQ(t->Charge().State(), ChargeState::AwaitingMovement);

    MatchSnapshot const snap = t->Snapshot();
    EXPECT_EQ(snap.charge_state, ChargeState::AwaitingMovement);
    EXPECT_FLOAT_EQ(*snap.charge_budget, 110.0f);
    EXPECT_FLOAT_EQ(*snap.charge_remaining, 110.0f);

    ASSERT_TRUE(t->HandleSelection(Selection{.combatant = target, .point = {0.0f, 5.0f, 95.0f},
                                             .surface = SurfaceTag::Model}).has_value());
    EXPECT_TRUE(Charger().HasCharged());
    EXPECT_FLOAT_EQ(Charger().Position().z, 90.0f);
}

TEST_F(ChargeTest, Only_In_Charge_Phase)
{
    CombatantId const target = EnemyAt(100.0f);
    auto const r = t->Submit(ChargeCommand{charger, target});
    EXPECT_EQ(Code(r), RuleViolationCode::WrongPhase);
    EXPECT_EQ(t.dice->Rolled(), 0u);
}
