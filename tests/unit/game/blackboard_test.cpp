/// @file blackboard_test.cpp
/// @brief TeamBlackboard knowledge decay, strategy and cross-round memory.

#include <gtest/gtest.h>

#include <cstdint>
#include <random>
#include <string>

#include "rse/game/blackboard.hpp"

using namespace rse::game;

namespace {

EnemySighting sighting(uint64_t enemy, const std::string& area, double now = 0.0) {
    EnemySighting s;
    s.enemy = PlayerId(enemy);
    s.position = {10.0, 10.0, 0.0};
    s.lastSeen = now;
    s.spottedBy = PlayerId(1);
    s.confidence = 0.4;
    s.area = area;
    s.weapon = "Vandal";
    return s;
}

StrategyCall call(const std::string& name, double at) {
    StrategyCall c;
    c.name = name;
    c.issuedAt = at;
    c.issuedBy = PlayerId(1);
    return c;
}

}  // namespace

class TeamBlackboardTest : public ::testing::Test {
protected:
    TeamBlackboard attackers_{Team::Attackers};
    TeamBlackboard defenders_{Team::Defenders};
};

// ── Store ───────────────────────────────────────────────────────────────

TEST_F(TeamBlackboardTest, TypedStore) {
    attackers_.Set("lurker", int64_t{3});
    attackers_.Set("rally", Vector3{5.0, 5.0, 0.0});

    EXPECT_TRUE(attackers_.Has("lurker"));
    EXPECT_EQ(attackers_.Get<int64_t>("lurker"), int64_t{3});
    EXPECT_FALSE(attackers_.Get<std::string>("lurker").has_value());
    EXPECT_FALSE(attackers_.Get<double>("missing").has_value());
    ASSERT_TRUE(attackers_.Get<Vector3>("rally").has_value());
    EXPECT_DOUBLE_EQ(attackers_.Get<Vector3>("rally")->x, 5.0);
}

TEST_F(TeamBlackboardTest, SidesStartWithTheirRole) {
    EXPECT_TRUE(attackers_.IsAttacking());
    EXPECT_FALSE(defenders_.IsAttacking());
    EXPECT_EQ(attackers_.Half(), 1);
    EXPECT_DOUBLE_EQ(attackers_.TeamConfidence(), 1.0);
    EXPECT_DOUBLE_EQ(attackers_.SiteSuccessRate("A"), 0.5);
}

// ── Sightings ───────────────────────────────────────────────────────────

TEST_F(TeamBlackboardTest, SightingIsFreshAndClearsArea) {
    attackers_.MarkAreaDangerous("Mid");
    attackers_.UpdateEnemy(sighting(6, "Mid"));

    ASSERT_EQ(attackers_.Enemies().size(), 1u);
    EXPECT_DOUBLE_EQ(attackers_.Enemies().at(PlayerId(6)).confidence, 1.0);
    EXPECT_EQ(attackers_.ClearedAreas().count("Mid"), 1u);
    EXPECT_EQ(attackers_.DangerAreas().count("Mid"), 0u);
}

TEST_F(TeamBlackboardTest, ConfidenceDecaysGeometrically) {
    attackers_.UpdateEnemy(sighting(6, "Mid"));
    attackers_.Decay(5.0, 5.0);
    EXPECT_NEAR(attackers_.Enemies().at(PlayerId(6)).confidence, 0.9, 1e-12);

    attackers_.Decay(10.0, 15.0);
    EXPECT_NEAR(attackers_.Enemies().at(PlayerId(6)).confidence, 0.729, 1e-12);
}

TEST_F(TeamBlackboardTest, StaleSightingsAreForgotten) {
    attackers_.UpdateEnemy(sighting(6, "Mid"));
    attackers_.UpdateEnemy(sighting(7, "Long"));

    // 0.9^15 is just above the forget threshold, 0.9^16 is below.
    attackers_.Decay(75.0, 75.0);
    EXPECT_EQ(attackers_.Enemies().size(), 2u);

    attackers_.UpdateEnemy(sighting(7, "Long", 75.0));
    attackers_.Decay(5.0, 80.0);
    EXPECT_EQ(attackers_.Enemies().count(PlayerId(6)), 0u);
    EXPECT_EQ(attackers_.Enemies().count(PlayerId(7)), 1u);
    EXPECT_EQ(attackers_.DangerAreas().count("Mid"), 1u);
}

TEST_F(TeamBlackboardTest, NoisesAndWarningsExpire) {
    NoiseEvent noise;
    noise.kind = NoiseKind::Footstep;
    noise.position = {3.0, 4.0, 0.0};
    noise.intensity = 0.6;
    noise.heardBy = PlayerId(2);
    noise.time = 0.0;
    attackers_.AddNoise(noise);
    attackers_.AddWarning("sniper on long", Vector3{20.0, 5.0, 0.0}, 0.0);
    attackers_.AddWarning("flank", std::nullopt, 0.0, 3.0);

    attackers_.Decay(0.05, 3.0);
    EXPECT_EQ(attackers_.Noises().size(), 1u);
    ASSERT_EQ(attackers_.Warnings().size(), 1u);
    EXPECT_EQ(attackers_.Warnings()[0].message, "sniper on long");

    attackers_.Decay(0.05, 10.0);
    EXPECT_EQ(attackers_.Noises().size(), 1u);
    EXPECT_TRUE(attackers_.Warnings().empty());

    attackers_.Decay(0.05, 10.5);
    EXPECT_TRUE(attackers_.Noises().empty());
}

// ── Strategy ────────────────────────────────────────────────────────────

TEST_F(TeamBlackboardTest, StrategyHistoryKeepsReplacedCalls) {
    attackers_.SetStrategy(call("default", 0.0));
    attackers_.SetStrategy(call("execute", 20.0));

    ASSERT_TRUE(attackers_.CurrentStrategy().has_value());
    EXPECT_EQ(attackers_.CurrentStrategy()->name, "execute");
    ASSERT_EQ(attackers_.StrategyHistory().size(), 1u);
    EXPECT_EQ(attackers_.StrategyHistory()[0].name, "default");

    attackers_.ClearRoundData();
    EXPECT_FALSE(attackers_.CurrentStrategy().has_value());
    EXPECT_EQ(attackers_.StrategyHistory().size(), 2u);
}

TEST_F(TeamBlackboardTest, SuggestionFollowsConfidence) {
    std::mt19937_64 rng(3);
    for (int i = 0; i < 20; ++i) {
        auto s = attackers_.SuggestStrategy(rng);
        EXPECT_TRUE(s.name == "execute" || s.name == "fake_and_rotate") << s.name;
        EXPECT_TRUE(s.targetSite.has_value());
    }
    EXPECT_EQ(defenders_.SuggestStrategy(rng).name, "standard_defense");

    attackers_.AdjustTeamConfidence(0.6);
    auto rush = attackers_.SuggestStrategy(rng);
    EXPECT_EQ(rush.name, "rush");
    EXPECT_DOUBLE_EQ(rush.confidence, 0.8);

    defenders_.AdjustTeamConfidence(-0.6);
    EXPECT_EQ(defenders_.SuggestStrategy(rng).name, "stack_site");
}

TEST_F(TeamBlackboardTest, PatternsStrengthenOnRepeat) {
    attackers_.RecordPattern("stack", "defenders stack B", 2);
    attackers_.RecordPattern("stack", "defenders stack B", 3);
    attackers_.RecordPattern("eco", "defenders save after loss", 3, 0.3);

    ASSERT_EQ(attackers_.Patterns().size(), 2u);
    EXPECT_NEAR(attackers_.Patterns()[0].confidence, 0.6, 1e-12);
    EXPECT_EQ(attackers_.Patterns()[0].observedRounds.size(), 2u);
    EXPECT_DOUBLE_EQ(attackers_.Patterns()[1].confidence, 0.3);
}

// ── Cross-round memory ──────────────────────────────────────────────────

TEST_F(TeamBlackboardTest, RoundResultUpdatesCountersAndSites) {
    attackers_.SetStrategy(call("execute", 1.0));
    attackers_.SetAlivePlayers({PlayerId(1), PlayerId(2)});
    attackers_.UpdateEnemy(sighting(6, "Mid"));

    attackers_.RecordRoundResult(1, true, "spike_detonation", "A");
    EXPECT_EQ(attackers_.RoundsWon(), 1);
    EXPECT_EQ(attackers_.Streak(), 1);
    EXPECT_NEAR(attackers_.TeamConfidence(), 1.1, 1e-12);
    EXPECT_NEAR(attackers_.SiteSuccessRate("A"), 0.6, 1e-12);

    const auto& memory = attackers_.Memory().at(1);
    EXPECT_TRUE(memory.won);
    EXPECT_EQ(memory.endCondition, "spike_detonation");
    EXPECT_EQ(memory.strategy, "execute");
    EXPECT_EQ(memory.alivePlayers, 2);

    // Round data is cleared with the result.
    EXPECT_TRUE(attackers_.Enemies().empty());
    EXPECT_TRUE(attackers_.AlivePlayers().empty());

    attackers_.RecordRoundResult(2, false, "elimination", "B");
    EXPECT_EQ(attackers_.Streak(), -1);
    EXPECT_NEAR(attackers_.SiteSuccessRate("B"), 0.4, 1e-12);
    EXPECT_EQ(attackers_.Memory().at(2).strategy, "unknown");

    defenders_.RecordRoundResult(1, false, "spike_detonation", "A");
    EXPECT_DOUBLE_EQ(defenders_.SiteSuccessRate("A"), 0.5);
    EXPECT_EQ(defenders_.RoundsLost(), 1);
}

TEST_F(TeamBlackboardTest, ConfidenceIsClamped) {
    for (int round = 1; round <= 15; ++round) {
        attackers_.RecordRoundResult(round, true, "elimination", std::nullopt);
    }
    EXPECT_DOUBLE_EQ(attackers_.TeamConfidence(), 2.0);
    EXPECT_EQ(attackers_.Streak(), 15);

    for (int round = 1; round <= 25; ++round) {
        defenders_.RecordRoundResult(round, false, "elimination", std::nullopt);
    }
    EXPECT_DOUBLE_EQ(defenders_.TeamConfidence(), 0.1);
}

TEST_F(TeamBlackboardTest, NewHalfSwitchesSides) {
    attackers_.AdjustTeamConfidence(1.0);
    attackers_.RecordRoundResult(12, true, "elimination", "B");
    ASSERT_NE(attackers_.SiteSuccessRate("B"), 0.5);

    attackers_.PrepareForNewHalf();
    EXPECT_FALSE(attackers_.IsAttacking());
    EXPECT_EQ(attackers_.Half(), 2);
    EXPECT_NEAR(attackers_.TeamConfidence(), 1.5, 1e-12);
    EXPECT_DOUBLE_EQ(attackers_.SiteSuccessRate("B"), 0.5);
    EXPECT_EQ(attackers_.RoundsWon(), 1);
    EXPECT_EQ(attackers_.Memory().size(), 1u);
}
