/// @file round_test.cpp
/// @brief Round creation, phases, spike objective, win conditions and determinism.

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "rse/game/heuristic_agent.hpp"
#include "rse/game/map_geometry.hpp"
#include "rse/game/round.hpp"

using namespace rse::game;
using rse::foundation::ErrorCode;

namespace {

constexpr double kTick = 0.05;

/// Two sites; both sides spawn inside site A, two units apart.
std::shared_ptr<MapGeometry> makeCourt(bool withDefenderSpawn = true) {
    auto map = std::make_shared<MapGeometry>("Court", 60.0, 40.0);
    EXPECT_TRUE(map->AddBoundary(Boundary::Box(BoundaryType::Area, "Floor", 0, 0, 60, 40)).hasValue());
    EXPECT_TRUE(map->AddBoundary(Boundary::Box(BoundaryType::BombSite, "A", 40, 5, 12, 12)).hasValue());
    EXPECT_TRUE(map->AddBoundary(Boundary::Box(BoundaryType::BombSite, "B", 5, 25, 10, 10)).hasValue());
    map->AddAttackerSpawn({45.0, 10.0, 0.0});
    if (withDefenderSpawn) {
        map->AddDefenderSpawn({47.0, 10.0, 0.0});
    }
    return map;
}

RoundParams makeParams(std::shared_ptr<const MapGeometry> map, int32_t roundNumber = 2) {
    RoundParams params;
    params.roundNumber = roundNumber;
    for (uint64_t id = 1; id <= 4; ++id) {
        Player p;
        p.id = PlayerId(id);
        params.players.push_back(p);
    }
    params.attackers = {PlayerId(1), PlayerId(2)};
    params.defenders = {PlayerId(3), PlayerId(4)};
    params.map = std::move(map);
    params.seed = 11;
    params.config.round.buyTime = 1.0;
    params.config.round.pistolBuyTime = 1.0;
    return params;
}

Round createRound(RoundParams params) {
    auto created = Round::Create(std::move(params));
    EXPECT_TRUE(created.hasValue());
    return std::move(created.value());
}

/// Tick until @p done holds, feeding @p before each tick; returns ticks run.
int runUntil(Round& round, const std::function<bool()>& done,
             const std::function<void()>& before = {}, int maxTicks = 2000) {
    int ticks = 0;
    while (!done() && ticks < maxTicks) {
        if (before) {
            before();
        }
        round.Update(kTick);
        ++ticks;
    }
    return ticks;
}

void toActive(Round& round) {
    runUntil(round, [&] { return round.Phase() != RoundPhase::Buy; });
    ASSERT_EQ(round.Phase(), RoundPhase::Active);
}

bool hasEvent(const Round& round, RoundEventType type) {
    return std::any_of(round.Events().begin(), round.Events().end(),
                       [type](const RoundEvent& e) { return e.type == type; });
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Creation
// ═══════════════════════════════════════════════════════════════════════════

TEST(RoundCreateTest, MissingMap) {
    auto params = makeParams(nullptr);
    auto created = Round::Create(std::move(params));
    ASSERT_TRUE(created.hasError());
    EXPECT_EQ(created.error().code(), ErrorCode::MissingMap);
}

TEST(RoundCreateTest, RosterMustPartitionPlayers) {
    auto empty = makeParams(makeCourt());
    empty.defenders.clear();
    EXPECT_EQ(Round::Create(std::move(empty)).error().code(), ErrorCode::InvalidRoster);

    auto twice = makeParams(makeCourt());
    twice.defenders = {PlayerId(3), PlayerId(1)};
    EXPECT_EQ(Round::Create(std::move(twice)).error().code(), ErrorCode::InvalidRoster);

    auto unknown = makeParams(makeCourt());
    unknown.defenders = {PlayerId(3), PlayerId(4), PlayerId(9)};
    EXPECT_EQ(Round::Create(std::move(unknown)).error().code(), ErrorCode::InvalidRoster);

    auto unassigned = makeParams(makeCourt());
    unassigned.defenders = {PlayerId(3)};
    EXPECT_EQ(Round::Create(std::move(unassigned)).error().code(), ErrorCode::InvalidRoster);

    auto duplicate = makeParams(makeCourt());
    duplicate.players[3].id = PlayerId(3);
    EXPECT_EQ(Round::Create(std::move(duplicate)).error().code(), ErrorCode::InvalidRoster);
}

TEST(RoundCreateTest, MapNeedsSpawnsForBothSides) {
    auto created = Round::Create(makeParams(makeCourt(false)));
    ASSERT_TRUE(created.hasError());
    EXPECT_EQ(created.error().code(), ErrorCode::InvalidRoundSetup);
}

TEST(RoundCreateTest, UnknownAbilityAndBadConfig) {
    auto params = makeParams(makeCourt());
    params.players[0].abilities.push_back({"teleport", 1});
    auto created = Round::Create(std::move(params));
    ASSERT_TRUE(created.hasError());
    EXPECT_EQ(created.error().code(), ErrorCode::AbilityNotFound);

    auto bad = makeParams(makeCourt());
    bad.config.round.plantTime = 0.0;
    auto rejected = Round::Create(std::move(bad));
    ASSERT_TRUE(rejected.hasError());
    EXPECT_EQ(rejected.error().code(), ErrorCode::ConfigValueOutOfRange);
}

TEST(RoundCreateTest, SlotChargesCappedAtMaximum) {
    auto params = makeParams(makeCourt());
    params.players[0].abilities = {{"flash", 5}, {"molly", 1}};
    Round round = createRound(std::move(params));

    const Player* player = round.FindPlayer(PlayerId(1));
    ASSERT_NE(player, nullptr);
    ASSERT_EQ(player->abilities.size(), 2u);
    EXPECT_EQ(player->abilities[0].charges, 2);
    EXPECT_EQ(player->abilities[1].charges, 1);

    ASSERT_EQ(round.AbilityInstances().size(), 2u);
    EXPECT_EQ(round.AbilityInstances()[0].Charges(), 2);
    EXPECT_EQ(round.AbilityInstances()[1].Charges(), 1);
}

TEST(RoundCreateTest, StartsInBuyPhaseWithSpikeCarrier) {
    Round round = createRound(makeParams(makeCourt()));
    EXPECT_EQ(round.Phase(), RoundPhase::Buy);
    EXPECT_EQ(round.AliveCount(Team::Attackers), 2);
    EXPECT_EQ(round.AliveCount(Team::Defenders), 2);

    const Spike& spike = round.GetSpike();
    EXPECT_EQ(spike.state, SpikeState::Carried);
    ASSERT_TRUE(spike.carrier.has_value());
    const Player* carrier = round.FindPlayer(*spike.carrier);
    ASSERT_NE(carrier, nullptr);
    EXPECT_EQ(carrier->team, Team::Attackers);
    EXPECT_TRUE(carrier->hasSpike);

    EXPECT_TRUE(round.Blackboard(Team::Attackers).CurrentStrategy().has_value());
    EXPECT_TRUE(round.Blackboard(Team::Defenders).CurrentStrategy().has_value());
    ASSERT_FALSE(round.Events().empty());
    EXPECT_EQ(round.Events().front().type, RoundEventType::PhaseChange);
}

TEST(RoundCreateTest, PistolRoundsGetLongerBuy) {
    auto pistol = makeParams(makeCourt(), 1);
    pistol.config.round.buyTime = 30.0;
    pistol.config.round.pistolBuyTime = 45.0;
    EXPECT_DOUBLE_EQ(createRound(std::move(pistol)).GetSummary().buyTimeRemaining, 45.0);

    auto regular = makeParams(makeCourt(), 2);
    regular.config.round.buyTime = 30.0;
    regular.config.round.pistolBuyTime = 45.0;
    EXPECT_DOUBLE_EQ(createRound(std::move(regular)).GetSummary().buyTimeRemaining, 30.0);
}

// ═══════════════════════════════════════════════════════════════════════════
// Buy phase
// ═══════════════════════════════════════════════════════════════════════════

TEST(RoundBuyTest, ExplicitAndAutomaticPurchases) {
    auto params = makeParams(makeCourt());
    for (auto& p : params.players) {
        p.credits = 4000;
    }
    Round round = createRound(std::move(params));

    ASSERT_TRUE(round.SetIntent(PlayerId(1), BuyIntent{"Spectre", ShieldType::Light}).hasValue());
    round.Update(kTick);
    const Player* buyer = round.FindPlayer(PlayerId(1));
    EXPECT_EQ(buyer->weapon, "Spectre");
    EXPECT_EQ(buyer->credits, 2000);

    toActive(round);
    // The explicit buyer is skipped by the automatic ladder.
    EXPECT_EQ(round.FindPlayer(PlayerId(1))->weapon, "Spectre");
    for (uint64_t id = 2; id <= 4; ++id) {
        const Player* p = round.FindPlayer(PlayerId(id));
        EXPECT_TRUE(p->weapon == "Vandal" || p->weapon == "Phantom") << p->weapon;
        EXPECT_EQ(p->shield, ShieldType::Heavy);
        EXPECT_EQ(p->credits, 100);
    }
    const auto purchases = std::count_if(
        round.Events().begin(), round.Events().end(),
        [](const RoundEvent& e) { return e.type == RoundEventType::Purchase; });
    EXPECT_EQ(purchases, 4);
}

TEST(RoundBuyTest, SetIntentRejectsUnknownPlayer) {
    Round round = createRound(makeParams(makeCourt()));
    auto queued = round.SetIntent(PlayerId(42), IdleIntent{});
    ASSERT_TRUE(queued.hasError());
    EXPECT_EQ(queued.error().code(), ErrorCode::PlayerNotFound);

    auto damage = round.ApplyDamage(PlayerId(42), 10.0, PlayerId(1), "test");
    ASSERT_TRUE(damage.hasError());
    EXPECT_EQ(damage.error().code(), ErrorCode::PlayerNotFound);
}

// ═══════════════════════════════════════════════════════════════════════════
// Spike
// ═══════════════════════════════════════════════════════════════════════════

class RoundSpikeTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto params = makeParams(makeCourt());
        params.config.round.spikeTime = spikeTime_;
        round_ = std::make_unique<Round>(createRound(std::move(params)));
        toActive(*round_);
        carrier_ = *round_->GetSpike().carrier;
    }

    int plant() {
        return runUntil(
            *round_, [&] { return round_->GetSpike().state == SpikeState::Planted; },
            [&] { ASSERT_TRUE(round_->SetIntent(carrier_, PlantIntent{}).hasValue()); }, 200);
    }

    double spikeTime_ = 45.0;
    std::unique_ptr<Round> round_;
    PlayerId carrier_;
};

TEST_F(RoundSpikeTest, PlantTakesPlantTime) {
    const int ticks = plant();
    EXPECT_GE(ticks, 80);
    EXPECT_LE(ticks, 82);

    const Spike& spike = round_->GetSpike();
    EXPECT_EQ(spike.site, "A");
    EXPECT_FALSE(spike.carrier.has_value());
    EXPECT_DOUBLE_EQ(spike.timer, 45.0);
    EXPECT_TRUE(hasEvent(*round_, RoundEventType::PlantStart));
    EXPECT_TRUE(hasEvent(*round_, RoundEventType::PlantComplete));
    EXPECT_EQ(round_->FindPlayer(carrier_)->stats.plants, 1);

    auto summary = round_->GetSummary();
    EXPECT_TRUE(summary.spikePlanted);
    ASSERT_TRUE(summary.spikeTimeRemaining.has_value());

    const auto& retake = round_->Blackboard(Team::Defenders).CurrentStrategy();
    ASSERT_TRUE(retake.has_value());
    EXPECT_EQ(retake->name, "retake");
    EXPECT_EQ(retake->targetSite, "A");
    EXPECT_EQ(round_->Blackboard(Team::Attackers).CurrentStrategy()->name, "post_plant");
}

TEST_F(RoundSpikeTest, LeavingSiteInterruptsPlant) {
    ASSERT_TRUE(round_->SetIntent(carrier_, PlantIntent{}).hasValue());
    round_->Update(kTick);
    ASSERT_EQ(round_->GetSpike().state, SpikeState::Planting);
    EXPECT_TRUE(round_->FindPlayer(carrier_)->planting);

    MoveIntent leave;
    leave.direction = {-1.0, 0.0, 0.0};
    runUntil(
        *round_, [&] { return hasEvent(*round_, RoundEventType::PlantInterrupt); },
        [&] { ASSERT_TRUE(round_->SetIntent(carrier_, leave).hasValue()); }, 60);

    EXPECT_TRUE(hasEvent(*round_, RoundEventType::PlantInterrupt));
    EXPECT_EQ(round_->GetSpike().state, SpikeState::Carried);
    const Player* carrier = round_->FindPlayer(carrier_);
    EXPECT_FALSE(carrier->planting);
    EXPECT_DOUBLE_EQ(carrier->plantProgress, 0.0);
    EXPECT_TRUE(carrier->hasSpike);
}

TEST_F(RoundSpikeTest, DefuseWinsForDefenders) {
    plant();
    const int ticks = runUntil(
        *round_, [&] { return round_->Phase() == RoundPhase::End; },
        [&] { ASSERT_TRUE(round_->SetIntent(PlayerId(3), DefuseIntent{}).hasValue()); }, 300);
    EXPECT_GE(ticks, 140);

    EXPECT_EQ(round_->Winner(), RoundWinner::Defenders);
    EXPECT_EQ(round_->GetEndCondition(), EndCondition::SpikeDefused);
    EXPECT_EQ(round_->GetSpike().state, SpikeState::Defused);
    EXPECT_EQ(round_->FindPlayer(PlayerId(3))->stats.defuses, 1);
    EXPECT_TRUE(hasEvent(*round_, RoundEventType::DefuseStart));
    EXPECT_TRUE(hasEvent(*round_, RoundEventType::DefuseComplete));
    EXPECT_EQ(round_->Events().back().type, RoundEventType::RoundEnd);

    auto carryover = round_->GetCarryover();
    ASSERT_TRUE(carryover.hasValue());
    EXPECT_EQ(carryover.value().at(PlayerId(3)).creditsDelta, 3000 + 300);
    EXPECT_EQ(carryover.value().at(PlayerId(4)).creditsDelta, 3000);
    EXPECT_EQ(carryover.value().at(carrier_).creditsDelta, 1900 + 300);
}

TEST_F(RoundSpikeTest, DefuserDeathInterruptsDefuse) {
    plant();
    ASSERT_TRUE(round_->SetIntent(PlayerId(3), DefuseIntent{}).hasValue());
    round_->Update(kTick);
    ASSERT_EQ(round_->GetSpike().state, SpikeState::Defusing);

    ASSERT_TRUE(round_->ApplyDamage(PlayerId(3), 200.0, PlayerId(1), "Classic").hasValue());
    EXPECT_EQ(round_->GetSpike().state, SpikeState::Planted);
    EXPECT_TRUE(hasEvent(*round_, RoundEventType::DefuseInterrupt));
    EXPECT_EQ(round_->Phase(), RoundPhase::Active);
}

class RoundShortSpikeTest : public RoundSpikeTest {
protected:
    void SetUp() override {
        spikeTime_ = 2.0;
        RoundSpikeTest::SetUp();
    }
};

TEST_F(RoundShortSpikeTest, DetonationWinsForAttackers) {
    plant();
    runUntil(*round_, [&] { return round_->Phase() == RoundPhase::End; });

    EXPECT_EQ(round_->Winner(), RoundWinner::Attackers);
    EXPECT_EQ(round_->GetEndCondition(), EndCondition::SpikeDetonation);
    EXPECT_EQ(round_->GetSpike().state, SpikeState::Detonated);
    EXPECT_TRUE(hasEvent(*round_, RoundEventType::Detonation));
    EXPECT_TRUE(round_->GetSummary().spikePlanted);
}

TEST_F(RoundShortSpikeTest, EliminatedAttackersStillWinByDetonation) {
    plant();
    ASSERT_TRUE(round_->ApplyDamage(PlayerId(1), 500.0, PlayerId(3), "Classic").hasValue());
    ASSERT_TRUE(round_->ApplyDamage(PlayerId(2), 500.0, PlayerId(4), "Classic").hasValue());
    EXPECT_EQ(round_->AliveCount(Team::Attackers), 0);
    EXPECT_EQ(round_->Phase(), RoundPhase::Active);

    runUntil(*round_, [&] { return round_->Phase() == RoundPhase::End; });
    EXPECT_EQ(round_->Winner(), RoundWinner::Attackers);
    EXPECT_EQ(round_->GetEndCondition(), EndCondition::SpikeDetonation);
    EXPECT_EQ(round_->GetSummary().killCount, 2);
}

TEST_F(RoundSpikeTest, CarrierDeathDropsSpikeForTeammate) {
    auto lost = round_->ApplyDamage(carrier_, 150.0, PlayerId(3), "Vandal");
    ASSERT_TRUE(lost.hasValue());
    EXPECT_DOUBLE_EQ(lost.value(), 100.0);
    EXPECT_EQ(round_->GetSpike().state, SpikeState::Dropped);
    EXPECT_TRUE(hasEvent(*round_, RoundEventType::SpikeDrop));
    EXPECT_EQ(round_->FindPlayer(PlayerId(3))->stats.kills, 1);

    // The other attacker stands on the same spawn and picks it up.
    round_->Update(kTick);
    const Spike& spike = round_->GetSpike();
    EXPECT_EQ(spike.state, SpikeState::Carried);
    ASSERT_TRUE(spike.carrier.has_value());
    EXPECT_NE(*spike.carrier, carrier_);
    EXPECT_TRUE(hasEvent(*round_, RoundEventType::SpikePickup));
}

// ═══════════════════════════════════════════════════════════════════════════
// Other end conditions
// ═══════════════════════════════════════════════════════════════════════════

TEST(RoundEndTest, EliminationOfDefenders) {
    Round round = createRound(makeParams(makeCourt()));
    toActive(round);

    ASSERT_TRUE(round.ApplyDamage(PlayerId(3), 100.0, PlayerId(1), "Classic").hasValue());
    EXPECT_EQ(round.Phase(), RoundPhase::Active);
    ASSERT_TRUE(round.ApplyDamage(PlayerId(4), 100.0, PlayerId(1), "Classic").hasValue());

    EXPECT_EQ(round.Phase(), RoundPhase::End);
    EXPECT_EQ(round.Winner(), RoundWinner::Attackers);
    EXPECT_EQ(round.GetEndCondition(), EndCondition::Elimination);
    EXPECT_EQ(round.FindPlayer(PlayerId(1))->stats.kills, 2);

    auto carryover = round.GetCarryover();
    ASSERT_TRUE(carryover.hasValue());
    EXPECT_EQ(carryover.value().at(PlayerId(1)).creditsDelta, 3000 + 2 * 200);
    EXPECT_EQ(carryover.value().at(PlayerId(1)).ultPointsDelta, 2);

    const auto& memory = round.Blackboard(Team::Attackers).Memory();
    ASSERT_EQ(memory.count(2), 1u);
    EXPECT_TRUE(memory.at(2).won);
    EXPECT_EQ(memory.at(2).endCondition, "elimination");
    EXPECT_FALSE(round.Blackboard(Team::Defenders).Memory().at(2).won);
}

TEST(RoundEndTest, TimeExpiresForDefenders) {
    auto params = makeParams(makeCourt());
    params.config.round.roundTime = 1.0;
    Round round = createRound(std::move(params));
    round.Simulate();

    EXPECT_EQ(round.Phase(), RoundPhase::End);
    EXPECT_EQ(round.Winner(), RoundWinner::Defenders);
    EXPECT_EQ(round.GetEndCondition(), EndCondition::TimeExpired);
    EXPECT_DOUBLE_EQ(round.GetSummary().timeRemaining, 0.0);
}

TEST(RoundEndTest, CarryoverOnlyAfterEnd) {
    Round round = createRound(makeParams(makeCourt()));
    auto early = round.GetCarryover();
    ASSERT_TRUE(early.hasError());
    EXPECT_EQ(early.error().code(), ErrorCode::InvalidState);
}

TEST(RoundEndTest, UpdateAfterEndIsNoOp) {
    auto params = makeParams(makeCourt());
    params.config.round.roundTime = 0.5;
    Round round = createRound(std::move(params));
    round.Simulate();
    ASSERT_EQ(round.Phase(), RoundPhase::End);

    const auto events = round.Events().size();
    const double elapsed = round.Elapsed();
    round.Update(kTick);
    EXPECT_EQ(round.Events().size(), events);
    EXPECT_DOUBLE_EQ(round.Elapsed(), elapsed);
}

// ═══════════════════════════════════════════════════════════════════════════
// Determinism
// ═══════════════════════════════════════════════════════════════════════════

TEST(RoundDeterminismTest, SameSeedSameRound) {
    auto map = makeCourt();
    auto play = [&map](uint64_t seed) {
        auto params = makeParams(map);
        params.seed = seed;
        for (auto& p : params.players) {
            p.credits = 3000;
            p.abilities.push_back({"flash", 2});
        }
        Round round = createRound(std::move(params));
        round.SetIntentProvider(std::make_shared<HeuristicIntentProvider>(map));
        round.Simulate();
        return round;
    };

    Round first = play(1234);
    Round second = play(1234);
    EXPECT_EQ(first.Phase(), RoundPhase::End);
    EXPECT_EQ(first.GetSummary(), second.GetSummary());
    EXPECT_EQ(first.Events(), second.Events());
    EXPECT_NE(first.Winner(), RoundWinner::None);
}
