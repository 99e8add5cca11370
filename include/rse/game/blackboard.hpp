#pragma once

/// @file blackboard.hpp
/// @brief Team-scoped shared knowledge: sightings, spike, strategy, memory.
///
/// Each Round owns one TeamBlackboard per side and hands it by reference
/// to intent providers.  Round-scoped entries are wiped by ClearRoundData;
/// team confidence, site success rates and round memory persist across
/// rounds and are partially reset by PrepareForNewHalf.

#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "rse/game/math_types.hpp"
#include "rse/game/player.hpp"

namespace rse::game {

/// Last known information about one enemy.
struct EnemySighting {
    PlayerId enemy;
    Vector3 position;
    double lastSeen = 0.0;
    PlayerId spottedBy;
    double confidence = 1.0;  ///< 1 for a fresh sighting, decays over time.
    std::optional<std::string> area;
    std::string weapon;
    ShieldType shield = ShieldType::None;
};

/// What the team believes about the spike.
enum class SpikeKnowledge : uint8_t { Unknown, Carried, Dropped, Planted, Defused, Detonated };

[[nodiscard]] std::string_view SpikeKnowledgeName(SpikeKnowledge status) noexcept;

struct SpikeInfo {
    SpikeKnowledge status = SpikeKnowledge::Unknown;
    std::optional<Vector3> location;
    std::optional<PlayerId> carrier;
    std::optional<double> plantTime;
    std::optional<std::string> plantSite;
    std::optional<PlayerId> seenBy;
    double lastUpdated = 0.0;
};

/// Strategy issued by the team's caller.
struct StrategyCall {
    std::string name;
    double issuedAt = 0.0;
    PlayerId issuedBy;
    std::optional<std::string> targetSite;
    std::string reason;
};

/// Suggestion returned by SuggestStrategy.
struct StrategySuggestion {
    std::string name;
    std::optional<std::string> targetSite;
    double confidence = 0.0;
};

enum class NoiseKind : uint8_t { Footstep, Gunshot, Ability };

[[nodiscard]] std::string_view NoiseKindName(NoiseKind kind) noexcept;

struct NoiseEvent {
    NoiseKind kind = NoiseKind::Footstep;
    Vector3 position;
    double intensity = 0.0;
    PlayerId heardBy;
    double time = 0.0;
};

struct Warning {
    std::string message;
    std::optional<Vector3> location;
    double createdAt = 0.0;
    double expiresAt = 0.0;
};

struct EconomyInfo {
    int32_t teamCredits = 0;
    double averageCredits = 0.0;
    bool canFullBuy = false;
    bool canHalfBuy = false;
    bool saving = false;
    double lastUpdated = 0.0;
};

/// Pattern observed in the enemy's play across rounds.
struct RoundPattern {
    std::string type;
    std::string description;
    double confidence = 0.5;
    std::vector<int32_t> observedRounds;
};

/// Summary kept for each finished round.
struct RoundMemory {
    bool won = false;
    std::string endCondition;
    std::optional<std::string> site;
    std::string strategy;
    int32_t alivePlayers = 0;
    double teamConfidence = 1.0;
};

/// Value type of the generic key/value store.
using BlackboardValue = std::variant<bool, int64_t, double, std::string, Vector3>;

/// Tunables for knowledge decay.
struct BlackboardTuning {
    double decayBase = 0.9;          ///< Confidence factor per decayInterval seconds.
    double decayInterval = 5.0;
    double minConfidence = 0.1;
    double forgetThreshold = 0.2;    ///< Sightings below this are dropped.
    double noiseMemory = 10.0;       ///< Seconds a noise event is kept.
    double defaultWarningLifetime = 10.0;
    double minTeamConfidence = 0.1;
    double maxTeamConfidence = 2.0;
    double confidenceStep = 0.1;     ///< Per round won or lost.
};

class TeamBlackboard {
public:
    explicit TeamBlackboard(Team team, std::vector<std::string> sites = {"A", "B"},
                            BlackboardTuning tuning = {});

    [[nodiscard]] Team GetTeam() const noexcept { return team_; }
    [[nodiscard]] bool IsAttacking() const noexcept { return attacking_; }
    void SetAttacking(bool attacking) noexcept { attacking_ = attacking; }

    // ── Generic store ───────────────────────────────────────────────────

    void Set(const std::string& key, BlackboardValue value);

    /// Typed read; nullopt when absent or holding another type.
    template <typename T>
    [[nodiscard]] std::optional<T> Get(const std::string& key) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return std::nullopt;
        }
        if (const T* v = std::get_if<T>(&it->second)) {
            return *v;
        }
        return std::nullopt;
    }

    [[nodiscard]] bool Has(const std::string& key) const { return values_.count(key) != 0; }

    // ── Enemies and areas ───────────────────────────────────────────────

    /// Record a fresh sighting.  The enemy's area becomes cleared.
    void UpdateEnemy(const EnemySighting& sighting);

    [[nodiscard]] const std::map<PlayerId, EnemySighting>& Enemies() const noexcept {
        return enemies_;
    }

    void MarkAreaDangerous(const std::string& area);
    void MarkAreaCleared(const std::string& area);
    [[nodiscard]] const std::set<std::string>& DangerAreas() const noexcept { return danger_; }
    [[nodiscard]] const std::set<std::string>& ClearedAreas() const noexcept { return cleared_; }

    void AddNoise(const NoiseEvent& noise);
    [[nodiscard]] const std::vector<NoiseEvent>& Noises() const noexcept { return noises_; }

    // ── Spike ───────────────────────────────────────────────────────────

    void UpdateSpike(const SpikeInfo& info) { spike_ = info; }
    [[nodiscard]] const SpikeInfo& Spike() const noexcept { return spike_; }

    // ── Strategy ────────────────────────────────────────────────────────

    /// Replace the current call; the previous one moves to the history.
    void SetStrategy(StrategyCall call);
    [[nodiscard]] const std::optional<StrategyCall>& CurrentStrategy() const noexcept {
        return strategy_;
    }
    [[nodiscard]] const std::vector<StrategyCall>& StrategyHistory() const noexcept {
        return history_;
    }

    /// Pick a strategy from team confidence and site success rates.
    [[nodiscard]] StrategySuggestion SuggestStrategy(std::mt19937_64& rng) const;

    // ── Warnings, economy, patterns ─────────────────────────────────────

    void AddWarning(std::string message, std::optional<Vector3> location, double now,
                    std::optional<double> lifetime = std::nullopt);
    [[nodiscard]] const std::vector<Warning>& Warnings() const noexcept { return warnings_; }

    void SetEconomy(const EconomyInfo& economy) { economy_ = economy; }
    [[nodiscard]] const EconomyInfo& Economy() const noexcept { return economy_; }

    /// Record a pattern, or strengthen it when already known.
    void RecordPattern(const std::string& type, const std::string& description,
                       int32_t roundNumber, double confidence = 0.5);
    [[nodiscard]] const std::vector<RoundPattern>& Patterns() const noexcept { return patterns_; }

    void SetAlivePlayers(std::set<PlayerId> alive) { alive_ = std::move(alive); }
    [[nodiscard]] const std::set<PlayerId>& AlivePlayers() const noexcept { return alive_; }

    // ── Cross-round memory ──────────────────────────────────────────────

    [[nodiscard]] double TeamConfidence() const noexcept { return confidence_; }

    /// Shift confidence by @p delta, clamped to [0.1, 2.0].
    void AdjustTeamConfidence(double delta);

    [[nodiscard]] double SiteSuccessRate(const std::string& site) const;
    [[nodiscard]] const std::map<std::string, double>& SiteSuccessRates() const noexcept {
        return siteRates_;
    }

    [[nodiscard]] int32_t RoundsWon() const noexcept { return roundsWon_; }
    [[nodiscard]] int32_t RoundsLost() const noexcept { return roundsLost_; }
    [[nodiscard]] int32_t Half() const noexcept { return half_; }

    /// Positive for a win streak, negative for a loss streak.
    [[nodiscard]] int32_t Streak() const noexcept { return streak_; }

    [[nodiscard]] const std::map<int32_t, RoundMemory>& Memory() const noexcept {
        return memory_;
    }

    /// Update counters, confidence and site rates, store the round in
    /// memory and clear round-scoped data.
    void RecordRoundResult(int32_t roundNumber, bool won, std::string endCondition,
                           std::optional<std::string> site);

    /// Wipe sightings, spike, strategy, areas, noise, warnings and alive set.
    void ClearRoundData();

    /// Switch sides: flip attacking, pull confidence toward neutral,
    /// reset site success rates and clear round data.
    void PrepareForNewHalf();

    /// Age knowledge by @p deltaTime seconds at simulation time @p now.
    void Decay(double deltaTime, double now);

private:
    [[nodiscard]] std::string bestSite() const;
    [[nodiscard]] std::string worstSite() const;

    Team team_;
    bool attacking_;
    BlackboardTuning tuning_;
    std::vector<std::string> sites_;

    std::unordered_map<std::string, BlackboardValue> values_;
    std::map<PlayerId, EnemySighting> enemies_;
    std::set<std::string> danger_;
    std::set<std::string> cleared_;
    std::vector<NoiseEvent> noises_;
    SpikeInfo spike_;
    std::optional<StrategyCall> strategy_;
    std::vector<StrategyCall> history_;
    std::vector<Warning> warnings_;
    EconomyInfo economy_;
    std::vector<RoundPattern> patterns_;
    std::set<PlayerId> alive_;

    double confidence_ = 1.0;
    std::map<std::string, double> siteRates_;
    int32_t roundsWon_ = 0;
    int32_t roundsLost_ = 0;
    int32_t streak_ = 0;
    int32_t half_ = 1;
    std::map<int32_t, RoundMemory> memory_;
};

}  // namespace rse::game
