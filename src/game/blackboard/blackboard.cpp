/// @file blackboard.cpp
/// @brief TeamBlackboard implementation.

#include "rse/game/blackboard.hpp"

#include <algorithm>
#include <cmath>

namespace rse::game {

namespace {

constexpr double kNeutralSiteRate = 0.5;
constexpr double kSiteRateWeight = 0.8;
constexpr double kHighConfidence = 1.5;
constexpr double kLowConfidence = 0.5;
constexpr double kExecuteChance = 0.7;
constexpr double kPatternStep = 0.1;

}  // namespace

std::string_view SpikeKnowledgeName(SpikeKnowledge status) noexcept {
    switch (status) {
        case SpikeKnowledge::Unknown:   return "unknown";
        case SpikeKnowledge::Carried:   return "carried";
        case SpikeKnowledge::Dropped:   return "dropped";
        case SpikeKnowledge::Planted:   return "planted";
        case SpikeKnowledge::Defused:   return "defused";
        case SpikeKnowledge::Detonated: return "detonated";
    }
    return "unknown";
}

std::string_view NoiseKindName(NoiseKind kind) noexcept {
    switch (kind) {
        case NoiseKind::Footstep: return "footstep";
        case NoiseKind::Gunshot:  return "gunshot";
        case NoiseKind::Ability:  return "ability";
    }
    return "unknown";
}

TeamBlackboard::TeamBlackboard(Team team, std::vector<std::string> sites,
                               BlackboardTuning tuning)
    : team_(team),
      attacking_(team == Team::Attackers),
      tuning_(tuning),
      sites_(std::move(sites)) {
    for (const auto& site : sites_) {
        siteRates_[site] = kNeutralSiteRate;
    }
}

void TeamBlackboard::Set(const std::string& key, BlackboardValue value) {
    values_[key] = std::move(value);
}

// ── Enemies and areas ───────────────────────────────────────────────────

void TeamBlackboard::UpdateEnemy(const EnemySighting& sighting) {
    auto& entry = enemies_[sighting.enemy];
    entry = sighting;
    entry.confidence = 1.0;
    if (sighting.area) {
        MarkAreaCleared(*sighting.area);
    }
}

void TeamBlackboard::MarkAreaDangerous(const std::string& area) {
    danger_.insert(area);
    cleared_.erase(area);
}

void TeamBlackboard::MarkAreaCleared(const std::string& area) {
    cleared_.insert(area);
    danger_.erase(area);
}

void TeamBlackboard::AddNoise(const NoiseEvent& noise) {
    noises_.push_back(noise);
}

// ── Strategy ────────────────────────────────────────────────────────────

void TeamBlackboard::SetStrategy(StrategyCall call) {
    if (strategy_) {
        history_.push_back(std::move(*strategy_));
    }
    strategy_ = std::move(call);
}

std::string TeamBlackboard::bestSite() const {
    std::string best;
    double rate = -1.0;
    for (const auto& site : sites_) {
        if (const double r = SiteSuccessRate(site); r > rate) {
            rate = r;
            best = site;
        }
    }
    return best;
}

std::string TeamBlackboard::worstSite() const {
    std::string worst;
    double rate = 2.0;
    for (const auto& site : sites_) {
        if (const double r = SiteSuccessRate(site); r < rate) {
            rate = r;
            worst = site;
        }
    }
    return worst;
}

StrategySuggestion TeamBlackboard::SuggestStrategy(std::mt19937_64& rng) const {
    if (attacking_) {
        if (confidence_ > kHighConfidence) {
            return {"rush", bestSite(), 0.8};
        }
        if (confidence_ < kLowConfidence) {
            return {"default", std::nullopt, 0.7};
        }
        std::uniform_real_distribution<double> draw(0.0, 1.0);
        if (draw(rng) < kExecuteChance) {
            return {"execute", bestSite(), 0.6};
        }
        return {"fake_and_rotate", worstSite(), 0.5};
    }

    if (confidence_ > kHighConfidence) {
        return {"aggressive_defense", bestSite(), 0.7};
    }
    if (confidence_ < kLowConfidence) {
        return {"stack_site", bestSite(), 0.6};
    }
    return {"standard_defense", std::nullopt, 0.8};
}

// ── Warnings, patterns ──────────────────────────────────────────────────

void TeamBlackboard::AddWarning(std::string message, std::optional<Vector3> location,
                                double now, std::optional<double> lifetime) {
    const double expiresAt = now + lifetime.value_or(tuning_.defaultWarningLifetime);
    warnings_.push_back({std::move(message), location, now, expiresAt});
    std::erase_if(warnings_, [now](const Warning& w) { return w.expiresAt <= now; });
}

void TeamBlackboard::RecordPattern(const std::string& type, const std::string& description,
                                   int32_t roundNumber, double confidence) {
    for (auto& pattern : patterns_) {
        if (pattern.type == type && pattern.description == description) {
            pattern.observedRounds.push_back(roundNumber);
            pattern.confidence = std::min(1.0, pattern.confidence + kPatternStep);
            return;
        }
    }
    patterns_.push_back({type, description, confidence, {roundNumber}});
}

// ── Cross-round memory ──────────────────────────────────────────────────

void TeamBlackboard::AdjustTeamConfidence(double delta) {
    confidence_ = std::clamp(confidence_ + delta, tuning_.minTeamConfidence,
                             tuning_.maxTeamConfidence);
}

double TeamBlackboard::SiteSuccessRate(const std::string& site) const {
    auto it = siteRates_.find(site);
    return it != siteRates_.end() ? it->second : kNeutralSiteRate;
}

void TeamBlackboard::RecordRoundResult(int32_t roundNumber, bool won, std::string endCondition,
                                       std::optional<std::string> site) {
    if (won) {
        ++roundsWon_;
        streak_ = std::max(1, streak_ + 1);
        AdjustTeamConfidence(tuning_.confidenceStep);
    } else {
        ++roundsLost_;
        streak_ = std::min(-1, streak_ - 1);
        AdjustTeamConfidence(-tuning_.confidenceStep);
    }

    if (site && attacking_) {
        const double current = SiteSuccessRate(*site);
        siteRates_[*site] = won ? current * kSiteRateWeight + (1.0 - kSiteRateWeight)
                                : current * kSiteRateWeight;
    }

    RoundMemory entry;
    entry.won = won;
    entry.endCondition = std::move(endCondition);
    entry.site = std::move(site);
    entry.strategy = strategy_ ? strategy_->name : "unknown";
    entry.alivePlayers = static_cast<int32_t>(alive_.size());
    entry.teamConfidence = confidence_;
    memory_[roundNumber] = std::move(entry);

    ClearRoundData();
}

void TeamBlackboard::ClearRoundData() {
    enemies_.clear();
    spike_ = SpikeInfo{};
    if (strategy_) {
        history_.push_back(std::move(*strategy_));
        strategy_.reset();
    }
    danger_.clear();
    cleared_.clear();
    noises_.clear();
    warnings_.clear();
    alive_.clear();
}

void TeamBlackboard::PrepareForNewHalf() {
    attacking_ = !attacking_;
    ++half_;
    confidence_ = (confidence_ + 1.0) / 2.0;
    for (auto& [site, rate] : siteRates_) {
        rate = kNeutralSiteRate;
    }
    ClearRoundData();
}

void TeamBlackboard::Decay(double deltaTime, double now) {
    if (deltaTime > 0.0) {
        const double factor = std::pow(tuning_.decayBase, deltaTime / tuning_.decayInterval);
        for (auto it = enemies_.begin(); it != enemies_.end();) {
            auto& sighting = it->second;
            sighting.confidence = std::max(tuning_.minConfidence, sighting.confidence * factor);
            if (sighting.confidence < tuning_.forgetThreshold) {
                if (sighting.area) {
                    MarkAreaDangerous(*sighting.area);
                }
                it = enemies_.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::erase_if(warnings_, [now](const Warning& w) { return w.expiresAt <= now; });
    const double memory = tuning_.noiseMemory;
    std::erase_if(noises_, [now, memory](const NoiseEvent& n) { return now - n.time > memory; });
}

}  // namespace rse::game
