/// @file round.cpp
/// @brief Round construction, validation and the per-tick state machine.

#include "rse/game/round.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <string>
#include <unordered_set>
#include <utility>

#include "rse/foundation/game_logger.hpp"
#include "rse/game/weapon_types.hpp"

namespace rse::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

const std::vector<VisibleEnemy> kNoneVisible;

double horizontalDistance(const Vector3& a, const Vector3& b) noexcept {
    return std::hypot(a.x - b.x, a.y - b.y);
}

std::string playerTag(const Player& player) {
    return player.name.empty() ? "player " + std::to_string(player.id.value()) : player.name;
}

SpikeKnowledge knowledgeFor(SpikeState state) noexcept {
    switch (state) {
        case SpikeState::Carried:
        case SpikeState::Planting:  return SpikeKnowledge::Carried;
        case SpikeState::Dropped:   return SpikeKnowledge::Dropped;
        case SpikeState::Planted:
        case SpikeState::Defusing:  return SpikeKnowledge::Planted;
        case SpikeState::Defused:   return SpikeKnowledge::Defused;
        case SpikeState::Detonated: return SpikeKnowledge::Detonated;
    }
    return SpikeKnowledge::Unknown;
}

std::vector<std::string> siteNames(const MapGeometry& map) {
    std::vector<std::string> sites;
    for (const auto& site : map.BombSites()) {
        sites.push_back(site.name);
    }
    return sites;
}

GameResult<Round> rosterError(std::string message) {
    return GameResult<Round>::err(GameError(ErrorCode::InvalidRoster, std::move(message)));
}

}  // namespace

// ── Construction ────────────────────────────────────────────────────────

GameResult<Round> Round::Create(RoundParams params) {
    if (!params.map) {
        return GameResult<Round>::err(
            GameError(ErrorCode::MissingMap, "round requires map geometry"));
    }
    if (auto valid = params.map->Validate(); !valid) {
        return GameResult<Round>::err(valid.error());
    }
    if (auto valid = params.config.Validate(); !valid) {
        return GameResult<Round>::err(valid.error());
    }
    if (params.attackers.empty() || params.defenders.empty()) {
        return rosterError("both sides need at least one player");
    }
    if (params.map->AttackerSpawns().empty() || params.map->DefenderSpawns().empty()) {
        return GameResult<Round>::err(GameError(
            ErrorCode::InvalidRoundSetup, "map " + params.map->Name() + " lacks spawn points"));
    }

    std::unordered_set<PlayerId> known;
    for (const auto& player : params.players) {
        if (!player.id.isValid()) {
            return rosterError("player with an invalid id");
        }
        if (!known.insert(player.id).second) {
            return rosterError("duplicate player id " + std::to_string(player.id.value()));
        }
        for (const auto& slot : player.abilities) {
            if (params.catalog.Find(slot.ability) == nullptr) {
                return GameResult<Round>::err(GameError(
                    ErrorCode::AbilityNotFound, "unknown ability '" + slot.ability +
                                                    "' for player " +
                                                    std::to_string(player.id.value())));
            }
        }
    }

    std::unordered_set<PlayerId> assigned;
    for (const auto* side : {&params.attackers, &params.defenders}) {
        for (PlayerId id : *side) {
            if (known.count(id) == 0) {
                return rosterError("roster names unknown player " + std::to_string(id.value()));
            }
            if (!assigned.insert(id).second) {
                return rosterError("player " + std::to_string(id.value()) +
                                   " listed more than once");
            }
        }
    }
    if (assigned.size() != known.size()) {
        return rosterError("every player must be an attacker or a defender");
    }

    const uint64_t seed = params.seed ? *params.seed : std::random_device{}();
    Round round(std::move(params), seed);
    round.setup();

    RSE_LOG_INFO(LogCategory::Round,
                 "Round " + std::to_string(round.roundNumber_) + " created on " +
                     round.map_->Name() + " with seed " + std::to_string(seed));
    return GameResult<Round>::ok(std::move(round));
}

Round::Round(RoundParams params, uint64_t seed)
    : roundNumber_(params.roundNumber),
      config_(params.config),
      map_(std::move(params.map)),
      catalog_(std::move(params.catalog)),
      lossBonus_(params.lossBonus),
      rng_(seed),
      movement_(config_.movement),
      combat_(config_.combat),
      players_(std::move(params.players)),
      attackers_(std::move(params.attackers)),
      defenders_(std::move(params.defenders)),
      attackerBoard_(params.attackerBlackboard
                         ? std::move(*params.attackerBlackboard)
                         : TeamBlackboard(Team::Attackers, siteNames(*map_), config_.blackboard)),
      defenderBoard_(params.defenderBlackboard
                         ? std::move(*params.defenderBlackboard)
                         : TeamBlackboard(Team::Defenders, siteNames(*map_), config_.blackboard)) {}

void Round::setup() {
    attackerBoard_.SetAttacking(true);
    defenderBoard_.SetAttacking(false);
    attackerBoard_.ClearRoundData();
    defenderBoard_.ClearRoundData();

    const std::unordered_set<PlayerId> attackerSet(attackers_.begin(), attackers_.end());
    for (std::size_t i = 0; i < players_.size(); ++i) {
        auto& player = players_[i];
        index_.emplace(player.id, i);
        player.team = attackerSet.count(player.id) != 0 ? Team::Attackers : Team::Defenders;
        player.alive = true;
        player.health = kMaxHealth;
        player.hasSpike = false;
        player.planting = false;
        player.defusing = false;
        player.plantProgress = 0.0;
        player.defuseProgress = 0.0;
        player.status.Clear();
        player.stats = RoundStats{};
        player.velocity = Vector3::Zero();
        player.acceleration = Vector3::Zero();
        player.moveDirection = Vector3::Zero();
    }

    uint64_t nextInstance = 1;
    slotInstances_.resize(players_.size());
    for (std::size_t i = 0; i < players_.size(); ++i) {
        auto& player = players_[i];
        for (auto& slot : player.abilities) {
            const AbilityDefinition* definition = catalog_.Find(slot.ability);
            slot.charges = std::min(slot.charges, definition->maxCharges);
            slotInstances_[i].push_back(abilities_.size());
            abilities_.emplace_back(InstanceId(nextInstance++), *definition, player.id,
                                    player.team, slot.charges, config_.ability);
        }
    }

    boughtThisRound_.assign(players_.size(), false);
    buyTimeRemaining_ = config_.round.IsPistolRound(roundNumber_) ? config_.round.pistolBuyTime
                                                                   : config_.round.buyTime;
    roundTimeRemaining_ = config_.round.roundTime;

    assignSpawns();
    assignSpike();
    setInitialStrategies();
    publishEconomy();

    std::set<PlayerId> attackersAlive(attackers_.begin(), attackers_.end());
    std::set<PlayerId> defendersAlive(defenders_.begin(), defenders_.end());
    attackerBoard_.SetAlivePlayers(std::move(attackersAlive));
    defenderBoard_.SetAlivePlayers(std::move(defendersAlive));

    emit({RoundEventType::PhaseChange, 0.0, PlayerId{}, std::nullopt,
          std::string(RoundPhaseName(RoundPhase::Buy))});
}

void Round::assignSpawns() {
    auto place = [this](const std::vector<PlayerId>& side, std::vector<Vector3> spawns) {
        std::shuffle(spawns.begin(), spawns.end(), rng_);
        for (std::size_t i = 0; i < side.size(); ++i) {
            Player* player = findPlayer(side[i]);
            const Vector3& spawn = spawns[i % spawns.size()];
            player->position = {spawn.x, spawn.y, map_->ElevationAt(spawn.x, spawn.y)};
            player->lastGroundZ = player->position.z;
            player->grounded = true;
            player->jumping = false;
            player->falling = false;
        }
    };
    place(attackers_, map_->AttackerSpawns());
    place(defenders_, map_->DefenderSpawns());
}

void Round::assignSpike() {
    std::uniform_int_distribution<std::size_t> pick(0, attackers_.size() - 1);
    Player* carrier = findPlayer(attackers_[pick(rng_)]);
    carrier->hasSpike = true;
    spike_ = Spike{};
    spike_.state = SpikeState::Carried;
    spike_.carrier = carrier->id;
    spike_.position = carrier->position;

    SpikeInfo info;
    info.status = SpikeKnowledge::Carried;
    info.carrier = carrier->id;
    info.location = carrier->position;
    attackerBoard_.UpdateSpike(info);
}

void Round::setInitialStrategies() {
    for (Team team : {Team::Attackers, Team::Defenders}) {
        const StrategySuggestion suggestion = boardFor(team).SuggestStrategy(rng_);
        callStrategy(team, suggestion.name, suggestion.targetSite, "round start");
    }
}

// ── Driving ─────────────────────────────────────────────────────────────

void Round::Update(double deltaTime) {
    if (phase_ == RoundPhase::End || deltaTime <= 0.0) {
        return;
    }
    elapsed_ += deltaTime;
    if (phase_ == RoundPhase::Buy) {
        updateBuyPhase(deltaTime);
    } else {
        updateActivePhase(deltaTime);
    }
}

RoundSummary Round::Simulate(std::size_t maxTicks) {
    const double tick = config_.round.tickInterval;
    if (maxTicks == 0) {
        const double horizon = std::max(config_.round.buyTime, config_.round.pistolBuyTime) +
                               config_.round.roundTime + config_.round.spikeTime +
                               config_.round.defuseTime;
        maxTicks = static_cast<std::size_t>(std::ceil(horizon / tick)) + 2;
    }
    for (std::size_t i = 0; i < maxTicks && phase_ != RoundPhase::End; ++i) {
        Update(tick);
    }
    if (phase_ != RoundPhase::End) {
        RSE_LOG_WARN(LogCategory::Round, "Simulate stopped after " + std::to_string(maxTicks) +
                                             " ticks before the round ended");
    }
    return GetSummary();
}

GameResult<void> Round::SetIntent(PlayerId player, Intent intent) {
    if (!indexOf(player)) {
        return GameResult<void>::err(GameError(
            ErrorCode::PlayerNotFound, "no player " + std::to_string(player.value())));
    }
    queued_.insert_or_assign(player, std::move(intent));
    return GameResult<void>::ok();
}

void Round::SetIntentProvider(std::shared_ptr<IIntentProvider> provider) {
    provider_ = std::move(provider);
    if (provider_) {
        provider_->Reset();
    }
}

GameResult<double> Round::ApplyDamage(PlayerId target, double amount, PlayerId source,
                                      const std::string& cause) {
    auto index = indexOf(target);
    if (!index) {
        return GameResult<double>::err(GameError(
            ErrorCode::PlayerNotFound, "no player " + std::to_string(target.value())));
    }
    Player& victim = players_[*index];
    const double lost = victim.ApplyDamage(amount);
    if (lost <= 0.0) {
        return GameResult<double>::ok(0.0);
    }

    std::optional<PlayerId> attacker;
    if (Player* from = findPlayer(source); from != nullptr && from->id != target) {
        from->stats.damageDealt += lost;
        if (from->team != victim.team) {
            attacker = from->id;
        }
    }
    RoundEvent event{RoundEventType::Damage, elapsed_, source, target, cause, lost,
                     victim.position};
    emit(std::move(event));

    if (victim.alive && victim.health <= 0.0) {
        handleDeath(*index, attacker, cause, false);
    }
    return GameResult<double>::ok(lost);
}

// ── Buy phase ───────────────────────────────────────────────────────────

void Round::updateBuyPhase(double deltaTime) {
    for (std::size_t i = 0; i < players_.size(); ++i) {
        Player& player = players_[i];
        std::optional<Intent> intent;
        if (auto it = queued_.find(player.id); it != queued_.end()) {
            intent = std::move(it->second);
        } else if (provider_) {
            const IntentContext context{*map_,   players_,  boardFor(player.team),
                                        kNoneVisible, spike_, phase_,
                                        elapsed_, rng_};
            intent = provider_->Decide(player, context);
        }
        if (!intent) {
            continue;
        }
        if (const auto* buy = std::get_if<BuyIntent>(&*intent)) {
            PurchaseDecision purchase{buy->weapon, buy->shield};
            if (ApplyPurchase(player, purchase)) {
                boughtThisRound_[i] = true;
                const WeaponStats* weapon = FindWeapon(buy->weapon);
                purchase.cost = (weapon != nullptr ? weapon->cost : 0) +
                                ShieldStatsFor(buy->shield).cost;
                emit({RoundEventType::Purchase, elapsed_, player.id, std::nullopt,
                      buy->weapon.empty() ? std::string(ShieldName(buy->shield)) : buy->weapon,
                      static_cast<double>(purchase.cost), player.position});
            } else {
                RSE_LOG_DEBUG(LogCategory::Economy,
                              playerTag(player) + " cannot buy '" + buy->weapon + "'");
            }
        } else if (!std::holds_alternative<IdleIntent>(*intent)) {
            RSE_LOG_DEBUG(LogCategory::Round, std::string(IntentName(*intent)) +
                                                  " ignored during the buy phase");
        }
    }
    queued_.clear();

    buyTimeRemaining_ -= deltaTime;
    if (buyTimeRemaining_ <= 0.0) {
        buyTimeRemaining_ = 0.0;
        finishBuyPhase();
    }
}

void Round::finishBuyPhase() {
    for (std::size_t i = 0; i < players_.size(); ++i) {
        if (boughtThisRound_[i]) {
            continue;
        }
        Player& player = players_[i];
        const PurchaseDecision decision = DecideBuy(player, rng_, config_.economy);
        if (decision.Empty() || !ApplyPurchase(player, decision)) {
            continue;
        }
        std::string item = decision.weapon;
        if (decision.shield != ShieldType::None) {
            item += item.empty() ? std::string(ShieldName(decision.shield))
                                 : "+" + std::string(ShieldName(decision.shield));
        }
        emit({RoundEventType::Purchase, elapsed_, player.id, std::nullopt, item,
              static_cast<double>(decision.cost), player.position});
    }
    publishEconomy();

    phase_ = RoundPhase::Active;
    emit({RoundEventType::PhaseChange, elapsed_, PlayerId{}, std::nullopt,
          std::string(RoundPhaseName(RoundPhase::Active))});
    RSE_LOG_INFO(LogCategory::Round, "Round " + std::to_string(roundNumber_) + " is live");
}

// ── Active phase ────────────────────────────────────────────────────────

void Round::updateActivePhase(double deltaTime) {
    roundTimeRemaining_ = std::max(0.0, roundTimeRemaining_ - deltaTime);
    if (spike_.IsPlanted()) {
        spike_.timer = std::max(0.0, spike_.timer - deltaTime);
    }
    for (auto& player : players_) {
        if (player.alive) {
            player.status.Tick(deltaTime);
        }
    }

    vision_ = combat_.ComputeVision(players_, *map_, activeSmokes());
    const std::vector<Intent> intents = collectIntents();

    applyMovement(intents, deltaTime);
    if (phase_ == RoundPhase::End) return;
    applyCommunication(intents);
    applyAbilityUse(intents);
    processPlant(intents, deltaTime);
    processDefuse(intents, deltaTime);
    if (phase_ == RoundPhase::End) return;

    updatePerception();
    resolveShots(intents);
    if (phase_ == RoundPhase::End) return;
    processPickups();
    updateAbilities(deltaTime);
    if (phase_ == RoundPhase::End) return;

    updateBlackboards(deltaTime);
    checkEndConditions();
}

std::vector<Intent> Round::collectIntents() {
    std::vector<Intent> intents(players_.size(), IdleIntent{});
    for (std::size_t i = 0; i < players_.size(); ++i) {
        const Player& player = players_[i];
        if (!player.alive) {
            continue;
        }
        if (auto it = queued_.find(player.id); it != queued_.end()) {
            intents[i] = std::move(it->second);
            continue;
        }
        if (!provider_) {
            continue;
        }
        auto seen = vision_.find(player.id);
        const IntentContext context{*map_,
                                    players_,
                                    boardFor(player.team),
                                    seen != vision_.end() ? seen->second : kNoneVisible,
                                    spike_,
                                    phase_,
                                    elapsed_,
                                    rng_};
        intents[i] = provider_->Decide(player, context);
    }
    queued_.clear();
    return intents;
}

void Round::applyMovement(const std::vector<Intent>& intents, double deltaTime) {
    for (std::size_t i = 0; i < players_.size(); ++i) {
        Player& player = players_[i];
        if (!player.alive) {
            continue;
        }
        MoveCommand command;
        if (const auto* move = std::get_if<MoveIntent>(&intents[i])) {
            command.direction = move->direction;
            command.walking = move->walking;
            command.crouching = move->crouching;
            command.jump = move->jump;
            command.yaw = move->yaw;
        }
        const MovementResult result = movement_.Update(player, command, deltaTime, *map_);
        if (result.fallDamage > 0) {
            emit({RoundEventType::Damage, elapsed_, PlayerId{}, player.id, "fall",
                  static_cast<double>(result.fallDamage), player.position});
        }
        if (result.died && player.alive) {
            handleDeath(i, std::nullopt, "fall", false);
            if (phase_ == RoundPhase::End) {
                return;
            }
        }
    }
}

void Round::applyCommunication(const std::vector<Intent>& intents) {
    for (std::size_t i = 0; i < players_.size(); ++i) {
        const auto* message = std::get_if<CommunicateIntent>(&intents[i]);
        if (message == nullptr || !players_[i].alive) {
            continue;
        }
        const Player& player = players_[i];
        emit({RoundEventType::Communication, elapsed_, player.id, std::nullopt, message->message,
              0.0, message->location.value_or(player.position)});
        boardFor(player.team).AddWarning(message->message, message->location, elapsed_);
    }
}

void Round::applyAbilityUse(const std::vector<Intent>& intents) {
    for (std::size_t i = 0; i < players_.size(); ++i) {
        const auto* use = std::get_if<UseAbilityIntent>(&intents[i]);
        Player& player = players_[i];
        if (use == nullptr || !player.alive) {
            continue;
        }
        if (use->slot >= slotInstances_[i].size()) {
            RSE_LOG_DEBUG(LogCategory::Ability,
                          playerTag(player) + " has no ability slot " + std::to_string(use->slot));
            continue;
        }
        AbilityInstance& instance = abilities_[slotInstances_[i][use->slot]];
        const Vector3 origin = instance.Definition().targeting == TargetingKind::Projectile
                                   ? combat_.EyePosition(player)
                                   : player.position;
        Vector3 toward = use->target - origin;
        if (instance.Definition().targeting == TargetingKind::Projectile &&
            toward.LengthSquared() == 0.0) {
            toward = player.ViewDirection();
        }
        auto activated = instance.Activate(elapsed_, origin, toward);
        if (!activated) {
            RSE_LOG_DEBUG(LogCategory::Ability, std::string(activated.error().message()));
            continue;
        }
        player.abilities[use->slot].charges = instance.Charges();

        emit({RoundEventType::AbilityUse, elapsed_, player.id, std::nullopt,
              instance.Definition().name, 0.0, instance.Position()});
        postNoise(NoiseKind::Ability, origin, instance.Definition().soundRange, player);
    }
}

// ── Spike ───────────────────────────────────────────────────────────────

void Round::processPlant(const std::vector<Intent>& intents, double deltaTime) {
    if (spike_.state != SpikeState::Carried && spike_.state != SpikeState::Planting) {
        return;
    }
    if (!spike_.carrier) {
        return;
    }
    const auto index = indexOf(*spike_.carrier);
    Player& carrier = players_[*index];
    if (!carrier.alive) {
        return;
    }
    const auto site = map_->BombSiteAt(carrier.position.x, carrier.position.y, carrier.position.z);

    if (spike_.state == SpikeState::Carried) {
        if (!std::holds_alternative<PlantIntent>(intents[*index])) {
            return;
        }
        if (!site) {
            RSE_LOG_DEBUG(LogCategory::Round, playerTag(carrier) + " is not inside a bomb site");
            return;
        }
        spike_.state = SpikeState::Planting;
        spike_.planter = carrier.id;
        carrier.planting = true;
        carrier.plantProgress = 0.0;
        emit({RoundEventType::PlantStart, elapsed_, carrier.id, std::nullopt, *site, 0.0,
              carrier.position});
    } else if (!site) {
        carrier.planting = false;
        carrier.plantProgress = 0.0;
        spike_.state = SpikeState::Carried;
        spike_.planter.reset();
        emit({RoundEventType::PlantInterrupt, elapsed_, carrier.id, std::nullopt, "left site",
              0.0, carrier.position});
        return;
    }

    carrier.plantProgress = std::min(carrier.plantProgress + deltaTime, config_.round.plantTime);
    if (carrier.plantProgress < config_.round.plantTime) {
        return;
    }

    carrier.planting = false;
    carrier.hasSpike = false;
    ++carrier.stats.plants;
    spike_.state = SpikeState::Planted;
    spike_.carrier.reset();
    spike_.position = carrier.position;
    spike_.site = *site;
    spike_.plantedAt = elapsed_;
    spike_.timer = config_.round.spikeTime;
    emit({RoundEventType::PlantComplete, elapsed_, carrier.id, std::nullopt, *site, 0.0,
          carrier.position});

    SpikeInfo info;
    info.status = SpikeKnowledge::Planted;
    info.location = spike_.position;
    info.plantTime = elapsed_;
    info.plantSite = *site;
    info.lastUpdated = elapsed_;
    attackerBoard_.UpdateSpike(info);
    defenderBoard_.UpdateSpike(info);
    callStrategy(Team::Defenders, "retake", *site, "spike planted");
    callStrategy(Team::Attackers, "post_plant", *site, "spike planted");

    RSE_LOG_INFO(LogCategory::Round, playerTag(carrier) + " planted the spike on " + *site);
}

void Round::processDefuse(const std::vector<Intent>& intents, double deltaTime) {
    if (!spike_.IsPlanted()) {
        return;
    }
    const double radius = config_.round.defuseRadius;

    if (spike_.state == SpikeState::Planted) {
        for (std::size_t i = 0; i < players_.size(); ++i) {
            Player& player = players_[i];
            if (!player.alive || player.team != Team::Defenders ||
                !std::holds_alternative<DefuseIntent>(intents[i])) {
                continue;
            }
            if (horizontalDistance(player.position, spike_.position) > radius) {
                RSE_LOG_DEBUG(LogCategory::Round, playerTag(player) + " is too far to defuse");
                continue;
            }
            spike_.state = SpikeState::Defusing;
            spike_.defuser = player.id;
            player.defusing = true;
            player.defuseProgress = 0.0;
            emit({RoundEventType::DefuseStart, elapsed_, player.id, std::nullopt,
                  spike_.site.value_or(""), 0.0, player.position});
            break;
        }
        if (spike_.state != SpikeState::Defusing) {
            return;
        }
    }

    Player& defuser = players_[*indexOf(*spike_.defuser)];
    if (horizontalDistance(defuser.position, spike_.position) > radius) {
        defuser.defusing = false;
        defuser.defuseProgress = 0.0;
        spike_.state = SpikeState::Planted;
        spike_.defuser.reset();
        emit({RoundEventType::DefuseInterrupt, elapsed_, defuser.id, std::nullopt, "left spike",
              0.0, defuser.position});
        return;
    }

    defuser.defuseProgress =
        std::min(defuser.defuseProgress + deltaTime, config_.round.defuseTime);
    if (defuser.defuseProgress < config_.round.defuseTime) {
        return;
    }

    defuser.defusing = false;
    ++defuser.stats.defuses;
    spike_.state = SpikeState::Defused;
    emit({RoundEventType::DefuseComplete, elapsed_, defuser.id, std::nullopt,
          spike_.site.value_or(""), 0.0, defuser.position});
    RSE_LOG_INFO(LogCategory::Round, playerTag(defuser) + " defused the spike");
    endRound(RoundWinner::Defenders, EndCondition::SpikeDefused);
}

void Round::dropSpike(Player& carrier) {
    if (!carrier.hasSpike) {
        return;
    }
    if (spike_.state == SpikeState::Planting) {
        emit({RoundEventType::PlantInterrupt, elapsed_, carrier.id, std::nullopt, "died", 0.0,
              carrier.position});
    }
    carrier.hasSpike = false;
    carrier.planting = false;
    carrier.plantProgress = 0.0;
    spike_.state = SpikeState::Dropped;
    spike_.carrier.reset();
    spike_.planter.reset();
    spike_.position = carrier.position;
    emit({RoundEventType::SpikeDrop, elapsed_, carrier.id, std::nullopt, "spike", 0.0,
          carrier.position});

    SpikeInfo info;
    info.status = SpikeKnowledge::Dropped;
    info.location = spike_.position;
    info.lastUpdated = elapsed_;
    attackerBoard_.UpdateSpike(info);
}

// ── Perception ──────────────────────────────────────────────────────────

void Round::updatePerception() {
    vision_ = combat_.ComputeVision(players_, *map_, activeSmokes());

    for (const auto& viewer : players_) {
        if (!viewer.alive) {
            continue;
        }
        TeamBlackboard& board = boardFor(viewer.team);
        if (auto seen = vision_.find(viewer.id); seen != vision_.end()) {
            for (const auto& visible : seen->second) {
                const Player* enemy = FindPlayer(visible.id);
                EnemySighting sighting;
                sighting.enemy = enemy->id;
                sighting.position = enemy->position;
                sighting.lastSeen = elapsed_;
                sighting.spottedBy = viewer.id;
                sighting.area = map_->AreaAt(enemy->position.x, enemy->position.y,
                                             enemy->position.z);
                sighting.weapon = enemy->ActiveWeapon();
                sighting.shield = enemy->shield;
                board.UpdateEnemy(sighting);
            }
        }

        for (const auto& heard : combat_.FootstepsHeardBy(viewer, players_)) {
            const Player* source = FindPlayer(heard.id);
            board.AddNoise({NoiseKind::Footstep, source->position, heard.intensity, viewer.id,
                            elapsed_});
            if (auto area = map_->AreaAt(source->position.x, source->position.y,
                                         source->position.z)) {
                board.MarkAreaDangerous(*area);
            }
        }
    }

    // Revealed players are exposed to the whole opposing team.
    for (const auto& player : players_) {
        if (!player.alive || !player.status.Has(StatusEffectType::Revealed)) {
            continue;
        }
        EnemySighting sighting;
        sighting.enemy = player.id;
        sighting.position = player.position;
        sighting.lastSeen = elapsed_;
        sighting.area = map_->AreaAt(player.position.x, player.position.y, player.position.z);
        sighting.weapon = player.ActiveWeapon();
        sighting.shield = player.shield;
        boardFor(Opponent(player.team)).UpdateEnemy(sighting);
    }

    if (spike_.carrier) {
        if (const Player* carrier = FindPlayer(*spike_.carrier)) {
            SpikeInfo info = attackerBoard_.Spike();
            info.status = knowledgeFor(spike_.state);
            info.carrier = carrier->id;
            info.location = carrier->position;
            info.lastUpdated = elapsed_;
            attackerBoard_.UpdateSpike(info);
        }
    }
}

void Round::postNoise(NoiseKind kind, const Vector3& source, double range, const Player& emitter) {
    for (const auto& listener : combat_.ListenersOf(source, range, emitter.id, players_)) {
        const Player* hearer = FindPlayer(listener.id);
        if (hearer->team == emitter.team) {
            continue;
        }
        boardFor(hearer->team).AddNoise({kind, source, listener.intensity, hearer->id, elapsed_});
    }
}

// ── Combat ──────────────────────────────────────────────────────────────

bool Round::sees(PlayerId viewer, PlayerId target) const {
    auto it = vision_.find(viewer);
    if (it == vision_.end()) {
        return false;
    }
    return std::any_of(it->second.begin(), it->second.end(),
                       [target](const VisibleEnemy& v) { return v.id == target; });
}

void Round::resolveShots(const std::vector<Intent>& intents) {
    for (std::size_t i = 0; i < players_.size(); ++i) {
        const auto* shot = std::get_if<ShootIntent>(&intents[i]);
        if (shot == nullptr || !players_[i].alive) {
            continue;
        }
        const auto targetIndex = indexOf(shot->target);
        if (!targetIndex || !players_[*targetIndex].alive) {
            continue;
        }
        if (!sees(players_[i].id, shot->target)) {
            RSE_LOG_DEBUG(LogCategory::Combat, playerTag(players_[i]) +
                                                   " has no sight of its target");
            continue;
        }

        const Player& shooter = players_[i];
        const Player& target = players_[*targetIndex];
        const bool shooterSpotted = sees(target.id, shooter.id);
        const DuelOutcome outcome = combat_.ResolveDuel(shooter, target, shooterSpotted, true, rng_);
        postNoise(NoiseKind::Gunshot, shooter.position, config_.combat.gunshotRange, shooter);

        const std::size_t loserIndex = outcome.loser == shooter.id ? i : *targetIndex;
        Player& winner = outcome.winner == shooter.id ? players_[i] : players_[*targetIndex];
        Player& loser = players_[loserIndex];
        const double lethal = loser.health;

        LogContext ctx;
        ctx.playerId = winner.id;
        ctx.roundNumber = static_cast<uint32_t>(roundNumber_);
        ctx.simTime = elapsed_;
        ctx.extra["weapon"] = winner.ActiveWeapon();
        ctx.extra["probability"] = std::to_string(outcome.winnerProbability);
        RSE_LOG_CTX(LogLevel::Debug, LogCategory::Combat,
                    playerTag(winner) + " won a duel against " + playerTag(loser), ctx);

        winner.stats.damageDealt += lethal;
        loser.stats.damageTaken += lethal;
        loser.health = 0.0;
        emit({RoundEventType::Damage, elapsed_, winner.id, loser.id, winner.ActiveWeapon(),
              lethal, loser.position, {}, outcome.headshot});
        handleDeath(loserIndex, winner.id, winner.ActiveWeapon(), outcome.headshot);
        if (phase_ == RoundPhase::End) {
            return;
        }
    }
}

void Round::handleDeath(std::size_t victimIndex, std::optional<PlayerId> killer,
                        const std::string& cause, bool headshot) {
    Player& victim = players_[victimIndex];
    if (!victim.alive) {
        return;
    }
    victim.alive = false;
    victim.health = 0.0;
    victim.velocity = Vector3::Zero();
    ++victim.stats.deaths;
    ++killCount_;

    std::vector<PlayerId> assists;
    if (killer) {
        Player* credited = findPlayer(*killer);
        ++credited->stats.kills;
        const double since = elapsed_ - config_.combat.assistWindow;
        for (const auto& touch : touches_) {
            if (touch.victim != victim.id || touch.time < since || touch.owner == *killer) {
                continue;
            }
            const Player* helper = FindPlayer(touch.owner);
            if (helper->team != credited->team ||
                std::find(assists.begin(), assists.end(), touch.owner) != assists.end()) {
                continue;
            }
            assists.push_back(touch.owner);
        }
        std::sort(assists.begin(), assists.end());
        for (PlayerId id : assists) {
            ++findPlayer(id)->stats.assists;
        }
    }

    if (!victim.weapon.empty()) {
        std::uniform_int_distribution<int32_t> ammo(config_.combat.minDroppedAmmo,
                                                    config_.combat.maxDroppedAmmo);
        droppedWeapons_.push_back({victim.weapon, ammo(rng_), victim.position, elapsed_});
        victim.weapon.clear();
    }
    if (victim.shield != ShieldType::None) {
        droppedShields_.push_back({victim.shield, victim.position, elapsed_});
        victim.shield = ShieldType::None;
    }
    victim.armor = 0.0;

    dropSpike(victim);
    if (spike_.state == SpikeState::Defusing && spike_.defuser == victim.id) {
        victim.defusing = false;
        victim.defuseProgress = 0.0;
        spike_.state = SpikeState::Planted;
        spike_.defuser.reset();
        emit({RoundEventType::DefuseInterrupt, elapsed_, victim.id, std::nullopt, "died", 0.0,
              victim.position});
    }

    RoundEvent death{RoundEventType::Death, elapsed_, killer.value_or(PlayerId{}), victim.id,
                     cause, 0.0, victim.position, assists, headshot};
    emit(std::move(death));

    LogContext ctx;
    ctx.playerId = victim.id;
    ctx.roundNumber = static_cast<uint32_t>(roundNumber_);
    ctx.simTime = elapsed_;
    ctx.extra["cause"] = cause;
    RSE_LOG_CTX(LogLevel::Info, LogCategory::Combat, playerTag(victim) + " died", ctx);

    std::set<PlayerId> alive;
    for (const auto& player : players_) {
        if (player.alive && player.team == victim.team) {
            alive.insert(player.id);
        }
    }
    boardFor(victim.team).SetAlivePlayers(std::move(alive));

    checkElimination();
}

void Round::processPickups() {
    const double radius = config_.combat.pickupRadius;
    for (auto& player : players_) {
        if (!player.alive) {
            continue;
        }
        if (player.weapon.empty()) {
            auto it = std::find_if(droppedWeapons_.begin(), droppedWeapons_.end(),
                                   [&](const DroppedWeapon& w) {
                                       return horizontalDistance(w.position, player.position) <=
                                              radius;
                                   });
            if (it != droppedWeapons_.end()) {
                player.weapon = it->weapon;
                emit({RoundEventType::ItemPickup, elapsed_, player.id, std::nullopt, it->weapon,
                      static_cast<double>(it->ammo), it->position});
                droppedWeapons_.erase(it);
            }
        }
        if (player.shield == ShieldType::None) {
            auto it = std::find_if(droppedShields_.begin(), droppedShields_.end(),
                                   [&](const DroppedShield& s) {
                                       return horizontalDistance(s.position, player.position) <=
                                              radius;
                                   });
            if (it != droppedShields_.end()) {
                player.shield = it->shield;
                player.armor = ShieldStatsFor(it->shield).armor;
                emit({RoundEventType::ItemPickup, elapsed_, player.id, std::nullopt,
                      std::string(ShieldName(it->shield)), 0.0, it->position});
                droppedShields_.erase(it);
            }
        }
        if (spike_.state == SpikeState::Dropped && player.team == Team::Attackers &&
            horizontalDistance(spike_.position, player.position) <= radius) {
            player.hasSpike = true;
            spike_.state = SpikeState::Carried;
            spike_.carrier = player.id;
            emit({RoundEventType::SpikePickup, elapsed_, player.id, std::nullopt, "spike", 0.0,
                  player.position});
        }
    }
}

// ── Abilities ───────────────────────────────────────────────────────────

std::vector<SmokeVolume> Round::activeSmokes() const {
    std::vector<SmokeVolume> smokes;
    for (const auto& instance : abilities_) {
        if (auto smoke = instance.Smoke()) {
            smokes.push_back(*smoke);
        }
    }
    return smokes;
}

std::vector<const AbilityInstance*> Round::ActiveAbilities() const {
    std::vector<const AbilityInstance*> active;
    for (const auto& instance : abilities_) {
        if (instance.IsActive()) {
            active.push_back(&instance);
        }
    }
    return active;
}

void Round::updateAbilities(double deltaTime) {
    for (auto& instance : abilities_) {
        if (!instance.IsActive()) {
            continue;
        }
        const AbilityEffectReport report = instance.Update(deltaTime, elapsed_, *map_, players_);

        for (const auto& hit : report.hits) {
            const auto victimIndex = indexOf(hit.target);
            Player& victim = players_[*victimIndex];
            if (victim.team != instance.OwnerTeam()) {
                touches_.push_back({instance.Owner(), victim.id, elapsed_});
            }
            if (hit.healthLost <= 0.0) {
                continue;
            }
            emit({RoundEventType::Damage, elapsed_, instance.Owner(), victim.id,
                  instance.Definition().name, hit.healthLost, victim.position});
            if (victim.alive && victim.health <= 0.0) {
                std::optional<PlayerId> killer;
                if (victim.team != instance.OwnerTeam()) {
                    killer = instance.Owner();
                }
                handleDeath(*victimIndex, killer, instance.Definition().name, false);
                if (phase_ == RoundPhase::End) {
                    return;
                }
            }
        }
    }

    const double horizon = elapsed_ - config_.combat.assistWindow;
    std::erase_if(touches_, [horizon](const AbilityTouch& t) { return t.time < horizon; });
}

// ── Blackboards ─────────────────────────────────────────────────────────

void Round::updateBlackboards(double deltaTime) {
    attackerBoard_.Decay(deltaTime, elapsed_);
    defenderBoard_.Decay(deltaTime, elapsed_);
    updateStrategiesMidRound();
}

void Round::updateStrategiesMidRound() {
    constexpr int32_t kStackedSite = 3;
    constexpr int32_t kLightSite = 1;
    constexpr int32_t kActivityThreshold = 3;

    auto siteOf = [this](const Vector3& p) { return map_->BombSiteAt(p.x, p.y, p.z); };

    // Attackers rotate away from a stacked target site toward a light one.
    if (!spike_.IsPlanted() && attackerBoard_.CurrentStrategy() &&
        attackerBoard_.CurrentStrategy()->targetSite) {
        std::map<std::string, int32_t> defendersAt;
        for (const auto& [id, sighting] : attackerBoard_.Enemies()) {
            if (auto site = siteOf(sighting.position)) {
                ++defendersAt[*site];
            }
        }
        const std::string target = *attackerBoard_.CurrentStrategy()->targetSite;
        if (defendersAt[target] >= kStackedSite) {
            for (const auto& site : map_->BombSites()) {
                if (site.name != target && defendersAt[site.name] <= kLightSite) {
                    callStrategy(Team::Attackers, "rotate", site.name,
                                 std::to_string(defendersAt[target]) + " defenders at " + target);
                    attackerBoard_.AddWarning("Rotating to site " + site.name, std::nullopt,
                                              elapsed_);
                    break;
                }
            }
        }
    }

    // Defenders rotate toward the site with the most attacker activity.
    if (!spike_.IsPlanted()) {
        std::map<std::string, int32_t> activity;
        for (const auto& [id, sighting] : defenderBoard_.Enemies()) {
            if (auto site = siteOf(sighting.position)) {
                activity[*site] += 2;
            }
        }
        for (const auto& noise : defenderBoard_.Noises()) {
            if (auto site = siteOf(noise.position)) {
                activity[*site] += 1;
            }
        }
        auto busiest = std::max_element(
            activity.begin(), activity.end(),
            [](const auto& a, const auto& b) { return a.second < b.second; });
        if (busiest != activity.end() && busiest->second >= kActivityThreshold) {
            const auto& current = defenderBoard_.CurrentStrategy();
            const bool alreadyThere = current && current->name == "rotate" &&
                                      current->targetSite == busiest->first;
            if (!alreadyThere) {
                callStrategy(Team::Defenders, "rotate", busiest->first,
                             "enemy activity at " + busiest->first);
                defenderBoard_.AddWarning("Rotate to " + busiest->first, std::nullopt, elapsed_);
            }
        }
    }
}

void Round::callStrategy(Team team, const std::string& name, std::optional<std::string> site,
                         const std::string& reason) {
    TeamBlackboard& board = boardFor(team);
    if (const auto& current = board.CurrentStrategy();
        current && current->name == name && current->targetSite == site) {
        return;
    }
    StrategyCall call;
    call.name = name;
    call.issuedAt = elapsed_;
    call.issuedBy = randomAlive(team).value_or(PlayerId{});
    call.targetSite = std::move(site);
    call.reason = reason;
    board.SetStrategy(std::move(call));
    RSE_LOG_DEBUG(LogCategory::AI, std::string(TeamName(team)) + " call: " + name);
}

void Round::publishEconomy() {
    for (Team team : {Team::Attackers, Team::Defenders}) {
        EconomyInfo info;
        int32_t members = 0;
        for (const auto& player : players_) {
            if (player.team == team) {
                info.teamCredits += player.credits;
                ++members;
            }
        }
        info.averageCredits = members > 0 ? static_cast<double>(info.teamCredits) / members : 0.0;
        info.canFullBuy = info.averageCredits >= config_.economy.fullBuyThreshold;
        info.canHalfBuy = info.averageCredits >= config_.economy.halfBuyThreshold;
        info.saving = !info.canHalfBuy;
        info.lastUpdated = elapsed_;
        boardFor(team).SetEconomy(info);
    }
}

// ── End conditions ──────────────────────────────────────────────────────

void Round::checkElimination() {
    if (phase_ != RoundPhase::Active) {
        return;
    }
    if (AliveCount(Team::Defenders) == 0) {
        endRound(RoundWinner::Attackers, EndCondition::Elimination);
    } else if (AliveCount(Team::Attackers) == 0 && !spike_.IsPlanted()) {
        endRound(RoundWinner::Defenders, EndCondition::Elimination);
    }
}

void Round::checkEndConditions() {
    if (phase_ != RoundPhase::Active) {
        return;
    }
    checkElimination();
    if (phase_ != RoundPhase::Active) {
        return;
    }
    if (spike_.IsPlanted() && spike_.timer <= 0.0) {
        spike_.state = SpikeState::Detonated;
        emit({RoundEventType::Detonation, elapsed_, PlayerId{}, std::nullopt,
              spike_.site.value_or(""), 0.0, spike_.position});
        RSE_LOG_INFO(LogCategory::Round, "Spike detonated");
        endRound(RoundWinner::Attackers, EndCondition::SpikeDetonation);
        return;
    }
    if (!spike_.IsPlanted() && roundTimeRemaining_ <= 0.0) {
        endRound(RoundWinner::Defenders, EndCondition::TimeExpired);
    }
}

void Round::endRound(RoundWinner winner, EndCondition condition) {
    if (phase_ == RoundPhase::End) {
        return;
    }
    phase_ = RoundPhase::End;
    winner_ = winner;
    endCondition_ = condition;

    for (auto& instance : abilities_) {
        instance.Expire(players_);
    }

    emit({RoundEventType::PhaseChange, elapsed_, PlayerId{}, std::nullopt,
          std::string(RoundPhaseName(RoundPhase::End))});
    emit({RoundEventType::RoundEnd, elapsed_, PlayerId{}, std::nullopt,
          std::string(EndConditionName(condition))});

    const std::string reason(EndConditionName(condition));
    for (Team team : {Team::Attackers, Team::Defenders}) {
        std::optional<std::string> site = spike_.site;
        if (!site && boardFor(team).CurrentStrategy()) {
            site = boardFor(team).CurrentStrategy()->targetSite;
        }
        boardFor(team).RecordRoundResult(roundNumber_, WinnerFor(team) == winner, reason, site);
    }

    RSE_LOG_INFO(LogCategory::Round, "Round " + std::to_string(roundNumber_) + " won by " +
                                         std::string(RoundWinnerName(winner)) + " (" + reason +
                                         ")");
}

// ── Observation ─────────────────────────────────────────────────────────

RoundSummary Round::GetSummary() const {
    RoundSummary summary;
    summary.roundNumber = roundNumber_;
    summary.phase = phase_;
    summary.elapsed = elapsed_;
    summary.buyTimeRemaining = buyTimeRemaining_;
    summary.timeRemaining = roundTimeRemaining_;
    summary.spikeState = spike_.state;
    summary.spikePlanted = spike_.IsPlanted() || spike_.state == SpikeState::Defused ||
                           spike_.state == SpikeState::Detonated;
    if (spike_.IsPlanted()) {
        summary.spikeTimeRemaining = spike_.timer;
    }
    summary.aliveAttackers = AliveCount(Team::Attackers);
    summary.aliveDefenders = AliveCount(Team::Defenders);
    summary.winner = winner_;
    summary.endCondition = endCondition_;
    summary.killCount = killCount_;
    return summary;
}

GameResult<Carryover> Round::GetCarryover() const {
    if (phase_ != RoundPhase::End || winner_ == RoundWinner::None) {
        return GameResult<Carryover>::err(
            GameError(ErrorCode::InvalidState, "carryover is only available after the round"));
    }
    const Team winningTeam = winner_ == RoundWinner::Attackers ? Team::Attackers : Team::Defenders;
    return GameResult<Carryover>::ok(
        ComputeCarryover(players_, winningTeam, lossBonus_, config_.economy));
}

int32_t Round::AliveCount(Team team) const {
    return static_cast<int32_t>(std::count_if(
        players_.begin(), players_.end(),
        [team](const Player& p) { return p.alive && p.team == team; }));
}

const Player* Round::FindPlayer(PlayerId id) const {
    auto index = indexOf(id);
    return index ? &players_[*index] : nullptr;
}

Player* Round::findPlayer(PlayerId id) {
    auto index = indexOf(id);
    return index ? &players_[*index] : nullptr;
}

std::optional<std::size_t> Round::indexOf(PlayerId id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<PlayerId> Round::randomAlive(Team team) {
    std::vector<PlayerId> candidates;
    for (const auto& player : players_) {
        if (player.alive && player.team == team) {
            candidates.push_back(player.id);
        }
    }
    if (candidates.empty()) {
        return std::nullopt;
    }
    std::uniform_int_distribution<std::size_t> pick(0, candidates.size() - 1);
    return candidates[pick(rng_)];
}

void Round::emit(RoundEvent event) {
    events_.push_back(std::move(event));
}

}  // namespace rse::game
