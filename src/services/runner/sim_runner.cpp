/// @file sim_runner.cpp
/// @brief Implementation of the round simulator entry-point helpers.

#include "rse/service/sim_runner.hpp"

#include <charconv>
#include <csignal>
#include <cstdlib>
#include <sstream>
#include <string_view>
#include <utility>

#include "rse/foundation/game_logger.hpp"
#include "rse/game/economy.hpp"
#include "rse/game/map_loader.hpp"

namespace rse::service {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

// ── SignalHandler ───────────────────────────────────────────────────────

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

// ── Config loading ──────────────────────────────────────────────────────

GameResult<void> loadConfig(foundation::ConfigManager& config,
                            const std::filesystem::path& path) {
    std::filesystem::path configPath = path;

    const char* envPath = std::getenv("RSE_CONFIG_PATH");
    if (envPath != nullptr && *envPath != '\0') {
        configPath = envPath;
    }
    if (configPath.empty()) {
        // Nothing to overlay; every tunable keeps its compiled-in default.
        return GameResult<void>::ok();
    }

    RSE_LOG_INFO(LogCategory::Core, "Loading configuration from " + configPath.string());
    return config.load(configPath);
}

// ── CLI parsing ─────────────────────────────────────────────────────────

namespace {

GameResult<RunOptions> badArgument(std::string message) {
    return GameResult<RunOptions>::err(
        GameError(ErrorCode::InvalidArgument, std::move(message)));
}

template <typename T>
bool parseNumber(std::string_view text, T& out) {
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, out);
    return ec == std::errc() && ptr == end;
}

}  // namespace

GameResult<RunOptions> parseArgs(int argc, char* argv[]) {
    RunOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

        if (arg == "--help" || arg == "-h") {
            options.help = true;
            continue;
        }
        if (arg == "--realtime") {
            options.realtime = true;
            continue;
        }
        if (arg == "--events") {
            options.printEvents = true;
            continue;
        }

        const bool takesValue =
            arg == "--config" || arg == "--map" || arg == "--seed" || arg == "--rounds";
        if (!takesValue) {
            return badArgument("unknown option '" + std::string(arg) + "'");
        }
        if (i + 1 >= argc) {
            return badArgument(std::string(arg) + " requires a value");
        }
        const std::string_view value(argv[++i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

        if (arg == "--config") {
            options.configPath = std::string(value);
        } else if (arg == "--map") {
            options.mapPath = std::string(value);
        } else if (arg == "--seed") {
            uint64_t seed = 0;
            if (!parseNumber(value, seed)) {
                return badArgument("--seed expects an unsigned integer");
            }
            options.seed = seed;
        } else {
            if (!parseNumber(value, options.rounds) || options.rounds < 1) {
                return badArgument("--rounds expects a positive integer");
            }
        }
    }
    return GameResult<RunOptions>::ok(std::move(options));
}

std::string usage() {
    return "Usage: rse_round_sim [options]\n"
           "  --config <path>   YAML tunables (RSE_CONFIG_PATH overrides)\n"
           "  --map <path>      YAML map description (default: built-in map)\n"
           "  --seed <n>        seed for reproducible rounds\n"
           "  --rounds <n>      number of consecutive rounds (default: 1)\n"
           "  --realtime        run ticks at wall-clock pace\n"
           "  --events          print every round event\n"
           "  --help            show this message\n";
}

// ── Built-in map and roster ─────────────────────────────────────────────

namespace {

// Lanes are walled off from the opposite spawn; each screen hides its lane
// mouth from the site centre.
constexpr std::string_view kBuiltinMap = R"(
metadata:
  name: Foundry
  map-size: [64, 72]
map-areas:
  Attacker Spawn: {x: 0, y: 0, w: 64, h: 10, z: 0}
  A Main: {x: 0, y: 10, w: 12, h: 30, z: 0}
  B Main: {x: 52, y: 10, w: 12, h: 30, z: 0}
  A Site: {x: 0, y: 40, w: 28, h: 32, z: 0}
  Defender Spawn: {x: 28, y: 40, w: 8, h: 32, z: 0}
  B Site: {x: 36, y: 40, w: 28, h: 32, z: 0}
walls:
  A Main Wall: {x: 12, y: 10, w: 1, h: 30}
  B Main Wall: {x: 51, y: 10, w: 1, h: 30}
  Mid Wall: {x: 13, y: 24, w: 38, h: 1}
  A Screen: {x: 0, y: 44, w: 20, h: 1}
  B Screen: {x: 44, y: 44, w: 20, h: 1}
objects:
  A Box: {x: 4, y: 62, w: 2, h: 2}
  B Box: {x: 58, y: 62, w: 2, h: 2}
bomb-sites:
  A: {x: 0, y: 40, w: 28, h: 32}
  B: {x: 36, y: 40, w: 28, h: 32}
spawns:
  attackers: [[28, 4], [30, 4], [32, 4], [34, 4], [36, 4]]
  defenders: [[30, 68], [32, 68], [34, 68], [30, 64], [34, 64]]
adjacency:
  Attacker Spawn: [A Main, B Main]
  A Main: [Attacker Spawn, A Site]
  B Main: [Attacker Spawn, B Site]
  A Site: [A Main, Defender Spawn]
  Defender Spawn: [A Site, B Site]
  B Site: [B Main, Defender Spawn]
)";

struct RosterEntry {
    const char* name;
    const char* role;
    const char* agent;
    const char* firstAbility;
    const char* secondAbility;
};

constexpr RosterEntry kAttackers[] = {
    {"Vex", "duelist", "Jett", "smoke", "flash"},
    {"Kite", "initiator", "Sova", "recon", "flash"},
    {"Moss", "controller", "Brimstone", "smoke", "molly"},
    {"Rook", "sentinel", "Killjoy", "trap", "molly"},
    {"Sage", "sentinel", "Sage", "heal", "trap"},
};

constexpr RosterEntry kDefenders[] = {
    {"Ash", "duelist", "Phoenix", "flash", "molly"},
    {"Lynx", "initiator", "Skye", "flash", "heal"},
    {"Fog", "controller", "Omen", "smoke", "flash"},
    {"Bolt", "sentinel", "Cypher", "trap", "recon"},
    {"Wren", "initiator", "Fade", "recon", "smoke"},
};

game::Player makePlayer(uint64_t id, const RosterEntry& entry, game::Team team,
                        int32_t credits) {
    game::Player player;
    player.id = game::PlayerId(id);
    player.name = entry.name;
    player.role = entry.role;
    player.agent = entry.agent;
    player.team = team;
    player.credits = credits;
    player.abilities = {{entry.firstAbility, 2}, {entry.secondAbility, 1}};
    return player;
}

}  // namespace

GameResult<std::shared_ptr<const game::MapGeometry>> builtinMap() {
    return game::LoadMapFromString(kBuiltinMap);
}

Roster defaultRoster(const game::EconomyTuning& economy) {
    Roster roster;
    uint64_t id = 1;
    for (const auto& entry : kAttackers) {
        roster.attackers.emplace_back(id);
        roster.players.push_back(makePlayer(id++, entry, game::Team::Attackers,
                                            economy.startingCredits));
    }
    for (const auto& entry : kDefenders) {
        roster.defenders.emplace_back(id);
        roster.players.push_back(makePlayer(id++, entry, game::Team::Defenders,
                                            economy.startingCredits));
    }
    return roster;
}

// ── MatchRunner ─────────────────────────────────────────────────────────

MatchRunner::MatchRunner(std::shared_ptr<const game::MapGeometry> map,
                         game::SimulationConfig config, Roster roster,
                         std::optional<uint64_t> seed)
    : map_(std::move(map)),
      config_(std::move(config)),
      roster_(std::move(roster)),
      seed_(seed) {}

GameResult<game::Round> MatchRunner::nextRound() const {
    game::RoundParams params;
    params.roundNumber = roundNumber_;
    params.players = roster_.players;
    params.attackers = roster_.attackers;
    params.defenders = roster_.defenders;
    params.map = map_;
    if (seed_) {
        params.seed = *seed_ + static_cast<uint64_t>(roundNumber_ - 1);
    }
    params.lossBonus = lossBonus_;
    params.config = config_;
    params.attackerBlackboard = attackerBoard_;
    params.defenderBlackboard = defenderBoard_;
    return game::Round::Create(std::move(params));
}

GameResult<void> MatchRunner::completeRound(const game::Round& round) {
    auto carryover = round.GetCarryover();
    if (!carryover) {
        return GameResult<void>::err(carryover.error());
    }

    std::vector<game::Player> players = round.Players();
    game::ApplyCarryover(players, carryover.value(), round.Catalog(), config_.economy);
    roster_.players = std::move(players);

    const bool attackersWon = round.Winner() == game::RoundWinner::Attackers;
    if (attackersWon) {
        ++attackerWins_;
        lossBonus_.attackersLossStreak = 1;
        ++lossBonus_.defendersLossStreak;
    } else {
        ++defenderWins_;
        lossBonus_.defendersLossStreak = 1;
        ++lossBonus_.attackersLossStreak;
    }

    attackerBoard_ = round.Blackboard(game::Team::Attackers);
    defenderBoard_ = round.Blackboard(game::Team::Defenders);
    ++roundNumber_;
    return GameResult<void>::ok();
}

GameResult<game::RoundSummary> MatchRunner::playRound(
    std::shared_ptr<game::IIntentProvider> provider) {
    auto created = nextRound();
    if (!created) {
        return GameResult<game::RoundSummary>::err(created.error());
    }
    game::Round round = std::move(created).value();
    round.SetIntentProvider(std::move(provider));

    const game::RoundSummary summary = round.Simulate();
    if (auto done = completeRound(round); !done) {
        return GameResult<game::RoundSummary>::err(done.error());
    }
    return GameResult<game::RoundSummary>::ok(summary);
}

// ── Formatting ──────────────────────────────────────────────────────────

std::string formatSummary(const game::RoundSummary& summary) {
    std::ostringstream out;
    out << "round " << summary.roundNumber << ": " << game::RoundPhaseName(summary.phase);
    if (summary.winner != game::RoundWinner::None) {
        out << ", " << game::RoundWinnerName(summary.winner) << " win by "
            << game::EndConditionName(summary.endCondition);
    }
    out << " after " << summary.elapsed << "s, spike "
        << game::SpikeStateName(summary.spikeState) << ", alive "
        << summary.aliveAttackers << "v" << summary.aliveDefenders << ", kills "
        << summary.killCount;
    return out.str();
}

std::string formatEvent(const game::RoundEvent& event) {
    std::ostringstream out;
    out << "[" << event.time << "] " << game::RoundEventTypeName(event.type);
    if (event.actor.isValid()) {
        out << " " << event.actor.value();
    }
    if (event.target) {
        out << " -> " << event.target->value();
    }
    if (!event.detail.empty()) {
        out << " (" << event.detail << ")";
    }
    if (event.amount > 0.0) {
        out << " " << event.amount;
    }
    if (event.headshot) {
        out << " headshot";
    }
    if (!event.assists.empty()) {
        out << " assists:";
        for (const auto& id : event.assists) {
            out << " " << id.value();
        }
    }
    return out.str();
}

}  // namespace rse::service
