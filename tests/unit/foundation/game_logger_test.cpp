/// @file game_logger_test.cpp
/// @brief GameLogger tests against a capturing kcenon ILogger.

#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "rse/foundation/error_code.hpp"
#include "rse/foundation/game_error.hpp"
#include "rse/foundation/game_logger.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

using namespace rse::foundation;
using kcenon::common::interfaces::GlobalLoggerRegistry;
using kcenon::common::interfaces::ILogger;
using kcenon::common::interfaces::log_level;

namespace {

struct CapturedLine {
    log_level level;
    std::string text;
};

/// ILogger that keeps every line it receives.
class CapturingLogger : public ILogger {
public:
    kcenon::common::VoidResult log(log_level level, const std::string& message) override {
        std::lock_guard lock(mutex_);
        lines_.push_back({level, message});
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(const kcenon::common::interfaces::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(log_level level) const override { return level >= level_.load(); }

    kcenon::common::VoidResult set_level(log_level level) override {
        level_.store(level);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    log_level get_level() const override { return level_.load(); }

    kcenon::common::VoidResult flush() override {
        flushed_.store(true);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    std::vector<CapturedLine> lines() const {
        std::lock_guard lock(mutex_);
        return lines_;
    }

    bool flushed() const { return flushed_.load(); }

private:
    mutable std::mutex mutex_;
    std::vector<CapturedLine> lines_;
    std::atomic<log_level> level_{log_level::trace};
    std::atomic<bool> flushed_{false};
};

}  // namespace

class GameLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        sink_ = std::make_shared<CapturingLogger>();
        registry.set_default_logger(sink_);
    }

    void TearDown() override { GlobalLoggerRegistry::instance().clear(); }

    std::shared_ptr<CapturingLogger> sink_;
};

// ── Error codes ─────────────────────────────────────────────────────────

TEST(ErrorCodeTest, SubsystemRanges) {
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidArgument), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigTypeMismatch), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidGeometry), "Map");
    EXPECT_EQ(errorSubsystem(ErrorCode::AbilityUnavailable), "Ability");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidRoster), "Round");
}

TEST(ErrorCodeTest, GameErrorCarriesCodeAndMessage) {
    GameError err(ErrorCode::MissingMap, "no map");
    EXPECT_EQ(err.code(), ErrorCode::MissingMap);
    EXPECT_EQ(err.message(), "no map");
    EXPECT_EQ(err.subsystem(), "Round");
}

// ── Names and defaults ──────────────────────────────────────────────────

TEST(LogCategoryTest, Names) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::Map), "Map");
    EXPECT_EQ(logCategoryName(LogCategory::Movement), "Movement");
    EXPECT_EQ(logCategoryName(LogCategory::Ability), "Ability");
    EXPECT_EQ(logCategoryName(LogCategory::Combat), "Combat");
    EXPECT_EQ(logCategoryName(LogCategory::Round), "Round");
    EXPECT_EQ(logCategoryName(LogCategory::Economy), "Economy");
    EXPECT_EQ(logCategoryName(LogCategory::AI), "AI");
    EXPECT_EQ(logCategoryName(static_cast<LogCategory>(42)), "Unknown");
}

TEST(LogLevelTest, Names) {
    EXPECT_EQ(logLevelName(LogLevel::Trace), "TRACE");
    EXPECT_EQ(logLevelName(LogLevel::Warning), "WARNING");
    EXPECT_EQ(logLevelName(LogLevel::Off), "OFF");
}

TEST(GameLoggerBasicTest, DefaultCategoryLevels) {
    GameLogger logger;
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Ability), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Combat), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Round), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::AI), LogLevel::Info);
}

TEST(GameLoggerBasicTest, CategoryLevelFiltering) {
    GameLogger logger;
    EXPECT_FALSE(logger.isEnabled(LogLevel::Debug, LogCategory::Round));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Debug, LogCategory::Combat));

    logger.setCategoryLevel(LogCategory::Round, LogLevel::Error);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Warning, LogCategory::Round));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Critical, LogCategory::Round));

    logger.setCategoryLevel(LogCategory::Round, LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, LogCategory::Round));
}

TEST(GameLoggerBasicTest, InvalidCategoryIsOff) {
    GameLogger logger;
    auto invalid = static_cast<LogCategory>(99);
    EXPECT_EQ(logger.getCategoryLevel(invalid), LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, invalid));
}

// ── Output ──────────────────────────────────────────────────────────────

TEST_F(GameLoggerTest, PrefixesCategory) {
    GameLogger logger;
    logger.log(LogLevel::Info, LogCategory::Round, "Round 1 is live");

    auto lines = sink_->lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].level, log_level::info);
    EXPECT_EQ(lines[0].text, "[Round] Round 1 is live");
}

TEST_F(GameLoggerTest, DropsMessagesBelowCategoryLevel) {
    GameLogger logger;
    logger.log(LogLevel::Debug, LogCategory::Economy, "filtered");
    EXPECT_TRUE(sink_->lines().empty());
}

TEST_F(GameLoggerTest, ContextFieldsAreAppended) {
    GameLogger logger;
    LogContext ctx;
    ctx.playerId = PlayerId(7);
    ctx.instanceId = InstanceId(3);
    ctx.roundNumber = 4;
    ctx.simTime = 12.5;
    ctx.extra["weapon"] = "Vandal";

    logger.logWithContext(LogLevel::Debug, LogCategory::Combat, "Duel resolved", ctx);

    auto lines = sink_->lines();
    ASSERT_EQ(lines.size(), 1u);
    const auto& text = lines[0].text;
    EXPECT_NE(text.find("[Combat] Duel resolved {"), std::string::npos);
    EXPECT_NE(text.find("round=4"), std::string::npos);
    EXPECT_NE(text.find("t=12.50"), std::string::npos);
    EXPECT_NE(text.find("player_id=7"), std::string::npos);
    EXPECT_NE(text.find("instance_id=3"), std::string::npos);
    EXPECT_NE(text.find("weapon=Vandal"), std::string::npos);
}

TEST_F(GameLoggerTest, EmptyContextHasNoBraces) {
    GameLogger logger;
    logger.logWithContext(LogLevel::Info, LogCategory::Map, "Loaded", LogContext{});

    auto lines = sink_->lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].text, "[Map] Loaded");
}

TEST_F(GameLoggerTest, CategoryLoggerTakesPrecedence) {
    auto abilitySink = std::make_shared<CapturingLogger>();
    ASSERT_TRUE(GlobalLoggerRegistry::instance().register_logger("rse.Ability", abilitySink)
                    .is_ok());

    GameLogger logger;
    logger.log(LogLevel::Info, LogCategory::Ability, "smoke deployed");
    logger.log(LogLevel::Info, LogCategory::Round, "phase change");

    ASSERT_EQ(abilitySink->lines().size(), 1u);
    EXPECT_EQ(abilitySink->lines()[0].text, "[Ability] smoke deployed");
    ASSERT_EQ(sink_->lines().size(), 1u);
    EXPECT_EQ(sink_->lines()[0].text, "[Round] phase change");
}

TEST_F(GameLoggerTest, FlushReachesDefaultLogger) {
    GameLogger logger;
    EXPECT_TRUE(logger.flush().hasValue());
    EXPECT_TRUE(sink_->flushed());
}

TEST_F(GameLoggerTest, MacrosUseProcessLogger) {
    GameLogger::instance().setCategoryLevel(LogCategory::AI, LogLevel::Debug);
    RSE_LOG_DEBUG(LogCategory::AI, "attackers call: split");
    GameLogger::instance().setCategoryLevel(LogCategory::AI, LogLevel::Info);
    RSE_LOG_DEBUG(LogCategory::AI, "dropped");

    auto lines = sink_->lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].text, "[AI] attackers call: split");
}
