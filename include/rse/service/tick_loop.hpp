#pragma once

/// @file tick_loop.hpp
/// @brief Fixed-rate tick loop driving a simulation in real time.
///
/// TickLoop runs a tick callback at a configurable rate (default 20 Hz =
/// 50 ms per tick, the engine's default tick interval) on a dedicated
/// thread.  The callback returns false to finish the loop from inside,
/// which is how a round driver stops once the round reaches End.  Each
/// tick measures update time and detects overruns.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace rse::service {

/// Per-tick performance metrics.
struct TickMetrics {
    /// Time spent in the tick callback.
    std::chrono::microseconds updateTime{0};

    /// Ratio of updateTime to the target frame time (1.0 = full budget).
    double budgetUtilization = 0.0;

    /// Monotonically increasing tick counter (starts at 0).
    uint64_t tickNumber = 0;

    /// True when updateTime exceeded the target frame time.
    bool overrun = false;
};

/// Fixed-rate loop on a dedicated thread.
///
/// Usage:
/// @code
///   TickLoop loop(20);  // 20 Hz
///   loop.setTickCallback([&](double dt) {
///       round.Update(dt);
///       return round.Phase() != RoundPhase::End;
///   });
///   (void)loop.start();
///   loop.waitUntilFinished();
/// @endcode
class TickLoop {
public:
    /// Return false to finish the loop after this tick.
    using TickCallback = std::function<bool(double deltaTime)>;
    using MetricsCallback = std::function<void(const TickMetrics&)>;

    /// @param tickRate  Ticks per second (0 falls back to 20).
    explicit TickLoop(uint32_t tickRate = 20);

    ~TickLoop();

    TickLoop(const TickLoop&) = delete;
    TickLoop& operator=(const TickLoop&) = delete;
    TickLoop(TickLoop&&) = delete;
    TickLoop& operator=(TickLoop&&) = delete;

    void setTickCallback(TickCallback callback);

    /// Invoked after each threaded tick with its metrics.
    void setMetricsCallback(MetricsCallback callback);

    /// Start the loop on a dedicated thread.
    /// @return false if already running.
    [[nodiscard]] bool start();

    /// Signal the loop to stop and join the thread.
    void stop();

    /// Block until the loop finishes on its own or is stopped.
    void waitUntilFinished();

    /// Execute a single tick manually.  The loop must not be running.
    /// @return The metrics for the executed tick.
    TickMetrics tick();

    [[nodiscard]] bool isRunning() const noexcept;
    [[nodiscard]] uint32_t tickRate() const noexcept;
    [[nodiscard]] std::chrono::microseconds targetFrameTime() const noexcept;

    /// Delta time handed to the callback, in seconds.
    [[nodiscard]] double tickInterval() const noexcept;

    [[nodiscard]] uint64_t tickCount() const noexcept;
    [[nodiscard]] TickMetrics lastMetrics() const;

private:
    void run();

    /// Execute one tick; @p keepGoing receives the callback's verdict.
    TickMetrics executeTick(bool& keepGoing);

    uint32_t tickRate_;
    std::chrono::microseconds targetFrameTime_;

    TickCallback tickCallback_;
    MetricsCallback metricsCallback_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> tickCount_{0};
    std::thread thread_;

    mutable std::mutex metricsMutex_;
    TickMetrics lastMetrics_;

    mutable std::mutex callbackMutex_;

    std::mutex finishedMutex_;
    std::condition_variable finishedCv_;
};

}  // namespace rse::service
