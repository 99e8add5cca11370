/// @file tick_loop.cpp
/// @brief TickLoop implementation.

#include "rse/service/tick_loop.hpp"

#include <utility>

namespace rse::service {

namespace {

constexpr uint32_t kDefaultTickRate = 20;

}  // namespace

TickLoop::TickLoop(uint32_t tickRate)
    : tickRate_(tickRate > 0 ? tickRate : kDefaultTickRate),
      targetFrameTime_(std::chrono::microseconds(1'000'000 / tickRate_)) {}

TickLoop::~TickLoop() {
    stop();
}

void TickLoop::setTickCallback(TickCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    tickCallback_ = std::move(callback);
}

void TickLoop::setMetricsCallback(MetricsCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    metricsCallback_ = std::move(callback);
}

bool TickLoop::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return false;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    thread_ = std::thread([this] { run(); });
    return true;
}

void TickLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(finishedMutex_);
        running_.store(false);
    }
    finishedCv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void TickLoop::waitUntilFinished() {
    {
        std::unique_lock<std::mutex> lock(finishedMutex_);
        finishedCv_.wait(lock, [this] { return !running_.load(); });
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

TickMetrics TickLoop::tick() {
    bool keepGoing = true;
    return executeTick(keepGoing);
}

bool TickLoop::isRunning() const noexcept {
    return running_.load();
}

uint32_t TickLoop::tickRate() const noexcept {
    return tickRate_;
}

std::chrono::microseconds TickLoop::targetFrameTime() const noexcept {
    return targetFrameTime_;
}

double TickLoop::tickInterval() const noexcept {
    return static_cast<double>(targetFrameTime_.count()) / 1'000'000.0;
}

uint64_t TickLoop::tickCount() const noexcept {
    return tickCount_.load();
}

TickMetrics TickLoop::lastMetrics() const {
    std::lock_guard<std::mutex> lock(metricsMutex_);
    return lastMetrics_;
}

void TickLoop::run() {
    auto nextTick = std::chrono::steady_clock::now();

    while (running_.load()) {
        nextTick += targetFrameTime_;

        bool keepGoing = true;
        auto metrics = executeTick(keepGoing);

        {
            std::lock_guard<std::mutex> lock(metricsMutex_);
            lastMetrics_ = metrics;
        }
        {
            std::lock_guard<std::mutex> lock(callbackMutex_);
            if (metricsCallback_) {
                metricsCallback_(metrics);
            }
        }

        if (!keepGoing) {
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (now < nextTick) {
            std::this_thread::sleep_until(nextTick);
        } else {
            // Overrun: reset the target to avoid cascading catch-up.
            nextTick = now;
        }
    }

    {
        std::lock_guard<std::mutex> lock(finishedMutex_);
        running_.store(false);
    }
    finishedCv_.notify_all();
}

TickMetrics TickLoop::executeTick(bool& keepGoing) {
    const auto start = std::chrono::steady_clock::now();

    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        if (tickCallback_) {
            keepGoing = tickCallback_(tickInterval());
        }
    }

    const auto updateDuration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);

    TickMetrics metrics;
    metrics.updateTime = updateDuration;
    metrics.budgetUtilization =
        targetFrameTime_.count() > 0
            ? static_cast<double>(updateDuration.count()) /
                  static_cast<double>(targetFrameTime_.count())
            : 0.0;
    metrics.tickNumber = tickCount_.fetch_add(1);
    metrics.overrun = updateDuration > targetFrameTime_;
    return metrics;
}

}  // namespace rse::service
