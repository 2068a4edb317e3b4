#include "burst_loop_runner.h"
#include <utility>
#include <spdlog/spdlog.h>

namespace cortexlib {

static std::chrono::nanoseconds period_for(float frequency_hz) {
    if (frequency_hz < 0.0f) {
        throw ConfigurationError("Target burst frequency must not be negative");
    }
    if (frequency_hz == 0.0f) {
        return std::chrono::nanoseconds(0);
    }
    return std::chrono::nanoseconds(static_cast<int64_t>(1e9 / frequency_hz));
}

BurstLoopRunner::BurstLoopRunner(BurstEngine& engine, float frequency_hz, uint64_t max_bursts)
    : engine_(engine), period_(period_for(frequency_hz)), max_bursts_(max_bursts),
      running_(false), stop_requested_(false), bursts_run_(0),
      last_perf_log_(std::chrono::steady_clock::now()) {}

BurstLoopRunner::~BurstLoopRunner() {
    stop_requested_.store(true);
    if (thread_.joinable()) {
        thread_.join();
    }
    if (failure_) {
        spdlog::error("Burst loop ended with an unreported failure");
    }
}

void BurstLoopRunner::set_report_callback(ReportCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback_ = std::move(callback);
}

void BurstLoopRunner::start() {
    if (running_.load()) {
        spdlog::warn("Burst loop already running");
        return;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    failure_ = nullptr;
    stop_requested_.store(false);
    running_.store(true);
    thread_ = std::thread([this]() { loop(); });
    spdlog::info("Burst loop started (period {} us, limit {})",
                 std::chrono::duration_cast<std::chrono::microseconds>(period_).count(), max_bursts_);
}

void BurstLoopRunner::stop() {
    stop_requested_.store(true);
    wait();
}

void BurstLoopRunner::wait() {
    if (thread_.joinable()) {
        thread_.join();
        spdlog::info("Burst loop stopped after {} bursts", bursts_run_.load());
    }
    if (failure_) {
        std::exception_ptr failure = failure_;
        failure_ = nullptr;
        std::rethrow_exception(failure);
    }
}

void BurstLoopRunner::run_bursts(uint64_t count) {
    for (uint64_t i = 0; i < count && !stop_requested_.load(); ++i) {
        auto burst_start = std::chrono::steady_clock::now();
        run_one();
        throttle(burst_start);
    }
}

void BurstLoopRunner::loop() {
    spdlog::debug("Burst loop thread started");
    try {
        while (!stop_requested_.load()) {
            if (max_bursts_ > 0 && bursts_run_.load() >= max_bursts_) {
                break;
            }
            auto burst_start = std::chrono::steady_clock::now();
            run_one();
            throttle(burst_start);
        }
    } catch (const std::exception& e) {
        spdlog::error("Burst loop aborted at burst {}: {}", engine_.burst_count(), e.what());
        failure_ = std::current_exception();
    }
    running_.store(false);
    spdlog::debug("Burst loop thread stopped");
}

void BurstLoopRunner::run_one() {
    BurstReport report = engine_.advance_burst();
    bursts_run_.fetch_add(1);

    for (const BurstError& error : report.errors) {
        SPDLOG_DEBUG("Burst {} {} error: {}", report.index, burst_error_kind_name(error.kind), error.message);
    }

    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        if (callback_) {
            callback_(report);
        }
    }

    auto now = std::chrono::steady_clock::now();
    if (now - last_perf_log_ >= std::chrono::seconds(1)) {
        spdlog::info("Performance: {:.1f} bursts/s, burst {} fired {} neurons in {:.1f} us",
                     engine_.current_rate_hz(), report.index, report.fired_count, report.timing.total_us);
        last_perf_log_ = now;
    }
}

void BurstLoopRunner::throttle(std::chrono::steady_clock::time_point burst_start) const {
    if (period_.count() == 0) {
        return;
    }
    auto deadline = burst_start + period_;
    if (std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_until(deadline);
    }
}

} // namespace cortexlib
