#ifndef CORTEXLIB_BURST_LOOP_RUNNER_H
#define CORTEXLIB_BURST_LOOP_RUNNER_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include "burst_engine.h"

namespace cortexlib {

// Drives a BurstEngine from a background thread, pulling sensory input from the
// engine's intake queue. The stop flag is only checked between bursts.
class BurstLoopRunner {
public:
    using ReportCallback = std::function<void(const BurstReport&)>;

    // frequency_hz of zero runs unthrottled; max_bursts of zero runs until stopped
    BurstLoopRunner(BurstEngine& engine, float frequency_hz, uint64_t max_bursts = 0);
    ~BurstLoopRunner();

    BurstLoopRunner(const BurstLoopRunner&) = delete;
    BurstLoopRunner& operator=(const BurstLoopRunner&) = delete;

    void set_report_callback(ReportCallback callback);

    void start();
    // Joins the loop thread; rethrows the exception that ended the loop, if any
    void stop();
    // Blocks until the burst limit is reached or stop() is called elsewhere
    void wait();

    // Runs count bursts on the calling thread with the same throttling
    void run_bursts(uint64_t count);

    bool is_running() const { return running_.load(); }
    uint64_t bursts_run() const { return bursts_run_.load(); }

private:
    void loop();
    void run_one();
    void throttle(std::chrono::steady_clock::time_point burst_start) const;

    BurstEngine& engine_;
    std::chrono::nanoseconds period_;
    uint64_t max_bursts_;

    std::thread thread_;
    std::atomic<bool> running_;
    std::atomic<bool> stop_requested_;
    std::atomic<uint64_t> bursts_run_;

    std::mutex callback_mutex_;
    ReportCallback callback_;
    std::exception_ptr failure_;
    std::chrono::steady_clock::time_point last_perf_log_;
};

} // namespace cortexlib

#endif // CORTEXLIB_BURST_LOOP_RUNNER_H
