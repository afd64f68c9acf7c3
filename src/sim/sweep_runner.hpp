#pragma once

#include "sweep_simulator.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace arqsim {
namespace sim {

// One row of a parameter sweep
struct SweepResult {
    uint64_t window_size = 0;
    uint64_t frame_payload = 0;
    uint32_t run = 0;
    double goodput_bps = 0.0;
    uint64_t retransmissions = 0;
    double time_seconds = 0.0;
    double efficiency = 0.0;            // goodput / raw bit rate
    double retransmission_rate = 0.0;   // retransmissions / data frames sent
};

// Fill efficiency and retransmission_rate; frames is the distinct frame count
void computeDerivedMetrics(SweepResult& row, double bit_rate, uint64_t frames);

struct SweepConfig {
    std::vector<uint64_t> window_sizes{2, 4, 8, 16, 32, 64};
    std::vector<uint64_t> frame_payloads{128, 256, 512, 1024, 2048, 4096};
    uint32_t runs_per_config = 10;
    unsigned workers = 0;           // 0 = hardware_concurrency - 1 (at least 1)
    SweepOptions base;              // base.seed + run seeds each run
};

/**
 * SweepRunner - window x payload x run cross product on a worker pool
 *
 * Each job is an independent simulateArq() call with seed = base.seed + run,
 * so results do not depend on the worker count or scheduling. Rows come
 * back in job order (window-major, then payload, then run).
 */
class SweepRunner {
public:
    // (completed jobs, total jobs), called from worker threads
    using ProgressCallback = std::function<void(size_t done, size_t total)>;

    // Throws std::logic_error for a zero window size, payload or file size
    explicit SweepRunner(const SweepConfig& config);

    void setProgressCallback(ProgressCallback cb) { on_progress_ = std::move(cb); }

    std::vector<SweepResult> run();

    // Thread-safe; unfinished jobs are skipped and left out of the result
    void cancel() { cancelled_ = true; }
    bool wasCancelled() const { return cancelled_; }

    size_t totalJobs() const;
    unsigned workerCount() const;

private:
    SweepConfig config_;
    ProgressCallback on_progress_;
    std::atomic<bool> cancelled_{false};
};

// Mean over runs for each (window, payload) pair; run field holds the run count.
// Efficiency and retransmission rate are averaged per run like the rest.
std::vector<SweepResult> averageResults(const std::vector<SweepResult>& rows);

// header: window_size,frame_payload,run,goodput_mbps,retransmissions,time_seconds
// Throws std::runtime_error if the file cannot be written
void writeCsv(const std::string& path, const std::vector<SweepResult>& rows);

// "[=====>    ]  42% (126/300)" on one line of stderr
void renderProgressBar(size_t done, size_t total, int width = 40);

} // namespace sim
} // namespace arqsim
