#include "sweep_runner.hpp"
#include "arqsim/logging.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <map>
#include <stdexcept>
#include <thread>
#include <utility>

namespace arqsim {
namespace sim {

namespace {

struct Job {
    uint64_t window_size;
    uint64_t frame_payload;
    uint32_t run;
};

} // namespace

SweepRunner::SweepRunner(const SweepConfig& config)
    : config_(config)
{
    for (uint64_t w : config_.window_sizes) {
        if (w == 0) throw std::logic_error("SweepRunner: window size must be >= 1");
    }
    for (uint64_t l : config_.frame_payloads) {
        if (l == 0) throw std::logic_error("SweepRunner: frame payload must be >= 1 byte");
    }
    if (config_.base.file_size_bytes == 0) {
        throw std::logic_error("SweepRunner: file size must be >= 1 byte");
    }
}

size_t SweepRunner::totalJobs() const {
    return config_.window_sizes.size() * config_.frame_payloads.size() *
           config_.runs_per_config;
}

unsigned SweepRunner::workerCount() const {
    if (config_.workers > 0) {
        return config_.workers;
    }
    unsigned hw = std::thread::hardware_concurrency();
    return hw > 1 ? hw - 1 : 1;
}

std::vector<SweepResult> SweepRunner::run() {
    std::vector<Job> jobs;
    jobs.reserve(totalJobs());
    for (uint64_t w : config_.window_sizes) {
        for (uint64_t l : config_.frame_payloads) {
            for (uint32_t r = 0; r < config_.runs_per_config; r++) {
                jobs.push_back(Job{w, l, r});
            }
        }
    }

    std::vector<SweepResult> rows(jobs.size());
    std::vector<char> finished(jobs.size(), 0);
    std::atomic<size_t> next_job{0};
    std::atomic<size_t> completed{0};

    const unsigned workers = std::min<unsigned>(workerCount(),
                                                std::max<size_t>(1, jobs.size()));

    LOG_SIM(INFO, "Sweep: %zu windows x %zu payloads x %u runs = %zu jobs on %u workers",
            config_.window_sizes.size(), config_.frame_payloads.size(),
            config_.runs_per_config, jobs.size(), workers);

    auto worker = [&]() {
        while (!cancelled_) {
            size_t i = next_job.fetch_add(1);
            if (i >= jobs.size()) {
                break;
            }

            const Job& job = jobs[i];
            SweepOptions opts = config_.base;
            opts.seed = config_.base.seed + job.run;

            ArqResult r = simulateArq(job.window_size, job.frame_payload, opts);

            SweepResult& row = rows[i];
            row.window_size = job.window_size;
            row.frame_payload = job.frame_payload;
            row.run = job.run;
            row.goodput_bps = r.goodput_bps;
            row.retransmissions = r.retransmissions;
            row.time_seconds = r.time_seconds;
            computeDerivedMetrics(row, opts.physical.bit_rate, r.frames);
            finished[i] = 1;

            size_t done = completed.fetch_add(1) + 1;
            if (on_progress_) {
                on_progress_(done, jobs.size());
            }
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (unsigned t = 0; t < workers; t++) {
        pool.emplace_back(worker);
    }
    for (auto& th : pool) {
        th.join();
    }

    if (cancelled_) {
        std::vector<SweepResult> partial;
        for (size_t i = 0; i < rows.size(); i++) {
            if (finished[i]) {
                partial.push_back(rows[i]);
            }
        }
        LOG_SIM(INFO, "Sweep cancelled after %zu/%zu jobs", partial.size(), jobs.size());
        return partial;
    }

    LOG_SIM(INFO, "Sweep complete: %zu rows", rows.size());
    return rows;
}

void computeDerivedMetrics(SweepResult& row, double bit_rate, uint64_t frames) {
    row.efficiency = bit_rate > 0.0 ? row.goodput_bps / bit_rate : 0.0;
    uint64_t sent = frames + row.retransmissions;
    row.retransmission_rate = sent > 0 ? static_cast<double>(row.retransmissions) / sent : 0.0;
}

std::vector<SweepResult> averageResults(const std::vector<SweepResult>& rows) {
    struct Acc {
        double goodput = 0.0;
        double retransmissions = 0.0;
        double time = 0.0;
        double efficiency = 0.0;
        double retransmission_rate = 0.0;
        uint32_t count = 0;
    };

    // Keep first-seen order of (window, payload) pairs
    std::vector<std::pair<uint64_t, uint64_t>> order;
    std::map<std::pair<uint64_t, uint64_t>, Acc> acc;

    for (const auto& row : rows) {
        auto key = std::make_pair(row.window_size, row.frame_payload);
        auto it = acc.find(key);
        if (it == acc.end()) {
            order.push_back(key);
            it = acc.emplace(key, Acc{}).first;
        }
        it->second.goodput += row.goodput_bps;
        it->second.retransmissions += static_cast<double>(row.retransmissions);
        it->second.time += row.time_seconds;
        it->second.efficiency += row.efficiency;
        it->second.retransmission_rate += row.retransmission_rate;
        it->second.count++;
    }

    std::vector<SweepResult> out;
    out.reserve(order.size());
    for (const auto& key : order) {
        const Acc& a = acc[key];
        SweepResult r;
        r.window_size = key.first;
        r.frame_payload = key.second;
        r.run = a.count;
        r.goodput_bps = a.goodput / a.count;
        r.retransmissions = static_cast<uint64_t>(a.retransmissions / a.count + 0.5);
        r.time_seconds = a.time / a.count;
        r.efficiency = a.efficiency / a.count;
        r.retransmission_rate = a.retransmission_rate / a.count;
        out.push_back(r);
    }
    return out;
}

void writeCsv(const std::string& path, const std::vector<SweepResult>& rows) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open " + path + " for writing");
    }

    file << "window_size,frame_payload,run,goodput_mbps,retransmissions,time_seconds\n";
    file << std::fixed;
    for (const auto& row : rows) {
        file << row.window_size << ','
             << row.frame_payload << ','
             << row.run << ','
             << std::setprecision(6) << row.goodput_bps / 1e6 << ','
             << row.retransmissions << ','
             << std::setprecision(6) << row.time_seconds << '\n';
    }

    if (!file) {
        throw std::runtime_error("write to " + path + " failed");
    }
    LOG_SIM(INFO, "Wrote %zu rows to %s", rows.size(), path.c_str());
}

void renderProgressBar(size_t done, size_t total, int width) {
    double frac = total > 0 ? static_cast<double>(done) / total : 1.0;
    int filled = static_cast<int>(frac * width);

    std::fputc('\r', stderr);
    std::fputc('[', stderr);
    for (int i = 0; i < width; i++) {
        if (i < filled) {
            std::fputc('=', stderr);
        } else if (i == filled) {
            std::fputc('>', stderr);
        } else {
            std::fputc(' ', stderr);
        }
    }
    std::fprintf(stderr, "] %3d%% (%zu/%zu)", static_cast<int>(frac * 100.0), done, total);
    if (done >= total) {
        std::fputc('\n', stderr);
    }
    std::fflush(stderr);
}

} // namespace sim
} // namespace arqsim
