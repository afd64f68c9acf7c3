#include "app.hpp"
#include "arqsim/logging.hpp"
#include "sim/sweep_simulator.hpp"

#include "imgui.h"

#include <cstdio>
#include <exception>
#include <random>

namespace arqsim {
namespace gui {

App::App() : App(Options{}) {}

App::App(const Options& opts)
    : options_(opts)
{
    if (!settings_.load(options_.config_path)) {
        LOG_APP(INFO, "No settings file at %s, using defaults",
                options_.config_path.empty() ? sim::SimSettings::getDefaultPath().c_str()
                                             : options_.config_path.c_str());
    }
    params_.seed = settings_.seed;
    params_.error_model = static_cast<int>(settings_.error_model);
}

App::~App() {
    requestStop();
    joinWorker();

    settings_.seed = params_.seed;
    settings_.error_model = static_cast<ErrorModelKind>(params_.error_model);
    if (!settings_.save(options_.config_path)) {
        LOG_APP(WARN, "Could not save settings");
    }
}

void App::setStatus(const std::string& message, float progress) {
    std::lock_guard<std::mutex> lock(status_mutex_);
    status_text_ = message;
    progress_ = progress;
}

void App::joinWorker() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

// ============================================================================
// Actions
// ============================================================================

void App::startSingle() {
    if (running_) return;
    joinWorker();

    running_ = true;
    stop_requested_ = false;
    setStatus("Running simulation...", 0.0f);
    worker_ = std::thread(&App::runSingle, this, params_);
}

void App::startBatch() {
    if (running_) return;
    joinWorker();

    {
        std::lock_guard<std::mutex> lock(results_mutex_);
        results_.clear();
    }

    running_ = true;
    stop_requested_ = false;
    setStatus("Starting batch...", 0.0f);
    worker_ = std::thread(&App::runBatch, this, params_);
}

void App::requestStop() {
    stop_requested_ = true;

    std::lock_guard<std::mutex> lock(active_mutex_);
    if (active_sweep_) active_sweep_->cancel();
    if (active_transfer_) active_transfer_->stop();
    if (running_) setStatus("Stopping...", -1.0f);
}

void App::exportCsv() {
    std::vector<sim::SweepResult> rows;
    {
        std::lock_guard<std::mutex> lock(results_mutex_);
        rows = results_;
    }
    if (results_widget_.showAverages()) {
        rows = sim::averageResults(rows);
    }

    try {
        sim::writeCsv(settings_.csv_path, rows);
        setStatus("Exported " + std::to_string(rows.size()) + " rows to " + settings_.csv_path, -1.0f);
    } catch (const std::exception& e) {
        LOG_APP(ERROR, "CSV export failed: %s", e.what());
        setStatus(std::string("Error: ") + e.what(), -1.0f);
    }
}

// ============================================================================
// Worker thread
// ============================================================================

void App::runSingle(RunParameters params) {
    try {
        const uint64_t window = settings_.window_sizes.at(params.window_index);
        const uint64_t payload = settings_.frame_payloads.at(params.payload_index);

        sim::SweepResult row;
        row.window_size = window;
        row.frame_payload = payload;
        row.run = 0;

        if (params.event_driven) {
            sim::TransferOptions opts = settings_.transferOptions();
            opts.seed = params.seed;
            opts.error_model = static_cast<ErrorModelKind>(params.error_model);

            Bytes data(settings_.file_size_bytes);
            std::mt19937_64 rng(params.seed);
            std::uniform_int_distribution<int> byte_dist(0, 255);
            for (auto& b : data) {
                b = static_cast<uint8_t>(byte_dist(rng));
            }

            sim::Transfer transfer(static_cast<SeqNum>(window), payload, opts);
            {
                std::lock_guard<std::mutex> lock(active_mutex_);
                active_transfer_ = &transfer;
                if (stop_requested_) transfer.stop();
            }
            sim::TransferResult r = transfer.run(data);
            {
                std::lock_guard<std::mutex> lock(active_mutex_);
                active_transfer_ = nullptr;
            }

            row.goodput_bps = r.goodput_bps;
            row.retransmissions = r.retransmissions;
            row.time_seconds = r.sim_time;
            sim::computeDerivedMetrics(row, opts.physical.bit_rate, r.frames);

            if (!r.completed) {
                setStatus(stop_requested_ ? "Stopped" : "Transfer did not complete", -1.0f);
                running_ = false;
                return;
            }
        } else {
            sim::SweepOptions opts = settings_.sweepOptions();
            opts.seed = params.seed;
            opts.error_model = static_cast<ErrorModelKind>(params.error_model);

            sim::ArqResult r = sim::simulateArq(window, payload, opts);
            row.goodput_bps = r.goodput_bps;
            row.retransmissions = r.retransmissions;
            row.time_seconds = r.time_seconds;
            sim::computeDerivedMetrics(row, opts.physical.bit_rate, r.frames);
        }

        {
            std::lock_guard<std::mutex> lock(results_mutex_);
            results_.push_back(row);
        }
        setStatus("Complete", 1.0f);
    } catch (const std::exception& e) {
        LOG_APP(ERROR, "Simulation failed: %s", e.what());
        setStatus(std::string("Error: ") + e.what(), -1.0f);
    }
    running_ = false;
}

void App::runBatch(RunParameters params) {
    try {
        sim::SweepConfig cfg = settings_.sweepConfig();
        cfg.base.seed = params.seed;
        cfg.base.error_model = static_cast<ErrorModelKind>(params.error_model);

        sim::SweepRunner runner(cfg);
        runner.setProgressCallback([this](size_t done, size_t total) {
            char buf[64];
            std::snprintf(buf, sizeof(buf), "Run %zu/%zu", done, total);
            setStatus(buf, total > 0 ? static_cast<float>(done) / total : 1.0f);
        });

        setStatus("Starting batch (" + std::to_string(runner.workerCount()) + " workers)...", 0.0f);
        {
            std::lock_guard<std::mutex> lock(active_mutex_);
            active_sweep_ = &runner;
            if (stop_requested_) runner.cancel();
        }
        std::vector<sim::SweepResult> rows = runner.run();
        {
            std::lock_guard<std::mutex> lock(active_mutex_);
            active_sweep_ = nullptr;
        }

        {
            std::lock_guard<std::mutex> lock(results_mutex_);
            results_.insert(results_.end(), rows.begin(), rows.end());
        }
        setStatus(runner.wasCancelled() ? "Stopped" : "Batch complete",
                  runner.wasCancelled() ? -1.0f : 1.0f);
    } catch (const std::exception& e) {
        LOG_APP(ERROR, "Batch failed: %s", e.what());
        setStatus(std::string("Error: ") + e.what(), -1.0f);
    }
    running_ = false;
}

// ============================================================================
// Frame
// ============================================================================

void App::render() {
    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);

    ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
                             ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoSavedSettings;
    ImGui::Begin("ARQ Protocol Simulator", nullptr, flags);

    const bool running = running_;

    // Top row: parameters left, controls right
    ImGui::BeginChild("params", ImVec2(ImGui::GetContentRegionAvail().x * 0.6f, 170.0f));
    parameters_.render(params_, settings_.window_sizes, settings_.frame_payloads, running);
    ImGui::EndChild();

    ImGui::SameLine();

    ImGui::BeginChild("controls", ImVec2(0.0f, 170.0f));
    switch (controls_.render(running)) {
        case ControlsWidget::Action::RUN_SINGLE: startSingle(); break;
        case ControlsWidget::Action::RUN_BATCH:  startBatch(); break;
        case ControlsWidget::Action::STOP:       requestStop(); break;
        case ControlsWidget::Action::NONE:       break;
    }
    ImGui::EndChild();

    std::vector<sim::SweepResult> snapshot;
    {
        std::lock_guard<std::mutex> lock(results_mutex_);
        snapshot = results_;
    }
    results_widget_.render(snapshot);

    if (results_widget_.clearRequested() && !running) {
        std::lock_guard<std::mutex> lock(results_mutex_);
        results_.clear();
    }
    if (results_widget_.exportRequested()) {
        exportCsv();
    }

    std::string status;
    float progress;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        status = status_text_;
        progress = progress_;
    }
    status_.render(status, progress, running);

    ImGui::End();
}

} // namespace gui
} // namespace arqsim
