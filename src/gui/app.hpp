#pragma once

#include "widgets/controls.hpp"
#include "widgets/parameters.hpp"
#include "widgets/results.hpp"
#include "widgets/status.hpp"
#include "sim/sim_settings.hpp"
#include "sim/sweep_runner.hpp"
#include "sim/transfer.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace arqsim {
namespace gui {

class App {
public:
    struct Options {
        std::string config_path = "";  // --config: Custom settings file
    };

    App();
    explicit App(const Options& opts);
    ~App();

    void render();

private:
    void startSingle();
    void startBatch();
    void requestStop();
    void exportCsv();

    // Worker thread bodies
    void runSingle(RunParameters params);
    void runBatch(RunParameters params);

    void setStatus(const std::string& message, float progress);
    void joinWorker();

    // Widgets
    ParametersWidget parameters_;
    ControlsWidget controls_;
    ResultsWidget results_widget_;
    StatusWidget status_;

    Options options_;
    sim::SimSettings settings_;
    RunParameters params_;

    // Background simulation
    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};

    // Stop targets owned by the worker while it runs
    std::mutex active_mutex_;
    sim::SweepRunner* active_sweep_ = nullptr;
    sim::Transfer* active_transfer_ = nullptr;

    // Shared with the worker
    std::mutex results_mutex_;
    std::vector<sim::SweepResult> results_;

    std::mutex status_mutex_;
    std::string status_text_ = "Ready";
    float progress_ = -1.0f;
};

} // namespace gui
} // namespace arqsim
