#pragma once

#include "arqsim/types.hpp"
#include "sweep_runner.hpp"
#include "transfer.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace arqsim {
namespace sim {

// Settings that persist across sessions (INI file)
struct SimSettings {
    // Save/load to file ("" = default path)
    bool save(const std::string& path = "") const;
    bool load(const std::string& path = "");

    // ARQSIM_CONFIG, else ~/.config/arqsim/settings.ini, else ./settings.ini
    static std::string getDefaultPath();

    // Physical layer
    PhysicalConfig physical;

    // Channel
    GilbertElliotParams channel;
    ErrorModelKind error_model = ErrorModelKind::JUMP_AHEAD;

    // Workload
    uint64_t file_size_bytes = 1000000;
    uint64_t seed = 42;

    // Sweep
    std::vector<uint64_t> window_sizes{2, 4, 8, 16, 32, 64};
    std::vector<uint64_t> frame_payloads{128, 256, 512, 1024, 2048, 4096};
    uint32_t runs_per_config = 10;
    unsigned workers = 0;               // 0 = auto
    std::string csv_path = "results.csv";

    // Event-driven transfer
    double transfer_sim_budget_s = 300.0;
    double transfer_wall_budget_s = 60.0;

    // Logging
    std::string log_level = "warn";

    SweepOptions sweepOptions() const;
    SweepConfig sweepConfig() const;
    TransferOptions transferOptions() const;
};

// "2,4,8" -> {2,4,8}; empty or malformed entries are skipped
std::vector<uint64_t> parseUintList(const std::string& text);
std::string formatUintList(const std::vector<uint64_t>& values);

// Export KEY=VALUE lines of a .env file into the environment.
// Variables already set are left alone. Returns false if the file is missing.
bool loadDotEnv(const std::string& path = ".env");

} // namespace sim
} // namespace arqsim
