#include "sim_settings.hpp"
#include "arqsim/logging.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

#ifdef _WIN32
#include <direct.h>
#define MKDIR(path) _mkdir(path)
#else
#include <sys/stat.h>
#define MKDIR(path) mkdir(path, 0755)
#endif

namespace arqsim {
namespace sim {

std::string SimSettings::getDefaultPath() {
    // Explicit override (per-experiment configs)
    const char* config_override = std::getenv("ARQSIM_CONFIG");
    if (config_override && config_override[0] != '\0') {
        return std::string(config_override);
    }

#ifdef _WIN32
    const char* appdata = std::getenv("APPDATA");
    if (appdata) {
        return std::string(appdata) + "\\arqsim\\settings.ini";
    }
#else
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.config/arqsim/settings.ini";
    }
#endif
    return "settings.ini";
}

// Create parent directories of a file path
static void ensureDirectory(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    if (pos == std::string::npos) {
        return;
    }
    std::string dir = path.substr(0, pos);
    for (size_t i = 1; i < dir.size(); i++) {
        if (dir[i] == '/' || dir[i] == '\\') {
            MKDIR(dir.substr(0, i).c_str());
        }
    }
    MKDIR(dir.c_str());
}

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::vector<uint64_t> parseUintList(const std::string& text) {
    std::vector<uint64_t> out;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (item.empty()) continue;
        char* end = nullptr;
        unsigned long long v = std::strtoull(item.c_str(), &end, 10);
        if (end == item.c_str() || *end != '\0') continue;
        out.push_back(static_cast<uint64_t>(v));
    }
    return out;
}

std::string formatUintList(const std::vector<uint64_t>& values) {
    std::string out;
    for (size_t i = 0; i < values.size(); i++) {
        if (i > 0) out += ',';
        out += std::to_string(values[i]);
    }
    return out;
}

bool SimSettings::save(const std::string& path) const {
    std::string filepath = path.empty() ? getDefaultPath() : path;
    ensureDirectory(filepath);

    std::ofstream file(filepath);
    if (!file.is_open()) {
        LOG_APP(WARN, "Cannot write settings to %s", filepath.c_str());
        return false;
    }

    // Round-trip doubles exactly
    file.precision(17);

    file << "[Physical]\n";
    file << "bit_rate=" << physical.bit_rate << "\n";
    file << "forward_path_delay=" << physical.forward_path_delay << "\n";
    file << "reverse_path_delay=" << physical.reverse_path_delay << "\n";
    file << "processing_delay=" << physical.processing_delay << "\n";
    file << "frame_overhead_bytes=" << physical.frame_overhead_bytes << "\n";
    file << "receiver_buffer_bytes=" << physical.receiver_buffer_bytes << "\n";
    file << "timeout_multiplier=" << physical.timeout_multiplier << "\n";
    file << "sweep_timeout_margin=" << physical.sweep_timeout_margin << "\n";

    file << "\n[Channel]\n";
    file << "good_ber=" << channel.good_ber << "\n";
    file << "bad_ber=" << channel.bad_ber << "\n";
    file << "p_good_to_bad=" << channel.p_good_to_bad << "\n";
    file << "p_bad_to_good=" << channel.p_bad_to_good << "\n";
    file << "error_model=" << errorModelKindToString(error_model) << "\n";

    file << "\n[Workload]\n";
    file << "file_size_bytes=" << file_size_bytes << "\n";
    file << "seed=" << seed << "\n";

    file << "\n[Sweep]\n";
    file << "window_sizes=" << formatUintList(window_sizes) << "\n";
    file << "frame_payloads=" << formatUintList(frame_payloads) << "\n";
    file << "runs_per_config=" << runs_per_config << "\n";
    file << "workers=" << workers << "\n";
    file << "csv_path=" << csv_path << "\n";

    file << "\n[Transfer]\n";
    file << "sim_budget_s=" << transfer_sim_budget_s << "\n";
    file << "wall_budget_s=" << transfer_wall_budget_s << "\n";

    file << "\n[Logging]\n";
    file << "log_level=" << log_level << "\n";

    return static_cast<bool>(file);
}

bool SimSettings::load(const std::string& path) {
    std::string filepath = path.empty() ? getDefaultPath() : path;

    std::ifstream file(filepath);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        // Skip empty lines, comments and section headers
        if (line.empty() || line[0] == '#' || line[0] == ';' || line[0] == '[') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        const char* v = value.c_str();

        // Physical
        if (key == "bit_rate") {
            physical.bit_rate = std::strtod(v, nullptr);
        } else if (key == "forward_path_delay") {
            physical.forward_path_delay = std::strtod(v, nullptr);
        } else if (key == "reverse_path_delay") {
            physical.reverse_path_delay = std::strtod(v, nullptr);
        } else if (key == "processing_delay") {
            physical.processing_delay = std::strtod(v, nullptr);
        } else if (key == "frame_overhead_bytes") {
            physical.frame_overhead_bytes = static_cast<uint32_t>(std::strtoul(v, nullptr, 10));
        } else if (key == "receiver_buffer_bytes") {
            physical.receiver_buffer_bytes = static_cast<size_t>(std::strtoull(v, nullptr, 10));
        } else if (key == "timeout_multiplier") {
            physical.timeout_multiplier = std::strtod(v, nullptr);
        } else if (key == "sweep_timeout_margin") {
            physical.sweep_timeout_margin = std::strtod(v, nullptr);
        }
        // Channel
        else if (key == "good_ber") {
            channel.good_ber = std::strtod(v, nullptr);
        } else if (key == "bad_ber") {
            channel.bad_ber = std::strtod(v, nullptr);
        } else if (key == "p_good_to_bad") {
            channel.p_good_to_bad = std::strtod(v, nullptr);
        } else if (key == "p_bad_to_good") {
            channel.p_bad_to_good = std::strtod(v, nullptr);
        } else if (key == "error_model") {
            error_model = parseErrorModelKind(value);
        }
        // Workload
        else if (key == "file_size_bytes") {
            file_size_bytes = std::strtoull(v, nullptr, 10);
        } else if (key == "seed") {
            seed = std::strtoull(v, nullptr, 10);
        }
        // Sweep
        else if (key == "window_sizes") {
            auto list = parseUintList(value);
            if (!list.empty()) window_sizes = list;
        } else if (key == "frame_payloads") {
            auto list = parseUintList(value);
            if (!list.empty()) frame_payloads = list;
        } else if (key == "runs_per_config") {
            runs_per_config = static_cast<uint32_t>(std::strtoul(v, nullptr, 10));
        } else if (key == "workers") {
            workers = static_cast<unsigned>(std::strtoul(v, nullptr, 10));
        } else if (key == "csv_path") {
            csv_path = value;
        }
        // Transfer
        else if (key == "sim_budget_s") {
            transfer_sim_budget_s = std::strtod(v, nullptr);
        } else if (key == "wall_budget_s") {
            transfer_wall_budget_s = std::strtod(v, nullptr);
        }
        // Logging
        else if (key == "log_level") {
            log_level = value;
        }
    }

    // Out-of-range values fall back to defaults
    PhysicalConfig defaults;
    if (physical.bit_rate <= 0.0) physical.bit_rate = defaults.bit_rate;
    if (physical.timeout_multiplier <= 0.0) physical.timeout_multiplier = defaults.timeout_multiplier;
    if (physical.sweep_timeout_margin <= 0.0) physical.sweep_timeout_margin = defaults.sweep_timeout_margin;
    if (file_size_bytes == 0) file_size_bytes = 1000000;
    if (runs_per_config == 0) runs_per_config = 1;

    LOG_APP(DEBUG, "Loaded settings from %s", filepath.c_str());
    return true;
}

SweepOptions SimSettings::sweepOptions() const {
    SweepOptions opts;
    opts.physical = physical;
    opts.channel = channel;
    opts.error_model = error_model;
    opts.file_size_bytes = file_size_bytes;
    opts.seed = seed;
    return opts;
}

SweepConfig SimSettings::sweepConfig() const {
    SweepConfig cfg;
    cfg.window_sizes = window_sizes;
    cfg.frame_payloads = frame_payloads;
    cfg.runs_per_config = runs_per_config;
    cfg.workers = workers;
    cfg.base = sweepOptions();
    return cfg;
}

TransferOptions SimSettings::transferOptions() const {
    TransferOptions opts;
    opts.physical = physical;
    opts.channel = channel;
    opts.error_model = error_model;
    opts.seed = seed;
    opts.sim_time_budget_s = transfer_sim_budget_s;
    opts.wall_time_budget_s = transfer_wall_budget_s;
    return opts;
}

bool loadDotEnv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }
        if (key.empty() || std::getenv(key.c_str()) != nullptr) continue;

#ifdef _WIN32
        _putenv_s(key.c_str(), value.c_str());
#else
        setenv(key.c_str(), value.c_str(), 0);
#endif
    }
    return true;
}

} // namespace sim
} // namespace arqsim
