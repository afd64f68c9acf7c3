/**
 * arqsim CLI - Selective Repeat ARQ over a Gilbert-Elliot channel
 *
 * Closed-form runs and sweeps for throughput curves, the event-driven
 * transfer for end-to-end checks, and raw channel statistics.
 */

#include "arqsim/logging.hpp"
#include "arqsim/types.hpp"
#include "channel/error_model.hpp"
#include "sim/sim_settings.hpp"
#include "sim/sweep_runner.hpp"
#include "sim/sweep_simulator.hpp"
#include "sim/transfer.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <random>
#include <string>
#include <thread>

using namespace arqsim;
using namespace arqsim::sim;

// Signal handling for clean shutdown
static std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

void printUsage(const char* prog) {
    std::cerr << "arqsim - Selective Repeat ARQ simulator\n\n";
    std::cerr << "Usage: " << prog << " [options] <command>\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  run             One closed-form run (needs -w, -l)\n";
    std::cerr << "  sweep           Window x payload sweep, written as CSV\n";
    std::cerr << "  transfer        Event-driven end-to-end transfer (needs -w, -l)\n";
    std::cerr << "  channel         Error model statistics\n";
    std::cerr << "  info            Show the active configuration\n";
    std::cerr << "\nOptions:\n";
    std::cerr << "  -c <file>       Settings file (default: $ARQSIM_CONFIG or ~/.config/arqsim/settings.ini)\n";
    std::cerr << "  -w <n>          Window size\n";
    std::cerr << "  -l <bytes>      Frame payload size\n";
    std::cerr << "  -s <seed>       Random seed (default: 42)\n";
    std::cerr << "  -m <model>      Error model: jump_ahead, bit_loop\n";
    std::cerr << "  -n <bytes>      Transfer size (default: file_size_bytes)\n";
    std::cerr << "  -o <file>       CSV output for sweep\n";
    std::cerr << "  -r <runs>       Runs per configuration for sweep\n";
    std::cerr << "  -j <workers>    Sweep worker threads (0 = auto)\n";
    std::cerr << "  -a              Sweep: also print per-configuration averages\n";
    std::cerr << "  -b <bits>       Channel: total bits to push through (default: 100000000)\n";
    std::cerr << "  -f <bits>       Channel: frame size in bits (default: 8384)\n";
    std::cerr << "  --save          Write the effective settings back to the settings file\n";
    std::cerr << "  -v              More logging (-v debug, -vv trace)\n";
    std::cerr << "  -q              Errors only\n";
    std::cerr << "\nExamples:\n";
    std::cerr << "  " << prog << " run -w 16 -l 1024\n";
    std::cerr << "  " << prog << " sweep -r 5 -o results.csv\n";
    std::cerr << "  " << prog << " transfer -w 8 -l 512 -n 200000\n";
    std::cerr << "  " << prog << " channel -m bit_loop -b 20000000\n";
    std::cerr << "\n";
}

void printInfo(const SimSettings& s) {
    const PhysicalConfig& p = s.physical;
    const GilbertElliotParams& c = s.channel;

    std::cout << "=== arqsim ===\n\n";
    std::cout << "Physical layer:\n";
    std::cout << "  Bit rate:         " << p.bit_rate / 1e6 << " Mbps\n";
    std::cout << "  Forward delay:    " << p.forward_path_delay * 1e3 << " ms\n";
    std::cout << "  Reverse delay:    " << p.reverse_path_delay * 1e3 << " ms\n";
    std::cout << "  Processing:       " << p.processing_delay * 1e3 << " ms\n";
    std::cout << "  Frame overhead:   " << p.frame_overhead_bytes << " bytes\n";
    std::cout << "  Receiver buffer:  " << p.receiver_buffer_bytes / 1024 << " KiB\n";
    std::cout << "  Timer:            " << p.timeout_multiplier << " x RTT\n\n";

    std::cout << "Channel (Gilbert-Elliot, " << errorModelKindToString(s.error_model) << "):\n";
    std::cout << "  GOOD  BER " << c.good_ber << ", P(G->B) " << c.p_good_to_bad << "\n";
    std::cout << "  BAD   BER " << c.bad_ber << ", P(B->G) " << c.p_bad_to_good << "\n";
    std::cout << "  Stationary BAD fraction: " << std::fixed << std::setprecision(4)
              << c.stationaryBadFraction() << "\n\n";
    std::cout.unsetf(std::ios::fixed);

    std::cout << "Workload:\n";
    std::cout << "  File size:        " << s.file_size_bytes << " bytes\n";
    std::cout << "  Seed:             " << s.seed << "\n";
    std::cout << "  Sweep windows:    " << formatUintList(s.window_sizes) << "\n";
    std::cout << "  Sweep payloads:   " << formatUintList(s.frame_payloads) << "\n";
    std::cout << "  Runs per config:  " << s.runs_per_config << "\n";
    std::cout << "  Settings file:    " << SimSettings::getDefaultPath() << "\n";
}

// ============================================================================
// Commands
// ============================================================================

int runSingle(const SimSettings& settings, uint64_t window, uint64_t payload) {
    ArqResult r = simulateArq(window, payload, settings.sweepOptions());

    std::cout << std::fixed;
    std::cout << "W=" << window << " L=" << payload
              << "  goodput=" << std::setprecision(3) << r.goodput_bps / 1e6 << " Mbps"
              << "  retransmissions=" << r.retransmissions
              << "  time=" << std::setprecision(4) << r.time_seconds << " s"
              << "  efficiency=" << std::setprecision(1)
              << r.goodput_bps / settings.physical.bit_rate * 100.0 << "%"
              << "  (" << r.frames << " frames, " << r.transmissions << " sent)\n";
    return 0;
}

int runSweep(const SimSettings& settings, bool print_averages) {
    SweepRunner runner(settings.sweepConfig());

    std::mutex progress_mutex;
    runner.setProgressCallback([&](size_t done, size_t total) {
        if (!g_running) {
            runner.cancel();
        }
        std::lock_guard<std::mutex> lock(progress_mutex);
        if (getLogLevel() <= LogLevel::WARN) {
            renderProgressBar(done, total);
        }
    });

    auto rows = runner.run();
    if (runner.wasCancelled()) {
        std::cerr << "\nInterrupted; writing " << rows.size() << " completed rows\n";
    }

    writeCsv(settings.csv_path, rows);
    std::cout << "Wrote " << rows.size() << " rows to " << settings.csv_path << "\n";

    if (print_averages) {
        std::cout << "\n   W      L   goodput(Mbps)   eff(%)   retx  retx(%)    time(s)\n";
        for (const auto& a : averageResults(rows)) {
            std::printf("%4llu %6llu %15.3f %8.2f %6llu %8.2f %10.4f\n",
                        static_cast<unsigned long long>(a.window_size),
                        static_cast<unsigned long long>(a.frame_payload),
                        a.goodput_bps / 1e6,
                        a.efficiency * 100.0,
                        static_cast<unsigned long long>(a.retransmissions),
                        a.retransmission_rate * 100.0,
                        a.time_seconds);
        }
    }
    return runner.wasCancelled() ? 130 : 0;
}

int runTransferCommand(const SimSettings& settings, uint64_t window, uint64_t payload_size,
                       uint64_t total_bytes) {
    Bytes payload(total_bytes);
    std::mt19937 rng(static_cast<uint32_t>(settings.seed));
    std::uniform_int_distribution<int> byte_dist(0, 255);
    for (auto& b : payload) {
        b = static_cast<uint8_t>(byte_dist(rng));
    }

    Transfer transfer(static_cast<SeqNum>(window), payload_size, settings.transferOptions());

    // Ctrl-C stops the transfer
    std::atomic<bool> finished{false};
    std::thread watcher([&]() {
        while (!finished) {
            if (!g_running) {
                transfer.stop();
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    TransferResult r = transfer.run(payload);
    finished = true;
    watcher.join();

    std::cout << std::fixed;
    std::cout << "Transfer W=" << window << " L=" << payload_size << " (" << total_bytes << " bytes)\n";
    std::cout << "  Status:           " << (r.completed ? "complete" : "incomplete")
              << (r.timed_out ? " (budget exceeded)" : "") << "\n";
    std::cout << "  Payload intact:   " << (r.payload_intact ? "yes" : "no") << "\n";
    std::cout << "  Simulated time:   " << std::setprecision(4) << r.sim_time << " s\n";
    std::cout << "  Wall time:        " << std::setprecision(2) << r.wall_seconds << " s\n";
    std::cout << "  Goodput:          " << std::setprecision(3) << r.goodput_bps / 1e6 << " Mbps ("
              << std::setprecision(1) << r.goodput_bps / settings.physical.bit_rate * 100.0
              << "% of link)\n";
    std::cout << "  Retransmissions:  " << r.retransmissions
              << " (timeout " << r.link.retransmissions_timeout
              << ", SREJ " << r.link.retransmissions_nak << ")\n";
    std::cout << "  Receiver:         " << r.link.frames_delivered << " delivered, "
              << r.link.out_of_order << " out of order, "
              << r.link.duplicates << " duplicates, "
              << r.link.buffer_drops << " buffer drops, "
              << r.link.corrupted_received << " corrupted\n";
    std::cout << "  Forward channel:  " << std::setprecision(4) << r.forward.corruptionRate() * 100.0
              << "% frames corrupted, " << r.forward.badFraction() * 100.0 << "% bits in BAD\n";

    return r.completed && r.payload_intact ? 0 : 1;
}

int runChannel(const SimSettings& settings, uint64_t total_bits, uint64_t frame_bits) {
    if (frame_bits == 0) {
        std::cerr << "Frame size must be > 0 bits\n";
        return 1;
    }

    auto model = channel::createErrorModel(settings.error_model, settings.channel, settings.seed);
    uint64_t frames = total_bits / frame_bits;

    auto start = std::chrono::steady_clock::now();
    for (uint64_t i = 0; i < frames && g_running; i++) {
        model->transmit(frame_bits);
    }
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    const channel::ChannelStats& s = model->stats();
    std::cout << std::fixed;
    std::cout << "Model:              " << errorModelKindToString(model->kind()) << "\n";
    std::cout << "Frames x bits:      " << s.frames << " x " << frame_bits << "\n";
    std::cout << "Frame error rate:   " << std::setprecision(5) << s.corruptionRate() << "\n";
    std::cout << "BAD fraction:       " << s.badFraction()
              << " (stationary " << settings.channel.stationaryBadFraction() << ")\n";
    std::cout << "State transitions:  " << s.transitions << "\n";
    std::cout << "Elapsed:            " << std::setprecision(3) << elapsed << " s ("
              << std::setprecision(1) << (elapsed > 0 ? s.bits / elapsed / 1e6 : 0.0)
              << " Mbit/s simulated)\n";
    return 0;
}

// ============================================================================
// Main
// ============================================================================
int main(int argc, char* argv[]) {
    signal(SIGINT, signalHandler);

    sim::loadDotEnv();
    configureLoggingFromEnv();

    const char* command = nullptr;
    const char* settings_path = nullptr;
    const char* csv_path = nullptr;
    const char* model_name = nullptr;
    uint64_t window = 0;
    uint64_t payload = 0;
    uint64_t total_bytes = 0;
    uint64_t channel_bits = 100000000;
    uint64_t frame_bits = 8384;
    long long seed = -1;
    long long runs = -1;
    long long workers = -1;
    int verbosity = 0;
    bool quiet = false;
    bool averages = false;
    bool save = false;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
            settings_path = argv[++i];
        } else if (strcmp(argv[i], "-w") == 0 && i + 1 < argc) {
            window = std::strtoull(argv[++i], nullptr, 10);
        } else if (strcmp(argv[i], "-l") == 0 && i + 1 < argc) {
            payload = std::strtoull(argv[++i], nullptr, 10);
        } else if (strcmp(argv[i], "-s") == 0 && i + 1 < argc) {
            seed = std::strtoll(argv[++i], nullptr, 10);
        } else if (strcmp(argv[i], "-m") == 0 && i + 1 < argc) {
            model_name = argv[++i];
        } else if (strcmp(argv[i], "-n") == 0 && i + 1 < argc) {
            total_bytes = std::strtoull(argv[++i], nullptr, 10);
        } else if (strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
            csv_path = argv[++i];
        } else if (strcmp(argv[i], "-r") == 0 && i + 1 < argc) {
            runs = std::strtoll(argv[++i], nullptr, 10);
        } else if (strcmp(argv[i], "-j") == 0 && i + 1 < argc) {
            workers = std::strtoll(argv[++i], nullptr, 10);
        } else if (strcmp(argv[i], "-b") == 0 && i + 1 < argc) {
            channel_bits = std::strtoull(argv[++i], nullptr, 10);
        } else if (strcmp(argv[i], "-f") == 0 && i + 1 < argc) {
            frame_bits = std::strtoull(argv[++i], nullptr, 10);
        } else if (strcmp(argv[i], "-a") == 0) {
            averages = true;
        } else if (strcmp(argv[i], "--save") == 0) {
            save = true;
        } else if (strcmp(argv[i], "-vv") == 0) {
            verbosity += 2;
        } else if (strcmp(argv[i], "-v") == 0) {
            verbosity++;
        } else if (strcmp(argv[i], "-q") == 0) {
            quiet = true;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-') {
            if (!command) {
                command = argv[i];
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    if (!command) {
        printUsage(argv[0]);
        return 1;
    }

    SimSettings settings;
    std::string path = settings_path ? settings_path : SimSettings::getDefaultPath();
    if (!settings.load(path) && settings_path) {
        std::cerr << "Cannot read settings file: " << path << "\n";
        return 1;
    }

    // Settings file < environment < command line
    if (!std::getenv("ARQSIM_LOG")) {
        setLogLevel(parseLogLevel(settings.log_level, getLogLevel()));
    }
    if (verbosity == 1) setLogLevel(LogLevel::DEBUG);
    if (verbosity >= 2) setLogLevel(LogLevel::TRACE);
    if (quiet) setLogLevel(LogLevel::ERROR);

    if (seed >= 0) settings.seed = static_cast<uint64_t>(seed);
    if (model_name) settings.error_model = parseErrorModelKind(model_name);
    if (csv_path) settings.csv_path = csv_path;
    if (runs > 0) settings.runs_per_config = static_cast<uint32_t>(runs);
    if (workers >= 0) settings.workers = static_cast<unsigned>(workers);
    if (total_bytes == 0) total_bytes = settings.file_size_bytes;

    if (save && !settings.save(path)) {
        std::cerr << "Cannot write settings file: " << path << "\n";
        return 1;
    }

    try {
        if (strcmp(command, "info") == 0) {
            printInfo(settings);
            return 0;
        } else if (strcmp(command, "run") == 0) {
            if (window == 0 || payload == 0) {
                std::cerr << "run needs -w <window> and -l <payload>\n";
                return 1;
            }
            return runSingle(settings, window, payload);
        } else if (strcmp(command, "sweep") == 0) {
            return runSweep(settings, averages);
        } else if (strcmp(command, "transfer") == 0) {
            if (window == 0 || payload == 0) {
                std::cerr << "transfer needs -w <window> and -l <payload>\n";
                return 1;
            }
            return runTransferCommand(settings, window, payload, total_bytes);
        } else if (strcmp(command, "channel") == 0) {
            return runChannel(settings, channel_bits, frame_bits);
        } else {
            std::cerr << "Unknown command: " << command << "\n";
            printUsage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        LOG_APP(ERROR, "%s failed: %s", command, e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
