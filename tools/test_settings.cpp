// test_settings.cpp - Settings persistence, CSV export and logging config
//
// Writes scratch files under the system temp directory.

#include "sim/sim_settings.hpp"
#include "sim/sweep_runner.hpp"
#include "arqsim/logging.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace arqsim;
using namespace arqsim::sim;

namespace fs = std::filesystem;

static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name) \
    do { std::cout << "  Testing " << name << "... " << std::flush; tests_run++; } while(0)

#define PASS() \
    do { std::cout << "PASS\n"; tests_passed++; } while(0)

#define FAIL(msg) \
    do { std::cout << "FAIL: " << msg << "\n"; return false; } while(0)

static std::string scratchPath(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / "arqsim_test_settings";
    fs::create_directories(dir);
    return (dir / name).string();
}

static std::string readFile(const std::string& path) {
    std::ifstream in(path);
    std::string all, line;
    while (std::getline(in, line)) all += line + "\n";
    return all;
}

bool test_defaults() {
    TEST("Defaults match the reference channel and link");

    SimSettings s;
    if (s.physical.bit_rate != 10e6) FAIL("bit_rate");
    if (s.physical.forward_path_delay != 0.040) FAIL("forward delay");
    if (s.physical.reverse_path_delay != 0.010) FAIL("reverse delay");
    if (s.physical.processing_delay != 0.002) FAIL("processing delay");
    if (s.physical.frame_overhead_bytes != 24) FAIL("overhead");
    if (s.physical.receiver_buffer_bytes != 256 * 1024) FAIL("receiver buffer");
    if (s.channel.good_ber != 1e-6 || s.channel.bad_ber != 5e-3) FAIL("BERs");
    if (s.channel.p_good_to_bad != 0.002 || s.channel.p_bad_to_good != 0.05) FAIL("transitions");
    if (s.file_size_bytes != 1000000) FAIL("file size");
    if (s.window_sizes.size() != 6 || s.frame_payloads.size() != 6) FAIL("sweep grid");
    if (s.runs_per_config != 10) FAIL("runs");

    PASS();
    return true;
}

bool test_save_load_round_trip() {
    TEST("save() then load() restores every field");

    SimSettings a;
    a.physical.bit_rate = 2.5e6;
    a.physical.forward_path_delay = 0.123;
    a.physical.receiver_buffer_bytes = 65536;
    a.physical.timeout_multiplier = 3.0;
    a.channel.good_ber = 2e-7;
    a.channel.p_bad_to_good = 0.1;
    a.error_model = ErrorModelKind::BIT_LOOP;
    a.file_size_bytes = 4242;
    a.seed = 987654321;
    a.window_sizes = {1, 3, 5};
    a.frame_payloads = {100, 200};
    a.runs_per_config = 4;
    a.workers = 2;
    a.csv_path = "/tmp/out.csv";
    a.transfer_sim_budget_s = 12.5;
    a.transfer_wall_budget_s = 7.0;
    a.log_level = "debug";

    std::string path = scratchPath("round_trip.ini");
    if (!a.save(path)) FAIL("save failed");

    SimSettings b;
    if (!b.load(path)) FAIL("load failed");

    if (b.physical.bit_rate != 2.5e6) FAIL("bit_rate");
    if (b.physical.forward_path_delay != 0.123) FAIL("forward delay");
    if (b.physical.receiver_buffer_bytes != 65536) FAIL("receiver buffer");
    if (b.physical.timeout_multiplier != 3.0) FAIL("timeout multiplier");
    if (b.channel.good_ber != 2e-7) FAIL("good_ber");
    if (b.channel.p_bad_to_good != 0.1) FAIL("p_bad_to_good");
    if (b.error_model != ErrorModelKind::BIT_LOOP) FAIL("error model");
    if (b.file_size_bytes != 4242) FAIL("file size");
    if (b.seed != 987654321) FAIL("seed");
    if (b.window_sizes != std::vector<uint64_t>({1, 3, 5})) FAIL("window sizes");
    if (b.frame_payloads != std::vector<uint64_t>({100, 200})) FAIL("frame payloads");
    if (b.runs_per_config != 4 || b.workers != 2) FAIL("runs/workers");
    if (b.csv_path != "/tmp/out.csv") FAIL("csv path");
    if (b.transfer_sim_budget_s != 12.5 || b.transfer_wall_budget_s != 7.0) FAIL("budgets");
    if (b.log_level != "debug") FAIL("log level");

    SweepConfig cfg = b.sweepConfig();
    if (cfg.base.seed != 987654321 || cfg.base.file_size_bytes != 4242) FAIL("sweepConfig");
    TransferOptions topts = b.transferOptions();
    if (topts.error_model != ErrorModelKind::BIT_LOOP || topts.sim_time_budget_s != 12.5)
        FAIL("transferOptions");

    std::remove(path.c_str());

    PASS();
    return true;
}

bool test_full_width_seed() {
    TEST("64-bit seed survives save/load unchanged");

    SimSettings a;
    a.seed = 0xFEDCBA9876543210ULL;

    std::string path = scratchPath("wide_seed.ini");
    if (!a.save(path)) FAIL("save failed");

    SimSettings b;
    if (!b.load(path)) FAIL("load failed");
    if (b.seed != 0xFEDCBA9876543210ULL) FAIL("seed came back as " << b.seed);
    if (b.sweepConfig().base.seed != 0xFEDCBA9876543210ULL) FAIL("sweepConfig seed");
    if (b.transferOptions().seed != 0xFEDCBA9876543210ULL) FAIL("transferOptions seed");

    std::remove(path.c_str());

    PASS();
    return true;
}

bool test_load_tolerates_junk() {
    TEST("Comments, unknown keys and bad values");

    std::string path = scratchPath("junk.ini");
    {
        std::ofstream f(path);
        f << "# comment\n"
          << "; another\n"
          << "[Physical]\n"
          << "  bit_rate = 0\n"
          << "no_equals_here\n"
          << "unknown_key=5\n"
          << "[Sweep]\n"
          << "window_sizes=4, x, 16,\n"
          << "runs_per_config=0\n";
    }

    SimSettings s;
    if (!s.load(path)) FAIL("load failed");
    if (s.physical.bit_rate != 10e6) FAIL("non-positive bit_rate should fall back");
    if (s.window_sizes != std::vector<uint64_t>({4, 16})) FAIL("window list not cleaned");
    if (s.runs_per_config != 1) FAIL("runs_per_config 0 should become 1");

    std::remove(path.c_str());

    SimSettings missing;
    if (missing.load(scratchPath("does_not_exist.ini"))) FAIL("missing file reported as loaded");

    PASS();
    return true;
}

bool test_default_path_override() {
    TEST("ARQSIM_CONFIG overrides the default path");

    setenv("ARQSIM_CONFIG", "/tmp/custom_arqsim.ini", 1);
    std::string p = SimSettings::getDefaultPath();
    unsetenv("ARQSIM_CONFIG");

    if (p != "/tmp/custom_arqsim.ini") FAIL("got " << p);

    PASS();
    return true;
}

bool test_uint_list() {
    TEST("parseUintList / formatUintList");

    if (parseUintList("2,4,8") != std::vector<uint64_t>({2, 4, 8})) FAIL("simple list");
    if (parseUintList(" 1 , 2 ,, 3 ") != std::vector<uint64_t>({1, 2, 3})) FAIL("spaces/empties");
    if (!parseUintList("").empty()) FAIL("empty string");
    if (parseUintList("5,abc,7x,9") != std::vector<uint64_t>({5, 9})) FAIL("malformed entries");
    if (formatUintList({128, 256}) != "128,256") FAIL("format");

    PASS();
    return true;
}

bool test_dot_env() {
    TEST(".env values fill unset variables only");

    std::string path = scratchPath("test.env");
    {
        std::ofstream f(path);
        f << "# settings\n"
          << "ARQSIM_TEST_A=alpha\n"
          << "export ARQSIM_TEST_B=\"quoted value\"\n"
          << "ARQSIM_TEST_C=from_file\n";
    }
    unsetenv("ARQSIM_TEST_A");
    unsetenv("ARQSIM_TEST_B");
    setenv("ARQSIM_TEST_C", "from_env", 1);

    if (!loadDotEnv(path)) FAIL("loadDotEnv failed");

    const char* a = std::getenv("ARQSIM_TEST_A");
    const char* b = std::getenv("ARQSIM_TEST_B");
    const char* c = std::getenv("ARQSIM_TEST_C");
    if (!a || std::string(a) != "alpha") FAIL("A not set");
    if (!b || std::string(b) != "quoted value") FAIL("B quotes not stripped");
    if (!c || std::string(c) != "from_env") FAIL("C overwritten");

    if (loadDotEnv(scratchPath("missing.env"))) FAIL("missing .env reported as loaded");

    std::remove(path.c_str());

    PASS();
    return true;
}

bool test_csv_and_averages() {
    TEST("averageResults and writeCsv");

    std::vector<SweepResult> rows = {
        {4, 512, 0, 2.0e6, 10, 1.0},
        {4, 512, 1, 4.0e6, 20, 3.0},
        {8, 512, 0, 6.0e6, 5, 0.5},
    };

    for (auto& row : rows) {
        computeDerivedMetrics(row, 10e6, 30);
    }
    if (rows[0].efficiency != 0.2) FAIL("efficiency should be goodput / bit rate");
    if (rows[0].retransmission_rate != 0.25) FAIL("retransmission rate should be 10/40");

    std::vector<SweepResult> avg = averageResults(rows);
    if (avg.size() != 2) FAIL("expected 2 groups");
    if (avg[0].window_size != 4 || avg[0].run != 2) FAIL("first group wrong");
    if (avg[0].goodput_bps != 3.0e6 || avg[0].retransmissions != 15 || avg[0].time_seconds != 2.0)
        FAIL("first group averages wrong");
    if (std::abs(avg[0].efficiency - 0.3) > 1e-12) FAIL("efficiency not averaged");
    if (std::abs(avg[0].retransmission_rate - 0.5 * (0.25 + 0.4)) > 1e-12)
        FAIL("retransmission rate not averaged");
    computeDerivedMetrics(avg[1], 0.0, 0);
    if (avg[1].efficiency != 0.0) FAIL("zero bit rate should give zero efficiency");
    if (avg[1].window_size != 8 || avg[1].run != 1) FAIL("second group wrong");

    std::string path = scratchPath("results.csv");
    writeCsv(path, rows);
    std::string text = readFile(path);
    std::string header = "window_size,frame_payload,run,goodput_mbps,retransmissions,time_seconds\n";
    if (text.compare(0, header.size(), header) != 0) FAIL("header wrong");
    if (text.find("4,512,1,4.000000,20,3.000000\n") == std::string::npos) FAIL("row formatting");
    std::remove(path.c_str());

    bool threw = false;
    try {
        writeCsv("/nonexistent_dir_arqsim/x.csv", rows);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    if (!threw) FAIL("unwritable path should throw");

    PASS();
    return true;
}

bool test_log_levels() {
    TEST("Log level parsing and gating");

    if (parseLogLevel("TRACE") != LogLevel::TRACE) FAIL("TRACE");
    if (parseLogLevel("debug") != LogLevel::DEBUG) FAIL("debug");
    if (parseLogLevel("Info") != LogLevel::INFO) FAIL("Info");
    if (parseLogLevel("off") != LogLevel::OFF) FAIL("off");
    if (parseLogLevel("bogus", LogLevel::ERROR) != LogLevel::ERROR) FAIL("fallback");

    LogLevel saved = getLogLevel();
    setLogLevel(LogLevel::WARN);
    bool ok = isLogEnabled(LogLevel::ERROR) && isLogEnabled(LogLevel::WARN) &&
              !isLogEnabled(LogLevel::INFO);
    setLogLevel(saved);
    if (!ok) FAIL("gating wrong at WARN");

    PASS();
    return true;
}

int main() {
    std::cout << "=== Settings and Output Test Suite ===\n\n";

    std::cout << "Settings:\n";
    test_defaults();
    test_save_load_round_trip();
    test_full_width_seed();
    test_load_tolerates_junk();
    test_default_path_override();
    test_uint_list();
    test_dot_env();

    std::cout << "\nOutput:\n";
    test_csv_and_averages();
    test_log_levels();

    std::cout << "\n=== Results: " << tests_passed << "/" << tests_run << " tests passed ===\n";

    if (tests_passed == tests_run) {
        std::cout << "All tests PASSED!\n";
        return 0;
    } else {
        std::cout << "Some tests FAILED!\n";
        return 1;
    }
}
