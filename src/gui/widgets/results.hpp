#pragma once

#include "sim/sweep_runner.hpp"
#include "imgui.h"

#include <vector>

namespace arqsim {
namespace gui {

// Result table: W, L, goodput, efficiency, retransmissions, time
class ResultsWidget {
public:
    void render(const std::vector<sim::SweepResult>& rows);

    bool showAverages() const { return show_averages_; }
    bool clearRequested() { bool r = clear_requested_; clear_requested_ = false; return r; }
    bool exportRequested() { bool r = export_requested_; export_requested_ = false; return r; }

private:
    bool show_averages_ = false;
    bool clear_requested_ = false;
    bool export_requested_ = false;
};

} // namespace gui
} // namespace arqsim
