#pragma once

#include "arqsim/types.hpp"
#include "imgui.h"

#include <cstdint>
#include <vector>

namespace arqsim {
namespace gui {

// Values picked in the Parameters panel
struct RunParameters {
    int window_index = 3;        // Into the settings' window_sizes
    int payload_index = 3;       // Into the settings' frame_payloads
    uint64_t seed = 42;
    int error_model = 0;         // ErrorModelKind
    bool event_driven = false;   // Run Single: Transfer instead of the closed form
};

class ParametersWidget {
public:
    // Returns true if anything changed
    bool render(RunParameters& params,
                const std::vector<uint64_t>& window_sizes,
                const std::vector<uint64_t>& frame_payloads,
                bool running);
};

} // namespace gui
} // namespace arqsim
