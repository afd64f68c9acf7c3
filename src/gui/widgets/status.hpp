#pragma once

#include "imgui.h"
#include <string>

namespace arqsim {
namespace gui {

class StatusWidget {
public:
    // progress in [0, 1]; negative hides the bar
    void render(const std::string& message, float progress, bool running);
};

} // namespace gui
} // namespace arqsim
