#pragma once

#include "imgui.h"

namespace arqsim {
namespace gui {

class ControlsWidget {
public:
    enum class Action {
        NONE,
        RUN_SINGLE,
        RUN_BATCH,
        STOP,
    };

    Action render(bool running);
};

} // namespace gui
} // namespace arqsim
