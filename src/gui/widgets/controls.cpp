#include "controls.hpp"

namespace arqsim {
namespace gui {

ControlsWidget::Action ControlsWidget::render(bool running) {
    Action action = Action::NONE;
    const ImVec2 button(120.0f, 0.0f);

    ImGui::TextUnformatted("Controls");
    ImGui::Separator();

    ImGui::BeginDisabled(running);
    if (ImGui::Button("Run Single", button)) {
        action = Action::RUN_SINGLE;
    }
    if (ImGui::Button("Run Batch", button)) {
        action = Action::RUN_BATCH;
    }
    ImGui::EndDisabled();

    ImGui::BeginDisabled(!running);
    if (ImGui::Button("Stop", button)) {
        action = Action::STOP;
    }
    ImGui::EndDisabled();

    return action;
}

} // namespace gui
} // namespace arqsim
