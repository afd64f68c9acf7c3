#include "status.hpp"

namespace arqsim {
namespace gui {

void StatusWidget::render(const std::string& message, float progress, bool running) {
    ImGui::Separator();

    ImVec4 color = running ? ImVec4(0.4f, 0.8f, 1.0f, 1.0f) : ImVec4(0.7f, 0.7f, 0.7f, 1.0f);
    if (message.rfind("Error", 0) == 0) {
        color = ImVec4(1.0f, 0.4f, 0.4f, 1.0f);
    }
    ImGui::TextColored(color, "%s", message.c_str());

    if (progress >= 0.0f) {
        ImGui::SameLine(ImGui::GetContentRegionAvail().x * 0.55f);
        ImGui::ProgressBar(progress, ImVec2(-1.0f, 0.0f));
    }
}

} // namespace gui
} // namespace arqsim
