#include "parameters.hpp"

#include <string>

namespace arqsim {
namespace gui {

namespace {

bool comboFromList(const char* label, int& index, const std::vector<uint64_t>& values,
                   const char* unit) {
    if (values.empty()) {
        ImGui::TextDisabled("%s: (none configured)", label);
        return false;
    }
    if (index < 0 || index >= static_cast<int>(values.size())) {
        index = 0;
    }

    bool changed = false;
    std::string preview = std::to_string(values[index]) + unit;
    if (ImGui::BeginCombo(label, preview.c_str())) {
        for (int i = 0; i < static_cast<int>(values.size()); i++) {
            std::string item = std::to_string(values[i]) + unit;
            bool selected = (i == index);
            if (ImGui::Selectable(item.c_str(), selected)) {
                index = i;
                changed = true;
            }
            if (selected) {
                ImGui::SetItemDefaultFocus();
            }
        }
        ImGui::EndCombo();
    }
    return changed;
}

} // namespace

bool ParametersWidget::render(RunParameters& params,
                              const std::vector<uint64_t>& window_sizes,
                              const std::vector<uint64_t>& frame_payloads,
                              bool running) {
    bool changed = false;

    ImGui::TextUnformatted("Parameters");
    ImGui::Separator();

    ImGui::BeginDisabled(running);
    ImGui::PushItemWidth(140.0f);

    changed |= comboFromList("Window size", params.window_index, window_sizes, "");
    changed |= comboFromList("Frame payload", params.payload_index, frame_payloads, " B");

    const uint64_t seed_step = 1;
    changed |= ImGui::InputScalar("Seed", ImGuiDataType_U64, &params.seed, &seed_step);

    const char* models[] = {"Jump-ahead", "Bit-loop"};
    changed |= ImGui::Combo("Error model", &params.error_model, models, IM_ARRAYSIZE(models));

    changed |= ImGui::Checkbox("Event-driven (Run Single)", &params.event_driven);
    if (ImGui::IsItemHovered()) {
        ImGui::SetTooltip("Run the full event loop with threads instead of the closed-form model");
    }

    ImGui::PopItemWidth();
    ImGui::EndDisabled();

    return changed;
}

} // namespace gui
} // namespace arqsim
