#include "results.hpp"

namespace arqsim {
namespace gui {

void ResultsWidget::render(const std::vector<sim::SweepResult>& rows) {
    ImGui::TextUnformatted("Results");
    ImGui::SameLine();
    ImGui::TextDisabled("(%zu rows)", rows.size());
    ImGui::SameLine(ImGui::GetContentRegionAvail().x - 260.0f);
    ImGui::Checkbox("Averages", &show_averages_);
    ImGui::SameLine();
    if (ImGui::SmallButton("Export CSV")) {
        export_requested_ = true;
    }
    ImGui::SameLine();
    if (ImGui::SmallButton("Clear")) {
        clear_requested_ = true;
    }
    ImGui::Separator();

    const std::vector<sim::SweepResult> averaged =
        show_averages_ ? sim::averageResults(rows) : std::vector<sim::SweepResult>{};
    const std::vector<sim::SweepResult>& shown = show_averages_ ? averaged : rows;

    ImGuiTableFlags flags = ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg |
                            ImGuiTableFlags_ScrollY | ImGuiTableFlags_SizingStretchProp;
    ImVec2 size(0.0f, ImGui::GetContentRegionAvail().y - 40.0f);

    if (ImGui::BeginTable("results", 8, flags, size)) {
        ImGui::TableSetupScrollFreeze(0, 1);
        ImGui::TableSetupColumn("W");
        ImGui::TableSetupColumn("L (bytes)");
        ImGui::TableSetupColumn(show_averages_ ? "Runs" : "Run");
        ImGui::TableSetupColumn("Goodput (Mbps)");
        ImGui::TableSetupColumn("Efficiency");
        ImGui::TableSetupColumn("Retx");
        ImGui::TableSetupColumn("Retx rate");
        ImGui::TableSetupColumn("Time (s)");
        ImGui::TableHeadersRow();

        ImGuiListClipper clipper;
        clipper.Begin(static_cast<int>(shown.size()));
        while (clipper.Step()) {
            for (int i = clipper.DisplayStart; i < clipper.DisplayEnd; i++) {
                const auto& r = shown[i];
                ImGui::TableNextRow();
                ImGui::TableNextColumn();
                ImGui::Text("%llu", static_cast<unsigned long long>(r.window_size));
                ImGui::TableNextColumn();
                ImGui::Text("%llu", static_cast<unsigned long long>(r.frame_payload));
                ImGui::TableNextColumn();
                ImGui::Text("%u", r.run);
                ImGui::TableNextColumn();
                ImGui::Text("%.3f", r.goodput_bps / 1e6);
                ImGui::TableNextColumn();
                ImGui::Text("%.1f%%", r.efficiency * 100.0);
                ImGui::TableNextColumn();
                ImGui::Text("%llu", static_cast<unsigned long long>(r.retransmissions));
                ImGui::TableNextColumn();
                ImGui::Text("%.1f%%", r.retransmission_rate * 100.0);
                ImGui::TableNextColumn();
                ImGui::Text("%.4f", r.time_seconds);
            }
        }
        ImGui::EndTable();
    }
}

} // namespace gui
} // namespace arqsim
