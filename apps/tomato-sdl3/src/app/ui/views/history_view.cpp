#include "history_view.hpp"

using namespace tomato;

namespace app::ui {

HistoryView::HistoryView(SharedContext &context)
    : m_context(context) {}

void HistoryView::Refresh() {
    const uint64 revision = m_context.session.HistoryRevision();
    if (m_revision == revision) {
        return;
    }
    m_revision = revision;

    m_entries = history::ComputeTomatoCounts(m_context.session.History());

    uint64 stored = 0;
    if (m_context.historyStore.IsOpen() && m_context.historyStore.Count(stored)) {
        m_storedCount = stored;
    } else {
        m_storedCount.reset();
    }
}

void HistoryView::Display() {
    Refresh();

    DisplayHeader();
    ImGui::Separator();
    DisplayTable();
}

void HistoryView::DisplayHeader() {
    if (m_storedCount) {
        ImGui::Text("%llu focus sessions recorded", static_cast<unsigned long long>(*m_storedCount));
    } else {
        ImGui::Text("%zu focus sessions this run", m_context.session.History().size());
    }

    ImGui::SameLine();
    ImGui::BeginDisabled(!m_context.historyStore.IsOpen());
    if (ImGui::SmallButton("Reload")) {
        if (!m_context.session.ReloadHistory()) {
            // Cache kept as is; recount the store on the next frame
            m_revision.reset();
        }
    }
    ImGui::EndDisabled();

    if (!m_context.historyError.empty()) {
        ImGui::TextColored(m_context.colors.notice, "History is not being saved: %s", m_context.historyError.c_str());
    }
}

void HistoryView::DisplayTable() {
    constexpr ImGuiTableFlags flags = ImGuiTableFlags_RowBg | ImGuiTableFlags_BordersInnerV |
                                      ImGuiTableFlags_SizingFixedFit | ImGuiTableFlags_ScrollY;

    if (ImGui::BeginTable("focus_history_table", 4, flags)) {
        ImGui::TableSetupColumn("Completed", ImGuiTableColumnFlags_WidthFixed, 190.0f * m_context.displayScale);
        ImGui::TableSetupColumn("Task", ImGuiTableColumnFlags_WidthStretch);
        ImGui::TableSetupColumn("Minutes", ImGuiTableColumnFlags_WidthFixed, 60.0f * m_context.displayScale);
        ImGui::TableSetupColumn("Tomatoes", ImGuiTableColumnFlags_WidthFixed, 70.0f * m_context.displayScale);
        ImGui::TableSetupScrollFreeze(0, 1);
        ImGui::TableHeadersRow();

        ImGuiListClipper clipper;
        clipper.Begin(static_cast<int>(m_entries.size()));
        while (clipper.Step()) {
            for (int i = clipper.DisplayStart; i < clipper.DisplayEnd; ++i) {
                const auto &entry = m_entries[i];

                ImGui::TableNextRow();
                if (ImGui::TableNextColumn()) {
                    ImGui::TextUnformatted(entry.record.completedAt.c_str());
                }
                if (ImGui::TableNextColumn()) {
                    if (entry.record.task.empty()) {
                        ImGui::TextDisabled("(no task)");
                    } else {
                        ImGui::TextUnformatted(entry.record.task.c_str());
                    }
                }
                if (ImGui::TableNextColumn()) {
                    ImGui::Text("%lld", static_cast<long long>(entry.record.durationSeconds / 60));
                }
                if (ImGui::TableNextColumn()) {
                    ImGui::TextColored(m_context.colors.focus, "%u", entry.cumulativeTomatoes);
                }
            }
        }

        ImGui::EndTable();
    }
}

} // namespace app::ui
