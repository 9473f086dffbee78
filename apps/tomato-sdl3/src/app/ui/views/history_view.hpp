#pragma once

#include <app/shared_context.hpp>

#include <tomato/history/tomato_count.hpp>

#include <optional>
#include <vector>

namespace app::ui {

class HistoryView {
public:
    explicit HistoryView(SharedContext &context);

    void Display();

private:
    SharedContext &m_context;

    std::vector<tomato::history::TomatoCountEntry> m_entries;
    std::optional<uint64> m_storedCount; // empty when the store could not be counted
    std::optional<uint64> m_revision;    // session history revision the caches were built from

    void Refresh();

    void DisplayHeader();
    void DisplayTable();
};

} // namespace app::ui
