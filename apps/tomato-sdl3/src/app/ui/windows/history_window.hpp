#pragma once

#include <app/ui/window_base.hpp>

#include <app/ui/views/history_view.hpp>

namespace app::ui {

class HistoryWindow : public WindowBase {
public:
    HistoryWindow(SharedContext &context);

protected:
    void PrepareWindow() override;
    void DrawContents() override;

private:
    HistoryView m_historyView;
};

} // namespace app::ui
