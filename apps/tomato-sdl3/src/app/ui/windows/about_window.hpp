#pragma once

#include <app/ui/window_base.hpp>

namespace app::ui {

class AboutWindow : public WindowBase {
public:
    AboutWindow(SharedContext &context);

protected:
    void DrawContents() override;
};

} // namespace app::ui
