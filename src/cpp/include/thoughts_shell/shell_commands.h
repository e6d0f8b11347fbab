#pragma once

#include "window_host.h"

#include <mutex>

namespace thoughts_shell {

// UI commands invoked from the tray, the hotkey and the front end
class ShellCommands {
public:
    ShellCommands(WindowHost& windows, bool dev_mode);

    // Always replaces an existing main window with a fresh one
    void open_main_window();

    void close_overlay();

    // Hide if visible, otherwise show, focus and keep on top
    void toggle_overlay();

    // Outside dev mode the overlay hides when it loses focus
    void on_overlay_focus_changed(bool focused);

    // Returns the new state
    bool toggle_record_mode();
    bool record_mode() const;

private:
    WindowHost& windows_;
    bool dev_mode_;

    mutable std::mutex record_mutex_;
    bool record_mode_ = false;
};

} // namespace thoughts_shell
