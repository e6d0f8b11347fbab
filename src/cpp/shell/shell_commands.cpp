#include "thoughts_shell/shell_commands.h"

namespace thoughts_shell {

ShellCommands::ShellCommands(WindowHost& windows, bool dev_mode)
    : windows_(windows)
    , dev_mode_(dev_mode)
{
}

void ShellCommands::open_main_window() {
    // Recreate to avoid showing stale data
    if (windows_.has_window(MAIN_WINDOW)) {
        windows_.close_window(MAIN_WINDOW);
    }
    windows_.create_main_window();
    windows_.focus(MAIN_WINDOW);
}

void ShellCommands::close_overlay() {
    windows_.hide(OVERLAY_WINDOW);
}

void ShellCommands::toggle_overlay() {
    if (windows_.is_visible(OVERLAY_WINDOW)) {
        windows_.hide(OVERLAY_WINDOW);
    } else {
        windows_.show(OVERLAY_WINDOW);
        windows_.focus(OVERLAY_WINDOW);
        windows_.set_always_on_top(OVERLAY_WINDOW, true);
    }
}

void ShellCommands::on_overlay_focus_changed(bool focused) {
    if (!focused && !dev_mode_) {
        windows_.hide(OVERLAY_WINDOW);
    }
}

bool ShellCommands::toggle_record_mode() {
    std::lock_guard<std::mutex> lock(record_mutex_);
    record_mode_ = !record_mode_;
    return record_mode_;
}

bool ShellCommands::record_mode() const {
    std::lock_guard<std::mutex> lock(record_mutex_);
    return record_mode_;
}

} // namespace thoughts_shell
