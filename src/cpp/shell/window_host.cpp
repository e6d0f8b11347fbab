#include "thoughts_shell/window_host.h"
#include <iostream>

namespace thoughts_shell {

HeadlessWindowHost::HeadlessWindowHost(bool overlay_visible)
    : overlay_visible_(overlay_visible)
{
}

bool HeadlessWindowHost::has_window(const std::string& label) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (label == MAIN_WINDOW) return main_open_;
    return label == OVERLAY_WINDOW;  // The overlay exists for the app's lifetime
}

void HeadlessWindowHost::create_main_window() {
    std::lock_guard<std::mutex> lock(mutex_);
    main_open_ = true;
    std::cout << "[Window] Opened main window" << std::endl;
}

void HeadlessWindowHost::close_window(const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (label == MAIN_WINDOW && main_open_) {
        main_open_ = false;
        std::cout << "[Window] Closed main window" << std::endl;
    }
}

bool HeadlessWindowHost::is_visible(const std::string& label) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (label == MAIN_WINDOW) return main_open_;
    if (label == OVERLAY_WINDOW) return overlay_visible_;
    return false;
}

void HeadlessWindowHost::show(const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (label == OVERLAY_WINDOW) {
        overlay_visible_ = true;
        std::cout << "[Window] Overlay shown" << std::endl;
    }
}

void HeadlessWindowHost::hide(const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (label == OVERLAY_WINDOW) {
        overlay_visible_ = false;
        std::cout << "[Window] Overlay hidden" << std::endl;
    }
}

void HeadlessWindowHost::focus(const std::string& label) {
    (void)label;
}

void HeadlessWindowHost::set_always_on_top(const std::string& label, bool on_top) {
    (void)label;
    (void)on_top;
}

std::unique_ptr<WindowHost> create_window_host(bool overlay_visible) {
    return std::make_unique<HeadlessWindowHost>(overlay_visible);
}

} // namespace thoughts_shell
