#pragma once

#include "tray_interface.h"

#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

namespace thoughts_shell {

// Tray without a GUI toolkit: logs menu and notifications, and dispatches
// menu items and the hotkey through trigger_* calls.
class HeadlessTray : public TrayInterface {
public:
    HeadlessTray();
    ~HeadlessTray() override;

    // TrayInterface implementation
    bool initialize(const std::string& app_name, const std::string& icon_path) override;
    void run() override;
    void stop() override;
    void set_menu(const Menu& menu) override;
    bool register_hotkey(const Hotkey& hotkey, std::function<void()> on_pressed) override;
    void show_notification(
        const std::string& title,
        const std::string& message,
        NotificationType type = NotificationType::INFO
    ) override;
    void set_log_level(const std::string& log_level) override;

    // Invoke the menu item with this id. Returns false if absent or disabled.
    bool trigger_menu_item(const std::string& id);
    // Simulate a press of the registered hotkey
    bool trigger_hotkey();

    bool is_running() const;

    // Messages shown so far, as "title: message"
    std::vector<std::string> notifications() const;

private:
    std::string app_name_;
    std::string icon_path_;
    std::string log_level_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    Menu menu_;
    Hotkey hotkey_;
    std::function<void()> hotkey_callback_;
    std::vector<std::string> notifications_;
    bool running_;
    bool should_exit_;
};

} // namespace thoughts_shell
