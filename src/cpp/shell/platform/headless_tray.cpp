#include "thoughts_shell/platform/headless_tray.h"
#include <iostream>

namespace thoughts_shell {

HeadlessTray::HeadlessTray()
    : log_level_("info")
    , running_(false)
    , should_exit_(false)
{
}

HeadlessTray::~HeadlessTray() {
    stop();
}

bool HeadlessTray::initialize(const std::string& app_name, const std::string& icon_path) {
    app_name_ = app_name;
    icon_path_ = icon_path;

    if (log_level_ == "debug") {
        std::cout << "DEBUG: [Tray] App name: " << app_name << std::endl;
        std::cout << "DEBUG: [Tray] Icon path: " << icon_path << std::endl;
    }
    return true;
}

void HeadlessTray::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    running_ = true;
    cv_.wait(lock, [this] { return should_exit_; });
    running_ = false;
}

void HeadlessTray::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        should_exit_ = true;
    }
    cv_.notify_all();
}

void HeadlessTray::set_menu(const Menu& menu) {
    std::lock_guard<std::mutex> lock(mutex_);
    menu_ = menu;

    if (log_level_ == "debug") {
        std::cout << "DEBUG: [Tray] Menu with " << menu.items.size() << " items:" << std::endl;
        for (const auto& item : menu.items) {
            if (item.is_separator) {
                std::cout << "DEBUG:   ----" << std::endl;
            } else {
                std::cout << "DEBUG:   " << item.text
                          << (item.accelerator.empty() ? "" : "  (" + item.accelerator + ")") << std::endl;
            }
        }
    }
}

bool HeadlessTray::register_hotkey(const Hotkey& hotkey, std::function<void()> on_pressed) {
    std::lock_guard<std::mutex> lock(mutex_);
    hotkey_ = hotkey;
    hotkey_callback_ = std::move(on_pressed);
    std::cout << "[Tray] Registered shortcut " << hotkey.label() << std::endl;
    return true;
}

void HeadlessTray::show_notification(
    const std::string& title,
    const std::string& message,
    NotificationType type)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        notifications_.push_back(title + ": " + message);
    }
    std::ostream& out = (type == NotificationType::ERROR) ? std::cerr : std::cout;
    out << "[" << app_name_ << "] " << title << ": " << message << std::endl;
}

void HeadlessTray::set_log_level(const std::string& log_level) {
    log_level_ = log_level;
}

bool HeadlessTray::trigger_menu_item(const std::string& id) {
    MenuCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& item : menu_.items) {
            if (!item.is_separator && item.id == id && item.enabled) {
                callback = item.callback;
                break;
            }
        }
    }

    // Callbacks may call stop(), so run them unlocked
    if (!callback) {
        return false;
    }
    callback();
    return true;
}

bool HeadlessTray::trigger_hotkey() {
    std::function<void()> callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = hotkey_callback_;
    }
    if (!callback) {
        return false;
    }
    callback();
    return true;
}

bool HeadlessTray::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

std::vector<std::string> HeadlessTray::notifications() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return notifications_;
}

} // namespace thoughts_shell
