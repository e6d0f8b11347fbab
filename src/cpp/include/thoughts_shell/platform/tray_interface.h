#pragma once

#include <string>
#include <vector>
#include <functional>
#include <memory>

namespace thoughts_shell {

// Forward declarations
struct MenuItem;
struct Menu;

// Notification types
enum class NotificationType {
    INFO,
    WARNING,
    ERROR
};

// Menu callback signature
using MenuCallback = std::function<void()>;

// Menu item structure
struct MenuItem {
    std::string id;
    std::string text;
    std::string accelerator;  // Shown next to the text, e.g. "Alt+Space"
    MenuCallback callback;
    bool enabled = true;
    bool is_separator = false;

    // Factory methods
    static MenuItem Separator() {
        MenuItem item;
        item.is_separator = true;
        return item;
    }

    static MenuItem Action(const std::string& id, const std::string& text, MenuCallback callback,
                           const std::string& accelerator = "") {
        MenuItem item;
        item.id = id;
        item.text = text;
        item.accelerator = accelerator;
        item.callback = callback;
        return item;
    }
};

// Menu structure
struct Menu {
    std::vector<MenuItem> items;

    void add_item(const MenuItem& item) {
        items.push_back(item);
    }

    void add_separator() {
        items.push_back(MenuItem::Separator());
    }
};

// Global shortcut
struct Hotkey {
    bool shift = false;
    bool alt = false;
    bool ctrl = false;
    std::string key = "Space";

    // Alt+Space, or Shift+Alt+Space in dev mode so a dev build can run
    // next to an installed one
    static Hotkey for_mode(bool dev_mode) {
        Hotkey hotkey;
        hotkey.alt = true;
        hotkey.shift = dev_mode;
        return hotkey;
    }

    std::string label() const {
        std::string result;
        if (ctrl) result += "Ctrl+";
        if (shift) result += "Shift+";
        if (alt) result += "Alt+";
        return result + key;
    }
};

// Abstract tray interface
class TrayInterface {
public:
    virtual ~TrayInterface() = default;

    // Lifecycle
    virtual bool initialize(const std::string& app_name, const std::string& icon_path) = 0;
    virtual void run() = 0;   // Blocks until stop()
    virtual void stop() = 0;

    // Menu management
    virtual void set_menu(const Menu& menu) = 0;

    // Global shortcut; callback runs on each press
    virtual bool register_hotkey(const Hotkey& hotkey, std::function<void()> on_pressed) = 0;

    // Notifications
    virtual void show_notification(
        const std::string& title,
        const std::string& message,
        NotificationType type = NotificationType::INFO
    ) = 0;

    // Set log level for debug logging
    virtual void set_log_level(const std::string& log_level) = 0;
};

// Factory function to create platform-specific tray
std::unique_ptr<TrayInterface> create_tray();

} // namespace thoughts_shell
