#pragma once

#include <memory>
#include <mutex>
#include <string>

namespace thoughts_shell {

// Window labels
constexpr const char* MAIN_WINDOW = "main";
constexpr const char* OVERLAY_WINDOW = "quick-panel";

// Abstract window host. Creation and styling of the actual windows
// belong to the embedding toolkit.
class WindowHost {
public:
    virtual ~WindowHost() = default;

    virtual bool has_window(const std::string& label) const = 0;
    virtual void create_main_window() = 0;
    virtual void close_window(const std::string& label) = 0;

    virtual bool is_visible(const std::string& label) const = 0;
    virtual void show(const std::string& label) = 0;
    virtual void hide(const std::string& label) = 0;
    virtual void focus(const std::string& label) = 0;
    virtual void set_always_on_top(const std::string& label, bool on_top) = 0;
};

// Tracks window state in memory and logs each request
class HeadlessWindowHost : public WindowHost {
public:
    explicit HeadlessWindowHost(bool overlay_visible = false);

    bool has_window(const std::string& label) const override;
    void create_main_window() override;
    void close_window(const std::string& label) override;

    bool is_visible(const std::string& label) const override;
    void show(const std::string& label) override;
    void hide(const std::string& label) override;
    void focus(const std::string& label) override;
    void set_always_on_top(const std::string& label, bool on_top) override;

private:
    mutable std::mutex mutex_;
    bool main_open_ = false;
    bool overlay_visible_;
};

std::unique_ptr<WindowHost> create_window_host(bool overlay_visible);

} // namespace thoughts_shell
