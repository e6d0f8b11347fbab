#include "thoughts_shell/platform/tray_interface.h"
#include "thoughts_shell/platform/headless_tray.h"

namespace thoughts_shell {

std::unique_ptr<TrayInterface> create_tray() {
#if defined(__linux__) || defined(__APPLE__)
    return std::make_unique<HeadlessTray>();
#else
    #error "Unsupported platform"
#endif
}

} // namespace thoughts_shell
