#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/vox-dispatch";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/vox-dispatch";
}

std::string data_dir() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg) return std::string(xdg) + "/vox-dispatch";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.local/share/vox-dispatch";
}

std::string cache_dir() {
    const char* xdg = std::getenv("XDG_CACHE_HOME");
    if (xdg) return std::string(xdg) + "/vox-dispatch";
    const char* home = std::getenv("HOME");
    if (!home) return "/tmp/vox-dispatch";
    return std::string(home) + "/.cache/vox-dispatch";
}

std::string resource_dir() {
    // <prefix>/bin/vox-dispatchd -> <prefix>/share/vox-dispatch
    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) return {};
    return (exe.parent_path().parent_path() / "share" / "vox-dispatch").string();
}

std::string ipc_endpoint() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg) return std::string(xdg) + "/vox-dispatch.sock";
    return "/tmp/vox-dispatch.sock";
}

} // namespace platform
