#include "globalvar.hpp"
#include <atomic>
#include <cstdlib>
#include <stdexcept>

namespace rexbind {
namespace globalvar {

// -1 = not overridden, otherwise 0 or 1
static std::atomic<int> debug_override{-1};

bool debug_mode() {
    int forced = debug_override.load();
    if (forced >= 0) return forced != 0;
    static const bool from_env = [] {
        const char* val = std::getenv(debug_env_name.c_str());
        return val != nullptr && val[0] != '\0' && std::string(val) != "0";
    }();
    return from_env;
}

void set_debug_mode(bool enabled) {
    debug_override.store(enabled ? 1 : 0);
}

std::string get_root_data_path() {
    // Try XDG_DATA_HOME first
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && xdg[0] != '\0') {
        return std::string(xdg) + "/rexbind";
    }
    // Fall back to HOME
    const char* home = std::getenv("HOME");
    if (home && home[0] == '/') {
        return std::string(home) + "/.local/share/rexbind";
    }
    throw std::runtime_error("unable to get your home directory or invalid home directory information; "
                             "please make sure that the $HOME environment variable is set correctly");
}

std::string get_default_store_path() {
    return get_root_data_path() + "/" + store_filename;
}

} // namespace globalvar
} // namespace rexbind
