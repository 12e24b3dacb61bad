#include "diagnostics.hpp"
#include "globalvar.hpp"
#include <iostream>
#include <mutex>
#include <utility>

namespace rexbind {
namespace diagnostics {

static std::mutex handler_mutex;
static MessageHandler warning_handler;

void warning(const std::string& message) {
    std::lock_guard<std::mutex> lock(handler_mutex);
    if (warning_handler) {
        warning_handler(message);
        return;
    }
    std::cerr << "[rexbind] Warning: " << message << "\n";
}

void error(const std::string& message) {
    std::cerr << "[rexbind] Error: " << message << "\n";
}

void debug(const std::string& message) {
    if (!globalvar::debug_mode()) return;
    std::cerr << "[Debug] " << message << "\n";
}

MessageHandler set_warning_handler(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex);
    std::swap(warning_handler, handler);
    return handler;
}

} // namespace diagnostics
} // namespace rexbind
