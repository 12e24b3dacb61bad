#pragma once
#include <string>
#include <functional>

namespace rexbind {
namespace diagnostics {

using MessageHandler = std::function<void(const std::string&)>;

// "[rexbind] Warning: <message>" to stderr, or to the installed handler
void warning(const std::string& message);

// "[rexbind] Error: <message>" to stderr
void error(const std::string& message);

// "[Debug] <message>" to stderr; dropped unless globalvar::debug_mode()
void debug(const std::string& message);

// Redirect warnings; pass an empty handler to restore stderr output.
// Returns the previous handler.
MessageHandler set_warning_handler(MessageHandler handler);

} // namespace diagnostics
} // namespace rexbind
