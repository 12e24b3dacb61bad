#pragma once
#include <string>
#include <cstddef>

namespace rexbind {
namespace globalvar {

// Version info
inline const std::string rexbind_version = "1.2";

// Size of the buffer handed to pcre2_get_error_message
constexpr std::size_t error_message_size = 256;

// Pattern store file and table names
inline const std::string store_filename = "patterns.db";
inline const std::string store_rules_tablename = "rexbind_rules";
inline const std::string store_version_tablename = "rexbind_rules_version";
constexpr int store_version = 2;

// Environment variable that turns on debug diagnostics
inline const std::string debug_env_name = "REXBIND_DEBUG";

// Whether debug diagnostics are on (reads REXBIND_DEBUG once)
bool debug_mode();
// Override debug mode (used by the CLI --debug flag and tests)
void set_debug_mode(bool enabled);

// Get the root data path (e.g. ~/.local/share/rexbind)
// Throws std::runtime_error when neither XDG_DATA_HOME nor HOME is usable
std::string get_root_data_path();
// Default location of the pattern store
std::string get_default_store_path();

} // namespace globalvar
} // namespace rexbind
