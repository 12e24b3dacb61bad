#include "command_line.hpp"
#include "globalvar.hpp"
#include <stdexcept>

namespace rexbind {
namespace command_line {

CommandLine parse_args(int argc, const char* const argv[]) {
    CommandLine cl;
    bool options_done = false;
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (options_done) {
            cl.positional.push_back(arg);
        } else if (arg == "--") {
            options_done = true;
        } else if (arg == "--offset" && i + 1 < argc) {
            std::string value = argv[++i];
            if (value.empty() || value.size() > 18 ||
                value.find_first_not_of("0123456789") != std::string::npos) {
                throw std::invalid_argument("invalid offset \"" + value + "\"");
            }
            cl.offset = std::stoull(value);
        } else if (arg == "--db" && i + 1 < argc) {
            cl.db_path = argv[++i];
        } else if (arg == "--literal") {
            cl.literal = true;
        } else if (arg == "--debug") {
            globalvar::set_debug_mode(true);
        } else if (auto opt = options::flag_to_option(arg)) {
            cl.compile_options |= *opt;
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw std::invalid_argument("unknown option: " + arg);
        } else {
            cl.positional.push_back(arg);
        }
    }
    return cl;
}

} // namespace command_line
} // namespace rexbind
