#pragma once
#include "options.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace rexbind {
namespace command_line {

// Arguments shared by every subcommand
struct CommandLine {
    std::vector<std::string> positional;
    CompileOption compile_options = CompileOption::none;
    std::size_t offset = 0;
    std::string db_path;
    bool literal = false;
};

// Parse argv[2..argc); argv[1] is the subcommand. "--" ends option parsing.
// Throws std::invalid_argument on unknown options or a malformed offset.
CommandLine parse_args(int argc, const char* const argv[]);

} // namespace command_line
} // namespace rexbind
