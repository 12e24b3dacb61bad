#pragma once
#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rexbind {

// Compile-time flags. Each enumerator carries PCRE2's own bit so the value
// can be handed to pcre2_compile unchanged.
enum class CompileOption : uint32_t {
    none            = 0,
    ignore_case     = PCRE2_CASELESS,       // letters match both cases
    multiline       = PCRE2_MULTILINE,      // ^ and $ also match at internal newlines
    dot_all         = PCRE2_DOTALL,         // . also matches newline
    extended        = PCRE2_EXTENDED,       // free-spacing syntax with # comments
    ungreedy        = PCRE2_UNGREEDY,       // quantifiers are lazy unless followed by ?
    no_auto_capture = PCRE2_NO_AUTO_CAPTURE, // only named groups capture
    anchored        = PCRE2_ANCHORED,       // every match starts at the start offset
    dollar_endonly  = PCRE2_DOLLAR_ENDONLY, // $ only matches at the very end
    utf             = PCRE2_UTF,            // pattern and subjects are UTF-8
    ucp             = PCRE2_UCP,            // \d, \w and friends use Unicode properties
};

// Match-time flags, handed to pcre2_match unchanged.
enum class MatchOption : uint32_t {
    none              = 0,
    not_bol           = PCRE2_NOTBOL,          // subject start is not a line start
    not_eol           = PCRE2_NOTEOL,          // subject end is not a line end
    not_empty         = PCRE2_NOTEMPTY,        // empty matches are rejected
    not_empty_atstart = PCRE2_NOTEMPTY_ATSTART, // empty match at the start offset is rejected
    no_utf_check      = PCRE2_NO_UTF_CHECK,    // subject is known to be valid UTF-8
};

constexpr CompileOption operator|(CompileOption a, CompileOption b) {
    return static_cast<CompileOption>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}
constexpr CompileOption operator&(CompileOption a, CompileOption b) {
    return static_cast<CompileOption>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}
inline CompileOption& operator|=(CompileOption& a, CompileOption b) {
    return a = a | b;
}

constexpr MatchOption operator|(MatchOption a, MatchOption b) {
    return static_cast<MatchOption>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}
constexpr MatchOption operator&(MatchOption a, MatchOption b) {
    return static_cast<MatchOption>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}
inline MatchOption& operator|=(MatchOption& a, MatchOption b) {
    return a = a | b;
}

constexpr bool has_option(CompileOption set, CompileOption flag) {
    return (set & flag) == flag;
}
constexpr bool has_option(MatchOption set, MatchOption flag) {
    return (set & flag) == flag;
}

constexpr uint32_t to_bits(CompileOption o) { return static_cast<uint32_t>(o); }
constexpr uint32_t to_bits(MatchOption o) { return static_cast<uint32_t>(o); }

namespace options {

// Every compile option that may be stored or passed on the command line
constexpr uint32_t known_compile_bits =
    PCRE2_CASELESS | PCRE2_MULTILINE | PCRE2_DOTALL | PCRE2_EXTENDED |
    PCRE2_UNGREEDY | PCRE2_NO_AUTO_CAPTURE | PCRE2_ANCHORED |
    PCRE2_DOLLAR_ENDONLY | PCRE2_UTF | PCRE2_UCP;

// Short CLI flag -> compile option
inline const std::vector<std::pair<std::string, CompileOption>> flag_options = {
    {"-i", CompileOption::ignore_case},
    {"-m", CompileOption::multiline},
    {"-s", CompileOption::dot_all},
    {"-x", CompileOption::extended},
    {"-U", CompileOption::ungreedy},
    {"-u", CompileOption::utf},
};

// Look up a CLI flag
inline std::optional<CompileOption> flag_to_option(const std::string& flag) {
    for (const auto& item : flag_options) {
        if (item.first == flag) return item.second;
    }
    return std::nullopt;
}

// Rebuild an option set from stored bits; unknown bits yield nullopt
inline std::optional<CompileOption> compile_option_from_bits(uint32_t bits) {
    if ((bits & ~known_compile_bits) != 0) return std::nullopt;
    return static_cast<CompileOption>(bits);
}

} // namespace options
} // namespace rexbind
