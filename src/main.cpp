#include "command_line.hpp"
#include "diagnostics.hpp"
#include "globalvar.hpp"
#include "options.hpp"
#include "pattern_store.hpp"
#include "pcre2_regex.hpp"
#include "regexp.hpp"
#include "subject_reader.hpp"
#include "string_utils.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace rexbind;

// Exit statuses
static constexpr int exit_matched = 0;
static constexpr int exit_no_match = 1;
static constexpr int exit_error = 2;

static void print_usage() {
    std::cerr << "Usage:\n"
              << "  rexbind search <pattern> <file> [--offset N] [flags]\n"
              << "  rexbind match <pattern> <file> [--offset N] [flags]\n"
              << "  rexbind names <pattern> [flags]\n"
              << "  rexbind sub <pattern> <replacement> <file> [flags]\n"
              << "  rexbind store-add [--db <path>] <name> <pattern> <replacement> [--literal] [flags]\n"
              << "  rexbind store-list [--db <path>]\n"
              << "  rexbind store-remove [--db <path>] <name>\n"
              << "  rexbind store-apply [--db <path>] <file>\n"
              << "\nFlags:\n"
              << "  -i  ignore case        -m  multiline\n"
              << "  -s  dot matches newline -x  extended syntax\n"
              << "  -U  ungreedy           -u  UTF-8 mode\n"
              << "  --debug  print debug messages\n"
              << "  --       end of options; later arguments may start with \"-\"\n"
              << "\n<file> may be \"-\" for standard input; gzip files are read transparently.\n"
              << "Default store: $XDG_DATA_HOME/rexbind/" << globalvar::store_filename << "\n";
}

using command_line::CommandLine;

static void require_args(const CommandLine& cl, std::size_t count) {
    if (cl.positional.size() < count) {
        throw std::invalid_argument("missing arguments");
    }
    if (cl.positional.size() > count) {
        throw std::invalid_argument("extra argument \"" + cl.positional[count] + "\"");
    }
}

static std::string store_path(const CommandLine& cl) {
    return cl.db_path.empty() ? globalvar::get_default_store_path() : cl.db_path;
}

// "<index> <begin> <end> [name...]" per group
static void print_region(const pcre2_regex::CompiledPattern& pattern, const pcre2_regex::MatchRegion& region) {
    std::vector<std::vector<std::string>> names(region.size());
    for (const auto& item : pcre2_regex::list_names(pattern)) {
        names[static_cast<std::size_t>(item.second)].push_back(item.first);
    }
    for (std::size_t i = 0; i < region.size(); i++) {
        auto span = region.span(i);
        std::cout << i << " " << span.begin << " " << span.end;
        if (!names[i].empty()) {
            std::cout << " " << string_utils::make_printable(string_utils::join(names[i], ","));
        }
        std::cout << "\n";
    }
}

static int cmd_match(const CommandLine& cl, bool anchored) {
    require_args(cl, 2);
    auto pattern = pcre2_regex::compile(cl.positional[0], cl.compile_options);
    std::string subject = subject_reader::read_subject(cl.positional[1]);
    if (cl.offset > subject.size()) {
        throw std::invalid_argument("offset " + std::to_string(cl.offset) +
                                    " is past the end of the input (" + std::to_string(subject.size()) + " bytes)");
    }

    pcre2_regex::MatchRegion region(pattern);
    auto outcome = anchored
        ? pcre2_regex::match_at(pattern, subject, cl.offset, region)
        : pcre2_regex::search(pattern, subject, cl.offset, region);
    if (outcome == pcre2_regex::MatchOutcome::no_match) {
        return exit_no_match;
    }
    print_region(pattern, region);
    return exit_matched;
}

static int cmd_names(const CommandLine& cl) {
    require_args(cl, 1);
    auto pattern = pcre2_regex::compile(cl.positional[0], cl.compile_options);
    std::cout << "groups " << pattern.group_count() << "\n";
    for (const auto& item : pcre2_regex::list_names(pattern)) {
        std::cout << item.second << " " << string_utils::make_printable(item.first) << "\n";
    }
    return exit_matched;
}

static int cmd_sub(const CommandLine& cl) {
    require_args(cl, 3);
    Regexp re(cl.positional[0], cl.compile_options);
    std::string subject = subject_reader::read_subject(cl.positional[2]);
    std::cout << (cl.literal ? re.replace_all_literal(subject, cl.positional[1])
                             : re.replace_all(subject, cl.positional[1]));
    return exit_matched;
}

static int cmd_store_add(const CommandLine& cl) {
    require_args(cl, 3);
    std::string path = store_path(cl);
    auto store = pattern_store::PatternStore::open_or_create(path);

    pattern_store::Rule rule;
    rule.name = cl.positional[0];
    rule.pattern = cl.positional[1];
    rule.replacement = cl.positional[2];
    rule.compile_options = cl.compile_options;
    rule.is_regex = !cl.literal;
    store.add_rule(rule);
    return exit_matched;
}

static int cmd_store_list(const CommandLine& cl) {
    require_args(cl, 0);
    auto store = pattern_store::PatternStore::open(store_path(cl));
    for (const auto& rule : store.fetch_rules()) {
        std::cout << rule.position << " " << string_utils::make_printable(rule.name)
                  << " /" << string_utils::make_printable(rule.pattern) << "/"
                  << " -> \"" << string_utils::make_printable(rule.replacement) << "\""
                  << (rule.is_regex ? "" : " (literal)") << "\n";
    }
    return exit_matched;
}

static int cmd_store_remove(const CommandLine& cl) {
    require_args(cl, 1);
    auto store = pattern_store::PatternStore::open(store_path(cl));
    if (!store.remove_rule(cl.positional[0])) {
        diagnostics::warning("No rule named \"" + cl.positional[0] + "\"");
        return exit_no_match;
    }
    return exit_matched;
}

static int cmd_store_apply(const CommandLine& cl) {
    require_args(cl, 1);
    auto store = pattern_store::PatternStore::open(store_path(cl));
    std::string subject = subject_reader::read_subject(cl.positional[0]);
    auto result = store.apply_rules(subject);
    std::cout << result.first;
    return result.second > 0 ? exit_matched : exit_no_match;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return exit_error;
    }

    std::string subcommand = argv[1];
    if (subcommand == "--help" || subcommand == "-h") {
        print_usage();
        return exit_matched;
    }
    if (subcommand == "--version") {
        std::cout << "rexbind " << globalvar::rexbind_version << "\n";
        return exit_matched;
    }

    try {
        CommandLine cl = command_line::parse_args(argc, argv);
        if (subcommand == "search") {
            return cmd_match(cl, false);
        } else if (subcommand == "match") {
            return cmd_match(cl, true);
        } else if (subcommand == "names") {
            return cmd_names(cl);
        } else if (subcommand == "sub") {
            return cmd_sub(cl);
        } else if (subcommand == "store-add") {
            return cmd_store_add(cl);
        } else if (subcommand == "store-list") {
            return cmd_store_list(cl);
        } else if (subcommand == "store-remove") {
            return cmd_store_remove(cl);
        } else if (subcommand == "store-apply") {
            return cmd_store_apply(cl);
        }
        std::cerr << "Unknown subcommand: " << subcommand << "\n";
        print_usage();
        return exit_error;
    } catch (const pcre2_regex::compile_error& e) {
        diagnostics::error("bad pattern (code " + std::to_string(e.code()) + " at offset " +
                           std::to_string(e.offset()) + "): " + e.what());
    } catch (const pcre2_regex::regex_error& e) {
        diagnostics::error("engine failure (code " + std::to_string(e.code()) + "): " + e.what());
    } catch (const std::invalid_argument& e) {
        diagnostics::error(e.what());
        print_usage();
    } catch (const std::exception& e) {
        diagnostics::error(e.what());
    }
    return exit_error;
}
