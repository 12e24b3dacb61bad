#pragma once
#include "pcre2_regex.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rexbind {

using pcre2_regex::Span;

// A compiled pattern bundled with its own match region. All methods lock
// an internal mutex, so one Regexp can be shared between threads.
class Regexp {
public:
    // Throws pcre2_regex::compile_error
    explicit Regexp(std::string_view pattern, CompileOption options = CompileOption::none);

    Regexp(const Regexp&) = delete;
    Regexp& operator=(const Regexp&) = delete;

    const std::string& source() const;
    CompileOption options() const;
    int num_subexp() const;

    // Group names aligned with group numbers; "" for unnamed groups and
    // for group 0
    std::vector<std::string> subexp_names() const;

    // Underlying pattern for use with the low-level API
    const pcre2_regex::CompiledPattern& pattern() const { return pattern_; }

    bool match(std::string_view subject);

    std::optional<Span> find_index(std::string_view subject);
    std::optional<std::string> find(std::string_view subject);

    // Spans / text of every group from the first match; empty if none.
    // Groups that did not participate are unset / nullopt.
    std::vector<Span> find_submatch_index(std::string_view subject);
    std::vector<std::optional<std::string>> find_submatch(std::string_view subject);

    // Successive non-overlapping matches; limit < 0 means no limit
    std::vector<Span> find_all_index(std::string_view subject, int limit = -1);
    std::vector<std::string> find_all(std::string_view subject, int limit = -1);
    std::vector<std::vector<Span>> find_all_submatch_index(std::string_view subject, int limit = -1);

    // name -> captured text from the first match. A name shared by several
    // groups takes the highest-numbered one that participated (lookup_name).
    std::map<std::string, std::string> named_captures(std::string_view subject);

    // Replace every match. Replacement escapes: \0-\9, \k<name>,
    // \g<name>, \g<N>, \\, \n, \t
    std::string replace_all(std::string_view subject, std::string_view replacement);
    std::string replace_first(std::string_view subject, std::string_view replacement);
    std::string replace_all_literal(std::string_view subject, std::string_view replacement);
    // fn receives the matched text and returns its replacement; it runs
    // with the lock held and must not call back into this Regexp
    std::string replace_all_func(std::string_view subject,
                                 const std::function<std::string(std::string_view)>& fn);

    // Escape every regex metacharacter in text
    static std::string quote_meta(std::string_view text);

private:
    using Expander = std::function<void(std::string& out, std::string_view subject,
                                        const std::vector<Span>& groups)>;

    std::string replace_impl(std::string_view subject, int limit, const Expander& expand);
    // Walk matches with the region lock held; fn returns false to stop
    void for_each_match(std::string_view subject, int limit,
                        const std::function<bool(const std::vector<Span>&)>& fn);
    std::size_t advance_empty(std::string_view subject, std::size_t pos) const;
    // Runs inside for_each_match, so region_ still holds the match for groups
    void expand_replacement(std::string& out, std::string_view replacement,
                            std::string_view subject, const std::vector<Span>& groups) const;

    pcre2_regex::CompiledPattern pattern_;
    pcre2_regex::MatchRegion region_;
    std::mutex mutex_;
};

} // namespace rexbind
