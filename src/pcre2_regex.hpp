#pragma once
#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>
#include "options.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rexbind {
namespace pcre2_regex {

// Base class for errors reported by the engine. code() is PCRE2's own
// error number and what() is PCRE2's message, both passed through as-is.
class regex_error : public std::runtime_error {
public:
    regex_error(int code, const std::string& message);
    int code() const noexcept { return code_; }

private:
    int code_;
};

// Pattern failed to compile
class compile_error : public regex_error {
public:
    compile_error(int code, const std::string& message, std::size_t offset);
    // Byte offset in the pattern where the error was detected
    std::size_t offset() const noexcept { return offset_; }

private:
    std::size_t offset_;
};

// pcre2_match failed for a reason other than "no match"
class engine_failure : public regex_error {
public:
    using regex_error::regex_error;
};

// Caller defect: bad offset, foreign region, released pattern
class contract_violation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

enum class MatchOutcome {
    matched,
    no_match,
};

// One distinct group name and every group number carrying it (ascending)
struct CaptureNameEntry {
    std::string name;
    std::vector<int> group_indices;
};

// [begin, end) byte offsets of one group; both are unset (-1) when the
// group did not participate in the match
struct Span {
    static constexpr std::ptrdiff_t unset = -1;

    std::ptrdiff_t begin = unset;
    std::ptrdiff_t end = unset;

    bool matched() const { return begin != unset; }
    std::size_t length() const { return matched() ? static_cast<std::size_t>(end - begin) : 0; }
};

struct CodeDeleter {
    void operator()(pcre2_code* code) const { pcre2_code_free(code); }
};

// Owns a compiled pcre2_code plus the metadata read from it at compile
// time. Move-only; the engine state is freed exactly once, by release() or
// by the destructor. Matching does not modify the pattern, so several
// threads may match against one CompiledPattern as long as each uses its
// own MatchRegion.
class CompiledPattern {
public:
    CompiledPattern(CompiledPattern&&) noexcept = default;
    CompiledPattern& operator=(CompiledPattern&&) noexcept = default;
    CompiledPattern(const CompiledPattern&) = delete;
    CompiledPattern& operator=(const CompiledPattern&) = delete;
    ~CompiledPattern() = default;

    // False once released or moved from
    bool valid() const noexcept { return code_ != nullptr; }

    // Free the engine state now. Releasing twice warns and does nothing.
    void release();

    const std::string& source() const;
    CompileOption options() const;

    // Number of capture groups, not counting the whole match
    int group_count() const;

    const std::vector<CaptureNameEntry>& capture_names() const;

    // True when the pattern runs in UTF-8 mode, whether from CompileOption::utf
    // or from a (*UTF) verb inside the pattern
    bool utf() const;

    // Unique per compilation; regions remember which pattern they belong to
    uint64_t serial() const;

    // The underlying engine handle; throws contract_violation when released
    pcre2_code* code() const;

private:
    friend CompiledPattern compile(std::string_view pattern, CompileOption options);

    CompiledPattern(std::unique_ptr<pcre2_code, CodeDeleter> code, std::string source, CompileOption options);
    void check_valid() const;

    std::unique_ptr<pcre2_code, CodeDeleter> code_;
    std::string source_;
    CompileOption options_;
    int group_count_;
    bool utf_;
    std::vector<CaptureNameEntry> names_;
    uint64_t serial_;
};

// Caller-owned record of the spans from the most recent match. Allocated
// once for a pattern and overwritten by every search()/match_at() call.
class MatchRegion {
public:
    MatchRegion() = default;
    explicit MatchRegion(const CompiledPattern& pattern);
    MatchRegion(MatchRegion&& other) noexcept;
    MatchRegion& operator=(MatchRegion&& other) noexcept;
    MatchRegion(const MatchRegion&) = delete;
    MatchRegion& operator=(const MatchRegion&) = delete;
    ~MatchRegion();

    // Bind to another pattern; the match block is kept if it is big enough
    void assign(const CompiledPattern& pattern);

    bool bound_to(const CompiledPattern& pattern) const;

    // True after a call that returned MatchOutcome::matched
    bool has_match() const { return has_match_; }

    // group_count() + 1 of the bound pattern
    std::size_t size() const { return size_; }

    // The accessors below throw contract_violation unless has_match()
    // and index < size()
    Span span(std::size_t index) const;
    std::ptrdiff_t begin(std::size_t index) const { return span(index).begin; }
    std::ptrdiff_t end(std::size_t index) const { return span(index).end; }
    bool matched(std::size_t index) const { return span(index).matched(); }

    std::vector<Span> spans() const;

private:
    friend MatchOutcome run_match(const CompiledPattern&, std::string_view, std::size_t,
                                  uint32_t, MatchRegion&);

    pcre2_match_data* data_ = nullptr;
    uint32_t capacity_ = 0;
    std::size_t size_ = 0;
    uint64_t pattern_serial_ = 0;
    bool has_match_ = false;
};

// Compile a pattern. Duplicate group names are always allowed.
// Throws compile_error with the engine's code, message and error offset.
CompiledPattern compile(std::string_view pattern, CompileOption options = CompileOption::none);

// Compile and discard; throws compile_error on failure
void validate_pattern(std::string_view pattern, CompileOption options = CompileOption::none);

// Leftmost match starting at or after offset (0 <= offset <= subject.size())
MatchOutcome search(const CompiledPattern& pattern, std::string_view subject, std::size_t offset,
                    MatchOption options, MatchRegion& region);
MatchOutcome search(const CompiledPattern& pattern, std::string_view subject, std::size_t offset,
                    MatchRegion& region);

// Match that must begin exactly at offset
MatchOutcome match_at(const CompiledPattern& pattern, std::string_view subject, std::size_t offset,
                      MatchOption options, MatchRegion& region);
MatchOutcome match_at(const CompiledPattern& pattern, std::string_view subject, std::size_t offset,
                      MatchRegion& region);

// Group numbers (1-based, ascending) carrying name; empty if undefined
std::vector<int> resolve_name(const CompiledPattern& pattern, std::string_view name);

// Group carrying name that took part in the match held by region. With
// duplicate names the highest-numbered participating group wins. Returns -1
// when the name is undefined or none of its groups participated. Throws
// contract_violation unless region holds a match made with pattern.
int lookup_name(const CompiledPattern& pattern, std::string_view name, const MatchRegion& region);

// Every (name, group number) pair in the engine's name table order
std::vector<std::pair<std::string, int>> list_names(const CompiledPattern& pattern);

// Text for a PCRE2 error code
std::string error_message(int errorcode);

} // namespace pcre2_regex
} // namespace rexbind
