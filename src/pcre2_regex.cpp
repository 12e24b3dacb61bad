#define PCRE2_CODE_UNIT_WIDTH 8
#include "pcre2_regex.hpp"
#include "diagnostics.hpp"
#include "globalvar.hpp"
#include <algorithm>
#include <atomic>
#include <cstring>
#include <new>

namespace rexbind {
namespace pcre2_regex {

static std::atomic<uint64_t> next_serial{1};

// PCRE2 rejects a null subject pointer on older releases even when the
// length is zero
static PCRE2_SPTR to_sptr(std::string_view s) {
    return reinterpret_cast<PCRE2_SPTR>(s.data() != nullptr ? s.data() : "");
}

std::string error_message(int errorcode) {
    PCRE2_UCHAR buffer[globalvar::error_message_size];
    int rc = pcre2_get_error_message(errorcode, buffer, sizeof(buffer));
    if (rc == PCRE2_ERROR_BADDATA) {
        return "unknown PCRE2 error code " + std::to_string(errorcode);
    }
    // PCRE2_ERROR_NOMEMORY means the text was truncated but still terminated
    return reinterpret_cast<const char*>(buffer);
}

regex_error::regex_error(int code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

compile_error::compile_error(int code, const std::string& message, std::size_t offset)
    : regex_error(code, message), offset_(offset) {}

// Read a piece of pattern metadata; failures here mean the code block is bad
template <typename T>
static T pattern_info(const pcre2_code* code, uint32_t what) {
    T value{};
    int rc = pcre2_pattern_info(code, what, &value);
    if (rc != 0) {
        throw engine_failure(rc, error_message(rc));
    }
    return value;
}

// Walk the name table. Each entry is a 2-byte big-endian group number
// followed by the NUL-terminated name, padded to a fixed entry size.
// PCRE2 keeps the table sorted by name, so duplicates are adjacent.
static std::vector<CaptureNameEntry> extract_named_groups(const pcre2_code* code) {
    std::vector<CaptureNameEntry> entries;
    auto namecount = pattern_info<uint32_t>(code, PCRE2_INFO_NAMECOUNT);
    if (namecount == 0) return entries;

    auto nametable = pattern_info<PCRE2_SPTR>(code, PCRE2_INFO_NAMETABLE);
    auto nameentrysize = pattern_info<uint32_t>(code, PCRE2_INFO_NAMEENTRYSIZE);

    for (uint32_t i = 0; i < namecount; i++) {
        PCRE2_SPTR entry = nametable + static_cast<std::size_t>(i) * nameentrysize;
        int group_num = (entry[0] << 8) | entry[1];
        const char* raw = reinterpret_cast<const char*>(entry + 2);
        std::string name(raw, strnlen(raw, nameentrysize - 2));

        if (entries.empty() || entries.back().name != name) {
            entries.push_back(CaptureNameEntry{name, {}});
        }
        entries.back().group_indices.push_back(group_num);
    }
    for (auto& e : entries) {
        std::sort(e.group_indices.begin(), e.group_indices.end());
    }
    return entries;
}

CompiledPattern::CompiledPattern(std::unique_ptr<pcre2_code, CodeDeleter> code, std::string source,
                                 CompileOption options)
    : code_(std::move(code)), source_(std::move(source)), options_(options), group_count_(0),
      utf_(false), serial_(next_serial.fetch_add(1)) {
    const pcre2_code* raw = code_.get();
    group_count_ = static_cast<int>(pattern_info<uint32_t>(raw, PCRE2_INFO_CAPTURECOUNT));
    // ALLOPTIONS includes options set by leading verbs such as (*UTF)
    utf_ = (pattern_info<uint32_t>(raw, PCRE2_INFO_ALLOPTIONS) & PCRE2_UTF) != 0;
    names_ = extract_named_groups(raw);
}

void CompiledPattern::check_valid() const {
    if (!code_) {
        throw contract_violation("compiled pattern has been released");
    }
}

void CompiledPattern::release() {
    if (!code_) {
        diagnostics::warning("compiled pattern \"" + source_ + "\" released more than once; ignoring");
        return;
    }
    code_.reset();
    diagnostics::debug("released compiled pattern #" + std::to_string(serial_));
}

const std::string& CompiledPattern::source() const {
    check_valid();
    return source_;
}

CompileOption CompiledPattern::options() const {
    check_valid();
    return options_;
}

int CompiledPattern::group_count() const {
    check_valid();
    return group_count_;
}

const std::vector<CaptureNameEntry>& CompiledPattern::capture_names() const {
    check_valid();
    return names_;
}

bool CompiledPattern::utf() const {
    check_valid();
    return utf_;
}

uint64_t CompiledPattern::serial() const {
    check_valid();
    return serial_;
}

pcre2_code* CompiledPattern::code() const {
    check_valid();
    return code_.get();
}

CompiledPattern compile(std::string_view pattern, CompileOption options) {
    int errorcode = 0;
    PCRE2_SIZE erroroffset = 0;
    std::unique_ptr<pcre2_code, CodeDeleter> code(pcre2_compile(
        to_sptr(pattern),
        pattern.size(),
        to_bits(options) | PCRE2_DUPNAMES,
        &errorcode, &erroroffset, nullptr));
    if (!code) {
        throw compile_error(errorcode, error_message(errorcode), erroroffset);
    }
    return CompiledPattern(std::move(code), std::string(pattern), options);
}

void validate_pattern(std::string_view pattern, CompileOption options) {
    CompiledPattern cp = compile(pattern, options);
    cp.release();
}

MatchRegion::MatchRegion(const CompiledPattern& pattern) {
    assign(pattern);
}

MatchRegion::MatchRegion(MatchRegion&& other) noexcept
    : data_(other.data_), capacity_(other.capacity_), size_(other.size_),
      pattern_serial_(other.pattern_serial_), has_match_(other.has_match_) {
    other.data_ = nullptr;
    other.capacity_ = 0;
    other.size_ = 0;
    other.pattern_serial_ = 0;
    other.has_match_ = false;
}

MatchRegion& MatchRegion::operator=(MatchRegion&& other) noexcept {
    if (this != &other) {
        if (data_) pcre2_match_data_free(data_);
        data_ = other.data_;
        capacity_ = other.capacity_;
        size_ = other.size_;
        pattern_serial_ = other.pattern_serial_;
        has_match_ = other.has_match_;
        other.data_ = nullptr;
        other.capacity_ = 0;
        other.size_ = 0;
        other.pattern_serial_ = 0;
        other.has_match_ = false;
    }
    return *this;
}

MatchRegion::~MatchRegion() {
    if (data_) pcre2_match_data_free(data_);
}

void MatchRegion::assign(const CompiledPattern& pattern) {
    uint32_t needed = static_cast<uint32_t>(pattern.group_count()) + 1;
    if (data_ == nullptr || capacity_ < needed) {
        pcre2_match_data* fresh = pcre2_match_data_create(needed, nullptr);
        if (fresh == nullptr) throw std::bad_alloc();
        if (data_) pcre2_match_data_free(data_);
        data_ = fresh;
        capacity_ = needed;
    }
    size_ = needed;
    pattern_serial_ = pattern.serial();
    has_match_ = false;
}

bool MatchRegion::bound_to(const CompiledPattern& pattern) const {
    return data_ != nullptr && pattern.valid() && pattern_serial_ == pattern.serial();
}

Span MatchRegion::span(std::size_t index) const {
    if (!has_match_) {
        throw contract_violation("match region holds no match");
    }
    if (index >= size_) {
        throw contract_violation("group index " + std::to_string(index) +
                                 " out of range (region has " + std::to_string(size_) + " groups)");
    }
    const PCRE2_SIZE* ovector = pcre2_get_ovector_pointer(data_);
    Span s;
    if (ovector[2 * index] != PCRE2_UNSET) {
        s.begin = static_cast<std::ptrdiff_t>(ovector[2 * index]);
        s.end = static_cast<std::ptrdiff_t>(ovector[2 * index + 1]);
    }
    return s;
}

std::vector<Span> MatchRegion::spans() const {
    std::vector<Span> result;
    result.reserve(size_);
    for (std::size_t i = 0; i < size_; i++) {
        result.push_back(span(i));
    }
    return result;
}

MatchOutcome run_match(const CompiledPattern& pattern, std::string_view subject, std::size_t offset,
                       uint32_t match_options, MatchRegion& region) {
    pcre2_code* code = pattern.code();
    if (!region.bound_to(pattern)) {
        throw contract_violation("match region was not created for this pattern");
    }
    if (offset > subject.size()) {
        throw contract_violation("offset " + std::to_string(offset) +
                                 " is past the end of the subject (length " +
                                 std::to_string(subject.size()) + ")");
    }

    region.has_match_ = false;
    int rc = pcre2_match(code, to_sptr(subject), subject.size(), offset,
                         match_options, region.data_, nullptr);
    if (rc == PCRE2_ERROR_NOMATCH) {
        return MatchOutcome::no_match;
    }
    if (rc < 0) {
        throw engine_failure(rc, error_message(rc));
    }
    if (rc == 0) {
        // The block is always sized from the pattern's capture count
        throw engine_failure(rc, "match block too small for pattern \"" + pattern.source() + "\"");
    }
    region.has_match_ = true;
    return MatchOutcome::matched;
}

MatchOutcome search(const CompiledPattern& pattern, std::string_view subject, std::size_t offset,
                    MatchOption options, MatchRegion& region) {
    return run_match(pattern, subject, offset, to_bits(options), region);
}

MatchOutcome search(const CompiledPattern& pattern, std::string_view subject, std::size_t offset,
                    MatchRegion& region) {
    return search(pattern, subject, offset, MatchOption::none, region);
}

MatchOutcome match_at(const CompiledPattern& pattern, std::string_view subject, std::size_t offset,
                      MatchOption options, MatchRegion& region) {
    return run_match(pattern, subject, offset, to_bits(options) | PCRE2_ANCHORED, region);
}

MatchOutcome match_at(const CompiledPattern& pattern, std::string_view subject, std::size_t offset,
                      MatchRegion& region) {
    return match_at(pattern, subject, offset, MatchOption::none, region);
}

std::vector<int> resolve_name(const CompiledPattern& pattern, std::string_view name) {
    for (const auto& entry : pattern.capture_names()) {
        if (entry.name == name) return entry.group_indices;
    }
    return {};
}

int lookup_name(const CompiledPattern& pattern, std::string_view name, const MatchRegion& region) {
    if (!region.bound_to(pattern)) {
        throw contract_violation("match region was not created for this pattern");
    }
    auto indices = resolve_name(pattern, name);
    for (auto it = indices.rbegin(); it != indices.rend(); ++it) {
        if (region.matched(static_cast<std::size_t>(*it))) return *it;
    }
    return -1;
}

std::vector<std::pair<std::string, int>> list_names(const CompiledPattern& pattern) {
    std::vector<std::pair<std::string, int>> result;
    for (const auto& entry : pattern.capture_names()) {
        for (int index : entry.group_indices) {
            result.emplace_back(entry.name, index);
        }
    }
    return result;
}

} // namespace pcre2_regex
} // namespace rexbind
