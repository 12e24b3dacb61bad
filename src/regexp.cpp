#include "regexp.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>

namespace rexbind {

using namespace pcre2_regex;

Regexp::Regexp(std::string_view pattern, CompileOption options)
    : pattern_(compile(pattern, options)), region_(pattern_) {}

const std::string& Regexp::source() const {
    return pattern_.source();
}

CompileOption Regexp::options() const {
    return pattern_.options();
}

int Regexp::num_subexp() const {
    return pattern_.group_count();
}

std::vector<std::string> Regexp::subexp_names() const {
    std::vector<std::string> names(static_cast<std::size_t>(pattern_.group_count()) + 1);
    for (const auto& item : list_names(pattern_)) {
        names[static_cast<std::size_t>(item.second)] = item.first;
    }
    return names;
}

// Step past an empty match: one byte, or one whole character in UTF mode
std::size_t Regexp::advance_empty(std::string_view subject, std::size_t pos) const {
    pos++;
    if (pattern_.utf()) {
        while (pos < subject.size() && (static_cast<unsigned char>(subject[pos]) & 0xC0) == 0x80) {
            pos++;
        }
    }
    return pos;
}

void Regexp::for_each_match(std::string_view subject, int limit,
                            const std::function<bool(const std::vector<Span>&)>& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t pos = 0;
    int count = 0;
    while (pos <= subject.size() && (limit < 0 || count < limit)) {
        if (search(pattern_, subject, pos, region_) == MatchOutcome::no_match) break;
        auto groups = region_.spans();
        count++;
        if (!fn(groups)) break;

        auto end = static_cast<std::size_t>(groups[0].end);
        if (groups[0].begin == groups[0].end || end <= pos) {
            // Zero-length match: move on so the same position is not found again
            if (std::max(end, pos) >= subject.size()) break;
            pos = advance_empty(subject, std::max(end, pos));
        } else {
            pos = end;
        }
    }
}

bool Regexp::match(std::string_view subject) {
    std::lock_guard<std::mutex> lock(mutex_);
    return search(pattern_, subject, 0, region_) == MatchOutcome::matched;
}

std::optional<Span> Regexp::find_index(std::string_view subject) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (search(pattern_, subject, 0, region_) == MatchOutcome::no_match) return std::nullopt;
    return region_.span(0);
}

std::optional<std::string> Regexp::find(std::string_view subject) {
    auto s = find_index(subject);
    if (!s) return std::nullopt;
    return std::string(subject.substr(static_cast<std::size_t>(s->begin), s->length()));
}

std::vector<Span> Regexp::find_submatch_index(std::string_view subject) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (search(pattern_, subject, 0, region_) == MatchOutcome::no_match) return {};
    return region_.spans();
}

std::vector<std::optional<std::string>> Regexp::find_submatch(std::string_view subject) {
    std::vector<std::optional<std::string>> result;
    for (const auto& s : find_submatch_index(subject)) {
        if (s.matched()) {
            result.emplace_back(std::string(subject.substr(static_cast<std::size_t>(s.begin), s.length())));
        } else {
            result.emplace_back(std::nullopt);
        }
    }
    return result;
}

std::vector<Span> Regexp::find_all_index(std::string_view subject, int limit) {
    std::vector<Span> result;
    for_each_match(subject, limit, [&](const std::vector<Span>& groups) {
        result.push_back(groups[0]);
        return true;
    });
    return result;
}

std::vector<std::string> Regexp::find_all(std::string_view subject, int limit) {
    std::vector<std::string> result;
    for (const auto& s : find_all_index(subject, limit)) {
        result.emplace_back(subject.substr(static_cast<std::size_t>(s.begin), s.length()));
    }
    return result;
}

std::vector<std::vector<Span>> Regexp::find_all_submatch_index(std::string_view subject, int limit) {
    std::vector<std::vector<Span>> result;
    for_each_match(subject, limit, [&](const std::vector<Span>& groups) {
        result.push_back(groups);
        return true;
    });
    return result;
}

std::map<std::string, std::string> Regexp::named_captures(std::string_view subject) {
    std::map<std::string, std::string> result;
    std::lock_guard<std::mutex> lock(mutex_);
    if (search(pattern_, subject, 0, region_) == MatchOutcome::no_match) return result;
    for (const auto& entry : pattern_.capture_names()) {
        int index = lookup_name(pattern_, entry.name, region_);
        if (index < 0) {
            result[entry.name] = "";
        } else {
            auto s = region_.span(static_cast<std::size_t>(index));
            result[entry.name] = std::string(subject.substr(static_cast<std::size_t>(s.begin), s.length()));
        }
    }
    return result;
}

// Expand \0-\9, \k<name>, \g<name>, \g<N>, \\, \n, \t
void Regexp::expand_replacement(std::string& out, std::string_view replacement,
                                std::string_view subject, const std::vector<Span>& groups) const {
    auto append_group = [&](int idx) {
        if (idx >= 0 && static_cast<std::size_t>(idx) < groups.size() && groups[idx].matched()) {
            out.append(subject.substr(static_cast<std::size_t>(groups[idx].begin), groups[idx].length()));
        }
    };

    std::size_t i = 0;
    while (i < replacement.size()) {
        if (replacement[i] == '\\' && i + 1 < replacement.size()) {
            char next = replacement[i + 1];
            if ((next == 'k' || next == 'g') && i + 2 < replacement.size() && replacement[i + 2] == '<') {
                std::size_t close = replacement.find('>', i + 3);
                if (close != std::string_view::npos) {
                    std::string_view ref = replacement.substr(i + 3, close - i - 3);
                    bool is_number = !ref.empty() && next == 'g';
                    for (char c : ref) {
                        if (!std::isdigit(static_cast<unsigned char>(c))) { is_number = false; break; }
                    }
                    if (is_number) {
                        append_group(ref.size() <= 6 ? std::stoi(std::string(ref)) : -1);
                    } else {
                        append_group(lookup_name(pattern_, ref, region_));
                    }
                    i = close + 1;
                    continue;
                }
            } else if (next == '\\') {
                out += '\\';
                i += 2;
                continue;
            } else if (next == 'n') {
                out += '\n';
                i += 2;
                continue;
            } else if (next == 't') {
                out += '\t';
                i += 2;
                continue;
            } else if (std::isdigit(static_cast<unsigned char>(next))) {
                append_group(next - '0');
                i += 2;
                continue;
            }
        }
        out += replacement[i];
        i++;
    }
}

std::string Regexp::replace_impl(std::string_view subject, int limit, const Expander& expand) {
    std::string result;
    std::size_t last = 0;
    for_each_match(subject, limit, [&](const std::vector<Span>& groups) {
        auto begin = std::max(static_cast<std::size_t>(groups[0].begin), last);
        result.append(subject.substr(last, begin - last));
        expand(result, subject, groups);
        last = std::max(static_cast<std::size_t>(groups[0].end), last);
        return true;
    });
    result.append(subject.substr(last));
    return result;
}

std::string Regexp::replace_all(std::string_view subject, std::string_view replacement) {
    return replace_impl(subject, -1, [&](std::string& out, std::string_view subj, const std::vector<Span>& groups) {
        expand_replacement(out, replacement, subj, groups);
    });
}

std::string Regexp::replace_first(std::string_view subject, std::string_view replacement) {
    return replace_impl(subject, 1, [&](std::string& out, std::string_view subj, const std::vector<Span>& groups) {
        expand_replacement(out, replacement, subj, groups);
    });
}

std::string Regexp::replace_all_literal(std::string_view subject, std::string_view replacement) {
    return replace_impl(subject, -1, [&](std::string& out, std::string_view, const std::vector<Span>&) {
        out.append(replacement);
    });
}

std::string Regexp::replace_all_func(std::string_view subject,
                                     const std::function<std::string(std::string_view)>& fn) {
    return replace_impl(subject, -1, [&](std::string& out, std::string_view subj, const std::vector<Span>& groups) {
        out += fn(subj.substr(static_cast<std::size_t>(groups[0].begin), groups[0].length()));
    });
}

std::string Regexp::quote_meta(std::string_view text) {
    static const char special_chars[] = "\\^$.|?*+()[]{}-#";
    std::string result;
    result.reserve(text.size() * 2);
    for (char c : text) {
        if ((c != '\0' && std::strchr(special_chars, c) != nullptr) ||
            std::isspace(static_cast<unsigned char>(c))) {
            result += '\\';
        }
        result += c;
    }
    return result;
}

} // namespace rexbind
