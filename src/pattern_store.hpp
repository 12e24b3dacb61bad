#pragma once
#include "options.hpp"
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <sqlite3.h>

namespace rexbind {
namespace pattern_store {

// A named rewrite rule
struct Rule {
    std::string name;
    std::string pattern;
    CompileOption compile_options = CompileOption::none;
    std::string replacement;
    bool is_regex = true; // expand \1, \k<name>... in replacement
    int position = 0;     // application order, assigned by add_rule
};

// Exceptions
class store_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
class need_store_regenerate : public store_error {
public:
    using store_error::store_error;
};
class store_not_found : public store_error {
public:
    using store_error::store_error;
};
class bad_pattern : public store_error {
public:
    using store_error::store_error;
};

// SQLite-backed list of rewrite rules, applied in position order
class PatternStore {
public:
    // Create a new store; fails if the file already exists
    static PatternStore create(const std::string& path);
    // Open an existing store; throws store_not_found or need_store_regenerate
    static PatternStore open(const std::string& path);
    static PatternStore open_or_create(const std::string& path);

    PatternStore(PatternStore&& other) noexcept;
    PatternStore& operator=(PatternStore&& other) noexcept;
    PatternStore(const PatternStore&) = delete;
    PatternStore& operator=(const PatternStore&) = delete;
    ~PatternStore();

    const std::string& path() const { return path_; }

    // The pattern is compiled first; an invalid one throws bad_pattern with
    // the engine message. A rule with the same name is replaced in place.
    void add_rule(const Rule& rule);
    bool remove_rule(const std::string& name);
    std::vector<Rule> fetch_rules() const;
    std::size_t rule_count() const;

    // Run every rule over content in order.
    // Returns (result, number of rules that matched).
    std::pair<std::string, std::size_t> apply_rules(std::string_view content) const;

private:
    PatternStore(sqlite3* connection, std::string path);
    void close();
    void exec_sql(const std::string& sql);

    sqlite3* connection_;
    std::string path_;
};

} // namespace pattern_store
} // namespace rexbind
