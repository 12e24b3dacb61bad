#include "pattern_store.hpp"
#include "diagnostics.hpp"
#include "globalvar.hpp"
#include "regexp.hpp"
#include <filesystem>

namespace fs = std::filesystem;

namespace rexbind {
namespace pattern_store {

// RAII wrapper for sqlite3_stmt
struct Statement {
    sqlite3_stmt* stmt = nullptr;
    Statement(sqlite3* db, const std::string& sql) {
        int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            throw store_error("SQL error: " + std::string(sqlite3_errmsg(db)));
        }
    }
    ~Statement() { sqlite3_finalize(stmt); }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
};

static void bind_bytes(sqlite3* db, sqlite3_stmt* stmt, int idx, const std::string& value) {
    // Bound as BLOB so embedded NUL bytes survive
    int rc = sqlite3_bind_blob(stmt, idx, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) throw store_error("SQL error: " + std::string(sqlite3_errmsg(db)));
}

static void bind_text(sqlite3* db, sqlite3_stmt* stmt, int idx, const std::string& value) {
    int rc = sqlite3_bind_text(stmt, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) throw store_error("SQL error: " + std::string(sqlite3_errmsg(db)));
}

static void bind_int(sqlite3* db, sqlite3_stmt* stmt, int idx, int64_t value) {
    int rc = sqlite3_bind_int64(stmt, idx, value);
    if (rc != SQLITE_OK) throw store_error("SQL error: " + std::string(sqlite3_errmsg(db)));
}

// Step a statement that is expected to finish without returning rows
static void step_done(sqlite3* db, sqlite3_stmt* stmt) {
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) throw store_error("SQL error: " + std::string(sqlite3_errmsg(db)));
}

static std::string column_bytes(sqlite3_stmt* stmt, int col) {
    const void* data = sqlite3_column_blob(stmt, col);
    int size = sqlite3_column_bytes(stmt, col);
    if (data == nullptr || size <= 0) return "";
    return std::string(static_cast<const char*>(data), static_cast<std::size_t>(size));
}

PatternStore::PatternStore(sqlite3* connection, std::string path)
    : connection_(connection), path_(std::move(path)) {}

PatternStore::PatternStore(PatternStore&& other) noexcept
    : connection_(other.connection_), path_(std::move(other.path_)) {
    other.connection_ = nullptr;
}

PatternStore& PatternStore::operator=(PatternStore&& other) noexcept {
    if (this != &other) {
        close();
        connection_ = other.connection_;
        path_ = std::move(other.path_);
        other.connection_ = nullptr;
    }
    return *this;
}

PatternStore::~PatternStore() {
    close();
}

void PatternStore::close() {
    if (connection_ != nullptr) {
        sqlite3_close(connection_);
        connection_ = nullptr;
    }
}

void PatternStore::exec_sql(const std::string& sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(connection_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string error = err_msg ? err_msg : "unknown error";
        sqlite3_free(err_msg);
        throw store_error("SQL error: " + error);
    }
}

static sqlite3* open_connection(const std::string& path, int flags) {
    sqlite3* connection = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &connection, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = connection ? sqlite3_errmsg(connection) : sqlite3_errstr(rc);
        sqlite3_close(connection);
        throw store_error("Cannot open pattern store: " + message);
    }
    return connection;
}

PatternStore PatternStore::create(const std::string& path) {
    if (fs::exists(path)) {
        throw store_error("Pattern store \"" + path + "\" already exists");
    }
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty() && !fs::exists(parent)) {
        fs::create_directories(parent);
    }

    PatternStore store(open_connection(path, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE), path);

    store.exec_sql("CREATE TABLE " + globalvar::store_rules_tablename + " ("
        "name TEXT NOT NULL PRIMARY KEY,"
        "pattern BLOB NOT NULL,"
        "compile_options INTEGER NOT NULL,"
        "replacement BLOB NOT NULL,"
        "is_regex INTEGER NOT NULL,"
        "position INTEGER NOT NULL"
        ");");
    store.exec_sql("CREATE TABLE " + globalvar::store_version_tablename + " (value INTEGER NOT NULL);");
    store.exec_sql("INSERT INTO " + globalvar::store_version_tablename + " (value) VALUES (" +
                   std::to_string(globalvar::store_version) + ");");

    diagnostics::debug("created pattern store \"" + path + "\"");
    return store;
}

PatternStore PatternStore::open(const std::string& path) {
    if (!fs::exists(path)) {
        throw store_not_found("No pattern store at \"" + path + "\"");
    }

    PatternStore store(open_connection(path, SQLITE_OPEN_READWRITE), path);

    // Check store version
    sqlite3_stmt* stmt = nullptr;
    std::string sql = "SELECT value FROM " + globalvar::store_version_tablename;
    int rc = sqlite3_prepare_v2(store.connection_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt);
        throw need_store_regenerate("Pattern store version table missing");
    }
    rc = sqlite3_step(stmt);
    int version = rc == SQLITE_ROW ? sqlite3_column_int(stmt, 0) : -1;
    sqlite3_finalize(stmt);
    if (version != globalvar::store_version) {
        throw need_store_regenerate("Pattern store version mismatch (found " + std::to_string(version) +
                                    ", expected " + std::to_string(globalvar::store_version) + ")");
    }
    return store;
}

PatternStore PatternStore::open_or_create(const std::string& path) {
    if (fs::exists(path)) return open(path);
    return create(path);
}

void PatternStore::add_rule(const Rule& rule) {
    try {
        pcre2_regex::validate_pattern(rule.pattern, rule.compile_options);
    } catch (const pcre2_regex::compile_error& e) {
        throw bad_pattern("Bad pattern for rule \"" + rule.name + "\": " + e.what());
    }

    // Keep the position of a rule being replaced
    int position = -1;
    {
        Statement st(connection_, "SELECT position FROM " + globalvar::store_rules_tablename + " WHERE name=?;");
        bind_text(connection_, st.stmt, 1, rule.name);
        int rc = sqlite3_step(st.stmt);
        if (rc == SQLITE_ROW) {
            position = sqlite3_column_int(st.stmt, 0);
        } else if (rc != SQLITE_DONE) {
            throw store_error("SQL error: " + std::string(sqlite3_errmsg(connection_)));
        }
    }
    if (position >= 0) {
        diagnostics::warning("Repeated rule \"" + rule.name + "\", overwriting");
    } else {
        Statement st(connection_, "SELECT COALESCE(MAX(position), -1) + 1 FROM " +
                                  globalvar::store_rules_tablename + ";");
        if (sqlite3_step(st.stmt) != SQLITE_ROW) {
            throw store_error("SQL error: " + std::string(sqlite3_errmsg(connection_)));
        }
        position = sqlite3_column_int(st.stmt, 0);
    }

    Statement st(connection_, "INSERT OR REPLACE INTO " + globalvar::store_rules_tablename +
                              " (name, pattern, compile_options, replacement, is_regex, position)"
                              " VALUES (?,?,?,?,?,?);");
    int idx = 1;
    bind_text(connection_, st.stmt, idx++, rule.name);
    bind_bytes(connection_, st.stmt, idx++, rule.pattern);
    bind_int(connection_, st.stmt, idx++, to_bits(rule.compile_options));
    bind_bytes(connection_, st.stmt, idx++, rule.replacement);
    bind_int(connection_, st.stmt, idx++, rule.is_regex ? 1 : 0);
    bind_int(connection_, st.stmt, idx++, position);
    step_done(connection_, st.stmt);
}

bool PatternStore::remove_rule(const std::string& name) {
    Statement st(connection_, "DELETE FROM " + globalvar::store_rules_tablename + " WHERE name=?;");
    bind_text(connection_, st.stmt, 1, name);
    step_done(connection_, st.stmt);
    return sqlite3_changes(connection_) > 0;
}

std::vector<Rule> PatternStore::fetch_rules() const {
    Statement st(connection_, "SELECT name, pattern, compile_options, replacement, is_regex, position FROM " +
                              globalvar::store_rules_tablename + " ORDER BY position ASC;");
    std::vector<Rule> rules;
    int rc;
    while ((rc = sqlite3_step(st.stmt)) == SQLITE_ROW) {
        Rule rule;
        rule.name = reinterpret_cast<const char*>(sqlite3_column_text(st.stmt, 0));
        rule.pattern = column_bytes(st.stmt, 1);
        auto bits = static_cast<uint32_t>(sqlite3_column_int64(st.stmt, 2));
        auto opts = options::compile_option_from_bits(bits);
        if (!opts) {
            throw need_store_regenerate("Rule \"" + rule.name + "\" has unknown compile options");
        }
        rule.compile_options = *opts;
        rule.replacement = column_bytes(st.stmt, 3);
        rule.is_regex = sqlite3_column_int(st.stmt, 4) != 0;
        rule.position = sqlite3_column_int(st.stmt, 5);
        rules.push_back(std::move(rule));
    }
    if (rc != SQLITE_DONE) {
        throw store_error("SQL error: " + std::string(sqlite3_errmsg(connection_)));
    }
    return rules;
}

std::size_t PatternStore::rule_count() const {
    Statement st(connection_, "SELECT COUNT(*) FROM " + globalvar::store_rules_tablename + ";");
    if (sqlite3_step(st.stmt) != SQLITE_ROW) {
        throw store_error("SQL error: " + std::string(sqlite3_errmsg(connection_)));
    }
    return static_cast<std::size_t>(sqlite3_column_int64(st.stmt, 0));
}

std::pair<std::string, std::size_t> PatternStore::apply_rules(std::string_view content) const {
    std::string result(content);
    std::size_t matched = 0;
    for (const auto& rule : fetch_rules()) {
        try {
            Regexp re(rule.pattern, rule.compile_options);
            if (!re.match(result)) continue;
            matched++;
            result = rule.is_regex ? re.replace_all(result, rule.replacement)
                                   : re.replace_all_literal(result, rule.replacement);
            diagnostics::debug("rule \"" + rule.name + "\" applied");
        } catch (const pcre2_regex::compile_error& e) {
            // Only reachable if the file was edited by hand
            diagnostics::warning("Skipping rule \"" + rule.name + "\": " + e.what());
        }
    }
    return {result, matched};
}

} // namespace pattern_store
} // namespace rexbind
