#include "localdoc/db.hpp"
#include "localdoc/log.hpp"
#include <algorithm>
#include <chrono>
#include <thread>

namespace localdoc {

namespace {

constexpr int busy_timeout_ms = 5000;
constexpr int begin_retry_limit_ms = 30000;

void bind(sqlite3_stmt* stmt, int index, const column_value_t& value) {
    int rc = SQLITE_OK;
    if (std::holds_alternative<std::nullptr_t>(value)) {
        rc = sqlite3_bind_null(stmt, index);
    } else if (auto i = std::get_if<int64_t>(&value)) {
        rc = sqlite3_bind_int64(stmt, index, *i);
    } else if (auto d = std::get_if<double>(&value)) {
        rc = sqlite3_bind_double(stmt, index, *d);
    } else {
        const auto& text = std::get<std::string>(value);
        rc = sqlite3_bind_text(stmt, index, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
    }
    if (rc != SQLITE_OK) {
        throw sqlite_error("Failed binding parameter " + std::to_string(index) + ": " + sqlite3_errstr(rc));
    }
}

column_value_t read_column(sqlite3_stmt* stmt, int index) {
    switch (sqlite3_column_type(stmt, index)) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_NULL:
            return nullptr;
        default: {
            // Text and blobs both come back as bytes
            const auto* bytes = static_cast<const char*>(sqlite3_column_blob(stmt, index));
            int size = sqlite3_column_bytes(stmt, index);
            return bytes ? std::string(bytes, static_cast<size_t>(size)) : std::string();
        }
    }
}

} // namespace

sqlite_database::sqlite_database(const std::string& path) {
    int rc = sqlite3_open_v2(path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("sqlite", "Cannot open %s: %s", path.c_str(), error.c_str());
        throw sqlite_error("Cannot open " + path + ": " + error);
    }

    sqlite3_busy_timeout(db_, busy_timeout_ms);
    try {
        if (path != ":memory:") {
            execute("PRAGMA journal_mode = WAL");
        }
        execute("PRAGMA synchronous = NORMAL");
    } catch (const sqlite_error&) {
        sqlite3_close(db_);
        throw;
    }
    LOG_DEBUG("sqlite", "Opened %s", path.c_str());
}

sqlite_database::~sqlite_database() {
    sqlite3_close(db_);
}

void sqlite_database::fail(const char* what, const std::string& sql) const {
    std::string error = sqlite3_errmsg(db_);
    LOG_ERROR("sqlite", "%s: %s (SQL: %s)", what, error.c_str(), sql.c_str());
    throw sqlite_error(std::string(what) + ": " + error);
}

sqlite_database::statement_ptr sqlite_database::prepare(const std::string& sql,
                                                        const std::vector<column_value_t>& params) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &raw, nullptr) != SQLITE_OK) {
        fail("Prepare failed", sql);
    }
    statement_ptr stmt(raw);
    for (size_t i = 0; i < params.size(); ++i) {
        bind(stmt.get(), static_cast<int>(i) + 1, params[i]);
    }
    return stmt;
}

void sqlite_database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    auto held = lock();
    if (params.empty()) {
        char* errmsg = nullptr;
        if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg) != SQLITE_OK) {
            std::string error = errmsg ? errmsg : sqlite3_errmsg(db_);
            sqlite3_free(errmsg);
            LOG_ERROR("sqlite", "Exec failed: %s (SQL: %s)", error.c_str(), sql.c_str());
            throw sqlite_error("Exec failed: " + error);
        }
        return;
    }

    auto stmt = prepare(sql, params);
    int rc = sqlite3_step(stmt.get());
    while (rc == SQLITE_ROW) {
        rc = sqlite3_step(stmt.get());
    }
    if (rc != SQLITE_DONE) {
        fail("Step failed", sql);
    }
}

std::vector<sqlite_database::row_t> sqlite_database::query(const std::string& sql,
                                                           const std::vector<column_value_t>& params) {
    auto held = lock();
    auto stmt = prepare(sql, params);
    const int columns = sqlite3_column_count(stmt.get());

    std::vector<row_t> rows;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        row_t row;
        row.reserve(static_cast<size_t>(columns));
        for (int c = 0; c < columns; ++c) {
            row.emplace(sqlite3_column_name(stmt.get(), c), read_column(stmt.get(), c));
        }
        rows.push_back(std::move(row));
    }
    if (rc != SQLITE_DONE) {
        fail("Query failed", sql);
    }
    return rows;
}

bool sqlite_database::table_exists(const std::string& name) {
    return !query("SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?", {name}).empty();
}

void sqlite_database::begin_transaction() {
    auto held = lock();
    // busy_timeout does not cover BEGIN IMMEDIATE under WAL; retry with backoff.
    int rc = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr);
    int delay_ms = 1;
    int waited_ms = 0;
    while ((rc == SQLITE_BUSY || rc == SQLITE_LOCKED) && waited_ms < begin_retry_limit_ms) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        waited_ms += delay_ms;
        delay_ms = std::min(delay_ms * 2, 1000);
        rc = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr);
    }
    if (rc != SQLITE_OK) {
        fail("Begin failed", "BEGIN IMMEDIATE");
    }
}

void sqlite_database::commit() {
    execute("COMMIT");
}

void sqlite_database::rollback() {
    execute("ROLLBACK");
}

bool sqlite_database::is_in_transaction() const {
    auto held = lock();
    return sqlite3_get_autocommit(db_) == 0;
}

// ============================================================================
// transaction
// ============================================================================

transaction::transaction(sqlite_database& db) : db_(db), lock_(db.lock()) {
    db_.begin_transaction();
}

transaction::~transaction() {
    if (done_ || !db_.is_in_transaction()) return;
    try {
        db_.rollback();
    } catch (const sqlite_error& e) {
        LOG_ERROR("sqlite", "Rollback failed: %s", e.what());
    }
}

void transaction::commit() {
    db_.commit();
    done_ = true;
}

std::string quote_identifier(const std::string& name) {
    std::string out;
    out.reserve(name.size() + 2);
    out.push_back('"');
    for (char c : name) {
        out.push_back(c);
        if (c == '"') out.push_back('"');
    }
    out.push_back('"');
    return out;
}

} // namespace localdoc
