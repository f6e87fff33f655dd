#pragma once

#ifdef __cplusplus

#include "errors.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace localdoc {

/// A bound parameter or a fetched column. Documents travel as JSON text.
using column_value_t = std::variant<std::nullptr_t, int64_t, double, std::string>;

/// One SQLite connection shared by every sqlite_storage of a database file.
/// Every call, and every transaction from BEGIN to COMMIT, holds the
/// connection lock, so writers on different threads take turns.
class sqlite_database {
public:
    using row_t = std::unordered_map<std::string, column_value_t>;

    explicit sqlite_database(const std::string& path);
    ~sqlite_database();

    sqlite_database(const sqlite_database&) = delete;
    sqlite_database& operator=(const sqlite_database&) = delete;

    /// Run a statement that returns no rows. Without params, `sql` may hold
    /// several statements.
    void execute(const std::string& sql, const std::vector<column_value_t>& params = {});

    /// Run a statement and collect every row keyed by column name.
    std::vector<row_t> query(const std::string& sql, const std::vector<column_value_t>& params = {});

    bool table_exists(const std::string& name);

    void begin_transaction();
    void commit();
    void rollback();
    bool is_in_transaction() const;

    /// Held by `transaction` for its whole lifetime. Recursive so the calls
    /// made inside the transaction can take it again.
    std::unique_lock<std::recursive_mutex> lock() const {
        return std::unique_lock<std::recursive_mutex>(mutex_);
    }

private:
    struct statement_deleter {
        void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
    };
    using statement_ptr = std::unique_ptr<sqlite3_stmt, statement_deleter>;

    statement_ptr prepare(const std::string& sql, const std::vector<column_value_t>& params);
    [[noreturn]] void fail(const char* what, const std::string& sql) const;

    sqlite3* db_ = nullptr;
    mutable std::recursive_mutex mutex_;
};

/// Scoped write transaction. Owns the connection lock until destroyed and
/// rolls back unless committed.
class transaction {
public:
    explicit transaction(sqlite_database& db);
    ~transaction();

    void commit();

private:
    sqlite_database& db_;
    std::unique_lock<std::recursive_mutex> lock_;
    bool done_ = false;
};

/// Double-quote a table name, escaping embedded quotes.
std::string quote_identifier(const std::string& name);

} // namespace localdoc

#endif // __cplusplus
