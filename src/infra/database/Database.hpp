#pragma once

#include <mutex>
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace camlink::infra {

/**
 * @brief RAII wrapper for SQLite prepared statements.
 *
 * @note This class is non-copyable but moveable.
 */
class Statement {
public:
    /**
     * @brief Takes ownership of a prepared statement handle.
     */
    explicit Statement(sqlite3_stmt* stmt);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    /// Parameter indices are 1-based.
    void bind(int index, int value);
    void bind(int index, int64_t value);
    void bind(int index, const std::string& value);
    void bindNull(int index);

    /**
     * @brief Executes the statement and advances to the next row.
     * @return True if a row is available, false if done.
     * @throws core::StorageError on SQLite errors.
     */
    bool step();

    void reset();

    /// Column indices are 0-based.
    int columnInt(int index) const;
    int64_t columnInt64(int index) const;
    double columnDouble(int index) const;
    std::string columnText(int index) const;
    bool columnIsNull(int index) const;

    sqlite3_stmt* handle() const { return stmt_; }

private:
    sqlite3_stmt* stmt_{nullptr};
};

/**
 * @brief SQLite connection with WAL mode and versioned schema migrations.
 *
 * @note This class is non-copyable.
 */
class Database {
public:
    /**
     * @brief Opens or creates a database.
     * @param path File path, or ":memory:".
     * @throws core::StorageError if the database cannot be opened.
     */
    explicit Database(const std::string& path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * @brief Executes SQL without results.
     * @throws core::StorageError on SQL error.
     */
    void execute(const std::string& sql);

    /**
     * @brief Prepares a SQL statement.
     * @throws core::StorageError if preparation fails.
     */
    Statement prepare(const std::string& sql);

    int changes() const;

    void beginTransaction();
    void commit();
    void rollback();

    /**
     * @brief Runs a function inside a transaction.
     *
     * Commits on success, rolls back and rethrows on exception.
     */
    template <typename Func>
    void transaction(Func&& func) {
        beginTransaction();
        try {
            func();
            commit();
        } catch (...) {
            rollback();
            throw;
        }
    }

    /**
     * @brief Applies pending schema migrations.
     */
    void runMigrations();

    /**
     * @brief Returns the applied schema version (0 for a fresh database).
     */
    int schemaVersion();

    /**
     * @brief Executes a query and returns its rows as JSON objects keyed by column name.
     */
    template <typename... Args>
    std::vector<nlohmann::json> query(const std::string& sql, Args&&... args) {
        std::vector<nlohmann::json> rows;
        auto stmt = prepare(sql);
        if constexpr (sizeof...(args) > 0) {
            bindAll(stmt, 1, std::forward<Args>(args)...);
        }

        int columnCount = sqlite3_column_count(stmt.handle());
        while (stmt.step()) {
            nlohmann::json row;
            for (int i = 0; i < columnCount; ++i) {
                const char* name = sqlite3_column_name(stmt.handle(), i);
                switch (sqlite3_column_type(stmt.handle(), i)) {
                case SQLITE_INTEGER:
                    row[name] = stmt.columnInt64(i);
                    break;
                case SQLITE_FLOAT:
                    row[name] = stmt.columnDouble(i);
                    break;
                case SQLITE_NULL:
                    row[name] = nullptr;
                    break;
                default:
                    row[name] = stmt.columnText(i);
                    break;
                }
            }
            rows.push_back(std::move(row));
        }
        return rows;
    }

private:
    template <typename T, typename... Rest>
    void bindAll(Statement& stmt, int index, T&& first, Rest&&... rest) {
        bindValue(stmt, index, std::forward<T>(first));
        if constexpr (sizeof...(rest) > 0) {
            bindAll(stmt, index + 1, std::forward<Rest>(rest)...);
        }
    }

    void bindValue(Statement& stmt, int index, int value) { stmt.bind(index, value); }
    void bindValue(Statement& stmt, int index, int64_t value) { stmt.bind(index, value); }
    void bindValue(Statement& stmt, int index, const std::string& value) { stmt.bind(index, value); }
    void bindValue(Statement& stmt, int index, const char* value) { stmt.bind(index, std::string(value)); }

    void enableWAL();
    void createMigrationsTable();
    void setVersion(int version);

    sqlite3* db_{nullptr};
    mutable std::mutex mutex_;
};

} // namespace camlink::infra
