#ifndef KEYSTEAD_SRC_STORAGE_SQLITE_SQLITESUPPORT_HPP
#define KEYSTEAD_SRC_STORAGE_SQLITE_SQLITESUPPORT_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <sqlite3.h>
#include <string>
#include <string_view>
#include <vector>

namespace keystead::storage::sqlite
{

struct SqliteDbDeleter final
{
    void operator()(sqlite3* db) const noexcept;
};

struct SqliteStmtDeleter final
{
    void operator()(sqlite3_stmt* stmt) const noexcept;
};

using SqliteDbPtr = std::unique_ptr<sqlite3, SqliteDbDeleter>;
using SqliteStmtPtr = std::unique_ptr<sqlite3_stmt, SqliteStmtDeleter>;

[[nodiscard]] std::string sqliteErr(sqlite3* db, const char* prefix);

// All helpers throw std::runtime_error carrying the SQLite message.
[[nodiscard]] SqliteDbPtr openDb(const std::filesystem::path& path, int flags);
void exec(sqlite3* db, const char* sql);

// A prepared statement with positional binds (1-based) and typed column reads (0-based).
class Statement final
{
public:
    Statement(sqlite3* db, const char* sql);

    Statement& bind(int index, std::string_view text);
    Statement& bind(int index, std::span<const std::uint8_t> blob);
    Statement& bind(int index, std::int64_t value);

    // True while a row is available; false once the statement is done.
    [[nodiscard]] bool step();
    void run();

    [[nodiscard]] std::string columnText(int column) const;
    [[nodiscard]] std::vector<std::uint8_t> columnBlob(int column) const;

private:
    sqlite3* m_db;
    SqliteStmtPtr m_stmt;
};

// BEGIN IMMEDIATE on construction; rolls back unless commit() succeeded.
class Transaction final
{
public:
    explicit Transaction(sqlite3* db);
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction(Transaction&&) = delete;
    Transaction& operator=(Transaction&&) = delete;
    ~Transaction() noexcept;

    void commit();

private:
    sqlite3* m_db;
    bool m_done{ false };
};

} // namespace keystead::storage::sqlite

#endif // KEYSTEAD_SRC_STORAGE_SQLITE_SQLITESUPPORT_HPP
