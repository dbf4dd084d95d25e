#include "SqliteSupport.hpp"
#include <cstring>
#include <limits>
#include <stdexcept>

namespace keystead::storage::sqlite
{

void SqliteDbDeleter::operator()(sqlite3* db) const noexcept
{
    if (db != nullptr)
    {
        (void)sqlite3_close_v2(db);
    }
}

void SqliteStmtDeleter::operator()(sqlite3_stmt* stmt) const noexcept
{
    if (stmt != nullptr)
    {
        (void)sqlite3_finalize(stmt);
    }
}

std::string sqliteErr(sqlite3* db, const char* prefix)
{
    const char* msg = (db != nullptr) ? sqlite3_errmsg(db) : "no-db";
    std::string out{ prefix };
    out.append(": ");
    out.append(msg);
    return out;
}

SqliteDbPtr openDb(const std::filesystem::path& path, int flags)
{
    sqlite3* raw = nullptr;
    const std::string filename = path.string();
    const int rc = sqlite3_open_v2(filename.c_str(), &raw, flags, nullptr);
    SqliteDbPtr db{ raw };
    if (rc != SQLITE_OK || !db)
    {
        throw std::runtime_error(sqliteErr(raw, "storage: sqlite3_open_v2 failed"));
    }
    return db;
}

void exec(sqlite3* db, const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK)
    {
        std::string msg = sqliteErr(db, "storage: sqlite3_exec failed");
        if (errMsg != nullptr)
        {
            msg.append(" (");
            msg.append(errMsg);
            msg.append(")");
            sqlite3_free(errMsg);
        }
        throw std::runtime_error(msg);
    }
}

Statement::Statement(sqlite3* db, const char* sql) : m_db{ db }
{
    sqlite3_stmt* rawStmt = nullptr;
    const int prepRc = sqlite3_prepare_v2(db, sql, -1, &rawStmt, nullptr);
    m_stmt.reset(rawStmt);
    if (prepRc != SQLITE_OK || !m_stmt)
    {
        throw std::runtime_error(sqliteErr(db, "storage: sqlite3_prepare_v2 failed"));
    }
}

Statement& Statement::bind(int index, std::string_view text)
{
    if (text.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
    {
        throw std::invalid_argument("storage: text too large");
    }
    if (sqlite3_bind_text(m_stmt.get(), index, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT) !=
        SQLITE_OK)
    {
        throw std::runtime_error(sqliteErr(m_db, "storage: bind text failed"));
    }
    return *this;
}

Statement& Statement::bind(int index, std::span<const std::uint8_t> blob)
{
    if (blob.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
    {
        throw std::invalid_argument("storage: blob too large");
    }
    // A null pointer would bind SQL NULL; empty blobs must stay blobs.
    static constexpr std::uint8_t kEmpty{ 0U };
    const void* data{ blob.empty() ? static_cast<const void*>(&kEmpty) : blob.data() };
    if (sqlite3_bind_blob(m_stmt.get(), index, data, static_cast<int>(blob.size()), SQLITE_TRANSIENT) != SQLITE_OK)
    {
        throw std::runtime_error(sqliteErr(m_db, "storage: bind blob failed"));
    }
    return *this;
}

Statement& Statement::bind(int index, std::int64_t value)
{
    if (sqlite3_bind_int64(m_stmt.get(), index, static_cast<sqlite3_int64>(value)) != SQLITE_OK)
    {
        throw std::runtime_error(sqliteErr(m_db, "storage: bind int failed"));
    }
    return *this;
}

bool Statement::step()
{
    const int rc = sqlite3_step(m_stmt.get());
    if (rc == SQLITE_ROW)
    {
        return true;
    }
    if (rc == SQLITE_DONE)
    {
        return false;
    }
    throw std::runtime_error(sqliteErr(m_db, "storage: sqlite3_step failed"));
}

void Statement::run()
{
    while (step())
    {
    }
}

std::string Statement::columnText(int column) const
{
    const auto* text = sqlite3_column_text(m_stmt.get(), column);
    const int bytes = sqlite3_column_bytes(m_stmt.get(), column);
    if (text == nullptr || bytes < 0)
    {
        throw std::runtime_error("storage: unexpected NULL text column");
    }
    return std::string{ reinterpret_cast<const char*>(text), static_cast<std::size_t>(bytes) };
}

std::vector<std::uint8_t> Statement::columnBlob(int column) const
{
    const void* ptr = sqlite3_column_blob(m_stmt.get(), column);
    const int bytes = sqlite3_column_bytes(m_stmt.get(), column);
    if (bytes < 0 || (ptr == nullptr && bytes > 0))
    {
        throw std::runtime_error("storage: invalid blob column");
    }
    std::vector<std::uint8_t> out(static_cast<std::size_t>(bytes));
    if (bytes > 0)
    {
        std::memcpy(out.data(), ptr, out.size());
    }
    return out;
}

Transaction::Transaction(sqlite3* db) : m_db{ db }
{
    exec(m_db, "BEGIN IMMEDIATE;");
}

Transaction::~Transaction() noexcept
{
    if (!m_done)
    {
        (void)sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
    }
}

void Transaction::commit()
{
    exec(m_db, "COMMIT;");
    m_done = true;
}

} // namespace keystead::storage::sqlite
