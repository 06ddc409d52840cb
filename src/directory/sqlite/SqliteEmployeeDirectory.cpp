#include "badgegate/directory/sqlite/SqliteEmployeeDirectoryFactory.hpp"

#include "badgegate/auth/Employee.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace badgegate::directory::sqlite
{
namespace
{

using badgegate::auth::DirectoryError;

constexpr std::string_view g_kInMemoryPath{ ":memory:" };

struct DemoEmployee final
{
    const char* cardId;
    const char* displayName;
    const char* role;
};

// Card-less rows can only log in through the manual fallback.
constexpr DemoEmployee g_kDemoEmployees[]{
    { "1234567890", "Max Mustermann", "supervisor" },
    { "0987654321", "Anna Schmidt", "worker" },
    { "test123", "Test User", "worker" },
    { nullptr, "Manual Login", "worker" },
    { "9999999999", "Kiosk Admin", "admin" },
};

struct SqliteDbDeleter final
{
    void operator()(sqlite3* db) const noexcept
    {
        if (db != nullptr)
        {
            (void)sqlite3_close_v2(db);
        }
    }
};

struct SqliteStmtDeleter final
{
    void operator()(sqlite3_stmt* stmt) const noexcept
    {
        if (stmt != nullptr)
        {
            (void)sqlite3_finalize(stmt);
        }
    }
};

using SqliteDbPtr = std::unique_ptr<sqlite3, SqliteDbDeleter>;
using SqliteStmtPtr = std::unique_ptr<sqlite3_stmt, SqliteStmtDeleter>;

[[nodiscard]] std::string sqliteErr(sqlite3* db, const char* prefix)
{
    const char* msg = (db != nullptr) ? sqlite3_errmsg(db) : "no-db";
    std::string out{ prefix };
    out.append(": ");
    out.append(msg);
    return out;
}

void exec(sqlite3* db, const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK)
    {
        std::string msg = sqliteErr(db, "directory: sqlite3_exec failed");
        if (errMsg != nullptr)
        {
            msg.append(" (");
            msg.append(errMsg);
            msg.append(")");
            sqlite3_free(errMsg);
        }
        throw DirectoryError(msg);
    }
}

[[nodiscard]] SqliteDbPtr openDb(const std::filesystem::path& path)
{
    if (path != std::filesystem::path{ g_kInMemoryPath } && path.has_parent_path())
    {
        std::error_code ec{};
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
        {
            throw DirectoryError("directory: cannot create " + path.parent_path().string() + ": " + ec.message());
        }
    }

    sqlite3* raw = nullptr;
    const std::string filename = path.string();
    const int rc = sqlite3_open_v2(filename.c_str(), &raw,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    SqliteDbPtr db{ raw };
    if (rc != SQLITE_OK || !db)
    {
        throw DirectoryError(sqliteErr(raw, "directory: sqlite3_open_v2 failed"));
    }
    return db;
}

[[nodiscard]] SqliteStmtPtr prepare(sqlite3* db, const char* sql)
{
    sqlite3_stmt* rawStmt = nullptr;
    const int prepRc = sqlite3_prepare_v2(db, sql, -1, &rawStmt, nullptr);
    SqliteStmtPtr stmt{ rawStmt };
    if (prepRc != SQLITE_OK || !stmt)
    {
        throw DirectoryError(sqliteErr(db, "directory: sqlite3_prepare_v2 failed"));
    }
    return stmt;
}

void bindText(sqlite3* db, sqlite3_stmt* stmt, int index, std::string_view value)
{
    if (sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK)
    {
        throw DirectoryError(sqliteErr(db, "directory: bind text failed"));
    }
}

void bindInt64(sqlite3* db, sqlite3_stmt* stmt, int index, std::int64_t value)
{
    if (sqlite3_bind_int64(stmt, index, value) != SQLITE_OK)
    {
        throw DirectoryError(sqliteErr(db, "directory: bind int failed"));
    }
}

void stepDone(sqlite3* db, sqlite3_stmt* stmt, const char* what)
{
    if (sqlite3_step(stmt) != SQLITE_DONE)
    {
        throw DirectoryError(sqliteErr(db, what));
    }
}

[[nodiscard]] std::string columnText(sqlite3_stmt* stmt, int column)
{
    const auto* text = sqlite3_column_text(stmt, column);
    if (text == nullptr)
    {
        return {};
    }
    const auto bytes = static_cast<std::size_t>(sqlite3_column_bytes(stmt, column));
    return std::string{ reinterpret_cast<const char*>(text), bytes };
}

[[nodiscard]] std::string_view trim(std::string_view s) noexcept
{
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string_view::npos)
    {
        return {};
    }
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1U);
}

// Comma separated; an empty column means "role defaults".
[[nodiscard]] badgegate::auth::PermissionSet parsePermissions(std::string_view column, badgegate::auth::Role role)
{
    badgegate::auth::PermissionSet out{};
    while (!column.empty())
    {
        const auto comma = column.find(',');
        const auto item = trim(column.substr(0, comma));
        if (!item.empty())
        {
            out.emplace(item);
        }
        if (comma == std::string_view::npos)
        {
            break;
        }
        column.remove_prefix(comma + 1U);
    }

    if (out.empty())
    {
        return badgegate::auth::defaultPermissionsFor(role);
    }
    return out;
}

void ensureSchema(sqlite3* db)
{
    exec(db, "CREATE TABLE IF NOT EXISTS employees ("
             " id INTEGER PRIMARY KEY AUTOINCREMENT,"
             " card_id TEXT UNIQUE,"
             " display_name TEXT NOT NULL UNIQUE,"
             " role TEXT NOT NULL DEFAULT 'worker',"
             " language TEXT NOT NULL DEFAULT 'de',"
             " active INTEGER NOT NULL DEFAULT 1,"
             " permissions TEXT,"
             " last_login TEXT,"
             " login_count INTEGER NOT NULL DEFAULT 0"
             ");");
    exec(db, "CREATE TABLE IF NOT EXISTS clock_events ("
             " id INTEGER PRIMARY KEY AUTOINCREMENT,"
             " employee_id INTEGER NOT NULL REFERENCES employees(id),"
             " kind TEXT NOT NULL CHECK(kind IN ('in', 'out')),"
             " at TEXT NOT NULL"
             ");");
}

void seedDemo(sqlite3* db)
{
    auto stmt = prepare(db, "INSERT OR IGNORE INTO employees(card_id, display_name, role) VALUES (?, ?, ?);");
    for (const auto& demo : g_kDemoEmployees)
    {
        (void)sqlite3_reset(stmt.get());
        (void)sqlite3_clear_bindings(stmt.get());
        if (demo.cardId != nullptr)
        {
            bindText(db, stmt.get(), 1, demo.cardId);
        }
        bindText(db, stmt.get(), 2, demo.displayName);
        bindText(db, stmt.get(), 3, demo.role);
        stepDone(db, stmt.get(), "directory: seed employee failed");
    }
}

class SqliteEmployeeDirectory final : public badgegate::auth::IEmployeeDirectory
{
public:
    explicit SqliteEmployeeDirectory(SqliteDbPtr db) : m_db(std::move(db))
    {
    }

    [[nodiscard]] std::optional<badgegate::auth::EmployeeRecord> lookupEmployee(std::string_view cardId) override
    {
        return lookupBy("SELECT id, display_name, role, language, active, permissions FROM employees"
                        " WHERE card_id = ?;",
                        cardId);
    }

    [[nodiscard]] std::optional<badgegate::auth::EmployeeRecord>
    lookupByDisplayName(std::string_view displayName) override
    {
        return lookupBy("SELECT id, display_name, role, language, active, permissions FROM employees"
                        " WHERE display_name = ?;",
                        displayName);
    }

    void recordLastLogin(std::int64_t employeeId) override
    {
        std::lock_guard<std::mutex> lock{ m_mutex };
        auto stmt = prepare(m_db.get(), "UPDATE employees SET last_login = datetime('now'),"
                                        " login_count = login_count + 1 WHERE id = ?;");
        bindInt64(m_db.get(), stmt.get(), 1, employeeId);
        stepDone(m_db.get(), stmt.get(), "directory: update last login failed");
    }

    void recordClockEvent(std::int64_t employeeId, badgegate::auth::ClockEventKind kind) override
    {
        std::lock_guard<std::mutex> lock{ m_mutex };
        auto stmt =
            prepare(m_db.get(), "INSERT INTO clock_events(employee_id, kind, at) VALUES (?, ?, datetime('now'));");
        bindInt64(m_db.get(), stmt.get(), 1, employeeId);
        bindText(m_db.get(), stmt.get(), 2, badgegate::auth::clockEventName(kind));
        stepDone(m_db.get(), stmt.get(), "directory: insert clock event failed");
    }

private:
    [[nodiscard]] std::optional<badgegate::auth::EmployeeRecord> lookupBy(const char* sql, std::string_view key)
    {
        std::lock_guard<std::mutex> lock{ m_mutex };
        auto stmt = prepare(m_db.get(), sql);
        bindText(m_db.get(), stmt.get(), 1, key);

        const int stepRc = sqlite3_step(stmt.get());
        if (stepRc == SQLITE_DONE)
        {
            return std::nullopt;
        }
        if (stepRc != SQLITE_ROW)
        {
            throw DirectoryError(sqliteErr(m_db.get(), "directory: select employee failed"));
        }

        const std::string roleText = columnText(stmt.get(), 2);
        const auto role = badgegate::auth::roleFromString(roleText);
        if (!role.has_value())
        {
            throw DirectoryError("directory: unknown role '" + roleText + "'");
        }

        badgegate::auth::EmployeeRecord out{};
        out.id = sqlite3_column_int64(stmt.get(), 0);
        out.displayName = columnText(stmt.get(), 1);
        out.role = *role;
        out.language = columnText(stmt.get(), 3);
        out.active = sqlite3_column_int(stmt.get(), 4) != 0;
        out.permissions = parsePermissions(columnText(stmt.get(), 5), *role);
        return out;
    }

    std::mutex m_mutex;
    SqliteDbPtr m_db;
};

} // namespace

[[nodiscard]] std::unique_ptr<badgegate::auth::IEmployeeDirectory>
makeSqliteEmployeeDirectory(const std::filesystem::path& databasePath, bool seedDemoEmployees)
{
    auto db = openDb(databasePath);
    ensureSchema(db.get());
    if (seedDemoEmployees)
    {
        seedDemo(db.get());
    }
    return std::make_unique<SqliteEmployeeDirectory>(std::move(db));
}

} // namespace badgegate::directory::sqlite
