#include "badgegate/directory/sqlite/SqliteEmployeeDirectoryFactory.hpp"

#include "TestUtils.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

namespace
{

using badgegate::auth::ClockEventKind;
using badgegate::auth::DirectoryError;
using badgegate::auth::Role;

struct RawDbCloser final
{
    void operator()(sqlite3* db) const noexcept
    {
        (void)sqlite3_close_v2(db);
    }
};

using RawDb = std::unique_ptr<sqlite3, RawDbCloser>;

class SqliteEmployeeDirectoryTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_FALSE(m_dir.path().empty());
        m_dbPath = m_dir.path() / "data" / "badgegate.db";
    }

    [[nodiscard]] RawDb openRaw() const
    {
        sqlite3* raw{ nullptr };
        EXPECT_EQ(sqlite3_open(m_dbPath.string().c_str(), &raw), SQLITE_OK);
        return RawDb{ raw };
    }

    void execRaw(const std::string& sql) const
    {
        auto db = openRaw();
        char* error{ nullptr };
        EXPECT_EQ(sqlite3_exec(db.get(), sql.c_str(), nullptr, nullptr, &error), SQLITE_OK)
            << (error != nullptr ? error : "");
        sqlite3_free(error);
    }

    [[nodiscard]] std::string queryText(const std::string& sql) const
    {
        auto db = openRaw();
        sqlite3_stmt* stmt{ nullptr };
        EXPECT_EQ(sqlite3_prepare_v2(db.get(), sql.c_str(), -1, &stmt, nullptr), SQLITE_OK);
        std::string out{};
        if (sqlite3_step(stmt) == SQLITE_ROW && sqlite3_column_text(stmt, 0) != nullptr)
        {
            out = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        }
        (void)sqlite3_finalize(stmt);
        return out;
    }

    badgegate::test_utils::ScopedTempDir m_dir{ "badgegate-directory-" }; // NOLINT
    std::filesystem::path m_dbPath;                                        // NOLINT
};

} // namespace

TEST_F(SqliteEmployeeDirectoryTest, CreatesParentDirectoryAndEmptySchema)
{
    auto directory = badgegate::directory::sqlite::makeSqliteEmployeeDirectory(m_dbPath);

    EXPECT_TRUE(std::filesystem::exists(m_dbPath));
    EXPECT_FALSE(directory->lookupEmployee("1234567890").has_value());
    EXPECT_EQ(queryText("SELECT COUNT(*) FROM employees;"), "0");
}

TEST_F(SqliteEmployeeDirectoryTest, DemoSeedProvidesStaff)
{
    auto directory = badgegate::directory::sqlite::makeSqliteEmployeeDirectory(m_dbPath, true);

    const auto max = directory->lookupEmployee("1234567890");
    ASSERT_TRUE(max.has_value());
    EXPECT_EQ(max->displayName, "Max Mustermann");
    EXPECT_EQ(max->role, Role::Supervisor);
    EXPECT_EQ(max->language, "de");
    EXPECT_TRUE(max->active);
    EXPECT_EQ(max->permissions, badgegate::auth::defaultPermissionsFor(Role::Supervisor));

    const auto admin = directory->lookupEmployee("9999999999");
    ASSERT_TRUE(admin.has_value());
    EXPECT_THAT(admin->permissions, ::testing::ElementsAre("*"));

    const auto manual = directory->lookupByDisplayName("Manual Login");
    ASSERT_TRUE(manual.has_value());
    EXPECT_EQ(manual->role, Role::Worker);
}

TEST_F(SqliteEmployeeDirectoryTest, SeedingTwiceKeepsOneCopy)
{
    {
        auto first = badgegate::directory::sqlite::makeSqliteEmployeeDirectory(m_dbPath, true);
    }
    auto second = badgegate::directory::sqlite::makeSqliteEmployeeDirectory(m_dbPath, true);

    EXPECT_EQ(queryText("SELECT COUNT(*) FROM employees;"), "5");
}

TEST_F(SqliteEmployeeDirectoryTest, LookupIsExactMatch)
{
    auto directory = badgegate::directory::sqlite::makeSqliteEmployeeDirectory(m_dbPath, true);

    EXPECT_FALSE(directory->lookupEmployee("123456789").has_value());
    EXPECT_FALSE(directory->lookupEmployee("").has_value());
    EXPECT_FALSE(directory->lookupByDisplayName("anna schmidt").has_value());
    EXPECT_TRUE(directory->lookupByDisplayName("Anna Schmidt").has_value());
}

TEST_F(SqliteEmployeeDirectoryTest, InactiveRowsAreReturnedFlagged)
{
    auto directory = badgegate::directory::sqlite::makeSqliteEmployeeDirectory(m_dbPath, true);
    execRaw("UPDATE employees SET active = 0 WHERE card_id = '0987654321';");

    const auto anna = directory->lookupEmployee("0987654321");
    ASSERT_TRUE(anna.has_value());
    EXPECT_FALSE(anna->active);
}

TEST_F(SqliteEmployeeDirectoryTest, ExplicitPermissionsOverrideRoleDefaults)
{
    auto directory = badgegate::directory::sqlite::makeSqliteEmployeeDirectory(m_dbPath);
    execRaw("INSERT INTO employees(card_id, display_name, role, language, permissions)"
            " VALUES ('4711471147', 'Lena Vogel', 'manager', 'en', 'view_reports, manage_users ,');");

    const auto lena = directory->lookupEmployee("4711471147");
    ASSERT_TRUE(lena.has_value());
    EXPECT_EQ(lena->role, Role::Manager);
    EXPECT_EQ(lena->language, "en");
    EXPECT_THAT(lena->permissions, ::testing::ElementsAre("manage_users", "view_reports"));
}

TEST_F(SqliteEmployeeDirectoryTest, UnknownRoleIsDirectoryError)
{
    auto directory = badgegate::directory::sqlite::makeSqliteEmployeeDirectory(m_dbPath);
    execRaw("INSERT INTO employees(card_id, display_name, role) VALUES ('1212121212', 'Odd Row', 'janitor');");

    EXPECT_THROW((void)directory->lookupEmployee("1212121212"), DirectoryError);
}

TEST_F(SqliteEmployeeDirectoryTest, RecordsLastLoginAndClockEvents)
{
    auto directory = badgegate::directory::sqlite::makeSqliteEmployeeDirectory(m_dbPath, true);
    const auto anna = directory->lookupEmployee("0987654321");
    ASSERT_TRUE(anna.has_value());

    directory->recordLastLogin(anna->id);
    directory->recordLastLogin(anna->id);
    directory->recordClockEvent(anna->id, ClockEventKind::In);
    directory->recordClockEvent(anna->id, ClockEventKind::Out);

    const std::string id{ std::to_string(anna->id) };
    EXPECT_EQ(queryText("SELECT login_count FROM employees WHERE id = " + id + ";"), "2");
    EXPECT_FALSE(queryText("SELECT last_login FROM employees WHERE id = " + id + ";").empty());
    EXPECT_EQ(queryText("SELECT group_concat(kind, ',') FROM (SELECT kind FROM clock_events WHERE employee_id = " +
                        id + " ORDER BY id);"),
              "in,out");
}

TEST(SqliteEmployeeDirectory, InMemoryDatabaseIsSupported)
{
    auto directory = badgegate::directory::sqlite::makeSqliteEmployeeDirectory(":memory:", true);
    EXPECT_TRUE(directory->lookupEmployee("test123").has_value());
}

TEST(SqliteEmployeeDirectory, UnopenablePathThrows)
{
    EXPECT_THROW((void)badgegate::directory::sqlite::makeSqliteEmployeeDirectory("/proc/badgegate/staff.db"),
                 DirectoryError);
}
