#ifndef INCLUDE_BADGEGATE_DIRECTORY_SQLITE_SQLITEEMPLOYEEDIRECTORYFACTORY_HPP
#define INCLUDE_BADGEGATE_DIRECTORY_SQLITE_SQLITEEMPLOYEEDIRECTORYFACTORY_HPP

#include "badgegate/auth/IEmployeeDirectory.hpp"
#include <filesystem>
#include <memory>

namespace badgegate::directory::sqlite
{

// Opens (creating if needed) the employee database at `databasePath`; ":memory:" keeps it in RAM.
// With `seedDemoEmployees` the demo staff is inserted unless already present.
// Throws badgegate::auth::DirectoryError when the database cannot be opened or migrated.
[[nodiscard]] std::unique_ptr<badgegate::auth::IEmployeeDirectory>
makeSqliteEmployeeDirectory(const std::filesystem::path& databasePath, bool seedDemoEmployees = false);

} // namespace badgegate::directory::sqlite

#endif // INCLUDE_BADGEGATE_DIRECTORY_SQLITE_SQLITEEMPLOYEEDIRECTORYFACTORY_HPP
