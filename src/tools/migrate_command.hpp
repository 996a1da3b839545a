/// @file migrate_command.hpp
/// @brief Commands of the lumen-migrate tool
///
/// Each command works on one store file and reports to the given streams, so
/// the tool's main only parses arguments.

#pragma once

#include <filesystem>
#include <iosfwd>

namespace lumen::tools {

inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitUsage = 2;

/// @brief Apply pending migrations to an existing store file
/// @return kExitOk on success or when already current, kExitFailure otherwise
int runMigrate(const std::filesystem::path& store_file, std::ostream& out, std::ostream& err);

/// @brief Report the current and latest version without touching the file
int runStatus(const std::filesystem::path& store_file, std::ostream& out, std::ostream& err);

/// @brief Step an existing store file down to target_version
/// @return kExitUsage if the target is outside [0, latest]
int runDowngrade(const std::filesystem::path& store_file, int target_version, std::ostream& out,
                 std::ostream& err);

}  // namespace lumen::tools
