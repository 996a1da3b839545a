#include <sstream>

#include <catch2/catch.hpp>

#include "core/store/migrations.hpp"
#include "test_support.hpp"
#include "tools/migrate_command.hpp"

using namespace lumen::tools;
using namespace lumen::store;

namespace {

class MigrateCommandFixture {
protected:
    /// A store file left at the given schema version
    std::filesystem::path makeStore(int version) {
        auto file = dir_ / "SwiftView_thumbs.db";
        auto connection =
            SqliteConnection::open(file, ConnectionOptions{.mode = OpenMode::ReadWriteCreate});
        REQUIRE(connection.has_value());
        if (version > 0) {
            REQUIRE(upgrade(*connection).has_value());
            REQUIRE(downgrade(*connection, version).has_value());
        }
        return file;
    }

    lumen::test::TempDir dir_;
    std::ostringstream out_;
    std::ostringstream err_;
};

}  // namespace

TEST_CASE_METHOD(MigrateCommandFixture, "migrate", "[MigrateCommand]") {
    SECTION("Old store is brought to the latest version") {
        auto file = makeStore(1);
        CHECK(runMigrate(file, out_, err_) == kExitOk);
        CHECK(out_.str() ==
              "Current user_version: 1\n"
              "Applied migration to v2\n"
              "Applied migration to v3\n"
              "Migrated to user_version: 3 (latest 3)\n");
        CHECK(err_.str().empty());
    }

    SECTION("Current store is a no-op") {
        auto file = makeStore(latestVersion());
        CHECK(runMigrate(file, out_, err_) == kExitOk);
        CHECK(out_.str() ==
              "Current user_version: 3\n"
              "Migrated to user_version: 3 (latest 3)\n");
    }

    SECTION("Missing file fails without creating it") {
        CHECK(runMigrate(dir_ / "absent.db", out_, err_) == kExitFailure);
        CHECK(err_.str().find("Store file does not exist") != std::string::npos);
        CHECK_FALSE(std::filesystem::exists(dir_ / "absent.db"));
    }

    SECTION("Newer store fails") {
        auto file = makeStore(0);
        {
            auto connection = SqliteConnection::open(file, ConnectionOptions{});
            REQUIRE(connection.has_value());
            REQUIRE(connection->setUserVersion(latestVersion() + 2).has_value());
        }
        CHECK(runMigrate(file, out_, err_) == kExitFailure);
        CHECK(err_.str().find("Migration failed") != std::string::npos);
    }
}

TEST_CASE_METHOD(MigrateCommandFixture, "status lists pending steps", "[MigrateCommand]") {
    auto file = makeStore(2);
    CHECK(runStatus(file, out_, err_) == kExitOk);
    CHECK(out_.str() ==
          "Current user_version: 2\n"
          "Latest user_version: 3\n"
          "Pending steps: 1\n"
          "  v2 -> v3: index mtime and created_at\n");
}

TEST_CASE_METHOD(MigrateCommandFixture, "downgrade checks its target", "[MigrateCommand]") {
    auto file = makeStore(latestVersion());
    CHECK(runDowngrade(file, 7, out_, err_) == kExitUsage);
    CHECK(runDowngrade(file, -1, out_, err_) == kExitUsage);

    CHECK(runDowngrade(file, 1, out_, err_) == kExitOk);
    CHECK(out_.str().find("Downgraded to user_version: 1") != std::string::npos);
}
