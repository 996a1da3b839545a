#include <atomic>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

#include "core/store/store_operator.hpp"
#include "test_support.hpp"

using namespace lumen::store;

namespace {

StoreResult<void> create_counter(SqliteConnection& connection) {
    return connection.exec(
        "CREATE TABLE IF NOT EXISTS counter (id INTEGER PRIMARY KEY, value INTEGER NOT NULL);"
        "INSERT OR IGNORE INTO counter (id, value) VALUES (1, 0);");
}

StoreResult<void> increment(SqliteConnection& connection) {
    // Read-modify-write: only correct if writers never interleave
    auto select = LUMEN_TRY(connection.prepare("SELECT value FROM counter WHERE id = 1;"));
    if (!LUMEN_TRY(select.step())) {
        return std::unexpected(StoreError(StoreErrorCode::NotFound, "counter row"));
    }
    int64_t value = select.columnInt64(0);
    auto update = LUMEN_TRY(connection.prepare("UPDATE counter SET value = ?1 WHERE id = 1;"));
    update.bindInt64(1, value + 1);
    return update.run();
}

StoreResult<int64_t> read_counter(SqliteConnection& connection) {
    auto select = LUMEN_TRY(connection.prepare("SELECT value FROM counter WHERE id = 1;"));
    if (!LUMEN_TRY(select.step())) {
        return std::unexpected(StoreError(StoreErrorCode::NotFound, "counter row"));
    }
    return select.columnInt64(0);
}

class StoreOperatorFixture {
protected:
    StoreOperatorConfig config(int busy_timeout_ms, int max_attempts,
                               std::chrono::milliseconds backoff) const {
        return StoreOperatorConfig{.db_path = dir_ / "store.db",
                                   .busy_timeout_ms = busy_timeout_ms,
                                   .max_attempts = max_attempts,
                                   .backoff_base = backoff};
    }

    /// Second connection holding the write lock, as another process would
    SqliteConnection lockFile() const {
        auto connection = SqliteConnection::open(
            dir_ / "store.db", ConnectionOptions{.mode = OpenMode::ReadWrite, .busy_timeout_ms = 0});
        REQUIRE(connection.has_value());
        REQUIRE(connection->beginImmediate().has_value());
        return std::move(*connection);
    }

    lumen::test::TempDir dir_;
};

}  // namespace

TEST_CASE_METHOD(StoreOperatorFixture, "Concurrent writers are serialized", "[StoreOperator]") {
    StoreOperator op(config(5000, 3, std::chrono::milliseconds(10)));
    REQUIRE(op.scheduleWrite<void>(create_counter).get().has_value());

    constexpr int kThreads = 8;
    constexpr int kPerThread = 25;
    std::atomic<int> failures{0};
    {
        std::vector<std::jthread> writers;
        for (int t = 0; t < kThreads; ++t) {
            writers.emplace_back([&] {
                std::vector<std::future<StoreResult<void>>> pending;
                for (int i = 0; i < kPerThread; ++i) {
                    pending.push_back(op.scheduleWrite<void>(increment));
                }
                for (auto& f : pending) {
                    if (!f.get()) {
                        failures.fetch_add(1);
                    }
                }
            });
        }
    }

    CHECK(failures.load() == 0);
    auto value = op.scheduleRead<int64_t>(read_counter).get();
    REQUIRE(value.has_value());
    CHECK(*value == kThreads * kPerThread);
}

TEST_CASE_METHOD(StoreOperatorFixture, "Failed work rolls back", "[StoreOperator]") {
    StoreOperator op(config(5000, 3, std::chrono::milliseconds(10)));
    REQUIRE(op.scheduleWrite<void>(create_counter).get().has_value());

    auto failed = op.scheduleWrite<void>([](SqliteConnection& connection) -> StoreResult<void> {
                        LUMEN_TRY_VOID(increment(connection));
                        return std::unexpected(StoreError(StoreErrorCode::Corrupt, "abort"));
                    }).get();
    REQUIRE_FALSE(failed.has_value());
    CHECK(failed.error().code() == StoreErrorCode::Corrupt);

    auto value = op.readSync<int64_t>(read_counter);
    REQUIRE(value.has_value());
    CHECK(*value == 0);
}

TEST_CASE_METHOD(StoreOperatorFixture, "A batch is one transaction", "[StoreOperator]") {
    StoreOperator op(config(5000, 3, std::chrono::milliseconds(10)));
    REQUIRE(op.scheduleWrite<void>(create_counter).get().has_value());

    std::vector<StoreWork<void>> works{increment, increment,
                                       [](SqliteConnection&) -> StoreResult<void> {
                                           return std::unexpected(
                                               StoreError(StoreErrorCode::Database, "third"));
                                       }};
    CHECK_FALSE(op.scheduleWriteBatch(works).get().has_value());
    CHECK(op.readSync<int64_t>(read_counter).value_or(-1) == 0);

    works.pop_back();
    CHECK(op.scheduleWriteBatch(works).get().has_value());
    CHECK(op.readSync<int64_t>(read_counter).value_or(-1) == 2);
}

TEST_CASE_METHOD(StoreOperatorFixture, "A held lock exhausts the retry budget", "[StoreOperator]") {
    StoreOperator op(config(10, 3, std::chrono::milliseconds(5)));
    REQUIRE(op.scheduleWrite<void>(create_counter).get().has_value());

    auto holder = lockFile();
    auto result = op.scheduleWrite<void>(increment).get();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == StoreErrorCode::Busy);
    CHECK(op.retryCount() == 2u);
    holder.rollback();
}

TEST_CASE_METHOD(StoreOperatorFixture, "Busy work retries until the lock is released", "[StoreOperator]") {
    StoreOperator op(config(10, 20, std::chrono::milliseconds(10)));
    REQUIRE(op.scheduleWrite<void>(create_counter).get().has_value());

    auto holder = lockFile();
    auto pending = op.scheduleWrite<void>(increment);
    REQUIRE(lumen::test::waitFor([&] { return op.retryCount() > 0; }));
    holder.rollback();

    auto result = pending.get();
    REQUIRE(result.has_value());
    CHECK(op.readSync<int64_t>(read_counter).value_or(-1) == 1);
}

TEST_CASE_METHOD(StoreOperatorFixture, "Work after shutdown fails", "[StoreOperator]") {
    StoreOperator op(config(5000, 3, std::chrono::milliseconds(10)));
    REQUIRE(op.scheduleWrite<void>(create_counter).get().has_value());
    op.shutdown();
    CHECK_FALSE(op.accepting());

    auto result = op.scheduleWrite<void>(increment).get();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == StoreErrorCode::ShutDown);

    bool called = false;
    op.scheduleRead<int64_t>(read_counter, [&](StoreResult<int64_t> r) {
        called = true;
        CHECK_FALSE(r.has_value());
    });
    CHECK(called);
}

TEST_CASE_METHOD(StoreOperatorFixture, "Throwing work becomes a database error", "[StoreOperator]") {
    StoreOperator op(config(5000, 3, std::chrono::milliseconds(10)));
    auto result = op.scheduleRead<int>([](SqliteConnection&) -> StoreResult<int> {
                        throw std::runtime_error("boom");
                    }).get();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == StoreErrorCode::Database);
}
