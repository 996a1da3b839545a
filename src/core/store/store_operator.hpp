/// @file store_operator.hpp
/// @brief Serializing owner of all access to one store file
///
/// Every unit of work runs on the operator's single thread with a connection
/// of its own, opened for that unit and closed when it finishes. Writes run
/// inside BEGIN IMMEDIATE and are retried with exponential backoff while the
/// file is locked by another process.

#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <thread>
#include <vector>

#include "../util/logger.hpp"
#include "../util/metrics.hpp"
#include "../util/serial_executor.hpp"
#include "sqlite_connection.hpp"
#include "store_error.hpp"

namespace lumen::store {

struct StoreOperatorConfig {
    std::filesystem::path db_path;
    int busy_timeout_ms = 5000;
    int max_attempts = 3;
    std::chrono::milliseconds backoff_base{50};
};

/// @brief Work executed with a fresh connection
template <typename T>
using StoreWork = std::function<StoreResult<T>(SqliteConnection&)>;

/// @brief Receives the result on the operator thread
template <typename T>
using StoreCompletion = std::function<void(StoreResult<T>)>;

class StoreOperator {
public:
    explicit StoreOperator(StoreOperatorConfig config);

    /// @brief Drains queued work
    ~StoreOperator();

    StoreOperator(const StoreOperator&) = delete;
    StoreOperator& operator=(const StoreOperator&) = delete;
    StoreOperator(StoreOperator&&) = delete;
    StoreOperator& operator=(StoreOperator&&) = delete;

    /// @brief Run work in one BEGIN IMMEDIATE transaction
    template <typename T>
    [[nodiscard]] std::future<StoreResult<T>> scheduleWrite(StoreWork<T> work) {
        return schedule<T>(std::move(work), Kind::Write);
    }

    template <typename T>
    void scheduleWrite(StoreWork<T> work, StoreCompletion<T> done) {
        enqueue<T>(std::move(work), Kind::Write, std::move(done));
    }

    /// @brief Run several mutations in a single transaction; the first failure rolls back all
    [[nodiscard]] std::future<StoreResult<void>>
    scheduleWriteBatch(std::vector<StoreWork<void>> works);

    void scheduleWriteBatch(std::vector<StoreWork<void>> works, StoreCompletion<void> done);

    /// @brief Run read-only work, ordered with the writes
    template <typename T>
    [[nodiscard]] std::future<StoreResult<T>> scheduleRead(StoreWork<T> work) {
        return schedule<T>(std::move(work), Kind::Read);
    }

    template <typename T>
    void scheduleRead(StoreWork<T> work, StoreCompletion<T> done) {
        enqueue<T>(std::move(work), Kind::Read, std::move(done));
    }

    /// @brief Run work that manages its own transactions (migrations, VACUUM)
    template <typename T>
    [[nodiscard]] std::future<StoreResult<T>> scheduleSession(StoreWork<T> work) {
        return schedule<T>(std::move(work), Kind::Session);
    }

    /// @brief Run read-only work on the calling thread with a read-only connection
    ///
    /// Does not wait for queued writes; relies on WAL for a consistent snapshot.
    template <typename T>
    [[nodiscard]] StoreResult<T> readSync(const StoreWork<T>& work) const {
        return execute<T>(work, Kind::ReadOnly);
    }

    /// @brief Stop accepting work and finish what is queued
    void shutdown();

    [[nodiscard]] bool accepting() const { return executor_.accepting(); }

    [[nodiscard]] const StoreOperatorConfig& config() const noexcept { return config_; }

    /// @brief Number of attempts repeated because of lock contention
    [[nodiscard]] uint64_t retryCount() const noexcept { return retries_.load(); }

private:
    enum class Kind {
        Write,     // Fresh read-write connection inside BEGIN IMMEDIATE
        Read,      // Fresh read-write connection, no transaction
        Session,   // Fresh read-write connection, work handles transactions
        ReadOnly,  // Fresh read-only connection
    };

    template <typename T>
    [[nodiscard]] std::future<StoreResult<T>> schedule(StoreWork<T> work, Kind kind) {
        auto promise = std::make_shared<std::promise<StoreResult<T>>>();
        auto future = promise->get_future();
        enqueue<T>(std::move(work), kind,
                   [promise](StoreResult<T> result) { promise->set_value(std::move(result)); });
        return future;
    }

    template <typename T>
    void enqueue(StoreWork<T> work, Kind kind, StoreCompletion<T> done) {
        auto shared_done = std::make_shared<StoreCompletion<T>>(std::move(done));
        bool posted = executor_.post([this, work = std::move(work), kind, shared_done] {
            complete<T>(*shared_done, execute<T>(work, kind));
        });
        if (!posted) {
            complete<T>(*shared_done,
                        std::unexpected(StoreError(StoreErrorCode::ShutDown,
                                                   config_.db_path.filename().string())));
        }
    }

    template <typename T>
    static void complete(StoreCompletion<T>& done, StoreResult<T> result) {
        if (!done) {
            if (!result) {
                LOG_WARN("Unobserved store failure: {}", result.error().format());
            }
            return;
        }
        try {
            done(std::move(result));
        } catch (const std::exception& e) {
            LOG_ERROR("Store completion threw: {}", e.what());
        }
    }

    /// @brief Run work with retries on lock contention
    template <typename T>
    [[nodiscard]] StoreResult<T> execute(const StoreWork<T>& work, Kind kind) const {
        const int max_attempts = config_.max_attempts > 0 ? config_.max_attempts : 1;

        for (int attempt = 1;; ++attempt) {
            StoreResult<T> result = attemptOnce<T>(work, kind);
            if (result || result.error().code() != StoreErrorCode::Busy) {
                return result;
            }
            if (attempt >= max_attempts) {
                metrics().increment("store.busy_exhausted");
                LOG_WARN("Store busy after {} attempts: {}", attempt, result.error().format());
                return std::unexpected(result.error().withContext(
                    fmt::format("gave up after {} attempts", attempt)));
            }

            auto delay = backoffDelay(attempt);
            retries_.fetch_add(1);
            metrics().increment("store.retry");
            LOG_DEBUG("Store busy (attempt {}), retrying in {} ms", attempt, delay.count());
            std::this_thread::sleep_for(delay);
        }
    }

    template <typename T>
    [[nodiscard]] StoreResult<T> attemptOnce(const StoreWork<T>& work, Kind kind) const {
        ConnectionOptions options{.mode = kind == Kind::ReadOnly ? OpenMode::ReadOnly
                                                                 : OpenMode::ReadWriteCreate,
                                  .busy_timeout_ms = config_.busy_timeout_ms,
                                  .wal = kind != Kind::ReadOnly};
        auto connection = SqliteConnection::open(config_.db_path, options);
        if (!connection) {
            return std::unexpected(connection.error());
        }

        if (kind == Kind::Write) {
            if (auto begun = connection->beginImmediate(); !begun) {
                return std::unexpected(begun.error());
            }
        }

        StoreResult<T> result = invoke<T>(work, *connection);
        if (!result) {
            connection->rollback();
            return result;
        }

        if (kind == Kind::Write) {
            if (auto committed = connection->commit(); !committed) {
                connection->rollback();
                return std::unexpected(committed.error());
            }
        }
        return result;
    }

    template <typename T>
    [[nodiscard]] static StoreResult<T> invoke(const StoreWork<T>& work,
                                               SqliteConnection& connection) {
        try {
            return work(connection);
        } catch (const std::exception& e) {
            return std::unexpected(
                StoreError(StoreErrorCode::Database, fmt::format("store work threw: {}", e.what())));
        }
    }

    [[nodiscard]] std::chrono::milliseconds backoffDelay(int attempt) const noexcept;

    [[nodiscard]] static StoreWork<void> batchWork(std::vector<StoreWork<void>> works);

    StoreOperatorConfig config_;
    mutable std::atomic<uint64_t> retries_{0};

    // Last member: drained before the configuration goes away
    SerialExecutor executor_;
};

}  // namespace lumen::store
