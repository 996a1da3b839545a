/// @file store_operator.cpp
/// @brief StoreOperator implementation

#include "store_operator.hpp"

namespace lumen::store {

StoreOperator::StoreOperator(StoreOperatorConfig config)
    : config_(std::move(config)), executor_("lumen-store") {
    LOG_DEBUG("StoreOperator started for {}", config_.db_path.string());
}

StoreOperator::~StoreOperator() {
    shutdown();
}

StoreWork<void> StoreOperator::batchWork(std::vector<StoreWork<void>> works) {
    return [works = std::move(works)](SqliteConnection& connection) -> StoreResult<void> {
        for (const auto& work : works) {
            if (auto done = invoke<void>(work, connection); !done) {
                return done;
            }
        }
        return {};
    };
}

std::future<StoreResult<void>> StoreOperator::scheduleWriteBatch(std::vector<StoreWork<void>> works) {
    return scheduleWrite<void>(batchWork(std::move(works)));
}

void StoreOperator::scheduleWriteBatch(std::vector<StoreWork<void>> works,
                                       StoreCompletion<void> done) {
    scheduleWrite<void>(batchWork(std::move(works)), std::move(done));
}

void StoreOperator::shutdown() {
    executor_.shutdown();
}

std::chrono::milliseconds StoreOperator::backoffDelay(int attempt) const noexcept {
    // base * 2^(attempt-1), with the shift capped to keep the value sane
    int shift = attempt - 1 < 10 ? attempt - 1 : 10;
    return config_.backoff_base * (1 << shift);
}

}  // namespace lumen::store
