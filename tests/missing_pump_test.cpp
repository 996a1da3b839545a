#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

#include <catch2/catch.hpp>

#include "core/engine/missing_pump.hpp"
#include "test_support.hpp"

using lumen::SerialExecutor;
using lumen::engine::MissingPump;
using lumen::engine::PumpConfig;

namespace {

/// Run a function on the executor and wait for its result
template <typename F>
auto on_strand(SerialExecutor& strand, F&& function) -> decltype(function()) {
    using R = decltype(function());
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(function));
    auto future = task->get_future();
    if (!strand.post([task] { (*task)(); })) {
        throw std::runtime_error("strand is not accepting work");
    }
    return future.get();
}

std::vector<std::filesystem::path> numbered(size_t count) {
    std::vector<std::filesystem::path> paths;
    for (size_t i = 0; i < count; ++i) {
        paths.emplace_back("/pics/" + std::to_string(i) + ".jpg");
    }
    return paths;
}

std::vector<std::string> names(const std::vector<std::filesystem::path>& paths) {
    std::vector<std::string> result;
    for (const auto& path : paths) {
        result.push_back(path.string());
    }
    return result;
}

/// The pump lives on its own strand; assertions stay on the test thread
class PumpFixture {
public:
    PumpFixture() { build(PumpConfig{}); }

    ~PumpFixture() {
        strand_.shutdown();
        pump_.reset();
    }

protected:
    void build(PumpConfig config, std::string fail_on = {}) {
        on_strand(strand_, [this, config, fail_on] {
            pump_ = std::make_unique<MissingPump>(
                strand_, config, [this, fail_on](const std::filesystem::path& path) {
                    submitted_.push_back(path.string());
                    if (!fail_on.empty() && path == fail_on) {
                        throw std::runtime_error("rejected");
                    }
                });
            return 0;
        });
    }

    std::vector<std::string> submitted() {
        return on_strand(strand_, [this] { return submitted_; });
    }

    template <typename F>
    auto pump(F&& function) {
        return on_strand(strand_, [this, &function] { return function(*pump_); });
    }

    SerialExecutor strand_{"pump-test"};
    std::unique_ptr<MissingPump> pump_;
    std::vector<std::string> submitted_;  // strand only
};

}  // namespace

TEST_CASE_METHOD(PumpFixture, "The pump drains in batches", "[MissingPump]") {
    auto paths = numbered(20);
    CHECK(pump([&](MissingPump& p) { return p.enqueue(paths); }) == 20);

    REQUIRE(lumen::test::waitFor(
        [&] { return pump([](MissingPump& p) { return p.drained(); }) == 20; }));
    CHECK(submitted() == names(paths));
    CHECK(pump([](MissingPump& p) { return p.ticks(); }) == 3);
    CHECK_FALSE(pump([](MissingPump& p) { return p.armed(); }));
}

TEST_CASE_METHOD(PumpFixture, "A path is queued at most once until drained", "[MissingPump]") {
    auto [first, again, queued, size] = pump([](MissingPump& p) {
        bool first = p.enqueue("/pics/a.jpg");
        bool again = p.enqueue("/pics/a.jpg");
        return std::tuple{first, again, p.contains("/pics/a.jpg"), p.size()};
    });
    CHECK(first);
    CHECK_FALSE(again);
    CHECK(queued);
    CHECK(size == 1);

    REQUIRE(lumen::test::waitFor([&] { return submitted().size() == 1; }));

    // Once drained it may be queued again
    CHECK(pump([](MissingPump& p) { return p.enqueue("/pics/a.jpg"); }));
    REQUIRE(lumen::test::waitFor([&] { return submitted().size() == 2; }));
}

TEST_CASE_METHOD(PumpFixture, "Front insertion", "[MissingPump]") {
    SECTION("Keeps order and moves queued paths forward") {
        auto head = pump([](MissingPump& p) {
            p.enqueue(std::vector<std::filesystem::path>{"/a", "/b", "/c"});
            return p.enqueueFront({"/x", "/c", "/y", "/z"}, 2);
        });
        CHECK(head == 2);

        REQUIRE(lumen::test::waitFor([&] { return submitted().size() == 6; }));
        CHECK(submitted() == std::vector<std::string>{"/x", "/c", "/a", "/b", "/y", "/z"});
    }

    SECTION("The limit is capped") {
        auto paths = numbered(300);
        auto head = pump([&](MissingPump& p) { return p.enqueueFront(paths, 1000); });
        CHECK(head == lumen::engine::kMaxPrefetchLimit);

        REQUIRE(lumen::test::waitFor([&] { return submitted().size() == 300; }));
        CHECK(submitted() == names(paths));
    }
}

TEST_CASE_METHOD(PumpFixture, "remove and clear drop queued paths", "[MissingPump]") {
    build(PumpConfig{.batch_size = 8, .interval = std::chrono::milliseconds(200)});

    auto [removed, removed_again, size] = pump([](MissingPump& p) {
        p.enqueue(std::vector<std::filesystem::path>{"/a", "/b", "/c"});
        bool removed = p.remove("/b");
        bool removed_again = p.remove("/b");
        return std::tuple{removed, removed_again, p.size()};
    });
    CHECK(removed);
    CHECK_FALSE(removed_again);
    CHECK(size == 2);

    REQUIRE(lumen::test::waitFor([&] { return submitted().size() == 2; }));
    CHECK(submitted() == std::vector<std::string>{"/a", "/c"});

    auto dropped = pump([](MissingPump& p) {
        p.enqueue(std::vector<std::filesystem::path>{"/d", "/e"});
        return p.clear();
    });
    CHECK(dropped == 2);
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    CHECK(submitted().size() == 2);
}

TEST_CASE_METHOD(PumpFixture, "A failing submit does not stop the pump", "[MissingPump]") {
    build(PumpConfig{.batch_size = 2}, "/bad");

    pump([](MissingPump& p) {
        return p.enqueue(std::vector<std::filesystem::path>{"/bad", "/ok1", "/ok2"});
    });
    REQUIRE(lumen::test::waitFor([&] { return submitted().size() == 3; }));
}
