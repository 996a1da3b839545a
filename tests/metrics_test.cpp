#include <chrono>

#include <catch2/catch.hpp>

#include "core/util/metrics.hpp"

using namespace std::chrono_literals;

TEST_CASE("Metrics counters accumulate", "[Metrics]") {
    lumen::Metrics sink;
    sink.increment("decode.ok");
    sink.increment("decode.ok", 4);
    sink.increment("decode.failed");

    CHECK(sink.counter("decode.ok") == 5);
    CHECK(sink.counter("decode.failed") == 1);
    CHECK(sink.counter("never.seen") == 0);
}

TEST_CASE("Metrics timings", "[Metrics]") {
    lumen::Metrics sink;

    SECTION("Count, mean and max are kept") {
        sink.record("store.write", 10ms);
        sink.record("store.write", 30ms);

        auto snap = sink.snapshot();
        const auto& timing = snap.timings.at("store.write");
        CHECK(timing.count == 2);
        CHECK(timing.meanMs() == Approx(20.0));
        CHECK(timing.max_ms == Approx(30.0));
    }

    SECTION("ScopedTimer records when it goes out of scope") {
        {
            lumen::ScopedTimer timer("scan.time", sink);
        }
        CHECK(sink.snapshot().timings.at("scan.time").count == 1);

        sink.reset();
        CHECK(sink.snapshot().timings.empty());
    }
}
