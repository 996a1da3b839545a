#include <atomic>
#include <map>
#include <string>

#include <catch2/catch.hpp>

#include "core/engine/bulk_scan.hpp"
#include "core/image/png_codec.hpp"
#include "test_support.hpp"

using namespace lumen::engine;
using lumen::store::CacheEntry;
using lumen::store::ReadPolicy;
using lumen::store::ThumbStore;

namespace {

constexpr lumen::image::TargetSize kBox{256, 195};

CacheEntry entry_for(const std::filesystem::path& path, bool populated) {
    CacheEntry entry{.path = path.string(),
                     .stat = lumen::fs::statFile(path).value(),
                     .width = 16,
                     .height = 16,
                     .thumb_width = kBox.width,
                     .thumb_height = kBox.height,
                     .thumbnail = {}};
    if (populated) {
        entry.thumbnail = lumen::image::encodePng(lumen::test::makeGradient(16, 16)).value();
    }
    return entry;
}

/// Records sink events; checked afterwards on the test thread
struct Collected {
    std::map<std::string, ScanStatus> status;
    size_t chunks = 0;
    size_t chunks_after_summary = 0;
    size_t row_mismatches = 0;
    std::vector<ScanProgress> progress;
    std::optional<ScanSummary> summary;

    ScanSink sink() {
        return ScanSink{
            .chunk =
                [this](std::vector<ScanItem> items) {
                    ++chunks;
                    if (summary) {
                        ++chunks_after_summary;
                    }
                    for (const auto& item : items) {
                        status[item.path.filename().string()] = item.status;
                        if (item.row.has_value() != (item.status != ScanStatus::Missing)) {
                            ++row_mismatches;
                        }
                    }
                },
            .progress = [this](ScanProgress p) { progress.push_back(p); },
            .finished = [this](ScanSummary s) { summary = std::move(s); },
        };
    }
};

class BulkScanFixture {
public:
    BulkScanFixture() {
        for (const char* name : {"valid.png", "pending.png", "missing.png", "stale.png", "boxed.png"}) {
            lumen::test::writePng(dir_ / name, 16, 16);
            paths_.push_back(dir_ / name);
        }
        auto opened = ThumbStore::open(dir_.path());
        if (!opened) {
            FAIL(opened.error().format());
        }
        store_ = std::move(*opened);

        auto stale = entry_for(dir_ / "stale.png", true);
        stale.stat.mtime_ms -= 5000;
        auto boxed = entry_for(dir_ / "boxed.png", true);
        boxed.thumb_width = 128;

        REQUIRE(store_->putThumbnail(entry_for(dir_ / "valid.png", true)).get().has_value());
        REQUIRE(store_->putThumbnail(std::move(stale)).get().has_value());
        REQUIRE(store_->putThumbnail(std::move(boxed)).get().has_value());
        REQUIRE(store_->upsertMeta({entry_for(dir_ / "pending.png", false)}).get().has_value());
    }

protected:
    ScanOptions options(size_t chunk_size, ReadPolicy policy) const {
        return ScanOptions{.chunk_size = chunk_size,
                           .policy = policy,
                           .thumbnail = kBox,
                           .generation = 7,
                           .cancelled = {}};
    }

    lumen::test::TempDir dir_;
    std::vector<std::filesystem::path> paths_;
    std::unique_ptr<ThumbStore> store_;
};

}  // namespace

TEST_CASE_METHOD(BulkScanFixture, "Every file is classified", "[BulkScan]") {
    auto policy = GENERATE(ReadPolicy::ThroughOperator, ReadPolicy::DirectConnection);
    INFO("read policy " << lumen::store::to_string(policy));
    Collected collected;
    auto summary = scanExisting(*store_, paths_, options(800, policy), collected.sink());

    CHECK(collected.status["valid.png"] == ScanStatus::Valid);
    CHECK(collected.status["pending.png"] == ScanStatus::Pending);
    CHECK(collected.status["missing.png"] == ScanStatus::Missing);
    CHECK(collected.status["stale.png"] == ScanStatus::Missing);
    CHECK(collected.status["boxed.png"] == ScanStatus::Missing);

    CHECK(summary.generation == 7u);
    CHECK(summary.total == 5u);
    CHECK(summary.valid == 1u);
    CHECK(summary.pending == 1u);
    CHECK(summary.missing == 3u);
    CHECK_FALSE(summary.cancelled);
    CHECK_FALSE(summary.error.has_value());
    REQUIRE(collected.summary.has_value());
    CHECK(collected.summary->valid == 1u);
    CHECK(collected.row_mismatches == 0);
    CHECK(collected.chunks_after_summary == 0);
}

TEST_CASE_METHOD(BulkScanFixture, "Chunks and progress events", "[BulkScan]") {
    auto policy = GENERATE(ReadPolicy::ThroughOperator, ReadPolicy::DirectConnection);
    INFO("read policy " << lumen::store::to_string(policy));
    Collected collected;
    scanExisting(*store_, paths_, options(2, policy), collected.sink());

    CHECK(collected.chunks == 3u);
    REQUIRE(collected.progress.size() == 4u);
    CHECK(collected.progress.front().done == 0u);
    CHECK(collected.progress[1].done == 2u);
    CHECK(collected.progress.back().done == 5u);
    CHECK(collected.progress.back().total == 5u);
}

TEST_CASE_METHOD(BulkScanFixture, "Unreadable files are skipped", "[BulkScan]") {
    auto policy = GENERATE(ReadPolicy::ThroughOperator, ReadPolicy::DirectConnection);
    INFO("read policy " << lumen::store::to_string(policy));
    paths_.push_back(dir_ / "never-existed.png");
    Collected collected;
    auto summary = scanExisting(*store_, paths_, options(800, policy), collected.sink());

    CHECK(summary.total == 6u);
    CHECK(summary.skipped == 1u);
    CHECK(collected.status.count("never-existed.png") == 0u);
}

TEST_CASE_METHOD(BulkScanFixture, "Cancelling stops between chunks", "[BulkScan]") {
    auto policy = GENERATE(ReadPolicy::ThroughOperator, ReadPolicy::DirectConnection);
    INFO("read policy " << lumen::store::to_string(policy));
    std::atomic<int> polls{0};
    auto opts = options(2, policy);
    opts.cancelled = [&polls] { return polls.fetch_add(1) >= 1; };

    Collected collected;
    auto summary = scanExisting(*store_, paths_, opts, collected.sink());

    CHECK(summary.cancelled);
    CHECK(collected.chunks == 1u);
    REQUIRE(collected.summary.has_value());
    CHECK(collected.summary->cancelled);
}

TEST_CASE("A stopped operator ends the scan", "[BulkScan]") {
    lumen::test::TempDir dir;
    lumen::test::writePng(dir / "a.png", 8, 8);
    auto store = ThumbStore::open(dir.path());
    REQUIRE(store.has_value());
    (*store)->shutdown();

    Collected collected;
    auto summary = scanExisting(**store, {dir / "a.png"},
                                ScanOptions{.policy = ReadPolicy::ThroughOperator},
                                collected.sink());
    CHECK(summary.cancelled);
    REQUIRE(summary.error.has_value());
    CHECK(summary.error->code() == lumen::store::StoreErrorCode::ShutDown);
    CHECK(collected.chunks == 0u);
}

TEST_CASE("No row is missing", "[BulkScan]") {
    CHECK(classifyRow(nullptr, lumen::fs::FileStat{1, 2}, kBox) == ScanStatus::Missing);
}
