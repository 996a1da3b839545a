#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <vector>

#include <catch2/catch.hpp>

#include "core/engine/engine.hpp"
#include "core/util/metrics.hpp"
#include "test_support.hpp"

using namespace lumen::engine;
using lumen::decode::DecodeJob;
using lumen::decode::DecodeResult;
using lumen::store::ReadPolicy;
using lumen::store::ThumbStore;

namespace {

/// Decodes only once opened; lets tests observe the state before results land
class Gate {
public:
    void open() {
        {
            std::lock_guard lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    void wait() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return open_; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
};

template <typename Result>
class Results {
public:
    std::function<void(Result)> callback() {
        return [this](Result result) {
            std::lock_guard lock(mutex_);
            results_.push_back(std::move(result));
        };
    }

    size_t count() const {
        std::lock_guard lock(mutex_);
        return results_.size();
    }

    Result at(size_t index) const {
        std::lock_guard lock(mutex_);
        return results_.at(index);
    }

private:
    mutable std::mutex mutex_;
    std::vector<Result> results_;
};

struct Observed {
    std::mutex mutex;
    std::optional<FolderSnapshot> snapshot;
    std::optional<ScanSummary> scan;
    std::vector<std::filesystem::path> ready;
    std::vector<std::filesystem::path> failed;

    EngineEvents events() {
        return EngineEvents{
            .folder_opened =
                [this](const FolderSnapshot& s) {
                    std::lock_guard lock(mutex);
                    snapshot = s;
                },
            .scan_chunk = {},
            .scan_progress = {},
            .scan_finished =
                [this](const ScanSummary& s) {
                    std::lock_guard lock(mutex);
                    scan = s;
                },
            .thumbnail_ready =
                [this](const std::filesystem::path& path, const lumen::cache::ThumbnailImage&) {
                    std::lock_guard lock(mutex);
                    ready.push_back(path);
                },
            .thumbnail_failed =
                [this](const std::filesystem::path& path, const EngineError&) {
                    std::lock_guard lock(mutex);
                    failed.push_back(path);
                },
        };
    }

    size_t readyCount() {
        std::lock_guard lock(mutex);
        return ready.size();
    }

    bool opened() {
        std::lock_guard lock(mutex);
        return snapshot.has_value();
    }

    std::optional<ScanSummary> scanSummary() {
        std::lock_guard lock(mutex);
        return scan;
    }
};

class EngineFixture {
public:
    EngineFixture() {
        for (const char* name : {"01.png", "02.png", "03.jpg"}) {
            paths_.push_back(dir_ / name);
        }
        lumen::test::writePng(paths_[0], 400, 300);
        lumen::test::writePng(paths_[1], 120, 90);
        lumen::test::writeJpeg(paths_[2], 640, 480);
        lumen::test::writeBytes(dir_ / "readme.txt", "not an image");
    }

    ~EngineFixture() {
        gate_->open();
        engine_.reset();
    }

protected:

    void start(bool gated = true) {
        lumen::config::Settings settings;
        settings.loader.io_slots = 2;
        settings.loader.decode_workers = 2;
        settings.loader.isolation = lumen::config::IsolationMode::InProcess;

        auto gate = gate_;
        if (!gated) {
            gate->open();
        }
        auto executor = std::make_shared<lumen::decode::InProcessDecodeExecutor>(
            [gate](const DecodeJob& job) -> DecodeResult {
                gate->wait();
                return lumen::decode::runDecodeJob(job);
            });

        engine_ = std::make_unique<Engine>(EngineOptions{.settings = std::move(settings),
                                                         .executor = std::move(executor),
                                                         .events = observed_.events()});
    }

    /// Rows as seen by a second store on the same file
    std::vector<lumen::store::CacheRow> rows() {
        auto store = ThumbStore::open(dir_.path());
        if (!store) {
            return {};
        }
        return (*store)->getRows(paths_, ReadPolicy::DirectConnection).value_or(
            std::vector<lumen::store::CacheRow>{});
    }

    size_t populatedRows() {
        auto all = rows();
        return static_cast<size_t>(std::count_if(all.begin(), all.end(), [](const auto& row) {
            return lumen::store::isPopulated(row);
        }));
    }

    lumen::test::TempDir dir_;
    std::vector<std::filesystem::path> paths_;
    std::shared_ptr<Gate> gate_ = std::make_shared<Gate>();
    Observed observed_;
    Observed reopened_;  // Events of a second engine on the same folder
    std::unique_ptr<Engine> engine_;
};

}  // namespace

TEST_CASE_METHOD(EngineFixture, "A new folder gets metadata rows before thumbnails", "[Engine]") {
    start();
    engine_->openFolder(dir_.path());
    REQUIRE(lumen::test::waitFor([&] { return observed_.opened(); }));
    {
        std::lock_guard lock(observed_.mutex);
        CHECK(observed_.snapshot->store_created);
        CHECK(observed_.snapshot->entries.size() == 3u);
        CHECK_FALSE(observed_.snapshot->store_error.has_value());
    }

    // Decodes are held back, so only metadata rows exist yet
    REQUIRE(lumen::test::waitFor([&] { return rows().size() == 3; }));
    CHECK(populatedRows() == 0u);

    gate_->open();
    REQUIRE(lumen::test::waitFor([&] { return observed_.readyCount() == 3; }));
    REQUIRE(lumen::test::waitFor([&] { return populatedRows() == 3; }));

    for (const auto& row : rows()) {
        const auto& meta = lumen::store::rowMeta(row);
        CHECK(meta.thumb_width == 256u);
        CHECK(meta.thumb_height == 195u);
        CHECK(meta.width.has_value());
    }
}

TEST_CASE_METHOD(EngineFixture, "A reopened folder needs no decodes", "[Engine]") {
    start(false);
    engine_->openFolder(dir_.path());
    REQUIRE(lumen::test::waitFor([&] { return populatedRows() == 3; }));
    engine_->shutdown();

    engine_ = std::make_unique<Engine>(EngineOptions{
        .settings = lumen::config::Settings{},
        .executor = std::make_shared<lumen::decode::InProcessDecodeExecutor>(),
        .events = reopened_.events()});
    engine_->openFolder(dir_.path());

    REQUIRE(lumen::test::waitFor([&] { return reopened_.scanSummary().has_value(); }));
    auto summary = *reopened_.scanSummary();
    CHECK(summary.valid == 3u);
    CHECK(summary.missing == 0u);
    CHECK_FALSE(reopened_.snapshot->store_created);

    // Served from the store without decoding
    Results<ThumbnailResult> result;
    engine_->requestThumbnail(paths_[0], result.callback());
    REQUIRE(lumen::test::waitFor([&] { return result.count() == 1; }));
    REQUIRE(result.at(0).has_value());
    CHECK(result.at(0).value()->source_width == 400u);
    CHECK(engine_->loaderStats().submitted.load() == 0u);
}

TEST_CASE_METHOD(EngineFixture, "A changed file is decoded again after reopening", "[Engine]") {
    start(false);
    engine_->openFolder(dir_.path());
    REQUIRE(lumen::test::waitFor([&] { return populatedRows() == 3; }));
    engine_->shutdown();

    lumen::test::writePng(paths_[1], 150, 100);
    std::filesystem::last_write_time(paths_[1], std::filesystem::file_time_type::clock::now() +
                                                    std::chrono::seconds(5));

    engine_ = std::make_unique<Engine>(EngineOptions{
        .settings = lumen::config::Settings{},
        .executor = std::make_shared<lumen::decode::InProcessDecodeExecutor>(),
        .events = reopened_.events()});
    engine_->openFolder(dir_.path());

    REQUIRE(lumen::test::waitFor([&] { return reopened_.readyCount() == 1; }));
    CHECK(reopened_.scanSummary()->valid == 2u);
    CHECK(reopened_.scanSummary()->missing == 1u);
    std::lock_guard lock(reopened_.mutex);
    CHECK(reopened_.ready.front().filename().string() == "02.png");
}

TEST_CASE_METHOD(EngineFixture, "Duplicate requests share one decode", "[Engine]") {
    start();
    Results<ThumbnailResult> first;
    Results<ThumbnailResult> second;
    engine_->requestThumbnail(paths_[0], first.callback());
    engine_->requestThumbnail(paths_[0], second.callback());

    gate_->open();
    REQUIRE(lumen::test::waitFor([&] { return first.count() == 1 && second.count() == 1; }));
    REQUIRE(first.at(0).has_value());
    REQUIRE(second.at(0).has_value());
    CHECK(first.at(0).value() == second.at(0).value());
    CHECK(engine_->loaderStats().submitted.load() == 1u);

    CHECK(first.at(0).value()->width <= 256u);
    CHECK(first.at(0).value()->height <= 195u);

    // A later request is a memory hit
    Results<ThumbnailResult> third;
    engine_->requestThumbnail(paths_[0], third.callback());
    REQUIRE(lumen::test::waitFor([&] { return third.count() == 1; }));
    CHECK(third.at(0).value() == first.at(0).value());
    CHECK(engine_->loaderStats().submitted.load() == 1u);
    CHECK(engine_->memoryStats().get().thumbnail.hits == 1u);
}

TEST_CASE_METHOD(EngineFixture, "A view decodes at full resolution", "[Engine]") {
    start(false);
    Results<ViewResult> view;
    engine_->requestView(paths_[2], view.callback());
    REQUIRE(lumen::test::waitFor([&] { return view.count() == 1; }));
    REQUIRE(view.at(0).has_value());
    CHECK(view.at(0).value()->width() == 640u);
    CHECK(view.at(0).value()->height() == 480u);
}

TEST_CASE_METHOD(EngineFixture, "Invalidate cancels a pending request", "[Engine]") {
    start();
    Results<ThumbnailResult> result;
    engine_->requestThumbnail(paths_[0], result.callback());
    engine_->invalidate(paths_[0]);

    REQUIRE(lumen::test::waitFor([&] { return result.count() == 1; }));
    REQUIRE_FALSE(result.at(0).has_value());
    CHECK(result.at(0).error().code == EngineErrorCode::Cancelled);
}

TEST_CASE_METHOD(EngineFixture, "Invalidate removes the row of a deleted file", "[Engine]") {
    start(false);
    engine_->openFolder(dir_.path());
    REQUIRE(lumen::test::waitFor([&] { return populatedRows() == 3; }));

    std::filesystem::remove(paths_[1]);
    engine_->invalidate(paths_[1]);
    REQUIRE(lumen::test::waitFor([&] { return rows().size() == 2; }));
}

TEST_CASE_METHOD(EngineFixture, "A missing file reports a decode error", "[Engine]") {
    start(false);
    Results<ThumbnailResult> result;
    engine_->requestThumbnail(dir_ / "absent.png", result.callback());
    REQUIRE(lumen::test::waitFor([&] { return result.count() == 1; }));
    REQUIRE_FALSE(result.at(0).has_value());
    CHECK(result.at(0).error().code == EngineErrorCode::Decode);
    CHECK(result.at(0).error().decode == lumen::image::DecodeError::FileNotFound);
}

TEST_CASE_METHOD(EngineFixture, "A corrupt image fires the failed event", "[Engine]") {
    start(false);
    auto broken = dir_ / "broken.png";
    lumen::test::writeBytes(broken, "\x89PNG\r\n\x1a\nthis is not the rest of a png");

    Results<ThumbnailResult> result;
    engine_->requestThumbnail(broken, result.callback());
    REQUIRE(lumen::test::waitFor([&] { return result.count() == 1; }));
    REQUIRE_FALSE(result.at(0).has_value());
    CHECK(result.at(0).error().code == EngineErrorCode::Decode);

    std::lock_guard lock(observed_.mutex);
    CHECK(observed_.failed.size() == 1u);
}

TEST_CASE_METHOD(EngineFixture, "Scanning without a folder reports no store", "[Engine]") {
    start(false);
    Results<ScanSummary> finished;
    engine_->scanExisting(paths_, ScanSink{.chunk = {}, .progress = {},
                                           .finished = finished.callback()});
    REQUIRE(lumen::test::waitFor([&] { return finished.count() == 1; }));
    REQUIRE(finished.at(0).error.has_value());
    CHECK(finished.at(0).error->code() == lumen::store::StoreErrorCode::NotFound);
}

TEST_CASE_METHOD(EngineFixture, "Scanning an open folder classifies its files", "[Engine]") {
    start(false);
    engine_->openFolder(dir_.path());
    REQUIRE(lumen::test::waitFor([&] { return populatedRows() == 3; }));

    Results<std::vector<ScanItem>> chunks;
    Results<ScanSummary> finished;
    engine_->scanExisting(paths_, ScanSink{.chunk = chunks.callback(), .progress = {},
                                           .finished = finished.callback()});
    REQUIRE(lumen::test::waitFor([&] { return finished.count() == 1; }));

    auto summary = finished.at(0);
    CHECK_FALSE(summary.error.has_value());
    CHECK_FALSE(summary.cancelled);
    CHECK(summary.total == 3u);
    CHECK(summary.valid == 3u);
    CHECK(summary.generation > 0u);

    size_t valid_items = 0;
    for (size_t i = 0; i < chunks.count(); ++i) {
        for (const auto& item : chunks.at(i)) {
            if (item.status == ScanStatus::Valid) {
                ++valid_items;
            }
        }
    }
    CHECK(valid_items == 3u);
}

TEST_CASE_METHOD(EngineFixture, "A folder scan leaves paths with a request in flight alone",
                 "[Engine]") {
    // An existing empty store makes openFolder scan rather than take the new-store path
    {
        auto store = ThumbStore::open(dir_.path());
        REQUIRE(store.has_value());
    }
    start();
    const auto counter = "engine.scan.missing_already_handled";
    auto before = lumen::metrics().snapshot().counter(counter);

    Results<ThumbnailResult> direct;
    engine_->requestThumbnail(paths_[0], direct.callback());
    engine_->openFolder(dir_.path());
    REQUIRE(lumen::test::waitFor([&] { return observed_.scanSummary().has_value(); }));
    CHECK(observed_.scanSummary()->missing == 3u);
    CHECK(lumen::metrics().snapshot().counter(counter) - before == 1u);
    CHECK(direct.count() == 0u);

    gate_->open();
    REQUIRE(lumen::test::waitFor([&] { return direct.count() == 1; }));
    REQUIRE(direct.at(0).has_value());
    REQUIRE(lumen::test::waitFor([&] { return populatedRows() == 3; }));
    CHECK(engine_->loaderStats().submitted.load() == 3u);
}

TEST_CASE_METHOD(EngineFixture, "Spellings of one path share cache entries", "[Engine]") {
    start(false);
    Results<ThumbnailResult> dotted;
    engine_->requestThumbnail(dir_ / "." / "01.png", dotted.callback());
    REQUIRE(lumen::test::waitFor([&] { return dotted.count() == 1; }));
    REQUIRE(dotted.at(0).has_value());

    Results<ThumbnailResult> plain;
    engine_->requestThumbnail(paths_[0], plain.callback());
    REQUIRE(lumen::test::waitFor([&] { return plain.count() == 1; }));
    CHECK(plain.at(0).value() == dotted.at(0).value());
    CHECK(engine_->loaderStats().submitted.load() == 1u);

    engine_->invalidate(dir_ / "sub" / ".." / "01.png");
    Results<ThumbnailResult> again;
    engine_->requestThumbnail(paths_[0], again.callback());
    REQUIRE(lumen::test::waitFor([&] { return again.count() == 1; }));
    REQUIRE(again.at(0).has_value());
    CHECK(engine_->loaderStats().submitted.load() == 2u);
}

TEST_CASE_METHOD(EngineFixture, "Requests after shutdown fail immediately", "[Engine]") {
    start();
    Results<ThumbnailResult> pending;
    engine_->requestThumbnail(paths_[0], pending.callback());

    gate_->open();
    engine_->shutdown();
    CHECK(pending.count() == 1u);

    Results<ThumbnailResult> late;
    engine_->requestThumbnail(paths_[0], late.callback());
    REQUIRE(late.count() == 1u);
    REQUIRE_FALSE(late.at(0).has_value());
    CHECK(late.at(0).error().code == EngineErrorCode::ShutDown);
}
