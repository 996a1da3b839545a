#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <variant>
#include <vector>

#include <catch2/catch.hpp>

#include "core/loader/loader.hpp"
#include "test_support.hpp"

using namespace lumen::loader;
using lumen::decode::DecodeJob;
using lumen::decode::DecodeMode;
using lumen::decode::DecodeOutput;
using lumen::decode::DecodeResult;
using lumen::image::DecodeError;
using lumen::image::EncodedImage;

namespace {

/// Holds every job until the gate opens; echoes the target width back
class GatedExecutor final : public lumen::decode::DecodeExecutor {
public:
    DecodeResult run(const DecodeJob& job) override {
        started_.fetch_add(1);
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return open_; });
        }
        finished_.fetch_add(1);
        EncodedImage encoded;
        encoded.bytes = {0x42};
        encoded.width = job.target ? job.target->width : 0;
        encoded.height = job.target ? job.target->height : 0;
        return DecodeOutput{std::move(encoded)};
    }

    std::string_view name() const noexcept override { return "gated"; }

    void open() {
        {
            std::lock_guard lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    int started() const { return started_.load(); }
    int finished() const { return finished_.load(); }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
    std::atomic<int> started_{0};
    std::atomic<int> finished_{0};
};

class Recorder {
public:
    LoadCallback callback() {
        return [this](LoadOutcome outcome) {
            std::lock_guard lock(mutex_);
            outcomes_.push_back(std::move(outcome));
        };
    }

    size_t count() const {
        std::lock_guard lock(mutex_);
        return outcomes_.size();
    }

    std::vector<OutcomeKind> kinds() const {
        std::lock_guard lock(mutex_);
        std::vector<OutcomeKind> kinds;
        for (const auto& outcome : outcomes_) {
            kinds.push_back(outcome.kind);
        }
        return kinds;
    }

    uint32_t decodedWidth(size_t index) const {
        std::lock_guard lock(mutex_);
        const auto& output = outcomes_.at(index).output;
        return output ? std::get<EncodedImage>(*output).width : 0;
    }

    std::optional<DecodeError> error(size_t index) const {
        std::lock_guard lock(mutex_);
        return outcomes_.at(index).error;
    }

private:
    mutable std::mutex mutex_;
    std::vector<LoadOutcome> outcomes_;
};

class LoaderFixture {
public:
    LoaderFixture() {
        image_ = dir_ / "a.png";
        lumen::test::writePng(image_, 8, 8);
        executor_ = std::make_shared<GatedExecutor>();
        loader_ = std::make_unique<Loader>(LoaderConfig{.io_slots = 2, .decode_workers = 2},
                                           executor_);
    }

    ~LoaderFixture() {
        executor_->open();
        loader_->shutdown();
    }

protected:
    lumen::test::TempDir dir_;
    std::filesystem::path image_;
    std::shared_ptr<GatedExecutor> executor_;
    std::unique_ptr<Loader> loader_;
};

bool is_only(const std::vector<OutcomeKind>& kinds, OutcomeKind kind) {
    return kinds.size() == 1 && kinds.front() == kind;
}

}  // namespace

TEST_CASE_METHOD(LoaderFixture, "A request gets its decoded result", "[Loader]") {
    Recorder recorder;
    RequestHandle handle = loader_->submit(CacheKey::thumbnail(image_, 64, 64), recorder.callback());
    CHECK(handle != kInvalidHandle);

    executor_->open();
    REQUIRE(lumen::test::waitFor([&] { return recorder.count() == 1; }));
    CHECK(is_only(recorder.kinds(), OutcomeKind::Decoded));
    CHECK(recorder.decodedWidth(0) == 64);
    CHECK(loader_->stats().decoded.load() == 1);
}

TEST_CASE_METHOD(LoaderFixture, "A newer request supersedes the older one", "[Loader]") {
    Recorder first;
    Recorder second;
    loader_->submit(CacheKey::thumbnail(image_, 64, 64), first.callback());
    REQUIRE(lumen::test::waitFor([&] { return executor_->started() == 1; }));

    loader_->submit(CacheKey::thumbnail(image_, 128, 128), second.callback());
    REQUIRE(lumen::test::waitFor([&] { return first.count() == 1; }));
    CHECK(is_only(first.kinds(), OutcomeKind::Superseded));

    executor_->open();
    REQUIRE(lumen::test::waitFor([&] { return second.count() == 1; }));
    CHECK(is_only(second.kinds(), OutcomeKind::Decoded));
    CHECK(second.decodedWidth(0) == 128);

    // The superseded job's result arrives later and is dropped
    REQUIRE(lumen::test::waitFor([&] { return loader_->stats().stale_dropped.load() == 1; }));
    CHECK(first.count() == 1);
}

TEST_CASE_METHOD(LoaderFixture, "An identical request joins the running job", "[Loader]") {
    Recorder first;
    Recorder second;
    auto key = CacheKey::thumbnail(image_, 64, 64);
    loader_->submit(key, first.callback());
    REQUIRE(lumen::test::waitFor([&] { return executor_->started() == 1; }));
    loader_->submit(key, second.callback());

    REQUIRE(lumen::test::waitFor([&] { return first.count() == 1; }));
    CHECK(is_only(first.kinds(), OutcomeKind::Superseded));

    executor_->open();
    REQUIRE(lumen::test::waitFor([&] { return second.count() == 1; }));
    CHECK(is_only(second.kinds(), OutcomeKind::Decoded));
    CHECK(executor_->started() == 1);
    CHECK(loader_->stats().coalesced.load() == 1);
}

TEST_CASE_METHOD(LoaderFixture, "Thumbnail and full requests are independent", "[Loader]") {
    Recorder thumb;
    Recorder full;
    loader_->submit(CacheKey::thumbnail(image_, 64, 64), thumb.callback());
    loader_->submit(CacheKey::full(image_), full.callback());

    executor_->open();
    REQUIRE(lumen::test::waitFor([&] { return thumb.count() == 1 && full.count() == 1; }));
    CHECK(is_only(thumb.kinds(), OutcomeKind::Decoded));
    CHECK(is_only(full.kinds(), OutcomeKind::Decoded));
}

TEST_CASE_METHOD(LoaderFixture, "cancel delivers Superseded once", "[Loader]") {
    Recorder recorder;
    RequestHandle handle = loader_->submit(CacheKey::full(image_), recorder.callback());
    REQUIRE(lumen::test::waitFor([&] { return executor_->started() == 1; }));

    loader_->cancel(handle);
    REQUIRE(lumen::test::waitFor([&] { return recorder.count() == 1; }));

    executor_->open();
    REQUIRE(lumen::test::waitFor([&] { return loader_->stats().stale_dropped.load() == 1; }));
    CHECK(is_only(recorder.kinds(), OutcomeKind::Superseded));
    CHECK(loader_->stats().decoded.load() == 0);
}

TEST_CASE_METHOD(LoaderFixture, "cancelAllFor covers every mode", "[Loader]") {
    Recorder thumb;
    Recorder full;
    loader_->submit(CacheKey::thumbnail(image_, 64, 64), thumb.callback());
    loader_->submit(CacheKey::full(image_), full.callback());

    loader_->cancelAllFor(image_);
    REQUIRE(lumen::test::waitFor([&] { return thumb.count() == 1 && full.count() == 1; }));
    CHECK(is_only(thumb.kinds(), OutcomeKind::Superseded));
    CHECK(is_only(full.kinds(), OutcomeKind::Superseded));
}

TEST_CASE_METHOD(LoaderFixture, "A missing file fails without decoding", "[Loader]") {
    Recorder recorder;
    loader_->submit(CacheKey::full(dir_ / "gone.png"), recorder.callback());

    REQUIRE(lumen::test::waitFor([&] { return recorder.count() == 1; }));
    CHECK(is_only(recorder.kinds(), OutcomeKind::Failed));
    CHECK(recorder.error(0) == DecodeError::FileNotFound);
    CHECK(executor_->started() == 0);
}

TEST_CASE_METHOD(LoaderFixture, "shutdown resolves every request once", "[Loader]") {
    Recorder running;
    loader_->submit(CacheKey::full(image_), running.callback());
    REQUIRE(lumen::test::waitFor([&] { return executor_->started() == 1; }));

    std::jthread opener([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        executor_->open();
    });
    loader_->shutdown();
    CHECK(running.count() == 1);

    Recorder late;
    CHECK(loader_->submit(CacheKey::full(image_), late.callback()) == kInvalidHandle);
    CHECK(is_only(late.kinds(), OutcomeKind::Superseded));
}
