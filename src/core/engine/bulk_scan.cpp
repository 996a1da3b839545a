/// @file bulk_scan.cpp
/// @brief Bulk scan implementation

#include "bulk_scan.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <unordered_map>

#include "../util/logger.hpp"
#include "../util/metrics.hpp"

namespace lumen::engine {

namespace {

struct StatEntry {
    std::filesystem::path path;
    fs::FileStat stat;
};

void notify_progress(const ScanSink& sink, size_t done, size_t total) {
    if (sink.progress) {
        sink.progress(ScanProgress{done, total});
    }
}

}  // namespace

ScanStatus classifyRow(const store::CacheRow* row, const fs::FileStat& stat,
                       const image::TargetSize& thumbnail) {
    if (!row || !store::isValidFor(*row, stat, thumbnail)) {
        return ScanStatus::Missing;
    }
    return store::isPopulated(*row) ? ScanStatus::Valid : ScanStatus::Pending;
}

ScanSummary scanExisting(store::ThumbStore& store, const std::vector<std::filesystem::path>& paths,
                         const ScanOptions& options, const ScanSink& sink) {
    const auto start = std::chrono::steady_clock::now();
    const size_t chunk_size = std::max<size_t>(options.chunk_size, 1);

    ScanSummary summary;
    summary.generation = options.generation;
    summary.total = paths.size();

    LOG_DEBUG("Scan {}: {} files, chunk {}, read policy {}", options.generation, paths.size(),
              chunk_size, store::to_string(options.policy));
    notify_progress(sink, 0, paths.size());

    size_t done = 0;
    for (size_t offset = 0; offset < paths.size(); offset += chunk_size) {
        if (options.cancelled && options.cancelled()) {
            summary.cancelled = true;
            break;
        }

        size_t end = std::min(offset + chunk_size, paths.size());

        std::vector<StatEntry> stats;
        stats.reserve(end - offset);
        for (size_t i = offset; i < end; ++i) {
            auto stat = fs::statFile(paths[i]);
            if (!stat) {
                LOG_DEBUG("Scan: skipping {}: {}", paths[i].string(), fs::to_string(stat.error()));
                ++summary.skipped;
                continue;
            }
            stats.push_back(StatEntry{paths[i], *stat});
        }

        std::vector<std::filesystem::path> query;
        query.reserve(stats.size());
        for (const auto& entry : stats) {
            query.push_back(entry.path);
        }

        std::unordered_map<std::string, store::CacheRow> by_key;
        auto rows = store.getRows(query, options.policy);
        if (rows) {
            for (auto& row : *rows) {
                std::string key = store::rowMeta(row).path;
                by_key.insert_or_assign(std::move(key), std::move(row));
            }
        } else {
            LOG_WARN("Scan: reading rows failed, treating {} files as missing: {}", stats.size(),
                     rows.error().format());
            if (!summary.error) {
                summary.error = rows.error();
            }
            if (rows.error().code() == store::StoreErrorCode::ShutDown) {
                summary.cancelled = true;
                break;
            }
        }

        std::vector<ScanItem> items;
        items.reserve(stats.size());
        for (auto& entry : stats) {
            ScanItem item{.path = std::move(entry.path), .stat = entry.stat};

            auto it = by_key.find(store::normalizeStorePath(item.path));
            item.status = classifyRow(it != by_key.end() ? &it->second : nullptr, item.stat,
                                      options.thumbnail);
            switch (item.status) {
            case ScanStatus::Valid:
                ++summary.valid;
                item.row = std::move(it->second);
                break;
            case ScanStatus::Pending:
                ++summary.pending;
                item.row = std::move(it->second);
                break;
            case ScanStatus::Missing:
                ++summary.missing;
                break;
            }
            items.push_back(std::move(item));
        }

        done = end;
        if (sink.chunk && !items.empty()) {
            sink.chunk(std::move(items));
        }
        notify_progress(sink, done, paths.size());
    }

    auto elapsed = std::chrono::steady_clock::now() - start;
    metrics().record("scan.time", elapsed);
    LOG_DEBUG("Scan {} {}: valid={} pending={} missing={} skipped={} in {} ms", options.generation,
              summary.cancelled ? "cancelled" : "finished", summary.valid, summary.pending,
              summary.missing, summary.skipped,
              std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());

    if (sink.finished) {
        sink.finished(summary);
    }
    return summary;
}

}  // namespace lumen::engine
