/// @file decode_request.hpp
/// @brief Loader request and outcome structures

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

#include "../decode/decode_job.hpp"
#include "cache_key.hpp"

namespace lumen::loader {

/// @brief Handle returned by Loader::submit, used for cancellation
using RequestHandle = uint64_t;

/// @brief Admission order; larger is newer
using Generation = uint64_t;

inline constexpr RequestHandle kInvalidHandle = 0;

struct DecodeRequest {
    CacheKey key;
    Generation generation = 0;
    std::chrono::steady_clock::time_point submitted_at = std::chrono::steady_clock::now();
};

/// @brief Terminal state of a request
enum class OutcomeKind : uint8_t {
    Decoded,     // output holds the result
    Failed,      // error holds the reason
    Superseded,  // Replaced by a newer request, cancelled or dropped at shutdown
};

[[nodiscard]] constexpr std::string_view to_string(OutcomeKind kind) noexcept {
    switch (kind) {
    case OutcomeKind::Decoded:
        return "decoded";
    case OutcomeKind::Failed:
        return "failed";
    case OutcomeKind::Superseded:
        return "superseded";
    }
    return "unknown";
}

/// @brief The single outcome delivered for an admitted request
struct LoadOutcome {
    OutcomeKind kind = OutcomeKind::Superseded;
    RequestHandle handle = kInvalidHandle;
    DecodeRequest request;
    std::optional<decode::DecodeOutput> output;
    std::optional<image::DecodeError> error;

    [[nodiscard]] bool decoded() const noexcept { return kind == OutcomeKind::Decoded; }
    [[nodiscard]] bool superseded() const noexcept { return kind == OutcomeKind::Superseded; }
};

/// @brief Receives the outcome on the loader's serial thread
///
/// Must return quickly and must not call Loader::shutdown.
using LoadCallback = std::function<void(LoadOutcome)>;

}  // namespace lumen::loader
