/// @file store_error.hpp
/// @brief Persistent store error types

#pragma once

#include <expected>
#include <string_view>

#include "../util/result.hpp"

namespace lumen::store {

/// @brief Store operation errors
enum class StoreErrorCode {
    Busy,      // Lock contention outlasted the retry budget
    Schema,    // Migration failed or the store is newer than supported
    Database,  // Any other SQLite failure
    Io,        // File could not be opened, read or written
    NotFound,  // No such row or store file
    Corrupt,   // Malformed database or row contents
    ShutDown,  // Scheduled after the operator stopped
};

/// @brief Get string representation of store error
[[nodiscard]] constexpr std::string_view to_string(StoreErrorCode code) noexcept {
    switch (code) {
    case StoreErrorCode::Busy:
        return "Store busy";
    case StoreErrorCode::Schema:
        return "Schema error";
    case StoreErrorCode::Database:
        return "Database error";
    case StoreErrorCode::Io:
        return "I/O error";
    case StoreErrorCode::NotFound:
        return "Not found";
    case StoreErrorCode::Corrupt:
        return "Corrupted store data";
    case StoreErrorCode::ShutDown:
        return "Store operator shut down";
    }
    return "Unknown store error";
}

using StoreError = ErrorInfo<StoreErrorCode>;

template <typename T>
using StoreResult = std::expected<T, StoreError>;

}  // namespace lumen::store
