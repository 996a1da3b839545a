/// @file decode_executor.hpp
/// @brief Execution strategies for decode jobs
///
/// The loader hands every job to a DecodeExecutor. ProcessDecodeExecutor runs
/// each job in a forked child so that a decoder crash only fails that job;
/// InProcessDecodeExecutor calls the same function on the calling thread.

#pragma once

#include <string_view>

#include "decode_job.hpp"

namespace lumen::decode {

class DecodeExecutor {
public:
    virtual ~DecodeExecutor() = default;

    /// @brief Run one job to completion on the calling thread
    ///
    /// Thread-safe; the loader calls this from every decode worker.
    [[nodiscard]] virtual DecodeResult run(const DecodeJob& job) = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

protected:
    DecodeExecutor() = default;
    DecodeExecutor(const DecodeExecutor&) = default;
    DecodeExecutor& operator=(const DecodeExecutor&) = default;
};

class InProcessDecodeExecutor final : public DecodeExecutor {
public:
    explicit InProcessDecodeExecutor(DecodeFunction function = runDecodeJob);

    [[nodiscard]] DecodeResult run(const DecodeJob& job) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "in_process"; }

private:
    DecodeFunction function_;
};

/// @brief Runs every job in a short-lived forked child
///
/// The child evaluates the function, writes one wire_format frame to a pipe
/// and leaves through _exit. A child that dies by a signal, exits non-zero or
/// sends an incomplete frame yields DecodeError::WorkerCrashed. The function
/// runs in the child after fork, so it must not log or take locks that other
/// threads of the parent may hold.
class ProcessDecodeExecutor final : public DecodeExecutor {
public:
    explicit ProcessDecodeExecutor(DecodeFunction function = runDecodeJob);

    [[nodiscard]] DecodeResult run(const DecodeJob& job) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "process"; }

private:
    DecodeFunction function_;
};

}  // namespace lumen::decode
