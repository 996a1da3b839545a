/// @file decode_executor.cpp
/// @brief In-process and forked decode executors

#include "decode_executor.hpp"

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <new>
#include <vector>

#include "../util/logger.hpp"
#include "../util/metrics.hpp"
#include "wire_format.hpp"

namespace lumen::decode {

namespace {

// Child exit codes
constexpr int kChildOk = 0;
constexpr int kChildWriteFailed = 2;
constexpr int kChildException = 3;

// Frames above this are treated as garbage rather than allocated
constexpr uint64_t kMaxFramePayload = uint64_t{1} << 34;

[[nodiscard]] bool write_all(int fd, const uint8_t* data, size_t size) noexcept {
    while (size > 0) {
        ssize_t n = ::write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data += n;
        size -= static_cast<size_t>(n);
    }
    return true;
}

/// @brief Read exactly size bytes
/// @return Bytes actually read (less than size on EOF or error)
[[nodiscard]] size_t read_exact(int fd, uint8_t* data, size_t size) noexcept {
    size_t total = 0;
    while (total < size) {
        ssize_t n = ::read(fd, data + total, size - total);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (n == 0) {
            break;
        }
        total += static_cast<size_t>(n);
    }
    return total;
}

/// @brief Body of the forked child; never returns
[[noreturn]] void child_main(int write_fd, const DecodeFunction& function, const DecodeJob& job) {
    int code = kChildOk;
    try {
        std::vector<uint8_t> frame = encodeReply(function(job));
        if (!write_all(write_fd, frame.data(), frame.size())) {
            code = kChildWriteFailed;
        }
    } catch (const std::exception&) {
        code = kChildException;
    }
    ::close(write_fd);
    ::_exit(code);
}

/// @brief Read one frame from the worker pipe
///
/// Reading stops after the announced length instead of waiting for EOF:
/// children forked concurrently by other decode threads inherit this pipe's
/// write end and keep it open until they exit.
[[nodiscard]] std::vector<uint8_t> read_frame(int read_fd) {
    std::vector<uint8_t> frame(kFrameHeaderSize);
    if (read_exact(read_fd, frame.data(), frame.size()) != frame.size()) {
        return {};
    }
    auto length = readFrameLength(frame);
    if (!length || *length > kMaxFramePayload) {
        return {};
    }
    frame.resize(kFrameHeaderSize + static_cast<size_t>(*length));
    size_t got = read_exact(read_fd, frame.data() + kFrameHeaderSize, static_cast<size_t>(*length));
    frame.resize(kFrameHeaderSize + got);
    return frame;
}

[[nodiscard]] bool wait_child(pid_t child, int& status) noexcept {
    while (::waitpid(child, &status, 0) == -1) {
        if (errno != EINTR) {
            return false;
        }
    }
    return true;
}

}  // namespace

InProcessDecodeExecutor::InProcessDecodeExecutor(DecodeFunction function)
    : function_(std::move(function)) {
}

DecodeResult InProcessDecodeExecutor::run(const DecodeJob& job) {
    try {
        return function_(job);
    } catch (const std::bad_alloc&) {
        return std::unexpected(image::DecodeError::OutOfMemory);
    } catch (const std::exception& e) {
        LOG_ERROR("Decode of '{}' threw: {}", job.path.string(), e.what());
        return std::unexpected(image::DecodeError::InternalError);
    }
}

ProcessDecodeExecutor::ProcessDecodeExecutor(DecodeFunction function)
    : function_(std::move(function)) {
}

DecodeResult ProcessDecodeExecutor::run(const DecodeJob& job) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        LOG_ERROR("pipe2 failed: {}", std::strerror(errno));
        return std::unexpected(image::DecodeError::InternalError);
    }

    pid_t child = ::fork();
    if (child < 0) {
        LOG_ERROR("fork failed: {}", std::strerror(errno));
        ::close(fds[0]);
        ::close(fds[1]);
        return std::unexpected(image::DecodeError::InternalError);
    }
    if (child == 0) {
        ::close(fds[0]);
        child_main(fds[1], function_, job);
    }

    ::close(fds[1]);
    std::vector<uint8_t> frame;
    try {
        frame = read_frame(fds[0]);
    } catch (const std::bad_alloc&) {
        ::close(fds[0]);
        int ignored = 0;
        static_cast<void>(wait_child(child, ignored));
        return std::unexpected(image::DecodeError::OutOfMemory);
    }
    ::close(fds[0]);

    int status = 0;
    if (!wait_child(child, status)) {
        LOG_ERROR("waitpid({}) failed: {}", child, std::strerror(errno));
        return std::unexpected(image::DecodeError::InternalError);
    }

    if (WIFSIGNALED(status)) {
        LOG_WARN("Decode worker for '{}' killed by signal {}", job.path.string(), WTERMSIG(status));
        metrics().increment("decode.worker_crashed");
        return std::unexpected(image::DecodeError::WorkerCrashed);
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != kChildOk) {
        LOG_WARN("Decode worker for '{}' exited with status {}", job.path.string(),
                 WIFEXITED(status) ? WEXITSTATUS(status) : -1);
        metrics().increment("decode.worker_crashed");
        return std::unexpected(image::DecodeError::WorkerCrashed);
    }

    DecodeResult result = decodeReply(frame);
    if (!result && result.error() == image::DecodeError::WorkerCrashed) {
        LOG_WARN("Decode worker for '{}' sent a truncated reply ({} bytes)", job.path.string(),
                 frame.size());
        metrics().increment("decode.worker_crashed");
    }
    return result;
}

}  // namespace lumen::decode
