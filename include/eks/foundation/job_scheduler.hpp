#pragma once

/// @file job_scheduler.hpp
/// @brief Worker pool over kcenon thread_system used for connection handling.

#include "eks/foundation/service_result.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <thread>

namespace eks::foundation {

/// Fire-and-forget worker pool wrapping kcenon's thread_system.
///
/// The HTTP server hands every accepted connection to submit(). PIMPL keeps
/// thread_system headers out of the public API.
///
/// Example:
/// @code
///   JobScheduler scheduler(4);
///   scheduler.submit([conn] { serve(conn); });
///   scheduler.shutdown();
/// @endcode
class JobScheduler {
public:
    using JobFunc = std::function<void()>;

    /// Construct a scheduler backed by a pool with @p numThreads workers.
    /// Zero is treated as one.
    explicit JobScheduler(std::size_t numThreads = std::thread::hardware_concurrency());

    ~JobScheduler();

    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;

    /// Enqueue a job. Exceptions thrown by @p job are logged and contained
    /// in the worker.
    /// @return Success, or JobScheduleFailed when the pool refuses the job.
    ServiceResult<void> submit(JobFunc job);

    /// Number of worker threads.
    [[nodiscard]] std::size_t workerCount() const noexcept;

    /// Stop the pool, letting running jobs finish. Idempotent.
    void shutdown();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace eks::foundation
