/// @file job_scheduler.cpp
/// @brief JobScheduler implementation wrapping kcenon thread_system.

#include "eks/foundation/job_scheduler.hpp"

#include "eks/foundation/service_logger.hpp"

// kcenon thread_system headers (hidden behind PIMPL)
#include <kcenon/thread/core/job_builder.h>
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>

#include <atomic>
#include <cstdint>
#include <exception>
#include <string>
#include <vector>

namespace eks::foundation {

struct JobScheduler::Impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::size_t workers{0};
    std::atomic<uint64_t> submitted{0};
    std::atomic<bool> stopped{false};
};

JobScheduler::JobScheduler(std::size_t numThreads)
    : impl_(std::make_unique<Impl>())
{
    impl_->workers = numThreads == 0 ? 1 : numThreads;
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>("eks_workers");

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(impl_->workers);
    for (std::size_t i = 0; i < impl_->workers; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();
}

JobScheduler::~JobScheduler() {
    shutdown();
}

ServiceResult<void> JobScheduler::submit(JobFunc job) {
    if (impl_->stopped.load(std::memory_order_acquire)) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::JobScheduleFailed, "scheduler is shut down"));
    }

    auto seq = impl_->submitted.fetch_add(1, std::memory_order_relaxed);
    auto threadJob = kcenon::thread::job_builder()
        .name("eks_task_" + std::to_string(seq))
        .work([fn = std::move(job)]() -> kcenon::common::VoidResult {
            try {
                fn();
            } catch (const std::exception& e) {
                EKS_LOG_ERROR(LogCategory::Core,
                              std::string("worker task failed: ") + e.what());
            } catch (...) {
                EKS_LOG_ERROR(LogCategory::Core, "worker task failed: unknown exception");
            }
            return kcenon::common::VoidResult::ok(std::monostate{});
        })
        .build();

    if (impl_->pool->enqueue(std::move(threadJob)).is_err()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::JobScheduleFailed, "failed to enqueue job"));
    }
    return ServiceResult<void>::ok();
}

std::size_t JobScheduler::workerCount() const noexcept {
    return impl_->workers;
}

void JobScheduler::shutdown() {
    if (impl_->stopped.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    impl_->pool->stop(false);  // graceful: wait for running jobs
}

}  // namespace eks::foundation
