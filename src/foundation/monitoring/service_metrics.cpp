/// @file service_metrics.cpp
/// @brief In-memory ServiceMetrics.
///
/// Counters and gauges are atomics behind a map mutex; histograms and health
/// state are fully mutex-protected.

#include "eks/foundation/service_metrics.hpp"

#include <atomic>
#include <cmath>
#include <map>
#include <mutex>
#include <sstream>
#include <unordered_map>

namespace eks::foundation {

HistogramBuckets HistogramBuckets::defaultLatency() {
    return HistogramBuckets{{1, 5, 10, 25, 50, 100, 250, 500, 1000}};
}

std::string_view healthStatusName(HealthStatus status) {
    switch (status) {
        case HealthStatus::Healthy:   return "healthy";
        case HealthStatus::Degraded:  return "degraded";
        case HealthStatus::Unhealthy: return "unhealthy";
    }
    return "unhealthy";
}

namespace {

struct HistogramData {
    std::vector<double> boundaries;
    std::vector<uint64_t> bucketCounts;  // cumulative; last entry is +Inf
    uint64_t totalCount{0};
    double totalSum{0.0};

    explicit HistogramData(std::vector<double> bounds)
        : boundaries(std::move(bounds)), bucketCounts(boundaries.size() + 1, 0) {}

    void record(double value) {
        for (std::size_t i = 0; i < boundaries.size(); ++i) {
            if (value <= boundaries[i]) {
                ++bucketCounts[i];
            }
        }
        ++bucketCounts.back();
        ++totalCount;
        totalSum += value;
    }
};

// std::atomic<double>::fetch_add is not available before C++20 libraries
// ship it everywhere; a CAS loop works on all of them.
void atomicAdd(std::atomic<double>& target, double delta) {
    double current = target.load(std::memory_order_relaxed);
    while (!target.compare_exchange_weak(
        current, current + delta, std::memory_order_release, std::memory_order_relaxed)) {
    }
}

std::string formatDouble(double value) {
    if (std::isinf(value)) {
        return value > 0 ? "+Inf" : "-Inf";
    }
    if (std::isnan(value)) {
        return "NaN";
    }
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

}  // anonymous namespace

struct ServiceMetrics::Impl {
    mutable std::mutex counterMutex;
    std::map<std::string, std::atomic<uint64_t>, std::less<>> counters;

    mutable std::mutex gaugeMutex;
    std::map<std::string, std::atomic<double>, std::less<>> gauges;

    mutable std::mutex histogramMutex;
    std::map<std::string, HistogramData, std::less<>> histograms;

    mutable std::mutex healthMutex;
    std::string serviceName{"ember-keyserver"};
    std::unordered_map<std::string, HealthStatus> componentHealth;
};

ServiceMetrics::ServiceMetrics() : impl_(std::make_unique<Impl>()) {}

ServiceMetrics::~ServiceMetrics() = default;

ServiceMetrics::ServiceMetrics(ServiceMetrics&&) noexcept = default;

ServiceMetrics& ServiceMetrics::operator=(ServiceMetrics&&) noexcept = default;

// ── Counters ────────────────────────────────────────────────────────────────

void ServiceMetrics::incrementCounter(std::string_view name, uint64_t value) {
    std::lock_guard lock(impl_->counterMutex);
    auto it = impl_->counters.find(name);
    if (it == impl_->counters.end()) {
        it = impl_->counters.try_emplace(std::string(name), 0).first;
    }
    it->second.fetch_add(value, std::memory_order_relaxed);
}

uint64_t ServiceMetrics::counterValue(std::string_view name) const {
    std::lock_guard lock(impl_->counterMutex);
    auto it = impl_->counters.find(name);
    if (it == impl_->counters.end()) {
        return 0;
    }
    return it->second.load(std::memory_order_relaxed);
}

// ── Gauges ──────────────────────────────────────────────────────────────────

void ServiceMetrics::setGauge(std::string_view name, double value) {
    std::lock_guard lock(impl_->gaugeMutex);
    auto it = impl_->gauges.find(name);
    if (it == impl_->gauges.end()) {
        impl_->gauges.try_emplace(std::string(name), value);
        return;
    }
    it->second.store(value, std::memory_order_release);
}

void ServiceMetrics::incrementGauge(std::string_view name, double delta) {
    std::lock_guard lock(impl_->gaugeMutex);
    auto it = impl_->gauges.find(name);
    if (it == impl_->gauges.end()) {
        impl_->gauges.try_emplace(std::string(name), delta);
        return;
    }
    atomicAdd(it->second, delta);
}

void ServiceMetrics::decrementGauge(std::string_view name, double delta) {
    incrementGauge(name, -delta);
}

double ServiceMetrics::gaugeValue(std::string_view name) const {
    std::lock_guard lock(impl_->gaugeMutex);
    auto it = impl_->gauges.find(name);
    if (it == impl_->gauges.end()) {
        return 0.0;
    }
    return it->second.load(std::memory_order_acquire);
}

// ── Histograms ──────────────────────────────────────────────────────────────

void ServiceMetrics::registerHistogram(std::string_view name, HistogramBuckets buckets) {
    std::lock_guard lock(impl_->histogramMutex);
    if (impl_->histograms.find(name) == impl_->histograms.end()) {
        impl_->histograms.emplace(std::string(name), HistogramData(std::move(buckets.boundaries)));
    }
}

void ServiceMetrics::recordHistogram(std::string_view name, double value) {
    std::lock_guard lock(impl_->histogramMutex);
    auto it = impl_->histograms.find(name);
    if (it != impl_->histograms.end()) {
        it->second.record(value);
    }
}

uint64_t ServiceMetrics::histogramCount(std::string_view name) const {
    std::lock_guard lock(impl_->histogramMutex);
    auto it = impl_->histograms.find(name);
    return it == impl_->histograms.end() ? 0 : it->second.totalCount;
}

// ── Health ──────────────────────────────────────────────────────────────────

void ServiceMetrics::setServiceName(std::string_view name) {
    std::lock_guard lock(impl_->healthMutex);
    impl_->serviceName = std::string(name);
}

void ServiceMetrics::setComponentHealth(std::string_view component, HealthStatus status) {
    std::lock_guard lock(impl_->healthMutex);
    impl_->componentHealth[std::string(component)] = status;
}

HealthCheckResult ServiceMetrics::healthCheck() const {
    std::lock_guard lock(impl_->healthMutex);

    HealthCheckResult result;
    result.serviceName = impl_->serviceName;
    result.timestamp = std::chrono::system_clock::now();
    result.components = impl_->componentHealth;

    result.status = HealthStatus::Healthy;
    for (const auto& [_, status] : impl_->componentHealth) {
        if (status == HealthStatus::Unhealthy) {
            result.status = HealthStatus::Unhealthy;
            break;
        }
        if (status == HealthStatus::Degraded) {
            result.status = HealthStatus::Degraded;
        }
    }
    return result;
}

// ── Prometheus scrape ───────────────────────────────────────────────────────

std::string ServiceMetrics::scrape() const {
    std::ostringstream out;

    {
        std::lock_guard lock(impl_->counterMutex);
        for (const auto& [name, value] : impl_->counters) {
            out << "# TYPE " << name << " counter\n";
            out << name << " " << value.load(std::memory_order_relaxed) << "\n";
        }
    }

    {
        std::lock_guard lock(impl_->gaugeMutex);
        for (const auto& [name, value] : impl_->gauges) {
            out << "# TYPE " << name << " gauge\n";
            out << name << " " << formatDouble(value.load(std::memory_order_acquire)) << "\n";
        }
    }

    {
        std::lock_guard lock(impl_->histogramMutex);
        for (const auto& [name, data] : impl_->histograms) {
            out << "# TYPE " << name << " histogram\n";
            for (std::size_t i = 0; i < data.boundaries.size(); ++i) {
                out << name << "_bucket{le=\"" << formatDouble(data.boundaries[i]) << "\"} "
                    << data.bucketCounts[i] << "\n";
            }
            out << name << "_bucket{le=\"+Inf\"} " << data.bucketCounts.back() << "\n";
            out << name << "_sum " << formatDouble(data.totalSum) << "\n";
            out << name << "_count " << data.totalCount << "\n";
        }
    }

    return out.str();
}

void ServiceMetrics::reset() {
    {
        std::lock_guard lock(impl_->counterMutex);
        impl_->counters.clear();
    }
    {
        std::lock_guard lock(impl_->gaugeMutex);
        impl_->gauges.clear();
    }
    {
        std::lock_guard lock(impl_->histogramMutex);
        impl_->histograms.clear();
    }
    {
        std::lock_guard lock(impl_->healthMutex);
        impl_->componentHealth.clear();
    }
}

ServiceMetrics& ServiceMetrics::instance() {
    static ServiceMetrics inst;
    return inst;
}

}  // namespace eks::foundation
