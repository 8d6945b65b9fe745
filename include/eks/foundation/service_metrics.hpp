#pragma once

/// @file service_metrics.hpp
/// @brief In-process counters, gauges, histograms and component health with
///        Prometheus text exposition.

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace eks::foundation {

/// Upper bounds ("le") of histogram buckets.
struct HistogramBuckets {
    /// Request latency in milliseconds: {1,5,10,25,50,100,250,500,1000}.
    static HistogramBuckets defaultLatency();

    std::vector<double> boundaries;
};

/// Health of a single component or of the whole service.
enum class HealthStatus : uint8_t {
    Healthy,
    Degraded,
    Unhealthy
};

[[nodiscard]] std::string_view healthStatusName(HealthStatus status);

/// Snapshot returned by ServiceMetrics::healthCheck().
struct HealthCheckResult {
    HealthStatus status{HealthStatus::Healthy};
    std::string serviceName;
    std::unordered_map<std::string, HealthStatus> components;
    std::chrono::system_clock::time_point timestamp{};
};

/// Metrics registry shared by the HTTP layer and the key service.
///
/// Thread-safe. Metric names follow Prometheus conventions
/// (`eks_http_requests_total`, `eks_keys_registered_total`, ...).
///
/// Example:
/// @code
///   auto& metrics = ServiceMetrics::instance();
///   metrics.incrementCounter("eks_challenges_issued_total");
///   metrics.registerHistogram("eks_http_request_duration_ms",
///                             HistogramBuckets::defaultLatency());
///   metrics.recordHistogram("eks_http_request_duration_ms", 3.2);
///   std::string text = metrics.scrape();
/// @endcode
class ServiceMetrics {
public:
    ServiceMetrics();
    ~ServiceMetrics();

    ServiceMetrics(const ServiceMetrics&) = delete;
    ServiceMetrics& operator=(const ServiceMetrics&) = delete;
    ServiceMetrics(ServiceMetrics&&) noexcept;
    ServiceMetrics& operator=(ServiceMetrics&&) noexcept;

    // ── Counters ────────────────────────────────────────────────────────

    /// Add @p value to a counter, creating it on first use.
    void incrementCounter(std::string_view name, uint64_t value = 1);

    /// Current counter value, 0 for an unknown counter.
    [[nodiscard]] uint64_t counterValue(std::string_view name) const;

    // ── Gauges ──────────────────────────────────────────────────────────

    void setGauge(std::string_view name, double value);

    void incrementGauge(std::string_view name, double delta = 1.0);

    void decrementGauge(std::string_view name, double delta = 1.0);

    /// Current gauge value, 0.0 for an unknown gauge.
    [[nodiscard]] double gaugeValue(std::string_view name) const;

    // ── Histograms ──────────────────────────────────────────────────────

    /// Register a histogram. Re-registering an existing name is a no-op.
    void registerHistogram(std::string_view name, HistogramBuckets buckets);

    /// Record an observation. Ignored for unregistered names.
    void recordHistogram(std::string_view name, double value);

    /// Number of observations recorded, 0 for an unknown histogram.
    [[nodiscard]] uint64_t histogramCount(std::string_view name) const;

    // ── Health ──────────────────────────────────────────────────────────

    void setServiceName(std::string_view name);

    void setComponentHealth(std::string_view component, HealthStatus status);

    /// Overall status is the worst component status.
    [[nodiscard]] HealthCheckResult healthCheck() const;

    // ── Export ──────────────────────────────────────────────────────────

    /// Prometheus text exposition format (version 0.0.4).
    [[nodiscard]] std::string scrape() const;

    /// Clear every metric and health entry. Intended for tests.
    void reset();

    static ServiceMetrics& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace eks::foundation
