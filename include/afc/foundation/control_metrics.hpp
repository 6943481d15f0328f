#pragma once

/// @file control_metrics.hpp
/// @brief ControlMetrics: counters, gauges, histograms and component health
///        for the availability controller, exported in Prometheus text format.

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace afc::foundation {

// ── Metric labels ───────────────────────────────────────────────────────────

/// Ordered label set attached to a series, e.g. {{"service","checkout"}}.
using MetricLabels = std::vector<std::pair<std::string, std::string>>;

/// Build the Prometheus series key `name{k="v",...}`.
/// Returns @p name unchanged when @p labels is empty.
[[nodiscard]] std::string seriesKey(std::string_view name, const MetricLabels& labels);

/// Bucket boundaries for histogram metrics (le = "less than or equal").
struct HistogramBuckets {
    /// Probe latency buckets in milliseconds.
    static HistogramBuckets probeLatency();

    /// Failover duration buckets in seconds.
    static HistogramBuckets failoverDuration();

    std::vector<double> boundaries;
};

// ── Health checking ─────────────────────────────────────────────────────────

enum class HealthStatus : uint8_t {
    Healthy,
    Degraded,
    Unhealthy
};

/// Aggregated health of the controller's components.
struct HealthCheckResult {
    HealthStatus status{HealthStatus::Healthy};
    std::string serviceName;
    std::map<std::string, HealthStatus> components;
    std::chrono::system_clock::time_point timestamp{};
};

[[nodiscard]] std::string_view healthStatusName(HealthStatus status);

// ── ControlMetrics ──────────────────────────────────────────────────────────

/// Thread-safe metrics registry.
///
/// Series are keyed by the full labelled name produced by seriesKey(); the
/// scrape output groups series of the same family under one TYPE line.
///
/// @code
///   auto& metrics = ControlMetrics::instance();
///   metrics.incrementCounter(seriesKey("afc_probe_total",
///                                      {{"service", "checkout"}, {"outcome", "timeout"}}));
///   metrics.setGauge("afc_live_failovers", 1.0);
///   std::string text = metrics.scrape();
/// @endcode
class ControlMetrics {
public:
    ControlMetrics();
    ~ControlMetrics();

    ControlMetrics(const ControlMetrics&) = delete;
    ControlMetrics& operator=(const ControlMetrics&) = delete;
    ControlMetrics(ControlMetrics&&) noexcept;
    ControlMetrics& operator=(ControlMetrics&&) noexcept;

    // ── Counters ────────────────────────────────────────────────────────

    void incrementCounter(std::string_view series, uint64_t value = 1);

    /// Returns 0 if the counter does not exist.
    [[nodiscard]] uint64_t counterValue(std::string_view series) const;

    // ── Gauges ──────────────────────────────────────────────────────────

    void setGauge(std::string_view series, double value);
    void incrementGauge(std::string_view series, double delta = 1.0);

    /// Returns 0.0 if the gauge does not exist.
    [[nodiscard]] double gaugeValue(std::string_view series) const;

    // ── Histograms ──────────────────────────────────────────────────────

    /// Must be called before recordHistogram() for the same series.
    void registerHistogram(std::string_view series, HistogramBuckets buckets);

    /// No-op if the histogram has not been registered.
    void recordHistogram(std::string_view series, double value);

    /// Number of observations recorded, 0 if unregistered.
    [[nodiscard]] uint64_t histogramCount(std::string_view series) const;

    // ── Health ──────────────────────────────────────────────────────────

    void setComponentHealth(std::string_view component, HealthStatus status);

    /// Overall status is the worst status among all components.
    [[nodiscard]] HealthCheckResult healthCheck() const;

    // ── Export ───────────────────────────────────────────────────────────

    /// Serialize all metrics in Prometheus text exposition format.
    [[nodiscard]] std::string scrape() const;

    /// Clear everything. Intended for tests.
    void reset();

    static ControlMetrics& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace afc::foundation
