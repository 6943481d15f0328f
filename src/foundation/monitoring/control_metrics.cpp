/// @file control_metrics.cpp
/// @brief In-memory ControlMetrics with Prometheus text export.

#include "afc/foundation/control_metrics.hpp"

#include <cmath>
#include <mutex>
#include <sstream>

namespace afc::foundation {

std::string seriesKey(std::string_view name, const MetricLabels& labels) {
    std::string key(name);
    if (labels.empty()) {
        return key;
    }
    key += '{';
    bool first = true;
    for (const auto& [label, value] : labels) {
        if (!first) {
            key += ',';
        }
        key += label;
        key += "=\"";
        for (char c : value) {
            if (c == '"' || c == '\\') {
                key += '\\';
            }
            key += c;
        }
        key += '"';
        first = false;
    }
    key += '}';
    return key;
}

HistogramBuckets HistogramBuckets::probeLatency() {
    return HistogramBuckets{{5, 10, 25, 50, 100, 250, 500, 1000, 2000, 5000}};
}

HistogramBuckets HistogramBuckets::failoverDuration() {
    return HistogramBuckets{{1, 5, 15, 30, 60, 120, 300, 600}};
}

std::string_view healthStatusName(HealthStatus status) {
    switch (status) {
        case HealthStatus::Healthy:   return "healthy";
        case HealthStatus::Degraded:  return "degraded";
        case HealthStatus::Unhealthy: return "unhealthy";
    }
    return "unknown";
}

namespace {

struct HistogramData {
    std::vector<double> boundaries;
    std::vector<uint64_t> bucketCounts;  // boundaries.size() + 1 (+Inf)
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

std::string familyOf(const std::string& series) {
    auto brace = series.find('{');
    return brace == std::string::npos ? series : series.substr(0, brace);
}

// Insert a suffix (e.g. "_bucket") between the family name and its labels,
// appending @p extraLabel inside the braces.
std::string decorate(const std::string& series, std::string_view suffix,
                     const std::string& extraLabel = {}) {
    auto brace = series.find('{');
    std::string family = brace == std::string::npos ? series : series.substr(0, brace);
    std::string labels = brace == std::string::npos
        ? std::string{}
        : series.substr(brace + 1, series.size() - brace - 2);
    if (!extraLabel.empty()) {
        labels = labels.empty() ? extraLabel : labels + "," + extraLabel;
    }
    std::string out = family;
    out += suffix;
    if (!labels.empty()) {
        out += '{' + labels + '}';
    }
    return out;
}

}  // namespace

// ── Impl ────────────────────────────────────────────────────────────────────

struct ControlMetrics::Impl {
    mutable std::mutex mutex;
    std::map<std::string, uint64_t, std::less<>> counters;
    std::map<std::string, double, std::less<>> gauges;
    std::map<std::string, HistogramData, std::less<>> histograms;

    std::string serviceName{"afc_controller"};
    std::map<std::string, HealthStatus> componentHealth;
};

ControlMetrics::ControlMetrics() : impl_(std::make_unique<Impl>()) {}
ControlMetrics::~ControlMetrics() = default;
ControlMetrics::ControlMetrics(ControlMetrics&&) noexcept = default;
ControlMetrics& ControlMetrics::operator=(ControlMetrics&&) noexcept = default;

// ── Counters ────────────────────────────────────────────────────────────────

void ControlMetrics::incrementCounter(std::string_view series, uint64_t value) {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->counters.find(series);
    if (it == impl_->counters.end()) {
        impl_->counters.emplace(std::string(series), value);
    } else {
        it->second += value;
    }
}

uint64_t ControlMetrics::counterValue(std::string_view series) const {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->counters.find(series);
    return it == impl_->counters.end() ? 0 : it->second;
}

// ── Gauges ──────────────────────────────────────────────────────────────────

void ControlMetrics::setGauge(std::string_view series, double value) {
    std::lock_guard lock(impl_->mutex);
    impl_->gauges[std::string(series)] = value;
}

void ControlMetrics::incrementGauge(std::string_view series, double delta) {
    std::lock_guard lock(impl_->mutex);
    impl_->gauges[std::string(series)] += delta;
}

double ControlMetrics::gaugeValue(std::string_view series) const {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->gauges.find(series);
    return it == impl_->gauges.end() ? 0.0 : it->second;
}

// ── Histograms ──────────────────────────────────────────────────────────────

void ControlMetrics::registerHistogram(std::string_view series, HistogramBuckets buckets) {
    std::lock_guard lock(impl_->mutex);
    if (impl_->histograms.find(series) == impl_->histograms.end()) {
        impl_->histograms.emplace(std::string(series),
                                  HistogramData(std::move(buckets.boundaries)));
    }
}

void ControlMetrics::recordHistogram(std::string_view series, double value) {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->histograms.find(series);
    if (it != impl_->histograms.end()) {
        it->second.record(value);
    }
}

uint64_t ControlMetrics::histogramCount(std::string_view series) const {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->histograms.find(series);
    return it == impl_->histograms.end() ? 0 : it->second.totalCount;
}

// ── Health ───────────────────────────────────────────────────────────────────

void ControlMetrics::setComponentHealth(std::string_view component, HealthStatus status) {
    std::lock_guard lock(impl_->mutex);
    impl_->componentHealth[std::string(component)] = status;
}

HealthCheckResult ControlMetrics::healthCheck() const {
    std::lock_guard lock(impl_->mutex);

    HealthCheckResult result;
    result.serviceName = impl_->serviceName;
    result.timestamp = std::chrono::system_clock::now();
    result.components = impl_->componentHealth;

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

std::string ControlMetrics::scrape() const {
    std::lock_guard lock(impl_->mutex);
    std::ostringstream out;

    std::string lastFamily;
    for (const auto& [series, value] : impl_->counters) {
        auto family = familyOf(series);
        if (family != lastFamily) {
            out << "# TYPE " << family << " counter\n";
            lastFamily = family;
        }
        out << series << " " << value << "\n";
    }

    lastFamily.clear();
    for (const auto& [series, value] : impl_->gauges) {
        auto family = familyOf(series);
        if (family != lastFamily) {
            out << "# TYPE " << family << " gauge\n";
            lastFamily = family;
        }
        out << series << " " << formatDouble(value) << "\n";
    }

    lastFamily.clear();
    for (const auto& [series, data] : impl_->histograms) {
        auto family = familyOf(series);
        if (family != lastFamily) {
            out << "# TYPE " << family << " histogram\n";
            lastFamily = family;
        }
        for (std::size_t i = 0; i < data.boundaries.size(); ++i) {
            out << decorate(series, "_bucket",
                            "le=\"" + formatDouble(data.boundaries[i]) + "\"")
                << " " << data.bucketCounts[i] << "\n";
        }
        out << decorate(series, "_bucket", "le=\"+Inf\"") << " "
            << data.bucketCounts.back() << "\n";
        out << decorate(series, "_sum") << " " << formatDouble(data.totalSum) << "\n";
        out << decorate(series, "_count") << " " << data.totalCount << "\n";
    }

    return out.str();
}

void ControlMetrics::reset() {
    std::lock_guard lock(impl_->mutex);
    impl_->counters.clear();
    impl_->gauges.clear();
    impl_->histograms.clear();
    impl_->componentHealth.clear();
}

ControlMetrics& ControlMetrics::instance() {
    static ControlMetrics inst;
    return inst;
}

}  // namespace afc::foundation
