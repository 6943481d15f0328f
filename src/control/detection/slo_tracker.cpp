/// @file slo_tracker.cpp
/// @brief SampleSeries prefix counts and SloTracker queries.

#include "afc/control/slo_tracker.hpp"

#include <algorithm>
#include <mutex>

namespace afc::control {

using foundation::ControlError;
using foundation::ControlResult;
using foundation::ErrorCode;

double computeBurnRate(double compliance, double target) {
    if (compliance >= target) {
        return 0.0;
    }
    return (1.0 - compliance) / (1.0 - target);
}

// ---------------------------------------------------------------------------
// SampleSeries
// ---------------------------------------------------------------------------

void SampleSeries::add(TimePoint at, bool good) {
    uint64_t inc = good ? 1 : 0;
    if (entries_.empty() || entries_.back().at <= at) {
        uint64_t prev = entries_.empty() ? 0 : entries_.back().cumGood;
        entries_.push_back(Entry{at, good, prev + inc});
        return;
    }

    // Late sample: insert in order and shift the prefix sums of the tail.
    auto pos = std::upper_bound(entries_.begin(), entries_.end(), at,
                                [](TimePoint t, const Entry& e) { return t < e.at; });
    auto index = static_cast<std::size_t>(pos - entries_.begin());
    uint64_t before = goodBefore(index);
    entries_.insert(pos, Entry{at, good, before + inc});
    for (std::size_t i = index + 1; i < entries_.size(); ++i) {
        entries_[i].cumGood += inc;
    }
}

void SampleSeries::evictThrough(TimePoint cutoff) {
    while (!entries_.empty() && entries_.front().at <= cutoff) {
        entries_.pop_front();
    }
}

uint64_t SampleSeries::goodBefore(std::size_t index) const {
    if (index == 0) {
        if (entries_.empty()) {
            return 0;
        }
        const auto& first = entries_.front();
        return first.cumGood - (first.good ? 1 : 0);
    }
    return entries_[index - 1].cumGood;
}

std::pair<uint64_t, uint64_t> SampleSeries::count(TimePoint from, TimePoint to) const {
    auto byTime = [](const Entry& e, TimePoint t) { return e.at <= t; };
    auto first = std::partition_point(entries_.begin(), entries_.end(),
                                      [&](const Entry& e) { return byTime(e, from); });
    auto last = std::partition_point(first, entries_.end(),
                                     [&](const Entry& e) { return byTime(e, to); });
    if (first == last) {
        return {0, 0};
    }
    auto begin = static_cast<std::size_t>(first - entries_.begin());
    auto end = static_cast<std::size_t>(last - entries_.begin());
    uint64_t good = entries_[end - 1].cumGood - goodBefore(begin);
    return {good, static_cast<uint64_t>(end - begin)};
}

// ---------------------------------------------------------------------------
// SloTracker
// ---------------------------------------------------------------------------

void SloTracker::registerService(const ServiceSpec& spec) {
    std::unique_lock lock(mutex_);
    auto& svc = services_[spec.id];
    svc.target = spec.slo;
    svc.windows = spec.windows;
}

ControlResult<const SloTracker::ServiceWindows*> SloTracker::find(
    const ServiceId& service) const {
    auto it = services_.find(service);
    if (it == services_.end()) {
        return ControlResult<const ServiceWindows*>::err(ControlError(
            ErrorCode::ServiceNotFound, "service not tracked: " + service.value()));
    }
    return ControlResult<const ServiceWindows*>::ok(&it->second);
}

ControlResult<void> SloTracker::record(const ProbeSample& sample) {
    std::unique_lock lock(mutex_);
    auto it = services_.find(sample.service);
    if (it == services_.end()) {
        return ControlResult<void>::err(ControlError(
            ErrorCode::ServiceNotFound, "service not tracked: " + sample.service.value()));
    }
    auto& svc = it->second;

    bool good = sample.outcome == ProbeOutcome::Success &&
                sample.latency <= svc.target.latencyCeiling;
    svc.all.add(sample.timestamp, good);
    auto& regionSeries = svc.byRegion[sample.region];
    regionSeries.add(sample.timestamp, good);

    auto longest = std::max(svc.windows.shortWindow, svc.windows.longWindow);
    auto cutoff = svc.all.latest() - longest;
    svc.all.evictThrough(cutoff);
    for (auto& [_, series] : svc.byRegion) {
        series.evictThrough(cutoff);
    }
    return ControlResult<void>::ok();
}

ControlResult<double> SloTracker::compliance(const ServiceId& service, SloWindow window,
                                             TimePoint now) const {
    std::shared_lock lock(mutex_);
    auto svc = find(service);
    if (!svc) {
        return ControlResult<double>::err(svc.error());
    }
    auto [good, total] = svc.value()->all.count(now - svc.value()->length(window), now);
    return ControlResult<double>::ok(
        total == 0 ? 1.0 : static_cast<double>(good) / static_cast<double>(total));
}

ControlResult<double> SloTracker::compliance(const ServiceId& service, const RegionId& region,
                                             SloWindow window, TimePoint now) const {
    std::shared_lock lock(mutex_);
    auto svc = find(service);
    if (!svc) {
        return ControlResult<double>::err(svc.error());
    }
    auto it = svc.value()->byRegion.find(region);
    if (it == svc.value()->byRegion.end()) {
        return ControlResult<double>::ok(1.0);
    }
    auto [good, total] = it->second.count(now - svc.value()->length(window), now);
    return ControlResult<double>::ok(
        total == 0 ? 1.0 : static_cast<double>(good) / static_cast<double>(total));
}

ControlResult<double> SloTracker::burnRate(const ServiceId& service, SloWindow window,
                                           TimePoint now) const {
    auto c = compliance(service, window, now);
    if (!c) {
        return c;
    }
    std::shared_lock lock(mutex_);
    return ControlResult<double>::ok(
        computeBurnRate(c.value(), services_.at(service).target.successRatio));
}

ControlResult<double> SloTracker::burnRate(const ServiceId& service, const RegionId& region,
                                           SloWindow window, TimePoint now) const {
    auto c = compliance(service, region, window, now);
    if (!c) {
        return c;
    }
    std::shared_lock lock(mutex_);
    return ControlResult<double>::ok(
        computeBurnRate(c.value(), services_.at(service).target.successRatio));
}

ControlResult<ErrorBudget> SloTracker::errorBudget(const ServiceId& service, SloWindow window,
                                                   TimePoint now) const {
    std::shared_lock lock(mutex_);
    auto svc = find(service);
    if (!svc) {
        return ControlResult<ErrorBudget>::err(svc.error());
    }
    const auto& s = *svc.value();

    ErrorBudget budget;
    budget.service = service;
    budget.windowEnd = now;
    budget.windowStart = now - s.length(window);

    auto [good, total] = s.all.count(budget.windowStart, now);
    budget.totalSamples = total;
    budget.consumedFailures = total - good;
    budget.allowedFailures = static_cast<double>(total) * (1.0 - s.target.successRatio);
    budget.compliance = total == 0 ? 1.0 : static_cast<double>(good) / static_cast<double>(total);
    budget.burnRate = computeBurnRate(budget.compliance, s.target.successRatio);
    return ControlResult<ErrorBudget>::ok(budget);
}

std::size_t SloTracker::sampleCount(const ServiceId& service) const {
    std::shared_lock lock(mutex_);
    auto it = services_.find(service);
    return it == services_.end() ? 0 : it->second.all.size();
}

std::chrono::seconds SloTracker::windowLength(const ServiceId& service, SloWindow window) const {
    std::shared_lock lock(mutex_);
    auto it = services_.find(service);
    if (it == services_.end()) {
        return SloWindows{}.shortWindow;
    }
    return it->second.length(window);
}

} // namespace afc::control
