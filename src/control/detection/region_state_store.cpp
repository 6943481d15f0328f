/// @file region_state_store.cpp
/// @brief RegionStateStore compare-and-set operations.

#include "afc/control/region_state_store.hpp"

#include "afc/foundation/control_logger.hpp"

#include <algorithm>

namespace afc::control {

using foundation::ControlError;
using foundation::ControlResult;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

ControlError regionNotFound(const ServiceId& service, const RegionId& region) {
    return ControlError(ErrorCode::RegionNotFound,
                        "unknown region " + region.value() + " for service " + service.value());
}

} // namespace

void RegionStateStore::registerService(const ServiceSpec& spec) {
    ServiceEntry entry;
    for (const auto& r : spec.regions) {
        RegionRecord rec;
        rec.service = spec.id;
        rec.region = r.id;
        rec.role = r.role;
        rec.state = RegionState::Healthy;
        entry.regions.push_back(std::move(rec));
        if (r.role == RegionRole::Primary) {
            entry.primary = r.id;
        }
    }

    std::lock_guard lock(mutex_);
    services_[spec.id] = std::move(entry);
}

ControlResult<RegionStateStore::ServiceEntry*> RegionStateStore::entryLocked(
    const ServiceId& service) {
    auto it = services_.find(service);
    if (it == services_.end()) {
        return ControlResult<ServiceEntry*>::err(
            ControlError(ErrorCode::ServiceNotFound, "unknown service " + service.value()));
    }
    return ControlResult<ServiceEntry*>::ok(&it->second);
}

RegionRecord* RegionStateStore::findLocked(ServiceEntry& entry, const RegionId& region) {
    auto it = std::find_if(entry.regions.begin(), entry.regions.end(),
                           [&](const RegionRecord& r) { return r.region == region; });
    return it == entry.regions.end() ? nullptr : &*it;
}

ControlResult<RegionRecord> RegionStateStore::get(const ServiceId& service,
                                                  const RegionId& region) const {
    std::lock_guard lock(mutex_);
    auto it = services_.find(service);
    if (it == services_.end()) {
        return ControlResult<RegionRecord>::err(
            ControlError(ErrorCode::ServiceNotFound, "unknown service " + service.value()));
    }
    for (const auto& rec : it->second.regions) {
        if (rec.region == region) {
            return ControlResult<RegionRecord>::ok(rec);
        }
    }
    return ControlResult<RegionRecord>::err(regionNotFound(service, region));
}

ControlResult<std::vector<RegionRecord>> RegionStateStore::snapshot(
    const ServiceId& service) const {
    std::lock_guard lock(mutex_);
    auto it = services_.find(service);
    if (it == services_.end()) {
        return ControlResult<std::vector<RegionRecord>>::err(
            ControlError(ErrorCode::ServiceNotFound, "unknown service " + service.value()));
    }
    return ControlResult<std::vector<RegionRecord>>::ok(it->second.regions);
}

ControlResult<RegionId> RegionStateStore::primaryOf(const ServiceId& service) const {
    std::lock_guard lock(mutex_);
    auto it = services_.find(service);
    if (it == services_.end()) {
        return ControlResult<RegionId>::err(
            ControlError(ErrorCode::ServiceNotFound, "unknown service " + service.value()));
    }
    return ControlResult<RegionId>::ok(it->second.primary);
}

ControlResult<RegionRecord> RegionStateStore::transition(const ServiceId& service,
                                                         const RegionId& region,
                                                         RegionState expected,
                                                         RegionState next) {
    std::lock_guard lock(mutex_);
    auto entry = entryLocked(service);
    if (!entry) {
        return ControlResult<RegionRecord>::err(entry.error());
    }
    auto* rec = findLocked(*entry.value(), region);
    if (rec == nullptr) {
        return ControlResult<RegionRecord>::err(regionNotFound(service, region));
    }

    if (rec->state != expected) {
        conflicts_.fetch_add(1, std::memory_order_relaxed);
        return ControlResult<RegionRecord>::err(ControlError(
            ErrorCode::ConflictError,
            service.value() + "/" + region.value() + " expected " +
                std::string(regionStateName(expected)) + " but is " +
                std::string(regionStateName(rec->state)),
            *rec));
    }
    if (next == expected) {
        return ControlResult<RegionRecord>::ok(*rec);
    }

    rec->state = next;
    ++rec->version;
    AFC_LOG_DEBUG(LogCategory::Detector,
                  "store " + service.value() + "/" + region.value() + ": " +
                      std::string(regionStateName(expected)) + " -> " +
                      std::string(regionStateName(next)));
    return ControlResult<RegionRecord>::ok(*rec);
}

ControlResult<RegionRecord> RegionStateStore::recordProbe(const ServiceId& service,
                                                          const RegionId& region,
                                                          TimePoint at, bool success) {
    std::lock_guard lock(mutex_);
    auto entry = entryLocked(service);
    if (!entry) {
        return ControlResult<RegionRecord>::err(entry.error());
    }
    auto* rec = findLocked(*entry.value(), region);
    if (rec == nullptr) {
        return ControlResult<RegionRecord>::err(regionNotFound(service, region));
    }

    if (!rec->lastProbe || *rec->lastProbe < at) {
        rec->lastProbe = at;
    }
    rec->consecutiveFailures = success ? 0 : rec->consecutiveFailures + 1;
    ++rec->version;
    return ControlResult<RegionRecord>::ok(*rec);
}

ControlResult<void> RegionStateStore::compareAndSetPrimary(const ServiceId& service,
                                                           const RegionId& expected,
                                                           const RegionId& next) {
    std::lock_guard lock(mutex_);
    auto entry = entryLocked(service);
    if (!entry) {
        return ControlResult<void>::err(entry.error());
    }
    auto& e = *entry.value();

    if (e.primary != expected) {
        conflicts_.fetch_add(1, std::memory_order_relaxed);
        return ControlResult<void>::err(ControlError(
            ErrorCode::ConflictError,
            service.value() + ": expected primary " + expected.value() + " but is " +
                e.primary.value(),
            e.primary));
    }

    auto* nextRec = findLocked(e, next);
    if (nextRec == nullptr) {
        return ControlResult<void>::err(regionNotFound(service, next));
    }
    if (next == expected) {
        return ControlResult<void>::ok();
    }

    if (auto* oldRec = findLocked(e, expected)) {
        oldRec->role = RegionRole::Standby;
        ++oldRec->version;
    }
    nextRec->role = RegionRole::Primary;
    ++nextRec->version;
    e.primary = next;

    AFC_LOG_INFO(LogCategory::Coordinator,
                 "primary of " + service.value() + " moved " + expected.value() + " -> " +
                     next.value());
    return ControlResult<void>::ok();
}

} // namespace afc::control
