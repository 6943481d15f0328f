#pragma once

/// @file region_state_store.hpp
/// @brief In-memory table of believed region states with compare-and-set
///        transitions and the active-primary designation per service.

#include "afc/control/fleet_types.hpp"
#include "afc/foundation/control_result.hpp"

#include <atomic>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace afc::control {

/// Authoritative record of every (service, region).
///
/// Mutations go through named compare-and-set operations only. A transition
/// is accepted iff the caller's expected state equals the current state;
/// otherwise it fails with ConflictError whose context is the current
/// RegionRecord, so the caller can re-read and retry once.
///
/// @code
///   auto r = store.transition(svc, region, RegionState::Healthy, RegionState::Degraded);
///   if (!r && r.error().code() == ErrorCode::ConflictError) {
///       const auto* seen = r.error().context<RegionRecord>();
///       // re-evaluate against seen->state, retry once, else defer
///   }
/// @endcode
class RegionStateStore {
public:
    RegionStateStore() = default;

    RegionStateStore(const RegionStateStore&) = delete;
    RegionStateStore& operator=(const RegionStateStore&) = delete;

    /// Create records for every region of @p spec (state Healthy, configured
    /// role). Existing records of the service are replaced.
    void registerService(const ServiceSpec& spec);

    [[nodiscard]] foundation::ControlResult<RegionRecord> get(
        const ServiceId& service, const RegionId& region) const;

    /// Regions of @p service in failover priority order.
    [[nodiscard]] foundation::ControlResult<std::vector<RegionRecord>> snapshot(
        const ServiceId& service) const;

    [[nodiscard]] foundation::ControlResult<RegionId> primaryOf(const ServiceId& service) const;

    /// Compare-and-set of the region state.
    /// @return The updated record, or ConflictError / ServiceNotFound / RegionNotFound.
    foundation::ControlResult<RegionRecord> transition(const ServiceId& service,
                                                       const RegionId& region,
                                                       RegionState expected,
                                                       RegionState next);

    /// Update last-probe time and the consecutive-failure counter.
    foundation::ControlResult<RegionRecord> recordProbe(const ServiceId& service,
                                                        const RegionId& region,
                                                        TimePoint at, bool success);

    /// Move the primary designation from @p expected to @p next; the old
    /// primary becomes a standby.
    /// @return ConflictError (context: current primary RegionId) if @p expected
    ///         is not the current primary.
    foundation::ControlResult<void> compareAndSetPrimary(const ServiceId& service,
                                                         const RegionId& expected,
                                                         const RegionId& next);

    /// Number of rejected compare-and-set attempts since construction.
    [[nodiscard]] uint64_t conflictCount() const {
        return conflicts_.load(std::memory_order_relaxed);
    }

private:
    struct ServiceEntry {
        std::vector<RegionRecord> regions;  // priority order
        RegionId primary;
    };

    RegionRecord* findLocked(ServiceEntry& entry, const RegionId& region);
    foundation::ControlResult<ServiceEntry*> entryLocked(const ServiceId& service);

    mutable std::mutex mutex_;
    std::unordered_map<ServiceId, ServiceEntry> services_;
    std::atomic<uint64_t> conflicts_{0};
};

} // namespace afc::control
