#pragma once

/// @file failover_journal.hpp
/// @brief Append-only, CRC-checked journal of FailoverEvent snapshots.
///
/// Every mutation of a FailoverEvent is appended as a full snapshot before
/// the executor proceeds, so after a crash the latest snapshot of each live
/// event can be replayed and its execution resumed.

#include "afc/control/failover_event.hpp"
#include "afc/foundation/control_result.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

namespace afc::control {

struct JournalConfig {
    std::filesystem::path directory = "/var/lib/afc/journal";

    /// Flush the stream after each append.
    bool syncOnWrite = true;
};

/// Binary framing on disk (little-endian host order):
///   [4: frame_size] [8: sequence] [8: written_at_us] [N: event] [4: crc32]
/// frame_size counts everything after itself and is capped at 1 MiB. Replay
/// stops at the first truncated or corrupted frame, and open() cuts the file
/// back to the end of the last good frame before appending.
///
/// @code
///   FailoverJournal journal({.directory = "/var/lib/afc/journal"});
///   journal.open();
///   executor.setRecorder([&](const FailoverEvent& e) { journal.append(e); });
///
///   // after restart
///   for (auto& event : journal.liveEvents().value()) { resume(event); }
/// @endcode
///
/// Thread-safe.
class FailoverJournal {
public:
    explicit FailoverJournal(JournalConfig config);
    ~FailoverJournal();

    FailoverJournal(const FailoverJournal&) = delete;
    FailoverJournal& operator=(const FailoverJournal&) = delete;

    /// Create the directory if needed and load existing frames.
    [[nodiscard]] foundation::ControlResult<void> open();

    void close();

    /// Append a snapshot of @p event. @return The frame sequence number.
    foundation::ControlResult<uint64_t> append(const FailoverEvent& event);

    /// Latest snapshot of every journaled event, ordered by event id.
    [[nodiscard]] foundation::ControlResult<std::vector<FailoverEvent>> replay() const;

    /// Latest snapshots whose phase is not terminal.
    [[nodiscard]] foundation::ControlResult<std::vector<FailoverEvent>> liveEvents() const;

    /// Rewrite the file keeping only the latest snapshot of each event.
    [[nodiscard]] foundation::ControlResult<void> compact();

    /// Highest event id seen (0 when empty).
    [[nodiscard]] uint64_t maxEventId() const;

    [[nodiscard]] std::size_t frameCount() const;
    [[nodiscard]] bool isOpen() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace afc::control
