/// @file failover_journal.cpp
/// @brief FailoverJournal framing, CRC32 integrity and replay.

#include "afc/control/failover_journal.hpp"

#include "afc/foundation/control_logger.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <fstream>
#include <map>
#include <mutex>
#include <string>

namespace afc::control {

using foundation::ControlError;
using foundation::ControlResult;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

// Larger frames are treated as corruption and never allocated.
constexpr uint32_t kMaxFrameSize = 1024 * 1024;

// -- CRC32 (ISO 3309 polynomial) --------------------------------------------

uint32_t crc32(const uint8_t* data, std::size_t length) {
    static const auto table = [] {
        std::array<uint32_t, 256> t{};
        for (uint32_t i = 0; i < 256; ++i) {
            uint32_t c = i;
            for (int bit = 0; bit < 8; ++bit) {
                c = (c & 1) ? (c >> 1) ^ 0xEDB88320u : c >> 1;
            }
            t[i] = c;
        }
        return t;
    }();

    uint32_t crc = 0xFFFFFFFFu;
    for (std::size_t i = 0; i < length; ++i) {
        crc = table[(crc ^ data[i]) & 0xFFu] ^ (crc >> 8);
    }
    return ~crc;
}

int64_t toMicros(WallTime t) {
    return std::chrono::duration_cast<std::chrono::microseconds>(t.time_since_epoch()).count();
}

WallTime fromMicros(int64_t us) {
    return WallTime(std::chrono::duration_cast<WallClock::duration>(std::chrono::microseconds(us)));
}

// -- Event codec ------------------------------------------------------------

class Writer {
public:
    template <typename T>
    void put(T value) {
        auto offset = buf_.size();
        buf_.resize(offset + sizeof(T));
        std::memcpy(buf_.data() + offset, &value, sizeof(T));
    }

    void putString(const std::string& s) {
        put(static_cast<uint32_t>(s.size()));
        buf_.insert(buf_.end(), s.begin(), s.end());
    }

    void putTime(const std::optional<WallTime>& t) {
        put(static_cast<uint8_t>(t ? 1 : 0));
        put(t ? toMicros(*t) : int64_t{0});
    }

    std::vector<uint8_t>& bytes() { return buf_; }

private:
    std::vector<uint8_t> buf_;
};

class Reader {
public:
    Reader(const uint8_t* data, std::size_t size) : p_(data), end_(data + size) {}

    template <typename T>
    bool get(T& out) {
        if (static_cast<std::size_t>(end_ - p_) < sizeof(T)) {
            return false;
        }
        std::memcpy(&out, p_, sizeof(T));
        p_ += sizeof(T);
        return true;
    }

    bool getString(std::string& out) {
        uint32_t len = 0;
        if (!get(len) || static_cast<std::size_t>(end_ - p_) < len) {
            return false;
        }
        out.assign(reinterpret_cast<const char*>(p_), len);
        p_ += len;
        return true;
    }

    bool getTime(std::optional<WallTime>& out) {
        uint8_t present = 0;
        int64_t us = 0;
        if (!get(present) || !get(us)) {
            return false;
        }
        out = present != 0 ? std::optional<WallTime>(fromMicros(us)) : std::nullopt;
        return true;
    }

private:
    const uint8_t* p_;
    const uint8_t* end_;
};

void encodeEvent(Writer& w, const FailoverEvent& e) {
    w.put(e.id().value());
    w.putString(e.service().value());
    w.putString(e.fromRegion().value());
    w.putString(e.toRegion().value());
    w.putString(e.reason());
    w.put(static_cast<uint8_t>(e.manual() ? 1 : 0));
    w.put(toMicros(e.triggeredAt()));
    w.put(static_cast<uint8_t>(e.phase()));
    w.putTime(e.finishedAt());
    w.put(static_cast<uint8_t>(e.steps().size()));
    for (const auto& s : e.steps()) {
        w.put(static_cast<uint8_t>(s.step));
        w.put(static_cast<uint8_t>(s.status));
        w.put(s.attempts);
        w.putString(s.message);
        w.putTime(s.startedAt);
        w.putTime(s.finishedAt);
    }
}

std::optional<FailoverEvent> decodeEvent(Reader& r) {
    uint64_t id = 0;
    std::string service, from, to, reason;
    uint8_t manual = 0, phase = 0, stepCount = 0;
    int64_t triggeredUs = 0;
    std::optional<WallTime> finishedAt;

    if (!r.get(id) || !r.getString(service) || !r.getString(from) || !r.getString(to) ||
        !r.getString(reason) || !r.get(manual) || !r.get(triggeredUs) || !r.get(phase) ||
        !r.getTime(finishedAt) || !r.get(stepCount)) {
        return std::nullopt;
    }
    if (phase > static_cast<uint8_t>(FailoverPhase::Aborted)) {
        return std::nullopt;
    }

    std::vector<StepRecord> steps;
    for (uint8_t i = 0; i < stepCount; ++i) {
        StepRecord s;
        uint8_t kind = 0, status = 0;
        if (!r.get(kind) || !r.get(status) || !r.get(s.attempts) || !r.getString(s.message) ||
            !r.getTime(s.startedAt) || !r.getTime(s.finishedAt)) {
            return std::nullopt;
        }
        if (kind > static_cast<uint8_t>(StepKind::ResumeWrites) ||
            status > static_cast<uint8_t>(StepStatus::CompensationFailed)) {
            return std::nullopt;
        }
        s.step = static_cast<StepKind>(kind);
        s.status = static_cast<StepStatus>(status);
        steps.push_back(std::move(s));
    }

    return FailoverEvent::restore(FailoverEventId(id), ServiceId(service), RegionId(from),
                                  RegionId(to), std::move(reason), manual != 0,
                                  fromMicros(triggeredUs), static_cast<FailoverPhase>(phase),
                                  std::move(steps), finishedAt);
}

std::vector<uint8_t> buildFrame(uint64_t sequence, const FailoverEvent& event) {
    Writer body;
    body.put(sequence);
    body.put(toMicros(WallClock::now()));
    encodeEvent(body, event);
    auto& bytes = body.bytes();

    uint32_t checksum = crc32(bytes.data(), bytes.size());
    uint32_t frameSize = static_cast<uint32_t>(bytes.size() + sizeof(checksum));

    std::vector<uint8_t> frame(sizeof(frameSize));
    std::memcpy(frame.data(), &frameSize, sizeof(frameSize));
    frame.insert(frame.end(), bytes.begin(), bytes.end());
    frame.resize(frame.size() + sizeof(checksum));
    std::memcpy(frame.data() + frame.size() - sizeof(checksum), &checksum, sizeof(checksum));
    return frame;
}

} // namespace

// -- Impl -------------------------------------------------------------------

struct FailoverJournal::Impl {
    JournalConfig config;
    mutable std::mutex mutex;
    std::ofstream writer;
    bool open = false;
    uint64_t nextSequence = 1;
    std::size_t frames = 0;

    // Latest snapshot per event id.
    std::map<uint64_t, FailoverEvent> latest;

    explicit Impl(JournalConfig cfg) : config(std::move(cfg)) {}

    std::filesystem::path filePath() const { return config.directory / "failover.journal"; }

    ControlResult<void> load() {
        auto path = filePath();
        if (!std::filesystem::exists(path)) {
            return ControlResult<void>::ok();
        }
        std::error_code ec;
        const auto fileSize = std::filesystem::file_size(path, ec);
        if (ec) {
            return ControlResult<void>::err(ControlError(
                ErrorCode::JournalReadFailed, "cannot stat " + path.string() + ": " + ec.message()));
        }
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return ControlResult<void>::err(
                ControlError(ErrorCode::JournalReadFailed, "cannot open " + path.string()));
        }

        latest.clear();
        frames = 0;
        uint64_t maxSeq = 0;
        // End of the last frame that replayed cleanly.
        uintmax_t goodOffset = 0;
        while (true) {
            uint32_t frameSize = 0;
            in.read(reinterpret_cast<char*>(&frameSize), sizeof(frameSize));
            if (in.gcount() < static_cast<std::streamsize>(sizeof(frameSize))) {
                break;
            }
            if (frameSize < 8 + 8 + 4) {
                AFC_LOG_WARN(LogCategory::Executor, "journal frame too small, replay stopped");
                break;
            }
            const auto remaining = fileSize - goodOffset - sizeof(frameSize);
            if (frameSize > kMaxFrameSize || frameSize > remaining) {
                AFC_LOG_WARN(LogCategory::Executor,
                             "journal frame of " + std::to_string(frameSize) +
                                 " bytes exceeds the file, replay stopped");
                break;
            }
            std::vector<uint8_t> buf(frameSize);
            in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(frameSize));
            if (static_cast<std::size_t>(in.gcount()) < frameSize) {
                AFC_LOG_WARN(LogCategory::Executor, "truncated journal frame, replay stopped");
                break;
            }

            uint32_t stored = 0;
            std::memcpy(&stored, buf.data() + frameSize - 4, 4);
            if (stored != crc32(buf.data(), frameSize - 4)) {
                AFC_LOG_WARN(LogCategory::Executor, "journal CRC mismatch, replay stopped");
                break;
            }

            Reader r(buf.data(), frameSize - 4);
            uint64_t seq = 0;
            int64_t writtenAt = 0;
            if (!r.get(seq) || !r.get(writtenAt)) {
                break;
            }
            auto event = decodeEvent(r);
            if (!event) {
                AFC_LOG_WARN(LogCategory::Executor, "undecodable journal frame, replay stopped");
                break;
            }
            maxSeq = std::max(maxSeq, seq);
            latest.insert_or_assign(event->id().value(), std::move(*event));
            ++frames;
            goodOffset += sizeof(frameSize) + frameSize;
        }
        in.close();
        nextSequence = maxSeq + 1;

        // New frames must follow the last good one, or the next replay would
        // stop at the damaged bytes and never reach them.
        if (goodOffset < fileSize) {
            std::filesystem::resize_file(path, goodOffset, ec);
            if (ec) {
                return ControlResult<void>::err(ControlError(
                    ErrorCode::JournalWriteFailed,
                    "cannot truncate damaged journal tail: " + ec.message()));
            }
            AFC_LOG_WARN(LogCategory::Executor,
                         "discarded " + std::to_string(fileSize - goodOffset) +
                             " byte(s) of damaged journal tail");
        }
        return ControlResult<void>::ok();
    }
};

FailoverJournal::FailoverJournal(JournalConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

FailoverJournal::~FailoverJournal() {
    if (impl_) {
        close();
    }
}

ControlResult<void> FailoverJournal::open() {
    std::lock_guard lock(impl_->mutex);
    if (impl_->open) {
        return ControlResult<void>::ok();
    }

    std::error_code ec;
    std::filesystem::create_directories(impl_->config.directory, ec);
    if (ec) {
        return ControlResult<void>::err(ControlError(
            ErrorCode::JournalError, "cannot create journal directory: " + ec.message()));
    }

    auto loaded = impl_->load();
    if (!loaded) {
        return loaded;
    }

    impl_->writer.open(impl_->filePath(), std::ios::binary | std::ios::app);
    if (!impl_->writer) {
        return ControlResult<void>::err(
            ControlError(ErrorCode::JournalWriteFailed, "cannot open journal for writing"));
    }
    impl_->open = true;
    AFC_LOG_INFO(LogCategory::Core, "journal opened with " + std::to_string(impl_->frames) +
                                        " frame(s), " + std::to_string(impl_->latest.size()) +
                                        " event(s)");
    return ControlResult<void>::ok();
}

void FailoverJournal::close() {
    std::lock_guard lock(impl_->mutex);
    if (!impl_->open) {
        return;
    }
    impl_->writer.flush();
    impl_->writer.close();
    impl_->open = false;
}

ControlResult<uint64_t> FailoverJournal::append(const FailoverEvent& event) {
    std::lock_guard lock(impl_->mutex);
    if (!impl_->open) {
        return ControlResult<uint64_t>::err(
            ControlError(ErrorCode::JournalNotOpen, "journal is not open"));
    }

    uint64_t seq = impl_->nextSequence++;
    auto frame = buildFrame(seq, event);
    impl_->writer.write(reinterpret_cast<const char*>(frame.data()),
                        static_cast<std::streamsize>(frame.size()));
    if (impl_->config.syncOnWrite) {
        impl_->writer.flush();
    }
    if (!impl_->writer) {
        return ControlResult<uint64_t>::err(
            ControlError(ErrorCode::JournalWriteFailed, "failed to write journal frame"));
    }

    impl_->latest.insert_or_assign(event.id().value(), event);
    ++impl_->frames;
    return ControlResult<uint64_t>::ok(seq);
}

ControlResult<std::vector<FailoverEvent>> FailoverJournal::replay() const {
    std::lock_guard lock(impl_->mutex);
    std::vector<FailoverEvent> out;
    out.reserve(impl_->latest.size());
    for (const auto& [_, event] : impl_->latest) {
        out.push_back(event);
    }
    return ControlResult<std::vector<FailoverEvent>>::ok(std::move(out));
}

ControlResult<std::vector<FailoverEvent>> FailoverJournal::liveEvents() const {
    std::lock_guard lock(impl_->mutex);
    std::vector<FailoverEvent> out;
    for (const auto& [_, event] : impl_->latest) {
        if (!event.isTerminal()) {
            out.push_back(event);
        }
    }
    return ControlResult<std::vector<FailoverEvent>>::ok(std::move(out));
}

ControlResult<void> FailoverJournal::compact() {
    std::lock_guard lock(impl_->mutex);
    if (!impl_->open) {
        return ControlResult<void>::err(
            ControlError(ErrorCode::JournalNotOpen, "journal is not open"));
    }

    impl_->writer.close();
    auto path = impl_->filePath();
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            impl_->writer.open(path, std::ios::binary | std::ios::app);
            return ControlResult<void>::err(
                ControlError(ErrorCode::JournalWriteFailed, "cannot write compacted journal"));
        }
        uint64_t seq = 1;
        for (const auto& [_, event] : impl_->latest) {
            auto frame = buildFrame(seq++, event);
            out.write(reinterpret_cast<const char*>(frame.data()),
                      static_cast<std::streamsize>(frame.size()));
        }
        out.flush();
        impl_->nextSequence = seq;
        impl_->frames = impl_->latest.size();
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    impl_->writer.open(path, std::ios::binary | std::ios::app);
    if (ec) {
        return ControlResult<void>::err(
            ControlError(ErrorCode::JournalWriteFailed, "cannot replace journal: " + ec.message()));
    }
    if (!impl_->writer) {
        return ControlResult<void>::err(
            ControlError(ErrorCode::JournalWriteFailed, "cannot reopen journal"));
    }
    return ControlResult<void>::ok();
}

uint64_t FailoverJournal::maxEventId() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->latest.empty() ? 0 : impl_->latest.rbegin()->first;
}

std::size_t FailoverJournal::frameCount() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->frames;
}

bool FailoverJournal::isOpen() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->open;
}

} // namespace afc::control
