#include <gtest/gtest.h>

#include <fstream>
#include <string>
#include <iterator>
#include <vector>

#include "afc/control/failover_journal.hpp"
#include "support/control_fakes.hpp"

using namespace afc::control;
using afc::foundation::ErrorCode;
using afc::test::TempDir;

namespace {

FailoverEvent makeEvent(uint64_t id, const std::string& to = "us-west") {
    return FailoverEvent(FailoverEventId(id), ServiceId("checkout"), RegionId("us-east"),
                         RegionId(to), "primary us-east unreachable", false, WallClock::now());
}

void markStep(FailoverEvent& event, StepKind kind, StepStatus status, uint32_t attempts,
              const std::string& message) {
    StepRecord rec = event.step(kind);
    rec.status = status;
    rec.attempts = attempts;
    rec.message = message;
    rec.startedAt = WallClock::now();
    rec.finishedAt = WallClock::now();
    ASSERT_TRUE(event.updateStep(rec));
}

std::vector<char> readAll(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

void writeAll(const std::filesystem::path& path, const std::vector<char>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

class FailoverJournalTest : public ::testing::Test {
protected:
    JournalConfig config() const {
        JournalConfig cfg;
        cfg.directory = dir_.path() / "state" / "journal";
        return cfg;
    }

    std::filesystem::path file() const { return config().directory / "failover.journal"; }

    TempDir dir_;
};

}  // namespace

TEST_F(FailoverJournalTest, OpenCreatesEmptyJournal) {
    FailoverJournal journal(config());
    ASSERT_TRUE(journal.open());
    EXPECT_TRUE(journal.isOpen());
    EXPECT_TRUE(std::filesystem::is_directory(config().directory));
    EXPECT_EQ(journal.frameCount(), 0u);
    EXPECT_EQ(journal.maxEventId(), 0u);
    EXPECT_TRUE(journal.replay().value().empty());

    // Opening twice is harmless.
    EXPECT_TRUE(journal.open());
}

TEST_F(FailoverJournalTest, AppendRequiresOpen) {
    FailoverJournal journal(config());
    auto r = journal.append(makeEvent(1));
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::JournalNotOpen);
}

TEST_F(FailoverJournalTest, ReplayReturnsLatestSnapshotAfterReopen) {
    {
        FailoverJournal journal(config());
        ASSERT_TRUE(journal.open());

        auto event = makeEvent(4);
        EXPECT_EQ(journal.append(event).value(), 1u);
        markStep(event, StepKind::QuiesceWrites, StepStatus::Skipped, 0,
                 "old primary us-east unreachable");
        markStep(event, StepKind::PromoteDatabase, StepStatus::Failed, 2, "injected failure");
        EXPECT_EQ(journal.append(event).value(), 2u);
        EXPECT_EQ(journal.frameCount(), 2u);
    }

    FailoverJournal reopened(config());
    ASSERT_TRUE(reopened.open());
    EXPECT_EQ(reopened.frameCount(), 2u);
    EXPECT_EQ(reopened.maxEventId(), 4u);

    auto events = reopened.replay().value();
    ASSERT_EQ(events.size(), 1u);
    const auto& e = events[0];
    EXPECT_EQ(e.id(), FailoverEventId(4));
    EXPECT_EQ(e.service(), ServiceId("checkout"));
    EXPECT_EQ(e.fromRegion(), RegionId("us-east"));
    EXPECT_EQ(e.toRegion(), RegionId("us-west"));
    EXPECT_EQ(e.reason(), "primary us-east unreachable");
    EXPECT_EQ(e.phase(), FailoverPhase::InProgress);
    EXPECT_EQ(e.step(StepKind::QuiesceWrites).status, StepStatus::Skipped);
    EXPECT_EQ(e.step(StepKind::PromoteDatabase).status, StepStatus::Failed);
    EXPECT_EQ(e.step(StepKind::PromoteDatabase).attempts, 2u);
    EXPECT_EQ(e.step(StepKind::PromoteDatabase).message, "injected failure");
    EXPECT_TRUE(e.step(StepKind::PromoteDatabase).finishedAt.has_value());
    EXPECT_FALSE(e.step(StepKind::UpdateRouting).startedAt.has_value());

    // Sequence numbers continue after the replayed frames.
    EXPECT_EQ(reopened.append(e).value(), 3u);
}

TEST_F(FailoverJournalTest, LiveEventsExcludeTerminalPhases) {
    FailoverJournal journal(config());
    ASSERT_TRUE(journal.open());

    auto done = makeEvent(1);
    ASSERT_TRUE(done.setPhase(FailoverPhase::Completed, WallClock::now()));
    auto verifying = makeEvent(2, "eu-central");
    ASSERT_TRUE(verifying.setPhase(FailoverPhase::Verifying, WallClock::now()));
    auto aborted = makeEvent(3);
    ASSERT_TRUE(aborted.setPhase(FailoverPhase::Aborted, WallClock::now()));

    ASSERT_TRUE(journal.append(verifying));
    ASSERT_TRUE(journal.append(aborted));
    ASSERT_TRUE(journal.append(done));

    auto all = journal.replay().value();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id(), FailoverEventId(1));
    EXPECT_EQ(all[2].id(), FailoverEventId(3));
    EXPECT_TRUE(all[0].finishedAt().has_value());

    auto live = journal.liveEvents().value();
    ASSERT_EQ(live.size(), 1u);
    EXPECT_EQ(live[0].id(), FailoverEventId(2));
    EXPECT_EQ(live[0].phase(), FailoverPhase::Verifying);
}

TEST_F(FailoverJournalTest, TruncatedTailIsIgnored) {
    {
        FailoverJournal journal(config());
        ASSERT_TRUE(journal.open());
        ASSERT_TRUE(journal.append(makeEvent(1)));
        ASSERT_TRUE(journal.append(makeEvent(2)));
    }
    auto bytes = readAll(file());
    bytes.resize(bytes.size() - 7);
    writeAll(file(), bytes);

    FailoverJournal reopened(config());
    ASSERT_TRUE(reopened.open());
    EXPECT_EQ(reopened.frameCount(), 1u);
    EXPECT_EQ(reopened.maxEventId(), 1u);
}

TEST_F(FailoverJournalTest, CorruptedFrameStopsReplay) {
    {
        FailoverJournal journal(config());
        ASSERT_TRUE(journal.open());
        auto event = makeEvent(1);
        ASSERT_TRUE(journal.append(event));
        markStep(event, StepKind::QuiesceWrites, StepStatus::Succeeded, 1, "quiesced");
        ASSERT_TRUE(journal.append(event));
    }
    auto bytes = readAll(file());
    // Inside the body of the last frame, before its checksum.
    bytes[bytes.size() - 10] ^= 0x5A;
    writeAll(file(), bytes);

    FailoverJournal reopened(config());
    ASSERT_TRUE(reopened.open());
    EXPECT_EQ(reopened.frameCount(), 1u);
    auto events = reopened.replay().value();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].step(StepKind::QuiesceWrites).status, StepStatus::Pending);
}

TEST_F(FailoverJournalTest, AppendAfterDamagedTailSurvivesReopen) {
    std::size_t goodSize = 0;
    {
        FailoverJournal journal(config());
        ASSERT_TRUE(journal.open());
        ASSERT_TRUE(journal.append(makeEvent(1)));
    }
    goodSize = readAll(file()).size();
    {
        std::ofstream tail(file(), std::ios::binary | std::ios::app);
        const std::string partial("\x40\x00\x00\x00garbage", 11);
        tail.write(partial.data(), static_cast<std::streamsize>(partial.size()));
    }

    {
        FailoverJournal journal(config());
        ASSERT_TRUE(journal.open());
        EXPECT_EQ(readAll(file()).size(), goodSize);
        ASSERT_TRUE(journal.append(makeEvent(2)));
    }

    FailoverJournal reopened(config());
    ASSERT_TRUE(reopened.open());
    EXPECT_EQ(reopened.frameCount(), 2u);
    EXPECT_EQ(reopened.maxEventId(), 2u);
    EXPECT_EQ(reopened.replay().value().size(), 2u);
}

TEST_F(FailoverJournalTest, OversizedFrameLengthIsTreatedAsDamage) {
    {
        FailoverJournal journal(config());
        ASSERT_TRUE(journal.open());
        ASSERT_TRUE(journal.append(makeEvent(1)));
    }
    auto bytes = readAll(file());
    const auto goodSize = bytes.size();
    // A length field claiming almost 4 GiB followed by a few stray bytes.
    for (char c : std::string("\xF0\xFF\xFF\xFFjunk", 8)) {
        bytes.push_back(c);
    }
    writeAll(file(), bytes);

    FailoverJournal reopened(config());
    ASSERT_TRUE(reopened.open());
    EXPECT_EQ(reopened.frameCount(), 1u);
    EXPECT_EQ(readAll(file()).size(), goodSize);
}

TEST_F(FailoverJournalTest, CompactKeepsLatestSnapshots) {
    FailoverJournal journal(config());
    ASSERT_TRUE(journal.open());

    auto first = makeEvent(1);
    ASSERT_TRUE(journal.append(first));
    markStep(first, StepKind::QuiesceWrites, StepStatus::Succeeded, 1, "quiesced");
    ASSERT_TRUE(journal.append(first));
    ASSERT_TRUE(first.setPhase(FailoverPhase::RolledBack, WallClock::now()));
    ASSERT_TRUE(journal.append(first));
    ASSERT_TRUE(journal.append(makeEvent(2)));
    auto sizeBefore = std::filesystem::file_size(file());
    ASSERT_EQ(journal.frameCount(), 4u);

    ASSERT_TRUE(journal.compact());
    EXPECT_EQ(journal.frameCount(), 2u);
    EXPECT_LT(std::filesystem::file_size(file()), sizeBefore);
    EXPECT_FALSE(std::filesystem::exists(file().string() + ".tmp"));

    // Appends land after the compacted frames.
    EXPECT_EQ(journal.append(makeEvent(3)).value(), 3u);
    journal.close();

    FailoverJournal reopened(config());
    ASSERT_TRUE(reopened.open());
    EXPECT_EQ(reopened.frameCount(), 3u);
    auto events = reopened.replay().value();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].phase(), FailoverPhase::RolledBack);
    EXPECT_EQ(events[0].step(StepKind::QuiesceWrites).status, StepStatus::Succeeded);
    EXPECT_EQ(reopened.liveEvents().value().size(), 2u);
}

TEST_F(FailoverJournalTest, CompactRequiresOpen) {
    FailoverJournal journal(config());
    EXPECT_EQ(journal.compact().error().code(), ErrorCode::JournalNotOpen);
}
