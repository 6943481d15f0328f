#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "afc/foundation/control_logger.hpp"
#include "afc/foundation/error_code.hpp"

// kcenon headers for test infrastructure (capturing logger registration)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

using namespace afc::foundation;
using kcenon::common::interfaces::GlobalLoggerRegistry;
using kcenon::common::interfaces::ILogger;
using kcenon::common::interfaces::log_level;

namespace {

struct CapturedLine {
    log_level level;
    std::string message;
};

/// ILogger that keeps every line it receives.
class CapturingLogger : public ILogger {
public:
    kcenon::common::VoidResult log(log_level level, const std::string& message) override {
        std::lock_guard lock(mutex_);
        lines_.push_back({level, message});
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(const kcenon::common::interfaces::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(log_level /*level*/) const override { return true; }

    kcenon::common::VoidResult set_level(log_level /*level*/) override {
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    log_level get_level() const override { return log_level::trace; }

    kcenon::common::VoidResult flush() override {
        flushes_.fetch_add(1);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    std::vector<CapturedLine> lines() const {
        std::lock_guard lock(mutex_);
        return lines_;
    }

    bool contains(const std::string& needle) const {
        std::lock_guard lock(mutex_);
        for (const auto& l : lines_) {
            if (l.message.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    int flushes() const { return flushes_.load(); }

private:
    mutable std::mutex mutex_;
    std::vector<CapturedLine> lines_;
    std::atomic<int> flushes_{0};
};

} // namespace

class ControlLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        sink_ = std::make_shared<CapturingLogger>();
        registry.set_default_logger(sink_);
    }

    void TearDown() override { GlobalLoggerRegistry::instance().clear(); }

    std::shared_ptr<CapturingLogger> sink_;
};

// ---------------------------------------------------------------------------
// Names and parsing
// ---------------------------------------------------------------------------

TEST(LoggerErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerError), "Logger");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
}

TEST(LogCategoryTest, NamesFollowPipelineStages) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::Probe), "Probe");
    EXPECT_EQ(logCategoryName(LogCategory::Slo), "Slo");
    EXPECT_EQ(logCategoryName(LogCategory::Detector), "Detector");
    EXPECT_EQ(logCategoryName(LogCategory::Coordinator), "Coordinator");
    EXPECT_EQ(logCategoryName(LogCategory::Executor), "Executor");
    EXPECT_EQ(logCategoryName(LogCategory::Config), "Config");
    EXPECT_EQ(logCategoryName(LogCategory::Notify), "Notify");
    EXPECT_EQ(logCategoryName(static_cast<LogCategory>(42)), "Unknown");
    EXPECT_EQ(kLogCategoryCount, 8u);
}

TEST(LogLevelTest, ParseAcceptsConfigSpellings) {
    EXPECT_EQ(parseLogLevel("trace"), LogLevel::Trace);
    EXPECT_EQ(parseLogLevel("info"), LogLevel::Info);
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::Off);
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
}

// ---------------------------------------------------------------------------
// Filtering
// ---------------------------------------------------------------------------

TEST(ControlLoggerLevelTest, DecisionCategoriesDefaultToDebug) {
    ControlLogger logger;
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Detector), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Coordinator), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Executor), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Notify), LogLevel::Info);
}

TEST(ControlLoggerLevelTest, SetCategoryLevelChangesFiltering) {
    ControlLogger logger;
    EXPECT_FALSE(logger.isEnabled(LogLevel::Debug, LogCategory::Probe));
    logger.setCategoryLevel(LogCategory::Probe, LogLevel::Trace);
    EXPECT_TRUE(logger.isEnabled(LogLevel::Trace, LogCategory::Probe));

    logger.setCategoryLevel(LogCategory::Probe, LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, LogCategory::Probe));
}

TEST(ControlLoggerLevelTest, InvalidCategoryIsOff) {
    ControlLogger logger;
    auto invalid = static_cast<LogCategory>(99);
    EXPECT_EQ(logger.getCategoryLevel(invalid), LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, invalid));
}

// ---------------------------------------------------------------------------
// Output
// ---------------------------------------------------------------------------

TEST_F(ControlLoggerTest, LogPrefixesCategory) {
    ControlLogger logger;
    logger.log(LogLevel::Warning, LogCategory::Executor, "promote_database failed");

    auto lines = sink_->lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].level, log_level::warning);
    EXPECT_EQ(lines[0].message, "[Executor] promote_database failed");
}

TEST_F(ControlLoggerTest, LogDropsLinesBelowLevel) {
    ControlLogger logger;
    logger.log(LogLevel::Debug, LogCategory::Core, "filtered");
    EXPECT_TRUE(sink_->lines().empty());
}

TEST_F(ControlLoggerTest, ContextAppendsFleetFields) {
    ControlLogger logger;

    LogContext ctx;
    ctx.serviceId = ServiceId("checkout");
    ctx.regionId = RegionId("us-east");
    ctx.eventId = FailoverEventId(12);
    ctx.extra["burn_rate"] = "14.2";

    logger.logWithContext(LogLevel::Warning, LogCategory::Detector, "region degraded", ctx);

    auto lines = sink_->lines();
    ASSERT_EQ(lines.size(), 1u);
    const auto& msg = lines[0].message;
    EXPECT_EQ(msg.rfind("[Detector] region degraded {", 0), 0u);
    EXPECT_NE(msg.find("service=checkout"), std::string::npos);
    EXPECT_NE(msg.find("region=us-east"), std::string::npos);
    EXPECT_NE(msg.find("event_id=12"), std::string::npos);
    EXPECT_NE(msg.find("burn_rate=14.2"), std::string::npos);
}

TEST_F(ControlLoggerTest, EmptyContextOmitsBraces) {
    ControlLogger logger;
    logger.logWithContext(LogLevel::Info, LogCategory::Core, "started", LogContext{});

    auto lines = sink_->lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].message, "[Core] started");
}

TEST_F(ControlLoggerTest, NamedCategoryLoggerWinsOverDefault) {
    auto detectorSink = std::make_shared<CapturingLogger>();
    ASSERT_TRUE(GlobalLoggerRegistry::instance()
                    .register_logger("afc.Detector", detectorSink)
                    .is_ok());

    ControlLogger logger;
    logger.log(LogLevel::Info, LogCategory::Detector, "to the detector stream");
    logger.log(LogLevel::Info, LogCategory::Core, "to the default stream");

    EXPECT_TRUE(detectorSink->contains("to the detector stream"));
    EXPECT_FALSE(detectorSink->contains("to the default stream"));
    EXPECT_TRUE(sink_->contains("to the default stream"));
}

TEST_F(ControlLoggerTest, FlushDelegatesToDefaultLogger) {
    ControlLogger logger;
    EXPECT_TRUE(logger.flush().hasValue());
    EXPECT_EQ(sink_->flushes(), 1);
}

TEST_F(ControlLoggerTest, MacroHonoursSingletonLevels) {
    ControlLogger::instance().setCategoryLevel(LogCategory::Slo, LogLevel::Warning);

    AFC_LOG_INFO(LogCategory::Slo, "hidden");
    AFC_LOG_WARN(LogCategory::Slo, "budget burning");

    EXPECT_FALSE(sink_->contains("hidden"));
    EXPECT_TRUE(sink_->contains("[Slo] budget burning"));
    ControlLogger::instance().setCategoryLevel(LogCategory::Slo, LogLevel::Info);
}

TEST_F(ControlLoggerTest, ConcurrentLoggingKeepsEveryLine) {
    ControlLogger logger;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 200;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t] {
            for (int i = 0; i < kPerThread; ++i) {
                logger.log(LogLevel::Info, LogCategory::Probe,
                           "probe " + std::to_string(t) + "/" + std::to_string(i));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(sink_->lines().size(), static_cast<std::size_t>(kThreads * kPerThread));
}
