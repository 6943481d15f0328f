#include <gtest/gtest.h>

#include <csignal>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "afc/control/service_runner.hpp"
#include "support/control_fakes.hpp"

using namespace afc::control;
using afc::foundation::ConfigManager;
using afc::foundation::ErrorCode;
using afc::test::TempDir;

namespace {

/// Clears AFC_CONFIG_PATH for the test and restores it afterwards.
class ConfigPathTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (const char* old = std::getenv("AFC_CONFIG_PATH")) {
            saved_ = old;
        }
        ::unsetenv("AFC_CONFIG_PATH");
    }

    void TearDown() override {
        if (saved_.empty()) {
            ::unsetenv("AFC_CONFIG_PATH");
        } else {
            ::setenv("AFC_CONFIG_PATH", saved_.c_str(), 1);
        }
    }

    std::string saved_;
};

}  // namespace

TEST_F(ConfigPathTest, DefaultsWithoutCliOrEnvironment) {
    EXPECT_EQ(resolveConfigPath({}), kDefaultConfigPath);
}

TEST_F(ConfigPathTest, CliPathWinsOverDefault) {
    EXPECT_EQ(resolveConfigPath("/srv/fleet.yaml"), std::filesystem::path("/srv/fleet.yaml"));
}

TEST_F(ConfigPathTest, EnvironmentWinsOverCli) {
    ::setenv("AFC_CONFIG_PATH", "/run/afc/fleet.yaml", 1);
    EXPECT_EQ(resolveConfigPath("/srv/fleet.yaml"),
              std::filesystem::path("/run/afc/fleet.yaml"));

    ::setenv("AFC_CONFIG_PATH", "", 1);
    EXPECT_EQ(resolveConfigPath("/srv/fleet.yaml"), std::filesystem::path("/srv/fleet.yaml"));
}

TEST_F(ConfigPathTest, LoadConfigReadsResolvedFile) {
    TempDir dir;
    auto path = dir.path() / "fleet.yaml";
    {
        std::ofstream out(path);
        out << "controller:\n  health_port: 9300\n";
    }

    ConfigManager config;
    ASSERT_TRUE(loadConfig(config, path));
    EXPECT_EQ(config.get<int>("controller.health_port").value(), 9300);

    auto missing = loadConfig(config, dir.path() / "absent.yaml");
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(ParseConfigArgTest, FindsFlagValue) {
    std::string prog = "afc_controller";
    std::string flag = "--config";
    std::string value = "/srv/fleet.yaml";
    std::string other = "--verbose";

    std::vector<char*> argv{prog.data(), other.data(), flag.data(), value.data()};
    EXPECT_EQ(parseConfigArg(static_cast<int>(argv.size()), argv.data()),
              std::filesystem::path("/srv/fleet.yaml"));

    std::vector<char*> dangling{prog.data(), flag.data()};
    EXPECT_TRUE(parseConfigArg(static_cast<int>(dangling.size()), dangling.data()).empty());

    std::vector<char*> none{prog.data()};
    EXPECT_TRUE(parseConfigArg(1, none.data()).empty());
}

TEST(GracefulShutdownTest, RunsHooksInOrderPastFailures) {
    GracefulShutdown shutdown;
    std::vector<std::string> order;
    shutdown.addHook("readiness", [&] { order.push_back("readiness"); });
    shutdown.addHook("controller", [&] {
        order.push_back("controller");
        throw std::runtime_error("stop failed");
    });
    shutdown.addHook("health", [&] { order.push_back("health"); });
    EXPECT_EQ(shutdown.hookCount(), 3u);

    EXPECT_EQ(shutdown.execute(), 2u);
    EXPECT_EQ(order, (std::vector<std::string>{"readiness", "controller", "health"}));
}

TEST(SignalHandlerTest, SigtermRequestsShutdown) {
    SignalHandler signals;
    EXPECT_FALSE(signals.shutdownRequested());
    std::raise(SIGTERM);
    EXPECT_TRUE(signals.shutdownRequested());
    // Returns immediately once the flag is set.
    signals.waitForShutdown();
}
