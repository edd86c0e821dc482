// tests/test_driver_supervisor.cpp
// Launch, single-instance and readiness behaviour against stand-in driver binaries.
#include "supervisor/driver_supervisor.h"
#include "supervisor/process_utils.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <thread>
#include <unistd.h>

namespace kiosk_payment::test {

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using supervisor::DriverSupervisor;
using supervisor::SupervisorOptions;
using supervisor::findProcessesByName;
using supervisor::isProcessAlive;
using supervisor::killAndWait;

namespace {

fs::path findTool(const std::string& name) {
    for (const char* dir : {"/bin", "/usr/bin"}) {
        fs::path candidate = fs::path(dir) / name;
        if (fs::exists(candidate)) {
            return candidate;
        }
    }
    return {};
}

bool containsPid(const std::vector<pid_t>& pids, pid_t pid) {
    return std::find(pids.begin(), pids.end(), pid) != pids.end();
}

// exec replaces the forked image asynchronously; wait until the name shows up
bool waitForProcess(const std::string& name, pid_t pid, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (containsPid(findProcessesByName(name), pid)) {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }
    return false;
}

// A driver started outside any supervisor, as left behind by a crashed host
pid_t spawnStray(const fs::path& driver) {
    const pid_t pid = ::fork();
    if (pid == 0) {
        ::execl(driver.c_str(), driver.filename().c_str(), "30", static_cast<char*>(nullptr));
        ::_exit(127);
    }
    return pid;
}

} // namespace

class DriverSupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        static std::atomic<int> counter{0};
        const std::string suffix = std::to_string(::getpid()) + "_" + std::to_string(counter++);
        root_ = fs::temp_directory_path() / ("kps_" + suffix);
        fs::remove_all(root_);
        fs::create_directories(root_);
        // Short enough to match the kernel's 15-character comm as well
        driverName_ = "kd" + suffix;
        driverName_ = driverName_.substr(0, 15);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    // Copies a system tool under a unique name so that name-based cleanup
    // cannot touch anything but this test's processes.
    fs::path installDriver(const std::string& tool) {
        const fs::path source = findTool(tool);
        if (source.empty()) {
            return {};
        }
        const fs::path target = root_ / driverName_;
        fs::copy_file(source, target, fs::copy_options::overwrite_existing);
        fs::permissions(target, fs::perms::owner_all, fs::perm_options::add);
        return target;
    }

    SupervisorOptions makeOptions(const fs::path& driverPath, std::vector<std::string> args) const {
        SupervisorOptions options;
        options.driverPath = driverPath.string();
        options.endpointPath = (root_ / "driver.sock").string();
        options.driverArgs = std::move(args);
        options.channelOptions.openTimeout = 200ms;
        options.readinessTimeout = 300ms;
        options.initialPollInterval = 20ms;
        options.maxPollInterval = 100ms;
        return options;
    }

    fs::path root_;
    std::string driverName_;
};

TEST_F(DriverSupervisorTest, LaunchAndTeardown) {
    const fs::path driver = installDriver("sleep");
    if (driver.empty()) {
        GTEST_SKIP() << "sleep not available";
    }

    DriverSupervisor supervisor(makeOptions(driver, {"30"}));
    ASSERT_TRUE(supervisor.launch()) << supervisor.getLastError();
    const pid_t pid = supervisor.getDriverPid();
    ASSERT_GT(pid, 0);
    EXPECT_TRUE(supervisor.isDriverRunning());
    EXPECT_EQ(supervisor.getDriverProcessName(), driverName_);
    ASSERT_TRUE(waitForProcess(driverName_, pid, 2000ms));

    EXPECT_TRUE(supervisor.teardown());
    EXPECT_FALSE(supervisor.isDriverRunning());
    EXPECT_FALSE(isProcessAlive(pid));
    EXPECT_TRUE(findProcessesByName(driverName_).empty());
    EXPECT_EQ(supervisor.getChannelFactory(), nullptr);
}

TEST_F(DriverSupervisorTest, EnsureSingleInstanceKillsStrayDriver) {
    const fs::path driver = installDriver("sleep");
    if (driver.empty()) {
        GTEST_SKIP() << "sleep not available";
    }

    const pid_t strayPid = spawnStray(driver);
    ASSERT_GT(strayPid, 0);
    ASSERT_TRUE(waitForProcess(driverName_, strayPid, 2000ms));

    DriverSupervisor supervisor(makeOptions(driver, {"30"}));
    EXPECT_TRUE(supervisor.ensureSingleInstance());

    EXPECT_FALSE(isProcessAlive(strayPid));
    EXPECT_TRUE(findProcessesByName(driverName_).empty());
}

TEST_F(DriverSupervisorTest, RelaunchReapsOwnDriverAndStrays) {
    const fs::path driver = installDriver("sleep");
    if (driver.empty()) {
        GTEST_SKIP() << "sleep not available";
    }

    const pid_t strayPid = spawnStray(driver);
    ASSERT_GT(strayPid, 0);

    DriverSupervisor supervisor(makeOptions(driver, {"30"}));
    ASSERT_TRUE(supervisor.launch());
    const pid_t ownPid = supervisor.getDriverPid();
    ASSERT_TRUE(waitForProcess(driverName_, strayPid, 2000ms));
    ASSERT_TRUE(waitForProcess(driverName_, ownPid, 2000ms));

    EXPECT_TRUE(supervisor.ensureSingleInstance()) << supervisor.getLastError();
    EXPECT_EQ(supervisor.getDriverPid(), -1);
    EXPECT_TRUE(supervisor.getLastError().empty());
    EXPECT_FALSE(isProcessAlive(ownPid));
    EXPECT_FALSE(isProcessAlive(strayPid));
    EXPECT_TRUE(findProcessesByName(driverName_).empty());

    // Nothing left to kill: a second pass touches no pid at all
    EXPECT_TRUE(supervisor.teardown());
    EXPECT_TRUE(supervisor.getLastError().empty());
}

TEST_F(DriverSupervisorTest, MissingDriverFailsLaunch) {
    DriverSupervisor supervisor(makeOptions(root_ / "no_such_driver", {}));

    EXPECT_FALSE(supervisor.launch());
    EXPECT_EQ(supervisor.getDriverPid(), -1);
    EXPECT_NE(supervisor.getLastError().find("not executable"), std::string::npos);
    EXPECT_FALSE(supervisor.start());
}

TEST_F(DriverSupervisorTest, DriverExitingDuringStartupFailsFast) {
    const fs::path driver = installDriver("false");
    if (driver.empty()) {
        GTEST_SKIP() << "false not available";
    }

    SupervisorOptions options = makeOptions(driver, {});
    options.readinessTimeout = 5000ms;
    DriverSupervisor supervisor(options);
    ASSERT_TRUE(supervisor.launch());

    const auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(supervisor.waitUntilReady());
    EXPECT_LT(std::chrono::steady_clock::now() - started, 4000ms);
    EXPECT_NE(supervisor.getLastError().find("exited"), std::string::npos);
    EXPECT_EQ(supervisor.getDriverPid(), -1);
}

TEST_F(DriverSupervisorTest, SilentDriverTimesOut) {
    const fs::path driver = installDriver("sleep");
    if (driver.empty()) {
        GTEST_SKIP() << "sleep not available";
    }

    DriverSupervisor supervisor(makeOptions(driver, {"30"}));
    ASSERT_TRUE(supervisor.launch());

    const auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(supervisor.waitUntilReady());
    EXPECT_GE(std::chrono::steady_clock::now() - started, 300ms);
    EXPECT_NE(supervisor.getLastError().find("not ready"), std::string::npos);
    EXPECT_EQ(supervisor.openChannel(), nullptr);

    EXPECT_TRUE(supervisor.teardown());
}

TEST(ProcessUtilsTest, CallerIsNeverListed) {
    const std::string self = fs::read_symlink("/proc/self/exe").filename().string();
    EXPECT_FALSE(containsPid(findProcessesByName(self), ::getpid()));
    EXPECT_TRUE(findProcessesByName("").empty());
}

TEST(ProcessUtilsTest, KillingAGoneProcessSucceeds) {
    const pid_t child = ::fork();
    ASSERT_GE(child, 0);
    if (child == 0) {
        ::_exit(0);
    }

    std::string error;
    EXPECT_TRUE(killAndWait(child, error)) << error;
    EXPECT_FALSE(isProcessAlive(child));
}

} // namespace kiosk_payment::test
