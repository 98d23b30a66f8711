#include <gtest/gtest.h>
#include "daemon/process_handle.hpp"
#include "test_helpers.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <signal.h>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class ProcessHandleTest : public ::testing::Test {
protected:
    std::string temp_dir_;

    void SetUp() override {
        temp_dir_ = "/tmp/nasmon_ph_" + std::to_string(::getpid());
        fs::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
    }

    std::string read_file(const std::string& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

TEST_F(ProcessHandleTest, SpawnSleep) {
    auto r = ProcessHandle::spawn("/bin/sleep", {"60"}, temp_dir_ + "/sleep.log");
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_GT(r.pid, 0);
    EXPECT_TRUE(ProcessHandle::is_alive(r.pid));

    ProcessHandle::terminate(r.pid);
    EXPECT_FALSE(ProcessHandle::is_alive(r.pid));
}

TEST_F(ProcessHandleTest, SpawnMissingBinaryIsError) {
    auto r = ProcessHandle::spawn("/nonexistent/binary", {}, temp_dir_ + "/missing.log");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.pid, -1);
    EXPECT_NE(r.error.find("/nonexistent/binary"), std::string::npos);
}

TEST_F(ProcessHandleTest, SpawnBadWorkingDirIsError) {
    auto r = ProcessHandle::spawn("/bin/sleep", {"60"}, temp_dir_ + "/wd.log",
                                  temp_dir_ + "/no/such/dir");
    EXPECT_FALSE(r.success);
}

TEST_F(ProcessHandleTest, OutputAppendedToLog) {
    std::string log = temp_dir_ + "/logs/echo.log";  // directory created on demand

    auto first = ProcessHandle::spawn("/bin/sh", {"-c", "echo first; echo oops >&2"}, log);
    ASSERT_TRUE(first.success) << first.error;
    EXPECT_TRUE(test_helpers::wait_until([&] { return !ProcessHandle::is_alive(first.pid); }));

    auto second = ProcessHandle::spawn("/bin/sh", {"-c", "echo second"}, log);
    ASSERT_TRUE(second.success) << second.error;
    EXPECT_TRUE(test_helpers::wait_until([&] { return !ProcessHandle::is_alive(second.pid); }));

    std::string content = read_file(log);
    EXPECT_NE(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("oops"), std::string::npos);
    EXPECT_NE(content.find("second"), std::string::npos);
    EXPECT_LT(content.find("first"), content.find("second"));
}

TEST_F(ProcessHandleTest, WorkingDirectoryApplied) {
    std::string log = temp_dir_ + "/pwd.log";
    auto r = ProcessHandle::spawn("/bin/sh", {"-c", "pwd"}, log, temp_dir_);
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_TRUE(test_helpers::wait_until([&] { return !ProcessHandle::is_alive(r.pid); }));
    EXPECT_NE(read_file(log).find(fs::canonical(temp_dir_).string()), std::string::npos);
}

TEST_F(ProcessHandleTest, IsAliveReportsExitCode) {
    auto r = ProcessHandle::spawn("/bin/sh", {"-c", "exit 3"}, temp_dir_ + "/exit.log");
    ASSERT_TRUE(r.success) << r.error;

    int code = -100;
    EXPECT_TRUE(test_helpers::wait_until([&] { return !ProcessHandle::is_alive(r.pid, &code); }));
    EXPECT_EQ(code, 3);
}

TEST_F(ProcessHandleTest, IsAliveInvalidPid) {
    EXPECT_FALSE(ProcessHandle::is_alive(-1));
    EXPECT_FALSE(ProcessHandle::is_alive(0));
}

TEST_F(ProcessHandleTest, TerminateGraceful) {
    auto r = ProcessHandle::spawn("/bin/sleep", {"60"}, temp_dir_ + "/term.log");
    ASSERT_TRUE(r.success) << r.error;

    auto start = std::chrono::steady_clock::now();
    bool forced = ProcessHandle::terminate(r.pid, 1000ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(forced);
    EXPECT_FALSE(ProcessHandle::is_alive(r.pid));
    EXPECT_LT(elapsed, 1000ms);
}

TEST_F(ProcessHandleTest, TerminateForcesKillAfterGrace) {
    uint16_t port = test_helpers::find_free_port();
    auto r = ProcessHandle::spawn(FAKE_SERVICE_PATH,
                                  {"--port", std::to_string(port), "--ignore-term"},
                                  temp_dir_ + "/stubborn.log");
    ASSERT_TRUE(r.success) << r.error;
    // Let it install SIG_IGN before we signal it
    ASSERT_TRUE(test_helpers::wait_until([&] {
        return read_file(temp_dir_ + "/stubborn.log").find("listening") != std::string::npos;
    }));

    bool forced = ProcessHandle::terminate(r.pid, 300ms);
    EXPECT_TRUE(forced);
    EXPECT_FALSE(ProcessHandle::is_alive(r.pid));
}

TEST_F(ProcessHandleTest, TerminateIsIdempotent) {
    auto r = ProcessHandle::spawn("/bin/sleep", {"60"}, temp_dir_ + "/twice.log");
    ASSERT_TRUE(r.success) << r.error;

    ProcessHandle::terminate(r.pid);
    EXPECT_FALSE(ProcessHandle::terminate(r.pid));  // already gone: no-op
    EXPECT_FALSE(ProcessHandle::terminate(-1));
}

TEST_F(ProcessHandleTest, ReadCmdline) {
    auto r = ProcessHandle::spawn("/bin/sleep", {"61"}, temp_dir_ + "/cmd.log");
    ASSERT_TRUE(r.success) << r.error;

    auto argv = ProcessHandle::read_cmdline(r.pid);
    ASSERT_EQ(argv.size(), 2u);
    EXPECT_NE(argv[0].find("sleep"), std::string::npos);
    EXPECT_EQ(argv[1], "61");

    ProcessHandle::terminate(r.pid);
}

TEST_F(ProcessHandleTest, ChildLeadsOwnProcessGroup) {
    auto r = ProcessHandle::spawn("/bin/sleep", {"60"}, temp_dir_ + "/pgid.log");
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_EQ(getpgid(r.pid), r.pid);
    ProcessHandle::terminate(r.pid);
}

// Leader is fake_service; a background sibling ignores SIGTERM. Returns the
// sibling's PID once it has exec'd, or -1.
static pid_t spawn_with_stubborn_sibling(const std::string& dir, uint16_t port, SpawnResult& leader) {
    std::string pid_file = dir + "/sibling.pid";
    std::string script = "(trap '' TERM; exec sleep 300) & echo $! > '" + pid_file + "'; exec '" +
                         std::string(FAKE_SERVICE_PATH) + "' --port " + std::to_string(port);
    leader = ProcessHandle::spawn("/bin/sh", {"-c", script}, dir + "/group.log");
    if (!leader.success) return -1;

    pid_t sibling = -1;
    test_helpers::wait_until([&] {
        std::ifstream in(pid_file);
        return static_cast<bool>(in >> sibling);
    });
    if (sibling <= 0) return -1;
    bool ready = test_helpers::wait_until([&] {
        auto argv = ProcessHandle::read_cmdline(sibling);
        auto leader_argv = ProcessHandle::read_cmdline(leader.pid);
        return !argv.empty() && argv[0].find("sleep") != std::string::npos &&
               !leader_argv.empty() && leader_argv[0].find("fake_service") != std::string::npos;
    });
    return ready ? sibling : -1;
}

TEST_F(ProcessHandleTest, GroupTerminateTakesDownStubbornGrandchild) {
    SpawnResult leader;
    pid_t sibling = spawn_with_stubborn_sibling(temp_dir_, test_helpers::find_free_port(), leader);
    ASSERT_TRUE(leader.success) << leader.error;
    ASSERT_GT(sibling, 0);
    EXPECT_EQ(getpgid(sibling), leader.pid);

    // The leader dies on SIGTERM right away; the sibling only to SIGKILL
    bool forced = ProcessHandle::terminate(leader.pid, 300ms, /*group=*/true);
    EXPECT_TRUE(forced);
    EXPECT_FALSE(ProcessHandle::is_alive(leader.pid));
    EXPECT_TRUE(test_helpers::wait_until([&] { return !ProcessHandle::is_alive(sibling); }));
}

TEST_F(ProcessHandleTest, PlainTerminateLeavesGroupMembers) {
    SpawnResult leader;
    pid_t sibling = spawn_with_stubborn_sibling(temp_dir_, test_helpers::find_free_port(), leader);
    ASSERT_TRUE(leader.success) << leader.error;
    ASSERT_GT(sibling, 0);

    ProcessHandle::terminate(leader.pid, 300ms);
    EXPECT_FALSE(ProcessHandle::is_alive(leader.pid));
    EXPECT_TRUE(ProcessHandle::is_alive(sibling));

    kill(sibling, SIGKILL);
    EXPECT_TRUE(test_helpers::wait_until([&] { return !ProcessHandle::is_alive(sibling); }));
}
