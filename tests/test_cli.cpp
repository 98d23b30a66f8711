#include <gtest/gtest.h>

#include "core/cli.hpp"
#include "test_helpers.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

// ── Subcommand dispatch tests ───────────────────────────────

TEST(CLIDispatch, NoArgs_RunsSupervisor) {
    char* argv[] = { (char*)"nasmon" };
    EXPECT_EQ(CLI::run(1, argv), -1);
}

TEST(CLIDispatch, Start_RunsSupervisor) {
    char* argv[] = { (char*)"nasmon", (char*)"start" };
    EXPECT_EQ(CLI::run(2, argv), -1);
}

TEST(CLIDispatch, Help_ReturnsZero) {
    char* argv[] = { (char*)"nasmon", (char*)"help" };
    EXPECT_EQ(CLI::run(2, argv), 0);
}

TEST(CLIDispatch, HelpFlag_ReturnsZero) {
    char* argv[] = { (char*)"nasmon", (char*)"--help" };
    EXPECT_EQ(CLI::run(2, argv), 0);
}

TEST(CLIDispatch, HelpShort_ReturnsZero) {
    char* argv[] = { (char*)"nasmon", (char*)"-h" };
    EXPECT_EQ(CLI::run(2, argv), 0);
}

TEST(CLIDispatch, Version_ReturnsZero) {
    char* argv[] = { (char*)"nasmon", (char*)"version" };
    EXPECT_EQ(CLI::run(2, argv), 0);
}

TEST(CLIDispatch, VersionFlag_ReturnsZero) {
    char* argv[] = { (char*)"nasmon", (char*)"--version" };
    EXPECT_EQ(CLI::run(2, argv), 0);
}

TEST(CLIDispatch, UnknownCommand_ReturnsError) {
    char* argv[] = { (char*)"nasmon", (char*)"foobar" };
    EXPECT_EQ(CLI::run(2, argv), 1);
}

// ── status / stop against a project directory ───────────────

class CLIProjectTest : public ::testing::Test {
protected:
    std::string dir_;
    std::string original_home_;
    bool had_home_ = false;

    void SetUp() override {
        dir_ = "/tmp/nasmon_cli_" + std::to_string(::getpid());
        fs::create_directories(dir_);
        const char* home = std::getenv("NASMON_HOME");
        if (home) {
            had_home_ = true;
            original_home_ = home;
        }
        setenv("NASMON_HOME", dir_.c_str(), 1);
    }

    void TearDown() override {
        if (had_home_) {
            setenv("NASMON_HOME", original_home_.c_str(), 1);
        } else {
            unsetenv("NASMON_HOME");
        }
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void write_config() {
        auto ports = test_helpers::find_free_port_pair();
        uint16_t fe = ports.first;
        uint16_t be = ports.second;
        std::ofstream(dir_ + "/config.json")
            << "{\"frontend_port\": " << fe << ", \"backend_port\": " << be << "}";
    }
};

TEST_F(CLIProjectTest, StatusWithoutConfig) {
    char* argv[] = { (char*)"nasmon", (char*)"status" };
    EXPECT_EQ(CLI::run(2, argv), 2);
}

TEST_F(CLIProjectTest, StopWithoutConfig) {
    char* argv[] = { (char*)"nasmon", (char*)"stop" };
    EXPECT_EQ(CLI::run(2, argv), 2);
}

TEST_F(CLIProjectTest, StatusWhenNothingRuns) {
    write_config();
    char* argv[] = { (char*)"nasmon", (char*)"status" };
    EXPECT_EQ(CLI::run(2, argv), 0);
}

TEST_F(CLIProjectTest, StopWhenNotRunning) {
    write_config();
    char* argv[] = { (char*)"nasmon", (char*)"stop" };
    EXPECT_EQ(CLI::run(2, argv), 1);
}

TEST_F(CLIProjectTest, StopRefusesForeignPid) {
    write_config();
    // The parent process is alive but is not a nasmon supervisor
    fs::create_directories(dir_ + "/run");
    std::ofstream(dir_ + "/run/supervisor.json")
        << "{\"supervisor_pid\": " << ::getppid() << "}";

    char* argv[] = { (char*)"nasmon", (char*)"stop" };
    EXPECT_EQ(CLI::run(2, argv), 1);
}
