#include <gtest/gtest.h>
#include "daemon/process_registry.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

class ProcessRegistryTest : public ::testing::Test {
protected:
    std::string temp_dir_;
    std::string state_path_;

    void SetUp() override {
        temp_dir_ = "/tmp/nasmon_reg_" + std::to_string(::getpid());
        fs::create_directories(temp_dir_);
        state_path_ = temp_dir_ + "/run/supervisor.json";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
    }
};

TEST_F(ProcessRegistryTest, MissingFileIsEmpty) {
    ProcessRegistry registry(state_path_);
    EXPECT_TRUE(registry.load());
    EXPECT_TRUE(registry.entries().empty());
    EXPECT_EQ(registry.supervisor_pid(), -1);
    EXPECT_EQ(registry.recorded_pid("backend"), -1);
}

TEST_F(ProcessRegistryTest, SaveAndReload) {
    {
        ProcessRegistry registry(state_path_);
        registry.set_supervisor_pid(4242);
        registry.record("backend", 1001, 8001, "logs/api_server.log");
        registry.record("frontend", 1002, 8000, "logs/http_server.log");
        ASSERT_TRUE(registry.save());
    }
    EXPECT_TRUE(fs::exists(state_path_));
    EXPECT_FALSE(fs::exists(state_path_ + ".tmp"));

    ProcessRegistry registry(state_path_);
    ASSERT_TRUE(registry.load());
    EXPECT_EQ(registry.supervisor_pid(), 4242);
    EXPECT_EQ(registry.recorded_pid("backend"), 1001);
    EXPECT_EQ(registry.recorded_pid("frontend"), 1002);

    const auto& backend = registry.entries().at("backend");
    EXPECT_EQ(backend.port, 8001);
    EXPECT_EQ(backend.log_path, "logs/api_server.log");
}

TEST_F(ProcessRegistryTest, FileLayout) {
    ProcessRegistry registry(state_path_);
    registry.set_supervisor_pid(7);
    registry.record("frontend", 9, 8000, "http.log");
    ASSERT_TRUE(registry.save());

    std::ifstream in(state_path_);
    auto j = nlohmann::json::parse(in);
    EXPECT_EQ(j["supervisor_pid"], 7);
    EXPECT_EQ(j["frontend"]["pid"], 9);
    EXPECT_EQ(j["frontend"]["port"], 8000);
    EXPECT_EQ(j["frontend"]["log"], "http.log");
}

TEST_F(ProcessRegistryTest, ClearRole) {
    ProcessRegistry registry(state_path_);
    registry.record("backend", 1001, 8001, "");
    registry.record("frontend", 1002, 8000, "");
    registry.clear("backend");
    EXPECT_EQ(registry.recorded_pid("backend"), -1);
    EXPECT_EQ(registry.recorded_pid("frontend"), 1002);

    registry.set_supervisor_pid(5);
    registry.clear_all();
    EXPECT_TRUE(registry.entries().empty());
    EXPECT_EQ(registry.supervisor_pid(), -1);
}

TEST_F(ProcessRegistryTest, CorruptFileRejected) {
    fs::create_directories(fs::path(state_path_).parent_path());
    {
        std::ofstream out(state_path_);
        out << "{ not json";
    }

    ProcessRegistry registry(state_path_);
    EXPECT_FALSE(registry.load());
    EXPECT_TRUE(registry.entries().empty());
}

TEST_F(ProcessRegistryTest, EntriesWithoutPidSkipped) {
    fs::create_directories(fs::path(state_path_).parent_path());
    {
        std::ofstream out(state_path_);
        out << R"({"supervisor_pid": 3, "backend": {"port": 8001}, "frontend": {"pid": 12, "port": 8000}})";
    }

    ProcessRegistry registry(state_path_);
    ASSERT_TRUE(registry.load());
    EXPECT_EQ(registry.recorded_pid("backend"), -1);
    EXPECT_EQ(registry.recorded_pid("frontend"), 12);
}
