#include <unistd.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace std::filesystem;
using namespace grader;

TEST(ConfigTest, Defaults) {
    sandbox_config config;
    EXPECT_DOUBLE_EQ(10, config.timeout_seconds);
    EXPECT_EQ(128, config.memory_limit_mb);
    EXPECT_EQ(10000u, config.max_output_length);
    EXPECT_EQ(500u, config.max_error_length);
    EXPECT_EQ(200u, config.max_host_error_length);
    EXPECT_EQ("python3", config.python);
    EXPECT_EQ("os", config.banned_modules.front());
    EXPECT_EQ(5u, config.dangerous_calls.size());
}

TEST(ConfigTest, FromJsonKeepsDefaultsForAbsentKeys) {
    nlohmann::json j = {{"timeoutSeconds", 2.5}, {"bannedModules", {"math"}}};
    sandbox_config config = j.get<sandbox_config>();
    EXPECT_DOUBLE_EQ(2.5, config.timeout_seconds);
    EXPECT_EQ(vector<string>{"math"}, config.banned_modules);
    EXPECT_EQ(128, config.memory_limit_mb);
    EXPECT_EQ("python3", config.python);
}

TEST(ConfigTest, RejectsNonPositiveTimeout) {
    nlohmann::json j = {{"timeoutSeconds", 0}};
    EXPECT_THROW(j.get<sandbox_config>(), invalid_argument);
}

TEST(ConfigTest, RejectsNonPositiveMemoryLimit) {
    nlohmann::json j = {{"memoryLimitMB", -1}};
    EXPECT_THROW(j.get<sandbox_config>(), invalid_argument);
}

TEST(ConfigTest, RejectsWrongType) {
    nlohmann::json j = {{"memoryLimitMB", "lots"}};
    EXPECT_THROW(j.get<sandbox_config>(), invalid_argument);
}

TEST(ConfigTest, RoundTripsThroughJson) {
    sandbox_config config;
    config.timeout_seconds = 3;
    config.python = "/usr/bin/python3";
    nlohmann::json j = config;
    EXPECT_EQ(3, j.at("timeoutSeconds").get<double>());
    EXPECT_EQ("/usr/bin/python3", j.at("python").get<string>());
    sandbox_config loaded = j.get<sandbox_config>();
    EXPECT_EQ(config.python, loaded.python);
    EXPECT_EQ(config.inherited_env, loaded.inherited_env);
}

TEST(ConfigTest, LoadConfig) {
    path file = temp_directory_path() / ("grader-config-test-" + to_string(getpid()) + ".json");
    {
        ofstream fout(file);
        fout << R"({"timeoutSeconds": 4, "python": "python3.11"})";
    }
    sandbox_config config = load_config(file);
    remove(file);
    EXPECT_DOUBLE_EQ(4, config.timeout_seconds);
    EXPECT_EQ("python3.11", config.python);
}

TEST(ConfigTest, LoadConfigErrors) {
    path file = temp_directory_path() / ("grader-config-test-" + to_string(getpid()) + ".json");
    EXPECT_THROW(load_config(file), config_error);
    {
        ofstream fout(file);
        fout << "{not json";
    }
    EXPECT_THROW(load_config(file), config_error);
    remove(file);
}

class ConfigEnvironmentTest : public ::testing::Test {
protected:
    // 其他测试会读取 GRADER_PYTHON，测试结束后恢复原来的环境变量
    void SetUp() override {
        for (const char *name : {"GRADER_TIMEOUT", "GRADER_MEMORY_LIMIT", "GRADER_PYTHON", "GRADER_TMPDIR"}) {
            const char *old = getenv(name);
            saved[name] = old ? optional<string>(old) : nullopt;
            unsetenv(name);
        }
    }

    void TearDown() override {
        for (auto &[name, old] : saved) {
            if (old) setenv(name.c_str(), old->c_str(), 1);
            else unsetenv(name.c_str());
        }
    }

    map<string, optional<string>> saved;
};

TEST_F(ConfigEnvironmentTest, OverridesFromEnvironment) {
    setenv("GRADER_TIMEOUT", "2.5", 1);
    setenv("GRADER_MEMORY_LIMIT", "256", 1);
    setenv("GRADER_PYTHON", "python3.12", 1);
    setenv("GRADER_TMPDIR", "/tmp", 1);
    sandbox_config config;
    apply_environment(config);
    EXPECT_DOUBLE_EQ(2.5, config.timeout_seconds);
    EXPECT_EQ(256, config.memory_limit_mb);
    EXPECT_EQ("python3.12", config.python);
    EXPECT_EQ(path("/tmp"), config.temp_dir);
}

TEST_F(ConfigEnvironmentTest, UnsetVariablesKeepConfig) {
    unsetenv("GRADER_TIMEOUT");
    sandbox_config config;
    config.timeout_seconds = 3;
    apply_environment(config);
    EXPECT_DOUBLE_EQ(3, config.timeout_seconds);
    EXPECT_EQ(128, config.memory_limit_mb);
}

TEST_F(ConfigEnvironmentTest, RejectsMalformedValues) {
    sandbox_config config;
    setenv("GRADER_TIMEOUT", "ten", 1);
    EXPECT_THROW(apply_environment(config), config_error);
    setenv("GRADER_TIMEOUT", "0", 1);
    EXPECT_THROW(apply_environment(config), config_error);
    unsetenv("GRADER_TIMEOUT");
    setenv("GRADER_MEMORY_LIMIT", "-64", 1);
    EXPECT_THROW(apply_environment(config), config_error);
    setenv("GRADER_MEMORY_LIMIT", "12.5", 1);
    EXPECT_THROW(apply_environment(config), config_error);
    EXPECT_DOUBLE_EQ(10, config.timeout_seconds);
}
