/**
 * @file test_runtime_options.cpp
 * @brief Tests for the runtime option provider: JSON config defaults and CLI overrides.
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

#include <options/Options.hpp>
#include "runtime/RuntimeOptions.hpp"

using namespace SkillRuntime;
using shared_opts::Options;

namespace {

class RuntimeOptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("skill-runtime-options-" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(dir_);
        config_file_ = dir_ / "runtime.json";
        std::ofstream(config_file_) << R"({"runtime": {
            "skills": "defs/skills.json",
            "telemetry_dir": "/tmp/skill-runtime-events",
            "backend": "offset",
            "sigma_gates": {"finance_coach": 0.65},
            "log_level": "warning"
        }})";

        Options::clear_providers();
        runtime_opts::register_options();
    }

    void TearDown() override {
        Options::clear_providers();
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    Options::ParseResult parse(std::vector<std::string> args) {
        args.insert(args.begin(), "skill-runtime");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        error_.clear();
        return Options::load_and_parse(static_cast<int>(argv.size()), argv.data(), error_);
    }

    std::filesystem::path dir_;
    std::filesystem::path config_file_;
    std::string error_;
};

}  // namespace

TEST_F(RuntimeOptionsTest, ConfigFileSuppliesDefaults) {
    ASSERT_EQ(parse({"-c", config_file_.string()}), Options::ParseResult::Ok) << error_;

    auto config = runtime_opts::get_config();
    EXPECT_EQ(config.skills_path, std::filesystem::absolute(config_file_).parent_path() / "defs/skills.json");
    EXPECT_EQ(config.telemetry_dir, std::filesystem::path{"/tmp/skill-runtime-events"});
    EXPECT_EQ(config.backend, "offset");
    EXPECT_EQ(config.log_level, LogLevel::Warning);
    EXPECT_DOUBLE_EQ(config.sigma_gates.at("finance_coach"), 0.65);
    EXPECT_FALSE(config.idle);

    auto command = runtime_opts::get_command();
    EXPECT_TRUE(command.skill.empty());
    EXPECT_FALSE(command.list);
}

TEST_F(RuntimeOptionsTest, CommandLineOverridesConfig) {
    ASSERT_EQ(parse({"-c", config_file_.string(), "--backend", "echo", "--idle", "--log-level", "debug",
                     "--skill", "education_assistant", "--payload", R"({"gradeLevel": 9})"}),
              Options::ParseResult::Ok) << error_;

    auto config = runtime_opts::get_config();
    EXPECT_EQ(config.backend, "echo");
    EXPECT_TRUE(config.idle);
    EXPECT_EQ(config.log_level, LogLevel::Debug);

    auto command = runtime_opts::get_command();
    EXPECT_EQ(command.skill, "education_assistant");
    EXPECT_EQ(command.payload, R"({"gradeLevel": 9})");
}

TEST_F(RuntimeOptionsTest, WithoutConfigFileUsesBuiltInDefaults) {
    ASSERT_EQ(parse({"--list"}), Options::ParseResult::Ok) << error_;
    EXPECT_FALSE(Options::get_config_file().has_value());

    auto config = runtime_opts::get_config();
    EXPECT_EQ(config.backend, "echo");
    EXPECT_EQ(config.skills_path, std::filesystem::path{"config/skills.json"});
    EXPECT_TRUE(runtime_opts::get_command().list);
}

TEST_F(RuntimeOptionsTest, ReportsErrors) {
    EXPECT_EQ(parse({"-c", (dir_ / "absent.json").string()}), Options::ParseResult::Error);
    EXPECT_NE(error_.find("absent.json"), std::string::npos);

    EXPECT_EQ(parse({"--bogus"}), Options::ParseResult::Error);
    EXPECT_FALSE(error_.empty());

    EXPECT_EQ(parse({"--backend", "quantum"}), Options::ParseResult::Error);
    EXPECT_EQ(parse({"--sample-rate", "1.5"}), Options::ParseResult::Error);

    std::ofstream(dir_ / "broken.json") << "{\"runtime\": ";
    EXPECT_EQ(parse({"-c", (dir_ / "broken.json").string()}), Options::ParseResult::Error);
    EXPECT_NE(error_.find("malformed"), std::string::npos);
}

TEST_F(RuntimeOptionsTest, InvalidConfigSectionIsAnError) {
    std::ofstream(config_file_, std::ios::trunc) << R"({"runtime": {"idle": "sometimes"}})";
    EXPECT_EQ(parse({"-c", config_file_.string()}), Options::ParseResult::Error);
}
