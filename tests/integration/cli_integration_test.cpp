/**
 * @file cli_integration_test.cpp
 * @brief Exit codes and output of the seqcdc command line
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <json/json.h>

#include "FileUtils.h"
#include "Logger.h"
#include "SeqcdcCli.h"

using namespace SeqCDC;
namespace fs = std::filesystem;

class CliIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setConsoleOutput(false);
        testDir_ = fs::temp_directory_path() /
                   ("seqcdc_cli_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(testDir_);

        input_ = (testDir_ / "zeros.bin").string();
        ASSERT_TRUE(FileUtils::writeFile(input_, std::vector<uint8_t>(40000, 0)).isOk());
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(testDir_, ec);
        Logger::instance().setLevel(LogLevel::INFO);
        Logger::instance().setComponent("SeqCDC");
        Logger::instance().setConsoleOutput(true);
    }

    int run(std::vector<std::string> args) {
        args.insert(args.begin(), "seqcdc");
        out_.str("");
        err_.str("");
        return runCli(args, out_, err_);
    }

    Json::Value parseOut() {
        Json::Value root;
        Json::CharReaderBuilder builder;
        std::string errors;
        std::istringstream in(out_.str());
        EXPECT_TRUE(Json::parseFromStream(builder, in, &root, &errors)) << errors << "\n" << out_.str();
        return root;
    }

    fs::path testDir_;
    std::string input_;
    std::ostringstream out_;
    std::ostringstream err_;
};

TEST_F(CliIntegrationTest, InvalidSizeOrderingIsConfigurationError) {
    EXPECT_EQ(run({"--json", "--max", "10", input_}), EXIT_RUNTIME_ERROR);

    EXPECT_NE(out_.str().find("\"name\":\"INVALID_CONFIGURATION\""), std::string::npos) << out_.str();
    auto root = parseOut();
    EXPECT_EQ(root["code"].asInt(), 1000);
    EXPECT_EQ(root["details"].asString(), "max_block_size must be >= min_block_size");
}

TEST_F(CliIntegrationTest, TextErrorsGoToErrorStream) {
    EXPECT_EQ(run({"--seq-threshold", "0", input_}), EXIT_RUNTIME_ERROR);

    EXPECT_TRUE(out_.str().empty());
    EXPECT_NE(err_.str().find("seq_threshold must be > 0"), std::string::npos) << err_.str();
}

TEST_F(CliIntegrationTest, MalformedValuesRejected) {
    EXPECT_EQ(run({"--json", "--mode", "sideways", input_}), EXIT_RUNTIME_ERROR);
    EXPECT_EQ(parseOut()["name"].asString(), "INVALID_CONFIGURATION");

    EXPECT_EQ(run({"--json", "--min", "-4", input_}), EXIT_RUNTIME_ERROR);
    EXPECT_NE(parseOut()["details"].asString().find("min_block_size"), std::string::npos);
}

TEST_F(CliIntegrationTest, MissingInputFile) {
    EXPECT_EQ(run({"--json", (testDir_ / "absent.bin").string()}), EXIT_RUNTIME_ERROR);
    EXPECT_EQ(parseOut()["name"].asString(), "FILE_NOT_FOUND");
}

TEST_F(CliIntegrationTest, UsageErrors) {
    EXPECT_EQ(run({}), EXIT_USAGE);
    EXPECT_EQ(run({"--bogus", input_}), EXIT_USAGE);
    EXPECT_EQ(run({input_, "--min"}), EXIT_USAGE);
    EXPECT_EQ(run({"--log-level", "loud", input_}), EXIT_USAGE);
    EXPECT_EQ(run({input_, input_}), EXIT_USAGE);
}

TEST_F(CliIntegrationTest, HelpSucceeds) {
    EXPECT_EQ(run({"--help"}), EXIT_OK);
    EXPECT_NE(out_.str().find("Usage: seqcdc"), std::string::npos);
}

TEST_F(CliIntegrationTest, JsonReport) {
    EXPECT_EQ(run({"--json", "--list", input_}), EXIT_OK);

    auto root = parseOut();
    EXPECT_EQ(root["technique"].asString(), "Seq Chunking");
    EXPECT_EQ(root["config"]["op_mode"].asString(), "increasing");
    EXPECT_EQ(root["stats"]["chunk_count"].asUInt64(), 3u);
    EXPECT_EQ(root["stats"]["total_size"].asUInt64(), 40000u);
    EXPECT_EQ(root["stats"]["min_chunk_size"].asUInt64(), 7232u);

    const auto& chunks = root["chunks"];
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0]["start"].asUInt64(), 0u);
    EXPECT_EQ(chunks[1]["start"].asUInt64(), 16384u);
    EXPECT_EQ(chunks[2]["len"].asUInt64(), 7232u);
}

TEST_F(CliIntegrationTest, FlagsOverrideConfigFile) {
    auto configPath = (testDir_ / "seqcdc.conf").string();
    {
        std::ofstream conf(configPath);
        conf << "op_mode=decreasing\n"
             << "max_block_size=20000\n";
    }

    EXPECT_EQ(run({"--json", "--config", configPath, "--mode", "increasing", input_}), EXIT_OK);

    auto root = parseOut();
    EXPECT_EQ(root["config"]["op_mode"].asString(), "increasing");
    EXPECT_EQ(root["config"]["max_block_size"].asUInt64(), 20000u);
    EXPECT_EQ(root["stats"]["chunk_count"].asUInt64(), 2u);
}

TEST_F(CliIntegrationTest, MissingConfigFile) {
    EXPECT_EQ(run({"--json", "--config", (testDir_ / "absent.conf").string(), input_}), EXIT_RUNTIME_ERROR);
    EXPECT_EQ(parseOut()["name"].asString(), "IO_ERROR");
}

TEST_F(CliIntegrationTest, OutputReassemblesInput) {
    auto rebuilt = (testDir_ / "rebuilt.bin").string();

    EXPECT_EQ(run({"--output", rebuilt, input_}), EXIT_OK);
    EXPECT_NE(out_.str().find("Technique: Seq Chunking"), std::string::npos);
    EXPECT_NE(out_.str().find("chunks=3 total=40000"), std::string::npos);

    auto original = FileUtils::readFile(input_);
    auto copy = FileUtils::readFile(rebuilt);
    ASSERT_TRUE(original.isOk());
    ASSERT_TRUE(copy.isOk());
    EXPECT_EQ(copy.value(), original.value());
}
