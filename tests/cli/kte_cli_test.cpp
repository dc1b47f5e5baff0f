// File: tests/cli/kte_cli_test.cpp
//
// Tests for the command-line driver

#include "cli/kte_cli.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <ctime>
#include <filesystem>
#include <memory>
#include <sstream>

namespace kte {
namespace {

class KteCliTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = EngineConfig::Default();
        cli_ = std::make_unique<KteCli>(config_, out_);
    }

    // Output of one command only
    std::string Run(const std::string& command) {
        out_.str("");
        out_.clear();
        cli_->ProcessCommand(command);
        return out_.str();
    }

    static bool Contains(const std::string& haystack, const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    }

    EngineConfig config_;
    std::ostringstream out_;
    std::unique_ptr<KteCli> cli_;
};

// ============================================================================
// Parsing helpers
// ============================================================================

TEST(KteCliParsingTest, ParseNumber) {
    EXPECT_DOUBLE_EQ(0.25, ParseNumber("0.25", "prior"));
    EXPECT_DOUBLE_EQ(-3.0, ParseNumber("-3", "logit"));
    EXPECT_THROW(ParseNumber("abc", "prior"), ValidationError);
    EXPECT_THROW(ParseNumber("0.5x", "prior"), ValidationError);
    EXPECT_THROW(ParseNumber("", "prior"), ValidationError);
}

TEST(KteCliParsingTest, ParseOutcome) {
    for (const char* yes : {"1", "true", "correct", "y"}) {
        EXPECT_TRUE(ParseOutcome(yes)) << yes;
    }
    for (const char* no : {"0", "false", "incorrect", "n"}) {
        EXPECT_FALSE(ParseOutcome(no)) << no;
    }
    EXPECT_THROW(ParseOutcome("maybe"), ValidationError);
}

TEST(KteCliParsingTest, SplitListDropsEmptyParts) {
    EXPECT_EQ((std::vector<std::string>{"a", "b", "c"}), SplitList("a,b,,c,"));
    EXPECT_EQ((std::vector<std::string>{"kinematics"}), SplitList("kinematics"));
    EXPECT_TRUE(SplitList("").empty());
}

// ============================================================================
// Session handling
// ============================================================================

TEST_F(KteCliTest, InitialState) {
    EXPECT_TRUE(cli_->IsRunning());
    EXPECT_FALSE(cli_->IsVerboseEnabled());
    EXPECT_EQ(0u, cli_->GetCommandCount());
    EXPECT_EQ(0u, cli_->GetErrorCount());
}

TEST_F(KteCliTest, EmptyInputIsIgnored) {
    EXPECT_TRUE(Run("").empty());
    EXPECT_TRUE(Run("   ").empty());
    EXPECT_EQ(0u, cli_->GetCommandCount());
}

TEST_F(KteCliTest, PlainTextGetsHint) {
    EXPECT_TRUE(Contains(Run("hello"), "Commands start with '/'"));
    EXPECT_EQ(0u, cli_->GetCommandCount());
}

TEST_F(KteCliTest, UnknownCommand) {
    EXPECT_TRUE(Contains(Run("/dance"), "Unknown command: /dance"));
    EXPECT_EQ(1u, cli_->GetCommandCount());
}

TEST_F(KteCliTest, HelpListsCommands) {
    std::string help = Run("/help");
    for (const char* command : {"/answer", "/time", "/fit", "/fairness", "/quit"}) {
        EXPECT_TRUE(Contains(help, command)) << command;
    }
}

TEST_F(KteCliTest, VerboseToggles) {
    EXPECT_TRUE(Contains(Run("/verbose"), "Verbose mode: ON"));
    EXPECT_TRUE(cli_->IsVerboseEnabled());
    EXPECT_TRUE(Contains(Run("/verbose"), "Verbose mode: OFF"));
    EXPECT_FALSE(cli_->IsVerboseEnabled());
}

TEST_F(KteCliTest, QuitStopsRunning) {
    Run("/quit");
    EXPECT_FALSE(cli_->IsRunning());
}

TEST_F(KteCliTest, RunReadsUntilQuit) {
    std::istringstream in("/params optics 0.25 0.3 0.1 0.2\n/quit\n/params never 0.2 0.3 0.1 0.2\n");
    cli_->Run(in);

    EXPECT_FALSE(cli_->IsRunning());
    EXPECT_EQ(2u, cli_->GetCommandCount());
    EXPECT_TRUE(Contains(out_.str(), "kte> "));
    EXPECT_TRUE(Contains(out_.str(), "Stored parameters for optics"));
}

TEST_F(KteCliTest, RunStopsAtEndOfInput) {
    std::istringstream in("/stats\n");
    cli_->Run(in);
    EXPECT_EQ(1u, cli_->GetCommandCount());
}

// ============================================================================
// Tracing commands
// ============================================================================

TEST_F(KteCliTest, AnswerPrintsMasteryChange) {
    std::string output = Run("/answer s1 kinematics correct 42000 NEET physics urban");

    EXPECT_TRUE(Contains(output, "kinematics: 0.2500 -> ")) << output;
    EXPECT_TRUE(Contains(output, "practice 1")) << output;
    EXPECT_TRUE(Contains(output, "score 4.0")) << output;
    EXPECT_TRUE(Contains(output, "event #1")) << output;
    EXPECT_EQ(0u, cli_->GetErrorCount());
}

TEST_F(KteCliTest, AnswerUpdatesSeveralConcepts) {
    std::string output = Run("/answer s1 kinematics,optics incorrect");
    EXPECT_TRUE(Contains(output, "kinematics: "));
    EXPECT_TRUE(Contains(output, "optics: "));
    EXPECT_TRUE(Contains(output, "score -1.0"));
}

TEST_F(KteCliTest, AnswerErrorsAreCountedNotFatal) {
    EXPECT_TRUE(Contains(Run("/answer s1 kinematics"), "Error: "));
    EXPECT_TRUE(Contains(Run("/answer s1 kinematics perhaps"), "Error: "));
    EXPECT_TRUE(Contains(Run("/answer s1 a,a correct"), "Error: "));
    EXPECT_TRUE(Contains(Run("/answer s1 kinematics correct 100 NEET physics urban watch"), "Error: "));

    EXPECT_EQ(4u, cli_->GetErrorCount());
    EXPECT_TRUE(cli_->IsRunning());
}

TEST_F(KteCliTest, MasteryShowsStoredState) {
    EXPECT_TRUE(Contains(Run("/mastery s1 kinematics"), "No state for s1/kinematics"));

    Run("/answer s1 kinematics correct");
    std::string output = Run("/mastery s1 kinematics");
    EXPECT_TRUE(Contains(output, "Mastery: "));
    EXPECT_TRUE(Contains(output, "Practice count: 1"));
    EXPECT_TRUE(Contains(output, "Recovery: no"));
}

TEST_F(KteCliTest, ParamsAreStoredAndValidated) {
    EXPECT_TRUE(Contains(Run("/params optics 0.3 0.4 0.1 0.2 0.05"), "Stored parameters for optics"));

    auto stored = cli_->GetParameterStore().GetParameters("optics", std::chrono::milliseconds(100));
    ASSERT_TRUE(stored.Ok());
    EXPECT_DOUBLE_EQ(0.3, stored.value->initial_mastery);
    EXPECT_DOUBLE_EQ(0.4, stored.value->learn_rate);
    EXPECT_DOUBLE_EQ(0.05, stored.value->forgetting_rate);

    EXPECT_TRUE(Contains(Run("/params optics 0.3 0.4 0.6 0.5"), "Error: "));
    EXPECT_EQ(1u, cli_->GetErrorCount());
}

// ============================================================================
// Pacing
// ============================================================================

TEST_F(KteCliTest, TimeAllocationRespectsCap) {
    std::string output = Run("/time s1 kinematics 1.0 1000000 NEET");
    EXPECT_TRUE(Contains(output, "Allocated 90000 ms for NEET (cap 90000 ms, capped)")) << output;

    output = Run("/time s1 kinematics 1.0 1000000");
    EXPECT_TRUE(Contains(output, "Allocated 180000 ms for JEE_Mains")) << output;
}

TEST_F(KteCliTest, TimeRejectsBadNumbers) {
    EXPECT_TRUE(Contains(Run("/time s1 kinematics hard 60000"), "Error: "));
    EXPECT_EQ(1u, cli_->GetErrorCount());
}

// ============================================================================
// Calibration and fairness
// ============================================================================

TEST_F(KteCliTest, FitThenCalibrate) {
    std::string output = Run("/fit JEE_Mains physics 2.0:1 1.5:1 -0.3:0 0.8:0 -1.2:0 2.2:1 0.4:1 -2.0:0");
    EXPECT_TRUE(Contains(output, "Temperature for JEE_Mains/physics: ")) << output;
    EXPECT_TRUE(Contains(output, "over 8 samples")) << output;

    output = Run("/calibrate JEE_Mains physics 0.9");
    EXPECT_TRUE(Contains(output, "Calibrated 0.9000 -> ")) << output;

    output = Run("/calibrate NEET physics 0.9");
    EXPECT_TRUE(Contains(output, "0.9000 -> 0.9000 (T=1.0000)")) << output;
}

TEST_F(KteCliTest, FitRejectsBadSamples) {
    EXPECT_TRUE(Contains(Run("/fit NEET biology 1.0"), "Error: "));
    EXPECT_TRUE(Contains(Run("/fit NEET biology 1.0:2"), "Error: "));
    EXPECT_TRUE(Contains(Run("/fit NEET biology 1.0:1 2.0:1"), "Error: "));
    EXPECT_EQ(3u, cli_->GetErrorCount());
}

TEST_F(KteCliTest, FitFromLogUsesAnswers) {
    Run("/answer s1 kinematics correct 40000 NEET physics");
    Run("/answer s2 kinematics incorrect 40000 NEET physics");
    Run("/answer s3 kinematics correct 40000 NEET physics");

    std::string output = Run("/fitlog NEET physics");
    EXPECT_TRUE(Contains(output, "over 3 samples")) << output;

    EXPECT_TRUE(Contains(Run("/fitlog NEET chemistry"), "Error: "));
}

TEST_F(KteCliTest, FairnessReportShowsDisparity) {
    for (int i = 0; i < 3; ++i) {
        Run("/sample JEE_Mains physics urban 0.9");
        Run("/sample JEE_Mains physics rural 0.6");
    }

    std::string output = Run("/fairness JEE_Mains physics");
    EXPECT_TRUE(Contains(output, "urban")) << output;
    EXPECT_TRUE(Contains(output, "rural")) << output;
    EXPECT_TRUE(Contains(output, "Disparity: 0.3000 [FLAGGED]")) << output;
    EXPECT_TRUE(Contains(output, "Investigate feature bias")) << output;
}

TEST_F(KteCliTest, SampleOutsideUnitIntervalIsError) {
    EXPECT_TRUE(Contains(Run("/sample JEE_Mains physics urban 1.5"), "Error: "));
}

// ============================================================================
// Session commands
// ============================================================================

TEST_F(KteCliTest, StatsAndConfig) {
    Run("/answer s1 kinematics correct");

    std::string stats = Run("/stats");
    EXPECT_TRUE(Contains(stats, "Interactions: 1"));
    EXPECT_TRUE(Contains(stats, "Backend: memory"));

    std::string yaml = Run("/config");
    EXPECT_TRUE(Contains(yaml, "default_exam: \"JEE_Mains\""));
    EXPECT_TRUE(EngineConfig::LoadFromString(yaml).has_value());
}

TEST_F(KteCliTest, SaveAndLoadWithMemoryBackend) {
    Run("/sample NEET biology urban 0.8");
    EXPECT_TRUE(Contains(Run("/save"), "Saved calibration and fairness state"));
    EXPECT_TRUE(Contains(Run("/load"), "Restored 0 calibration entries"));
    EXPECT_EQ(0u, cli_->GetErrorCount());
}

// ============================================================================
// SQLite backend
// ============================================================================

class KteCliSqliteTest : public ::testing::Test {
protected:
    void SetUp() override {
        static int counter = 0;
        db_path_ = "/tmp/test_kte_cli_" + std::to_string(std::time(nullptr)) + "_" +
                   std::to_string(counter++) + ".db";
        config_ = EngineConfig::Default();
        config_.storage.backend = "sqlite";
        config_.storage.db_path = db_path_;
    }

    void TearDown() override {
        std::filesystem::remove(db_path_);
        std::filesystem::remove(db_path_ + "-wal");
        std::filesystem::remove(db_path_ + "-shm");
    }

    EngineConfig config_;
    std::string db_path_;
};

TEST_F(KteCliSqliteTest, StateAndSnapshotsSurviveRestart) {
    {
        std::ostringstream out;
        KteCli cli(config_, out);
        std::istringstream in(
            "/answer s1 kinematics correct 40000 NEET physics\n"
            "/fit NEET physics 2.0:1 1.5:1 -0.3:0 0.8:0 -1.2:0 2.2:1 0.4:1 -2.0:0\n"
            "/quit\n");
        cli.Run(in);
        EXPECT_EQ(0u, cli.GetErrorCount()) << out.str();
        EXPECT_TRUE(out.str().find("Saved calibration and fairness state") != std::string::npos);
    }

    std::ostringstream out;
    KteCli cli(config_, out);

    cli.ProcessCommand("/mastery s1 kinematics");
    EXPECT_NE(std::string::npos, out.str().find("Practice count: 1")) << out.str();

    double temperature = cli.GetEngine().GetCalibrationTable().GetTemperature("NEET", "physics");
    EXPECT_NE(1.0, temperature);

    auto report = cli.GetEngine().GetFairnessReport("NEET", "physics");
    EXPECT_EQ(1u, report.groups.size());
}

} // namespace
} // namespace kte
