#include <gtest/gtest.h>

#include <cstdlib>
#include <sstream>
#include <string>

#include "cli/run_once.hpp"
#include "nlohmann/json.hpp"
#include "test_support.hpp"

using proverd::cli::RunOnce;
using proverd::cli::RunOnceArgs;
using proverd::config::Config;
using proverd::test::CapturingLogger;
using proverd::test::TempDir;
using proverd::test::WriteScript;

namespace {

class RunOnceTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::filesystem::create_directories(WorkspaceRoot());
        config_.workspace.root = WorkspaceRoot().string();
        config_.prover.bin_dir = (dir_.Path() / "bin").string();
        args_.formula = "P -> P";
        args_.timeout_s = 2;
    }

    std::filesystem::path WorkspaceRoot() const { return dir_.Path() / "workspaces"; }

    int Run() {
        return RunOnce(args_, config_, logger_, out_, err_);
    }

    TempDir dir_;
    CapturingLogger logger_;
    Config config_;
    RunOnceArgs args_;
    std::ostringstream out_;
    std::ostringstream err_;
};

// Points TMPDIR somewhere for one test and restores it afterwards.
class ScopedTmpDir {
public:
    explicit ScopedTmpDir(const std::string& value) {
        if (const char* current = std::getenv("TMPDIR")) {
            saved_ = current;
            had_value_ = true;
        }
        ::setenv("TMPDIR", value.c_str(), 1);
    }

    ~ScopedTmpDir() {
        if (had_value_) {
            ::setenv("TMPDIR", saved_.c_str(), 1);
        } else {
            ::unsetenv("TMPDIR");
        }
    }

private:
    std::string saved_;
    bool had_value_ = false;
};

}  // namespace

TEST_F(RunOnceTest, PrintsResultJson) {
    WriteScript(dir_.Path() / "bin" / "prover", "echo 'valid: true' > \"$2/result.yaml\"");

    EXPECT_EQ(Run(), 0);

    const auto body = nlohmann::json::parse(out_.str());
    EXPECT_EQ(body["summary"]["valid"], true);
}

TEST_F(RunOnceTest, InvalidOptionsAreUsageError) {
    args_.options = "{broken";

    EXPECT_EQ(Run(), 2);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(RunOnceTest, OutOfRangeTimeoutIsRejected) {
    args_.timeout_s = 0;

    EXPECT_EQ(Run(), 2);
    EXPECT_NE(err_.str().find("invalid_request"), std::string::npos);
}

TEST_F(RunOnceTest, MissingBinaryIsFailure) {
    EXPECT_EQ(Run(), 1);
    EXPECT_EQ(proverd::test::CountEntries(WorkspaceRoot()), 0u);
}

TEST_F(RunOnceTest, UnexpectedExceptionIsReportedNotFatal) {
    WriteScript(dir_.Path() / "bin" / "prover", "echo 'valid: true' > \"$2/result.yaml\"");
    const auto not_a_dir = dir_.Path() / "tmp-file";
    proverd::test::WriteFile(not_a_dir, "x");
    ScopedTmpDir tmpdir(not_a_dir.string());

    EXPECT_EQ(Run(), 1);
    EXPECT_NE(err_.str().find("Error: "), std::string::npos);
    EXPECT_TRUE(logger_.Contains(proverd::utils::LogLevel::kError, "Job failed"));
    EXPECT_EQ(proverd::test::CountEntries(WorkspaceRoot()), 0u);
}
