#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config_loader.hpp"
#include "test_support.hpp"

using proverd::config::ApplyConfigFromEnv;
using proverd::config::ApplyConfigFromJson;
using proverd::config::Config;
using proverd::config::FileGrouping;
using proverd::test::TempDir;

namespace {

// Sets variables for one test and unsets them afterwards.
class ScopedEnv {
public:
    ScopedEnv& Set(const std::string& key, const std::string& value) {
        ::setenv(key.c_str(), value.c_str(), 1);
        keys_.push_back(key);
        return *this;
    }

    ~ScopedEnv() {
        for (const auto& key : keys_) {
            ::unsetenv(key.c_str());
        }
    }

private:
    std::vector<std::string> keys_;
};

}  // namespace

TEST(ConfigLoader, DefaultsMatchServiceContract) {
    const Config config{};
    EXPECT_EQ(config.server.port, 3000);
    EXPECT_EQ(config.prover.bin_dir, "./bin");
    EXPECT_EQ(config.prover.name, "prover");
    EXPECT_EQ(config.prover.output_flag, "--out");
    EXPECT_EQ(config.workspace.prefix, "tmp-");
    EXPECT_EQ(config.limits.min_timeout_s, 1);
    EXPECT_EQ(config.limits.max_timeout_s, 10);
    EXPECT_EQ(config.result.grouping, FileGrouping::kByExtension);
    EXPECT_FALSE(config.result.always_include_output);
    EXPECT_FALSE(config.result.always_include_timeout);
}

TEST(ConfigLoader, AppliesJsonSections) {
    Config config{};
    ApplyConfigFromJson(config, nlohmann::json::parse(R"({
        "server": {"host": "127.0.0.1", "port": 8080, "workerThreads": 2, "maxBodyBytes": 4096},
        "prover": {"binDir": "/opt/bin", "name": "tableau", "killGraceMs": 50},
        "workspace": {"root": "/var/tmp", "prefix": "job-"},
        "limits": {"maxTimeoutS": 30},
        "result": {"grouping": "flat", "alwaysIncludeOutput": true, "alwaysIncludeTimeout": true},
        "log": {"level": "debug", "format": "text"}
    })"));

    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.port, 8080);
    EXPECT_EQ(config.server.worker_threads, 2);
    EXPECT_EQ(config.server.max_body_bytes, 4096u);
    EXPECT_EQ(config.prover.bin_dir, "/opt/bin");
    EXPECT_EQ(config.prover.name, "tableau");
    EXPECT_EQ(config.prover.kill_grace_ms, 50);
    EXPECT_EQ(config.workspace.root, "/var/tmp");
    EXPECT_EQ(config.workspace.prefix, "job-");
    EXPECT_EQ(config.limits.max_timeout_s, 30);
    EXPECT_EQ(config.result.grouping, FileGrouping::kFlat);
    EXPECT_TRUE(config.result.always_include_output);
    EXPECT_TRUE(config.result.always_include_timeout);
    EXPECT_EQ(config.log.min_level, proverd::utils::LogLevel::kDebug);
    EXPECT_EQ(config.log.format, proverd::utils::LogFormat::kText);
}

TEST(ConfigLoader, IgnoresWrongTypesAndUnknownValues) {
    Config config{};
    ApplyConfigFromJson(config, nlohmann::json::parse(R"({
        "server": {"port": "8080"},
        "result": {"grouping": "nested"},
        "log": {"level": "loud"}
    })"));

    EXPECT_EQ(config.server.port, 3000);
    EXPECT_EQ(config.result.grouping, FileGrouping::kByExtension);
    EXPECT_EQ(config.log.min_level, proverd::utils::LogLevel::kInfo);
}

TEST(ConfigLoader, EnvironmentOverridesFile) {
    ScopedEnv env;
    env.Set("PORT", "9090")
        .Set("ENV", "dev")
        .Set("PROVERD_PROVER__BIN_DIR", "/srv/prover")
        .Set("PROVERD_RESULT__GROUPING", "flat")
        .Set("PROVERD_RESULT__ALWAYS_INCLUDE_OUTPUT", "yes")
        .Set("PROVERD_LIMITS__MAX_TIMEOUT_S", "not-a-number");

    Config config{};
    ApplyConfigFromEnv(config);

    EXPECT_EQ(config.server.port, 9090);
    EXPECT_EQ(config.server.host, "localhost");
    EXPECT_EQ(config.prover.bin_dir, "/srv/prover");
    EXPECT_EQ(config.result.grouping, FileGrouping::kFlat);
    EXPECT_TRUE(config.result.always_include_output);
    EXPECT_EQ(config.limits.max_timeout_s, 10);
}

TEST(ConfigLoader, LoadConfigReadsFileThenEnvironment) {
    TempDir dir;
    const auto path = dir.Path() / "proverd.json";
    proverd::test::WriteFile(path, R"({"server": {"port": 4000}, "prover": {"name": "from-file"}})");
    ScopedEnv env;
    env.Set("PROVERD_PROVER__NAME", "from-env");

    const auto config = proverd::config::LoadConfig(path);

    EXPECT_EQ(config.server.port, 4000);
    EXPECT_EQ(config.prover.name, "from-env");
}

TEST(ConfigLoader, MissingFileKeepsDefaultsAndMalformedFileThrows) {
    TempDir dir;
    EXPECT_EQ(proverd::config::LoadConfig(dir.Path() / "absent.json").server.port, 3000);

    const auto path = dir.Path() / "broken.json";
    proverd::test::WriteFile(path, "{not json");
    EXPECT_THROW(proverd::config::LoadConfig(path), std::runtime_error);
}

TEST(ConfigLoader, DotEnvDoesNotOverrideExistingVariables) {
    TempDir dir;
    const auto path = dir.Path() / ".env";
    proverd::test::WriteFile(path,
                             "# comment\n"
                             "PROVERD_TEST_FRESH=\"from file\"\n"
                             "export PROVERD_TEST_EXISTING=from-file\n"
                             "not a pair\n");
    ScopedEnv env;
    env.Set("PROVERD_TEST_EXISTING", "from-process");

    proverd::config::LoadDotEnv(path);

    ASSERT_NE(std::getenv("PROVERD_TEST_FRESH"), nullptr);
    EXPECT_STREQ(std::getenv("PROVERD_TEST_FRESH"), "from file");
    EXPECT_STREQ(std::getenv("PROVERD_TEST_EXISTING"), "from-process");
    ::unsetenv("PROVERD_TEST_FRESH");
}
