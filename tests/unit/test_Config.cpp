#include <gtest/gtest.h>
#include "TempDir.hpp"
#include "config/Config.hpp"
#include "config/ConfigRegistry.hpp"
#include "config/paths.hpp"
#include "util/files.hpp"

#include <nlohmann/json.hpp>

using namespace pt::config;

class ConfigTest : public ::testing::Test {
protected:
    pt::test::TempDir dir;

    Config load(const std::string& yaml) const {
        const auto path = dir / "config.yaml";
        pt::util::writeFile(path, yaml);
        return loadConfig(path);
    }
};

TEST_F(ConfigTest, MissingFileYieldsDefaults) {
    const auto cfg = loadConfig(dir / "absent.yaml");
    EXPECT_EQ(cfg.transfer.max_concurrency, 0u);
    EXPECT_EQ(cfg.transfer.default_timeout_seconds, 0u);
    EXPECT_EQ(cfg.transfer.duplicate_destinations, DuplicatePolicy::Warn);
    EXPECT_EQ(cfg.transfer.part_size_bytes, DEFAULT_PART_SIZE_BYTES);
    EXPECT_FALSE(cfg.transfer.keep_work_dirs);
    EXPECT_EQ(cfg.transfer.work_root, pt::paths::getWorkRoot());
    EXPECT_TRUE(cfg.strategies.empty());
}

TEST_F(ConfigTest, RegistryIsInitializedForTests) {
    EXPECT_TRUE(ConfigRegistry::isInitialized());
    EXPECT_NO_THROW(ConfigRegistry::get());
}

TEST_F(ConfigTest, ParsesTransferSection) {
    const auto cfg = load(R"(
transfer:
  max_concurrency: 4
  default_timeout_seconds: 30
  work_root: /scratch/porter
  keep_work_dirs: true
  duplicate_destinations: error
  part_size_bytes: 1024
)");
    EXPECT_EQ(cfg.transfer.max_concurrency, 4u);
    EXPECT_EQ(cfg.transfer.default_timeout_seconds, 30u);
    EXPECT_EQ(cfg.transfer.work_root, "/scratch/porter");
    EXPECT_TRUE(cfg.transfer.keep_work_dirs);
    EXPECT_EQ(cfg.transfer.duplicate_destinations, DuplicatePolicy::Error);
    EXPECT_EQ(cfg.transfer.part_size_bytes, MIN_PART_SIZE_BYTES);
}

TEST_F(ConfigTest, ParsesStrategies) {
    const auto cfg = load(R"(
strategies:
  - name: archive
    type: object_store
    scheme: s3
    region: eu-west-1
    endpoint: http://minio:9000
    access_key: AK
    secret_access_key: SK
  - name: build-host
    type: remote_host
    host: build01
    user: ci
    port: 2222
    program: rsync
  - type: http
    upload_enabled: true
)");
    ASSERT_EQ(cfg.strategies.size(), 3u);

    const auto& s3 = cfg.strategies[0];
    EXPECT_EQ(s3.name, "archive");
    EXPECT_EQ(s3.type, "object_store");
    EXPECT_EQ(s3.region, "eu-west-1");
    EXPECT_EQ(s3.endpoint, "http://minio:9000");
    EXPECT_EQ(s3.secret_access_key, "SK");

    const auto& ssh = cfg.strategies[1];
    EXPECT_EQ(ssh.host, "build01");
    ASSERT_TRUE(ssh.port.has_value());
    EXPECT_EQ(*ssh.port, 2222);
    EXPECT_EQ(ssh.program, "rsync");
    EXPECT_EQ(ssh.connect_timeout_seconds, 10u);

    const auto& http = cfg.strategies[2];
    EXPECT_EQ(http.name, "http");
    EXPECT_TRUE(http.upload_enabled);
    EXPECT_TRUE(http.verify_tls);
}

TEST_F(ConfigTest, ParsesLogLevels) {
    const auto cfg = load(R"(
logging:
  log_dir: /tmp/porter-logs
  levels:
    console_log_level: debug
    subsystem_levels:
      cloud: trace
)");
    EXPECT_EQ(cfg.logging.log_dir, "/tmp/porter-logs");
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.cloud, spdlog::level::trace);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.transfer, spdlog::level::info);
}

TEST_F(ConfigTest, RejectsBadValues) {
    EXPECT_THROW(load("transfer:\n  duplicate_destinations: maybe\n"), std::invalid_argument);
    EXPECT_THROW(load("strategies:\n  - name: nameless\n"), std::runtime_error);
    EXPECT_THROW(load("strategies: s3\n"), std::runtime_error);
}

TEST_F(ConfigTest, JsonDumpOmitsSecrets) {
    auto cfg = load(R"(
strategies:
  - name: archive
    type: object_store
    secret_access_key: hunter2
)");
    const nlohmann::json j = cfg;
    EXPECT_EQ(j["transfer"]["duplicate_destinations"], "warn");
    ASSERT_EQ(j["strategies"].size(), 1u);
    EXPECT_EQ(j["strategies"][0]["name"], "archive");
    EXPECT_FALSE(j["strategies"][0].contains("secret_access_key"));
}
