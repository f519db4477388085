#include <gtest/gtest.h>
#include "TempDir.hpp"
#include "cli/Commands.hpp"
#include "config/Config.hpp"
#include "storage/Registry.hpp"
#include "task/TaskDefinition.hpp"
#include "util/files.hpp"

#include <atomic>
#include <memory>
#include <sstream>
#include <nlohmann/json.hpp>

using namespace pt::cli;
using json = nlohmann::json;

class CommandsTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg.transfer.work_root = dir / "work";
    }

    int run(const std::vector<std::string>& args) {
        out.str("");
        err.str("");
        const CommandContext ctx{cfg, registry, flag, out, err};
        return dispatch(args, ctx);
    }

    pt::test::TempDir dir;
    pt::config::Config cfg;
    std::shared_ptr<pt::storage::Registry> registry = std::make_shared<pt::storage::Registry>(pt::config::Config{});
    std::shared_ptr<std::atomic<bool>> flag = std::make_shared<std::atomic<bool>>(false);
    std::ostringstream out, err;
};

TEST_F(CommandsTest, UsageErrors) {
    EXPECT_EQ(run({}), EXIT_USAGE);
    EXPECT_EQ(run({"frobnicate"}), EXIT_USAGE);
    EXPECT_EQ(run({"get", "only-one"}), EXIT_USAGE);
    EXPECT_EQ(run({"run", "manifest.json"}), EXIT_USAGE);
    EXPECT_EQ(run({"run", "manifest.json", "--"}), EXIT_USAGE);
    EXPECT_NE(err.str().find("usage: porter"), std::string::npos);
    EXPECT_EQ(run({"--help"}), EXIT_OK);
}

TEST_F(CommandsTest, ConfigPrintsJson) {
    ASSERT_EQ(run({"config"}), EXIT_OK);
    const auto j = json::parse(out.str());
    EXPECT_EQ(j["transfer"]["work_root"], (dir / "work").string());
}

TEST_F(CommandsTest, GetAndPutCopyLocalFiles) {
    pt::util::writeFile(dir / "src.txt", "payload");

    ASSERT_EQ(run({"get", (dir / "src.txt").string(), (dir / "fetched.txt").string()}), EXIT_OK);
    EXPECT_EQ(pt::util::readFileToString(dir / "fetched.txt"), "payload");
    EXPECT_EQ(json::parse(out.str())["succeeded"], true);

    ASSERT_EQ(run({"put", (dir / "fetched.txt").string(), (dir / "published" / "out.txt").string()}), EXIT_OK);
    EXPECT_EQ(pt::util::readFileToString(dir / "published" / "out.txt"), "payload");
}

TEST_F(CommandsTest, GetMissingObjectFails) {
    EXPECT_EQ(run({"get", (dir / "absent").string(), (dir / "x").string()}), EXIT_FAILED);
    EXPECT_NE(err.str().find("ObjectNotFound"), std::string::npos);
}

TEST_F(CommandsTest, UnknownSchemeFails) {
    EXPECT_EQ(run({"get", "ftp://host/file", (dir / "x").string()}), EXIT_FAILED);
    EXPECT_NE(err.str().find("SchemeMismatch"), std::string::npos);
}

TEST_F(CommandsTest, RunStagesFilesAroundCommand) {
    pt::util::writeFile(dir / "input.txt", "hello");
    const json manifest{
        {"name", "upper"},
        {"files", json::array({
            json{{"from", (dir / "input.txt").string()}, {"to", "in.txt"}},
            json{{"direction", "ToRemote"}, {"remote", "file://" + (dir / "result" / "out.txt").string()},
                 {"local", "out.txt"}, {"id", "result"}}
        })}
    };
    pt::util::writeFile(dir / "manifest.json", manifest.dump());

    const std::string script =
        "in=$(printf '%s' \"$PORTER_FILES\" | sed -e 's/^\\[\\[\"[^\"]*\",\"//' -e 's/\"\\].*//'); "
        "out=\"$(dirname \"$in\")/out.txt\"; tr a-z A-Z < \"$in\" > \"$out\"";

    ASSERT_EQ(run({"run", (dir / "manifest.json").string(), "--", "sh", "-c", script}), EXIT_OK) << err.str();
    EXPECT_EQ(pt::util::readFileToString(dir / "result" / "out.txt"), "HELLO");

    const auto outcome = json::parse(out.str());
    EXPECT_EQ(outcome["status"], "COMPLETED");
    EXPECT_EQ(outcome["task"], "upper");
}

TEST_F(CommandsTest, RunReportsFailingCommand) {
    pt::util::writeFile(dir / "manifest.json", R"({"name": "fails", "files": []})");
    EXPECT_EQ(run({"run", (dir / "manifest.json").string(), "--", "sh", "-c", "exit 4"}), EXIT_FAILED);
    EXPECT_EQ(json::parse(out.str())["status"], "FAILED");
    EXPECT_NE(err.str().find("TaskBodyFailure"), std::string::npos);
}

TEST(ManifestTaskTest, RejectsMalformedManifests) {
    EXPECT_THROW(manifestTask(json::array(), {"true"}, nullptr), std::invalid_argument);
    EXPECT_THROW(manifestTask(json::object(), {}, nullptr), std::invalid_argument);

    const auto def = manifestTask(json{{"files", json::array({json{{"from", "s3://b/k"}, {"to", "k"}}})}},
                                  {"/usr/bin/env"}, nullptr);
    EXPECT_EQ(def.name, "env");
    ASSERT_EQ(def.files.size(), 1u);
    EXPECT_TRUE(static_cast<bool>(def.body));
}
