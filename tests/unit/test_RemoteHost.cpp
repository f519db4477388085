#include <gtest/gtest.h>
#include <algorithm>
#include "storage/RemoteHostStrategy.hpp"
#include "transfer/model/Error.hpp"
#include "transfer/model/TransferSpec.hpp"

using namespace pt::storage;
using namespace pt::transfer;
using namespace pt::transfer::model;
using pt::util::ProcessResult;

namespace {

pt::config::StrategyConfig hostConfig(const std::string& program = "scp") {
    pt::config::StrategyConfig cfg;
    cfg.name = "build";
    cfg.type = "remote_host";
    cfg.host = "build01";
    cfg.user = "ci";
    cfg.program = program;
    cfg.connect_timeout_seconds = 5;
    return cfg;
}

ProcessResult failed(const std::string& stderrText, const int code = 1) {
    ProcessResult r;
    r.exit_code = code;
    r.stderr_text = stderrText;
    return r;
}

}

TEST(RemoteHostStrategyTest, BuildsScpCommand) {
    auto cfg = hostConfig();
    cfg.port = 2222;
    cfg.credentials_path = "/keys/id_ed25519";
    const RemoteHostStrategy s(cfg);

    const auto remote = Locator::parse("ssh://build01/srv/out.tar");
    EXPECT_EQ(s.remoteOperand(remote), "ci@build01:/srv/out.tar");

    const std::vector<std::string> expected{
        "scp", "-B", "-q", "-o", "BatchMode=yes", "-o", "ConnectTimeout=5",
        "-P", "2222", "-i", "/keys/id_ed25519", "ci@build01:/srv/out.tar", "/work/out.tar"};
    EXPECT_EQ(s.commandFor(s.remoteOperand(remote), "/work/out.tar", remote), expected);
}

TEST(RemoteHostStrategyTest, LocatorPortAndUserOverrideConfig) {
    const RemoteHostStrategy s(hostConfig());
    const auto remote = Locator::parse("ssh://deploy@build01:2200/data/x");
    EXPECT_EQ(s.remoteOperand(remote), "deploy@build01:/data/x");

    const auto argv = s.commandFor("/local/x", s.remoteOperand(remote), remote);
    const auto port = std::find(argv.begin(), argv.end(), "-P");
    ASSERT_NE(port, argv.end());
    EXPECT_EQ(*std::next(port), "2200");
    EXPECT_EQ(argv.back(), "deploy@build01:/data/x");
}

TEST(RemoteHostStrategyTest, BuildsRsyncCommand) {
    auto cfg = hostConfig("rsync");
    cfg.port = 22;
    const RemoteHostStrategy s(cfg);
    const auto remote = Locator::parse("build01:/srv/in.bin");

    const std::vector<std::string> expected{
        "rsync", "-q", "-e", "ssh -o BatchMode=yes -o ConnectTimeout=5 -p 22",
        "ci@build01:/srv/in.bin", "/work/in.bin"};
    EXPECT_EQ(s.commandFor(s.remoteOperand(remote), "/work/in.bin", remote), expected);
}

TEST(RemoteHostStrategyTest, AcceptsOnlyConfiguredHost) {
    const RemoteHostStrategy s(hostConfig());
    EXPECT_TRUE(s.accepts(Locator::parse("ssh://build01/x")));
    EXPECT_TRUE(s.accepts(Locator::parse("ci@build01:/x")));
    EXPECT_FALSE(s.accepts(Locator::parse("ssh://other/x")));
    EXPECT_FALSE(s.accepts(Locator::parse("s3://build01/x")));
}

TEST(RemoteHostStrategyTest, RejectsLocatorWithoutPath) {
    const auto s = std::make_shared<RemoteHostStrategy>(hostConfig());
    try {
        TransferSpec("x", Direction::ToLocal, Locator::parse("ssh://build01"), "/work/x", s);
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SchemeMismatch);
    }
}

TEST(RemoteHostStrategyTest, ClassifiesCopyFailures) {
    EXPECT_EQ(RemoteHostStrategy::classify(failed("ci@build01: Permission denied (publickey).")),
              ErrorKind::AuthenticationFailure);
    EXPECT_EQ(RemoteHostStrategy::classify(failed("Host key verification failed.")),
              ErrorKind::AuthenticationFailure);
    EXPECT_EQ(RemoteHostStrategy::classify(failed("scp: /srv/missing: No such file or directory")),
              ErrorKind::ObjectNotFound);
    EXPECT_EQ(RemoteHostStrategy::classify(failed("ssh: connect to host build01 port 22: Connection timed out", 255)),
              ErrorKind::NetworkTimeout);
    EXPECT_EQ(RemoteHostStrategy::classify(failed("ssh: connect to host build01 port 22: Connection refused", 255)),
              ErrorKind::TransportFailure);

    ProcessResult timedOut;
    timedOut.timed_out = true;
    EXPECT_EQ(RemoteHostStrategy::classify(timedOut), ErrorKind::NetworkTimeout);

    ProcessResult cancelled;
    cancelled.cancelled = true;
    EXPECT_EQ(RemoteHostStrategy::classify(cancelled), ErrorKind::Cancelled);
}

TEST(RemoteHostStrategyTest, UnsupportedProgramFailsAtFirstTransfer) {
    const RemoteHostStrategy s(hostConfig("ftp"));
    const auto remote = Locator::parse("ssh://build01/srv/x");
    try {
        s.download(remote, "/tmp/porter-never-written", Context{});
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnsupportedOperation);
    }
    EXPECT_FALSE(std::filesystem::exists("/tmp/porter-never-written"));
}
