#include <gtest/gtest.h>
#include "FakeStrategy.hpp"
#include "TempDir.hpp"
#include "transfer/Executor.hpp"
#include "transfer/model/Error.hpp"
#include "util/files.hpp"

#include <chrono>
#include <memory>
#include <thread>

using namespace pt::transfer;
using namespace pt::transfer::model;
using namespace std::chrono;

class ExecutorTest : public ::testing::Test {
protected:
    std::shared_ptr<pt::test::FakeStrategy> store = std::make_shared<pt::test::FakeStrategy>();
    pt::test::TempDir dir;

    TransferSpec download(const std::string& id, const std::string& key, const std::string& local) const {
        return {id, Direction::ToLocal, Locator::parse("store://bucket/" + key), dir / local, store};
    }

    TransferSpec upload(const std::string& id, const std::string& local, const std::string& key) const {
        return {id, Direction::ToRemote, Locator::parse("store://bucket/" + key), dir / local, store};
    }
};

TEST_F(ExecutorTest, ResultsFollowDeclarationOrder) {
    store->put("bucket/slow", "s");
    store->put("bucket/fast", "f");
    store->delay("bucket/slow", milliseconds(150));

    const Executor exec;
    const auto results = exec.runPhase({download("slow", "slow", "a"), download("fast", "fast", "b")}, Phase::Pre);

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].spec_id, "slow");
    EXPECT_EQ(results[1].spec_id, "fast");
    EXPECT_TRUE(allSucceeded(results));

    // fast finished first even though it is reported second
    const auto done = store->completed();
    ASSERT_EQ(done.size(), 2u);
    EXPECT_EQ(done.front(), (dir / "b").string());
}

TEST_F(ExecutorTest, PhaseRunsConcurrently) {
    std::vector<TransferSpec> specs;
    for (int i = 0; i < 4; ++i) {
        const auto key = "obj" + std::to_string(i);
        store->put("bucket/" + key, key);
        store->delay("bucket/" + key, milliseconds(250));
        specs.push_back(download(key, key, key));
    }

    const Executor exec;
    const auto start = steady_clock::now();
    const auto results = exec.runPhase(specs, Phase::Pre);
    const auto elapsed = steady_clock::now() - start;

    EXPECT_TRUE(allSucceeded(results));
    EXPECT_GT(store->maxActive(), 1);
    EXPECT_LT(elapsed, milliseconds(900));
}

TEST_F(ExecutorTest, MaxConcurrencyBoundsWorkers) {
    std::vector<TransferSpec> specs;
    for (int i = 0; i < 3; ++i) {
        const auto key = "k" + std::to_string(i);
        store->put("bucket/" + key, key);
        store->delay("bucket/" + key, milliseconds(40));
        specs.push_back(download(key, key, key));
    }

    ExecutorOptions opts;
    opts.max_concurrency = 1;
    const auto results = Executor(opts).runPhase(specs, Phase::Pre);

    EXPECT_TRUE(allSucceeded(results));
    EXPECT_EQ(store->maxActive(), 1);
}

TEST_F(ExecutorTest, OnlyRequestedPhaseRuns) {
    store->put("bucket/in", "in");
    pt::util::writeFile(dir / "out", "out");

    const std::vector specs{download("d", "in", "in"), upload("u", "out", "out")};
    const Executor exec;

    const auto pre = exec.runPhase(specs, Phase::Pre);
    ASSERT_EQ(pre.size(), 1u);
    EXPECT_EQ(pre[0].spec_id, "d");
    EXPECT_FALSE(store->object("bucket/out").has_value());

    const auto post = exec.runPhase(specs, Phase::Post);
    ASSERT_EQ(post.size(), 1u);
    EXPECT_EQ(post[0].spec_id, "u");
    EXPECT_EQ(store->object("bucket/out").value_or(""), "out");
}

TEST_F(ExecutorTest, EmptyPhaseReturnsNoResults) {
    EXPECT_TRUE(Executor().runPhase({}, Phase::Pre).empty());
}

TEST_F(ExecutorTest, FailureDoesNotCancelSiblings) {
    store->put("bucket/ok", "ok");
    store->put("bucket/bad", "bad");
    store->failWith("bucket/bad", ErrorKind::AuthenticationFailure);
    store->delay("bucket/ok", milliseconds(100));

    const auto results = Executor().runPhase({download("bad", "bad", "bad"), download("ok", "ok", "ok")}, Phase::Pre);

    ASSERT_EQ(results.size(), 2u);
    EXPECT_FALSE(results[0].succeeded);
    EXPECT_EQ(results[0].error, ErrorKind::AuthenticationFailure);
    EXPECT_TRUE(results[1].succeeded);
    EXPECT_TRUE(std::filesystem::exists(dir / "ok"));
    EXPECT_EQ(firstFailure(results), &results[0]);
}

TEST_F(ExecutorTest, MissingObjectIsReportedAsObjectNotFound) {
    const auto results = Executor().runPhase({download("gone", "gone", "gone")}, Phase::Pre);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].error, ErrorKind::ObjectNotFound);
    EXPECT_FALSE(std::filesystem::exists(dir / "gone"));
}

TEST_F(ExecutorTest, TruncatedDownloadLeavesNoDestination) {
    store->put("bucket/big", std::string(4096, 'x'));
    store->truncate("bucket/big");

    const auto results = Executor().runPhase({download("big", "big", "big.bin")}, Phase::Pre);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].error, ErrorKind::TransportFailure);
    EXPECT_FALSE(std::filesystem::exists(dir / "big.bin"));

    // no staging leftovers either
    EXPECT_TRUE(std::filesystem::is_empty(dir.path()));
}

TEST_F(ExecutorTest, TimeoutBecomesNetworkTimeout) {
    store->put("bucket/slow", "s");
    store->delay("bucket/slow", seconds(5));

    const std::vector specs{TransferSpec("slow", Direction::ToLocal, Locator::parse("store://bucket/slow"),
                                         dir / "slow", store, TransferOptions{milliseconds(100), false})};
    const auto start = steady_clock::now();
    const auto results = Executor().runPhase(specs, Phase::Pre);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].error, ErrorKind::NetworkTimeout);
    EXPECT_LT(steady_clock::now() - start, seconds(3));
}

TEST_F(ExecutorTest, DefaultTimeoutAppliesWhenSpecHasNone) {
    store->put("bucket/slow", "s");
    store->delay("bucket/slow", seconds(5));

    ExecutorOptions opts;
    opts.default_timeout = milliseconds(100);
    const auto results = Executor(opts).runPhase({download("slow", "slow", "slow")}, Phase::Pre);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].error, ErrorKind::NetworkTimeout);
}

TEST_F(ExecutorTest, InterruptCancelsInFlightTransfers) {
    store->put("bucket/slow", "s");
    store->delay("bucket/slow", seconds(5));

    const auto flag = std::make_shared<std::atomic<bool>>(false);
    std::thread trigger([flag] {
        std::this_thread::sleep_for(milliseconds(100));
        flag->store(true);
    });

    const auto results = Executor().runPhase({download("slow", "slow", "slow")}, Phase::Pre, flag);
    trigger.join();

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].error, ErrorKind::Cancelled);
}

TEST_F(ExecutorTest, ConflictingDownloadsApplyInDeclarationOrder) {
    store->put("bucket/first", "first");
    store->put("bucket/second", "second");
    store->delay("bucket/first", milliseconds(150));

    const std::vector specs{download("one", "first", "same.txt"), download("two", "second", "same.txt")};

    const auto diags = Executor::conflicts(specs, Phase::Pre);
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].kind, ErrorKind::AuthorConflict);
    EXPECT_EQ(diags[0].destination, (dir / "same.txt").string());
    EXPECT_EQ(diags[0].spec_ids, (std::vector<std::string>{"one", "two"}));

    const auto results = Executor().runPhase(specs, Phase::Pre);
    EXPECT_TRUE(allSucceeded(results));
    EXPECT_EQ(pt::util::readFileToString(dir / "same.txt"), "second");
}

TEST_F(ExecutorTest, ConflictsAreScopedPerPhase) {
    const std::vector specs{download("d", "x", "x"), upload("u", "x", "x")};
    EXPECT_TRUE(Executor::conflicts(specs, Phase::Pre).empty());
    EXPECT_TRUE(Executor::conflicts(specs, Phase::Post).empty());

    const std::vector uploads{upload("u1", "a", "dest"), upload("u2", "b", "dest")};
    const auto diags = Executor::conflicts(uploads, Phase::Post);
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].destination, "store://bucket/dest");
    EXPECT_EQ(diags[0].phase, Phase::Post);
}

TEST_F(ExecutorTest, ErrorPolicyRejectsConflicts) {
    const std::vector specs{download("one", "a", "same"), download("two", "b", "same")};

    ExecutorOptions opts;
    opts.duplicates = pt::config::DuplicatePolicy::Error;
    try {
        (void)Executor(opts).checkConflicts(specs);
        FAIL() << "expected AuthorConflict";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::AuthorConflict);
    }

    EXPECT_EQ(Executor().checkConflicts(specs).size(), 1u);
}
