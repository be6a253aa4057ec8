#include "core/downloader/DownloadsState.hpp"
#include "support/FakeTransport.hpp"
#include "support/TestHelpers.hpp"

#include <gtest/gtest.h>

using namespace harbor::core;
using namespace harbor::core::downloader;
using harbor::test::FakeScript;
using harbor::test::FakeTransport;
using harbor::test::TempDir;
using harbor::test::waitUntil;

class DownloadsStateTest : public ::testing::Test {
protected:
    void SetUp() override {
        SchedulerOptions options;
        options.maxConcurrent = 1;
        options.downloadDirectory = dir.path().string();

        auto executor = std::make_shared<TransferExecutor>(transport, fileSystem);
        scheduler = std::make_unique<DownloadScheduler>(executor, fileSystem, nullptr, options);
        state = std::make_unique<DownloadsState>(*scheduler);
    }

    DownloadRequest request(const std::string& id, const std::string& body,
                            bool hold = false, const std::string& group = "") {
        DownloadRequest r;
        r.id = id;
        r.sourceUrl = "https://media.example/" + id;
        r.groupKey = group;

        FakeScript script;
        script.body = body;
        script.hold = hold;
        transport->script(r.sourceUrl, script);
        return r;
    }

    bool waitCompleted(const std::string& id) {
        return waitUntil([&] {
            auto item = state->byId(id);
            return item && item->status == DownloadStatus::Completed;
        });
    }

    TempDir dir;
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    std::shared_ptr<LocalFileSystem> fileSystem = std::make_shared<LocalFileSystem>();
    std::unique_ptr<DownloadScheduler> scheduler;
    std::unique_ptr<DownloadsState> state;
};

TEST_F(DownloadsStateTest, EmptyState) {
    EXPECT_TRUE(state->all().empty());
    EXPECT_FALSE(state->isBusy());
    EXPECT_EQ(state->totalBytesUsed(), 0u);
    EXPECT_FALSE(state->byId("x").has_value());
}

TEST_F(DownloadsStateTest, ViewsFollowScheduler) {
    ASSERT_TRUE(state->startDownload(request("a", "aaaa", true, "show")));
    ASSERT_TRUE(state->startDownload(request("b", "bbbb", true, "show")));
    ASSERT_TRUE(state->startDownload(request("c", "cccc", true, "other")));

    ASSERT_EQ(state->active().size(), 1u);
    EXPECT_EQ(state->active()[0].id, "a");
    ASSERT_EQ(state->queued().size(), 2u);
    EXPECT_EQ(state->queued()[0].id, "b");
    EXPECT_EQ(state->current().size(), 3u);
    EXPECT_TRUE(state->isBusy());

    auto show = state->byGroup("show");
    ASSERT_EQ(show.size(), 2u);
    EXPECT_EQ(show[1].id, "b");

    // Paused items hold a slot but are not "active"
    ASSERT_TRUE(transport->waitStarted("https://media.example/a"));
    EXPECT_TRUE(state->pauseDownload("a"));
    EXPECT_TRUE(state->active().empty());
    EXPECT_FALSE(state->isBusy());
    EXPECT_EQ(state->current().size(), 3u);
    EXPECT_TRUE(state->resumeDownload("a"));
}

TEST_F(DownloadsStateTest, TotalBytesUsedCountsCompletedOnly) {
    ASSERT_TRUE(state->startDownload(request("a", std::string(100, 'x'))));
    ASSERT_TRUE(waitCompleted("a"));
    ASSERT_TRUE(state->startDownload(request("b", std::string(50, 'y'))));
    ASSERT_TRUE(waitCompleted("b"));

    FakeScript failing;
    failing.fail = true;
    auto bad = request("bad", "zzzz");
    transport->script(bad.sourceUrl, failing);
    ASSERT_TRUE(state->startDownload(bad));
    ASSERT_TRUE(scheduler->waitForIdle(std::chrono::seconds(5)));

    EXPECT_EQ(state->totalBytesUsed(), 150u);

    EXPECT_TRUE(state->removeDownload("a"));
    EXPECT_EQ(state->totalBytesUsed(), 50u);

    EXPECT_TRUE(state->removeDownload("bad"));
    EXPECT_EQ(state->totalBytesUsed(), 50u);
}

TEST_F(DownloadsStateTest, RejectedControlCallsReturnFalse) {
    ASSERT_TRUE(state->startDownload(request("a", "aaaa", true)));

    EXPECT_FALSE(state->startDownload(request("a", "aaaa", true)).has_value());
    EXPECT_FALSE(state->removeDownload("a"));
    EXPECT_FALSE(state->resumeDownload("a"));
    EXPECT_FALSE(state->pauseDownload("missing"));
    EXPECT_FALSE(state->cancelDownload("missing"));

    EXPECT_TRUE(state->cancelDownload("a"));
    EXPECT_TRUE(state->all().empty());
}

TEST_F(DownloadsStateTest, ClearAndValidate) {
    ASSERT_TRUE(state->startDownload(request("a", "aaaa")));
    ASSERT_TRUE(waitCompleted("a"));
    ASSERT_TRUE(state->startDownload(request("b", "bbbb")));
    ASSERT_TRUE(waitCompleted("b"));

    std::filesystem::remove(state->byId("a")->destinationPath);
    EXPECT_EQ(state->validateAndCleanupDownloads(), 1u);
    EXPECT_EQ(state->all().size(), 1u);

    EXPECT_TRUE(state->clearAllDownloads());
    EXPECT_TRUE(state->all().empty());
}

TEST_F(DownloadsStateTest, PermissionsWithoutGateAreGranted) {
    EXPECT_TRUE(state->requestDownloadPermissions());

    scheduler->sideEffects().setPermissionGate(std::make_shared<StaticPermissionGate>(false));
    EXPECT_FALSE(state->requestDownloadPermissions());
}
