#include "core/Application.hpp"
#include "core/Config.hpp"
#include "core/downloader/DownloadScheduler.hpp"
#include "core/downloader/DownloadsState.hpp"
#include "core/downloader/PersistenceGateway.hpp"
#include "core/storage/FileStore.hpp"
#include "support/TestHelpers.hpp"

#include <gtest/gtest.h>

using namespace harbor::core;
using harbor::test::TempDir;

class ApplicationTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& config = Config::instance();
        config.setDefaults();
        config.set("storage.directory", dir.file("store"));
        config.set("downloads.directory", dir.file("downloads"));
        config.set("persistence.debounceMs", 10);
    }

    void TearDown() override { Config::instance().setDefaults(); }

    TempDir dir;
};

TEST_F(ApplicationTest, InitializeAndShutdown) {
    Application app;
    std::vector<AppState> states;
    app.onStateChange([&](AppState state) { states.push_back(state); });

    ASSERT_TRUE(app.initialize());
    EXPECT_TRUE(app.isRunning());
    EXPECT_FALSE(app.initialize());

    EXPECT_TRUE(app.getDownloads().all().empty());
    EXPECT_EQ(app.getScheduler()->options().maxConcurrent, 2u);
    EXPECT_EQ(app.getScheduler()->options().downloadDirectory, dir.file("downloads"));
    EXPECT_TRUE(std::filesystem::is_directory(dir.file("downloads")));

    app.shutdown();
    EXPECT_EQ(app.getState(), AppState::Uninitialized);
    ASSERT_GE(states.size(), 3u);
    EXPECT_EQ(states.front(), AppState::Initializing);
}

TEST_F(ApplicationTest, RestoresPersistedItemsAtStartup) {
    auto store = std::make_shared<storage::FileStore>(dir.file("store"));
    {
        downloader::DownloadItem interrupted;
        interrupted.id = "ep1";
        interrupted.sourceUrl = "https://media.example/ep1.mp4";
        interrupted.status = downloader::DownloadStatus::Downloading;
        interrupted.progress = 0.3;

        downloader::DownloadItem vanished;
        vanished.id = "ep2";
        vanished.destinationPath = dir.file("downloads/ep2.mp4");
        vanished.status = downloader::DownloadStatus::Completed;
        vanished.progress = 1.0;

        ASSERT_TRUE(store->write("downloads",
            downloader::PersistenceGateway::serialize({interrupted, vanished})));
    }

    Application app;
    ASSERT_TRUE(app.initialize());

    auto items = app.getDownloads().all();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].id, "ep1");
    EXPECT_EQ(items[0].status, downloader::DownloadStatus::Failed);
    EXPECT_EQ(items[0].failure->message, "interrupted");
}
