#include "core/downloader/SideEffects.hpp"
#include "support/TestHelpers.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace harbor::core;
using namespace harbor::core::downloader;
using harbor::test::TempDir;

namespace {

DownloadItem completedItem(const std::string& path) {
    DownloadItem item;
    item.id = "a";
    item.displayTitle = "Title";
    item.destinationPath = path;
    item.status = DownloadStatus::Completed;
    item.progress = 1.0;
    item.sizeBytes = 5;
    return item;
}

class ThrowingExporter : public GalleryExporter {
public:
    bool exportItem(const DownloadItem&) override { throw std::runtime_error("disk full"); }
};

} // namespace

TEST(SideEffectsTest, EventBusNotifierPublishesPayload) {
    EventBus bus;
    json received;
    bus.subscribe("download.completed", [&](const json& data) { received = data; });

    EventBusNotifier notifier(bus);
    notifier.notify(DownloadEvent::Completed, completedItem("/tmp/a.mp4"));

    EXPECT_EQ(received.value("id", ""), "a");
    EXPECT_EQ(received.value("status", ""), "completed");
    EXPECT_EQ(received.value("sizeBytes", 0), 5);
    EXPECT_EQ(EventBusNotifier::topic(DownloadEvent::Cancelled), "download.cancelled");
}

TEST(SideEffectsTest, ThrowingSubscriberIsContained) {
    EventBus bus;
    int calls = 0;
    bus.subscribe("download.started", [](const json&) { throw std::runtime_error("bad"); });
    auto second = bus.subscribe("download.started", [&](const json&) { ++calls; });

    DownloadSideEffects effects;
    effects.setNotifier(std::make_shared<EventBusNotifier>(bus));
    EXPECT_NO_THROW(effects.notify(DownloadEvent::Started, completedItem("x")));
    EXPECT_EQ(calls, 1);

    bus.unsubscribe(second);
    effects.notify(DownloadEvent::Started, completedItem("x"));
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(bus.getSubscriberCount("download.started"), 1u);
}

TEST(SideEffectsTest, ExportRequiresPermission) {
    TempDir dir;
    auto source = dir.file("a.mp4");
    harbor::test::writeFile(source, "video");
    auto galleryDir = (dir.path() / "gallery").string();

    auto fileSystem = std::make_shared<LocalFileSystem>();
    DownloadSideEffects effects;

    // No exporter installed
    EXPECT_FALSE(effects.exportToGallery(completedItem(source)));

    effects.setGalleryExporter(std::make_shared<DirectoryGalleryExporter>(fileSystem, galleryDir));
    effects.setPermissionGate(std::make_shared<StaticPermissionGate>(false));
    EXPECT_FALSE(effects.exportToGallery(completedItem(source)));
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "gallery" / "a.mp4"));

    effects.setPermissionGate(std::make_shared<StaticPermissionGate>(true));
    EXPECT_TRUE(effects.exportToGallery(completedItem(source)));
    EXPECT_EQ(harbor::test::readFile((dir.path() / "gallery" / "a.mp4").string()), "video");
}

TEST(SideEffectsTest, ExporterFailureIsContained) {
    DownloadSideEffects effects;
    effects.setGalleryExporter(std::make_shared<ThrowingExporter>());

    EXPECT_NO_THROW({
        EXPECT_FALSE(effects.exportToGallery(completedItem("/nowhere/a.mp4")));
    });
}

TEST(SideEffectsTest, GalleryExporterFailsForMissingSource) {
    TempDir dir;
    DirectoryGalleryExporter exporter(std::make_shared<LocalFileSystem>(), dir.file("gallery"));

    EXPECT_FALSE(exporter.exportItem(completedItem(dir.file("missing.mp4"))));
}
