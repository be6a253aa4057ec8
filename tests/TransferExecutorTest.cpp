#include "core/downloader/TransferExecutor.hpp"
#include "support/FakeTransport.hpp"
#include "support/TestHelpers.hpp"

#include <gtest/gtest.h>

#include <mutex>
#include <thread>
#include <vector>

using namespace harbor::core::downloader;
using harbor::test::FakeScript;
using harbor::test::FakeTransport;
using harbor::test::TempDir;

namespace {

class EventLog {
public:
    TransferEventSink sink() {
        return [this](const TransferEvent& event) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_events.push_back(event);
        };
    }

    std::vector<TransferEvent> events() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_events;
    }

    size_t terminalCount() const {
        size_t count = 0;
        for (const auto& event : events()) {
            if (event.isTerminal()) ++count;
        }
        return count;
    }

    bool hasTerminal() const { return terminalCount() > 0; }

    TransferEvent last() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_events.back();
    }

private:
    mutable std::mutex m_mutex;
    std::vector<TransferEvent> m_events;
};

const std::string kUrl = "https://media.example/video.mp4";

} // namespace

class TransferExecutorTest : public ::testing::Test {
protected:
    TransferRequest requestFor(const std::string& name) {
        return TransferRequest{name, kUrl, dir.file(name)};
    }

    TempDir dir;
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    std::shared_ptr<LocalFileSystem> fileSystem = std::make_shared<LocalFileSystem>();
    TransferExecutor executor{transport, fileSystem};
    TransferControl control;
    EventLog log;
};

TEST_F(TransferExecutorTest, WritesBodyAndReportsCompletion) {
    FakeScript script;
    script.body = "0123456789abcdefghij";
    transport->script(kUrl, script);

    auto request = requestFor("out.mp4");
    executor.run(request, control, log.sink());

    EXPECT_EQ(harbor::test::readFile(request.destinationPath), script.body);

    auto events = log.events();
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(log.terminalCount(), 1u);
    EXPECT_EQ(events.back().type, TransferEventType::Completed);
    EXPECT_EQ(events.back().bytesTotal, script.body.size());
    EXPECT_FALSE(std::filesystem::exists(request.outputPath()));

    uint64_t previous = 0;
    for (const auto& event : events) {
        if (event.type == TransferEventType::Progress) {
            EXPECT_GE(event.bytesWritten, previous);
            EXPECT_LE(event.bytesWritten, event.bytesTotal);
            previous = event.bytesWritten;
        }
    }
}

TEST_F(TransferExecutorTest, UsesProbedSizeAsTotal) {
    FakeScript script;
    script.body = "abcdefgh";
    script.size = 8;
    transport->script(kUrl, script);

    executor.run(requestFor("probe.bin"), control, log.sink());

    auto events = log.events();
    ASSERT_GE(events.size(), 2u);
    EXPECT_EQ(events.front().type, TransferEventType::Progress);
    EXPECT_EQ(events.front().bytesTotal, 8u);
}

TEST_F(TransferExecutorTest, TransportFailureDeletesOutput) {
    FakeScript script;
    script.fail = true;
    script.error = "host unreachable";
    transport->script(kUrl, script);

    auto request = requestFor("fail.bin");
    executor.run(request, control, log.sink());

    EXPECT_EQ(log.terminalCount(), 1u);
    EXPECT_EQ(log.last().type, TransferEventType::Failed);
    EXPECT_EQ(log.last().error, "host unreachable");
    EXPECT_FALSE(std::filesystem::exists(request.destinationPath));
}

TEST_F(TransferExecutorTest, UnwritableDestinationFails) {
    transport->script(kUrl, FakeScript{});
    harbor::test::writeFile(dir.file("blocker"), "not a directory");

    TransferRequest request{"x", kUrl, dir.file("blocker") + "/nested/out.bin"};
    executor.run(request, control, log.sink());

    EXPECT_EQ(log.terminalCount(), 1u);
    EXPECT_EQ(log.last().type, TransferEventType::Failed);
    EXPECT_EQ(transport->fetchCount(kUrl), 0u);
}

TEST_F(TransferExecutorTest, AbortBeforeStartReportsAbortedOnly) {
    transport->script(kUrl, FakeScript{});
    control.abort();

    executor.run(requestFor("never.bin"), control, log.sink());

    ASSERT_EQ(log.events().size(), 1u);
    EXPECT_EQ(log.last().type, TransferEventType::Aborted);
    EXPECT_EQ(transport->fetchCount(kUrl), 0u);
}

TEST_F(TransferExecutorTest, AbortDuringTransferDiscardsOutput) {
    FakeScript script;
    script.hold = true;
    transport->script(kUrl, script);

    auto request = requestFor("aborted.bin");
    std::thread worker([&] { executor.run(request, control, log.sink()); });

    ASSERT_TRUE(transport->waitStarted(kUrl));
    control.abort();
    worker.join();

    EXPECT_EQ(log.terminalCount(), 1u);
    EXPECT_EQ(log.last().type, TransferEventType::Aborted);
    EXPECT_FALSE(std::filesystem::exists(request.destinationPath));
}

TEST_F(TransferExecutorTest, PauseSuspendsUntilResumed) {
    FakeScript script;
    script.hold = true;
    script.body = "paused-body";
    transport->script(kUrl, script);

    auto request = requestFor("paused.bin");
    std::thread worker([&] { executor.run(request, control, log.sink()); });

    ASSERT_TRUE(transport->waitStarted(kUrl));
    control.pause();
    transport->release(kUrl);

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(log.hasTerminal());

    control.resume();
    worker.join();

    EXPECT_EQ(log.last().type, TransferEventType::Completed);
    EXPECT_EQ(harbor::test::readFile(request.destinationPath), "paused-body");
}

TEST_F(TransferExecutorTest, AbortWhilePausedEndsTransfer) {
    FakeScript script;
    script.hold = true;
    transport->script(kUrl, script);

    std::thread worker([&] { executor.run(requestFor("p.bin"), control, log.sink()); });

    ASSERT_TRUE(transport->waitStarted(kUrl));
    control.pause();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    control.abort();
    worker.join();

    EXPECT_EQ(log.terminalCount(), 1u);
    EXPECT_EQ(log.last().type, TransferEventType::Aborted);
}

TEST_F(TransferExecutorTest, AbortedRunNeverTouchesDestination) {
    FakeScript script;
    script.hold = true;
    transport->script(kUrl, script);

    auto request = requestFor("kept.bin");
    request.partialPath = dir.file("kept.bin.part7");
    harbor::test::writeFile(request.destinationPath, "written-by-another-run");

    std::thread worker([&] { executor.run(request, control, log.sink()); });

    ASSERT_TRUE(transport->waitStarted(kUrl));
    EXPECT_TRUE(std::filesystem::exists(request.partialPath));
    control.abort();
    worker.join();

    EXPECT_EQ(log.last().type, TransferEventType::Aborted);
    EXPECT_FALSE(std::filesystem::exists(request.partialPath));
    EXPECT_EQ(harbor::test::readFile(request.destinationPath), "written-by-another-run");
    EXPECT_FALSE(control.isCommitted());
}

TEST_F(TransferExecutorTest, AbortAfterCommitIsReportedAsCommitted) {
    FakeScript script;
    script.body = "finished";
    transport->script(kUrl, script);

    auto request = requestFor("done.bin");
    executor.run(request, control, log.sink());
    control.abort();

    EXPECT_EQ(log.last().type, TransferEventType::Completed);
    EXPECT_TRUE(control.isCommitted());
    EXPECT_EQ(harbor::test::readFile(request.destinationPath), "finished");
}
