#include "WatchPipeline.hpp"

#include "FileMover.hpp"
#include "TestSupport.hpp"

#include <sys/resource.h>
#include <sys/stat.h>

#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

// Thread-safe sink for pipeline callbacks.
class OutcomeCollector {
public:
    WatchCallback callback() {
        return [this](const WatchOutcome& outcome) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_outcomes.push_back(outcome);
        };
    }

    std::vector<WatchOutcome> snapshot() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_outcomes;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_outcomes.size();
    }

private:
    mutable std::mutex m_mutex;
    std::vector<WatchOutcome> m_outcomes;
};

class WatchPipelineTest : public TempDirTest {
protected:
    Classifier m_classifier{Classifier::defaultTable()};
    OutcomeCollector m_collector;

    WatchOptions fastOptions(std::chrono::milliseconds delay = 100ms, std::size_t workers = 2) const {
        WatchOptions options;
        options.settleDelay = delay;
        options.workerThreads = workers;
        return options;
    }
};

TEST_F(WatchPipelineTest, NewFileIsMovedAfterSettleDelay) {
    WatchPipeline pipeline(m_classifier, fastOptions());
    ASSERT_FALSE(pipeline.start(m_dir, m_collector.callback()));
    EXPECT_TRUE(pipeline.isRunning());
    EXPECT_EQ(pipeline.targetDirectory(), m_dir);

    writeFile(m_dir / "new.pdf", "contents");

    ASSERT_TRUE(waitFor([&] { return m_collector.size() >= 1; }));
    // Give any stray notification (e.g. the new category folder) a chance to show up.
    std::this_thread::sleep_for(300ms);
    pipeline.stop();

    const auto outcomes = m_collector.snapshot();
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].kind, WatchOutcomeKind::Moved);
    EXPECT_STREQ(toString(outcomes[0].kind), "moved");
    EXPECT_EQ(outcomes[0].file, m_dir / "new.pdf");
    EXPECT_EQ(outcomes[0].detail, "documents");
    EXPECT_EQ(readFile(m_dir / "documents" / "new.pdf"), "contents");
    EXPECT_FALSE(fs::exists(m_dir / "new.pdf"));
}

TEST_F(WatchPipelineTest, FileRenamedIntoFolderIsMoved) {
    const fs::path outside = m_dir.string() + "_outside";
    fs::create_directories(outside);
    writeFile(outside / "song.mp3");

    WatchPipeline pipeline(m_classifier, fastOptions());
    ASSERT_FALSE(pipeline.start(m_dir, m_collector.callback()));

    fs::rename(outside / "song.mp3", m_dir / "song.mp3");

    ASSERT_TRUE(waitFor([&] { return m_collector.size() >= 1; }));
    pipeline.stop();
    fs::remove_all(outside);

    EXPECT_EQ(m_collector.snapshot().front().detail, "audio");
    EXPECT_TRUE(fs::is_regular_file(m_dir / "audio" / "song.mp3"));
}

TEST_F(WatchPipelineTest, NewDirectoriesAreIgnored) {
    WatchPipeline pipeline(m_classifier, fastOptions());
    ASSERT_FALSE(pipeline.start(m_dir, m_collector.callback()));

    fs::create_directories(m_dir / "incoming");
    writeFile(m_dir / "incoming" / "nested.jpg");

    std::this_thread::sleep_for(400ms);
    pipeline.stop();

    EXPECT_EQ(m_collector.size(), 0u);
    EXPECT_TRUE(fs::is_regular_file(m_dir / "incoming" / "nested.jpg"));
    EXPECT_FALSE(fs::exists(m_dir / "images"));
}

TEST_F(WatchPipelineTest, EachFileGetsItsOwnOutcomeAndDelaysOverlap) {
    const std::vector<std::string> names = {"a.jpg", "b.mp4", "c.pdf", "d.mp3", "e.zip",
                                            "f.py", "g.xyz", "h.png", "i.txt", "j.wav"};
    WatchPipeline pipeline(m_classifier, fastOptions(300ms, 2));
    ASSERT_FALSE(pipeline.start(m_dir, m_collector.callback()));

    const auto begin = std::chrono::steady_clock::now();
    for (const auto& name : names) {
        writeFile(m_dir / name, name);
    }

    ASSERT_TRUE(waitFor([&] { return m_collector.size() >= names.size(); }));
    const auto elapsed = std::chrono::steady_clock::now() - begin;
    pipeline.stop();

    // Serialized settle delays would need at least names.size() * 300ms.
    EXPECT_LT(elapsed, 2000ms);

    const auto outcomes = m_collector.snapshot();
    ASSERT_EQ(outcomes.size(), names.size());
    std::set<fs::path> seen;
    for (const auto& outcome : outcomes) {
        EXPECT_EQ(outcome.kind, WatchOutcomeKind::Moved) << outcome.file << ": " << outcome.detail;
        EXPECT_EQ(outcome.detail, m_classifier.categoryForPath(outcome.file));
        EXPECT_EQ(readFile(m_dir / outcome.detail / outcome.file.filename()), outcome.file.filename().string());
        seen.insert(outcome.file);
    }
    EXPECT_EQ(seen.size(), names.size());
}

TEST_F(WatchPipelineTest, VanishedFileIsReportedAsError) {
    WatchPipeline pipeline(m_classifier, fastOptions(300ms));
    ASSERT_FALSE(pipeline.start(m_dir, m_collector.callback()));

    writeFile(m_dir / "temp.pdf");
    fs::remove(m_dir / "temp.pdf");

    ASSERT_TRUE(waitFor([&] { return m_collector.size() >= 1; }));
    pipeline.stop();

    const auto outcomes = m_collector.snapshot();
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].kind, WatchOutcomeKind::Error);
    EXPECT_STREQ(toString(outcomes[0].kind), "error");
    EXPECT_EQ(outcomes[0].file, m_dir / "temp.pdf");
    EXPECT_FALSE(fs::exists(m_dir / "documents"));
}

TEST_F(WatchPipelineTest, MoveFailureIsReportedAsError) {
    ASSERT_EQ(::mkfifo((m_dir / "images").c_str(), 0600), 0);

    WatchPipeline pipeline(m_classifier, fastOptions());
    ASSERT_FALSE(pipeline.start(m_dir, m_collector.callback()));

    writeFile(m_dir / "pic.jpg");

    ASSERT_TRUE(waitFor([&] { return m_collector.size() >= 1; }));
    pipeline.stop();

    const auto outcomes = m_collector.snapshot();
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].kind, WatchOutcomeKind::Error);
    EXPECT_EQ(outcomes[0].detail.find(std::error_code(OrganizerErrc::DirectoryCreation).message()), 0u);
    EXPECT_TRUE(fs::exists(m_dir / "pic.jpg"));
}

TEST_F(WatchPipelineTest, FilesStillSettlingAreReportedOnStop) {
    WatchPipeline pipeline(m_classifier, fastOptions(10s));
    ASSERT_FALSE(pipeline.start(m_dir, m_collector.callback()));

    writeFile(m_dir / "slow.iso");
    std::this_thread::sleep_for(300ms);

    const auto begin = std::chrono::steady_clock::now();
    pipeline.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);

    // Delivered before stop() returned.
    const auto outcomes = m_collector.snapshot();
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].kind, WatchOutcomeKind::Error);
    EXPECT_EQ(outcomes[0].file, m_dir / "slow.iso");
    EXPECT_TRUE(fs::exists(m_dir / "slow.iso"));
}

TEST_F(WatchPipelineTest, NothingIsDeliveredAfterStop) {
    WatchPipeline pipeline(m_classifier, fastOptions());
    ASSERT_FALSE(pipeline.start(m_dir, m_collector.callback()));
    pipeline.stop();
    EXPECT_FALSE(pipeline.isRunning());

    writeFile(m_dir / "late.pdf");
    std::this_thread::sleep_for(400ms);

    EXPECT_EQ(m_collector.size(), 0u);
    EXPECT_TRUE(fs::exists(m_dir / "late.pdf"));
}

TEST_F(WatchPipelineTest, StopIsIdempotentAndSafeBeforeStart) {
    WatchPipeline pipeline(m_classifier, fastOptions());
    pipeline.stop();
    EXPECT_FALSE(pipeline.isRunning());
    EXPECT_EQ(pipeline.targetDirectory(), fs::path{});

    ASSERT_FALSE(pipeline.start(m_dir, m_collector.callback()));
    pipeline.stop();
    pipeline.stop();
    EXPECT_FALSE(pipeline.isRunning());
}

TEST_F(WatchPipelineTest, StartOnMissingDirectoryFails) {
    WatchPipeline pipeline(m_classifier, fastOptions());

    EXPECT_EQ(pipeline.start(m_dir / "missing", m_collector.callback()), OrganizerErrc::DirectoryNotFound);
    EXPECT_FALSE(pipeline.isRunning());
}

TEST_F(WatchPipelineTest, WorkerSpawnFailureLeavesPipelineStopped) {
    if (runningAsRoot()) {
        GTEST_SKIP() << "process limits are not enforced for root";
    }

    rlimit saved{};
    ASSERT_EQ(::getrlimit(RLIMIT_NPROC, &saved), 0);
    rlimit exhausted = saved;
    exhausted.rlim_cur = 1;
    ASSERT_EQ(::setrlimit(RLIMIT_NPROC, &exhausted), 0);

    {
        WatchPipeline pipeline(m_classifier, fastOptions(100ms, 4));
        const std::error_code ec = pipeline.start(m_dir, m_collector.callback());
        ASSERT_EQ(::setrlimit(RLIMIT_NPROC, &saved), 0);

        EXPECT_EQ(ec, OrganizerErrc::WatchStart);
        EXPECT_FALSE(pipeline.isRunning());

        // A later start works and the pipeline still shuts down cleanly.
        ASSERT_FALSE(pipeline.start(m_dir, m_collector.callback()));
        writeFile(m_dir / "after.pdf");
        ASSERT_TRUE(waitFor([&] { return m_collector.size() >= 1; }));
    }

    EXPECT_TRUE(fs::is_regular_file(m_dir / "documents" / "after.pdf"));
}

TEST_F(WatchPipelineTest, StartingSameTargetAgainIsNoop) {
    WatchPipeline pipeline(m_classifier, fastOptions());
    ASSERT_FALSE(pipeline.start(m_dir, m_collector.callback()));
    ASSERT_FALSE(pipeline.start(m_dir / ".", [](const WatchOutcome&) {}));
    EXPECT_TRUE(pipeline.isRunning());

    // The first callback is still the one in use.
    writeFile(m_dir / "kept.txt");
    ASSERT_TRUE(waitFor([&] { return m_collector.size() >= 1; }));
    pipeline.stop();
}

TEST_F(WatchPipelineTest, StartingNewTargetRestarts) {
    const fs::path first = m_dir / "first";
    const fs::path second = m_dir / "second";
    fs::create_directories(first);
    fs::create_directories(second);

    WatchPipeline pipeline(m_classifier, fastOptions());
    ASSERT_FALSE(pipeline.start(first, m_collector.callback()));
    ASSERT_FALSE(pipeline.start(second, m_collector.callback()));
    EXPECT_EQ(pipeline.targetDirectory(), second);

    writeFile(first / "ignored.pdf");
    writeFile(second / "watched.pdf");

    ASSERT_TRUE(waitFor([&] { return m_collector.size() >= 1; }));
    std::this_thread::sleep_for(300ms);
    pipeline.stop();

    const auto outcomes = m_collector.snapshot();
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].file, second / "watched.pdf");
    EXPECT_TRUE(fs::exists(first / "ignored.pdf"));
    EXPECT_TRUE(fs::exists(second / "documents" / "watched.pdf"));
}

// The watch and a manual move racing for the same destination name must both keep their file.
TEST_F(WatchPipelineTest, CollidingArrivalsAreAllPersisted) {
    constexpr int kRounds = 10;
    const fs::path staging = m_dir.string() + "_staging";

    WatchPipeline pipeline(m_classifier, fastOptions(0ms, 4));
    ASSERT_FALSE(pipeline.start(m_dir, m_collector.callback()));

    for (int i = 0; i < kRounds; ++i) {
        const fs::path stagedDir = staging / std::to_string(i);
        fs::create_directories(stagedDir);
        writeFile(stagedDir / "report.pdf", "manual " + std::to_string(i));

        std::thread manual([&] { EXPECT_TRUE(FileMover().move(stagedDir / "report.pdf", m_dir / "documents").succeeded()); });
        writeFile(m_dir / "report.pdf", "watched " + std::to_string(i));
        manual.join();

        // The next arrival may only appear once the previous one left the root.
        ASSERT_TRUE(waitFor([&] { return m_collector.size() >= static_cast<std::size_t>(i + 1); }));
    }
    pipeline.stop();
    fs::remove_all(staging);

    std::set<std::string> contents;
    for (const auto& entry : fs::directory_iterator(m_dir / "documents")) {
        contents.insert(readFile(entry.path()));
    }
    EXPECT_EQ(contents.size(), static_cast<std::size_t>(2 * kRounds));
    for (const auto& outcome : m_collector.snapshot()) {
        EXPECT_EQ(outcome.kind, WatchOutcomeKind::Moved) << outcome.detail;
    }
}

} // namespace
