#include <gtest/gtest.h>

#include "crypto/sha256.hpp"
#include "testing.hpp"
#include "transfer/transfer_engine.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace driverfetch {
namespace {

namespace fs = std::filesystem;

class RecordingProgress final : public IProgress {
  public:
    void OnProgress(const ProgressEvent& e) override { events.push_back(e); }
    std::vector<ProgressEvent> events;
};

class TransferEngineTest : public ::testing::Test {
  protected:
    DownloadTask Task(const std::string& url, const std::string& subdir) const {
        return DownloadTask{.entry = FileEntry{.url = url}, .dest_dir = tmp.Join(subdir), .owner_title = "t"};
    }

    TransferEngine::Options Opt(std::size_t workers = 4) const {
        TransferEngine::Options opt;
        opt.concurrency = workers;
        opt.cancel_check = [] { return false; };
        return opt;
    }

    testutil::TemporaryDirectory tmp;
    std::shared_ptr<testutil::FakeHttpClient> http = std::make_shared<testutil::FakeHttpClient>();
    TransferEngine engine{http};
};

TEST_F(TransferEngineTest, DownloadsToUrlDerivedName) {
    http->SetJson("https://host/path/bios_1.2.exe?sig=abc", "firmware");

    std::vector<TransferOutcome> out;
    ASSERT_TRUE(engine.Run({Task("https://host/path/bios_1.2.exe?sig=abc", "BIOS")}, Opt(), out).is_ok());

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].status, TransferStatus::Completed);
    EXPECT_EQ(out[0].path, tmp.Join("BIOS/bios_1.2.exe"));
    EXPECT_EQ(testutil::ReadFile(tmp.Join("BIOS/bios_1.2.exe")), "firmware");
    EXPECT_EQ(testutil::ListFiles(tmp.Path()), (std::vector<std::string>{"BIOS/bios_1.2.exe"}));
}

TEST_F(TransferEngineTest, SecondRunSkipsWithoutNetwork) {
    std::vector<DownloadTask> tasks;
    for (int i = 0; i < 6; ++i) {
        const std::string url = "https://host/f" + std::to_string(i) + ".bin";
        http->SetJson(url, std::string(20000, static_cast<char>('a' + i)));
        tasks.push_back(Task(url, i % 2 ? "A" : "B"));
    }

    std::vector<TransferOutcome> first;
    ASSERT_TRUE(engine.Run(tasks, Opt(3), first).is_ok());
    EXPECT_EQ(TransferEngine::Summarize(first, tmp.Path()).completed, 6u);
    const int calls_after_first = http->TotalCalls();

    std::vector<TransferOutcome> second;
    ASSERT_TRUE(engine.Run(tasks, Opt(3), second).is_ok());
    EXPECT_EQ(http->TotalCalls(), calls_after_first);
    for (const auto& o : second) EXPECT_EQ(o.status, TransferStatus::Skipped);

    const auto s = TransferEngine::Summarize(second, tmp.Path());
    EXPECT_EQ(s.skipped, 6u);
    EXPECT_EQ(s.completed, 0u);
    EXPECT_EQ(s.failed, 0u);
}

TEST_F(TransferEngineTest, FailedTasksLeaveNoPartialFiles) {
    http->SetJson("https://host/good.bin", "ok");
    http->Set("https://host/missing.bin", {.status = 404, .body = "nope"});
    http->Set("https://host/dropped.bin", {.status = 200, .body = std::string(50000, 'x'), .fail_after = 10000});
    http->Set("https://host/refused.bin", {.transport_error = true});

    const std::vector<DownloadTask> tasks = {
        Task("https://host/good.bin", "d"),
        Task("https://host/missing.bin", "d"),
        Task("https://host/dropped.bin", "d"),
        Task("https://host/refused.bin", "d"),
    };

    std::vector<TransferOutcome> out;
    ASSERT_TRUE(engine.Run(tasks, Opt(2), out).is_ok());
    ASSERT_EQ(out.size(), tasks.size());
    for (std::size_t i = 0; i < out.size(); ++i) EXPECT_EQ(out[i].task_index, i);

    EXPECT_EQ(out[0].status, TransferStatus::Completed);
    for (std::size_t i = 1; i < out.size(); ++i) {
        EXPECT_EQ(out[i].status, TransferStatus::Failed);
        EXPECT_FALSE(out[i].reason.empty());
    }
    EXPECT_EQ(testutil::ListFiles(tmp.Join("d")), (std::vector<std::string>{"good.bin"}));
}

TEST_F(TransferEngineTest, ZeroWorkersIsConfigurationError) {
    std::vector<TransferOutcome> out;
    auto r = engine.Run({Task("https://host/a.bin", "d")}, Opt(0), out);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.err, kErrInvalidConfig);
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(http->TotalCalls(), 0);
    EXPECT_FALSE(testutil::Exists(tmp.Join("d")));
}

TEST_F(TransferEngineTest, UncreatableDirectoryFailsItsTasksOnly) {
    testutil::WriteFile(tmp.Join("blocker"), "file, not a dir");
    http->SetJson("https://host/a.bin", "a");
    http->SetJson("https://host/b.bin", "b");

    std::vector<TransferOutcome> out;
    ASSERT_TRUE(engine.Run({Task("https://host/a.bin", "blocker/sub"), Task("https://host/b.bin", "ok")}, Opt(), out)
                    .is_ok());
    EXPECT_EQ(out[0].status, TransferStatus::Failed);
    EXPECT_EQ(out[1].status, TransferStatus::Completed);
    EXPECT_EQ(http->Calls("https://host/a.bin"), 0);
}

TEST_F(TransferEngineTest, DigestMismatchFailsWhenVerifying) {
    const std::string body = "abc";
    http->SetJson("https://host/good.bin", body);
    http->SetJson("https://host/bad.bin", body);

    auto good = Task("https://host/good.bin", "d");
    good.entry.sha256 = "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD";
    auto bad = Task("https://host/bad.bin", "d");
    bad.entry.sha256 = std::string(64, '0');

    auto opt = Opt();
    opt.verify_digest = true;

    std::vector<TransferOutcome> out;
    ASSERT_TRUE(engine.Run({good, bad}, opt, out).is_ok());
    EXPECT_EQ(out[0].status, TransferStatus::Completed);
    EXPECT_EQ(out[1].status, TransferStatus::Failed);
    EXPECT_NE(out[1].reason.find("sha256 mismatch"), std::string::npos);
    EXPECT_EQ(testutil::ListFiles(tmp.Join("d")), (std::vector<std::string>{"good.bin"}));
}

TEST_F(TransferEngineTest, CancelMarksUnstartedTasksFailed) {
    std::vector<DownloadTask> tasks;
    for (int i = 0; i < 4; ++i) {
        const std::string url = "https://host/c" + std::to_string(i) + ".bin";
        http->SetJson(url, "data");
        tasks.push_back(Task(url, "d"));
    }

    std::atomic_int checks{0};
    auto opt = Opt(1);
    // The first task runs to completion; everything after sees the cancel.
    opt.cancel_check = [&] { return checks.fetch_add(1) >= 4; };

    std::vector<TransferOutcome> out;
    auto r = engine.Run(tasks, opt, out);
    EXPECT_EQ(r.err, kErrCancelled);
    ASSERT_EQ(out.size(), 4u);
    EXPECT_EQ(out[0].status, TransferStatus::Completed);
    for (std::size_t i = 1; i < out.size(); ++i) {
        EXPECT_EQ(out[i].status, TransferStatus::Failed);
        EXPECT_EQ(out[i].reason, "cancelled");
    }
    EXPECT_EQ(testutil::ListFiles(tmp.Join("d")), (std::vector<std::string>{"c0.bin"}));
}

TEST_F(TransferEngineTest, BulkProgressCountsTasks) {
    http->SetJson("https://host/a.bin", "a");
    http->SetJson("https://host/b.bin", "b");
    RecordingProgress progress;
    auto opt = Opt(2);
    opt.progress_sink = &progress;

    std::vector<TransferOutcome> out;
    ASSERT_TRUE(engine.Run({Task("https://host/a.bin", "d"), Task("https://host/b.bin", "d")}, opt, out).is_ok());
    ASSERT_EQ(progress.events.size(), 2u);
    EXPECT_EQ(progress.events[0].tasks_done, 1u);
    EXPECT_EQ(progress.events[1].tasks_done, 2u);
    EXPECT_EQ(progress.events[1].tasks_total, 2u);
    EXPECT_TRUE(progress.events[1].finished);
}

TEST_F(TransferEngineTest, DownloadOneReportsBytes) {
    http->SetJson("https://host/pkg.exe", std::string(20000, 'p'));
    fs::create_directories(tmp.Join("SCCM"));

    RecordingProgress progress;
    auto opt = Opt();
    opt.progress_sink = &progress;

    auto o = engine.DownloadOne(Task("https://host/pkg.exe", "SCCM"), 0, opt);
    EXPECT_EQ(o.status, TransferStatus::Completed);
    ASSERT_FALSE(progress.events.empty());
    EXPECT_EQ(progress.events.back().bytes_done, 20000u);
    EXPECT_TRUE(progress.events.back().finished);
    EXPECT_FALSE(testutil::Exists(TransferEngine::PartPath(tmp.Join("SCCM/pkg.exe"), 0)));
}

} // namespace
} // namespace driverfetch
