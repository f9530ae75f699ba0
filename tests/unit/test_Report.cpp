#include <gtest/gtest.h>
#include "sync/model/Report.hpp"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace ms::sync::model;

TEST(ReportTest, CountsPerStatus) {
    Report report;
    report.record(Outcome::copied("/a", 10));
    report.record(Outcome::copied("/b", 5));
    report.record(Outcome::skipped("/c", "unchanged"));
    report.record(Outcome::deleted("/d"));
    report.record(Outcome::error("/e", "boom"));

    EXPECT_EQ(report.copied(), 2u);
    EXPECT_EQ(report.bytesCopied(), 15u);
    EXPECT_EQ(report.skipped(), 1u);
    EXPECT_EQ(report.deleted(), 1u);
    EXPECT_EQ(report.failed(), 1u);
    EXPECT_EQ(report.total(), 5u);
}

TEST(ReportTest, HistoryIsBounded) {
    Report report(3);
    for (int i = 0; i < 5; ++i) report.record(Outcome::deleted("/" + std::to_string(i)));

    const auto history = report.history();
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history.front().path, "/2");
    EXPECT_EQ(history.back().path, "/4");
    EXPECT_EQ(report.deleted(), 5u);
}

TEST(ReportTest, ObserverSeesEveryOutcome) {
    Report report;
    std::vector<Outcome::Status> seen;
    report.setObserver([&](const Outcome& o) { seen.push_back(o.status); });

    report.record(Outcome::copied("/a", 1));
    report.record(Outcome::error("/b", "x"));

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], Outcome::Status::COPIED);
    EXPECT_EQ(seen[1], Outcome::Status::ERROR);
}

TEST(ReportTest, ConcurrentRecording) {
    Report report;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t)
        threads.emplace_back([&] {
            for (int i = 0; i < 1000; ++i) report.record(Outcome::copied("/x", 1));
        });
    for (auto& t : threads) t.join();

    EXPECT_EQ(report.copied(), 8000u);
    EXPECT_EQ(report.bytesCopied(), 8000u);
}

TEST(ReportTest, ResetClearsCounters) {
    Report report;
    report.record(Outcome::copied("/a", 1));
    report.reset();
    EXPECT_EQ(report.total(), 0u);
    EXPECT_TRUE(report.history().empty());
}

TEST(ReportTest, SummaryMentionsCounts) {
    Report report;
    report.start();
    report.record(Outcome::copied("/a", 42));
    report.record(Outcome::deleted("/b"));
    report.stop();

    const auto summary = report.summary();
    EXPECT_NE(summary.find("1 copied (42 bytes)"), std::string::npos) << summary;
    EXPECT_NE(summary.find("1 deleted"), std::string::npos) << summary;
}

TEST(ReportTest, SummaryReportsElapsedTime) {
    Report report;
    report.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    report.stop();

    const auto elapsed = report.duration_ms();
    EXPECT_GE(elapsed, 30u);
    const auto summary = report.summary();
    EXPECT_NE(summary.find("in " + std::to_string(elapsed) + "ms"), std::string::npos) << summary;
}

TEST(OutcomeTest, StatusNames) {
    EXPECT_EQ(to_string(Outcome::Status::COPIED), "copied");
    EXPECT_EQ(Outcome::deleted("/x").statusToString(), "deleted");
}
