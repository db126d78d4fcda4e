#include <gtest/gtest.h>
#include "scan/model/Stats.hpp"
#include "scan/model/Progress.hpp"

#include <nlohmann/json.hpp>

using namespace ds::scan::model;

TEST(StatsTest, RecordFileUpdatesTotalsAndType) {
    Stats stats;
    stats.recordFile("txt", 100);
    stats.recordFile("txt", 50);
    stats.recordFile("png", 10);

    EXPECT_EQ(stats.totalFiles, 3u);
    EXPECT_EQ(stats.totalSize, 160u);
    ASSERT_EQ(stats.fileTypes.size(), 2u);
    EXPECT_EQ(stats.fileTypes.at("txt").count, 2u);
    EXPECT_EQ(stats.fileTypes.at("txt").size, 150u);
    EXPECT_EQ(stats.fileTypes.at("txt").description, "Text File");
    EXPECT_EQ(stats.fileTypes.at("png").description, "PNG Image");
}

TEST(StatsTest, FolderIsCreatedOnFirstSight) {
    Stats stats;
    auto& folder = stats.folder("/data/Downloads");
    EXPECT_EQ(folder.name, "Downloads");
    EXPECT_EQ(folder.path, "/data/Downloads");
    EXPECT_EQ(folder.size, 0u);

    stats.addToFolder("/data/Downloads", 42);
    stats.addToFolder("/data/Downloads", 8);
    EXPECT_EQ(stats.folders.size(), 1u);
    EXPECT_EQ(stats.folders.at("/data/Downloads").size, 50u);
}

TEST(StatsTest, ApplicationKeepsFirstPath) {
    Stats stats;
    stats.recordApplication("tool", "/opt/a/tool.exe", 10);
    stats.recordApplication("tool", "/opt/b/tool.exe", 5);

    ASSERT_EQ(stats.applications.size(), 1u);
    EXPECT_EQ(stats.applications.at("tool").path, "/opt/a/tool.exe");
    EXPECT_EQ(stats.applications.at("tool").size, 15u);
}

TEST(StatsTest, ProgressSnapshotsCounters) {
    Stats stats;
    stats.recordFile("txt", 7);
    stats.scannedCount = 250;
    stats.recordError();

    const Progress progress("scan_1", stats, "/data/a.txt");
    const nlohmann::json j = progress;

    EXPECT_EQ(j.at("taskId"), "scan_1");
    EXPECT_EQ(j.at("scannedCount"), 250);
    EXPECT_EQ(j.at("totalSize"), 7);
    EXPECT_EQ(j.at("errorCount"), 1);
    EXPECT_EQ(j.at("currentPath"), "/data/a.txt");
    EXPECT_EQ(j.at("percentage"), 2);
}

TEST(StatsTest, PercentageNeverReachesHundred) {
    EXPECT_EQ(Progress::estimatePercentage(0), 0u);
    EXPECT_EQ(Progress::estimatePercentage(9999), 99u);
    EXPECT_EQ(Progress::estimatePercentage(1'000'000), 99u);
}
