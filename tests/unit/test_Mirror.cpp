#include "TempTree.hpp"
#include "fs/Mirror.hpp"
#include "sync/model/Report.hpp"

using namespace ms::fs;
using namespace ms::sync::model;

class MirrorTest : public ms::test::TempTree {
protected:
    std::shared_ptr<Report> report = std::make_shared<Report>();
    Mirror mirror{report};
};

TEST_F(MirrorTest, CopyFile_CreatesParentsAndStampsTimes) {
    write(src / "a.txt", "1");
    setMtime(src / "a.txt", 1'600'000'000, 123'456'789);

    const auto outcome = mirror.copyFile(src / "a.txt", dst / "deep" / "er" / "a.txt");

    EXPECT_EQ(outcome.status, Outcome::Status::COPIED);
    EXPECT_EQ(outcome.size_bytes, 1u);
    EXPECT_EQ(read(dst / "deep" / "er" / "a.txt"), "1");
    EXPECT_TRUE(sameTimes(src / "a.txt", dst / "deep" / "er" / "a.txt"));

    const auto s = statOf(src / "a.txt"), d = statOf(dst / "deep" / "er" / "a.txt");
    EXPECT_EQ(s.st_atim.tv_sec, d.st_atim.tv_sec);
    EXPECT_EQ(report->copied(), 1u);
}

TEST_F(MirrorTest, CopyFile_SkipsWhenTimesMatch) {
    write(src / "a.txt", "new content");
    write(dst / "a.txt", "old");
    setMtime(src / "a.txt", 1'600'000'000);
    setMtime(dst / "a.txt", 1'600'000'000);

    const auto outcome = mirror.copyFile(src / "a.txt", dst / "a.txt");

    // Only timestamps are compared, so the stale content is left untouched
    EXPECT_EQ(outcome.status, Outcome::Status::SKIPPED);
    EXPECT_EQ(outcome.reason, "unchanged");
    EXPECT_EQ(read(dst / "a.txt"), "old");
    EXPECT_EQ(report->skipped(), 1u);
    EXPECT_EQ(report->copied(), 0u);
}

TEST_F(MirrorTest, CopyFile_SubMillisecondDifferenceIsUnchanged) {
    write(src / "a.txt", "x");
    write(dst / "a.txt", "y");
    setMtime(src / "a.txt", 1'600'000'000, 100'000);
    setMtime(dst / "a.txt", 1'600'000'000, 300'000);

    EXPECT_EQ(mirror.copyFile(src / "a.txt", dst / "a.txt").status, Outcome::Status::SKIPPED);
    EXPECT_EQ(read(dst / "a.txt"), "y");
}

TEST_F(MirrorTest, CopyFile_OverwritesWhenTimesDiffer) {
    write(src / "a.txt", "fresh");
    write(dst / "a.txt", "stale and longer");
    setMtime(src / "a.txt", 1'700'000'000);
    setMtime(dst / "a.txt", 1'600'000'000);

    const auto outcome = mirror.copyFile(src / "a.txt", dst / "a.txt");

    EXPECT_EQ(outcome.status, Outcome::Status::COPIED);
    EXPECT_EQ(read(dst / "a.txt"), "fresh");
    EXPECT_TRUE(sameTimes(src / "a.txt", dst / "a.txt"));
}

TEST_F(MirrorTest, CopyFile_SecondCopyIsNoOp) {
    write(src / "a.txt", "1");
    ASSERT_EQ(mirror.copyFile(src / "a.txt", dst / "a.txt").status, Outcome::Status::COPIED);
    const auto before = statOf(dst / "a.txt");

    EXPECT_EQ(mirror.copyFile(src / "a.txt", dst / "a.txt").status, Outcome::Status::SKIPPED);

    const auto after = statOf(dst / "a.txt");
    EXPECT_EQ(before.st_ino, after.st_ino);
    EXPECT_EQ(before.st_ctim.tv_sec, after.st_ctim.tv_sec);
    EXPECT_EQ(before.st_ctim.tv_nsec, after.st_ctim.tv_nsec);
}

TEST_F(MirrorTest, CopyFile_MissingSourceThrows) {
    EXPECT_THROW(mirror.copyFile(src / "missing.txt", dst / "missing.txt"), std::filesystem::filesystem_error);
}

TEST_F(MirrorTest, CopyDirectory_MirrorsTree) {
    write(src / "sub" / "b.txt", "2");
    write(src / "sub" / "nested" / "c.txt", "33");
    fs::create_directories(src / "sub" / "empty");

    const auto outcome = mirror.copyDirectory(src / "sub", dst / "sub");

    EXPECT_EQ(outcome.status, Outcome::Status::COPIED);
    EXPECT_EQ(outcome.size_bytes, 3u);
    EXPECT_EQ(read(dst / "sub" / "b.txt"), "2");
    EXPECT_EQ(read(dst / "sub" / "nested" / "c.txt"), "33");
    EXPECT_TRUE(fs::is_directory(dst / "sub" / "empty"));
    EXPECT_EQ(report->copied(), 2u);
}

TEST_F(MirrorTest, CopyDirectory_IgnoresSymlinks) {
    write(src / "sub" / "b.txt", "2");
    fs::create_symlink(src / "sub" / "b.txt", src / "sub" / "link");

    mirror.copyDirectory(src / "sub", dst / "sub");

    EXPECT_TRUE(fs::exists(dst / "sub" / "b.txt"));
    EXPECT_FALSE(fs::exists(fs::symlink_status(dst / "sub" / "link")));
}

TEST_F(MirrorTest, CopyDirectory_UnchangedTreeIsSkipped) {
    write(src / "sub" / "b.txt", "2");
    mirror.copyDirectory(src / "sub", dst / "sub");

    const auto outcome = mirror.copyDirectory(src / "sub", dst / "sub");
    EXPECT_EQ(outcome.status, Outcome::Status::SKIPPED);
}

TEST_F(MirrorTest, RemoveFileAndDirectory) {
    write(dst / "a.txt", "1");
    write(dst / "sub" / "deep" / "b.txt", "2");

    EXPECT_EQ(mirror.removeFile(dst / "a.txt").status, Outcome::Status::DELETED);
    EXPECT_EQ(mirror.removeDirectory(dst / "sub").status, Outcome::Status::DELETED);

    EXPECT_FALSE(fs::exists(dst / "a.txt"));
    EXPECT_FALSE(fs::exists(dst / "sub"));
    EXPECT_EQ(report->deleted(), 2u);
}

TEST_F(MirrorTest, EnsureDir_LeavesExistingEntriesAlone) {
    write(dst / "occupied", "file");
    EXPECT_NO_THROW(Mirror::ensureDir(dst / "occupied"));
    EXPECT_TRUE(fs::is_regular_file(dst / "occupied"));

    Mirror::ensureDir(dst / "x" / "y");
    EXPECT_TRUE(fs::is_directory(dst / "x" / "y"));
}

TEST_F(MirrorTest, WorksWithoutReport) {
    Mirror bare;
    write(src / "a.txt", "1");
    EXPECT_EQ(bare.copyFile(src / "a.txt", dst / "a.txt").status, Outcome::Status::COPIED);
    EXPECT_EQ(bare.report(), nullptr);
}
