#include "TempTree.hpp"
#include "sync/Initial.hpp"
#include "sync/model/Report.hpp"

#include <map>

using namespace ms::sync;
using namespace ms::sync::model;
using ms::fs::model::Path;

class InitialTest : public ms::test::TempTree {
protected:
    std::shared_ptr<Report> report = std::make_shared<Report>();

    Initial engine() { return Initial(Path(src, dst), report); }

    void run() {
        auto initial = engine();
        initial.run();
    }

    // relative path -> "d" for directories, file content otherwise
    static std::map<std::string, std::string> snapshot(const fs::path& root) {
        std::map<std::string, std::string> out;
        for (const auto& e : fs::recursive_directory_iterator(root)) {
            const auto rel = e.path().lexically_relative(root).string();
            out[rel] = e.is_directory() ? "d" : read(e.path());
        }
        return out;
    }
};

TEST_F(InitialTest, MirrorsIntoEmptyDestination) {
    write(src / "a.txt", "1");
    write(src / "sub" / "b.txt", "2");

    run();

    EXPECT_EQ(read(dst / "a.txt"), "1");
    EXPECT_EQ(read(dst / "sub" / "b.txt"), "2");
    EXPECT_TRUE(sameTimes(src / "a.txt", dst / "a.txt"));
    EXPECT_TRUE(sameTimes(src / "sub" / "b.txt", dst / "sub" / "b.txt"));
    EXPECT_EQ(report->copied(), 2u);
}

TEST_F(InitialTest, Completeness) {
    write(src / "a.txt", "1");
    write(src / "x" / "y" / "z.txt", "deep");
    fs::create_directories(src / "empty" / "nested");
    write(dst / "old" / "junk.txt", "junk");

    run();

    EXPECT_EQ(snapshot(src), snapshot(dst));
}

TEST_F(InitialTest, DeletesStaleFile) {
    write(src / "a.txt", "1");
    write(dst / "stale.txt", "gone");

    run();

    EXPECT_FALSE(fs::exists(dst / "stale.txt"));
    EXPECT_TRUE(fs::exists(dst / "a.txt"));
    EXPECT_EQ(report->deleted(), 1u);
}

TEST_F(InitialTest, DeletesStaleDirectoryRecursively) {
    write(dst / "gone" / "deep" / "f.txt", "x");
    write(src / "kept" / "k.txt", "k");
    write(dst / "kept" / "stale.txt", "s");

    run();

    EXPECT_FALSE(fs::exists(dst / "gone"));
    EXPECT_FALSE(fs::exists(dst / "kept" / "stale.txt"));
    EXPECT_EQ(read(dst / "kept" / "k.txt"), "k");
}

TEST_F(InitialTest, CleanupBeforeCopy) {
    write(dst / "X", "stale");
    write(src / "Y", "new");

    std::vector<Outcome> seen;
    report->setObserver([&](const Outcome& o) { seen.push_back(o); });

    run();

    EXPECT_FALSE(fs::exists(dst / "X"));
    EXPECT_EQ(read(dst / "Y"), "new");
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].status, Outcome::Status::DELETED);
    EXPECT_EQ(seen[1].status, Outcome::Status::COPIED);
}

TEST_F(InitialTest, Idempotent) {
    write(src / "a.txt", "1");
    write(src / "sub" / "b.txt", "2");
    run();

    const auto contentBefore = snapshot(dst);
    const auto a = statOf(dst / "a.txt"), b = statOf(dst / "sub" / "b.txt");

    report->reset();
    run();

    EXPECT_EQ(snapshot(dst), contentBefore);
    const auto a2 = statOf(dst / "a.txt"), b2 = statOf(dst / "sub" / "b.txt");
    EXPECT_EQ(a.st_mtim.tv_sec, a2.st_mtim.tv_sec);
    EXPECT_EQ(a.st_mtim.tv_nsec, a2.st_mtim.tv_nsec);
    EXPECT_EQ(b.st_mtim.tv_sec, b2.st_mtim.tv_sec);
    EXPECT_EQ(b.st_mtim.tv_nsec, b2.st_mtim.tv_nsec);
    EXPECT_EQ(a.st_ctim.tv_nsec, a2.st_ctim.tv_nsec);
    EXPECT_EQ(report->copied(), 0u);
    EXPECT_EQ(report->deleted(), 0u);
    EXPECT_EQ(report->skipped(), 2u);
}

TEST_F(InitialTest, UpdatesChangedFile) {
    write(src / "a.txt", "v2");
    write(dst / "a.txt", "v1");
    setMtime(dst / "a.txt", 1'000'000'000);

    run();

    EXPECT_EQ(read(dst / "a.txt"), "v2");
    EXPECT_TRUE(sameTimes(src / "a.txt", dst / "a.txt"));
}

TEST_F(InitialTest, IgnoresSymlinksInSource) {
    write(src / "a.txt", "1");
    fs::create_symlink(src / "a.txt", src / "link");

    run();

    EXPECT_TRUE(fs::exists(dst / "a.txt"));
    EXPECT_FALSE(fs::exists(fs::symlink_status(dst / "link")));
}

TEST_F(InitialTest, LeavesNonRegularDestinationEntries) {
    write(src / "a.txt", "1");
    fs::create_symlink("/nonexistent-target", dst / "dangling");

    run();

    EXPECT_TRUE(fs::is_symlink(fs::symlink_status(dst / "dangling")));
}

// A destination file whose name is now a source directory is kept. Only the
// destination entry's type is looked at during cleanup, so the copy pass then
// fails to create the directory over the file.
TEST_F(InitialTest, TypeMismatch_FileShadowingSourceDirectoryIsRetained) {
    write(src / "thing" / "inner.txt", "i");
    write(dst / "thing", "stale file");

    auto initial = engine();
    initial.cleanup(dst);

    EXPECT_TRUE(fs::is_regular_file(dst / "thing"));
    EXPECT_EQ(read(dst / "thing"), "stale file");
    EXPECT_EQ(report->deleted(), 0u);
}

TEST_F(InitialTest, TypeMismatch_CopyOverRetainedFileFails) {
    write(src / "thing" / "inner.txt", "i");
    write(dst / "thing", "stale file");

    auto initial = engine();
    EXPECT_THROW(initial.run(), std::filesystem::filesystem_error);
    EXPECT_TRUE(fs::is_regular_file(dst / "thing"));
}

// The opposite shape: a destination directory where the source now has a file.
// Cleanup recurses into it and prunes its contents, and the copy then fails
// because a directory occupies the file's path.
TEST_F(InitialTest, TypeMismatch_DirectoryShadowingSourceFileIsRecursedNotRemoved) {
    write(src / "thing", "now a file");
    write(dst / "thing" / "old.txt", "old");

    auto initial = engine();
    initial.cleanup(dst);

    EXPECT_TRUE(fs::is_directory(dst / "thing"));
    EXPECT_FALSE(fs::exists(dst / "thing" / "old.txt"));
}

TEST_F(InitialTest, AbortBeforeRunDoesNothing) {
    write(src / "a.txt", "1");
    write(dst / "stale.txt", "s");

    auto initial = engine();
    initial.abort();
    initial.run();

    EXPECT_TRUE(initial.isAborted());
    EXPECT_FALSE(fs::exists(dst / "a.txt"));
    EXPECT_TRUE(fs::exists(dst / "stale.txt"));
}

TEST_F(InitialTest, SharedFlagStopsCopyBetweenTopLevelEntries) {
    write(dst / "stale.txt", "s");
    write(src / "a.txt", "1");
    write(src / "b.txt", "2");

    auto flag = std::make_shared<std::atomic<bool>>(false);
    Initial initial(Path(src, dst), report, flag);

    // The first deletion flips the flag: cleanup still finishes, copy never starts
    report->setObserver([&](const Outcome& o) {
        if (o.status == Outcome::Status::DELETED) flag->store(true);
    });
    initial.run();

    EXPECT_FALSE(fs::exists(dst / "stale.txt"));
    EXPECT_FALSE(fs::exists(dst / "a.txt"));
    EXPECT_FALSE(fs::exists(dst / "b.txt"));
}

TEST_F(InitialTest, AbortDoesNotInterruptRunningDirectoryCopy) {
    write(src / "dir" / "1.txt", "1");
    write(src / "dir" / "2.txt", "2");
    write(src / "dir" / "3.txt", "3");

    auto flag = std::make_shared<std::atomic<bool>>(false);
    Initial initial(Path(src, dst), report, flag);
    report->setObserver([&](const Outcome&) { flag->store(true); });
    initial.run();

    EXPECT_EQ(report->copied(), 3u);
    EXPECT_TRUE(fs::exists(dst / "dir" / "3.txt"));
}
