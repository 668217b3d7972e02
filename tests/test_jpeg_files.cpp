// =============================================================================
// Unit tests for jpeg_files.hpp
// Tests: extension classifier, sorted discovery, recursion, missing folder
// =============================================================================
#include <gtest/gtest.h>
#include <algorithm>

#include "errors.hpp"
#include "jpeg_files.hpp"
#include "test_helpers.hpp"

using namespace exif_redate;

TEST(JpegPathTest, MatchesJpegExtensionsInAnyCase) {
    EXPECT_TRUE(IsJpegPath("a.jpg"));
    EXPECT_TRUE(IsJpegPath("a.JPG"));
    EXPECT_TRUE(IsJpegPath("dir/a.jpeg"));
    EXPECT_TRUE(IsJpegPath("a.JpEg"));
    EXPECT_FALSE(IsJpegPath("a.png"));
    EXPECT_FALSE(IsJpegPath("a.jpg.bak"));
    EXPECT_FALSE(IsJpegPath("jpg"));
    EXPECT_FALSE(IsJpegPath(""));
}

class FindJpegFilesTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        touch("c.jpg");
        touch("a.JPEG");
        touch("b.jpg");
        touch("notes.txt");
        touch("sub/d.jpg");
        touch("sub/deeper/e.jpeg");
        touch("sub/f.png");
        fs::create_directories(root_ / "folder.jpg");  // directory, not a file
    }
};

TEST_F(FindJpegFilesTest, NonRecursiveListsDirectChildrenSorted) {
    auto files = FindJpegFiles(root_, false);
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0], root_ / "a.JPEG");
    EXPECT_EQ(files[1], root_ / "b.jpg");
    EXPECT_EQ(files[2], root_ / "c.jpg");
}

TEST_F(FindJpegFilesTest, RecursiveDescendsIntoSubfolders) {
    auto files = FindJpegFiles(root_, true);
    ASSERT_EQ(files.size(), 5u);
    EXPECT_TRUE(std::is_sorted(files.begin(), files.end(),
                               [](const fs::path& a, const fs::path& b) {
                                   return a.string() < b.string();
                               }));
    for (const auto& f : files) {
        EXPECT_TRUE(IsJpegPath(f)) << f;
        EXPECT_TRUE(fs::is_regular_file(f)) << f;
    }
    EXPECT_NE(std::find(files.begin(), files.end(), root_ / "sub" / "deeper" / "e.jpeg"),
              files.end());
}

TEST_F(FindJpegFilesTest, EmptyFolderIsNotAnError) {
    fs::create_directories(root_ / "empty");
    EXPECT_TRUE(FindJpegFiles(root_ / "empty", true).empty());
}

TEST_F(FindJpegFilesTest, MissingFolderThrowsNotFound) {
    EXPECT_THROW(FindJpegFiles(root_ / "nope", false), NotFoundError);
    EXPECT_THROW(FindJpegFiles(root_ / "b.jpg", false), NotFoundError);
}

TEST_F(FindJpegFilesTest, UnreadableSubfolderIsSkipped) {
    touch("locked/hidden.jpg");
    const fs::path locked = root_ / "locked";
    fs::permissions(locked, fs::perms::none);

    std::error_code ec;
    fs::directory_iterator can_open(locked, ec);
    if (!ec) {
        fs::permissions(locked, fs::perms::owner_all);
        GTEST_SKIP() << "permissions are not enforced for this user";
    }

    std::vector<fs::path> files;
    EXPECT_NO_THROW(files = FindJpegFiles(root_, true));
    fs::permissions(locked, fs::perms::owner_all);

    EXPECT_EQ(files.size(), 5u);
    EXPECT_EQ(std::find(files.begin(), files.end(), locked / "hidden.jpg"), files.end());
    EXPECT_NE(std::find(files.begin(), files.end(), root_ / "b.jpg"), files.end());
}
