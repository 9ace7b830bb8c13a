/**
 * @file test_ls_dir_rec.cc
 * @brief Unit tests for recursive listing and media filtering
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <regex>
#include <string>
#include <vector>

#include "picsort/ls_dir_rec.hh"

namespace fs = std::filesystem;

class ListFilesTest : public ::testing::Test {
 protected:
  fs::path test_dir;

  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    test_dir =
        fs::temp_directory_path() / (std::string("picsort_ls_") + info->name());
    fs::remove_all(test_dir);
    fs::create_directories(test_dir);
  }

  void TearDown() override { fs::remove_all(test_dir); }

  void createFile(const std::string& name, const std::string& content = "x") {
    auto path = test_dir / name;
    fs::create_directories(path.parent_path());
    std::ofstream file(path, std::ios::binary);
    file << content;
  }

  std::vector<fs::path> relative(const picsort::file_entry_vec& files) {
    std::vector<fs::path> paths;
    for (const auto& file : files) {
      paths.push_back(fs::relative(file.path(), test_dir));
    }
    return paths;
  }
};

TEST(IsMedia, ExtensionsIgnoreCase) {
  EXPECT_TRUE(picsort::is_media("a.jpg"));
  EXPECT_TRUE(picsort::is_media("/x/a.JPG"));
  EXPECT_TRUE(picsort::is_media("a.JpEg"));
  EXPECT_TRUE(picsort::is_media("a.gif"));
  EXPECT_TRUE(picsort::is_media("a.png"));
  EXPECT_TRUE(picsort::is_media("a.webp"));
  EXPECT_TRUE(picsort::is_media("a.raw"));
  EXPECT_TRUE(picsort::is_media("a.MP4"));
  EXPECT_TRUE(picsort::is_media("a.mkv"));
  EXPECT_FALSE(picsort::is_media("a.txt"));
  EXPECT_FALSE(picsort::is_media("jpg"));
  EXPECT_FALSE(picsort::is_media("a.jpg.bak"));
  EXPECT_FALSE(picsort::is_media(""));
}

TEST_F(ListFilesTest, EmptyDirectory) {
  EXPECT_TRUE(picsort::list_files({test_dir}).empty());
}

TEST_F(ListFilesTest, ListsRecursivelySortedByPath) {
  createFile("b.jpg");
  createFile("a/c.png");
  createFile("a/deep/er/d.mp4", "");
  createFile("a.jpg");

  auto files = picsort::list_files({test_dir}, {}, {}, 4);
  EXPECT_EQ(relative(files),
            (std::vector<fs::path>{"a/c.png", "a/deep/er/d.mp4", "a.jpg",
                                   "b.jpg"}));
}

TEST_F(ListFilesTest, RecordsFileSize) {
  createFile("a.jpg", "12345");
  createFile("empty.jpg", "");
  auto files = picsort::list_files({test_dir});
  ASSERT_EQ(files.size(), 2U);
  EXPECT_EQ(files[0].size(), 5U);
  EXPECT_EQ(files[1].size(), 0U);
}

TEST_F(ListFilesTest, FilterKeepsOnlyMedia) {
  createFile("a.jpg");
  createFile("notes.txt");
  createFile("sub/B.PNG");
  createFile("sub/readme");

  auto files = picsort::list_files({test_dir}, picsort::is_media);
  EXPECT_EQ(relative(files), (std::vector<fs::path>{"a.jpg", "sub/B.PNG"}));
}

TEST_F(ListFilesTest, ExcludeRegexSkipsFilesAndDirectories) {
  createFile("keep.jpg");
  createFile("skip.jpg");
  createFile("trash/a.jpg");
  createFile("sub/trash.jpg");

  std::vector<std::regex> exclude{std::regex(".*/trash(/.*)?"),
                                  std::regex(".*/skip\\.jpg")};
  auto files = picsort::list_files({test_dir}, {}, exclude);
  EXPECT_EQ(relative(files),
            (std::vector<fs::path>{"keep.jpg", "sub/trash.jpg"}));
}

TEST_F(ListFilesTest, RootsKeepGivenOrder) {
  createFile("z/1.jpg");
  createFile("a/2.jpg");
  auto files = picsort::list_files({test_dir / "z", test_dir / "a"});
  EXPECT_EQ(relative(files), (std::vector<fs::path>{"z/1.jpg", "a/2.jpg"}));
}

TEST_F(ListFilesTest, SkipsSymlinks) {
  createFile("a.jpg");
  fs::create_symlink(test_dir / "a.jpg", test_dir / "link.jpg");
  auto files = picsort::list_files({test_dir});
  EXPECT_EQ(relative(files), (std::vector<fs::path>{"a.jpg"}));
}

TEST_F(ListFilesTest, MissingRootIsSkipped) {
  EXPECT_TRUE(picsort::list_files({test_dir / "missing"}).empty());
}
