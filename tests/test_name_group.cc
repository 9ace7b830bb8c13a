/**
 * @file test_name_group.cc
 * @brief Unit tests for partitioning files by terminal name
 */

#include <gtest/gtest.h>

#include "picsort/name_group.hh"

using picsort::file_entry_vec;

TEST(ResolveNames, EmptyInput) {
  auto partition = picsort::resolve_names({});
  EXPECT_TRUE(partition.unique.empty());
  EXPECT_TRUE(partition.colliding.empty());
}

TEST(ResolveNames, AllUnique) {
  file_entry_vec files{"/a/x.jpg", "/a/y.jpg", "/b/z.png"};
  auto partition = picsort::resolve_names(files);
  EXPECT_EQ(partition.unique, files);
  EXPECT_TRUE(partition.colliding.empty());
}

TEST(ResolveNames, GroupsSameNameInFirstSeenOrder) {
  file_entry_vec files{"/c/a.jpg", "/a/b.jpg", "/a/a.jpg",
                       "/b/c.jpg", "/d/b.jpg", "/b/a.jpg"};
  auto partition = picsort::resolve_names(files);

  EXPECT_EQ(partition.unique, (file_entry_vec{"/b/c.jpg"}));
  ASSERT_EQ(partition.colliding.size(), 2U);
  EXPECT_EQ(partition.colliding[0].name, "a.jpg");
  EXPECT_EQ(partition.colliding[0].files,
            (file_entry_vec{"/c/a.jpg", "/a/a.jpg", "/b/a.jpg"}));
  EXPECT_EQ(partition.colliding[1].name, "b.jpg");
  EXPECT_EQ(partition.colliding[1].files,
            (file_entry_vec{"/a/b.jpg", "/d/b.jpg"}));
}

TEST(ResolveNames, NamesAreCaseSensitive) {
  file_entry_vec files{"/a/IMG.jpg", "/b/img.jpg", "/c/IMG.JPG"};
  auto partition = picsort::resolve_names(files);
  EXPECT_EQ(partition.unique, files);
  EXPECT_TRUE(partition.colliding.empty());
}

TEST(ResolveNames, EveryFileLandsInExactlyOnePartition) {
  file_entry_vec files{"/1/a.jpg", "/2/a.jpg", "/3/b.jpg",
                       "/4/c.jpg", "/5/c.jpg", "/6/c.jpg"};
  auto partition = picsort::resolve_names(files);
  std::size_t total = partition.unique.size();
  for (const auto &group : partition.colliding) {
    EXPECT_GE(group.files.size(), 2U);
    total += group.files.size();
  }
  EXPECT_EQ(total, files.size());
}
