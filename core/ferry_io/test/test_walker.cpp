// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "io_mocks.hpp"
#include "walker.hpp"

namespace fs = std::filesystem;

using namespace ferry::io;
using namespace ferry::io::test;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Return;
using ::testing::SetArgReferee;

namespace {

template <typename Walker>
std::vector<WalkNode> drain(Walker& walker) {
  std::vector<WalkNode> nodes;
  std::optional<WalkNode> node;
  while (true) {
    Status status = walker.next(node);
    EXPECT_TRUE(status.ok()) << status;
    if (!status.ok() || !node) {
      break;
    }
    nodes.push_back(*node);
  }
  return nodes;
}

std::vector<std::string> keys_of(const std::vector<WalkNode>& nodes) {
  std::vector<std::string> keys;
  for (const auto& node : nodes) {
    keys.push_back(node.key);
  }
  return keys;
}

size_t index_of(const std::vector<std::string>& keys, const std::string& key) {
  return static_cast<size_t>(std::find(keys.begin(), keys.end(), key) - keys.begin());
}

bool is_ancestor(const std::string& container, const std::string& key) {
  if (container == "/") {
    return key != "/";
  }
  return key.size() > container.size() && key.compare(0, container.size(), container) == 0;
}

}  // namespace

// =============================================================================
// Key helpers and MemoryListingProvider
// =============================================================================

TEST(ParentContainerTest, Parents) {
  EXPECT_EQ(parentContainer("a/b/c.txt"), "a/b/");
  EXPECT_EQ(parentContainer("a/b/"), "a/");
  EXPECT_EQ(parentContainer("a/"), "/");
  EXPECT_EQ(parentContainer("file"), "/");
  EXPECT_EQ(parentContainer("/"), "/");
}

TEST(MemoryListingProviderTest, ImpliedContainers) {
  MemoryListingProvider provider({"a/b/c.txt"});

  std::vector<WalkNode> children;
  ASSERT_TRUE(provider.list("/", children).ok());
  ASSERT_EQ(children.size(), 1u);
  EXPECT_EQ(children[0], (WalkNode{"a/", true}));

  ASSERT_TRUE(provider.list("a/b/", children).ok());
  ASSERT_EQ(children.size(), 1u);
  EXPECT_EQ(children[0], (WalkNode{"a/b/c.txt", false}));
}

TEST(MemoryListingProviderTest, UnknownContainerIsEmpty) {
  MemoryListingProvider provider({"x"});
  std::vector<WalkNode> children{{"stale", false}};
  ASSERT_TRUE(provider.list("nope/", children).ok());
  EXPECT_TRUE(children.empty());
}

TEST(MemoryListingProviderTest, ListingLeafIsConfigError) {
  MemoryListingProvider provider({"x"});
  std::vector<WalkNode> children;
  Status status = provider.list("x", children);
  EXPECT_FALSE(status.ok());
  EXPECT_EQ(status.kind, ErrorKind::Config);
}

// =============================================================================
// Walkers over an in-memory tree
// =============================================================================

class WalkerTest : public ::testing::Test {
protected:
  void SetUp() override {
    provider_.add("a/x.txt");
    provider_.add("a/b/y.txt");
    provider_.add("a/b/z.txt");
    provider_.add("c/");
    provider_.add("top.txt");
  }

  const std::set<std::string> all_keys_ = {"/",         "a/",        "a/x.txt", "a/b/",
                                           "a/b/y.txt", "a/b/z.txt", "c/",      "top.txt"};
  MemoryListingProvider provider_;
};

TEST_F(WalkerTest, TopDownOrder) {
  TopDownWalker walker(provider_, "/");
  std::vector<std::string> keys = keys_of(drain(walker));

  std::vector<std::string> expected = {"/",    "top.txt", "a/",        "a/x.txt",
                                       "c/",   "a/b/",    "a/b/y.txt", "a/b/z.txt"};
  EXPECT_EQ(keys, expected);
}

TEST_F(WalkerTest, TopDownContainersBeforeDescendants) {
  TopDownWalker walker(provider_, "/");
  std::vector<WalkNode> nodes = drain(walker);
  std::vector<std::string> keys = keys_of(nodes);

  EXPECT_EQ(std::set<std::string>(keys.begin(), keys.end()), all_keys_);
  EXPECT_EQ(keys.size(), all_keys_.size());
  for (const auto& node : nodes) {
    if (!node.is_container) continue;
    for (const auto& key : keys) {
      if (is_ancestor(node.key, key)) {
        EXPECT_LT(index_of(keys, node.key), index_of(keys, key)) << node.key << " vs " << key;
      }
    }
  }
}

TEST_F(WalkerTest, BottomUpOrder) {
  BottomUpWalker walker(provider_, "/");
  std::vector<std::string> keys = keys_of(drain(walker));

  std::vector<std::string> expected = {"a/b/y.txt", "a/b/z.txt", "a/b/", "a/x.txt",
                                       "a/",        "c/",        "top.txt", "/"};
  EXPECT_EQ(keys, expected);
}

TEST_F(WalkerTest, BottomUpDescendantsBeforeContainers) {
  BottomUpWalker walker(provider_, "/");
  std::vector<WalkNode> nodes = drain(walker);
  std::vector<std::string> keys = keys_of(nodes);

  EXPECT_EQ(std::set<std::string>(keys.begin(), keys.end()), all_keys_);
  EXPECT_EQ(keys.size(), all_keys_.size());
  for (const auto& node : nodes) {
    if (!node.is_container) continue;
    for (const auto& key : keys) {
      if (is_ancestor(node.key, key)) {
        EXPECT_GT(index_of(keys, node.key), index_of(keys, key)) << node.key << " vs " << key;
      }
    }
  }
}

TEST_F(WalkerTest, SubtreeRoot) {
  TopDownWalker walker(provider_, "a/b/");
  EXPECT_EQ(keys_of(drain(walker)), (std::vector<std::string>{"a/b/", "a/b/y.txt", "a/b/z.txt"}));
}

TEST_F(WalkerTest, ListingIsLazy) {
  TopDownWalker walker(provider_, "/");
  std::optional<WalkNode> node;

  ASSERT_TRUE(walker.next(node).ok());
  EXPECT_EQ(node->key, "/");
  EXPECT_EQ(provider_.listCalls(), (std::vector<std::string>{"/"}));

  ASSERT_TRUE(walker.next(node).ok());  // top.txt
  ASSERT_TRUE(walker.next(node).ok());  // a/
  EXPECT_EQ(node->key, "a/");
  EXPECT_EQ(provider_.listCalls(), (std::vector<std::string>{"/", "a/"}));
}

TEST_F(WalkerTest, CompletedWalkStaysComplete) {
  BottomUpWalker walker(provider_, "c/");
  drain(walker);

  std::optional<WalkNode> node;
  ASSERT_TRUE(walker.next(node).ok());
  EXPECT_FALSE(node.has_value());
}

TEST(WalkerRootTest, RootMustBeContainer) {
  MemoryListingProvider provider;
  EXPECT_THROW(TopDownWalker(provider, "file.txt"), std::invalid_argument);
  EXPECT_THROW(BottomUpWalker(provider, ""), std::invalid_argument);
}

TEST(WalkerErrorTest, ListingFailureIsSticky) {
  MockListingProvider provider;
  EXPECT_CALL(provider, list("/", _))
    .WillOnce(DoAll(
      SetArgReferee<1>(std::vector<WalkNode>{{"d/", true}}), Return(Status::Success())
    ));
  EXPECT_CALL(provider, list("d/", _))
    .WillOnce(Return(Status::Failure(ErrorKind::IO, "listing timed out")));

  BottomUpWalker walker(provider, "/");
  std::optional<WalkNode> node;
  Status status = walker.next(node);
  EXPECT_FALSE(status.ok());
  EXPECT_FALSE(node.has_value());

  status = walker.next(node);
  EXPECT_FALSE(status.ok());
  EXPECT_EQ(status.error_message, "listing timed out");
}

// =============================================================================
// LocalListingProvider
// =============================================================================

class LocalListingTest : public ::testing::Test {
protected:
  void SetUp() override {
    root_ = fs::temp_directory_path() /
            ("ferry_walker_test_" +
             std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(root_ / "logs" / "old");
    fs::create_directories(root_ / "empty");
    std::ofstream(root_ / "readme.md") << "hi";
    std::ofstream(root_ / "logs" / "today.txt") << "t";
    std::ofstream(root_ / "logs" / "old" / "jan.txt") << "j";
  }

  void TearDown() override {
    fs::remove_all(root_);
  }

  fs::path root_;
};

TEST_F(LocalListingTest, WalksDirectoryTree) {
  LocalListingProvider provider(root_.string());
  TopDownWalker walker(provider, "/");

  std::vector<std::string> keys = keys_of(drain(walker));
  std::vector<std::string> expected = {"/",      "readme.md",     "empty/", "logs/",
                                       "logs/today.txt", "logs/old/", "logs/old/jan.txt"};
  EXPECT_EQ(keys, expected);
}

TEST_F(LocalListingTest, LocalPathOfKey) {
  LocalListingProvider provider(root_.string() + "/");
  EXPECT_EQ(provider.localPath("/"), root_.string());
  EXPECT_EQ(provider.localPath("logs/old/jan.txt"), (root_ / "logs/old/jan.txt").string());
  EXPECT_EQ(provider.localPath("logs/"), (root_ / "logs").string());
}

TEST_F(LocalListingTest, MissingDirectoryIsIoError) {
  LocalListingProvider provider((root_ / "missing").string());
  std::vector<WalkNode> children;
  Status status = provider.list("/", children);
  EXPECT_FALSE(status.ok());
  EXPECT_EQ(status.kind, ErrorKind::IO);
}
