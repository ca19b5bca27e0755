// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_IO_WALKER_HPP
#define FERRY_IO_WALKER_HPP

#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "io_status.hpp"

namespace ferry {
namespace io {

/**
 * One entry of a hierarchical namespace
 *
 * Container keys end with '/'. The namespace root is "/"; every other key is
 * relative to it, e.g. "logs/" and "logs/2026-10-17.txt".
 */
struct WalkNode {
  std::string key;
  bool is_container;

  bool operator==(const WalkNode& other) const {
    return key == other.key && is_container == other.is_container;
  }
};

/**
 * Returns the direct children of one container
 *
 * Implementations must describe a tree: a key is never listed under two
 * containers and a container never lists one of its ancestors.
 */
class IListingProvider {
public:
  virtual ~IListingProvider() = default;

  /**
   * @param container Container key (ends with '/')
   * @param children Replaced with the direct children of container
   */
  virtual Status list(const std::string& container, std::vector<WalkNode>& children) = 0;
};

/**
 * Listing provider over a snapshot of keys held in memory
 *
 * Intermediate containers are implied by nested keys, so adding
 * "a/b/c.txt" also creates "a/" and "a/b/". Children are listed in key order.
 */
class MemoryListingProvider : public IListingProvider {
public:
  MemoryListingProvider() = default;
  explicit MemoryListingProvider(const std::vector<std::string>& keys);

  void add(const std::string& key);

  Status list(const std::string& container, std::vector<WalkNode>& children) override;

  // Containers listed so far, in call order
  const std::vector<std::string>& listCalls() const {
    return list_calls_;
  }

private:
  std::map<std::string, std::set<std::string>> children_;
  std::vector<std::string> list_calls_;
};

/**
 * Listing provider over a local directory tree
 *
 * Container "/" is the root directory itself; "a/b/" is root/a/b. Symbolic
 * links to directories are reported as leaves so the tree stays acyclic.
 */
class LocalListingProvider : public IListingProvider {
public:
  explicit LocalListingProvider(const std::string& root_directory);

  Status list(const std::string& container, std::vector<WalkNode>& children) override;

  // Local filesystem path of a key
  std::string localPath(const std::string& key) const;

private:
  std::string root_directory_;
};

// Parent container of a key: "a/b/c.txt" -> "a/b/", "a/" -> "/"
std::string parentContainer(const std::string& key);

/**
 * Breadth-first walk that yields a container before its children
 *
 * A container is yielded, then listed; its child containers are queued and
 * its leaf entries are yielded in listing order. The root is yielded first.
 */
class TopDownWalker {
public:
  /**
   * @param provider Listing provider, must outlive the walker
   * @param root Container key to start from (must end with '/')
   * @throws std::invalid_argument if root is not a container key
   */
  TopDownWalker(IListingProvider& provider, const std::string& root);

  /**
   * Advance the walk
   *
   * @param node Set to the next entry, or reset when the walk is complete
   * @return Failure from the listing provider; the walker then stays failed
   */
  Status next(std::optional<WalkNode>& node);

private:
  IListingProvider& provider_;
  std::deque<std::string> pending_containers_;
  std::deque<WalkNode> ready_;
  Status failure_ = Status::Success();
};

/**
 * Depth-first walk that yields every descendant of a container before the
 * container itself. The root is yielded last.
 */
class BottomUpWalker {
public:
  /**
   * @param provider Listing provider, must outlive the walker
   * @param root Container key to start from (must end with '/')
   * @throws std::invalid_argument if root is not a container key
   */
  BottomUpWalker(IListingProvider& provider, const std::string& root);

  Status next(std::optional<WalkNode>& node);

private:
  struct Frame {
    std::string container;
    bool listed;
    std::vector<WalkNode> children;
    size_t next_child;
  };

  IListingProvider& provider_;
  std::vector<Frame> stack_;
  Status failure_ = Status::Success();
};

}  // namespace io
}  // namespace ferry

#endif  // FERRY_IO_WALKER_HPP
