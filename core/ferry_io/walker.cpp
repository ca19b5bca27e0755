// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "walker.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace ferry {
namespace io {

namespace {

bool isContainerKey(const std::string& key) {
  return !key.empty() && key.back() == '/';
}

void requireContainer(const std::string& root) {
  if (!isContainerKey(root)) {
    throw std::invalid_argument("walk root must be a container key ending with '/': " + root);
  }
}

}  // namespace

std::string parentContainer(const std::string& key) {
  if (key.empty() || key == "/") {
    return "/";
  }
  // Skip the trailing '/' of a container key
  size_t search_end = isContainerKey(key) ? key.size() - 2 : key.size() - 1;
  size_t pos = key.rfind('/', search_end);
  if (pos == std::string::npos) {
    return "/";
  }
  return key.substr(0, pos + 1);
}

// =============================================================================
// MemoryListingProvider
// =============================================================================

MemoryListingProvider::MemoryListingProvider(const std::vector<std::string>& keys) {
  for (const auto& key : keys) {
    add(key);
  }
}

void MemoryListingProvider::add(const std::string& key) {
  std::string k = key;
  while (!k.empty() && k.front() == '/') {
    k.erase(0, 1);
  }
  if (k.empty()) {
    children_["/"];
    return;
  }
  if (isContainerKey(k)) {
    children_[k];
  }
  // Register the key and every implied ancestor
  while (true) {
    std::string parent = parentContainer(k);
    children_[parent].insert(k);
    if (parent == "/") {
      break;
    }
    k = parent;
  }
}

Status MemoryListingProvider::list(const std::string& container, std::vector<WalkNode>& children) {
  children.clear();
  if (!isContainerKey(container)) {
    return Status::Failure(ErrorKind::Config, "cannot list a non-container key: " + container);
  }
  list_calls_.push_back(container);

  auto it = children_.find(container);
  if (it == children_.end()) {
    return Status::Success();
  }
  for (const auto& child : it->second) {
    children.push_back(WalkNode{child, isContainerKey(child)});
  }
  return Status::Success();
}

// =============================================================================
// LocalListingProvider
// =============================================================================

LocalListingProvider::LocalListingProvider(const std::string& root_directory)
    : root_directory_(root_directory) {
  while (root_directory_.size() > 1 && root_directory_.back() == '/') {
    root_directory_.pop_back();
  }
}

std::string LocalListingProvider::localPath(const std::string& key) const {
  if (key.empty() || key == "/") {
    return root_directory_;
  }
  std::string relative = key;
  if (relative.back() == '/') {
    relative.pop_back();
  }
  return (std::filesystem::path(root_directory_) / relative).string();
}

Status LocalListingProvider::list(const std::string& container, std::vector<WalkNode>& children) {
  children.clear();
  if (!isContainerKey(container)) {
    return Status::Failure(ErrorKind::Config, "cannot list a non-container key: " + container);
  }

  const std::string prefix = container == "/" ? "" : container;
  std::error_code ec;
  std::filesystem::directory_iterator it(localPath(container), ec);
  if (ec) {
    return Status::Failure(
      ErrorKind::IO, "failed to list " + localPath(container) + ": " + ec.message()
    );
  }

  try {
    for (const auto& entry : it) {
      std::string name = entry.path().filename().string();
      std::error_code type_ec;
      bool is_dir = entry.is_directory(type_ec) && !entry.is_symlink(type_ec);
      if (is_dir) {
        children.push_back(WalkNode{prefix + name + "/", true});
      } else {
        children.push_back(WalkNode{prefix + name, false});
      }
    }
  } catch (const std::filesystem::filesystem_error& e) {
    children.clear();
    return Status::Failure(ErrorKind::IO, std::string("failed to list directory: ") + e.what());
  }
  std::sort(children.begin(), children.end(), [](const WalkNode& a, const WalkNode& b) {
    return a.key < b.key;
  });
  return Status::Success();
}

// =============================================================================
// TopDownWalker
// =============================================================================

TopDownWalker::TopDownWalker(IListingProvider& provider, const std::string& root)
    : provider_(provider) {
  requireContainer(root);
  pending_containers_.push_back(root);
}

Status TopDownWalker::next(std::optional<WalkNode>& node) {
  node.reset();
  if (!failure_.ok()) {
    return failure_;
  }

  if (!ready_.empty()) {
    node = std::move(ready_.front());
    ready_.pop_front();
    return Status::Success();
  }
  if (pending_containers_.empty()) {
    return Status::Success();
  }

  std::string container = std::move(pending_containers_.front());
  pending_containers_.pop_front();

  std::vector<WalkNode> children;
  Status status = provider_.list(container, children);
  if (!status.ok()) {
    failure_ = status;
    return status;
  }
  for (auto& child : children) {
    if (child.is_container) {
      pending_containers_.push_back(child.key);
    } else {
      ready_.push_back(std::move(child));
    }
  }

  node = WalkNode{container, true};
  return Status::Success();
}

// =============================================================================
// BottomUpWalker
// =============================================================================

BottomUpWalker::BottomUpWalker(IListingProvider& provider, const std::string& root)
    : provider_(provider) {
  requireContainer(root);
  stack_.push_back(Frame{root, false, {}, 0});
}

Status BottomUpWalker::next(std::optional<WalkNode>& node) {
  node.reset();
  if (!failure_.ok()) {
    return failure_;
  }

  while (!stack_.empty()) {
    Frame& top = stack_.back();
    if (!top.listed) {
      Status status = provider_.list(top.container, top.children);
      if (!status.ok()) {
        failure_ = status;
        return status;
      }
      top.listed = true;
    }

    if (top.next_child < top.children.size()) {
      WalkNode child = top.children[top.next_child++];
      if (child.is_container) {
        // top is invalidated by the push
        stack_.push_back(Frame{child.key, false, {}, 0});
        continue;
      }
      node = std::move(child);
      return Status::Success();
    }

    node = WalkNode{top.container, true};
    stack_.pop_back();
    return Status::Success();
  }
  return Status::Success();
}

}  // namespace io
}  // namespace ferry
