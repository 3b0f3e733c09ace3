/**
 * @file repo_discovery.cpp
 * @brief Implements lazy repository discovery over a directory tree.
 *
 * Directories are classified by the presence of a repository marker directly
 * inside them. Repository roots are yielded and never descended into; all
 * other directories are listed and their subdirectories queued in a stable
 * order.
 */
#include "repo_discovery.hpp"
#include "log.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace grpr {

namespace fs = std::filesystem;

namespace {

std::shared_ptr<spdlog::logger> discovery_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("repo.discovery");
  }();
  return logger;
}

/**
 * Check whether a single marker is present inside @p dir.
 *
 * @param dir Directory being classified.
 * @param marker Marker entry name.
 * @param accept_files Whether a regular file counts as a marker.
 * @param ec Receives errors other than "not found".
 * @return `true` when the marker exists with an accepted type.
 */
bool marker_present(const fs::path &dir, const std::string &marker,
                    bool accept_files, std::error_code &ec) {
  std::error_code status_ec;
  fs::file_status st = fs::status(dir / marker, status_ec);
  if (st.type() == fs::file_type::not_found) {
    return false;
  }
  if (status_ec) {
    ec = status_ec;
    return false;
  }
  if (st.type() == fs::file_type::directory) {
    return true;
  }
  return accept_files && st.type() == fs::file_type::regular;
}

} // namespace

InvalidRootError::InvalidRootError(const fs::path &root,
                                   const std::string &why)
    : std::runtime_error("Invalid root '" + root.string() + "': " + why),
      root_(root) {}

std::string DirectoryAccessError::message() const {
  return "cannot " + operation + " '" + path.string() +
         "': " + error.message();
}

/**
 * Convert a directory kind to its string representation.
 *
 * @param kind Directory classification to describe.
 * @return Lowercase textual representation of the kind.
 */
std::string to_string(DirectoryKind kind) {
  switch (kind) {
  case DirectoryKind::RepositoryRoot:
    return "repository-root";
  case DirectoryKind::PlainDirectory:
    return "plain-directory";
  case DirectoryKind::Unreadable:
    return "unreadable";
  }
  return "unreadable";
}

DirectoryNode classify_directory(const fs::path &path,
                                 const DiscoveryOptions &options) {
  DirectoryNode node;
  node.path = path;
  for (const auto &marker : options.markers) {
    if (marker.empty()) {
      continue;
    }
    std::error_code ec;
    if (marker_present(path, marker, options.accept_marker_files, ec)) {
      node.kind = DirectoryKind::RepositoryRoot;
      return node;
    }
    if (ec) {
      node.kind = DirectoryKind::Unreadable;
      node.error = ec;
      return node;
    }
  }
  node.kind = DirectoryKind::PlainDirectory;
  return node;
}

RepositoryWalker::RepositoryWalker(fs::path root, DiscoveryOptions options,
                                   WarningCallback on_warning)
    : root_(std::move(root)), options_(std::move(options)),
      on_warning_(std::move(on_warning)) {
  std::error_code ec;
  fs::file_status st = fs::status(root_, ec);
  if (st.type() == fs::file_type::not_found) {
    throw InvalidRootError(root_, "does not exist");
  }
  if (ec) {
    throw InvalidRootError(root_, ec.message());
  }
  if (st.type() != fs::file_type::directory) {
    throw InvalidRootError(root_, "is not a directory");
  }
  pending_.push_back(root_);
  discovery_log()->debug("Walking '{}' with {} marker(s)", root_.string(),
                         options_.markers.size());
}

void RepositoryWalker::skip(const fs::path &path, std::error_code error,
                            const char *operation) {
  DirectoryAccessError warning{path, error, operation};
  discovery_log()->warn("Skipping directory: {}", warning.message());
  if (on_warning_) {
    on_warning_(warning);
  }
  warnings_.push_back(std::move(warning));
}

/**
 * List the immediate subdirectories of @p dir and queue them.
 *
 * Children are pushed in reverse lexicographic order so the smallest name is
 * popped first. Entries that are symbolic links are ignored.
 *
 * @param dir Plain directory whose children should be visited.
 */
void RepositoryWalker::push_children(const fs::path &dir) {
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    skip(dir, ec, "list");
    return;
  }
  std::vector<fs::path> children;
  fs::directory_iterator end;
  while (it != end) {
    std::error_code entry_ec;
    const fs::file_status st = it->symlink_status(entry_ec);
    if (entry_ec) {
      skip(it->path(), entry_ec, "classify");
    } else if (st.type() == fs::file_type::directory) {
      children.push_back(it->path());
    }
    it.increment(ec);
    if (ec) {
      skip(dir, ec, "list");
      break;
    }
  }
  std::sort(children.begin(), children.end(),
            [](const fs::path &a, const fs::path &b) {
              return a.filename().native() < b.filename().native();
            });
  pending_.insert(pending_.end(), children.rbegin(), children.rend());
}

std::optional<fs::path> RepositoryWalker::next() {
  while (!pending_.empty()) {
    fs::path current = std::move(pending_.back());
    pending_.pop_back();
    ++visited_;
    DirectoryNode node = classify_directory(current, options_);
    switch (node.kind) {
    case DirectoryKind::RepositoryRoot:
      discovery_log()->debug("Discovered repository '{}'", current.string());
      return current;
    case DirectoryKind::Unreadable:
      skip(current, node.error, "classify");
      break;
    case DirectoryKind::PlainDirectory:
      push_children(current);
      break;
    }
  }
  return std::nullopt;
}

std::vector<DirectoryAccessError> walk_repositories(
    const fs::path &root, const DiscoveryOptions &options,
    const std::function<void(const fs::path &)> &on_repository) {
  RepositoryWalker walker(root, options);
  while (auto repo = walker.next()) {
    on_repository(*repo);
  }
  return walker.warnings();
}

std::vector<fs::path> discover_repositories(const fs::path &root,
                                            const DiscoveryOptions &options) {
  std::vector<fs::path> repos;
  walk_repositories(root, options,
                    [&repos](const fs::path &repo) { repos.push_back(repo); });
  return repos;
}

} // namespace grpr
