/**
 * @file repo_discovery.hpp
 * @brief Repository discovery by walking a directory tree.
 *
 * Provides directory classification and a lazy, depth-first walker that
 * yields repository roots without descending into them.
 */
#ifndef GRPR_REPO_DISCOVERY_HPP
#define GRPR_REPO_DISCOVERY_HPP

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace grpr {

/// Classification of a single directory.
enum class DirectoryKind {
  RepositoryRoot, ///< Contains a repository marker directly inside it
  PlainDirectory, ///< Readable directory without a marker
  Unreadable      ///< Could not be inspected (permissions, I/O errors)
};

/**
 * @brief Convert a directory kind to a lowercase string.
 * @param kind Directory classification.
 * @return Lowercase string representation.
 */
std::string to_string(DirectoryKind kind);

/// A path together with its classification.
struct DirectoryNode {
  std::filesystem::path path;
  DirectoryKind kind{DirectoryKind::PlainDirectory};
  std::error_code error; ///< Set when @ref kind is Unreadable
};

/// Rules deciding what counts as a repository root.
struct DiscoveryOptions {
  /// Entry names marking a repository root when present inside a directory.
  std::vector<std::string> markers{".git"};
  /// Also accept markers that are regular files (worktrees, submodules).
  bool accept_marker_files{false};
};

/// Thrown when the walk cannot start because the root is unusable.
class InvalidRootError : public std::runtime_error {
public:
  InvalidRootError(const std::filesystem::path &root, const std::string &why);

  /// Root path that was rejected.
  const std::filesystem::path &root() const noexcept { return root_; }

private:
  std::filesystem::path root_;
};

/// A directory skipped during the walk. Never thrown; reported and recorded.
struct DirectoryAccessError {
  std::filesystem::path path;
  std::error_code error;
  std::string operation; ///< "classify" or "list"

  /// Human readable description for logs and summaries.
  std::string message() const;
};

/**
 * @brief Classify a directory by checking for a marker directly inside it.
 *
 * Ancestors and descendants are never inspected.
 *
 * @param path Directory to classify.
 * @param options Marker rules.
 * @return Classified node; Unreadable nodes carry the error.
 */
DirectoryNode classify_directory(const std::filesystem::path &path,
                                 const DiscoveryOptions &options);

/**
 * @brief Lazy depth-first walker over repository roots.
 *
 * Each call to next() resumes the walk until the following repository root is
 * found. Siblings are visited in byte-wise lexicographic order of their names,
 * symbolic links are never followed and repository roots are not descended
 * into. Pending directories are kept on an explicit stack so arbitrarily deep
 * trees do not grow the call stack.
 */
class RepositoryWalker {
public:
  using WarningCallback = std::function<void(const DirectoryAccessError &)>;

  /**
   * @param root Directory the walk starts from.
   * @param options Marker rules.
   * @param on_warning Optional callback for skipped directories.
   * @throws InvalidRootError When @p root does not exist or is not a
   *         directory.
   */
  explicit RepositoryWalker(std::filesystem::path root,
                            DiscoveryOptions options = {},
                            WarningCallback on_warning = WarningCallback{});

  RepositoryWalker(const RepositoryWalker &) = delete;
  RepositoryWalker &operator=(const RepositoryWalker &) = delete;

  /**
   * Advance to the next repository root.
   *
   * @return The next root, or std::nullopt once the tree is exhausted.
   */
  std::optional<std::filesystem::path> next();

  /// Directory the walk started from.
  const std::filesystem::path &root() const { return root_; }

  /// Directories skipped so far.
  const std::vector<DirectoryAccessError> &warnings() const {
    return warnings_;
  }

  /// Number of directories classified so far.
  std::size_t visited() const { return visited_; }

private:
  void skip(const std::filesystem::path &path, std::error_code error,
            const char *operation);
  void push_children(const std::filesystem::path &dir);

  std::filesystem::path root_;
  DiscoveryOptions options_;
  WarningCallback on_warning_;
  std::vector<std::filesystem::path> pending_;
  std::vector<DirectoryAccessError> warnings_;
  std::size_t visited_{0};
};

/**
 * @brief Walk @p root to completion, invoking @p on_repository for each root.
 *
 * @return Directories skipped during the walk.
 * @throws InvalidRootError When the root is unusable.
 */
std::vector<DirectoryAccessError> walk_repositories(
    const std::filesystem::path &root, const DiscoveryOptions &options,
    const std::function<void(const std::filesystem::path &)> &on_repository);

/**
 * @brief Collect every repository root below @p root in walk order.
 * @throws InvalidRootError When the root is unusable.
 */
std::vector<std::filesystem::path>
discover_repositories(const std::filesystem::path &root,
                      const DiscoveryOptions &options = {});

} // namespace grpr

#endif // GRPR_REPO_DISCOVERY_HPP
