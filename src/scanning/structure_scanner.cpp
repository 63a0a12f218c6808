#include "catalyst/scanning/structure_scanner.h"

#include "catalyst/scanning/project_indicators.h"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <mutex>
#include <thread>
#include <vector>

namespace catalyst::scanning {

namespace fs = std::filesystem;

namespace {

using ScanResult = core::Result<domain::ProjectSnapshot, ScanError>;

enum class StopReason { kNone, kCancelled, kDeadline };

// Shared between walkers. The first walker to notice a stop condition records it.
class StopSignal {
 public:
  explicit StopSignal(const ScanOptions& options) : options_(options) {}

  // Polls the caller's token and deadline. Returns true once the walk must stop.
  bool poll() {
    if (reason_.load(std::memory_order_relaxed) != StopReason::kNone) {
      return true;
    }
    if (options_.cancel && options_.cancel->is_cancelled()) {
      trip(StopReason::kCancelled);
      return true;
    }
    if (options_.deadline.has_value() &&
        std::chrono::steady_clock::now() >= options_.deadline.value()) {
      trip(StopReason::kDeadline);
      return true;
    }
    return false;
  }

  [[nodiscard]] StopReason reason() const { return reason_.load(std::memory_order_relaxed); }

 private:
  void trip(StopReason reason) {
    StopReason expected = StopReason::kNone;
    reason_.compare_exchange_strong(expected, reason, std::memory_order_relaxed);
  }

  const ScanOptions& options_;
  std::atomic<StopReason> reason_{StopReason::kNone};
};

// What one walker collected. Merged into SnapshotData under the merge lock.
struct PartialScan {
  std::vector<std::string> files;
  std::vector<std::string> directories;
  std::vector<domain::SkippedEntry> skipped;
};

// Classifies entry and appends it to partial. Returns true when the entry is a directory
// that should be descended.
bool record_entry(const fs::directory_entry& entry, const std::string& rel, PartialScan& partial) {
  std::error_code ec;
  const auto link_status = entry.symlink_status(ec);
  if (ec) {
    partial.skipped.push_back({rel, ec.message()});
    return false;
  }

  const bool is_link = fs::is_symlink(link_status);
  const auto target_status = is_link ? entry.status(ec) : link_status;
  if (ec) {
    // Dangling symlink.
    partial.skipped.push_back({rel, ec.message()});
    return false;
  }

  const std::string name = entry.path().filename().string();
  if (fs::is_directory(target_status)) {
    partial.directories.push_back(rel);
    return !is_link && !is_denied_directory(name);
  }
  if (fs::is_regular_file(target_status) && !is_skipped_file(name)) {
    partial.files.push_back(rel);
  }
  return false;
}

// Depth-first walk of one subtree. rel_dir is the subtree's path relative to the root;
// the subtree directory itself has already been recorded.
void walk_subtree(const fs::path& root, const std::string& rel_dir, PartialScan& partial,
                  StopSignal& stop) {
  std::vector<std::string> pending{rel_dir};

  while (!pending.empty()) {
    if (stop.poll()) {
      return;
    }

    const std::string current = std::move(pending.back());
    pending.pop_back();

    std::error_code ec;
    fs::directory_iterator it(root / current, ec);
    const fs::directory_iterator end;
    if (ec) {
      partial.skipped.push_back({current, ec.message()});
      continue;
    }

    std::vector<std::string> children;
    for (; it != end; it.increment(ec)) {
      const std::string rel = current + "/" + it->path().filename().string();
      if (record_entry(*it, rel, partial)) {
        children.push_back(rel);
      }
    }
    if (ec) {
      partial.skipped.push_back({current, ec.message()});
    }

    // Reverse so the walk visits children in directory order; only cosmetic, the
    // snapshot uses sorted sets.
    pending.insert(pending.end(), children.rbegin(), children.rend());
  }
}

void merge(domain::SnapshotData& data, PartialScan& partial) {
  data.files.insert(partial.files.begin(), partial.files.end());
  data.directories.insert(partial.directories.begin(), partial.directories.end());
  data.skipped_entries.insert(data.skipped_entries.end(),
                              std::make_move_iterator(partial.skipped.begin()),
                              std::make_move_iterator(partial.skipped.end()));
}

ScanResult stop_error(StopReason reason, const std::string& root) {
  if (reason == StopReason::kDeadline) {
    return ScanResult::err(
        {ScanErrorKind::kDeadlineExceeded, root, "Scan deadline exceeded before the walk finished"});
  }
  return ScanResult::err({ScanErrorKind::kCancelled, root, "Scan cancelled"});
}

}  // namespace

ScanResult scan(const std::string& root, const ScanOptions& options) {
  std::error_code ec;
  fs::path root_path = fs::absolute(fs::path(root), ec).lexically_normal();
  if (ec) {
    return ScanResult::err({ScanErrorKind::kIoError, root, ec.message()});
  }
  if (root_path.filename().empty() && root_path.has_parent_path()) {
    root_path = root_path.parent_path();
  }

  const auto status = fs::status(root_path, ec);
  if (status.type() == fs::file_type::not_found) {
    return ScanResult::err({ScanErrorKind::kNotFound, root, "Path does not exist"});
  }
  if (ec) {
    return ScanResult::err({ScanErrorKind::kIoError, root, ec.message()});
  }
  if (!fs::is_directory(status)) {
    return ScanResult::err({ScanErrorKind::kNotADirectory, root, "Path is not a directory"});
  }

  StopSignal stop(options);
  if (stop.poll()) {
    return stop_error(stop.reason(), root);
  }

  domain::SnapshotData data;
  data.root = root_path.generic_string();
  data.project_name = root_path.filename().string();

  // Top level: files are recorded directly, each descendable directory becomes a unit
  // of work for the pool.
  PartialScan top;
  std::vector<std::string> subtrees;
  fs::directory_iterator it(root_path, ec);
  const fs::directory_iterator end;
  if (ec) {
    return ScanResult::err({ScanErrorKind::kIoError, root, ec.message()});
  }
  for (; it != end; it.increment(ec)) {
    const std::string rel = it->path().filename().string();
    if (record_entry(*it, rel, top)) {
      subtrees.push_back(rel);
    }
  }
  if (ec) {
    top.skipped.push_back({".", ec.message()});
  }
  merge(data, top);
  std::sort(subtrees.begin(), subtrees.end());

  const std::size_t workers =
      std::min<std::size_t>(std::max<std::size_t>(options.max_workers, 1), subtrees.size());

  if (workers <= 1) {
    for (const auto& subtree : subtrees) {
      PartialScan partial;
      walk_subtree(root_path, subtree, partial, stop);
      merge(data, partial);
    }
  } else {
    std::atomic<std::size_t> next_index{0};
    std::mutex merge_lock;
    std::vector<std::thread> pool;
    pool.reserve(workers);

    for (std::size_t worker = 0; worker < workers; ++worker) {
      pool.emplace_back([&]() {
        PartialScan local;
        while (true) {
          const std::size_t index = next_index.fetch_add(1, std::memory_order_relaxed);
          if (index >= subtrees.size()) {
            break;
          }
          walk_subtree(root_path, subtrees[index], local, stop);
        }

        std::lock_guard<std::mutex> guard(merge_lock);
        merge(data, local);
      });
    }

    for (std::thread& thread : pool) {
      if (thread.joinable()) {
        thread.join();
      }
    }
  }

  if (stop.reason() != StopReason::kNone) {
    return stop_error(stop.reason(), root);
  }

  // Skip order depends on worker interleaving; sort so snapshots compare equal.
  std::sort(data.skipped_entries.begin(), data.skipped_entries.end(),
            [](const domain::SkippedEntry& a, const domain::SkippedEntry& b) {
              return a.path != b.path ? a.path < b.path : a.reason < b.reason;
            });

  data.project_types = detect_project_types(data.files, data.directories);
  data.frameworks = detect_frameworks(data.root, data.files, data.skipped_entries);
  compute_flags(data);

  return ScanResult::ok(domain::ProjectSnapshot(std::move(data)));
}

}  // namespace catalyst::scanning
