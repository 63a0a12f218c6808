#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>

namespace catalyst::scanning {

// CancellationToken is shared between the caller and a running scan.
// cancel() may be called from any thread; the walk polls it between directories.
class CancellationToken {
 public:
  void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
  [[nodiscard]] bool is_cancelled() const noexcept {
    return cancelled_.load(std::memory_order_relaxed);
  }

 private:
  std::atomic<bool> cancelled_{false};
};

struct ScanOptions {
  // Upper bound on concurrent subtree walkers. 0 and 1 both mean a single-threaded walk.
  std::size_t max_workers{1};  // NOLINT(readability-identifier-naming)
  std::shared_ptr<const CancellationToken> cancel;
  std::optional<std::chrono::steady_clock::time_point> deadline;
};

}  // namespace catalyst::scanning
