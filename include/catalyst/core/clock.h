#pragma once

#include <string>

namespace catalyst::core {

// IClock stamps audit events and history records. Timestamps are ISO 8601 UTC with second
// precision ("2026-05-01T10:00:00Z"), so they sort lexically in time order.
class IClock {
 public:
  virtual ~IClock() = default;

  [[nodiscard]] virtual std::string now_iso8601() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

class SystemClock final : public IClock {
 public:
  [[nodiscard]] std::string now_iso8601() override;
};

// Returns the same instant on every call. Used by tests and by replays of stored runs.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::string instant) : instant_(std::move(instant)) {}

  [[nodiscard]] std::string now_iso8601() override { return instant_; }

 private:
  std::string instant_;
};

}  // namespace catalyst::core
