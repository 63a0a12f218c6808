#pragma once

#include <atomic>
#include <string>
#include <string_view>

namespace catalyst::core {

// IIdGenerator hands out trace, event and run identifiers of the form "<prefix>-<suffix>".
// Implementations must be safe to call from several threads.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  [[nodiscard]] virtual std::string next(std::string_view prefix) = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// "<prefix>-<unix micros>-<counter>": unique within a process and ordered by creation.
class SystemIdGenerator final : public IIdGenerator {
 public:
  [[nodiscard]] std::string next(std::string_view prefix) override;

 private:
  std::atomic<unsigned long long> sequence_{0};
};

// "<prefix>-<counter>" with one counter shared by all prefixes, so a fixed call sequence
// always yields the same ids.
class DeterministicIdGenerator final : public IIdGenerator {
 public:
  [[nodiscard]] std::string next(std::string_view prefix) override;

 private:
  std::atomic<unsigned long long> sequence_{0};
};

}  // namespace catalyst::core
