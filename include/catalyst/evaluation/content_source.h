#pragma once

#include "catalyst/core/result.h"

#include <map>
#include <string>

namespace catalyst::evaluation {

// IFileContentSource gives the evaluator read access to file content by snapshot-relative
// path. Only FileQuality rules read content. Implementations must allow concurrent read()
// calls.
class IFileContentSource {
 public:
  virtual ~IFileContentSource() = default;

  // Returns the file's bytes, or a message describing why it could not be read.
  [[nodiscard]] virtual core::Result<std::string, std::string> read(
      const std::string& relative_path) const = 0;

 protected:
  IFileContentSource() = default;
  IFileContentSource(const IFileContentSource&) = default;
  IFileContentSource& operator=(const IFileContentSource&) = default;
  IFileContentSource(IFileContentSource&&) = default;
  IFileContentSource& operator=(IFileContentSource&&) = default;
};

// Reads from disk beneath a fixed root (normally ProjectSnapshot::root()).
class FilesystemContentSource final : public IFileContentSource {
 public:
  explicit FilesystemContentSource(std::string root) : root_(std::move(root)) {}

  [[nodiscard]] core::Result<std::string, std::string> read(
      const std::string& relative_path) const override;

 private:
  std::string root_;
};

// Fixed content for tests. Paths never added read as "not found"; paths added with
// put_error read as that error.
class InMemoryContentSource final : public IFileContentSource {
 public:
  void put(const std::string& relative_path, std::string content);
  void put_error(const std::string& relative_path, std::string message);

  [[nodiscard]] core::Result<std::string, std::string> read(
      const std::string& relative_path) const override;

 private:
  std::map<std::string, core::Result<std::string, std::string>> entries_;
};

}  // namespace catalyst::evaluation
