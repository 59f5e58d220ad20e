#pragma once

#include <transita/core/error.hpp>
#include <expected>
#include <filesystem>

namespace transita::app {

/// Owns a temporary file "<stem>.partial<ext>" next to a destination path.
/// The file is removed on destruction unless commit() moved it into place.
class ScopedTempFile {
 public:
  explicit ScopedTempFile(std::filesystem::path destination);
  ~ScopedTempFile() noexcept;

  ScopedTempFile(ScopedTempFile&& other) noexcept;
  ScopedTempFile& operator=(ScopedTempFile&& other) noexcept;

  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;

  [[nodiscard]] const std::filesystem::path& temp_path() const noexcept { return temp_; }
  [[nodiscard]] const std::filesystem::path& destination() const noexcept {
    return destination_;
  }

  /// Renames the temporary file onto the destination. EncodeFailed if the
  /// temporary file is missing or the rename fails.
  [[nodiscard]] std::expected<std::filesystem::path, core::TransitionError> commit();

 private:
  void remove() noexcept;

  std::filesystem::path destination_;
  std::filesystem::path temp_;
  bool committed_{false};
};

}  // namespace transita::app
