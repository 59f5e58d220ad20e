#include <transita/app/scoped_temp_file.hpp>
#include <spdlog/spdlog.h>
#include <system_error>
#include <utility>

namespace transita::app {

namespace {

std::filesystem::path partial_path_for(const std::filesystem::path& destination) {
  std::filesystem::path temp = destination;
  temp.replace_filename(destination.stem().string() + ".partial" +
                        destination.extension().string());
  return temp;
}

}  // namespace

ScopedTempFile::ScopedTempFile(std::filesystem::path destination)
    : destination_(std::move(destination)), temp_(partial_path_for(destination_)) {}

ScopedTempFile::~ScopedTempFile() noexcept {
  remove();
}

ScopedTempFile::ScopedTempFile(ScopedTempFile&& other) noexcept
    : destination_(std::move(other.destination_)),
      temp_(std::move(other.temp_)),
      committed_(std::exchange(other.committed_, true)) {}

ScopedTempFile& ScopedTempFile::operator=(ScopedTempFile&& other) noexcept {
  if (this != &other) {
    remove();
    destination_ = std::move(other.destination_);
    temp_ = std::move(other.temp_);
    committed_ = std::exchange(other.committed_, true);
  }
  return *this;
}

std::expected<std::filesystem::path, core::TransitionError> ScopedTempFile::commit() {
  std::error_code ec;
  if (!std::filesystem::exists(temp_, ec)) {
    spdlog::error("temporary output '{}' was not written", temp_.string());
    return std::unexpected(core::TransitionError::EncodeFailed);
  }
  std::filesystem::rename(temp_, destination_, ec);
  if (ec) {
    spdlog::error("cannot move '{}' to '{}': {}", temp_.string(), destination_.string(),
                  ec.message());
    return std::unexpected(core::TransitionError::EncodeFailed);
  }
  committed_ = true;
  return destination_;
}

void ScopedTempFile::remove() noexcept {
  if (committed_ || temp_.empty()) return;
  std::error_code ec;
  if (std::filesystem::remove(temp_, ec)) {
    spdlog::debug("removed temporary output '{}'", temp_.string());
  } else if (ec) {
    spdlog::warn("cannot remove temporary output '{}': {}", temp_.string(), ec.message());
  }
}

}  // namespace transita::app
