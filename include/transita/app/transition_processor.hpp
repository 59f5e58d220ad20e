#pragma once

#include <transita/core/error.hpp>
#include <transita/core/frame_source.hpp>
#include <transita/core/output_sequence.hpp>
#include <transita/core/transition_factory.hpp>
#include <transita/core/transition_request.hpp>
#include <transita/vision/encoder.hpp>
#include <transita/vision/media_decoder.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace transita::app {

struct ProcessorOptions {
  bool parallel{true};
  std::size_t workers{0};  // 0 = hardware concurrency; ignored with TBB
};

/// (frames_done, total_frames). May be invoked from worker threads; must be
/// thread-safe.
using ProgressCallback = std::function<void(std::uint32_t, std::uint32_t)>;

/// Runs a transition between two media sources.
///
/// Frames are computed independently (in parallel when enabled) into
/// pre-sized slots, so the sequence comes back in index order. A raised
/// cancel flag is honoured before every frame.
class TransitionProcessor {
 public:
  /// The factory must outlive the processor.
  TransitionProcessor(const core::TransitionFactory& factory,
                      std::shared_ptr<vision::IMediaDecoder> decoder,
                      std::shared_ptr<vision::IEncoder> encoder,
                      ProcessorOptions options = {});

  void set_progress_callback(ProgressCallback callback) { progress_ = std::move(callback); }

  /// Decode \p path. MediaLoadFailed when missing, a directory or undecodable.
  [[nodiscard]] std::expected<std::unique_ptr<core::IFrameSource>, core::TransitionError> load(
      const std::filesystem::path& path) const;

  /// Validate the request, create request.effect, resolve its params, then
  /// compute request.total_frames frames of request.width x request.height.
  /// Samples of source2 are converted to source1's pixel format.
  [[nodiscard]] std::expected<core::OutputSequence, core::TransitionError> process(
      const core::IFrameSource& source1,
      const core::IFrameSource& source2,
      const core::TransitionRequest& request,
      const std::atomic<bool>* cancel = nullptr) const;

  /// load + process + encode. The encoder writes into a temporary file next
  /// to \p output_path that is renamed into place on success and removed on
  /// every failure or cancellation.
  [[nodiscard]] std::expected<std::filesystem::path, core::TransitionError> render(
      const std::filesystem::path& input1,
      const std::filesystem::path& input2,
      const core::TransitionRequest& request,
      const std::filesystem::path& output_path,
      const std::atomic<bool>* cancel = nullptr) const;

  /// Joins N inputs with N-1 transitions: step k renders the previous
  /// step's output (or inputs[0]) into inputs[k+1] with effects[k]. Returns
  /// every step's output; the last one is the full chain. request.effect is
  /// ignored. InvalidConfig for fewer than two inputs or a wrong effect
  /// count; UnknownEffect before any work if an effect is not registered.
  [[nodiscard]] std::expected<std::vector<std::filesystem::path>, core::TransitionError>
  render_chain(const std::vector<std::filesystem::path>& inputs,
               const std::vector<std::string>& effects,
               const core::TransitionRequest& request,
               const std::filesystem::path& output_dir,
               const std::atomic<bool>* cancel = nullptr) const;

 private:
  void run_frames(std::size_t count, const std::function<void(std::size_t)>& task) const;

  const core::TransitionFactory& factory_;
  std::shared_ptr<vision::IMediaDecoder> decoder_;
  std::shared_ptr<vision::IEncoder> encoder_;
  ProcessorOptions options_;
  ProgressCallback progress_;
};

}  // namespace transita::app
