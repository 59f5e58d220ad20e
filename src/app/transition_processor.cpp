#include <transita/app/transition_processor.hpp>
#include <transita/app/frame_runner.hpp>
#include <transita/app/frame_runner_tbb.hpp>
#include <transita/app/scoped_temp_file.hpp>
#include <transita/core/transition.hpp>
#include <transita/vision/color_convert.hpp>
#include <transita/vision/resize.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <iterator>
#include <system_error>
#include <utility>

namespace transita::app {

namespace {

bool cancelled(const std::atomic<bool>* cancel) {
  return cancel != nullptr && cancel->load(std::memory_order_relaxed);
}

}  // namespace

TransitionProcessor::TransitionProcessor(const core::TransitionFactory& factory,
                                         std::shared_ptr<vision::IMediaDecoder> decoder,
                                         std::shared_ptr<vision::IEncoder> encoder,
                                         ProcessorOptions options)
    : factory_(factory),
      decoder_(std::move(decoder)),
      encoder_(std::move(encoder)),
      options_(options) {}

std::expected<std::unique_ptr<core::IFrameSource>, core::TransitionError>
TransitionProcessor::load(const std::filesystem::path& path) const {
  if (!decoder_) {
    spdlog::error("no media decoder configured");
    return std::unexpected(core::TransitionError::MediaLoadFailed);
  }
  auto source = decoder_->open(path);
  if (!source) {
    spdlog::error("cannot load '{}': {}", path.string(), core::to_string(source.error()));
    return std::unexpected(source.error());
  }
  spdlog::debug("loaded '{}' ({} frames)", path.string(), (*source)->size());
  return source;
}

void TransitionProcessor::run_frames(std::size_t count,
                                     const std::function<void(std::size_t)>& task) const {
  if (!options_.parallel) {
    run_indexed(count, task);
    return;
  }
#ifdef TRANSITA_HAS_TBB
  run_indexed_tbb(count, task);
#else
  run_indexed_parallel(count, task, options_.workers);
#endif
}

std::expected<core::OutputSequence, core::TransitionError> TransitionProcessor::process(
    const core::IFrameSource& source1,
    const core::IFrameSource& source2,
    const core::TransitionRequest& request,
    const std::atomic<bool>* cancel) const {
  if (auto valid = core::validate_request(request); !valid) {
    return std::unexpected(valid.error());
  }
  auto transition = factory_.create(request.effect);
  if (!transition) {
    spdlog::error("unknown effect '{}'", request.effect);
    return std::unexpected(transition.error());
  }
  // Fail on bad params before any frame is computed.
  if (auto resolved = core::resolve_transition_params(**transition, request.params); !resolved) {
    return std::unexpected(resolved.error());
  }
  if (cancelled(cancel)) {
    return std::unexpected(core::TransitionError::Cancelled);
  }

  const std::uint32_t total = request.total_frames;
  spdlog::info("{}: {} frames at {}x{}, {} fps", request.effect, total, request.width,
               request.height, request.fps);

  const core::ITransition& algorithm = **transition;
  std::vector<core::Frame> slots(total);
  std::vector<core::TransitionError> errors(total, core::TransitionError::None);
  std::atomic<bool> failed{false};
  std::atomic<std::uint32_t> done{0};

  const auto compute = [&](std::size_t index) {
    if (failed.load(std::memory_order_relaxed)) return;
    if (cancelled(cancel)) {
      errors[index] = core::TransitionError::Cancelled;
      failed = true;
      return;
    }
    const auto i = static_cast<std::uint32_t>(index);
    const double p = core::progress_at(i, total);
    auto frame1 = vision::resize_frame(source1.at(p), request.width, request.height);
    auto frame2 = vision::resize_frame(source2.at(p), request.width, request.height);
    if (!frame1 || !frame2) {
      errors[index] = frame1 ? frame2.error() : frame1.error();
      failed = true;
      return;
    }
    // Sources may differ in channel order or alpha; frame1's format wins.
    if (frame2->format() != frame1->format()) {
      frame2 = vision::convert_format(*frame2, frame1->format());
      if (!frame2) {
        errors[index] = frame2.error();
        failed = true;
        return;
      }
    }
    auto out = algorithm.apply(*frame1, *frame2, i, total, request.fps, request.params);
    if (!out) {
      errors[index] = out.error();
      failed = true;
      return;
    }
    if (out->width() != request.width || out->height() != request.height ||
        out->format() != frame1->format()) {
      spdlog::error("{}: frame {} came back {}x{}, expected {}x{}", request.effect, i,
                    out->width(), out->height(), request.width, request.height);
      errors[index] = core::TransitionError::FrameDimensionMismatch;
      failed = true;
      return;
    }
    slots[index] = std::move(*out);
    const std::uint32_t n = done.fetch_add(1) + 1;
    if (progress_) progress_(n, total);
    if (n % 10 == 0 || n == total) {
      spdlog::debug("{}: {}/{} frames", request.effect, n, total);
    }
  };

  run_frames(total, compute);

  if (failed) {
    // Cancellation wins; otherwise report the lowest failing index.
    if (std::find(errors.begin(), errors.end(), core::TransitionError::Cancelled) !=
        errors.end()) {
      spdlog::info("{}: cancelled", request.effect);
      return std::unexpected(core::TransitionError::Cancelled);
    }
    const auto it = std::find_if(errors.begin(), errors.end(), [](core::TransitionError e) {
      return e != core::TransitionError::None;
    });
    const core::TransitionError error =
        it != errors.end() ? *it : core::TransitionError::Cancelled;
    spdlog::error("{}: frame {} failed: {}", request.effect,
                  std::distance(errors.begin(), it), core::to_string(error));
    return std::unexpected(error);
  }

  core::OutputSequence sequence;
  sequence.frames = std::move(slots);
  sequence.fps = request.fps;
  sequence.width = request.width;
  sequence.height = request.height;
  return sequence;
}

std::expected<std::filesystem::path, core::TransitionError> TransitionProcessor::render(
    const std::filesystem::path& input1,
    const std::filesystem::path& input2,
    const core::TransitionRequest& request,
    const std::filesystem::path& output_path,
    const std::atomic<bool>* cancel) const {
  auto source1 = load(input1);
  if (!source1) return std::unexpected(source1.error());
  auto source2 = load(input2);
  if (!source2) return std::unexpected(source2.error());

  auto sequence = process(**source1, **source2, request, cancel);
  if (!sequence) return std::unexpected(sequence.error());

  if (!encoder_) {
    spdlog::error("no encoder configured");
    return std::unexpected(core::TransitionError::EncodeFailed);
  }
  if (output_path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(output_path.parent_path(), ec);
    if (ec) {
      spdlog::error("cannot create '{}': {}", output_path.parent_path().string(), ec.message());
      return std::unexpected(core::TransitionError::EncodeFailed);
    }
  }

  ScopedTempFile temp(output_path);
  auto written = encoder_->write(*sequence, request.fps, request.width, request.height,
                                 temp.temp_path());
  if (!written) {
    spdlog::error("encoding '{}' failed", output_path.string());
    return std::unexpected(written.error());
  }
  if (cancelled(cancel)) {
    return std::unexpected(core::TransitionError::Cancelled);
  }
  auto committed = temp.commit();
  if (!committed) return std::unexpected(committed.error());
  spdlog::info("wrote {}", committed->string());
  return committed;
}

std::expected<std::vector<std::filesystem::path>, core::TransitionError>
TransitionProcessor::render_chain(const std::vector<std::filesystem::path>& inputs,
                                  const std::vector<std::string>& effects,
                                  const core::TransitionRequest& request,
                                  const std::filesystem::path& output_dir,
                                  const std::atomic<bool>* cancel) const {
  if (inputs.size() < 2 || effects.size() != inputs.size() - 1) {
    spdlog::error("chain needs N >= 2 inputs and N-1 effects, got {} and {}", inputs.size(),
                  effects.size());
    return std::unexpected(core::TransitionError::InvalidConfig);
  }
  for (const auto& effect : effects) {
    if (auto t = factory_.create(effect); !t) {
      spdlog::error("unknown effect '{}' in chain", effect);
      return std::unexpected(t.error());
    }
  }

  std::vector<std::filesystem::path> outputs;
  outputs.reserve(effects.size());
  std::filesystem::path current = inputs.front();
  for (std::size_t k = 0; k < effects.size(); ++k) {
    core::TransitionRequest step = request;
    step.effect = effects[k];
    const auto destination = output_dir / fmt::format("{:02}_{}.mp4", k + 1, effects[k]);
    spdlog::info("chain step {}/{}: {}", k + 1, effects.size(), effects[k]);
    auto written = render(current, inputs[k + 1], step, destination, cancel);
    if (!written) return std::unexpected(written.error());
    outputs.push_back(*written);
    current = *written;
  }
  return outputs;
}

}  // namespace transita::app
