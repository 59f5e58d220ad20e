#pragma once

#include <transita/core/transition_request.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

namespace transita::app {

/// Processor and front-end configuration.
struct ProcessorConfig {
  std::string output_dir{"output"};
  std::size_t workers{0};  // 0 = hardware concurrency
  bool parallel{true};
  std::string log_level{"info"};
  std::string log_file;  // empty = console only
  std::uint32_t default_total_frames{30};
  std::uint32_t default_fps{30};
  std::uint32_t default_width{640};
  std::uint32_t default_height{640};
  std::string default_effect{"crossfade"};
};

/// Load config from a simple key=value file (one per line, '#' comments).
/// Missing file -> defaults. Unknown keys and unparsable values are logged
/// and skipped.
ProcessorConfig load_config(const std::string& path);

/// Default config when no file is provided.
ProcessorConfig default_config();

/// Request pre-filled with the config's default effect and geometry.
[[nodiscard]] core::TransitionRequest default_request(const ProcessorConfig& config);

}  // namespace transita::app
