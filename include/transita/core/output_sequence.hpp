#pragma once

#include <transita/core/frame.hpp>
#include <cstdint>
#include <vector>

namespace transita::core {

/// Finished transition: frames in index order, all width x height.
struct OutputSequence {
  std::vector<Frame> frames;
  std::uint32_t fps{30};
  std::uint32_t width{0};
  std::uint32_t height{0};
};

}  // namespace transita::core
