#pragma once

#include <transita/core/error.hpp>
#include <expected>
#include <string>

namespace transita::app {

/// Installs the default spdlog logger: a colored console sink plus, when
/// \p log_file is non-empty, a file sink (appending). \p level is an spdlog
/// level name (trace, debug, info, warn, err, critical, off).
/// InvalidConfig for an unknown level or a file sink that cannot be opened.
[[nodiscard]] std::expected<void, core::TransitionError> init_logging(
    const std::string& level, const std::string& log_file = {});

}  // namespace transita::app
