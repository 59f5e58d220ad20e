#include <transita/app/logging.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <vector>

namespace transita::app {

std::expected<void, core::TransitionError> init_logging(const std::string& level,
                                                        const std::string& log_file) {
  const auto parsed = spdlog::level::from_str(level);
  if (parsed == spdlog::level::off && level != "off") {
    spdlog::error("unknown log level '{}'", level);
    return std::unexpected(core::TransitionError::InvalidConfig);
  }

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!log_file.empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
    } catch (const spdlog::spdlog_ex& ex) {
      spdlog::error("cannot open log file '{}': {}", log_file, ex.what());
      return std::unexpected(core::TransitionError::InvalidConfig);
    }
  }

  auto logger = std::make_shared<spdlog::logger>("transita", sinks.begin(), sinks.end());
  logger->set_level(parsed);
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");
  spdlog::set_default_logger(logger);
  return {};
}

}  // namespace transita::app
