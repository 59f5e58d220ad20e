#include <transita/app/config.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <fstream>
#include <string_view>

namespace transita::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

template <typename T>
void parse_number(const std::string& key, const std::string& value, T& out) {
  T parsed{};
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (ec != std::errc() || ptr != value.data() + value.size()) {
    spdlog::warn("config: ignoring {}={} (not a number)", key, value);
    return;
  }
  out = parsed;
}

void parse_bool(const std::string& key, const std::string& value, bool& out) {
  if (value == "true" || value == "1" || value == "yes" || value == "on") {
    out = true;
  } else if (value == "false" || value == "0" || value == "no" || value == "off") {
    out = false;
  } else {
    spdlog::warn("config: ignoring {}={} (not a boolean)", key, value);
  }
}

}  // namespace

ProcessorConfig default_config() {
  return ProcessorConfig{};
}

ProcessorConfig load_config(const std::string& path) {
  ProcessorConfig c = default_config();
  std::ifstream f(path);
  if (!f) {
    spdlog::warn("config: cannot open '{}', using defaults", path);
    return c;
  }

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "output_dir") c.output_dir = value;
    else if (key == "workers") parse_number(key, value, c.workers);
    else if (key == "parallel") parse_bool(key, value, c.parallel);
    else if (key == "log_level") c.log_level = value;
    else if (key == "log_file") c.log_file = value;
    else if (key == "default_total_frames") parse_number(key, value, c.default_total_frames);
    else if (key == "default_fps") parse_number(key, value, c.default_fps);
    else if (key == "default_width") parse_number(key, value, c.default_width);
    else if (key == "default_height") parse_number(key, value, c.default_height);
    else if (key == "default_effect") c.default_effect = value;
    else spdlog::warn("config: unknown key '{}'", key);
  }
  return c;
}

core::TransitionRequest default_request(const ProcessorConfig& config) {
  core::TransitionRequest request;
  request.effect = config.default_effect;
  request.total_frames = config.default_total_frames;
  request.fps = config.default_fps;
  request.width = config.default_width;
  request.height = config.default_height;
  return request;
}

}  // namespace transita::app
