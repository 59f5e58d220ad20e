/**
 * transita-cli: render a transition between two media files, chain several
 * files, or inspect the registered effects.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/transita_cli --input a.mp4 --input b.png --effect warp --output out.mp4
 *        ./build/transita_cli --list | --describe <effect>
 */

#include <transita/app/config.hpp>
#include <transita/app/logging.hpp>
#include <transita/app/transition_processor.hpp>
#include <transita/core/parameter.hpp>
#include <transita/core/transition_factory.hpp>
#include <transita/core/transition_registry.hpp>
#include <transita/transitions/builtin_transitions.hpp>
#include <transita/vision/encoder.hpp>
#include <transita/vision/media_decoder.hpp>

#include <atomic>
#include <charconv>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

std::atomic<bool> g_cancel{false};

extern "C" void on_interrupt(int) {
  g_cancel.store(true);
}

template <typename T>
std::optional<T> parse_number(std::string_view text) {
  T value{};
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) return std::nullopt;
  return value;
}

void print_usage() {
  std::cout << "Usage: transita_cli [options]\n"
            << "  --list                 List effects by category\n"
            << "  --describe <effect>    Show an effect's parameters\n"
            << "  --config <path>        Config file (key=value); default: built-in\n"
            << "  --input <path>         Input image or video; repeat (>= 2)\n"
            << "  --effect <name>        Effect; repeat once per step when chaining\n"
            << "  --output <path>        Output file (2 inputs) or directory (chain)\n"
            << "  --frames <n>           Frames in the transition [1, 300]\n"
            << "  --fps <n>              Output frame rate [15, 60]\n"
            << "  --width <n>            Output width [320, 3840]\n"
            << "  --height <n>           Output height [240, 2160]\n"
            << "  --param <key=value>    Effect parameter; repeatable\n"
            << "  --workers <n>          Worker threads (0 = hardware concurrency)\n"
            << "  --log-level <level>    trace | debug | info | warn | err | off\n";
}

void print_list(const transita::core::TransitionFactory& factory) {
  for (const auto& category : factory.list_categories()) {
    std::cout << category << ":\n";
    for (const auto& name : factory.list_by_category(category)) {
      std::cout << "  " << name << "\n";
    }
  }
}

int print_description(const transita::core::TransitionFactory& factory,
                      const std::string& name) {
  auto descriptor = factory.describe(name);
  if (!descriptor) {
    std::cerr << "Unknown effect: " << name << "\n";
    return 1;
  }
  std::cout << descriptor->name << " [" << descriptor->category << "]\n";
  for (const auto& spec : descriptor->schema) {
    std::cout << "  " << spec.name << " (" << transita::core::to_string(spec.type)
              << ", default " << transita::core::to_string(spec.default_value);
    if (spec.min && spec.max) std::cout << ", range [" << *spec.min << ", " << *spec.max << "]";
    if (!spec.choices.empty()) {
      std::cout << ", one of";
      for (const auto& choice : spec.choices) std::cout << " " << choice;
    }
    std::cout << ")";
    if (!spec.description.empty()) std::cout << "  " << spec.description;
    std::cout << "\n";
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string describe_name;
  std::string output;
  std::string log_level;
  bool list = false;
  std::vector<std::filesystem::path> inputs;
  std::vector<std::string> effects;
  std::vector<std::pair<std::string, std::string>> params;
  std::optional<std::uint32_t> frames;
  std::optional<std::uint32_t> fps;
  std::optional<std::uint32_t> width;
  std::optional<std::uint32_t> height;
  std::optional<std::size_t> workers;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else if (arg == "--list") {
      list = true;
    } else if (arg == "--describe" && has_value) {
      describe_name = argv[++i];
    } else if (arg == "--config" && has_value) {
      config_path = argv[++i];
    } else if (arg == "--input" && has_value) {
      inputs.emplace_back(argv[++i]);
    } else if (arg == "--effect" && has_value) {
      effects.emplace_back(argv[++i]);
    } else if (arg == "--output" && has_value) {
      output = argv[++i];
    } else if (arg == "--log-level" && has_value) {
      log_level = argv[++i];
    } else if (arg == "--param" && has_value) {
      const std::string kv = argv[++i];
      const auto eq = kv.find('=');
      if (eq == std::string::npos || eq == 0) {
        std::cerr << "--param expects key=value, got " << kv << "\n";
        return 2;
      }
      params.emplace_back(kv.substr(0, eq), kv.substr(eq + 1));
    } else if ((arg == "--frames" || arg == "--fps" || arg == "--width" ||
                arg == "--height" || arg == "--workers") &&
               has_value) {
      const std::string value = argv[++i];
      const auto n = parse_number<std::uint32_t>(value);
      if (!n) {
        std::cerr << arg << " expects a non-negative integer, got " << value << "\n";
        return 2;
      }
      if (arg == "--frames") frames = n;
      else if (arg == "--fps") fps = n;
      else if (arg == "--width") width = n;
      else if (arg == "--height") height = n;
      else workers = *n;
    } else {
      std::cerr << "Unknown or incomplete option: " << arg << "\n";
      print_usage();
      return 2;
    }
  }

  transita::app::ProcessorConfig cfg = config_path.empty()
                                           ? transita::app::default_config()
                                           : transita::app::load_config(config_path);
  if (!log_level.empty()) cfg.log_level = log_level;
  if (workers) cfg.workers = *workers;
  if (auto logging = transita::app::init_logging(cfg.log_level, cfg.log_file); !logging) {
    std::cerr << "Logging setup failed: " << transita::core::to_string(logging.error()) << "\n";
    return 1;
  }

  transita::core::TransitionRegistry registry;
  if (auto registered = transita::transitions::register_builtin_transitions(registry);
      !registered) {
    std::cerr << "Effect registration failed: "
              << transita::core::to_string(registered.error()) << "\n";
    return 1;
  }
  const transita::core::TransitionFactory factory(registry);

  if (list) {
    print_list(factory);
    return 0;
  }
  if (!describe_name.empty()) {
    return print_description(factory, describe_name);
  }

  if (inputs.size() < 2) {
    std::cerr << "At least two --input files are required\n";
    print_usage();
    return 2;
  }

  transita::core::TransitionRequest request = transita::app::default_request(cfg);
  if (frames) request.total_frames = *frames;
  if (fps) request.fps = *fps;
  if (width) request.width = *width;
  if (height) request.height = *height;
  for (const auto& [key, value] : params) {
    request.params[key] = value;
  }
  if (effects.empty()) effects.push_back(cfg.default_effect);
  request.effect = effects.front();

  transita::app::TransitionProcessor processor(
      factory, std::make_shared<transita::vision::OpenCvMediaDecoder>(),
      std::make_shared<transita::vision::OpenCvVideoEncoder>(),
      transita::app::ProcessorOptions{cfg.parallel, cfg.workers});

  std::signal(SIGINT, on_interrupt);

  if (inputs.size() == 2 && effects.size() == 1) {
    const std::filesystem::path out_file =
        output.empty() ? std::filesystem::path(cfg.output_dir) /
                             (request.effect + "_transition.mp4")
                       : std::filesystem::path(output);
    auto written = processor.render(inputs[0], inputs[1], request, out_file, &g_cancel);
    if (!written) {
      std::cerr << "Transition failed: " << transita::core::to_string(written.error()) << "\n";
      return 1;
    }
    std::cout << written->string() << "\n";
    return 0;
  }

  // Chain: one effect applies to every step.
  if (effects.size() == 1) effects.assign(inputs.size() - 1, effects.front());
  const std::filesystem::path out_dir = output.empty() ? cfg.output_dir : output;
  auto written = processor.render_chain(inputs, effects, request, out_dir, &g_cancel);
  if (!written) {
    std::cerr << "Transition chain failed: " << transita::core::to_string(written.error())
              << "\n";
    return 1;
  }
  for (const auto& path : *written) {
    std::cout << path.string() << "\n";
  }
  return 0;
}
