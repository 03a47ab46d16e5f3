#include "hexrot/runtime_config.hpp"
#include "hexrot/simple_mock_controller.hpp"
#include "hexrot/stop_flag.hpp"

#include "utils/logger.hpp"
#include "utils/signal_handler.hpp"

#include "helpper.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>
#include <thread>

static void print_help(const char* argv0) {
  std::printf(
    "Usage: %s [options]\n"
    "  --host 127.0.0.1\n"
    "  --port 5570              (0 = ephemeral)\n"
    "  --initial_state offline|standby|disabled|enabled|fault\n"
    "  --telemetry_hz 10\n"
    "  --log_level debug|info|warn|error\n"
    "  --log_dir ./logs/hexrot  (enables log files)\n",
    argv0
  );
}

int main(int argc, char** argv) {
  hexrot::MockConfig cfg;
  cfg.port = 5570;

  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];
    auto need = [&](std::string_view name) -> std::string_view {
      if (i + 1 >= argc) {
        logger::error() << "Missing value for " << name << "\n";
        std::exit(2);
      }
      return argv[++i];
    };

    if (a == "--host") cfg.host = std::string(need(a));
    else if (a == "--port") cfg.port = static_cast<uint16_t>(std::stoi(std::string(need(a))));
    else if (a == "--initial_state") {
      if (!hexrot::parse_controller_state(need(a), cfg.initial_state)) {
        logger::error() << "Invalid --initial_state\n";
        return 2;
      }
    }
    else if (a == "--telemetry_hz") {
      const double hz = std::stod(std::string(need(a)));
      if (hz <= 0.0) {
        logger::error() << "Invalid --telemetry_hz\n";
        return 2;
      }
      cfg.telemetry_interval = hexrot::Seconds{1.0 / hz};
    }
    else if (a == "--log_level") {
      logger::Level level{};
      if (!logger::parse_level(need(a), level)) {
        logger::error() << "Invalid --log_level\n";
        return 2;
      }
      logger::set_print_level(level);
    }
    else if (a == "--log_dir") logger::set_logs_dir(std::string(need(a)));

    else if (a == "--help") { print_help(argv[0]); return 0; }
    else {
      logger::error() << "Unknown arg: " << a << "\n";
      print_help(argv[0]);
      return 2;
    }
  }

  hexrot::StopFlag stop;
  utils::SignalHandler sig(stop);

  hexrot::SimpleMockController ctrl(cfg);
  if (!ctrl.start()) {
    logger::close_logger();
    return 1;
  }

  logger::info() << "[MAIN] Mock controller on " << cfg.host << ":" << ctrl.port() << "\n";

  helpper::Print print(5.0);
  while (!stop.stop_requested()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    if (print.check()) {
      logger::info() << "[MAIN] connected=" << ctrl.connected() << " "
                     << helpper::to_string(ctrl.telemetry()) << "\n";
    }
  }

  ctrl.close();
  logger::info() << "[MAIN] Shutdown complete.\n";
  logger::close_logger();
  return 0;
}
