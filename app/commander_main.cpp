#include "hexrot/enums.hpp"
#include "hexrot/errors.hpp"
#include "hexrot/runtime_config.hpp"
#include "hexrot/simple_device.hpp"

#include "utils/logger.hpp"

#include "helpper.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <future>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

static void print_help(const char* argv0) {
  std::printf(
    "Usage: %s [options]\n"
    "  --host 127.0.0.1\n"
    "  --port 5570\n"
    "  --connect_timeout 10\n"
    "  --command_timeout 5\n"
    "  --log_level debug|info|warn|error\n"
    "  --log_dir ./logs/hexrot  (enables log files)\n",
    argv0
  );
}

static void print_commands() {
  std::printf(
    "Commands:\n"
    "  enter_control | start | enable | disable | standby | exit | clear_error\n"
    "  move <position>\n"
    "  config_vel <max_velocity>\n"
    "  telemetry                (wait for the next telemetry)\n"
    "  config\n"
    "  help\n"
    "  quit\n"
  );
}

static bool set_state_param(std::string_view word, hexrot::SetStateParam& out) {
  using P = hexrot::SetStateParam;
  if (word == "enter_control") out = P::ENTER_CONTROL;
  else if (word == "start") out = P::START;
  else if (word == "enable") out = P::ENABLE;
  else if (word == "disable") out = P::DISABLE;
  else if (word == "standby") out = P::STANDBY;
  else if (word == "exit") out = P::EXIT;
  else if (word == "clear_error") out = P::CLEAR_ERROR;
  else return false;
  return true;
}

static void run(hexrot::SimpleClient& client, const connection::wire::Command& cmd) {
  try {
    const double duration = client.run_command(cmd);
    std::printf("ACK (duration %.3f s)\n", duration);
  } catch (const hexrot::CommandRejected& e) {
    std::printf("NO_ACK: %s\n", e.reason().c_str());
  } catch (const hexrot::CommandTimeout& e) {
    std::printf("Timeout: %s\n", e.what());
  }
}

int main(int argc, char** argv) {
  hexrot::ClientConfig cfg;

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
    else if (a == "--connect_timeout") cfg.connect_timeout = hexrot::Seconds{std::stod(std::string(need(a)))};
    else if (a == "--command_timeout") cfg.command_timeout = hexrot::Seconds{std::stod(std::string(need(a)))};
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

#ifdef SIGPIPE
  std::signal(SIGPIPE, SIG_IGN); // a dropped controller must not kill the commander
#endif

  hexrot::SimpleClient::Callbacks callbacks;
  callbacks.on_connect = [](bool connected) {
    logger::info() << "[MAIN] " << (connected ? "connected" : "disconnected") << "\n";
  };
  callbacks.on_config = [](const hexrot::SimpleConfig& c) {
    logger::info() << "[MAIN] config: " << helpper::to_string(c) << "\n";
  };

  hexrot::SimpleClient client(cfg, callbacks);
  try {
    client.connect();
  } catch (const hexrot::TransportError& e) {
    logger::error() << "[MAIN] " << e.what() << "\n";
    logger::close_logger();
    return 1;
  }

  print_commands();
  std::string line;
  while (std::printf("> "), std::fflush(stdout), std::getline(std::cin, line)) {
    std::istringstream in(line);
    std::string word;
    if (!(in >> word)) continue;

    try {
      hexrot::SetStateParam param{};
      if (word == "quit") break;
      else if (word == "help") print_commands();
      else if (set_state_param(word, param)) {
        run(client, client.make_command(hexrot::to_underlying(hexrot::SimpleCommandCode::SET_STATE),
                                                   static_cast<double>(hexrot::to_underlying(param))));
      }
      else if (word == "move" || word == "config_vel") {
        double value = 0.0;
        if (!(in >> value)) {
          std::printf("%s needs a numeric argument\n", word.c_str());
          continue;
        }
        const auto code = (word == "move") ? hexrot::SimpleCommandCode::MOVE : hexrot::SimpleCommandCode::CONFIG_VEL;
        run(client, client.make_command(hexrot::to_underlying(code), value));
      }
      else if (word == "telemetry") {
        auto next = client.next_telemetry();
        if (next.wait_for(std::chrono::seconds(2)) != std::future_status::ready) {
          std::printf("No telemetry within 2 s\n");
          continue;
        }
        std::printf("%s\n", helpper::to_string(next.get()).c_str());
      }
      else if (word == "config") {
        const auto c = client.config();
        std::printf("%s\n", c ? helpper::to_string(*c).c_str() : "no config yet");
      }
      else {
        std::printf("Unknown command '%s'; type help\n", word.c_str());
      }
    } catch (const hexrot::TransportError& e) {
      logger::error() << "[MAIN] " << e.what() << "\n";
      break;
    }
  }

  client.close();
  logger::info() << "[MAIN] Shutdown complete.\n";
  logger::close_logger();
  return 0;
}
