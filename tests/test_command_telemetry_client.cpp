#include "connection/wire_codec.hpp"
#include "hexrot/enums.hpp"
#include "hexrot/errors.hpp"
#include "hexrot/runtime_config.hpp"
#include "hexrot/simple_device.hpp"
#include "hexrot/simple_mock_controller.hpp"
#include "utils/logger.hpp"

#include "fake_controller.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <future>
#include <stdexcept>
#include <string>

using namespace std::chrono_literals;
using hexrot::ControllerState;
using hexrot::SetStateParam;
using hexrot::SimpleCommandCode;

static hexrot::MockConfig mock_config(ControllerState initial = ControllerState::OFFLINE) {
  hexrot::MockConfig cfg;
  cfg.host = "127.0.0.1";
  cfg.port = 0;
  cfg.initial_state = initial;
  cfg.telemetry_interval = hexrot::Seconds{0.05};
  return cfg;
}

static hexrot::ClientConfig client_config(uint16_t port) {
  hexrot::ClientConfig cfg;
  cfg.host = "127.0.0.1";
  cfg.port = port;
  cfg.connect_timeout = hexrot::Seconds{2.0};
  cfg.command_timeout = hexrot::Seconds{2.0};
  return cfg;
}

static double set_state(hexrot::SimpleClient& client, SetStateParam p) {
  return client.run_command(client.make_command(hexrot::to_underlying(SimpleCommandCode::SET_STATE),
                                                static_cast<double>(hexrot::to_underlying(p))));
}

static hexrot::SimpleTelemetry fresh_telemetry(hexrot::SimpleClient& client) {
  auto f = client.next_telemetry();
  assert(f.wait_for(2s) == std::future_status::ready);
  return f.get();
}

static void test_state_scenario() {
  hexrot::SimpleMockController mock(mock_config());
  assert(mock.start());

  hexrot::SimpleClient client(client_config(mock.port()));
  client.connect();
  assert(client.configured().wait_for(2s) == std::future_status::ready);
  assert(mock.wait_connected(2000ms));

  auto tel = fresh_telemetry(client);
  assert(tel.state == ControllerState::OFFLINE);
  assert(tel.offline_substate == hexrot::OfflineSubstate::AVAILABLE);
  assert(tel.application_status & hexrot::DDS_COMMAND_SOURCE);

  const auto cfg = client.config();
  assert(cfg && cfg->min_position == -25.0 && cfg->max_position == 25.0 && cfg->max_velocity == 47.0);

  // A rejected transition leaves the link and the state as they were.
  try {
    set_state(client, SetStateParam::ENABLE);
    assert(false);
  } catch (const hexrot::CommandRejected& e) {
    assert(e.reason().find("OFFLINE") != std::string::npos);
  }
  assert(client.connected());

  assert(set_state(client, SetStateParam::ENTER_CONTROL) == 0.0);
  assert(fresh_telemetry(client).state == ControllerState::STANDBY);
  assert(set_state(client, SetStateParam::START) == 0.0);
  assert(fresh_telemetry(client).state == ControllerState::DISABLED);
  assert(set_state(client, SetStateParam::ENABLE) == 0.0);
  tel = fresh_telemetry(client);
  assert(tel.state == ControllerState::ENABLED);
  assert(tel.enabled_substate == hexrot::EnabledSubstate::STATIONARY);

  // Commanded move shows up in telemetry; curr_position creeps each tick.
  assert(client.run_command(client.make_command(hexrot::to_underlying(SimpleCommandCode::MOVE), 5.0)) == 0.0);
  tel = fresh_telemetry(client);
  assert(tel.cmd_position == 5.0);
  assert(tel.curr_position > 5.0 && tel.curr_position < 5.5);

  // Externally detected fault, then recovery.
  mock.set_fault();
  assert(tests::wait_until([&] { return client.telemetry().state == ControllerState::FAULT; }));
  assert(set_state(client, SetStateParam::CLEAR_ERROR) == 0.0);
  assert(fresh_telemetry(client).state == ControllerState::STANDBY);

  client.close();
  mock.close();
}

static void test_rejected_reason_is_truncated() {
  hexrot::SimpleMockController mock(mock_config(ControllerState::ENABLED));
  assert(mock.start());
  hexrot::SimpleClient client(client_config(mock.port()));
  client.connect();
  assert(client.configured().wait_for(2s) == std::future_status::ready);

  const double before = mock.telemetry().cmd_position;
  try {
    (void)client.run_command(client.make_command(hexrot::to_underlying(SimpleCommandCode::MOVE), 100.0));
    assert(false);
  } catch (const hexrot::CommandRejected& e) {
    assert(e.reason().size() == connection::wire::kReasonSize);
    assert(e.reason() == "Commanded position 100 out of range [-25, 25]; ign");
  }
  assert(mock.telemetry().cmd_position == before);
  assert(client.connected());

  // Unknown command code: NO_ACK, link stays up.
  try {
    (void)client.run_command(client.make_command(42));
    assert(false);
  } catch (const hexrot::CommandRejected& e) {
    assert(e.reason().find("Unrecognized command code=42") != std::string::npos);
  }
  assert(client.connected());
}

static void test_config_vel_resends_config() {
  hexrot::SimpleMockController mock(mock_config(ControllerState::ENABLED));
  assert(mock.start());

  std::atomic<int> config_calls{0};
  hexrot::SimpleClient::Callbacks cb;
  cb.on_config = [&](const hexrot::SimpleConfig&) { config_calls.fetch_add(1); };
  hexrot::SimpleClient client(client_config(mock.port()), cb);
  client.connect();
  assert(client.configured().wait_for(2s) == std::future_status::ready);
  assert(config_calls.load() == 1);

  assert(client.run_command(client.make_command(hexrot::to_underlying(SimpleCommandCode::CONFIG_VEL), 12.0)) == 0.0);
  // The new Config precedes the command's status on the wire.
  assert(config_calls.load() == 2);
  assert(client.config()->max_velocity == 12.0);
  assert(mock.config().max_velocity == 12.0);

  try {
    (void)client.run_command(client.make_command(hexrot::to_underlying(SimpleCommandCode::CONFIG_VEL), 0.0));
    assert(false);
  } catch (const hexrot::CommandRejected&) {
  }
  assert(config_calls.load() == 2);
  assert(client.config()->max_velocity == 12.0);
}

static void test_throwing_callbacks() {
  hexrot::SimpleMockController mock(mock_config(ControllerState::ENABLED));
  assert(mock.start());

  std::atomic<int> config_calls{0};
  std::atomic<int> telemetry_calls{0};
  hexrot::SimpleClient::Callbacks cb;
  cb.on_config = [&](const hexrot::SimpleConfig&) {
    if (config_calls.fetch_add(1) == 0) throw std::runtime_error("first config refused");
  };
  cb.on_telemetry = [&](const hexrot::SimpleTelemetry&) {
    telemetry_calls.fetch_add(1);
    throw std::runtime_error("telemetry observer failure");
  };
  cb.on_connect = [](bool) { throw std::runtime_error("connect observer failure"); };

  const uint64_t errors_before = logger::count(logger::Level::Error);
  hexrot::SimpleClient client(client_config(mock.port()), cb);
  client.connect();
  assert(client.connected());

  // The first config callback threw, so configured() is still pending.
  assert(tests::wait_until([&] { return config_calls.load() == 1; }));
  assert(client.configured().wait_for(200ms) == std::future_status::timeout);

  // Telemetry keeps flowing despite the throwing callback.
  assert(tests::wait_until([&] { return telemetry_calls.load() >= 3; }));
  assert(client.connected());
  assert(logger::count(logger::Level::Error) > errors_before);

  assert(client.run_command(client.make_command(hexrot::to_underlying(SimpleCommandCode::CONFIG_VEL), 3.0)) == 0.0);
  assert(client.configured().wait_for(2s) == std::future_status::ready);
  client.configured().get();
  assert(config_calls.load() == 2);
}

static void test_drop_versus_close() {
  hexrot::SimpleMockController mock(mock_config());
  assert(mock.start());

  std::atomic<int> disconnects{0};
  hexrot::SimpleClient::Callbacks cb;
  cb.on_connect = [&](bool connected) {
    if (!connected) disconnects.fetch_add(1);
  };
  hexrot::SimpleClient client(client_config(mock.port()), cb);
  client.connect();
  assert(mock.wait_connected(2000ms));
  (void)fresh_telemetry(client);

  mock.close_client();
  assert(tests::wait_until([&] { return !client.connected(); }));
  assert(client.should_be_connected());
  assert(tests::wait_until([&] { return disconnects.load() == 1; }));

  client.close();
  assert(!client.should_be_connected());
  assert(disconnects.load() == 1);

  // The mock accepts a new link after the old one is gone.
  hexrot::SimpleClient again(client_config(mock.port()));
  again.connect();
  assert(again.configured().wait_for(2s) == std::future_status::ready);
  assert(set_state(again, SetStateParam::ENTER_CONTROL) == 0.0);
}

static void test_second_client_rejected() {
  hexrot::SimpleMockController mock(mock_config());
  assert(mock.start());

  hexrot::SimpleClient first(client_config(mock.port()));
  first.connect();
  assert(first.configured().wait_for(2s) == std::future_status::ready);

  // TCP accepts the second link, then the controller hangs up on it.
  hexrot::SimpleClient second(client_config(mock.port()));
  second.connect();
  assert(tests::wait_until([&] { return !second.connected(); }));
  assert(second.should_be_connected());
  assert(second.telemetry_count() == 0);

  // The first link is unaffected.
  assert(first.connected());
  assert(set_state(first, SetStateParam::ENTER_CONTROL) == 0.0);
  assert(mock.state() == ControllerState::STANDBY);
}

static void test_batch_and_basic_close() {
  hexrot::SimpleMockController mock(mock_config());
  assert(mock.start());
  hexrot::SimpleClient client(client_config(mock.port()));
  client.connect();
  assert(client.configured().wait_for(2s) == std::future_status::ready);

  const auto code = hexrot::to_underlying(SimpleCommandCode::SET_STATE);
  const auto durations = client.run_commands(
    {client.make_command(code, static_cast<double>(hexrot::to_underlying(SetStateParam::ENTER_CONTROL))),
     client.make_command(code, static_cast<double>(hexrot::to_underlying(SetStateParam::START))),
     client.make_command(code, static_cast<double>(hexrot::to_underlying(SetStateParam::ENABLE)))},
    hexrot::Seconds{0.01});
  assert(durations.size() == 3);
  assert(mock.state() == ControllerState::ENABLED);

  // A batch stops at the first rejected command.
  try {
    (void)client.run_commands(
      {client.make_command(code, static_cast<double>(hexrot::to_underlying(SetStateParam::EXIT))),
       client.make_command(code, static_cast<double>(hexrot::to_underlying(SetStateParam::DISABLE)))});
    assert(false);
  } catch (const hexrot::CommandRejected&) {
  }
  assert(mock.state() == ControllerState::ENABLED);

  client.basic_close();
  assert(!client.connected());
  assert(client.should_be_connected());
  assert(tests::wait_until([&] { return !mock.connected(); }));
}

static void test_finished_sessions_are_joined() {
  hexrot::SimpleMockController mock(mock_config());
  assert(mock.start());

  for (int i = 0; i < 5; ++i) {
    hexrot::SimpleClient client(client_config(mock.port()));
    client.connect();
    assert(client.configured().wait_for(2s) == std::future_status::ready);
    // Each session is reaped once a later client is adopted.
    assert(mock.session_count() <= 2);
    client.close();
    assert(tests::wait_until([&] { return !mock.connected(); }));
  }
  assert(mock.session_count() <= 2);
  mock.close();
  assert(mock.session_count() == 0);
}

int main() {
  logger::set_print_level(logger::Level::Error);
  test_state_scenario();
  test_rejected_reason_is_truncated();
  test_config_vel_resends_config();
  test_throwing_callbacks();
  test_drop_versus_close();
  test_second_client_rejected();
  test_batch_and_basic_close();
  test_finished_sessions_are_joined();
  logger::close_logger();
  return 0;
}
