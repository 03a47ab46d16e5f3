#include "connection/one_client_server.hpp"
#include "connection/tcp_socket.hpp"
#include "utils/logger.hpp"

#include "fake_controller.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <stdexcept>

using namespace std::chrono_literals;

static void test_single_client_and_transitions() {
  std::atomic<int> connects{0};
  std::atomic<int> disconnects{0};
  connection::OneClientServer server("test", "127.0.0.1", 0, [&](bool connected) {
    (connected ? connects : disconnects).fetch_add(1);
  });
  assert(server.start());
  assert(server.port() != 0);
  assert(!server.connected());
  assert(!server.start()); // only once

  connection::TcpSocket a;
  assert(a.connect_with_timeout("127.0.0.1", server.port(), 1000ms));
  assert(server.wait_connected(2000ms));
  assert(tests::wait_until([&] { return connects.load() == 1; }));

  // A second client is accepted by TCP, then closed by the server.
  const uint64_t errors_before = logger::count(logger::Level::Error);
  connection::TcpSocket b;
  assert(b.connect_with_timeout("127.0.0.1", server.port(), 1000ms));
  assert(b.wait_readable(2000ms) == connection::WaitResult::Ready);
  uint8_t byte = 0;
  size_t n = 0;
  assert(!b.try_recv(&byte, 1, n));
  assert(logger::count(logger::Level::Error) > errors_before);

  // The first client is undisturbed and no extra notification fired.
  assert(server.connected());
  assert(connects.load() == 1);
  assert(disconnects.load() == 0);

  server.close_client();
  assert(!server.connected());
  assert(disconnects.load() == 1);
  server.close_client();
  assert(disconnects.load() == 1);

  // The peer sees the connection go away.
  assert(a.wait_readable(2000ms) == connection::WaitResult::Ready);
  assert(!a.try_recv(&byte, 1, n));

  // A new client may connect after the old one is gone.
  connection::TcpSocket c;
  assert(c.connect_with_timeout("127.0.0.1", server.port(), 1000ms));
  assert(tests::wait_until([&] { return connects.load() == 2; }));

  server.close();
  server.close();
  assert(disconnects.load() == 2);
  assert(!server.connected());
}

static void test_close_client_expected() {
  connection::OneClientServer server("expected", "127.0.0.1", 0);
  assert(server.start());

  connection::TcpSocket a;
  assert(a.connect_with_timeout("127.0.0.1", server.port(), 1000ms));
  assert(server.wait_connected(2000ms));
  const auto first = server.client();
  assert(first);

  // A stale handle does not drop the current client.
  server.close_client(std::make_shared<connection::TcpSocket>());
  assert(server.connected());
  server.close_client(first);
  assert(!server.connected());
  server.close();
}

static void test_bind_failure() {
  connection::OneClientServer first("first", "127.0.0.1", 0);
  assert(first.start());

  connection::OneClientServer second("second", "127.0.0.1", first.port());
  assert(!second.start());
  second.close();
  first.close();
}

static void test_callback_exception_is_contained() {
  std::atomic<int> calls{0};
  connection::OneClientServer server("throwing", "127.0.0.1", 0, [&](bool) {
    calls.fetch_add(1);
    throw std::runtime_error("observer failure");
  });
  assert(server.start());

  connection::TcpSocket a;
  assert(a.connect_with_timeout("127.0.0.1", server.port(), 1000ms));
  assert(tests::wait_until([&] { return calls.load() == 1; }));
  assert(server.connected());

  // The accept loop keeps running after the callback threw.
  server.close_client();
  assert(calls.load() == 2);
  connection::TcpSocket b;
  assert(b.connect_with_timeout("127.0.0.1", server.port(), 1000ms));
  assert(tests::wait_until([&] { return calls.load() == 3; }));
  server.close();
}

int main() {
  logger::set_print_level(logger::Level::Warn);
  test_single_client_and_transitions();
  test_close_client_expected();
  test_bind_failure();
  test_callback_exception_is_contained();
  logger::close_logger();
  return 0;
}
