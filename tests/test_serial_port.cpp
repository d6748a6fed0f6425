#include <cassert>

#include <fcntl.h>
#include <poll.h>
#include <stdlib.h>
#include <termios.h>
#include <unistd.h>

#include <atomic>
#include <thread>
#include <vector>

#include "transport/PosixSerialPort.h"
#include "test_support.h"

using hexilink::PosixSerialPort;
using hexilink::ghi::PacketType;

namespace {

// Master side of a pseudo terminal; the port opens the slave side.
struct PtyPair {
  int master = -1;
  const char* slave_name = nullptr;

  bool open() {
    master = posix_openpt(O_RDWR | O_NOCTTY);
    if (master < 0) {
      return false;
    }
    if (grantpt(master) != 0 || unlockpt(master) != 0) {
      return false;
    }
    slave_name = ptsname(master);
    return slave_name != nullptr;
  }

  ~PtyPair() {
    if (master >= 0) {
      ::close(master);
    }
  }

  void send(const std::vector<uint8_t>& bytes) const {
    const ssize_t n = ::write(master, bytes.data(), bytes.size());
    TEST_ASSERT(n == static_cast<ssize_t>(bytes.size()));
  }

  std::vector<uint8_t> receive(size_t count) const {
    std::vector<uint8_t> out;
    while (out.size() < count) {
      struct pollfd pfd;
      pfd.fd = master;
      pfd.events = POLLIN;
      pfd.revents = 0;
      if (::poll(&pfd, 1, 2000) <= 0) {
        break;
      }
      uint8_t buf[64];
      const ssize_t n = ::read(master, buf, sizeof(buf));
      if (n <= 0) {
        break;
      }
      out.insert(out.end(), buf, buf + n);
    }
    return out;
  }
};

}  // namespace

static void test_baud_constants() {
  unsigned speed = 0;
  assert(PosixSerialPort::baudConstant(230400, speed));
  assert(speed == B230400);
  assert(PosixSerialPort::baudConstant(115200, speed));
  assert(speed == B115200);
  assert(!PosixSerialPort::baudConstant(12345, speed));
}

static void test_open_failures() {
  PosixSerialPort port;
  assert(!port.isOpen());
  assert(!port.open("/nonexistent/tty-hexilink"));
  assert(!port.isOpen());

  uint8_t byte = 0;
  assert(!port.readExact(etl::span<uint8_t>(&byte, 1)));
  assert(!port.write(etl::span<const uint8_t>(&byte, 1)));
}

static void test_frames_cross_the_port(const PtyPair& pty) {
  PosixSerialPort port;
  assert(port.open(pty.slave_name));
  assert(port.isOpen());

  const std::vector<uint8_t> inbound = make_wire_frame(PacketType::PT_LINK_STATE_SEND, 0, {0x01});
  pty.send(inbound);
  std::vector<uint8_t> got(inbound.size(), 0);
  assert(port.readExact(etl::span<uint8_t>(got.data(), got.size())));
  assert(got == inbound);

  const std::vector<uint8_t> outbound = make_wire_frame(PacketType::PT_ADV_MODE_TOGGLE, 0);
  assert(port.write(etl::span<const uint8_t>(outbound.data(), outbound.size())));
  assert(pty.receive(outbound.size()) == outbound);
  port.close();
  assert(!port.isOpen());
}

static void test_interrupt_and_resume(const PtyPair& pty) {
  PosixSerialPort port;
  assert(port.open(pty.slave_name));

  std::atomic<int> result(-1);
  std::thread reader([&] {
    uint8_t byte = 0;
    result = port.readExact(etl::span<uint8_t>(&byte, 1)) ? 1 : 0;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(result.load() == -1);
  port.interrupt();
  reader.join();
  assert(result.load() == 0);

  // Still interrupted: reads fail straight away.
  uint8_t byte = 0;
  assert(!port.readExact(etl::span<uint8_t>(&byte, 1)));

  port.resume();
  pty.send(std::vector<uint8_t>({0x55}));
  assert(port.readExact(etl::span<uint8_t>(&byte, 1)));
  assert(byte == 0x55);
}

int main() {
  test_baud_constants();
  test_open_failures();

  PtyPair pty;
  if (!pty.open()) {
    fprintf(stderr, "no pseudo terminal available, port I/O not exercised\n");
    return 0;
  }
  test_frames_cross_the_port(pty);
  test_interrupt_and_resume(pty);
  return 0;
}
