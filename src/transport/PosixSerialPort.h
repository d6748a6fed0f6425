#ifndef POSIX_SERIAL_PORT_H
#define POSIX_SERIAL_PORT_H

#include <atomic>

#include "config/hexilink_config.h"
#include "SerialChannel.h"

namespace hexilink {

// termios serial device in raw mode, 8 data bits, no parity.
class PosixSerialPort : public SerialChannel {
public:
    PosixSerialPort();
    ~PosixSerialPort() override;

    PosixSerialPort(const PosixSerialPort&) = delete;
    PosixSerialPort& operator=(const PosixSerialPort&) = delete;

    bool open(const char* device,
              unsigned long baudrate = HEXILINK_BAUDRATE,
              unsigned stop_bits = HEXILINK_STOP_BITS);
    void close();

    bool readExact(etl::span<uint8_t> buffer) override;
    bool write(etl::span<const uint8_t> data) override;
    void interrupt() override;
    void resume() override;
    bool isOpen() const override { return _fd >= 0; }

#if defined(HEXILINK_HOST_TEST)
 public:
#else
 private:
#endif
    static bool baudConstant(unsigned long baudrate, unsigned& out_speed);

    int _fd;
    std::atomic<bool> _interrupted;

    // Granularity at which a blocked read notices interrupt().
    static constexpr int kPollIntervalMs = 100;
};

} // namespace hexilink

#endif // POSIX_SERIAL_PORT_H
