#include "PosixSerialPort.h"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <string.h>
#include <termios.h>
#include <unistd.h>

#include "util/log.h"

namespace hexilink {

namespace {
constexpr const char* TAG = "serial";
}

PosixSerialPort::PosixSerialPort() : _fd(-1), _interrupted(false) {}

PosixSerialPort::~PosixSerialPort() {
    close();
}

bool PosixSerialPort::baudConstant(unsigned long baudrate, unsigned& out_speed) {
    switch (baudrate) {
        case 9600:   out_speed = B9600;   return true;
        case 19200:  out_speed = B19200;  return true;
        case 38400:  out_speed = B38400;  return true;
        case 57600:  out_speed = B57600;  return true;
        case 115200: out_speed = B115200; return true;
        case 230400: out_speed = B230400; return true;
#ifdef B460800
        case 460800: out_speed = B460800; return true;
#endif
        default: return false;
    }
}

bool PosixSerialPort::open(const char* device, unsigned long baudrate, unsigned stop_bits) {
    close();

    unsigned speed = 0;
    if (!baudConstant(baudrate, speed)) {
        HEXILINK_LOGE(TAG, "unsupported baud rate %lu", baudrate);
        return false;
    }

    const int fd = ::open(device, O_RDWR | O_NOCTTY | O_CLOEXEC);
    if (fd < 0) {
        HEXILINK_LOGE(TAG, "open %s: %s", device, strerror(errno));
        return false;
    }

    struct termios tio;
    if (tcgetattr(fd, &tio) != 0) {
        HEXILINK_LOGE(TAG, "tcgetattr %s: %s", device, strerror(errno));
        ::close(fd);
        return false;
    }

    cfmakeraw(&tio);
    tio.c_cflag &= ~(CSIZE | PARENB | CSTOPB);
    tio.c_cflag |= CS8 | CLOCAL | CREAD;
    if (stop_bits == 2) {
        tio.c_cflag |= CSTOPB;
    }
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;
    cfsetispeed(&tio, static_cast<speed_t>(speed));
    cfsetospeed(&tio, static_cast<speed_t>(speed));

    if (tcsetattr(fd, TCSANOW, &tio) != 0) {
        HEXILINK_LOGE(TAG, "tcsetattr %s: %s", device, strerror(errno));
        ::close(fd);
        return false;
    }
    tcflush(fd, TCIOFLUSH);

    _fd = fd;
    _interrupted = false;
    HEXILINK_LOGI(TAG, "%s open at %lu baud, %u stop bits", device, baudrate, stop_bits);
    return true;
}

void PosixSerialPort::close() {
    if (_fd >= 0) {
        ::close(_fd);
        _fd = -1;
    }
}

void PosixSerialPort::interrupt() {
    _interrupted = true;
}

void PosixSerialPort::resume() {
    _interrupted = false;
}

bool PosixSerialPort::readExact(etl::span<uint8_t> buffer) {
    size_t filled = 0;
    while (filled < buffer.size()) {
        if (_interrupted || _fd < 0) {
            return false;
        }

        struct pollfd pfd;
        pfd.fd = _fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        const int ready = ::poll(&pfd, 1, kPollIntervalMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            HEXILINK_LOGE(TAG, "poll: %s", strerror(errno));
            return false;
        }
        if (ready == 0) {
            continue;
        }
        if ((pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0) {
            HEXILINK_LOGE(TAG, "device error (revents=0x%x)", pfd.revents);
            return false;
        }

        const ssize_t n = ::read(_fd, buffer.data() + filled, buffer.size() - filled);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            HEXILINK_LOGE(TAG, "read: %s", strerror(errno));
            return false;
        }
        filled += static_cast<size_t>(n);
    }
    return true;
}

bool PosixSerialPort::write(etl::span<const uint8_t> data) {
    if (_fd < 0) {
        return false;
    }
    const uint8_t* cursor = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
        const ssize_t n = ::write(_fd, cursor, remaining);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            HEXILINK_LOGE(TAG, "write: %s", strerror(errno));
            return false;
        }
        cursor += n;
        remaining -= static_cast<size_t>(n);
    }
    return tcdrain(_fd) == 0;
}

} // namespace hexilink
