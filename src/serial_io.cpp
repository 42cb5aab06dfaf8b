// ============================================================================
// serial_io.cpp — implementation for serial_io.hpp
// For API/overview see the matching .hpp.
// ============================================================================

#include "serial_io.hpp"

#include <fcntl.h>         // ::open flags (O_RDWR, O_NOCTTY, etc.)
#include <unistd.h>        // ::read, ::write, ::close, usleep
#include <termios.h>       // termios struct + raw mode helpers
#include <poll.h>          // poll(2) for bounded waits
#include <cerrno>

namespace flightdiag {

// ---------------------------------------------------------------------------
// set_raw()
// ----------
// 8N1 raw mode, no flow control, VMIN=0/VTIME=0 (poll() does the waiting),
// then flush both directions.
// ---------------------------------------------------------------------------
static bool set_raw(int fd, speed_t baud) {
    termios tio{};
    if (tcgetattr(fd, &tio) != 0) return false;

    cfmakeraw(&tio);
    cfsetispeed(&tio, baud);
    cfsetospeed(&tio, baud);

    tio.c_cflag |= (CLOCAL | CREAD);              // ignore modem ctrl, enable read
    tio.c_cflag &= ~CRTSCTS;                      // no hardware flow control
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    if (tcsetattr(fd, TCSANOW, &tio) != 0) return false;
    tcflush(fd, TCIOFLUSH);
    return true;
}

static speed_t to_speed(int baud) {
    switch (baud) {
        case 9600:   return B9600;
        case 19200:  return B19200;
        case 38400:  return B38400;
        case 57600:  return B57600;
        case 115200: return B115200;
#ifdef B230400
        case 230400: return B230400;
#endif
#ifdef B460800
        case 460800: return B460800;
#endif
#ifdef B921600
        case 921600: return B921600;
#endif
        default:     return B115200;
    }
}

// ---------------------------------------------------------------------------
// open_serial()
// -------------
// O_NOCTTY so the port never becomes our controlling terminal; O_NONBLOCK so
// open() does not hang on modem lines. The boot delay covers the board reset
// that USB CDC triggers on open, and the flush drops bootloader chatter.
// ---------------------------------------------------------------------------
int open_serial(const std::string& dev, int baud, int boot_delay_ms) {
    int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) return -1;

    if (!set_raw(fd, to_speed(baud))) {
        ::close(fd);
        return -1;
    }

    if (boot_delay_ms > 0) usleep(static_cast<useconds_t>(boot_delay_ms) * 1000);
    tcflush(fd, TCIOFLUSH);
    return fd;
}

// ---------------------------------------------------------------------------
// write_bytes()
// -------------
// Loop until everything is written. EAGAIN waits for POLLOUT; a wait that
// expires means the driver is wedged and the write fails.
// ---------------------------------------------------------------------------
bool write_bytes(int fd, const uint8_t* data, std::size_t len, int timeout_ms) {
    if (fd < 0 || (!data && len)) return false;
    std::size_t done = 0;
    while (done < len) {
        ssize_t w = ::write(fd, data + done, len - done);
        if (w > 0) {
            done += static_cast<std::size_t>(w);
            continue;
        }
        if (w < 0 && errno == EINTR) continue;
        if (w < 0 && errno != EAGAIN && errno != EWOULDBLOCK) return false;

        pollfd pfd{fd, POLLOUT, 0};
        int pr = ::poll(&pfd, 1, timeout_ms);
        if (pr <= 0 || (pfd.revents & (POLLERR | POLLHUP))) return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// read_bytes()
// ------------
// One poll, one read. EINTR counts as a timeout so the caller's deadline
// logic stays in charge.
// ---------------------------------------------------------------------------
int read_bytes(int fd, uint8_t* buf, std::size_t cap, int timeout_ms) {
    if (fd < 0 || !buf || cap == 0) return -1;
    pollfd pfd{fd, POLLIN, 0};
    int pr = ::poll(&pfd, 1, timeout_ms < 0 ? 0 : timeout_ms);
    if (pr == 0) return 0;
    if (pr < 0) return errno == EINTR ? 0 : -1;
    if (pfd.revents & POLLIN) {
        ssize_t n = ::read(fd, buf, cap);
        if (n > 0) return static_cast<int>(n);
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) return 0;
        return -1;                                // n == 0 after POLLIN: device gone
    }
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) return -1;
    return 0;
}

void close_serial(int fd) {
    if (fd >= 0) ::close(fd);
}

} // namespace flightdiag
