/**
 * @page fd-serial-io-hdr flightdiag Serial I/O API (Header)
 * @file serial_io.hpp
 * @brief Open a Linux TTY in raw mode and move bytes with bounded waits.
 *
 * @details
 * PURPOSE
 * -------
 * The flight controller shows up as a USB CDC device (or a telemetry radio
 * behind a USB-UART bridge). This header is the whole byte-level surface the
 * MAVLink transport needs: open, write, poll-bounded read, close. Framing
 * lives one layer up (MAVLink's own parser), so nothing here knows about
 * message boundaries.
 *
 * HOW IT FITS TOGETHER
 * --------------------
 *   MavlinkSerialTransport -> open_serial() -> write_bytes()/read_bytes() -> close_serial()
 *                         \-> mavlink_parse_char() per byte
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Device selection: prefer /dev/serial/by-id/... for stable paths (see port_scan.hpp).
 * - Permissions: the runtime user must be in the dialout group.
 * - Opening a USB CDC port resets most boards; boot_delay_ms lets the
 *   bootloader hand over before the first byte is written.
 * - Every read is bounded by poll(); nothing here blocks indefinitely.
 *
 * EXAMPLE
 * -------
 * @code
 *   int fd = flightdiag::open_serial("/dev/ttyACM0", 115200, 400);
 *   if (fd < 0) { // handle open failure  }
 *
 *   uint8_t buf[256];
 *   int n = flightdiag::read_bytes(fd, buf, sizeof(buf), 100);
 *   if (n > 0) { // feed the parser  }
 *
 *   flightdiag::close_serial(fd);
 * @endcode
 *
 * LIMITATIONS
 * -----------
 * - Baud table: 9600..921600. Unknown values fall back to 115200.
 * - Concurrency: one owner per fd.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace flightdiag {

/**
 * @brief Open a TTY, configure raw 8N1 at `baud`, settle, flush. Returns fd or -1.
 *
 * The returned fd is non-blocking; callers wait with read_bytes().
 */
int open_serial(const std::string& dev, int baud = 115200, int boot_delay_ms = 400);

/**
 * @brief Write all `len` bytes, waiting for the driver (POLLOUT) up to `timeout_ms` per stall.
 * @return true when every byte was accepted.
 */
bool write_bytes(int fd, const uint8_t* data, std::size_t len, int timeout_ms = 200);

/**
 * @brief Wait up to `timeout_ms` for input, then read what is available (at most `cap`).
 * @return bytes read (>0), 0 on timeout, -1 on error or hang-up.
 */
int read_bytes(int fd, uint8_t* buf, std::size_t cap, int timeout_ms);

/// Close a descriptor from open_serial(). Negative fds are ignored.
void close_serial(int fd);

} // namespace flightdiag
