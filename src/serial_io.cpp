// ============================================================================
// serial_io.cpp — implementation for serial_io.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file serial_io.cpp
 */

#include "serial_io.hpp"   // declarations for open_serial(), write_all(), read_exact(), ...

// POSIX / termios headers for low-level serial port handling
#include <fcntl.h>         // ::open flags (O_RDWR, O_NOCTTY, etc.)
#include <unistd.h>        // ::read, ::write, ::close, usleep
#include <termios.h>       // termios struct + raw mode helpers
#include <poll.h>          // poll(2) for deadline-based loops
#include <cerrno>          // errno (EAGAIN, EINTR)
#include <chrono>          // steady_clock deadline arithmetic

namespace rfidlink {

using transport::IoResult;

// ---------------------------------------------------------------------------
// baud_to_speed()
// ---------------
// Map an integer baud onto the termios constant. Returns false for rates the
// lock controller's UART bridge is not known to run at.
// ---------------------------------------------------------------------------
static bool baud_to_speed(int baud, speed_t& sp) {
    switch (baud) {
        case 1200:   sp = B1200;   return true;
        case 2400:   sp = B2400;   return true;
        case 4800:   sp = B4800;   return true;
        case 9600:   sp = B9600;   return true;
        case 19200:  sp = B19200;  return true;
        case 38400:  sp = B38400;  return true;
        case 57600:  sp = B57600;  return true;
        case 115200: sp = B115200; return true;
        case 230400: sp = B230400; return true;
        default:     return false;
    }
}

bool is_supported_baud(int baud) {
    speed_t sp;
    return baud_to_speed(baud, sp);
}

// Raw 8N1 at @p sp, no software or hardware flow control. VMIN and VTIME are
// zero, so read() never blocks in the driver and read_exact() waits in poll().
static bool configure_tty(int fd, speed_t sp) {
    termios tio{};
    if (tcgetattr(fd, &tio) != 0) return false;

    cfmakeraw(&tio);
    tio.c_cflag &= ~(CSIZE | PARENB | CSTOPB | CRTSCTS);
    tio.c_cflag |= CS8 | CLOCAL | CREAD;
    tio.c_iflag &= ~(IXON | IXOFF | IXANY);
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;
    if (cfsetispeed(&tio, sp) != 0 || cfsetospeed(&tio, sp) != 0) return false;

    return tcsetattr(fd, TCSANOW, &tio) == 0;
}


// ---------------------------------------------------------------------------
// open_serial()
// -------------
// Open and initialize a serial port at the requested baud.
// - O_NOCTTY (don't steal controlling terminal) and O_NONBLOCK.
// - configure_tty() applies 8N1 raw mode; failure closes the fd again.
// - Sleeps boot_delay_ms to allow USB CDC devices to reset on open.
// - Flushes boot chatter after the delay.
// ---------------------------------------------------------------------------
int open_serial(const std::string& dev, int baud, int boot_delay_ms, std::string* err) {
    speed_t sp;
    if (!baud_to_speed(baud, sp)) {
        if (err) *err = "unsupported_baud";
        return -1;
    }

    int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) {                                 // perm, missing, busy
        if (err) *err = (errno == EACCES) ? "permission_denied" : "open_failed";
        return -1;
    }

    if (!configure_tty(fd, sp)) {
        ::close(fd);
        if (err) *err = "not_a_tty";
        return -1;
    }

    if (boot_delay_ms > 0) usleep(static_cast<useconds_t>(boot_delay_ms) * 1000);
    tcflush(fd, TCIOFLUSH);                       // flush any reboot chatter
    return fd;
}


// ---------------------------------------------------------------------------
// write_all()
// -----------
// Keep writing until every byte is accepted by the driver.
// - EAGAIN: wait for POLLOUT (bounded per wait) and try again.
// - EINTR: retry immediately, in the write loop and in tcdrain().
// - tcdrain() at the end so the response timeout measures the device, not
//   our own output queue.
// ---------------------------------------------------------------------------
IoResult write_all(int fd, const uint8_t* data, std::size_t len) {
    if (fd < 0) return IoResult::Error;
    std::size_t done = 0;
    while (done < len) {
        ssize_t w = ::write(fd, data + done, len - done);
        if (w > 0) { done += static_cast<std::size_t>(w); continue; }
        if (w < 0 && errno == EINTR) continue;
        if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{fd, POLLOUT, 0};
            int pr = ::poll(&pfd, 1, 1000);
            if (pr < 0 && errno != EINTR) return IoResult::Error;
            if (pr > 0 && (pfd.revents & (POLLERR | POLLHUP))) return IoResult::Error;
            continue;
        }
        return IoResult::Error;                   // w == 0 or hard error
    }
    while (tcdrain(fd) != 0) {
        if (errno == EINTR) continue;             // signal landed; bytes are still queued
        if (errno == ENOTTY) break;
        return IoResult::Error;
    }
    return IoResult::Ok;
}


// ---------------------------------------------------------------------------
// read_exact()
// ------------
// Accumulate exactly n bytes before the deadline.
// - VMIN/VTIME are zero (non-blocking), so poll() controls blocking time.
// - The deadline covers the whole read, not each individual poll.
// ---------------------------------------------------------------------------
IoResult read_exact(int fd, uint8_t* out, std::size_t n, int timeout_ms) {
    using clock = std::chrono::steady_clock;
    if (fd < 0) return IoResult::Error;

    const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);
    std::size_t got = 0;
    pollfd pfd{fd, POLLIN, 0};

    while (got < n) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
        if (left <= 0) return IoResult::Timeout;

        int pr = ::poll(&pfd, 1, static_cast<int>(left));
        if (pr == 0) return IoResult::Timeout;    // deadline expired
        if (pr < 0) {
            if (errno == EINTR) continue;
            return IoResult::Error;
        }
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) return IoResult::Error;
        if (pfd.revents & POLLIN) {
            ssize_t r = ::read(fd, out + got, n - got);
            if (r > 0) { got += static_cast<std::size_t>(r); continue; }
            if (r < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) continue;
            return IoResult::Error;               // EOF or hard error
        }
    }
    return IoResult::Ok;
}


void flush_input(int fd) {
    if (fd >= 0) tcflush(fd, TCIFLUSH);
}


void close_serial(int fd) {
    if (fd >= 0) ::close(fd);
}

} // namespace rfidlink
