/**
 * @page rl-serial-io-hdr rfidlink Serial I/O API (Header)
 * @file serial_io.hpp
 * @brief POSIX helpers for opening a Linux TTY raw and moving exact byte counts.
 *
 * @details
 * PURPOSE
 * -------
 * The lock controller hangs off a USB-UART bridge. This header declares the
 * minimal surface needed to talk to it from a Linux host. There is no framing
 * layer here: the controller's protocol is fixed-size 4-byte frames, so the
 * only primitives needed are "write all of these bytes" and "read exactly n
 * bytes before a deadline".
 *
 * ROLE IN RFIDLINK
 * ----------------
 * - rfidlink::open_serial: acquire a file descriptor, set raw 8N1, settle, flush.
 * - rfidlink::write_all: write every byte, looping over partial writes and EAGAIN.
 * - rfidlink::read_exact: poll and accumulate until n bytes or the deadline.
 * - rfidlink::flush_input: drop unread input (stale acknowledgments).
 * - rfidlink::close_serial: close the descriptor cleanly.
 *
 * These back rfidlink::transport::LinuxSerial, which is what the link
 * session actually talks to.
 *
 * HOW IT FITS TOGETHER
 * --------------------
 *   LinkSession -> Channel (LinuxSerial) -> serial_io.cpp (termios, poll, syscalls)
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Device selection: prefer /dev/serial/by-id/... for stable paths.
 * - Permissions: the runtime user needs the dialout group (or equivalent).
 * - Partial frames: write_all never returns Ok with a frame half-written. The
 *   controller cannot recover from a truncated frame, so a failed write means
 *   the port should be closed and reopened.
 * - Concurrency: do not share one fd between threads.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "rfidlink/transport/channel.hpp"

namespace rfidlink {

/// True when @p baud maps onto a termios speed constant we configure.
bool is_supported_baud(int baud);

/**
 * @brief Open a Linux TTY device, configure it for raw I/O, and return its fd.
 *
 * What it does:
 *   - Opens @p dev with O_RDWR | O_NOCTTY | O_NONBLOCK.
 *   - Raw mode: 8N1, no echo, no line processing, no flow control.
 *   - Sets the baud (1200..230400). Unsupported values are rejected.
 *   - Sleeps @p boot_delay_ms to let USB CDC devices finish an auto-reset.
 *   - Flushes whatever the device printed while booting.
 *
 * @return File descriptor (non-negative) on success, or -1 on failure.
 *         On failure @p err (if given) receives a short reason token.
 */
int open_serial(const std::string& dev, int baud, int boot_delay_ms, std::string* err = nullptr);

/**
 * @brief Write all @p len bytes, retrying partial writes until done.
 *
 * Waits for writability with poll() on EAGAIN and drains the output queue
 * (tcdrain) before returning so the bytes are on the wire when the
 * response timer starts.
 *
 * @return IoResult::Ok or IoResult::Error.
 */
transport::IoResult write_all(int fd, const uint8_t* data, std::size_t len);

/**
 * @brief Read exactly @p n bytes within @p timeout_ms.
 *
 * @return IoResult::Ok with @p n bytes in @p out, IoResult::Timeout when the
 *         deadline passes first, IoResult::Error on poll/read failure or hangup.
 */
transport::IoResult read_exact(int fd, uint8_t* out, std::size_t n, int timeout_ms);

/// Discard bytes received but not yet read.
void flush_input(int fd);

/// Close @p fd if non-negative.
void close_serial(int fd);

} // namespace rfidlink
