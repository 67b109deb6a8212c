#pragma once
/**
 * @file transport_linux_serial.hpp
 * @brief Linux USB/tty channel for the lock controller (header-only, termios).
 *
 * Thin RAII wrapper over serial_io.hpp. Depends on: serial_io.cpp (termios,
 * poll). STL only for std::string (Linux-only path).
 */

#if !defined(__linux__)
#  error "transport_linux_serial.hpp is Linux-only."
#endif

#include "rfidlink/transport/channel.hpp"
#include "serial_io.hpp"
#include <string>

namespace rfidlink::transport {

struct SerialConfig {
  std::string path;          // e.g. /dev/serial/by-id/usb-FTDI_...
  int baud{9600};            // lock controller UART default
  int boot_delay_ms{0};      // >0 for boards that reset when the port opens
};

class LinuxSerial : public Channel {
public:
  LinuxSerial() = default;
  ~LinuxSerial() override { close(); }

  LinuxSerial(const LinuxSerial&) = delete;
  LinuxSerial& operator=(const LinuxSerial&) = delete;

  /// Open and configure the port. On failure @p err gets a reason token.
  bool open(const SerialConfig& cfg, std::string& err) {
    close();
    fd_ = rfidlink::open_serial(cfg.path, cfg.baud, cfg.boot_delay_ms, &err);
    if (fd_ < 0) return false;
    path_ = cfg.path;
    return true;
  }

  void close() {
    if (fd_ >= 0) { rfidlink::close_serial(fd_); fd_ = -1; }
  }

  bool is_open() const { return fd_ >= 0; }
  const std::string& path() const { return path_; }

  IoResult write(const uint8_t* data, std::size_t len) override {
    if (fd_ < 0 || !data) return IoResult::Error;
    return rfidlink::write_all(fd_, data, len);
  }

  IoResult read_exact(uint8_t* out, std::size_t n, int timeout_ms) override {
    if (fd_ < 0 || !out) return IoResult::Error;
    return rfidlink::read_exact(fd_, out, n, timeout_ms);
  }

  void discard_input() override { rfidlink::flush_input(fd_); }

  const char* name() const override { return "linux-serial"; }

private:
  int fd_{-1};
  std::string path_;
};

} // namespace rfidlink::transport
