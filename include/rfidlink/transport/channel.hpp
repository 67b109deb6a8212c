#pragma once
/**
 * @file channel.hpp
 * @brief Byte channel contract the rfidlink protocol engine runs on.
 *
 * Header-only on purpose. The engine needs nothing from the port beyond
 * ordered, reliable delivery with blocking-with-timeout reads.
 */

#include <cstddef>
#include <cstdint>

namespace rfidlink::transport {

// Return codes kept simple; the session maps them onto Status.
enum class IoResult : uint8_t { Ok = 0, Timeout = 1, Error = 2 };

/**
 * @brief Transport trait every channel implementation provides.
 *
 * Contract:
 *  - write(buf,len) delivers all @p len bytes in order or reports Error.
 *    A frame is never left half-written on Ok.
 *  - read_exact(buf,n,timeout_ms) returns Ok only with exactly @p n bytes in
 *    @p buf. If the deadline passes first it returns Timeout and whatever
 *    arrived is dropped.
 *  - discard_input() throws away anything already received but unread.
 *  - name() is a short identifier for logs.
 *
 * The engine owns a Channel exclusively for a call chain; implementations
 * need no internal locking.
 */
class Channel {
public:
  virtual ~Channel() = default;
  virtual IoResult    write(const uint8_t* data, std::size_t len) = 0;
  virtual IoResult    read_exact(uint8_t* out, std::size_t n, int timeout_ms) = 0;
  virtual void        discard_input() = 0;
  virtual const char* name() const = 0;
};

} // namespace rfidlink::transport
