#pragma once
/**
 * @file config.hpp
 * @brief Runtime settings for rfidlink: defaults, JSON config file, validation.
 *
 * Precedence is defaults < config file < command-line options. The file is
 * optional and human-editable:
 *
 * @code
 *   {
 *     "device": "/dev/serial/by-id/usb-FTDI_FT232R_USB_UART_A50285BI-if00-port0",
 *     "baud": 9600,
 *     "response_timeout_ms": 2000,
 *     "max_frame_bytes": 255,
 *     "max_chunk_entries": 50,
 *     "retry": { "max_attempts": 3, "backoff_ms": 500, "backoff_factor": 2 },
 *     "log_level": "info"
 *   }
 * @endcode
 *
 * Unknown keys are ignored. A key with the wrong JSON type is an error, not
 * a silent default.
 */

#include <cstddef>
#include <string>

#include "rfidlink/chunk_planner.hpp"
#include "rfidlink/frame_codec.hpp"
#include "rfidlink/uploader.hpp"

namespace rfidlink {

struct Config {
  std::string device{"/dev/ttyUSB0"};
  int         baud{9600};
  int         boot_delay_ms{0};
  int         response_timeout_ms{2000};
  std::size_t max_frame_bytes{DEVICE_FRAME_BUDGET};
  std::size_t max_chunk_entries{DEVICE_MAX_CHUNK_ENTRIES};
  RetryPolicy retry{};
  std::string log_level{"info"};
};

/// $XDG_CONFIG_HOME/rfidlink/config.json, else ~/.config/rfidlink/config.json.
std::string default_config_path();

/**
 * @brief Overlay keys from a JSON document onto @p cfg.
 * @return false with a reason in @p err on malformed JSON or a mistyped key.
 */
bool parse_config(const std::string& text, Config& cfg, std::string& err);

/**
 * @brief Overlay a config file onto @p cfg.
 *
 * A missing file is fine unless @p must_exist (the user named it explicitly).
 */
bool load_config(const std::string& path, Config& cfg, std::string& err, bool must_exist = false);

/// Range checks; first problem goes to @p err as "bad_value:<key>".
bool validate_config(const Config& cfg, std::string& err);

/// Pretty JSON of the effective settings.
std::string config_to_json(const Config& cfg);

} // namespace rfidlink
