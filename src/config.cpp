// ============================================================================
// config.cpp — implementation for rfidlink/config.hpp
// ============================================================================

#include "rfidlink/config.hpp"
#include "rfidlink/log.hpp"
#include "serial_io.hpp"          // is_supported_baud()

#include <cstdint>
#include <cstdlib>                // getenv
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

#include "nlohmann/json.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace rfidlink {

// ---------- typed field readers ----------
// Each returns false only when the key exists with the wrong type, or (for
// integers) a value that does not fit in an int.

static bool read_int(const json& j, const char* key, int& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_number_integer()) { err = std::string("bad_type:") + key; return false; }
    const bool fits = it->is_number_unsigned()
        ? it->get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
        : it->get<int64_t>() >= std::numeric_limits<int>::min() &&
          it->get<int64_t>() <= std::numeric_limits<int>::max();
    if (!fits) { err = std::string("bad_value:") + key; return false; }
    out = it->get<int>();
    return true;
}

static bool read_size(const json& j, const char* key, std::size_t& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_number_unsigned()) { err = std::string("bad_type:") + key; return false; }
    out = it->get<std::size_t>();
    return true;
}

static bool read_string(const json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_string()) { err = std::string("bad_type:") + key; return false; }
    out = it->get<std::string>();
    return true;
}

std::string default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    const char* home = std::getenv("HOME");
    fs::path base = (xdg && *xdg) ? fs::path(xdg) : fs::path(home ? home : "") / ".config";
    return (base / "rfidlink" / "config.json").string();
}

bool parse_config(const std::string& text, Config& cfg, std::string& err) {
    json j = json::parse(text, nullptr, /*allow_exceptions*/false);
    if (j.is_discarded()) { err = "bad_json"; return false; }
    if (!j.is_object())   { err = "bad_json:not_an_object"; return false; }

    Config c = cfg;
    if (!read_string(j, "device", c.device, err))                     return false;
    if (!read_int(j, "baud", c.baud, err))                            return false;
    if (!read_int(j, "boot_delay_ms", c.boot_delay_ms, err))          return false;
    if (!read_int(j, "response_timeout_ms", c.response_timeout_ms, err)) return false;
    if (!read_size(j, "max_frame_bytes", c.max_frame_bytes, err))     return false;
    if (!read_size(j, "max_chunk_entries", c.max_chunk_entries, err)) return false;
    if (!read_string(j, "log_level", c.log_level, err))               return false;

    if (auto it = j.find("retry"); it != j.end()) {
        if (!it->is_object()) { err = "bad_type:retry"; return false; }
        if (!read_int(*it, "max_attempts", c.retry.max_attempts, err))     return false;
        if (!read_int(*it, "backoff_ms", c.retry.backoff_ms, err))         return false;
        if (!read_int(*it, "backoff_factor", c.retry.backoff_factor, err)) return false;
    }

    cfg = c;
    return true;
}

bool load_config(const std::string& path, Config& cfg, std::string& err, bool must_exist) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (must_exist) { err = "config_not_found"; return false; }
        log_line(LogLevel::Debug, "config=" + path + " status=absent");
        return true;
    }

    std::ifstream in(path);
    if (!in) { err = "config_unreadable"; return false; }
    std::ostringstream buf;
    buf << in.rdbuf();

    if (!parse_config(buf.str(), cfg, err)) return false;
    log_line(LogLevel::Debug, "config=" + path + " status=loaded");
    return true;
}

bool validate_config(const Config& cfg, std::string& err) {
    LogLevel lvl;
    if (cfg.device.empty())                  { err = "bad_value:device"; return false; }
    if (!is_supported_baud(cfg.baud))        { err = "bad_value:baud"; return false; }
    if (cfg.boot_delay_ms < 0)               { err = "bad_value:boot_delay_ms"; return false; }
    if (cfg.response_timeout_ms <= 0)        { err = "bad_value:response_timeout_ms"; return false; }
    if (cfg.max_frame_bytes < 2 * FRAME_SIZE ||
        cfg.max_frame_bytes > DEVICE_FRAME_BUDGET) { err = "bad_value:max_frame_bytes(8..255)"; return false; }
    if (cfg.max_chunk_entries < 1)           { err = "bad_value:max_chunk_entries"; return false; }
    if (cfg.retry.max_attempts < 1)          { err = "bad_value:retry.max_attempts"; return false; }
    if (cfg.retry.backoff_ms < 0)            { err = "bad_value:retry.backoff_ms"; return false; }
    if (cfg.retry.backoff_factor < 1)        { err = "bad_value:retry.backoff_factor"; return false; }
    if (!parse_log_level(cfg.log_level, lvl)) { err = "bad_value:log_level"; return false; }
    return true;
}

std::string config_to_json(const Config& cfg) {
    json j;
    j["device"]              = cfg.device;
    j["baud"]                = cfg.baud;
    j["boot_delay_ms"]       = cfg.boot_delay_ms;
    j["response_timeout_ms"] = cfg.response_timeout_ms;
    j["max_frame_bytes"]     = cfg.max_frame_bytes;
    j["max_chunk_entries"]   = cfg.max_chunk_entries;
    j["retry"] = {
        {"max_attempts",   cfg.retry.max_attempts},
        {"backoff_ms",     cfg.retry.backoff_ms},
        {"backoff_factor", cfg.retry.backoff_factor}
    };
    j["log_level"] = cfg.log_level;
    return j.dump(2);
}

} // namespace rfidlink
