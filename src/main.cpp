/**
 * @file main.cpp
 * @brief rfidlink CLI — one-shot host tool for the RFID lock controller.
 *
 * Responsibilities:
 *  - Parse options (CLI11); overlay them on the JSON config file.
 *  - Run exactly one command: --ping, --read-last, --upload/--ids, or --show-config.
 *  - Print results as key=value lines (default) or JSON (--format json).
 *  - Map engine statuses onto stable exit codes for scripts.
 *
 * Exit codes:
 *   0 ok, 1 open/io, 2 usage/input, 3 timeout, 4 protocol/framing,
 *   5 capacity/oversize, 6 aborted (SIGINT between chunks)
 */

#include <csignal>
#include <signal.h>         // sigaction
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "id_list.hpp"
#include "rfidlink/chunk_planner.hpp"
#include "rfidlink/config.hpp"
#include "rfidlink/frame_codec.hpp"
#include "rfidlink/link_session.hpp"
#include "rfidlink/log.hpp"
#include "rfidlink/status.hpp"
#include "rfidlink/transport/transport_linux_serial.hpp"
#include "rfidlink/uploader.hpp"

using json = nlohmann::json;
using namespace rfidlink;

// ---------- small utilities ----------

static volatile std::sig_atomic_t g_cancel = 0;

static void on_sigint(int) { g_cancel = 1; }

// No SA_RESTART: poll() returns EINTR, serial_io retries, the frame completes.
static void install_sigint() {
  struct sigaction sa{};
  sa.sa_handler = on_sigint;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  sigaction(SIGINT, &sa, nullptr);
}

static int exit_code_for(Status s) {
  switch (s) {
    case Status::Ok:            return 0;
    case Status::IoError:       return 1;
    case Status::Busy:          return 1;
    case Status::TimeoutError:  return 3;
    case Status::ProtocolError:
    case Status::FramingError:  return 4;
    case Status::CapacityError:
    case Status::OversizeError: return 5;
    case Status::Aborted:       return 6;
  }
  return 1;
}

struct Output {
  bool as_json{false};

  void error(const std::string& reason, const std::string& extra = {}) const {
    if (as_json) {
      json j{{"status", "error"}, {"reason", reason}};
      if (!extra.empty()) j["detail"] = extra;
      std::cout << j.dump() << "\n";
    } else {
      std::cerr << "status=error reason=" << reason;
      if (!extra.empty()) std::cerr << " " << extra;
      std::cerr << "\n";
    }
  }
};

static json report_to_json(const UploadReport& r) {
  json j;
  j["status"] = ok(r.status) ? "ok" : "error";
  if (!ok(r.status)) j["reason"] = status_name(r.status);
  j["phase"]         = upload_phase_name(r.phase);
  j["chunks"]        = r.chunks_total;
  j["entries_acked"] = r.entries_acked;
  j["total"]         = r.total_count;
  j["attempts"]      = r.attempts;
  if (!ok(r.status) && r.phase == UploadPhase::Chunk) j["chunk"] = r.chunk_index;
  if (!r.detail.empty()) j["detail"] = r.detail;
  return j;
}

// Gather upload identifiers from --upload FILE or --ids HEX...
static bool collect_ids(const std::string& list_path, const std::vector<std::string>& hex_ids,
                        std::vector<uint32_t>& out, const Output& o) {
  out.clear();
  if (!list_path.empty()) {
    IdList list;
    std::string err;
    if (!load_id_list(list_path, list, err)) { o.error(err, "file=" + list_path); return false; }
    out = list.ids();
  }
  for (const auto& h : hex_ids) {
    uint32_t id = 0;
    if (!parse_hex_id(h, id)) { o.error("bad_id", "id=" + h); return false; }
    out.push_back(id);
  }
  return true;
}

static void print_plan(const UploadPlan& p, const Output& o) {
  if (o.as_json) {
    json j{{"status", "ok"}, {"total", p.total_count},
           {"max_entries_per_chunk", p.max_entries_per_chunk}};
    json sizes = json::array();
    for (const auto& c : p.chunks) sizes.push_back(c.size());
    j["chunks"] = sizes;
    j["set_count_frame"] = to_hex(encode_command(Opcode::SetCount, static_cast<uint16_t>(p.total_count)));
    std::cout << j.dump() << "\n";
    return;
  }
  std::cout << "status=ok total=" << p.total_count
            << " chunks=" << p.chunks.size()
            << " max_entries_per_chunk=" << p.max_entries_per_chunk
            << " set_count_frame="
            << to_hex(encode_command(Opcode::SetCount, static_cast<uint16_t>(p.total_count))) << "\n";
  for (std::size_t i = 0; i < p.chunks.size(); ++i) {
    const auto& c = p.chunks[i];
    std::cout << "chunk=" << i << " entries=" << c.size()
              << " header=" << to_hex(encode_command(Opcode::SendChunk, static_cast<uint16_t>(c.size())))
              << " first=" << id_to_hex(c.entries.front())
              << " last=" << id_to_hex(c.entries.back()) << "\n";
  }
}

// ---------- main ----------

int main(int argc, char** argv) {
  CLI::App app{"rfidlink: upload RFID lists to the lock controller over serial"};

  // ---- commands ----
  bool ping = false, read_last = false, dry_run = false, show_config = false;
  std::string list_path;
  std::vector<std::string> hex_ids;

  // ---- device / io ----
  std::string dev, config_path, format = "pretty";
  int baud = 0, timeout_ms = 0, boot_delay_ms = -1, retries = 0, backoff_ms = -1;
  std::size_t max_frame = 0, max_chunk = 0;
  int verbose = 0;
  bool quiet = false;

  app.add_flag("--ping", ping, "Check the controller answers");
  app.add_flag("--read-last", read_last, "Print the identifier scanned most recently at the lock");
  app.add_option("--upload", list_path, "Upload an identifier list file (HEXID[,label] per line)");
  app.add_option("--ids", hex_ids, "Upload identifiers given as 8-digit hex");
  app.add_flag("--dry-run", dry_run, "With --upload/--ids: print the chunk plan, do not open the port");
  app.add_flag("--show-config", show_config, "Print the effective configuration");

  app.add_option("--dev", dev, "Serial device (e.g. /dev/serial/by-id/...)");
  app.add_option("--baud", baud, "Baud rate (default 9600)");
  app.add_option("--timeout", timeout_ms, "Response timeout (ms)");
  app.add_option("--boot-delay", boot_delay_ms, "Delay after open (ms) for boards that reset");
  app.add_option("--max-frame", max_frame, "SendChunk header+payload budget in bytes (8..255)");
  app.add_option("--max-chunk", max_chunk, "Entries per SendChunk (device limit 50)");
  app.add_option("--retries", retries, "Total upload attempts (restarts from ping)");
  app.add_option("--backoff", backoff_ms, "Wait before the second attempt (ms)");
  app.add_option("--config", config_path, "Config file (default $XDG_CONFIG_HOME/rfidlink/config.json)");
  app.add_option("--format", format, "Output format")->check(CLI::IsMember({"pretty", "json"}));
  app.add_flag("-v,--verbose", verbose, "More diagnostics (-vv for frame traces)");
  app.add_flag("-q,--quiet", quiet, "Errors only");

  CLI11_PARSE(app, argc, argv);

  Output out;
  out.as_json = (format == "json");

  // -------- configuration: defaults < file < CLI --------
  Config cfg;
  std::string err;
  const bool explicit_config = !config_path.empty();
  if (!load_config(explicit_config ? config_path : default_config_path(), cfg, err, explicit_config)) {
    out.error(err);
    return 2;
  }
  if (!dev.empty())        cfg.device = dev;
  if (baud > 0)            cfg.baud = baud;
  if (timeout_ms > 0)      cfg.response_timeout_ms = timeout_ms;
  if (boot_delay_ms >= 0)  cfg.boot_delay_ms = boot_delay_ms;
  if (max_frame > 0)       cfg.max_frame_bytes = max_frame;
  if (max_chunk > 0)       cfg.max_chunk_entries = max_chunk;
  if (retries > 0)         cfg.retry.max_attempts = retries;
  if (backoff_ms >= 0)     cfg.retry.backoff_ms = backoff_ms;
  if (quiet)               cfg.log_level = "error";
  else if (verbose >= 2)   cfg.log_level = "trace";
  else if (verbose == 1)   cfg.log_level = "debug";

  if (!validate_config(cfg, err)) { out.error(err); return 2; }
  LogLevel lvl = LogLevel::Info;
  parse_log_level(cfg.log_level, lvl);
  set_log_level(lvl);

  if (show_config) {
    std::cout << config_to_json(cfg) << "\n";
    return 0;
  }

  // -------- choose exactly one command --------
  const bool upload = !list_path.empty() || !hex_ids.empty();
  int cmds = (ping ? 1 : 0) + (read_last ? 1 : 0) + (upload ? 1 : 0);
  if (cmds != 1) { out.error("need_exactly_one_command"); return 2; }
  if (dry_run && !upload) { out.error("dry_run_needs_upload"); return 2; }

  std::vector<uint32_t> ids;
  if (upload && !collect_ids(list_path, hex_ids, ids, out)) return 2;

  if (dry_run) {
    UploadPlan p;
    Status s = plan(ids, p, cfg.max_frame_bytes, cfg.max_chunk_entries);
    if (!ok(s)) { out.error(status_name(s), "count=" + std::to_string(ids.size())); return exit_code_for(s); }
    print_plan(p, out);
    return 0;
  }

  // -------- open the port --------
  transport::LinuxSerial port;
  if (!port.open({cfg.device, cfg.baud, cfg.boot_delay_ms}, err)) {
    out.error(err, "dev=" + cfg.device);
    return 1;
  }
  log_line(LogLevel::Debug, "dev=" + port.path() + " chan=" + port.name() +
                            " baud=" + std::to_string(cfg.baud) + " status=open");

  LinkSession link(port, {cfg.response_timeout_ms, cfg.max_frame_bytes});

  if (ping) {
    Status s = link.ping();
    if (!ok(s)) { out.error(status_name(s), "op=ping"); return exit_code_for(s); }
    if (out.as_json) std::cout << json{{"status", "ok"}, {"op", "ping"}}.dump() << "\n";
    else             std::cout << "status=ok op=ping\n";
    return 0;
  }

  if (read_last) {
    uint32_t last = 0;
    Status s = link.read_last(last);
    if (!ok(s)) { out.error(status_name(s), "op=read_last"); return exit_code_for(s); }
    if (out.as_json) std::cout << json{{"status", "ok"}, {"last_id", id_to_hex(last)}}.dump() << "\n";
    else             std::cout << "status=ok last_id=" << id_to_hex(last) << "\n";
    return 0;
  }

  // -------- upload --------
  install_sigint();
  Uploader uploader(link, cfg.max_chunk_entries);
  ChunkHooks hooks;
  hooks.should_continue = [](std::size_t) { return g_cancel == 0; };
  hooks.on_progress = [](std::size_t acked, std::size_t total) {
    log_line(LogLevel::Info, "progress=" + std::to_string(acked) + "/" + std::to_string(total));
  };
  uploader.set_hooks(std::move(hooks));

  UploadReport report;
  Status s = uploader.upload_with_retry(ids, cfg.retry, report);

  if (out.as_json) {
    std::cout << report_to_json(report).dump() << "\n";
  } else if (ok(s)) {
    std::cout << to_kv(report) << "\n";
  } else {
    std::cerr << to_kv(report) << "\n";
  }
  return exit_code_for(s);
}
