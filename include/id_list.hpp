#pragma once
/**
 * @page rl-id-list rfidlink Identifier List Loader
 * @file id_list.hpp
 * @brief Read the lock tool's identifier list file into upload order.
 *
 * @details
 * FILE FORMAT
 * -----------
 * One tag per line, exactly as the list editor saves it:
 *
 *   0A1B2C3D,Front door - Alice
 *   00C0FFEE,Cleaner
 *   DEADBEEF
 *
 * - First field: exactly 8 hex digits, the identifier read big-endian.
 * - Optional ",<label>": free text, kept for display only, never uploaded.
 * - Blank lines and lines starting with '#' are skipped.
 * - CRLF and LF line endings are both accepted (the editor writes CRLF).
 *
 * BEHAVIOR
 * --------
 * - Malformed lines are skipped, counted, and their line numbers reported.
 * - A repeated identifier keeps its first occurrence; later copies are
 *   counted as duplicates. The editor keyed entries by identifier, so a
 *   list it saved never contains repeats.
 * - Read-only. Nothing in rfidlink writes list files.
 *
 * EXAMPLE
 * -------
 * @code
 *   rfidlink::IdList list;
 *   std::string err;
 *   if (!rfidlink::load_id_list("data.txt", list, err)) {
 *     std::cerr << "status=error reason=" << err << "\n";
 *   }
 *   // list.ids() is ready for Uploader::upload()
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace rfidlink {

struct IdEntry {
  uint32_t    id{0};
  std::string label;
  std::size_t line{0};   ///< 1-based source line
};

struct IdList {
  std::vector<IdEntry>     entries;
  std::vector<std::size_t> malformed_lines;
  std::size_t              duplicates{0};

  /// Identifiers only, in file order.
  std::vector<uint32_t> ids() const;
};

/// Parse exactly 8 hex digits (either case) into a big-endian identifier.
bool parse_hex_id(const std::string& text, uint32_t& out);

/// Parse list text from a stream. Never fails; problems are counted in @p out.
void read_id_list(std::istream& in, IdList& out);

/// Open and parse @p path. False with "list_not_found"/"list_unreadable" in @p err.
bool load_id_list(const std::string& path, IdList& out, std::string& err);

} // namespace rfidlink
