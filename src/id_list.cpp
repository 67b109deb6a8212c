// ============================================================================
// id_list.cpp — implementation for id_list.hpp
// For the file format see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "id_list.hpp"
#include "rfidlink/log.hpp"

#include <cctype>          // std::isxdigit, std::isspace
#include <filesystem>
#include <fstream>
#include <unordered_set>
#include <utility>

namespace fs = std::filesystem;

namespace rfidlink {

// Strip surrounding whitespace, including the '\r' of CRLF files.
static std::string trim(const std::string& s) {
    std::size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
    return s.substr(a, b - a);
}

std::vector<uint32_t> IdList::ids() const {
    std::vector<uint32_t> v;
    v.reserve(entries.size());
    for (const auto& e : entries) v.push_back(e.id);
    return v;
}

bool parse_hex_id(const std::string& text, uint32_t& out) {
    if (text.size() != 8) return false;
    uint32_t v = 0;
    for (char c : text) {
        const unsigned char u = static_cast<unsigned char>(c);
        if (!std::isxdigit(u)) return false;
        const uint32_t d = std::isdigit(u) ? uint32_t(u - '0')
                                           : uint32_t(std::tolower(u) - 'a' + 10);
        v = (v << 4) | d;
    }
    out = v;
    return true;
}

void read_id_list(std::istream& in, IdList& out) {
    out = IdList{};
    std::unordered_set<uint32_t> seen;
    std::string raw;
    std::size_t line_no = 0;

    while (std::getline(in, raw)) {
        ++line_no;
        const std::string line = trim(raw);
        if (line.empty() || line[0] == '#') continue;

        const std::size_t comma = line.find(',');
        const std::string id_text = trim(line.substr(0, comma));
        std::string label = (comma == std::string::npos) ? std::string{} : trim(line.substr(comma + 1));

        uint32_t id = 0;
        if (!parse_hex_id(id_text, id)) {
            out.malformed_lines.push_back(line_no);
            log_line(LogLevel::Warn, "op=load_list reason=malformed line=" + std::to_string(line_no));
            continue;
        }
        if (!seen.insert(id).second) {
            ++out.duplicates;
            log_line(LogLevel::Warn, "op=load_list reason=duplicate line=" + std::to_string(line_no) +
                                     " id=" + id_text);
            continue;
        }
        out.entries.push_back({id, std::move(label), line_no});
    }
}

bool load_id_list(const std::string& path, IdList& out, std::string& err) {
    std::error_code ec;
    if (!fs::exists(path, ec)) { err = "list_not_found"; return false; }

    std::ifstream in(path);
    if (!in) { err = "list_unreadable"; return false; }

    read_id_list(in, out);
    log_line(LogLevel::Info, "op=load_list file=" + path +
                             " entries=" + std::to_string(out.entries.size()) +
                             " malformed=" + std::to_string(out.malformed_lines.size()) +
                             " duplicates=" + std::to_string(out.duplicates));
    return true;
}

} // namespace rfidlink
