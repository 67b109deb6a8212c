/**
 * @file test-frame/main.cpp
 * @brief CLI test tool for rfidlink frames and chunk plans.
 *
 * Builds and inspects the 4-byte command frames exchanged with the lock
 * controller, and shows how a list of a given size is cut into chunks. No
 * serial port is opened.
 *
 * @section usage Basic Usage
 *
 * @code
 *   ./test-frame <subcommand> [options...]
 * @endcode
 *
 * Examples:
 * @code
 *   Encode a request header
 *   ./test-frame encode --op set_count --param 110
 *     -> CD01006E
 *
 *   Encode the acknowledgment the device would send
 *   ./test-frame encode --op send_chunk --param 50 --response
 *     -> DC020032
 *
 *   Decode a captured header
 *   ./test-frame decode --hex DC01006E
 *     -> role=resp op=set_count param=110
 *
 *   Show the chunk plan for a list size
 *   ./test-frame plan --count 110
 *     -> count=110 per_chunk=50 chunks=3 sizes=50,50,10
 * @endcode
 *
 * @note For low-level checks while bringing up a new controller board.
 */

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "CLI/CLI11.hpp"
#include "rfidlink/chunk_planner.hpp"
#include "rfidlink/frame_codec.hpp"
#include "id_list.hpp"          // parse_hex_id

using namespace rfidlink;

static bool opcode_from_name(const std::string& s, Opcode& out) {
    for (Opcode op : {Opcode::Ping, Opcode::SetCount, Opcode::SendChunk, Opcode::ReadLast}) {
        if (opcode_name(op) == s) { out = op; return true; }
    }
    return false;
}

int main(int argc, char** argv) {
    CLI::App app{"rfidlink frame and chunk plan tester"};

    // Subcommand: encode
    std::string op_name;
    uint16_t param = 0;
    bool response = false;
    auto cmd_encode = app.add_subcommand("encode", "Encode a command header");
    cmd_encode->add_option("--op", op_name, "ping|set_count|send_chunk|read_last")->required();
    cmd_encode->add_option("--param", param, "16-bit parameter");
    cmd_encode->add_flag("--response", response, "Use the response tag (DC)");

    // Subcommand: decode
    std::string hex;
    auto cmd_decode = app.add_subcommand("decode", "Decode a 4-byte header");
    cmd_decode->add_option("--hex", hex, "8 hex digits, e.g. DC01006E")->required();

    // Subcommand: plan
    std::size_t count = 0;
    std::size_t max_frame = DEVICE_FRAME_BUDGET;
    std::size_t max_chunk = DEVICE_MAX_CHUNK_ENTRIES;
    auto cmd_plan = app.add_subcommand("plan", "Show chunk sizes for a list");
    cmd_plan->add_option("--count", count, "Number of identifiers")->required();
    cmd_plan->add_option("--max-frame", max_frame, "Frame budget in bytes");
    cmd_plan->add_option("--max-chunk", max_chunk, "Entries per chunk limit");

    CLI11_PARSE(app, argc, argv);

    if (*cmd_encode) {
        Opcode op;
        if (!opcode_from_name(op_name, op)) {
            std::cerr << "status=error reason=unknown_op op=" << op_name << "\n";
            return 2;
        }
        const Frame f = response ? encode_response(op, param) : encode_command(op, param);
        std::cout << to_hex(f) << "\n";
    } else if (*cmd_decode) {
        uint32_t raw = 0;
        if (!parse_hex_id(hex, raw)) {
            std::cerr << "status=error reason=bad_hex\n";
            return 2;
        }
        CommandFrame f;
        const Status s = decode_header(encode_entry(raw), f);
        if (!ok(s)) {
            std::cerr << "status=error reason=" << status_name(s) << "\n";
            return 4;
        }
        std::cout << describe(f);
        if (!is_known_opcode(f.opcode)) std::cout << " (unknown opcode)";
        std::cout << "\n";
    } else if (*cmd_plan) {
        UploadPlan p;
        const Status s = plan(std::vector<uint32_t>(count, 0), p, max_frame, max_chunk);
        if (!ok(s)) {
            std::cerr << "status=error reason=" << status_name(s) << "\n";
            return 5;
        }
        std::cout << "count=" << p.total_count << " per_chunk=" << p.max_entries_per_chunk
                  << " chunks=" << p.chunks.size() << " sizes=";
        for (std::size_t i = 0; i < p.chunks.size(); ++i)
            std::cout << (i ? "," : "") << p.chunks[i].size();
        std::cout << "\n";
    } else {
        std::cout << "Please provide a valid subcommand. Use --help for options.\n";
    }

    return 0;
}
