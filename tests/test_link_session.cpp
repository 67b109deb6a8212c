#include <doctest/doctest.h>
#include "rfidlink/link_session.hpp"
#include "rfidlink/log.hpp"
#include "scripted_channel.hpp"

#include <string>
#include <vector>

using namespace rfidlink;
using rfidlink::test::ScriptedChannel;

static std::vector<uint32_t> sequence(uint32_t n) {
    std::vector<uint32_t> v;
    for (uint32_t i = 0; i < n; ++i) v.push_back(i);
    return v;
}

TEST_CASE("ping writes CD000000 and accepts DC000000") {
    ScriptedChannel ch;
    ch.queue_hex("DC000000");
    LinkSession link(ch, {1500, 255});

    CHECK(link.ping() == Status::Ok);
    CHECK(ch.written_hex() == "CD000000");
    CHECK(link.state() == SessionState::Complete);
    CHECK(ch.timeouts_seen == std::vector<int>{1500});
}

TEST_CASE("ping with wrong echoed parameter is a protocol error") {
    ScriptedChannel ch;
    ch.queue_hex("DC000001");
    LinkSession link(ch);

    CHECK(link.ping() == Status::ProtocolError);
    CHECK(link.state() == SessionState::Failed);
}

TEST_CASE("ping acknowledgment deviations") {
    ScriptedChannel ch;
    LinkSession link(ch);

    SUBCASE("wrong opcode") {
        ch.queue_hex("DC010000");
        CHECK(link.ping() == Status::ProtocolError);
    }
    SUBCASE("request tag echoed back") {
        ch.queue_hex("CD000000");
        CHECK(link.ping() == Status::ProtocolError);
    }
    SUBCASE("unrecognized tag") {
        ch.queue_hex("00000000");
        CHECK(link.ping() == Status::FramingError);
    }
    SUBCASE("nothing comes back") {
        CHECK(link.ping() == Status::TimeoutError);
    }
    SUBCASE("only part of the answer arrives") {
        ch.queue_hex("DC00");
        CHECK(link.ping() == Status::TimeoutError);
    }
    SUBCASE("read failure") {
        ch.fail_read = true;
        CHECK(link.ping() == Status::IoError);
    }
    SUBCASE("write failure") {
        ch.fail_write = true;
        CHECK(link.ping() == Status::IoError);
        CHECK(ch.read_calls == 0);
    }
    CHECK(link.state() == SessionState::Failed);
}

TEST_CASE("set_count echoes the declared count") {
    ScriptedChannel ch;
    LinkSession link(ch);

    ch.queue_hex("DC01006E");
    CHECK(link.set_count(110) == Status::Ok);
    CHECK(ch.written_hex() == "CD01006E");
    CHECK(link.last_opcode() == Opcode::SetCount);
    CHECK(link.expected_parameter() == 110);

    // A device that refuses the count echoes something else.
    ch.queue_hex("DC01006D");
    CHECK(link.set_count(110) == Status::ProtocolError);
}

TEST_CASE("send_chunk of 50 entries matches the documented trace") {
    ScriptedChannel ch;
    ch.queue_hex("DC010032");
    ch.queue_hex("DC020032");
    LinkSession link(ch);

    const auto ids = sequence(50);
    REQUIRE(link.set_count(50) == Status::Ok);
    REQUIRE(link.send_chunk(ids) == Status::Ok);

    std::string expected = "CD010032CD020032";
    for (uint32_t id : ids) expected += id_to_hex(id);
    CHECK(ch.written_hex() == expected);
    CHECK(ch.written.size() == 4 + 4 + 50 * 4);
    CHECK(ch.pending() == 0);
}

TEST_CASE("send_chunk with a mismatched entry count echo fails") {
    ScriptedChannel ch;
    ch.queue_hex("DC020009");
    LinkSession link(ch);
    CHECK(link.send_chunk(sequence(10)) == Status::ProtocolError);
}

TEST_CASE("send_chunk over the 255-byte budget fails without touching the channel") {
    ScriptedChannel ch;
    LinkSession link(ch);

    // 4 + 4*63 = 256 > 255
    CHECK(link.send_chunk(sequence(63)) == Status::OversizeError);
    CHECK(ch.write_calls == 0);
    CHECK(ch.read_calls == 0);
    CHECK(ch.written.empty());
    CHECK(link.state() == SessionState::Idle);

    // 4 + 4*62 = 252 fits
    ch.queue_hex("DC02003E");
    CHECK(link.send_chunk(sequence(62)) == Status::Ok);
}

TEST_CASE("a smaller frame budget shrinks the largest legal chunk") {
    ScriptedChannel ch;
    LinkSession link(ch, {2000, 44});      // (44-4)/4 = 10 entries

    CHECK(link.send_chunk(sequence(11)) == Status::OversizeError);
    CHECK(ch.write_calls == 0);

    ch.queue_hex("DC02000A");
    CHECK(link.send_chunk(sequence(10)) == Status::Ok);
}

TEST_CASE("frame budget is clamped to the device buffer") {
    ScriptedChannel ch;
    LinkSession link(ch, {2000, 1024});
    CHECK(link.options().max_frame_bytes == 255);
    CHECK(link.send_chunk(sequence(63)) == Status::OversizeError);
}

TEST_CASE("read_last returns the trailing raw identifier") {
    ScriptedChannel ch;
    ch.queue_hex("DC030000");
    ch.queue_hex("12345678");
    LinkSession link(ch);

    uint32_t id = 0;
    CHECK(link.read_last(id) == Status::Ok);
    CHECK(id == 0x12345678u);
    CHECK(ch.written_hex() == "CD030000");
}

TEST_CASE("read_last failure modes") {
    ScriptedChannel ch;
    LinkSession link(ch);
    uint32_t id = 0xAAAAAAAA;

    SUBCASE("header arrives, identifier does not") {
        ch.queue_hex("DC030000");
        CHECK(link.read_last(id) == Status::TimeoutError);
    }
    SUBCASE("header does not match") {
        ch.queue_hex("DC030001");
        ch.queue_hex("12345678");
        CHECK(link.read_last(id) == Status::ProtocolError);
    }
    CHECK(id == 0xAAAAAAAAu);
}

TEST_CASE("a command issued while one is pending is refused") {
    ScriptedChannel ch;
    LinkSession link(ch);
    Status nested = Status::Ok;
    std::size_t writes_during_nested = 0;

    ch.on_write = [&]() {
        if (ch.write_calls == 1) {
            CHECK(link.state() == SessionState::AwaitingResponse);
            nested = link.set_count(5);
            writes_during_nested = ch.write_calls;
        }
    };
    ch.queue_hex("DC000000");

    CHECK(link.ping() == Status::Ok);
    CHECK(nested == Status::Busy);
    CHECK(writes_during_nested == 1);
    CHECK(ch.written_hex() == "CD000000");
}

TEST_CASE("stale input is discarded after a failed exchange") {
    ScriptedChannel ch;
    LinkSession link(ch);

    ch.queue_hex("DC000001");                 // bad echo
    REQUIRE(link.ping() == Status::ProtocolError);
    CHECK(ch.discards == 0);

    ch.queue_hex("DC000000");                 // late answer to the failed exchange
    ch.on_write = [&]() { ch.queue_hex("DC000000"); };

    CHECK(link.ping() == Status::Ok);
    CHECK(ch.discards == 1);
    CHECK(ch.pending() == 0);                 // stale frame did not survive

    CHECK(link.ping() == Status::Ok);
    CHECK(ch.discards == 1);                  // previous exchange completed
}

TEST_CASE("trace logging dumps every frame") {
    std::vector<std::string> lines;
    set_log_sink([&](LogLevel, const std::string& l) { lines.push_back(l); });
    set_log_level(LogLevel::Trace);

    ScriptedChannel ch;
    ch.queue_hex("DC000000");
    LinkSession link(ch);
    CHECK(link.ping() == Status::Ok);

    set_log_level(LogLevel::Info);
    set_log_sink({});

    REQUIRE(lines.size() >= 2);
    CHECK(lines[0] == "level=trace dir=tx bytes=CD000000");
    CHECK(lines[1] == "level=trace dir=rx bytes=DC000000");
}

TEST_CASE("failed exchanges name the channel and the session state") {
    std::vector<std::string> lines;
    set_log_sink([&](LogLevel lvl, const std::string& l) {
        if (lvl == LogLevel::Warn) lines.push_back(l);
    });

    ScriptedChannel ch;
    ch.queue_hex("DC000001");
    LinkSession link(ch);
    CHECK(link.ping() == Status::ProtocolError);

    set_log_sink({});

    REQUIRE_FALSE(lines.empty());
    CHECK(lines.back() ==
          "level=warn op=ping status=error reason=protocol_error chan=scripted state=failed");
    CHECK(std::string(session_state_name(link.state())) == "failed");
}
