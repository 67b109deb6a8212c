#include <doctest/doctest.h>
#include "rfidlink/config.hpp"

#include "nlohmann/json.hpp"

#include <limits>

using namespace rfidlink;

TEST_CASE("defaults are valid") {
    Config c;
    std::string err;
    CHECK(validate_config(c, err));
    CHECK(c.device == "/dev/ttyUSB0");
    CHECK(c.baud == 9600);
    CHECK(c.response_timeout_ms == 2000);
    CHECK(c.max_frame_bytes == 255);
    CHECK(c.max_chunk_entries == 50);
    CHECK(c.retry.max_attempts == 1);
}

TEST_CASE("parse_config overlays only the keys present") {
    Config c;
    std::string err;
    REQUIRE(parse_config(R"({
        "device": "/dev/ttyACM1",
        "response_timeout_ms": 800,
        "retry": { "max_attempts": 4 },
        "comment": "ignored"
    })", c, err));

    CHECK(c.device == "/dev/ttyACM1");
    CHECK(c.response_timeout_ms == 800);
    CHECK(c.retry.max_attempts == 4);
    CHECK(c.retry.backoff_ms == 500);      // untouched
    CHECK(c.baud == 9600);                 // untouched
}

TEST_CASE("parse_config rejects bad documents and leaves the config alone") {
    Config c;
    std::string err;

    SUBCASE("not json") {
        CHECK_FALSE(parse_config("{device:", c, err));
        CHECK(err == "bad_json");
    }
    SUBCASE("not an object") {
        CHECK_FALSE(parse_config("[1,2]", c, err));
        CHECK(err == "bad_json:not_an_object");
    }
    SUBCASE("mistyped key") {
        CHECK_FALSE(parse_config(R"({"device": "/dev/x", "baud": "fast"})", c, err));
        CHECK(err == "bad_type:baud");
    }
    SUBCASE("negative size") {
        CHECK_FALSE(parse_config(R"({"max_frame_bytes": -1})", c, err));
        CHECK(err == "bad_type:max_frame_bytes");
    }
    SUBCASE("integer too large for an int") {
        CHECK_FALSE(parse_config(R"({"baud": 4294967296})", c, err));
        CHECK(err == "bad_value:baud");
    }
    SUBCASE("integer too small for an int") {
        CHECK_FALSE(parse_config(R"({"response_timeout_ms": -3000000000})", c, err));
        CHECK(err == "bad_value:response_timeout_ms");
    }
    SUBCASE("retry value out of range") {
        CHECK_FALSE(parse_config(R"({"retry": {"backoff_ms": 2147483648}})", c, err));
        CHECK(err == "bad_value:backoff_ms");
    }
    SUBCASE("retry must be an object") {
        CHECK_FALSE(parse_config(R"({"retry": 3})", c, err));
        CHECK(err == "bad_type:retry");
    }
    CHECK(c.device == "/dev/ttyUSB0");
    CHECK(c.baud == 9600);
}

TEST_CASE("int boundaries are accepted") {
    Config c;
    std::string err;
    REQUIRE(parse_config(R"({"boot_delay_ms": 2147483647, "baud": -2147483648})", c, err));
    CHECK(c.boot_delay_ms == 2147483647);
    CHECK(c.baud == std::numeric_limits<int>::min());
}

TEST_CASE("validate_config range checks") {
    Config c;
    std::string err;

    SUBCASE("baud") { c.baud = 12345; CHECK_FALSE(validate_config(c, err)); CHECK(err == "bad_value:baud"); }
    SUBCASE("frame budget too small") {
        c.max_frame_bytes = 7;
        CHECK_FALSE(validate_config(c, err));
        CHECK(err == "bad_value:max_frame_bytes(8..255)");
    }
    SUBCASE("frame budget too large") {
        c.max_frame_bytes = 256;
        CHECK_FALSE(validate_config(c, err));
    }
    SUBCASE("timeout") {
        c.response_timeout_ms = 0;
        CHECK_FALSE(validate_config(c, err));
        CHECK(err == "bad_value:response_timeout_ms");
    }
    SUBCASE("attempts") {
        c.retry.max_attempts = 0;
        CHECK_FALSE(validate_config(c, err));
        CHECK(err == "bad_value:retry.max_attempts");
    }
    SUBCASE("log level") {
        c.log_level = "chatty";
        CHECK_FALSE(validate_config(c, err));
        CHECK(err == "bad_value:log_level");
    }
}

TEST_CASE("load_config on a missing file") {
    Config c;
    std::string err;
    CHECK(load_config("/nonexistent/rfidlink/config.json", c, err));
    CHECK_FALSE(load_config("/nonexistent/rfidlink/config.json", c, err, true));
    CHECK(err == "config_not_found");
}

TEST_CASE("config_to_json reads back through parse_config") {
    Config a;
    a.device = "/dev/ttyS3";
    a.max_chunk_entries = 62;
    a.retry = RetryPolicy{3, 250, 3};
    a.log_level = "debug";

    const auto j = nlohmann::json::parse(config_to_json(a));
    CHECK(j["retry"]["backoff_factor"] == 3);

    Config b;
    std::string err;
    REQUIRE(parse_config(config_to_json(a), b, err));
    CHECK(b.device == "/dev/ttyS3");
    CHECK(b.max_chunk_entries == 62);
    CHECK(b.retry.backoff_ms == 250);
    CHECK(b.log_level == "debug");
}
