#include <catch2/catch_test_macros.hpp>

#include "outbound_caller/logging.hpp"

#include <string>

using outbound_caller::logging::CallScope;
using outbound_caller::logging::call_room;
using outbound_caller::logging::format_kv;
using outbound_caller::logging::format_line;
using outbound_caller::logging::kv;
using outbound_caller::logging::with_kv;

TEST_CASE("key values quote empty and spaced values") {
    REQUIRE(format_kv({kv("a", 1), kv("b", "two words"), kv("c", "")}) ==
            "a=1, b=\"two words\", c=\"\"");
    REQUIRE(format_kv({kv("ok", true)}) == "ok=true");
    REQUIRE(with_kv("Hello", {}) == "Hello");
    REQUIRE(with_kv("Hello", {kv("x", "y")}) == "Hello [x=y]");
}

TEST_CASE("lines outside a call carry no room") {
    REQUIRE_FALSE(call_room().has_value());
    REQUIRE(format_line("Idle", {kv("x", 1)}) == "Idle [x=1]");
}

TEST_CASE("lines inside a call carry its room") {
    {
        CallScope scope("outbound-15550100-1");
        REQUIRE(call_room() == std::string("outbound-15550100-1"));
        REQUIRE(format_line("Ringing", {}) == "Ringing [room=outbound-15550100-1]");
        REQUIRE(format_line("Dial failed", {kv("sip_status_code", 486)}) ==
                "Dial failed [sip_status_code=486, room=outbound-15550100-1]");
        REQUIRE(format_line("Hangup", {kv("room", "other")}) == "Hangup [room=other]");
    }
    REQUIRE_FALSE(call_room().has_value());
    REQUIRE(format_line("Done", {}) == "Done");
}
