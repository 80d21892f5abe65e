#include <catch2/catch_test_macros.hpp>

#include "outbound_caller/utils/text.hpp"

#include <string>

TEST_CASE("normalize_text lowercases and trims whitespace") {
    const std::string input = "  Hello\tWORLD  ";
    REQUIRE(outbound_caller::utils::normalize_text(input) == "hello world");
}

TEST_CASE("trim strips leading and trailing whitespace only") {
    REQUIRE(outbound_caller::utils::trim("  a b \n") == "a b");
    REQUIRE(outbound_caller::utils::trim("   ").empty());
}

TEST_CASE("join places the separator between items") {
    REQUIRE(outbound_caller::utils::join({"9:00 AM", "2:00 PM"}, ", ") == "9:00 AM, 2:00 PM");
    REQUIRE(outbound_caller::utils::join({}, ", ").empty());
}

TEST_CASE("normalize_phone_number strips separators") {
    REQUIRE(outbound_caller::utils::normalize_phone_number("+1 (555) 010-2030") == "+15550102030");
    REQUIRE(outbound_caller::utils::normalize_phone_number("555.010.2030") == "5550102030");
}

TEST_CASE("normalize_phone_number keeps DTMF after the first digit") {
    REQUIRE(outbound_caller::utils::normalize_phone_number("+15550102030ww1234#") ==
            "+15550102030ww1234#");
    REQUIRE(outbound_caller::utils::normalize_phone_number("5550102030P42") == "5550102030p42");
}

TEST_CASE("normalize_phone_number rejects undialable input") {
    REQUIRE(outbound_caller::utils::normalize_phone_number("").empty());
    REQUIRE(outbound_caller::utils::normalize_phone_number("12").empty());
    REQUIRE(outbound_caller::utils::normalize_phone_number("w123").empty());
    REQUIRE(outbound_caller::utils::normalize_phone_number("1+23").empty());
    REQUIRE(outbound_caller::utils::normalize_phone_number("call me").empty());
}
