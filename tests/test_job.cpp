#include <catch2/catch_test_macros.hpp>

#include "outbound_caller/job.hpp"

#include <string>

using outbound_caller::JobError;
using outbound_caller::parse_job_metadata;

TEST_CASE("bare metadata is taken as the phone number") {
    const auto info = parse_job_metadata("  +1 555 010 2030 ");
    REQUIRE(info.phone_number == "+15550102030");
    REQUIRE_FALSE(info.transfer_to.has_value());
}

TEST_CASE("JSON metadata accepts snake and camel case keys") {
    const auto snake = parse_job_metadata(
        R"({"phone_number":"+15550102030","transfer_to":"+15550109999","customer_name":"Jayden"})");
    REQUIRE(snake.phone_number == "+15550102030");
    REQUIRE(snake.transfer_to == std::string("+15550109999"));
    REQUIRE(snake.customer_name == std::string("Jayden"));

    const auto camel = parse_job_metadata(
        R"({"phoneNumber":"5550102030","transferTo":"5550109999","appointmentTime":"next Tuesday at 3pm"})");
    REQUIRE(camel.phone_number == "5550102030");
    REQUIRE(camel.transfer_to == std::string("5550109999"));
    REQUIRE(camel.appointment_time == std::string("next Tuesday at 3pm"));
}

TEST_CASE("invalid metadata is rejected") {
    REQUIRE_THROWS_AS(parse_job_metadata(""), JobError);
    REQUIRE_THROWS_AS(parse_job_metadata("not a number"), JobError);
    REQUIRE_THROWS_AS(parse_job_metadata("{\"customer_name\":\"x\"}"), JobError);
    REQUIRE_THROWS_AS(parse_job_metadata("{\"phone_number\":42}"), JobError);
    REQUIRE_THROWS_AS(parse_job_metadata("{broken"), JobError);
    REQUIRE_THROWS_AS(
        parse_job_metadata(R"({"phone_number":"+15550102030","transfer_to":"front desk"})"),
        JobError);
}

TEST_CASE("instructions carry customer details and transfer availability") {
    outbound_caller::DialInfo info;
    info.phone_number = "+15550102030";
    info.customer_name = "Jayden";
    info.appointment_time = "next Tuesday at 3pm";

    const auto without_transfer = outbound_caller::build_instructions("Base.", info);
    REQUIRE(without_transfer ==
            "Base. The customer's name is Jayden. Their appointment is next Tuesday at 3pm. "
            "Transferring to a human agent is not available on this call.");

    info.transfer_to = "+15550109999";
    REQUIRE(outbound_caller::build_instructions("Base.", info) ==
            "Base. The customer's name is Jayden. Their appointment is next Tuesday at 3pm.");
}

TEST_CASE("room names derive from the dialed digits unless given") {
    outbound_caller::DialInfo info;
    info.phone_number = "+15550102030";
    const auto generated = outbound_caller::make_room_name(info);
    REQUIRE(generated.rfind("outbound-15550102030-", 0) == 0);

    info.room_name = "fixed-room";
    REQUIRE(outbound_caller::make_room_name(info) == "fixed-room");
}
