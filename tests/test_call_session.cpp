#include <catch2/catch_test_macros.hpp>

#include "outbound_caller/agent/session_controller.hpp"
#include "outbound_caller/call/session.hpp"
#include "outbound_caller/call/status_monitor.hpp"

#include "fakes.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>

using namespace outbound_caller;
using outbound_caller::testing::FakePipeline;
using outbound_caller::testing::FakeRoomServer;

namespace {

DialInfo dial_info() {
    DialInfo info;
    info.phone_number = "+15550102030";
    return info;
}

}

TEST_CASE("close succeeds exactly once and keeps the first reason") {
    CallSession session("room-1", dial_info());
    REQUIRE_FALSE(session.is_closed());
    REQUIRE(session.close(CloseReason::Completed));
    REQUIRE_FALSE(session.close(CloseReason::Failed));
    REQUIRE(session.is_closed());
    REQUIRE(session.close_reason() == CloseReason::Completed);
}

TEST_CASE("wait_closed wakes when another thread closes the session") {
    CallSession session("room-1", dial_info());
    REQUIRE_FALSE(session.wait_closed(std::chrono::milliseconds(10)));
    auto closer = std::async(std::launch::async, [&session]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        session.close(CloseReason::CalleeHangup);
    });
    REQUIRE(session.wait_closed(std::chrono::milliseconds(2000)));
    closer.get();
}

TEST_CASE("callee identity and session handle bind once") {
    CallSession session("room-1", dial_info());
    REQUIRE_FALSE(session.callee_identity().has_value());
    session.set_callee_identity("phone_user");
    REQUIRE(session.callee_identity() == std::string("phone_user"));
    REQUIRE_THROWS_AS(session.set_callee_identity("other"), std::logic_error);

    auto controller = std::make_shared<SessionController>(std::make_shared<FakePipeline>());
    session.attach_session(controller);
    REQUIRE(session.session_handle() == controller);
    REQUIRE_THROWS_AS(session.attach_session(controller), std::logic_error);
}

TEST_CASE("status only moves forward") {
    FakeRoomServer rooms;
    auto session = std::make_shared<CallSession>("room-1", dial_info());
    StatusMonitor monitor(rooms, session, "phone_user", std::chrono::milliseconds(10));

    REQUIRE(session->status() == CallStatus::Pending);
    monitor.record(CallStatus::Ringing);
    monitor.record(CallStatus::Automation);
    REQUIRE(session->status() == CallStatus::Automation);
    monitor.record(CallStatus::Ringing);
    REQUIRE(session->status() == CallStatus::Automation);
    monitor.record(CallStatus::Active);
    REQUIRE(session->status() == CallStatus::Active);
    monitor.record(CallStatus::Hangup);
    monitor.record(CallStatus::Failed);
    monitor.record(CallStatus::Active);
    REQUIRE(session->status() == CallStatus::Hangup);
}

TEST_CASE("session controller rejects misuse of its lifecycle") {
    auto pipeline = std::make_shared<FakePipeline>();
    SessionController controller(pipeline);

    REQUIRE_THROWS_AS(controller.set_participant("phone_user"), std::logic_error);
    REQUIRE_THROWS_AS(controller.participant(), std::logic_error);

    controller.start("be helpful", "room-1", SessionOptions{}).get();
    REQUIRE(pipeline->started());
    REQUIRE_THROWS_AS(controller.start("again", "room-1", SessionOptions{}), std::logic_error);

    controller.set_participant("phone_user");
    REQUIRE(controller.participant() == "phone_user");
    REQUIRE(pipeline->participant() == std::string("phone_user"));
    REQUIRE_THROWS_AS(controller.set_participant("phone_user"), std::logic_error);

    controller.close();
    controller.close();
    REQUIRE(pipeline->stopped());
    REQUIRE_THROWS_AS(controller.generate_reply("hello"), std::logic_error);
}

TEST_CASE("session start failures surface through the start future") {
    auto pipeline = std::make_shared<FakePipeline>();
    pipeline->start_error = "backend unavailable";
    SessionController controller(pipeline);
    auto started = controller.start("be helpful", "room-1", SessionOptions{});
    REQUIRE_THROWS_AS(started.get(), std::runtime_error);
    controller.close();
    REQUIRE(pipeline->stopped());
}

TEST_CASE("null pipelines are rejected") {
    REQUIRE_THROWS_AS(SessionController(nullptr), std::invalid_argument);
}
