#include <catch2/catch_test_macros.hpp>

#include "outbound_caller/actions/dispatcher.hpp"
#include "outbound_caller/agent/session_controller.hpp"

#include "fakes.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

using namespace outbound_caller;
using outbound_caller::testing::FakePipeline;
using outbound_caller::testing::FakeRoomServer;
using outbound_caller::testing::TransferBehavior;

namespace {

class RecordingCallControl : public CallControl {
public:
    RecordingCallControl(std::shared_ptr<CallSession> session, TelephonyClient& telephony)
        : session_(std::move(session)), telephony_(telephony) {}

    std::shared_ptr<CallSession> session() const override { return session_; }

    void hangup(CloseReason reason) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            hangups_.push_back(reason);
        }
        if (session_->close(reason)) {
            telephony_.delete_room(session_->room());
        }
    }

    void complete_transfer() override {
        ++transfers_completed_;
        session_->close(CloseReason::Transferred);
    }

    std::vector<CloseReason> hangups() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return hangups_;
    }

    int transfers_completed() const { return transfers_completed_; }

private:
    std::shared_ptr<CallSession> session_;
    TelephonyClient& telephony_;
    mutable std::mutex mutex_;
    std::vector<CloseReason> hangups_;
    std::atomic<int> transfers_completed_{0};
};

struct Harness {
    explicit Harness(bool with_transfer_target = true, bool bind = true) {
        DialInfo info;
        info.phone_number = "+15550102030";
        if (with_transfer_target) {
            info.transfer_to = "+15550109999";
        }
        session = std::make_shared<CallSession>("room-1", info);
        pipeline = std::make_shared<FakePipeline>();
        controller = std::make_shared<SessionController>(pipeline);
        session->attach_session(controller);
        controller->start("be helpful", "room-1", SessionOptions{}).get();
        if (bind) {
            controller->set_participant("phone_user");
            session->set_callee_identity("phone_user");
        }
        control = std::make_unique<RecordingCallControl>(session, rooms);

        DispatcherOptions options;
        options.trunk_id = "ST_test";
        options.participant_wait_timeout = std::chrono::milliseconds(100);
        options.poll_interval = std::chrono::milliseconds(5);
        options.appointment_slots = {"9:00 AM", "2:00 PM"};
        dispatcher = std::make_unique<ActionDispatcher>(*control, rooms, rooms, options);
    }

    FakeRoomServer rooms;
    std::shared_ptr<CallSession> session;
    std::shared_ptr<FakePipeline> pipeline;
    std::shared_ptr<SessionController> controller;
    std::unique_ptr<RecordingCallControl> control;
    std::unique_ptr<ActionDispatcher> dispatcher;
};

}

TEST_CASE("transfer without a target fails without dialing or speaking") {
    Harness harness(false);
    const auto result = harness.dispatcher->dispatch(TransferCall{});
    REQUIRE_FALSE(result.ok);
    REQUIRE(result.message == "cannot transfer call");
    REQUIRE(harness.rooms.requests().empty());
    REQUIRE(harness.pipeline->replies().empty());
    REQUIRE(harness.control->hangups().empty());
    REQUIRE_FALSE(harness.session->is_closed());
}

TEST_CASE("successful transfer dials the target and removes the agent") {
    Harness harness;
    const auto result = harness.dispatcher->dispatch(TransferCall{});
    REQUIRE(result.ok);

    const auto requests = harness.rooms.requests();
    REQUIRE(requests.size() == 1);
    REQUIRE(requests[0].call_to == "+15550109999");
    REQUIRE(requests[0].identity == "transfer_target");
    REQUIRE(requests[0].room == "room-1");
    REQUIRE(requests[0].trunk_id == "ST_test");
    REQUIRE(requests[0].ringing_timeout == std::chrono::seconds(30));

    REQUIRE(harness.rooms.removed() == std::vector<std::string>{"agent"});
    REQUIRE(harness.pipeline->replies().size() == 1);
    REQUIRE(harness.control->transfers_completed() == 1);
    REQUIRE(harness.control->hangups().empty());
    REQUIRE(harness.rooms.delete_count() == 0);
    REQUIRE(harness.session->close_reason() == CloseReason::Transferred);
}

TEST_CASE("failed transfers apologize once and hang up once") {
    Harness harness;
    SECTION("target busy") {
        harness.rooms.transfer_behavior = TransferBehavior::Busy;
    }
    SECTION("target never joins") {
        harness.rooms.transfer_behavior = TransferBehavior::NeverJoins;
    }
    SECTION("agent cannot leave") {
        harness.rooms.remove_participant_fails = true;
    }

    const auto result = harness.dispatcher->dispatch(TransferCall{});
    REQUIRE_FALSE(result.ok);
    REQUIRE(result.message == "transfer failed");
    REQUIRE(harness.pipeline->replies().size() == 2);
    REQUIRE(harness.control->hangups() == std::vector<CloseReason>{CloseReason::TransferFailed});
    REQUIRE(harness.rooms.delete_count() == 1);
    REQUIRE(harness.control->transfers_completed() == 0);
}

TEST_CASE("end_call waits for the current utterance before hanging up") {
    Harness harness;
    auto goodbye = std::make_shared<Utterance>("reply-1", "goodbye");
    harness.pipeline->set_current_utterance(goodbye);

    auto pending = std::async(std::launch::async,
                              [&harness]() { return harness.dispatcher->dispatch(EndCall{}); });
    REQUIRE(pending.wait_for(std::chrono::milliseconds(50)) == std::future_status::timeout);
    REQUIRE(harness.control->hangups().empty());

    goodbye->finish();
    const auto result = pending.get();
    REQUIRE(result.ok);
    REQUIRE(harness.control->hangups() == std::vector<CloseReason>{CloseReason::Completed});
    REQUIRE(harness.rooms.delete_count() == 1);
}

TEST_CASE("answering machine detection hangs up as voicemail") {
    Harness harness;
    REQUIRE(harness.dispatcher->dispatch(DetectedAnsweringMachine{}).ok);
    REQUIRE(harness.session->close_reason() == CloseReason::Voicemail);
    REQUIRE(harness.rooms.delete_count() == 1);
}

TEST_CASE("actions touching the callee require a bound participant") {
    Harness harness(true, false);
    REQUIRE_THROWS_AS(harness.dispatcher->dispatch(EndCall{}), std::logic_error);
    REQUIRE_THROWS_AS(harness.dispatcher->dispatch(DetectedAnsweringMachine{}), std::logic_error);
    REQUIRE(harness.dispatcher->dispatch(LookUpAvailability{"Friday"}).ok);
    REQUIRE(harness.control->hangups().empty());
}

TEST_CASE("availability and confirmation replies") {
    Harness harness;
    const auto lookup = harness.dispatcher->dispatch("look_up_availability", {{"date", "Friday"}});
    REQUIRE(lookup.ok);
    REQUIRE(lookup.message == "Available times on Friday are 9:00 AM, 2:00 PM.");

    const auto confirm = harness.dispatcher->dispatch("confirm_appointment",
                                                      {{"date", "Tuesday"}, {"time", "3pm"}});
    REQUIRE(confirm.ok);
    REQUIRE(confirm.message == "reservation confirmed for Tuesday at 3pm");
    const auto confirmations = harness.dispatcher->confirmations();
    REQUIRE(confirmations.size() == 1);
    REQUIRE(confirmations[0].date == "Tuesday");
    REQUIRE(confirmations[0].time == "3pm");
}

TEST_CASE("malformed and late tool calls fail without side effects") {
    Harness harness;
    REQUIRE_FALSE(harness.dispatcher->dispatch("book_flight", nlohmann::json::object()).ok);
    REQUIRE_FALSE(harness.dispatcher->dispatch("confirm_appointment", {{"date", "Tuesday"}}).ok);

    harness.control->hangup(CloseReason::CalleeHangup);
    const auto late = harness.dispatcher->dispatch(EndCall{});
    REQUIRE_FALSE(late.ok);
    REQUIRE(late.message == "the call has already ended");
    REQUIRE(harness.dispatcher->confirmations().empty());
    REQUIRE(harness.rooms.delete_count() == 1);
}

TEST_CASE("a transfer on a closed conversation session ends quietly") {
    Harness harness;
    harness.controller->close();

    const auto result = harness.dispatcher->dispatch(TransferCall{});
    REQUIRE_FALSE(result.ok);
    REQUIRE(result.message == "the call has already ended");
    REQUIRE(harness.rooms.requests().empty());
    REQUIRE(harness.control->hangups().empty());

    const auto again = harness.dispatcher->dispatch(TransferCall{});
    REQUIRE(again.message == "the call has already ended");
}
