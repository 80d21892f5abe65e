#include "outbound_caller/actions/dispatcher.hpp"

#include <stdexcept>
#include <utility>

#include "outbound_caller/agent/session_controller.hpp"
#include "outbound_caller/logging.hpp"
#include "outbound_caller/metrics.hpp"
#include "outbound_caller/utils/text.hpp"

namespace outbound_caller {

namespace {

constexpr const char* kTransferNotice = "let the user know you'll be transferring them";
constexpr const char* kTransferApology =
    "apologize to the user, explain that the transfer could not be completed and say goodbye";

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}

ActionDispatcher::ActionDispatcher(CallControl& control,
                                   TelephonyClient& telephony,
                                   RoomService& rooms,
                                   DispatcherOptions options)
    : control_(control),
      telephony_(telephony),
      rooms_(rooms),
      options_(std::move(options)) {}

ActionResult ActionDispatcher::dispatch(const Action& action) {
    const auto name = action_name(action);
    auto session = control_.session();
    if (!session) {
        throw std::logic_error("action " + name + " invoked before the call was placed");
    }
    if (session->is_closed() || is_terminal(session->status())) {
        logging::warn(
            "Action ignored, call has ended",
            {kv("action", name), kv("room", session->room())});
        Metrics::instance().increment_action(name, false);
        return {false, "the call has already ended"};
    }

    logging::info("Action invoked", {kv("action", name), kv("room", session->room())});
    const auto result = std::visit(
        Overloaded{
            [this](const EndCall& a) { return end_call(a); },
            [this](const TransferCall& a) { return transfer_call(a); },
            [this](const LookUpAvailability& a) { return look_up_availability(a); },
            [this](const ConfirmAppointment& a) { return confirm_appointment(a); },
            [this](const DetectedAnsweringMachine& a) { return detected_answering_machine(a); },
        },
        action);
    Metrics::instance().increment_action(name, result.ok);
    return result;
}

ActionResult ActionDispatcher::dispatch(const std::string& name, const nlohmann::json& arguments) {
    Action action;
    try {
        action = parse_action(name, arguments);
    } catch (const ActionError& ex) {
        logging::warn("Rejected action call", {kv("action", name), kv("error", ex.what())});
        return {false, ex.what()};
    }
    return dispatch(action);
}

std::vector<AppointmentConfirmation> ActionDispatcher::confirmations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return confirmations_;
}

ActionResult ActionDispatcher::end_call(const EndCall&) {
    auto session = control_.session();
    auto controller = bound_controller(*session);
    logging::info(
        "Ending call",
        {kv("room", session->room()), kv("identity", controller->participant())});
    // Let the goodbye finish before the room goes away.
    controller->drain();
    control_.hangup(CloseReason::Completed);
    return {true, "call ended"};
}

ActionResult ActionDispatcher::transfer_call(const TransferCall&) {
    auto session = control_.session();
    const auto& transfer_to = session->dial_info().transfer_to;
    if (!transfer_to || transfer_to->empty()) {
        logging::warn("Transfer requested without a transfer target",
                      {kv("room", session->room())});
        return {false, "cannot transfer call"};
    }
    auto controller = bound_controller(*session);
    if (transfer_in_progress_.exchange(true)) {
        return {false, "transfer already in progress"};
    }

    logging::info(
        "Transferring call",
        {kv("room", session->room()),
         kv("identity", controller->participant()),
         kv("transfer_identity", options_.transfer_identity)});

    try {
        controller->generate_reply(kTransferNotice)->wait();
    } catch (const std::logic_error& ex) {
        logging::warn(
            "Transfer abandoned, conversation session closed",
            {kv("room", session->room()), kv("error", ex.what())});
        transfer_in_progress_ = false;
        return {false, "the call has already ended"};
    }
    if (session->is_closed()) {
        transfer_in_progress_ = false;
        return {false, "the call has already ended"};
    }

    try {
        CreateCallRequest request;
        request.room = session->room();
        request.trunk_id = options_.trunk_id;
        request.call_to = *transfer_to;
        request.identity = options_.transfer_identity;
        request.wait_until_answered = true;
        request.ringing_timeout = options_.transfer_answer_timeout;
        telephony_.create_call(request);

        rooms_.wait_for_participant(session->room(), options_.transfer_identity,
                                    options_.participant_wait_timeout, options_.poll_interval,
                                    [session]() { return session->is_closed(); });

        telephony_.remove_participant(session->room(), options_.agent_identity);
    } catch (const DialError& ex) {
        logging::error(
            "Transfer dial failed",
            {kv("room", session->room()),
             kv("sip_status_code", ex.sip_status_code()),
             kv("sip_status", ex.sip_status()),
             kv("error", ex.what())});
        apologize_and_hang_up(*controller);
        return {false, "transfer failed"};
    } catch (const std::exception& ex) {
        logging::error(
            "Transfer failed",
            {kv("room", session->room()), kv("error", ex.what())});
        apologize_and_hang_up(*controller);
        return {false, "transfer failed"};
    }

    logging::info("Call handed off to transfer target", {kv("room", session->room())});
    control_.complete_transfer();
    return {true, "call transferred"};
}

ActionResult ActionDispatcher::look_up_availability(const LookUpAvailability& action) {
    logging::info("Looking up availability", {kv("date", action.date)});
    if (options_.appointment_slots.empty()) {
        return {true, "There is no availability on " + action.date + "."};
    }
    return {true, "Available times on " + action.date + " are " +
                      utils::join(options_.appointment_slots, ", ") + "."};
}

ActionResult ActionDispatcher::confirm_appointment(const ConfirmAppointment& action) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        confirmations_.push_back({action.date, action.time});
    }
    logging::info(
        "Appointment confirmed",
        {kv("date", action.date),
         kv("time", action.time),
         kv("room", control_.session()->room())});
    return {true, "reservation confirmed for " + action.date + " at " + action.time};
}

ActionResult ActionDispatcher::detected_answering_machine(const DetectedAnsweringMachine&) {
    auto session = control_.session();
    auto controller = bound_controller(*session);
    logging::info(
        "Answering machine detected",
        {kv("room", session->room()), kv("identity", controller->participant())});
    control_.hangup(CloseReason::Voicemail);
    return {true, "voicemail detected, call ended"};
}

std::shared_ptr<SessionController> ActionDispatcher::bound_controller(
    const CallSession& session) const {
    auto controller = session.session_handle();
    if (!controller) {
        throw std::logic_error("no conversation session attached to " + session.room());
    }
    // Throws until the callee is bound.
    controller->participant();
    return controller;
}

void ActionDispatcher::apologize_and_hang_up(SessionController& controller) {
    try {
        controller.generate_reply(kTransferApology)->wait();
    } catch (const std::logic_error& ex) {
        logging::warn("Transfer apology skipped", {kv("error", ex.what())});
    }
    control_.hangup(CloseReason::TransferFailed);
}

}
